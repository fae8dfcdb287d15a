//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2026 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of tracemux.
//
//  tracemux is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  tracemux is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with tracemux. If not, see <http://www.gnu.org/licenses/>.
//

#include "callcapture.hpp"

using namespace tmx;


// MARK: - CallInfo

ScriptValue CallInfo::local(const string &aName) const
{
  VariablesMap::const_iterator pos = locals.find(aName);
  if (pos==locals.end()) return ScriptValue();
  return pos->second;
}


ScriptValue CallInfo::arg(const string &aName) const
{
  for (BindingsList::const_iterator pos = args.begin(); pos!=args.end(); ++pos) {
    if (pos->first==aName) return pos->second;
  }
  return ScriptValue();
}


string CallInfo::description() const
{
  string s = string_format("%s(%s)", name.c_str(), bindingsDescription(args).c_str());
  if (unwound) {
    string_format_append(s, " raised %s", Error::text(exception));
  }
  else {
    string_format_append(s, " -> %s", returnValue.description().c_str());
  }
  return s;
}


string CallInfo::stackDescription() const
{
  return "Traceback (most recent call last):\n" + formatStack(stack);
}


void CallInfo::printStack(FILE *aFile) const
{
  fputs(stackDescription().c_str(), aFile);
}


// MARK: - CallCaptureBase

ErrorPtr CallCaptureBase::traced(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg)
{
  uint64_t id = aContext.activationId();
  if (aEvent==trace_enter) {
    CallInfo &ci = mPending[id];
    ci = CallInfo();
    CodeUnitPtr code = aContext.code();
    if (code) ci.name = code->name();
    ci.file = aContext.fileName();
    ci.stack = stackOf(aContext);
    ci.args = argumentsOf(aContext);
    return ErrorPtr();
  }
  PendingMap::iterator pos = mPending.find(id);
  if (pos==mPending.end()) {
    // entered before we were registered
    return ErrorPtr();
  }
  if (aEvent==trace_exception) {
    pos->second.exception = aArg.errorValue();
  }
  else if (aEvent==trace_return) {
    CallInfo ci = pos->second;
    mPending.erase(pos);
    ci.locals = localsOf(aContext);
    ci.globals = globalsOf(aContext);
    ci.unwound = aContext.unwinding();
    if (!ci.unwound) ci.returnValue = aArg;
    LOG(LOG_DEBUG, "captured call %s", ci.description().c_str());
    completed(ci);
  }
  return ErrorPtr();
}


// MARK: - CallCapture

void CallCapture::completed(const CallInfo &aCallInfo)
{
  mCall = aCallInfo;
  mCaptured = true;
}


// MARK: - CallListCapture

void CallListCapture::completed(const CallInfo &aCallInfo)
{
  mCalls.push_back(aCallInfo);
}
