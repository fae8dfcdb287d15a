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

#include "tracehost.hpp"

#include <string.h>

using namespace tmx;


#if ENABLE_NAMED_ERRORS
const char* TraceError::errorName() const
{
  switch (getErrorCode()) {
    case OK: return "OK";
    case Configuration: return "Configuration";
    case SessionState: return "SessionState";
    case Evaluation: return "Evaluation";
    case VariableConflict: return "VariableConflict";
    case HookOwnership: return "HookOwnership";
  }
  return NULL;
}
#endif // ENABLE_NAMED_ERRORS


static const char *traceEventNames[numTraceEvents] = {
  "enter",
  "line",
  "return",
  "exception"
};


const char *tmx::traceEventName(TraceEvent aEvent)
{
  if (aEvent<0 || aEvent>=numTraceEvents) return "<invalid>";
  return traceEventNames[aEvent];
}


ErrorPtr tmx::parseTraceEvents(const string &aEventNames, TraceEventMask &aMask)
{
  aMask = traceMask_none;
  size_t i = 0;
  while (i<aEventNames.size()) {
    size_t e = aEventNames.find_first_of(", ", i);
    if (e==string::npos) e = aEventNames.size();
    if (e>i) {
      string name = lowerCase(aEventNames.substr(i, e-i));
      int ev;
      for (ev=0; ev<numTraceEvents; ev++) {
        if (name==traceEventNames[ev]) break;
      }
      if (ev>=numTraceEvents) {
        if (name=="call") ev = trace_enter; // conventional alias
        else return Error::err<TraceError>(TraceError::Configuration, "unknown trace event '%s'", name.c_str());
      }
      aMask |= (1<<ev);
    }
    i = e+1;
  }
  if (aMask==traceMask_none) {
    return Error::err<TraceError>(TraceError::Configuration, "no trace events specified");
  }
  return ErrorPtr();
}


// MARK: - ExecutionContext

string ExecutionContext::fileName()
{
  CodeUnitPtr c = code();
  return c ? c->fileName() : "";
}


string ExecutionContext::sourceLine()
{
  CodeUnitPtr c = code();
  return c ? c->sourceLine(line()) : "";
}


int ExecutionContext::depth()
{
  int d = 0;
  ExecutionContextPtr c = caller();
  while (c) {
    d++;
    c = c->caller();
  }
  return d;
}
