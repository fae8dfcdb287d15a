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

#include "cmddebugger.hpp"

#if TMX_DEBUGGER_SUPPORT

#include "snapshot.hpp"

#include <stdarg.h>

using namespace tmx;


CommandDebugger::CommandDebugger(TraceHostPtr aHost, CommandSourceCB aCommandSource, OutputCB aOutput) :
  mHost(aHost),
  mCommandSource(aCommandSource),
  mOutput(aOutput),
  mMode(dbg_stepInto),
  mStopDepth(0),
  mStops(0)
{
}


void CommandDebugger::output(const char *aFmt, ...)
{
  string s;
  va_list args;
  va_start(args, aFmt);
  string_format_v(s, false, aFmt, args);
  va_end(args);
  if (mOutput) mOutput(s);
  else LOG(LOG_NOTICE, "dbg: %s", s.c_str());
}


void CommandDebugger::attachTo(ExecutionContext &aContext)
{
  mMode = dbg_stepInto;
  mHost->setGlobalHook(TraceHookPtr(this));
  ExecutionContextPtr ctx = ExecutionContextPtr(&aContext);
  while (ctx) {
    contextSeen(*ctx);
    ctx->setLocalHook(TraceHookPtr(this));
    ctx = ctx->caller();
  }
}


void CommandDebugger::detach(ExecutionContext &aContext)
{
  mMode = dbg_terminated;
  if (mHost->globalHook().get()==this) mHost->setGlobalHook(TraceHookPtr());
  ExecutionContextPtr ctx = ExecutionContextPtr(&aContext);
  while (ctx) {
    if (ctx->localHook().get()==this) ctx->setLocalHook(TraceHookPtr());
    ctx = ctx->caller();
  }
}


ErrorPtr CommandDebugger::trace(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook)
{
  if (mMode!=dbg_terminated) {
    contextSeen(aContext);
    if (shouldStop(aContext, aEvent)) interact(aContext, aEvent, aArg);
    if (mMode!=dbg_terminated && aEvent==trace_return && !aContext.caller()) {
      // nothing left to debug
      detach(aContext);
      ended(ended_continue);
    }
  }
  if (mMode==dbg_terminated) {
    // whatever the handoff restored
    aNextHook = aContext.localHook();
  }
  else {
    aNextHook = TraceHookPtr(this);
  }
  return ErrorPtr();
}


bool CommandDebugger::shouldStop(ExecutionContext &aContext, TraceEvent aEvent)
{
  switch (mMode) {
    case dbg_stepInto:
      return true;
    case dbg_stepOver:
      return aEvent!=trace_enter && aContext.depth()<=mStopDepth;
    case dbg_stepOut:
      if (aEvent==trace_return) return aContext.depth()<=mStopDepth;
      return aEvent!=trace_enter && aContext.depth()<mStopDepth;
    default:
      return false;
  }
}


void CommandDebugger::interact(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg)
{
  mStops++;
  CodeUnitPtr code = aContext.code();
  output("> %s(%d)%s()", aContext.fileName().c_str(), aContext.line(), code ? code->name().c_str() : "?");
  if (aEvent==trace_enter) output("--Call--");
  else if (aEvent==trace_return) output("--Return-- %s", aArg.description().c_str());
  else if (aEvent==trace_exception) output("--Exception-- %s", Error::text(aArg.errorValue()));
  else output("-> %s", trimWhiteSpace(aContext.sourceLine()).c_str());
  while (true) {
    string cmd;
    if (!mCommandSource || !mCommandSource(cmd)) cmd = "continue";
    cmd = trimWhiteSpace(cmd);
    string verb = cmd;
    string rest;
    size_t i = cmd.find_first_of(" \t");
    if (i!=string::npos) {
      verb = cmd.substr(0, i);
      rest = trimWhiteSpace(cmd.substr(i+1));
    }
    if (verb.empty() || verb=="c" || verb=="cont" || verb=="continue") {
      detach(aContext);
      ended(ended_continue);
      return;
    }
    if (verb=="q" || verb=="quit") {
      mMode = dbg_terminated;
      output("debugger quit");
      ended(ended_quit);
      return;
    }
    if (verb=="s" || verb=="step") {
      mMode = dbg_stepInto;
      return;
    }
    if (verb=="n" || verb=="next") {
      mMode = dbg_stepOver;
      mStopDepth = aContext.depth();
      return;
    }
    if (verb=="r" || verb=="return") {
      mMode = dbg_stepOut;
      mStopDepth = aContext.depth();
      return;
    }
    if (verb=="p" || verb=="print") {
      VariablesMap locals = aContext.locals();
      ScriptValue res;
      ErrorPtr err = mHost->evaluate(rest, TraceHost::eval_expression, locals, &aContext.globals(), res);
      if (Error::notOK(err)) output("*** %s", err->text());
      else output("%s", res.description().c_str());
      continue;
    }
    if (verb=="w" || verb=="where") {
      output("%s", formatStack(stackOf(aContext)).c_str());
      continue;
    }
    output("*** unknown command '%s'", verb.c_str());
  }
}

#endif // TMX_DEBUGGER_SUPPORT
