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

#include "breakpoint.hpp"

using namespace tmx;


// MARK: - LineSelector

LineSelector LineSelector::onEntry()
{
  return LineSelector();
}


LineSelector LineSelector::at(int aLineNumber)
{
  LineSelector l;
  l.kind = line_number;
  l.number = aLineNumber;
  return l;
}


LineSelector LineSelector::atSource(const string &aSourceText)
{
  LineSelector l;
  l.kind = line_text;
  l.text = trimWhiteSpace(aSourceText);
  return l;
}


string LineSelector::description() const
{
  switch (kind) {
    case line_number: return string_format("line %d", number);
    case line_text: return string_format("line '%s'", text.c_str());
    default: return "entry";
  }
}


// MARK: - Breakpoint

Breakpoint::Breakpoint(const LineSelector &aLine, const string &aCondition) :
  mLine(aLine),
  mCondition(aCondition),
  mHits(0)
{
}


string Breakpoint::description() const
{
  string d = "breakpoint at " + mLine.description();
  if (!mCondition.empty()) string_format_append(d, " if %s", mCondition.c_str());
  return d;
}


EvalResultsPtr Breakpoint::eval(const string &aExpression, const VariablesMap &aExtras)
{
  Action a;
  a.kind = Action::action_eval;
  a.code = aExpression;
  a.extras = aExtras;
  a.results = EvalResultsPtr(new EvalResults);
  mActions.push_back(a);
  return a.results;
}


void Breakpoint::exec(const string &aStatements, const VariablesMap &aExtras)
{
  Action a;
  a.kind = Action::action_exec;
  a.code = aStatements;
  a.extras = aExtras;
  mActions.push_back(a);
}


#if TMX_DEBUGGER_SUPPORT

void Breakpoint::debug(DebuggerFactoryCB aDebuggerFactory)
{
  Action a;
  a.kind = Action::action_debug;
  a.debuggerFactory = aDebuggerFactory;
  mActions.push_back(a);
}

#endif // TMX_DEBUGGER_SUPPORT


bool Breakpoint::atLine(ExecutionContext &aContext, TraceEvent aEvent)
{
  switch (mLine.kind) {
    case LineSelector::line_none:
      return aEvent==trace_enter;
    case LineSelector::line_number:
      return aEvent==trace_line && aContext.line()==mLine.number;
    case LineSelector::line_text:
      return aEvent==trace_line && trimWhiteSpace(aContext.sourceLine())==mLine.text;
  }
  return false;
}


ErrorPtr Breakpoint::traced(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg)
{
  if (!atLine(aContext, aEvent)) return ErrorPtr();
  TraceSessionPtr session = this->session();
  if (!session) return ErrorPtr();
  if (!mCondition.empty()) {
    TraceSession::SuspendGuard suspended(session);
    VariablesMap locals = aContext.locals();
    ScriptValue res;
    ErrorPtr err = session->host()->evaluate(mCondition, TraceHost::eval_expression, locals, &aContext.globals(), res);
    if (Error::notOK(err)) {
      return Error::err<TraceError>(TraceError::Evaluation, "condition '%s' failed: %s", mCondition.c_str(), err->text());
    }
    if (!res.boolValue()) return ErrorPtr();
  }
  mHits++;
  LOG(LOG_INFO, "%s hit in %s() at %s:%d",
    description().c_str(), aContext.code() ? aContext.code()->name().c_str() : "?", aContext.fileName().c_str(), aContext.line()
  );
  // keep actions alive even if an action releases us
  BreakpointPtr keepAlive = BreakpointPtr(this);
  for (size_t i=0; i<mActions.size(); i++) {
    ErrorPtr err = runAction(mActions[i], aContext, aEvent, aArg);
    if (Error::notOK(err)) return err;
  }
  return ErrorPtr();
}


ErrorPtr Breakpoint::runAction(Action &aAction, ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg)
{
  TraceSessionPtr session = this->session();
  if (!session) return ErrorPtr();
  switch (aAction.kind) {
    case Action::action_eval: {
      TraceSession::SuspendGuard suspended(session);
      VariablesMap locals = aContext.locals();
      for (VariablesMap::iterator pos = aAction.extras.begin(); pos!=aAction.extras.end(); ++pos) {
        locals[pos->first] = pos->second;
      }
      ScriptValue res;
      ErrorPtr err = session->host()->evaluate(aAction.code, TraceHost::eval_expression, locals, &aContext.globals(), res);
      if (Error::notOK(err)) {
        return Error::err<TraceError>(TraceError::Evaluation, "evaluating '%s' failed: %s", aAction.code.c_str(), err->text());
      }
      aAction.results->values.push_back(res);
      return ErrorPtr();
    }
    case Action::action_exec:
      return runExec(aAction, aContext);
    case Action::action_debug: {
      #if TMX_DEBUGGER_SUPPORT
      InteractiveDebuggerPtr dbg = aAction.debuggerFactory(session->host());
      if (!dbg) return ErrorPtr();
      return HandoffState::handOff(session->host(), dbg, aContext, aEvent, aArg);
      #else
      return ErrorPtr();
      #endif
    }
  }
  return ErrorPtr();
}


ErrorPtr Breakpoint::runExec(Action &aAction, ExecutionContext &aContext)
{
  const VariablesMap &live = aContext.locals();
  string conflicts;
  for (VariablesMap::iterator pos = aAction.extras.begin(); pos!=aAction.extras.end(); ++pos) {
    if (live.find(pos->first)!=live.end()) {
      if (!conflicts.empty()) conflicts += ", ";
      conflicts += pos->first;
    }
  }
  if (!conflicts.empty()) {
    return Error::err<TraceError>(TraceError::VariableConflict, "extra variables collide with locals: %s", conflicts.c_str());
  }
  TraceSessionPtr session = this->session();
  VariablesMap locals = live;
  for (VariablesMap::iterator pos = aAction.extras.begin(); pos!=aAction.extras.end(); ++pos) {
    locals[pos->first] = pos->second;
  }
  ScriptValue res;
  ErrorPtr err;
  {
    TraceSession::SuspendGuard suspended(session);
    err = session->host()->evaluate(aAction.code, TraceHost::eval_statements, locals, &aContext.globals(), res);
  }
  if (Error::notOK(err)) {
    return Error::err<TraceError>(TraceError::Evaluation, "executing '%s' failed: %s", aAction.code.c_str(), err->text());
  }
  // write back what changed, but not the extras
  VariablesMap changed;
  for (VariablesMap::iterator pos = locals.begin(); pos!=locals.end(); ++pos) {
    if (aAction.extras.find(pos->first)!=aAction.extras.end()) continue;
    VariablesMap::const_iterator old = live.find(pos->first);
    if (old==live.end() || !old->second.identical(pos->second)) changed[pos->first] = pos->second;
  }
  if (!changed.empty()) aContext.updateLocals(changed);
  return ErrorPtr();
}
