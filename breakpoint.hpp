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

#ifndef __tracemux__breakpoint__
#define __tracemux__breakpoint__

#include "tracemux_common.hpp"
#include "tracesession.hpp"
#include "handoff.hpp"

using namespace std;

namespace tmx {

  /// where in a scope a breakpoint fires
  struct LineSelector
  {
    typedef enum {
      line_none, ///< on entry of the function
      line_number, ///< at a line number
      line_text ///< at lines whose stripped source equals a text
    } Kind;
    Kind kind;
    int number;
    string text;

    LineSelector() : kind(line_none), number(0) {};

    /// @name convenience constructors
    /// @{
    static LineSelector onEntry();
    static LineSelector at(int aLineNumber);
    static LineSelector atSource(const string &aSourceText);
    /// @}

    /// @return description for log messages
    string description() const;
  };


  /// results of an evaluate action, one per firing
  class EvalResults : public TmxObj
  {
  public:
    ValueList values;

    size_t size() const { return values.size(); }
    const ScriptValue &operator[](size_t aIndex) const { return values[aIndex]; }
  };
  typedef boost::intrusive_ptr<EvalResults> EvalResultsPtr;


  /// a breakpoint, running its actions every time execution reaches it
  class Breakpoint : public TraceRegistration
  {
    typedef TraceRegistration inherited;
    friend class TraceSession;

    LineSelector mLine;
    string mCondition;
    int mHits;

    struct Action
    {
      typedef enum { action_eval, action_exec, action_debug } Kind;
      Kind kind;
      string code;
      VariablesMap extras;
      EvalResultsPtr results;
      DebuggerFactoryCB debuggerFactory;
    };
    typedef std::vector<Action> ActionsVector;
    ActionsVector mActions;

    Breakpoint(const LineSelector &aLine, const string &aCondition);

  public:

    /// evaluate an expression every time the breakpoint fires
    /// @param aExpression the expression
    /// @param aExtras additional bindings, shadowing locals of the same name
    /// @return list receiving one value per firing
    EvalResultsPtr eval(const string &aExpression, const VariablesMap &aExtras = VariablesMap());

    /// execute statements in the context every time the breakpoint fires, writing changed locals back
    /// @param aStatements the statements
    /// @param aExtras additional bindings, which must not have the name of an existing local
    void exec(const string &aStatements, const VariablesMap &aExtras = VariablesMap());

    #if TMX_DEBUGGER_SUPPORT
    /// hand over to an interactive debugger when the breakpoint fires
    /// @param aDebuggerFactory creates the debugger
    void debug(DebuggerFactoryCB aDebuggerFactory);
    #endif

    /// @return number of times the breakpoint fired
    int hits() const { return mHits; }

    /// @return description for log messages
    string description() const;

  protected:

    virtual ErrorPtr traced(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg) TMX_OVERRIDE;

  private:

    bool atLine(ExecutionContext &aContext, TraceEvent aEvent);
    ErrorPtr runAction(Action &aAction, ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg);
    ErrorPtr runExec(Action &aAction, ExecutionContext &aContext);

  };

} // namespace tmx

#endif /* defined(__tracemux__breakpoint__) */
