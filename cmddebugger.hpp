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

#ifndef __tracemux__cmddebugger__
#define __tracemux__cmddebugger__

#include "tracemux_common.hpp"
#include "handoff.hpp"

#if TMX_DEBUGGER_SUPPORT

using namespace std;

namespace tmx {

  /// line oriented interactive debugger
  /// Commands: s(tep), n(ext), r(eturn), c(ontinue), q(uit), p(rint) <expression>, w(here).
  /// An empty command or the end of the command source continues. Debugging also ends
  /// when the outermost context returns.
  class CommandDebugger : public InteractiveDebugger
  {
    typedef InteractiveDebugger inherited;

  public:

    /// supplies the next command
    /// @param aCommand will receive the command
    /// @return false at end of input
    typedef boost::function<bool (string &aCommand)> CommandSourceCB;

    /// receives debugger output
    typedef boost::function<void (const string &aText)> OutputCB;

  private:

    typedef enum {
      dbg_stepInto, ///< stop at next event anywhere
      dbg_stepOver, ///< stop at next line or return at or above mStopDepth
      dbg_stepOut, ///< stop at return from mStopDepth or at next line above it
      dbg_running, ///< never stop
      dbg_terminated ///< hooks given back
    } DebugMode;

    TraceHostPtr mHost;
    CommandSourceCB mCommandSource;
    OutputCB mOutput;
    DebugMode mMode;
    int mStopDepth;
    int mStops;

  public:

    /// create debugger
    /// @param aHost the host
    /// @param aCommandSource source of commands
    /// @param aOutput output, if not set, output goes to the log at LOG_NOTICE
    CommandDebugger(TraceHostPtr aHost, CommandSourceCB aCommandSource, OutputCB aOutput = OutputCB());

    virtual void attachTo(ExecutionContext &aContext) TMX_OVERRIDE;
    virtual ErrorPtr trace(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook) TMX_OVERRIDE;

    /// @return number of times the debugger stopped for commands
    int stops() const { return mStops; }

    /// @return true when the debugger has given back control
    bool isTerminated() const { return mMode==dbg_terminated; }

  private:

    bool shouldStop(ExecutionContext &aContext, TraceEvent aEvent);
    void interact(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg);
    void detach(ExecutionContext &aContext);
    void output(const char *aFmt, ...) __printflike(2,3);

  };
  typedef boost::intrusive_ptr<CommandDebugger> CommandDebuggerPtr;

} // namespace tmx

#endif // TMX_DEBUGGER_SUPPORT
#endif /* defined(__tracemux__cmddebugger__) */
