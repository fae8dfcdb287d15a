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

#ifndef __tracemux__handoff__
#define __tracemux__handoff__

#include "tracemux_common.hpp"
#include "tracehost.hpp"

using namespace std;

/// Handing a live context over to an interactive debugger, and giving back all
/// hooks the debugger displaced once it is done.

namespace tmx {

  class InteractiveDebugger;
  typedef boost::intrusive_ptr<InteractiveDebugger> InteractiveDebuggerPtr;

  /// an interactive debugger that can take over a running context
  class InteractiveDebugger : public TraceHook
  {
    typedef TraceHook inherited;

  public:

    typedef enum {
      ended_continue, ///< user continued, debugger removed its hooks
      ended_quit ///< user quit debugging
    } EndReason;

    typedef boost::function<void (EndReason aReason)> EndedCB;
    typedef boost::function<void (ExecutionContext &aContext)> ContextSeenCB;

    /// take over: become the global hook and the hook of aContext and all its callers
    /// @param aContext the context to start debugging in
    virtual void attachTo(ExecutionContext &aContext) = 0;

    /// set handlers for a handoff
    /// @param aEndedCB called when the debugging session ends
    /// @param aContextSeenCB must be called for every context the debugger gets events from
    void setHandoffHandlers(EndedCB aEndedCB, ContextSeenCB aContextSeenCB);

  protected:

    /// report a context to the handoff before the debugger changes its hook
    void contextSeen(ExecutionContext &aContext);

    /// report end of debugging
    void ended(EndReason aReason);

  private:

    EndedCB mEndedCB;
    ContextSeenCB mContextSeenCB;

  };

  /// creates a debugger for a host
  typedef boost::function<InteractiveDebuggerPtr (TraceHostPtr aHost)> DebuggerFactoryCB;


  class HandoffState;
  typedef boost::intrusive_ptr<HandoffState> HandoffStatePtr;

  /// hooks saved when handing off to a debugger
  class HandoffState : public TmxObj
  {
    typedef TmxObj inherited;

    TraceHostPtr mHost;
    TraceHookPtr mSavedGlobalHook;
    typedef std::vector<std::pair<ExecutionContextPtr, TraceHookPtr> > SavedHooksVector;
    SavedHooksVector mSavedHooks; ///< per context, in order of first appearance
    bool mRestored;

  public:

    /// save global hook and hooks of aContext and all of its callers
    HandoffState(TraceHostPtr aHost, ExecutionContext &aContext);

    /// record the hook of a context if it was not seen before
    void contextSeen(ExecutionContext &aContext);

    /// debugger has ended
    /// @note on continue, hooks are only restored if the debugger has removed the global hook
    void debuggerEnded(InteractiveDebugger::EndReason aReason);

    /// restore all saved per-context hooks, then the global hook
    void restore();

    /// @return true once restored
    bool isRestored() const { return mRestored; }

    /// @return number of contexts with saved hooks
    size_t numSavedContexts() const { return mSavedHooks.size(); }

    /// hand a context over to a debugger
    /// @param aHost the host
    /// @param aDebugger the debugger to take over
    /// @param aContext the context the current event is from
    /// @param aEvent the current event, which is passed on to the debugger
    /// @param aArg the current event's payload
    /// @param aStateP if not NULL, receives the handoff state
    /// @return ok or error from the debugger
    static ErrorPtr handOff(TraceHostPtr aHost, InteractiveDebuggerPtr aDebugger, ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, HandoffStatePtr *aStateP = NULL);

  private:

    bool isKnown(ExecutionContext &aContext) const;

  };

} // namespace tmx

#endif /* defined(__tracemux__handoff__) */
