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

#include "handoff.hpp"

using namespace tmx;


// MARK: - InteractiveDebugger

void InteractiveDebugger::setHandoffHandlers(EndedCB aEndedCB, ContextSeenCB aContextSeenCB)
{
  mEndedCB = aEndedCB;
  mContextSeenCB = aContextSeenCB;
}


void InteractiveDebugger::contextSeen(ExecutionContext &aContext)
{
  if (mContextSeenCB) mContextSeenCB(aContext);
}


void InteractiveDebugger::ended(EndReason aReason)
{
  EndedCB cb = mEndedCB;
  // handlers hold the handoff state, which is done now
  mEndedCB.clear();
  mContextSeenCB.clear();
  if (cb) cb(aReason);
}


// MARK: - HandoffState

HandoffState::HandoffState(TraceHostPtr aHost, ExecutionContext &aContext) :
  mHost(aHost),
  mRestored(false)
{
  mSavedGlobalHook = mHost->globalHook();
  ExecutionContextPtr ctx = ExecutionContextPtr(&aContext);
  while (ctx) {
    mSavedHooks.push_back(make_pair(ctx, ctx->localHook()));
    ctx = ctx->caller();
  }
}


bool HandoffState::isKnown(ExecutionContext &aContext) const
{
  for (SavedHooksVector::const_iterator pos = mSavedHooks.begin(); pos!=mSavedHooks.end(); ++pos) {
    if (pos->first.get()==&aContext) return true;
  }
  return false;
}


void HandoffState::contextSeen(ExecutionContext &aContext)
{
  if (mRestored || isKnown(aContext)) return;
  mSavedHooks.push_back(make_pair(ExecutionContextPtr(&aContext), aContext.localHook()));
}


void HandoffState::debuggerEnded(InteractiveDebugger::EndReason aReason)
{
  if (aReason==InteractiveDebugger::ended_quit || !mHost->globalHook()) {
    restore();
  }
}


void HandoffState::restore()
{
  if (mRestored) return;
  mRestored = true;
  for (SavedHooksVector::reverse_iterator pos = mSavedHooks.rbegin(); pos!=mSavedHooks.rend(); ++pos) {
    pos->first->setLocalHook(pos->second);
  }
  mHost->setGlobalHook(mSavedGlobalHook);
  LOG(LOG_NOTICE, "debugger ended, restored hooks of %d contexts", (int)mSavedHooks.size());
  mSavedHooks.clear();
  mSavedGlobalHook.reset();
}


ErrorPtr HandoffState::handOff(TraceHostPtr aHost, InteractiveDebuggerPtr aDebugger, ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, HandoffStatePtr *aStateP)
{
  HandoffStatePtr state = HandoffStatePtr(new HandoffState(aHost, aContext));
  if (aStateP) *aStateP = state;
  aDebugger->setHandoffHandlers(
    boost::bind(&HandoffState::debuggerEnded, state, _1),
    boost::bind(&HandoffState::contextSeen, state, _1)
  );
  LOG(LOG_NOTICE, "handing off to debugger in %s() at %s:%d",
    aContext.code() ? aContext.code()->name().c_str() : "?", aContext.fileName().c_str(), aContext.line()
  );
  aHost->setGlobalHook(TraceHookPtr());
  aDebugger->attachTo(aContext);
  // the debugger gets the event we are in
  TraceHookPtr next = aContext.localHook();
  ErrorPtr err = aDebugger->trace(aContext, aEvent, aArg, next);
  if (Error::notOK(err)) {
    state->restore();
    return err;
  }
  aContext.setLocalHook(next);
  return ErrorPtr();
}
