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

#include "tracesession.hpp"
#include "callcapture.hpp"
#include "breakpoint.hpp"

using namespace tmx;


// MARK: - DispatchHook

namespace tmx {

  /// the hook a session installs, forwarding to the session as long as it exists
  class DispatchHook : public TraceHook
  {
    friend class TraceSession;

    TraceSession *mSession; ///< non-retaining, cleared by the session on destruction

  public:

    DispatchHook(TraceSession *aSession) : mSession(aSession) {}

    TraceSession *session() { return mSession; }

    virtual ErrorPtr trace(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook) TMX_OVERRIDE
    {
      if (!mSession) {
        aNextHook.reset();
        return ErrorPtr();
      }
      return mSession->dispatch(aContext, aEvent, aArg, aNextHook);
    }

  };

} // namespace tmx


// MARK: - TraceSession

static __thread TraceSession *defaultSessionP = NULL;


TraceSession::TraceSession(TraceHostPtr aHost) :
  mHost(aHost),
  mStarted(false),
  mAutoStarted(false),
  mRetainCount(0),
  mSuspended(0),
  mNextHandle(1)
{
  mHook = TraceHookPtr(new DispatchHook(this));
}


TraceSession::~TraceSession()
{
  if (mStarted) {
    ErrorPtr err = stop();
    if (Error::notOK(err)) OLOG(LOG_INFO, "stop at deletion: %s", err->text());
  }
  static_cast<DispatchHook *>(mHook.get())->mSession = NULL;
}


string TraceSession::logContextPrefix()
{
  return string_format("trace session %p", this);
}


TraceSessionPtr TraceSession::sessionFor(TraceHostPtr aHost)
{
  // a started session owns the host's global hook
  DispatchHook *h = dynamic_cast<DispatchHook *>(aHost->globalHook().get());
  if (h && h->session()) return TraceSessionPtr(h->session());
  if (!defaultSessionP || defaultSessionP->mHost!=aHost) {
    TraceSession *s = new TraceSession(aHost);
    intrusive_ptr_add_ref(s); // held by the thread
    if (defaultSessionP) {
      if (defaultSessionP->isStarted()) {
        LOG(LOG_WARNING, "started default session %p for another host is dropped", defaultSessionP);
      }
      intrusive_ptr_release(defaultSessionP);
    }
    defaultSessionP = s;
  }
  return TraceSessionPtr(defaultSessionP);
}


ErrorPtr TraceSession::start()
{
  if (mStarted) {
    return Error::err<TraceError>(TraceError::SessionState, "session already started");
  }
  if (mSuspended>0) {
    return Error::err<TraceError>(TraceError::SessionState, "cannot start a suspended session");
  }
  DispatchHook *h = dynamic_cast<DispatchHook *>(mHost->globalHook().get());
  if (h && h->session() && h->session()!=this) {
    return Error::err<TraceError>(TraceError::SessionState, "another session is installed on this host");
  }
  mPreviousHook = mHost->globalHook();
  mHost->setGlobalHook(mHook);
  mStarted = true;
  OLOG(LOG_INFO, "started%s", mPreviousHook ? ", replacing previously installed hook" : "");
  return ErrorPtr();
}


ErrorPtr TraceSession::stop()
{
  if (!mStarted) {
    return Error::err<TraceError>(TraceError::SessionState, "session not started");
  }
  mStarted = false;
  mAutoStarted = false;
  ErrorPtr err;
  if (mHost->globalHook()==mHook) {
    mHost->setGlobalHook(mPreviousHook);
    OLOG(LOG_INFO, "stopped%s", mPreviousHook ? ", previous hook restored" : "");
  }
  else {
    err = Error::err<TraceError>(TraceError::HookOwnership, "global hook was replaced while session was running, not restoring previous hook");
    OLOG(LOG_WARNING, "stopped: %s", err->text());
  }
  mPreviousHook.reset();
  return err;
}


bool TraceSession::isInstalled()
{
  return mStarted && mHost->globalHook()==mHook;
}


ErrorPtr TraceSession::retainTracing()
{
  if (mStarted) {
    if (!isInstalled()) {
      return Error::err<TraceError>(TraceError::SessionState, "session was started, but its hook has been replaced");
    }
  }
  else {
    ErrorPtr err = start();
    if (Error::notOK(err)) return err;
    mAutoStarted = true;
  }
  mRetainCount++;
  return ErrorPtr();
}


void TraceSession::releaseTracing()
{
  if (mRetainCount<=0) return;
  mRetainCount--;
  if (mRetainCount==0 && mAutoStarted && mStarted) {
    ErrorPtr err = stop();
    if (Error::notOK(err)) OLOG(LOG_INFO, "automatic stop: %s", err->text());
  }
}


void TraceSession::excludeFile(const string &aFile)
{
  mExcludedFiles.push_back(aFile);
}


bool TraceSession::isExcluded(const string &aFile) const
{
  for (std::vector<string>::const_iterator pos = mExcludedFiles.begin(); pos!=mExcludedFiles.end(); ++pos) {
    if (aFile==*pos) return true;
    if (!isSpecialFileLabel(*pos) && !isSpecialFileLabel(aFile) && pathMatch(aFile, *pos)) return true;
  }
  return false;
}


ErrorPtr TraceSession::addCallback(const ScopeSpec &aScopeSpec, const string &aEventNames, TraceCallback aCallback, CallbackHandle &aHandle)
{
  TraceEventMask events;
  ErrorPtr err = parseTraceEvents(aEventNames, events);
  if (Error::notOK(err)) return err;
  ScopePtr scope;
  err = Scope::create(scope, aScopeSpec);
  if (Error::notOK(err)) return err;
  aHandle = addCallback(scope, events, aCallback);
  return ErrorPtr();
}


CallbackHandle TraceSession::addCallback(ScopePtr aScope, TraceEventMask aEvents, TraceCallback aCallback)
{
  CallbackEntry e;
  e.scope = aScope;
  e.events = aEvents;
  e.callback = aCallback;
  CallbackHandle h = mNextHandle++;
  mCallbacks[h] = e;
  OLOG(LOG_DEBUG, "callback #%ld registered for %s", h, aScope->description().c_str());
  return h;
}


bool TraceSession::removeCallback(CallbackHandle aHandle)
{
  CallbackMap::iterator pos = mCallbacks.find(aHandle);
  if (pos==mCallbacks.end()) return false;
  mCallbacks.erase(pos);
  OLOG(LOG_DEBUG, "callback #%ld removed", aHandle);
  return true;
}


ErrorPtr TraceSession::dispatch(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook)
{
  aNextHook.reset();
  if (!isInstalled() || mSuspended>0) return ErrorPtr();
  if (isExcluded(aContext.fileName())) return ErrorPtr();
  TraceHookPtr hookBefore = aContext.localHook();
  bool traceLocally = false;
  // callbacks may add or remove registrations
  std::vector<CallbackHandle> handles;
  for (CallbackMap::iterator pos = mCallbacks.begin(); pos!=mCallbacks.end(); ++pos) {
    handles.push_back(pos->first);
  }
  for (std::vector<CallbackHandle>::iterator h = handles.begin(); h!=handles.end(); ++h) {
    CallbackMap::iterator pos = mCallbacks.find(*h);
    if (pos==mCallbacks.end()) continue;
    CallbackEntry e = pos->second; // keep alive, callback might remove itself
    if (!e.scope->matches(aContext)) continue;
    if (e.events & ~traceMask_enter) traceLocally = true;
    if (e.events & (1<<aEvent)) {
      ErrorPtr err = e.callback(aContext, aEvent, aArg);
      if (Error::notOK(err)) return err;
    }
  }
  TraceHookPtr hookAfter = aContext.localHook();
  if (hookAfter!=hookBefore) {
    // context was handed over to another hook by a callback
    aNextHook = hookAfter;
  }
  else if (traceLocally || aEvent!=trace_enter) {
    aNextHook = mHook;
  }
  return ErrorPtr();
}


ErrorPtr TraceSession::captureCall(const ScopeSpec &aScopeSpec, CallCapturePtr &aCapture)
{
  ScopePtr scope;
  ErrorPtr err = Scope::create(scope, aScopeSpec);
  if (Error::notOK(err)) return err;
  CallCapturePtr capture = CallCapturePtr(new CallCapture);
  err = capture->registerWith(TraceSessionPtr(this), scope, traceMask_enter|traceMask_exception|traceMask_return);
  if (Error::notOK(err)) return err;
  aCapture = capture;
  return ErrorPtr();
}


ErrorPtr TraceSession::captureCalls(const ScopeSpec &aScopeSpec, CallListCapturePtr &aCapture)
{
  ScopePtr scope;
  ErrorPtr err = Scope::create(scope, aScopeSpec);
  if (Error::notOK(err)) return err;
  CallListCapturePtr capture = CallListCapturePtr(new CallListCapture);
  err = capture->registerWith(TraceSessionPtr(this), scope, traceMask_enter|traceMask_exception|traceMask_return);
  if (Error::notOK(err)) return err;
  aCapture = capture;
  return ErrorPtr();
}


ErrorPtr TraceSession::setBreakpoint(const ScopeSpec &aScopeSpec, const LineSelector &aLine, const string &aCondition, BreakpointPtr &aBreakpoint)
{
  ScopePtr scope;
  ErrorPtr err = Scope::create(scope, aScopeSpec);
  if (Error::notOK(err)) return err;
  if (aLine.kind==LineSelector::line_none && !scope->selectsFunction()) {
    return Error::err<TraceError>(TraceError::Configuration, "breakpoint without a line needs a function to break in");
  }
  BreakpointPtr bp = BreakpointPtr(new Breakpoint(aLine, aCondition));
  err = bp->registerWith(TraceSessionPtr(this), scope, traceMask_enter|traceMask_line);
  if (Error::notOK(err)) return err;
  aBreakpoint = bp;
  return ErrorPtr();
}


// MARK: - TraceRegistration

TraceRegistration::TraceRegistration() :
  mHandle(0)
{
}


TraceRegistration::~TraceRegistration()
{
  release();
}


ErrorPtr TraceRegistration::registerWith(TraceSessionPtr aSession, ScopePtr aScope, TraceEventMask aEvents)
{
  ErrorPtr err = aSession->retainTracing();
  if (Error::notOK(err)) return err;
  mSession = aSession;
  // non-retaining, release() removes the callback before we are gone
  mHandle = mSession->addCallback(aScope, aEvents, boost::bind(&TraceRegistration::traced, this, _1, _2, _3));
  return ErrorPtr();
}


void TraceRegistration::release()
{
  if (!mSession) return;
  TraceSessionPtr session = mSession;
  mSession.reset();
  session->removeCallback(mHandle);
  session->releaseTracing();
}
