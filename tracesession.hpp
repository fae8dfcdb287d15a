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

#ifndef __tracemux__tracesession__
#define __tracemux__tracesession__

#include "tracemux_common.hpp"
#include "tracehost.hpp"
#include "scope.hpp"

using namespace std;

/// A trace session owns the global hook of a host while started, and multiplexes the
/// events it receives to the registered callbacks whose scope matches the context.

namespace tmx {

  class TraceSession;
  typedef boost::intrusive_ptr<TraceSession> TraceSessionPtr;

  class CallCapture;
  typedef boost::intrusive_ptr<CallCapture> CallCapturePtr;
  class CallListCapture;
  typedef boost::intrusive_ptr<CallListCapture> CallListCapturePtr;
  class Breakpoint;
  typedef boost::intrusive_ptr<Breakpoint> BreakpointPtr;
  struct LineSelector;

  typedef long CallbackHandle;

  /// callback for trace events
  /// @param aContext the context (valid during the call only)
  /// @param aEvent the event
  /// @param aArg event payload (return value, error)
  /// @return ok or error, which aborts dispatching and is raised in the traced code
  typedef boost::function<ErrorPtr (ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg)> TraceCallback;


  class TraceSession : public TmxLoggingObj
  {
    typedef TmxLoggingObj inherited;
    friend class DispatchHook;

    TraceHostPtr mHost;
    TraceHookPtr mHook; ///< our dispatch hook
    TraceHookPtr mPreviousHook; ///< global hook found installed at start()
    bool mStarted;
    bool mAutoStarted; ///< started on behalf of registrations
    int mRetainCount; ///< number of registrations depending on tracing
    int mSuspended;

    struct CallbackEntry
    {
      ScopePtr scope;
      TraceEventMask events;
      TraceCallback callback;
    };
    typedef std::map<CallbackHandle, CallbackEntry> CallbackMap;
    CallbackMap mCallbacks; ///< ordered by handle, i.e. by registration
    CallbackHandle mNextHandle;

    std::vector<string> mExcludedFiles;

  public:

    TraceSession(TraceHostPtr aHost);
    virtual ~TraceSession();

    virtual string logContextPrefix() TMX_OVERRIDE;

    /// @return the host this session observes
    TraceHostPtr host() { return mHost; }

    /// get a session for a host
    /// @param aHost the host
    /// @return the session whose hook is currently installed in aHost, or the default session of the calling thread
    /// @note the calling thread keeps one default session, asking for another host replaces it
    static TraceSessionPtr sessionFor(TraceHostPtr aHost);

    /// @name lifecycle
    /// @{

    /// start tracing: install our hook as the global hook of the host
    /// @return ok or TraceError::SessionState when already started or suspended
    ErrorPtr start();

    /// stop tracing and restore the global hook found at start()
    /// @return ok, TraceError::SessionState when not started, or TraceError::HookOwnership
    ///   when another hook was installed meanwhile (which is then left in place)
    ErrorPtr stop();

    /// @return true if started
    bool isStarted() const { return mStarted; }

    /// @return true if started and our hook is the current global hook
    bool isInstalled();

    /// make sure tracing is active on behalf of a registration
    /// @return ok or TraceError::SessionState if started but our hook is no longer installed
    /// @note starts the session if not started yet. Balance with releaseTracing().
    ErrorPtr retainTracing();

    /// end dependency of a registration on tracing
    /// @note stops the session when the last registration is released and the session was started by retainTracing()
    void releaseTracing();

    /// @}

    /// @name suspension
    /// @{

    /// temporarily ignore all events (nestable)
    void suspend() { mSuspended++; }
    /// end one level of suspension
    void resume() { if (mSuspended>0) mSuspended--; }
    /// @return true when suspended
    bool isSuspended() const { return mSuspended>0; }

    /// suspends a session for its own lifetime
    class SuspendGuard
    {
      TraceSessionPtr mSession;
    public:
      SuspendGuard(TraceSessionPtr aSession) : mSession(aSession) { mSession->suspend(); }
      ~SuspendGuard() { mSession->resume(); }
    };

    /// @}

    /// never dispatch events from contexts in this file
    /// @note code run by the engine itself (conditions, actions) needs no exclusion, the host
    ///   does not call hooks while a hook runs, and the session is suspended around it
    /// @param aFile file name or label, or a glob pattern
    void excludeFile(const string &aFile);

    /// @name callback registry
    /// @{

    /// register a callback
    /// @param aScopeSpec selectors of the scope
    /// @param aEventNames names of the events to deliver, see parseTraceEvents()
    /// @param aCallback the callback
    /// @param aHandle will receive the handle for removeCallback()
    /// @return ok or TraceError::Configuration
    ErrorPtr addCallback(const ScopeSpec &aScopeSpec, const string &aEventNames, TraceCallback aCallback, CallbackHandle &aHandle);

    /// register a callback
    /// @param aScope the scope
    /// @param aEvents the events to deliver
    /// @param aCallback the callback
    /// @return handle for removeCallback()
    CallbackHandle addCallback(ScopePtr aScope, TraceEventMask aEvents, TraceCallback aCallback);

    /// unregister a callback
    /// @param aHandle the handle
    /// @return true if the callback was registered
    bool removeCallback(CallbackHandle aHandle);

    /// @return number of registered callbacks
    size_t numCallbacks() const { return mCallbacks.size(); }

    /// @}

    /// @name registrations
    /// @{

    /// capture the last call of a scope
    /// @param aScopeSpec the scope
    /// @param aCapture will receive the capture, which is updated after every matching call
    /// @return ok or error
    ErrorPtr captureCall(const ScopeSpec &aScopeSpec, CallCapturePtr &aCapture);

    /// capture all calls of a scope
    /// @param aScopeSpec the scope
    /// @param aCapture will receive the capture, which collects all matching calls
    /// @return ok or error
    ErrorPtr captureCalls(const ScopeSpec &aScopeSpec, CallListCapturePtr &aCapture);

    /// set a breakpoint
    /// @param aScopeSpec the scope
    /// @param aLine the line to break at, or none to break on entry of a function
    /// @param aCondition expression which must be true for the breakpoint to fire, empty for none
    /// @param aBreakpoint will receive the breakpoint, to add actions to
    /// @return ok or error
    ErrorPtr setBreakpoint(const ScopeSpec &aScopeSpec, const LineSelector &aLine, const string &aCondition, BreakpointPtr &aBreakpoint);

    /// @}

  private:

    ErrorPtr dispatch(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook);
    bool isExcluded(const string &aFile) const;

  };


  /// base class for objects registering a callback with a session while they exist
  class TraceRegistration : public TmxObj
  {
    typedef TmxObj inherited;
    friend class TraceSession;

    TraceSessionPtr mSession;
    CallbackHandle mHandle;

  public:

    TraceRegistration();
    virtual ~TraceRegistration();

    /// unregister now, rather than at destruction
    void release();

    /// @return true while registered
    bool isRegistered() const { return mSession!=NULL; }

    /// @return the session, NULL when released
    TraceSessionPtr session() { return mSession; }

  protected:

    /// register with the session, making sure it is tracing
    /// @param aSession the session
    /// @param aScope scope to observe
    /// @param aEvents events to receive via traced()
    /// @return ok or error
    ErrorPtr registerWith(TraceSessionPtr aSession, ScopePtr aScope, TraceEventMask aEvents);

    /// called for every event of the registered kinds in a matching context
    virtual ErrorPtr traced(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg) = 0;

  };

} // namespace tmx

#endif /* defined(__tracemux__tracesession__) */
