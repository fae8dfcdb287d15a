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

#ifndef __tracemux__callcapture__
#define __tracemux__callcapture__

#include "tracemux_common.hpp"
#include "tracesession.hpp"
#include "snapshot.hpp"

#include <stdio.h>

using namespace std;

namespace tmx {

  /// record of one completed call
  class CallInfo
  {
  public:
    string name; ///< name of the code unit
    string file; ///< file the code is in
    StackSummary stack; ///< call stack at entry, outermost first
    BindingsList args; ///< arguments at entry, in declaration order
    VariablesMap locals; ///< local bindings when the call ended
    VariablesMap globals; ///< global bindings when the call ended
    ScriptValue returnValue; ///< null when unwound
    ErrorPtr exception; ///< the error that ended the call, if any
    bool unwound; ///< set if the call was left because of an error

    CallInfo() : unwound(false) {};

    /// @return value of a local variable at the end of the call, null if not present
    ScriptValue local(const string &aName) const;

    /// @return value of an argument, null if not present
    ScriptValue arg(const string &aName) const;

    /// @return single line summary, like `f(x=3) -> 6`
    string description() const;

    /// @return the stack in traceback format
    string stackDescription() const;

    /// print the stack in traceback format
    void printStack(FILE *aFile = stdout) const;
  };
  typedef std::vector<CallInfo> CallInfoList;


  /// common base of call captures, tracking calls from entry to completion
  class CallCaptureBase : public TraceRegistration
  {
    typedef TraceRegistration inherited;

    typedef std::map<uint64_t, CallInfo> PendingMap;
    PendingMap mPending; ///< calls entered but not yet completed, by activation

  protected:

    virtual ErrorPtr traced(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg) TMX_OVERRIDE;

    /// called with every completed call
    virtual void completed(const CallInfo &aCallInfo) = 0;

  public:

    /// @return number of calls currently in progress
    size_t numPending() const { return mPending.size(); }

  };


  /// captures the most recently completed call
  class CallCapture : public CallCaptureBase
  {
    typedef CallCaptureBase inherited;

    CallInfo mCall;
    bool mCaptured;

  public:

    CallCapture() : mCaptured(false) {};

    /// @return true once a call has completed
    bool captured() const { return mCaptured; }

    /// @return the last completed call (empty record before the first one)
    const CallInfo &call() const { return mCall; }

  protected:

    virtual void completed(const CallInfo &aCallInfo) TMX_OVERRIDE;

  };


  /// captures all completed calls, in order of completion
  class CallListCapture : public CallCaptureBase
  {
    typedef CallCaptureBase inherited;

    CallInfoList mCalls;

  public:

    /// @return the completed calls
    const CallInfoList &calls() const { return mCalls; }

    /// @return number of completed calls
    size_t size() const { return mCalls.size(); }

    /// clear the list
    void clear() { mCalls.clear(); }

  protected:

    virtual void completed(const CallInfo &aCallInfo) TMX_OVERRIDE;

  };

} // namespace tmx

#endif /* defined(__tracemux__callcapture__) */
