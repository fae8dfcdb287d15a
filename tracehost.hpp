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

#ifndef __tracemux__tracehost__
#define __tracemux__tracehost__

#include "tracemux_common.hpp"
#include "values.hpp"

#include <string>

using namespace std;

/// Interface between the trace engine and the interpreter that is being observed.
/// The interpreter exposes one single global hook slot, which it invokes on function
/// entry. The hook returned from there becomes the per-context hook which receives
/// line, exception and return events of that context.

namespace tmx {

  /// Trace Error
  class TraceError : public Error
  {
  public:
    // Errors
    typedef enum {
      OK,
      Configuration, ///< invalid scope, unresolvable callable, unknown event kind
      SessionState, ///< double start, stop of a session not started, start while suspended
      Evaluation, ///< guard, evaluate or mutate action failed
      VariableConflict, ///< extra bindings of a mutate action collide with existing locals
      HookOwnership, ///< hook was replaced by a third party before stop()
      numErrorCodes
    } ErrorCodes;
    static const char *domain() { return "TraceError"; }
    virtual const char *getErrorDomain() const TMX_OVERRIDE { return TraceError::domain(); };
    TraceError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const TMX_OVERRIDE;
    #endif // ENABLE_NAMED_ERRORS
  };


  /// trace event kinds
  typedef enum {
    trace_enter,
    trace_line,
    trace_return,
    trace_exception,
    numTraceEvents
  } TraceEvent;

  /// set of trace events
  typedef uint8_t TraceEventMask;
  enum {
    traceMask_none = 0,
    traceMask_enter = 1<<trace_enter,
    traceMask_line = 1<<trace_line,
    traceMask_return = 1<<trace_return,
    traceMask_exception = 1<<trace_exception,
    traceMask_all = traceMask_enter|traceMask_line|traceMask_return|traceMask_exception
  };

  /// @return name of the event
  const char *traceEventName(TraceEvent aEvent);

  /// parse event names
  /// @param aEventNames event names separated by commas and/or spaces: "enter" (or "call"), "line", "return", "exception"
  /// @param aMask will receive the event set
  /// @return ok or TraceError::Configuration for unknown or missing names
  ErrorPtr parseTraceEvents(const string &aEventNames, TraceEventMask &aMask);


  class ExecutionContext;
  typedef boost::intrusive_ptr<ExecutionContext> ExecutionContextPtr;

  class TraceHook;
  typedef boost::intrusive_ptr<TraceHook> TraceHookPtr;

  /// a trace hook, installed as the global hook or as a per-context hook
  class TraceHook : public TmxObj
  {
  public:
    /// called by the host on trace events
    /// @param aContext the context the event originates from. Only valid during this call.
    /// @param aEvent the event
    /// @param aArg payload: the return value for trace_return, the error for trace_exception
    /// @param aNextHook on entry, the hook the context is currently observed with. Set it to the
    ///   hook that should observe the context from now on, or to NULL to stop observing this call.
    /// @return ok, or an error which disables tracing and is raised in the traced call
    virtual ErrorPtr trace(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook) = 0;
  };


  /// a unit of compiled code (function body)
  class CodeUnit : public TmxObj
  {
  public:
    /// @return unqualified name
    virtual string name() const = 0;
    /// @return file name or special label such as "<eval>"
    virtual string fileName() const = 0;
    /// @return line number of the definition
    virtual int firstLine() const = 0;
    /// @return parameter names, in declaration order
    virtual const std::vector<string> &argNames() const = 0;
    /// @param aLine line number
    /// @return source text of the line (empty if not available)
    virtual string sourceLine(int aLine) const = 0;
  };
  typedef boost::intrusive_ptr<CodeUnit> CodeUnitPtr;


  class Callable;
  typedef boost::intrusive_ptr<Callable> CallablePtr;

  /// something that can be called: plain function, bound method, callable object, native
  class Callable : public MemberAccess
  {
  public:
    /// @return name for diagnostics
    virtual string name() = 0;
    /// @return the code unit executed when called, NULL if none is inspectable (e.g. native functions)
    virtual CodeUnitPtr code() = 0;
    /// @return the function itself, or the function a bound method or callable object refers to
    virtual CallablePtr underlyingFunction() { return CallablePtr(this); }
    /// @return the receiver a method is bound to, NULL if none
    virtual TmxObjPtr boundReceiver() { return TmxObjPtr(); }
    /// @return the callable wrapped by a decorator, NULL if not decorated
    virtual CallablePtr wrapped() { return CallablePtr(); }
  };


  /// a loaded source module
  class SourceModule : public MemberAccess
  {
  public:
    virtual string moduleName() const = 0;
    virtual string fileName() const = 0;
  };
  typedef boost::intrusive_ptr<SourceModule> SourceModulePtr;


  /// live state of one call activation
  /// @note contexts are owned by the host, the engine keeps copies of what it needs
  class ExecutionContext : public TmxObj
  {
  public:
    /// @return the code being executed
    virtual CodeUnitPtr code() = 0;
    /// @return current line number
    virtual int line() = 0;
    /// @return receiver of a method call, NULL if none
    virtual TmxObjPtr receiver() = 0;
    /// @return live local bindings
    virtual const VariablesMap &locals() = 0;
    /// write back bindings into the live context
    /// @param aBindings bindings to add or replace
    virtual void updateLocals(const VariablesMap &aBindings) = 0;
    /// @return live global bindings
    virtual VariablesMap &globals() = 0;
    /// @return the calling context, NULL for the outermost one
    virtual ExecutionContextPtr caller() = 0;
    /// @name per-context hook
    /// @{
    virtual TraceHookPtr localHook() = 0;
    virtual void setLocalHook(TraceHookPtr aHook) = 0;
    /// @}
    /// @return identifier unique for this activation
    virtual uint64_t activationId() = 0;
    /// @return true while the context is being left because of an error
    virtual bool unwinding() = 0;

    /// @return file name of the code
    string fileName();
    /// @return raw source text of the current line
    string sourceLine();
    /// @return number of callers
    int depth();
  };


  /// the observed interpreter
  class TraceHost : public TmxObj
  {
  public:

    typedef enum {
      eval_expression, ///< single expression
      eval_statements ///< simple statements (assignments, var definitions, expressions)
    } EvalMode;

    /// @return currently installed global hook, NULL if none
    virtual TraceHookPtr globalHook() = 0;

    /// install the global hook
    /// @param aHook the hook, NULL to disable tracing
    virtual void setGlobalHook(TraceHookPtr aHook) = 0;

    /// evaluate code in a binding environment
    /// @param aCode the code
    /// @param aMode expression or statements
    /// @param aLocals local bindings, statements may modify and add to these
    /// @param aGlobals global bindings, can be NULL
    /// @param aResult the result
    /// @return ok or error
    virtual ErrorPtr evaluate(const string &aCode, EvalMode aMode, VariablesMap &aLocals, VariablesMap *aGlobals, ScriptValue &aResult) = 0;
  };
  typedef boost::intrusive_ptr<TraceHost> TraceHostPtr;

} // namespace tmx

#endif /* defined(__tracemux__tracehost__) */
