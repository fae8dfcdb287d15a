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

#ifndef __tracemux__scriptrt__
#define __tracemux__scriptrt__

#include "tracemux_common.hpp"
#include "tracehost.hpp"
#include "expressions.hpp"

#include <string>

using namespace std;

/// A small line oriented script interpreter implementing the TraceHost interface.
///
/// Module source consists of function and class definitions plus top level statements:
///
///     var factor = 2
///     function f(x) {
///       var y = x * factor
///       return y
///     }
///     class Counter {
///       function init(self, start) {
///         self.count = start
///       }
///       function call(self) {
///         self.count = self.count + 1
///         return self.count
///       }
///     }
///     @logged
///     function g(a) {
///       return a + 1
///     }
///
/// `@name` decorates the following function with the global function `name`, which runs
/// instead of the decorated function and finds it in its local `wrapped`.
///
/// Statements occupy one line each: simple statements (see EvaluationContext::executeStatements),
/// `return [expr]`, `throw expr`, `if (cond) statement`, `if (cond) {` ... `} else {` ... `}`
/// and `while (cond) {` ... `}`.

namespace tmx {

  class ScriptRuntime;
  typedef boost::intrusive_ptr<ScriptRuntime> ScriptRuntimePtr;

  class ScriptModule;
  typedef boost::intrusive_ptr<ScriptModule> ScriptModulePtr;

  /// source text shared between a module and its code units
  class SourceText : public TmxObj
  {
  public:
    std::vector<string> mLines;
    /// @return line aLine (1 based), empty if out of range
    string line(int aLine) const;
  };
  typedef boost::intrusive_ptr<SourceText> SourceTextPtr;


  /// loaded module, members are its globals
  class ScriptModule : public SourceModule
  {
    typedef SourceModule inherited;
    friend class ScriptRuntime;

    string mName;
    string mFileName;
    SourceTextPtr mSource;
    VariablesMap mGlobals;

  public:

    ScriptModule(const string &aName, const string &aFileName);

    virtual string moduleName() const TMX_OVERRIDE { return mName; }
    virtual string fileName() const TMX_OVERRIDE { return mFileName; }
    virtual bool memberByName(const string &aName, ScriptValue &aValue) TMX_OVERRIDE;
    virtual ErrorPtr setMemberByName(const string &aName, const ScriptValue &aValue) TMX_OVERRIDE;

    VariablesMap &globals() { return mGlobals; }

    /// @return the global named aName, null value if none
    ScriptValue global(const string &aName);
  };


  class ScriptStatement;
  typedef boost::intrusive_ptr<ScriptStatement> ScriptStatementPtr;
  typedef std::vector<ScriptStatementPtr> StatementList;

  /// one parsed statement
  class ScriptStatement : public TmxObj
  {
  public:
    typedef enum {
      st_simple,
      st_return,
      st_throw,
      st_if,
      st_while
    } StatementType;

    StatementType mType;
    int mLine; ///< source line
    string mCode; ///< simple statement, return/throw expression, if/while condition
    StatementList mBody; ///< if/while body
    StatementList mElseBody; ///< if: else branch
    bool mInline; ///< on the same line as the enclosing if, no line event of its own

    ScriptStatement(StatementType aType, int aLine, const string &aCode) : mType(aType), mLine(aLine), mCode(aCode), mInline(false) {};
  };


  /// compiled function body
  class ScriptCode : public CodeUnit
  {
    typedef CodeUnit inherited;
    friend class ScriptRuntime;

    string mName;
    string mFileName;
    int mFirstLine;
    std::vector<string> mArgNames;
    SourceTextPtr mSource;
    StatementList mBody;

  public:

    ScriptCode(const string &aName, const string &aFileName, int aFirstLine, SourceTextPtr aSource);

    virtual string name() const TMX_OVERRIDE { return mName; }
    virtual string fileName() const TMX_OVERRIDE { return mFileName; }
    virtual int firstLine() const TMX_OVERRIDE { return mFirstLine; }
    virtual const std::vector<string> &argNames() const TMX_OVERRIDE { return mArgNames; }
    virtual string sourceLine(int aLine) const TMX_OVERRIDE;

    const StatementList &body() const { return mBody; }
  };
  typedef boost::intrusive_ptr<ScriptCode> ScriptCodePtr;


  /// script function, possibly wrapping another callable (decorator)
  class ScriptFunction : public Callable
  {
    typedef Callable inherited;

    ScriptCodePtr mCode;
    ScriptModulePtr mModule; ///< defining module, provides the globals
    CallablePtr mWrapped; ///< set for decorated functions

  public:

    ScriptFunction(ScriptCodePtr aCode, ScriptModulePtr aModule, CallablePtr aWrapped = CallablePtr());

    virtual string name() TMX_OVERRIDE;
    virtual CodeUnitPtr code() TMX_OVERRIDE { return mCode; }
    virtual CallablePtr wrapped() TMX_OVERRIDE { return mWrapped; }

    ScriptCodePtr scriptCode() { return mCode; }
    ScriptModulePtr module() { return mModule; }
  };
  typedef boost::intrusive_ptr<ScriptFunction> ScriptFunctionPtr;


  /// method bound to a receiver
  class BoundMethod : public Callable
  {
    typedef Callable inherited;

    ScriptFunctionPtr mFunction;
    TmxObjPtr mReceiver;

  public:

    BoundMethod(ScriptFunctionPtr aFunction, TmxObjPtr aReceiver) : mFunction(aFunction), mReceiver(aReceiver) {};

    virtual string name() TMX_OVERRIDE { return mFunction->name(); }
    virtual CodeUnitPtr code() TMX_OVERRIDE { return mFunction->code(); }
    virtual CallablePtr underlyingFunction() TMX_OVERRIDE { return mFunction; }
    virtual TmxObjPtr boundReceiver() TMX_OVERRIDE { return mReceiver; }

    ScriptFunctionPtr function() { return mFunction; }
  };


  /// builtin function implemented in C++
  class NativeFunction : public Callable
  {
    typedef Callable inherited;

  public:

    typedef boost::function<ErrorPtr (const ValueList &aArgs, ScriptValue &aResult)> NativeImplementation;

  private:

    string mName;
    int mNumArgs;
    NativeImplementation mImplementation;

  public:

    NativeFunction(const string &aName, int aNumArgs, NativeImplementation aImplementation);

    virtual string name() TMX_OVERRIDE { return mName; }
    virtual CodeUnitPtr code() TMX_OVERRIDE { return CodeUnitPtr(); }

    ErrorPtr invoke(const ValueList &aArgs, ScriptValue &aResult);
  };
  typedef boost::intrusive_ptr<NativeFunction> NativeFunctionPtr;


  class ScriptClass;
  typedef boost::intrusive_ptr<ScriptClass> ScriptClassPtr;

  /// class with methods. Calling it creates an instance, running its `init` method if any
  class ScriptClass : public Callable
  {
    typedef Callable inherited;
    friend class ScriptRuntime;

    string mName;
    typedef std::map<string, ScriptFunctionPtr> MethodsMap;
    MethodsMap mMethods;

  public:

    ScriptClass(const string &aName) : mName(aName) {};

    virtual string name() TMX_OVERRIDE { return mName; }
    virtual CodeUnitPtr code() TMX_OVERRIDE { return CodeUnitPtr(); }
    virtual bool memberByName(const string &aName, ScriptValue &aValue) TMX_OVERRIDE;

    /// @return method or NULL
    ScriptFunctionPtr method(const string &aName);
  };


  /// class instance. Instances of classes with a `call` method are callable objects
  class ScriptObject : public Callable
  {
    typedef Callable inherited;

    ScriptClassPtr mClass;
    VariablesMap mAttributes;

  public:

    ScriptObject(ScriptClassPtr aClass) : mClass(aClass) {};

    virtual string name() TMX_OVERRIDE;
    virtual CodeUnitPtr code() TMX_OVERRIDE;
    virtual CallablePtr underlyingFunction() TMX_OVERRIDE;
    virtual TmxObjPtr boundReceiver() TMX_OVERRIDE { return TmxObjPtr(this); }
    virtual bool memberByName(const string &aName, ScriptValue &aValue) TMX_OVERRIDE;
    virtual ErrorPtr setMemberByName(const string &aName, const ScriptValue &aValue) TMX_OVERRIDE;

    ScriptClassPtr scriptClass() { return mClass; }
  };
  typedef boost::intrusive_ptr<ScriptObject> ScriptObjectPtr;


  class ScriptFrame;
  typedef boost::intrusive_ptr<ScriptFrame> ScriptFramePtr;

  /// one activation of a script function
  class ScriptFrame : public ExecutionContext
  {
    typedef ExecutionContext inherited;
    friend class ScriptRuntime;

    ScriptCodePtr mCode;
    ScriptModulePtr mModule;
    int mLine;
    TmxObjPtr mReceiver;
    VariablesMap mLocals;
    ExecutionContextPtr mCaller;
    TraceHookPtr mLocalHook;
    uint64_t mActivationId;
    bool mUnwinding;

  public:

    ScriptFrame(ScriptCodePtr aCode, ScriptModulePtr aModule, TmxObjPtr aReceiver, ExecutionContextPtr aCaller, uint64_t aActivationId);

    virtual CodeUnitPtr code() TMX_OVERRIDE { return mCode; }
    virtual int line() TMX_OVERRIDE { return mLine; }
    virtual TmxObjPtr receiver() TMX_OVERRIDE { return mReceiver; }
    virtual const VariablesMap &locals() TMX_OVERRIDE { return mLocals; }
    virtual void updateLocals(const VariablesMap &aBindings) TMX_OVERRIDE;
    virtual VariablesMap &globals() TMX_OVERRIDE { return mModule->globals(); }
    virtual ExecutionContextPtr caller() TMX_OVERRIDE { return mCaller; }
    virtual TraceHookPtr localHook() TMX_OVERRIDE { return mLocalHook; }
    virtual void setLocalHook(TraceHookPtr aHook) TMX_OVERRIDE { mLocalHook = aHook; }
    virtual uint64_t activationId() TMX_OVERRIDE { return mActivationId; }
    virtual bool unwinding() TMX_OVERRIDE { return mUnwinding; }
  };


  /// the interpreter
  class ScriptRuntime : public TraceHost
  {
    typedef TraceHost inherited;

    TraceHookPtr mGlobalHook;
    VariablesMap mBuiltins;
    std::vector<ScriptModulePtr> mModules;
    ScriptFramePtr mCurrentFrame; ///< innermost running frame
    uint64_t mNextActivationId;
    int mCallDepth;
    int mHookDepth; ///< >0 while a hook is running

  public:

    ScriptRuntime();
    virtual ~ScriptRuntime();

    /// @name TraceHost interface
    /// @{
    virtual TraceHookPtr globalHook() TMX_OVERRIDE { return mGlobalHook; }
    virtual void setGlobalHook(TraceHookPtr aHook) TMX_OVERRIDE { mGlobalHook = aHook; }
    virtual ErrorPtr evaluate(const string &aCode, EvalMode aMode, VariablesMap &aLocals, VariablesMap *aGlobals, ScriptValue &aResult) TMX_OVERRIDE;
    /// @}

    /// load a module
    /// @param aName module name
    /// @param aFileName file name the code is attributed to (need not exist)
    /// @param aSource the source code
    /// @param aModule will receive the module
    /// @return ok or error (syntax errors, errors from top level statements)
    ErrorPtr loadModule(const string &aName, const string &aFileName, const string &aSource, ScriptModulePtr &aModule);

    /// run statements at module level (globals of the module act as locals)
    /// @param aModule the module
    /// @param aStatements the statements
    /// @param aResult value of the last statement
    /// @return ok or error (uncaught exception)
    ErrorPtr run(ScriptModulePtr aModule, const string &aStatements, ScriptValue &aResult);

    /// call a callable value
    /// @param aCallee function, bound method, callable object, class or native
    /// @param aArgs arguments
    /// @param aResult the return value
    /// @return ok or error (uncaught exception of the call)
    ErrorPtr call(const ScriptValue &aCallee, const ValueList &aArgs, ScriptValue &aResult);

    /// create a decorated function
    /// @param aWrapper the function whose code runs when the decorated function is called
    /// @param aInner the callable the wrapper gets as local `wrapped`
    /// @return the decorated function
    ScriptFunctionPtr decorate(ScriptFunctionPtr aWrapper, CallablePtr aInner);

    /// @return innermost running context, NULL if none
    ExecutionContextPtr currentContext() { return mCurrentFrame; }

    /// @return the builtins
    const VariablesMap &builtins() { return mBuiltins; }

  private:

    ErrorPtr parseModule(ScriptModulePtr aModule);
    ErrorPtr parseFunction(ScriptModulePtr aModule, size_t &aLineIdx, ScriptFunctionPtr &aFunction);
    ErrorPtr parseBlock(ScriptModulePtr aModule, size_t &aLineIdx, StatementList &aStatements, string &aTerminator);
    ErrorPtr parseStatement(ScriptModulePtr aModule, size_t &aLineIdx, const string &aText, int aLine, ScriptStatementPtr &aStatement);

    ErrorPtr callFunction(ScriptFunctionPtr aFunction, TmxObjPtr aReceiver, const ValueList &aArgs, ScriptValue &aResult);
    ErrorPtr executeBlock(ScriptFrame &aFrame, const StatementList &aStatements, bool &aReturned, ScriptValue &aResult);
    ErrorPtr executeStatement(ScriptFrame &aFrame, ScriptStatementPtr aStatement, bool &aReturned, ScriptValue &aResult);
    ErrorPtr evaluateIn(ScriptFrame &aFrame, const string &aCode, EvalMode aMode, ScriptValue &aResult);
    ErrorPtr lineEvent(ScriptFrame &aFrame, int aLine);
    ErrorPtr localEvent(ScriptFrame &aFrame, TraceEvent aEvent, const ScriptValue &aArg);
    void hookFailed(ScriptFrame &aFrame, ErrorPtr aError);

  };

} // namespace tmx

#endif /* defined(__tracemux__scriptrt__) */
