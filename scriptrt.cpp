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

// set to 1 to log every hook invocation even in non-DEBUG builds (must precede including logger.hpp)
#define ALWAYS_DEBUG 0

#include "scriptrt.hpp"

#include <math.h>
#include <ctype.h>
#include <string.h>

using namespace tmx;


// MARK: - source text helpers

string SourceText::line(int aLine) const
{
  if (aLine<1 || aLine>(int)mLines.size()) return "";
  return mLines[aLine-1];
}


/// @return line with comment removed and whitespace trimmed
static string codeText(const string &aLine)
{
  char quote = 0;
  size_t i;
  for (i=0; i<aLine.size(); i++) {
    char c = aLine[i];
    if (quote) {
      if (c=='\\' && quote=='"') i++;
      else if (c==quote) quote = 0;
    }
    else if (c=='"' || c=='\'') quote = c;
    else if (c=='/' && i+1<aLine.size() && aLine[i+1]=='/') break;
  }
  return trimWhiteSpace(aLine.substr(0, i));
}


/// @return true if aText begins with keyword aKeyword
static bool keyword(const string &aText, const char *aKeyword)
{
  size_t n = strlen(aKeyword);
  if (aText.compare(0, n, aKeyword)!=0) return false;
  return aText.size()==n || !(isalnum(aText[n]) || aText[n]=='_');
}


/// find the closing paren matching the opening one at aOpenPos
static size_t matchingParen(const string &aText, size_t aOpenPos)
{
  int level = 0;
  char quote = 0;
  for (size_t i=aOpenPos; i<aText.size(); i++) {
    char c = aText[i];
    if (quote) {
      if (c=='\\' && quote=='"') i++;
      else if (c==quote) quote = 0;
    }
    else if (c=='"' || c=='\'') quote = c;
    else if (c=='(') level++;
    else if (c==')') {
      if (--level==0) return i;
    }
  }
  return string::npos;
}


static bool isElse(const string &aTerminator)
{
  if (aTerminator.empty() || aTerminator[0]!='}') return false;
  string t = trimWhiteSpace(aTerminator.substr(1));
  if (!keyword(t, "else")) return false;
  return trimWhiteSpace(t.substr(4))=="{";
}


// MARK: - code units and callables

ScriptCode::ScriptCode(const string &aName, const string &aFileName, int aFirstLine, SourceTextPtr aSource) :
  mName(aName),
  mFileName(aFileName),
  mFirstLine(aFirstLine),
  mSource(aSource)
{
}


string ScriptCode::sourceLine(int aLine) const
{
  if (!mSource) return "";
  return mSource->line(aLine);
}


ScriptFunction::ScriptFunction(ScriptCodePtr aCode, ScriptModulePtr aModule, CallablePtr aWrapped) :
  mCode(aCode),
  mModule(aModule),
  mWrapped(aWrapped)
{
}


string ScriptFunction::name()
{
  // decorated functions keep the name of what they decorate
  if (mWrapped) return mWrapped->name();
  return mCode->name();
}


NativeFunction::NativeFunction(const string &aName, int aNumArgs, NativeImplementation aImplementation) :
  mName(aName),
  mNumArgs(aNumArgs),
  mImplementation(aImplementation)
{
}


ErrorPtr NativeFunction::invoke(const ValueList &aArgs, ScriptValue &aResult)
{
  if ((int)aArgs.size()!=mNumArgs) {
    return Error::err<ScriptError>(ScriptError::Invalid, "%s() expects %d arguments, got %d", mName.c_str(), mNumArgs, (int)aArgs.size());
  }
  return mImplementation(aArgs, aResult);
}


ScriptFunctionPtr ScriptClass::method(const string &aName)
{
  MethodsMap::iterator pos = mMethods.find(aName);
  if (pos==mMethods.end()) return ScriptFunctionPtr();
  return pos->second;
}


bool ScriptClass::memberByName(const string &aName, ScriptValue &aValue)
{
  ScriptFunctionPtr m = method(aName);
  if (!m) return false;
  aValue = ScriptValue(TmxObjPtr(m));
  return true;
}


string ScriptObject::name()
{
  return mClass->name();
}


CodeUnitPtr ScriptObject::code()
{
  ScriptFunctionPtr m = mClass->method("call");
  if (!m) return CodeUnitPtr();
  return m->code();
}


CallablePtr ScriptObject::underlyingFunction()
{
  return mClass->method("call");
}


bool ScriptObject::memberByName(const string &aName, ScriptValue &aValue)
{
  VariablesMap::iterator pos = mAttributes.find(aName);
  if (pos!=mAttributes.end()) {
    aValue = pos->second;
    return true;
  }
  ScriptFunctionPtr m = mClass->method(aName);
  if (!m) return false;
  aValue = ScriptValue(TmxObjPtr(new BoundMethod(m, TmxObjPtr(this))));
  return true;
}


ErrorPtr ScriptObject::setMemberByName(const string &aName, const ScriptValue &aValue)
{
  mAttributes[aName] = aValue;
  return ErrorPtr();
}


// MARK: - module

ScriptModule::ScriptModule(const string &aName, const string &aFileName) :
  mName(aName),
  mFileName(aFileName),
  mSource(new SourceText)
{
}


bool ScriptModule::memberByName(const string &aName, ScriptValue &aValue)
{
  VariablesMap::iterator pos = mGlobals.find(aName);
  if (pos==mGlobals.end()) return false;
  aValue = pos->second;
  return true;
}


ErrorPtr ScriptModule::setMemberByName(const string &aName, const ScriptValue &aValue)
{
  mGlobals[aName] = aValue;
  return ErrorPtr();
}


ScriptValue ScriptModule::global(const string &aName)
{
  ScriptValue v;
  memberByName(aName, v);
  return v;
}


// MARK: - frame

ScriptFrame::ScriptFrame(ScriptCodePtr aCode, ScriptModulePtr aModule, TmxObjPtr aReceiver, ExecutionContextPtr aCaller, uint64_t aActivationId) :
  mCode(aCode),
  mModule(aModule),
  mLine(aCode->firstLine()),
  mReceiver(aReceiver),
  mCaller(aCaller),
  mActivationId(aActivationId),
  mUnwinding(false)
{
}


void ScriptFrame::updateLocals(const VariablesMap &aBindings)
{
  for (VariablesMap::const_iterator pos = aBindings.begin(); pos!=aBindings.end(); ++pos) {
    mLocals[pos->first] = pos->second;
  }
}


// MARK: - builtins

static ErrorPtr builtin_abs(const ValueList &aArgs, ScriptValue &aResult)
{
  aResult.setNumber(fabs(aArgs[0].numValue()));
  return ErrorPtr();
}


static ErrorPtr builtin_string(const ValueList &aArgs, ScriptValue &aResult)
{
  aResult.setString(aArgs[0].stringValue());
  return ErrorPtr();
}


static ErrorPtr builtin_number(const ValueList &aArgs, ScriptValue &aResult)
{
  aResult.setNumber(aArgs[0].numValue());
  return ErrorPtr();
}


// MARK: - runtime

ScriptRuntime::ScriptRuntime() :
  mNextActivationId(0),
  mCallDepth(0),
  mHookDepth(0)
{
  mBuiltins["abs"] = ScriptValue(TmxObjPtr(new NativeFunction("abs", 1, &builtin_abs)));
  mBuiltins["string"] = ScriptValue(TmxObjPtr(new NativeFunction("string", 1, &builtin_string)));
  mBuiltins["number"] = ScriptValue(TmxObjPtr(new NativeFunction("number", 1, &builtin_number)));
}


ScriptRuntime::~ScriptRuntime()
{
  // functions refer to their module, module globals to functions: break these cycles
  for (std::vector<ScriptModulePtr>::iterator pos = mModules.begin(); pos!=mModules.end(); ++pos) {
    (*pos)->mGlobals.clear();
  }
  mModules.clear();
}


ErrorPtr ScriptRuntime::evaluate(const string &aCode, EvalMode aMode, VariablesMap &aLocals, VariablesMap *aGlobals, ScriptValue &aResult)
{
  EvaluationContext ctx(aLocals, aGlobals, &mBuiltins, boost::bind(&ScriptRuntime::call, this, _1, _2, _3));
  if (aMode==eval_expression) {
    return ctx.evaluateExpression(aCode, aResult);
  }
  return ctx.executeStatements(aCode, aResult);
}


ErrorPtr ScriptRuntime::loadModule(const string &aName, const string &aFileName, const string &aSource, ScriptModulePtr &aModule)
{
  ScriptModulePtr module = ScriptModulePtr(new ScriptModule(aName, aFileName));
  const char *p = aSource.c_str();
  string line;
  while (nextLine(p, line)) {
    module->mSource->mLines.push_back(line);
  }
  mModules.push_back(module);
  ErrorPtr err = parseModule(module);
  if (Error::notOK(err)) {
    LOG(LOG_ERR, "loading module '%s' failed: %s", aName.c_str(), err->text());
    return err;
  }
  LOG(LOG_INFO, "loaded module '%s' from '%s', %zu lines", aName.c_str(), aFileName.c_str(), module->mSource->mLines.size());
  aModule = module;
  return ErrorPtr();
}


ErrorPtr ScriptRuntime::run(ScriptModulePtr aModule, const string &aStatements, ScriptValue &aResult)
{
  return evaluate(aStatements, eval_statements, aModule->mGlobals, NULL, aResult);
}


ScriptFunctionPtr ScriptRuntime::decorate(ScriptFunctionPtr aWrapper, CallablePtr aInner)
{
  return ScriptFunctionPtr(new ScriptFunction(aWrapper->scriptCode(), aWrapper->module(), aInner));
}


// MARK: - parsing

ErrorPtr ScriptRuntime::parseModule(ScriptModulePtr aModule)
{
  ErrorPtr err;
  const std::vector<string> &lines = aModule->mSource->mLines;
  std::vector<string> decorators;
  size_t i = 0;
  while (i<lines.size()) {
    int lineNo = (int)i+1;
    string text = codeText(lines[i]);
    if (text.empty()) { i++; continue; }
    if (text[0]=='@') {
      string d = trimWhiteSpace(text.substr(1));
      if (!EvaluationContext::isIdentifier(d)) {
        return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: invalid decorator '%s'", aModule->mFileName.c_str(), lineNo, d.c_str());
      }
      decorators.push_back(d);
      i++;
      continue;
    }
    if (keyword(text, "function")) {
      ScriptFunctionPtr fn;
      err = parseFunction(aModule, i, fn);
      if (Error::notOK(err)) return err;
      ScriptFunctionPtr f = fn;
      // innermost decorator is applied first
      while (!decorators.empty()) {
        ScriptValue w = aModule->global(decorators.back());
        ScriptFunction *wf = dynamic_cast<ScriptFunction *>(w.objectValue().get());
        if (!wf) {
          return Error::err<ScriptError>(ScriptError::NotFound, "%s:%d: decorator '%s' is not a function", aModule->mFileName.c_str(), lineNo, decorators.back().c_str());
        }
        f = decorate(ScriptFunctionPtr(wf), f);
        decorators.pop_back();
      }
      aModule->mGlobals[fn->scriptCode()->name()] = ScriptValue(TmxObjPtr(f));
      continue;
    }
    if (!decorators.empty()) {
      return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: decorator must precede a function", aModule->mFileName.c_str(), lineNo);
    }
    if (keyword(text, "class")) {
      string rest = trimWhiteSpace(text.substr(5));
      size_t e = 0;
      while (e<rest.size() && (isalnum(rest[e]) || rest[e]=='_')) e++;
      string name = rest.substr(0, e);
      if (!EvaluationContext::isIdentifier(name) || trimWhiteSpace(rest.substr(e))!="{") {
        return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: expected 'class Name {'", aModule->mFileName.c_str(), lineNo);
      }
      ScriptClassPtr cls = ScriptClassPtr(new ScriptClass(name));
      i++;
      while (true) {
        if (i>=lines.size()) {
          return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: missing '}' closing class '%s'", aModule->mFileName.c_str(), lineNo, name.c_str());
        }
        string t = codeText(lines[i]);
        if (t.empty()) { i++; continue; }
        if (t=="}") { i++; break; }
        if (!keyword(t, "function")) {
          return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: only functions are allowed in class body", aModule->mFileName.c_str(), (int)i+1);
        }
        ScriptFunctionPtr m;
        err = parseFunction(aModule, i, m);
        if (Error::notOK(err)) return err;
        cls->mMethods[m->scriptCode()->name()] = m;
      }
      aModule->mGlobals[name] = ScriptValue(TmxObjPtr(cls));
      continue;
    }
    // top level statement, run now
    ScriptValue r;
    err = evaluate(text, eval_statements, aModule->mGlobals, NULL, r);
    if (Error::notOK(err)) {
      return err->withPrefix("%s:%d: ", aModule->mFileName.c_str(), lineNo);
    }
    i++;
  }
  if (!decorators.empty()) {
    return Error::err<ScriptError>(ScriptError::Syntax, "%s: decorator at end of module", aModule->mFileName.c_str());
  }
  return ErrorPtr();
}


ErrorPtr ScriptRuntime::parseFunction(ScriptModulePtr aModule, size_t &aLineIdx, ScriptFunctionPtr &aFunction)
{
  int lineNo = (int)aLineIdx+1;
  string text = codeText(aModule->mSource->mLines[aLineIdx]);
  // function name(a, b) {
  string rest = trimWhiteSpace(text.substr(8));
  size_t o = rest.find('(');
  size_t c = rest.find(')');
  if (o==string::npos || c==string::npos || c<o || trimWhiteSpace(rest.substr(c+1))!="{") {
    return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: expected 'function name(args) {'", aModule->mFileName.c_str(), lineNo);
  }
  string name = trimWhiteSpace(rest.substr(0, o));
  if (!EvaluationContext::isIdentifier(name)) {
    return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: invalid function name '%s'", aModule->mFileName.c_str(), lineNo, name.c_str());
  }
  ScriptCodePtr code = ScriptCodePtr(new ScriptCode(name, aModule->mFileName, lineNo, aModule->mSource));
  string params = rest.substr(o+1, c-o-1);
  size_t s = 0;
  while (!trimWhiteSpace(params).empty() && s<=params.size()) {
    size_t e = params.find(',', s);
    if (e==string::npos) e = params.size();
    string p = trimWhiteSpace(params.substr(s, e-s));
    if (!EvaluationContext::isIdentifier(p)) {
      return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: invalid parameter name '%s'", aModule->mFileName.c_str(), lineNo, p.c_str());
    }
    code->mArgNames.push_back(p);
    s = e+1;
  }
  aLineIdx++;
  string terminator;
  ErrorPtr err = parseBlock(aModule, aLineIdx, code->mBody, terminator);
  if (Error::notOK(err)) return err;
  if (terminator!="}") {
    return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: unexpected '%s' at end of function '%s'", aModule->mFileName.c_str(), (int)aLineIdx, terminator.c_str(), name.c_str());
  }
  aFunction = ScriptFunctionPtr(new ScriptFunction(code, aModule));
  return ErrorPtr();
}


ErrorPtr ScriptRuntime::parseBlock(ScriptModulePtr aModule, size_t &aLineIdx, StatementList &aStatements, string &aTerminator)
{
  const std::vector<string> &lines = aModule->mSource->mLines;
  while (aLineIdx<lines.size()) {
    int lineNo = (int)aLineIdx+1;
    string text = codeText(lines[aLineIdx]);
    aLineIdx++;
    if (text.empty()) continue;
    if (text[0]=='}') {
      aTerminator = text;
      return ErrorPtr();
    }
    ScriptStatementPtr st;
    ErrorPtr err = parseStatement(aModule, aLineIdx, text, lineNo, st);
    if (Error::notOK(err)) return err;
    aStatements.push_back(st);
  }
  return Error::err<ScriptError>(ScriptError::Syntax, "%s: missing '}' at end of file", aModule->mFileName.c_str());
}


ErrorPtr ScriptRuntime::parseStatement(ScriptModulePtr aModule, size_t &aLineIdx, const string &aText, int aLine, ScriptStatementPtr &aStatement)
{
  ErrorPtr err;
  string text = aText;
  if (!text.empty() && text[text.size()-1]==';') text = trimWhiteSpace(text.substr(0, text.size()-1));
  bool isIf = keyword(text, "if");
  if (isIf || keyword(text, "while")) {
    size_t o = text.find_first_not_of(" \t", isIf ? 2 : 5);
    size_t c = o==string::npos || text[o]!='(' ? string::npos : matchingParen(text, o);
    if (c==string::npos) {
      return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: expected '(condition)'", aModule->mFileName.c_str(), aLine);
    }
    aStatement = ScriptStatementPtr(new ScriptStatement(isIf ? ScriptStatement::st_if : ScriptStatement::st_while, aLine, text.substr(o+1, c-o-1)));
    string rest = trimWhiteSpace(text.substr(c+1));
    if (rest=="{") {
      string terminator;
      err = parseBlock(aModule, aLineIdx, aStatement->mBody, terminator);
      if (Error::notOK(err)) return err;
      if (isIf && isElse(terminator)) {
        err = parseBlock(aModule, aLineIdx, aStatement->mElseBody, terminator);
        if (Error::notOK(err)) return err;
      }
      if (terminator!="}") {
        return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: unexpected '%s'", aModule->mFileName.c_str(), (int)aLineIdx, terminator.c_str());
      }
    }
    else if (isIf && !rest.empty()) {
      ScriptStatementPtr sub;
      err = parseStatement(aModule, aLineIdx, rest, aLine, sub);
      if (Error::notOK(err)) return err;
      sub->mInline = true;
      aStatement->mBody.push_back(sub);
    }
    else {
      return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: missing statement after condition", aModule->mFileName.c_str(), aLine);
    }
    return ErrorPtr();
  }
  if (keyword(text, "return")) {
    aStatement = ScriptStatementPtr(new ScriptStatement(ScriptStatement::st_return, aLine, trimWhiteSpace(text.substr(6))));
    return ErrorPtr();
  }
  if (keyword(text, "throw")) {
    string expr = trimWhiteSpace(text.substr(5));
    if (expr.empty()) {
      return Error::err<ScriptError>(ScriptError::Syntax, "%s:%d: throw needs a value", aModule->mFileName.c_str(), aLine);
    }
    aStatement = ScriptStatementPtr(new ScriptStatement(ScriptStatement::st_throw, aLine, expr));
    return ErrorPtr();
  }
  aStatement = ScriptStatementPtr(new ScriptStatement(ScriptStatement::st_simple, aLine, text));
  return ErrorPtr();
}


// MARK: - execution

ErrorPtr ScriptRuntime::call(const ScriptValue &aCallee, const ValueList &aArgs, ScriptValue &aResult)
{
  aResult.setNull();
  TmxObjPtr obj = aCallee.objectValue();
  if (!aCallee.isObject()) {
    return Error::err<ScriptError>(ScriptError::Invalid, "%s is not callable", aCallee.description().c_str());
  }
  if (ScriptFunction *f = dynamic_cast<ScriptFunction *>(obj.get())) {
    return callFunction(ScriptFunctionPtr(f), TmxObjPtr(), aArgs, aResult);
  }
  if (BoundMethod *bm = dynamic_cast<BoundMethod *>(obj.get())) {
    return callFunction(bm->function(), bm->boundReceiver(), aArgs, aResult);
  }
  if (ScriptObject *o = dynamic_cast<ScriptObject *>(obj.get())) {
    ScriptFunctionPtr m = o->scriptClass()->method("call");
    if (!m) {
      return Error::err<ScriptError>(ScriptError::Invalid, "instance of '%s' is not callable", o->name().c_str());
    }
    return callFunction(m, obj, aArgs, aResult);
  }
  if (ScriptClass *cls = dynamic_cast<ScriptClass *>(obj.get())) {
    // instantiate
    ScriptObjectPtr inst = ScriptObjectPtr(new ScriptObject(ScriptClassPtr(cls)));
    ScriptFunctionPtr init = cls->method("init");
    if (init) {
      ScriptValue r;
      ErrorPtr err = callFunction(init, inst, aArgs, r);
      if (Error::notOK(err)) return err;
    }
    else if (!aArgs.empty()) {
      return Error::err<ScriptError>(ScriptError::Invalid, "class '%s' has no init method taking arguments", cls->name().c_str());
    }
    aResult = ScriptValue(TmxObjPtr(inst));
    return ErrorPtr();
  }
  if (NativeFunction *nf = dynamic_cast<NativeFunction *>(obj.get())) {
    return nf->invoke(aArgs, aResult);
  }
  return Error::err<ScriptError>(ScriptError::Invalid, "object is not callable");
}


ErrorPtr ScriptRuntime::callFunction(ScriptFunctionPtr aFunction, TmxObjPtr aReceiver, const ValueList &aArgs, ScriptValue &aResult)
{
  if (mCallDepth>=TMX_SCRIPT_MAX_CALL_DEPTH) {
    return Error::err<ScriptError>(ScriptError::Recursion, "maximum call depth (%d) exceeded calling '%s'", TMX_SCRIPT_MAX_CALL_DEPTH, aFunction->name().c_str());
  }
  ScriptCodePtr code = aFunction->scriptCode();
  ValueList args;
  if (aReceiver) args.push_back(ScriptValue(aReceiver));
  args.insert(args.end(), aArgs.begin(), aArgs.end());
  if (args.size()!=code->argNames().size()) {
    return Error::err<ScriptError>(ScriptError::Invalid, "%s() expects %d arguments, got %d", code->name().c_str(), (int)code->argNames().size(), (int)args.size());
  }
  ScriptFramePtr frame = ScriptFramePtr(new ScriptFrame(code, aFunction->module(), aReceiver, mCurrentFrame, ++mNextActivationId));
  for (size_t i=0; i<args.size(); i++) {
    frame->mLocals[code->argNames()[i]] = args[i];
  }
  if (aFunction->wrapped()) {
    frame->mLocals["wrapped"] = ScriptValue(TmxObjPtr(aFunction->wrapped()));
  }
  ScriptFramePtr prevFrame = mCurrentFrame;
  mCurrentFrame = frame;
  mCallDepth++;
  ErrorPtr err;
  aResult.setNull();
  // entry: global hook decides about observing this context
  if (mGlobalHook && mHookDepth==0) {
    TraceHookPtr hook = mGlobalHook;
    TraceHookPtr next = hook;
    mHookDepth++;
    err = hook->trace(*frame, trace_enter, ScriptValue(), next);
    mHookDepth--;
    if (Error::notOK(err)) hookFailed(*frame, err);
    else frame->mLocalHook = next;
  }
  if (Error::isOK(err)) {
    bool returned = false;
    err = executeBlock(*frame, code->body(), returned, aResult);
  }
  if (Error::notOK(err)) {
    // unwinding
    aResult.setNull();
    frame->mUnwinding = true;
    ErrorPtr hookErr = localEvent(*frame, trace_exception, ScriptValue(err));
    if (Error::notOK(hookErr)) err = hookErr;
    hookErr = localEvent(*frame, trace_return, ScriptValue());
    if (Error::notOK(hookErr)) err = hookErr;
  }
  else {
    err = localEvent(*frame, trace_return, aResult);
    if (Error::notOK(err)) aResult.setNull();
  }
  mCallDepth--;
  mCurrentFrame = prevFrame;
  return err;
}


ErrorPtr ScriptRuntime::executeBlock(ScriptFrame &aFrame, const StatementList &aStatements, bool &aReturned, ScriptValue &aResult)
{
  for (StatementList::const_iterator pos = aStatements.begin(); pos!=aStatements.end(); ++pos) {
    ErrorPtr err = executeStatement(aFrame, *pos, aReturned, aResult);
    if (Error::notOK(err) || aReturned) return err;
  }
  return ErrorPtr();
}


ErrorPtr ScriptRuntime::executeStatement(ScriptFrame &aFrame, ScriptStatementPtr aStatement, bool &aReturned, ScriptValue &aResult)
{
  ErrorPtr err;
  if (!aStatement->mInline) {
    err = lineEvent(aFrame, aStatement->mLine);
    if (Error::notOK(err)) return err;
  }
  switch (aStatement->mType) {
    case ScriptStatement::st_simple: {
      ScriptValue r;
      return evaluateIn(aFrame, aStatement->mCode, eval_statements, r);
    }
    case ScriptStatement::st_return: {
      aResult.setNull();
      if (!aStatement->mCode.empty()) {
        err = evaluateIn(aFrame, aStatement->mCode, eval_expression, aResult);
        if (Error::notOK(err)) return err;
      }
      aReturned = true;
      return ErrorPtr();
    }
    case ScriptStatement::st_throw: {
      ScriptValue v;
      err = evaluateIn(aFrame, aStatement->mCode, eval_expression, v);
      if (Error::notOK(err)) return err;
      return Error::err<ScriptError>(ScriptError::Thrown, "%s", v.stringValue().c_str());
    }
    case ScriptStatement::st_if: {
      ScriptValue cond;
      err = evaluateIn(aFrame, aStatement->mCode, eval_expression, cond);
      if (Error::notOK(err)) return err;
      return executeBlock(aFrame, cond.boolValue() ? aStatement->mBody : aStatement->mElseBody, aReturned, aResult);
    }
    case ScriptStatement::st_while: {
      bool first = true;
      while (true) {
        if (!first) {
          // condition line is visited again for every iteration
          err = lineEvent(aFrame, aStatement->mLine);
          if (Error::notOK(err)) return err;
        }
        first = false;
        ScriptValue cond;
        err = evaluateIn(aFrame, aStatement->mCode, eval_expression, cond);
        if (Error::notOK(err)) return err;
        if (!cond.boolValue()) break;
        err = executeBlock(aFrame, aStatement->mBody, aReturned, aResult);
        if (Error::notOK(err) || aReturned) return err;
      }
      return ErrorPtr();
    }
  }
  return Error::err<ScriptError>(ScriptError::Internal, "unknown statement type");
}


ErrorPtr ScriptRuntime::evaluateIn(ScriptFrame &aFrame, const string &aCode, EvalMode aMode, ScriptValue &aResult)
{
  return evaluate(aCode, aMode, aFrame.mLocals, &aFrame.globals(), aResult);
}


ErrorPtr ScriptRuntime::lineEvent(ScriptFrame &aFrame, int aLine)
{
  aFrame.mLine = aLine;
  return localEvent(aFrame, trace_line, ScriptValue());
}


ErrorPtr ScriptRuntime::localEvent(ScriptFrame &aFrame, TraceEvent aEvent, const ScriptValue &aArg)
{
  TraceHookPtr hook = aFrame.mLocalHook;
  // no events for code run by hooks themselves
  if (!hook || mHookDepth>0) return ErrorPtr();
  TraceHookPtr next = hook;
  DBGLOG(LOG_DEBUG, "%s event in %s() line %d", traceEventName(aEvent), aFrame.mCode->name().c_str(), aFrame.mLine);
  mHookDepth++;
  ErrorPtr err = hook->trace(aFrame, aEvent, aArg, next);
  mHookDepth--;
  if (Error::notOK(err)) {
    hookFailed(aFrame, err);
    return err;
  }
  if (aEvent!=trace_return) aFrame.mLocalHook = next;
  return ErrorPtr();
}


void ScriptRuntime::hookFailed(ScriptFrame &aFrame, ErrorPtr aError)
{
  LOG(LOG_WARNING,
    "trace hook failed in %s() at %s:%d, tracing disabled: %s",
    aFrame.mCode->name().c_str(), aFrame.mCode->fileName().c_str(), aFrame.mLine, Error::text(aError)
  );
  mGlobalHook.reset();
  aFrame.mLocalHook.reset();
}
