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

#include "expressions.hpp"

#include <stdio.h>
#include <ctype.h>

using namespace tmx;


EvaluationContext::EvaluationContext(VariablesMap &aLocals, VariablesMap *aGlobals, const VariablesMap *aBuiltins, CallHandlerCB aCallHandler) :
  mPos(0),
  mSkipping(false),
  mLocals(aLocals),
  mGlobals(aGlobals),
  mBuiltins(aBuiltins),
  mCallHandler(aCallHandler)
{
}


// MARK: - entry points

ErrorPtr EvaluationContext::evaluateExpression(const string &aExpression, ScriptValue &aResult)
{
  mCode = aExpression;
  mPos = 0;
  mSkipping = false;
  aResult.setNull();
  ErrorPtr err = expression(aResult);
  if (Error::notOK(err)) return err;
  skipNonCode();
  if (currentchar()) {
    return syntaxError("unexpected '%c' after expression", currentchar());
  }
  return ErrorPtr();
}


ErrorPtr EvaluationContext::executeStatements(const string &aStatements, ScriptValue &aResult)
{
  mCode = aStatements;
  mPos = 0;
  mSkipping = false;
  aResult.setNull();
  while (true) {
    skipNonCode();
    while (currentchar()==';') { mPos++; skipNonCode(); }
    if (!currentchar()) break;
    ErrorPtr err = statement(aResult);
    if (Error::notOK(err)) return err;
    // statements must be separated by semicolon or line end
    size_t e = mPos;
    skipNonCode();
    if (currentchar()==';') { mPos++; continue; }
    if (currentchar()==0) break;
    size_t le = mCode.find_first_of("\n\r", e);
    if (le==string::npos || le>=mPos) {
      return syntaxError("unexpected '%c', missing ';' or line end", currentchar());
    }
  }
  return ErrorPtr();
}


// MARK: - parsing utilities

void EvaluationContext::skipNonCode(size_t &aPos)
{
  bool recheck;
  do {
    recheck = false;
    while (code(aPos)==' ' || code(aPos)=='\t' || code(aPos)=='\n' || code(aPos)=='\r') aPos++;
    // also check for comments
    if (code(aPos)=='/') {
      if (code(aPos+1)=='/') {
        aPos += 2;
        // C++ style comment, lasts until EOT or EOL
        while (code(aPos) && code(aPos)!='\n' && code(aPos)!='\r') aPos++;
        recheck = true;
      }
      else if (code(aPos+1)=='*') {
        // C style comment, lasts until '*/'
        aPos += 2;
        while (code(aPos) && !(code(aPos)=='*' && code(aPos+1)=='/')) aPos++;
        if (code(aPos)) aPos += 2;
        recheck = true;
      }
    }
  } while(recheck);
}


bool EvaluationContext::getIdentifier(string &aIdentifier)
{
  const char* p = tail(mPos);
  if (!isalpha(*p) && *p!='_') return false; // is not an identifier
  const char* b = p; // begins here
  p++;
  while (*p && (isalnum(*p) || *p=='_')) p++;
  aIdentifier.assign(b, p-b);
  mPos += p-b;
  return true;
}


bool EvaluationContext::isIdentifier(const string &aName)
{
  if (aName.empty()) return false;
  if (!isalpha(aName[0]) && aName[0]!='_') return false;
  for (size_t i=1; i<aName.size(); i++) {
    if (!isalnum(aName[i]) && aName[i]!='_') return false;
  }
  return true;
}


ErrorPtr EvaluationContext::syntaxError(const char *aFmt, ...)
{
  string msg;
  va_list args;
  va_start(args, aFmt);
  string_format_v(msg, false, aFmt, args);
  va_end(args);
  string_format_append(msg, " in '%s' at position %zu", mCode.c_str(), mPos);
  return Error::err_str<ScriptError>(ScriptError::Syntax, msg);
}


ErrorPtr EvaluationContext::parseNumericLiteral(ScriptValue &aResult, const char* aCode, size_t& aPos)
{
  double v;
  int i;
  if (sscanf(aCode+aPos, "%lf%n", &v, &i)!=1) {
    return Error::err<ScriptError>(ScriptError::Syntax, "invalid number at position %zu", aPos);
  }
  aPos += i; // past consumation of sscanf
  aResult.setNumber(v);
  return ErrorPtr();
}


EvaluationContext::Operations EvaluationContext::parseOperator(size_t &aPos)
{
  skipNonCode(aPos);
  // check for operator
  Operations op = op_none;
  switch (code(aPos++)) {
    // assignment and equality
    case '=': {
      if (code(aPos)=='=') {
        aPos++; op = op_equal; break;
      }
      op = op_assign; break;
    }
    case '*': op = op_multiply; break;
    case '/': op = op_divide; break;
    case '%': op = op_modulo; break;
    case '+': op = op_add; break;
    case '-': op = op_subtract; break;
    case '&': op = op_and; if (code(aPos)=='&') aPos++; break;
    case '|': op = op_or; if (code(aPos)=='|') aPos++; break;
    case '<': {
      if (code(aPos)=='=') {
        aPos++; op = op_leq; break;
      }
      else if (code(aPos)=='>') {
        aPos++; op = op_notequal; break;
      }
      op = op_less; break;
    }
    case '>': {
      if (code(aPos)=='=') {
        aPos++; op = op_geq; break;
      }
      op = op_greater; break;
    }
    case '!': {
      if (code(aPos)=='=') {
        aPos++; op = op_notequal; break;
      }
      op = op_not; break;
    }
    default:
      --aPos; // no expression char
      return op_none;
  }
  skipNonCode(aPos);
  return op;
}


// MARK: - statements

ErrorPtr EvaluationContext::statement(ScriptValue &aResult)
{
  ErrorPtr err;
  skipNonCode();
  size_t start = mPos;
  string id;
  if (getIdentifier(id)) {
    if (id=="var") {
      // variable definition, always local
      skipNonCode();
      string name;
      if (!getIdentifier(name)) return syntaxError("missing variable name after 'var'");
      skipNonCode();
      ScriptValue v;
      if (currentchar()=='=' && code(mPos+1)!='=') {
        mPos++;
        err = expression(v);
        if (Error::notOK(err)) return err;
      }
      aResult = v;
      return assign(name, v, true);
    }
    // check for assignment to variable or member
    std::vector<string> path;
    path.push_back(id);
    bool lvalue = true;
    while (true) {
      skipNonCode();
      if (currentchar()!='.') break;
      mPos++;
      skipNonCode();
      string m;
      if (!getIdentifier(m)) { lvalue = false; break; }
      path.push_back(m);
    }
    skipNonCode();
    if (lvalue && currentchar()=='=' && code(mPos+1)!='=') {
      mPos++;
      ScriptValue v;
      err = expression(v);
      if (Error::notOK(err)) return err;
      aResult = v;
      if (path.size()==1) return assign(id, v, false);
      // member assignment
      ScriptValue obj;
      err = lookup(path[0], obj);
      for (size_t i=1; Error::isOK(err) && i<path.size()-1; i++) {
        ScriptValue o = obj;
        err = member(o, path[i], obj);
      }
      if (Error::notOK(err)) return err;
      MemberAccess *target = obj.isObject() ? dynamic_cast<MemberAccess *>(obj.objectValue().get()) : NULL;
      if (!target) {
        return Error::err<ScriptError>(ScriptError::Invalid, "cannot assign member '%s' of a non-object", path.back().c_str());
      }
      return target->setMemberByName(path.back(), v);
    }
    // not an assignment, re-parse as expression
    mPos = start;
  }
  return expression(aResult);
}


ErrorPtr EvaluationContext::assign(const string &aName, const ScriptValue &aValue, bool aLocal)
{
  if (aLocal || !mGlobals || mLocals.find(aName)!=mLocals.end() || mGlobals->find(aName)==mGlobals->end()) {
    mLocals[aName] = aValue;
  }
  else {
    (*mGlobals)[aName] = aValue;
  }
  return ErrorPtr();
}


// MARK: - expressions

ErrorPtr EvaluationContext::expression(ScriptValue &aResult)
{
  ErrorPtr err = binaryTerm(1, aResult);
  if (Error::notOK(err)) return err;
  skipNonCode();
  if (currentchar()=='?') {
    // conditional, only the chosen branch is evaluated
    mPos++;
    bool cond = aResult.boolValue();
    bool wasSkipping = mSkipping;
    ScriptValue a, b;
    mSkipping = wasSkipping || !cond;
    err = expression(a);
    if (Error::isOK(err)) {
      skipNonCode();
      if (currentchar()!=':') {
        err = syntaxError("missing ':' in conditional expression");
      }
      else {
        mPos++;
        mSkipping = wasSkipping || cond;
        err = expression(b);
      }
    }
    mSkipping = wasSkipping;
    if (Error::notOK(err)) return err;
    aResult = cond ? a : b;
  }
  return ErrorPtr();
}


ErrorPtr EvaluationContext::binaryTerm(int aMinPrecedence, ScriptValue &aResult)
{
  ErrorPtr err = unaryTerm(aResult);
  if (Error::notOK(err)) return err;
  while (true) {
    size_t p = mPos;
    Operations op = parseOperator(p);
    int precedence = op & opmask_precedence;
    if (op==op_none || op==op_not || op==op_assign || precedence<aMinPrecedence) break;
    mPos = p;
    ScriptValue right;
    if (op==op_and || op==op_or) {
      // short circuit: right side is only evaluated when it can change the outcome
      bool decided = !mSkipping && (op==op_and ? !aResult.boolValue() : aResult.boolValue());
      bool wasSkipping = mSkipping;
      if (decided) mSkipping = true;
      err = binaryTerm(precedence+1, right);
      mSkipping = wasSkipping;
      if (Error::notOK(err)) return err;
      if (mSkipping) continue;
      aResult.setBool(decided ? op==op_or : right.boolValue());
      continue;
    }
    err = binaryTerm(precedence+1, right);
    if (Error::notOK(err)) return err;
    if (mSkipping) continue;
    ScriptValue left = aResult;
    switch (op) {
      case op_multiply: aResult = left * right; break;
      case op_divide: aResult = left / right; break;
      case op_modulo: aResult = left % right; break;
      case op_add: aResult = left + right; break;
      case op_subtract: aResult = left - right; break;
      case op_equal: aResult = left == right; break;
      case op_notequal: aResult = left != right; break;
      case op_less: aResult = left < right; break;
      case op_greater: aResult = left > right; break;
      case op_leq: aResult = left <= right; break;
      case op_geq: aResult = left >= right; break;
      default: break;
    }
    if (aResult.isError()) return aResult.errorValue();
  }
  return ErrorPtr();
}


ErrorPtr EvaluationContext::unaryTerm(ScriptValue &aResult)
{
  ErrorPtr err;
  skipNonCode();
  char c = currentchar();
  if (c=='!' && code(mPos+1)!='=') {
    mPos++;
    err = unaryTerm(aResult);
    if (Error::isOK(err) && !mSkipping) aResult = !aResult;
    return err;
  }
  if (c=='-') {
    mPos++;
    err = unaryTerm(aResult);
    if (Error::isOK(err) && !mSkipping) {
      if (aResult.isObject()) return Error::err<ScriptError>(ScriptError::Invalid, "cannot negate an object");
      aResult.setNumber(-aResult.numValue());
    }
    return err;
  }
  if (c=='+') {
    // dummy, is NOP, allowed for clarification purposes
    mPos++;
    return unaryTerm(aResult);
  }
  return term(aResult);
}


ErrorPtr EvaluationContext::stringLiteral(ScriptValue &aResult)
{
  // c-like with double quotes or php-like with single quotes and no escaping inside
  char delimiter = currentchar();
  string str;
  mPos++;
  char c;
  while(true) {
    c = currentchar();
    if (c==delimiter) {
      if (delimiter=='\'' && code(mPos+1)==delimiter) {
        // single quoted strings allow including delimiter by doubling it
        str += delimiter;
        mPos += 2;
        continue;
      }
      break; // end of string
    }
    if (c==0) return syntaxError("unterminated string, missing %c delimiter", delimiter);
    if (delimiter!='\'' && c=='\\') {
      c = code(++mPos);
      if (c==0) return syntaxError("incomplete \\-escape");
      else if (c=='n') c='\n';
      else if (c=='r') c='\r';
      else if (c=='t') c='\t';
      // everything else is taken literally
    }
    str += c;
    mPos++;
  }
  mPos++; // skip closing quote
  aResult.setString(str);
  return ErrorPtr();
}


ErrorPtr EvaluationContext::term(ScriptValue &aResult)
{
  ErrorPtr err;
  skipNonCode();
  char c = currentchar();
  if (c=='(') {
    mPos++;
    err = expression(aResult);
    if (Error::notOK(err)) return err;
    skipNonCode();
    if (currentchar()!=')') return syntaxError("missing ')'");
    mPos++;
  }
  else if (c=='"' || c=='\'') {
    err = stringLiteral(aResult);
    if (Error::notOK(err)) return err;
  }
  else if (isdigit(c) || (c=='.' && isdigit(code(mPos+1)))) {
    err = parseNumericLiteral(aResult, mCode.c_str(), mPos);
    if (Error::notOK(err)) return err;
  }
  else {
    string id;
    if (!getIdentifier(id)) {
      if (c) return syntaxError("unexpected '%c'", c);
      return syntaxError("unexpected end of expression");
    }
    if (id=="true") aResult.setBool(true);
    else if (id=="false") aResult.setBool(false);
    else if (id=="null" || mSkipping) aResult.setNull();
    else {
      err = lookup(id, aResult);
      if (Error::notOK(err)) return err;
    }
  }
  // member access and calls
  while (true) {
    skipNonCode();
    if (currentchar()=='.') {
      mPos++;
      skipNonCode();
      string m;
      if (!getIdentifier(m)) return syntaxError("missing member name after '.'");
      if (!mSkipping) {
        ScriptValue o = aResult;
        err = member(o, m, aResult);
        if (Error::notOK(err)) return err;
      }
    }
    else if (currentchar()=='(') {
      mPos++;
      ValueList args;
      skipNonCode();
      if (currentchar()!=')') {
        while (true) {
          ScriptValue a;
          err = expression(a);
          if (Error::notOK(err)) return err;
          args.push_back(a);
          skipNonCode();
          if (currentchar()==',') { mPos++; continue; }
          if (currentchar()==')') break;
          return syntaxError("missing ',' or ')' in argument list");
        }
      }
      mPos++; // skip closing paren
      if (!mSkipping) {
        if (mCallHandler.empty()) {
          return Error::err<ScriptError>(ScriptError::Invalid, "calls are not possible here");
        }
        ScriptValue callee = aResult;
        aResult.setNull();
        err = mCallHandler(callee, args, aResult);
        if (Error::notOK(err)) return err;
      }
    }
    else {
      break;
    }
  }
  return ErrorPtr();
}


ErrorPtr EvaluationContext::lookup(const string &aName, ScriptValue &aResult)
{
  VariablesMap::const_iterator pos = mLocals.find(aName);
  if (pos!=mLocals.end()) {
    aResult = pos->second;
    return ErrorPtr();
  }
  if (mGlobals) {
    pos = mGlobals->find(aName);
    if (pos!=mGlobals->end()) {
      aResult = pos->second;
      return ErrorPtr();
    }
  }
  if (mBuiltins) {
    pos = mBuiltins->find(aName);
    if (pos!=mBuiltins->end()) {
      aResult = pos->second;
      return ErrorPtr();
    }
  }
  return Error::err<ScriptError>(ScriptError::NotFound, "undefined variable '%s'", aName.c_str());
}


ErrorPtr EvaluationContext::member(const ScriptValue &aObject, const string &aName, ScriptValue &aResult)
{
  MemberAccess *obj = aObject.isObject() ? dynamic_cast<MemberAccess *>(aObject.objectValue().get()) : NULL;
  if (!obj) {
    return Error::err<ScriptError>(ScriptError::Invalid, "%s has no members, cannot access '%s'", aObject.description().c_str(), aName.c_str());
  }
  if (!obj->memberByName(aName, aResult)) {
    return Error::err<ScriptError>(ScriptError::NotFound, "no member named '%s'", aName.c_str());
  }
  return ErrorPtr();
}
