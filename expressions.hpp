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

#ifndef __tracemux__expressions__
#define __tracemux__expressions__

#include "tracemux_common.hpp"
#include "values.hpp"

#include <string>

using namespace std;

namespace tmx {

  /// callback function for calling a callable value
  /// @param aCallee the value to call (an object the runtime knows how to call)
  /// @param aArgs the evaluated arguments, in order
  /// @param aResult set to the call's result
  /// @return ok or error (uncaught exception of the call)
  typedef boost::function<ErrorPtr (const ScriptValue &aCallee, const ValueList &aArgs, ScriptValue &aResult)> CallHandlerCB;


  /// Synchronous evaluator for expressions and simple statements
  /// @note evaluates directly on the text. Variables are looked up in locals first, then globals, then builtins.
  class EvaluationContext
  {
  public:

    // operations with precedence
    typedef enum {
      op_none       = (0 << 3) + 6,
      op_not        = (1 << 3) + 6,
      op_multiply   = (2 << 3) + 5,
      op_divide     = (3 << 3) + 5,
      op_modulo     = (4 << 3) + 5,
      op_add        = (5 << 3) + 4,
      op_subtract   = (6 << 3) + 4,
      op_equal      = (7 << 3) + 3,
      op_notequal   = (9 << 3) + 3,
      op_less       = (10 << 3) + 3,
      op_greater    = (11 << 3) + 3,
      op_leq        = (12 << 3) + 3,
      op_geq        = (13 << 3) + 3,
      op_and        = (14 << 3) + 2,
      op_or         = (15 << 3) + 1,
      op_assign     = (16 << 3) + 0,
      opmask_precedence = 0x07
    } Operations;

  private:

    string mCode; ///< the code being evaluated
    size_t mPos; ///< current position in mCode
    bool mSkipping; ///< set while parsing branches that are not to be evaluated
    VariablesMap &mLocals;
    VariablesMap *mGlobals;
    const VariablesMap *mBuiltins;
    CallHandlerCB mCallHandler;

  public:

    /// create evaluation context
    /// @param aLocals local variables, new variables are created here
    /// @param aGlobals global variables, can be NULL
    /// @param aBuiltins read-only builtin names, can be NULL
    /// @param aCallHandler handler for calling callable values, can be empty (calls are errors then)
    EvaluationContext(VariablesMap &aLocals, VariablesMap *aGlobals, const VariablesMap *aBuiltins, CallHandlerCB aCallHandler);

    /// evaluate a single expression
    /// @param aExpression the expression text, must be consumed completely
    /// @param aResult will receive the result
    /// @return ok or error (Syntax, NotFound, or any error raised by operators and calls)
    ErrorPtr evaluateExpression(const string &aExpression, ScriptValue &aResult);

    /// execute one or multiple simple statements
    /// @param aStatements statements separated by semicolons or line ends. Supported are
    ///   `var name [= expr]`, `name = expr`, `obj.member = expr` and plain expressions.
    /// @param aResult will receive the value of the last statement
    /// @return ok or error
    ErrorPtr executeStatements(const string &aStatements, ScriptValue &aResult);

    /// parse a numeric literal
    /// @param aResult receives the number
    /// @param aCode the code
    /// @param aPos position of the literal, will be advanced past it
    /// @return ok or syntax error
    static ErrorPtr parseNumericLiteral(ScriptValue &aResult, const char* aCode, size_t& aPos);

    /// @return true if aName is a valid identifier
    static bool isIdentifier(const string &aName);

  private:

    char code(size_t aPos) const { return aPos<mCode.size() ? mCode[aPos] : 0; }
    char currentchar() const { return code(mPos); }
    const char *tail(size_t aPos) const { return mCode.c_str()+(aPos<mCode.size() ? aPos : mCode.size()); }
    void skipNonCode(size_t &aPos);
    void skipNonCode() { skipNonCode(mPos); }
    bool getIdentifier(string &aIdentifier);
    Operations parseOperator(size_t &aPos);
    ErrorPtr syntaxError(const char *aFmt, ...) __printflike(2,3);

    ErrorPtr statement(ScriptValue &aResult);
    ErrorPtr expression(ScriptValue &aResult);
    ErrorPtr binaryTerm(int aMinPrecedence, ScriptValue &aResult);
    ErrorPtr unaryTerm(ScriptValue &aResult);
    ErrorPtr term(ScriptValue &aResult);
    ErrorPtr stringLiteral(ScriptValue &aResult);
    ErrorPtr lookup(const string &aName, ScriptValue &aResult);
    ErrorPtr member(const ScriptValue &aObject, const string &aName, ScriptValue &aResult);
    ErrorPtr assign(const string &aName, const ScriptValue &aValue, bool aLocal);

  };

} // namespace tmx

#endif /* defined(__tracemux__expressions__) */
