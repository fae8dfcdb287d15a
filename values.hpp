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

#ifndef __tracemux__values__
#define __tracemux__values__

#include "tracemux_common.hpp"

#include <string>

using namespace std;

namespace tmx {

  /// Script Error
  class ScriptError : public Error
  {
  public:
    // Errors
    typedef enum {
      OK,
      Syntax, ///< code cannot be parsed
      NotFound, ///< referenced variable, member or function not found
      Invalid, ///< invalid value or argument count
      DivisionByZero,
      Thrown, ///< user generated error (with throw)
      Recursion, ///< max call depth exceeded
      Internal,
      numErrorCodes
    } ErrorCodes;
    static const char *domain() { return "ScriptError"; }
    virtual const char *getErrorDomain() const TMX_OVERRIDE { return ScriptError::domain(); };
    ScriptError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const TMX_OVERRIDE;
    #endif // ENABLE_NAMED_ERRORS
  };


  /// script value: null, number, string, object reference or error
  class ScriptValue
  {
  public:

    typedef enum {
      null,
      numeric,
      text,
      object,
      error
    } ValueType;

  private:

    ValueType mType;
    double mNumVal;
    string mStrVal;
    TmxObjPtr mObjVal;
    ErrorPtr mErrVal;

  public:

    ScriptValue() : mType(null), mNumVal(0) {};
    ScriptValue(double aNumValue) : mType(numeric), mNumVal(aNumValue) {};
    ScriptValue(int aNumValue) : mType(numeric), mNumVal(aNumValue) {};
    ScriptValue(const string &aStrValue) : mType(text), mNumVal(0), mStrVal(aStrValue) {};
    ScriptValue(const char *aCStrValue) : mType(text), mNumVal(0), mStrVal(nonNullCStr(aCStrValue)) {};
    ScriptValue(TmxObjPtr aObj) : mType(aObj ? object : null), mNumVal(0), mObjVal(aObj) {};
    ScriptValue(ErrorPtr aError) : mType(aError ? error : null), mNumVal(0), mErrVal(aError) {};

    /// @name type checks
    /// @{
    ValueType type() const { return mType; }
    bool isNull() const { return mType==null; }
    bool isNumeric() const { return mType==numeric; }
    bool isString() const { return mType==text; }
    bool isObject() const { return mType==object; }
    bool isError() const { return mType==error; }
    bool isValue() const { return mType!=null && mType!=error; } ///< not null and not error -> real value
    /// @}

    /// @name getters
    /// @{
    double numValue() const; ///< returns a conversion to numeric (using literal syntax), if value is string
    bool boolValue() const; ///< returns a conversion to boolean (true = not numerically 0, non-empty string, any object)
    int intValue() const { return (int)numValue(); }
    string stringValue() const; ///< returns a conversion to string if value is numeric
    TmxObjPtr objectValue() const { return mObjVal; }
    ErrorPtr errorValue() const { return mErrVal; }
    /// @return representation for diagnostics, strings quoted
    string description() const;
    /// @}

    /// @name setters
    /// @{
    void setNull() { mType = null; mNumVal = 0; mStrVal.clear(); mObjVal.reset(); mErrVal.reset(); }
    void setNumber(double aNumValue) { setNull(); mType = numeric; mNumVal = aNumValue; }
    void setBool(bool aBoolValue) { setNumber(aBoolValue ? 1 : 0); }
    void setString(const string &aStrValue) { setNull(); mType = text; mStrVal = aStrValue; }
    void setObject(TmxObjPtr aObj) { setNull(); if (aObj) { mType = object; mObjVal = aObj; } }
    void setError(ErrorPtr aError) { setNull(); if (aError) { mType = error; mErrVal = aError; } }
    /// @}

    /// @return true if both values are of the same type and equal, objects and errors by identity
    bool identical(const ScriptValue &aOther) const;

    /// @name operators
    /// @note results of invalid operations are error values
    /// @{
    ScriptValue operator!() const;
    ScriptValue operator<(const ScriptValue& aRightSide) const;
    ScriptValue operator>=(const ScriptValue& aRightSide) const;
    ScriptValue operator>(const ScriptValue& aRightSide) const;
    ScriptValue operator<=(const ScriptValue& aRightSide) const;
    ScriptValue operator==(const ScriptValue& aRightSide) const;
    ScriptValue operator!=(const ScriptValue& aRightSide) const;
    ScriptValue operator+(const ScriptValue& aRightSide) const;
    ScriptValue operator-(const ScriptValue& aRightSide) const;
    ScriptValue operator*(const ScriptValue& aRightSide) const;
    ScriptValue operator/(const ScriptValue& aRightSide) const;
    ScriptValue operator%(const ScriptValue& aRightSide) const;
    /// @}

  };

  /// local or global variables container
  typedef std::map<string, ScriptValue> VariablesMap;

  /// objects that have named members accessible with the dot notation
  class MemberAccess : public TmxObj
  {
  public:
    /// get a member
    /// @param aName name of the member
    /// @param aValue will be set to the member's value
    /// @return false if there is no such member (default: no members)
    virtual bool memberByName(const string &aName, ScriptValue &aValue) { return false; };

    /// set a member
    /// @param aName name of the member
    /// @param aValue the new value
    /// @return ok or error (default: members are read-only)
    virtual ErrorPtr setMemberByName(const string &aName, const ScriptValue &aValue);
  };
  typedef boost::intrusive_ptr<MemberAccess> MemberAccessPtr;

  /// ordered list of name/value bindings (e.g. arguments in declaration order)
  typedef std::vector<std::pair<string, ScriptValue> > BindingsList;
  typedef std::vector<ScriptValue> ValueList;

  /// @return bindings list as diagnostic text, e.g. `x=3, y="a"`
  string bindingsDescription(const BindingsList &aBindings);

} // namespace tmx

#endif /* defined(__tracemux__values__) */
