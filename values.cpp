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

#include "values.hpp"

#include <math.h>
#include <stdio.h>

using namespace tmx;


#if ENABLE_NAMED_ERRORS
const char* ScriptError::errorName() const
{
  switch (getErrorCode()) {
    case OK: return "OK";
    case Syntax: return "Syntax";
    case NotFound: return "NotFound";
    case Invalid: return "Invalid";
    case DivisionByZero: return "DivisionByZero";
    case Thrown: return "Thrown";
    case Recursion: return "Recursion";
    case Internal: return "Internal";
  }
  return NULL;
}
#endif // ENABLE_NAMED_ERRORS


// MARK: - ScriptValue

double ScriptValue::numValue() const
{
  switch (mType) {
    case numeric: return mNumVal;
    case text: {
      double v = 0;
      if (sscanf(mStrVal.c_str(), "%lf", &v)==1) return v;
      return 0;
    }
    default: return 0;
  }
}


bool ScriptValue::boolValue() const
{
  switch (mType) {
    case numeric: return mNumVal!=0;
    case text: return !mStrVal.empty();
    case object: return true;
    default: return false;
  }
}


string ScriptValue::stringValue() const
{
  switch (mType) {
    case numeric: {
      if (mNumVal==floor(mNumVal) && fabs(mNumVal)<1e15) return string_format("%lld", (long long)mNumVal);
      return string_format("%lg", mNumVal);
    }
    case text: return mStrVal;
    case object: return "<object>";
    case error: return string_format("<error: %s>", Error::text(mErrVal));
    default: return "null";
  }
}


string ScriptValue::description() const
{
  if (mType==text) return cstringQuote(mStrVal);
  return stringValue();
}


bool ScriptValue::identical(const ScriptValue &aOther) const
{
  if (mType!=aOther.mType) return false;
  switch (mType) {
    case null: return true;
    case numeric: return mNumVal==aOther.mNumVal;
    case text: return mStrVal==aOther.mStrVal;
    case object: return mObjVal==aOther.mObjVal;
    case error: return mErrVal==aOther.mErrVal;
  }
  return false;
}


ScriptValue ScriptValue::operator!() const
{
  if (isError()) return *this;
  return ScriptValue(!boolValue() ? 1 : 0);
}


ScriptValue ScriptValue::operator<(const ScriptValue& aRightSide) const
{
  if (isError()) return *this;
  if (aRightSide.isError()) return aRightSide;
  if (isString()) return ScriptValue(stringValue()<aRightSide.stringValue() ? 1 : 0);
  return ScriptValue(numValue()<aRightSide.numValue() ? 1 : 0);
}


ScriptValue ScriptValue::operator>=(const ScriptValue& aRightSide) const
{
  return !(*this<aRightSide);
}


ScriptValue ScriptValue::operator>(const ScriptValue& aRightSide) const
{
  if (isError()) return *this;
  if (aRightSide.isError()) return aRightSide;
  if (isString()) return ScriptValue(stringValue()>aRightSide.stringValue() ? 1 : 0);
  return ScriptValue(numValue()>aRightSide.numValue() ? 1 : 0);
}


ScriptValue ScriptValue::operator<=(const ScriptValue& aRightSide) const
{
  return !(*this>aRightSide);
}


ScriptValue ScriptValue::operator==(const ScriptValue& aRightSide) const
{
  if (isNull() || aRightSide.isNull()) return ScriptValue(isNull() && aRightSide.isNull() ? 1 : 0);
  if (isObject() || aRightSide.isObject() || isError() || aRightSide.isError()) return ScriptValue(identical(aRightSide) ? 1 : 0);
  if (isString()) return ScriptValue(stringValue()==aRightSide.stringValue() ? 1 : 0);
  return ScriptValue(numValue()==aRightSide.numValue() ? 1 : 0);
}


ScriptValue ScriptValue::operator!=(const ScriptValue& aRightSide) const
{
  return !(*this==aRightSide);
}


ScriptValue ScriptValue::operator+(const ScriptValue& aRightSide) const
{
  if (isError()) return *this;
  if (aRightSide.isError()) return aRightSide;
  if (isString() || aRightSide.isString()) return ScriptValue(stringValue()+aRightSide.stringValue());
  if (isNumeric() && aRightSide.isNumeric()) return ScriptValue(numValue()+aRightSide.numValue());
  return ScriptValue(Error::err<ScriptError>(ScriptError::Invalid, "invalid operands for '+'"));
}


ScriptValue ScriptValue::operator-(const ScriptValue& aRightSide) const
{
  if (isError()) return *this;
  if (aRightSide.isError()) return aRightSide;
  if (isObject() || aRightSide.isObject()) return ScriptValue(Error::err<ScriptError>(ScriptError::Invalid, "invalid operands for '-'"));
  return ScriptValue(numValue()-aRightSide.numValue());
}


ScriptValue ScriptValue::operator*(const ScriptValue& aRightSide) const
{
  if (isError()) return *this;
  if (aRightSide.isError()) return aRightSide;
  if (isObject() || aRightSide.isObject()) return ScriptValue(Error::err<ScriptError>(ScriptError::Invalid, "invalid operands for '*'"));
  return ScriptValue(numValue()*aRightSide.numValue());
}


ScriptValue ScriptValue::operator/(const ScriptValue& aRightSide) const
{
  if (isError()) return *this;
  if (aRightSide.isError()) return aRightSide;
  if (isObject() || aRightSide.isObject()) return ScriptValue(Error::err<ScriptError>(ScriptError::Invalid, "invalid operands for '/'"));
  if (aRightSide.numValue()==0) return ScriptValue(Error::err<ScriptError>(ScriptError::DivisionByZero, "division by zero"));
  return ScriptValue(numValue()/aRightSide.numValue());
}


ScriptValue ScriptValue::operator%(const ScriptValue& aRightSide) const
{
  if (isError()) return *this;
  if (aRightSide.isError()) return aRightSide;
  if (isObject() || aRightSide.isObject()) return ScriptValue(Error::err<ScriptError>(ScriptError::Invalid, "invalid operands for '%%'"));
  if (aRightSide.numValue()==0) return ScriptValue(Error::err<ScriptError>(ScriptError::DivisionByZero, "modulo by zero"));
  // modulo allowing float dividend and divisor, really meaning "remainder"
  double a = numValue();
  double b = aRightSide.numValue();
  int64_t q = a/b;
  return ScriptValue(a-b*q);
}


// MARK: - MemberAccess

ErrorPtr MemberAccess::setMemberByName(const string &aName, const ScriptValue &aValue)
{
  return Error::err<ScriptError>(ScriptError::Invalid, "member '%s' is read-only", aName.c_str());
}


string tmx::bindingsDescription(const BindingsList &aBindings)
{
  string s;
  for (BindingsList::const_iterator pos = aBindings.begin(); pos!=aBindings.end(); ++pos) {
    if (!s.empty()) s += ", ";
    string_format_append(s, "%s=%s", pos->first.c_str(), pos->second.description().c_str());
  }
  return s;
}
