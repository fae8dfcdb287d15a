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

#include "error.hpp"

#include "utils.hpp"

#include <string.h>

using namespace tmx;

Error::Error(ErrorCode aErrorCode, const string &aMessage) :
  mErrorCode(aErrorCode),
  mMessage(aMessage)
{
}


void Error::formatMessage(const char *aFmt, va_list aArgs)
{
  string_format_v(mMessage, false, aFmt, aArgs);
  mText.clear();
}


ErrorPtr Error::withPrefix(const char *aFmt, ...)
{
  string prefix;
  va_list args;
  va_start(args, aFmt);
  string_format_v(prefix, false, aFmt, args);
  va_end(args);
  mMessage = prefix + mMessage;
  mText.clear();
  return ErrorPtr(this);
}


string Error::description() const
{
  string d = mMessage.empty() ? string_format("code %ld", mErrorCode) : mMessage;
  #if ENABLE_NAMED_ERRORS
  const char *name = errorName();
  if (name) {
    string_format_append(d, " (%s::%s)", getErrorDomain(), name);
    return d;
  }
  #endif // ENABLE_NAMED_ERRORS
  string_format_append(d, " (%s:%ld)", getErrorDomain(), mErrorCode);
  return d;
}


const char *Error::text()
{
  if (mText.empty()) mText = description();
  return mText.c_str();
}


const char *Error::text(ErrorPtr aError)
{
  return aError ? aError->text() : "<none>";
}


bool Error::isDomain(const char *aDomain) const
{
  return aDomain==NULL || strcmp(aDomain, getErrorDomain())==0;
}


bool Error::isError(const char *aDomain, ErrorCode aErrorCode) const
{
  return mErrorCode==aErrorCode && isDomain(aDomain);
}


bool Error::isError(ErrorPtr aError, const char *aDomain, ErrorCode aErrorCode)
{
  return aError && aError->isError(aDomain, aErrorCode);
}
