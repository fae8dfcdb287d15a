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

#ifndef __tracemux__error__
#define __tracemux__error__

#include "tracemux_minimal.hpp"

#include <string>
#include <stdarg.h>
#include "tmxobj.hpp"

#ifndef __printflike
#define __printflike(...)
#endif

using namespace std;

namespace tmx {

  /// error codes are only unique within their domain, 0 is OK in every domain
  typedef long ErrorCode;

  class Error;
  typedef boost::intrusive_ptr<Error> ErrorPtr;

  /// Base class of all errors. Subclasses define a domain and an ErrorCodes enum.
  /// A NULL ErrorPtr means success, so most code only creates errors when something fails.
  class Error : public TmxObj
  {
    ErrorCode mErrorCode;
    string mMessage;
    string mText; ///< cached description() for text()

  public:

    enum {
      OK,
      NotOK
    };
    typedef ErrorCode ErrorCodes;

    static const char *domain() { return "Error"; }
    virtual const char *getErrorDomain() const { return Error::domain(); }

    explicit Error(ErrorCode aErrorCode, const string &aMessage = "");

    /// @name factories, T must be an Error subclass with a constructor taking T::ErrorCodes
    /// @{

    template<typename T> static ErrorPtr err(ErrorCode aErrorCode)
    {
      return ErrorPtr(new T(static_cast<typename T::ErrorCodes>(aErrorCode)));
    }

    /// @param aFmt printf style message
    template<typename T> static ErrorPtr err(ErrorCode aErrorCode, const char *aFmt, ...) __printflike(2,3)
    {
      Error *e = new T(static_cast<typename T::ErrorCodes>(aErrorCode));
      va_list args;
      va_start(args, aFmt);
      e->formatMessage(aFmt, args);
      va_end(args);
      return ErrorPtr(e);
    }

    template<typename T> static ErrorPtr err_str(ErrorCode aErrorCode, const string &aMessage)
    {
      Error *e = new T(static_cast<typename T::ErrorCodes>(aErrorCode));
      e->mMessage = aMessage;
      return ErrorPtr(e);
    }

    /// @}

    /// insert printf style context in front of the message
    /// @return this error, for returning it directly
    ErrorPtr withPrefix(const char *aFmt, ...) __printflike(2,3);

    ErrorCode getErrorCode() const { return mErrorCode; }
    bool isOK() const { return mErrorCode==OK; }
    bool notOK() const { return mErrorCode!=OK; }

    /// @return the message as set, possibly empty
    const char *getErrorMessage() const { return mMessage.c_str(); }

    /// @return message (or code if there is none), followed by domain and error name
    virtual string description() const;

    /// @return description() as a C string living as long as this error
    const char *text();

    /// @param aDomain domain to match, NULL for any
    bool isDomain(const char *aDomain) const;
    bool isError(const char *aDomain, ErrorCode aErrorCode) const;

    /// @name NULL-safe checks on ErrorPtr
    /// @{
    static bool isOK(ErrorPtr aError) { return !aError || aError->isOK(); }
    static bool notOK(ErrorPtr aError) { return aError && aError->notOK(); }
    static bool isError(ErrorPtr aError, const char *aDomain, ErrorCode aErrorCode);
    /// @return "<none>" for NULL
    static const char *text(ErrorPtr aError);
    /// @}

  protected:

    void formatMessage(const char *aFmt, va_list aArgs);

    #if ENABLE_NAMED_ERRORS
    /// @return symbolic name of the error code, NULL if the subclass has none
    virtual const char *errorName() const { return NULL; }
    #endif // ENABLE_NAMED_ERRORS
  };

} // namespace tmx


#endif /* defined(__tracemux__error__) */
