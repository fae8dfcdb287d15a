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

#ifndef __tracemux__utils__
#define __tracemux__utils__

#include "tracemux_minimal.hpp"

#include <string>
#include <stdarg.h>
#include <stdint.h>
#include <time.h>

#ifndef __printflike
#define __printflike(...)
#endif
#ifndef __strftimelike
#define __strftimelike(...)
#endif

using namespace std;

/// Basic utilities that DO NOT HAVE DEPENDENCIES on other tracemux classes

namespace tmx {

  /// printf-style format into string
  /// @param aFormat printf-style format string
  /// @param aStringObj string to receive formatted result
  /// @param aAppend if true, aStringObj will be appended to, otherwise contents will be replaced
  /// @param aArgs va_list of vprintf arguments
  void string_format_v(string &aStringObj, bool aAppend, const char *aFormat, va_list aArgs) __printflike(3,0);

  /// printf-style format into string
  /// @param aFormat printf-style format string
  /// @return formatted string
  string string_format(const char *aFormat, ...) __printflike(1,2);

  /// printf-style format appending to string
  /// @param aStringToAppendTo string to append formatted output to
  /// @param aFormat printf-style format string
  void string_format_append(string &aStringToAppendTo, const char *aFormat, ...) __printflike(2,3);

  /// strftime appending to std::string
  /// @param aTimeP time to format, NULL for current local time. Output is limited to 63 characters.
  void string_ftime_append(string &aStringToAppendTo, const char *aFormat, const struct tm *aTimeP = NULL) __strftimelike(2);

  /// always return a valid C String, if NULL is passed, an empty string is returned
  /// @param aNULLOrCStr NULL or C-String
  /// @return the input string if it is non-NULL, or an empty string
  const char *nonNullCStr(const char *aNULLOrCStr);

  /// return simple (non locale aware) ASCII lowercase version of string
  string lowerCase(const char *aStringP);
  string lowerCase(const string &aString);

  /// return a C-string like quoted version of aString (double quotes, backslash escapes)
  string cstringQuote(const string &aString);

  /// trim leading and/or trailing whitespace
  /// @param aString string to trim
  /// @param aLeading if set, remove leading whitespace
  /// @param aTrailing if set, remove trailing whitespace
  /// @return trimmed string
  string trimWhiteSpace(const string &aString, bool aLeading = true, bool aTrailing = true);

  /// get next line from a string
  /// @param aCursor must point to a c string. Will be updated to the beginning of the next line
  /// @param aLine will receive the contents of the line (without any line end characters)
  /// @return true if line could be extracted, false if end of text
  bool nextLine(const char * &aCursor, string &aLine);

  /// @param aFileName a file name or label
  /// @return true if the name is a special label such as "<eval>", which is never a real path
  bool isSpecialFileLabel(const string &aFileName);

  /// lexically normalize a path and make it absolute relative to the current working directory
  /// @param aPath the path to resolve
  /// @return the resolved path, symlinks resolved if the file exists, special labels returned unchanged
  string resolvedPath(const string &aPath);

  /// match a path against a glob pattern, component by component from the right
  /// @param aPath the path to check
  /// @param aPattern a glob pattern (*, ?, [..] per path component). Relative patterns match
  ///   the trailing components of aPath, absolute patterns must match all components.
  /// @return true if aPath matches
  bool pathMatch(const string &aPath, const string &aPattern);

} // namespace tmx

#endif /* defined(__tracemux__utils__) */
