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

#include "utils.hpp"

#include <string.h>
#include <stdio.h>
#include <stdlib.h>
#include <ctype.h>
#include <limits.h>
#include <unistd.h>
#include <fnmatch.h>

#include <vector>

using namespace tmx;

void tmx::string_format_v(std::string &aStringObj, bool aAppend, const char *aFormat, va_list aArgs)
{
  if (!aAppend) aStringObj.clear();
  // vsnprintf consumes aArgs, keep a copy for the second pass
  va_list retryArgs;
  va_copy(retryArgs, aArgs);
  char buf[128];
  int n = vsnprintf(buf, sizeof(buf), aFormat, aArgs);
  if (n>=(int)sizeof(buf)) {
    std::vector<char> big(n+1);
    n = vsnprintf(&big[0], big.size(), aFormat, retryArgs);
    if (n>0) aStringObj.append(&big[0], n);
  }
  else if (n>0) {
    aStringObj.append(buf, n);
  }
  va_end(retryArgs);
}


std::string tmx::string_format(const char *aFormat, ...)
{
  std::string s;
  va_list args;
  va_start(args, aFormat);
  string_format_v(s, false, aFormat, args);
  va_end(args);
  return s;
}


void tmx::string_format_append(std::string &aStringToAppendTo, const char *aFormat, ...)
{
  va_list args;
  va_start(args, aFormat);
  string_format_v(aStringToAppendTo, true, aFormat, args);
  va_end(args);
}


void tmx::string_ftime_append(std::string &aStringToAppendTo, const char *aFormat, const struct tm *aTimeP)
{
  struct tm now;
  if (!aTimeP) {
    time_t t = time(NULL);
    localtime_r(&t, &now);
    aTimeP = &now;
  }
  char buf[64];
  size_t n = strftime(buf, sizeof(buf), aFormat, aTimeP);
  aStringToAppendTo.append(buf, n);
}


const char *tmx::nonNullCStr(const char *aNULLOrCStr)
{
  if (aNULLOrCStr==NULL) return "";
  return aNULLOrCStr;
}


string tmx::lowerCase(const char *aString)
{
  string s;
  while (char c=*aString++) {
    s += tolower(c);
  }
  return s;
}


string tmx::lowerCase(const string &aString)
{
  return lowerCase(aString.c_str());
}


string tmx::cstringQuote(const string &aString)
{
  string s = "\"";
  for (size_t i=0; i<aString.size(); i++) {
    char c = aString[i];
    switch (c) {
      case '"': s += "\\\""; break;
      case '\\': s += "\\\\"; break;
      case '\n': s += "\\n"; break;
      case '\t': s += "\\t"; break;
      case '\r': s += "\\r"; break;
      default:
        if (!isprint(c) && (uint8_t)c<0x80) string_format_append(s, "\\x%02x", (unsigned)(c & 0xFF));
        else s += c;
        break;
    }
  }
  s += '"';
  return s;
}


string tmx::trimWhiteSpace(const string &aString, bool aLeading, bool aTrailing)
{
  size_t n = aString.length();
  size_t s = 0;
  size_t e = n;
  if (aLeading) {
    while (s<n && isspace(aString[s])) ++s;
  }
  if (aTrailing) {
    while (e>s && isspace(aString[e-1])) --e;
  }
  return aString.substr(s,e-s);
}


bool tmx::nextLine(const char * &aCursor, string &aLine)
{
  const char *p = aCursor;
  if (!p || *p==0) return false; // no input or end of text -> no line
  char c;
  do {
    c = *p;
    if (c==0 || c=='\n' || c=='\r') {
      // end of line or end of text
      aLine.assign(aCursor,p-aCursor);
      if (c) {
        // skip line end
        ++p;
        if (c=='\r' && *p=='\n') ++p; // CRLF is ok as well
      }
      // p now at end of text or beginning of next line
      aCursor = p;
      return true;
    }
    ++p;
  } while (true);
}


bool tmx::isSpecialFileLabel(const string &aFileName)
{
  return !aFileName.empty() && aFileName[aFileName.size()-1]=='>';
}


static void splitPath(const string &aPath, std::vector<string> &aComponents)
{
  aComponents.clear();
  size_t s = 0;
  while (s<=aPath.size()) {
    size_t e = aPath.find('/', s);
    if (e==string::npos) e = aPath.size();
    if (e>s) aComponents.push_back(aPath.substr(s, e-s));
    s = e+1;
  }
}


string tmx::resolvedPath(const string &aPath)
{
  if (aPath.empty() || isSpecialFileLabel(aPath)) return aPath;
  char buf[PATH_MAX];
  if (realpath(aPath.c_str(), buf)) return string(buf);
  // file does not exist (scripts loaded from memory), normalize lexically
  string full = aPath;
  if (full[0]!='/') {
    if (getcwd(buf, sizeof(buf))) full = string(buf) + "/" + aPath;
  }
  std::vector<string> comps;
  splitPath(full, comps);
  std::vector<string> norm;
  for (size_t i=0; i<comps.size(); i++) {
    if (comps[i]==".") continue;
    if (comps[i]=="..") {
      if (!norm.empty()) norm.pop_back();
      continue;
    }
    norm.push_back(comps[i]);
  }
  string res;
  for (size_t i=0; i<norm.size(); i++) {
    res += "/";
    res += norm[i];
  }
  return res.empty() ? "/" : res;
}


bool tmx::pathMatch(const string &aPath, const string &aPattern)
{
  if (aPattern.empty()) return false;
  std::vector<string> pathComps, patComps;
  splitPath(aPath, pathComps);
  splitPath(aPattern, patComps);
  if (patComps.empty()) return false;
  bool anchored = aPattern[0]=='/';
  if (anchored && (aPath.empty() || aPath[0]!='/' || pathComps.size()!=patComps.size())) return false;
  if (patComps.size()>pathComps.size()) return false;
  // compare from the right
  size_t po = pathComps.size()-patComps.size();
  for (size_t i=0; i<patComps.size(); i++) {
    if (fnmatch(patComps[i].c_str(), pathComps[po+i].c_str(), 0)!=0) return false;
  }
  return true;
}
