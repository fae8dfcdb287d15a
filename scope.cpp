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

#include "scope.hpp"

using namespace tmx;


// MARK: - ScopeSpec

ScopeSpec ScopeSpec::forFunction(CallablePtr aFunction)
{
  ScopeSpec s;
  s.function = aFunction;
  return s;
}


ScopeSpec ScopeSpec::forName(const string &aFunctionName)
{
  ScopeSpec s;
  s.functionName = aFunctionName;
  return s;
}


ScopeSpec ScopeSpec::forModule(SourceModulePtr aModule)
{
  ScopeSpec s;
  s.module = aModule;
  return s;
}


ScopeSpec ScopeSpec::forFile(const string &aFile, bool aPattern)
{
  ScopeSpec s;
  s.file = aFile;
  s.filePattern = aPattern;
  return s;
}


// MARK: - Scope

Scope::Scope() :
  mHasModule(false),
  mFilePattern(true)
{
}


ErrorPtr Scope::create(ScopePtr &aScope, const ScopeSpec &aSpec)
{
  if (!aSpec.parentScopes.empty()) {
    return Error::err<TraceError>(TraceError::Configuration, "parent scopes are not supported");
  }
  if (!aSpec.function && aSpec.functionName.empty() && !aSpec.module && aSpec.file.empty()) {
    return Error::err<TraceError>(TraceError::Configuration, "scope without function, module or file would match everything");
  }
  ScopePtr scope = ScopePtr(new Scope);
  if (aSpec.function) {
    // find the code actually executed when aSpec.function is called
    CallablePtr fn = aSpec.function->underlyingFunction();
    scope->mReceiver = aSpec.function->boundReceiver();
    if (fn && aSpec.unwrap) {
      while (CallablePtr w = fn->wrapped()) {
        fn = w->underlyingFunction();
        if (!fn) break;
      }
    }
    if (fn) scope->mCode = fn->code();
    if (!scope->mCode) {
      return Error::err<TraceError>(TraceError::Configuration,
        "cannot find the code for '%s', a script function, bound method or callable object is required",
        aSpec.function->name().c_str()
      );
    }
  }
  scope->mFunctionName = aSpec.functionName;
  if (aSpec.module) {
    scope->mHasModule = true;
    scope->mModuleFile = aSpec.module->fileName();
  }
  scope->mFilePattern = aSpec.filePattern;
  scope->mFile = aSpec.filePattern ? aSpec.file : resolvedPath(aSpec.file);
  aScope = scope;
  return ErrorPtr();
}


bool Scope::matches(ExecutionContext &aContext) const
{
  if (mCode) {
    if (aContext.code()!=mCode) return false;
    // methods: only calls on the very same object
    if (mReceiver && aContext.receiver()!=mReceiver) return false;
  }
  if (!mFunctionName.empty()) {
    CodeUnitPtr c = aContext.code();
    if (!c || c->name()!=mFunctionName) return false;
  }
  if (mHasModule) {
    if (aContext.fileName()!=mModuleFile) return false;
  }
  if (!mFile.empty()) {
    string f = aContext.fileName();
    if (isSpecialFileLabel(f)) {
      // labels like <eval> only match exactly
      if (f!=mFile) return false;
    }
    else if (!mFilePattern) {
      if (resolvedPath(f)!=mFile) return false;
    }
    else if (!pathMatch(resolvedPath(f), mFile)) {
      return false;
    }
  }
  return true;
}


string Scope::description() const
{
  string d;
  if (mCode) {
    string_format_append(d, "code of '%s'", mCode->name().c_str());
    if (mReceiver) d += " on a specific receiver";
  }
  if (!mFunctionName.empty()) {
    if (!d.empty()) d += ", ";
    string_format_append(d, "function name '%s'", mFunctionName.c_str());
  }
  if (mHasModule) {
    if (!d.empty()) d += ", ";
    string_format_append(d, "module file '%s'", mModuleFile.c_str());
  }
  if (!mFile.empty()) {
    if (!d.empty()) d += ", ";
    string_format_append(d, "%s '%s'", mFilePattern ? "file pattern" : "file", mFile.c_str());
  }
  return d;
}
