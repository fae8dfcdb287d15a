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

#ifndef __tracemux__scope__
#define __tracemux__scope__

#include "tracemux_common.hpp"
#include "tracehost.hpp"

using namespace std;

namespace tmx {

  class Scope;
  typedef boost::intrusive_ptr<Scope> ScopePtr;
  typedef std::vector<ScopePtr> ScopeList;

  /// selectors for creating a Scope. All selectors that are set must match.
  struct ScopeSpec
  {
    CallablePtr function; ///< function, bound method or callable object, matched by code identity (and receiver identity for methods)
    string functionName; ///< unqualified name of the code unit
    SourceModulePtr module; ///< module, matched by its file name
    string file; ///< file name or pattern
    bool filePattern; ///< if set (default), file is a glob pattern matched against trailing path components, otherwise an exact path
    bool unwrap; ///< if set (default), decorated functions are resolved to the innermost wrapped function
    ScopeList parentScopes; ///< ancestor scopes, not supported

    ScopeSpec() : filePattern(true), unwrap(true) {};

    /// @name convenience constructors
    /// @{
    static ScopeSpec forFunction(CallablePtr aFunction);
    static ScopeSpec forName(const string &aFunctionName);
    static ScopeSpec forModule(SourceModulePtr aModule);
    static ScopeSpec forFile(const string &aFile, bool aPattern = true);
    /// @}
  };


  /// predicate selecting execution contexts
  class Scope : public TmxObj
  {
    typedef TmxObj inherited;

    CodeUnitPtr mCode; ///< code identity, NULL if not selected by function
    TmxObjPtr mReceiver; ///< receiver identity for bound methods and callable objects
    string mFunctionName;
    string mModuleFile;
    bool mHasModule;
    string mFile;
    bool mFilePattern;

    Scope();

  public:

    /// create a scope
    /// @param aScope will receive the new scope
    /// @param aSpec the selectors
    /// @return ok or TraceError::Configuration if no selector is set, the function has no
    ///   inspectable code, or parent scopes are specified
    static ErrorPtr create(ScopePtr &aScope, const ScopeSpec &aSpec);

    /// @param aContext the context to check
    /// @return true if all selectors of this scope match aContext
    bool matches(ExecutionContext &aContext) const;

    /// @return true if this scope selects a specific function (by code or by name)
    bool selectsFunction() const { return mCode || !mFunctionName.empty(); }

    /// @return the code selected by function identity, NULL if none
    CodeUnitPtr code() const { return mCode; }

    /// @return description for log messages
    string description() const;

  };

} // namespace tmx

#endif /* defined(__tracemux__scope__) */
