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

#ifndef __tracemux__scriptfixture__
#define __tracemux__scriptfixture__

#include "scriptrt.hpp"
#include "tracesession.hpp"

using namespace tmx;

/// runtime with one loaded module and a session observing it
class ScriptFixture
{
public:

  ScriptRuntimePtr runtime;
  ScriptModulePtr module;
  TraceSessionPtr session;

  ScriptFixture()
  {
    runtime = ScriptRuntimePtr(new ScriptRuntime);
    session = TraceSessionPtr(new TraceSession(runtime));
  }

  virtual ~ScriptFixture()
  {
    if (session->isStarted()) {
      ErrorPtr err = session->stop();
      if (Error::notOK(err)) LOG(LOG_INFO, "fixture: %s", err->text());
    }
  }

  ErrorPtr load(const string &aSource, const string &aFileName = "/work/demo/demo.tms", const string &aName = "demo")
  {
    return runtime->loadModule(aName, aFileName, aSource, module);
  }

  /// @return result of the statements, or an error value
  ScriptValue run(const string &aStatements)
  {
    ScriptValue res;
    ErrorPtr err = runtime->run(module, aStatements, res);
    if (Error::notOK(err)) return ScriptValue(err);
    return res;
  }

  /// @return callable global of the module
  CallablePtr fn(const string &aName)
  {
    return CallablePtr(dynamic_cast<Callable *>(module->global(aName).objectValue().get()));
  }

  /// @return error code if aValue is an error of aDomain, -1 otherwise
  static long errorCode(const ScriptValue &aValue, const char *aDomain)
  {
    ErrorPtr err = aValue.errorValue();
    if (!err || !err->isDomain(aDomain)) return -1;
    return err->getErrorCode();
  }

  static long traceErrorCode(ErrorPtr aError)
  {
    if (!aError || !aError->isDomain(TraceError::domain())) return -1;
    return aError->getErrorCode();
  }

};

#endif /* defined(__tracemux__scriptfixture__) */
