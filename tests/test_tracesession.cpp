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

#include <catch2/catch.hpp>

#include "scriptfixture.hpp"

using namespace tmx;

static const char *sessionSource =
  "function f(x) {\n"            // 1
  "  var y = x * 2\n"            // 2
  "  return y\n"                 // 3
  "}\n"                          // 4
  "function outer(x) {\n"        // 5
  "  return f(x) + 1\n"          // 6
  "}\n";                         // 7


/// records callback invocations
class CallbackRecorder
{
public:
  std::vector<string> calls;

  ErrorPtr record(const string &aTag, ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg)
  {
    calls.push_back(string_format("%s:%s:%s:%d", aTag.c_str(), traceEventName(aEvent), aContext.code()->name().c_str(), aContext.line()));
    return ErrorPtr();
  }

  TraceCallback callback(const string &aTag)
  {
    return boost::bind(&CallbackRecorder::record, this, aTag, _1, _2, _3);
  }
};


/// a hook that does nothing but stays installed
class ForeignHook : public TraceHook
{
public:
  virtual ErrorPtr trace(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook) TMX_OVERRIDE
  {
    aNextHook.reset();
    return ErrorPtr();
  }
};


static void collectLine(std::vector<string> *aLines, int aLevel, const string &aLine)
{
  aLines->push_back(aLine);
}


class SessionFixture : public ScriptFixture
{
public:
  CallbackRecorder rec;

  SessionFixture()
  {
    ErrorPtr err = load(sessionSource);
    if (Error::notOK(err)) LOG(LOG_ERR, "fixture: %s", err->text());
  }

  CallbackHandle add(const ScopeSpec &aSpec, const string &aEvents, const string &aTag)
  {
    CallbackHandle h = 0;
    ErrorPtr err = session->addCallback(aSpec, aEvents, rec.callback(aTag), h);
    if (Error::notOK(err)) LOG(LOG_ERR, "add: %s", err->text());
    return h;
  }
};


TEST_CASE("Event names", "[tracesession]" )
{
  TraceEventMask m;
  REQUIRE(Error::isOK(parseTraceEvents("enter", m)));
  REQUIRE(m == traceMask_enter);
  REQUIRE(Error::isOK(parseTraceEvents("call, return", m)));
  REQUIRE(m == (traceMask_enter|traceMask_return));
  REQUIRE(Error::isOK(parseTraceEvents("line exception", m)));
  REQUIRE(m == (traceMask_line|traceMask_exception));
  REQUIRE(Error::isError(parseTraceEvents("enter,jump", m), TraceError::domain(), TraceError::Configuration));
  REQUIRE(Error::isError(parseTraceEvents(" , ", m), TraceError::domain(), TraceError::Configuration));
}


TEST_CASE_METHOD(SessionFixture, "Session lifecycle", "[tracesession]" )
{
  SECTION("start installs and stop restores the previous hook") {
    TraceHookPtr foreign = TraceHookPtr(new ForeignHook);
    runtime->setGlobalHook(foreign);
    REQUIRE(Error::isOK(session->start()));
    REQUIRE(session->isInstalled());
    REQUIRE(runtime->globalHook() != foreign);
    REQUIRE(Error::isOK(session->stop()));
    REQUIRE(runtime->globalHook() == foreign);
    runtime->setGlobalHook(TraceHookPtr());
  }
  SECTION("double start and stop without start fail") {
    REQUIRE(traceErrorCode(session->stop()) == TraceError::SessionState);
    REQUIRE(Error::isOK(session->start()));
    REQUIRE(traceErrorCode(session->start()) == TraceError::SessionState);
    REQUIRE(Error::isOK(session->stop()));
  }
  SECTION("starting a suspended session fails") {
    session->suspend();
    REQUIRE(traceErrorCode(session->start()) == TraceError::SessionState);
    session->resume();
    REQUIRE(Error::isOK(session->start()));
  }
  SECTION("replaced hook is left in place on stop") {
    REQUIRE(Error::isOK(session->start()));
    TraceHookPtr foreign = TraceHookPtr(new ForeignHook);
    runtime->setGlobalHook(foreign);
    REQUIRE(!session->isInstalled());
    REQUIRE(traceErrorCode(session->stop()) == TraceError::HookOwnership);
    REQUIRE(!session->isStarted());
    REQUIRE(runtime->globalHook() == foreign);
    runtime->setGlobalHook(TraceHookPtr());
  }
  SECTION("second session cannot start while another is installed") {
    TraceSessionPtr other = TraceSessionPtr(new TraceSession(runtime));
    REQUIRE(Error::isOK(session->start()));
    REQUIRE(traceErrorCode(other->start()) == TraceError::SessionState);
    REQUIRE(!other->isStarted());
    REQUIRE(traceErrorCode(other->retainTracing()) == TraceError::SessionState);
    REQUIRE(session->isInstalled());
    REQUIRE(Error::isOK(session->stop()));
    REQUIRE(Error::isOK(other->start()));
    REQUIRE(Error::isOK(other->stop()));
  }
  SECTION("retaining a started session whose hook was replaced fails") {
    REQUIRE(Error::isOK(session->start()));
    runtime->setGlobalHook(TraceHookPtr(new ForeignHook));
    REQUIRE(traceErrorCode(session->retainTracing()) == TraceError::SessionState);
    runtime->setGlobalHook(TraceHookPtr());
  }
}


TEST_CASE_METHOD(SessionFixture, "Callback dispatch", "[tracesession]" )
{
  SECTION("callbacks receive only their events") {
    add(ScopeSpec::forName("f"), "enter", "E");
    add(ScopeSpec::forName("f"), "return", "R");
    REQUIRE(Error::isOK(session->start()));
    REQUIRE(run("f(3)").numValue() == 6);
    REQUIRE(rec.calls.size() == 2);
    REQUIRE(rec.calls[0] == "E:enter:f:1");
    REQUIRE(rec.calls[1] == "R:return:f:3");
  }
  SECTION("callbacks run in registration order") {
    add(ScopeSpec::forName("f"), "line", "first");
    add(ScopeSpec::forName("f"), "line", "second");
    REQUIRE(Error::isOK(session->start()));
    run("f(3)");
    REQUIRE(rec.calls.size() == 4);
    REQUIRE(rec.calls[0] == "first:line:f:2");
    REQUIRE(rec.calls[1] == "second:line:f:2");
    REQUIRE(rec.calls[2] == "first:line:f:3");
  }
  SECTION("non-matching contexts are not traced") {
    add(ScopeSpec::forName("f"), "enter,line", "F");
    REQUIRE(Error::isOK(session->start()));
    REQUIRE(run("outer(1)").numValue() == 3);
    REQUIRE(rec.calls.size() == 3);
    REQUIRE(rec.calls[0] == "F:enter:f:1");
  }
  SECTION("removed callbacks are no longer called") {
    CallbackHandle h = add(ScopeSpec::forName("f"), "enter", "E");
    REQUIRE(Error::isOK(session->start()));
    run("f(1)");
    REQUIRE(session->removeCallback(h));
    REQUIRE(!session->removeCallback(h));
    run("f(1)");
    REQUIRE(rec.calls.size() == 1);
    REQUIRE(session->numCallbacks() == 0);
  }
  SECTION("suspended sessions do not dispatch") {
    add(ScopeSpec::forName("f"), "enter", "E");
    REQUIRE(Error::isOK(session->start()));
    {
      TraceSession::SuspendGuard s(session);
      REQUIRE(session->isSuspended());
      run("f(1)");
    }
    REQUIRE(!session->isSuspended());
    run("f(1)");
    REQUIRE(rec.calls.size() == 1);
  }
  SECTION("excluded files are not dispatched") {
    add(ScopeSpec::forName("f"), "enter", "E");
    session->excludeFile("demo/*.tms");
    REQUIRE(Error::isOK(session->start()));
    run("f(1)");
    REQUIRE(rec.calls.size() == 0);
  }
  SECTION("stopped session does not dispatch") {
    add(ScopeSpec::forName("f"), "enter", "E");
    REQUIRE(Error::isOK(session->start()));
    REQUIRE(Error::isOK(session->stop()));
    run("f(1)");
    REQUIRE(rec.calls.size() == 0);
  }
  SECTION("invalid registrations are rejected") {
    CallbackHandle h;
    REQUIRE(traceErrorCode(session->addCallback(ScopeSpec::forName("f"), "jump", rec.callback("X"), h)) == TraceError::Configuration);
    REQUIRE(traceErrorCode(session->addCallback(ScopeSpec(), "enter", rec.callback("X"), h)) == TraceError::Configuration);
    REQUIRE(session->numCallbacks() == 0);
  }
}


static ErrorPtr noteLocalHook(ScriptRuntime *aRuntime, std::vector<bool> *aSeen, const ValueList &aArgs, ScriptValue &aResult)
{
  ExecutionContextPtr ctx = aRuntime->currentContext();
  aSeen->push_back(ctx && ctx->localHook());
  aResult = aArgs[0];
  return ErrorPtr();
}


TEST_CASE_METHOD(SessionFixture, "Enter-only subscriptions leave calls unobserved", "[tracesession]" )
{
  ScriptModulePtr obs;
  REQUIRE(Error::isOK(runtime->loadModule("obs", "/work/demo/obs.tms",
    "function g(x) {\n"
    "  return noted(x + 1)\n"
    "}\n", obs)));
  std::vector<bool> seen;
  obs->globals()["noted"] = ScriptValue(TmxObjPtr(new NativeFunction("noted", 1, boost::bind(&noteLocalHook, runtime.get(), &seen, _1, _2))));
  ScriptValue res;
  add(ScopeSpec::forName("g"), "enter", "E");
  REQUIRE(Error::isOK(session->start()));
  REQUIRE(Error::isOK(runtime->run(obs, "g(1)", res)));
  REQUIRE(res.numValue() == 2);
  REQUIRE(rec.calls.size() == 1);
  REQUIRE(seen.size() == 1);
  REQUIRE(seen[0] == false);
  // any other subscribed event keeps the call observed
  add(ScopeSpec::forName("g"), "return", "R");
  REQUIRE(Error::isOK(runtime->run(obs, "g(1)", res)));
  REQUIRE(rec.calls.size() == 3);
  REQUIRE(seen.size() == 2);
  REQUIRE(seen[1] == true);
}


TEST_CASE_METHOD(SessionFixture, "Callback errors propagate", "[tracesession]" )
{
  class Failing
  {
  public:
    static ErrorPtr fail(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg)
    {
      return Error::err<TraceError>(TraceError::Evaluation, "callback failed");
    }
  };
  CallbackHandle h;
  REQUIRE(Error::isOK(session->addCallback(ScopeSpec::forName("f"), "line", &Failing::fail, h)));
  REQUIRE(Error::isOK(session->start()));
  REQUIRE(traceErrorCode(run("f(1)").errorValue()) == TraceError::Evaluation);
  // tracing is disabled after a failing hook
  REQUIRE(!session->isInstalled());
  REQUIRE(run("f(1)").numValue() == 2);
}


TEST_CASE_METHOD(SessionFixture, "Sessions for hosts", "[tracesession]" )
{
  TraceSessionPtr s1 = TraceSession::sessionFor(runtime);
  REQUIRE(s1 != session);
  REQUIRE(TraceSession::sessionFor(runtime) == s1);
  REQUIRE(Error::isOK(session->start()));
  REQUIRE(TraceSession::sessionFor(runtime) == session);
  REQUIRE(Error::isOK(session->stop()));
  REQUIRE(TraceSession::sessionFor(runtime) == s1);
  SECTION("replacing a started default session is reported") {
    std::vector<string> lines;
    SETLOGSINK(boost::bind(&collectLine, &lines, _1, _2));
    REQUIRE(Error::isOK(s1->start()));
    ScriptRuntimePtr otherRuntime = ScriptRuntimePtr(new ScriptRuntime);
    TraceSessionPtr s2 = TraceSession::sessionFor(otherRuntime);
    SETLOGSINK(LogSinkCB());
    REQUIRE(s2 != s1);
    REQUIRE(s2->host() == otherRuntime);
    bool warned = false;
    for (size_t i=0; i<lines.size(); i++) {
      if (lines[i].find("W]")!=string::npos && lines[i].find("dropped")!=string::npos) warned = true;
    }
    REQUIRE(warned);
    // still held here, so not stopped
    REQUIRE(s1->isInstalled());
    REQUIRE(Error::isOK(s1->stop()));
  }
}
