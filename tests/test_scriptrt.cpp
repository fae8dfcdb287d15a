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

static const char *demoSource =
  "var factor = 2\n"                      // 1
  "function f(x) {\n"                     // 2
  "  var y = x * factor\n"                // 3
  "  return y\n"                          // 4
  "}\n"                                   // 5
  "function fact(n) {\n"                  // 6
  "  if (n <= 1) return 1\n"              // 7
  "  return n * fact(n - 1)\n"            // 8
  "}\n"                                   // 9
  "function fails(a) {\n"                 // 10
  "  throw 'bad ' + a\n"                  // 11
  "}\n"                                   // 12
  "function loop(n) {\n"                  // 13
  "  var i = 0\n"                         // 14
  "  while (i < n) {\n"                   // 15
  "    i = i + 1\n"                       // 16
  "  }\n"                                 // 17
  "  return i\n"                          // 18
  "}\n"                                   // 19
  "class Counter {\n"                     // 20
  "  function init(self, start) {\n"      // 21
  "    self.count = start\n"              // 22
  "  }\n"                                 // 23
  "  function call(self) {\n"             // 24
  "    self.count = self.count + 1\n"     // 25
  "    return self.count\n"               // 26
  "  }\n"                                 // 27
  "}\n";                                  // 28


/// records all events it sees, observing every context
class RecordingHook : public TraceHook
{
public:
  std::vector<string> events;
  bool local;
  string failOn;

  RecordingHook() : local(true) {}

  virtual ErrorPtr trace(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook) TMX_OVERRIDE
  {
    string e = string_format("%s %s:%d", traceEventName(aEvent), aContext.code()->name().c_str(), aContext.line());
    if (aEvent==trace_return) e += " " + aArg.description();
    events.push_back(e);
    if (e==failOn) return Error::err<TraceError>(TraceError::Evaluation, "hook failed");
    if (aEvent==trace_enter) {
      if (local) aNextHook = TraceHookPtr(this);
      else aNextHook.reset();
    }
    return ErrorPtr();
  }
};
typedef boost::intrusive_ptr<RecordingHook> RecordingHookPtr;


TEST_CASE_METHOD(ScriptFixture, "Module loading and calls", "[scriptrt]" )
{
  REQUIRE(Error::isOK(load(demoSource)));
  REQUIRE(module->moduleName() == "demo");
  REQUIRE(module->global("factor").numValue() == 2);
  REQUIRE(run("f(3)").numValue() == 6);
  REQUIRE(run("fact(5)").numValue() == 120);
  REQUIRE(run("loop(4)").numValue() == 4);
  REQUIRE(errorCode(run("fails(1)"), ScriptError::domain()) == ScriptError::Thrown);
  REQUIRE(run("fails(1)").errorValue()->getErrorMessage() == string("bad 1"));
  REQUIRE(errorCode(run("f(1,2)"), ScriptError::domain()) == ScriptError::Invalid);
  SECTION("callable objects") {
    REQUIRE(run("var c = Counter(10); c(); c()").numValue() == 12);
    REQUIRE(run("c.count").numValue() == 12);
  }
  SECTION("globals modified by statements") {
    run("factor = 3");
    REQUIRE(run("f(3)").numValue() == 9);
  }
  SECTION("recursion limit") {
    REQUIRE(errorCode(run("fact(100000)"), ScriptError::domain()) == ScriptError::Recursion);
  }
}


TEST_CASE_METHOD(ScriptFixture, "Syntax errors", "[scriptrt]" )
{
  REQUIRE(errorCode(ScriptValue(load("function f(x {\n}\n")), ScriptError::domain()) == ScriptError::Syntax);
  REQUIRE(errorCode(ScriptValue(load("function f(x) {\n  return x\n")), ScriptError::domain()) == ScriptError::Syntax);
  REQUIRE(errorCode(ScriptValue(load("@nothere\nfunction f(x) {\n}\n")), ScriptError::domain()) == ScriptError::NotFound);
  REQUIRE(errorCode(ScriptValue(load("class A {\n  var x = 1\n}\n")), ScriptError::domain()) == ScriptError::Syntax);
}


TEST_CASE_METHOD(ScriptFixture, "Decorators", "[scriptrt]" )
{
  REQUIRE(Error::isOK(load(
    "function logged(a) {\n"
    "  return wrapped(a) + 1\n"
    "}\n"
    "@logged\n"
    "function g(a) {\n"
    "  return a * 10\n"
    "}\n"
  )));
  REQUIRE(run("g(2)").numValue() == 21);
  CallablePtr g = fn("g");
  REQUIRE(g->name() == "g");
  REQUIRE(g->code()->name() == "logged");
  REQUIRE(g->wrapped());
  REQUIRE(g->wrapped()->code()->name() == "g");
}


TEST_CASE_METHOD(ScriptFixture, "Hook protocol", "[scriptrt]" )
{
  REQUIRE(Error::isOK(load(demoSource)));
  RecordingHookPtr hook = RecordingHookPtr(new RecordingHook);
  runtime->setGlobalHook(hook);

  SECTION("enter, lines and return") {
    REQUIRE(run("f(3)").numValue() == 6);
    REQUIRE(hook->events.size() == 4);
    REQUIRE(hook->events[0] == "enter f:2");
    REQUIRE(hook->events[1] == "line f:3");
    REQUIRE(hook->events[2] == "line f:4");
    REQUIRE(hook->events[3] == "return f:4 6");
  }
  SECTION("no local events without a local hook") {
    hook->local = false;
    run("f(3)");
    REQUIRE(hook->events.size() == 1);
    REQUIRE(hook->events[0] == "enter f:2");
  }
  SECTION("loop condition line is reported for every iteration") {
    run("loop(2)");
    int conditionLines = 0;
    for (size_t i=0; i<hook->events.size(); i++) {
      if (hook->events[i] == "line loop:15") conditionLines++;
    }
    REQUIRE(conditionLines == 3);
  }
  SECTION("unwinding reports exception, then return without value") {
    run("fails(1)");
    REQUIRE(hook->events.size() == 4);
    REQUIRE(hook->events[2] == "exception fails:11");
    REQUIRE(hook->events[3] == "return fails:11 null");
  }
  SECTION("hook errors disable tracing and propagate") {
    hook->failOn = "line f:3";
    REQUIRE(errorCode(run("f(3)"), TraceError::domain()) == TraceError::Evaluation);
    REQUIRE(!runtime->globalHook());
    size_t n = hook->events.size();
    REQUIRE(run("f(3)").numValue() == 6);
    REQUIRE(hook->events.size() == n);
  }
  runtime->setGlobalHook(TraceHookPtr());
}


TEST_CASE_METHOD(ScriptFixture, "Execution contexts", "[scriptrt]" )
{
  REQUIRE(Error::isOK(load(demoSource)));
  REQUIRE(!runtime->currentContext());
  SECTION("contexts chain to their callers") {
    class DepthHook : public TraceHook
    {
    public:
      int maxDepth;
      uint64_t lastId;
      bool idsUnique;
      DepthHook() : maxDepth(0), lastId(0), idsUnique(true) {}
      virtual ErrorPtr trace(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook) TMX_OVERRIDE
      {
        if (aContext.depth()>maxDepth) maxDepth = aContext.depth();
        if (aContext.activationId()<=lastId) idsUnique = false;
        lastId = aContext.activationId();
        aNextHook.reset();
        return ErrorPtr();
      }
    };
    boost::intrusive_ptr<DepthHook> hook = boost::intrusive_ptr<DepthHook>(new DepthHook);
    runtime->setGlobalHook(hook);
    run("fact(4)");
    runtime->setGlobalHook(TraceHookPtr());
    REQUIRE(hook->maxDepth == 3);
    REQUIRE(hook->idsUnique);
  }
}
