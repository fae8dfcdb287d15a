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
#include "callcapture.hpp"

using namespace tmx;

static const char *captureSource =
  "var counter = 0\n"                 // 1
  "function f(x) {\n"                 // 2
  "  var y = x * 2\n"                 // 3
  "  counter = counter + 1\n"         // 4
  "  return y\n"                      // 5
  "}\n"                               // 6
  "function fact(n) {\n"              // 7
  "  if (n <= 1) return 1\n"          // 8
  "  return n * fact(n - 1)\n"        // 9
  "}\n"                               // 10
  "function fails(a) {\n"             // 11
  "  var before = a\n"                // 12
  "  throw 'bad'\n"                   // 13
  "}\n"                               // 14
  "function caller(a) {\n"            // 15
  "  return f(a)\n"                   // 16
  "}\n";                              // 17


class CaptureFixture : public ScriptFixture
{
public:
  CaptureFixture()
  {
    ErrorPtr err = load(captureSource);
    if (Error::notOK(err)) LOG(LOG_ERR, "fixture: %s", err->text());
  }
};


TEST_CASE_METHOD(CaptureFixture, "Capture last call", "[callcapture]" )
{
  CallCapturePtr cap;
  REQUIRE(Error::isOK(session->captureCall(ScopeSpec::forFunction(fn("f")), cap)));
  REQUIRE(session->isInstalled());
  REQUIRE(!cap->captured());
  SECTION("single call") {
    REQUIRE(run("f(3)").numValue() == 6);
    REQUIRE(cap->captured());
    const CallInfo &c = cap->call();
    REQUIRE(c.name == "f");
    REQUIRE(c.file == "/work/demo/demo.tms");
    REQUIRE(c.args.size() == 1);
    REQUIRE(c.arg("x").numValue() == 3);
    REQUIRE(c.local("y").numValue() == 6);
    REQUIRE(c.returnValue.numValue() == 6);
    REQUIRE(!c.unwound);
    REQUIRE(c.globals.find("counter")->second.numValue() == 1);
    REQUIRE(c.description() == "f(x=3) -> 6");
  }
  SECTION("record is updated by later calls") {
    const CallInfo &c = cap->call();
    run("f(1); f(5)");
    REQUIRE(c.arg("x").numValue() == 5);
    REQUIRE(c.returnValue.numValue() == 10);
  }
  SECTION("stack shows the caller") {
    run("caller(2)");
    const CallInfo &c = cap->call();
    REQUIRE(c.stack.size() == 2);
    REQUIRE(c.stack[0].name == "caller");
    REQUIRE(c.stack[0].line == 16);
    REQUIRE(c.stack[0].source == "return f(a)");
    REQUIRE(c.stack[1].name == "f");
    REQUIRE(c.stackDescription().find("File \"/work/demo/demo.tms\", line 16, in caller") != string::npos);
  }
  SECTION("releasing stops capturing and the session it started") {
    cap->release();
    REQUIRE(!cap->isRegistered());
    REQUIRE(!session->isStarted());
    run("f(3)");
    REQUIRE(!cap->captured());
  }
}


TEST_CASE_METHOD(CaptureFixture, "Capture all calls", "[callcapture]" )
{
  CallListCapturePtr cap;
  REQUIRE(Error::isOK(session->captureCalls(ScopeSpec::forFunction(fn("fact")), cap)));
  SECTION("recursive calls in completion order") {
    REQUIRE(run("fact(3)").numValue() == 6);
    REQUIRE(cap->size() == 3);
    const CallInfoList &calls = cap->calls();
    REQUIRE(calls[0].arg("n").numValue() == 1);
    REQUIRE(calls[0].returnValue.numValue() == 1);
    REQUIRE(calls[1].arg("n").numValue() == 2);
    REQUIRE(calls[2].arg("n").numValue() == 3);
    REQUIRE(calls[2].returnValue.numValue() == 6);
    REQUIRE(calls[0].stack.size() == 3);
    REQUIRE(cap->numPending() == 0);
  }
  SECTION("no calls") {
    run("f(1)");
    REQUIRE(cap->size() == 0);
  }
}


TEST_CASE_METHOD(CaptureFixture, "Capture unwound calls", "[callcapture]" )
{
  CallCapturePtr cap;
  REQUIRE(Error::isOK(session->captureCall(ScopeSpec::forName("fails"), cap)));
  REQUIRE(run("fails(4)").isError());
  REQUIRE(cap->captured());
  const CallInfo &c = cap->call();
  REQUIRE(c.unwound);
  REQUIRE(c.returnValue.isNull());
  REQUIRE(Error::isError(c.exception, ScriptError::domain(), ScriptError::Thrown));
  REQUIRE(c.local("before").numValue() == 4);
  REQUIRE(c.description().find("fails(a=4) raised") == 0);
}


TEST_CASE_METHOD(CaptureFixture, "Nested registrations share the session", "[callcapture]" )
{
  CallCapturePtr capF;
  CallListCapturePtr capAll;
  REQUIRE(Error::isOK(session->captureCall(ScopeSpec::forName("f"), capF)));
  REQUIRE(Error::isOK(session->captureCalls(ScopeSpec::forModule(module), capAll)));
  run("caller(1)");
  REQUIRE(capF->captured());
  REQUIRE(capAll->size() == 2);
  // released out of order, tracing continues until the last one is gone
  capF->release();
  REQUIRE(session->isInstalled());
  run("f(1)");
  REQUIRE(capAll->size() == 3);
  capAll->release();
  REQUIRE(!session->isStarted());
}


TEST_CASE_METHOD(CaptureFixture, "Registrations on an explicitly started session", "[callcapture]" )
{
  REQUIRE(Error::isOK(session->start()));
  {
    CallCapturePtr cap;
    REQUIRE(Error::isOK(session->captureCall(ScopeSpec::forName("f"), cap)));
    run("f(1)");
    REQUIRE(cap->captured());
  }
  // going out of scope releases the registration, but leaves the session running
  REQUIRE(session->numCallbacks() == 0);
  REQUIRE(session->isInstalled());
}


TEST_CASE_METHOD(CaptureFixture, "Capture configuration errors", "[callcapture]" )
{
  CallCapturePtr cap;
  REQUIRE(traceErrorCode(session->captureCall(ScopeSpec(), cap)) == TraceError::Configuration);
  REQUIRE(!cap);
  REQUIRE(!session->isStarted());
}
