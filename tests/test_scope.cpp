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
#include "scope.hpp"

using namespace tmx;

static const char *scopeSource =
  "function f(x) {\n"
  "  return x + 1\n"
  "}\n"
  "function other(x) {\n"
  "  return x\n"
  "}\n"
  "function deco(a) {\n"
  "  return wrapped(a)\n"
  "}\n"
  "@deco\n"
  "function g(a) {\n"
  "  return a\n"
  "}\n"
  "class Item {\n"
  "  function get(self) {\n"
  "    return 1\n"
  "  }\n"
  "}\n";


/// collects the names of contexts matched by a scope on entry
class MatchingHook : public TraceHook
{
public:
  ScopePtr scope;
  std::vector<string> matched;

  MatchingHook(ScopePtr aScope) : scope(aScope) {}

  virtual ErrorPtr trace(ExecutionContext &aContext, TraceEvent aEvent, const ScriptValue &aArg, TraceHookPtr &aNextHook) TMX_OVERRIDE
  {
    if (aEvent==trace_enter && scope->matches(aContext)) matched.push_back(aContext.code()->name());
    aNextHook.reset();
    return ErrorPtr();
  }
};


class ScopeFixture : public ScriptFixture
{
public:
  ScopeFixture()
  {
    ErrorPtr err = load(scopeSource, "/work/demo/scoped.tms", "scoped");
    if (Error::notOK(err)) LOG(LOG_ERR, "fixture: %s", err->text());
  }

  /// @return names of matched contexts while running aStatements
  std::vector<string> matching(const ScopeSpec &aSpec, const string &aStatements)
  {
    ScopePtr scope;
    ErrorPtr err = Scope::create(scope, aSpec);
    if (Error::notOK(err)) return std::vector<string>(1, string("error: ") + err->text());
    boost::intrusive_ptr<MatchingHook> hook = boost::intrusive_ptr<MatchingHook>(new MatchingHook(scope));
    runtime->setGlobalHook(hook);
    run(aStatements);
    runtime->setGlobalHook(TraceHookPtr());
    return hook->matched;
  }
};


TEST_CASE_METHOD(ScopeFixture, "Scope configuration errors", "[scope]" )
{
  ScopePtr scope;
  SECTION("no selector") {
    REQUIRE(traceErrorCode(Scope::create(scope, ScopeSpec())) == TraceError::Configuration);
  }
  SECTION("parent scopes") {
    ScopeSpec s = ScopeSpec::forName("f");
    ScopePtr parent;
    REQUIRE(Error::isOK(Scope::create(parent, ScopeSpec::forName("other"))));
    s.parentScopes.push_back(parent);
    REQUIRE(traceErrorCode(Scope::create(scope, s)) == TraceError::Configuration);
  }
  SECTION("function without code") {
    CallablePtr native = CallablePtr(dynamic_cast<Callable *>(runtime->builtins().find("abs")->second.objectValue().get()));
    REQUIRE(native);
    REQUIRE(traceErrorCode(Scope::create(scope, ScopeSpec::forFunction(native))) == TraceError::Configuration);
  }
  SECTION("class without call method") {
    REQUIRE(traceErrorCode(Scope::create(scope, ScopeSpec::forFunction(fn("Item")))) == TraceError::Configuration);
  }
}


TEST_CASE_METHOD(ScopeFixture, "Scope matching by function", "[scope]" )
{
  SECTION("function identity") {
    std::vector<string> m = matching(ScopeSpec::forFunction(fn("f")), "f(1); other(1); f(2)");
    REQUIRE(m.size() == 2);
    REQUIRE(m[0] == "f");
  }
  SECTION("decorated function is unwrapped by default") {
    std::vector<string> m = matching(ScopeSpec::forFunction(fn("g")), "g(1)");
    REQUIRE(m.size() == 1);
    REQUIRE(m[0] == "g");
  }
  SECTION("decorated function without unwrapping selects the wrapper") {
    ScopeSpec s = ScopeSpec::forFunction(fn("g"));
    s.unwrap = false;
    std::vector<string> m = matching(s, "g(1)");
    REQUIRE(m.size() == 1);
    REQUIRE(m[0] == "deco");
  }
  SECTION("bound method matches its receiver only") {
    run("var a = Item(); var b = Item(); var am = a.get");
    std::vector<string> m = matching(ScopeSpec::forFunction(CallablePtr(dynamic_cast<Callable *>(module->global("am").objectValue().get()))), "a.get(); b.get(); a.get()");
    REQUIRE(m.size() == 2);
  }
  SECTION("unbound method matches all receivers") {
    run("var a = Item(); var b = Item()");
    ScriptValue m;
    REQUIRE(fn("Item")->memberByName("get", m));
    std::vector<string> r = matching(ScopeSpec::forFunction(CallablePtr(dynamic_cast<Callable *>(m.objectValue().get()))), "a.get(); b.get()");
    REQUIRE(r.size() == 2);
  }
}


TEST_CASE_METHOD(ScopeFixture, "Scope matching by name, module and file", "[scope]" )
{
  SECTION("name") {
    REQUIRE(matching(ScopeSpec::forName("other"), "f(1); other(1)").size() == 1);
  }
  SECTION("module") {
    REQUIRE(matching(ScopeSpec::forModule(module), "f(1); other(1)").size() == 2);
  }
  SECTION("file pattern") {
    REQUIRE(matching(ScopeSpec::forFile("*.tms"), "f(1)").size() == 1);
    REQUIRE(matching(ScopeSpec::forFile("demo/scoped.tms"), "f(1)").size() == 1);
    REQUIRE(matching(ScopeSpec::forFile("elsewhere/scoped.tms"), "f(1)").size() == 0);
  }
  SECTION("exact file") {
    REQUIRE(matching(ScopeSpec::forFile("/work/demo/../demo/scoped.tms", false), "f(1)").size() == 1);
    REQUIRE(matching(ScopeSpec::forFile("scoped.tms", false), "f(1)").size() == 0);
  }
  SECTION("all selectors must match") {
    ScopeSpec s = ScopeSpec::forName("f");
    s.file = "*.other";
    REQUIRE(matching(s, "f(1)").size() == 0);
    s.file = "*.tms";
    REQUIRE(matching(s, "f(1); other(1)").size() == 1);
  }
}


TEST_CASE_METHOD(ScriptFixture, "Special file labels match exactly", "[scope]" )
{
  REQUIRE(Error::isOK(load("function h() {\n  return 1\n}\n", "<generated>", "gen")));
  ScopePtr scope;
  REQUIRE(Error::isOK(Scope::create(scope, ScopeSpec::forFile("<generated>"))));
  ScopePtr patternScope;
  REQUIRE(Error::isOK(Scope::create(patternScope, ScopeSpec::forFile("*"))));
  boost::intrusive_ptr<MatchingHook> hook = boost::intrusive_ptr<MatchingHook>(new MatchingHook(scope));
  boost::intrusive_ptr<MatchingHook> patternHook = boost::intrusive_ptr<MatchingHook>(new MatchingHook(patternScope));
  runtime->setGlobalHook(hook);
  run("h()");
  runtime->setGlobalHook(patternHook);
  run("h()");
  runtime->setGlobalHook(TraceHookPtr());
  REQUIRE(hook->matched.size() == 1);
  REQUIRE(patternHook->matched.size() == 0);
}
