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

#include "snapshot.hpp"

using namespace tmx;


BindingsList tmx::argumentsOf(ExecutionContext &aContext)
{
  BindingsList args;
  CodeUnitPtr code = aContext.code();
  if (!code) return args;
  const VariablesMap &locals = aContext.locals();
  const std::vector<string> &names = code->argNames();
  for (std::vector<string>::const_iterator pos = names.begin(); pos!=names.end(); ++pos) {
    VariablesMap::const_iterator v = locals.find(*pos);
    if (v!=locals.end()) args.push_back(make_pair(*pos, v->second));
  }
  return args;
}


VariablesMap tmx::localsOf(ExecutionContext &aContext)
{
  return aContext.locals();
}


VariablesMap tmx::globalsOf(ExecutionContext &aContext)
{
  return aContext.globals();
}


StackSummary tmx::stackOf(ExecutionContext &aContext)
{
  StackSummary stack;
  ExecutionContextPtr ctx = ExecutionContextPtr(&aContext);
  while (ctx) {
    StackEntry e;
    CodeUnitPtr code = ctx->code();
    e.name = code ? code->name() : "?";
    e.file = ctx->fileName();
    e.line = ctx->line();
    e.source = trimWhiteSpace(ctx->sourceLine());
    stack.insert(stack.begin(), e);
    ctx = ctx->caller();
  }
  return stack;
}


string tmx::formatStack(const StackSummary &aStack)
{
  string s;
  for (StackSummary::const_iterator pos = aStack.begin(); pos!=aStack.end(); ++pos) {
    string_format_append(s, "  File \"%s\", line %d, in %s\n", pos->file.c_str(), pos->line, pos->name.c_str());
    if (!pos->source.empty()) string_format_append(s, "    %s\n", pos->source.c_str());
  }
  return s;
}
