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

#ifndef __tracemux__snapshot__
#define __tracemux__snapshot__

#include "tracemux_common.hpp"
#include "tracehost.hpp"

using namespace std;

/// Copies of what the engine needs to keep from a live execution context

namespace tmx {

  /// one entry of a call stack summary
  struct StackEntry
  {
    string name;
    string file;
    int line;
    string source; ///< stripped source text of the line
  };
  typedef std::vector<StackEntry> StackSummary;

  /// @return arguments of the context, in declaration order
  BindingsList argumentsOf(ExecutionContext &aContext);

  /// @return copy of the local bindings
  VariablesMap localsOf(ExecutionContext &aContext);

  /// @return copy of the global bindings
  VariablesMap globalsOf(ExecutionContext &aContext);

  /// @return call stack summary ending with aContext, outermost call first
  StackSummary stackOf(ExecutionContext &aContext);

  /// format a stack summary, one "  File ..., line ..., in ..." line plus source line per entry
  string formatStack(const StackSummary &aStack);

} // namespace tmx

#endif /* defined(__tracemux__snapshot__) */
