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

#ifndef __tracemux__config__
#define __tracemux__config__

// NOTE: all settings can be overridden from the build (-D...) or a config.h

#ifndef ENABLE_NAMED_ERRORS
  #define ENABLE_NAMED_ERRORS TMX_CPP11_FEATURE // Enable if compiler can do C++11
#endif
#ifndef TMX_DEBUGGER_SUPPORT
  #define TMX_DEBUGGER_SUPPORT 1 // nested interactive debugger handoff from breakpoints
#endif
#ifndef TMX_SCRIPT_MAX_CALL_DEPTH
  #define TMX_SCRIPT_MAX_CALL_DEPTH 200 // max nesting of script function calls in the reference runtime
#endif

#endif // __tracemux__config__
