// Copyright (C) 2020-2023 Sami Väisänen
// Copyright (C) 2020-2023 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include "config.h"

namespace debug
{
    // check if running in debugger
    bool has_debugger();

    [[noreturn]]
    void do_assert(const char* expression, const char* file, const char* func, int line);

    // Force a breakpoint when having a debugger attached or otherwise abort
    [[noreturn]]
    void do_break();

} // debug

// ASSERT and BUG are always compiled in, unlike the standard assert.
// They are for programmer errors only, i.e. conditions whose violation
// means the process state is no longer sane. Resource and input errors
// are reported through exceptions or diagnostics instead.
// A failed ASSERT prints the expression and a backtrace and dumps core.
#define ASSERT(expr) \
    (expr) \
    ? ((void)0) \
    : (debug::has_debugger() ? \
        debug::do_break() : \
        debug::do_assert(#expr, __FILE__, __PRETTY_FUNCTION__, __LINE__))
#define BUG(message)                                                    \
  do {                                                                  \
    debug::has_debugger()                                               \
  ? debug::do_break()                                                   \
  : debug::do_assert(message, __FILE__, __PRETTY_FUNCTION__, __LINE__); \
} while(0)
