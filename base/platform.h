// Copyright (C) 2020-2021 Sami Väisänen
// Copyright (C) 2020-2021 Ensisoft http://www.ensisoft.com
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

// Compiler and OS detection. The project's config.h includes this
// and adds its own definitions. Every source file includes "config.h".

#pragma once

#if defined(_MSC_VER)
  #define __MSVC__
  #define WINDOWS_OS
  #ifdef _M_AMD64
    #define X86_64
  #endif
  #define COMPILER_NAME    "msvc"
  #define COMPILER_VERSION _MSC_FULL_VER

  #define __PRETTY_FUNCTION__ __FUNCSIG__

  // execlude some stuff from the windows headers we dont need
  #define WIN32_LEAN_AND_MEAN

   // get rid of the stupid MIN MAX macros..
  #define NOMINMAX

  // suppress some useless warnings
  #define _CRT_SECURE_NO_WARNINGS
  #define _SCL_SECURE_NO_WARNINGS

  // msvc wants this for M_PI
  #define _USE_MATH_DEFINES
#endif

#if defined(__GNUG__) && !defined(__clang__)
  #define __GCC__
  #define POSIX_OS
  #define COMPILER_NAME "GCC"
  #define COMPILER_VERSION __GNUC__ * 10000 + __GNUC_MINOR__ * 100 + __GNUC_PATCHLEVEL__
#endif

#if defined(__clang__)
  #define __CLANG__
  #define POSIX_OS
  #define COMPILER_NAME    "clang"
  #define COMPILER_VERSION __clang_version__
#endif

#ifdef POSIX_OS
#  if defined(__APPLE__)
#    define APPLE_OS
#  else
#    define LINUX_OS
#  endif
#endif
