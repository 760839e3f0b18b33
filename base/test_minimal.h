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

#include <vector>
#include <string>
#include <stdexcept>

#include "base/platform.h"
#include "base/bitflag.h"

namespace test {

// Note that this class does *not* derive from std::exception
// on purpose so that the test code that would catch std::exceptions
// won't catch this.
class Fatality {
public:
    Fatality(const char* expression,
             const char* file,
             const char* function,
             int line)
      : mExpression(expression)
      , mFile(file)
      , mFunc(function)
      , mLine(line)
    {}
public:
    const char* mExpression = nullptr;
    const char* mFile       = nullptr;
    const char* mFunc       = nullptr;
    const int mLine         = 0;
};

enum class Type {
    Feature, Other
};

enum class Color {
    Error, Warning, Success, Message, Info
};

extern base::bitflag<Type> EnabledTestTypes;
extern std::vector<std::string> EnabledTestNames;
extern unsigned ErrorCount;

// Produce printed message into some output device such as stdout.
void Print(Color color, const char* fmt, ...);
// Extract simple filename from the filename provided by the __FILE__ macro.
const char* GetFileName(const char* source_file_name);
// Process a testing failure.
void BlurpFailure(const char* expression, const char* file, const char* function, int line, bool fatality);

bool IsEnabledByName(const std::string& name);
bool IsEnabledByType(Type type);

class TestCaseReporter {
public:
    TestCaseReporter(const char* func, Type type)
      : mName(func)
      , mType(type)
      , mErrors(ErrorCount)
    {}
   ~TestCaseReporter()
    {
        // printed here so that the non-fatal failures show up
        // before the name and the result of the test case.
        test::Print(test::Color::Message, "Running ");
        test::Print(test::Color::Info, "%-60s", mName);
        if (IsEnabledByType(mType) && IsEnabledByName(mName))
        {
            if (mErrors == ErrorCount)
                test::Print(test::Color::Success, "OK\n");
            else test::Print(test::Color::Warning, "Fail\n");
        }
        else
        {
            test::Print(test::Color::Message, "Skipped\n");
        }
    }
private:
    const char* mName = nullptr;
    const Type mType;
    const unsigned mErrors = 0;
};

} // test

#define TEST_CHECK(expr) \
    (expr) \
    ? ((void)0) \
    : (test::BlurpFailure(#expr, __FILE__, __FUNCTION__, __LINE__, false))

#define TEST_REQUIRE(expr) \
    (expr) \
    ? ((void)0) \
    : (test::BlurpFailure(#expr, __FILE__, __FUNCTION__, __LINE__, true))

#define TEST_MESSAGE(msg, ...) \
    test::Print(test::Color::Message, "%s (%d): '" msg "'\n", __FUNCTION__, __LINE__, ## __VA_ARGS__); \

#define TEST_EXCEPTION(expr) \
    try { \
        expr; \
        TEST_REQUIRE(!"Exception was expected"); \
    } \
    catch (const std::exception& e) \
    {}

#define TEST_CASE(type) \
    test::TestCaseReporter test_case_reporter(__FUNCTION__, type);   \
    if (!test::IsEnabledByType(type))                                \
        return;                                                      \
    if (!test::IsEnabledByName(__FUNCTION__))                        \
        return;

#define EXPORT_TEST_MAIN(main) main

// include the definitions directly to keep the build rules of the
// unit tests simple, each test is a single translation unit.
#include "base/test_minimal.cpp"
