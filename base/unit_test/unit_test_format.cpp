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

#include "config.h"

#include <string>

#include "base/test_minimal.h"
#include "base/format.h"
#include "base/utility.h"

void unit_test_format_string()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(base::FormatString("hello") == "hello");
    TEST_REQUIRE(base::FormatString("%1 %2", "hello", "world") == "hello world");
    TEST_REQUIRE(base::FormatString("%2 %1", 1, 2) == "2 1");
    TEST_REQUIRE(base::FormatString("%1%1", 'x') == "xx");
    TEST_REQUIRE(base::FormatString("%1", true) == "true");
}

void unit_test_to_chars()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(base::ToChars(1.0f) == "1.00");
    TEST_REQUIRE(base::ToChars(3.24096994, 4) == "3.2410");
    TEST_REQUIRE(base::ToChars(-0.00001, 4) == "0.0000");
    TEST_REQUIRE(base::ToChars(-1.5373832, 4) == "-1.5374");
    TEST_REQUIRE(base::ToCharsGeneral(0.00390625) == "0.00390625");
    TEST_REQUIRE(base::ToCharsGeneral(8.0) == "8");
    TEST_REQUIRE(base::ToChars(42) == "42");
}

void unit_test_string_util()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(base::TrimString("  foo \n") == "foo");
    TEST_REQUIRE(base::TrimString("   ") == "");
    TEST_REQUIRE(base::ToUpper("vertex") == "VERTEX");
    TEST_REQUIRE(base::JoinString({"a", "b", "c"}, ",") == "a,b,c");
    TEST_REQUIRE(base::JoinString({}, ",") == "");

    const auto& lines = base::SplitLines("a\n\nb\n");
    TEST_REQUIRE(lines.size() == 3);
    TEST_REQUIRE(lines[0] == "a");
    TEST_REQUIRE(lines[1] == "");
    TEST_REQUIRE(lines[2] == "b");

    const auto& parts = base::SplitString("x  y z");
    TEST_REQUIRE(parts.size() == 3);
    TEST_REQUIRE(parts[2] == "z");

    TEST_REQUIRE(base::StartsWith("#include <foo>", "#include"));
    TEST_REQUIRE(base::EndsWith("array[0]", "[0]"));
    TEST_REQUIRE(!base::EndsWith("]", "[0]"));
}

void unit_test_replace_identifier()
{
    TEST_CASE(test::Type::Feature)

    TEST_REQUIRE(base::ReplaceIdentifier("x[NUM_FOO]", "NUM_FOO", "3") == "x[3]");
    TEST_REQUIRE(base::ReplaceIdentifier("NUM_FOO_BAR NUM_FOO", "NUM_FOO", "3") == "NUM_FOO_BAR 3");
    TEST_REQUIRE(base::ReplaceIdentifier("XNUM_FOO", "NUM_FOO", "3") == "XNUM_FOO");
    TEST_REQUIRE(base::ReplaceIdentifier("NUM_FOO", "NUM_FOO", "10") == "10");
    TEST_REQUIRE(base::ReplaceAll("texture2D(a); texture2D(b);", "texture2D", "texture") == "texture(a); texture(b);");
}

EXPORT_TEST_MAIN(
int test_main(int argc, char* argv[])
{
    unit_test_format_string();
    unit_test_to_chars();
    unit_test_string_util();
    unit_test_replace_identifier();
    return 0;
}
) // TEST_MAIN
