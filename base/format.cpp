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

#include <cstdio>
#include <cstring>
#include <cctype>
#include <locale>
#include <iomanip>

#include "base/format.h"

namespace base {
namespace detail {
#if defined(BASE_FORMAT_SUPPORT_GLM)
std::string ToString(const glm::mat4& m)
{
    const auto& x = m[0];
    const auto& y = m[1];
    const auto& z = m[2];
    const auto& w = m[3];

    char buff[1024];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
       "[%.2f %.2f %.2f %.2f],"
       "[%.2f %.2f %.2f %.2f],"
       "[%.2f %.2f %.2f %.2f],"
       "[%.2f %.2f %.2f %.2f]",
       x[0], x[1], x[2], x[3],
       y[0], y[1], y[2], y[3],
       z[0], z[1], z[2], z[3],
       w[0], w[1], w[2], w[3]);
    return buff;
}
std::string ToString(const glm::mat3& m)
{
    const auto& x = m[0];
    const auto& y = m[1];
    const auto& z = m[2];
    char buff[1024];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
        "[%.2f %.2f %.2f],"
        "[%.2f %.2f %.2f],"
        "[%.2f %.2f %.2f]",
        x[0], x[1], x[2],
        y[0], y[1], y[2],
        z[0], z[1], z[2]);
    return buff;
}

std::string ToString(const glm::vec4& v)
{
    char buff[256];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
       "[%.2f %.2f %.2f %.2f]", v[0], v[1], v[2], v[3]);
    return buff;
}

std::string ToString(const glm::vec3& v)
{
    char buff[256];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
        "[%.2f %.2f %.2f]", v[0], v[1], v[2]);
    return buff;
}

std::string ToString(const glm::vec2& v)
{
    char buff[256];
    std::memset(buff, 0, sizeof(buff));
    std::snprintf(buff, sizeof(buff),
        "[%.2f %.2f]", v[0], v[1]);
    return buff;
}
#endif // BASE_FORMAT_SUPPORT_GLM

} // detail

std::string TrimString(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return "";
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ToUpper(const std::string& str)
{
    std::string ret;
    ret.reserve(str.size());
    for (auto c : str)
        ret.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    return ret;
}

std::string ToChars(float value)
{
    // c++17 has to_chars in <charconv> but GCC (stdlib) doesn't
    // yet support float conversion. gah.
    std::stringstream ss;
    std::string ret;
    ss.imbue(std::locale("C"));
    ss << std::fixed << std::setprecision(2) << value;
    ss >> ret;
    return ret;
}

std::string ToChars(double value, unsigned precision)
{
    std::stringstream ss;
    std::string ret;
    ss.imbue(std::locale("C"));
    ss << std::fixed << std::setprecision(precision) << value;
    ss >> ret;
    // avoid "-0.0000"
    if (ret[0] == '-' && ret.find_first_not_of("-0.") == std::string::npos)
        ret.erase(0, 1);
    return ret;
}

std::string ToCharsGeneral(double value, unsigned significant_digits)
{
    std::stringstream ss;
    std::string ret;
    ss.imbue(std::locale("C"));
    ss << std::setprecision(significant_digits) << value;
    ss >> ret;
    return ret;
}

std::string ToChars(int value)
{
    return std::to_string(value);
}

std::string ToChars(unsigned value)
{
    return std::to_string(value);
}

std::string JoinString(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string ret;
    for (size_t i=0; i<parts.size(); ++i)
    {
        if (i)
            ret += separator;
        ret += parts[i];
    }
    return ret;
}

} // namespace
