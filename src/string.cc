/*
 * Copyright (c) 2023 MariaDB plc, Finnish Branch
 *
 * Use of this software is governed by the Business Source License included
 * in the LICENSE.TXT file and at www.mariadb.com/bsl11.
 *
 * Change Date: 2029-02-28
 *
 * On the date above, in accordance with the Business Source License, use
 * of this software will be governed by version 2 or later of the General
 * Public License.
 */

#include <maxosc/string.hh>

#include <cerrno>
#include <climits>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace
{
thread_local char errbuf[512];
}

const char* mxo_strerror(int error)
{
    return strerror_r(error, errbuf, sizeof(errbuf));
}

namespace maxosc
{

std::string string_printf(const char* format, ...)
{
    /* Use 'vsnprintf' for the formatted printing. It outputs the optimal buffer length - 1. */
    va_list args;
    va_start(args, format);
    int characters = vsnprintf(nullptr, 0, format, args);
    va_end(args);

    std::string rval;
    if (characters < 0)
    {
        // Encoding (programmer) error.
        fprintf(stderr, "Could not format '%s'.\n", format);
    }
    else if (characters > 0)
    {
        rval.resize(characters + 1);
        va_start(args, format);
        vsnprintf(&rval[0], characters + 1, format, args);
        va_end(args);
        rval.resize(characters);
    }
    return rval;
}

std::vector<std::string> split_trimmed(const std::string& str, char separator)
{
    std::vector<std::string> rval;
    std::string::size_type start = 0;

    while (start <= str.length())
    {
        auto end = str.find(separator, start);
        if (end == std::string::npos)
        {
            end = str.length();
        }

        std::string piece = trimmed_copy(str.substr(start, end - start));
        if (!piece.empty())
        {
            rval.push_back(std::move(piece));
        }
        start = end + 1;
    }

    return rval;
}

bool get_int(const std::string& s, int* value)
{
    errno = 0;
    char* endptr;
    long l = strtol(s.c_str(), &endptr, 10);
    bool rval = false;

    if (!s.empty() && errno == 0 && *endptr == '\0' && l >= INT_MIN && l <= INT_MAX)
    {
        *value = l;
        rval = true;
    }

    return rval;
}

bool get_non_negative_decimal(const std::string& s, double* value)
{
    // strtod() would also accept hex, inf, nan and exponents, none of which are valid here.
    bool seen_digit = false;
    bool seen_dot = false;

    for (char c : s)
    {
        if (isdigit((unsigned char)c))
        {
            seen_digit = true;
        }
        else if (c == '.' && !seen_dot)
        {
            seen_dot = true;
        }
        else
        {
            return false;
        }
    }

    if (seen_digit)
    {
        *value = strtod(s.c_str(), nullptr);
    }

    return seen_digit;
}

void substitute(std::string& subject, const std::string& match, const std::string& replace)
{
    // The match may be in the subject multiple times. Find all locations.
    std::string::size_type next_search_begin = 0;
    while (!match.empty() && next_search_begin < subject.length())
    {
        auto position = subject.find(match, next_search_begin);
        if (position == std::string::npos)
        {
            next_search_begin = subject.length();
        }
        else
        {
            subject.replace(position, match.length(), replace);
            next_search_begin = position + replace.length();
        }
    }
}
}
