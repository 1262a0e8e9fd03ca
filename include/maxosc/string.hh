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
#pragma once

#include <maxosc/ccdefs.hh>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

/**
 * Thread-safe (but not re-entrant) strerror.
 *
 * @param error  An errno value.
 *
 * @return The corresponding message.
 */
const char* mxo_strerror(int error);

/**
 * macro MAKE_STR - Make a string out of streaming operations:
 *                  log(MAKE_STR("Host " << host << " is lagging " << lag << " seconds"));
 */
#define MAKE_STR(sstr) \
    [&]() { \
        std::ostringstream os; \
        os << sstr; \
        return os.str(); \
    } ()

namespace maxosc
{

/**
 * printf into a std::string
 */
std::string string_printf(const char* format, ...) mxo_attribute((format(printf, 1, 2)));

inline void ltrim(std::string& s)
{
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    }));
}

inline void rtrim(std::string& s)
{
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

inline void trim(std::string& s)
{
    ltrim(s);
    rtrim(s);
}

inline std::string trimmed_copy(const std::string& original)
{
    std::string s(original);
    trim(s);
    return s;
}

inline std::string lower_case_copy(const std::string& str)
{
    std::string rval(str);
    std::transform(rval.begin(), rval.end(), rval.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return rval;
}

/**
 * Split a string on a separator, trimming every piece. Empty pieces are dropped.
 */
std::vector<std::string> split_trimmed(const std::string& str, char separator);

/**
 * Join objects into a string delimited by separators
 *
 * @param container Container that provides iterators, stored value must support writing to ostream with
 *                  operator<<
 * @param separator Value used as the separator
 * @param quotation Quotation marker used to quote the values
 *
 * @return String created by joining all values and delimiting them with `separator` (no trailing delimiter)
 */
template<class T>
std::string join(const T& container, const std::string& separator = ",", const std::string& quotation = "")
{
    std::ostringstream ss;
    auto it = std::begin(container);

    if (it != std::end(container))
    {
        ss << quotation << *it++ << quotation;

        while (it != std::end(container))
        {
            ss << separator << quotation << *it++ << quotation;
        }
    }

    return ss.str();
}

/**
 * Convert a string to an int. The whole string must be a valid number, leading whitespace is ignored.
 *
 * @param s     String to convert
 * @param value Where the result is stored, if the conversion succeeded
 *
 * @return True on success
 */
bool get_int(const std::string& s, int* value);

/**
 * Convert a string to a non-negative double. Only plain decimal notation is accepted.
 *
 * @param s     String to convert
 * @param value Where the result is stored, if the conversion succeeded
 *
 * @return True on success
 */
bool get_non_negative_decimal(const std::string& s, double* value);

/**
 * Substitute all occurrences of @c match with @c replace.
 *
 * @param subject The string to modify
 * @param match   The string to look for
 * @param replace The replacement
 */
void substitute(std::string& subject, const std::string& match, const std::string& replace);
}
