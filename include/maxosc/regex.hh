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

#if defined (PCRE2_CODE_UNIT_WIDTH)
#error PCRE2_CODE_UNIT_WIDTH already defined. Do not define, and include <maxosc/regex.hh>.
#else
#define PCRE2_CODE_UNIT_WIDTH 8
#endif

#include <pcre2.h>

#include <memory>
#include <string>

namespace maxosc
{

// Class for PCRE2 regular expressions
class Regex
{
public:

    /**
     * Constructs a regular expression
     *
     * The default values construct an empty regular expression that is valid but does not match
     * anything. This is used to signify unconfigured regular expressions.
     *
     * @param pattern The pattern to use.
     * @param options PCRE2 options to use.
     */
    Regex(const std::string& pattern = "", uint32_t options = 0);

    Regex(const Regex& rhs) = default;
    Regex(Regex&& rhs) = default;
    Regex& operator=(const Regex& rhs) = default;
    Regex& operator=(Regex&& rhs) = default;

    /**
     * @return True if the pattern is empty i.e. the string `""`
     */
    bool empty() const;

    /**
     * @return True if the pattern is either empty or it is valid
     */
    explicit operator bool() const;

    /**
     * @return True if pattern was compiled successfully
     */
    bool valid() const;

    const std::string& pattern() const;

    /**
     * @return The error of compiling the pattern, empty if it compiled
     */
    const std::string& error() const;

    /**
     * Check if `str` matches this pattern. The match is unanchored, i.e. the pattern
     * may match anywhere in the subject. An empty pattern never matches.
     *
     * @return True if the string matches the pattern
     */
    bool match(const char* str, size_t len) const;
    bool match(const std::string& str) const
    {
        return match(str.c_str(), str.size());
    }

    uint32_t options() const
    {
        return m_options;
    }

private:
    std::string                 m_pattern;
    std::string                 m_error;
    uint32_t                    m_options = 0;
    std::shared_ptr<pcre2_code> m_code;
};
}
