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

#include <maxosc/regex.hh>
#include <maxosc/log.hh>

namespace
{
std::string pcre2_error_message(int err)
{
    PCRE2_UCHAR errorbuf[120];
    pcre2_get_error_message(err, errorbuf, sizeof(errorbuf));
    return (const char*)errorbuf;
}
}

namespace maxosc
{

Regex::Regex(const std::string& pattern, uint32_t options)
    : m_pattern(pattern)
    , m_options(options)
{
    if (!m_pattern.empty())
    {
        int err;
        size_t erroff;
        auto code = pcre2_compile((PCRE2_SPTR) pattern.c_str(), pattern.length(),
                                  options, &err, &erroff, nullptr);

        if (!code)
        {
            m_error = pcre2_error_message(err) + " at offset " + std::to_string(erroff);
        }
        else
        {
            if (pcre2_jit_compile(code, PCRE2_JIT_COMPLETE) < 0)
            {
                MXO_INFO("PCRE2 JIT compilation of pattern '%s' failed, falling back to normal matching.",
                         pattern.c_str());
            }

            m_code.reset(code, pcre2_code_free);
        }
    }
}

bool Regex::empty() const
{
    return m_pattern.empty();
}

Regex::operator bool() const
{
    return empty() || valid();
}

bool Regex::valid() const
{
    return m_code.get();
}

const std::string& Regex::pattern() const
{
    return m_pattern;
}

const std::string& Regex::error() const
{
    return m_error;
}

bool Regex::match(const char* str, size_t len) const
{
    bool rval = false;

    if (m_code)
    {
        // Match data is created per call, the same Regex is used from several threads.
        std::unique_ptr<pcre2_match_data, decltype(&pcre2_match_data_free)>
        md(pcre2_match_data_create_from_pattern(m_code.get(), nullptr), pcre2_match_data_free);

        if (md)
        {
            int rc = pcre2_match(m_code.get(), (PCRE2_SPTR)str, len, 0, 0, md.get(), nullptr);

            if (rc >= 0)
            {
                rval = true;
            }
            else if (rc != PCRE2_ERROR_NOMATCH)
            {
                MXO_ERROR("Matching '%s' failed: %s", m_pattern.c_str(), pcre2_error_message(rc).c_str());
            }
        }
    }

    return rval;
}
}
