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

#include <maxosc/command.hh>

#include <maxosc/string.hh>

namespace maxosc
{

CommandSpec::CommandSpec(const std::string& program,
                         const std::vector<std::string>& arguments,
                         Duration timeout,
                         const std::set<int>& success_codes)
    : m_program(program)
    , m_arguments(arguments)
    , m_timeout(timeout)
    , m_success_codes(success_codes)
{
}

std::vector<std::string> CommandSpec::argv() const
{
    std::vector<std::string> rval;
    rval.reserve(m_arguments.size() + 1);
    rval.push_back(m_program);
    rval.insert(rval.end(), m_arguments.begin(), m_arguments.end());
    return rval;
}

std::string CommandSpec::to_string() const
{
    return shell_join(argv());
}

CommandResult::CommandResult(const Host& host,
                             int exit_code,
                             const std::string& out,
                             const std::string& err,
                             Duration duration,
                             wall_time::TimePoint started_at)
    : m_host(host)
    , m_exit_code(exit_code)
    , m_out(out)
    , m_err(err)
    , m_duration(duration)
    , m_started_at(started_at)
{
}

std::string shell_quote(const std::string& str)
{
    const char safe[] = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789@%_-+=:,./";

    if (!str.empty() && str.find_first_not_of(safe) == std::string::npos)
    {
        return str;
    }

    // Single quotes cannot be escaped inside single quotes: close, escape and reopen.
    std::string rval = str;
    substitute(rval, "'", "'\\''");
    return "'" + rval + "'";
}

std::string shell_join(const std::vector<std::string>& argv)
{
    std::vector<std::string> quoted;
    quoted.reserve(argv.size());

    for (const auto& arg : argv)
    {
        quoted.push_back(shell_quote(arg));
    }

    return join(quoted, " ");
}
}
