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

#include <set>
#include <string>
#include <vector>

#include <maxosc/host.hh>
#include <maxosc/stopwatch.hh>

namespace maxosc
{

/**
 * What to run: a program with its arguments, the time it is allowed to take and
 * the exit codes that count as success.
 */
class CommandSpec
{
public:
    CommandSpec(const std::string& program,
                const std::vector<std::string>& arguments,
                Duration timeout,
                const std::set<int>& success_codes = {0});

    const std::string& program() const
    {
        return m_program;
    }

    const std::vector<std::string>& arguments() const
    {
        return m_arguments;
    }

    Duration timeout() const
    {
        return m_timeout;
    }

    const std::set<int>& success_codes() const
    {
        return m_success_codes;
    }

    bool is_success(int exit_code) const
    {
        return m_success_codes.count(exit_code) != 0;
    }

    /**
     * The program followed by the arguments.
     */
    std::vector<std::string> argv() const;

    /**
     * The command as a single line that a POSIX shell would parse back into argv().
     */
    std::string to_string() const;

private:
    std::string              m_program;
    std::vector<std::string> m_arguments;
    Duration                 m_timeout;
    std::set<int>            m_success_codes;
};

/**
 * The outcome of one execution attempt on one host. Never modified after creation,
 * a retry produces a new result.
 */
class CommandResult
{
public:
    static constexpr int ERROR = -1;    // The command could not be run at all
    static constexpr int TIMEOUT = -2;  // The command did not finish in time and was killed

    // Appended to the standard error of a command that timed out.
    static constexpr const char* TIMEOUT_MARKER = "[maxosc] command timed out";

    CommandResult(const Host& host,
                  int exit_code,
                  const std::string& out,
                  const std::string& err,
                  Duration duration,
                  wall_time::TimePoint started_at);

    const Host& host() const
    {
        return m_host;
    }

    int exit_code() const
    {
        return m_exit_code;
    }

    const std::string& out() const
    {
        return m_out;
    }

    const std::string& err() const
    {
        return m_err;
    }

    Duration duration() const
    {
        return m_duration;
    }

    wall_time::TimePoint started_at() const
    {
        return m_started_at;
    }

    bool timed_out() const
    {
        return m_exit_code == TIMEOUT;
    }

private:
    Host                 m_host;
    int                  m_exit_code;
    std::string          m_out;
    std::string          m_err;
    Duration             m_duration;
    wall_time::TimePoint m_started_at;
};

/**
 * Quote a string for a POSIX shell. Strings consisting only of safe characters are
 * returned as such, everything else is enclosed in single quotes.
 */
std::string shell_quote(const std::string& str);

/**
 * Quote every argument and join them with spaces.
 */
std::string shell_join(const std::vector<std::string>& argv);
}
