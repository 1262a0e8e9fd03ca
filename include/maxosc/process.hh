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

#include <string>
#include <vector>
#include <sys/types.h>

#include <maxosc/command.hh>
#include <maxosc/stopwatch.hh>

namespace maxosc
{

/**
 * Runs an external program without a shell, capturing its standard output and
 * standard error separately.
 */
class Process
{
public:
    static constexpr int ERROR = CommandResult::ERROR;      // System error unrelated to the command
    static constexpr int TIMEOUT = CommandResult::TIMEOUT;  // The command did not exit in time

    // Time between SIGTERM and SIGKILL when a command times out.
    static constexpr std::chrono::milliseconds KILL_GRACE {2000};

    struct Output
    {
        int         exit_code {ERROR};
        std::string out;
        std::string err;
    };

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /**
     * @param argv  The program followed by its arguments. The program is looked up from PATH
     *              if it does not contain a slash.
     */
    explicit Process(const std::vector<std::string>& argv);

    /**
     * Kills the process group if it is still running and reaps the child.
     */
    ~Process();

    /**
     * Start the process.
     *
     * @return True if the process was forked. A program that cannot be executed is
     *         reported by the child as exit code 127, like a shell does.
     */
    bool start();

    /**
     * Wait for the process to exit, reading its output meanwhile.
     *
     * @param timeout  How long to wait. When exceeded, the process group is sent SIGTERM
     *                 and, if it is still alive after KILL_GRACE, SIGKILL.
     *
     * @return The exit code, 128 + signal number if the program was killed by a signal,
     *         TIMEOUT if it timed out and ERROR on system errors.
     */
    int wait(Duration timeout);

    const std::string& out() const
    {
        return m_out;
    }

    const std::string& err() const
    {
        return m_err;
    }

    /**
     * Start, wait and collect the output in one go.
     */
    static Output run(const std::vector<std::string>& argv, Duration timeout);

private:
    bool read_output(int timeout_ms);
    int  try_wait();
    void close_fds();

    std::vector<std::string> m_argv;
    pid_t                    m_pid {-1};
    int                      m_out_fd {-1};
    int                      m_err_fd {-1};
    int                      m_result {ERROR};
    std::string              m_out;
    std::string              m_err;
};

/**
 * Run a command on the calling machine and package the outcome as a result for @c host.
 * A timed out command gets CommandResult::TIMEOUT_MARKER appended to its standard error.
 *
 * @param host     The host the result is attributed to.
 * @param argv     What to run.
 * @param timeout  The time limit.
 */
CommandResult run_for_host(const Host& host, const std::vector<std::string>& argv, Duration timeout);

/**
 * Split a string into arguments. Whitespace separates arguments, single and double quotes
 * group and a backslash escapes the next character.
 */
std::vector<std::string> tokenize_args(const std::string& args);
}
