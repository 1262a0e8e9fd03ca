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

#define MXO_MODULE_NAME "process"

#include <maxosc/process.hh>

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <initializer_list>

#include <maxosc/log.hh>
#include <maxosc/string.hh>

namespace
{

void write_all_to_stderr(const char* msg)
{
    ssize_t len = strlen(msg);

    while (len > 0)
    {
        ssize_t rc = ::write(STDERR_FILENO, msg, len);

        if (rc <= 0)
        {
            break;
        }

        msg += rc;
        len -= rc;
    }
}
}

namespace maxosc
{

Process::Process(const std::vector<std::string>& argv)
    : m_argv(argv)
{
}

Process::~Process()
{
    if (m_pid != -1)
    {
        kill(-m_pid, SIGKILL);

        int exit_status;
        while (waitpid(m_pid, &exit_status, 0) == -1 && errno == EINTR)
        {
        }
    }

    close_fds();
}

bool Process::start()
{
    if (m_argv.empty() || m_argv[0].empty())
    {
        MXO_ERROR("Cannot start a process without a program name.");
        return false;
    }

    // Create the pipes for stdout and stderr. Close-on-exec prevents processes started
    // concurrently by other threads from inheriting them.
    int out_fd[2];
    int err_fd[2];
    if (pipe2(out_fd, O_CLOEXEC) == -1)
    {
        MXO_ERROR("Failed to open pipe: [%d] %s", errno, mxo_strerror(errno));
        return false;
    }
    else if (pipe2(err_fd, O_CLOEXEC) == -1)
    {
        close(out_fd[0]);
        close(out_fd[1]);
        MXO_ERROR("Failed to open pipe: [%d] %s", errno, mxo_strerror(errno));
        return false;
    }

    // Everything the child needs is prepared before forking, the child only calls
    // functions that are safe in a multithreaded program.
    std::vector<char*> argvec;
    for (auto& arg : m_argv)
    {
        argvec.push_back(&arg[0]);
    }
    argvec.push_back(nullptr);

    std::string exec_error = "error: Cannot execute '" + m_argv[0] + "': ";
    const char* exec_name = argvec[0];

    pid_t pid = fork();
    if (pid < 0)
    {
        close(out_fd[0]);
        close(out_fd[1]);
        close(err_fd[0]);
        close(err_fd[1]);
        MXO_ERROR("Failed to execute command '%s', fork failed: [%d] %s",
                  exec_name, errno, mxo_strerror(errno));
        return false;
    }
    else if (pid == 0)
    {
        // A group of its own, so that a timeout kills whatever the command started too.
        setpgid(0, 0);

        // The mask is inherited across exec. A command whose SIGTERM stays blocked could
        // never clean up after a timeout.
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd != -1)
        {
            dup2(null_fd, STDIN_FILENO);
        }

        dup2(out_fd[1], STDOUT_FILENO);
        dup2(err_fd[1], STDERR_FILENO);

        execvp(exec_name, argvec.data());

        // Only reached if execvp failed. The message is caught by the parent process.
        int error = errno;
        write_all_to_stderr(exec_error.c_str());
        write_all_to_stderr(strerror(error));
        _exit(127);
    }

    // Same call in the parent, whichever runs first wins the race.
    setpgid(pid, pid);

    close(out_fd[1]);
    close(err_fd[1]);
    fcntl(out_fd[0], F_SETFL, O_NONBLOCK);
    fcntl(err_fd[0], F_SETFL, O_NONBLOCK);

    m_pid = pid;
    m_out_fd = out_fd[0];
    m_err_fd = err_fd[0];

    MXO_DEBUG("Executing command '%s' in process %d", exec_name, pid);
    return true;
}

bool Process::read_output(int timeout_ms)
{
    pollfd pfds[2];
    int nfds = 0;

    for (int fd : {m_out_fd, m_err_fd})
    {
        if (fd != -1)
        {
            pfds[nfds].fd = fd;
            pfds[nfds].events = POLLIN;
            pfds[nfds].revents = 0;
            ++nfds;
        }
    }

    if (nfds == 0)
    {
        // Both pipes closed, the process is about to exit or has exited.
        if (timeout_ms > 0)
        {
            usleep(std::min(timeout_ms, 10) * 1000);
        }
        return true;
    }

    if (poll(pfds, nfds, timeout_ms) == -1 && errno != EINTR)
    {
        MXO_ERROR("Failed to poll pipe file descriptors: %d, %s", errno, mxo_strerror(errno));
        return false;
    }

    for (auto* fd : {&m_out_fd, &m_err_fd})
    {
        if (*fd == -1)
        {
            continue;
        }

        std::string& dest = (fd == &m_out_fd) ? m_out : m_err;
        char buf[4096];
        ssize_t n;

        while ((n = read(*fd, buf, sizeof(buf))) > 0)
        {
            dest.append(buf, n);
        }

        if (n == 0 || (n == -1 && errno != EAGAIN && errno != EINTR))
        {
            close(*fd);
            *fd = -1;
        }
    }

    return true;
}

int Process::try_wait()
{
    if (m_pid != -1)
    {
        int exit_status;

        switch (waitpid(m_pid, &exit_status, WNOHANG))
        {
        case -1:
            if (errno != EINTR)
            {
                MXO_ERROR("Failed to wait for child process: %d, %s", errno, mxo_strerror(errno));
                m_result = ERROR;
                m_pid = -1;
            }
            break;

        case 0:
            m_result = TIMEOUT;
            break;

        default:
            m_pid = -1;

            if (WIFEXITED(exit_status))
            {
                m_result = WEXITSTATUS(exit_status);
            }
            else if (WIFSIGNALED(exit_status))
            {
                m_result = 128 + WTERMSIG(exit_status);
            }
            else
            {
                MXO_ERROR("Command '%s' did not exit normally. Exit status: %d",
                          m_argv[0].c_str(), exit_status);
                m_result = ERROR;
            }
            break;
        }
    }

    return m_result;
}

int Process::wait(Duration timeout)
{
    if (m_pid == -1)
    {
        return m_result;
    }

    auto deadline = Clock::now() + timeout;
    TimePoint kill_deadline;
    bool timed_out = false;
    bool killed = false;

    while (try_wait() == TIMEOUT)
    {
        auto now = Clock::now();

        if (!timed_out && now >= deadline)
        {
            MXO_WARNING("Command '%s' did not finish in %s, sending SIGTERM",
                        m_argv[0].c_str(), maxosc::to_string(timeout).c_str());
            kill(-m_pid, SIGTERM);
            timed_out = true;
            kill_deadline = now + KILL_GRACE;
        }
        else if (timed_out && !killed && now >= kill_deadline)
        {
            MXO_ERROR("Command '%s' ignored SIGTERM, sending SIGKILL", m_argv[0].c_str());
            kill(-m_pid, SIGKILL);
            killed = true;
        }

        auto next = timed_out ? kill_deadline : deadline;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(next - now).count();
        int poll_ms = killed ? 10 : std::max<int>(1, std::min<int64_t>(left, 100));

        if (!read_output(poll_ms))
        {
            // Poll failure, the process can no longer be observed.
            kill(-m_pid, SIGKILL);
            timed_out = false;
            killed = true;
        }
    }

    // Whatever is still buffered in the pipes. Descendants that are still running may keep the
    // pipes open, so nothing here waits for end of file.
    read_output(0);
    close_fds();

    if (timed_out)
    {
        m_result = TIMEOUT;
    }
    else if (killed)
    {
        m_result = ERROR;
    }

    return m_result;
}

void Process::close_fds()
{
    for (auto* fd : {&m_out_fd, &m_err_fd})
    {
        if (*fd != -1)
        {
            close(*fd);
            *fd = -1;
        }
    }
}

// static
Process::Output Process::run(const std::vector<std::string>& argv, Duration timeout)
{
    Output rval;
    Process process(argv);

    if (process.start())
    {
        rval.exit_code = process.wait(timeout);
        rval.out = process.out();
        rval.err = process.err();
    }
    else
    {
        rval.exit_code = ERROR;
        rval.err = "error: Failed to start '" + (argv.empty() ? std::string() : argv[0]) + "'";
    }

    return rval;
}

CommandResult run_for_host(const Host& host, const std::vector<std::string>& argv, Duration timeout)
{
    auto started_at = wall_time::Clock::now();
    StopWatch sw;
    auto output = Process::run(argv, timeout);
    auto duration = sw.split();

    if (output.exit_code == Process::TIMEOUT)
    {
        if (!output.err.empty() && output.err.back() != '\n')
        {
            output.err += '\n';
        }

        output.err += MAKE_STR(CommandResult::TIMEOUT_MARKER << " after " << timeout);
    }

    return CommandResult(host, output.exit_code, output.out, output.err, duration, started_at);
}

std::vector<std::string> tokenize_args(const std::string& args)
{
    std::vector<std::string> rval;
    std::string current;
    bool in_token = false;
    bool escaped = false;
    char quote = 0;

    for (char c : args)
    {
        if (escaped)
        {
            current += c;
            escaped = false;
        }
        else if (c == '\\' && quote != '\'')
        {
            escaped = true;
            in_token = true;
        }
        else if (quote)
        {
            if (c == quote)
            {
                quote = 0;
            }
            else
            {
                current += c;
            }
        }
        else if (c == '"' || c == '\'')
        {
            quote = c;
            in_token = true;
        }
        else if (isspace((unsigned char)c))
        {
            if (in_token)
            {
                rval.push_back(std::move(current));
                current.clear();
                in_token = false;
            }
        }
        else
        {
            current += c;
            in_token = true;
        }
    }

    if (in_token)
    {
        rval.push_back(std::move(current));
    }

    return rval;
}
}
