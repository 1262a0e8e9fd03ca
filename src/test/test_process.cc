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

#include <maxosc/process.hh>

#include <pthread.h>
#include <signal.h>

#include <maxosc/command.hh>
#include <maxosc/log.hh>
#include <maxosc/stopwatch.hh>

#include "test_utils.hh"

using namespace std::chrono;
using maxosc::Process;

namespace
{

void test_output()
{
    auto output = Process::run({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"}, seconds(10));

    TEST(output.exit_code == 3, "exit code " << output.exit_code);
    TEST(output.out == "out\n", "out: " << output.out);
    TEST(output.err == "err\n", "err: " << output.err);

    // More than a pipe buffer on both streams at once must not block.
    output = Process::run({"/bin/sh", "-c", "head -c 200000 /dev/zero; head -c 200000 /dev/zero >&2"},
                          seconds(10));
    TEST(output.exit_code == 0, "exit code " << output.exit_code);
    TEST(output.out.size() == 200000, "stdout size " << output.out.size());
    TEST(output.err.size() == 200000, "stderr size " << output.err.size());
}

void test_exit_codes()
{
    auto output = Process::run({"/bin/false"}, seconds(10));
    TEST(output.exit_code == 1, "false returned " << output.exit_code);

    output = Process::run({"/nonexistent/program"}, seconds(10));
    TEST(output.exit_code == 127, "missing program returned " << output.exit_code);
    TEST(!output.err.empty(), "no error message for a missing program");

    output = Process::run({"/bin/sh", "-c", "kill -9 $$"}, seconds(10));
    TEST(output.exit_code == 128 + 9, "killed program returned " << output.exit_code);

    output = Process::run({}, seconds(10));
    TEST(output.exit_code == Process::ERROR, "empty argv returned " << output.exit_code);
}

void test_timeout()
{
    maxosc::StopWatch sw;
    auto output = Process::run({"/bin/sh", "-c", "echo started; sleep 30; exit 5"}, milliseconds(300));
    auto elapsed = sw.split();

    TEST(output.exit_code == Process::TIMEOUT, "exit code " << output.exit_code);
    TEST(output.out == "started\n", "output before the timeout was lost: " << output.out);
    TEST(elapsed < Process::KILL_GRACE + seconds(2), "took " << maxosc::to_string(elapsed));

    // A program that ignores SIGTERM is killed after the grace period.
    sw.restart();
    output = Process::run({"/bin/sh", "-c", "trap '' TERM; sleep 30"}, milliseconds(100));
    elapsed = sw.split();

    TEST(output.exit_code == Process::TIMEOUT, "exit code " << output.exit_code);
    TEST(elapsed < Process::KILL_GRACE + seconds(2), "took " << maxosc::to_string(elapsed));

    maxosc::Host host("db1001.eqiad.wmnet");
    auto result = maxosc::run_for_host(host, {"sleep", "30"}, milliseconds(100));

    TEST(result.timed_out(), "exit code " << result.exit_code());
    TEST(result.host() == host, "wrong host " << result.host());
    TEST(result.err().find(maxosc::CommandResult::TIMEOUT_MARKER) != std::string::npos,
         "no timeout marker: " << result.err());
    TEST(result.duration() >= milliseconds(100), "duration " << maxosc::to_string(result.duration()));
}

// The CLI blocks SIGINT and SIGTERM in all of its threads. A command it starts must still
// get the SIGTERM of a timeout.
void test_timeout_with_blocked_signals()
{
    sigset_t blocked;
    sigset_t saved;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &blocked, &saved);

    maxosc::StopWatch sw;
    auto output = Process::run({"/bin/sh", "-c",
                                "trap 'echo cleaned-up; exit 0' TERM; echo started; "
                                "while true; do sleep 0.1; done"},
                               milliseconds(300));
    auto elapsed = sw.split();

    pthread_sigmask(SIG_SETMASK, &saved, nullptr);

    TEST(output.exit_code == Process::TIMEOUT, "exit code " << output.exit_code);
    TEST(output.out.find("cleaned-up") != std::string::npos, "the TERM trap did not run: " << output.out);
    TEST(elapsed < Process::KILL_GRACE, "the command was killed, took " << maxosc::to_string(elapsed));
}

void test_tokenize()
{
    using V = std::vector<std::string>;

    TEST(maxosc::tokenize_args("") == V {}, "empty");
    TEST(maxosc::tokenize_args("  a  b ") == (V {"a", "b"}), "spaces");
    TEST(maxosc::tokenize_args("ssh -o 'BatchMode yes' %h") == (V {"ssh", "-o", "BatchMode yes", "%h"}),
         "single quotes");
    TEST(maxosc::tokenize_args("a \"b 'c'\" d\\ e") == (V {"a", "b 'c'", "d e"}), "double quotes");
    TEST(maxosc::tokenize_args("--x='' y") == (V {"--x=", "y"}), "empty quotes");
    TEST(maxosc::tokenize_args("caf\xc3\xa9 \xe2\x80\x94x") == (V {"caf\xc3\xa9", "\xe2\x80\x94x"}),
         "bytes above 127");
}

void test_quote()
{
    TEST(maxosc::shell_quote("abc") == "abc", "plain");
    TEST(maxosc::shell_quote("") == "''", "empty");
    TEST(maxosc::shell_quote("ADD COLUMN x INT") == "'ADD COLUMN x INT'", "spaces");
    TEST(maxosc::shell_quote("it's") == "'it'\\''s'", "single quote");

    maxosc::CommandSpec spec("pt-online-schema-change", {"--alter=ADD COLUMN x INT", "D=db,t=t"},
                             seconds(1));
    TEST(spec.to_string() == "pt-online-schema-change '--alter=ADD COLUMN x INT' D=db,t=t",
         "joined: " << spec.to_string());

    // What shell_join produces, a shell parses back into the same arguments.
    auto output = Process::run({"/bin/sh", "-c", "printf '%s|' " + spec.to_string()}, seconds(10));
    TEST(output.out == "pt-online-schema-change|--alter=ADD COLUMN x INT|D=db,t=t|",
         "shell parsed: " << output.out);
}
}

int main()
{
    maxosc::Log log;

    test_output();
    test_exit_codes();
    test_timeout();
    test_timeout_with_blocked_signals();
    test_tokenize();
    test_quote();

    return maxosc::test::result();
}
