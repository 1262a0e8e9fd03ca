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

#include <maxosc/executor.hh>

#include <atomic>
#include <thread>

#include <maxosc/errors.hh>
#include <maxosc/log.hh>
#include <maxosc/process.hh>
#include <maxosc/stopwatch.hh>

#include "test_utils.hh"

using namespace std::chrono;
using maxosc::CommandResult;
using maxosc::CommandSpec;
using maxosc::Host;

namespace
{

/**
 * Runs the command locally for every host, except that the host called "unreachable"
 * behaves like ssh does when it cannot connect.
 */
class LocalClusterService : public maxosc::ClusterService
{
public:
    CommandResult run(const Host& host, const CommandSpec& spec) override
    {
        int now_running = ++m_running;
        int max = m_max_running.load();

        while (now_running > max && !m_max_running.compare_exchange_weak(max, now_running))
        {
        }

        CommandResult rval = host.address() == "unreachable.eqiad.wmnet" ?
            maxosc::test::make_result(host, 255, "", "ssh: Could not resolve hostname") :
            maxosc::run_for_host(host, spec.argv(), spec.timeout());

        --m_running;
        return rval;
    }

    int max_running() const
    {
        return m_max_running;
    }

private:
    std::atomic<int> m_running {0};
    std::atomic<int> m_max_running {0};
};

class ThrowingClusterService : public maxosc::ClusterService
{
public:
    CommandResult run(const Host& host, const CommandSpec& spec) override
    {
        if (host.port() == 3307)
        {
            throw std::runtime_error("connection pool exhausted");
        }

        return maxosc::test::make_result(host, 0, "ok");
    }
};

maxosc::Targets make_targets(int n)
{
    maxosc::Targets targets;

    for (int i = 0; i < n; ++i)
    {
        targets.insert(Host("db" + std::to_string(1001 + i) + ".eqiad.wmnet"));
    }

    return targets;
}

void test_local()
{
    maxosc::LocalExecutor executor;
    Host host("localhost");

    auto result = executor.execute_one(host, CommandSpec("/bin/echo", {"hello", "world"}, seconds(10)));
    TEST(result.exit_code() == 0, "exit code " << result.exit_code());
    TEST(result.out() == "hello world\n", "out: " << result.out());
    TEST(result.host() == host, "host " << result.host());

    bool thrown = false;

    try
    {
        executor.execute(make_targets(2), CommandSpec("/bin/true", {}, seconds(10)));
    }
    catch (const maxosc::InvalidTargetError&)
    {
        thrown = true;
    }

    TEST(thrown, "two targets were accepted by the local executor");

    thrown = false;

    try
    {
        executor.execute({}, CommandSpec("/bin/true", {}, seconds(10)));
    }
    catch (const maxosc::InvalidTargetError&)
    {
        thrown = true;
    }

    TEST(thrown, "no targets were accepted by the local executor");
}

void test_timeout()
{
    maxosc::LocalExecutor executor;
    maxosc::StopWatch sw;

    auto result = executor.execute_one(Host("localhost"),
                                       CommandSpec("/bin/sh", {"-c", "sleep 20; exit 7"}, milliseconds(200)));
    auto elapsed = sw.split();

    TEST(result.exit_code() == CommandResult::TIMEOUT, "exit code " << result.exit_code());
    TEST(result.timed_out(), "not timed out");
    TEST(result.err().find(CommandResult::TIMEOUT_MARKER) != std::string::npos, "err: " << result.err());
    TEST(elapsed < seconds(5), "took " << maxosc::to_string(elapsed));
}

void test_fleet_isolation()
{
    auto* service = new LocalClusterService;
    maxosc::FleetExecutor executor(std::unique_ptr<maxosc::ClusterService>(service), 8);

    auto targets = make_targets(4);
    Host unreachable("unreachable.eqiad.wmnet");
    Host invalid("wrong_host.eqiad.wmnet");
    targets.insert(unreachable);
    targets.insert(invalid);

    auto results = executor.execute(targets, CommandSpec("/bin/echo", {"ok"}, seconds(10)));

    TEST(results.size() == targets.size(), results.size() << " results for " << targets.size() << " targets");

    int succeeded = 0;

    for (const auto& kv : results)
    {
        TEST(kv.first == kv.second.host(), "result of " << kv.second.host() << " filed under " << kv.first);

        if (kv.second.exit_code() == 0)
        {
            TEST(kv.second.out() == "ok\n", kv.first << " printed " << kv.second.out());
            ++succeeded;
        }
    }

    TEST(succeeded == 4, succeeded << " hosts succeeded");
    TEST(results.at(unreachable).exit_code() == 255, "unreachable host exit code");

    const auto& refused = results.at(invalid);
    TEST(refused.exit_code() == 1, "invalid host exit code " << refused.exit_code());
    TEST(refused.out().empty(), "invalid host stdout " << refused.out());
    TEST(refused.err() == maxosc::FleetExecutor::INVALID_HOST_MESSAGE, "invalid host stderr " << refused.err());
}

void test_fleet_parallel()
{
    auto* service = new LocalClusterService;
    maxosc::FleetExecutor executor(std::unique_ptr<maxosc::ClusterService>(service), 4);
    maxosc::StopWatch sw;

    auto results = executor.execute(make_targets(4), CommandSpec("/bin/sleep", {"1"}, seconds(10)));
    auto elapsed = sw.split();

    TEST(results.size() == 4, results.size() << " results");
    TEST(elapsed < milliseconds(3000), "four one second commands took " << maxosc::to_string(elapsed));
    TEST(service->max_running() > 1, "at most " << service->max_running() << " ran at the same time");

    // The pool is capped.
    auto* capped_service = new LocalClusterService;
    maxosc::FleetExecutor capped(std::unique_ptr<maxosc::ClusterService>(capped_service), 2);
    results = capped.execute(make_targets(6), CommandSpec("/bin/sleep", {"0.2"}, seconds(10)));

    TEST(results.size() == 6, results.size() << " results");
    TEST(capped_service->max_running() <= 2, capped_service->max_running() << " ran at the same time");
}

void test_fleet_exception()
{
    maxosc::FleetExecutor executor(std::unique_ptr<maxosc::ClusterService>(new ThrowingClusterService), 4);
    Host ok("db1001.eqiad.wmnet");
    Host bad("db1002.eqiad.wmnet", 3307);

    auto results = executor.execute({ok, bad}, CommandSpec("/bin/true", {}, seconds(10)));

    TEST(results.size() == 2, results.size() << " results");
    TEST(results.at(ok).exit_code() == 0, "the other host was affected");
    TEST(results.at(bad).exit_code() == CommandResult::ERROR, "exit code " << results.at(bad).exit_code());
    TEST(results.at(bad).err() == "connection pool exhausted", "err " << results.at(bad).err());
}

void test_shell_service()
{
    maxosc::ShellClusterService ssh;
    CommandSpec spec("pt-online-schema-change", {"--alter=ADD COLUMN x INT", "D=db,t=t"}, seconds(10));
    Host host("db1001.eqiad.wmnet", 3317);

    auto argv = ssh.argv_for(host, spec);
    std::vector<std::string> expected {"ssh", "-o", "BatchMode=yes", "db1001.eqiad.wmnet",
                                       "pt-online-schema-change '--alter=ADD COLUMN x INT' D=db,t=t"};
    TEST(argv == expected, "argv " << maxosc::join(argv, " ", "\""));

    // With a local shell as the prefix, the command runs here.
    maxosc::ShellClusterService sh("/bin/sh -c");
    auto result = sh.run(host, CommandSpec("printf", {"%s|", "a b", "it's", "%h"}, seconds(10)));
    TEST(result.exit_code() == 0, "exit code " << result.exit_code() << ": " << result.err());
    TEST(result.out() == "a b|it's|%h|", "out " << result.out());

    maxosc::ShellClusterService port("/bin/echo %h:%p");
    result = port.run(host, CommandSpec("true", {}, seconds(10)));
    TEST(result.out() == "db1001.eqiad.wmnet:3317 true\n", "out " << result.out());
}

void test_create()
{
    maxosc::ExecutorConfig config;
    TEST(maxosc::Executor::create(config)->backend() == maxosc::ExecutorConfig::Backend::LOCAL, "local");

    config.backend = maxosc::ExecutorConfig::Backend::FLEET;
    config.max_threads = 3;
    auto executor = maxosc::Executor::create(config);
    TEST(executor->backend() == maxosc::ExecutorConfig::Backend::FLEET, "fleet");

    auto* fleet = dynamic_cast<maxosc::FleetExecutor*>(executor.get());
    TEST(fleet && fleet->max_threads() == 3, "max_threads");

    maxosc::ExecutorConfig::Backend backend;
    TEST(maxosc::backend_from_string("fleet", &backend) && backend == maxosc::ExecutorConfig::Backend::FLEET,
         "fleet from string");
    TEST(!maxosc::backend_from_string("cumin", &backend), "unknown backend accepted");
}
}

int main()
{
    maxosc::Log log;

    test_local();
    test_timeout();
    test_fleet_isolation();
    test_fleet_parallel();
    test_fleet_exception();
    test_shell_service();
    test_create();

    return maxosc::test::result();
}
