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

#include <maxosc/schemachange.hh>

#include <algorithm>
#include <functional>
#include <memory>
#include <thread>
#include <unistd.h>

#include <maxosc/jobstate.hh>
#include <maxosc/log.hh>
#include <maxosc/report.hh>

#include "test_utils.hh"

using namespace std::chrono;
using namespace maxosc;
using maxosc::test::TOOL;
using maxosc::test::LAG_CHECK;
using maxosc::test::make_result;
using maxosc::test::master;
using maxosc::test::replica1;
using maxosc::test::replica2;

namespace
{

const TableName TABLE {"enwiki", "revision"};
const char DDL[] = "ADD COLUMN rev_actor BIGINT UNSIGNED";

struct Fixture
{
    Config                    config;
    test::ScriptedExecutor    executor;
    std::unique_ptr<Topology> topology;
    std::unique_ptr<SchemaChange> change;

    Fixture(const Config& c = test::fast_config(), bool dry_run = false)
        : config(c)
        , topology(Topology::from_config(config, executor))
        , change(new SchemaChange(config, executor, *topology, TABLE, DDL, dry_run))
    {
    }

    const SchemaChangeJob& job() const
    {
        return change->job();
    }

    JobStatus status_of(const Host& host) const
    {
        auto* outcome = job().outcome(host);
        return outcome ? outcome->status : JobStatus::PENDING;
    }

    size_t attempts_of(const Host& host) const
    {
        auto* outcome = job().outcome(host);
        return outcome ? outcome->attempts.size() : 0;
    }
};

bool contains(const std::vector<std::string>& args, const std::string& arg)
{
    return std::find(args.begin(), args.end(), arg) != args.end();
}

void test_table_name()
{
    TableName name;
    TEST(TableName::from_string("enwiki.revision", &name), "db.table");
    TEST(name.db == "enwiki" && name.table == "revision", "parts");
    TEST(name.to_string() == "enwiki.revision", "to_string");

    for (auto bad : {"", "enwiki", ".revision", "enwiki.", "a.b.c", "enwiki.rev ision"})
    {
        TEST(!TableName::from_string(bad, &name), "'" << bad << "' was accepted");
    }
}

void test_order_and_command()
{
    Fixture f;

    TEST(f.job().status() == JobStatus::PENDING, "not pending before run");
    TEST(f.change->run() == JobStatus::SUCCEEDED, "status " << to_string(f.job().status()));

    auto altered = f.executor.hosts_of(TOOL);
    TEST(altered == (std::vector<Host> {replica1(), replica2(), master()}),
         "order " << join(altered, " "));

    // The lag of both replicas is checked after each replica, not after the master.
    auto lag_checked = f.executor.hosts_of(LAG_CHECK);
    TEST(lag_checked == (std::vector<Host> {replica1(), replica2(), replica1(), replica2()}),
         "lag checks " << join(lag_checked, " "));

    for (auto host : {replica1(), replica2(), master()})
    {
        TEST(f.status_of(host) == JobStatus::SUCCEEDED, host << " " << to_string(f.status_of(host)));
        TEST(f.attempts_of(host) == 1, host << " attempts " << f.attempts_of(host));
    }

    TEST(!f.job().failure(), "failure recorded");
    TEST(f.job().finished_at() >= f.job().started_at(), "timestamps");

    auto spec = f.executor.calls().front().spec;
    std::vector<std::string> expected {
        std::string("--alter=") + DDL,
        "--execute",
        "--recursion-method=none",
        "--set-vars=sql_log_bin=0",
        "D=enwiki,t=revision,h=db1002.eqiad.wmnet,P=3306",
    };

    TEST(spec.program() == TOOL, "program " << spec.program());
    TEST(spec.arguments() == expected, "arguments " << join(spec.arguments(), " "));
    TEST(spec.timeout() == seconds(60), "timeout");

    // Running a finished job again does nothing.
    auto n_calls = f.executor.calls().size();
    TEST(f.change->run() == JobStatus::SUCCEEDED, "second run");
    TEST(f.executor.calls().size() == n_calls, "second run ran commands");
}

void test_tool_command_options()
{
    auto config = test::fast_config();
    config.credentials_file = "/root/.my.cnf";
    config.osc.extra_args = {"--chunk-size=1000", "--max-load=Threads_running=100"};
    Fixture f(config);

    auto args = f.change->tool_command(replica2()).arguments();
    TEST(args.size() == 7, join(args, " "));
    TEST(args[4] == "--chunk-size=1000" && args[5] == "--max-load=Threads_running=100", "extra args");
    TEST(args.back() == "D=enwiki,t=revision,h=db1003.eqiad.wmnet,P=3307,F=/root/.my.cnf",
         "dsn " << args.back());
}

void test_transient_retry()
{
    Fixture f;
    int r2_calls = 0;

    f.executor.set_handler([&](const Host& host, const CommandSpec& spec) {
                               if (spec.program() == TOOL && host == replica2() && ++r2_calls == 1)
                               {
                                   return make_result(host, 255, "",
                                                      "DBD::mysql::db do failed: Deadlock found when "
                                                      "trying to get lock; try restarting transaction");
                               }

                               return make_result(host, 0, spec.program() == LAG_CHECK ? "0.5\n" : "");
                           });

    TEST(f.change->run() == JobStatus::SUCCEEDED, "status " << to_string(f.job().status()));
    TEST(f.attempts_of(replica2()) == 2, "attempts " << f.attempts_of(replica2()));
    TEST(f.job().outcome(replica2())->error == ErrorKind::NONE, "error left behind");
    TEST(f.job().outcome(replica2())->attempts[0].exit_code() == 255, "first attempt");
    TEST(f.executor.hosts_of(TOOL).size() == 4, "tool runs");
}

void test_non_retryable()
{
    Fixture f;

    f.executor.set_handler([&](const Host& host, const CommandSpec& spec) {
                               if (spec.program() == TOOL && host == replica2())
                               {
                                   return make_result(host, 255, "",
                                                      "Error altering new table: "
                                                      "Unknown column 'rev_foo' in 'revision'");
                               }

                               return make_result(host, 0, spec.program() == LAG_CHECK ? "0\n" : "");
                           });

    TEST(f.change->run() == JobStatus::FAILED, "status " << to_string(f.job().status()));
    TEST(f.status_of(replica1()) == JobStatus::SUCCEEDED, "replica1");
    TEST(f.status_of(replica2()) == JobStatus::FAILED, "replica2");
    TEST(f.status_of(master()) == JobStatus::PENDING, "master");
    TEST(f.attempts_of(replica2()) == 1, "retried a non-retryable failure");
    TEST(f.executor.hosts_of(TOOL) == (std::vector<Host> {replica1(), replica2()}), "master was altered");

    const auto& failure = f.job().failure();
    TEST(failure, "no failure");

    if (failure)
    {
        TEST(failure->host == replica2(), "failed host " << failure->host);
        TEST(failure->step == Step::COMMAND, "step");
        TEST(failure->kind == ErrorKind::NON_RETRYABLE, "kind " << to_string(failure->kind));
        TEST(failure->message.find("Unknown column 'rev_foo'") != std::string::npos,
             "message " << failure->message);
    }
}

void test_retries_exhausted()
{
    Fixture f;

    f.executor.set_handler([&](const Host& host, const CommandSpec& spec) {
                               if (spec.program() == TOOL)
                               {
                                   return make_result(host, 1, "", "Lock wait timeout exceeded; "
                                                                   "try restarting transaction");
                               }

                               return make_result(host, 0, "0\n");
                           });

    TEST(f.change->run() == JobStatus::FAILED, "status");
    TEST(f.attempts_of(replica1()) == 3, "attempts " << f.attempts_of(replica1()));
    TEST(f.executor.hosts_of(TOOL) == (std::vector<Host>(3, replica1())), "other hosts altered");
    TEST(f.job().failure() && f.job().failure()->kind == ErrorKind::TRANSIENT, "kind");
    TEST(f.job().outcome(replica1())->error == ErrorKind::TRANSIENT, "outcome error");
}

void test_timeout()
{
    auto config = test::fast_config();
    config.osc.max_attempts = 2;
    Fixture f(config);

    f.executor.set_handler([&](const Host& host, const CommandSpec& spec) {
                               if (spec.program() == TOOL && host == replica1())
                               {
                                   return make_result(host, CommandResult::TIMEOUT, "Copying rows",
                                                      CommandResult::TIMEOUT_MARKER);
                               }

                               return make_result(host, 0, "0\n");
                           });

    TEST(f.change->run() == JobStatus::FAILED, "status");
    TEST(f.attempts_of(replica1()) == 2, "a timeout is retried");
    TEST(f.job().failure() && f.job().failure()->kind == ErrorKind::TIMEOUT, "kind");
    TEST(f.job().failure() && f.job().failure()->message.find("timed out") != std::string::npos, "message");
}

void test_classify()
{
    auto config = test::fast_config();
    config.osc.success_codes = {0, 2};
    config.osc.transient_codes = {16};
    Fixture f(config);
    auto& change = *f.change;
    auto h = replica1();

    TEST(change.classify(make_result(h, 0)) == ErrorKind::NONE, "0");
    TEST(change.classify(make_result(h, 2, "", "Deadlock found")) == ErrorKind::NONE, "success code wins");
    TEST(change.classify(make_result(h, CommandResult::TIMEOUT)) == ErrorKind::TIMEOUT, "timeout");
    TEST(change.classify(make_result(h, 16)) == ErrorKind::TRANSIENT, "transient code");
    TEST(change.classify(make_result(h, 1, "", "Deadlock found when trying to get lock")) == ErrorKind::TRANSIENT,
         "pattern in stderr");
    TEST(change.classify(make_result(h, 1, "Lost connection to MySQL server during query")) == ErrorKind::TRANSIENT,
         "pattern in stdout");
    TEST(change.classify(make_result(h, 1, "", "Table 'enwiki.revision' doesn't exist"))
         == ErrorKind::NON_RETRYABLE, "other failure");
    TEST(change.classify(make_result(h, CommandResult::ERROR, "", "No such file or directory"))
         == ErrorKind::NON_RETRYABLE, "not run at all");

    config.osc.transient_patterns = "";
    Fixture no_patterns(config);
    TEST(no_patterns.change->classify(make_result(h, 1, "", "Deadlock found")) == ErrorKind::NON_RETRYABLE,
         "no patterns");

    config.osc.transient_patterns = "Deadlock (found";
    bool thrown = false;

    try
    {
        Fixture bad(config);
    }
    catch (const ConfigError&)
    {
        thrown = true;
    }

    TEST(thrown, "invalid pattern accepted");
}

void test_backoff()
{
    auto config = test::fast_config();
    config.osc.backoff_initial = seconds(10);
    config.osc.backoff_max = seconds(300);
    config.osc.backoff_multiplier = 2.0;
    Fixture f(config);

    TEST(f.change->backoff(1) == seconds(10), "1: " << maxosc::to_string(f.change->backoff(1)));
    TEST(f.change->backoff(2) == seconds(20), "2: " << maxosc::to_string(f.change->backoff(2)));
    TEST(f.change->backoff(3) == seconds(40), "3: " << maxosc::to_string(f.change->backoff(3)));
    TEST(f.change->backoff(6) == seconds(300), "6: " << maxosc::to_string(f.change->backoff(6)));
    TEST(f.change->backoff(100) == seconds(300), "100: " << maxosc::to_string(f.change->backoff(100)));
}

// The lag of replica2 is as answered by the function, everything else succeeds.
void lag_of_replica2(Fixture& f, std::function<CommandResult(const Host&)> lag)
{
    f.executor.set_handler([lag](const Host& host, const CommandSpec& spec) {
                               if (spec.program() == LAG_CHECK && host == replica2())
                               {
                                   return lag(host);
                               }

                               return make_result(host, 0, spec.program() == LAG_CHECK ? "0\n" : "");
                           });
}

void test_lag_gating()
{
    {
        Fixture f;
        lag_of_replica2(f, [](const Host& h) {
                            return make_result(h, 0, "30\n");
                        });

        TEST(f.change->run() == JobStatus::FAILED, "status " << to_string(f.job().status()));
        TEST(f.status_of(replica1()) == JobStatus::SUCCEEDED, "replica1 " << to_string(f.status_of(replica1())));
        TEST(f.status_of(replica2()) == JobStatus::PENDING, "replica2");
        TEST(f.status_of(master()) == JobStatus::PENDING, "master");
        TEST(f.executor.hosts_of(TOOL) == std::vector<Host> {replica1()}, "hosts altered");

        const auto& failure = f.job().failure();
        TEST(failure, "no failure");

        if (failure)
        {
            TEST(failure->host == replica1(), "failure host " << failure->host);
            TEST(failure->step == Step::LAG_WAIT, "step " << to_string(failure->step));
            TEST(failure->kind == ErrorKind::TIMEOUT, "kind " << to_string(failure->kind));
            TEST(failure->message.find("30 seconds behind") != std::string::npos, "message " << failure->message);
        }
    }

    {
        Fixture f;
        lag_of_replica2(f, [](const Host& h) {
                            return make_result(h, 0, "NULL\n");
                        });

        TEST(f.change->run() == JobStatus::FAILED, "not replicating");
        TEST(f.job().failure() && f.job().failure()->kind == ErrorKind::TIMEOUT, "not replicating kind");
    }

    {
        Fixture f;
        lag_of_replica2(f, [](const Host& h) {
                            return make_result(h, 1, "", "Access denied for user 'maxosc'");
                        });

        TEST(f.change->run() == JobStatus::FAILED, "lag check fails");
        TEST(f.job().failure() && f.job().failure()->kind == ErrorKind::TIMEOUT, "failing check kind");
    }

    {
        Fixture f;
        lag_of_replica2(f, [](const Host& h) {
                            return make_result(h, 0, "Seconds_Behind_Master: 3\n");
                        });

        TEST(f.change->run() == JobStatus::FAILED, "unparseable lag");
        TEST(f.job().failure() && f.job().failure()->kind == ErrorKind::LAG_PARSE, "unparseable kind");
        TEST(f.job().failure() && f.job().failure()->step == Step::LAG_WAIT, "unparseable step");
    }

    {
        // Replication catches up while waiting.
        Fixture f;
        auto n = std::make_shared<int>(0);
        lag_of_replica2(f, [n](const Host& h) {
                            return make_result(h, 0, ++*n <= 2 ? "12.5\n" : "1\n");
                        });

        TEST(f.change->run() == JobStatus::SUCCEEDED, "lag recovered " << to_string(f.job().status()));
        TEST(f.executor.hosts_of(TOOL).size() == 3, "all altered");
    }
}

void test_abort()
{
    {
        // Abort while a host is being altered. The host completes, nothing more is started.
        Fixture f;
        auto* change = f.change.get();

        f.executor.set_handler([change](const Host& host, const CommandSpec& spec) {
                                   if (spec.program() == TOOL)
                                   {
                                       change->abort();
                                   }

                                   return make_result(host, 0, spec.program() == LAG_CHECK ? "0\n" : "");
                               });

        TEST(f.change->run() == JobStatus::ABORTED, "status " << to_string(f.job().status()));
        TEST(f.status_of(replica1()) == JobStatus::SUCCEEDED, "replica1");
        TEST(f.status_of(replica2()) == JobStatus::PENDING, "replica2");
        TEST(f.status_of(master()) == JobStatus::PENDING, "master");
        TEST(f.executor.hosts_of(TOOL).size() == 1, "hosts altered after abort");
        TEST(!f.job().failure(), "an abort is not a failure");
    }

    {
        Fixture f;
        f.change->abort();
        TEST(f.change->run() == JobStatus::ABORTED, "abort before run");
        TEST(f.executor.calls().empty(), "commands run");
    }

    {
        // Abort during a long backoff.
        auto config = test::fast_config();
        config.osc.backoff_initial = seconds(30);
        config.osc.backoff_max = seconds(30);
        Fixture f(config);

        f.executor.set_handler([](const Host& host, const CommandSpec&) {
                                   return make_result(host, 1, "", "Deadlock found");
                               });

        std::thread aborter([&f]() {
                                std::this_thread::sleep_for(milliseconds(100));
                                f.change->abort();
                            });

        StopWatch sw;
        auto status = f.change->run();
        aborter.join();

        TEST(status == JobStatus::ABORTED, "status " << to_string(status));
        TEST(sw.split() < seconds(10), "abort took " << maxosc::to_string(sw.split()));
        TEST(f.status_of(replica1()) == JobStatus::ABORTED, "replica1 " << to_string(f.status_of(replica1())));
        TEST(f.attempts_of(replica1()) == 1, "attempts");
    }
}

void test_dry_run()
{
    auto config = test::fast_config();
    config.state_file = "/tmp/maxosc_test_dry_run_" + std::to_string(getpid()) + "_%t.json";
    Fixture f(config, true);

    TEST(f.change->run() == JobStatus::SUCCEEDED, "status");
    TEST(f.job().dry_run(), "dry_run");

    for (const auto& call : f.executor.calls())
    {
        if (call.spec.program() == TOOL)
        {
            TEST(contains(call.spec.arguments(), "--dry-run"), "no --dry-run");
            TEST(!contains(call.spec.arguments(), "--execute"), "--execute in a dry run");
        }
    }

    TEST(access(f.change->state_file().c_str(), F_OK) != 0, "state file written in a dry run");
}

void test_replicated()
{
    auto config = test::fast_config();
    config.osc.mode = OscConfig::Mode::REPLICATED;

    {
        Fixture f(config);

        TEST(f.job().outcomes().size() == 1, "outcomes " << f.job().outcomes().size());
        TEST(f.change->run() == JobStatus::SUCCEEDED, "status");
        TEST(f.executor.hosts_of(TOOL) == std::vector<Host> {master()}, "only the master is altered");
        TEST(f.executor.hosts_of(LAG_CHECK).size() == 2, "lag not checked after the master");

        auto args = f.executor.calls().front().spec.arguments();
        TEST(!contains(args, "--recursion-method=none") && !contains(args, "--set-vars=sql_log_bin=0"),
             "binary logging disabled: " << join(args, " "));
        TEST(args.back() == "D=enwiki,t=revision,h=db1001.eqiad.wmnet,P=3306", "dsn " << args.back());
    }

    {
        Fixture f(config);
        lag_of_replica2(f, [](const Host& h) {
                            return make_result(h, 0, "600\n");
                        });

        TEST(f.change->run() == JobStatus::FAILED, "replicated lag");
        TEST(f.status_of(master()) == JobStatus::SUCCEEDED, "master");
        TEST(f.job().failure() && f.job().failure()->host == master(), "failure host");
        TEST(f.job().failure() && f.job().failure()->step == Step::LAG_WAIT, "failure step");
    }
}

void test_end_to_end()
{
    // A master declared before its only replica.
    auto config = test::fast_config();
    config.servers = {master(), replica1()};
    Fixture f(config);

    TEST(f.change->run() == JobStatus::SUCCEEDED, "status");
    TEST(f.executor.hosts_of(TOOL) == (std::vector<Host> {replica1(), master()}), "order");
    TEST(f.executor.hosts_of(LAG_CHECK) == std::vector<Host> {replica1()}, "lag checks");

    Report report(f.job());
    TEST(report.exit_code() == 0, "exit code");
    TEST(report.hosts().size() == 2, "report hosts");
}

void test_resume()
{
    auto config = test::fast_config();
    config.state_file = "/tmp/maxosc_test_resume_" + std::to_string(getpid()) + "_%t.json";
    auto path = config.state_file_for(TABLE.to_string());
    unlink(path.c_str());

    {
        Fixture f(config);
        TEST(!f.change->resume(), "resumed without a state file");

        f.executor.set_handler([](const Host& host, const CommandSpec& spec) {
                                   if (spec.program() == TOOL && host == master())
                                   {
                                       return make_result(host, 255, "", "Cannot connect to MySQL");
                                   }

                                   return make_result(host, 0, spec.program() == LAG_CHECK ? "0\n" : "");
                               });

        TEST(f.change->run() == JobStatus::FAILED, "first run");
    }

    auto state = jobstate::load(path);
    TEST(state, "no state file");

    if (state)
    {
        TEST(state->status == JobStatus::FAILED, "saved status " << to_string(state->status));
        TEST(state->ddl == DDL, "saved ddl");
        TEST(state->hosts.size() == 3, "saved hosts");
    }

    {
        Fixture f(config);
        TEST(f.change->resume(), "not resumed");
        TEST(f.job().outcome(replica1())->resumed && f.job().outcome(replica2())->resumed, "replicas");
        TEST(!f.job().outcome(master())->resumed, "master");

        TEST(f.change->run() == JobStatus::SUCCEEDED, "second run " << to_string(f.job().status()));
        TEST(f.executor.hosts_of(TOOL) == std::vector<Host> {master()}, "hosts altered again");
        TEST(!f.executor.calls().empty() && f.executor.calls().front().spec.program() == LAG_CHECK,
             "the master was altered before the lag of the replicas was checked");

        Report report(f.job());
        TEST(report.hosts()[0].resumed && report.hosts()[0].attempts == 0, "report of a resumed host");
    }

    {
        auto other = config;
        other.osc.mode = OscConfig::Mode::REPLICATED;
        test::ScriptedExecutor executor;
        auto topology = Topology::from_config(other, executor);
        SchemaChange change(other, executor, *topology, TABLE, "DROP COLUMN rev_actor", false);
        bool thrown = false;

        try
        {
            change.resume();
        }
        catch (const ConfigError&)
        {
            thrown = true;
        }

        TEST(thrown, "resumed a different change");
    }

    {
        auto no_state = test::fast_config();
        Fixture f(no_state);
        bool thrown = false;

        try
        {
            f.change->resume();
        }
        catch (const ConfigError&)
        {
            thrown = true;
        }

        TEST(thrown, "resumed without a configured state file");
    }

    unlink(path.c_str());
}

// A job that stopped in a lag wait must wait again before altering the next host.
void test_resume_after_lag_wait()
{
    auto config = test::fast_config();
    config.state_file = "/tmp/maxosc_test_resume_lag_" + std::to_string(getpid()) + "_%t.json";
    auto path = config.state_file_for(TABLE.to_string());
    unlink(path.c_str());

    {
        Fixture f(config);
        lag_of_replica2(f, [](const Host& h) {
                            return make_result(h, 0, "30\n");
                        });

        TEST(f.change->run() == JobStatus::FAILED, "first run " << to_string(f.job().status()));
        TEST(f.executor.hosts_of(TOOL) == std::vector<Host> {replica1()}, "first run altered");
        TEST(f.job().failure() && f.job().failure()->step == Step::LAG_WAIT, "first run failure step");
    }

    {
        Fixture f(config);
        lag_of_replica2(f, [](const Host& h) {
                            return make_result(h, 0, "30\n");
                        });

        TEST(f.change->resume(), "not resumed");
        TEST(f.change->run() == JobStatus::FAILED, "lagging run " << to_string(f.job().status()));
        TEST(f.executor.hosts_of(TOOL).empty(), "a host was altered while replication was behind");
        TEST(f.job().failure() && f.job().failure()->host == replica1(), "failure host");
        TEST(f.job().failure() && f.job().failure()->step == Step::LAG_WAIT, "failure step");
        TEST(f.status_of(replica1()) == JobStatus::SUCCEEDED, "resumed host " << to_string(f.status_of(replica1())));
    }

    {
        Fixture f(config);
        lag_of_replica2(f, [](const Host& h) {
                            return make_result(h, 0, "0\n");
                        });

        TEST(f.change->resume(), "not resumed");
        TEST(f.change->run() == JobStatus::SUCCEEDED, "caught up run " << to_string(f.job().status()));
        TEST(!f.executor.calls().empty() && f.executor.calls().front().spec.program() == LAG_CHECK,
             "the first command was not a lag check");
        TEST(f.executor.hosts_of(TOOL) == (std::vector<Host> {replica2(), master()}), "hosts altered");
    }

    unlink(path.c_str());

    // In replicated mode a resumed master still waits for the replicas.
    config.osc.mode = OscConfig::Mode::REPLICATED;

    {
        Fixture f(config);
        lag_of_replica2(f, [](const Host& h) {
                            return make_result(h, 0, "600\n");
                        });

        TEST(f.change->run() == JobStatus::FAILED, "replicated first run");
    }

    {
        Fixture f(config);

        TEST(f.change->resume(), "replicated not resumed");
        TEST(f.job().outcome(master())->resumed, "master not resumed");
        TEST(f.change->run() == JobStatus::SUCCEEDED, "replicated run " << to_string(f.job().status()));
        TEST(f.executor.hosts_of(TOOL).empty(), "the master was altered again");
        TEST(f.executor.hosts_of(LAG_CHECK).size() == 2, "lag checks " << f.executor.hosts_of(LAG_CHECK).size());
    }

    unlink(path.c_str());
}
}

int main()
{
    maxosc::Log log;

    test_table_name();
    test_order_and_command();
    test_tool_command_options();
    test_transient_retry();
    test_non_retryable();
    test_retries_exhausted();
    test_timeout();
    test_classify();
    test_backoff();
    test_lag_gating();
    test_abort();
    test_dry_run();
    test_replicated();
    test_end_to_end();
    test_resume();
    test_resume_after_lag_wait();

    return maxosc::test::result();
}
