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

#include <maxosc/report.hh>

#include <jansson.h>

#include <maxosc/log.hh>

#include "test_utils.hh"

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
const char DDL[] = "ADD INDEX rev_timestamp (rev_timestamp)";

void test_exit_codes()
{
    TEST(exit_code(JobStatus::SUCCEEDED) == 0, "succeeded");
    TEST(exit_code(JobStatus::FAILED) == 1, "failed");
    TEST(exit_code(JobStatus::ABORTED) == 2, "aborted");
}

void test_incomplete()
{
    auto config = test::fast_config();
    test::ScriptedExecutor executor;
    auto topology = Topology::from_config(config, executor);
    SchemaChange change(config, executor, *topology, TABLE, DDL, false);
    bool thrown = false;

    try
    {
        Report report(change.job());
    }
    catch (const IncompleteJobError& e)
    {
        thrown = std::string(e.what()).find("pending") != std::string::npos;
        std::cout << "Expected error: " << e.what() << std::endl;
    }

    TEST(thrown, "a pending job was reported");
}

void test_failed()
{
    auto config = test::fast_config();
    test::ScriptedExecutor executor;
    auto topology = Topology::from_config(config, executor);
    SchemaChange change(config, executor, *topology, TABLE, DDL, false);

    executor.set_handler([](const Host& host, const CommandSpec& spec) {
                             if (spec.program() == TOOL && host == replica2())
                             {
                                 return make_result(host, 255, "", "Duplicate key name 'rev_timestamp'");
                             }

                             return make_result(host, 0, spec.program() == LAG_CHECK ? "0\n" : "");
                         });

    TEST(change.run() == JobStatus::FAILED, "status");

    Report report(change.job());
    TEST(report.status() == JobStatus::FAILED && report.exit_code() == 1, "report status");
    TEST(report.hosts().size() == 3, "hosts");

    if (report.hosts().size() == 3)
    {
        const auto& r1 = report.hosts()[0];
        const auto& r2 = report.hosts()[1];
        const auto& m = report.hosts()[2];

        TEST(r1.host == replica1() && r1.status == JobStatus::SUCCEEDED && r1.last_exit_code == 0, "replica1");
        TEST(r2.host == replica2() && r2.status == JobStatus::FAILED && r2.last_exit_code == 255, "replica2");
        TEST(r2.message.find("Duplicate key name") != std::string::npos, "message " << r2.message);
        TEST(m.host == master() && m.status == JobStatus::PENDING && !m.last_exit_code && m.attempts == 0,
             "master");
    }

    // The report is a snapshot, producing it again gives the same result.
    TEST(report.to_json() == report.to_json(), "json differs");
    TEST(report.to_string() == report.to_string(), "text differs");
    TEST(Report(change.job()).to_string() == report.to_string(), "second report differs");

    auto json = report.to_json();
    std::cout << json.to_string() << std::endl;

    TEST(json.get_string("table") == "enwiki.revision", "table");
    TEST(json.get_string("ddl") == DDL, "ddl");
    TEST(json.get_string("mode") == "per_host", "mode");
    TEST(json.get_string("status") == "failed", "status");

    bool dry_run = true;
    TEST(json.try_get_bool("dry_run", &dry_run) && !dry_run, "dry_run");

    auto failure = json.get_object("failure");
    TEST(failure.get_string("host") == "db1003:3307", "failure host " << failure.get_string("host"));
    TEST(failure.get_string("step") == "command", "failure step");
    TEST(failure.get_string("kind") == "non_retryable", "failure kind " << failure.get_string("kind"));

    auto hosts = json.get_array_elems("hosts");
    TEST(hosts.size() == 3, "json hosts");

    if (hosts.size() == 3)
    {
        TEST(hosts[0].get_string("host") == "db1002" && hosts[0].get_string("role") == "replica", "host 0");
        TEST(hosts[1].get_int("exit_code") == 255, "host 1 exit code");
        TEST(hosts[2].get_string("role") == "master" && hosts[2].get_string("status") == "pending", "host 2");
        TEST(json_is_null(json_object_get(hosts[2].get_json(), "exit_code")), "exit code of a pending host");
        TEST(!hosts[0].contains("message") && hosts[1].contains("message"), "messages");
    }

    auto text = report.to_string();
    std::cout << text << std::endl;

    TEST(text.find("Schema change of enwiki.revision: failed") == 0, "heading");
    TEST(text.find("db1003:3307 during command (non_retryable)") != std::string::npos, "failure line");
    TEST(text.find("*") == std::string::npos, "resumed marker without resumed hosts");
}

void test_succeeded()
{
    auto config = test::fast_config();
    test::ScriptedExecutor executor;
    auto topology = Topology::from_config(config, executor);
    SchemaChange change(config, executor, *topology, TABLE, DDL, true);

    TEST(change.run() == JobStatus::SUCCEEDED, "status");

    Report report(change.job());
    auto json = report.to_json();

    TEST(report.exit_code() == 0, "exit code");
    TEST(json_is_null(json_object_get(json.get_json(), "failure")), "failure of a successful job");

    bool dry_run = false;
    TEST(json.try_get_bool("dry_run", &dry_run) && dry_run, "dry_run");
    TEST(report.to_string().find("succeeded (dry run)") != std::string::npos, "dry run heading");
}
}

int main()
{
    maxosc::Log log;

    test_exit_codes();
    test_incomplete();
    test_failed();
    test_succeeded();

    return maxosc::test::result();
}
