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

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <maxosc/command.hh>
#include <maxosc/config.hh>
#include <maxosc/errors.hh>
#include <maxosc/executor.hh>
#include <maxosc/host.hh>
#include <maxosc/regex.hh>
#include <maxosc/stopwatch.hh>
#include <maxosc/topology.hh>

namespace maxosc
{

struct TableName
{
    std::string db;
    std::string table;

    /**
     * Parse a name of the form db.table.
     */
    static bool from_string(const std::string& str, TableName* name);

    std::string to_string() const;
};

enum class JobStatus
{
    PENDING,
    RUNNING,
    SUCCEEDED,
    FAILED,
    ABORTED,
};

const char* to_string(JobStatus status);
bool        status_from_string(const std::string& str, JobStatus* status);
bool        is_terminal(JobStatus status);

// The part of the work on a host that failed.
enum class Step
{
    COMMAND,
    LAG_WAIT,
};

const char* to_string(Step step);
bool        step_from_string(const std::string& str, Step* step);

struct HostOutcome
{
    Host                       host;
    JobStatus                  status {JobStatus::PENDING};
    std::vector<CommandResult> attempts;    // Every attempt, oldest first
    ErrorKind                  error {ErrorKind::NONE};
    std::string                message;
    bool                       resumed {false};     // Succeeded in an earlier run

    explicit HostOutcome(const Host& h)
        : host(h)
    {
    }

    Duration duration() const;
};

struct Failure
{
    Host        host;
    Step        step;
    ErrorKind   kind;
    std::string message;
};

/**
 * One schema change over a topology. The outcome of each host is kept so that it is
 * always visible which hosts succeeded, which failed and which were never attempted.
 *
 * Only the SchemaChange that created the job modifies it.
 */
class SchemaChangeJob
{
public:
    SchemaChangeJob(const TableName& table,
                    const std::string& ddl,
                    OscConfig::Mode mode,
                    bool dry_run,
                    const std::vector<Host>& order);

    const TableName& table() const
    {
        return m_table;
    }

    const std::string& ddl() const
    {
        return m_ddl;
    }

    OscConfig::Mode mode() const
    {
        return m_mode;
    }

    bool dry_run() const
    {
        return m_dry_run;
    }

    JobStatus status() const
    {
        return m_status;
    }

    bool is_terminal() const
    {
        return maxosc::is_terminal(m_status);
    }

    /**
     * The per-host outcomes in execution order.
     */
    const std::vector<HostOutcome>& outcomes() const
    {
        return m_outcomes;
    }

    /**
     * @return The outcome of a host or nullptr if the host is not part of the job.
     */
    const HostOutcome* outcome(const Host& host) const;

    const std::optional<Failure>& failure() const
    {
        return m_failure;
    }

    wall_time::TimePoint started_at() const
    {
        return m_started_at;
    }

    wall_time::TimePoint finished_at() const
    {
        return m_finished_at;
    }

    Duration duration() const
    {
        return m_duration;
    }

private:
    friend class SchemaChange;

    HostOutcome* outcome(const Host& host);

    void start();
    void finish(JobStatus status);

    TableName                m_table;
    std::string              m_ddl;
    OscConfig::Mode          m_mode;
    bool                     m_dry_run;
    JobStatus                m_status {JobStatus::PENDING};
    std::vector<HostOutcome> m_outcomes;
    std::optional<Failure>   m_failure;
    wall_time::TimePoint     m_started_at;
    wall_time::TimePoint     m_finished_at;
    Duration                 m_duration {0};
    StopWatch                m_timer;
};

/**
 * Runs the schema change tool over a topology one host at a time.
 *
 * In per_host mode the replicas are altered first in declaration order and the master
 * last. In replicated mode only the master is altered. After each host, the lag of all
 * replicas must come down before the work continues.
 *
 * An abort may be requested from any thread. It is honoured between hosts, during
 * retry back-off and during lag waits, never while the tool is running.
 */
class SchemaChange
{
public:
    SchemaChange(const SchemaChange&) = delete;
    SchemaChange& operator=(const SchemaChange&) = delete;

    /**
     * @param config    The configuration. The osc and lag settings, the credentials file
     *                  and the state file are used.
     * @param executor  Runs the tool. Must outlive the object.
     * @param topology  The hosts. Must outlive the object.
     * @param table     The table to alter.
     * @param ddl       The alteration, e.g. "ADD COLUMN x INT".
     * @param dry_run   Whether the tool should only check that the change could be made.
     */
    SchemaChange(const Config& config,
                 Executor& executor,
                 const Topology& topology,
                 const TableName& table,
                 const std::string& ddl,
                 bool dry_run);

    const SchemaChangeJob& job() const
    {
        return m_job;
    }

    /**
     * Continue from the state file of an earlier run. Hosts that succeeded then are not
     * run again. Must be called before run().
     *
     * @return True, if a state file was found and applied.
     * @throw ConfigError  If the state file is for another change or cannot be read.
     */
    bool resume();

    /**
     * Run the job until it reaches a terminal state. Failures are recorded in the job,
     * only misuse of the executor is thrown.
     *
     * @return The final status.
     */
    JobStatus run();

    /**
     * Request the job to be aborted at the next safe point. Thread safe.
     */
    void abort();

    bool abort_requested() const
    {
        return m_abort.load(std::memory_order_relaxed);
    }

    /**
     * The command that alters the table on a host.
     */
    CommandSpec tool_command(const Host& host) const;

    /**
     * Classify the result of one tool run. The success codes are checked first, then
     * whether it timed out, then the transient exit codes and finally the transient
     * output patterns. Everything else is non-retryable.
     */
    ErrorKind classify(const CommandResult& result) const;

    /**
     * How long to wait before the next attempt after the given failed attempt (1-based).
     */
    Duration backoff(int attempt) const;

    const std::string& state_file() const
    {
        return m_state_file;
    }

private:
    bool      run_host(HostOutcome& outcome);
    void      check_result(const CommandResult& result) const;
    bool      wait_for_lag(const Host& after);
    ErrorKind poll_lag(std::string* problem);
    bool      sleep(Duration duration);
    void      fail(const Host& host, Step step, ErrorKind kind, const std::string& message);
    void      finish(JobStatus status);
    void      save_state() const;

    OscConfig       m_osc;
    LagConfig       m_lag;
    std::string     m_credentials_file;
    std::string     m_state_file;
    Executor&       m_executor;
    const Topology& m_topology;
    Regex           m_transient;
    SchemaChangeJob m_job;

    std::atomic<bool>       m_abort {false};
    std::mutex              m_lock;
    std::condition_variable m_cond;
};
}
