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

#define MXO_MODULE_NAME "schemachange"

#include <maxosc/schemachange.hh>

#include <algorithm>
#include <cmath>

#include <maxosc/assert.hh>
#include <maxosc/jobstate.hh>
#include <maxosc/log.hh>
#include <maxosc/string.hh>

using std::string;

namespace
{

std::vector<maxosc::Host> execution_order(const maxosc::Topology& topology, maxosc::OscConfig::Mode mode)
{
    std::vector<maxosc::Host> rval;

    if (mode == maxosc::OscConfig::Mode::PER_HOST)
    {
        rval = topology.hosts();
    }
    else
    {
        rval.push_back(topology.master());
    }

    return rval;
}

// The last non-empty line of the output is usually the one that says what went wrong.
string last_line(const string& output)
{
    auto lines = maxosc::split_trimmed(output, '\n');
    return lines.empty() ? string() : lines.back();
}

string describe(const maxosc::CommandResult& result)
{
    string rval;

    if (result.timed_out())
    {
        rval = "timed out after " + maxosc::to_string(result.duration());
    }
    else
    {
        rval = MAKE_STR("exit code " << result.exit_code());
        string line = last_line(result.err());

        if (line.empty())
        {
            line = last_line(result.out());
        }

        if (!line.empty())
        {
            rval += ": " + line;
        }
    }

    return rval;
}
}

namespace maxosc
{

//
// TableName
//
// static
bool TableName::from_string(const std::string& str, TableName* name)
{
    auto pos = str.find('.');
    bool rval = false;

    if (pos != string::npos && pos > 0 && pos < str.length() - 1)
    {
        TableName tmp {str.substr(0, pos), str.substr(pos + 1)};

        if (tmp.table.find('.') == string::npos
            && tmp.db.find_first_of(" \t") == string::npos
            && tmp.table.find_first_of(" \t") == string::npos)
        {
            *name = std::move(tmp);
            rval = true;
        }
    }

    return rval;
}

std::string TableName::to_string() const
{
    return db + "." + table;
}

//
// Enumerations
//
const char* to_string(JobStatus status)
{
    switch (status)
    {
    case JobStatus::PENDING:
        return "pending";

    case JobStatus::RUNNING:
        return "running";

    case JobStatus::SUCCEEDED:
        return "succeeded";

    case JobStatus::FAILED:
        return "failed";

    case JobStatus::ABORTED:
        return "aborted";
    }

    mxo_assert(!true);
    return "unknown";
}

bool status_from_string(const std::string& str, JobStatus* status)
{
    for (auto s : {JobStatus::PENDING, JobStatus::RUNNING, JobStatus::SUCCEEDED,
                   JobStatus::FAILED, JobStatus::ABORTED})
    {
        if (str == to_string(s))
        {
            *status = s;
            return true;
        }
    }

    return false;
}

bool is_terminal(JobStatus status)
{
    return status == JobStatus::SUCCEEDED || status == JobStatus::FAILED || status == JobStatus::ABORTED;
}

const char* to_string(Step step)
{
    return step == Step::COMMAND ? "command" : "lag_wait";
}

bool step_from_string(const std::string& str, Step* step)
{
    bool rval = true;

    if (str == "command")
    {
        *step = Step::COMMAND;
    }
    else if (str == "lag_wait")
    {
        *step = Step::LAG_WAIT;
    }
    else
    {
        rval = false;
    }

    return rval;
}

Duration HostOutcome::duration() const
{
    Duration rval {0};

    for (const auto& attempt : attempts)
    {
        rval += attempt.duration();
    }

    return rval;
}

//
// SchemaChangeJob
//
SchemaChangeJob::SchemaChangeJob(const TableName& table,
                                 const std::string& ddl,
                                 OscConfig::Mode mode,
                                 bool dry_run,
                                 const std::vector<Host>& order)
    : m_table(table)
    , m_ddl(ddl)
    , m_mode(mode)
    , m_dry_run(dry_run)
{
    for (const auto& host : order)
    {
        m_outcomes.emplace_back(host);
    }
}

const HostOutcome* SchemaChangeJob::outcome(const Host& host) const
{
    auto it = std::find_if(m_outcomes.begin(), m_outcomes.end(), [&](const HostOutcome& o) {
                               return o.host == host;
                           });

    return it != m_outcomes.end() ? &*it : nullptr;
}

HostOutcome* SchemaChangeJob::outcome(const Host& host)
{
    return const_cast<HostOutcome*>(static_cast<const SchemaChangeJob&>(*this).outcome(host));
}

void SchemaChangeJob::start()
{
    mxo_assert(m_status == JobStatus::PENDING);
    m_status = JobStatus::RUNNING;
    m_started_at = wall_time::Clock::now();
    m_timer.restart();
}

void SchemaChangeJob::finish(JobStatus status)
{
    mxo_assert(m_status == JobStatus::RUNNING && maxosc::is_terminal(status));
    m_status = status;
    m_finished_at = wall_time::Clock::now();
    m_duration = m_timer.split();
}

//
// SchemaChange
//
SchemaChange::SchemaChange(const Config& config,
                           Executor& executor,
                           const Topology& topology,
                           const TableName& table,
                           const std::string& ddl,
                           bool dry_run)
    : m_osc(config.osc)
    , m_lag(config.lag)
    , m_credentials_file(config.credentials_file)
    , m_state_file(config.state_file_for(table.to_string()))
    , m_executor(executor)
    , m_topology(topology)
    , m_transient(config.osc.transient_patterns)
    , m_job(table, ddl, config.osc.mode, dry_run, execution_order(topology, config.osc.mode))
{
    if (!m_transient)
    {
        MXO_THROW(ConfigError, "Invalid transient pattern '" << m_transient.pattern() << "': "
                                                              << m_transient.error());
    }
}

bool SchemaChange::resume()
{
    mxo_assert(m_job.status() == JobStatus::PENDING);

    if (m_state_file.empty())
    {
        MXO_THROW(ConfigError, "Cannot resume, no state file has been configured.");
    }

    auto state = jobstate::load(m_state_file);

    if (!state)
    {
        MXO_NOTICE("No state file '%s', starting from the beginning.", m_state_file.c_str());
        return false;
    }

    if (state->table.to_string() != m_job.table().to_string()
        || state->ddl != m_job.ddl()
        || state->mode != m_job.mode())
    {
        MXO_THROW(ConfigError, "The state file '" << m_state_file << "' is for the change '"
                                                  << state->ddl << "' of " << state->table.to_string()
                                                  << " in mode " << to_string(state->mode)
                                                  << ", not for '" << m_job.ddl() << "' of "
                                                  << m_job.table().to_string() << " in mode "
                                                  << to_string(m_job.mode()) << ".");
    }

    for (const auto& hs : state->hosts)
    {
        auto* outcome = m_job.outcome(hs.host);

        if (outcome && hs.status == JobStatus::SUCCEEDED)
        {
            outcome->status = JobStatus::SUCCEEDED;
            outcome->resumed = true;
            MXO_NOTICE("%s was altered by an earlier run, it will not be altered again.",
                       outcome->host.name().c_str());
        }
    }

    return true;
}

JobStatus SchemaChange::run()
{
    if (m_job.is_terminal())
    {
        return m_job.status();
    }

    LogScope scope(m_job.table().to_string());
    MXO_NOTICE("%s schema change '%s' on %s in %s mode.",
               m_job.dry_run() ? "Dry run of" : "Starting", m_job.ddl().c_str(),
               m_job.table().to_string().c_str(), to_string(m_job.mode()));

    m_job.start();
    save_state();

    auto& outcomes = m_job.m_outcomes;
    // A host altered by an earlier run whose lag wait has not been done in this one.
    const Host* pending_gate = nullptr;

    for (size_t i = 0; i < outcomes.size() && !m_job.is_terminal(); ++i)
    {
        auto& outcome = outcomes[i];
        bool last = i == outcomes.size() - 1;
        bool gated = !last || m_job.mode() == OscConfig::Mode::REPLICATED;

        if (outcome.resumed)
        {
            pending_gate = gated ? &outcome.host : nullptr;
            continue;
        }

        if (abort_requested())
        {
            finish(JobStatus::ABORTED);
        }
        else if (pending_gate && !wait_for_lag(*pending_gate))
        {
            break;
        }
        else
        {
            pending_gate = nullptr;

            if (run_host(outcome) && gated)
            {
                wait_for_lag(outcome.host);
            }
        }
    }

    if (pending_gate && !m_job.is_terminal())
    {
        wait_for_lag(*pending_gate);
    }

    if (!m_job.is_terminal())
    {
        finish(JobStatus::SUCCEEDED);
    }

    return m_job.status();
}

bool SchemaChange::run_host(HostOutcome& outcome)
{
    const Host& host = outcome.host;
    LogScope scope(host.name());

    outcome.status = JobStatus::RUNNING;
    save_state();

    for (int attempt = 1;; ++attempt)
    {
        auto spec = tool_command(host);
        MXO_NOTICE("Attempt %d of %d: %s", attempt, m_osc.max_attempts, spec.to_string().c_str());

        auto result = m_executor.execute_one(host, spec);
        outcome.attempts.push_back(result);

        ErrorKind kind = ErrorKind::NONE;

        try
        {
            check_result(result);
        }
        catch (const TimeoutError& e)
        {
            kind = ErrorKind::TIMEOUT;
            outcome.message = e.what();
        }
        catch (const TransientCommandFailure& e)
        {
            kind = ErrorKind::TRANSIENT;
            outcome.message = e.what();
        }
        catch (const NonRetryableCommandFailure& e)
        {
            kind = ErrorKind::NON_RETRYABLE;
            outcome.message = e.what();
        }

        outcome.error = kind;

        if (kind == ErrorKind::NONE)
        {
            MXO_SNOTICE("Altered " << m_job.table().to_string() << " in " << result.duration() << ".");
            outcome.status = JobStatus::SUCCEEDED;
            outcome.message.clear();
            save_state();
            return true;
        }

        if (!is_retryable(kind) || attempt >= m_osc.max_attempts)
        {
            MXO_ERROR("Giving up after attempt %d: %s (%s).",
                      attempt, outcome.message.c_str(), to_string(kind));
            outcome.status = JobStatus::FAILED;
            fail(host, Step::COMMAND, kind, outcome.message);
            return false;
        }

        auto delay = backoff(attempt);
        MXO_SWARNING("Attempt " << attempt << " failed: " << outcome.message << " ("
                                << to_string(kind) << "). Retrying in " << delay << ".");

        if (!sleep(delay))
        {
            outcome.status = JobStatus::ABORTED;
            finish(JobStatus::ABORTED);
            return false;
        }
    }
}

void SchemaChange::check_result(const CommandResult& result) const
{
    switch (classify(result))
    {
    case ErrorKind::NONE:
        break;

    case ErrorKind::TIMEOUT:
        MXO_THROW_CODE(TimeoutError, result.exit_code(), describe(result));
        break;

    case ErrorKind::TRANSIENT:
        MXO_THROW_CODE(TransientCommandFailure, result.exit_code(), describe(result));
        break;

    default:
        MXO_THROW_CODE(NonRetryableCommandFailure, result.exit_code(), describe(result));
        break;
    }
}

bool SchemaChange::wait_for_lag(const Host& after)
{
    for (int attempt = 1;; ++attempt)
    {
        string problem;
        auto kind = poll_lag(&problem);

        if (kind == ErrorKind::NONE)
        {
            return true;
        }
        else if (kind == ErrorKind::ABORTED)
        {
            finish(JobStatus::ABORTED);
            return false;
        }
        else if (attempt >= m_osc.max_attempts)
        {
            MXO_ERROR("Replication did not catch up after %s was altered: %s",
                      after.name().c_str(), problem.c_str());
            fail(after, Step::LAG_WAIT, kind, problem);
            return false;
        }

        auto delay = backoff(attempt);
        MXO_SWARNING("Waiting for replication to catch up failed: " << problem
                                                                    << ". Waiting again in " << delay << ".");

        if (!sleep(delay))
        {
            finish(JobStatus::ABORTED);
            return false;
        }
    }
}

ErrorKind SchemaChange::poll_lag(std::string* problem)
{
    double max_lag = to_secs(m_lag.max_lag);
    StopWatch timer;

    MXO_SINFO("Waiting at most " << m_lag.wait_budget << " for lag to drop to " << m_lag.max_lag << ".");

    while (true)
    {
        if (abort_requested())
        {
            return ErrorKind::ABORTED;
        }

        ErrorKind kind = ErrorKind::NONE;

        for (const auto& replica : m_topology.replicas())
        {
            try
            {
                auto sample = m_topology.lag(replica);

                if (!sample.lag)
                {
                    *problem = replica.name() + " is not replicating or its state is unknown";
                    kind = ErrorKind::TIMEOUT;
                }
                else if (*sample.lag > max_lag)
                {
                    *problem = MAKE_STR(replica.name() << " is " << *sample.lag << " seconds behind");
                    kind = ErrorKind::TIMEOUT;
                }
            }
            catch (const LagParseError& e)
            {
                *problem = replica.name() + ": " + e.what();
                kind = ErrorKind::LAG_PARSE;
            }

            if (kind != ErrorKind::NONE)
            {
                break;
            }
        }

        if (kind == ErrorKind::NONE)
        {
            MXO_SINFO("All replicas are within " << m_lag.max_lag << " of the master.");
            return kind;
        }

        if (timer.split() + m_lag.poll_interval > m_lag.wait_budget)
        {
            *problem += MAKE_STR(" after waiting " << timer.split());
            return kind;
        }

        MXO_INFO("%s, checking again.", problem->c_str());

        if (!sleep(m_lag.poll_interval))
        {
            return ErrorKind::ABORTED;
        }
    }
}

bool SchemaChange::sleep(Duration duration)
{
    std::unique_lock<std::mutex> guard(m_lock);
    return !m_cond.wait_for(guard, duration, [this]() {
                                return abort_requested();
                            });
}

void SchemaChange::abort()
{
    if (!m_abort.exchange(true))
    {
        MXO_NOTICE("Abort requested, stopping at the next safe point.");
    }

    std::lock_guard<std::mutex> guard(m_lock);
    m_cond.notify_all();
}

void SchemaChange::fail(const Host& host, Step step, ErrorKind kind, const std::string& message)
{
    m_job.m_failure = Failure {host, step, kind, message};
    finish(JobStatus::FAILED);
}

void SchemaChange::finish(JobStatus status)
{
    m_job.finish(status);

    if (status == JobStatus::SUCCEEDED)
    {
        MXO_SNOTICE("Schema change " << to_string(status) << " in " << m_job.duration() << ".");
    }
    else
    {
        MXO_SWARNING("Schema change " << to_string(status) << " after " << m_job.duration() << ".");
    }

    save_state();
}

void SchemaChange::save_state() const
{
    if (!m_state_file.empty() && !m_job.dry_run() && !jobstate::save(m_job, m_state_file))
    {
        MXO_WARNING("The job cannot be resumed from '%s' until it has been written.", m_state_file.c_str());
    }
}

CommandSpec SchemaChange::tool_command(const Host& host) const
{
    std::vector<string> args;

    args.push_back("--alter=" + m_job.ddl());
    args.push_back(m_job.dry_run() ? "--dry-run" : "--execute");

    if (m_job.mode() == OscConfig::Mode::PER_HOST)
    {
        args.push_back("--recursion-method=none");
        args.push_back("--set-vars=sql_log_bin=0");
    }

    args.insert(args.end(), m_osc.extra_args.begin(), m_osc.extra_args.end());

    string dsn = MAKE_STR("D=" << m_job.table().db << ",t=" << m_job.table().table
                               << ",h=" << host.address() << ",P=" << host.port());

    if (!m_credentials_file.empty())
    {
        dsn += ",F=" + m_credentials_file;
    }

    args.push_back(dsn);

    return CommandSpec(m_osc.tool, args, m_osc.command_timeout, m_osc.success_codes);
}

ErrorKind SchemaChange::classify(const CommandResult& result) const
{
    ErrorKind rval = ErrorKind::NON_RETRYABLE;

    if (m_osc.success_codes.count(result.exit_code()))
    {
        rval = ErrorKind::NONE;
    }
    else if (result.timed_out())
    {
        rval = ErrorKind::TIMEOUT;
    }
    else if (m_osc.transient_codes.count(result.exit_code()))
    {
        rval = ErrorKind::TRANSIENT;
    }
    else if (m_transient.match(result.err()) || m_transient.match(result.out()))
    {
        rval = ErrorKind::TRANSIENT;
    }

    return rval;
}

Duration SchemaChange::backoff(int attempt) const
{
    double secs = to_secs(m_osc.backoff_initial) * std::pow(m_osc.backoff_multiplier, attempt - 1);
    return std::min(from_secs(std::min(secs, to_secs(m_osc.backoff_max))), m_osc.backoff_max);
}
}
