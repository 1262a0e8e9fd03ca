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

#define MXO_MODULE_NAME "topology"

#include <maxosc/topology.hh>

#include <algorithm>
#include <mutex>
#include <set>

#include <maxosc/config.hh>
#include <maxosc/errors.hh>
#include <maxosc/log.hh>
#include <maxosc/process.hh>
#include <maxosc/string.hh>

namespace maxosc
{

Topology::Topology(const std::vector<Host>& hosts, Executor& executor, const LagCheckConfig& lag_check)
    : m_executor(executor)
    , m_lag_check(lag_check)
{
    std::set<Host> seen;
    int masters = 0;

    for (const auto& host : hosts)
    {
        if (!seen.insert(host).second)
        {
            MXO_THROW(TopologyError, "Host " << host << " is declared more than once.");
        }

        if (host.role() == Host::Role::MASTER)
        {
            m_master = host;
            ++masters;
        }
        else
        {
            m_replicas.push_back(host);
        }
    }

    if (masters != 1)
    {
        MXO_THROW(TopologyError, "A topology must have exactly one master, " << masters << " were declared.");
    }

    MXO_INFO("Topology: master %s, replicas [%s].", m_master.name().c_str(),
             join(replicas(), ", ").c_str());
}

// static
std::unique_ptr<Topology> Topology::from_config(const Config& config, Executor& executor)
{
    LagCheckConfig lag_check = config.lag.check;

    if (lag_check.credentials_file.empty())
    {
        lag_check.credentials_file = config.credentials_file;
    }

    return std::unique_ptr<Topology>(new Topology(config.servers, executor, lag_check));
}

Host Topology::master() const
{
    std::shared_lock<std::shared_mutex> guard(m_lock);
    return m_master;
}

std::vector<Host> Topology::replicas() const
{
    std::shared_lock<std::shared_mutex> guard(m_lock);
    return m_replicas;
}

std::vector<Host> Topology::hosts() const
{
    std::shared_lock<std::shared_mutex> guard(m_lock);
    std::vector<Host> rval = m_replicas;
    rval.push_back(m_master);
    return rval;
}

std::vector<Host>::const_iterator Topology::find(const Host& host) const
{
    return std::find(m_replicas.begin(), m_replicas.end(), host);
}

bool Topology::contains(const Host& host) const
{
    std::shared_lock<std::shared_mutex> guard(m_lock);
    return host == m_master || find(host) != m_replicas.end();
}

Host::Role Topology::role_of(const Host& host) const
{
    std::shared_lock<std::shared_mutex> guard(m_lock);

    if (host == m_master)
    {
        return Host::Role::MASTER;
    }
    else if (find(host) == m_replicas.end())
    {
        MXO_THROW(TopologyError, "Host " << host << " is not part of the topology.");
    }

    return Host::Role::REPLICA;
}

void Topology::promote(const Host& host)
{
    std::unique_lock<std::shared_mutex> guard(m_lock);

    auto it = std::find(m_replicas.begin(), m_replicas.end(), host);

    if (it == m_replicas.end())
    {
        MXO_THROW(TopologyError, "Cannot promote " << host << ", it is not a replica of the topology.");
    }

    Host old_master = m_master;
    m_master = it->with_role(Host::Role::MASTER);
    *it = old_master.with_role(Host::Role::REPLICA);

    MXO_NOTICE("Promoted %s to master, %s is now a replica.",
               m_master.name().c_str(), old_master.name().c_str());
}

CommandSpec Topology::lag_command(const Host& host) const
{
    auto argv = tokenize_args(m_lag_check.command);

    for (auto& arg : argv)
    {
        substitute(arg, "%h", host.address());
        substitute(arg, "%p", std::to_string(host.port()));
        substitute(arg, "%c", m_lag_check.credentials_file);
        substitute(arg, "%s", host.credentials());
    }

    if (argv.empty())
    {
        MXO_THROW(TopologyError, "The lag check command is empty.");
    }

    std::string program = argv.front();
    argv.erase(argv.begin());

    return CommandSpec(program, argv, m_lag_check.timeout);
}

LagSample Topology::lag(const Host& host) const
{
    if (role_of(host) == Host::Role::MASTER)
    {
        // A master has no lag relative to itself.
        return {host, 0.0, wall_time::Clock::now()};
    }

    auto result = m_executor.execute_one(host, lag_command(host));
    LagSample sample {host, std::nullopt, result.started_at()};

    if (result.exit_code() == 0)
    {
        try
        {
            sample.lag = parse_lag(result.out());
        }
        catch (const LagParseError& e)
        {
            MXO_WARNING("Unrecognized lag check output from %s: %s", host.name().c_str(), e.what());
            throw;
        }
    }
    else
    {
        MXO_WARNING("Lag check on %s failed with exit code %d: %s",
                    host.name().c_str(), result.exit_code(), trimmed_copy(result.err()).c_str());
    }

    return sample;
}

bool Topology::is_healthy(const Host& host, double max_lag_seconds) const
{
    bool rval = false;

    try
    {
        auto sample = lag(host);
        rval = sample.lag && *sample.lag <= max_lag_seconds;
    }
    catch (const LagParseError&)
    {
        // Logged by lag(), an unparseable status is an unhealthy one.
    }

    return rval;
}

// static
std::optional<double> Topology::parse_lag(const std::string& output)
{
    std::string str = trimmed_copy(output);
    std::optional<double> rval;
    double value;

    if (lower_case_copy(str) == "null")
    {
        // Replication is not running.
    }
    else if (get_non_negative_decimal(str, &value))
    {
        rval = value;
    }
    else
    {
        MXO_THROW(LagParseError, "'" << str << "' is neither a number of seconds nor NULL.");
    }

    return rval;
}
}
