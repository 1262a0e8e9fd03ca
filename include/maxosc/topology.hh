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

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <maxosc/executor.hh>
#include <maxosc/host.hh>
#include <maxosc/stopwatch.hh>

namespace maxosc
{

struct Config;

/**
 * How replica lag is measured. In the command, %h is replaced with the address, %p with
 * the port, %c with the credentials file and %s with the credentials section of the host.
 * The command must print the lag in seconds, or NULL if replication is not running.
 */
struct LagCheckConfig
{
    static constexpr const char* DEFAULT_COMMAND =
        "/usr/bin/maxosc-lag --host=%h --port=%p --defaults-file=%c --section=%s";

    std::string command {DEFAULT_COMMAND};
    Duration    timeout {std::chrono::seconds(10)};
    std::string credentials_file;
};

/**
 * One lag measurement. An empty lag means that replication is stopped or that its
 * state is unknown, which is never the same as no lag.
 */
struct LagSample
{
    Host                  host;
    std::optional<double> lag;
    wall_time::TimePoint  sampled_at;

    bool is_null() const
    {
        return !lag.has_value();
    }
};

/**
 * One master and zero or more replicas. The replica order is the declaration order and
 * does not change at runtime, except through promote().
 *
 * Queries may be made concurrently from several threads. Role updates are serialized
 * with the queries.
 */
class Topology
{
public:
    Topology(const Topology&) = delete;
    Topology& operator=(const Topology&) = delete;

    /**
     * @param hosts     The hosts in declaration order. Exactly one must be a master.
     * @param executor  Executor used for running the lag checks. Must outlive the topology.
     * @param lag_check How lag is checked.
     *
     * @throw TopologyError if the hosts do not form a valid topology.
     */
    Topology(const std::vector<Host>& hosts, Executor& executor, const LagCheckConfig& lag_check = {});

    /**
     * Create the topology from the server sections of the configuration.
     */
    static std::unique_ptr<Topology> from_config(const Config& config, Executor& executor);

    Host master() const;

    std::vector<Host> replicas() const;

    /**
     * All hosts: the replicas in order, followed by the master.
     */
    std::vector<Host> hosts() const;

    bool contains(const Host& host) const;

    /**
     * @throw TopologyError if the host is not part of the topology.
     */
    Host::Role role_of(const Host& host) const;

    /**
     * Make a replica the master. The previous master takes the place of the promoted
     * replica in the replica order. For use by external failover tooling.
     *
     * @throw TopologyError if the host is not a replica of this topology.
     */
    void promote(const Host& host);

    /**
     * Measure the replication lag of a host. The master is never queried, its lag is 0.
     * A lag check that fails or times out produces a null sample.
     *
     * @throw LagParseError  If the lag check printed something unrecognized.
     * @throw TopologyError  If the host is not part of the topology.
     */
    LagSample lag(const Host& host) const;

    /**
     * Whether the lag of a host is known and at most @c max_lag_seconds. A lag check
     * that cannot be parsed counts as unhealthy.
     */
    bool is_healthy(const Host& host, double max_lag_seconds) const;

    /**
     * Parse the output of a lag check.
     *
     * @return The lag in seconds or an empty value for NULL.
     * @throw LagParseError  If the output is not a non-negative number or NULL.
     */
    static std::optional<double> parse_lag(const std::string& output);

    /**
     * The lag check command for a host.
     */
    CommandSpec lag_command(const Host& host) const;

private:
    std::vector<Host>::const_iterator find(const Host& host) const;

    Executor&                 m_executor;
    LagCheckConfig            m_lag_check;
    Host                      m_master;
    std::vector<Host>         m_replicas;
    mutable std::shared_mutex m_lock;
};
}
