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

#include <map>
#include <memory>
#include <set>
#include <string>

#include <maxosc/clusterservice.hh>
#include <maxosc/command.hh>
#include <maxosc/host.hh>

namespace maxosc
{

using Targets = std::set<Host>;
using Results = std::map<Host, CommandResult>;

struct ExecutorConfig
{
    enum class Backend {LOCAL, FLEET};

    static constexpr int DEFAULT_MAX_THREADS = 16;

    Backend     backend {Backend::LOCAL};
    std::string fleet_command {ShellClusterService::DEFAULT_PREFIX};
    int         max_threads {DEFAULT_MAX_THREADS};
};

const char* to_string(ExecutorConfig::Backend backend);
bool        backend_from_string(const std::string& str, ExecutorConfig::Backend* backend);

/**
 * Runs a command on one or more hosts. One call is one attempt per host, fully observed:
 * the call returns once every target has completed or timed out, and it never retries.
 */
class Executor
{
public:
    using Backend = ExecutorConfig::Backend;

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    virtual ~Executor() = default;

    /**
     * Create the executor selected by the configuration.
     */
    static std::unique_ptr<Executor> create(const ExecutorConfig& config);

    /**
     * Execute a command on the targets.
     *
     * @param targets  The hosts to run the command on.
     * @param spec     What to run.
     *
     * @return One result per target.
     * @throw InvalidTargetError if the backend cannot handle the targets.
     */
    virtual Results execute(const Targets& targets, const CommandSpec& spec) = 0;

    /**
     * Execute a command on one host.
     */
    CommandResult execute_one(const Host& host, const CommandSpec& spec);

    virtual Backend backend() const = 0;

protected:
    Executor() = default;

    static void log_result(const CommandSpec& spec, const CommandResult& result);
};

/**
 * Runs the command on the calling machine. The target tells which host the command
 * concerns; the command itself must know how to reach it.
 */
class LocalExecutor : public Executor
{
public:
    LocalExecutor() = default;

    /**
     * @throw InvalidTargetError unless exactly one target is given.
     */
    Results execute(const Targets& targets, const CommandSpec& spec) override;

    Backend backend() const override
    {
        return Backend::LOCAL;
    }
};

/**
 * Runs the command on all targets concurrently through a cluster service. Each target
 * gets its own result; a host that cannot be reached does not affect the others.
 */
class FleetExecutor : public Executor
{
public:
    // Standard error of the result of a host that fails validation.
    static constexpr const char* INVALID_HOST_MESSAGE = "host is wrong or does not match rules";

    /**
     * @param service      The cluster service to use.
     * @param max_threads  The maximum number of hosts handled at the same time.
     */
    FleetExecutor(std::unique_ptr<ClusterService> service, int max_threads);

    Results execute(const Targets& targets, const CommandSpec& spec) override;

    Backend backend() const override
    {
        return Backend::FLEET;
    }

    int max_threads() const
    {
        return m_max_threads;
    }

private:
    std::unique_ptr<ClusterService> m_service;
    int                             m_max_threads;
};
}
