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

#define MXO_MODULE_NAME "executor"

#include <maxosc/executor.hh>

#include <maxosc/errors.hh>
#include <maxosc/log.hh>
#include <maxosc/process.hh>
#include <maxosc/string.hh>

namespace maxosc
{

const char* to_string(ExecutorConfig::Backend backend)
{
    return backend == ExecutorConfig::Backend::LOCAL ? "local" : "fleet";
}

bool backend_from_string(const std::string& str, ExecutorConfig::Backend* backend)
{
    bool rval = true;

    if (str == "local")
    {
        *backend = ExecutorConfig::Backend::LOCAL;
    }
    else if (str == "fleet")
    {
        *backend = ExecutorConfig::Backend::FLEET;
    }
    else
    {
        rval = false;
    }

    return rval;
}

// static
std::unique_ptr<Executor> Executor::create(const ExecutorConfig& config)
{
    std::unique_ptr<Executor> rval;

    switch (config.backend)
    {
    case Backend::LOCAL:
        rval.reset(new LocalExecutor);
        break;

    case Backend::FLEET:
        rval.reset(new FleetExecutor(std::unique_ptr<ClusterService>(
                                         new ShellClusterService(config.fleet_command)),
                                     config.max_threads));
        break;
    }

    MXO_INFO("Using the %s executor.", to_string(config.backend));
    return rval;
}

CommandResult Executor::execute_one(const Host& host, const CommandSpec& spec)
{
    auto results = execute({host}, spec);
    auto it = results.find(host);

    if (it == results.end())
    {
        MXO_THROW(InvalidTargetError, "No result was produced for " << host);
    }

    return it->second;
}

// static
void Executor::log_result(const CommandSpec& spec, const CommandResult& result)
{
    MXO_SINFO("'" << spec.program() << "' on " << result.host().name()
                  << " exited with " << result.exit_code() << " in " << result.duration());
}

Results LocalExecutor::execute(const Targets& targets, const CommandSpec& spec)
{
    if (targets.size() != 1)
    {
        MXO_THROW(InvalidTargetError, "The local executor accepts exactly one target, "
                  << targets.size() << " were given.");
    }

    const Host& host = *targets.begin();
    Results results;
    auto result = run_for_host(host, spec.argv(), spec.timeout());
    log_result(spec, result);
    results.emplace(host, std::move(result));

    return results;
}
}
