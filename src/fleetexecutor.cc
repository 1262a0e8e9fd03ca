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

#include <algorithm>
#include <exception>
#include <mutex>

#include <maxosc/latch.hh>
#include <maxosc/log.hh>
#include <maxosc/threadpool.hh>

namespace maxosc
{

FleetExecutor::FleetExecutor(std::unique_ptr<ClusterService> service, int max_threads)
    : m_service(std::move(service))
    , m_max_threads(max_threads > 0 ? max_threads : ExecutorConfig::DEFAULT_MAX_THREADS)
{
}

Results FleetExecutor::execute(const Targets& targets, const CommandSpec& spec)
{
    Results results;
    std::vector<Host> valid;

    for (const auto& host : targets)
    {
        if (host.is_valid())
        {
            valid.push_back(host);
        }
        else
        {
            MXO_WARNING("Refusing to run '%s' on '%s', the host is not valid.",
                        spec.program().c_str(), host.address().c_str());
            results.emplace(host, CommandResult(host, 1, "", INVALID_HOST_MESSAGE,
                                                Duration::zero(), wall_time::Clock::now()));
        }
    }

    if (valid.empty())
    {
        return results;
    }

    int nThreads = std::min<int>(valid.size(), m_max_threads);
    ThreadPool pool("fleet", nThreads);
    latch done(valid.size());
    std::mutex results_lock;

    for (const auto& host : valid)
    {
        pool.execute([&, host]() {
                         std::unique_ptr<CommandResult> result;

                         try
                         {
                             result.reset(new CommandResult(m_service->run(host, spec)));
                         }
                         catch (const std::exception& e)
                         {
                             // Failures are isolated to the host they concern.
                             MXO_ERROR("Running '%s' on %s failed: %s",
                                       spec.program().c_str(), host.name().c_str(), e.what());
                             result.reset(new CommandResult(host, CommandResult::ERROR, "", e.what(),
                                                            Duration::zero(), wall_time::Clock::now()));
                         }

                         log_result(spec, *result);

                         std::unique_lock<std::mutex> guard(results_lock);
                         results.emplace(host, std::move(*result));
                         guard.unlock();

                         done.count_down();
                     });
    }

    done.wait();
    pool.stop();

    return results;
}
}
