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

#include <maxosc/clusterservice.hh>

#include <maxosc/process.hh>
#include <maxosc/string.hh>

namespace maxosc
{

ShellClusterService::ShellClusterService(const std::string& prefix)
    : m_prefix(tokenize_args(prefix))
{
}

std::vector<std::string> ShellClusterService::argv_for(const Host& host, const CommandSpec& spec) const
{
    std::vector<std::string> argv;

    for (auto arg : m_prefix)
    {
        substitute(arg, "%h", host.address());
        substitute(arg, "%p", std::to_string(host.port()));
        argv.push_back(std::move(arg));
    }

    argv.push_back(spec.to_string());
    return argv;
}

CommandResult ShellClusterService::run(const Host& host, const CommandSpec& spec)
{
    return run_for_host(host, argv_for(host, spec), spec.timeout());
}
}
