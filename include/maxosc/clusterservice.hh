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

#include <string>

#include <maxosc/command.hh>
#include <maxosc/host.hh>

namespace maxosc
{

/**
 * The boundary to the service that runs commands on remote hosts on behalf of the
 * fleet executor. A call concerns one host and returns one result; the service is
 * called concurrently from several threads.
 */
class ClusterService
{
public:
    virtual ~ClusterService() = default;

    /**
     * Run a command on a host.
     *
     * @param host  The target, always a valid host.
     * @param spec  What to run.
     *
     * @return The result of the one attempt.
     */
    virtual CommandResult run(const Host& host, const CommandSpec& spec) = 0;
};

/**
 * Runs commands through a locally executed prefix command, by default ssh. In the prefix,
 * %h is replaced with the address and %p with the port of the host. The command itself is
 * appended as one shell quoted argument, the form ssh expects.
 */
class ShellClusterService : public ClusterService
{
public:
    static constexpr const char* DEFAULT_PREFIX = "ssh -o BatchMode=yes %h";

    explicit ShellClusterService(const std::string& prefix = DEFAULT_PREFIX);

    CommandResult run(const Host& host, const CommandSpec& spec) override;

    /**
     * The complete argument vector for running @c spec on @c host.
     */
    std::vector<std::string> argv_for(const Host& host, const CommandSpec& spec) const;

private:
    std::vector<std::string> m_prefix;
};
}
