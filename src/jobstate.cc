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

#define MXO_MODULE_NAME "jobstate"

#include <maxosc/jobstate.hh>

#include <unistd.h>

#include <maxosc/errors.hh>
#include <maxosc/log.hh>

namespace
{
const char CN_TABLE[] = "table";
const char CN_DDL[] = "ddl";
const char CN_MODE[] = "mode";
const char CN_STATUS[] = "status";
const char CN_HOSTS[] = "hosts";
const char CN_ADDRESS[] = "address";
const char CN_PORT[] = "port";
const char CN_ROLE[] = "role";
const char CN_ATTEMPTS[] = "attempts";
const char CN_UPDATED[] = "updated";
}

namespace maxosc
{
namespace jobstate
{

Json to_json(const SchemaChangeJob& job)
{
    Json rval;
    rval.set_string(CN_TABLE, job.table().to_string());
    rval.set_string(CN_DDL, job.ddl());
    rval.set_string(CN_MODE, to_string(job.mode()));
    rval.set_string(CN_STATUS, to_string(job.status()));
    rval.set_string(CN_UPDATED, wall_time::to_string(wall_time::Clock::now()));

    Json hosts(Json::Type::ARRAY);

    for (const auto& outcome : job.outcomes())
    {
        Json host;
        host.set_string(CN_ADDRESS, outcome.host.address());
        host.set_int(CN_PORT, outcome.host.port());
        host.set_string(CN_ROLE, to_string(outcome.host.role()));
        host.set_string(CN_STATUS, to_string(outcome.status));
        host.set_int(CN_ATTEMPTS, outcome.attempts.size());
        hosts.add_array_elem(host);
    }

    rval.set_object(CN_HOSTS, hosts);
    return rval;
}

State from_json(const Json& json)
{
    State rval;
    std::string table;
    std::string mode;
    std::string status;

    if (!json.try_get_string(CN_TABLE, &table) || !TableName::from_string(table, &rval.table)
        || !json.try_get_string(CN_DDL, &rval.ddl)
        || !json.try_get_string(CN_MODE, &mode) || !mode_from_string(mode, &rval.mode)
        || !json.try_get_string(CN_STATUS, &status) || !status_from_string(status, &rval.status)
        || json.get_object(CN_HOSTS).type() != Json::Type::ARRAY)
    {
        MXO_THROW(ConfigError, "Invalid job state: " << json.to_string(Json::Format::COMPACT));
    }

    for (const auto& elem : json.get_array_elems(CN_HOSTS))
    {
        std::string address;
        int64_t port;
        std::string role_str;
        int64_t attempts = 0;
        Host::Role role;
        JobStatus host_status;

        if (!elem.try_get_string(CN_ADDRESS, &address)
            || !elem.try_get_int(CN_PORT, &port)
            || !elem.try_get_string(CN_ROLE, &role_str) || !role_from_string(role_str, &role)
            || !elem.try_get_string(CN_STATUS, &status) || !status_from_string(status, &host_status))
        {
            MXO_THROW(ConfigError, "Invalid host in job state: " << elem.to_string(Json::Format::COMPACT));
        }

        if (!elem.try_get_int(CN_ATTEMPTS, &attempts))
        {
            attempts = 0;
        }

        rval.hosts.push_back({Host(address, port, role), host_status, (int)attempts});
    }

    return rval;
}

bool save(const SchemaChangeJob& job, const std::string& path)
{
    auto json = to_json(job);
    bool rval = json.save(path);

    if (!rval)
    {
        MXO_ERROR("Failed to write job state to '%s': %s", path.c_str(), json.error_msg().c_str());
    }

    return rval;
}

std::optional<State> load(const std::string& path)
{
    std::optional<State> rval;

    if (access(path.c_str(), F_OK) == 0)
    {
        Json json;

        if (!json.load(path))
        {
            MXO_THROW(ConfigError, "Failed to read job state from '" << path << "': " << json.error_msg());
        }

        rval = from_json(json);
    }

    return rval;
}
}
}
