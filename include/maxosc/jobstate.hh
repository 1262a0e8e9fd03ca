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

#include <optional>
#include <string>
#include <vector>

#include <maxosc/json.hh>
#include <maxosc/schemachange.hh>

/**
 * The state file of a schema change. It is rewritten after every transition so that an
 * interrupted change can be continued without altering the same host twice.
 */
namespace maxosc
{
namespace jobstate
{

struct HostState
{
    Host      host;
    JobStatus status;
    int       attempts;
};

struct State
{
    TableName              table;
    std::string            ddl;
    OscConfig::Mode        mode;
    JobStatus              status;
    std::vector<HostState> hosts;
};

Json to_json(const SchemaChangeJob& job);

/**
 * @throw ConfigError  If the JSON is not a job state.
 */
State from_json(const Json& json);

/**
 * Write the state of a job. The file is replaced atomically. A failure is logged.
 *
 * @return True, if the state was written.
 */
bool save(const SchemaChangeJob& job, const std::string& path);

/**
 * Read a state file.
 *
 * @return The state or nothing, if the file does not exist.
 * @throw ConfigError  If the file exists but cannot be read or parsed.
 */
std::optional<State> load(const std::string& path);
}
}
