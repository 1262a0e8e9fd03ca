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

#include <set>
#include <string>
#include <vector>

#include <maxosc/executor.hh>
#include <maxosc/host.hh>
#include <maxosc/stopwatch.hh>
#include <maxosc/topology.hh>

namespace maxosc
{

/**
 * How the schema change tool is run and how its failures are treated. The [osc] section.
 */
struct OscConfig
{
    enum class Mode
    {
        PER_HOST,   // Every host altered separately with binary logging disabled, master last
        REPLICATED, // Only the master is altered, the change replicates
    };

    static constexpr const char* DEFAULT_TOOL = "/usr/bin/pt-online-schema-change";
    static constexpr const char* DEFAULT_TRANSIENT_PATTERNS =
        "Lock wait timeout exceeded|Deadlock found|Lost connection|server has gone away";

    std::string              tool {DEFAULT_TOOL};
    Mode                     mode {Mode::PER_HOST};
    Duration                 command_timeout {std::chrono::hours(24)};
    std::set<int>            success_codes {0};
    std::set<int>            transient_codes;
    std::string              transient_patterns {DEFAULT_TRANSIENT_PATTERNS};
    int                      max_attempts {3};
    Duration                 backoff_initial {std::chrono::seconds(10)};
    Duration                 backoff_max {std::chrono::seconds(300)};
    double                   backoff_multiplier {2.0};
    std::vector<std::string> extra_args;
};

const char* to_string(OscConfig::Mode mode);
bool        mode_from_string(const std::string& str, OscConfig::Mode* mode);

/**
 * Replication lag gating. The [lag] section.
 */
struct LagConfig
{
    LagCheckConfig check;
    Duration       max_lag {std::chrono::seconds(5)};
    Duration       wait_budget {std::chrono::seconds(600)};
    Duration       poll_interval {std::chrono::seconds(5)};
};

/**
 * Everything one orchestration run needs. There is no global configuration, a Config
 * is passed to whatever needs it.
 */
struct Config
{
    ExecutorConfig    executor;
    std::string       log_dir;      // Empty means stdout
    bool              syslog {false};
    std::string       credentials_file;
    std::string       state_file;   // Empty means no state file, %t is replaced with db.table
    OscConfig         osc;
    LagConfig         lag;
    std::vector<Host> servers;      // In declaration order

    /**
     * Load the configuration from a file.
     *
     * @throw ConfigError  If the file cannot be read or contains errors. The message
     *                     lists every error found.
     */
    static Config load(const std::string& filename);

    /**
     * Load the configuration from text.
     *
     * @throw ConfigError
     */
    static Config from_text(const std::string& text);

    /**
     * The state file path for a table, or an empty string if no state file is used.
     */
    std::string state_file_for(const std::string& table) const;
};

/**
 * Parse a duration. The accepted suffixes are h, m, s and ms, a value without a suffix
 * is in seconds.
 *
 * @return True, if the string was a valid duration.
 */
bool get_suffixed_duration(const std::string& str, Duration* duration);

/**
 * Parse a boolean: true, false, yes, no, on, off, 1 or 0.
 */
bool get_bool(const std::string& str, bool* value);
}
