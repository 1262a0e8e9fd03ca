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

namespace maxosc
{

/**
 * The process exit code that corresponds to the final status of a job:
 * 0 for succeeded, 1 for failed and 2 for aborted.
 */
int exit_code(JobStatus status);

/**
 * Summary of a finished schema change. Creating a report has no side effects,
 * the same job always produces the same report.
 */
class Report
{
public:
    struct HostEntry
    {
        Host               host;
        JobStatus          status;
        int                attempts;
        std::optional<int> last_exit_code;
        Duration           duration;
        bool               resumed;
        std::string        message;
    };

    /**
     * @throw IncompleteJobError  If the job has not reached a terminal state.
     */
    explicit Report(const SchemaChangeJob& job);

    JobStatus status() const
    {
        return m_status;
    }

    const std::vector<HostEntry>& hosts() const
    {
        return m_hosts;
    }

    const std::optional<Failure>& failure() const
    {
        return m_failure;
    }

    Duration duration() const
    {
        return m_duration;
    }

    int exit_code() const
    {
        return maxosc::exit_code(m_status);
    }

    Json        to_json() const;
    std::string to_string() const;

private:
    std::string            m_table;
    std::string            m_ddl;
    OscConfig::Mode        m_mode;
    bool                   m_dry_run;
    JobStatus              m_status;
    std::optional<Failure> m_failure;
    std::vector<HostEntry> m_hosts;
    Duration               m_duration;
    wall_time::TimePoint   m_started_at;
    wall_time::TimePoint   m_finished_at;
};
}
