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

#include <maxosc/report.hh>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <maxosc/errors.hh>
#include <maxosc/string.hh>

namespace
{
const char CN_TABLE[] = "table";
const char CN_DDL[] = "ddl";
const char CN_MODE[] = "mode";
const char CN_DRY_RUN[] = "dry_run";
const char CN_STATUS[] = "status";
const char CN_FAILURE[] = "failure";
const char CN_HOST[] = "host";
const char CN_STEP[] = "step";
const char CN_KIND[] = "kind";
const char CN_MESSAGE[] = "message";
const char CN_HOSTS[] = "hosts";
const char CN_ROLE[] = "role";
const char CN_ATTEMPTS[] = "attempts";
const char CN_EXIT_CODE[] = "exit_code";
const char CN_DURATION[] = "duration";
const char CN_RESUMED[] = "resumed";
const char CN_STARTED[] = "started";
const char CN_FINISHED[] = "finished";
}

namespace maxosc
{

int exit_code(JobStatus status)
{
    switch (status)
    {
    case JobStatus::SUCCEEDED:
        return 0;

    case JobStatus::ABORTED:
        return 2;

    default:
        return 1;
    }
}

Report::Report(const SchemaChangeJob& job)
    : m_table(job.table().to_string())
    , m_ddl(job.ddl())
    , m_mode(job.mode())
    , m_dry_run(job.dry_run())
    , m_status(job.status())
    , m_failure(job.failure())
    , m_duration(job.duration())
    , m_started_at(job.started_at())
    , m_finished_at(job.finished_at())
{
    if (!job.is_terminal())
    {
        MXO_THROW(IncompleteJobError, "Cannot report on the change of " << m_table
                                                                        << ", it is " << maxosc::to_string(m_status)
                                                                        << ".");
    }

    for (const auto& outcome : job.outcomes())
    {
        HostEntry entry {outcome.host, outcome.status, (int)outcome.attempts.size(), std::nullopt,
                         outcome.duration(), outcome.resumed, outcome.message};

        if (!outcome.attempts.empty())
        {
            entry.last_exit_code = outcome.attempts.back().exit_code();
        }

        m_hosts.push_back(std::move(entry));
    }
}

Json Report::to_json() const
{
    Json rval;
    rval.set_string(CN_TABLE, m_table);
    rval.set_string(CN_DDL, m_ddl);
    rval.set_string(CN_MODE, maxosc::to_string(m_mode));
    rval.set_bool(CN_DRY_RUN, m_dry_run);
    rval.set_string(CN_STATUS, maxosc::to_string(m_status));
    rval.set_float(CN_DURATION, to_secs(m_duration));
    rval.set_string(CN_STARTED, wall_time::to_string(m_started_at));
    rval.set_string(CN_FINISHED, wall_time::to_string(m_finished_at));

    if (m_failure)
    {
        Json failure;
        failure.set_string(CN_HOST, m_failure->host.name());
        failure.set_string(CN_STEP, maxosc::to_string(m_failure->step));
        failure.set_string(CN_KIND, maxosc::to_string(m_failure->kind));
        failure.set_string(CN_MESSAGE, m_failure->message);
        rval.set_object(CN_FAILURE, failure);
    }
    else
    {
        rval.set_null(CN_FAILURE);
    }

    Json hosts(Json::Type::ARRAY);

    for (const auto& entry : m_hosts)
    {
        Json host;
        host.set_string(CN_HOST, entry.host.name());
        host.set_string(CN_ROLE, maxosc::to_string(entry.host.role()));
        host.set_string(CN_STATUS, maxosc::to_string(entry.status));
        host.set_int(CN_ATTEMPTS, entry.attempts);

        if (entry.last_exit_code)
        {
            host.set_int(CN_EXIT_CODE, *entry.last_exit_code);
        }
        else
        {
            host.set_null(CN_EXIT_CODE);
        }

        host.set_float(CN_DURATION, to_secs(entry.duration));
        host.set_bool(CN_RESUMED, entry.resumed);

        if (!entry.message.empty())
        {
            host.set_string(CN_MESSAGE, entry.message);
        }

        hosts.add_array_elem(host);
    }

    rval.set_object(CN_HOSTS, hosts);
    return rval;
}

std::string Report::to_string() const
{
    std::ostringstream os;

    os << "Schema change of " << m_table << ": " << maxosc::to_string(m_status)
       << (m_dry_run ? " (dry run)" : "") << "\n"
       << "DDL:       " << m_ddl << "\n"
       << "Mode:      " << maxosc::to_string(m_mode) << "\n"
       << "Started:   " << wall_time::to_string(m_started_at) << "\n"
       << "Finished:  " << wall_time::to_string(m_finished_at) << "\n"
       << "Duration:  " << maxosc::to_string(m_duration) << "\n";

    if (m_failure)
    {
        os << "Failure:   " << m_failure->host.name() << " during " << maxosc::to_string(m_failure->step)
           << " (" << maxosc::to_string(m_failure->kind) << "): " << m_failure->message << "\n";
    }

    size_t width = 4;

    for (const auto& entry : m_hosts)
    {
        width = std::max(width, entry.host.name().length());
    }

    width += 2;

    os << "\n" << std::left
       << std::setw(width) << "Host"
       << std::setw(9) << "Role"
       << std::setw(11) << "Status"
       << std::setw(10) << "Attempts"
       << std::setw(6) << "Exit"
       << "Duration\n";

    for (const auto& entry : m_hosts)
    {
        std::string exit_code = entry.last_exit_code ? std::to_string(*entry.last_exit_code) : "-";
        std::string status = maxosc::to_string(entry.status);

        if (entry.resumed)
        {
            status += "*";
        }

        os << std::setw(width) << entry.host.name()
           << std::setw(9) << maxosc::to_string(entry.host.role())
           << std::setw(11) << status
           << std::setw(10) << entry.attempts
           << std::setw(6) << exit_code
           << maxosc::to_string(entry.duration) << "\n";
    }

    if (std::any_of(m_hosts.begin(), m_hosts.end(), [](const HostEntry& e) {
                        return e.resumed;
                    }))
    {
        os << "\n* altered by an earlier run\n";
    }

    return os.str();
}
}
