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

/**
 * @file maxosc_lag.cc  - Prints the replication lag of a server
 */

#define MXO_MODULE_NAME "maxosc-lag"

#include <maxosc/ccdefs.hh>

#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <optional>

#include <maxosc/log.hh>
#include <maxosc/mariadb.hh>
#include <maxosc/string.hh>

using std::string;

namespace
{

struct option options[] =
{
    {"help",          no_argument,       nullptr, 'h'},
    {"host",          required_argument, nullptr, 'H'},
    {"port",          required_argument, nullptr, 'P'},
    {"defaults-file", required_argument, nullptr, 'f'},
    {"section",       required_argument, nullptr, 's'},
    {"timeout",       required_argument, nullptr, 't'},
    {nullptr,         0,                 nullptr, 0  }
};

const char SLAVE_STATUS[] = "SHOW ALL SLAVES STATUS";
const char SECONDS_BEHIND[] = "Seconds_Behind_Master";

void print_usage(const char* executable)
{
    const char msg[] =
        R"(Usage: %s --host=HOST [--port=PORT] [--defaults-file=FILE] [--section=SECTION]
          [--timeout=SECONDS]

Print the replication lag of a server in seconds, or NULL if it is not replicating.
With several replication connections, the largest lag is printed.

  -h, --help           Display this help.
  -H, --host           The server address.
  -P, --port           The server port (default: 3306).
  -f, --defaults-file  Option file with the credentials.
  -s, --section        Section of the option file to use (default: client).
  -t, --timeout        Connect and read timeout in seconds (default: 10).
)";

    printf(msg, executable);
}

/**
 * The largest lag of all replication connections. Any stopped connection makes the
 * whole lag unknown.
 */
bool get_lag(maxosc::MariaDB& conn, std::optional<double>* lag)
{
    auto result = conn.query(SLAVE_STATUS);

    if (!result)
    {
        MXO_ERROR("%s", conn.error());
        return false;
    }

    auto col = result->get_col_index(SECONDS_BEHIND);

    if (col < 0)
    {
        MXO_ERROR("'%s' did not return the column '%s'.", SLAVE_STATUS, SECONDS_BEHIND);
        return false;
    }

    std::optional<double> rval;
    bool replicating = result->get_row_count() > 0;

    while (replicating && result->next_row())
    {
        double value = 0;

        if (result->field_is_null(col)
            || !maxosc::get_non_negative_decimal(result->get_string(col), &value))
        {
            replicating = false;
            rval.reset();
        }
        else if (!rval || value > *rval)
        {
            rval = value;
        }
    }

    *lag = rval;
    return true;
}
}

int main(int argc, char** argv)
{
    // The lag goes to stdout, so the log goes elsewhere.
    maxosc::Log log(MXO_LOG_TARGET_STDERR);

    string host;
    int port = 3306;
    int timeout = 10;
    maxosc::MariaDB conn;
    auto& settings = conn.connection_settings();
    settings.defaults_group = "client";

    int c;
    while ((c = getopt_long(argc, argv, "hH:P:f:s:t:", options, NULL)) != -1)
    {
        switch (c)
        {
        case 'h':
            print_usage(argv[0]);
            return EXIT_SUCCESS;

        case 'H':
            host = optarg;
            break;

        case 'P':
            if (!maxosc::get_int(optarg, &port) || port <= 0 || port > 65535)
            {
                MXO_ERROR("Invalid port '%s'.", optarg);
                return EXIT_FAILURE;
            }
            break;

        case 'f':
            settings.defaults_file = optarg;
            break;

        case 's':
            if (*optarg)
            {
                settings.defaults_group = optarg;
            }
            break;

        case 't':
            if (!maxosc::get_int(optarg, &timeout) || timeout <= 0)
            {
                MXO_ERROR("Invalid timeout '%s'.", optarg);
                return EXIT_FAILURE;
            }
            break;

        default:
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (host.empty() || optind != argc)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    settings.timeout = timeout;

    if (!conn.open(host, port))
    {
        MXO_ERROR("%s", conn.error());
        return EXIT_FAILURE;
    }

    std::optional<double> lag;

    if (!get_lag(conn, &lag))
    {
        return EXIT_FAILURE;
    }

    if (lag)
    {
        // Seconds_Behind_Master is a whole number.
        printf("%.0f\n", *lag);
    }
    else
    {
        printf("NULL\n");
    }

    return EXIT_SUCCESS;
}
