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
 * @file maxosc.cc  - Runs an online schema change over a replication topology
 */

#define MXO_MODULE_NAME "maxosc"

#include <maxosc/ccdefs.hh>

#include <getopt.h>
#include <signal.h>
#include <syslog.h>

#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <thread>

#include <maxosc/config.hh>
#include <maxosc/errors.hh>
#include <maxosc/executor.hh>
#include <maxosc/log.hh>
#include <maxosc/report.hh>
#include <maxosc/schemachange.hh>
#include <maxosc/string.hh>
#include <maxosc/threadpool.hh>
#include <maxosc/topology.hh>

using std::string;

namespace
{

const int EXIT_USAGE = 3;

struct option options[] =
{
    {"help",         no_argument,       nullptr, 'h'},
    {"config",       required_argument, nullptr, 'c'},
    {"table",        required_argument, nullptr, 't'},
    {"alter",        required_argument, nullptr, 'a'},
    {"dry-run",      no_argument,       nullptr, 'n'},
    {"max-lag",      required_argument, nullptr, 'l'},
    {"max-attempts", required_argument, nullptr, 'r'},
    {"mode",         required_argument, nullptr, 'm'},
    {"executor",     required_argument, nullptr, 'e'},
    {"resume",       no_argument,       nullptr, 'R'},
    {"json",         no_argument,       nullptr, 'j'},
    {"verbose",      no_argument,       nullptr, 'v'},
    {"log-dir",      required_argument, nullptr, 'L'},
    {nullptr,        0,                 nullptr, 0  }
};

void print_usage(const char* executable)
{
    const char msg[] =
        R"(Usage: %s --config=FILE --table=DB.TABLE --alter=DDL [OPTIONS]

Alter a table on every server of a replication topology with pt-online-schema-change,
one server at a time, waiting for the replicas to catch up in between.

  -h, --help              Display this help.
  -c, --config=FILE       The configuration file.
  -t, --table=DB.TABLE    The table to alter.
  -a, --alter=DDL         The alteration, e.g. "ADD COLUMN x INT".
  -n, --dry-run           Only check that the change can be made.
  -l, --max-lag=DUR       Largest acceptable replica lag, e.g. 5s.
  -r, --max-attempts=N    Attempts per host before giving up.
  -m, --mode=MODE         per_host or replicated.
  -e, --executor=BACKEND  local or fleet.
  -R, --resume            Continue from the state file of an earlier run.
  -j, --json              Print the report as JSON.
  -v, --verbose           Log informational messages.
  -L, --log-dir=DIR       Log to DIR/maxosc.log instead of standard error.

Exit code: 0 succeeded, 1 failed, 2 aborted, 3 usage or configuration error.
)";

    printf(msg, executable);
}

struct Options
{
    string config_file;
    string table;
    string ddl;
    bool   dry_run {false};
    string max_lag;
    string max_attempts;
    string mode;
    string executor;
    string log_dir;
    bool   resume {false};
    bool   json {false};
    bool   verbose {false};
};

/**
 * Turns SIGINT and SIGTERM into an abort request. The signals are blocked in every thread
 * and received synchronously by a dedicated thread, so the abort is requested from a
 * normal thread context.
 */
class SignalWatcher
{
public:
    SignalWatcher(maxosc::SchemaChange& change)
        : m_change(change)
        , m_thread(&SignalWatcher::run, this)
    {
        maxosc::set_thread_name(m_thread, "signals");
    }

    ~SignalWatcher()
    {
        m_stop = true;
        m_thread.join();
    }

    static void block_signals()
    {
        sigset_t sigset;
        sigemptyset(&sigset);
        sigaddset(&sigset, SIGINT);
        sigaddset(&sigset, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &sigset, nullptr);
    }

private:
    void run()
    {
        sigset_t sigset;
        sigemptyset(&sigset);
        sigaddset(&sigset, SIGINT);
        sigaddset(&sigset, SIGTERM);
        timespec timeout {0, 100000000};
        int received = 0;

        while (!m_stop)
        {
            int sig = sigtimedwait(&sigset, nullptr, &timeout);

            if (sig > 0)
            {
                if (received++ == 0)
                {
                    MXO_NOTICE("Received %s, aborting once the current step is done.", strsignal(sig));
                    m_change.abort();
                }
                else
                {
                    MXO_NOTICE("Received %s, the abort is already in progress. The external tool is "
                               "never interrupted.", strsignal(sig));
                }
            }
        }
    }

    maxosc::SchemaChange& m_change;
    std::atomic<bool>     m_stop {false};
    std::thread           m_thread;
};

bool parse_options(int argc, char** argv, Options* opts)
{
    int c;
    while ((c = getopt_long(argc, argv, "hc:t:a:nl:r:m:e:RjvL:", options, NULL)) != -1)
    {
        switch (c)
        {
        case 'h':
            print_usage(argv[0]);
            exit(EXIT_SUCCESS);

        case 'c':
            opts->config_file = optarg;
            break;

        case 't':
            opts->table = optarg;
            break;

        case 'a':
            opts->ddl = optarg;
            break;

        case 'n':
            opts->dry_run = true;
            break;

        case 'l':
            opts->max_lag = optarg;
            break;

        case 'r':
            opts->max_attempts = optarg;
            break;

        case 'm':
            opts->mode = optarg;
            break;

        case 'e':
            opts->executor = optarg;
            break;

        case 'R':
            opts->resume = true;
            break;

        case 'j':
            opts->json = true;
            break;

        case 'v':
            opts->verbose = true;
            break;

        case 'L':
            opts->log_dir = optarg;
            break;

        default:
            return false;
        }
    }

    bool rval = true;

    if (optind != argc)
    {
        fprintf(stderr, "Unexpected argument '%s'.\n", argv[optind]);
        rval = false;
    }

    for (auto req : {std::make_pair(&opts->config_file, "--config"),
                     std::make_pair(&opts->table, "--table"),
                     std::make_pair(&opts->ddl, "--alter")})
    {
        if (req.first->empty())
        {
            fprintf(stderr, "%s is required.\n", req.second);
            rval = false;
        }
    }

    return rval;
}

/**
 * Apply the command line on top of the configuration file.
 */
void apply_overrides(const Options& opts, maxosc::Config* config)
{
    if (!opts.max_lag.empty() && !maxosc::get_suffixed_duration(opts.max_lag, &config->lag.max_lag))
    {
        MXO_THROW(maxosc::ConfigError, "Invalid value for --max-lag: " << opts.max_lag);
    }

    if (!opts.max_attempts.empty()
        && (!maxosc::get_int(opts.max_attempts, &config->osc.max_attempts) || config->osc.max_attempts <= 0))
    {
        MXO_THROW(maxosc::ConfigError, "Invalid value for --max-attempts: " << opts.max_attempts);
    }

    if (!opts.mode.empty() && !maxosc::mode_from_string(opts.mode, &config->osc.mode))
    {
        MXO_THROW(maxosc::ConfigError, "Invalid value for --mode: " << opts.mode);
    }

    if (!opts.executor.empty() && !maxosc::backend_from_string(opts.executor, &config->executor.backend))
    {
        MXO_THROW(maxosc::ConfigError, "Invalid value for --executor: " << opts.executor);
    }

    if (!opts.log_dir.empty())
    {
        config->log_dir = opts.log_dir;
    }
}

int run(const Options& opts, const maxosc::Config& config)
{
    maxosc::TableName table;

    if (!maxosc::TableName::from_string(opts.table, &table))
    {
        MXO_THROW(maxosc::ConfigError, "Invalid table name '" << opts.table << "', expected DB.TABLE.");
    }

    auto executor = maxosc::Executor::create(config.executor);
    auto topology = maxosc::Topology::from_config(config, *executor);
    maxosc::SchemaChange change(config, *executor, *topology, table, opts.ddl, opts.dry_run);

    if (opts.resume)
    {
        change.resume();
    }

    {
        SignalWatcher watcher(change);
        change.run();
    }

    maxosc::Report report(change.job());

    if (opts.json)
    {
        std::cout << report.to_json().to_string(maxosc::Json::Format::PRETTY) << std::endl;
    }
    else
    {
        std::cout << report.to_string() << std::flush;
    }

    return report.exit_code();
}
}

int main(int argc, char** argv)
{
    std::ios::sync_with_stdio();

    Options opts;

    if (!parse_options(argc, argv, &opts))
    {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    // Before any threads are created, so that they all inherit the mask.
    SignalWatcher::block_signals();

    int rc = EXIT_USAGE;

    try
    {
        auto config = maxosc::Config::load(opts.config_file);
        apply_overrides(opts, &config);

        const char* logdir = config.log_dir.empty() ? nullptr : config.log_dir.c_str();
        maxosc::Log log("maxosc", logdir, nullptr,
                        logdir ? MXO_LOG_TARGET_FS : MXO_LOG_TARGET_STDERR);

        mxo_log_set_syslog_enabled(config.syslog);

        if (opts.verbose)
        {
            mxo_log_set_priority_enabled(LOG_INFO, true);
        }

        try
        {
            rc = run(opts, config);
        }
        catch (const maxosc::ConfigError& e)
        {
            MXO_ERROR("%s", e.what());
        }
        catch (const maxosc::TopologyError& e)
        {
            MXO_ERROR("%s", e.what());
        }
        catch (const maxosc::Exception& e)
        {
            MXO_ERROR("%s", e.error_msg().c_str());
            rc = EXIT_FAILURE;
        }
    }
    catch (const maxosc::ConfigError& e)
    {
        // Logged to standard error, the log has not been initialized yet.
        fprintf(stderr, "%s\n", e.what());
    }
    catch (const std::runtime_error& e)
    {
        fprintf(stderr, "%s\n", e.what());
    }

    return rc;
}
