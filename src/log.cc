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

#include <maxosc/log.hh>

#include <errno.h>
#include <sys/time.h>
#include <syslog.h>
#include <unistd.h>

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include <maxosc/logger.hh>
#include <maxosc/string.hh>

/**
 * Variable holding the enabled priorities information.
 */
int mxo_log_enabled_priorities = (1 << LOG_ERR) | (1 << LOG_NOTICE) | (1 << LOG_WARNING);

namespace
{

// BUFSIZ comes from the system. It equals with block size or its multiplication.
const int MAX_LOGSTRLEN = BUFSIZ;

const char PREFIX_EMERG[] = "emerg  : ";
const char PREFIX_ALERT[] = "alert  : ";
const char PREFIX_CRIT[] = "crit   : ";
const char PREFIX_ERROR[] = "error  : ";
const char PREFIX_WARNING[] = "warning: ";
const char PREFIX_NOTICE[] = "notice : ";
const char PREFIX_INFO[] = "info   : ";
const char PREFIX_DEBUG[] = "debug  : ";

const char* level_to_prefix(int level)
{
    switch (level)
    {
    case LOG_EMERG:
        return PREFIX_EMERG;

    case LOG_ALERT:
        return PREFIX_ALERT;

    case LOG_CRIT:
        return PREFIX_CRIT;

    case LOG_ERR:
        return PREFIX_ERROR;

    case LOG_WARNING:
        return PREFIX_WARNING;

    case LOG_NOTICE:
        return PREFIX_NOTICE;

    case LOG_INFO:
        return PREFIX_INFO;

    case LOG_DEBUG:
        return PREFIX_DEBUG;

    default:
        return PREFIX_ERROR;
    }
}

struct this_unit
{
    bool                           do_syslog {false};
    std::string                    syslog_identifier;
    std::unique_ptr<maxosc::Logger> sLogger;
} this_unit;

std::string format_timestamp(const struct timeval& tv)
{
    struct tm tm;
    localtime_r(&tv.tv_sec, &tm);

    char buf[64];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d   ",
             tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

int log_message(int priority, const char* zModname, const std::string& message)
{
    int level = priority & LOG_PRIMASK;

    // The log format looks as follows:
    //
    // timestamp   prefix : [\[module\] ][(scope); ]message
    //
    // where
    //   timestamp   :  The timestamp when the message was logged.
    //   prefix      :  debug, info, warning, etc.
    //   module      :  The module logging; in practice the current value of MXO_MODULE_NAME.
    //   scope       :  The scope of the message; explicitly set in code using LogScope.
    //   message     :  The actual message, with newlines escaped.
    struct timeval now;
    gettimeofday(&now, NULL);

    std::string body;

    if (zModname)
    {
        body += "[";
        body += zModname;
        body += "] ";
    }

    if (auto zScope = maxosc::LogScope::current_scope())
    {
        body += "(";
        body += zScope;
        body += "); ";
    }

    std::string streamlined_message = message;    // I.e. no newlines.
    maxosc::substitute(streamlined_message, "\n", "\\n");
    body += streamlined_message;

    if ((int)body.length() > MAX_LOGSTRLEN)
    {
        body.resize(MAX_LOGSTRLEN);
    }

    // Debug messages are never logged into syslog
    if (this_unit.do_syslog && level != LOG_DEBUG)
    {
        syslog(priority, "%s", body.c_str());
    }

    std::string log_line = format_timestamp(now);
    log_line += level_to_prefix(level);
    log_line += body;
    log_line += '\n';

    int err = 0;

    if (this_unit.sLogger)
    {
        err = this_unit.sLogger->write(log_line.c_str(), log_line.length()) ? 0 : -1;
    }
    else
    {
        // Not initialized, which only happens in tools that log before parsing their
        // arguments. Standard error is the only sensible destination.
        fputs(log_line.c_str(), stderr);
    }

    return err;
}
}

namespace maxosc
{
thread_local LogScope* LogScope::s_current_scope = nullptr;
}

bool mxo_log_init(const char* ident, const char* logdir, const char* filename, mxo_log_target_t target)
{
    if (mxo_log_inited())
    {
        fprintf(stderr, "The log has already been initialized.\n");
        return false;
    }

    // A NULL logdir with MXO_LOG_TARGET_STDOUT is the common case in tests and
    // tools; /dev/null as the default allows total suppression of file logging.
    std::string filepath = "/dev/null";

    if (logdir)
    {
        std::string suffix;

        if (!filename)
        {
            suffix = program_invocation_short_name;
            suffix += ".log";
        }
        else
        {
            suffix = filename;
        }

        filepath = std::string(logdir) + "/" + suffix;
    }

    if (!ident)
    {
        ident = program_invocation_short_name;
    }

    switch (target)
    {
    case MXO_LOG_TARGET_FS:
    case MXO_LOG_TARGET_DEFAULT:
        this_unit.sLogger = maxosc::FileLogger::create(filepath);
        break;

    case MXO_LOG_TARGET_STDOUT:
        this_unit.sLogger = maxosc::FDLogger::create(filepath, STDOUT_FILENO);
        break;

    case MXO_LOG_TARGET_STDERR:
        this_unit.sLogger = maxosc::FDLogger::create(filepath, STDERR_FILENO);
        break;
    }

    if (this_unit.sLogger)
    {
        this_unit.syslog_identifier = ident;
        maxosc::Logger::set_ident(ident);
        openlog(this_unit.syslog_identifier.c_str(), LOG_PID | LOG_ODELAY, LOG_USER);
    }

    return this_unit.sLogger != nullptr;
}

void mxo_log_finish()
{
    closelog();
    this_unit.sLogger.reset();
}

bool mxo_log_inited()
{
    return this_unit.sLogger != nullptr;
}

void mxo_log_set_syslog_enabled(bool enabled)
{
    this_unit.do_syslog = enabled;
}

const char* mxo_log_level_to_string(int level)
{
    switch (level)
    {
    case LOG_EMERG:
        return "emergency";

    case LOG_ALERT:
        return "alert";

    case LOG_CRIT:
        return "critical";

    case LOG_ERR:
        return "error";

    case LOG_WARNING:
        return "warning";

    case LOG_NOTICE:
        return "notice";

    case LOG_INFO:
        return "info";

    case LOG_DEBUG:
        return "debug";

    default:
        return "unknown";
    }
}

bool mxo_log_set_priority_enabled(int level, bool enable)
{
    bool rv = false;
    const char* text = (enable ? "enable" : "disable");

    if ((level & ~LOG_PRIMASK) == 0)
    {
        int bit = (1 << level);

        if (enable)
        {
            mxo_log_enabled_priorities |= bit;
        }
        else
        {
            mxo_log_enabled_priorities &= ~bit;
        }

        MXO_INFO("The logging of %s messages has been %sd.", mxo_log_level_to_string(level), text);
        rv = true;
    }
    else
    {
        MXO_ERROR("Attempt to %s unknown syslog priority %d.", text, level);
    }

    return rv;
}

int mxo_log_message(int priority,
                    const char* modname,
                    const char* file,
                    int line,
                    const char* function,
                    const char* format,
                    ...)
{
    int err = 0;

    if ((priority & ~(LOG_PRIMASK | LOG_FACMASK)) == 0)     // Check that the priority is ok,
    {
        va_list valist;
        va_start(valist, format);
        int message_len = vsnprintf(NULL, 0, format, valist);
        va_end(valist);

        if (message_len >= 0)
        {
            std::string message(message_len + 1, '\0');

            va_start(valist, format);
            vsnprintf(&message[0], message_len + 1, format, valist);
            va_end(valist);

            message.resize(message_len);
            err = log_message(priority, modname, message);
        }
        else
        {
            err = -1;
        }
    }
    else
    {
        MXO_WARNING("Invalid syslog priority %d used at %s:%d in %s, message ignored.",
                    priority, file, line, function);
        err = -1;
    }

    return err;
}
