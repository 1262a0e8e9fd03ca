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
#include <sstream>
#include <stdexcept>
#include <syslog.h>

/**
 * If MXO_MODULE_NAME is defined before this file is included, then all
 * logged messages will be prefixed with that string enclosed in square brackets.
 * For instance, the following
 *
 *     #define MXO_MODULE_NAME "executor"
 *     #include <maxosc/log.hh>
 *
 * will lead to every logged message looking like:
 *
 *     2023-08-12 13:49:11   error  : [executor] The command could not be started
 */
#if !defined (MXO_MODULE_NAME)
#define MXO_MODULE_NAME nullptr
#endif

enum mxo_log_target_t
{
    MXO_LOG_TARGET_DEFAULT,
    MXO_LOG_TARGET_FS,      // File system
    MXO_LOG_TARGET_STDOUT,  // Standard output
    MXO_LOG_TARGET_STDERR,  // Standard error
};

extern int mxo_log_enabled_priorities;

/**
 * @brief Initialize the log
 *
 * This function must be called before any of the log function should be used.
 *
 * @param ident     The syslog ident. If NULL, then the program name is used.
 * @param logdir    The directory for the log file. If NULL, file output is discarded.
 * @param filename  The name of the log-file. If NULL, the program name will be used.
 * @param target    Logging target
 *
 * @return true if succeed, otherwise false
 */
bool mxo_log_init(const char* ident, const char* logdir, const char* filename, mxo_log_target_t target);

/**
 * @brief Finalize the log
 *
 * A successful call to @c mxo_log_init() should be followed by a call
 * to this function before the process exits.
 */
void mxo_log_finish();

/**
 * @brief Has the log been initialized.
 */
bool mxo_log_inited();

/**
 * Enable/disable a particular syslog priority.
 *
 * @param priority  One of the LOG_ERR etc. constants from sys/syslog.h.
 * @param enabled   True if the priority should be enabled, false if it should be disabled.
 *
 * @return True if the priority was valid, false otherwise.
 */
bool mxo_log_set_priority_enabled(int priority, bool enabled);

/**
 * Query whether a particular syslog priority is enabled.
 */
inline bool mxo_log_is_priority_enabled(int priority)
{
    return ((mxo_log_enabled_priorities & (1 << priority)) != 0) || (priority == LOG_ALERT);
}

/**
 * Enable/disable mirroring of the messages to syslog.
 */
void mxo_log_set_syslog_enabled(bool enabled);

/**
 * Convert log level to string
 */
const char* mxo_log_level_to_string(int level);

/**
 * Log a message of a particular priority.
 *
 * @param priority One of the syslog constants: LOG_ERR, LOG_WARNING, ...
 * @param modname  The name of the module.
 * @param file     The name of the file where the message was logged.
 * @param line     The line where the message was logged.
 * @param function The function where the message was logged.
 * @param format   The printf format of the following arguments.
 * @param ...      Optional arguments according to the format.
 *
 * @return 0 for success, non-zero otherwise.
 */
int mxo_log_message(int priority,
                    const char* modname,
                    const char* file,
                    int line,
                    const char* function,
                    const char* format,
                    ...) mxo_attribute((format(printf, 6, 7)));

/**
 * Log an error, warning, notice, info, or debug message.
 *
 * @attention Should typically not be called directly. Use some of the
 *            MXO_ERROR, MXO_WARNING, etc. macros instead.
 */
#define MXO_LOG_MESSAGE(priority, format, ...) \
    (mxo_log_is_priority_enabled(priority) \
     ? mxo_log_message(priority, MXO_MODULE_NAME, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__) \
     : 0)

/**
 * MXO_ALERT   To be used when the process is about to go down.
 * MXO_ERROR   For errors.
 * MXO_WARNING For warnings.
 * MXO_NOTICE  For messages deemed important, e.g. job state transitions.
 * MXO_INFO    For information of value when investigating some problem.
 * MXO_DEBUG   For debugging messages during development.
 */
#define MXO_ALERT(format, ...)   MXO_LOG_MESSAGE(LOG_ALERT, format, ##__VA_ARGS__)
#define MXO_ERROR(format, ...)   MXO_LOG_MESSAGE(LOG_ERR, format, ##__VA_ARGS__)
#define MXO_WARNING(format, ...) MXO_LOG_MESSAGE(LOG_WARNING, format, ##__VA_ARGS__)
#define MXO_NOTICE(format, ...)  MXO_LOG_MESSAGE(LOG_NOTICE, format, ##__VA_ARGS__)
#define MXO_INFO(format, ...)    MXO_LOG_MESSAGE(LOG_INFO, format, ##__VA_ARGS__)

#if defined (SS_DEBUG)
#define MXO_DEBUG(format, ...) MXO_LOG_MESSAGE(LOG_DEBUG, format, ##__VA_ARGS__)
#else
#define MXO_DEBUG(format, ...)
#endif

namespace maxosc
{

/**
 * @class Log
 *
 * A simple utility RAII class where the constructor initializes the log and
 * the destructor finalizes it.
 */
class Log
{
    Log(const Log&) = delete;
    Log& operator=(const Log&) = delete;

public:
    Log(const char* ident, const char* logdir, const char* filename, mxo_log_target_t target)
    {
        if (!mxo_log_init(ident, logdir, filename, target))
        {
            throw std::runtime_error("Failed to initialize the log.");
        }
    }

    Log(mxo_log_target_t target = MXO_LOG_TARGET_STDOUT)
        : Log(nullptr, nullptr, nullptr, target)
    {
    }

    ~Log()
    {
        mxo_log_finish();
    }
};

// RAII class for setting and clearing the "scope" of the log messages. Adds the given name to log
// messages of the current thread as long as the object is alive.
class LogScope
{
public:
    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

    explicit LogScope(const std::string& name)
        : m_prev_scope(s_current_scope)
        , m_name(name)
    {
        s_current_scope = this;
    }

    ~LogScope()
    {
        s_current_scope = m_prev_scope;
    }

    static const char* current_scope()
    {
        return s_current_scope ? s_current_scope->m_name.c_str() : nullptr;
    }

private:
    LogScope*   m_prev_scope;
    std::string m_name;

    static thread_local LogScope* s_current_scope;
};

#define MXO_STREAM_LOG_HELPER(CMXOLOGLEVEL__, mxo_msg_str__) \
    do { \
        if (!mxo_log_is_priority_enabled(CMXOLOGLEVEL__)) \
        { \
            break; \
        } \
        thread_local std::ostringstream os; \
        os.str(std::string()); \
        os << mxo_msg_str__; \
        mxo_log_message(CMXOLOGLEVEL__, MXO_MODULE_NAME, __FILE__, __LINE__, \
                        __func__, "%s", os.str().c_str()); \
    } while (false)

#define MXO_SERROR(mxo_msg_str__)   MXO_STREAM_LOG_HELPER(LOG_ERR, mxo_msg_str__)
#define MXO_SWARNING(mxo_msg_str__) MXO_STREAM_LOG_HELPER(LOG_WARNING, mxo_msg_str__)
#define MXO_SNOTICE(mxo_msg_str__)  MXO_STREAM_LOG_HELPER(LOG_NOTICE, mxo_msg_str__)
#define MXO_SINFO(mxo_msg_str__)    MXO_STREAM_LOG_HELPER(LOG_INFO, mxo_msg_str__)
}
