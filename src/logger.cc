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

#include <maxosc/logger.hh>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <maxosc/stopwatch.hh>
#include <maxosc/string.hh>

/**
 * Error logging for the logger itself.
 *
 * For obvious reasons, it cannot use its own functions for reporting errors.
 */
#define LOG_ERROR(format, ...) do {fprintf(stderr, format, ##__VA_ARGS__);} while (false)

namespace
{

int open_fd(const std::string& filename)
{
    int fd = open(filename.c_str(),
                  O_WRONLY | O_APPEND | O_CREAT,
                  S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH);

    if (fd == -1)
    {
        LOG_ERROR("Failed to open file '%s': %d, %s\n", filename.c_str(), errno, mxo_strerror(errno));
    }

    return fd;
}

bool should_log_error()
{
    using std::chrono::seconds;
    static auto last_write = maxosc::Clock::now() - seconds(61);
    auto now = maxosc::Clock::now();
    bool rval = false;

    if (now - last_write >= seconds(60))
    {
        last_write = now;
        rval = true;
    }

    return rval;
}

struct this_unit
{
    static const int MAX_IDENT_LEN = 256;

    // Not a std::string, the loggers may be destroyed during static destruction.
    char ident[MAX_IDENT_LEN + 1];
} this_unit;

std::string get_ident()
{
    return this_unit.ident[0] ? this_unit.ident : program_invocation_short_name;
}

bool write_all(int fd, const char* msg, int len)
{
    bool rval = true;

    while (len > 0)
    {
        int rc;
        do
        {
            rc = ::write(fd, msg, len);
        }
        while (rc == -1 && errno == EINTR);

        if (rc == -1)
        {
            if (should_log_error())     // Coarse error suppression
            {
                LOG_ERROR("Failed to write to log: %d, %s\n", errno, mxo_strerror(errno));
            }

            rval = false;
            break;
        }

        len -= rc;
        msg += rc;
    }

    return rval;
}
}

namespace maxosc
{

// static
void Logger::set_ident(const std::string& ident)
{
    int len = ident.length();

    if (len > this_unit.MAX_IDENT_LEN)
    {
        len = this_unit.MAX_IDENT_LEN;
    }
    memcpy(this_unit.ident, ident.c_str(), len);
    this_unit.ident[len] = 0;
}

std::unique_ptr<Logger> FileLogger::create(const std::string& filename)
{
    std::unique_ptr<FileLogger> logger;
    int fd = open_fd(filename);

    if (fd != -1)
    {
        logger.reset(new(std::nothrow) FileLogger(fd, filename));

        if (logger)
        {
            logger->write_header();
        }
        else
        {
            ::close(fd);
        }
    }

    return logger;
}

FileLogger::FileLogger(int fd, const std::string& filename)
    : Logger(filename)
    , m_fd(fd)
{
}

FileLogger::~FileLogger()
{
    std::lock_guard<std::mutex> guard(m_lock);
    std::string suffix = get_ident() + " is shut down.";
    write_footer(suffix.c_str());
    ::close(m_fd);
}

bool FileLogger::write(const char* msg, int len)
{
    std::lock_guard<std::mutex> guard(m_lock);
    return write_all(m_fd, msg, len);
}

bool FileLogger::write_header()
{
    time_t t = time(NULL);
    struct tm tm;
    localtime_r(&t, &tm);

    char time_string[32];   // 26 would be enough, according to "man asctime".
    asctime_r(&tm, time_string);

    std::string header = MAKE_STR("\n\n" << get_ident() << "  " << m_filename << "  " << time_string);
    std::string line(header.length() - 3, '-');
    line += '\n';

    bool ok = write_all(m_fd, header.c_str(), header.length())
        && write_all(m_fd, line.c_str(), line.length());

    if (!ok)
    {
        LOG_ERROR("Error: Writing log header failed due to %d, %s\n", errno, mxo_strerror(errno));
    }

    return ok;
}

bool FileLogger::write_footer(const char* suffix)
{
    std::string footer = MAKE_STR(wall_time::to_string(wall_time::Clock::now()) << "   " << suffix << '\n');
    std::string line(footer.length() - 1, '-');
    line += '\n';

    bool ok = write_all(m_fd, footer.c_str(), footer.length())
        && write_all(m_fd, line.c_str(), line.length());

    if (!ok)
    {
        LOG_ERROR("Error: Writing log footer failed due to %d, %s\n", errno, mxo_strerror(errno));
    }

    return ok;
}

bool FDLogger::write(const char* msg, int len)
{
    std::lock_guard<std::mutex> guard(m_lock);
    return write_all(m_fd, msg, len);
}
}
