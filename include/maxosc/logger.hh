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

#include <memory>
#include <mutex>
#include <string>

namespace maxosc
{

// Minimal logger interface
class Logger
{
public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    virtual ~Logger() = default;

    /**
     * Write a message to the log
     *
     * @param msg Message to write
     * @param len Length of message
     *
     * @return True on success
     */
    virtual bool write(const char* msg, int len) = 0;

    /**
     * Get the name of the log file
     */
    const char* filename() const
    {
        return m_filename.c_str();
    }

    /**
     * Set the ident written into the header and footer of file logs.
     */
    static void set_ident(const std::string& ident);

protected:
    Logger(const std::string& filename)
        : m_filename(filename)
    {
    }

    std::string m_filename;
};

class FileLogger : public Logger
{
public:
    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    /**
     * Create a new logger that writes to a file
     *
     * @param filename Log file to open
     *
     * @return New logger instance or an empty unique_ptr on error
     */
    static std::unique_ptr<Logger> create(const std::string& filename);

    /**
     * Close the log
     *
     * A footer is written to the log and the file is closed.
     */
    ~FileLogger();

    bool write(const char* msg, int len) override;

private:
    int        m_fd;
    std::mutex m_lock;

    FileLogger(int fd, const std::string& filename);
    bool write_header();
    bool write_footer(const char* suffix);
};

// Writes to an already open file descriptor, in practice stdout or stderr.
class FDLogger : public Logger
{
public:
    FDLogger(const FDLogger&) = delete;
    FDLogger& operator=(const FDLogger&) = delete;

    static std::unique_ptr<Logger> create(const std::string& filename, int fd)
    {
        return std::unique_ptr<Logger>(new FDLogger(filename, fd));
    }

    bool write(const char* msg, int len) override;

private:
    FDLogger(const std::string& filename, int fd)
        : Logger(filename)
        , m_fd(fd)
    {
    }

    int        m_fd;
    std::mutex m_lock;
};
}
