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
#include <string>
#include <unordered_map>
#include <vector>

struct st_mysql;
struct st_mysql_res;

namespace maxosc
{

/**
 * A result set. Iterate the rows with next_row(), the first call moves to the first row.
 */
class QueryResult
{
public:
    QueryResult(const QueryResult&) = delete;
    QueryResult& operator=(const QueryResult&) = delete;

    explicit QueryResult(st_mysql_res* resultset);
    ~QueryResult();

    bool next_row();

    int64_t get_col_count() const;
    int64_t get_row_count() const;

    /**
     * @return Index of the named column or -1 if not found.
     */
    int64_t get_col_index(const std::string& col_name) const;

    /**
     * @return The value of the column on the current row. An empty string for NULL.
     */
    std::string get_string(int64_t column_ind) const;

    bool field_is_null(int64_t column_ind) const;

private:
    st_mysql_res*                            m_resultset;
    char**                                   m_rowdata {nullptr};
    std::unordered_map<std::string, int64_t> m_col_indexes;
};

/**
 * A connection to a MariaDB server.
 */
class MariaDB
{
public:
    MariaDB() = default;
    ~MariaDB();
    MariaDB(const MariaDB& rhs) = delete;
    MariaDB& operator=(const MariaDB& rhs) = delete;

    struct ConnectionSettings
    {
        std::string user;
        std::string password;

        std::string defaults_file;      // Option file to read the credentials from
        std::string defaults_group;     // Section of the option file, e.g. client

        int timeout {0};    // Connect, read and write timeout in seconds
    };

    static constexpr unsigned int INTERNAL_ERROR = 1;
    static constexpr unsigned int USER_ERROR = 2;

    /**
     * Open a new connection. An open connection is closed first.
     *
     * @return True on success.
     */
    bool open(const std::string& host, int port, const std::string& db = "");

    void close();

    bool is_open() const;

    /**
     * Run a query that returns a result set.
     *
     * @return The result or nullptr on error.
     */
    std::unique_ptr<QueryResult> query(const std::string& query);

    const char* error() const;
    int64_t     errornum() const;

    ConnectionSettings& connection_settings();

private:
    void clear_errors();

    st_mysql*          m_conn {nullptr};
    std::string        m_errormsg;
    int64_t            m_errornum {0};
    ConnectionSettings m_settings;
};
}
