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

#include <maxosc/mariadb.hh>

#include <mysql.h>

#include <maxosc/assert.hh>
#include <maxosc/string.hh>

using std::string;

namespace
{
const char no_connection[] = "MySQL-connection is not open, cannot perform query.";
const char query_failed[] = "Query '%s' failed. Error %li: %s.";
const char no_data[] = "Query '%s' did not return any results.";
}

namespace maxosc
{

MariaDB::~MariaDB()
{
    close();
}

bool MariaDB::open(const std::string& host, int port, const std::string& db)
{
    mxo_assert(port >= 0);
    close();

    auto newconn = mysql_init(nullptr);
    if (!newconn)
    {
        m_errornum = INTERNAL_ERROR;
        m_errormsg = "Failed to allocate memory for MYSQL-handle.";
        return false;
    }

    // Checking the return value of mysql_optionsv is pointless, as it rarely checks the inputs.
    // The errors are reported when connecting.
    if (m_settings.timeout > 0)
    {
        auto timeout = m_settings.timeout;
        mysql_optionsv(newconn, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);
        mysql_optionsv(newconn, MYSQL_OPT_READ_TIMEOUT, &timeout);
        mysql_optionsv(newconn, MYSQL_OPT_WRITE_TIMEOUT, &timeout);
    }

    if (!m_settings.defaults_file.empty())
    {
        mysql_optionsv(newconn, MYSQL_READ_DEFAULT_FILE, m_settings.defaults_file.c_str());
    }

    if (!m_settings.defaults_group.empty())
    {
        mysql_optionsv(newconn, MYSQL_READ_DEFAULT_GROUP, m_settings.defaults_group.c_str());
    }

    // Empty user and password are given as null so that the option file values are used.
    const char* userc = m_settings.user.empty() ? nullptr : m_settings.user.c_str();
    const char* passwdc = m_settings.password.empty() ? nullptr : m_settings.password.c_str();
    const char* dbc = db.empty() ? nullptr : db.c_str();

    bool connection_success = false;
    if (host.empty() || host[0] != '/')
    {
        const char* hostc = host.empty() ? nullptr : host.c_str();
        connection_success = mysql_real_connect(newconn, hostc, userc, passwdc, dbc, port, nullptr, 0);
    }
    else
    {
        // The host looks like a unix socket.
        connection_success = mysql_real_connect(newconn, nullptr, userc, passwdc, dbc, 0, host.c_str(), 0);
    }

    if (connection_success)
    {
        clear_errors();
        m_conn = newconn;
    }
    else
    {
        m_errornum = mysql_errno(newconn);
        m_errormsg = string_printf("Connection to [%s]:%i failed. Error %li: %s",
                                   host.c_str(), port, m_errornum, mysql_error(newconn));
        mysql_close(newconn);
    }

    return connection_success;
}

void MariaDB::close()
{
    if (m_conn)
    {
        mysql_close(m_conn);
        m_conn = nullptr;
    }
}

bool MariaDB::is_open() const
{
    return m_conn != nullptr;
}

const char* MariaDB::error() const
{
    return m_errormsg.c_str();
}

int64_t MariaDB::errornum() const
{
    return m_errornum;
}

MariaDB::ConnectionSettings& MariaDB::connection_settings()
{
    return m_settings;
}

void MariaDB::clear_errors()
{
    m_errormsg.clear();
    m_errornum = 0;
}

std::unique_ptr<QueryResult> MariaDB::query(const std::string& query)
{
    std::unique_ptr<QueryResult> rval;

    if (m_conn)
    {
        if (mysql_query(m_conn, query.c_str()) == 0)
        {
            MYSQL_RES* result = mysql_store_result(m_conn);

            if (result)
            {
                rval.reset(new QueryResult(result));
                clear_errors();
            }
            else
            {
                m_errornum = USER_ERROR;
                m_errormsg = string_printf(no_data, query.c_str());
            }
        }
        else
        {
            m_errornum = mysql_errno(m_conn);
            m_errormsg = string_printf(query_failed, query.c_str(), m_errornum, mysql_error(m_conn));
        }
    }
    else
    {
        m_errornum = USER_ERROR;
        m_errormsg = no_connection;
    }

    return rval;
}

QueryResult::QueryResult(st_mysql_res* resultset)
    : m_resultset(resultset)
{
    auto columns = mysql_num_fields(m_resultset);
    MYSQL_FIELD* field_info = mysql_fetch_fields(m_resultset);

    for (int64_t column_index = 0; column_index < columns; column_index++)
    {
        m_col_indexes[field_info[column_index].name] = column_index;
    }
}

QueryResult::~QueryResult()
{
    mysql_free_result(m_resultset);
}

bool QueryResult::next_row()
{
    m_rowdata = mysql_fetch_row(m_resultset);
    return m_rowdata != nullptr;
}

int64_t QueryResult::get_col_count() const
{
    return mysql_num_fields(m_resultset);
}

int64_t QueryResult::get_row_count() const
{
    return mysql_num_rows(m_resultset);
}

int64_t QueryResult::get_col_index(const std::string& col_name) const
{
    auto iter = m_col_indexes.find(col_name);
    return (iter != m_col_indexes.end()) ? iter->second : -1;
}

std::string QueryResult::get_string(int64_t column_ind) const
{
    mxo_assert(m_rowdata && column_ind >= 0 && column_ind < get_col_count());
    char* data = m_rowdata[column_ind];
    return data ? data : "";
}

bool QueryResult::field_is_null(int64_t column_ind) const
{
    mxo_assert(m_rowdata && column_ind >= 0 && column_ind < get_col_count());
    return m_rowdata[column_ind] == nullptr;
}
}
