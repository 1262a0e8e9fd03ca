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

#include <maxosc/errors.hh>

namespace
{
struct
{
    maxosc::ErrorKind kind;
    const char*       name;
} const error_kinds[] =
{
    {maxosc::ErrorKind::NONE,           "none"          },
    {maxosc::ErrorKind::INVALID_TARGET, "invalid_target"},
    {maxosc::ErrorKind::TIMEOUT,        "timeout"       },
    {maxosc::ErrorKind::TRANSIENT,      "transient"     },
    {maxosc::ErrorKind::NON_RETRYABLE,  "non_retryable" },
    {maxosc::ErrorKind::LAG_PARSE,      "lag_parse"     },
    {maxosc::ErrorKind::ABORTED,        "aborted"       },
};
}

namespace maxosc
{

const char* to_string(ErrorKind kind)
{
    for (const auto& e : error_kinds)
    {
        if (e.kind == kind)
        {
            return e.name;
        }
    }

    return "unknown";
}

bool from_string(const std::string& str, ErrorKind* kind)
{
    for (const auto& e : error_kinds)
    {
        if (str == e.name)
        {
            *kind = e.kind;
            return true;
        }
    }

    return false;
}

bool is_retryable(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::TIMEOUT:
    case ErrorKind::TRANSIENT:
    case ErrorKind::LAG_PARSE:
        return true;

    default:
        return false;
    }
}
}
