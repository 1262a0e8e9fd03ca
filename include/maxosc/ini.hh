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
#include <map>
#include <string>
#include <vector>

namespace maxosc
{
namespace ini
{
using StringVector = std::vector<std::string>;

// Parse results in map form. Section and key names are unique and not empty.
// Other than that, no checking is done.
namespace map_result
{

struct ValueDef
{
    std::string value;
    int         lineno {-1};

    explicit ValueDef(std::string value, int lineno = -1);
};

struct ConfigSection
{
    std::map<std::string, ValueDef> key_values;
    int                             lineno {-1};
};

using Configuration = std::map<std::string, ConfigSection>;

struct ParseResult
{
    Configuration config;
    StringVector  errors;
};
}

/**
 * Parse configuration text. Duplicate sections, duplicate keys and syntax errors
 * end up in the error list, each mentioning the offending line.
 */
map_result::ParseResult parse_config_text_to_map(const std::string& config_text);

/**
 * Read and parse a configuration file.
 */
map_result::ParseResult parse_config_file_to_map(const std::string& config_file);

/**
 * Replace values of the form $NAME with the value of the environment variable NAME.
 *
 * @return Errors for every referenced variable that is not set
 */
StringVector substitute_env_vars(map_result::Configuration& config);

/**
 * Names of the sections in the order they appear in the text.
 */
StringVector sections_in_file_order(const map_result::Configuration& config);
}
}
