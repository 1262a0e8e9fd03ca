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

#define MXO_MODULE_NAME "config"

#include <maxosc/config.hh>

#include <cerrno>
#include <cstdlib>
#include <functional>
#include <map>

#include <maxosc/assert.hh>
#include <maxosc/errors.hh>
#include <maxosc/ini.hh>
#include <maxosc/log.hh>
#include <maxosc/process.hh>
#include <maxosc/regex.hh>
#include <maxosc/string.hh>

using std::string;
using namespace maxosc::ini::map_result;

namespace
{

const char SECTION_MAIN[] = "maxosc";
const char SECTION_OSC[] = "osc";
const char SECTION_LAG[] = "lag";
const char TYPE_SERVER[] = "server";

/**
 * Turns the parsed INI map into a Config. Errors are collected so that the user sees
 * all of them at once.
 */
class Loader
{
public:
    Loader(maxosc::Config& config)
        : m_config(config)
    {
    }

    void load(const Configuration& ini);

    const std::vector<string>& errors() const
    {
        return m_errors;
    }

private:
    using Setter = std::function<bool (const string& value)>;
    using Setters = std::map<string, Setter>;

    void apply(const string& name, const ConfigSection& section, const Setters& setters);
    void add_server(const string& name, const ConfigSection& section);

    Setters main_setters();
    Setters osc_setters();
    Setters lag_setters();

    maxosc::Config&     m_config;
    std::vector<string> m_errors;
};

bool get_positive_int(const string& str, int* value)
{
    return maxosc::get_int(str, value) && *value > 0;
}

bool get_codes(const string& str, std::set<int>* codes)
{
    std::set<int> rval;

    for (const auto& piece : maxosc::split_trimmed(str, ','))
    {
        int code;

        if (!maxosc::get_int(piece, &code) || code < 0 || code > 255)
        {
            return false;
        }

        rval.insert(code);
    }

    *codes = std::move(rval);
    return true;
}

Loader::Setters Loader::main_setters()
{
    auto& c = m_config;

    return {
        {"executor", [&c](const string& v) {
             return maxosc::backend_from_string(v, &c.executor.backend);
         }},
        {"fleet_command", [&c](const string& v) {
             c.executor.fleet_command = v;
             return !maxosc::tokenize_args(v).empty();
         }},
        {"max_threads", [&c](const string& v) {
             return get_positive_int(v, &c.executor.max_threads);
         }},
        {"log_dir", [&c](const string& v) {
             c.log_dir = v;
             return true;
         }},
        {"syslog", [&c](const string& v) {
             return maxosc::get_bool(v, &c.syslog);
         }},
        {"credentials_file", [&c](const string& v) {
             c.credentials_file = v;
             return true;
         }},
        {"state_file", [&c](const string& v) {
             c.state_file = v;
             return true;
         }},
    };
}

Loader::Setters Loader::osc_setters()
{
    auto& c = m_config.osc;

    return {
        {"tool", [&c](const string& v) {
             c.tool = v;
             return !v.empty();
         }},
        {"mode", [&c](const string& v) {
             return maxosc::mode_from_string(v, &c.mode);
         }},
        {"command_timeout", [&c](const string& v) {
             return maxosc::get_suffixed_duration(v, &c.command_timeout) && c.command_timeout.count() > 0;
         }},
        {"success_codes", [&c](const string& v) {
             return get_codes(v, &c.success_codes) && !c.success_codes.empty();
         }},
        {"transient_codes", [&c](const string& v) {
             return get_codes(v, &c.transient_codes);
         }},
        {"transient_patterns", [&c](const string& v) {
             c.transient_patterns = v;
             return v.empty() || maxosc::Regex(v).valid();
         }},
        {"max_attempts", [&c](const string& v) {
             return get_positive_int(v, &c.max_attempts);
         }},
        {"backoff_initial", [&c](const string& v) {
             return maxosc::get_suffixed_duration(v, &c.backoff_initial);
         }},
        {"backoff_max", [&c](const string& v) {
             return maxosc::get_suffixed_duration(v, &c.backoff_max);
         }},
        {"backoff_multiplier", [&c](const string& v) {
             return maxosc::get_non_negative_decimal(v, &c.backoff_multiplier) && c.backoff_multiplier >= 1;
         }},
        {"extra_args", [&c](const string& v) {
             c.extra_args = maxosc::tokenize_args(v);
             return true;
         }},
    };
}

Loader::Setters Loader::lag_setters()
{
    auto& c = m_config.lag;

    return {
        {"command", [&c](const string& v) {
             c.check.command = v;
             return !maxosc::tokenize_args(v).empty();
         }},
        {"check_timeout", [&c](const string& v) {
             return maxosc::get_suffixed_duration(v, &c.check.timeout) && c.check.timeout.count() > 0;
         }},
        {"max_lag", [&c](const string& v) {
             return maxosc::get_suffixed_duration(v, &c.max_lag);
         }},
        {"wait_budget", [&c](const string& v) {
             return maxosc::get_suffixed_duration(v, &c.wait_budget);
         }},
        {"poll_interval", [&c](const string& v) {
             return maxosc::get_suffixed_duration(v, &c.poll_interval) && c.poll_interval.count() > 0;
         }},
    };
}

void Loader::apply(const string& name, const ConfigSection& section, const Setters& setters)
{
    for (const auto& kv : section.key_values)
    {
        auto it = setters.find(kv.first);

        if (it == setters.end())
        {
            m_errors.push_back(maxosc::string_printf("Unknown setting '%s' in section '%s' at line %i.",
                                                     kv.first.c_str(), name.c_str(), kv.second.lineno));
        }
        else if (!it->second(kv.second.value))
        {
            m_errors.push_back(maxosc::string_printf("Invalid value '%s' for '%s' in section '%s' at line %i.",
                                                     kv.second.value.c_str(), kv.first.c_str(),
                                                     name.c_str(), kv.second.lineno));
        }
    }
}

void Loader::add_server(const string& name, const ConfigSection& section)
{
    string address;
    int port = maxosc::Host::DEFAULT_PORT;
    auto role = maxosc::Host::Role::REPLICA;
    string credentials = maxosc::Host::DEFAULT_CREDENTIALS;

    Setters setters = {
        {"type", [](const string&) {
             return true;
         }},
        {"address", [&address](const string& v) {
             address = v;
             return !v.empty();
         }},
        {"port", [&port](const string& v) {
             return maxosc::get_int(v, &port) && port > 0 && port < 65536;
         }},
        {"role", [&role](const string& v) {
             return maxosc::role_from_string(v, &role);
         }},
        {"credentials", [&credentials](const string& v) {
             credentials = v;
             return !v.empty();
         }},
    };

    auto n_errors = m_errors.size();
    apply(name, section, setters);

    if (address.empty())
    {
        m_errors.push_back(maxosc::string_printf("Server '%s' at line %i has no address.",
                                                 name.c_str(), section.lineno));
    }
    else if (m_errors.size() == n_errors)
    {
        maxosc::Host host(address, port, role, credentials);

        if (host.is_valid())
        {
            m_config.servers.push_back(host);
        }
        else
        {
            m_errors.push_back(maxosc::string_printf("Server '%s' at line %i has an invalid address '%s'.",
                                                     name.c_str(), section.lineno, address.c_str()));
        }
    }
}

void Loader::load(const Configuration& ini)
{
    for (const auto& name : maxosc::ini::sections_in_file_order(ini))
    {
        const auto& section = ini.at(name);
        auto it = section.key_values.find("type");

        if (name == SECTION_MAIN)
        {
            apply(name, section, main_setters());
        }
        else if (name == SECTION_OSC)
        {
            apply(name, section, osc_setters());
        }
        else if (name == SECTION_LAG)
        {
            apply(name, section, lag_setters());
        }
        else if (it != section.key_values.end() && it->second.value == TYPE_SERVER)
        {
            add_server(name, section);
        }
        else
        {
            m_errors.push_back(maxosc::string_printf("Section '%s' at line %i is not a known section "
                                                     "and is not of type '%s'.",
                                                     name.c_str(), section.lineno, TYPE_SERVER));
        }
    }

    if (m_config.osc.backoff_max < m_config.osc.backoff_initial)
    {
        m_errors.push_back("'backoff_max' is smaller than 'backoff_initial'.");
    }

    if (m_config.servers.empty())
    {
        m_errors.push_back("No servers defined.");
    }
}

maxosc::Config build(ParseResult&& parsed)
{
    auto env_errors = maxosc::ini::substitute_env_vars(parsed.config);
    auto& errors = parsed.errors;
    errors.insert(errors.end(), env_errors.begin(), env_errors.end());

    maxosc::Config config;

    if (errors.empty())
    {
        Loader loader(config);
        loader.load(parsed.config);
        errors = loader.errors();
    }

    if (!errors.empty())
    {
        MXO_THROW(maxosc::ConfigError, maxosc::join(errors, "\n"));
    }

    return config;
}
}

namespace maxosc
{

const char* to_string(OscConfig::Mode mode)
{
    switch (mode)
    {
    case OscConfig::Mode::PER_HOST:
        return "per_host";

    case OscConfig::Mode::REPLICATED:
        return "replicated";
    }

    mxo_assert(!true);
    return "unknown";
}

bool mode_from_string(const std::string& str, OscConfig::Mode* mode)
{
    bool rval = true;

    if (str == "per_host")
    {
        *mode = OscConfig::Mode::PER_HOST;
    }
    else if (str == "replicated")
    {
        *mode = OscConfig::Mode::REPLICATED;
    }
    else
    {
        rval = false;
    }

    return rval;
}

bool get_suffixed_duration(const std::string& str, Duration* duration)
{
    size_t i = 0;

    while (i < str.length() && isdigit((unsigned char)str[i]))
    {
        ++i;
    }

    if (i == 0)
    {
        return false;
    }

    string digits = str.substr(0, i);
    string suffix = str.substr(i);
    errno = 0;
    long long value = strtoll(digits.c_str(), nullptr, 10);

    if (errno != 0)
    {
        return false;
    }

    bool rval = true;

    if (suffix.empty() || suffix == "s")
    {
        *duration = std::chrono::seconds(value);
    }
    else if (suffix == "ms")
    {
        *duration = std::chrono::milliseconds(value);
    }
    else if (suffix == "m")
    {
        *duration = std::chrono::minutes(value);
    }
    else if (suffix == "h")
    {
        *duration = std::chrono::hours(value);
    }
    else
    {
        rval = false;
    }

    return rval;
}

bool get_bool(const std::string& str, bool* value)
{
    auto s = lower_case_copy(str);
    bool rval = true;

    if (s == "true" || s == "yes" || s == "on" || s == "1")
    {
        *value = true;
    }
    else if (s == "false" || s == "no" || s == "off" || s == "0")
    {
        *value = false;
    }
    else
    {
        rval = false;
    }

    return rval;
}

// static
Config Config::load(const std::string& filename)
{
    MXO_INFO("Loading configuration from '%s'.", filename.c_str());
    return build(ini::parse_config_file_to_map(filename));
}

// static
Config Config::from_text(const std::string& text)
{
    return build(ini::parse_config_text_to_map(text));
}

std::string Config::state_file_for(const std::string& table) const
{
    string rval = state_file;
    substitute(rval, "%t", table);
    return rval;
}
}
