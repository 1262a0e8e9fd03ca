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
#include <maxosc/ini.hh>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

#include <ini.h>

#include <maxosc/string.hh>

using std::move;
using std::string;

namespace
{

struct RawValue
{
    string name;
    string value;
    int    lineno;
};

struct RawSection
{
    string                header;
    std::vector<RawValue> key_values;
    int                   lineno {-1};
};

// The input text together with the number of the line last handed to inih. The handler
// is always called for the line most recently read, which gives the line numbers without
// depending on how the library was compiled.
struct Reader
{
    const string&           text;
    size_t                  pos {0};
    int                     lineno {0};
    int                     header_lineno {0};  // Line of the latest [section]
    bool                    indented {false};   // The latest line starts with whitespace
    bool                    at_line_start {true};
    std::vector<RawSection> sections;
};

char* read_line(char* str, int num, void* stream)
{
    auto* reader = static_cast<Reader*>(stream);

    if (reader->pos >= reader->text.length() || num <= 1)
    {
        return nullptr;
    }

    size_t end = reader->text.find('\n', reader->pos);
    end = (end == string::npos) ? reader->text.length() : end + 1;

    size_t len = std::min<size_t>(end - reader->pos, num - 1);
    memcpy(str, reader->text.data() + reader->pos, len);
    str[len] = '\0';

    reader->pos += len;

    // inih reads long lines in several chunks.
    if (reader->at_line_start)
    {
        ++reader->lineno;
        reader->indented = str[0] == ' ' || str[0] == '\t';

        const char* p = str;
        while (*p == ' ' || *p == '\t')
        {
            ++p;
        }

        if (*p == '[')
        {
            reader->header_lineno = reader->lineno;
        }
    }

    reader->at_line_start = str[len - 1] == '\n';
    return str;
}

/**
 * Collects the sections and values in file order. Duplicates are allowed here, indented
 * continuation lines are concatenated to the value they continue.
 */
int collect_handler(void* userdata, const char* section, const char* name, const char* value)
{
    auto* reader = static_cast<Reader*>(userdata);
    auto& sections = reader->sections;
    int lineno = reader->lineno;

    if (sections.empty() || sections.back().header != section)
    {
        RawSection new_section;
        new_section.header = section;
        new_section.lineno = *section ? reader->header_lineno : lineno;
        sections.push_back(move(new_section));
    }

    if (name)
    {
        auto& curr = sections.back();
        bool is_continuation = reader->indented && !curr.key_values.empty()
            && curr.key_values.back().name == name;

        if (is_continuation)
        {
            curr.key_values.back().value += value ? value : "";
        }
        else
        {
            curr.key_values.push_back({name, value ? value : "", lineno});
        }
    }

    return 1;
}

string line_at(const string& text, int lineno)
{
    std::istringstream is(text);
    string line;

    for (int i = 0; i < lineno && std::getline(is, line); ++i)
    {
    }

    return line;
}
}

namespace maxosc
{
namespace ini
{

namespace map_result
{
ValueDef::ValueDef(std::string value, int lineno)
    : value(std::move(value))
    , lineno(lineno)
{
}
}

map_result::ParseResult parse_config_text_to_map(const std::string& config_text)
{
    using namespace map_result;
    ParseResult rval;
    Reader reader {config_text};

    int rc = ::ini_parse_stream(read_line, &reader, collect_handler, &reader);

    if (rc != 0)
    {
        if (rc > 0)
        {
            rval.errors.push_back(string_printf("Syntax error at line %i (%s).", rc,
                                                trimmed_copy(line_at(config_text, rc)).c_str()));
        }
        else
        {
            rval.errors.push_back("Parser memory allocation error.");
        }

        return rval;
    }

    for (auto& section_in : reader.sections)
    {
        if (section_in.header.empty())
        {
            rval.errors.push_back(string_printf("Settings starting at line %i are not inside a section.",
                                                section_in.lineno));
            continue;
        }

        auto it_s = rval.config.find(section_in.header);
        if (it_s != rval.config.end())
        {
            rval.errors.push_back(string_printf("Section name '%s' at line %i is a duplicate, "
                                                "previous definition at line %i.",
                                                section_in.header.c_str(), section_in.lineno,
                                                it_s->second.lineno));
            continue;
        }

        ConfigSection section_out;
        section_out.lineno = section_in.lineno;

        for (auto& kv_in : section_in.key_values)
        {
            auto it_kv = section_out.key_values.find(kv_in.name);
            if (it_kv != section_out.key_values.end())
            {
                rval.errors.push_back(string_printf(
                                          "Setting '%s' in section '%s' at line %i is a duplicate, "
                                          "previous definition at line %i.",
                                          kv_in.name.c_str(), section_in.header.c_str(), kv_in.lineno,
                                          it_kv->second.lineno));
            }
            else
            {
                section_out.key_values.emplace(move(kv_in.name), ValueDef(move(kv_in.value), kv_in.lineno));
            }
        }

        rval.config.emplace(move(section_in.header), move(section_out));
    }

    return rval;
}

map_result::ParseResult parse_config_file_to_map(const std::string& config_file)
{
    map_result::ParseResult rval;
    std::ifstream file(config_file);

    if (file)
    {
        std::stringstream ss;
        ss << file.rdbuf();
        rval = parse_config_text_to_map(ss.str());

        for (auto& err : rval.errors)
        {
            err = config_file + ": " + err;
        }
    }
    else
    {
        rval.errors.push_back(string_printf("Failed to open file '%s': %d, %s",
                                            config_file.c_str(), errno, mxo_strerror(errno)));
    }

    return rval;
}

StringVector substitute_env_vars(map_result::Configuration& config)
{
    StringVector errors;

    for (auto& section : config)
    {
        for (auto& kv : section.second.key_values)
        {
            auto& value = kv.second.value;

            if (value.length() > 1 && value[0] == '$')
            {
                const char* env = getenv(value.c_str() + 1);

                if (env)
                {
                    value = env;
                }
                else
                {
                    errors.push_back(string_printf("Setting '%s' in section '%s' at line %i refers to "
                                                   "the environment variable '%s', which is not set.",
                                                   kv.first.c_str(), section.first.c_str(),
                                                   kv.second.lineno, value.c_str() + 1));
                }
            }
        }
    }

    return errors;
}

StringVector sections_in_file_order(const map_result::Configuration& config)
{
    std::vector<std::pair<int, std::string>> ordered;

    for (const auto& section : config)
    {
        ordered.emplace_back(section.second.lineno, section.first);
    }

    std::sort(ordered.begin(), ordered.end());

    StringVector rval;
    for (auto& elem : ordered)
    {
        rval.push_back(move(elem.second));
    }

    return rval;
}
}
}
