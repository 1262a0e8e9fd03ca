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

#include <maxosc/json.hh>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <unistd.h>

#include <maxosc/log.hh>
#include <maxosc/string.hh>

using std::string;

namespace
{
const char key_not_found[] = "Key '%s' was not found in json data.";

const char* json_type_to_string(const json_t* json)
{
    switch (json_typeof(json))
    {
    case JSON_OBJECT:
        return "object";

    case JSON_ARRAY:
        return "array";

    case JSON_STRING:
        return "string";

    case JSON_INTEGER:
        return "integer";

    case JSON_REAL:
        return "real";

    case JSON_TRUE:
    case JSON_FALSE:
        return "boolean";

    case JSON_NULL:
        return "null";
    }

    return "unknown";
}
}

namespace maxosc
{

std::string json_dump(const json_t* json, int flags)
{
    std::string rval;

    if (char* js = json_dumps(json, flags))
    {
        rval = js;
        free(js);
    }

    return rval;
}

Json::Json(Type type)
{
    switch (type)
    {
    case Type::OBJECT:
        m_obj = json_object();
        break;

    case Type::ARRAY:
        m_obj = json_array();
        break;

    case Type::STRING:
        m_obj = json_string("");
        break;

    case Type::INTEGER:
        m_obj = json_integer(0);
        break;

    case Type::REAL:
        m_obj = json_real(0.0);
        break;

    case Type::BOOL:
        m_obj = json_false();
        break;

    case Type::JSON_NULL:
        m_obj = json_null();
        break;

    case Type::UNDEFINED:
        break;
    }
}

Json::Json(json_t* obj)
    : m_obj(obj)
{
    json_incref(m_obj);
}

Json::~Json()
{
    json_decref(m_obj);
}

Json::Json(const Json& rhs)
    : m_obj(rhs.m_obj)
{
    json_incref(m_obj);
}

void Json::swap(Json& rhs) noexcept
{
    std::swap(m_obj, rhs.m_obj);
    std::swap(m_errormsg, rhs.m_errormsg);
}

Json& Json::operator=(const Json& rhs)
{
    Json tmp(rhs);
    swap(tmp);
    return *this;
}

Json::Json(Json&& rhs) noexcept
    : m_obj(rhs.m_obj)
{
    rhs.m_obj = nullptr;
}

Json& Json::operator=(Json&& rhs)
{
    Json tmp(std::move(rhs));
    swap(tmp);
    return *this;
}

bool Json::load(const string& filepath)
{
    json_error_t error;
    auto res = json_load_file(filepath.c_str(), 0, &error);
    if (res)
    {
        json_decref(m_obj);
        m_obj = res;
    }
    else
    {
        m_errormsg = string_printf("%s, line %i: %s", filepath.c_str(), error.line, error.text);
    }
    return res;
}

bool Json::save(const string& filepath, Format format)
{
    bool rval = false;
    string tmp = filepath + ".tmp";

    if (json_dump_file(m_obj, tmp.c_str(), (int)format) != 0)
    {
        m_errormsg = string_printf("Failed to write JSON to '%s': %d, %s",
                                   tmp.c_str(), errno, mxo_strerror(errno));
    }
    else if (rename(tmp.c_str(), filepath.c_str()) != 0)
    {
        m_errormsg = string_printf("Failed to rename '%s' to '%s': %d, %s",
                                   tmp.c_str(), filepath.c_str(), errno, mxo_strerror(errno));
        unlink(tmp.c_str());
    }
    else
    {
        rval = true;
    }

    return rval;
}

bool Json::contains(const string& key) const
{
    return json_object_get(m_obj, key.c_str());
}

Json Json::get_object(const string& key) const
{
    json_t* obj = json_object_get(m_obj, key.c_str());
    if (!obj)
    {
        m_errormsg = string_printf(key_not_found, key.c_str());
    }
    return Json(obj);
}

std::string Json::get_string() const
{
    return json_is_string(m_obj) ? json_string_value(m_obj) : "";
}

std::string Json::get_string(const string& key) const
{
    string rval;
    json_t* obj = json_object_get(m_obj, key.c_str());
    if (obj)
    {
        if (json_is_string(obj))
        {
            rval = json_string_value(obj);
        }
        else
        {
            m_errormsg = string_printf("'%s' is a JSON %s, not a JSON string.",
                                       key.c_str(), json_type_to_string(obj));
        }
    }
    else
    {
        m_errormsg = string_printf(key_not_found, key.c_str());
    }
    return rval;
}

int64_t Json::get_int() const
{
    return json_is_integer(m_obj) ? json_integer_value(m_obj) : 0;
}

int64_t Json::get_int(const string& key) const
{
    int64_t rval = 0;
    json_t* obj = json_object_get(m_obj, key.c_str());
    if (obj)
    {
        if (json_is_integer(obj))
        {
            rval = json_integer_value(obj);
        }
        else
        {
            m_errormsg = string_printf("'%s' is a JSON %s, not a JSON integer.",
                                       key.c_str(), json_type_to_string(obj));
        }
    }
    else
    {
        m_errormsg = string_printf(key_not_found, key.c_str());
    }
    return rval;
}

bool Json::try_get_int(const string& key, int64_t* out) const
{
    bool rval = false;
    json_t* obj = json_object_get(m_obj, key.c_str());
    if (json_is_integer(obj))
    {
        *out = json_integer_value(obj);
        rval = true;
    }
    return rval;
}

bool Json::try_get_string(const string& key, std::string* out) const
{
    bool rval = false;
    json_t* obj = json_object_get(m_obj, key.c_str());
    if (json_is_string(obj))
    {
        *out = json_string_value(obj);
        rval = true;
    }
    return rval;
}

bool Json::try_get_bool(const string& key, bool* out) const
{
    bool rval = false;
    json_t* obj = json_object_get(m_obj, key.c_str());
    if (json_is_boolean(obj))
    {
        *out = json_boolean_value(obj);
        rval = true;
    }
    return rval;
}

std::vector<Json> Json::get_array_elems(const string& key) const
{
    std::vector<Json> rval;
    json_t* obj = json_object_get(m_obj, key.c_str());

    if (obj)
    {
        if (json_is_array(obj))
        {
            rval = Json(obj).get_array_elems();
        }
        else
        {
            m_errormsg = string_printf("'%s' is a JSON %s, not a JSON array.",
                                       key.c_str(), json_type_to_string(obj));
        }
    }
    else
    {
        m_errormsg = string_printf(key_not_found, key.c_str());
    }
    return rval;
}

std::vector<Json> Json::get_array_elems() const
{
    std::vector<Json> rval;

    if (type() == Type::ARRAY)
    {
        rval.reserve(json_array_size(m_obj));

        size_t index;
        json_t* elem;
        json_array_foreach(m_obj, index, elem)
        {
            rval.emplace_back(elem);
        }
    }

    return rval;
}

const std::string& Json::error_msg() const
{
    return m_errormsg;
}

bool Json::valid() const
{
    return m_obj;
}

Json::Type Json::type() const
{
    if (m_obj)
    {
        switch (json_typeof(m_obj))
        {
        case JSON_OBJECT:
            return Type::OBJECT;

        case JSON_ARRAY:
            return Type::ARRAY;

        case JSON_STRING:
            return Type::STRING;

        case JSON_INTEGER:
            return Type::INTEGER;

        case JSON_REAL:
            return Type::REAL;

        case JSON_TRUE:
        case JSON_FALSE:
            return Type::BOOL;

        case JSON_NULL:
            return Type::JSON_NULL;
        }
    }

    return Type::UNDEFINED;
}

void Json::set_object(const char* key, const Json& value)
{
    json_object_set(m_obj, key, value.m_obj);
}

void Json::set_string(const char* key, const string& value)
{
    json_t* str = json_stringn(value.data(), value.length());

    if (!str)
    {
        // Not valid UTF-8, which happens with captured program output. Keep the ASCII part.
        string ascii = value;
        for (auto& c : ascii)
        {
            if ((unsigned char)c > 0x7f || c == '\0')
            {
                c = '?';
            }
        }

        str = json_stringn(ascii.data(), ascii.length());
    }

    json_object_set_new(m_obj, key, str);
}

void Json::set_int(const char* key, int64_t value)
{
    json_object_set_new(m_obj, key, json_integer(value));
}

void Json::set_float(const char* key, double value)
{
    json_object_set_new(m_obj, key, json_real(value));
}

void Json::set_bool(const char* key, bool value)
{
    json_object_set_new(m_obj, key, json_boolean(value));
}

void Json::set_null(const char* key)
{
    json_object_set_new(m_obj, key, json_null());
}

void Json::add_array_elem(const Json& elem)
{
    json_array_append(m_obj, elem.m_obj);
}

json_t* Json::get_json() const
{
    return m_obj;
}

std::string Json::to_string(Format format) const
{
    return json_dump(m_obj, (int)format);
}

void Json::reset(json_t* obj)
{
    json_decref(m_obj);
    m_obj = obj;
}

bool Json::equal(const Json& other) const
{
    return json_equal(m_obj, other.m_obj);
}
}
