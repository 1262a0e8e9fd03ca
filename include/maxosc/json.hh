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
#include <string>
#include <vector>
#include <jansson.h>

namespace maxosc
{

/**
 * Convenience function for dumping JSON into a string
 *
 * @param json  JSON to dump
 * @param flags Optional flags passed to the jansson json_dump function
 *
 * @return The JSON in string format
 */
std::string json_dump(const json_t* json, int flags = 0);

/**
 * Wrapper class for Jansson json-objects.
 */
class Json
{
public:

    enum class Format
    {
        NORMAL  = 0,                // JSON on one line
        COMPACT = JSON_COMPACT,     // As compact as possible
        PRETTY  = JSON_INDENT(4),   // Pretty-printed
    };

    enum class Type
    {
        OBJECT,
        ARRAY,
        STRING,
        INTEGER,
        REAL,
        BOOL,
        JSON_NULL,
        UNDEFINED
    };

    /**
     * Construct a new Json wrapper object. The contained object is initialized with the given type.
     *
     * @param type The type of the object to create
     */
    explicit Json(Type type = Type::OBJECT);

    ~Json();

    /**
     * Construct a new Json wrapper object. Increments reference count of obj.
     *
     * @param obj The object to manage
     */
    explicit Json(json_t* obj);

    Json(const Json& rhs);
    Json& operator=(const Json& rhs);

    Json(Json&& rhs) noexcept;
    Json& operator=(Json&& rhs);

    /**
     * Load data from a file.
     *
     * @param filepath Path to a JSON file that is loaded
     *
     * @return True on success
     */
    bool load(const std::string& filepath);

    /**
     * Save data to a file. The data is first written to a temporary file in the same
     * directory which is then renamed over the target, so a reader never sees a partial file.
     *
     * @param filepath Path to where the JSON file is stored
     * @param format   The format to store the file in
     *
     * @return True on success
     */
    bool save(const std::string& filepath, Format format = Format::PRETTY);

    bool contains(const std::string& key) const;

    /**
     * Get a JSON object. If the key doesn't exist, the returned object is not valid and
     * the error message is set.
     */
    Json get_object(const std::string& key) const;

    std::string get_string(const std::string& key) const;
    std::string get_string() const;

    int64_t get_int(const std::string& key) const;
    int64_t get_int() const;

    bool try_get_int(const std::string& key, int64_t* out) const;
    bool try_get_string(const std::string& key, std::string* out) const;
    bool try_get_bool(const std::string& key, bool* out) const;

    /**
     * Get JSON array elements
     *
     * @param key The key of the array
     *
     * @return The array elements, empty if the key does not exist or is not an array
     */
    std::vector<Json> get_array_elems(const std::string& key) const;
    std::vector<Json> get_array_elems() const;

    /**
     * Get latest error message.
     */
    const std::string& error_msg() const;

    bool valid() const;

    explicit operator bool() const
    {
        return valid();
    }

    Type type() const;

    void set_object(const char* key, const Json& value);
    void set_string(const char* key, const std::string& value);
    void set_int(const char* key, int64_t value);
    void set_float(const char* key, double value);
    void set_bool(const char* key, bool value);
    void set_null(const char* key);

    /**
     * Add an element to an array.
     */
    void add_array_elem(const Json& elem);

    json_t* get_json() const;

    std::string to_string(Format format = Format::PRETTY) const;

    void reset(json_t* obj = nullptr);

    /**
     * Check if the two objects are equal
     */
    bool equal(const Json& other) const;

private:
    json_t*             m_obj {nullptr};/**< Managed json-object */
    mutable std::string m_errormsg;     /**< Error message container */

    void swap(Json& rhs) noexcept;
};

static inline bool operator==(const Json& lhs, const Json& rhs)
{
    return lhs.equal(rhs);
}

static inline bool operator!=(const Json& lhs, const Json& rhs)
{
    return !lhs.equal(rhs);
}
}
