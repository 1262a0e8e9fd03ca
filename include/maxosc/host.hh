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

#include <iosfwd>
#include <string>

/** Host is a streamable value that represents one database server endpoint.
 */
namespace maxosc
{

class Host;

std::ostream& operator<<(std::ostream&, const Host& host);

class Host
{
public:
    enum class Role {MASTER, REPLICA};          // to_string() provided
    enum class Type {Invalid, HostName, IPV4, IPV6};
    static constexpr int DEFAULT_PORT = 3306;
    static constexpr const char* DEFAULT_CREDENTIALS = "client";

    Host() = default;   // type() returns Type::Invalid

    /**
     * @brief from_string
     * @param str.  A string parsed according to this format (the brackets are real brackets):
     *              addr | addr:port | [addr] | [addr]:port
     *              'addr' is a plain ipv4, ipv6 or host name.
     *              An ipv6 address with a port must use the format [ipv6]:port.
     * @param role         Role of the host in its topology.
     * @param credentials  Name of the section in the credentials file used for the host.
     * @return Host. Check with is_valid() that the input string could be parsed, and port is ok.
     */
    static Host from_string(const std::string& str,
                            Role role = Role::REPLICA,
                            const std::string& credentials = DEFAULT_CREDENTIALS);

    /**
     * Constructor. The passed in address and port are always set without modification,
     * regardless of validation results, and can be read back with the address() and port()
     * functions.
     */
    Host(const std::string& addr,
         int port = DEFAULT_PORT,
         Role role = Role::REPLICA,
         const std::string& credentials = DEFAULT_CREDENTIALS);

    Type               type() const;
    bool               is_valid() const;
    const std::string& address() const;
    int                port() const;
    Role               role() const;
    const std::string& credentials() const;

    /**
     * The short display name: the first label of a host name or the full IP address,
     * followed by :port when the port is not the default one.
     */
    std::string name() const;

    /**
     * The complete address:port form, with brackets around IPv6 addresses.
     */
    std::string to_string() const;

    /**
     * A copy of this host with a different role.
     */
    Host with_role(Role role) const;

    static bool is_valid_ipv4(const std::string& ip);
    static bool is_valid_ipv6(const std::string& ip);
    static bool is_valid_hostname(const std::string& hn);

private:
    void set_type();        // set m_type based on m_address and m_port

    std::string m_address;
    int         m_port {DEFAULT_PORT};
    Role        m_role {Role::REPLICA};
    std::string m_credentials {DEFAULT_CREDENTIALS};
    Type        m_type {Type::Invalid};
};

const char* to_string(Host::Role role);
bool        role_from_string(const std::string& str, Host::Role* role);

// impl below
inline Host::Type Host::type() const
{
    return m_type;
}

inline bool Host::is_valid() const
{
    return m_type != Type::Invalid;
}

inline const std::string& Host::address() const
{
    return m_address;
}

inline int Host::port() const
{
    return m_port;
}

inline Host::Role Host::role() const
{
    return m_role;
}

inline const std::string& Host::credentials() const
{
    return m_credentials;
}

// The identity of a host is its address and port, the role and credentials are attributes.
inline bool operator==(const Host& l, const Host& r)
{
    return l.port() == r.port() && l.address() == r.address();
}

inline bool operator!=(const Host& l, const Host& r)
{
    return !(l == r);
}

inline bool operator<(const Host& l, const Host& r)
{
    return l.address() < r.address() || (l.address() == r.address() && l.port() < r.port());
}
}
