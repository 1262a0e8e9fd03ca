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

#include <maxosc/host.hh>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <ostream>
#include <arpa/inet.h>

#include <maxosc/string.hh>

namespace
{

bool is_valid_port(int port)
{
    return 0 < port && port < (1 << 16);
}

// RFC 1123: labels of letters, digits and hyphens, not starting or ending with a hyphen.
bool is_valid_label(const std::string& label)
{
    auto invalid_char = [](unsigned char ch) {
            return !(std::isalnum(ch) || ch == '-');
        };

    return !label.empty() && label.length() <= 63
           && label.front() != '-' && label.back() != '-'
           && std::none_of(label.begin(), label.end(), invalid_char);
}
}

namespace maxosc
{

bool Host::is_valid_ipv4(const std::string& ip)
{
    in_addr addr;
    return inet_pton(AF_INET, ip.c_str(), &addr) == 1;
}

bool Host::is_valid_ipv6(const std::string& ip)
{
    in6_addr addr;
    return inet_pton(AF_INET6, ip.c_str(), &addr) == 1;
}

bool Host::is_valid_hostname(const std::string& hn)
{
    if (hn.empty() || hn.length() > 253)
    {
        return false;
    }

    // A trailing dot denotes the root and is allowed.
    std::string name = hn.back() == '.' ? hn.substr(0, hn.length() - 1) : hn;
    std::string::size_type start = 0;

    while (true)
    {
        auto dot = name.find('.', start);
        if (!is_valid_label(name.substr(start, dot == std::string::npos ? std::string::npos : dot - start)))
        {
            return false;
        }
        else if (dot == std::string::npos)
        {
            break;
        }

        start = dot + 1;
    }

    // An all-numeric dotted name is a malformed IPv4 address, not a host name.
    return name.find_first_not_of("0123456789.") != std::string::npos;
}

Host::Host(const std::string& addr, int port, Role role, const std::string& credentials)
    : m_address(addr)
    , m_port(port)
    , m_role(role)
    , m_credentials(credentials)
{
    set_type();
}

void Host::set_type()
{
    m_type = Type::Invalid;

    if (is_valid_port(m_port))
    {
        if (is_valid_ipv4(m_address))
        {
            m_type = Type::IPV4;
        }
        else if (is_valid_ipv6(m_address))
        {
            m_type = Type::IPV6;
        }
        else if (is_valid_hostname(m_address))
        {
            m_type = Type::HostName;
        }
    }
}

Host Host::from_string(const std::string& in, Role role, const std::string& credentials)
{
    std::string input = trimmed_copy(in);
    std::string address_part;
    std::string port_part;
    bool ok = !input.empty();

    if (ok && input.front() == '[')
    {
        // expecting [address]:port, where :port is optional
        auto last = input.find(']');
        if (last == std::string::npos)
        {
            ok = false;
        }
        else
        {
            address_part = input.substr(1, last - 1);

            if (last + 1 < input.length())
            {
                if (input[last + 1] == ':' && last + 2 < input.length())
                {
                    port_part = input.substr(last + 2);
                }
                else
                {
                    ok = false;
                }
            }
        }
    }
    else if (ok && is_valid_ipv6(input))
    {
        address_part = input;
    }
    else if (ok)
    {
        // expecting address:port, where :port is optional
        auto colon = input.find(':');
        address_part = input.substr(0, colon);

        if (colon != std::string::npos)
        {
            port_part = input.substr(colon + 1);
            ok = !port_part.empty();
        }
    }

    int port = DEFAULT_PORT;

    if (ok && !port_part.empty())
    {
        ok = get_int(port_part, &port) && std::isdigit((unsigned char)port_part.front());
    }

    Host rval(ok ? address_part : input, ok ? port : DEFAULT_PORT, role, credentials);

    if (!ok)
    {
        rval.m_type = Type::Invalid;
    }

    return rval;
}

std::string Host::name() const
{
    std::string rval = m_address;

    if (m_type == Type::HostName)
    {
        rval = m_address.substr(0, m_address.find('.'));
    }
    else if (m_type == Type::IPV6 && m_port != DEFAULT_PORT)
    {
        rval = "[" + m_address + "]";
    }

    if (m_port != DEFAULT_PORT)
    {
        rval += ":" + std::to_string(m_port);
    }

    return rval;
}

std::string Host::to_string() const
{
    return m_type == Type::IPV6 ?
           "[" + m_address + "]:" + std::to_string(m_port) :
           m_address + ":" + std::to_string(m_port);
}

Host Host::with_role(Role role) const
{
    Host rval(*this);
    rval.m_role = role;
    return rval;
}

std::ostream& operator<<(std::ostream& os, const Host& host)
{
    os << host.to_string();
    return os;
}

const char* to_string(Host::Role role)
{
    return role == Host::Role::MASTER ? "master" : "replica";
}

bool role_from_string(const std::string& str, Host::Role* role)
{
    std::string s = lower_case_copy(str);
    bool rval = true;

    if (s == "master" || s == "primary")
    {
        *role = Host::Role::MASTER;
    }
    else if (s == "replica" || s == "slave")
    {
        *role = Host::Role::REPLICA;
    }
    else
    {
        rval = false;
    }

    return rval;
}
}
