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

#include <set>
#include <sstream>

#include "test_utils.hh"

using maxosc::Host;

namespace
{

void expect(const std::string& str, Host::Type type, const std::string& address = "", int port = 3306)
{
    Host host = Host::from_string(str);

    std::cout << str << " => " << host << " (" << (host.is_valid() ? "valid" : "invalid") << ")\n";

    TEST(host.type() == type, "'" << str << "' has the wrong type");

    if (type != Host::Type::Invalid)
    {
        TEST(host.address() == address, "'" << str << "' has the address " << host.address());
        TEST(host.port() == port, "'" << str << "' has the port " << host.port());
    }
}

void test_parsing()
{
    expect("db1001.eqiad.wmnet", Host::Type::HostName, "db1001.eqiad.wmnet");
    expect("db1001.eqiad.wmnet:3317", Host::Type::HostName, "db1001.eqiad.wmnet", 3317);
    expect("  localhost ", Host::Type::HostName, "localhost");
    expect("10.64.0.1", Host::Type::IPV4, "10.64.0.1");
    expect("10.64.0.1:3310", Host::Type::IPV4, "10.64.0.1", 3310);
    expect("::1", Host::Type::IPV6, "::1");
    expect("[::1]", Host::Type::IPV6, "::1");
    expect("[2620:0:861::1]:3311", Host::Type::IPV6, "2620:0:861::1", 3311);

    expect("", Host::Type::Invalid);
    expect("wrong_host.eqiad.wmnet", Host::Type::Invalid);
    expect("db1001:", Host::Type::Invalid);
    expect("db1001:abc", Host::Type::Invalid);
    expect("db1001:-1", Host::Type::Invalid);
    expect("db1001:70000", Host::Type::Invalid);
    expect("[::1", Host::Type::Invalid);
    expect("[::1]3306", Host::Type::Invalid);
    expect("-db1001", Host::Type::Invalid);
    expect("10.64.0.256", Host::Type::Invalid);
}

void test_names()
{
    TEST(Host("db1001.eqiad.wmnet").name() == "db1001", Host("db1001.eqiad.wmnet").name());
    TEST(Host("db1001.eqiad.wmnet", 3317).name() == "db1001:3317", Host("db1001.eqiad.wmnet", 3317).name());
    TEST(Host("10.64.0.1").name() == "10.64.0.1", Host("10.64.0.1").name());
    TEST(Host("::1", 3310).name() == "[::1]:3310", Host("::1", 3310).name());

    TEST(Host("db1001.eqiad.wmnet").to_string() == "db1001.eqiad.wmnet:3306", "to_string");
    TEST(Host("::1").to_string() == "[::1]:3306", "to_string of ipv6");

    std::ostringstream os;
    os << Host("10.64.0.1", 3310);
    TEST(os.str() == "10.64.0.1:3310", "streamed as " << os.str());
}

void test_identity()
{
    Host a("db1001.eqiad.wmnet", 3306, Host::Role::MASTER, "admin");
    Host b("db1001.eqiad.wmnet", 3306, Host::Role::REPLICA);
    Host c("db1001.eqiad.wmnet", 3307);

    TEST(a == b, "role and credentials are not part of the identity");
    TEST(a != c, "the port is part of the identity");
    TEST(a < c && !(c < a), "ordering");

    std::set<Host> hosts {a, b, c};
    TEST(hosts.size() == 2, "set has " << hosts.size() << " hosts");

    Host promoted = b.with_role(Host::Role::MASTER);
    TEST(promoted.role() == Host::Role::MASTER, "with_role");
    TEST(b.role() == Host::Role::REPLICA, "with_role modified the original");
    TEST(a.credentials() == "admin" && b.credentials() == Host::DEFAULT_CREDENTIALS, "credentials");
}

void test_roles()
{
    Host::Role role = Host::Role::REPLICA;

    TEST(maxosc::role_from_string("master", &role) && role == Host::Role::MASTER, "master");
    TEST(maxosc::role_from_string("Primary", &role) && role == Host::Role::MASTER, "primary");
    TEST(maxosc::role_from_string("replica", &role) && role == Host::Role::REPLICA, "replica");
    TEST(maxosc::role_from_string("slave", &role) && role == Host::Role::REPLICA, "slave");
    TEST(!maxosc::role_from_string("leader", &role), "leader");
    TEST(std::string(maxosc::to_string(Host::Role::MASTER)) == "master", "to_string");
}
}

int main()
{
    test_parsing();
    test_names();
    test_identity();
    test_roles();

    return maxosc::test::result();
}
