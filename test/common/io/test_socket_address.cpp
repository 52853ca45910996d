//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "io/socket_address.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>

namespace
{

using namespace usbad::common::io;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::AnyOf;
using testing::VariantWith;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestSocketAddress : public testing::Test
{
protected:
    using Result = SocketAddress::ParseResult;

    static SocketAddress parseOk(const std::string& str, const std::uint16_t port_hint)
    {
        auto maybe_socket_addr = SocketAddress::parse(str, port_hint);
        EXPECT_THAT(maybe_socket_addr, VariantWith<Result::Success>(_)) << "str='" << str << "'";
        if (const auto* const socket_address = cetl::get_if<Result::Success>(&maybe_socket_addr))
        {
            return *socket_address;
        }
        return {};
    }
};

// MARK: - Tests:

TEST_F(TestSocketAddress, parse_unix_domain)
{
    {
        const std::string test_path      = "/run/usbad/control.sock";
        const auto        socket_address = parseOk("unix:" + test_path, 0);
        const auto        raw            = socket_address.getRaw();

        const auto* const addr_un = reinterpret_cast<const sockaddr_un*>(raw.first);  // NOLINT
        EXPECT_TRUE(socket_address.isUnix());
        EXPECT_THAT(addr_un->sun_family, AF_UNIX);
        EXPECT_THAT(addr_un->sun_path, test_path);
        EXPECT_THAT(socket_address.toString(), "unix:" + test_path);
    }

    constexpr auto MaxPath = sizeof(sockaddr_un::sun_path);
    {
        const std::string too_long_path(MaxPath, 'x');
        EXPECT_THAT(SocketAddress::parse("unix:" + too_long_path, 0), VariantWith<Result::Failure>(EINVAL));
    }
}

TEST_F(TestSocketAddress, parse_abstract_unix_domain)
{
    {
        const std::string test_name      = "org.usbad.control";
        const auto        socket_address = parseOk("unix-abstract:" + test_name, 0);
        const auto        raw            = socket_address.getRaw();

        const auto* const addr_un = reinterpret_cast<const sockaddr_un*>(raw.first);  // NOLINT
        EXPECT_TRUE(socket_address.isUnix());
        EXPECT_THAT(addr_un->sun_family, AF_UNIX);
        EXPECT_THAT(addr_un->sun_path[0], '\0');
        EXPECT_THAT(addr_un->sun_path + 1, test_name);  // NOLINT
        EXPECT_THAT(socket_address.toString(), "unix-abstract:" + test_name);
    }

    // Name is one byte shorter than a path (because of the leading zero).
    constexpr auto MaxPath = sizeof(sockaddr_un::sun_path);
    {
        const std::string too_long_name(MaxPath - 1, 'x');
        EXPECT_THAT(SocketAddress::parse("unix-abstract:" + too_long_name, 0), VariantWith<Result::Failure>(EINVAL));
    }
}

TEST_F(TestSocketAddress, parse_ipv4)
{
    // Port hint is used when there is no explicit port.
    {
        const auto        socket_address = parseOk("192.168.1.123", 65432);
        const auto        raw            = socket_address.getRaw();
        const auto* const addr_in        = reinterpret_cast<const sockaddr_in*>(raw.first);  // NOLINT
        EXPECT_FALSE(socket_address.isUnix());
        EXPECT_THAT(addr_in->sin_family, AF_INET);
        EXPECT_THAT(ntohs(addr_in->sin_port), 65432);
        EXPECT_THAT(ntohl(addr_in->sin_addr.s_addr), 0xC0A8017B);
        EXPECT_THAT(socket_address.toString(), "192.168.1.123");
    }

    // Explicit port wins.
    {
        const auto        socket_address = parseOk("127.0.0.1:3240", 65432);
        const auto        raw            = socket_address.getRaw();
        const auto* const addr_in        = reinterpret_cast<const sockaddr_in*>(raw.first);  // NOLINT
        EXPECT_THAT(ntohs(addr_in->sin_port), 3240);
        EXPECT_THAT(ntohl(addr_in->sin_addr.s_addr), 0x7F000001);
    }

    EXPECT_THAT(SocketAddress::parse("127.0.0.1:65536", 0), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("127.0.0.1:80_80", 0), VariantWith<Result::Failure>(EINVAL));
}

TEST_F(TestSocketAddress, parse_ipv6)
{
    {
        const auto        socket_address = parseOk("[2001:db8::1]:8080", 0);
        const auto        raw            = socket_address.getRaw();
        const auto* const addr_in6       = reinterpret_cast<const sockaddr_in6*>(raw.first);  // NOLINT
        EXPECT_FALSE(socket_address.isUnix());
        EXPECT_THAT(addr_in6->sin6_family, AF_INET6);
        EXPECT_THAT(ntohs(addr_in6->sin6_port), 8080);
        EXPECT_THAT(addr_in6->sin6_addr.s6_addr,  //
                    testing::ElementsAre(0x20, 0x01, 0x0D, 0xB8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1));
        EXPECT_THAT(socket_address.toString(), "2001:db8::1");
    }

    // Missing closing bracket, and missing colon after it.
    EXPECT_THAT(SocketAddress::parse("[::1", 0), VariantWith<Result::Failure>(EINVAL));
    EXPECT_THAT(SocketAddress::parse("[::1]8080", 0), VariantWith<Result::Failure>(EINVAL));
}

TEST_F(TestSocketAddress, parse_wildcard)
{
    const auto        socket_address = parseOk("*:65432", 0);
    const auto        raw            = socket_address.getRaw();
    const auto* const addr_in6       = reinterpret_cast<const sockaddr_in6*>(raw.first);  // NOLINT
    EXPECT_THAT(addr_in6->sin6_family, AF_INET6);
    EXPECT_THAT(ntohs(addr_in6->sin6_port), 65432);
    EXPECT_THAT(addr_in6->sin6_addr.s6_addr,  //
                testing::ElementsAre(0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0));
}

TEST_F(TestSocketAddress, parse_host_name)
{
    const auto socket_address = parseOk("localhost:3240", 65432);
    const auto raw            = socket_address.getRaw();
    ASSERT_THAT(raw.first->sa_family, AnyOf(AF_INET, AF_INET6));
    if (raw.first->sa_family == AF_INET)
    {
        const auto* const addr_in = reinterpret_cast<const sockaddr_in*>(raw.first);  // NOLINT
        EXPECT_THAT(ntohs(addr_in->sin_port), 3240);
        EXPECT_THAT(socket_address.toString(), "127.0.0.1");
    }
    else
    {
        const auto* const addr_in6 = reinterpret_cast<const sockaddr_in6*>(raw.first);  // NOLINT
        EXPECT_THAT(ntohs(addr_in6->sin6_port), 3240);
        EXPECT_THAT(socket_address.toString(), "::1");
    }

    EXPECT_THAT(SocketAddress::parse("no-such-host.invalid", 0), VariantWith<Result::Failure>(_));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
