//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
#define USBAD_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED

#include "io.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <utility>

namespace usbad
{
namespace common
{
namespace io
{

/// Address of a stream socket endpoint.
///
/// Supported textual forms:
/// - `unix:<path>` - Unix domain socket bound to a file system path;
/// - `unix-abstract:<name>` - Linux abstract Unix domain socket;
/// - `*[:<port>]` - dual-stack wildcard (all IPv4 and IPv6 interfaces);
/// - `<ipv4>[:<port>]`, `[<ipv6>][:<port>]` or `<ipv6>` - numeric inet addresses;
/// - `<hostname>[:<port>]` - resolved via `getaddrinfo` (first result wins).
///
class SocketAddress final
{
public:
    struct ParseResult
    {
        using Failure = int;  // aka errno
        using Success = SocketAddress;
        using Var     = cetl::variant<Success, Failure>;
    };
    static ParseResult::Var parse(const std::string& str, const std::uint16_t port_hint);

    SocketAddress() noexcept;

    std::pair<const sockaddr*, socklen_t> getRaw() const noexcept;

    bool isUnix() const noexcept
    {
        return asGenericAddr().sa_family == AF_UNIX;
    }

    /// Formats the address back into textual form.
    ///
    /// Inet addresses are formatted without port (`host`), so that the result is stable
    /// across reconnects of the same peer. Unix peers are usually unnamed, hence `unix:`.
    ///
    std::string toString() const;

    struct SocketResult
    {
        using Failure = int;  // aka errno
        using Success = OwnFd;
        using Var     = cetl::variant<Success, Failure>;
    };
    SocketResult::Var socket(const int type) const;

    int                   bind(const OwnFd& socket_fd) const;
    int                   connect(const OwnFd& socket_fd) const;
    cetl::optional<OwnFd> accept(const OwnFd& socket_fd);

private:
    static void                             configureNoDelay(const OwnFd& fd);
    static cetl::optional<ParseResult::Var> tryParseAsUnixDomain(const std::string& str);
    static cetl::optional<ParseResult::Var> tryParseAsAbstractUnixDomain(const std::string& str);
    static int extractFamilyHostAndPort(const std::string& str, std::string& host, std::uint16_t& port);
    static cetl::optional<ParseResult::Success> tryParseAsWildcard(const std::string& host, const std::uint16_t port);
    static ParseResult::Var                     resolveHostName(const std::string& host, const std::uint16_t port);

    sockaddr& asGenericAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr&>(addr_storage_);
    }
    const sockaddr& asGenericAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr&>(addr_storage_);
    }
    sockaddr_un& asUnixAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_un&>(addr_storage_);
    }
    const sockaddr_un& asUnixAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr_un&>(addr_storage_);
    }
    sockaddr_in& asInetAddr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in&>(addr_storage_);
    }
    const sockaddr_in& asInetAddr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr_in&>(addr_storage_);
    }
    sockaddr_in6& asInet6Addr()
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<sockaddr_in6&>(addr_storage_);
    }
    const sockaddr_in6& asInet6Addr() const
    {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const sockaddr_in6&>(addr_storage_);
    }

    bool             is_wildcard_;
    socklen_t        addr_len_;
    sockaddr_storage addr_storage_;

};  // SocketAddress

}  // namespace io
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IO_SOCKET_ADDRESS_HPP_INCLUDED
