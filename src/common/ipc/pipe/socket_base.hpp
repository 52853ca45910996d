//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IPC_PIPE_SOCKET_BASE_HPP_INCLUDED
#define USBAD_COMMON_IPC_PIPE_SOCKET_BASE_HPP_INCLUDED

#include "io/io.hpp"
#include "ipc/ipc_types.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace usbad
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Common framing of both server and client stream sockets.
///
/// Every message on the wire is a fixed header (signature and payload size, host byte order)
/// followed by the payload bytes. Payloads are (re)assembled from partial reads.
///
class SocketBase
{
public:
    struct IoState final
    {
        struct MsgHeader final
        {
            std::uint32_t signature{0};
            std::uint32_t payload_size{0};
        };
        struct MsgPayload final
        {
            std::size_t                     size{0};
            std::unique_ptr<std::uint8_t[]> buffer;  // NOLINT(*-avoid-c-arrays)
        };
        using MsgPart = cetl::variant<MsgHeader, MsgPayload>;

        io::OwnFd                   fd;
        std::size_t                 rx_partial_size{0};
        MsgPart                     rx_msg_part{MsgHeader{}};
        std::function<int(Payload)> on_rx_msg_payload;

        void resetRx()
        {
            rx_partial_size = 0;
            rx_msg_part.emplace<MsgHeader>();
        }

    };  // IoState

    SocketBase(const SocketBase&)                = delete;
    SocketBase(SocketBase&&) noexcept            = delete;
    SocketBase& operator=(const SocketBase&)     = delete;
    SocketBase& operator=(SocketBase&&) noexcept = delete;

protected:
    SocketBase()  = default;
    ~SocketBase() = default;

    Logger& logger() const noexcept
    {
        return *logger_;
    }

    /// Sends the whole message (header and all payload fragments) without blocking.
    ///
    /// @return Zero on success, otherwise errno. A socket without room for the whole message
    ///         fails with `EWOULDBLOCK` - nothing is queued for later.
    ///
    CETL_NODISCARD int send(const IoState& io_state, const Payloads payloads) const;

    /// Receives available data, and delivers complete message payloads to `on_rx_msg_payload`.
    ///
    /// @return Zero if stream is still healthy, `-1` on end of stream, otherwise errno.
    ///
    CETL_NODISCARD int receiveData(IoState& io_state) const;

private:
    LoggerPtr logger_{getLogger("ipc")};

};  // SocketBase

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IPC_PIPE_SOCKET_BASE_HPP_INCLUDED
