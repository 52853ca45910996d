//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "socket_base.hpp"

#include "ipc/ipc_types.hpp"
#include "usbad/platform/posix_utils.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <numeric>
#include <sys/socket.h>
#include <sys/uio.h>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace usbad
{
namespace common
{
namespace ipc
{
namespace pipe
{
namespace
{

constexpr std::uint32_t MsgHeaderSignature = 0x41425355;      // 'USBA'
constexpr std::size_t   MsgPayloadMaxSize  = 64ULL << 10ULL;  // 64 KB
constexpr std::size_t   MaxSendFragments   = 8;

}  // namespace

int SocketBase::send(const IoState& io_state, const Payloads payloads) const
{
    if (!io_state.fd.isValid())
    {
        return static_cast<int>(ErrorCode::NotConnected);
    }
    if (payloads.size() > MaxSendFragments)
    {
        logger_->error("SocketBase: Too many payload fragments (fd={}, count={}).",
                       io_state.fd.get(),
                       payloads.size());
        return EINVAL;
    }

    const std::size_t total_payload_size = std::accumulate(  // NOLINT
        payloads.begin(),
        payloads.end(),
        0ULL,
        [](const std::size_t acc, const Payload payload) {
            //
            return acc + payload.size();
        });
    if ((total_payload_size == 0) || (total_payload_size > MsgPayloadMaxSize))
    {
        logger_->error("SocketBase: Invalid msg payload size (fd={}, size={}).", io_state.fd.get(), total_payload_size);
        return EINVAL;
    }

    // Header and payload fragments go out with a single `sendmsg`,
    // so that a message is either completely queued in the socket or not at all.
    //
    const IoState::MsgHeader msg_header{MsgHeaderSignature, static_cast<std::uint32_t>(total_payload_size)};

    std::array<iovec, MaxSendFragments + 1> iov{};
    std::size_t                             iov_count = 0;
    iov[iov_count++] = {const_cast<IoState::MsgHeader*>(&msg_header), sizeof(msg_header)};  // NOLINT
    for (const auto payload : payloads)
    {
        iov[iov_count++] = {const_cast<std::uint8_t*>(payload.data()), payload.size()};  // NOLINT
    }

    msghdr msg{};
    msg.msg_iov    = iov.data();
    msg.msg_iovlen = iov_count;

    const std::size_t total_size = sizeof(msg_header) + total_payload_size;
    ssize_t           bytes_sent = 0;
    if (const int err = platform::posixSyscallError([&io_state, &msg, &bytes_sent] {
            //
            return bytes_sent = ::sendmsg(io_state.fd.get(), &msg, MSG_DONTWAIT | MSG_NOSIGNAL);
        }))
    {
        logger_->error("SocketBase: Failed to send msg (fd={}): {}.", io_state.fd.get(), std::strerror(err));
        return err;
    }
    if (static_cast<std::size_t>(bytes_sent) != total_size)
    {
        // The stream is now out of sync - the only way to recover is to reconnect.
        logger_->error("SocketBase: Partial msg send (fd={}, sent={}, total={}).",
                       io_state.fd.get(),
                       bytes_sent,
                       total_size);
        return EWOULDBLOCK;
    }
    return 0;
}

int SocketBase::receiveData(IoState& io_state) const
{
    // 1. Receive and validate the message header.
    //
    if (auto* const msg_header_ptr = cetl::get_if<IoState::MsgHeader>(&io_state.rx_msg_part))
    {
        auto& msg_header = *msg_header_ptr;

        CETL_DEBUG_ASSERT(io_state.rx_partial_size < sizeof(msg_header), "");
        if (io_state.rx_partial_size < sizeof(msg_header))
        {
            // Try read remaining part of the message header.
            //
            ssize_t bytes_read = 0;
            if (const auto err = platform::posixSyscallError([&io_state, &bytes_read, &msg_header] {
                    //
                    // No lint b/c of low-level (potentially partial) reading.
                    // NOLINTNEXTLINE(*-reinterpret-cast, *-pointer-arithmetic)
                    auto* const dst_buf = reinterpret_cast<std::uint8_t*>(&msg_header) + io_state.rx_partial_size;
                    //
                    const auto bytes_to_read = sizeof(msg_header) - io_state.rx_partial_size;
                    return bytes_read        = ::recv(io_state.fd.get(), dst_buf, bytes_to_read, MSG_DONTWAIT);
                }))
            {
                if ((err == EAGAIN) || (err == EWOULDBLOCK))
                {
                    // No data available yet - that's ok, the next attempt will try to read again.
                    //
                    logger_->trace("Msg header read would block (fd={}).", io_state.fd.get());
                    return 0;
                }
                logger_->error("Failed to read msg header (fd={}): {}.", io_state.fd.get(), std::strerror(err));
                return err;
            }

            // Progress the partial read state.
            //
            io_state.rx_partial_size += bytes_read;
            CETL_DEBUG_ASSERT(io_state.rx_partial_size <= sizeof(msg_header), "");
            if (bytes_read == 0)
            {
                logger_->debug("Zero bytes of msg header read - end of stream (fd={}).", io_state.fd.get());
                return -1;  // EOF
            }
            if (io_state.rx_partial_size < sizeof(msg_header))
            {
                // Not enough data yet - that's ok, the next attempt will try to read the rest.
                return 0;
            }

            // Validate the message header.
            // Just in case validate also the payload size to be within the reasonable limits.
            // Zero payload size is also considered invalid (b/c every message is a non-empty DSDL object).
            //
            if ((msg_header.signature != MsgHeaderSignature)  //
                || (msg_header.payload_size == 0) || (msg_header.payload_size > MsgPayloadMaxSize))
            {
                logger_->error("Invalid msg header read - closing invalid stream (fd={}, payload_size={}).",
                               io_state.fd.get(),
                               msg_header.payload_size);
                return EINVAL;
            }
        }

        // Message header has been read and validated.
        // Switch to the next part - message payload.
        //
        io_state.rx_partial_size = 0;
        auto payload_buffer = std::make_unique<std::uint8_t[]>(msg_header.payload_size);  // NOLINT(*-avoid-c-arrays)
        io_state.rx_msg_part.emplace<IoState::MsgPayload>(
            IoState::MsgPayload{msg_header.payload_size, std::move(payload_buffer)});
    }

    // 2. Read message payload.
    //
    if (auto* const msg_payload_ptr = cetl::get_if<IoState::MsgPayload>(&io_state.rx_msg_part))
    {
        auto& msg_payload = *msg_payload_ptr;

        CETL_DEBUG_ASSERT(io_state.rx_partial_size < msg_payload.size, "");
        if (io_state.rx_partial_size < msg_payload.size)
        {
            ssize_t bytes_read = 0;
            if (const auto err = platform::posixSyscallError([&io_state, &bytes_read, &msg_payload] {
                    //
                    std::uint8_t* const dst_buf = msg_payload.buffer.get() + io_state.rx_partial_size;
                    //
                    const auto bytes_to_read = msg_payload.size - io_state.rx_partial_size;
                    return bytes_read        = ::recv(io_state.fd.get(), dst_buf, bytes_to_read, MSG_DONTWAIT);
                }))
            {
                if ((err == EAGAIN) || (err == EWOULDBLOCK))
                {
                    // No data available yet - that's ok, the next attempt will try to read again.
                    //
                    logger_->trace("Msg payload read would block (fd={}).", io_state.fd.get());
                    return 0;
                }
                logger_->error("Failed to read msg payload (fd={}): {}.", io_state.fd.get(), std::strerror(err));
                return err;
            }

            // Progress the partial read state.
            //
            io_state.rx_partial_size += bytes_read;
            CETL_DEBUG_ASSERT(io_state.rx_partial_size <= msg_payload.size, "");
            if (bytes_read == 0)
            {
                logger_->debug("Zero bytes of msg payload read - end of stream (fd={}).", io_state.fd.get());
                return -1;  // EOF
            }
            if (io_state.rx_partial_size < msg_payload.size)
            {
                // Not enough data yet - that's ok, the next attempt will try to read the rest.
                return 0;
            }
        }

        // Message payload has been completely received.
        // Switch to the first part - the message header again.
        //
        // Payload buffer is moved out b/c the handler is allowed to close (and so destroy) this very stream.
        //
        const auto payload = std::move(msg_payload);
        io_state.resetRx();

        return io_state.on_rx_msg_payload(Payload{payload.buffer.get(), payload.size});
    }

    return 0;
}

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace usbad
