//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IPC_PIPE_CLIENT_CONTEXT_HPP_INCLUDED
#define USBAD_COMMON_IPC_PIPE_CLIENT_CONTEXT_HPP_INCLUDED

#include "io/io.hpp"
#include "logging.hpp"
#include "server_pipe.hpp"
#include "socket_base.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

#include <memory>
#include <string>
#include <utility>

namespace usbad
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Server side state of a single accepted connection.
///
class ClientContext final
{
public:
    using Ptr = std::unique_ptr<ClientContext>;

    ClientContext(const ServerPipe::ClientId id, io::OwnFd&& fd, std::string peer_address, Logger& logger)
        : id_{id}
        , peer_address_{std::move(peer_address)}
        , logger_{logger}
    {
        CETL_DEBUG_ASSERT(fd.isValid(), "");

        logger_.trace("ClientContext(fd={}, id={}, peer='{}').", fd.get(), id_, peer_address_);
        io_state_.fd = std::move(fd);
    }

    ~ClientContext()
    {
        logger_.trace("~ClientContext(fd={}, id={}).", io_state_.fd.get(), id_);
    }

    ClientContext(const ClientContext&)                = delete;
    ClientContext(ClientContext&&) noexcept            = delete;
    ClientContext& operator=(const ClientContext&)     = delete;
    ClientContext& operator=(ClientContext&&) noexcept = delete;

    SocketBase::IoState& ioState() noexcept
    {
        return io_state_;
    }

    const std::string& peerAddress() const noexcept
    {
        return peer_address_;
    }

    void setCallback(libcyphal::IExecutor::Callback::Any&& fd_callback)
    {
        fd_callback_ = std::move(fd_callback);
    }

private:
    const ServerPipe::ClientId          id_;
    const std::string                   peer_address_;
    Logger&                             logger_;
    SocketBase::IoState                 io_state_;
    libcyphal::IExecutor::Callback::Any fd_callback_;

};  // ClientContext

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IPC_PIPE_CLIENT_CONTEXT_HPP_INCLUDED
