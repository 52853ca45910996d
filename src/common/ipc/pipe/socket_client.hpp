//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
#define USBAD_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED

#include "client_pipe.hpp"
#include "io/socket_address.hpp"
#include "ipc/ipc_types.hpp"
#include "socket_base.hpp"
#include "usbad/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

namespace usbad
{
namespace common
{
namespace ipc
{
namespace pipe
{

class SocketClient final : public SocketBase, public ClientPipe
{
public:
    SocketClient(libcyphal::IExecutor& executor, const io::SocketAddress& address);

    SocketClient(const SocketClient&)                = delete;
    SocketClient(SocketClient&&) noexcept            = delete;
    SocketClient& operator=(const SocketClient&)     = delete;
    SocketClient& operator=(SocketClient&&) noexcept = delete;

    ~SocketClient() override = default;

    // ClientPipe
    //
    CETL_NODISCARD int start(EventHandler event_handler) override;
    CETL_NODISCARD int send(const Payloads payloads) override;
    void               stop() override;

private:
    CETL_NODISCARD int makeSocketHandle();
    void               handleConnect();
    void               handleReceive();
    void               handleDisconnect();

    io::SocketAddress                        socket_address_;
    platform::IPosixExecutorExtension* const posix_executor_ext_;
    IoState                                  io_state_;
    bool                                     is_connected_;
    libcyphal::IExecutor::Callback::Any      socket_callback_;
    EventHandler                             event_handler_;

};  // SocketClient

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IPC_PIPE_SOCKET_CLIENT_HPP_INCLUDED
