//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IPC_PIPE_SOCKET_SERVER_HPP_INCLUDED
#define USBAD_COMMON_IPC_PIPE_SOCKET_SERVER_HPP_INCLUDED

#include "client_context.hpp"
#include "io/io.hpp"
#include "io/socket_address.hpp"
#include "ipc/ipc_types.hpp"
#include "server_pipe.hpp"
#include "socket_base.hpp"
#include "usbad/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

#include <unordered_map>

namespace usbad
{
namespace common
{
namespace ipc
{
namespace pipe
{

class SocketServer final : public SocketBase, public ServerPipe
{
public:
    SocketServer(libcyphal::IExecutor& executor, const io::SocketAddress& address);

    SocketServer(const SocketServer&)                = delete;
    SocketServer(SocketServer&&) noexcept            = delete;
    SocketServer& operator=(const SocketServer&)     = delete;
    SocketServer& operator=(SocketServer&&) noexcept = delete;

    ~SocketServer() override;

    // ServerPipe
    //
    CETL_NODISCARD int start(EventHandler event_handler) override;
    CETL_NODISCARD int send(const ClientId client_id, const Payloads payloads) override;
    void               disconnect(const ClientId client_id) override;

private:
    CETL_NODISCARD int makeSocketHandle();
    void               handleAccept();
    void               handleClientRequest(const ClientId client_id);
    ClientContext*     tryFindClientContext(const ClientId client_id);

    io::SocketAddress                                socket_address_;
    platform::IPosixExecutorExtension* const         posix_executor_ext_;
    io::OwnFd                                        server_fd_;
    ClientId                                         unique_client_id_counter_;
    EventHandler                                     event_handler_;
    libcyphal::IExecutor::Callback::Any              accept_callback_;
    std::unordered_map<ClientId, ClientContext::Ptr> client_id_to_context_;

};  // SocketServer

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IPC_PIPE_SOCKET_SERVER_HPP_INCLUDED
