//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IPC_PIPE_SERVER_PIPE_HPP_INCLUDED
#define USBAD_COMMON_IPC_PIPE_SERVER_PIPE_HPP_INCLUDED

#include "ipc/ipc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace usbad
{
namespace common
{
namespace ipc
{
namespace pipe
{

/// Server side of a framed stream pipe.
///
/// Every accepted connection gets its own process-unique (never reused) id.
///
class ServerPipe
{
public:
    using Ptr = std::unique_ptr<ServerPipe>;

    using ClientId = std::size_t;

    struct Event final
    {
        struct Connected final
        {
            ClientId    client_id;
            std::string peer_address;

        };  // Connected

        struct Disconnected final
        {
            ClientId client_id;
        };

        struct Message final
        {
            ClientId client_id;
            Payload  payload;

        };  // Message

        using Var = cetl::variant<Message, Connected, Disconnected>;

    };  // Event

    using EventHandler = std::function<int(const Event::Var&)>;

    ServerPipe(const ServerPipe&)                = delete;
    ServerPipe(ServerPipe&&) noexcept            = delete;
    ServerPipe& operator=(const ServerPipe&)     = delete;
    ServerPipe& operator=(ServerPipe&&) noexcept = delete;

    virtual ~ServerPipe() = default;

    CETL_NODISCARD virtual int start(EventHandler event_handler)                       = 0;
    CETL_NODISCARD virtual int send(const ClientId client_id, const Payloads payloads) = 0;

    /// Closes connection of the given client.
    ///
    /// Closing is initiated by the server side, so no `Disconnected` event is delivered for it.
    ///
    virtual void disconnect(const ClientId client_id) = 0;

protected:
    ServerPipe() = default;

};  // ServerPipe

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IPC_PIPE_SERVER_PIPE_HPP_INCLUDED
