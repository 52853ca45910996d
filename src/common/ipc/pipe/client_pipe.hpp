//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
#define USBAD_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED

#include "ipc/ipc_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

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

/// Client side of a framed stream pipe.
///
/// After `Disconnected` event the pipe could be started again (f.e. to reconnect).
///
class ClientPipe
{
public:
    using Ptr = std::unique_ptr<ClientPipe>;

    struct Event final
    {
        struct Connected final
        {};
        struct Disconnected final
        {};
        struct Message final
        {
            Payload payload;

        };  // Message

        using Var = cetl::variant<Message, Connected, Disconnected>;

    };  // Event

    using EventHandler = std::function<int(const Event::Var&)>;

    ClientPipe(const ClientPipe&)                = delete;
    ClientPipe(ClientPipe&&) noexcept            = delete;
    ClientPipe& operator=(const ClientPipe&)     = delete;
    ClientPipe& operator=(ClientPipe&&) noexcept = delete;

    virtual ~ClientPipe() = default;

    CETL_NODISCARD virtual int start(EventHandler event_handler) = 0;
    CETL_NODISCARD virtual int send(const Payloads payloads)     = 0;

    /// Closes the connection (if any) without delivering `Disconnected` event.
    ///
    virtual void stop() = 0;

protected:
    ClientPipe() = default;

};  // ClientPipe

}  // namespace pipe
}  // namespace ipc
}  // namespace common
}  // namespace usbad

#endif  // USBAD_COMMON_IPC_PIPE_CLIENT_PIPE_HPP_INCLUDED
