//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_CLIENTS_CLIENT_MANAGER_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_CLIENTS_CLIENT_MANAGER_HPP_INCLUDED

#include "engine_types.hpp"
#include "ipc/pipe/server_pipe.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace clients
{

/// Owns connections of the remote clients.
///
/// A connection becomes a client connection only after its `Hello` message.
/// Only one connection per client id is kept - the newest one wins.
///
class ClientManager
{
public:
    using Ptr = std::unique_ptr<ClientManager>;

    struct Command final
    {
        struct Attach final
        {
            PortId       port_id;
            TransitionId transition_id;
        };
        struct Detach final
        {
            PortId       port_id;
            TransitionId transition_id;
        };

        using Var = cetl::variant<Attach, Detach>;

    };  // Command

    struct Event final
    {
        struct Connected final
        {
            ClientId client_id;
        };
        struct Disconnected final
        {
            ClientId client_id;
        };
        struct Ack final
        {
            ClientId     client_id;
            PortId       port_id;
            TransitionId transition_id;
            bool         success;
            int          error_code;

        };  // Ack

        using Var = cetl::variant<Connected, Disconnected, Ack>;

    };  // Event

    using EventHandler = std::function<void(const Event::Var&)>;

    struct ClientRecord final
    {
        ClientId                             client_id;
        bool                                 connected;
        cetl::optional<libcyphal::TimePoint> last_seen;

    };  // ClientRecord

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource&        memory,
                                   libcyphal::IExecutor&              executor,
                                   common::ipc::pipe::ServerPipe::Ptr server_pipe,
                                   const libcyphal::Duration          heartbeat_period,
                                   const libcyphal::Duration          heartbeat_timeout);

    ClientManager(const ClientManager&)                = delete;
    ClientManager(ClientManager&&) noexcept            = delete;
    ClientManager& operator=(const ClientManager&)     = delete;
    ClientManager& operator=(ClientManager&&) noexcept = delete;

    virtual ~ClientManager() = default;

    CETL_NODISCARD virtual int start(EventHandler event_handler) = 0;

    /// Sends the command to the currently connected client.
    ///
    /// Never blocks, and never retries.
    ///
    /// @return Zero if the command has been queued into the connection, otherwise errno
    ///         (`ENOTCONN` if the client is not connected).
    ///
    CETL_NODISCARD virtual int send(const ClientId& client_id, const Command::Var& command) = 0;

    CETL_NODISCARD virtual bool                      isConnected(const ClientId& client_id) const = 0;
    CETL_NODISCARD virtual std::vector<ClientRecord> clients() const                              = 0;

protected:
    ClientManager() = default;

};  // ClientManager

}  // namespace clients
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_CLIENTS_CLIENT_MANAGER_HPP_INCLUDED
