//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "client_manager.hpp"

#include "dsdl_helpers.hpp"
#include "engine_types.hpp"
#include "ipc/ipc_types.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "logging.hpp"

#include "usbad/protocol/Ack_0_1.hpp"
#include "usbad/protocol/Heartbeat_0_1.hpp"
#include "usbad/protocol/Hello_0_1.hpp"
#include "usbad/protocol/Message_0_1.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace clients
{
namespace
{

using Message_0_1 = usbad::protocol::Message_0_1;

class ClientManagerImpl final : public ClientManager
{
    using ServerPipe = common::ipc::pipe::ServerPipe;
    using ConnId     = ServerPipe::ClientId;

public:
    ClientManagerImpl(cetl::pmr::memory_resource& memory,
                      libcyphal::IExecutor&       executor,
                      ServerPipe::Ptr             server_pipe,
                      const libcyphal::Duration   heartbeat_period,
                      const libcyphal::Duration   heartbeat_timeout)
        : memory_{memory}
        , executor_{executor}
        , server_pipe_{std::move(server_pipe)}
        , heartbeat_period_{heartbeat_period}
        , heartbeat_timeout_{heartbeat_timeout}
        , heartbeat_sequence_{0}
    {
        CETL_DEBUG_ASSERT(server_pipe_, "");
    }

    ~ClientManagerImpl() override
    {
        heartbeat_callback_.reset();
        close_callback_.reset();
    }

    ClientManagerImpl(const ClientManagerImpl&)                = delete;
    ClientManagerImpl(ClientManagerImpl&&) noexcept            = delete;
    ClientManagerImpl& operator=(const ClientManagerImpl&)     = delete;
    ClientManagerImpl& operator=(ClientManagerImpl&&) noexcept = delete;

    // ClientManager

    CETL_NODISCARD int start(EventHandler event_handler) override
    {
        CETL_DEBUG_ASSERT(event_handler, "");
        event_handler_ = std::move(event_handler);

        heartbeat_callback_ = executor_.registerCallback([this](const auto& arg) {
            //
            handleHeartbeatTick(arg.approx_now);
        });
        close_callback_ = executor_.registerCallback([this](const auto&) {
            //
            closeBrokenConnections();
        });
        const bool is_scheduled = heartbeat_callback_.schedule(
            libcyphal::IExecutor::Callback::Schedule::Repeat{executor_.now() + heartbeat_period_, heartbeat_period_});
        (void) is_scheduled;

        return server_pipe_->start([this](const auto& pipe_event_var) {
            //
            return cetl::visit([this](const auto& pipe_event) { return handlePipeEvent(pipe_event); },
                               pipe_event_var);
        });
    }

    CETL_NODISCARD int send(const ClientId& client_id, const Command::Var& command) override
    {
        const auto conn_id = tryFindConnection(client_id);
        if (!conn_id)
        {
            return static_cast<int>(common::ipc::ErrorCode::NotConnected);
        }

        Message_0_1 message{&memory_};
        cetl::visit(cetl::make_overloaded(
                        [&message](const Command::Attach& attach) {
                            //
                            auto& msg_attach         = message.set_attach();
                            msg_attach.transition_id = attach.transition_id;
                            common::assignString(msg_attach.port_id, attach.port_id, common::MaxPortIdLength);
                        },
                        [&message](const Command::Detach& detach) {
                            //
                            auto& msg_detach         = message.set_detach();
                            msg_detach.transition_id = detach.transition_id;
                            common::assignString(msg_detach.port_id, detach.port_id, common::MaxPortIdLength);
                        }),
                    command);

        const int err = sendMessage(*conn_id, message);
        if (err != 0)
        {
            logger_->warn("Failed to send command to client (client='{}', conn={}): {}.",
                          client_id,
                          *conn_id,
                          std::strerror(err));
        }
        return err;
    }

    CETL_NODISCARD bool isConnected(const ClientId& client_id) const override
    {
        return tryFindConnection(client_id).has_value();
    }

    CETL_NODISCARD std::vector<ClientRecord> clients() const override
    {
        std::vector<ClientRecord> result;
        result.reserve(clients_.size());
        for (const auto& id_and_client : clients_)
        {
            const auto& client = id_and_client.second;
            result.push_back({id_and_client.first, client.conn_id.has_value(), client.last_seen});
        }
        return result;
    }

private:
    /// Accepted connection - possibly not yet identified by `Hello`.
    struct Connection final
    {
        std::string              peer_address;
        cetl::optional<ClientId> client_id;
        libcyphal::TimePoint     last_rx;
        bool                     is_broken{false};

    };  // Connection

    /// Client record outlives its connections.
    struct Client final
    {
        cetl::optional<ConnId>               conn_id;
        cetl::optional<libcyphal::TimePoint> last_seen;

    };  // Client

    // MARK: Pipe events

    int handlePipeEvent(const ServerPipe::Event::Connected& connected)
    {
        logger_->debug("New connection (conn={}, peer='{}').", connected.client_id, connected.peer_address);

        connections_[connected.client_id] = Connection{connected.peer_address, cetl::nullopt, executor_.now()};
        return 0;
    }

    int handlePipeEvent(const ServerPipe::Event::Disconnected& disconnected)
    {
        const auto it = connections_.find(disconnected.client_id);
        if (it == connections_.end())
        {
            return 0;
        }
        const auto client_id = std::move(it->second.client_id);
        connections_.erase(it);

        logger_->debug("Connection is closed by peer (conn={}).", disconnected.client_id);
        if (client_id)
        {
            detachConnection(*client_id, disconnected.client_id);
        }
        return 0;
    }

    int handlePipeEvent(const ServerPipe::Event::Message& msg)
    {
        const auto it = connections_.find(msg.client_id);
        if (it == connections_.end())
        {
            return EINVAL;
        }
        const ConnId conn_id = msg.client_id;
        auto&        conn    = it->second;
        const auto   now     = executor_.now();
        conn.last_rx         = now;

        Message_0_1 message{&memory_};
        const auto  result_size = common::tryDeserializePayload(msg.payload, message);
        if (!result_size.has_value())
        {
            logger_->warn("Malformed message - closing connection (conn={}).", conn_id);
            return EINVAL;
        }

        if (const auto* const hello = cetl::get_if<usbad::protocol::Hello_0_1>(&message.union_value))
        {
            return handleHello(conn_id, conn, *hello);
        }

        if (!conn.client_id)
        {
            logger_->warn("Message before `Hello` - closing connection (conn={}, peer='{}').",
                          conn_id,
                          conn.peer_address);
            return EINVAL;
        }
        const ClientId client_id      = *conn.client_id;
        clients_[client_id].last_seen = now;

        return cetl::visit(cetl::make_overloaded(
                               [this, &client_id](const usbad::protocol::Ack_0_1& ack) {
                                   //
                                   handleAck(client_id, ack);
                                   return 0;
                               },
                               [](const usbad::protocol::Heartbeat_0_1&) {
                                   //
                                   return 0;
                               },
                               [this, &client_id](const auto&) {
                                   //
                                   // Includes `Empty` (b/c Nunavut generated code needs a default case),
                                   // and host-only commands which a client is not supposed to send.
                                   logger_->warn("Unexpected message from client - ignored (client='{}').", client_id);
                                   return 0;
                               }),
                           message.union_value);
    }

    // MARK: Messages

    int handleHello(const ConnId conn_id, Connection& conn, const usbad::protocol::Hello_0_1& hello)
    {
        auto client_id = common::toString(hello.client_id);
        if (client_id.empty())
        {
            client_id = conn.peer_address;
        }
        if (client_id.empty())
        {
            logger_->warn("Anonymous `Hello` without peer address - closing connection (conn={}).", conn_id);
            return EINVAL;
        }

        if (conn.client_id)
        {
            if (*conn.client_id == client_id)
            {
                return 0;  // Repeated `Hello` - nothing to do.
            }
            logger_->warn("Client identity change is not allowed - closing connection (conn={}, client='{}').",
                          conn_id,
                          *conn.client_id);
            return EINVAL;
        }

        // Newest connection wins - close the previous one of the same client (if any).
        //
        auto& client = clients_[client_id];
        if (client.conn_id)
        {
            const ConnId old_conn_id = *client.conn_id;
            logger_->info("Client reconnected - closing its previous connection (client='{}', old_conn={}).",
                          client_id,
                          old_conn_id);

            connections_.erase(old_conn_id);
            server_pipe_->disconnect(old_conn_id);
            detachConnection(client_id, old_conn_id);
        }

        conn.client_id   = client_id;
        client.conn_id   = conn_id;
        client.last_seen = executor_.now();

        logger_->info("Client is connected (client='{}', conn={}, peer='{}', ver={}).",
                      client_id,
                      conn_id,
                      conn.peer_address,
                      static_cast<int>(hello.protocol_version));

        event_handler_(Event::Connected{client_id});
        return 0;
    }

    void handleAck(const ClientId& client_id, const usbad::protocol::Ack_0_1& ack)
    {
        Event::Ack event{client_id,
                         common::toString(ack.port_id),
                         ack.transition_id,
                         ack.success,
                         static_cast<int>(ack.error_code)};

        logger_->debug("Ack (client='{}', port='{}', tid={}, success={}, err={}).",
                       client_id,
                       event.port_id,
                       event.transition_id,
                       event.success,
                       event.error_code);

        event_handler_(event);
    }

    // MARK: Heartbeats

    void handleHeartbeatTick(const libcyphal::TimePoint now)
    {
        // First collect stale connections, b/c closing them modifies the map.
        //
        std::vector<ConnId> stale_conn_ids;
        for (const auto& id_and_conn : connections_)
        {
            if ((now - id_and_conn.second.last_rx) > heartbeat_timeout_)
            {
                stale_conn_ids.push_back(id_and_conn.first);
            }
        }
        for (const auto conn_id : stale_conn_ids)
        {
            logger_->info("Connection is silent for too long - closing it (conn={}).", conn_id);
            closeConnection(conn_id);
        }

        // Heartbeat all identified connections.
        //
        Message_0_1 message{&memory_};
        auto&       heartbeat = message.set_heartbeat();
        heartbeat.sequence    = ++heartbeat_sequence_;

        std::vector<ConnId> failed_conn_ids;
        for (const auto& id_and_conn : connections_)
        {
            if (id_and_conn.second.client_id)
            {
                if (0 != sendMessage(id_and_conn.first, message))
                {
                    failed_conn_ids.push_back(id_and_conn.first);
                }
            }
        }
        for (const auto conn_id : failed_conn_ids)
        {
            logger_->info("Failed to send heartbeat - closing connection (conn={}).", conn_id);
            closeConnection(conn_id);
        }
    }

    // MARK: Helpers

    int sendMessage(const ConnId conn_id, const Message_0_1& message)
    {
        const auto it = connections_.find(conn_id);
        if ((it == connections_.end()) || it->second.is_broken)
        {
            return static_cast<int>(common::ipc::ErrorCode::Disconnected);
        }

        const int err = common::tryPerformOnSerialized(message, [this, conn_id](const auto payload) {
            //
            return server_pipe_->send(conn_id, {{payload}});
        });
        if ((err != 0) && (err != static_cast<int>(common::ipc::ErrorCode::NotConnected)))
        {
            // The stream may be left with a partial frame, so nothing else is sent over it.
            // Closing is deferred b/c the sender is in the middle of its own state change.
            it->second.is_broken = true;
            broken_conn_ids_.push_back(conn_id);
            const bool is_scheduled =
                close_callback_.schedule(libcyphal::IExecutor::Callback::Schedule::Once{executor_.now()});
            (void) is_scheduled;
        }
        return err;
    }

    void closeBrokenConnections()
    {
        std::vector<ConnId> conn_ids;
        std::swap(conn_ids, broken_conn_ids_);
        for (const auto conn_id : conn_ids)
        {
            logger_->info("Failed to send to connection - closing it (conn={}).", conn_id);
            closeConnection(conn_id);
        }
    }

    void closeConnection(const ConnId conn_id)
    {
        const auto it = connections_.find(conn_id);
        if (it == connections_.end())
        {
            return;
        }
        const auto client_id = std::move(it->second.client_id);
        connections_.erase(it);
        server_pipe_->disconnect(conn_id);

        if (client_id)
        {
            detachConnection(*client_id, conn_id);
        }
    }

    /// Detaches the connection from its client record, and reports the client as disconnected.
    ///
    void detachConnection(const ClientId& client_id, const ConnId conn_id)
    {
        auto& client = clients_[client_id];
        if (!client.conn_id || (*client.conn_id != conn_id))
        {
            return;
        }
        client.conn_id.reset();

        logger_->info("Client is disconnected (client='{}', conn={}).", client_id, conn_id);
        event_handler_(Event::Disconnected{client_id});
    }

    cetl::optional<ConnId> tryFindConnection(const ClientId& client_id) const
    {
        const auto it = clients_.find(client_id);
        if (it == clients_.end())
        {
            return cetl::nullopt;
        }
        return it->second.conn_id;
    }

    common::LoggerPtr                   logger_{common::getLogger("clients")};
    cetl::pmr::memory_resource&         memory_;
    libcyphal::IExecutor&               executor_;
    ServerPipe::Ptr                     server_pipe_;
    const libcyphal::Duration           heartbeat_period_;
    const libcyphal::Duration           heartbeat_timeout_;
    std::uint32_t                       heartbeat_sequence_;
    EventHandler                        event_handler_;
    std::map<ConnId, Connection>        connections_;
    std::map<ClientId, Client>          clients_;
    libcyphal::IExecutor::Callback::Any heartbeat_callback_;
    libcyphal::IExecutor::Callback::Any close_callback_;
    std::vector<ConnId>                 broken_conn_ids_;

};  // ClientManagerImpl

}  // namespace

ClientManager::Ptr ClientManager::make(cetl::pmr::memory_resource&        memory,
                                       libcyphal::IExecutor&              executor,
                                       common::ipc::pipe::ServerPipe::Ptr server_pipe,
                                       const libcyphal::Duration          heartbeat_period,
                                       const libcyphal::Duration          heartbeat_timeout)
{
    return std::make_unique<ClientManagerImpl>(memory,
                                               executor,
                                               std::move(server_pipe),
                                               heartbeat_period,
                                               heartbeat_timeout);
}

}  // namespace clients
}  // namespace engine
}  // namespace daemon
}  // namespace usbad
