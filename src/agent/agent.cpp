//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "agent.hpp"

#include "common_helpers.hpp"
#include "dsdl_helpers.hpp"
#include "import_transport.hpp"
#include "ipc/pipe/client_pipe.hpp"
#include "logging.hpp"

#include "usbad/protocol/Ack_0_1.hpp"
#include "usbad/protocol/Attach_0_1.hpp"
#include "usbad/protocol/Detach_0_1.hpp"
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
#include <memory>
#include <string>
#include <utility>

namespace usbad
{
namespace agent
{
namespace
{

using Message_0_1 = usbad::protocol::Message_0_1;

class AgentImpl final : public Agent
{
    using ClientPipe = common::ipc::pipe::ClientPipe;

public:
    AgentImpl(cetl::pmr::memory_resource& memory,
              libcyphal::IExecutor&       executor,
              ClientPipe::Ptr             client_pipe,
              ImportTransport&            import_transport,
              std::string                 client_id,
              const libcyphal::Duration   reconnect_delay)
        : memory_{memory}
        , executor_{executor}
        , client_pipe_{std::move(client_pipe)}
        , import_transport_{import_transport}
        , client_id_{std::move(client_id)}
        , reconnect_delay_{reconnect_delay}
        , is_connected_{false}
    {
        CETL_DEBUG_ASSERT(client_pipe_, "");
    }

    AgentImpl(const AgentImpl&)                = delete;
    AgentImpl(AgentImpl&&) noexcept            = delete;
    AgentImpl& operator=(const AgentImpl&)     = delete;
    AgentImpl& operator=(AgentImpl&&) noexcept = delete;

    ~AgentImpl() override
    {
        reconnect_callback_.reset();
        client_pipe_->stop();
    }

    // Agent

    void start() override
    {
        reconnect_callback_ = executor_.registerCallback([this](const auto&) {
            //
            connect();
        });
        connect();
    }

    CETL_NODISCARD bool isConnected() const override
    {
        return is_connected_;
    }

private:
    void connect()
    {
        logger_->debug("Connecting to host...");

        const int err = client_pipe_->start([this](const auto& pipe_event_var) {
            //
            return cetl::visit([this](const auto& pipe_event) { return handlePipeEvent(pipe_event); },
                               pipe_event_var);
        });
        if (err != 0)
        {
            logger_->warn("Failed to connect to host - retrying in {}ms (err={}).",
                          common::toMilliseconds(reconnect_delay_),
                          err);
            scheduleReconnect();
        }
    }

    void scheduleReconnect()
    {
        const bool is_scheduled = reconnect_callback_.schedule(
            libcyphal::IExecutor::Callback::Schedule::Once{executor_.now() + reconnect_delay_});
        (void) is_scheduled;
    }

    // MARK: Pipe events

    int handlePipeEvent(const ClientPipe::Event::Connected&)
    {
        Message_0_1 message{&memory_};
        auto&       hello      = message.set_hello();
        hello.protocol_version = usbad::protocol::Hello_0_1::PROTOCOL_VERSION;
        common::assignString(hello.client_id, client_id_, common::MaxClientIdLength);

        if (const int err = sendMessage(message))
        {
            logger_->warn("Failed to send `Hello` (err={}).", err);
            return err;
        }

        is_connected_ = true;
        logger_->info("Connected to host (client='{}').", client_id_);
        return 0;
    }

    int handlePipeEvent(const ClientPipe::Event::Disconnected&)
    {
        is_connected_ = false;
        logger_->warn("Connection to host is lost - reconnecting in {}ms.", common::toMilliseconds(reconnect_delay_));

        scheduleReconnect();
        return 0;
    }

    int handlePipeEvent(const ClientPipe::Event::Message& msg)
    {
        Message_0_1 message{&memory_};
        const auto  result_size = common::tryDeserializePayload(msg.payload, message);
        if (!result_size.has_value())
        {
            logger_->warn("Malformed message from host - closing connection.");
            return EINVAL;
        }

        return cetl::visit(cetl::make_overloaded(
                               [this](const usbad::protocol::Attach_0_1& attach) {
                                   //
                                   const auto port_id = common::toString(attach.port_id);
                                   logger_->info("Host: attach (port='{}', tid={}).", port_id, attach.transition_id);
                                   return sendAck(port_id, attach.transition_id, import_transport_.attach(port_id));
                               },
                               [this](const usbad::protocol::Detach_0_1& detach) {
                                   //
                                   const auto port_id = common::toString(detach.port_id);
                                   logger_->info("Host: detach (port='{}', tid={}).", port_id, detach.transition_id);
                                   return sendAck(port_id, detach.transition_id, import_transport_.detach(port_id));
                               },
                               [this](const usbad::protocol::Heartbeat_0_1& heartbeat) {
                                   //
                                   // Echo proves to the host that we are alive.
                                   Message_0_1 reply{&memory_};
                                   reply.set_heartbeat().sequence = heartbeat.sequence;
                                   return sendMessage(reply);
                               },
                               [this](const auto&) {
                                   //
                                   logger_->warn("Unexpected message from host - ignored.");
                                   return 0;
                               }),
                           message.union_value);
    }

    int sendAck(const std::string& port_id, const std::uint64_t transition_id, const int result)
    {
        Message_0_1 message{&memory_};
        auto&       ack   = message.set_ack();
        ack.transition_id = transition_id;
        ack.success       = result == 0;
        ack.error_code    = static_cast<std::int32_t>(result);
        common::assignString(ack.port_id, port_id, common::MaxPortIdLength);

        logger_->debug("Ack (port='{}', tid={}, err={}).", port_id, transition_id, result);

        const int err = sendMessage(message);
        if (err != 0)
        {
            logger_->warn("Failed to send ack (port='{}', tid={}): {}.", port_id, transition_id, std::strerror(err));
        }
        return err;
    }

    int sendMessage(const Message_0_1& message)
    {
        return common::tryPerformOnSerialized(message, [this](const auto payload) {
            //
            return client_pipe_->send({{payload}});
        });
    }

    common::LoggerPtr                   logger_{common::getLogger("agent")};
    cetl::pmr::memory_resource&         memory_;
    libcyphal::IExecutor&               executor_;
    ClientPipe::Ptr                     client_pipe_;
    ImportTransport&                    import_transport_;
    const std::string                   client_id_;
    const libcyphal::Duration           reconnect_delay_;
    bool                                is_connected_;
    libcyphal::IExecutor::Callback::Any reconnect_callback_;

};  // AgentImpl

}  // namespace

Agent::Ptr Agent::make(cetl::pmr::memory_resource&        memory,
                       libcyphal::IExecutor&              executor,
                       common::ipc::pipe::ClientPipe::Ptr client_pipe,
                       ImportTransport&                   import_transport,
                       std::string                        client_id,
                       const libcyphal::Duration          reconnect_delay)
{
    return std::make_unique<AgentImpl>(memory,
                                       executor,
                                       std::move(client_pipe),
                                       import_transport,
                                       std::move(client_id),
                                       reconnect_delay);
}

}  // namespace agent
}  // namespace usbad
