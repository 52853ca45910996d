//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "control_server.hpp"

#include "assignment/assignment_types.hpp"
#include "assignment/orchestrator.hpp"
#include "common_helpers.hpp"
#include "dsdl_helpers.hpp"
#include "engine_types.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "logging.hpp"

#include "usbad/control/OpResult_0_1.hpp"
#include "usbad/control/PortStatus_0_1.hpp"
#include "usbad/control/Request_0_1.hpp"
#include "usbad/control/Response_0_1.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace control
{
namespace
{

using Request_0_1  = usbad::control::Request_0_1;
using Response_0_1 = usbad::control::Response_0_1;

constexpr std::size_t MaxResponseItems = 32;
constexpr std::size_t MaxMessageLength = 96;

std::uint8_t toDsdlStatus(const assignment::OpResult::Status status)
{
    using OpResult_0_1 = usbad::control::OpResult_0_1;

    switch (status)
    {
    case assignment::OpResult::Status::Accepted:
        return OpResult_0_1::STATUS_ACCEPTED;
    case assignment::OpResult::Status::Completed:
        return OpResult_0_1::STATUS_COMPLETED;
    case assignment::OpResult::Status::Rejected:
        return OpResult_0_1::STATUS_REJECTED;
    case assignment::OpResult::Status::Skipped:
        return OpResult_0_1::STATUS_SKIPPED;
    }
    return OpResult_0_1::STATUS_REJECTED;
}

std::uint8_t toDsdlRemoteState(const assignment::RemoteState remote_state)
{
    using PortStatus_0_1 = usbad::control::PortStatus_0_1;

    switch (remote_state)
    {
    case assignment::RemoteState::Detached:
        return PortStatus_0_1::REMOTE_DETACHED;
    case assignment::RemoteState::Attaching:
        return PortStatus_0_1::REMOTE_ATTACHING;
    case assignment::RemoteState::Attached:
        return PortStatus_0_1::REMOTE_ATTACHED;
    case assignment::RemoteState::Detaching:
        return PortStatus_0_1::REMOTE_DETACHING;
    }
    return PortStatus_0_1::REMOTE_DETACHED;
}

class ControlServerImpl final : public ControlServer
{
    using ServerPipe = common::ipc::pipe::ServerPipe;

public:
    ControlServerImpl(cetl::pmr::memory_resource& memory,
                      libcyphal::IExecutor&       executor,
                      ServerPipe::Ptr             server_pipe,
                      assignment::Orchestrator&   orchestrator)
        : memory_{memory}
        , executor_{executor}
        , server_pipe_{std::move(server_pipe)}
        , orchestrator_{orchestrator}
    {
        CETL_DEBUG_ASSERT(server_pipe_, "");
    }

    // ControlServer

    CETL_NODISCARD int start() override
    {
        return server_pipe_->start([this](const auto& pipe_event_var) {
            //
            return cetl::visit([this](const auto& pipe_event) { return handlePipeEvent(pipe_event); },
                               pipe_event_var);
        });
    }

private:
    int handlePipeEvent(const ServerPipe::Event::Connected& connected) const
    {
        logger_->debug("Control connection (conn={}, peer='{}').", connected.client_id, connected.peer_address);
        return 0;
    }

    int handlePipeEvent(const ServerPipe::Event::Disconnected& disconnected) const
    {
        logger_->debug("Control connection is closed (conn={}).", disconnected.client_id);
        return 0;
    }

    int handlePipeEvent(const ServerPipe::Event::Message& msg)
    {
        Request_0_1 request{&memory_};
        const auto  result_size = common::tryDeserializePayload(msg.payload, request);
        if (!result_size.has_value())
        {
            logger_->warn("Malformed control request - closing connection (conn={}).", msg.client_id);
            return EINVAL;
        }

        Response_0_1 response{&memory_};
        cetl::visit(cetl::make_overloaded(
                        [this, &response](const usbad::control::Assign_0_1& assign) {
                            //
                            const auto port_id   = common::toString(assign.port_id);
                            const auto client_id = common::toString(assign.client_id);
                            logger_->info("Control: assign (port='{}', client='{}').", port_id, client_id);
                            appendResult(response, orchestrator_.assign(port_id, client_id));
                        },
                        [this, &response](const usbad::control::AssignAll_0_1& assign_all) {
                            //
                            const auto client_id = common::toString(assign_all.client_id);
                            logger_->info("Control: assign all (client='{}', policy={}).",
                                          client_id,
                                          static_cast<int>(assign_all.policy));
                            for (const auto& result : orchestrator_.assignAll(client_id, toPolicy(assign_all.policy)))
                            {
                                appendResult(response, result);
                            }
                        },
                        [this, &response](const usbad::control::ForceFree_0_1& force_free) {
                            //
                            const auto port_id = common::toString(force_free.port_id);
                            logger_->info("Control: force free (port='{}').", port_id);
                            appendResult(response, orchestrator_.forceFree(port_id));
                        },
                        [this, &response](const usbad::control::ForceReattach_0_1& force_reattach) {
                            //
                            const auto port_id = common::toString(force_reattach.port_id);
                            logger_->info("Control: force reattach (port='{}').", port_id);
                            appendResult(response, orchestrator_.forceReattach(port_id));
                        },
                        [this, &response](const usbad::control::Snapshot_0_1&) {
                            //
                            fillSnapshot(response, orchestrator_.snapshot());
                        },
                        [this](const uavcan::primitive::Empty_1_0&) {
                            //
                            logger_->warn("Empty control request - ignored.");
                        }),
                    request.union_value);

        const int err = common::tryPerformOnSerializedInHeap(response, [this, &msg](const auto payload) {
            //
            return server_pipe_->send(msg.client_id, {{payload}});
        });
        if (err != 0)
        {
            logger_->warn("Failed to send control response (conn={}): {}.", msg.client_id, std::strerror(err));
        }
        return 0;
    }

    static cetl::optional<assignment::AssignAllPolicy> toPolicy(const std::uint8_t policy)
    {
        using AssignAll_0_1 = usbad::control::AssignAll_0_1;

        switch (policy)
        {
        case AssignAll_0_1::POLICY_SKIP_ASSIGNED:
            return assignment::AssignAllPolicy::SkipAssigned;
        case AssignAll_0_1::POLICY_OVERRIDE:
            return assignment::AssignAllPolicy::Override;
        default:
            return cetl::nullopt;
        }
    }

    void appendResult(Response_0_1& response, const assignment::OpResult& result)
    {
        logger_->debug("Control result (port='{}', status={}, error='{}', msg='{}').",
                       result.port_id,
                       static_cast<int>(toDsdlStatus(result.status)),
                       toString(result.error),
                       result.message);

        if (response.results.size() >= MaxResponseItems)
        {
            logger_->warn("Too many control results - truncating (port='{}').", result.port_id);
            return;
        }

        usbad::control::OpResult_0_1 item{&memory_};
        common::assignString(item.port_id, result.port_id, common::MaxPortIdLength);
        item.status     = toDsdlStatus(result.status);
        item.error_kind = static_cast<std::uint8_t>(result.error);
        common::assignString(item.message, result.message, MaxMessageLength);
        response.results.push_back(std::move(item));
    }

    void fillSnapshot(Response_0_1& response, const assignment::Snapshot& snapshot)
    {
        for (const auto& port : snapshot.ports)
        {
            if (response.ports.size() >= MaxResponseItems)
            {
                break;
            }

            usbad::control::PortStatus_0_1 item{&memory_};
            common::assignString(item.port_id, port.port_id, common::MaxPortIdLength);
            item.present    = port.present;
            item.bound      = port.bind_state == devices::BindState::BoundLocal;
            item.vendor_id  = port.descriptor.vendor_id;
            item.product_id = port.descriptor.product_id;
            common::assignString(item.product, port.descriptor.product, common::MaxClientIdLength);
            common::assignString(item.intended_client_id,
                                 port.intended_client.value_or(""),
                                 common::MaxClientIdLength);
            common::assignString(item.holder_client_id, port.holder_client.value_or(""), common::MaxClientIdLength);
            item.remote_state  = toDsdlRemoteState(port.remote_state);
            item.transition_id = port.transition_id;
            response.ports.push_back(std::move(item));
        }

        const auto now = executor_.now();
        for (const auto& client : snapshot.clients)
        {
            if (response.clients.size() >= MaxResponseItems)
            {
                break;
            }

            usbad::control::ClientStatus_0_1 item{&memory_};
            common::assignString(item.client_id, client.client_id, common::MaxClientIdLength);
            item.connected = client.connected;
            if (client.last_seen)
            {
                const auto ago_ms     = common::toMilliseconds(now - *client.last_seen);
                item.last_seen_ago_ms = static_cast<std::uint32_t>(
                    std::min<std::int64_t>(std::max<std::int64_t>(ago_ms, 1), std::numeric_limits<std::uint32_t>::max()));
            }
            response.clients.push_back(std::move(item));
        }

        common::assignString(response.assign_all_client_id,
                             snapshot.assign_all_client.value_or(""),
                             common::MaxClientIdLength);
    }

    common::LoggerPtr           logger_{common::getLogger("control")};
    cetl::pmr::memory_resource& memory_;
    libcyphal::IExecutor&       executor_;
    ServerPipe::Ptr             server_pipe_;
    assignment::Orchestrator&   orchestrator_;

};  // ControlServerImpl

}  // namespace

ControlServer::Ptr ControlServer::make(cetl::pmr::memory_resource&        memory,
                                       libcyphal::IExecutor&              executor,
                                       common::ipc::pipe::ServerPipe::Ptr server_pipe,
                                       assignment::Orchestrator&          orchestrator)
{
    return std::make_unique<ControlServerImpl>(memory, executor, std::move(server_pipe), orchestrator);
}

}  // namespace control
}  // namespace engine
}  // namespace daemon
}  // namespace usbad
