//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <usbad/sdk/daemon.hpp>

#include "dsdl_helpers.hpp"
#include "io/socket_address.hpp"
#include "ipc/pipe/client_pipe.hpp"
#include "ipc/pipe/socket_client.hpp"
#include "logging.hpp"

#include "usbad/control/Request_0_1.hpp"
#include "usbad/control/Response_0_1.hpp"

#include <usbad/platform/defines.hpp>

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace usbad
{
namespace sdk
{
namespace
{

using Request_0_1  = usbad::control::Request_0_1;
using Response_0_1 = usbad::control::Response_0_1;

OpResult::Status toStatus(const std::uint8_t status)
{
    using OpResult_0_1 = usbad::control::OpResult_0_1;

    switch (status)
    {
    case OpResult_0_1::STATUS_ACCEPTED:
        return OpResult::Status::Accepted;
    case OpResult_0_1::STATUS_COMPLETED:
        return OpResult::Status::Completed;
    case OpResult_0_1::STATUS_SKIPPED:
        return OpResult::Status::Skipped;
    default:
        return OpResult::Status::Rejected;
    }
}

OpResult::ErrorKind toErrorKind(const std::uint8_t error_kind)
{
    using OpResult_0_1 = usbad::control::OpResult_0_1;

    switch (error_kind)
    {
    case OpResult_0_1::ERROR_NONE:
        return OpResult::ErrorKind::None;
    case OpResult_0_1::ERROR_CONFIGURATION:
        return OpResult::ErrorKind::ConfigurationError;
    case OpResult_0_1::ERROR_TRANSPORT:
        return OpResult::ErrorKind::TransportError;
    case OpResult_0_1::ERROR_CLIENT_UNREACHABLE:
        return OpResult::ErrorKind::ClientUnreachable;
    case OpResult_0_1::ERROR_STORAGE:
        return OpResult::ErrorKind::StorageError;
    default:
        return OpResult::ErrorKind::InvariantViolation;
    }
}

PortStatus::RemoteState toRemoteState(const std::uint8_t remote_state)
{
    using PortStatus_0_1 = usbad::control::PortStatus_0_1;

    switch (remote_state)
    {
    case PortStatus_0_1::REMOTE_ATTACHING:
        return PortStatus::RemoteState::Attaching;
    case PortStatus_0_1::REMOTE_ATTACHED:
        return PortStatus::RemoteState::Attached;
    case PortStatus_0_1::REMOTE_DETACHING:
        return PortStatus::RemoteState::Detaching;
    default:
        return PortStatus::RemoteState::Detached;
    }
}

std::uint8_t toDsdlPolicy(const AssignAllPolicy policy)
{
    using AssignAll_0_1 = usbad::control::AssignAll_0_1;

    switch (policy)
    {
    case AssignAllPolicy::SkipAssigned:
        return AssignAll_0_1::POLICY_SKIP_ASSIGNED;
    case AssignAllPolicy::Override:
        return AssignAll_0_1::POLICY_OVERRIDE;
    default:
        return AssignAll_0_1::POLICY_DEFAULT;
    }
}

class DaemonImpl final : public Daemon
{
    using ClientPipe = common::ipc::pipe::ClientPipe;

public:
    DaemonImpl(cetl::pmr::memory_resource&      memory,
               platform::SingleThreadedExecutor& executor,
               const libcyphal::Duration        timeout)
        : memory_{memory}
        , executor_{executor}
        , timeout_{timeout}
        , logger_{common::getLogger("sdk")}
        , is_connected_{false}
        , is_disconnected_{false}
    {
    }

    DaemonImpl(const DaemonImpl&)                = delete;
    DaemonImpl(DaemonImpl&&) noexcept            = delete;
    DaemonImpl& operator=(const DaemonImpl&)     = delete;
    DaemonImpl& operator=(DaemonImpl&&) noexcept = delete;

    ~DaemonImpl() override
    {
        if (client_pipe_)
        {
            client_pipe_->stop();
        }
    }

    CETL_NODISCARD int start(const std::string& connection)
    {
        logger_->info("Connecting to daemon (connection='{}')...", connection);

        using ParseResult = common::io::SocketAddress::ParseResult;

        auto maybe_socket_address = common::io::SocketAddress::parse(connection, 0);
        if (const auto* const err = cetl::get_if<ParseResult::Failure>(&maybe_socket_address))
        {
            logger_->error("Failed to parse connection string ('{}'): {}.", connection, std::strerror(*err));
            return *err;
        }
        const auto socket_address = cetl::get<ParseResult::Success>(maybe_socket_address);
        client_pipe_              = std::make_unique<common::ipc::pipe::SocketClient>(executor_, socket_address);

        const int err = client_pipe_->start([this](const auto& pipe_event_var) {
            //
            return cetl::visit([this](const auto& pipe_event) { return handlePipeEvent(pipe_event); },
                               pipe_event_var);
        });
        if (err != 0)
        {
            logger_->error("Failed to start connection: {}.", std::strerror(err));
            return err;
        }

        const auto deadline = executor_.now() + timeout_;
        platform::waitPollingUntil(executor_, [this, deadline] {
            //
            return is_connected_ || is_disconnected_ || (executor_.now() >= deadline);
        });
        if (!is_connected_)
        {
            const int result = is_disconnected_ ? ECONNREFUSED : ETIMEDOUT;
            logger_->error("Failed to connect to daemon: {}.", std::strerror(result));
            return result;
        }

        logger_->debug("Connected to daemon.");
        return 0;
    }

    // Daemon

    CETL_NODISCARD OpResults::Var assign(const std::string& port_id, const std::string& client_id) override
    {
        Request_0_1 request{&memory_};
        auto&       assign = request.set_assign();
        common::assignString(assign.port_id, port_id, common::MaxPortIdLength);
        common::assignString(assign.client_id, client_id, common::MaxClientIdLength);
        return performOp(request);
    }

    CETL_NODISCARD OpResults::Var assignAll(const std::string& client_id, const AssignAllPolicy policy) override
    {
        Request_0_1 request{&memory_};
        auto&       assign_all = request.set_assign_all();
        common::assignString(assign_all.client_id, client_id, common::MaxClientIdLength);
        assign_all.policy = toDsdlPolicy(policy);
        return performOp(request);
    }

    CETL_NODISCARD OpResults::Var forceFree(const std::string& port_id) override
    {
        Request_0_1 request{&memory_};
        common::assignString(request.set_force_free().port_id, port_id, common::MaxPortIdLength);
        return performOp(request);
    }

    CETL_NODISCARD OpResults::Var forceReattach(const std::string& port_id) override
    {
        Request_0_1 request{&memory_};
        common::assignString(request.set_force_reattach().port_id, port_id, common::MaxPortIdLength);
        return performOp(request);
    }

    CETL_NODISCARD SnapshotResult::Var snapshot() override
    {
        Request_0_1 request{&memory_};
        request.set_snapshot();

        if (const int err = performRequest(request))
        {
            return err;
        }
        const auto& response = response_.value();

        Snapshot snapshot;
        for (const auto& port : response.ports)
        {
            snapshot.ports.push_back(PortStatus{common::toString(port.port_id),
                                                port.present,
                                                port.bound,
                                                port.vendor_id,
                                                port.product_id,
                                                common::toString(port.product),
                                                common::toString(port.intended_client_id),
                                                common::toString(port.holder_client_id),
                                                toRemoteState(port.remote_state),
                                                port.transition_id});
        }
        for (const auto& client : response.clients)
        {
            ClientStatus status{common::toString(client.client_id), client.connected, cetl::nullopt};
            if (client.last_seen_ago_ms > 0)
            {
                status.last_seen_ago = std::chrono::milliseconds{client.last_seen_ago_ms};
            }
            snapshot.clients.push_back(std::move(status));
        }
        snapshot.assign_all_client_id = common::toString(response.assign_all_client_id);
        return snapshot;
    }

private:
    OpResults::Var performOp(const Request_0_1& request)
    {
        if (const int err = performRequest(request))
        {
            return err;
        }

        OpResults::Success results;
        for (const auto& result : response_.value().results)
        {
            results.push_back(OpResult{common::toString(result.port_id),
                                       toStatus(result.status),
                                       toErrorKind(result.error_kind),
                                       common::toString(result.message)});
        }
        return results;
    }

    /// Sends the request, and waits for the response (stored at `response_`).
    ///
    int performRequest(const Request_0_1& request)
    {
        if (!is_connected_)
        {
            return ENOTCONN;
        }
        response_.reset();

        const int err = common::tryPerformOnSerialized(request, [this](const auto payload) {
            //
            return client_pipe_->send({{payload}});
        });
        if (err != 0)
        {
            logger_->error("Failed to send request: {}.", std::strerror(err));
            return err;
        }

        const auto deadline = executor_.now() + timeout_;
        platform::waitPollingUntil(executor_, [this, deadline] {
            //
            return response_.has_value() || is_disconnected_ || (executor_.now() >= deadline);
        });
        if (!response_.has_value())
        {
            const int result = is_disconnected_ ? ECONNRESET : ETIMEDOUT;
            logger_->error("No response from daemon: {}.", std::strerror(result));
            return result;
        }
        return 0;
    }

    // MARK: Pipe events

    int handlePipeEvent(const ClientPipe::Event::Connected&)
    {
        is_connected_ = true;
        return 0;
    }

    int handlePipeEvent(const ClientPipe::Event::Disconnected&)
    {
        logger_->debug("Daemon has closed the connection.");
        is_connected_    = false;
        is_disconnected_ = true;
        return 0;
    }

    int handlePipeEvent(const ClientPipe::Event::Message& msg)
    {
        Response_0_1 response{&memory_};
        const auto   result_size = common::tryDeserializePayload(msg.payload, response);
        if (!result_size.has_value())
        {
            logger_->warn("Malformed response from daemon.");
            return EINVAL;
        }
        response_.emplace(std::move(response));
        return 0;
    }

    cetl::pmr::memory_resource&       memory_;
    platform::SingleThreadedExecutor& executor_;
    const libcyphal::Duration         timeout_;
    common::LoggerPtr                 logger_;
    ClientPipe::Ptr                   client_pipe_;
    bool                              is_connected_;
    bool                              is_disconnected_;
    cetl::optional<Response_0_1>      response_;

};  // DaemonImpl

}  // namespace

CETL_NODISCARD Daemon::Ptr Daemon::make(cetl::pmr::memory_resource&       memory,
                                        platform::SingleThreadedExecutor& executor,
                                        const std::string&                connection,
                                        const libcyphal::Duration         timeout)
{
    auto daemon = std::make_unique<DaemonImpl>(memory, executor, timeout);
    if (0 != daemon->start(connection))
    {
        return nullptr;
    }

    return daemon;
}

}  // namespace sdk
}  // namespace usbad
