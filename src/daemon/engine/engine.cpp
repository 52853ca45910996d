//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine.hpp"

#include "assignment/assignment_store.hpp"
#include "assignment/assignment_types.hpp"
#include "assignment/orchestrator.hpp"
#include "clients/client_manager.hpp"
#include "config.hpp"
#include "control/control_server.hpp"
#include "devices/device_registry.hpp"
#include "devices/udev_discovery.hpp"
#include "devices/usbip_driver.hpp"
#include "io/process_runner.hpp"
#include "io/socket_address.hpp"
#include "ipc/pipe/server_pipe.hpp"
#include "ipc/pipe/socket_server.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace
{

/// Default TCP port of the client connections (if the configured connection has none).
constexpr std::uint16_t DefaultClientsPort = 65432;

template <typename Duration>
libcyphal::Duration toDuration(const Duration duration)
{
    return std::chrono::duration_cast<libcyphal::Duration>(duration);
}

}  // namespace

Engine::Engine(Config::Ptr config)
    : config_{std::move(config)}
{
}

cetl::optional<std::string> Engine::init()
{
    logger_->trace("Initializing engine...");

    // 1. Create the device layer - the `usbip` driver, and the registry of the whitelisted ports.
    //
    const auto usb_ports = config_->getUsbPorts();
    if (usb_ports.empty())
    {
        std::string msg = "No USB ports configured.";
        logger_->error(msg);
        return msg;
    }
    driver_   = devices::UsbipDriver::make(common::io::ProcessRunner::make(), config_->getUsbipTool());
    registry_ = devices::DeviceRegistry::make(*driver_, usb_ports);

    // 2. Create the client connection manager.
    //
    {
        common::ipc::pipe::ServerPipe::Ptr server_pipe;
        if (auto error = makeServerPipe(config_->getClientsConnection(), server_pipe))
        {
            return error;
        }
        client_manager_ = clients::ClientManager::make(memory_,
                                                       executor_,
                                                       std::move(server_pipe),
                                                       toDuration(config_->getClientsHeartbeatPeriod()),
                                                       toDuration(config_->getClientsHeartbeatTimeout()));
    }

    // 3. Create the orchestrator (with its durable store of intents).
    //
    assignment::Orchestrator::Params params{};
    {
        const auto policy = config_->getAssignAllPolicy();
        if (policy == "skip_assigned")
        {
            params.assign_all_policy = assignment::AssignAllPolicy::SkipAssigned;
        }
        else if (policy == "override")
        {
            params.assign_all_policy = assignment::AssignAllPolicy::Override;
        }
        else
        {
            std::string msg = "Invalid assign-all policy '" + policy + "' (expected 'skip_assigned' or 'override').";
            logger_->error(msg);
            return msg;
        }
    }
    params.ack_timeout         = toDuration(config_->getAckTimeout());
    params.retry_initial_delay = toDuration(config_->getRetryInitialDelay());
    params.retry_max_delay     = std::max(params.retry_initial_delay, toDuration(config_->getRetryMaxDelay()));
    params.tick_period         = toDuration(config_->getTickPeriod());
    //
    store_        = assignment::AssignmentStore::make(config_->getAssignmentsStoreFile());
    orchestrator_ = assignment::Orchestrator::make(executor_, *registry_, *client_manager_, *store_, params);
    orchestrator_->start();

    // 4. Bring up the control surface.
    //
    {
        common::ipc::pipe::ServerPipe::Ptr server_pipe;
        if (auto error = makeServerPipe(config_->getControlConnection(), server_pipe))
        {
            return error;
        }
        control_server_ = control::ControlServer::make(memory_, executor_, std::move(server_pipe), *orchestrator_);
    }
    if (0 != control_server_->start())
    {
        std::string msg = "Failed to start control server.";
        logger_->error(msg);
        return msg;
    }

    // 5. Start accepting clients.
    //
    if (0 != client_manager_->start([this](const auto& event) {
            //
            orchestrator_->onClientEvent(event);
        }))
    {
        std::string msg = "Failed to start client connection manager.";
        logger_->error(msg);
        return msg;
    }

    // 6. Finally, start discovering devices (existing ones, and then hot-plugged).
    //
    discovery_ = devices::UdevDiscovery::make(executor_, *registry_);
    if (0 != discovery_->start())
    {
        std::string msg = "Failed to start USB device discovery.";
        logger_->error(msg);
        return msg;
    }

    logger_->debug("Engine is initialized.");
    return cetl::nullopt;
}

void Engine::runWhile(const std::function<bool()>& loop_predicate)
{
    using std::chrono_literals::operator""s;

    libcyphal::Duration worst_lateness{0};
    while (loop_predicate())
    {
        // Poll awaitable resources but awake at least once per second.
        worst_lateness = std::max(worst_lateness, usbad::platform::spinAndPollOnce(executor_, 1s));
    }
    logger_->debug("Run loop predicate is fulfilled (worst_lateness={}us).",
                   std::chrono::duration_cast<std::chrono::microseconds>(worst_lateness).count());
}

void Engine::shutdown()
{
    discovery_.reset();
    if (registry_)
    {
        logger_->info("Unbinding all devices...");
        registry_->unbindAll();
    }
}

cetl::optional<std::string> Engine::makeServerPipe(const std::string&                  connection,
                                                   common::ipc::pipe::ServerPipe::Ptr& out_pipe)
{
    using ParseResult = common::io::SocketAddress::ParseResult;

    logger_->debug("Making server pipe with connection '{}'...", connection);
    auto maybe_socket_address = common::io::SocketAddress::parse(connection, DefaultClientsPort);
    if (const auto* const failure = cetl::get_if<ParseResult::Failure>(&maybe_socket_address))
    {
        std::string msg = "Failed to parse connection '" + connection + "' (err=" + std::to_string(*failure) + ").";
        logger_->error(msg);
        return msg;
    }
    const auto socket_address = cetl::get<ParseResult::Success>(maybe_socket_address);
    out_pipe                  = std::make_unique<common::ipc::pipe::SocketServer>(executor_, socket_address);
    return cetl::nullopt;
}

}  // namespace engine
}  // namespace daemon
}  // namespace usbad
