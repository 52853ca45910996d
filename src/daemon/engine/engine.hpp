//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_HPP_INCLUDED

#include "assignment/assignment_store.hpp"
#include "assignment/orchestrator.hpp"
#include "clients/client_manager.hpp"
#include "config.hpp"
#include "control/control_server.hpp"
#include "devices/device_registry.hpp"
#include "devices/driver_transport.hpp"
#include "devices/udev_discovery.hpp"
#include "logging.hpp"
#include "usbad/platform/defines.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <functional>
#include <string>

namespace usbad
{
namespace daemon
{
namespace engine
{

class Engine
{
public:
    explicit Engine(Config::Ptr config);

    CETL_NODISCARD cetl::optional<std::string> init();
    void                                       runWhile(const std::function<bool()>& loop_predicate);

    /// Releases all exported devices back to the host.
    ///
    void shutdown();

private:
    CETL_NODISCARD cetl::optional<std::string> makeServerPipe(const std::string&                  connection,
                                                              common::ipc::pipe::ServerPipe::Ptr& out_pipe);

    Config::Ptr                              config_;
    common::LoggerPtr                        logger_{common::getLogger("engine")};
    usbad::platform::SingleThreadedExecutor  executor_;
    cetl::pmr::memory_resource&              memory_{*cetl::pmr::get_default_resource()};
    devices::DriverTransport::Ptr            driver_;
    devices::DeviceRegistry::Ptr             registry_;
    assignment::AssignmentStore::Ptr         store_;
    clients::ClientManager::Ptr              client_manager_;
    assignment::Orchestrator::Ptr            orchestrator_;
    control::ControlServer::Ptr              control_server_;
    devices::UdevDiscovery::Ptr              discovery_;

};  // Engine

}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_HPP_INCLUDED
