//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_CONTROL_SERVER_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_CONTROL_SERVER_HPP_INCLUDED

#include "assignment/orchestrator.hpp"
#include "ipc/pipe/server_pipe.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>

#include <memory>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace control
{

/// Serves operator requests (`usbad.control.Request.0.1`) of the local control socket.
///
/// Every request is executed immediately by the orchestrator, and answered with a single
/// `usbad.control.Response.0.1` message on the same connection.
///
class ControlServer
{
public:
    using Ptr = std::unique_ptr<ControlServer>;

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource&        memory,
                                   libcyphal::IExecutor&              executor,
                                   common::ipc::pipe::ServerPipe::Ptr server_pipe,
                                   assignment::Orchestrator&          orchestrator);

    ControlServer(const ControlServer&)                = delete;
    ControlServer(ControlServer&&) noexcept            = delete;
    ControlServer& operator=(const ControlServer&)     = delete;
    ControlServer& operator=(ControlServer&&) noexcept = delete;

    virtual ~ControlServer() = default;

    CETL_NODISCARD virtual int start() = 0;

protected:
    ControlServer() = default;

};  // ControlServer

}  // namespace control
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_CONTROL_SERVER_HPP_INCLUDED
