//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_AGENT_AGENT_HPP_INCLUDED
#define USBAD_AGENT_AGENT_HPP_INCLUDED

#include "import_transport.hpp"
#include "ipc/pipe/client_pipe.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <memory>
#include <string>

namespace usbad
{
namespace agent
{

/// Client side of the host connection.
///
/// Identifies itself with `Hello`, answers heartbeats, and executes `Attach`/`Detach` commands
/// of the host (acknowledging every one of them). Reconnects after a delay whenever the connection is lost.
///
class Agent
{
public:
    using Ptr = std::unique_ptr<Agent>;

    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource&        memory,
                                   libcyphal::IExecutor&              executor,
                                   common::ipc::pipe::ClientPipe::Ptr client_pipe,
                                   ImportTransport&                   import_transport,
                                   std::string                        client_id,
                                   const libcyphal::Duration          reconnect_delay);

    Agent(const Agent&)                = delete;
    Agent(Agent&&) noexcept            = delete;
    Agent& operator=(const Agent&)     = delete;
    Agent& operator=(Agent&&) noexcept = delete;

    virtual ~Agent() = default;

    /// Starts connecting to the host.
    ///
    /// Failure to connect is not an error - connecting is retried.
    ///
    virtual void start() = 0;

    CETL_NODISCARD virtual bool isConnected() const = 0;

protected:
    Agent() = default;

};  // Agent

}  // namespace agent
}  // namespace usbad

#endif  // USBAD_AGENT_AGENT_HPP_INCLUDED
