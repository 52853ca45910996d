//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_ASSIGNMENT_ORCHESTRATOR_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_ASSIGNMENT_ORCHESTRATOR_HPP_INCLUDED

#include "assignment_store.hpp"
#include "assignment_types.hpp"
#include "clients/client_manager.hpp"
#include "devices/device_registry.hpp"
#include "engine_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <memory>
#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace assignment
{

/// Drives every whitelisted port towards its intended client.
///
/// The orchestrator is the only owner of the intents and of the remote (client side) state of the ports.
/// All its inputs (control operations, client events, device changes and the retry tick) are expected
/// to come from the same single-threaded executor, so they are never interleaved.
///
/// Per port the remote state goes through `Detached -> Attaching -> Attached -> Detaching -> Detached`.
/// At most one client holds a port at any instant: an `Attach` command is never sent to a new client
/// before the previous holder has acknowledged its `Detach`, or has disconnected.
///
class Orchestrator
{
public:
    using Ptr = std::unique_ptr<Orchestrator>;

    struct Params final
    {
        /// How long to wait for an acknowledgement of a command.
        libcyphal::Duration ack_timeout;

        /// Capped exponential backoff of the failed attempts.
        libcyphal::Duration retry_initial_delay;
        libcyphal::Duration retry_max_delay;

        /// Period of the reconciliation (and timeout checking) tick.
        libcyphal::Duration tick_period;

        /// Policy of `assignAll` when the request doesn't say otherwise.
        AssignAllPolicy assign_all_policy;

    };  // Params

    CETL_NODISCARD static Ptr make(libcyphal::IExecutor&    executor,
                                   devices::DeviceRegistry& registry,
                                   clients::ClientManager&  client_manager,
                                   AssignmentStore&         store,
                                   const Params&            params);

    Orchestrator(const Orchestrator&)                = delete;
    Orchestrator(Orchestrator&&) noexcept            = delete;
    Orchestrator& operator=(const Orchestrator&)     = delete;
    Orchestrator& operator=(Orchestrator&&) noexcept = delete;

    virtual ~Orchestrator() = default;

    /// Loads persisted intents, subscribes to the device registry, and starts the periodic tick.
    ///
    virtual void start() = 0;

    /// Feeds an event of the client connection manager.
    ///
    virtual void onClientEvent(const clients::ClientManager::Event::Var& event) = 0;

    /// Assigns the port to the client.
    ///
    /// The intent is persisted before anything else happens. If another client holds the port,
    /// it is detached first.
    ///
    /// @return `Completed` if the port is already attached to the client, `Accepted` if the intent
    ///         has been recorded, or `Rejected` (`ConfigurationError` or `StorageError`).
    ///
    CETL_NODISCARD virtual OpResult assign(const PortId& port_id, const ClientId& client_id) = 0;

    /// Assigns every present device to the client, and makes the client "sticky" -
    /// devices admitted later (and having no intent) are assigned to it as well.
    ///
    /// One port's failure never rolls back the others.
    ///
    CETL_NODISCARD virtual std::vector<OpResult> assignAll(const ClientId&                        client_id,
                                                           const cetl::optional<AssignAllPolicy>& policy) = 0;

    /// Clears intent of the port, and takes the port away from its holder (if any).
    ///
    /// Idempotent: a port without intent and holder is left untouched.
    ///
    CETL_NODISCARD virtual OpResult forceFree(const PortId& port_id) = 0;

    /// Forcibly frees the port, and then assigns it again to the same client.
    ///
    CETL_NODISCARD virtual OpResult forceReattach(const PortId& port_id) = 0;

    CETL_NODISCARD virtual Snapshot snapshot() const = 0;

protected:
    Orchestrator() = default;

};  // Orchestrator

}  // namespace assignment
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_ASSIGNMENT_ORCHESTRATOR_HPP_INCLUDED
