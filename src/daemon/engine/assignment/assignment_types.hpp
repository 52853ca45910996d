//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_ASSIGNMENT_TYPES_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_ASSIGNMENT_TYPES_HPP_INCLUDED

#include "devices/device_registry.hpp"
#include "engine_types.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace assignment
{

/// Desired owner of every assigned port.
using Intents = std::map<PortId, ClientId>;

/// Everything which survives a daemon restart.
///
struct PersistentState final
{
    Intents                  intents;
    cetl::optional<ClientId> assign_all_client;

};  // PersistentState

/// Observed state of a port on its (current or last) holder client.
///
enum class RemoteState : std::uint8_t
{
    Detached,
    Attaching,
    Attached,
    Detaching,
};

inline const char* toString(const RemoteState remote_state)
{
    switch (remote_state)
    {
    case RemoteState::Detached:
        return "detached";
    case RemoteState::Attaching:
        return "attaching";
    case RemoteState::Attached:
        return "attached";
    case RemoteState::Detaching:
        return "detaching";
    }
    return "?";
}

/// How `assignAll` treats ports which are already assigned to other clients.
///
enum class AssignAllPolicy : std::uint8_t
{
    SkipAssigned,
    Override,
};

/// Result of a control operation on a single port.
///
struct OpResult final
{
    enum class Status : std::uint8_t
    {
        /// Intent is recorded (and persisted); the remote state will follow.
        Accepted,

        /// Remote state already matches the intent.
        Completed,

        /// Nothing has changed; see `error`.
        Rejected,

        /// Port has been deliberately left untouched (f.e. assigned to another client).
        Skipped,
    };

    PortId      port_id;
    Status      status{Status::Rejected};
    ErrorKind   error{ErrorKind::None};
    std::string message;

};  // OpResult

struct PortSnapshot final
{
    PortId                   port_id;
    bool                     present{false};
    devices::BindState       bind_state{devices::BindState::Unbound};
    devices::Descriptor      descriptor;
    cetl::optional<ClientId> intended_client;
    cetl::optional<ClientId> holder_client;
    RemoteState              remote_state{RemoteState::Detached};
    TransitionId             transition_id{0};

};  // PortSnapshot

struct ClientSnapshot final
{
    ClientId                             client_id;
    bool                                 connected{false};
    cetl::optional<libcyphal::TimePoint> last_seen;

};  // ClientSnapshot

struct Snapshot final
{
    std::vector<PortSnapshot>   ports;
    std::vector<ClientSnapshot> clients;
    cetl::optional<ClientId>    assign_all_client;

};  // Snapshot

}  // namespace assignment
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_ASSIGNMENT_TYPES_HPP_INCLUDED
