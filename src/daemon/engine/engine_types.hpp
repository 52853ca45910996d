//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_TYPES_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_TYPES_HPP_INCLUDED

#include <cstdint>
#include <string>

namespace usbad
{
namespace daemon
{
namespace engine
{

/// USB bus/port path of a device, f.e. `1-1` or `1-1.2` (sysfs name of the device).
using PortId = std::string;

/// Self-declared identity of a remote client (or its network address if it has declared none).
using ClientId = std::string;

/// Per-port counter of issued commands - correlates acknowledgements with their commands.
using TransitionId = std::uint64_t;

/// Error taxonomy of the daemon.
///
enum class ErrorKind : std::uint8_t
{
    None = 0,

    /// Operation refers to a non-whitelisted port, empty client id, or similar.
    ConfigurationError,

    /// Local `usbip bind/unbind` has failed, or the client has failed to import/release a device.
    TransportError,

    /// Client is not connected, or a command could not be delivered to it.
    ClientUnreachable,

    /// Internal state was found inconsistent; the port has been forcibly reset.
    InvariantViolation,

    /// Assignment intents could not be persisted.
    StorageError,

};  // ErrorKind

inline const char* toString(const ErrorKind error_kind)
{
    switch (error_kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::ConfigurationError:
        return "configuration error";
    case ErrorKind::TransportError:
        return "transport error";
    case ErrorKind::ClientUnreachable:
        return "client unreachable";
    case ErrorKind::InvariantViolation:
        return "invariant violation";
    case ErrorKind::StorageError:
        return "storage error";
    }
    return "?";
}

}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_TYPES_HPP_INCLUDED
