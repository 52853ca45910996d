//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_SDK_DAEMON_HPP_INCLUDED
#define USBAD_SDK_DAEMON_HPP_INCLUDED

#include "usbad/platform/defines.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace usbad
{
namespace sdk
{

/// Outcome of a control operation on a single port.
///
struct OpResult final
{
    enum class Status : std::uint8_t
    {
        Accepted,
        Completed,
        Rejected,
        Skipped,
    };

    enum class ErrorKind : std::uint8_t
    {
        None,
        ConfigurationError,
        TransportError,
        ClientUnreachable,
        InvariantViolation,
        StorageError,
    };

    std::string port_id;
    Status      status;
    ErrorKind   error;
    std::string message;

};  // OpResult

struct PortStatus final
{
    enum class RemoteState : std::uint8_t
    {
        Detached,
        Attaching,
        Attached,
        Detaching,
    };

    std::string   port_id;
    bool          present;
    bool          bound;
    std::uint16_t vendor_id;
    std::uint16_t product_id;
    std::string   product;
    std::string   intended_client_id;  // empty if none
    std::string   holder_client_id;    // empty if none
    RemoteState   remote_state;
    std::uint64_t transition_id;

};  // PortStatus

struct ClientStatus final
{
    std::string client_id;
    bool        connected;

    /// Time since the last message of the client, if it has ever been seen.
    cetl::optional<std::chrono::milliseconds> last_seen_ago;

};  // ClientStatus

struct Snapshot final
{
    std::vector<PortStatus>   ports;
    std::vector<ClientStatus> clients;
    std::string               assign_all_client_id;  // empty if none

};  // Snapshot

enum class AssignAllPolicy : std::uint8_t
{
    Default,
    SkipAssigned,
    Override,
};

/// Control connection to the USBAD daemon.
///
/// All operations are synchronous - they spin the executor until the daemon responds
/// (or the connection is lost, or the timeout expires).
///
class Daemon
{
public:
    using Ptr = std::unique_ptr<Daemon>;

    /// Result of a mutating operation - per port outcomes, or errno of the communication failure.
    ///
    struct OpResults
    {
        using Success = std::vector<OpResult>;
        using Failure = int;
        using Var     = cetl::variant<Success, Failure>;
    };

    struct SnapshotResult
    {
        using Success = Snapshot;
        using Failure = int;
        using Var     = cetl::variant<Success, Failure>;
    };

    /// Creates a new instance, and connects it to the daemon.
    ///
    /// @param memory The memory resource for the (de)serialization of messages. Must outlive the instance.
    /// @param executor The executor to spin while waiting. Must outlive the instance.
    /// @param connection Control connection of the daemon, f.e. `unix-abstract:org.usbad.control`.
    /// @param timeout Maximum time to wait for the connection, and then for every response.
    /// @return The connected instance, or `nullptr` on failure (see logs for the reason of failure).
    ///
    CETL_NODISCARD static Ptr make(cetl::pmr::memory_resource&      memory,
                                   platform::SingleThreadedExecutor& executor,
                                   const std::string&               connection,
                                   const libcyphal::Duration        timeout);

    Daemon(Daemon&&)                 = delete;
    Daemon(const Daemon&)            = delete;
    Daemon& operator=(Daemon&&)      = delete;
    Daemon& operator=(const Daemon&) = delete;

    virtual ~Daemon() = default;

    CETL_NODISCARD virtual OpResults::Var assign(const std::string& port_id, const std::string& client_id) = 0;
    CETL_NODISCARD virtual OpResults::Var assignAll(const std::string& client_id, const AssignAllPolicy policy) = 0;
    CETL_NODISCARD virtual OpResults::Var forceFree(const std::string& port_id)                                = 0;
    CETL_NODISCARD virtual OpResults::Var forceReattach(const std::string& port_id)                            = 0;
    CETL_NODISCARD virtual SnapshotResult::Var snapshot()                                                       = 0;

protected:
    Daemon() = default;

};  // Daemon

}  // namespace sdk
}  // namespace usbad

#endif  // USBAD_SDK_DAEMON_HPP_INCLUDED
