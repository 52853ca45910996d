//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "setup_logging.hpp"

#include <usbad/platform/defines.hpp>
#include <usbad/sdk/daemon.hpp>

#include <cetl/pf17/cetlpf.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace
{

using usbad::sdk::AssignAllPolicy;
using usbad::sdk::Daemon;
using usbad::sdk::OpResult;
using usbad::sdk::PortStatus;

const char* const s_usage =
    "Usage: usbadctl <command> [args...] [SPDLOG_LEVEL=...] [SPDLOG_FLUSH_LEVEL=...]\n"
    "\n"
    "Commands:\n"
    "  assign <port> <client>                        Assign port to client.\n"
    "  assign-all <client> [--skip-assigned|--override]\n"
    "                                                Assign all ports to client (sticky).\n"
    "  free <port>                                   Release port from any client.\n"
    "  reattach <port>                               Detach and re-attach port to its client.\n"
    "  status                                        Print ports and clients.\n"
    "\n"
    "Environment:\n"
    "  USBAD_CONNECTION   Control connection of the daemon (default 'unix-abstract:org.usbad.control').\n";

const char* toString(const OpResult::Status status)
{
    switch (status)
    {
    case OpResult::Status::Accepted:
        return "accepted";
    case OpResult::Status::Completed:
        return "completed";
    case OpResult::Status::Rejected:
        return "rejected";
    case OpResult::Status::Skipped:
        return "skipped";
    }
    return "?";
}

const char* toString(const OpResult::ErrorKind error)
{
    switch (error)
    {
    case OpResult::ErrorKind::None:
        return "";
    case OpResult::ErrorKind::ConfigurationError:
        return "configuration error";
    case OpResult::ErrorKind::TransportError:
        return "transport error";
    case OpResult::ErrorKind::ClientUnreachable:
        return "client unreachable";
    case OpResult::ErrorKind::InvariantViolation:
        return "invariant violation";
    case OpResult::ErrorKind::StorageError:
        return "storage error";
    }
    return "?";
}

const char* toString(const PortStatus::RemoteState remote_state)
{
    switch (remote_state)
    {
    case PortStatus::RemoteState::Detached:
        return "detached";
    case PortStatus::RemoteState::Attaching:
        return "attaching";
    case PortStatus::RemoteState::Attached:
        return "attached";
    case PortStatus::RemoteState::Detaching:
        return "detaching";
    }
    return "?";
}

std::string orDash(const std::string& str)
{
    return str.empty() ? "-" : str;
}

/// Prints per port results.
///
/// @return `EXIT_FAILURE` if the daemon could not be reached, or any of the ports was rejected.
///
int printResults(const Daemon::OpResults::Var& results_var)
{
    if (const auto* const err = cetl::get_if<Daemon::OpResults::Failure>(&results_var))
    {
        fmt::print(stderr, "usbadctl: request has failed: {}\n", std::strerror(*err));
        return EXIT_FAILURE;
    }

    const auto& results = cetl::get<Daemon::OpResults::Success>(results_var);
    if (results.empty())
    {
        fmt::print("No ports affected.\n");
    }

    int exit_code = EXIT_SUCCESS;
    for (const auto& result : results)
    {
        fmt::print("{:<12} {:<10}", result.port_id, toString(result.status));
        if (result.error != OpResult::ErrorKind::None)
        {
            fmt::print(" [{}]", toString(result.error));
        }
        if (!result.message.empty())
        {
            fmt::print(" {}", result.message);
        }
        fmt::print("\n");

        if (result.status == OpResult::Status::Rejected)
        {
            exit_code = EXIT_FAILURE;
        }
    }
    return exit_code;
}

int printSnapshot(const Daemon::SnapshotResult::Var& snapshot_var)
{
    if (const auto* const err = cetl::get_if<Daemon::SnapshotResult::Failure>(&snapshot_var))
    {
        fmt::print(stderr, "usbadctl: request has failed: {}\n", std::strerror(*err));
        return EXIT_FAILURE;
    }
    const auto& snapshot = cetl::get<Daemon::SnapshotResult::Success>(snapshot_var);

    fmt::print("{:<12} {:<8} {:<6} {:<10} {:<24} {:<16} {:<16} {:<10} {}\n",
               "PORT",
               "PRESENT",
               "BOUND",
               "VID:PID",
               "PRODUCT",
               "INTENT",
               "HOLDER",
               "STATE",
               "TID");
    for (const auto& port : snapshot.ports)
    {
        const auto vid_pid =
            port.present ? fmt::format("{:04x}:{:04x}", port.vendor_id, port.product_id) : std::string{"-"};
        fmt::print("{:<12} {:<8} {:<6} {:<10} {:<24} {:<16} {:<16} {:<10} {}\n",
                   port.port_id,
                   port.present ? "yes" : "no",
                   port.bound ? "yes" : "no",
                   vid_pid,
                   orDash(port.product),
                   orDash(port.intended_client_id),
                   orDash(port.holder_client_id),
                   toString(port.remote_state),
                   port.transition_id);
    }

    fmt::print("\n{:<24} {:<10} {}\n", "CLIENT", "CONNECTED", "LAST SEEN");
    for (const auto& client : snapshot.clients)
    {
        const auto last_seen =
            client.last_seen_ago ? fmt::format("{}ms ago", client.last_seen_ago->count()) : std::string{"never"};
        fmt::print("{:<24} {:<10} {}\n", client.client_id, client.connected ? "yes" : "no", last_seen);
    }

    fmt::print("\nAssign-all client: {}\n", orDash(snapshot.assign_all_client_id));
    return EXIT_SUCCESS;
}

/// Runs a single command.
///
/// @return Process exit code; `cetl::nullopt` if the command line is invalid.
///
cetl::optional<int> runCommand(Daemon& daemon, const std::vector<std::string>& args)
{
    const auto& command = args.front();

    if ((command == "assign") && (args.size() == 3))
    {
        return printResults(daemon.assign(args[1], args[2]));
    }
    if ((command == "assign-all") && ((args.size() == 2) || (args.size() == 3)))
    {
        auto policy = AssignAllPolicy::Default;
        if (args.size() == 3)
        {
            if (args[2] == "--skip-assigned")
            {
                policy = AssignAllPolicy::SkipAssigned;
            }
            else if (args[2] == "--override")
            {
                policy = AssignAllPolicy::Override;
            }
            else
            {
                return cetl::nullopt;
            }
        }
        return printResults(daemon.assignAll(args[1], policy));
    }
    if ((command == "free") && (args.size() == 2))
    {
        return printResults(daemon.forceFree(args[1]));
    }
    if ((command == "reattach") && (args.size() == 2))
    {
        return printResults(daemon.forceReattach(args[1]));
    }
    if ((command == "status") && (args.size() == 1))
    {
        return printSnapshot(daemon.snapshot());
    }
    return cetl::nullopt;
}

/// Command arguments, without the logging ones (`SPDLOG_LEVEL=...` etc).
///
std::vector<std::string> collectCommandArgs(const int argc, const char** const argv)
{
    static const std::string spdlog_prefix = "SPDLOG_";

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if ((0 == arg_str.compare(0, spdlog_prefix.size(), spdlog_prefix)) &&
            (arg_str.find('=') != std::string::npos))
        {
            continue;
        }
        args.push_back(std::move(arg_str));
    }
    return args;
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using std::chrono_literals::operator""s;
    using Executor = usbad::platform::SingleThreadedExecutor;

    const auto args = collectCommandArgs(argc, argv);
    if (args.empty() || (args.front() == "--help") || (args.front() == "-h"))
    {
        fmt::print(args.empty() ? stderr : stdout, "{}", s_usage);
        return args.empty() ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    setupLogging(argc, argv);

    spdlog::info("USBAD control started (ver='{}.{}', cmd='{}').", VERSION_MAJOR, VERSION_MINOR, args.front());
    int result = EXIT_SUCCESS;
    try
    {
        auto&    memory = *cetl::pmr::new_delete_resource();
        Executor executor;

        std::string connection = "unix-abstract:org.usbad.control";
        if (const auto* const env_connection_str = std::getenv("USBAD_CONNECTION"))
        {
            connection = env_connection_str;
        }

        const auto daemon = Daemon::make(memory, executor, connection, 10s);
        if (!daemon)
        {
            spdlog::critical("Failed to connect to daemon.");
            fmt::print(stderr, "usbadctl: failed to connect to daemon (connection='{}').\n", connection);
            return EXIT_FAILURE;
        }

        const auto maybe_result = runCommand(*daemon, args);
        if (!maybe_result)
        {
            fmt::print(stderr, "usbadctl: invalid command line.\n\n{}", s_usage);
            result = EXIT_FAILURE;
        }
        else
        {
            result = *maybe_result;
        }

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("USBAD control terminated (result={}).", result);

    return result;
}
