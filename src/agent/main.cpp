//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "agent.hpp"
#include "agent_config.hpp"
#include "io/process_runner.hpp"
#include "io/socket_address.hpp"
#include "ipc/pipe/socket_client.hpp"
#include "setup_logging.hpp"
#include "usbip_import.hpp"

#include <usbad/platform/defines.hpp>

#include <cetl/pf17/cetlpf.hpp>
#include <libcyphal/types.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <signal.h>  // NOLINT
#include <sstream>
#include <string>
#include <utility>

namespace
{

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

extern "C" void signalHandler(const int sig)
{
    if ((sig == SIGINT) || (sig == SIGTERM))
    {
        g_running = 0;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);

    struct sigaction sigignore
    {};
    sigignore.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &sigignore, nullptr);
}

usbad::agent::AgentConfig::Ptr loadConfig(const int argc, const char** const argv)
{
    static const std::string config_file_prefix = "CONFIG_FILE=";

    std::string cfg_file_path = "./usbad-agent.toml";
    for (int i = 1; i < argc; i++)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (0 == arg_str.compare(0, config_file_prefix.size(), config_file_prefix))
        {
            cfg_file_path = arg_str.substr(config_file_prefix.size());
        }
    }

    try
    {
        return usbad::agent::AgentConfig::make(cfg_file_path);

    } catch (const std::exception& ex)
    {
        std::cerr << "Failed to load configuration file (path='" << cfg_file_path << "').\n" << ex.what() << "\n";
    }
    std::exit(EXIT_FAILURE);
}

}  // namespace

int main(const int argc, const char** const argv)
{
    using std::chrono_literals::operator""s;
    using ParseResult = usbad::common::io::SocketAddress::ParseResult;
    using Executor    = usbad::platform::SingleThreadedExecutor;

    setupSignalHandlers();
    const auto config = loadConfig(argc, argv);
    setupLogging(argc, argv, config);

    spdlog::info("USBAD agent started (ver='{}.{}').", VERSION_MAJOR, VERSION_MINOR);
    int result = EXIT_SUCCESS;
    try
    {
        auto&    memory = *cetl::pmr::new_delete_resource();
        Executor executor;

        const auto host = config->getHost();
        auto       maybe_socket_address = usbad::common::io::SocketAddress::parse(host, config->getPort());
        if (const auto* const failure = cetl::get_if<ParseResult::Failure>(&maybe_socket_address))
        {
            spdlog::critical("Failed to resolve host '{}': {}.", host, std::strerror(*failure));
            std::cerr << "Failed to resolve host '" << host << "'.\n";
            return EXIT_FAILURE;
        }
        const auto socket_address = cetl::get<ParseResult::Success>(maybe_socket_address);

        // `usbip attach -r` talks to the `usbipd` of the same host (on its own port).
        const auto import_transport = usbad::agent::UsbipImport::make(usbad::common::io::ProcessRunner::make(),
                                                                      config->getUsbipTool(),
                                                                      host);
        const auto client_id        = config->getClientId();
        spdlog::info("Using client id '{}' (host='{}').", client_id, socket_address.toString());

        const auto agent = usbad::agent::Agent::make(  //
            memory,
            executor,
            std::make_unique<usbad::common::ipc::pipe::SocketClient>(executor, socket_address),
            *import_transport,
            client_id,
            std::chrono::duration_cast<libcyphal::Duration>(config->getReconnectDelay()));
        agent->start();

        while (g_running == 1)
        {
            (void) usbad::platform::spinAndPollOnce(executor, 1s);
        }
        spdlog::debug("Received termination signal.");

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }
    spdlog::info("USBAD agent terminated.");

    return result;
}
