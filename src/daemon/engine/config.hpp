//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{

/// Read-only view of the daemon configuration file.
///
/// Missing keys are reported with their defaults, so only `make` can fail (on unparsable file).
///
class Config
{
public:
    using Ptr = std::shared_ptr<Config>;

    using Duration = std::chrono::milliseconds;

    /// @throws std::exception (f.e. `toml::syntax_error`) if the file can't be read or parsed.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    Config(const Config&)                = delete;
    Config(Config&&) noexcept            = delete;
    Config& operator=(const Config&)     = delete;
    Config& operator=(Config&&) noexcept = delete;

    virtual ~Config() = default;

    CETL_NODISCARD virtual auto getUsbPorts() const -> std::vector<std::string> = 0;

    CETL_NODISCARD virtual auto getClientsConnection() const -> std::string   = 0;
    CETL_NODISCARD virtual auto getClientsHeartbeatPeriod() const -> Duration  = 0;
    CETL_NODISCARD virtual auto getClientsHeartbeatTimeout() const -> Duration = 0;

    CETL_NODISCARD virtual auto getControlConnection() const -> std::string = 0;

    CETL_NODISCARD virtual auto getAssignmentsStoreFile() const -> std::string = 0;
    CETL_NODISCARD virtual auto getAssignAllPolicy() const -> std::string      = 0;
    CETL_NODISCARD virtual auto getAckTimeout() const -> Duration              = 0;
    CETL_NODISCARD virtual auto getRetryInitialDelay() const -> Duration       = 0;
    CETL_NODISCARD virtual auto getRetryMaxDelay() const -> Duration           = 0;
    CETL_NODISCARD virtual auto getTickPeriod() const -> Duration              = 0;

    CETL_NODISCARD virtual auto getUsbipTool() const -> std::string = 0;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    Config() = default;

};  // Config

}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_CONFIG_HPP_INCLUDED
