//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_AGENT_CONFIG_HPP_INCLUDED
#define USBAD_AGENT_CONFIG_HPP_INCLUDED

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace usbad
{
namespace agent
{

/// Read-only view of the agent configuration file.
///
class AgentConfig
{
public:
    using Ptr = std::shared_ptr<AgentConfig>;

    using Duration = std::chrono::milliseconds;

    /// @throws std::exception (f.e. `toml::syntax_error`) if the file can't be read or parsed.
    ///
    CETL_NODISCARD static Ptr make(std::string file_path);

    AgentConfig(const AgentConfig&)                = delete;
    AgentConfig(AgentConfig&&) noexcept            = delete;
    AgentConfig& operator=(const AgentConfig&)     = delete;
    AgentConfig& operator=(AgentConfig&&) noexcept = delete;

    virtual ~AgentConfig() = default;

    /// Identity of the agent - the lower-cased host name unless configured.
    ///
    CETL_NODISCARD virtual auto getClientId() const -> std::string = 0;

    CETL_NODISCARD virtual auto getHost() const -> std::string        = 0;
    CETL_NODISCARD virtual auto getPort() const -> std::uint16_t      = 0;
    CETL_NODISCARD virtual auto getReconnectDelay() const -> Duration = 0;
    CETL_NODISCARD virtual auto getUsbipTool() const -> std::string   = 0;

    CETL_NODISCARD virtual auto getLoggingFile() const -> cetl::optional<std::string>       = 0;
    CETL_NODISCARD virtual auto getLoggingLevel() const -> cetl::optional<std::string>      = 0;
    CETL_NODISCARD virtual auto getLoggingFlushLevel() const -> cetl::optional<std::string> = 0;

protected:
    AgentConfig() = default;

};  // AgentConfig

}  // namespace agent
}  // namespace usbad

#endif  // USBAD_AGENT_CONFIG_HPP_INCLUDED
