//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "agent_config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>

namespace usbad
{
namespace agent
{
namespace
{

constexpr std::int64_t  DefaultReconnectDelayMs = 5000;
constexpr std::uint16_t DefaultPort             = 65432;

class AgentConfigImpl final : public AgentConfig
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    explicit AgentConfigImpl(TomlValue&& root)
        : root_{std::move(root)}
    {
    }

    // AgentConfig

    auto getClientId() const -> std::string override
    {
        if (auto client_id = findImpl<std::string>("agent", "client_id"))
        {
            if (!client_id->empty())
            {
                return std::move(*client_id);
            }
        }
        return getLowerHostName();
    }

    auto getHost() const -> std::string override
    {
        return find_or(root_, "agent", "host", std::string{"localhost"});
    }

    auto getPort() const -> std::uint16_t override
    {
        const auto port = find_or(root_, "agent", "port", static_cast<std::int64_t>(DefaultPort));
        if ((port <= 0) || (port > std::numeric_limits<std::uint16_t>::max()))
        {
            return DefaultPort;
        }
        return static_cast<std::uint16_t>(port);
    }

    auto getReconnectDelay() const -> Duration override
    {
        const auto value_ms = find_or(root_, "agent", "reconnect_delay_ms", DefaultReconnectDelayMs);
        return Duration{(value_ms > 0) ? value_ms : DefaultReconnectDelayMs};
    }

    auto getUsbipTool() const -> std::string override
    {
        return find_or(root_, "usbip", "tool", std::string{"usbip"});
    }

    auto getLoggingFile() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "file");
    }

    auto getLoggingLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "level");
    }

    auto getLoggingFlushLevel() const -> cetl::optional<std::string> override
    {
        return findImpl<std::string>("logging", "flush_level");
    }

private:
    template <typename T, typename... Keys>
    cetl::optional<T> findImpl(Keys&&... keys) const
    {
        try
        {
            return cetl::make_optional(toml::find<T>(root_, std::forward<Keys>(keys)...));

        } catch (const std::exception&)
        {
            return cetl::nullopt;
        }
    }

    static std::string getLowerHostName()
    {
        constexpr std::size_t               max_host_name_len = 256;
        std::array<char, max_host_name_len> host_name{};
        if (::gethostname(host_name.data(), host_name.size() - 1) != 0)
        {
            return {};
        }

        std::string result{host_name.data()};
        std::transform(result.begin(), result.end(), result.begin(), [](const unsigned char ch) {
            //
            return static_cast<char>(std::tolower(ch));
        });
        return result;
    }

    TomlValue root_;

};  // AgentConfigImpl

}  // namespace

AgentConfig::Ptr AgentConfig::make(std::string file_path)
{
    auto root = toml::parse<AgentConfigImpl::TomlConf>(file_path);
    return std::make_shared<AgentConfigImpl>(std::move(root));
}

}  // namespace agent
}  // namespace usbad
