//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <toml.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace
{

// Defaults of the optional keys.
//
constexpr std::int64_t DefaultHeartbeatPeriodMs  = 5000;
constexpr std::int64_t DefaultHeartbeatTimeoutMs = 15000;
constexpr std::int64_t DefaultAckTimeoutMs       = 10000;
constexpr std::int64_t DefaultRetryInitialMs     = 1000;
constexpr std::int64_t DefaultRetryMaxMs         = 60000;
constexpr std::int64_t DefaultTickPeriodMs       = 1000;

class ConfigImpl final : public Config
{
public:
    using TomlConf  = toml::ordered_type_config;
    using TomlValue = toml::basic_value<TomlConf>;

    ConfigImpl(std::string file_path, TomlValue&& root)
        : file_path_{std::move(file_path)}
        , root_{std::move(root)}
    {
    }

    // Config

    auto getUsbPorts() const -> std::vector<std::string> override
    {
        return find_or(root_, "usb", "ports", std::vector<std::string>{"1-1", "3-1", "1-2", "3-2"});
    }

    auto getClientsConnection() const -> std::string override
    {
        return find_or(root_, "clients", "connection", std::string{"*:65432"});
    }

    auto getClientsHeartbeatPeriod() const -> Duration override
    {
        return findDuration("clients", "heartbeat_period_ms", DefaultHeartbeatPeriodMs);
    }

    auto getClientsHeartbeatTimeout() const -> Duration override
    {
        return findDuration("clients", "heartbeat_timeout_ms", DefaultHeartbeatTimeoutMs);
    }

    auto getControlConnection() const -> std::string override
    {
        return find_or(root_, "control", "connection", std::string{"unix-abstract:org.usbad.control"});
    }

    auto getAssignmentsStoreFile() const -> std::string override
    {
        return find_or(root_, "assignments", "store_file", std::string{"/var/lib/usbad/assignments.toml"});
    }

    auto getAssignAllPolicy() const -> std::string override
    {
        return find_or(root_, "assignments", "assign_all_policy", std::string{"skip_assigned"});
    }

    auto getAckTimeout() const -> Duration override
    {
        return findDuration("assignments", "ack_timeout_ms", DefaultAckTimeoutMs);
    }

    auto getRetryInitialDelay() const -> Duration override
    {
        return findDuration("assignments", "retry_initial_ms", DefaultRetryInitialMs);
    }

    auto getRetryMaxDelay() const -> Duration override
    {
        return findDuration("assignments", "retry_max_ms", DefaultRetryMaxMs);
    }

    auto getTickPeriod() const -> Duration override
    {
        return findDuration("assignments", "tick_period_ms", DefaultTickPeriodMs);
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
            // Missing key or value of a different type.
            return cetl::nullopt;
        }
    }

    Duration findDuration(const char* const table, const char* const key, const std::int64_t default_ms) const
    {
        const auto value_ms = find_or(root_, table, key, default_ms);
        return Duration{(value_ms > 0) ? value_ms : default_ms};
    }

    std::string file_path_;
    TomlValue   root_;

};  // ConfigImpl

}  // namespace

Config::Ptr Config::make(std::string file_path)
{
    auto root = toml::parse<ConfigImpl::TomlConf>(file_path);
    return std::make_shared<ConfigImpl>(std::move(file_path), std::move(root));
}

}  // namespace engine
}  // namespace daemon
}  // namespace usbad
