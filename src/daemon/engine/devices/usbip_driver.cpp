//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "usbip_driver.hpp"

#include "driver_transport.hpp"
#include "engine_types.hpp"
#include "io/process_runner.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <unistd.h>
#include <utility>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace devices
{

constexpr const char* UsbipDriver::DefaultSysfsDevicesDir;
constexpr const char* UsbipDriver::HostDriverName;

namespace
{

class UsbipDriverImpl final : public DriverTransport
{
public:
    UsbipDriverImpl(common::io::ProcessRunner::Ptr process_runner,
                    std::string                    usbip_tool,
                    std::string                    sysfs_devices_dir)
        : process_runner_{std::move(process_runner)}
        , usbip_tool_{std::move(usbip_tool)}
        , sysfs_devices_dir_{std::move(sysfs_devices_dir)}
    {
        CETL_DEBUG_ASSERT(process_runner_, "");
    }

    // DriverTransport

    CETL_NODISCARD int bind(const PortId& port_id) override
    {
        if (isBound(port_id))
        {
            logger_->debug("Device is already bound (port='{}').", port_id);
            return 0;
        }

        const int err = runTool("bind", port_id);
        if (err != 0)
        {
            // `usbip bind` fails for a device bound in the meantime - that's still a success for us.
            if (isBound(port_id))
            {
                return 0;
            }
            logger_->warn("Failed to bind device (port='{}', err={}).", port_id, err);
            return err;
        }

        logger_->info("Device is bound (port='{}').", port_id);
        return 0;
    }

    CETL_NODISCARD int unbind(const PortId& port_id) override
    {
        const int err = runTool("unbind", port_id);
        if (err != 0)
        {
            logger_->warn("Failed to unbind device (port='{}', err={}).", port_id, err);
            return err;
        }

        logger_->info("Device is unbound (port='{}').", port_id);
        return 0;
    }

    CETL_NODISCARD bool isBound(const PortId& port_id) const override
    {
        const auto driver_link = sysfs_devices_dir_ + "/" + port_id + "/driver";

        std::array<char, 256> target{};  // NOLINT(*-magic-numbers)
        const auto            len = ::readlink(driver_link.c_str(), target.data(), target.size() - 1);
        if (len <= 0)
        {
            // No driver at all (or no such device).
            return false;
        }

        const std::string target_path{target.data(), static_cast<std::size_t>(len)};
        const auto        slash_pos   = target_path.find_last_of('/');
        const auto        driver_name = (slash_pos == std::string::npos) ? target_path : target_path.substr(slash_pos + 1);
        return driver_name == UsbipDriver::HostDriverName;
    }

private:
    using RunResult = common::io::ProcessRunner::RunResult;

    /// Runs `<tool> <command> -b <port>`.
    ///
    /// @return Zero on success; `EIO` if the tool has failed; or errno if it could not be run.
    ///
    int runTool(const char* const command, const PortId& port_id)
    {
        auto maybe_result = process_runner_->run({usbip_tool_, command, "-b", port_id});
        if (const auto* const failure = cetl::get_if<RunResult::Failure>(&maybe_result))
        {
            logger_->error("Failed to run '{} {}' (port='{}'): {}.",
                           usbip_tool_,
                           command,
                           port_id,
                           std::strerror(*failure));
            return *failure;
        }

        const auto& success = cetl::get<RunResult::Success>(maybe_result);
        if (success.exit_status != 0)
        {
            logger_->debug("'{} {}' has failed (port='{}', status={}): {}",
                           usbip_tool_,
                           command,
                           port_id,
                           success.exit_status,
                           success.output);
            return EIO;
        }
        return 0;
    }

    common::LoggerPtr                    logger_{common::getLogger("registry")};
    const common::io::ProcessRunner::Ptr process_runner_;
    const std::string                    usbip_tool_;
    const std::string                    sysfs_devices_dir_;

};  // UsbipDriverImpl

}  // namespace

DriverTransport::Ptr UsbipDriver::make(common::io::ProcessRunner::Ptr process_runner,
                                       std::string                    usbip_tool,
                                       std::string                    sysfs_devices_dir)
{
    return std::make_unique<UsbipDriverImpl>(std::move(process_runner),
                                             std::move(usbip_tool),
                                             std::move(sysfs_devices_dir));
}

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace usbad
