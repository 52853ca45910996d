//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_DEVICES_USBIP_DRIVER_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_DEVICES_USBIP_DRIVER_HPP_INCLUDED

#include "driver_transport.hpp"
#include "io/process_runner.hpp"

#include <cetl/cetl.hpp>

#include <string>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace devices
{

/// Driver transport implemented on top of the `usbip` command line tool.
///
class UsbipDriver
{
public:
    /// Default sysfs directory of USB devices - used to detect already bound devices.
    static constexpr const char* DefaultSysfsDevicesDir = "/sys/bus/usb/devices";

    /// Name of the kernel driver which exports devices.
    static constexpr const char* HostDriverName = "usbip-host";

    CETL_NODISCARD static DriverTransport::Ptr make(common::io::ProcessRunner::Ptr process_runner,
                                                    std::string                    usbip_tool,
                                                    std::string sysfs_devices_dir = DefaultSysfsDevicesDir);

};  // UsbipDriver

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_DEVICES_USBIP_DRIVER_HPP_INCLUDED
