//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_DEVICES_UDEV_DISCOVERY_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_DEVICES_UDEV_DISCOVERY_HPP_INCLUDED

#include "device_registry.hpp"

#include <cetl/cetl.hpp>
#include <libcyphal/executor.hpp>

#include <memory>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace devices
{

/// Feeds the device registry with USB devices - existing ones on start, and then hot-plug events.
///
/// Uses libudev netlink monitor, which is served by the executor (so no extra threads).
///
class UdevDiscovery
{
public:
    using Ptr = std::unique_ptr<UdevDiscovery>;

    CETL_NODISCARD static Ptr make(libcyphal::IExecutor& executor, DeviceRegistry& registry);

    UdevDiscovery(const UdevDiscovery&)                = delete;
    UdevDiscovery(UdevDiscovery&&) noexcept            = delete;
    UdevDiscovery& operator=(const UdevDiscovery&)     = delete;
    UdevDiscovery& operator=(UdevDiscovery&&) noexcept = delete;

    virtual ~UdevDiscovery() = default;

    /// Starts monitoring, and then enumerates already connected devices.
    ///
    /// @return Zero on success, otherwise errno.
    ///
    CETL_NODISCARD virtual int start() = 0;

protected:
    UdevDiscovery() = default;

};  // UdevDiscovery

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_DEVICES_UDEV_DISCOVERY_HPP_INCLUDED
