//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef USBAD_DAEMON_ENGINE_DEVICES_DEVICE_REGISTRY_HPP_INCLUDED
#define USBAD_DAEMON_ENGINE_DEVICES_DEVICE_REGISTRY_HPP_INCLUDED

#include "driver_transport.hpp"
#include "engine_types.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace devices
{

struct Descriptor final
{
    std::uint16_t vendor_id{0};
    std::uint16_t product_id{0};
    std::string   product;

};  // Descriptor

enum class BindState : std::uint8_t
{
    Unbound,
    BoundLocal,
};

struct Device final
{
    PortId     port_id;
    Descriptor descriptor;
    bool       present{false};
    BindState  bind_state{BindState::Unbound};

};  // Device

/// In-memory view of the whitelisted ports: which devices are present, and which are bound for export.
///
/// Devices are created when first seen on a whitelisted port, and never deleted - only marked absent.
/// Every change of presence or bind state is reported to the changed handler.
///
class DeviceRegistry
{
public:
    using Ptr            = std::unique_ptr<DeviceRegistry>;
    using ChangedHandler = std::function<void(const PortId& port_id)>;

    CETL_NODISCARD static Ptr make(DriverTransport& driver, std::vector<PortId> whitelist);

    DeviceRegistry(const DeviceRegistry&)                = delete;
    DeviceRegistry(DeviceRegistry&&) noexcept            = delete;
    DeviceRegistry& operator=(const DeviceRegistry&)     = delete;
    DeviceRegistry& operator=(DeviceRegistry&&) noexcept = delete;

    virtual ~DeviceRegistry() = default;

    virtual void setChangedHandler(ChangedHandler changed_handler) = 0;

    /// Whether the port is either configured, or lies behind a configured one (on a hub).
    ///
    /// Interface entries (like `1-1:1.0`) are never ports.
    ///
    CETL_NODISCARD virtual bool isWhitelisted(const PortId& port_id) const = 0;

    /// Admits a device - marks it present and tries to bind it.
    ///
    /// Ignored for non-whitelisted ports.
    ///
    virtual void onDeviceAdded(const PortId& port_id, const Descriptor& descriptor) = 0;

    /// Marks a device absent (and so unbound).
    ///
    virtual void onDeviceRemoved(const PortId& port_id) = 0;

    CETL_NODISCARD virtual cetl::optional<Device> get(const PortId& port_id) const = 0;
    CETL_NODISCARD virtual std::vector<Device>    listPresent() const              = 0;
    CETL_NODISCARD virtual std::vector<Device>    list() const                     = 0;

    /// Binds a present device if it is not bound yet.
    ///
    /// @return Zero if the device is bound, `ENODEV` if it is not present, otherwise an error of the driver.
    ///
    CETL_NODISCARD virtual int ensureBound(const PortId& port_id) = 0;

    /// Unbinds (tolerating failure) and binds again a present device.
    ///
    /// Clears stale kernel state, and kills any remote session on the port.
    ///
    CETL_NODISCARD virtual int rebind(const PortId& port_id) = 0;

    /// Unbinds all currently bound devices (on shutdown).
    ///
    virtual void unbindAll() = 0;

protected:
    DeviceRegistry() = default;

};  // DeviceRegistry

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace usbad

#endif  // USBAD_DAEMON_ENGINE_DEVICES_DEVICE_REGISTRY_HPP_INCLUDED
