//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "device_registry.hpp"

#include "driver_transport.hpp"
#include "engine_types.hpp"
#include "logging.hpp"

#include <cetl/pf17/cetlpf.hpp>

#include <algorithm>
#include <cerrno>
#include <map>
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
namespace devices
{
namespace
{

class DeviceRegistryImpl final : public DeviceRegistry
{
public:
    DeviceRegistryImpl(DriverTransport& driver, std::vector<PortId> whitelist)
        : driver_{driver}
        , whitelist_{std::move(whitelist)}
    {
    }

    // DeviceRegistry

    void setChangedHandler(ChangedHandler changed_handler) override
    {
        changed_handler_ = std::move(changed_handler);
    }

    CETL_NODISCARD bool isWhitelisted(const PortId& port_id) const override
    {
        if (port_id.empty() || (port_id.find(':') != std::string::npos))
        {
            return false;
        }

        return std::any_of(whitelist_.cbegin(), whitelist_.cend(), [&port_id](const PortId& allowed) {
            //
            if (port_id == allowed)
            {
                return true;
            }
            // Behind a hub plugged into the allowed port (`1-1` -> `1-1.2`, `1-1.2.3` etc.).
            return (port_id.size() > allowed.size() + 1) && (port_id.compare(0, allowed.size(), allowed) == 0) &&
                   (port_id[allowed.size()] == '.');
        });
    }

    void onDeviceAdded(const PortId& port_id, const Descriptor& descriptor) override
    {
        if (!isWhitelisted(port_id))
        {
            logger_->debug("Ignoring device on non-whitelisted port (port='{}', id={:04x}:{:04x}).",
                           port_id,
                           descriptor.vendor_id,
                           descriptor.product_id);
            return;
        }

        auto&      device      = devices_[port_id];
        const bool was_present = device.present;
        device.port_id         = port_id;
        device.descriptor      = descriptor;
        device.present         = true;

        logger_->info("Device is {} (port='{}', id={:04x}:{:04x}, product='{}').",
                      was_present ? "present" : "added",
                      port_id,
                      descriptor.vendor_id,
                      descriptor.product_id,
                      descriptor.product);

        // Failure is not fatal here - the device stays unbound, and the bind is retried later.
        const int err = bindImpl(device);
        if (err != 0)
        {
            logger_->warn("Failed to bind added device (port='{}', err={}).", port_id, err);
        }

        notifyChanged(port_id);
    }

    void onDeviceRemoved(const PortId& port_id) override
    {
        const auto it = devices_.find(port_id);
        if ((it == devices_.end()) || !it->second.present)
        {
            logger_->debug("Ignoring removal of unknown device (port='{}').", port_id);
            return;
        }

        auto& device      = it->second;
        device.present    = false;
        device.bind_state = BindState::Unbound;

        logger_->info("Device is removed (port='{}').", port_id);
        notifyChanged(port_id);
    }

    CETL_NODISCARD cetl::optional<Device> get(const PortId& port_id) const override
    {
        const auto it = devices_.find(port_id);
        if (it == devices_.end())
        {
            return cetl::nullopt;
        }
        return it->second;
    }

    CETL_NODISCARD std::vector<Device> listPresent() const override
    {
        std::vector<Device> result;
        for (const auto& port_and_device : devices_)
        {
            if (port_and_device.second.present)
            {
                result.push_back(port_and_device.second);
            }
        }
        return result;
    }

    CETL_NODISCARD std::vector<Device> list() const override
    {
        std::vector<Device> result;
        result.reserve(devices_.size());
        for (const auto& port_and_device : devices_)
        {
            result.push_back(port_and_device.second);
        }
        return result;
    }

    CETL_NODISCARD int ensureBound(const PortId& port_id) override
    {
        auto* const device = tryFindPresent(port_id);
        if (device == nullptr)
        {
            return ENODEV;
        }
        if (device->bind_state == BindState::BoundLocal)
        {
            return 0;
        }

        const int err = bindImpl(*device);
        if (err == 0)
        {
            notifyChanged(port_id);
        }
        return err;
    }

    CETL_NODISCARD int rebind(const PortId& port_id) override
    {
        auto* const device = tryFindPresent(port_id);
        if (device == nullptr)
        {
            return ENODEV;
        }

        logger_->debug("Rebinding device (port='{}')...", port_id);

        const int unbind_err = driver_.unbind(port_id);
        if (unbind_err != 0)
        {
            // Tolerated - the device might be not bound at all.
            logger_->debug("Unbind before rebind has failed (port='{}', err={}).", port_id, unbind_err);
        }
        device->bind_state = BindState::Unbound;

        const int err = bindImpl(*device);
        notifyChanged(port_id);
        return err;
    }

    void unbindAll() override
    {
        for (auto& port_and_device : devices_)
        {
            auto& device = port_and_device.second;
            if (device.bind_state == BindState::BoundLocal)
            {
                const int err = driver_.unbind(device.port_id);
                if (err != 0)
                {
                    logger_->warn("Failed to unbind device on shutdown (port='{}', err={}).", device.port_id, err);
                }
                device.bind_state = BindState::Unbound;
            }
        }
    }

private:
    Device* tryFindPresent(const PortId& port_id)
    {
        const auto it = devices_.find(port_id);
        if ((it == devices_.end()) || !it->second.present)
        {
            return nullptr;
        }
        return &it->second;
    }

    int bindImpl(Device& device)
    {
        const int err = driver_.bind(device.port_id);
        if (err != 0)
        {
            logger_->warn("Transport error: failed to bind (port='{}', err={}).", device.port_id, err);
            device.bind_state = BindState::Unbound;
            return err;
        }
        device.bind_state = BindState::BoundLocal;
        return 0;
    }

    void notifyChanged(const PortId& port_id) const
    {
        if (changed_handler_)
        {
            changed_handler_(port_id);
        }
    }

    common::LoggerPtr         logger_{common::getLogger("registry")};
    DriverTransport&          driver_;
    const std::vector<PortId> whitelist_;
    std::map<PortId, Device>  devices_;
    ChangedHandler            changed_handler_;

};  // DeviceRegistryImpl

}  // namespace

DeviceRegistry::Ptr DeviceRegistry::make(DriverTransport& driver, std::vector<PortId> whitelist)
{
    return std::make_unique<DeviceRegistryImpl>(driver, std::move(whitelist));
}

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace usbad
