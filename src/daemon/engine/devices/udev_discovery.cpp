//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "udev_discovery.hpp"

#include "device_registry.hpp"
#include "logging.hpp"
#include "usbad/platform/posix_executor_extension.hpp"

#include <cetl/cetl.hpp>
#include <cetl/rtti.hpp>
#include <libcyphal/executor.hpp>

#include <libudev.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

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

constexpr const char* UsbSubsystem = "usb";
constexpr const char* UsbDeviceType = "usb_device";

struct UdevDeleter
{
    void operator()(udev* const ptr) const
    {
        udev_unref(ptr);
    }
    void operator()(udev_monitor* const ptr) const
    {
        udev_monitor_unref(ptr);
    }
    void operator()(udev_enumerate* const ptr) const
    {
        udev_enumerate_unref(ptr);
    }
    void operator()(udev_device* const ptr) const
    {
        udev_device_unref(ptr);
    }

};  // UdevDeleter

template <typename T>
using UdevPtr = std::unique_ptr<T, UdevDeleter>;

class UdevDiscoveryImpl final : public UdevDiscovery
{
public:
    UdevDiscoveryImpl(libcyphal::IExecutor& executor, DeviceRegistry& registry)
        : posix_executor_ext_{cetl::rtti_cast<platform::IPosixExecutorExtension*>(&executor)}
        , registry_{registry}
    {
        CETL_DEBUG_ASSERT(posix_executor_ext_ != nullptr, "");
    }

    // UdevDiscovery

    CETL_NODISCARD int start() override
    {
        udev_.reset(udev_new());
        if (!udev_)
        {
            logger_->error("Failed to create udev context.");
            return ENOMEM;
        }

        // 1. Start monitoring before the enumeration, so that no device is missed in between.
        //
        monitor_.reset(udev_monitor_new_from_netlink(udev_.get(), "udev"));
        if (!monitor_)
        {
            logger_->error("Failed to create udev monitor.");
            return ENOMEM;
        }
        if (const int err = udev_monitor_filter_add_match_subsystem_devtype(monitor_.get(), UsbSubsystem, UsbDeviceType))
        {
            logger_->error("Failed to add udev monitor filter (err={}).", err);
            return -err;
        }
        if (const int err = udev_monitor_enable_receiving(monitor_.get()))
        {
            logger_->error("Failed to enable udev monitor receiving (err={}).", err);
            return -err;
        }

        monitor_callback_ = posix_executor_ext_->registerAwaitableCallback(  //
            [this](const auto&) {
                //
                handleMonitorEvent();
            },
            platform::IPosixExecutorExtension::Trigger::Readable{udev_monitor_get_fd(monitor_.get())});

        // 2. Enumerate already connected devices.
        //
        return enumerateExistingDevices();
    }

private:
    int enumerateExistingDevices()
    {
        const UdevPtr<udev_enumerate> enumerate{udev_enumerate_new(udev_.get())};
        if (!enumerate)
        {
            logger_->error("Failed to create udev enumeration.");
            return ENOMEM;
        }
        udev_enumerate_add_match_subsystem(enumerate.get(), UsbSubsystem);
        udev_enumerate_add_match_property(enumerate.get(), "DEVTYPE", UsbDeviceType);
        if (const int err = udev_enumerate_scan_devices(enumerate.get()))
        {
            logger_->error("Failed to scan udev devices (err={}).", err);
            return -err;
        }

        std::size_t count = 0;

        udev_list_entry* entry = nullptr;
        udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(enumerate.get()))
        {
            const char* const          sys_path = udev_list_entry_get_name(entry);
            const UdevPtr<udev_device> device{udev_device_new_from_syspath(udev_.get(), sys_path)};
            if (device)
            {
                handleDeviceAdded(*device);
                ++count;
            }
        }

        logger_->debug("Enumerated existing USB devices (count={}).", count);
        return 0;
    }

    void handleMonitorEvent()
    {
        const UdevPtr<udev_device> device{udev_monitor_receive_device(monitor_.get())};
        if (!device)
        {
            return;
        }

        const char* const action = udev_device_get_action(device.get());
        if (action == nullptr)
        {
            return;
        }
        logger_->trace("Udev event (action='{}', sysname='{}').", action, safeStr(udev_device_get_sysname(device.get())));

        if (0 == std::strcmp(action, "add"))
        {
            handleDeviceAdded(*device);
        }
        else if (0 == std::strcmp(action, "remove"))
        {
            if (const char* const sys_name = udev_device_get_sysname(device.get()))
            {
                registry_.onDeviceRemoved(sys_name);
            }
        }
    }

    void handleDeviceAdded(udev_device& device)
    {
        const char* const sys_name = udev_device_get_sysname(&device);
        if (sys_name == nullptr)
        {
            return;
        }

        Descriptor descriptor;
        descriptor.vendor_id  = parseHexId(udev_device_get_sysattr_value(&device, "idVendor"));
        descriptor.product_id = parseHexId(udev_device_get_sysattr_value(&device, "idProduct"));
        descriptor.product    = safeStr(udev_device_get_sysattr_value(&device, "product"));

        registry_.onDeviceAdded(sys_name, descriptor);
    }

    static std::uint16_t parseHexId(const char* const str)
    {
        if (str == nullptr)
        {
            return 0;
        }
        constexpr int hex_base = 16;
        return static_cast<std::uint16_t>(std::strtoul(str, nullptr, hex_base));
    }

    static std::string safeStr(const char* const str)
    {
        return (str != nullptr) ? std::string{str} : std::string{};
    }

    common::LoggerPtr                        logger_{common::getLogger("discovery")};
    platform::IPosixExecutorExtension* const posix_executor_ext_;
    DeviceRegistry&                          registry_;
    UdevPtr<udev>                            udev_;
    UdevPtr<udev_monitor>                    monitor_;
    libcyphal::IExecutor::Callback::Any      monitor_callback_;

};  // UdevDiscoveryImpl

}  // namespace

UdevDiscovery::Ptr UdevDiscovery::make(libcyphal::IExecutor& executor, DeviceRegistry& registry)
{
    return std::make_unique<UdevDiscoveryImpl>(executor, registry);
}

}  // namespace devices
}  // namespace engine
}  // namespace daemon
}  // namespace usbad
