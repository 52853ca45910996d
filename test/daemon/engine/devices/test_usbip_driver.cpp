//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "devices/usbip_driver.hpp"

#include "common/io/process_runner_mock.hpp"
#include "devices/driver_transport.hpp"
#include "io/process_runner.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace
{

using usbad::common::io::ProcessRunnerMock;
using namespace usbad::daemon::engine::devices;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::ElementsAre;
using testing::Return;
using testing::StrictMock;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestUsbipDriver : public testing::Test
{
protected:
    void SetUp() override
    {
        std::array<char, 64> dir_template{"/tmp/usbad_sysfs_XXXXXX"};
        ASSERT_THAT(::mkdtemp(dir_template.data()), testing::NotNull());
        sysfs_dir_ = dir_template.data();
    }

    void TearDown() override
    {
        for (const auto& link : links_)
        {
            ::unlink(link.c_str());
        }
        for (auto it = dirs_.rbegin(); it != dirs_.rend(); ++it)
        {
            ::rmdir(it->c_str());
        }
        ::rmdir(sysfs_dir_.c_str());
    }

    /// Emulates sysfs entry of a device bound to the given driver.
    ///
    void makeDeviceEntry(const std::string& port_id, const std::string& driver_name)
    {
        const auto device_dir = sysfs_dir_ + "/" + port_id;
        ASSERT_THAT(::mkdir(device_dir.c_str(), 0700), 0);
        dirs_.push_back(device_dir);

        const auto link   = device_dir + "/driver";
        const auto target = "../../../bus/usb/drivers/" + driver_name;
        ASSERT_THAT(::symlink(target.c_str(), link.c_str()), 0);
        links_.push_back(link);
    }

    DriverTransport::Ptr makeDriver()
    {
        return UsbipDriver::make(std::make_unique<ProcessRunnerMock::Wrapper>(runner_mock_), "usbip", sysfs_dir_);
    }

    // MARK: Data members:

    // NOLINTBEGIN
    StrictMock<ProcessRunnerMock> runner_mock_;
    std::string                   sysfs_dir_;
    std::vector<std::string>      dirs_;
    std::vector<std::string>      links_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestUsbipDriver, isBound)
{
    makeDeviceEntry("1-1", "usbip-host");
    makeDeviceEntry("1-2", "usb");

    const auto driver = makeDriver();
    EXPECT_TRUE(driver->isBound("1-1"));
    EXPECT_FALSE(driver->isBound("1-2"));
    EXPECT_FALSE(driver->isBound("1-3"));

    EXPECT_CALL(runner_mock_, deinit());
}

TEST_F(TestUsbipDriver, bind)
{
    makeDeviceEntry("1-2", "usb");

    const auto driver = makeDriver();

    EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "bind", "-b", "1-2")))
        .WillOnce(Return(ProcessRunnerMock::exited(0, "bind device on busid 1-2: complete")));
    EXPECT_THAT(driver->bind("1-2"), 0);

    // Tool failure.
    EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "bind", "-b", "1-2")))
        .WillOnce(Return(ProcessRunnerMock::exited(1, "usbip: error: device not found")));
    EXPECT_THAT(driver->bind("1-2"), EIO);

    // Tool is missing.
    EXPECT_CALL(runner_mock_, run(_)).WillOnce(Return(ENOENT));
    EXPECT_THAT(driver->bind("1-2"), ENOENT);

    EXPECT_CALL(runner_mock_, deinit());
}

TEST_F(TestUsbipDriver, bind_of_bound_device_runs_nothing)
{
    makeDeviceEntry("1-1", "usbip-host");

    const auto driver = makeDriver();
    EXPECT_THAT(driver->bind("1-1"), 0);

    EXPECT_CALL(runner_mock_, deinit());
}

TEST_F(TestUsbipDriver, unbind)
{
    const auto driver = makeDriver();

    EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "unbind", "-b", "1-1")))
        .WillOnce(Return(ProcessRunnerMock::exited(0)));
    EXPECT_THAT(driver->unbind("1-1"), 0);

    EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "unbind", "-b", "1-1")))
        .WillOnce(Return(ProcessRunnerMock::exited(1, "usbip: error: device is not bound to usbip-host driver")));
    EXPECT_THAT(driver->unbind("1-1"), EIO);

    EXPECT_CALL(runner_mock_, deinit());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
