//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "config.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>

namespace
{

using usbad::daemon::engine::Config;

using testing::ElementsAre;
using testing::Eq;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""ms;
using std::literals::chrono_literals::operator""s;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestConfig : public testing::Test
{
protected:
    void TearDown() override
    {
        if (!file_path_.empty())
        {
            ::unlink(file_path_.c_str());
        }
    }

    Config::Ptr makeConfig(const std::string& content)
    {
        std::array<char, 64> file_template{"/tmp/usbad_config_XXXXXX"};
        const int            fd = ::mkstemp(file_template.data());
        EXPECT_THAT(fd, testing::Ge(0));
        ::close(fd);
        file_path_ = file_template.data();

        std::ofstream file{file_path_};
        file << content;
        file.close();

        return Config::make(file_path_);
    }

    // MARK: Data members:

    // NOLINTBEGIN
    std::string file_path_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestConfig, defaults)
{
    const auto config = makeConfig("");

    EXPECT_THAT(config->getUsbPorts(), ElementsAre("1-1", "3-1", "1-2", "3-2"));
    EXPECT_THAT(config->getClientsConnection(), "*:65432");
    EXPECT_THAT(config->getClientsHeartbeatPeriod(), 5s);
    EXPECT_THAT(config->getClientsHeartbeatTimeout(), 15s);
    EXPECT_THAT(config->getControlConnection(), "unix-abstract:org.usbad.control");
    EXPECT_THAT(config->getAssignmentsStoreFile(), "/var/lib/usbad/assignments.toml");
    EXPECT_THAT(config->getAssignAllPolicy(), "skip_assigned");
    EXPECT_THAT(config->getAckTimeout(), 10s);
    EXPECT_THAT(config->getRetryInitialDelay(), 1s);
    EXPECT_THAT(config->getRetryMaxDelay(), 60s);
    EXPECT_THAT(config->getTickPeriod(), 1s);
    EXPECT_THAT(config->getUsbipTool(), "usbip");
    EXPECT_FALSE(config->getLoggingFile().has_value());
    EXPECT_FALSE(config->getLoggingLevel().has_value());
    EXPECT_FALSE(config->getLoggingFlushLevel().has_value());
}

TEST_F(TestConfig, explicit_values)
{
    const auto config = makeConfig(R"(
[usb]
ports = ["2-1", "2-2"]

[clients]
connection = "192.168.0.10:4000"
heartbeat_period_ms = 250
heartbeat_timeout_ms = 0

[control]
connection = "unix:/run/usbad/control.sock"

[assignments]
store_file = "/tmp/assignments.toml"
assign_all_policy = "override"
ack_timeout_ms = 3000

[usbip]
tool = "/usr/local/sbin/usbip"

[logging]
file = "/var/log/usbad.log"
level = "debug"
)");

    EXPECT_THAT(config->getUsbPorts(), ElementsAre("2-1", "2-2"));
    EXPECT_THAT(config->getClientsConnection(), "192.168.0.10:4000");
    EXPECT_THAT(config->getClientsHeartbeatPeriod(), 250ms);
    EXPECT_THAT(config->getClientsHeartbeatTimeout(), 15s);  // non-positive falls back to default
    EXPECT_THAT(config->getControlConnection(), "unix:/run/usbad/control.sock");
    EXPECT_THAT(config->getAssignmentsStoreFile(), "/tmp/assignments.toml");
    EXPECT_THAT(config->getAssignAllPolicy(), "override");
    EXPECT_THAT(config->getAckTimeout(), 3s);
    EXPECT_THAT(config->getUsbipTool(), "/usr/local/sbin/usbip");
    EXPECT_THAT(config->getLoggingFile(), Eq(cetl::optional<std::string>{"/var/log/usbad.log"}));
    EXPECT_THAT(config->getLoggingLevel(), Eq(cetl::optional<std::string>{"debug"}));
    EXPECT_FALSE(config->getLoggingFlushLevel().has_value());
}

TEST_F(TestConfig, wrong_value_type_is_default)
{
    const auto config = makeConfig(R"(
[logging]
level = 5
)");
    EXPECT_FALSE(config->getLoggingLevel().has_value());
}

TEST_F(TestConfig, unparsable_file_throws)
{
    EXPECT_ANY_THROW(makeConfig("[usb\nports = "));
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
