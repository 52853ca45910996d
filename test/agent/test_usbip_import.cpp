//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "usbip_import.hpp"

#include "common/io/process_runner_mock.hpp"
#include "import_transport.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cerrno>
#include <memory>
#include <string>

namespace
{

using usbad::agent::ImportTransport;
using usbad::agent::UsbipImport;
using usbad::common::io::ProcessRunnerMock;

using testing::ElementsAre;
using testing::InSequence;
using testing::IsEmpty;
using testing::Pair;
using testing::Return;
using testing::StrictMock;

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

constexpr const char* LinuxPortOutput = R"(Imported USB devices
====================
Port 00: <Port in Use> at Full Speed(12Mbps)
       STMicroelectronics : Virtual COM Port (0483:5740)
       3-1 -> usbip://192.168.1.10:3240/1-1
           -> remote bus/dev 001/004
Port 01: <Port in Use> at High Speed(480Mbps)
       unknown vendor : unknown product (1234:5678)
       3-2 -> usbip://192.168.1.10:3240/1-2.3
           -> remote bus/dev 001/007
)";

constexpr const char* WindowsPortOutput = R"(Imported USB devices
====================
port 1: used
    <-> busid 1-1 (0483:5740)
port 2: <-> busid 3-2 (1234:5678) STMicroelectronics : Virtual COM Port
)";

class TestUsbipImport : public testing::Test
{
protected:
    ImportTransport::Ptr makeImport()
    {
        return UsbipImport::make(std::make_unique<ProcessRunnerMock::Wrapper>(runner_mock_), "usbip", "10.0.0.1");
    }

    // MARK: Data members:

    // NOLINTBEGIN
    StrictMock<ProcessRunnerMock> runner_mock_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestUsbipImport, parseImportedPorts_linux)
{
    EXPECT_THAT(UsbipImport::parseImportedPorts(LinuxPortOutput),
                ElementsAre(Pair("1-1", "00"), Pair("1-2.3", "01")));
}

TEST_F(TestUsbipImport, parseImportedPorts_windows)
{
    // Only single-line entries carry both the port number and the bus id.
    EXPECT_THAT(UsbipImport::parseImportedPorts(WindowsPortOutput), ElementsAre(Pair("3-2", "2")));
}

TEST_F(TestUsbipImport, parseImportedPorts_nothing_imported)
{
    EXPECT_THAT(UsbipImport::parseImportedPorts(""), IsEmpty());
    EXPECT_THAT(UsbipImport::parseImportedPorts("Imported USB devices\n====================\n"), IsEmpty());
    EXPECT_THAT(UsbipImport::parseImportedPorts("Port 00: <Port in Use>\n  garbage -> usbip://host\n"), IsEmpty());
}

TEST_F(TestUsbipImport, attach)
{
    const auto import = makeImport();

    {
        InSequence seq;
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "port"))).WillOnce(Return(ProcessRunnerMock::exited(0)));
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "attach", "-r", "10.0.0.1", "-b", "1-2")))
            .WillOnce(Return(ProcessRunnerMock::exited(0)));
    }
    EXPECT_THAT(import->attach("1-2"), 0);

    // Failure of the attach itself.
    {
        InSequence seq;
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "port"))).WillOnce(Return(ENOENT));
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "attach", "-r", "10.0.0.1", "-b", "1-2")))
            .WillOnce(Return(ProcessRunnerMock::exited(1, "usbip: error: import device")));
    }
    EXPECT_THAT(import->attach("1-2"), EIO);

    EXPECT_CALL(runner_mock_, deinit());
}

TEST_F(TestUsbipImport, attach_releases_stale_import)
{
    const auto import = makeImport();

    {
        InSequence seq;
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "port")))
            .WillOnce(Return(ProcessRunnerMock::exited(0, LinuxPortOutput)));
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "detach", "-p", "00")))
            .WillOnce(Return(ProcessRunnerMock::exited(0)));
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "attach", "-r", "10.0.0.1", "-b", "1-1")))
            .WillOnce(Return(ProcessRunnerMock::exited(0)));
    }
    EXPECT_THAT(import->attach("1-1"), 0);

    EXPECT_CALL(runner_mock_, deinit());
}

TEST_F(TestUsbipImport, detach)
{
    const auto import = makeImport();

    {
        InSequence seq;
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "port")))
            .WillOnce(Return(ProcessRunnerMock::exited(0, LinuxPortOutput)));
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "detach", "-p", "01")))
            .WillOnce(Return(ProcessRunnerMock::exited(0)));
    }
    EXPECT_THAT(import->detach("1-2.3"), 0);

    // Not imported - nothing to do.
    EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "port")))
        .WillOnce(Return(ProcessRunnerMock::exited(0, LinuxPortOutput)));
    EXPECT_THAT(import->detach("1-3"), 0);

    {
        InSequence seq;
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "port")))
            .WillOnce(Return(ProcessRunnerMock::exited(0, LinuxPortOutput)));
        EXPECT_CALL(runner_mock_, run(ElementsAre("usbip", "detach", "-p", "00")))
            .WillOnce(Return(ProcessRunnerMock::exited(2)));
    }
    EXPECT_THAT(import->detach("1-1"), EIO);

    EXPECT_CALL(runner_mock_, deinit());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
