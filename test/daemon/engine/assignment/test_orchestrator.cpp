//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "assignment/orchestrator.hpp"

#include "assignment/assignment_types.hpp"
#include "daemon/engine/assignment/assignment_store_mock.hpp"
#include "clients/client_manager.hpp"
#include "daemon/engine/clients/client_manager_mock.hpp"
#include "daemon/engine/devices/driver_transport_mock.hpp"
#include "devices/device_registry.hpp"
#include "engine_types.hpp"
#include "virtual_time_scheduler.hpp"

#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/types.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <iterator>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

using namespace usbad::daemon::engine;              // NOLINT This our main concern here in the unit tests.
using namespace usbad::daemon::engine::assignment;  // NOLINT This our main concern here in the unit tests.

using testing::_;
using testing::ElementsAre;
using testing::Eq;
using testing::Invoke;
using testing::IsEmpty;
using testing::NiceMock;
using testing::Pair;
using testing::Return;
using testing::SizeIs;
using testing::Throw;

// https://github.com/llvm/llvm-project/issues/53444
// NOLINTBEGIN(misc-unused-using-decls, misc-include-cleaner)
using std::literals::chrono_literals::operator""s;
// NOLINTEND(misc-unused-using-decls, misc-include-cleaner)

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

class TestOrchestrator : public testing::Test
{
protected:
    using Command = clients::ClientManager::Command;
    using Event   = clients::ClientManager::Event;
    using Status  = OpResult::Status;

    /// Command as seen by a client.
    struct Sent final
    {
        ClientId     client_id;
        bool         is_attach;
        PortId       port_id;
        TransitionId transition_id;

    };  // Sent

    void SetUp() override
    {
        ON_CALL(driver_mock_, bind(_)).WillByDefault(Invoke([this](const PortId& port_id) {
            //
            ++bind_count_[port_id];
            trace_.push_back("bind " + port_id);
            return bind_error_;
        }));
        ON_CALL(driver_mock_, unbind(_)).WillByDefault(Invoke([this](const PortId& port_id) {
            //
            ++unbind_count_[port_id];
            trace_.push_back("unbind " + port_id);
            return 0;
        }));

        ON_CALL(client_manager_mock_, isConnected(_)).WillByDefault(Invoke([this](const ClientId& client_id) {
            //
            return connected_.count(client_id) > 0;
        }));
        ON_CALL(client_manager_mock_, send(_, _))
            .WillByDefault(Invoke([this](const ClientId& client_id, const Command::Var& command) {
                //
                if (connected_.count(client_id) == 0)
                {
                    return ENOTCONN;
                }
                if (send_error_ != 0)
                {
                    return send_error_;
                }
                cetl::visit(cetl::make_overloaded(
                                [&](const Command::Attach& attach) {
                                    sent_.push_back({client_id, true, attach.port_id, attach.transition_id});
                                    trace_.push_back("attach " + client_id + " " + attach.port_id);
                                },
                                [&](const Command::Detach& detach) {
                                    sent_.push_back({client_id, false, detach.port_id, detach.transition_id});
                                    trace_.push_back("detach " + client_id + " " + detach.port_id);
                                }),
                            command);
                return 0;
            }));
        ON_CALL(client_manager_mock_, clients()).WillByDefault(Return(std::vector<clients::ClientManager::ClientRecord>{}));

        ON_CALL(store_mock_, load()).WillByDefault(Invoke([this] { return persisted_; }));
        ON_CALL(store_mock_, save(_)).WillByDefault(Invoke([this](const PersistentState& state) {
            //
            if (save_error_ == 0)
            {
                persisted_ = state;
            }
            return save_error_;
        }));
    }

    void TearDown() override
    {
        orchestrator_.reset();
        registry_.reset();
    }

    void makeOrchestrator(const AssignAllPolicy policy = AssignAllPolicy::SkipAssigned)
    {
        orchestrator_.reset();
        registry_ = devices::DeviceRegistry::make(driver_mock_, {"1-1", "1-2", "1-3"});

        const Orchestrator::Params params{5s, 1s, 8s, 1s, policy};
        orchestrator_ = Orchestrator::make(scheduler_, *registry_, client_manager_mock_, store_mock_, params);
        orchestrator_->start();
    }

    void plug(const PortId& port_id)
    {
        registry_->onDeviceAdded(port_id, devices::Descriptor{0x0483, 0x5740, "Virtual COM Port"});
    }

    void unplug(const PortId& port_id)
    {
        registry_->onDeviceRemoved(port_id);
    }

    void connect(const ClientId& client_id)
    {
        connected_.insert(client_id);
        orchestrator_->onClientEvent(Event::Connected{client_id});
    }

    void disconnect(const ClientId& client_id)
    {
        connected_.erase(client_id);
        orchestrator_->onClientEvent(Event::Disconnected{client_id});
    }

    void ack(const Sent& sent, const bool success = true)
    {
        orchestrator_->onClientEvent(
            Event::Ack{sent.client_id, sent.port_id, sent.transition_id, success, success ? 0 : EIO});
    }

    /// Acknowledges (successfully) the latest command of the port.
    ///
    void ackLast(const PortId& port_id)
    {
        const auto sent = lastSentFor(port_id);
        ASSERT_TRUE(sent.has_value());
        ack(*sent);
    }

    cetl::optional<Sent> lastSentFor(const PortId& port_id) const
    {
        const auto it = std::find_if(sent_.rbegin(), sent_.rend(), [&port_id](const Sent& sent) {
            //
            return sent.port_id == port_id;
        });
        if (it == sent_.rend())
        {
            return cetl::nullopt;
        }
        return *it;
    }

    std::vector<Sent> sentFor(const PortId& port_id) const
    {
        std::vector<Sent> result;
        std::copy_if(sent_.begin(), sent_.end(), std::back_inserter(result), [&port_id](const Sent& sent) {
            //
            return sent.port_id == port_id;
        });
        return result;
    }

    PortSnapshot portOf(const PortId& port_id) const
    {
        const auto snapshot = orchestrator_->snapshot();
        const auto it       = std::find_if(snapshot.ports.begin(), snapshot.ports.end(), [&](const PortSnapshot& port) {
            //
            return port.port_id == port_id;
        });
        EXPECT_TRUE(it != snapshot.ports.end()) << "port='" << port_id << "'";
        return (it != snapshot.ports.end()) ? *it : PortSnapshot{};
    }

    /// At most one client may believe (by the commands it has received) that it uses the port.
    ///
    void expectMutualExclusion() const
    {
        std::map<PortId, std::set<ClientId>> attached;
        for (const auto& sent : sent_)
        {
            if (sent.is_attach)
            {
                attached[sent.port_id].insert(sent.client_id);
            }
            else
            {
                attached[sent.port_id].erase(sent.client_id);
            }
            EXPECT_THAT(attached[sent.port_id].size(), testing::Le(1)) << "port='" << sent.port_id << "'";
        }
    }

    // MARK: Data members:

    // NOLINTBEGIN
    usbad::VirtualTimeScheduler                   scheduler_{};
    NiceMock<devices::DriverTransportMock>        driver_mock_;
    NiceMock<clients::ClientManagerMock>          client_manager_mock_;
    NiceMock<AssignmentStoreMock>                 store_mock_;
    devices::DeviceRegistry::Ptr                  registry_;
    Orchestrator::Ptr                             orchestrator_;
    std::set<ClientId>                            connected_;
    std::vector<Sent>                             sent_;
    PersistentState                               persisted_;
    int                                           save_error_{0};
    int                                           send_error_{0};
    int                                           bind_error_{0};
    std::map<PortId, int>                         bind_count_;
    std::map<PortId, int>                         unbind_count_;
    std::vector<std::string>                      trace_;
    // NOLINTEND
};

// MARK: - Tests:

TEST_F(TestOrchestrator, assign_rejects_invalid_requests)
{
    makeOrchestrator();
    connect("alice");

    const auto not_whitelisted = orchestrator_->assign("2-1", "alice");
    EXPECT_THAT(not_whitelisted.status, Status::Rejected);
    EXPECT_THAT(not_whitelisted.error, ErrorKind::ConfigurationError);

    const auto interface_entry = orchestrator_->assign("1-1:1.0", "alice");
    EXPECT_THAT(interface_entry.status, Status::Rejected);
    EXPECT_THAT(interface_entry.error, ErrorKind::ConfigurationError);

    const auto empty_client = orchestrator_->assign("1-1", "");
    EXPECT_THAT(empty_client.status, Status::Rejected);
    EXPECT_THAT(empty_client.error, ErrorKind::ConfigurationError);

    EXPECT_THAT(persisted_.intents, IsEmpty());
    EXPECT_THAT(sent_, IsEmpty());
}

TEST_F(TestOrchestrator, assign_attaches_present_device)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");

    const auto result = orchestrator_->assign("1-1", "alice");
    EXPECT_THAT(result.status, Status::Accepted);
    EXPECT_THAT(result.error, ErrorKind::None);
    EXPECT_THAT(persisted_.intents, ElementsAre(Pair("1-1", "alice")));

    ASSERT_THAT(sent_, SizeIs(1));
    EXPECT_TRUE(sent_[0].is_attach);
    EXPECT_THAT(sent_[0].client_id, "alice");
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Attaching);

    ack(sent_[0]);
    const auto port = portOf("1-1");
    EXPECT_THAT(port.remote_state, RemoteState::Attached);
    EXPECT_THAT(port.holder_client, Eq(cetl::optional<ClientId>{"alice"}));

    // Repeated assignment is complete already, and sends nothing.
    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Completed);
    EXPECT_THAT(sent_, SizeIs(1));
}

TEST_F(TestOrchestrator, presence_gating)
{
    makeOrchestrator();
    connect("alice");

    const auto result = orchestrator_->assign("1-2", "alice");
    EXPECT_THAT(result.status, Status::Accepted);
    EXPECT_THAT(persisted_.intents.at("1-2"), "alice");

    scheduler_.spinFor(10s);
    EXPECT_THAT(sent_, IsEmpty());
    EXPECT_THAT(portOf("1-2").present, false);
    EXPECT_THAT(portOf("1-2").intended_client, Eq(cetl::optional<ClientId>{"alice"}));

    plug("1-2");
    ASSERT_THAT(sent_, SizeIs(1));
    EXPECT_TRUE(sent_[0].is_attach);
    EXPECT_THAT(sent_[0].port_id, "1-2");
}

TEST_F(TestOrchestrator, assign_waits_for_client_connection)
{
    makeOrchestrator();
    plug("1-1");

    const auto result = orchestrator_->assign("1-1", "alice");
    EXPECT_THAT(result.status, Status::Accepted);
    EXPECT_THAT(result.error, ErrorKind::ClientUnreachable);
    scheduler_.spinFor(3s);
    EXPECT_THAT(sent_, IsEmpty());

    connect("alice");
    ASSERT_THAT(sent_, SizeIs(1));
    EXPECT_TRUE(sent_[0].is_attach);
}

TEST_F(TestOrchestrator, reassignment_detaches_previous_holder_first)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");
    connect("bob");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ackLast("1-1");
    ASSERT_THAT(portOf("1-1").remote_state, RemoteState::Attached);

    EXPECT_THAT(orchestrator_->assign("1-1", "bob").status, Status::Accepted);
    ASSERT_THAT(sent_, SizeIs(2));
    EXPECT_FALSE(sent_[1].is_attach);
    EXPECT_THAT(sent_[1].client_id, "alice");
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Detaching);

    // Nothing goes to bob until alice acknowledges.
    scheduler_.spinFor(2s);
    EXPECT_THAT(sent_, SizeIs(2));

    ack(sent_[1]);
    ASSERT_THAT(sent_, SizeIs(3));
    EXPECT_TRUE(sent_[2].is_attach);
    EXPECT_THAT(sent_[2].client_id, "bob");
    EXPECT_THAT(sent_[2].transition_id, testing::Gt(sent_[1].transition_id));

    ack(sent_[2]);
    EXPECT_THAT(portOf("1-1").holder_client, Eq(cetl::optional<ClientId>{"bob"}));
    expectMutualExclusion();
}

TEST_F(TestOrchestrator, reassignment_proceeds_when_previous_holder_disconnects)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");
    connect("bob");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ackLast("1-1");
    EXPECT_THAT(orchestrator_->assign("1-1", "bob").status, Status::Accepted);
    ASSERT_THAT(sent_, SizeIs(2));
    const auto unbinds_before = unbind_count_["1-1"];

    disconnect("alice");

    // Local rebind kills the remote session of alice before bob gets the device.
    EXPECT_THAT(unbind_count_["1-1"], unbinds_before + 1);
    ASSERT_THAT(sent_, SizeIs(3));
    EXPECT_TRUE(sent_[2].is_attach);
    EXPECT_THAT(sent_[2].client_id, "bob");
    expectMutualExclusion();
}

TEST_F(TestOrchestrator, stale_ack_is_ignored)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ASSERT_THAT(sent_, SizeIs(1));
    const auto first_attach = sent_[0];

    // No ack within timeout -> port is released, and retried after backoff.
    scheduler_.spinFor(5s);
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Detached);
    EXPECT_THAT(sent_, SizeIs(1));

    scheduler_.spinFor(1s);
    ASSERT_THAT(sent_, SizeIs(2));
    const auto second_attach = sent_[1];
    EXPECT_TRUE(second_attach.is_attach);
    EXPECT_THAT(second_attach.transition_id, testing::Gt(first_attach.transition_id));

    // Late ack of the superseded command changes nothing.
    ack(first_attach);
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Attaching);

    ack(second_attach);
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Attached);
}

TEST_F(TestOrchestrator, failed_attach_is_retried_with_backoff)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ASSERT_THAT(sent_, SizeIs(1));

    const auto unbinds_before = unbind_count_["1-1"];
    ack(sent_[0], false);
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Detached);
    EXPECT_THAT(unbind_count_["1-1"], unbinds_before + 1);

    // First retry after 1s.
    scheduler_.spinFor(1s);
    ASSERT_THAT(sent_, SizeIs(2));
    ack(sent_[1], false);

    // Second retry after 2s (exponential).
    scheduler_.spinFor(1s);
    EXPECT_THAT(sent_, SizeIs(2));
    scheduler_.spinFor(1s);
    ASSERT_THAT(sent_, SizeIs(3));

    ack(sent_[2]);
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Attached);
}

TEST_F(TestOrchestrator, force_free_is_idempotent)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ackLast("1-1");
    const auto unbinds_before = unbind_count_["1-1"];

    const auto first = orchestrator_->forceFree("1-1");
    EXPECT_THAT(first.status, Status::Completed);
    EXPECT_THAT(unbind_count_["1-1"], unbinds_before + 1);
    ASSERT_THAT(sent_, SizeIs(2));
    EXPECT_FALSE(sent_[1].is_attach);

    const auto second = orchestrator_->forceFree("1-1");
    EXPECT_THAT(second.status, Status::Completed);
    EXPECT_THAT(unbind_count_["1-1"], unbinds_before + 1);
    EXPECT_THAT(sent_, SizeIs(2));

    const auto port = portOf("1-1");
    EXPECT_THAT(port.remote_state, RemoteState::Detached);
    EXPECT_FALSE(port.intended_client.has_value());
    EXPECT_FALSE(port.holder_client.has_value());
    EXPECT_THAT(persisted_.intents, IsEmpty());

    // Late ack of the best-effort detach is stale.
    ack(sent_[1]);
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Detached);

    EXPECT_THAT(orchestrator_->forceFree("3-1").status, Status::Rejected);
}

TEST_F(TestOrchestrator, detach_timeout_resends_and_keeps_new_client_waiting)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");
    connect("bob");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ackLast("1-1");
    EXPECT_THAT(orchestrator_->assign("1-1", "bob").status, Status::Accepted);
    ASSERT_THAT(sent_, SizeIs(2));
    const auto first_detach = sent_[1];
    EXPECT_FALSE(first_detach.is_attach);

    const auto sent_to_bob = [this] {
        return std::count_if(sent_.begin(), sent_.end(), [](const Sent& sent) { return sent.client_id == "bob"; });
    };

    // No ack in time -> the detach is repeated with a new transition id.
    scheduler_.spinFor(5s);
    ASSERT_THAT(sent_, SizeIs(3));
    const auto second_detach = sent_[2];
    EXPECT_FALSE(second_detach.is_attach);
    EXPECT_THAT(second_detach.client_id, "alice");
    EXPECT_THAT(second_detach.transition_id, testing::Gt(first_detach.transition_id));
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Detaching);
    EXPECT_THAT(sent_to_bob(), 0);

    // Late ack of the superseded detach changes nothing.
    ack(first_detach);
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Detaching);
    EXPECT_THAT(sent_, SizeIs(3));

    // Undelivered repetition is retried after backoff.
    send_error_ = EPIPE;
    scheduler_.spinFor(5s);
    EXPECT_THAT(sent_, SizeIs(3));
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Detaching);
    send_error_ = 0;
    scheduler_.spinFor(1s);
    ASSERT_THAT(sent_, SizeIs(4));
    const auto third_detach = sent_[3];
    EXPECT_FALSE(third_detach.is_attach);
    EXPECT_THAT(third_detach.client_id, "alice");
    EXPECT_THAT(sent_to_bob(), 0);

    ack(second_detach);
    EXPECT_THAT(sent_, SizeIs(4));

    ack(third_detach);
    ASSERT_THAT(sent_, SizeIs(5));
    EXPECT_TRUE(sent_[4].is_attach);
    EXPECT_THAT(sent_[4].client_id, "bob");
    expectMutualExclusion();
}

TEST_F(TestOrchestrator, failed_detach_ack_rebinds_before_reassignment)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");
    connect("bob");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ackLast("1-1");
    EXPECT_THAT(orchestrator_->assign("1-1", "bob").status, Status::Accepted);
    ASSERT_THAT(sent_, SizeIs(2));
    const auto unbinds_before = unbind_count_["1-1"];

    trace_.clear();
    ack(sent_[1], false);

    EXPECT_THAT(unbind_count_["1-1"], unbinds_before + 1);
    EXPECT_THAT(trace_, ElementsAre("unbind 1-1", "bind 1-1", "attach bob 1-1"));
    EXPECT_THAT(portOf("1-1").holder_client, Eq(cetl::optional<ClientId>{"bob"}));
    expectMutualExclusion();
}

TEST_F(TestOrchestrator, failed_bind_is_retried_with_backoff)
{
    makeOrchestrator();

    bind_error_ = EIO;
    plug("1-1");
    EXPECT_THAT(portOf("1-1").bind_state, devices::BindState::Unbound);
    const auto binds_after_plug = bind_count_["1-1"];

    // Retried even without any intent - after 1s, then after 2s more.
    scheduler_.spinFor(1s);
    EXPECT_THAT(bind_count_["1-1"], binds_after_plug + 1);
    scheduler_.spinFor(1s);
    EXPECT_THAT(bind_count_["1-1"], binds_after_plug + 1);
    scheduler_.spinFor(1s);
    EXPECT_THAT(bind_count_["1-1"], binds_after_plug + 2);

    bind_error_ = 0;
    scheduler_.spinFor(4s);
    EXPECT_THAT(bind_count_["1-1"], binds_after_plug + 3);
    EXPECT_THAT(portOf("1-1").bind_state, devices::BindState::BoundLocal);

    scheduler_.spinFor(10s);
    EXPECT_THAT(bind_count_["1-1"], binds_after_plug + 3);

    connect("alice");
    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ASSERT_THAT(sent_, SizeIs(1));
    EXPECT_TRUE(sent_[0].is_attach);
}

TEST_F(TestOrchestrator, exception_while_handling_device_change_is_contained)
{
    makeOrchestrator();

    // The first bind is the admission one (by the registry); the second one is a retry by the orchestrator.
    EXPECT_CALL(driver_mock_, bind("1-1"))
        .WillOnce(Return(EIO))
        .WillOnce(Throw(std::runtime_error("usbip output is garbled")))
        .WillRepeatedly(Return(0));
    EXPECT_NO_THROW(plug("1-1"));

    scheduler_.spinFor(1s);
    EXPECT_THAT(portOf("1-1").bind_state, devices::BindState::BoundLocal);

    connect("alice");
    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ASSERT_THAT(sent_, SizeIs(1));
    EXPECT_TRUE(sent_[0].is_attach);
}

TEST_F(TestOrchestrator, force_free_reports_failed_rebind)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ackLast("1-1");

    bind_error_ = EIO;
    const auto result = orchestrator_->forceFree("1-1");
    EXPECT_THAT(result.status, Status::Accepted);
    EXPECT_THAT(result.error, ErrorKind::TransportError);
    EXPECT_THAT(persisted_.intents, IsEmpty());

    auto port = portOf("1-1");
    EXPECT_THAT(port.remote_state, RemoteState::Detached);
    EXPECT_THAT(port.bind_state, devices::BindState::Unbound);

    bind_error_ = 0;
    scheduler_.spinFor(1s);
    port = portOf("1-1");
    EXPECT_THAT(port.bind_state, devices::BindState::BoundLocal);
    EXPECT_FALSE(port.holder_client.has_value());
    EXPECT_THAT(sent_, SizeIs(2));
}

TEST_F(TestOrchestrator, force_reattach_reattaches_same_client)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    ackLast("1-1");

    const auto result = orchestrator_->forceReattach("1-1");
    EXPECT_THAT(result.status, Status::Accepted);

    const auto sent = sentFor("1-1");
    ASSERT_THAT(sent, SizeIs(3));
    EXPECT_FALSE(sent[1].is_attach);
    EXPECT_TRUE(sent[2].is_attach);
    EXPECT_THAT(sent[2].client_id, "alice");
    EXPECT_THAT(persisted_.intents.at("1-1"), "alice");

    ack(sent[2]);
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Attached);
}

TEST_F(TestOrchestrator, reconnect_reattaches_exactly_held_ports)
{
    makeOrchestrator();
    plug("1-1");
    plug("1-2");
    plug("1-3");
    connect("alice");
    connect("bob");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    EXPECT_THAT(orchestrator_->assign("1-2", "alice").status, Status::Accepted);
    EXPECT_THAT(orchestrator_->assign("1-3", "bob").status, Status::Accepted);
    ackLast("1-1");
    ackLast("1-2");
    ackLast("1-3");

    disconnect("alice");
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Detached);
    EXPECT_THAT(portOf("1-2").remote_state, RemoteState::Detached);
    EXPECT_THAT(portOf("1-3").remote_state, RemoteState::Attached);

    sent_.clear();
    connect("alice");

    ASSERT_THAT(sent_, SizeIs(2));
    std::set<PortId> attached_ports;
    for (const auto& sent : sent_)
    {
        EXPECT_TRUE(sent.is_attach);
        EXPECT_THAT(sent.client_id, "alice");
        attached_ports.insert(sent.port_id);
    }
    EXPECT_THAT(attached_ports, ElementsAre("1-1", "1-2"));
}

TEST_F(TestOrchestrator, intent_survives_restart)
{
    makeOrchestrator();
    plug("1-1");

    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    EXPECT_THAT(sent_, IsEmpty());

    // Crash and restart - only the persisted state survives.
    makeOrchestrator();
    plug("1-1");
    EXPECT_THAT(portOf("1-1").intended_client, Eq(cetl::optional<ClientId>{"alice"}));

    connect("alice");
    ASSERT_THAT(sent_, SizeIs(1));
    EXPECT_TRUE(sent_[0].is_attach);
    ack(sent_[0]);
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Attached);
}

TEST_F(TestOrchestrator, storage_failure_rejects_assignment)
{
    makeOrchestrator();
    plug("1-1");
    connect("alice");

    save_error_ = EIO;
    const auto result = orchestrator_->assign("1-1", "alice");
    EXPECT_THAT(result.status, Status::Rejected);
    EXPECT_THAT(result.error, ErrorKind::StorageError);
    EXPECT_FALSE(portOf("1-1").intended_client.has_value());
    EXPECT_THAT(sent_, IsEmpty());

    save_error_ = 0;
    EXPECT_THAT(orchestrator_->assign("1-1", "alice").status, Status::Accepted);
    EXPECT_THAT(sent_, SizeIs(1));
}

TEST_F(TestOrchestrator, assign_all_policies)
{
    makeOrchestrator();
    plug("1-1");
    plug("1-2");
    connect("alice");
    connect("bob");

    EXPECT_THAT(orchestrator_->assign("1-1", "bob").status, Status::Accepted);

    // Default (skip assigned) leaves ports of other clients alone.
    {
        const auto results = orchestrator_->assignAll("alice", cetl::nullopt);
        ASSERT_THAT(results, SizeIs(2));
        EXPECT_THAT(results[0].port_id, "1-1");
        EXPECT_THAT(results[0].status, Status::Skipped);
        EXPECT_THAT(results[1].port_id, "1-2");
        EXPECT_THAT(results[1].status, Status::Accepted);
        EXPECT_THAT(persisted_.intents.at("1-1"), "bob");
        EXPECT_THAT(persisted_.assign_all_client, Eq(cetl::optional<ClientId>{"alice"}));
    }

    // Override takes everything.
    {
        const auto results = orchestrator_->assignAll("alice", AssignAllPolicy::Override);
        ASSERT_THAT(results, SizeIs(2));
        EXPECT_THAT(results[0].status, Status::Accepted);
        EXPECT_THAT(persisted_.intents.at("1-1"), "alice");
    }

    const auto empty_client = orchestrator_->assignAll("", cetl::nullopt);
    ASSERT_THAT(empty_client, SizeIs(1));
    EXPECT_THAT(empty_client[0].status, Status::Rejected);
}

TEST_F(TestOrchestrator, assign_all_client_gets_new_devices)
{
    makeOrchestrator();
    connect("alice");

    const auto results = orchestrator_->assignAll("alice", cetl::nullopt);
    EXPECT_THAT(results, IsEmpty());

    plug("1-3");
    EXPECT_THAT(persisted_.intents.at("1-3"), "alice");
    ASSERT_THAT(sent_, SizeIs(1));
    EXPECT_TRUE(sent_[0].is_attach);
    EXPECT_THAT(sent_[0].port_id, "1-3");

    // Non-whitelisted devices are never taken.
    plug("2-1");
    EXPECT_THAT(persisted_.intents.count("2-1"), 0);
}

TEST_F(TestOrchestrator, failed_assign_all_assignment_is_retried)
{
    makeOrchestrator();
    connect("alice");
    EXPECT_THAT(orchestrator_->assignAll("alice", cetl::nullopt), IsEmpty());

    save_error_ = EIO;
    plug("1-3");
    EXPECT_THAT(persisted_.intents.count("1-3"), 0);
    EXPECT_THAT(sent_, IsEmpty());

    save_error_ = 0;
    scheduler_.spinFor(1s);
    EXPECT_THAT(persisted_.intents.at("1-3"), "alice");
    ASSERT_THAT(sent_, SizeIs(1));
    EXPECT_TRUE(sent_[0].is_attach);
    EXPECT_THAT(sent_[0].port_id, "1-3");
}

TEST_F(TestOrchestrator, unplug_and_replug_scenario)
{
    makeOrchestrator();
    connect("alice");
    plug("1-1");
    plug("1-2");

    const auto results = orchestrator_->assignAll("alice", cetl::nullopt);
    ASSERT_THAT(results, SizeIs(2));
    ackLast("1-1");
    ackLast("1-2");
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Attached);
    EXPECT_THAT(portOf("1-2").remote_state, RemoteState::Attached);

    unplug("1-1");
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Detached);
    EXPECT_THAT(portOf("1-2").remote_state, RemoteState::Attached);
    EXPECT_THAT(persisted_.intents.at("1-1"), "alice");

    const auto sent_before_replug = sent_.size();
    plug("1-1");
    ASSERT_THAT(sent_, SizeIs(sent_before_replug + 1));
    EXPECT_TRUE(sent_.back().is_attach);
    EXPECT_THAT(sent_.back().port_id, "1-1");
    EXPECT_THAT(sent_.back().client_id, "alice");

    ackLast("1-1");
    EXPECT_THAT(portOf("1-1").remote_state, RemoteState::Attached);
    EXPECT_THAT(portOf("1-2").remote_state, RemoteState::Attached);
    expectMutualExclusion();
}

TEST_F(TestOrchestrator, snapshot_reports_clients_and_absent_assigned_ports)
{
    makeOrchestrator();
    EXPECT_CALL(client_manager_mock_, clients())
        .WillRepeatedly(Return(std::vector<clients::ClientManager::ClientRecord>{{"alice", true, scheduler_.now()},
                                                                                  {"bob", false, cetl::nullopt}}));

    EXPECT_THAT(orchestrator_->assign("1-2", "bob").status, Status::Accepted);

    const auto snapshot = orchestrator_->snapshot();
    ASSERT_THAT(snapshot.ports, SizeIs(1));
    EXPECT_THAT(snapshot.ports[0].port_id, "1-2");
    EXPECT_FALSE(snapshot.ports[0].present);
    ASSERT_THAT(snapshot.clients, SizeIs(2));
    EXPECT_THAT(snapshot.clients[0].client_id, "alice");
    EXPECT_TRUE(snapshot.clients[0].connected);
    EXPECT_FALSE(snapshot.clients[1].last_seen.has_value());
    EXPECT_FALSE(snapshot.assign_all_client.has_value());
}

// NOLINTEND(cppcoreguidelines-avoid-magic-numbers, readability-magic-numbers)

}  // namespace
