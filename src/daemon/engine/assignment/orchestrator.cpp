//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "orchestrator.hpp"

#include "assignment_store.hpp"
#include "assignment_types.hpp"
#include "clients/client_manager.hpp"
#include "common_helpers.hpp"
#include "devices/device_registry.hpp"
#include "engine_types.hpp"
#include "logging.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>
#include <cetl/visit_helpers.hpp>
#include <libcyphal/executor.hpp>
#include <libcyphal/types.hpp>

#include <algorithm>
#include <cstring>
#include <deque>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace usbad
{
namespace daemon
{
namespace engine
{
namespace assignment
{
namespace
{

class OrchestratorImpl final : public Orchestrator
{
    using ClientManager = clients::ClientManager;
    using Command       = ClientManager::Command;
    using Event         = ClientManager::Event;

public:
    OrchestratorImpl(libcyphal::IExecutor&    executor,
                     devices::DeviceRegistry& registry,
                     ClientManager&           client_manager,
                     AssignmentStore&         store,
                     const Params&            params)
        : executor_{executor}
        , registry_{registry}
        , client_manager_{client_manager}
        , store_{store}
        , params_{params}
    {
    }

    OrchestratorImpl(const OrchestratorImpl&)                = delete;
    OrchestratorImpl(OrchestratorImpl&&) noexcept            = delete;
    OrchestratorImpl& operator=(const OrchestratorImpl&)     = delete;
    OrchestratorImpl& operator=(OrchestratorImpl&&) noexcept = delete;

    ~OrchestratorImpl() override
    {
        registry_.setChangedHandler(nullptr);
    }

    // MARK: Orchestrator

    void start() override
    {
        state_ = store_.load();
        for (const auto& port_and_client : state_.intents)
        {
            if (!registry_.isWhitelisted(port_and_client.first))
            {
                logger_->warn("Intent for non-whitelisted port is retained but ignored (port='{}', client='{}').",
                              port_and_client.first,
                              port_and_client.second);
            }
        }

        registry_.setChangedHandler([this](const PortId& port_id) {
            //
            onDeviceChanged(port_id);
        });

        tick_callback_ = executor_.registerCallback([this](const auto& arg) {
            //
            onTick(arg.approx_now);
        });
        const bool is_scheduled = tick_callback_.schedule(
            libcyphal::IExecutor::Callback::Schedule::Repeat{executor_.now() + params_.tick_period,
                                                             params_.tick_period});
        (void) is_scheduled;

        // Devices which were discovered before the start are admitted now.
        const Activity activity{*this};
        for (const auto& device : registry_.listPresent())
        {
            pending_changes_.push_back(device.port_id);
        }

        logger_->info("Orchestrator is started (intents={}, assign_all='{}', ack_timeout={}ms, tick={}ms).",
                      state_.intents.size(),
                      state_.assign_all_client.value_or(""),
                      common::toMilliseconds(params_.ack_timeout),
                      common::toMilliseconds(params_.tick_period));
    }

    void onClientEvent(const Event::Var& event) override
    {
        const Activity activity{*this};

        cetl::visit(cetl::make_overloaded(
                        [this](const Event::Connected& connected) {
                            //
                            handleClientConnected(connected.client_id);
                        },
                        [this](const Event::Disconnected& disconnected) {
                            //
                            handleClientDisconnected(disconnected.client_id);
                        },
                        [this](const Event::Ack& ack) {
                            //
                            handleAck(ack);
                        }),
                    event);
    }

    CETL_NODISCARD OpResult assign(const PortId& port_id, const ClientId& client_id) override
    {
        const Activity activity{*this};

        if (client_id.empty())
        {
            return rejected(port_id, ErrorKind::ConfigurationError, "client id is empty");
        }
        if (!registry_.isWhitelisted(port_id))
        {
            return rejected(port_id, ErrorKind::ConfigurationError, "port is not whitelisted");
        }

        return assignImpl(port_id, client_id);
    }

    CETL_NODISCARD std::vector<OpResult> assignAll(const ClientId&                        client_id,
                                                   const cetl::optional<AssignAllPolicy>& policy) override
    {
        const Activity activity{*this};

        std::vector<OpResult> results;
        if (client_id.empty())
        {
            results.push_back(rejected({}, ErrorKind::ConfigurationError, "client id is empty"));
            return results;
        }

        const auto effective_policy = policy.value_or(params_.assign_all_policy);
        logger_->info("Assigning all devices (client='{}', policy={}).",
                      client_id,
                      effective_policy == AssignAllPolicy::Override ? "override" : "skip_assigned");

        // 1. Remember the client as the "sticky" one - for devices admitted later.
        //
        if (state_.assign_all_client != cetl::optional<ClientId>{client_id})
        {
            auto      prev_client = std::exchange(state_.assign_all_client, client_id);
            const int save_err    = store_.save(state_);
            if (save_err != 0)
            {
                state_.assign_all_client = std::move(prev_client);
                results.push_back(rejected({}, ErrorKind::StorageError, std::strerror(save_err)));
                return results;
            }
        }

        // 2. Apply the assignment to every present device.
        //
        for (const auto& device : registry_.listPresent())
        {
            const auto intent = findIntent(device.port_id);
            if ((effective_policy == AssignAllPolicy::SkipAssigned) && intent && (*intent != client_id))
            {
                logger_->debug("Skipping port assigned to another client (port='{}', client='{}').",
                               device.port_id,
                               *intent);
                results.push_back(
                    OpResult{device.port_id, OpResult::Status::Skipped, ErrorKind::None, "assigned to " + *intent});
                continue;
            }
            results.push_back(assignImpl(device.port_id, client_id));
        }
        return results;
    }

    CETL_NODISCARD OpResult forceFree(const PortId& port_id) override
    {
        const Activity activity{*this};

        if (!registry_.isWhitelisted(port_id))
        {
            return rejected(port_id, ErrorKind::ConfigurationError, "port is not whitelisted");
        }

        auto&      port_state = ports_[port_id];
        const auto intent     = findIntent(port_id);
        if (!intent && !port_state.holder)
        {
            logger_->debug("Port is already free (port='{}').", port_id);
            return OpResult{port_id, OpResult::Status::Completed, ErrorKind::None, "already free"};
        }

        if (intent)
        {
            state_.intents.erase(port_id);
            const int save_err = store_.save(state_);
            if (save_err != 0)
            {
                state_.intents[port_id] = *intent;
                return rejected(port_id, ErrorKind::StorageError, std::strerror(save_err));
            }
        }

        logger_->info("Force freeing port (port='{}', intent='{}', holder='{}').",
                      port_id,
                      intent.value_or(""),
                      port_state.holder.value_or(""));

        if (port_state.holder)
        {
            // Best effort - the local rebind below terminates the remote session anyway.
            const int err = client_manager_.send(*port_state.holder,
                                                 Command::Detach{port_id, ++port_state.transition_id});
            if (err != 0)
            {
                logger_->debug("Best-effort detach is not delivered (port='{}', client='{}', err={}).",
                               port_id,
                               *port_state.holder,
                               err);
            }
        }
        releasePort(port_id, port_state);
        resetBackoff(port_state);
        if (const int err = rebindPort(port_id))
        {
            // The intent is cleared already; the bind is retried by reconciliation.
            applyBackoff(port_id, port_state);
            return OpResult{port_id, OpResult::Status::Accepted, ErrorKind::TransportError, std::strerror(err)};
        }

        return OpResult{port_id, OpResult::Status::Completed, ErrorKind::None, {}};
    }

    CETL_NODISCARD OpResult forceReattach(const PortId& port_id) override
    {
        const Activity activity{*this};

        if (!registry_.isWhitelisted(port_id))
        {
            return rejected(port_id, ErrorKind::ConfigurationError, "port is not whitelisted");
        }

        auto captured_client = findIntent(port_id);
        if (!captured_client)
        {
            captured_client = ports_[port_id].holder;
        }

        auto result = forceFree(port_id);
        if ((result.status == OpResult::Status::Rejected) || !captured_client)
        {
            return result;
        }

        logger_->info("Reattaching port (port='{}', client='{}').", port_id, *captured_client);
        return assignImpl(port_id, *captured_client);
    }

    CETL_NODISCARD Snapshot snapshot() const override
    {
        Snapshot snapshot;

        std::set<PortId> seen_ports;
        for (const auto& device : registry_.list())
        {
            seen_ports.insert(device.port_id);

            PortSnapshot port{};
            port.port_id    = device.port_id;
            port.present    = device.present;
            port.bind_state = device.bind_state;
            port.descriptor = device.descriptor;
            fillAssignment(port);
            snapshot.ports.push_back(std::move(port));
        }
        for (const auto& port_and_client : state_.intents)
        {
            if ((seen_ports.count(port_and_client.first) == 0) && registry_.isWhitelisted(port_and_client.first))
            {
                PortSnapshot port{};
                port.port_id = port_and_client.first;
                fillAssignment(port);
                snapshot.ports.push_back(std::move(port));
            }
        }

        for (const auto& record : client_manager_.clients())
        {
            snapshot.clients.push_back(ClientSnapshot{record.client_id, record.connected, record.last_seen});
        }
        snapshot.assign_all_client = state_.assign_all_client;
        return snapshot;
    }

private:
    struct PortState final
    {
        RemoteState              remote_state{RemoteState::Detached};
        cetl::optional<ClientId> holder;
        TransitionId             transition_id{0};
        libcyphal::TimePoint     ack_deadline{};
        libcyphal::TimePoint     next_attempt{libcyphal::TimePoint::min()};
        libcyphal::Duration      backoff{0};
        bool                     known_present{false};

    };  // PortState

    /// Marks a (possibly nested) processing of an input.
    ///
    /// Registry changes caused by the processing itself (f.e. by a bind) are queued,
    /// and handled only when the outermost activity completes.
    ///
    class Activity final
    {
    public:
        explicit Activity(OrchestratorImpl& self)
            : self_{self}
        {
            ++self_.activity_depth_;
        }

        ~Activity()
        {
            if (self_.activity_depth_ == 1)
            {
                common::performWithoutThrowing([this] {
                    //
                    self_.drainDeviceChanges();
                });
            }
            --self_.activity_depth_;
        }

        Activity(const Activity&)                = delete;
        Activity(Activity&&) noexcept            = delete;
        Activity& operator=(const Activity&)     = delete;
        Activity& operator=(Activity&&) noexcept = delete;

    private:
        OrchestratorImpl& self_;

    };  // Activity

    static OpResult rejected(const PortId& port_id, const ErrorKind error, std::string message)
    {
        return OpResult{port_id, OpResult::Status::Rejected, error, std::move(message)};
    }

    cetl::optional<ClientId> findIntent(const PortId& port_id) const
    {
        const auto it = state_.intents.find(port_id);
        if (it == state_.intents.end())
        {
            return cetl::nullopt;
        }
        return it->second;
    }

    void fillAssignment(PortSnapshot& port) const
    {
        port.intended_client = findIntent(port.port_id);

        const auto it = ports_.find(port.port_id);
        if (it != ports_.end())
        {
            port.holder_client = it->second.holder;
            port.remote_state  = it->second.remote_state;
            port.transition_id = it->second.transition_id;
        }
    }

    OpResult assignImpl(const PortId& port_id, const ClientId& client_id)
    {
        const auto prev_intent = findIntent(port_id);
        if (prev_intent != cetl::optional<ClientId>{client_id})
        {
            // Persist the intent before anything else becomes visible.
            state_.intents[port_id] = client_id;
            const int save_err      = store_.save(state_);
            if (save_err != 0)
            {
                if (prev_intent)
                {
                    state_.intents[port_id] = *prev_intent;
                }
                else
                {
                    state_.intents.erase(port_id);
                }
                logger_->error("Storage error: intent is not recorded (port='{}', client='{}', err={}).",
                               port_id,
                               client_id,
                               save_err);
                return rejected(port_id, ErrorKind::StorageError, std::strerror(save_err));
            }
            logger_->info("Port is assigned (port='{}', client='{}', prev='{}').",
                          port_id,
                          client_id,
                          prev_intent.value_or(""));
        }

        auto& port_state = ports_[port_id];
        resetBackoff(port_state);
        reconcile(port_id);

        if ((port_state.remote_state == RemoteState::Attached) &&
            (port_state.holder == cetl::optional<ClientId>{client_id}))
        {
            return OpResult{port_id, OpResult::Status::Completed, ErrorKind::None, {}};
        }
        if (!client_manager_.isConnected(client_id))
        {
            return OpResult{port_id,
                            OpResult::Status::Accepted,
                            ErrorKind::ClientUnreachable,
                            "client is not connected"};
        }
        return OpResult{port_id, OpResult::Status::Accepted, ErrorKind::None, {}};
    }

    // MARK: Reconciliation

    /// Makes one step (if possible) towards the intended state of the port.
    ///
    void reconcile(const PortId& port_id)
    {
        if (!registry_.isWhitelisted(port_id))
        {
            return;
        }

        auto& port_state = ports_[port_id];
        if (!verifyHolder(port_id, port_state))
        {
            return;
        }

        const auto intent = findIntent(port_id);
        switch (port_state.remote_state)
        {
        case RemoteState::Attaching:
        case RemoteState::Detaching:
            // Waiting for the acknowledgement (or its timeout).
            return;

        case RemoteState::Attached:
            if (intent != port_state.holder)
            {
                startDetach(port_id, port_state);
            }
            return;

        case RemoteState::Detached:
            break;
        }

        if (executor_.now() < port_state.next_attempt)
        {
            return;
        }
        const auto device = registry_.get(port_id);
        if (!device || !device->present)
        {
            return;
        }

        // Present devices are kept bound locally, whether assigned or not.
        if (device->bind_state == devices::BindState::Unbound)
        {
            const int bind_err = registry_.ensureBound(port_id);
            if (bind_err != 0)
            {
                logger_->warn("Transport error: device is not bound (port='{}', err={}).", port_id, bind_err);
                applyBackoff(port_id, port_state);
                return;
            }
        }

        if (!intent)
        {
            return;
        }
        if (!client_manager_.isConnected(*intent))
        {
            logger_->trace("Waiting for client to connect (port='{}', client='{}').", port_id, *intent);
            return;
        }

        startAttach(port_id, port_state, *intent);
    }

    void reconcileAll()
    {
        std::set<PortId> port_ids;
        for (const auto& port_and_client : state_.intents)
        {
            port_ids.insert(port_and_client.first);
        }
        for (const auto& port_and_state : ports_)
        {
            port_ids.insert(port_and_state.first);
        }

        for (const auto& port_id : port_ids)
        {
            reconcile(port_id);
        }
    }

    void startAttach(const PortId& port_id, PortState& port_state, const ClientId& client_id)
    {
        port_state.holder        = client_id;
        port_state.ack_deadline  = executor_.now() + params_.ack_timeout;
        const auto transition_id = ++port_state.transition_id;
        setRemoteState(port_id, port_state, RemoteState::Attaching);

        const int err = client_manager_.send(client_id, Command::Attach{port_id, transition_id});
        if (err != 0)
        {
            logger_->warn("Client unreachable: attach is not sent (port='{}', client='{}', err={}).",
                          port_id,
                          client_id,
                          err);
            releasePort(port_id, port_state);
            applyBackoff(port_id, port_state);
        }
    }

    void startDetach(const PortId& port_id, PortState& port_state)
    {
        CETL_DEBUG_ASSERT(port_state.holder, "");
        const auto holder = *port_state.holder;

        port_state.ack_deadline  = executor_.now() + params_.ack_timeout;
        const auto transition_id = ++port_state.transition_id;
        setRemoteState(port_id, port_state, RemoteState::Detaching);

        const int err = client_manager_.send(holder, Command::Detach{port_id, transition_id});
        if (err != 0)
        {
            if (!client_manager_.isConnected(holder))
            {
                // Holder is gone - so is its session, once the device is rebound.
                logger_->info("Holder is disconnected - releasing port (port='{}', client='{}').", port_id, holder);
                releasePort(port_id, port_state);
                rebindPort(port_id);
                return;
            }

            logger_->warn("Client unreachable: detach is not sent (port='{}', client='{}', err={}).",
                          port_id,
                          holder,
                          err);
            applyBackoff(port_id, port_state);
            port_state.ack_deadline = port_state.next_attempt;
        }
    }

    /// Forces the port into `Detached` state, and makes any outstanding acknowledgement stale.
    ///
    void releasePort(const PortId& port_id, PortState& port_state)
    {
        ++port_state.transition_id;
        setRemoteState(port_id, port_state, RemoteState::Detached);
        port_state.holder = cetl::nullopt;
    }

    /// @return errno of the bind; zero also when the device is absent (nothing to rebind).
    ///
    int rebindPort(const PortId& port_id)
    {
        const auto device = registry_.get(port_id);
        if (!device || !device->present)
        {
            return 0;
        }

        const int err = registry_.rebind(port_id);
        if (err != 0)
        {
            logger_->warn("Transport error: failed to rebind (port='{}', err={}).", port_id, err);
        }
        return err;
    }

    /// A holder exists if and only if the port is not detached.
    ///
    bool verifyHolder(const PortId& port_id, PortState& port_state)
    {
        const bool is_detached = port_state.remote_state == RemoteState::Detached;
        if (is_detached == !port_state.holder)
        {
            return true;
        }

        logger_->critical("Invariant violation: port state is inconsistent - resetting (port='{}', state={}, holder='{}').",
                          port_id,
                          toString(port_state.remote_state),
                          port_state.holder.value_or(""));
        releasePort(port_id, port_state);
        rebindPort(port_id);
        return false;
    }

    void setRemoteState(const PortId& port_id, PortState& port_state, const RemoteState new_state)
    {
        if (port_state.remote_state != new_state)
        {
            logger_->info("Port '{}' {} -> {} (client='{}', tid={}).",
                          port_id,
                          toString(port_state.remote_state),
                          toString(new_state),
                          port_state.holder.value_or(""),
                          port_state.transition_id);
            port_state.remote_state = new_state;
        }
    }

    void applyBackoff(const PortId& port_id, PortState& port_state)
    {
        port_state.backoff = (port_state.backoff == libcyphal::Duration::zero())
                                 ? params_.retry_initial_delay
                                 : std::min(port_state.backoff * 2, params_.retry_max_delay);
        port_state.next_attempt = executor_.now() + port_state.backoff;

        logger_->debug("Port retry is delayed (port='{}', delay={}ms).",
                       port_id,
                       common::toMilliseconds(port_state.backoff));
    }

    static void resetBackoff(PortState& port_state)
    {
        port_state.backoff      = libcyphal::Duration::zero();
        port_state.next_attempt = libcyphal::TimePoint::min();
    }

    // MARK: Inputs

    void handleClientConnected(const ClientId& client_id)
    {
        logger_->info("Client is connected (client='{}').", client_id);

        for (const auto& port_and_client : state_.intents)
        {
            if (port_and_client.second == client_id)
            {
                resetBackoff(ports_[port_and_client.first]);
                reconcile(port_and_client.first);
            }
        }
    }

    void handleClientDisconnected(const ClientId& client_id)
    {
        logger_->info("Client is disconnected (client='{}').", client_id);

        for (auto& port_and_state : ports_)
        {
            auto& port_state = port_and_state.second;
            if (port_state.holder == cetl::optional<ClientId>{client_id})
            {
                releasePort(port_and_state.first, port_state);
                rebindPort(port_and_state.first);
            }
        }

        // Ports which were waiting for this client to detach may go to their new clients now.
        reconcileAll();
    }

    void handleAck(const Event::Ack& ack)
    {
        const auto it = ports_.find(ack.port_id);
        if (it == ports_.end())
        {
            logger_->debug("Ignoring ack for unknown port (port='{}', client='{}').", ack.port_id, ack.client_id);
            return;
        }
        auto& port_state = it->second;
        if (!verifyHolder(ack.port_id, port_state))
        {
            return;
        }

        const bool is_awaiting = (port_state.remote_state == RemoteState::Attaching) ||
                                 (port_state.remote_state == RemoteState::Detaching);
        if (!is_awaiting || (port_state.holder != cetl::optional<ClientId>{ack.client_id}) ||
            (port_state.transition_id != ack.transition_id))
        {
            logger_->debug("Ignoring stale ack (port='{}', client='{}', tid={}, current_tid={}, state={}).",
                           ack.port_id,
                           ack.client_id,
                           ack.transition_id,
                           port_state.transition_id,
                           toString(port_state.remote_state));
            return;
        }

        if (port_state.remote_state == RemoteState::Attaching)
        {
            if (ack.success)
            {
                setRemoteState(ack.port_id, port_state, RemoteState::Attached);
                resetBackoff(port_state);
            }
            else
            {
                logger_->warn("Transport error: client has failed to attach (port='{}', client='{}', err={}).",
                              ack.port_id,
                              ack.client_id,
                              ack.error_code);
                releasePort(ack.port_id, port_state);
                rebindPort(ack.port_id);
                applyBackoff(ack.port_id, port_state);
            }
        }
        else
        {
            if (!ack.success)
            {
                logger_->warn("Transport error: client has failed to detach (port='{}', client='{}', err={}).",
                              ack.port_id,
                              ack.client_id,
                              ack.error_code);
                releasePort(ack.port_id, port_state);
                rebindPort(ack.port_id);
            }
            else
            {
                releasePort(ack.port_id, port_state);
            }
        }

        reconcile(ack.port_id);
    }

    void onDeviceChanged(const PortId& port_id)
    {
        pending_changes_.push_back(port_id);
        if (activity_depth_ == 0)
        {
            // Draining happens when the activity ends.
            const Activity activity{*this};
        }
    }

    void drainDeviceChanges()
    {
        while (!pending_changes_.empty())
        {
            const auto port_id = std::move(pending_changes_.front());
            pending_changes_.pop_front();
            handleDeviceChanged(port_id);
        }
    }

    void handleDeviceChanged(const PortId& port_id)
    {
        if (!registry_.isWhitelisted(port_id))
        {
            return;
        }

        auto&      port_state = ports_[port_id];
        const auto device     = registry_.get(port_id);
        if (!device || !device->present)
        {
            port_state.known_present = false;
            switch (port_state.remote_state)
            {
            case RemoteState::Attaching:
            case RemoteState::Attached: {
                if (port_state.holder)
                {
                    const int err = client_manager_.send(*port_state.holder,
                                                         Command::Detach{port_id, ++port_state.transition_id});
                    (void) err;  // Best effort - the device is gone anyway.
                }
                releasePort(port_id, port_state);
                break;
            }
            case RemoteState::Detaching:
                releasePort(port_id, port_state);
                break;
            case RemoteState::Detached:
                break;
            }
            return;
        }

        const bool is_admitted   = !port_state.known_present;
        port_state.known_present = true;
        if (is_admitted && state_.assign_all_client && !findIntent(port_id))
        {
            const auto client_id = *state_.assign_all_client;
            logger_->info("Assigning new device to the assign-all client (port='{}', client='{}').",
                          port_id,
                          client_id);
            const auto result = assignImpl(port_id, client_id);
            if (result.status == OpResult::Status::Rejected)
            {
                // Offered again on the next tick.
                port_state.known_present = false;
            }
            return;
        }

        reconcile(port_id);
    }

    void onTick(const libcyphal::TimePoint now)
    {
        const Activity activity{*this};

        for (auto& port_and_state : ports_)
        {
            const auto& port_id    = port_and_state.first;
            auto&       port_state = port_and_state.second;
            if (now < port_state.ack_deadline)
            {
                continue;
            }

            if (port_state.remote_state == RemoteState::Attaching)
            {
                logger_->warn("Attach is not acknowledged in time (port='{}', client='{}', tid={}).",
                              port_id,
                              port_state.holder.value_or(""),
                              port_state.transition_id);
                releasePort(port_id, port_state);
                rebindPort(port_id);
                applyBackoff(port_id, port_state);
            }
            else if ((port_state.remote_state == RemoteState::Detaching) && port_state.holder)
            {
                logger_->warn("Detach is not acknowledged in time - resending (port='{}', client='{}', tid={}).",
                              port_id,
                              *port_state.holder,
                              port_state.transition_id);
                startDetach(port_id, port_state);
            }
        }

        // Admissions which have not completed (f.e. a failed assign-all assignment) are repeated.
        for (const auto& device : registry_.listPresent())
        {
            const auto it = ports_.find(device.port_id);
            if ((it != ports_.end()) && !it->second.known_present)
            {
                pending_changes_.push_back(device.port_id);
            }
        }

        reconcileAll();
    }

    // MARK: Data members:

    common::LoggerPtr                   logger_{common::getLogger("orch")};
    libcyphal::IExecutor&               executor_;
    devices::DeviceRegistry&            registry_;
    ClientManager&                      client_manager_;
    AssignmentStore&                    store_;
    const Params                        params_;
    PersistentState                     state_;
    std::map<PortId, PortState>         ports_;
    std::deque<PortId>                  pending_changes_;
    int                                 activity_depth_{0};
    libcyphal::IExecutor::Callback::Any tick_callback_;

};  // OrchestratorImpl

}  // namespace

Orchestrator::Ptr Orchestrator::make(libcyphal::IExecutor&    executor,
                                     devices::DeviceRegistry& registry,
                                     clients::ClientManager&  client_manager,
                                     AssignmentStore&         store,
                                     const Params&            params)
{
    return std::make_unique<OrchestratorImpl>(executor, registry, client_manager, store, params);
}

}  // namespace assignment
}  // namespace engine
}  // namespace daemon
}  // namespace usbad
