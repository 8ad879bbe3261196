/**
 * @file Common.cpp
 *
 * This module provides the implementation of the base fixture used to test the
 * Failover::Decider class.
 *
 * © 2020 by Richard Walters
 */

#include "Common.hpp"

#include <algorithm>
#include <chrono>
#include <Failover/Decider.hpp>
#include <Failover/Roles.hpp>
#include <functional>
#include <gtest/gtest.h>
#include <mutex>
#include <stddef.h>
#include <StringExtensions/StringExtensions.hpp>
#include <system_error>
#include <vector>

namespace DeciderTests {

    double MockTimeKeeper::GetCurrentTime() {
        return currentTime;
    }

    bool MockCandidate::AwaitGetDBRoleCalls(size_t numCalls) {
        std::unique_lock< decltype(mutex) > lock(mutex);
        return getDBRoleCalled.wait_for(
            lock,
            std::chrono::milliseconds(100),
            [this, numCalls]{ return numGetDBRoleCalls >= numCalls; }
        );
    }

    std::error_code MockCandidate::GetRole(Failover::NodeRole& nodeRole) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        ++numGetRoleCalls;
        if (getRoleError) {
            return getRoleError;
        }
        nodeRole = this->nodeRole;
        return std::error_code();
    }

    std::shared_ptr< Failover::ICandidate > MockCandidate::Bounce(
        std::shared_ptr< Failover::ICandidate > candidate
    ) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        ++numBounceCalls;
        return bounceResult;
    }

    void MockCandidate::Ready() {
        std::unique_lock< decltype(mutex) > lock(mutex);
        ++numReadyCalls;
        const auto hook = onReady;
        lock.unlock();
        if (hook != nullptr) {
            hook();
        }
    }

    std::error_code MockCandidate::GetDBRole(Failover::DBRole& dbRole) {
        std::unique_lock< decltype(mutex) > lock(mutex);
        ++numGetDBRoleCalls;
        getDBRoleCalled.notify_all();
        const auto hook = onGetDBRole;
        lock.unlock();
        if (hook != nullptr) {
            hook();
        }
        lock.lock();
        if (getDBRoleError) {
            return getDBRoleError;
        }
        dbRole = this->dbRole;
        return std::error_code();
    }

    std::error_code MockCandidate::SetDBRole(Failover::DBRole dbRole) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        if (setDBRoleError) {
            return setDBRoleError;
        }
        this->dbRole = dbRole;
        dbRolesSet.push_back(dbRole);
        return std::error_code();
    }

    std::error_code MockCandidate::HasSynced(bool& hasSynced) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        ++numHasSyncedCalls;
        if (hasSyncedError) {
            return hasSyncedError;
        }
        hasSynced = this->hasSynced;
        return std::error_code();
    }

    std::error_code MockMonitor::GetRole(Failover::NodeRole& nodeRole) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        nodeRole = this->nodeRole;
        return std::error_code();
    }

    std::shared_ptr< Failover::ICandidate > MockMonitor::Bounce(
        std::shared_ptr< Failover::ICandidate > candidate
    ) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        ++numBounceCalls;
        bounced = candidate;
        return bounceResult;
    }

    void MockMonitor::Ready() {
        std::unique_lock< decltype(mutex) > lock(mutex);
        ++numReadyCalls;
        const auto hook = onReady;
        lock.unlock();
        if (hook != nullptr) {
            hook();
        }
    }

    bool MockPerformer::AwaitCalls(size_t numCalls) {
        std::unique_lock< decltype(mutex) > lock(mutex);
        return called.wait_for(
            lock,
            std::chrono::milliseconds(100),
            [this, numCalls]{ return calls.size() >= numCalls; }
        );
    }

    size_t MockPerformer::CountCalls(PerformerCall::Type type) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        return (size_t)std::count_if(
            calls.begin(),
            calls.end(),
            [type](const PerformerCall& call){ return call.type == type; }
        );
    }

    void MockPerformer::RecordCall(
        PerformerCall::Type type,
        std::shared_ptr< Failover::ICandidate > me,
        std::shared_ptr< Failover::ICandidate > other
    ) {
        std::unique_lock< decltype(mutex) > lock(mutex);
        PerformerCall call;
        call.type = type;
        call.me = me;
        call.other = other;
        calls.push_back(std::move(call));
        called.notify_all();
        const auto hook = onCall;
        lock.unlock();
        if (hook != nullptr) {
            hook();
        }
    }

    void MockPerformer::TransitionToActive(std::shared_ptr< Failover::ICandidate > me) {
        RecordCall(PerformerCall::Type::TransitionToActive, me, nullptr);
    }

    void MockPerformer::TransitionToBackupOf(
        std::shared_ptr< Failover::ICandidate > me,
        std::shared_ptr< Failover::ICandidate > other
    ) {
        RecordCall(PerformerCall::Type::TransitionToBackupOf, me, other);
    }

    void MockPerformer::TransitionToSingle(std::shared_ptr< Failover::ICandidate > me) {
        RecordCall(PerformerCall::Type::TransitionToSingle, me, nullptr);
    }

    void MockPerformer::Stop() {
        RecordCall(PerformerCall::Type::Stop, nullptr, nullptr);
    }

    void Common::MakePeerUnreachable() {
        other->getDBRoleError = std::make_error_code(std::errc::connection_refused);
        relayedOther->getDBRoleError = std::make_error_code(std::errc::host_unreachable);
    }

    std::error_code Common::MobilizeDecider() {
        other->dbRole = Failover::DBRole::Backup;
        const auto error = decider.Mobilize(
            me,
            other,
            monitor,
            performer,
            scheduler,
            configuration
        );
        if (!error) {
            (void)AwaitEventsPublished(1);
        }
        return error;
    }

    void Common::ClearRecords() {
        for (const auto& candidate: {me, other, relayedOther}) {
            std::lock_guard< decltype(candidate->mutex) > lock(candidate->mutex);
            candidate->dbRolesSet.clear();
            candidate->numReadyCalls = 0;
            candidate->numGetRoleCalls = 0;
            candidate->numGetDBRoleCalls = 0;
            candidate->numHasSyncedCalls = 0;
            candidate->numBounceCalls = 0;
        }
        {
            std::lock_guard< decltype(monitor->mutex) > lock(monitor->mutex);
            monitor->numReadyCalls = 0;
            monitor->numBounceCalls = 0;
            monitor->bounced = nullptr;
        }
        {
            std::lock_guard< decltype(performer->mutex) > lock(performer->mutex);
            performer->calls.clear();
        }
        {
            std::lock_guard< decltype(mutex) > lock(mutex);
            transitionsPublished.clear();
            manualTransitionsPublished.clear();
            stopsPublished = 0;
        }
        decider.ResetStatistics();
    }

    bool Common::AwaitEventsPublished(size_t numEvents) {
        std::unique_lock< decltype(mutex) > lock(mutex);
        if (transitionsPublished.size() + stopsPublished >= numEvents) {
            return true;
        }
        eventsAwaitedPublished = std::promise< void >();
        numEventsAwaiting = numEvents;
        auto eventsPublished = eventsAwaitedPublished.get_future();
        lock.unlock();
        const auto result = Await(eventsPublished);
        lock.lock();
        numEventsAwaiting = 0;
        return result;
    }

    bool Common::DiagnosticPublished(const std::string& text) {
        std::lock_guard< decltype(mutex) > lock(mutex);
        return std::any_of(
            diagnosticMessages.begin(),
            diagnosticMessages.end(),
            [&text](const std::string& message){
                return (message.find(text) != std::string::npos);
            }
        );
    }

    void Common::SetUp() {
        scheduler->SetClock(mockTimeKeeper);
        monitor->bounceResult = relayedOther;
        relayedOther->getDBRoleError = std::make_error_code(std::errc::host_unreachable);
        diagnosticsUnsubscribeDelegate = decider.SubscribeToDiagnostics(
            [this](
                std::string senderName,
                size_t level,
                std::string message
            ){
                std::lock_guard< decltype(mutex) > lock(mutex);
                diagnosticMessages.push_back(
                    StringExtensions::sprintf(
                        "%s[%zu]: %s",
                        senderName.c_str(),
                        level,
                        message.c_str()
                    )
                );
            },
            0
        );
        eventsUnsubscribeDelegate = decider.SubscribeToEvents(
            [this](
                const Failover::IDecider::Event& baseEvent
            ){
                std::lock_guard< decltype(mutex) > lock(mutex);
                switch (baseEvent.type) {
                    case Failover::IDecider::Event::Type::Transition: {
                        const auto& event = static_cast< const Failover::IDecider::TransitionEvent& >(baseEvent);
                        transitionsPublished.push_back(event.dbRole);
                        manualTransitionsPublished.push_back(event.manual);
                    } break;

                    case Failover::IDecider::Event::Type::Stop: {
                        ++stopsPublished;
                    } break;

                    default: {
                    } break;
                }
                if (
                    (numEventsAwaiting > 0)
                    && (transitionsPublished.size() + stopsPublished >= numEventsAwaiting)
                ) {
                    numEventsAwaiting = 0;
                    eventsAwaitedPublished.set_value();
                }
            }
        );
    }

    void Common::TearDown() {
        decider.Demobilize();
        eventsUnsubscribeDelegate();
        diagnosticsUnsubscribeDelegate();
    }

}
