/**
 * @file DeciderImpl.cpp
 *
 * This module contains the implementation of the Failover::Decider::Impl
 * structure.
 *
 * © 2020 by Richard Walters
 */

#include "DeciderImpl.hpp"
#include "Utilities.hpp"

#include <Failover/Errors.hpp>
#include <Failover/ICandidate.hpp>
#include <Failover/Roles.hpp>
#include <memory>
#include <mutex>
#include <system_error>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <thread>

namespace Failover {

    Decider::Impl::Impl()
        : diagnosticsSender("Failover::Decider")
    {
    }

    std::error_code Decider::Impl::ReCheck() {
        ++numReChecks;
        DBRole otherDBRole = DBRole::Initialized;
        auto error = other->GetDBRole(otherDBRole);
        if (error) {
            diagnosticsSender.SendDiagnosticInformationFormatted(
                2,
                "Unable to read peer database role (%s) -- bouncing through monitor",
                error.message().c_str()
            );
            ++numBounces;
            const auto bounced = monitor->Bounce(other);
            if (bounced == nullptr) {
                error = Error::ClusterUnavailable;
            } else {
                error = bounced->GetDBRole(otherDBRole);
            }
            if (error) {
                DBRole myDBRole = DBRole::Initialized;
                const auto myError = me->GetDBRole(myDBRole);
                if (
                    !myError
                    && (myDBRole == DBRole::Single)
                ) {
                    diagnosticsSender.SendDiagnosticInformationString(
                        2,
                        "Peer unreachable; remaining single"
                    );
                    return std::error_code();
                }
                diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Peer unreachable and local node is %s -- stopping",
                    (myError ? myError.message().c_str() : DBRoleToString(myDBRole).c_str())
                );
                return StopServing();
            }
        }
        peerDBRoleObserved = true;
        lastPeerDBRole = otherDBRole;
        diagnosticsSender.SendDiagnosticInformationFormatted(
            1,
            "Peer is %s",
            DBRoleToString(otherDBRole).c_str()
        );
        switch (otherDBRole) {
            case DBRole::Single:
            case DBRole::Active: {
                return BecomeBackup(false);
            } break;

            case DBRole::Dead: {
                DBRole myDBRole = DBRole::Initialized;
                error = me->GetDBRole(myDBRole);
                if (error) {
                    return error;
                }
                if (myDBRole == DBRole::Backup) {
                    bool hasSynced = false;
                    error = me->HasSynced(hasSynced);
                    if (error) {
                        return error;
                    }
                    if (!hasSynced) {
                        diagnosticsSender.SendDiagnosticInformationString(
                            SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                            "Peer is dead but this backup has not synced -- stopping"
                        );
                        return StopServing();
                    }
                }
                return BecomeSingle();
            } break;

            case DBRole::Initialized: {
                NodeRole myRole = NodeRole::Initialized;
                error = me->GetRole(myRole);
                if (error) {
                    return error;
                }
                switch (myRole) {
                    case NodeRole::Primary: {
                        return BecomeActive(false);
                    } break;

                    case NodeRole::Secondary: {
                        return BecomeBackup(false);
                    } break;

                    default: {
                        diagnosticsSender.SendDiagnosticInformationFormatted(
                            1,
                            "Both nodes uninitialized and local node is %s -- no transition",
                            NodeRoleToString(myRole).c_str()
                        );
                    } break;
                }
            } break;

            case DBRole::Backup: {
                return BecomeActive(false);
            } break;

            default: {
            } break;
        }
        return std::error_code();
    }

    std::error_code Decider::Impl::BecomeActive(bool manual) {
        const auto error = me->SetDBRole(DBRole::Active);
        if (error) {
            return error;
        }
        diagnosticsSender.SendDiagnosticInformationString(
            1,
            "Becoming active"
        );
        performer->TransitionToActive(me);
        ++numTransitions;
        auto transitionEvent = std::make_shared< TransitionEvent >();
        transitionEvent->dbRole = DBRole::Active;
        transitionEvent->manual = manual;
        AddToEventQueue(std::move(transitionEvent));
        return std::error_code();
    }

    std::error_code Decider::Impl::BecomeBackup(bool manual) {
        const auto error = me->SetDBRole(DBRole::Backup);
        if (error) {
            return error;
        }
        diagnosticsSender.SendDiagnosticInformationString(
            1,
            "Becoming backup"
        );
        performer->TransitionToBackupOf(me, other);
        ++numTransitions;
        auto transitionEvent = std::make_shared< TransitionEvent >();
        transitionEvent->dbRole = DBRole::Backup;
        transitionEvent->manual = manual;
        AddToEventQueue(std::move(transitionEvent));
        return std::error_code();
    }

    std::error_code Decider::Impl::BecomeSingle() {
        const auto error = me->SetDBRole(DBRole::Single);
        if (error) {
            return error;
        }
        diagnosticsSender.SendDiagnosticInformationString(
            1,
            "Becoming single"
        );
        performer->TransitionToSingle(me);
        ++numTransitions;
        auto transitionEvent = std::make_shared< TransitionEvent >();
        transitionEvent->dbRole = DBRole::Single;
        AddToEventQueue(std::move(transitionEvent));
        return std::error_code();
    }

    std::error_code Decider::Impl::StopServing() {
        performer->Stop();
        ++numStops;
        ++numClusterUnavailable;
        AddToEventQueue(std::make_shared< StopEvent >());
        return Error::ClusterUnavailable;
    }

    void Decider::Impl::ScheduleLoopTick() {
        CancelLoop();
        const auto thisLoopGeneration = loopGeneration;
        const auto due = scheduler->GetClock()->GetCurrentTime() + loopInterval;
        std::weak_ptr< Impl > weakImpl(shared_from_this());
        loopToken = scheduler->Schedule(
            [weakImpl, thisLoopGeneration]{
                auto impl = weakImpl.lock();
                if (impl == nullptr) {
                    return;
                }
                std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                if (
                    (impl->state != State::Mobilized)
                    || (impl->loopGeneration != thisLoopGeneration)
                ) {
                    return;
                }
                impl->loopToken = 0;
                const auto error = impl->ReCheck();
                if (error) {
                    impl->diagnosticsSender.SendDiagnosticInformationFormatted(
                        SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                        "Periodic re-check failed: %s",
                        error.message().c_str()
                    );
                }
                impl->ScheduleLoopTick();
            },
            due
        );
    }

    void Decider::Impl::CancelLoop() {
        ++loopGeneration;
        if (loopToken != 0) {
            scheduler->Cancel(loopToken);
            loopToken = 0;
        }
    }

    void Decider::Impl::Demobilize(std::unique_lock< decltype(mutex) >& lock) {
        if (state == State::Demobilized) {
            return;
        }
        diagnosticsSender.SendDiagnosticInformationString(
            0,
            "Demobilizing"
        );
        state = State::Demobilized;
        ++generation;
        bootstrapWakeCondition.notify_all();
        if (scheduler != nullptr) {
            CancelLoop();
        }
        me = nullptr;
        other = nullptr;
        monitor = nullptr;
        performer = nullptr;
        scheduler = nullptr;
        StopEventQueueWorker(lock);
    }

    void Decider::Impl::ResetStatistics() {
        numReChecks = 0;
        numBounces = 0;
        numClusterUnavailable = 0;
        numTransitions = 0;
        numStops = 0;
        peerDBRoleObserved = false;
        lastPeerDBRole = DBRole::Initialized;
    }

    void Decider::Impl::AddToEventQueue(
        std::shared_ptr< IDecider::Event >&& event
    ) {
        std::lock_guard< decltype(eventQueueMutex) > lock(eventQueueMutex);
        eventQueue.Add(std::move(event));
        eventQueueWorkerWakeCondition.notify_one();
    }

    void Decider::Impl::StartEventQueueWorker() {
        if (eventQueueWorker.joinable()) {
            return;
        }
        stopEventQueueWorker = false;
        eventQueueWorker = std::thread(&Impl::EventQueueWorker, shared_from_this());
    }

    void Decider::Impl::StopEventQueueWorker(std::unique_lock< decltype(mutex) >& lock) {
        if (!eventQueueWorker.joinable()) {
            return;
        }
        auto worker = std::move(eventQueueWorker);
        std::unique_lock< decltype(eventQueueMutex) > eventQueueLock(eventQueueMutex);
        stopEventQueueWorker = true;
        eventQueueWorkerWakeCondition.notify_one();
        eventQueueLock.unlock();
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
            return;
        }
        lock.unlock();
        worker.join();
        lock.lock();
    }

    void Decider::Impl::ProcessEventQueue(
        std::unique_lock< decltype(eventQueueMutex) >& lock
    ) {
        auto eventSubscribersSample = eventSubscribers;
        lock.unlock();
        while (!eventQueue.IsEmpty()) {
            const auto event = eventQueue.Remove();
            for (auto eventSubscriber: eventSubscribersSample) {
                eventSubscriber.second(*event);
            }
        }
        lock.lock();
    }

    void Decider::Impl::EventQueueWorker() {
        std::unique_lock< decltype(eventQueueMutex) > lock(eventQueueMutex);
        diagnosticsSender.SendDiagnosticInformationString(
            0,
            "Event queue worker thread started"
        );
        while (!stopEventQueueWorker) {
            eventQueueWorkerWakeCondition.wait(
                lock,
                [this]{
                    return (
                        stopEventQueueWorker
                        || !eventQueue.IsEmpty()
                    );
                }
            );
            ProcessEventQueue(lock);
        }
        diagnosticsSender.SendDiagnosticInformationString(
            0,
            "Event queue worker thread stopping"
        );
    }

}
