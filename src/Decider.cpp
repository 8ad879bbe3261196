/**
 * @file Decider.cpp
 *
 * This module contains the implementation of the Failover::Decider class.
 *
 * © 2020 by Richard Walters
 */

#include "DeciderImpl.hpp"
#include "Utilities.hpp"

#include <Failover/Decider.hpp>
#include <Failover/Errors.hpp>
#include <Json/Value.hpp>
#include <memory>
#include <mutex>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Failover {

    Decider::~Decider() noexcept {
        if (impl_ == nullptr) {
            return;
        }
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->Demobilize(lock);
    }
    Decider::Decider(Decider&&) noexcept = default;
    Decider& Decider::operator=(Decider&& other) noexcept {
        if (this != &other) {
            if (impl_ != nullptr) {
                std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
                impl_->Demobilize(lock);
            }
            impl_ = std::move(other.impl_);
        }
        return *this;
    }

    Decider::Decider()
        : impl_(std::make_shared< Impl >())
    {
    }

    SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate Decider::SubscribeToDiagnostics(
        SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
        size_t minLevel
    ) {
        return impl_->diagnosticsSender.SubscribeToDiagnostics(delegate, minLevel);
    }

    bool Decider::IsMobilized() const {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return (impl_->state == Impl::State::Mobilized);
    }

    auto Decider::SubscribeToEvents(EventDelegate eventDelegate) -> EventsUnsubscribeDelegate {
        std::lock_guard< decltype(impl_->eventQueueMutex) > lock(impl_->eventQueueMutex);
        const auto eventSubscriberId = impl_->nextEventSubscriberId++;
        impl_->eventSubscribers[eventSubscriberId] = eventDelegate;
        const std::weak_ptr< Impl > implWeak = impl_;
        return [implWeak, eventSubscriberId]{
            const auto impl = implWeak.lock();
            if (impl == nullptr) {
                return;
            }
            std::lock_guard< decltype(impl->eventQueueMutex) > lock(impl->eventQueueMutex);
            impl->eventSubscribers.erase(eventSubscriberId);
        };
    }

    std::error_code Decider::Mobilize(
        std::shared_ptr< ICandidate > me,
        std::shared_ptr< ICandidate > other,
        std::shared_ptr< IMonitor > monitor,
        std::shared_ptr< IPerformer > performer,
        std::shared_ptr< Timekeeping::Scheduler > scheduler,
        const Configuration& configuration
    ) {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        switch (impl_->state) {
            case Impl::State::Mobilized: {
                return std::error_code();
            } break;

            case Impl::State::Bootstrapping: {
                impl_->diagnosticsSender.SendDiagnosticInformationString(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Mobilize requested while already bootstrapping"
                );
                return Error::AlreadyBootstrapping;
            } break;

            default: break;
        }
        ++impl_->generation;
        const auto thisGeneration = impl_->generation;
        impl_->state = Impl::State::Bootstrapping;
        impl_->me = me;
        impl_->other = other;
        impl_->monitor = monitor;
        impl_->performer = performer;
        impl_->scheduler = scheduler;
        impl_->configuration = configuration;
        impl_->StartEventQueueWorker();
        size_t attempts = 0;
        for (;;) {
            lock.unlock();
            other->Ready();
            monitor->Ready();
            lock.lock();
            if (
                (impl_->state != Impl::State::Bootstrapping)
                || (impl_->generation != thisGeneration)
            ) {
                impl_->diagnosticsSender.SendDiagnosticInformationString(
                    SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                    "Demobilized while bootstrapping"
                );
                return Error::BootstrapAborted;
            }
            ++attempts;
            const auto error = impl_->ReCheck();
            if (!error) {
                impl_->state = Impl::State::Mobilized;
                impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                    0,
                    "Mobilized after %zu attempt(s)",
                    attempts
                );
                return std::error_code();
            }
            if (error != Error::ClusterUnavailable) {
                impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                    "Unable to establish view of cluster: %s",
                    error.message().c_str()
                );
                impl_->Demobilize(lock);
                return error;
            }
            if (
                (configuration.maxBootstrapAttempts != 0)
                && (attempts >= configuration.maxBootstrapAttempts)
            ) {
                impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                    SystemAbstractions::DiagnosticsSender::Levels::ERROR,
                    "Cluster still unavailable after %zu attempt(s) -- giving up",
                    attempts
                );
                impl_->Demobilize(lock);
                return error;
            }
            impl_->diagnosticsSender.SendDiagnosticInformationString(
                2,
                "Cluster unavailable -- retrying"
            );
            if (configuration.bootstrapRetryDelay > 0.0) {
                impl_->bootstrapRetryDue = false;
                const std::weak_ptr< Impl > weakImpl(impl_);
                const auto retryToken = scheduler->Schedule(
                    [weakImpl, thisGeneration]{
                        const auto impl = weakImpl.lock();
                        if (impl == nullptr) {
                            return;
                        }
                        std::lock_guard< decltype(impl->mutex) > lock(impl->mutex);
                        if (impl->generation != thisGeneration) {
                            return;
                        }
                        impl->bootstrapRetryDue = true;
                        impl->bootstrapWakeCondition.notify_all();
                    },
                    scheduler->GetClock()->GetCurrentTime() + configuration.bootstrapRetryDelay
                );
                impl_->bootstrapWakeCondition.wait(
                    lock,
                    [this, thisGeneration]{
                        return (
                            impl_->bootstrapRetryDue
                            || (impl_->generation != thisGeneration)
                        );
                    }
                );
                scheduler->Cancel(retryToken);
                if (impl_->generation != thisGeneration) {
                    impl_->diagnosticsSender.SendDiagnosticInformationString(
                        SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                        "Demobilized while bootstrapping"
                    );
                    return Error::BootstrapAborted;
                }
            }
        }
    }

    void Decider::Demobilize() {
        std::unique_lock< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->Demobilize(lock);
    }

    void Decider::Loop(double interval) {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->state != Impl::State::Mobilized) {
            impl_->diagnosticsSender.SendDiagnosticInformationString(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Loop requested while not mobilized"
            );
            return;
        }
        if (interval <= 0.0) {
            impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
                SystemAbstractions::DiagnosticsSender::Levels::WARNING,
                "Loop interval must be positive (%lg requested)",
                interval
            );
            return;
        }
        impl_->diagnosticsSender.SendDiagnosticInformationFormatted(
            0,
            "Re-checking every %lg seconds",
            interval
        );
        impl_->loopInterval = interval;
        impl_->ScheduleLoopTick();
    }

    std::error_code Decider::ReCheck() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->state != Impl::State::Mobilized) {
            return Error::NotMobilized;
        }
        return impl_->ReCheck();
    }

    std::error_code Decider::Promote() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->state != Impl::State::Mobilized) {
            return Error::NotMobilized;
        }
        return impl_->BecomeActive(true);
    }

    std::error_code Decider::Demote() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        if (impl_->state != Impl::State::Mobilized) {
            return Error::NotMobilized;
        }
        return impl_->BecomeBackup(true);
    }

    void Decider::ResetStatistics() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        impl_->ResetStatistics();
    }

    Json::Value Decider::GetStatistics() {
        std::lock_guard< decltype(impl_->mutex) > lock(impl_->mutex);
        return Json::Object({
            {"reChecks", (int)impl_->numReChecks},
            {"bounces", (int)impl_->numBounces},
            {"clusterUnavailable", (int)impl_->numClusterUnavailable},
            {"transitions", (int)impl_->numTransitions},
            {"stops", (int)impl_->numStops},
            {
                "lastPeerDBRole", (
                    impl_->peerDBRoleObserved
                    ? DBRoleToString(impl_->lastPeerDBRole)
                    : std::string("unknown")
                )
            },
        });
    }

}
