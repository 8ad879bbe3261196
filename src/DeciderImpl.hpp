#pragma once

/**
 * @file DeciderImpl.hpp
 *
 * This module contains the implementation of the Failover::Decider class.
 *
 * © 2020 by Richard Walters
 */

#include <AsyncData/MultiProducerSingleConsumerQueue.hpp>
#include <condition_variable>
#include <Failover/Decider.hpp>
#include <Failover/ICandidate.hpp>
#include <Failover/IMonitor.hpp>
#include <Failover/IPerformer.hpp>
#include <Failover/Roles.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <stddef.h>
#include <system_error>
#include <SystemAbstractions/DiagnosticsSender.hpp>
#include <thread>
#include <Timekeeping/Scheduler.hpp>

namespace Failover {

    /**
     * This contains the private properties of a Decider class instance
     * that don't live any longer than the Decider class instance itself.
     */
    struct Decider::Impl
        : std::enable_shared_from_this< Impl >
    {
        // Types

        /**
         * These are the stages of the decider's lifecycle.
         */
        enum class State {
            /**
             * The decider holds no collaborators and does nothing.
             */
            Demobilized,

            /**
             * The decider is inside Mobilize, waiting for a reconciliation
             * pass to find the cluster available.
             */
            Bootstrapping,

            /**
             * The decider has a verified view of the cluster.
             */
            Mobilized,
        };

        // Properties

        /**
         * This is a helper object used to generate and publish
         * diagnostic messages.
         */
        SystemAbstractions::DiagnosticsSender diagnosticsSender;

        /**
         * This is used to serialize every decide-and-act sequence, and to
         * synchronize access to the properties below.
         */
        std::recursive_mutex mutex;

        State state = State::Demobilized;

        /**
         * This is incremented whenever the decider is mobilized or
         * demobilized, so that a pending bootstrap can tell it was
         * interrupted.
         */
        size_t generation = 0;

        /**
         * This is incremented whenever the periodic loop is re-armed or
         * cancelled, so that stale ticks can be ignored.
         */
        size_t loopGeneration = 0;

        /**
         * This is the local node.
         */
        std::shared_ptr< ICandidate > me;

        /**
         * This is the peer node.
         */
        std::shared_ptr< ICandidate > other;

        /**
         * This is the witness used to reach the peer when it can't be
         * reached directly.
         */
        std::shared_ptr< IMonitor > monitor;

        /**
         * This is the object which carries out role transitions.
         */
        std::shared_ptr< IPerformer > performer;

        /**
         * This is the object used to track time for the decider
         * and call back functions at specific times.
         */
        std::shared_ptr< Timekeeping::Scheduler > scheduler;

        /**
         * This holds all configuration items for the decider.
         */
        Decider::Configuration configuration;

        /**
         * This is the time, in seconds, between periodic reconciliation
         * passes.
         */
        double loopInterval = 0.0;

        /**
         * This is the token of the next scheduled periodic reconciliation
         * pass, or zero if the loop is not running.
         */
        int loopToken = 0;

        /**
         * This is set by the scheduler once the delay between two bootstrap
         * attempts has elapsed.
         */
        bool bootstrapRetryDue = false;

        /**
         * This is notified when the bootstrap retry delay elapses, and when
         * the decider is demobilized.
         */
        std::condition_variable_any bootstrapWakeCondition;

        /**
         * This is the next identifier to use for an event subscription.
         */
        int nextEventSubscriberId = 0;

        /**
         * These are the current subscriptions to decider events.
         * They are protected by the event queue mutex.
         */
        std::map< int, IDecider::EventDelegate > eventSubscribers;

        /**
         * This holds events to be published by the decider in its worker
         * thread.
         */
        AsyncData::MultiProducerSingleConsumerQueue<
            std::shared_ptr< IDecider::Event >
        > eventQueue;

        /**
         * This thread publishes any events in the event queue.
         */
        std::thread eventQueueWorker;

        /**
         * This flag is set to tell the event queue worker thread to stop.
         */
        bool stopEventQueueWorker = false;

        /**
         * This is notified whenever the event queue is no longer empty,
         * and when the event queue worker thread should stop.
         */
        std::condition_variable eventQueueWorkerWakeCondition;

        /**
         * This is used to synchronize access to the event queue worker thread.
         */
        std::mutex eventQueueMutex;

        size_t numReChecks = 0;
        size_t numBounces = 0;
        size_t numClusterUnavailable = 0;
        size_t numTransitions = 0;
        size_t numStops = 0;

        /**
         * This indicates whether or not a peer database role has been
         * observed since statistics were last reset.
         */
        bool peerDBRoleObserved = false;

        /**
         * This is the last database role observed on the peer.
         */
        DBRole lastPeerDBRole = DBRole::Initialized;

        // Methods

        /**
         * This is the constructor of the structure.
         */
        Impl();

        /**
         * Perform one reconciliation pass.  The mutex must be held.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        std::error_code ReCheck();

        /**
         * Assign the active role to the local node and tell the performer.
         *
         * @param[in] manual
         *     This indicates whether the transition was requested manually.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        std::error_code BecomeActive(bool manual);

        /**
         * Assign the backup role to the local node and tell the performer
         * to follow the peer.
         *
         * @param[in] manual
         *     This indicates whether the transition was requested manually.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        std::error_code BecomeBackup(bool manual);

        /**
         * Assign the single role to the local node and tell the performer.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        std::error_code BecomeSingle();

        /**
         * Tell the performer to stop serving.
         *
         * @return
         *     Error::ClusterUnavailable is always returned.
         */
        std::error_code StopServing();

        /**
         * Cancel any pending periodic pass and schedule the next one,
         * one loop interval from now.
         */
        void ScheduleLoopTick();

        /**
         * Cancel any pending periodic pass.
         */
        void CancelLoop();

        /**
         * Drop all collaborators, cancel the loop, and stop the event queue
         * worker thread.
         *
         * @param[in] lock
         *     This is the object holding the mutex protecting the shared
         *     properties of the decider.
         */
        void Demobilize(std::unique_lock< decltype(mutex) >& lock);

        /**
         * Zero all collected statistics.
         */
        void ResetStatistics();

        void AddToEventQueue(std::shared_ptr< IDecider::Event >&& event);

        void StartEventQueueWorker();

        /**
         * Tell the event queue worker thread to stop, and wait for it,
         * after it has published every event already queued.
         *
         * @param[in] lock
         *     This is the object holding the mutex protecting the shared
         *     properties of the decider.  It is released while waiting.
         */
        void StopEventQueueWorker(std::unique_lock< decltype(mutex) >& lock);

        /**
         * Empty out the event queue, processing each event in order.
         *
         * @param[in] lock
         *     This is the object holding the event queue mutex.
         */
        void ProcessEventQueue(
            std::unique_lock< decltype(eventQueueMutex) >& lock
        );

        /**
         * This runs in a thread and publishes any events in the event queue.
         * The thread holds a reference to the implementation, so a detached
         * worker may safely outlive the Decider.
         */
        void EventQueueWorker();
    };

}
