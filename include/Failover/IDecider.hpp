#ifndef FAILOVER_I_DECIDER_HPP
#define FAILOVER_I_DECIDER_HPP

/**
 * @file IDecider.hpp
 *
 * This module declares the Failover::IDecider interface.
 *
 * © 2020 by Richard Walters
 */

#include "ICandidate.hpp"
#include "IMonitor.hpp"
#include "IPerformer.hpp"
#include "Roles.hpp"

#include <functional>
#include <Json/Value.hpp>
#include <memory>
#include <stddef.h>
#include <system_error>
#include <Timekeeping/Scheduler.hpp>

namespace Failover {

    /**
     * This is the interface to the Decider component, which reconciles the
     * database role of the local node with what it observes of its peer,
     * driving role transitions so that at most one of the two nodes serves
     * writes.
     */
    class IDecider {
        // Types
    public:
        /**
         * This holds the properties which make up the configuration of
         * the decider.
         */
        struct Configuration {
            /**
             * This is the maximum number of reconciliation passes to attempt
             * while mobilizing, before giving up.  Zero means keep trying
             * until the cluster becomes available.
             */
            size_t maxBootstrapAttempts = 0;

            /**
             * This is the amount of time, in seconds, to wait between
             * reconciliation passes while mobilizing, after a pass found the
             * cluster unavailable.
             */
            double bootstrapRetryDelay = 0.0;
        };

        /**
         * This is the base type of any event published by the decider.
         * All events will subclass this type and set the appropriate value
         * for the type field.
         */
        struct Event {
            /**
             * This is used to identify the subclass of the concrete event.
             */
            const enum class Type {
                /**
                 * This indicates the event announces that the local node
                 * was assigned a new database role and the performer was
                 * told to carry out the transition.
                 */
                Transition,

                /**
                 * This indicates the event announces that the performer was
                 * told to stop serving.
                 */
                Stop,
            } type;

            /**
             * This is the constructor of the event.
             *
             * @param[in] type
             *     This is used to identify the subclass of the concrete event.
             */
            explicit Event(Type type) : type(type) {}
        };

        /**
         * This is an event published by the decider.  It announces that the
         * local node was assigned a new database role.
         */
        struct TransitionEvent : public Event {
            /**
             * This is the database role assigned to the local node.
             */
            DBRole dbRole = DBRole::Initialized;

            /**
             * This indicates whether the transition was requested manually
             * (Promote or Demote) rather than decided by reconciliation.
             */
            bool manual = false;

            /**
             * This is the default constructor.
             */
            TransitionEvent()
                : Event(Type::Transition)
            {
            }
        };

        /**
         * This is an event published by the decider.  It announces that the
         * local node stopped serving because the cluster became unavailable.
         */
        struct StopEvent : public Event {
            /**
             * This is the default constructor.
             */
            StopEvent()
                : Event(Type::Stop)
            {
            }
        };

        /**
         * Declare the type of delegate used to deliver events published by the
         * decider.
         *
         * @param[in] baseEvent
         *     This is a reference to the base of the event that was published.
         *     The delegate should look at the event's type and downcast
         *     the reference to the matching subtype for more details.
         */
        using EventDelegate = std::function<
            void(
                const Failover::IDecider::Event& baseEvent
            )
        >;

        /**
         * Declare the type of delegate returned when a subscriber subscribes
         * to decider events.  When called, this delegate cancels the
         * subscription.
         */
        using EventsUnsubscribeDelegate = std::function< void() >;

        // Lifecycle
    public:
        virtual ~IDecider() = default;

        // Methods
    public:
        /**
         * Subscribe to events published by the decider.
         *
         * @param[in] eventDelegate
         *     This is the delegate to be called whenever an event
         *     is published by the decider.
         *
         * @return
         *     A delegate that can be called to cancel the subscription
         *     is returned.
         */
        virtual EventsUnsubscribeDelegate SubscribeToEvents(EventDelegate eventDelegate) = 0;

        /**
         * This method blocks until the decider has established a view of
         * the cluster.  It repeatedly waits for the peer and the monitor to
         * be ready and attempts one reconciliation pass, until a pass
         * completes without finding the cluster unavailable.
         *
         * @param[in] me
         *     This is the local node.
         *
         * @param[in] other
         *     This is the peer node.
         *
         * @param[in] monitor
         *     This is the witness used to reach the peer indirectly.
         *
         * @param[in] performer
         *     This is the object which carries out role transitions.
         *
         * @param[in] scheduler
         *     This is the object used to run the periodic loop and to
         *     time the delay between bootstrap attempts.
         *
         * @param[in] configuration
         *     This holds the configuration items for the decider.
         *
         * @return
         *     An error code is returned, which is empty if the decider is
         *     now mobilized.  Any error reported by a reconciliation pass
         *     other than Error::ClusterUnavailable is returned unchanged
         *     and leaves the decider demobilized.
         *     Error::AlreadyBootstrapping is returned if another call
         *     is still bootstrapping the decider.
         */
        virtual std::error_code Mobilize(
            std::shared_ptr< ICandidate > me,
            std::shared_ptr< ICandidate > other,
            std::shared_ptr< IMonitor > monitor,
            std::shared_ptr< IPerformer > performer,
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const Configuration& configuration
        ) = 0;

        /**
         * This method stops the periodic loop, aborts any pending bootstrap,
         * and releases all collaborators.
         */
        virtual void Demobilize() = 0;

        /**
         * Start reconciling the cluster periodically.  Errors from the
         * periodic passes are discarded.
         *
         * @param[in] interval
         *     This is the time, in seconds, between reconciliation passes.
         */
        virtual void Loop(double interval) = 0;

        /**
         * Perform one reconciliation pass: observe the peer's database role,
         * directly or through the monitor, and transition the local node
         * accordingly.
         *
         * @return
         *     An error code is returned, which is empty on success.
         *
         * @retval Error::ClusterUnavailable
         *     This is returned if the local node stopped serving.
         */
        virtual std::error_code ReCheck() = 0;

        /**
         * Make the local node active, without looking at the peer.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        virtual std::error_code Promote() = 0;

        /**
         * Make the local node a backup of the peer, without looking at
         * the peer.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        virtual std::error_code Demote() = 0;

        /**
         * Reset collected statistics.
         */
        virtual void ResetStatistics() = 0;

        /**
         * Return collected statistics.
         *
         * @return
         *     Statistics collected by the decider are returned.
         */
        virtual Json::Value GetStatistics() = 0;
    };

}

#endif /* FAILOVER_I_DECIDER_HPP */
