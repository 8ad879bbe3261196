#ifndef FAILOVER_DECIDER_HPP
#define FAILOVER_DECIDER_HPP

/**
 * @file Decider.hpp
 *
 * This module declares the Failover::Decider implementation.
 *
 * © 2020 by Richard Walters
 */

#include <Failover/IDecider.hpp>
#include <memory>
#include <stddef.h>
#include <SystemAbstractions/DiagnosticsSender.hpp>

namespace Failover {

    /**
     * This class decides and drives the database role transitions of the
     * local node of a two-node cluster.
     */
    class Decider
        : public IDecider
    {
        // Lifecycle Methods
    public:
        ~Decider() noexcept;
        Decider(const Decider&) = delete;
        Decider(Decider&&) noexcept;
        Decider& operator=(const Decider&) = delete;
        Decider& operator=(Decider&&) noexcept;

        // Public Methods
    public:
        /**
         * This is the constructor of the class.
         */
        Decider();

        /**
         * This method forms a new subscription to diagnostic
         * messages published by the class.
         *
         * @param[in] delegate
         *     This is the function to call to deliver messages
         *     to the subscriber.
         *
         * @param[in] minLevel
         *     This is the minimum level of message that this subscriber
         *     desires to receive.
         *
         * @return
         *     A function is returned which may be called
         *     to terminate the subscription.
         */
        SystemAbstractions::DiagnosticsSender::UnsubscribeDelegate SubscribeToDiagnostics(
            SystemAbstractions::DiagnosticsSender::DiagnosticMessageDelegate delegate,
            size_t minLevel = 0
        );

        /**
         * Return an indication of whether or not the decider is mobilized.
         *
         * @return
         *     An indication of whether or not the decider is mobilized
         *     is returned.
         */
        bool IsMobilized() const;

        // IDecider
    public:
        virtual EventsUnsubscribeDelegate SubscribeToEvents(EventDelegate eventDelegate) override;
        virtual std::error_code Mobilize(
            std::shared_ptr< ICandidate > me,
            std::shared_ptr< ICandidate > other,
            std::shared_ptr< IMonitor > monitor,
            std::shared_ptr< IPerformer > performer,
            std::shared_ptr< Timekeeping::Scheduler > scheduler,
            const Configuration& configuration
        ) override;
        virtual void Demobilize() override;
        virtual void Loop(double interval) override;
        virtual std::error_code ReCheck() override;
        virtual std::error_code Promote() override;
        virtual std::error_code Demote() override;
        virtual void ResetStatistics() override;
        virtual Json::Value GetStatistics() override;

        // Private properties
    private:
        /**
         * This is the type of structure that contains the private
         * properties of the instance.  It is defined in the implementation
         * and declared here to ensure that it is scoped inside the class.
         */
        struct Impl;

        /**
         * This contains the private properties of the instance.
         */
        std::shared_ptr< Impl > impl_;
    };

}

#endif /* FAILOVER_DECIDER_HPP */
