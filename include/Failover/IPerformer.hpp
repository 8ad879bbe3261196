#ifndef FAILOVER_I_PERFORMER_HPP
#define FAILOVER_I_PERFORMER_HPP

/**
 * @file IPerformer.hpp
 *
 * This module declares the Failover::IPerformer interface.
 *
 * © 2020 by Richard Walters
 */

#include "ICandidate.hpp"

#include <memory>

namespace Failover {

    /**
     * This is the interface a Decider needs in order to carry out the
     * physical consequences of role transitions (replication, proxies, ...).
     */
    class IPerformer {
    public:
        // Lifecycle

        virtual ~IPerformer() = default;

        // Methods

        /**
         * Make the given node serve writes, with a backup following it.
         *
         * @param[in] me
         *     This is the local node.
         */
        virtual void TransitionToActive(std::shared_ptr< ICandidate > me) = 0;

        /**
         * Make the given node follow the other node.
         *
         * @param[in] me
         *     This is the local node.
         *
         * @param[in] other
         *     This is the peer node to follow.
         */
        virtual void TransitionToBackupOf(
            std::shared_ptr< ICandidate > me,
            std::shared_ptr< ICandidate > other
        ) = 0;

        /**
         * Make the given node serve writes alone.
         *
         * @param[in] me
         *     This is the local node.
         */
        virtual void TransitionToSingle(std::shared_ptr< ICandidate > me) = 0;

        /**
         * Stop serving entirely.
         */
        virtual void Stop() = 0;
    };

}

#endif /* FAILOVER_I_PERFORMER_HPP */
