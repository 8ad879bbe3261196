#ifndef FAILOVER_I_MONITOR_HPP
#define FAILOVER_I_MONITOR_HPP

/**
 * @file IMonitor.hpp
 *
 * This module declares the Failover::IMonitor interface.
 *
 * © 2020 by Richard Walters
 */

#include "Roles.hpp"

#include <memory>
#include <system_error>

namespace Failover {

    class ICandidate;

    /**
     * This is the interface to a member of the cluster which can be asked
     * about its role, including the witness which relays information about
     * a peer when the peer cannot be contacted directly.
     */
    class IMonitor {
    public:
        // Lifecycle

        virtual ~IMonitor() = default;

        // Methods

        /**
         * Return the role of the member in the replication topology.
         *
         * @param[out] nodeRole
         *     This is where to store the role of the member.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        virtual std::error_code GetRole(NodeRole& nodeRole) = 0;

        /**
         * Re-resolve the given peer through this member, returning a
         * reference to the peer which may be reached indirectly.
         *
         * @param[in] candidate
         *     This is the peer which could not be reached directly.
         *
         * @return
         *     A reference to the peer, relayed through this member, is
         *     returned.  It may be a different object than the one given.
         *
         * @retval nullptr
         *     This is returned if the member cannot relay to the peer at all.
         */
        virtual std::shared_ptr< ICandidate > Bounce(
            std::shared_ptr< ICandidate > candidate
        ) = 0;

        /**
         * Block until the member is usable.
         */
        virtual void Ready() = 0;
    };

}

#endif /* FAILOVER_I_MONITOR_HPP */
