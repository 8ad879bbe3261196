#ifndef FAILOVER_I_CANDIDATE_HPP
#define FAILOVER_I_CANDIDATE_HPP

/**
 * @file ICandidate.hpp
 *
 * This module declares the Failover::ICandidate interface.
 *
 * © 2020 by Richard Walters
 */

#include "IMonitor.hpp"
#include "Roles.hpp"

#include <system_error>

namespace Failover {

    /**
     * This is the interface to one of the two data nodes of the cluster,
     * either the local node or its peer.
     */
    class ICandidate
        : public IMonitor
    {
    public:
        // Methods

        /**
         * Return the database role currently held by the node.
         *
         * @param[out] dbRole
         *     This is where to store the database role of the node.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        virtual std::error_code GetDBRole(DBRole& dbRole) = 0;

        /**
         * Assign a new database role to the node.
         *
         * @param[in] dbRole
         *     This is the database role to assign.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        virtual std::error_code SetDBRole(DBRole dbRole) = 0;

        /**
         * Return an indication of whether or not the node has fully replayed
         * the data of the previous active node.
         *
         * @param[out] hasSynced
         *     This is where to store the indication.
         *
         * @return
         *     An error code is returned, which is empty on success.
         */
        virtual std::error_code HasSynced(bool& hasSynced) = 0;
    };

}

#endif /* FAILOVER_I_CANDIDATE_HPP */
