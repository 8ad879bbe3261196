#ifndef FAILOVER_ROLES_HPP
#define FAILOVER_ROLES_HPP

/**
 * @file Roles.hpp
 *
 * This module declares the Failover::NodeRole and Failover::DBRole
 * enumerations.
 *
 * © 2020 by Richard Walters
 */

#include <ostream>

namespace Failover {

    /**
     * This is the role a node holds in the replication topology of the
     * underlying database engine, independent of the failover layer.
     */
    enum class NodeRole {
        /**
         * The node has not yet been placed in the replication topology.
         */
        Initialized,

        /**
         * The node is the replication source.
         */
        Primary,

        /**
         * The node replicates from the primary.
         */
        Secondary,
    };

    /**
     * This is the role the failover layer assigns to a node, which
     * downstream systems (proxies, replication) honor.
     */
    enum class DBRole {
        /**
         * The node has not yet been assigned a database role.
         */
        Initialized,

        /**
         * The node serves writes alone, without a backup.
         */
        Single,

        /**
         * The node serves writes and has a backup following it.
         */
        Active,

        /**
         * The node follows the active node and does not serve writes.
         */
        Backup,

        /**
         * The node is reachable but reports itself as unhealthy.  Only ever
         * observed on a peer.
         */
        Dead,
    };

    /**
     * This is a support function for Google Test to print out
     * values of the Failover::NodeRole type.
     *
     * @param[in] nodeRole
     *     This is the node role value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     node role value.
     */
    void PrintTo(
        NodeRole nodeRole,
        std::ostream* os
    );

    /**
     * This is a support function for Google Test to print out
     * values of the Failover::DBRole type.
     *
     * @param[in] dbRole
     *     This is the database role value to print.
     *
     * @param[in] os
     *     This points to the stream to which to print the
     *     database role value.
     */
    void PrintTo(
        DBRole dbRole,
        std::ostream* os
    );

}

#endif /* FAILOVER_ROLES_HPP */
