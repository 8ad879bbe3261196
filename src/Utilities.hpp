#ifndef FAILOVER_UTILITIES_HPP
#define FAILOVER_UTILITIES_HPP

/**
 * @file Utilities.hpp
 *
 * This module contains the declaration of free functions used by other parts
 * of the library implementation.
 *
 * © 2020 by Richard Walters
 */

#include <Failover/Roles.hpp>
#include <string>

namespace Failover {

    /**
     * Return a human-readable string representation of the given node role.
     *
     * @param[in] nodeRole
     *     This is the node role to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given node role
     *     is returned.
     */
    std::string NodeRoleToString(NodeRole nodeRole);

    /**
     * Return a human-readable string representation of the given database
     * role.
     *
     * @param[in] dbRole
     *     This is the database role to turn into a string.
     *
     * @return
     *     A human-readable string representation of the given database role
     *     is returned.
     */
    std::string DBRoleToString(DBRole dbRole);

}

#endif /* FAILOVER_UTILITIES_HPP */
