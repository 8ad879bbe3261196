/**
 * @file Utilities.cpp
 *
 * This module contains the implementation of free functions used by other
 * parts of the library implementation.
 *
 * © 2020 by Richard Walters
 */

#include "Utilities.hpp"

#include <Failover/Roles.hpp>
#include <ostream>
#include <string>

namespace Failover {

    void PrintTo(
        NodeRole nodeRole,
        std::ostream* os
    ) {
        *os << NodeRoleToString(nodeRole);
    }

    void PrintTo(
        DBRole dbRole,
        std::ostream* os
    ) {
        *os << DBRoleToString(dbRole);
    }

    std::string NodeRoleToString(NodeRole nodeRole) {
        switch (nodeRole) {
            case NodeRole::Initialized: return "initialized";
            case NodeRole::Primary: return "primary";
            case NodeRole::Secondary: return "secondary";
            default: return "???";
        }
    }

    std::string DBRoleToString(DBRole dbRole) {
        switch (dbRole) {
            case DBRole::Initialized: return "initialized";
            case DBRole::Single: return "single";
            case DBRole::Active: return "active";
            case DBRole::Backup: return "backup";
            case DBRole::Dead: return "dead";
            default: return "???";
        }
    }

}
