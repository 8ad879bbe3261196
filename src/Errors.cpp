/**
 * @file Errors.cpp
 *
 * This module contains the implementation of the "Failover" error category.
 *
 * © 2020 by Richard Walters
 */

#include <Failover/Errors.hpp>
#include <string>
#include <system_error>

namespace {

    /**
     * This is the category of errors reported by the Failover library itself.
     */
    class FailoverErrorCategory
        : public std::error_category
    {
    public:
        // std::error_category

        virtual const char* name() const noexcept override {
            return "Failover";
        }

        virtual std::string message(int value) const override {
            switch (static_cast< Failover::Error >(value)) {
                case Failover::Error::Success: return "success";
                case Failover::Error::ClusterUnavailable: return "none of the nodes in the cluster are available";
                case Failover::Error::NotMobilized: return "decider is not mobilized";
                case Failover::Error::BootstrapAborted: return "decider was demobilized while bootstrapping";
                case Failover::Error::AlreadyBootstrapping: return "decider is already bootstrapping";
                default: return "unknown error";
            }
        }
    };

}

namespace Failover {

    const std::error_category& ErrorCategory() {
        static const FailoverErrorCategory category;
        return category;
    }

    std::error_code make_error_code(Error error) {
        return std::error_code(static_cast< int >(error), ErrorCategory());
    }

}
