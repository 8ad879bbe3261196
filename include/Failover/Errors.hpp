#ifndef FAILOVER_ERRORS_HPP
#define FAILOVER_ERRORS_HPP

/**
 * @file Errors.hpp
 *
 * This module declares the error conditions reported by the Failover
 * library itself.  Errors reported by collaborators are passed through
 * in whatever category they use.
 *
 * © 2020 by Richard Walters
 */

#include <system_error>

namespace Failover {

    /**
     * These are the error codes of the "Failover" error category.
     */
    enum class Error {
        /**
         * This is not an error; it is reserved so that a default
         * constructed error code means success.
         */
        Success = 0,

        /**
         * Neither the peer nor the witness could be reached, or an unsynced
         * backup refused to promote itself.  The local node has stopped
         * serving.  The caller should keep retrying on its normal cadence.
         */
        ClusterUnavailable,

        /**
         * The operation requires a mobilized decider.
         */
        NotMobilized,

        /**
         * The decider was demobilized while it was still bootstrapping.
         */
        BootstrapAborted,

        /**
         * Another call to Mobilize is still bootstrapping the decider.
         */
        AlreadyBootstrapping,
    };

    /**
     * Return the category object for errors of the Failover library.
     *
     * @return
     *     The category object for errors of the Failover library
     *     is returned.
     */
    const std::error_category& ErrorCategory();

    /**
     * Build an error code in the Failover category.
     *
     * @param[in] error
     *     This is the error to wrap.
     *
     * @return
     *     The error code for the given error is returned.
     */
    std::error_code make_error_code(Error error);

}

namespace std {

    template<> struct is_error_code_enum< Failover::Error >
        : public true_type
    {
    };

}

#endif /* FAILOVER_ERRORS_HPP */
