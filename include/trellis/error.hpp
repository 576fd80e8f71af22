//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_ERROR_HPP
#define TRELLIS_ERROR_HPP

#include <trellis/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace trellis {

/** Error codes returned when a route is registered.

    All of these indicate a defect in the application's
    route table, and are fatal to startup. Each value is
    equivalent to @ref condition::configuration_error.
*/
enum class error
{
    /// Success
    success = 0,

    /// A parameter name is empty or contains invalid characters
    bad_param_name,

    /// A parameter pattern is unbalanced or is not a valid regular expression
    bad_param_pattern,

    /// A catch-all segment is not the last segment of the pattern
    misplaced_wildcard,

    /// The same parameter name appears more than once in a pattern
    duplicate_param,

    /// The method is not a valid HTTP token
    bad_method
};

//------------------------------------------------

/** Error conditions corresponding to sets of error codes.
*/
enum class condition
{
    /** The route table is invalid

        The application attempted to register a route
        which can never be served as written.
    */
    configuration_error
};

} // trellis

#include <trellis/impl/error.hpp>

#endif
