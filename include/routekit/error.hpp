//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_ERROR_HPP
#define ROUTEKIT_ERROR_HPP

#include <routekit/detail/config.hpp>
#include <boost/system/error_code.hpp>

namespace routekit {

/** Error codes returned by the routing library.

    The first group of values is produced when a route
    specification string is compiled. Those errors indicate
    a programming mistake and are reported by throwing
    `system::system_error` from the registration functions.
*/
enum class error
{
    /// Success
    success = 0,

    /// The method list in front of the path pattern is malformed
    invalid_method,

    /// A parameter token in the path pattern is malformed
    invalid_pattern,

    /// A parameter name appears more than once in a pattern
    duplicate_param,

    /// The regular expression built from the pattern does not compile
    invalid_regex,

    /** A handler exited with an exception.

        The exception itself is available from
        @ref route_params_base::exception.
    */
    unhandled_exception
};

} // routekit

#include <routekit/impl/error.hpp>

#endif
