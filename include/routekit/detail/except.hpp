//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_DETAIL_EXCEPT_HPP
#define ROUTEKIT_DETAIL_EXCEPT_HPP

#include <routekit/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace routekit {
namespace detail {

[[noreturn]] ROUTEKIT_DECL void throw_length_error(
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

[[noreturn]] ROUTEKIT_DECL void throw_logic_error(
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

[[noreturn]] ROUTEKIT_DECL void throw_system_error(
    system::error_code const& ec,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // routekit

#endif
