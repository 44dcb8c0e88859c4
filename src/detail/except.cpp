//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <routekit/detail/except.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace routekit {
namespace detail {

void
throw_length_error(
    boost::source_location const& loc)
{
    boost::throw_exception(
        std::length_error(
            "length error"), loc);
}

void
throw_logic_error(
    boost::source_location const& loc)
{
    boost::throw_exception(
        std::logic_error(
            "logic error"), loc);
}

void
throw_system_error(
    system::error_code const& ec,
    boost::source_location const& loc)
{
    boost::throw_exception(
        system::system_error(ec), loc);
}

} // detail
} // routekit
