//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_ROUTER_HPP
#define ROUTEKIT_ROUTER_HPP

#include <routekit/detail/config.hpp>
#include <routekit/basic_router.hpp>
#include <routekit/route_params.hpp>

namespace routekit {

/** A router for handlers which need no extra request state
*/
using router = basic_router<route_params_base>;

} // routekit

#endif
