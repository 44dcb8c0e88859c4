//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_HPP
#define ROUTEKIT_HPP

#include <routekit/basic_router.hpp>
#include <routekit/error.hpp>
#include <routekit/method.hpp>
#include <routekit/output.hpp>
#include <routekit/route_params.hpp>
#include <routekit/route_pattern.hpp>
#include <routekit/router.hpp>

#endif
