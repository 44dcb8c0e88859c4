//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_SRC_DETAIL_ROUTE_NODE_HPP
#define ROUTEKIT_SRC_DETAIL_ROUTE_NODE_HPP

#include <routekit/detail/router_base.hpp>
#include <routekit/route_pattern.hpp>
#include <memory>
#include <vector>

namespace routekit {
namespace detail {

// A router or a route in the tree.
// Routes never have children.
struct route_node
{
    enum class kind : char
    {
        router,
        route
    };

    // not owning, null at the root. Walked to
    // name the enclosing scope in diagnostics.
    route_node* parent = nullptr;

    route_pattern pattern;
    handler_list handlers;
    std::vector<std::unique_ptr<route_node>> children;
    std::size_t depth = 0;
    kind type = kind::router;

    // routes only: runs while an error is pending
    bool is_error = false;

    // routers only: inherited by groups
    bool case_sensitive = true;

    bool
    is_router() const noexcept
    {
        return type == kind::router;
    }
};

} // detail
} // routekit

#endif
