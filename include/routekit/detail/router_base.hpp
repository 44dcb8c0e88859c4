//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_DETAIL_ROUTER_BASE_HPP
#define ROUTEKIT_DETAIL_ROUTER_BASE_HPP

#include <routekit/detail/config.hpp>
#include <routekit/output.hpp>
#include <routekit/route_params.hpp>
#include <routekit/route_pattern.hpp>
#include <boost/system/error_code.hpp>
#include <boost/url/url_view.hpp>
#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace routekit {

namespace detail {

struct route_node;

// type-erased route handler
struct ROUTEKIT_SYMBOL_VISIBLE
    route_handler
{
    virtual ~route_handler() = default;
    virtual handler_result invoke(
        route_params_base&) const = 0;
};

using handler_ptr = std::unique_ptr<route_handler>;
using handler_list = std::vector<handler_ptr>;

// implementation for all routers
class ROUTEKIT_DECL
    router_base
{
    std::unique_ptr<route_node> owned_;
    route_node* node_;

protected:
    ~router_base();
    explicit router_base(bool case_sensitive);
    explicit router_base(route_node& n) noexcept;
    router_base(router_base&&) noexcept;
    router_base& operator=(router_base&&) noexcept;

    route_node& add_group(
        std::string_view pattern,
        handler_list handlers);

    route_node& add_route(
        std::string_view spec,
        handler_list handlers);

    route_node& add_middleware(
        handler_list handlers,
        bool is_error);

    static void append_handlers(
        route_node& n,
        handler_list handlers);

    static route_pattern const& node_pattern(
        route_node const& n) noexcept;

    static std::size_t handler_count(
        route_node const& n) noexcept;

    system::error_code dispatch_impl(
        std::string_view verb,
        std::string_view path,
        route_params_base& p,
        response_sink& res) const;

    system::error_code serve_impl(
        std::string_view verb,
        urls::url_view const& url,
        route_params_base& p,
        response_sink& res) const;

public:
    /** Maximum nesting depth for groups

        Exceeding this limit throws std::length_error
        when the group is added.
    */
    static constexpr std::size_t max_depth = 16;
};

} // detail
} // routekit

#endif
