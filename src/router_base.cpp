//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/dispatcher.hpp"
#include "src/detail/pct_decode.hpp"
#include "src/detail/route_node.hpp"
#include <routekit/detail/router_base.hpp>
#include <routekit/detail/except.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>

namespace routekit {
namespace detail {

namespace {

// the patterns leading from the root to n
std::string
scope_of(route_node const& n)
{
    std::vector<std::string_view> v;
    for(auto p = &n; p; p = p->parent)
        v.push_back(p->pattern.pattern());
    std::string s;
    for(auto it = v.rbegin(); it != v.rend(); ++it)
        s.append(it->data(), it->size());
    return s;
}

route_pattern
compile(
    route_node const& parent,
    std::string_view spec)
{
    auto rv = parse_route_pattern(
        spec, parent.case_sensitive);
    if(rv.has_error())
    {
        spdlog::error(
            "routekit: bad route \"{}\" in \"{}\": {}",
            spec, scope_of(parent), rv.error().message());
        detail::throw_system_error(rv.error());
    }
    return std::move(*rv);
}

} // (anon)

router_base::
~router_base() = default;

router_base::
router_base(bool case_sensitive)
    : owned_(std::make_unique<route_node>())
    , node_(owned_.get())
{
    node_->case_sensitive = case_sensitive;
}

router_base::
router_base(route_node& n) noexcept
    : node_(&n)
{
}

router_base::
router_base(router_base&&) noexcept = default;

router_base&
router_base::
operator=(router_base&&) noexcept = default;

route_node&
router_base::
add_group(
    std::string_view pattern,
    handler_list handlers)
{
    if(node_->depth >= max_depth)
    {
        spdlog::error(
            "routekit: group \"{}\" in \"{}\" exceeds {} levels",
            pattern, scope_of(*node_), max_depth);
        detail::throw_length_error();
    }
    auto n = std::make_unique<route_node>();
    n->parent = node_;
    n->pattern = compile(*node_, pattern);
    n->handlers = std::move(handlers);
    n->depth = node_->depth + 1;
    n->type = route_node::kind::router;
    n->case_sensitive = node_->case_sensitive;
    auto& rv = *n;
    node_->children.push_back(std::move(n));
    return rv;
}

route_node&
router_base::
add_route(
    std::string_view spec,
    handler_list handlers)
{
    auto n = std::make_unique<route_node>();
    n->parent = node_;
    n->pattern = compile(*node_, spec);
    n->handlers = std::move(handlers);
    n->depth = node_->depth + 1;
    n->type = route_node::kind::route;
    auto& rv = *n;
    node_->children.push_back(std::move(n));
    return rv;
}

route_node&
router_base::
add_middleware(
    handler_list handlers,
    bool is_error)
{
    // the empty pattern accepts everything
    auto n = std::make_unique<route_node>();
    n->parent = node_;
    n->handlers = std::move(handlers);
    n->depth = node_->depth + 1;
    n->type = route_node::kind::route;
    n->is_error = is_error;
    auto& rv = *n;
    node_->children.push_back(std::move(n));
    return rv;
}

void
router_base::
append_handlers(
    route_node& n,
    handler_list handlers)
{
    n.handlers.reserve(
        n.handlers.size() + handlers.size());
    for(auto& h : handlers)
        n.handlers.push_back(std::move(h));
}

route_pattern const&
router_base::
node_pattern(
    route_node const& n) noexcept
{
    return n.pattern;
}

std::size_t
router_base::
handler_count(
    route_node const& n) noexcept
{
    return n.handlers.size();
}

system::error_code
router_base::
dispatch_impl(
    std::string_view verb,
    std::string_view path,
    route_params_base& p,
    response_sink& res) const
{
    return dispatcher::start(
        *node_, verb, path, p, res);
}

system::error_code
router_base::
serve_impl(
    std::string_view verb,
    urls::url_view const& url,
    route_params_base& p,
    response_sink& res) const
{
    auto path = pct_decode_path(url.encoded_path());
    if(path.empty())
        path.push_back('/');
    return dispatcher::start(
        *node_, verb, path, p, res);
}

} // detail
} // routekit
