//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/dispatcher.hpp"
#include <routekit/route_params.hpp>
#include <boost/assert.hpp>
#include <spdlog/spdlog.h>

namespace routekit {

std::string_view
route_params_base::
remaining() const noexcept
{
    if(frames_.empty())
        return path_;
    return frames_.back().path;
}

params_map const&
route_params_base::
params() const noexcept
{
    static params_map const empty;
    if(! params_)
        return empty;
    return *params_;
}

std::string_view
route_params_base::
param(std::string_view name) const noexcept
{
    auto const& m = params();
    auto it = m.find(name);
    if(it == m.end())
        return {};
    return it->second;
}

void
route_params_base::
clear_error()
{
    if(! ec_.failed())
        return;
    spdlog::trace(
        "routekit: {} {}: error cleared: {}",
        verb_, path_, ec_.message());
    ec_ = {};
    ep_ = nullptr;
}

response_sink&
route_params_base::
response() const noexcept
{
    BOOST_ASSERT(res_ != nullptr);
    return *res_;
}

void
route_params_base::
next()
{
    detail::dispatcher::next(*this);
}

void
route_params_base::
next_route()
{
    detail::dispatcher::next_route(*this);
}

} // routekit
