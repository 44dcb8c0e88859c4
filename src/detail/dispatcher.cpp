//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/dispatcher.hpp"
#include <routekit/detail/except.hpp>
#include <routekit/error.hpp>
#include <boost/assert.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace routekit {
namespace detail {

namespace {

std::shared_ptr<params_map const> const&
empty_params()
{
    static auto const p =
        std::make_shared<params_map const>();
    return p;
}

// routers are always entered so that error
// routes nested inside them remain reachable
bool
is_eligible(
    route_node const& n,
    route_params_base const& p) noexcept
{
    if(n.is_router())
        return true;
    return n.is_error == p.has_error();
}

} // (anon)

system::error_code
dispatcher::
start(
    route_node const& root,
    std::string_view verb,
    std::string_view path,
    route_params_base& p,
    response_sink& res)
{
    // one request at a time
    if(p.res_ || p.inv_ || ! p.frames_.empty())
        detail::throw_logic_error();

    // release the dispatch state on exit,
    // including when an exception propagates
    struct state_saver
    {
        route_params_base& p;

        ~state_saver()
        {
            p.frames_.clear();
            p.inv_ = nullptr;
            p.res_ = nullptr;
        }
    };

    p.verb_.assign(verb.data(), verb.size());
    p.path_.assign(path.data(), path.size());
    p.params_ = empty_params();
    p.ec_ = {};
    p.ep_ = nullptr;
    p.res_ = &res;

    state_saver saver{p};
    p.frames_.push_back({
        &root, 0, 0, p.path_, p.params_ });
    run(p);
    return p.ec_;
}

void
dispatcher::
next(route_params_base& p)
{
    auto& inv = current(p);
    inv.resumed = true;
    BOOST_ASSERT(p.frames_.size() == inv.depth);
    run(p);
}

void
dispatcher::
next_route(route_params_base& p)
{
    auto& inv = current(p);
    inv.resumed = true;
    unwind(p, inv.depth - 1);
    run(p);
}

//------------------------------------------------

void
dispatcher::
run(route_params_base& p)
{
    // frames_ may grow while a handler runs,
    // so never hold a reference across invoke
    while(! p.frames_.empty())
    {
        auto& f = p.frames_.back();
        route_node const& n = *f.node;

        // the node's own handlers
        if( f.handler_pos < n.handlers.size() &&
            n.is_error == p.has_error())
        {
            auto const& h = *n.handlers[f.handler_pos++];
            if(! invoke(p, h))
                return;
            continue;
        }

        // the first eligible child which matches
        bool entered = false;
        while(f.child_pos < n.children.size())
        {
            auto const& c = *n.children[f.child_pos++];
            if(! is_eligible(c, p))
                continue;
            auto m = c.pattern.match(p.verb_, f.path);
            if(! m.matched)
                continue;
            auto saved = p.params_;
            if(! m.params.empty())
            {
                // copy on write, so that siblings
                // never see each other's captures
                auto merged = std::make_shared<
                    params_map>(*p.params_);
                for(auto& kv : m.params)
                    (*merged)[kv.first] = std::move(kv.second);
                p.params_ = std::move(merged);
            }
            p.frames_.push_back({
                &c, 0, 0, m.rest, std::move(saved) });
            entered = true;
            break;
        }
        if(entered)
            continue;

        // nothing left at this level
        p.params_ = std::move(f.saved_params);
        p.frames_.pop_back();
    }
}

// Returns true if the loop which
// invoked the handler should continue
bool
dispatcher::
invoke(
    route_params_base& p,
    route_handler const& h)
{
    invocation inv{ p.frames_.size() };
    auto const prev = std::exchange(p.inv_, &inv);

    system::error_code ec;
    std::exception_ptr ep;
    try
    {
        auto rv = h.invoke(p);
        if(rv.has_value())
            ec = write_output(*p.res_, *rv);
        else
            ec = rv.error();
    }
    catch(...)
    {
        ep = std::current_exception();
        ec = ROUTEKIT_ERR(error::unhandled_exception);
    }
    p.inv_ = prev;

    // a handler which returns without calling
    // next() or next_route() ends the dispatch
    if(! ec.failed())
        return false;

    fail(p, ec, ep);
    if(inv.resumed)
    {
        // the rest of the chain already ran
        return false;
    }
    unwind(p, inv.depth - 1);
    return true;
}

void
dispatcher::
unwind(
    route_params_base& p,
    std::size_t depth) noexcept
{
    while(p.frames_.size() > depth)
    {
        p.params_ = std::move(
            p.frames_.back().saved_params);
        p.frames_.pop_back();
    }
}

void
dispatcher::
fail(
    route_params_base& p,
    system::error_code const& ec,
    std::exception_ptr ep)
{
    spdlog::debug(
        "routekit: {} {}: handler failed: {}",
        p.verb_, p.path_, ec.message());
    p.ec_ = ec;
    p.ep_ = std::move(ep);
}

invocation&
dispatcher::
current(route_params_base& p)
{
    if(! p.inv_ || p.inv_->resumed)
        detail::throw_logic_error();
    return *p.inv_;
}

} // detail
} // routekit
