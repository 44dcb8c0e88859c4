//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_ROUTE_PARAMS_HPP
#define ROUTEKIT_ROUTE_PARAMS_HPP

#include <routekit/detail/config.hpp>
#include <routekit/output.hpp>
#include <routekit/route_pattern.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace routekit {

namespace detail {

struct route_node;
class dispatcher;
struct invocation;

// One level of the router tree being walked
struct dispatch_frame
{
    route_node const* node;
    std::size_t handler_pos;
    std::size_t child_pos;

    // unconsumed path at this level
    std::string_view path;

    // parameters to restore on leaving this level
    std::shared_ptr<params_map const> saved_params;
};

} // detail

/** Base class for request objects

    This is a required public base for any `Params`
    type used with @ref basic_router. It holds the
    request method and path, the captured parameters,
    the pending error, and the state of the dispatch
    in progress.

    An object is reset at the start of each dispatch
    and may be reused for subsequent requests, but it
    must not take part in two dispatches at once.

    @par Control transfer

    Inside a handler, call @ref next to run the rest
    of the chain before returning, or @ref next_route
    to abandon the route or router level the handler
    belongs to. A handler which returns without
    calling either ends the dispatch, so the first
    route accepting a request is the only one to run
    unless its handlers pass control on.

    A handler which fails is the exception: the
    remaining handlers of its level are skipped and
    matching continues with the error pending. If it
    had already passed control on, the error is only
    recorded.
*/
class ROUTEKIT_SYMBOL_VISIBLE
    route_params_base
{
public:
    route_params_base() = default;
    route_params_base(
        route_params_base const&) = delete;
    route_params_base& operator=(
        route_params_base const&) = delete;

    /** Return the request method
    */
    std::string_view
    method() const noexcept
    {
        return verb_;
    }

    /** Return the request path

        This is never modified during a dispatch.
    */
    std::string_view
    path() const noexcept
    {
        return path_;
    }

    /** Return the part of the path not yet consumed

        Each router level which matches removes its
        prefix before handing the rest down.
    */
    ROUTEKIT_DECL
    std::string_view
    remaining() const noexcept;

    /** Return the parameters captured so far
    */
    ROUTEKIT_DECL
    params_map const&
    params() const noexcept;

    /** Return a captured parameter, or an empty string
    */
    ROUTEKIT_DECL
    std::string_view
    param(std::string_view name) const noexcept;

    /** Return the pending error

        The error is set when a handler fails, and
        remains set until cleared by a handler or
        until the dispatch ends.
    */
    system::error_code const&
    error() const noexcept
    {
        return ec_;
    }

    /** Return the exception thrown by a failed handler

        This is null unless the pending error is
        @ref error::unhandled_exception.
    */
    std::exception_ptr
    exception() const noexcept
    {
        return ep_;
    }

    /** Return true if an error is pending
    */
    bool
    has_error() const noexcept
    {
        return ec_.failed();
    }

    /** Clear the pending error

        Subsequent matching routes are treated as
        regular routes again.
    */
    ROUTEKIT_DECL
    void
    clear_error();

    /** Return the sink for the current dispatch

        @par Preconditions
        A dispatch is in progress.
    */
    ROUTEKIT_DECL
    response_sink&
    response() const noexcept;

    /** Run the remainder of the chain

        Control returns to the caller once no more
        handlers are left to run, or a handler ended
        the dispatch.

        @throw std::logic_error Called outside of a
        handler, or more than once by one handler.
    */
    ROUTEKIT_DECL
    void
    next();

    /** Skip the rest of the current level

        The remaining handlers of the route, or of the
        router whose handler is running, are skipped
        along with that router's children. Matching
        resumes with the next sibling in the parent.

        @throw std::logic_error Called outside of a
        handler, or more than once by one handler.
    */
    ROUTEKIT_DECL
    void
    next_route();

private:
    friend class detail::dispatcher;

    std::string verb_;
    std::string path_;
    std::shared_ptr<params_map const> params_;
    system::error_code ec_;
    std::exception_ptr ep_;
    std::vector<detail::dispatch_frame> frames_;
    detail::invocation* inv_ = nullptr;
    response_sink* res_ = nullptr;
};

} // routekit

#endif
