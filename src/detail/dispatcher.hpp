//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_SRC_DETAIL_DISPATCHER_HPP
#define ROUTEKIT_SRC_DETAIL_DISPATCHER_HPP

#include "src/detail/route_node.hpp"
#include <routekit/route_params.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <exception>
#include <string_view>

namespace routekit {
namespace detail {

// The handler currently running for a request
struct invocation
{
    // size of the frame stack when invoked
    std::size_t depth;

    // true once next() or next_route() was called
    bool resumed = false;
};

/*  Walks the router tree for one request.

    All state lives in the params object, as a
    stack of frames. A handler which calls next()
    or next_route() re-enters run() from inside
    the handler, the rest of the chain executes
    and the handler eventually resumes. A handler
    which returns without doing so ends the walk,
    unless it failed: a failure abandons the
    handler's level and the walk goes on with the
    error pending.
*/
class dispatcher
{
public:
    static
    system::error_code
    start(
        route_node const& root,
        std::string_view verb,
        std::string_view path,
        route_params_base& p,
        response_sink& res);

    static void next(route_params_base& p);
    static void next_route(route_params_base& p);

private:
    static void run(route_params_base& p);

    static bool invoke(
        route_params_base& p,
        route_handler const& h);

    static void unwind(
        route_params_base& p,
        std::size_t depth) noexcept;

    static void fail(
        route_params_base& p,
        system::error_code const& ec,
        std::exception_ptr ep);

    static invocation& current(
        route_params_base& p);
};

} // detail
} // routekit

#endif
