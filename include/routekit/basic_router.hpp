//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_BASIC_ROUTER_HPP
#define ROUTEKIT_BASIC_ROUTER_HPP

#include <routekit/detail/config.hpp>
#include <routekit/detail/router_base.hpp>
#include <routekit/output.hpp>
#include <routekit/route_params.hpp>
#include <boost/system/error_code.hpp>
#include <boost/url/url_view.hpp>
#include <concepts>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace routekit {

/** Configuration options for routers.
*/
struct router_options
{
    /** Constructor.

        Default options select case-sensitive matching.
    */
    router_options() = default;

    /** Set whether pattern matching is case-sensitive.

        Routers created with @ref basic_router::group
        inherit the setting of their parent.

        @par Example
        @code
        router r( router_options()
            .case_sensitive( false ) );
        @endcode

        @param value `true` to perform case-sensitive path matching.

        @return A reference to `*this` for chaining.
    */
    router_options&
    case_sensitive(
        bool value) noexcept
    {
        case_sensitive_ = value;
        return *this;
    }

private:
    template<class> friend class basic_router;
    bool case_sensitive_ = true;
};

//------------------------------------------------

/** A container for request handlers, routes and nested routers

    Children are tried in registration order and the
    first one which matches is entered. A router runs
    its own handlers before trying its children, and
    each matching level consumes its prefix of the path.

    Handlers are invoked with a reference to `P` and
    return one of:

    @li `void`: no output
    @li `system::error_code`: a failure if set,
        otherwise no output
    @li @ref handler_result: a failure or a value
    @li any type from which @ref output_value is
        constructible, written to the response

    A handler passes control on by calling
    @ref route_params_base::next or
    @ref route_params_base::next_route. Returning
    without calling either ends the dispatch.

    When a handler fails, or exits with an exception,
    the error becomes pending and the remaining
    handlers of its route or router level are
    skipped. While an error is pending only routes
    added with @ref error run.

    @par Example
    @code
    router r;
    r.use( []( route_params_base& p )
        {
            log_request( p );
            p.next();
        } );
    r.group( "/api", []( router& api )
    {
        api.get( "/users/<id:\\d+>$",
            []( route_params_base& p )
            {
                return std::string( p.param( "id" ) );
            } );
    } );
    @endcode

    @par Thread Safety
    Registration is not thread-safe. Once all routes
    are added, `dispatch` may be called concurrently
    with distinct params objects.

    @tparam P The type of the parameters object passed to handlers.
*/
template<class P>
class basic_router : public detail::router_base
{
    static_assert(std::derived_from<P, route_params_base>);

    template<class T>
    static inline constexpr bool handler_valid =
        []() -> bool
        {
            using H = std::decay_t<T> const&;
            if constexpr(! std::is_invocable_v<H, P&>)
            {
                return false;
            }
            else
            {
                using R = std::invoke_result_t<H, P&>;
                return
                    std::is_void_v<R> ||
                    std::is_same_v<R, system::error_code> ||
                    std::is_same_v<R, handler_result> ||
                    std::is_constructible_v<output_value, R>;
            }
        }();

    template<class... Ts>
    static inline constexpr bool handler_crvals =
        ((!std::is_lvalue_reference_v<Ts> ||
        std::is_const_v<std::remove_reference_t<Ts>> ||
        std::is_function_v<std::remove_reference_t<Ts>>) && ...);

    template<class... Ts>
    static inline constexpr bool handler_check =
        (handler_valid<Ts> && ...);

    template<class H>
    struct handler_impl : detail::route_handler
    {
        std::decay_t<H> h;

        template<class H_>
        explicit handler_impl(H_&& h_)
            : h(std::forward<H_>(h_))
        {
        }

        handler_result
        invoke(route_params_base& rp) const override
        {
            using R = std::invoke_result_t<
                std::decay_t<H> const&, P&>;
            auto& p = static_cast<P&>(rp);
            if constexpr(std::is_void_v<R>)
            {
                std::invoke(h, p);
                return output_value();
            }
            else if constexpr(std::is_same_v<
                R, system::error_code>)
            {
                system::error_code ec = std::invoke(h, p);
                if(ec.failed())
                    return handler_result(
                        system::in_place_error, ec);
                return output_value();
            }
            else if constexpr(std::is_same_v<
                R, handler_result>)
            {
                return std::invoke(h, p);
            }
            else
            {
                return output_value(std::invoke(h, p));
            }
        }
    };

    template<class... HN>
    static detail::handler_list
    make_handlers(HN&&... hn)
    {
        detail::handler_list v;
        v.reserve(sizeof...(HN));
        (v.push_back(std::make_unique<handler_impl<HN>>(
            std::forward<HN>(hn))), ...);
        return v;
    }

    // a view of a group owned by the parent
    explicit
    basic_router(detail::route_node& n) noexcept
        : router_base(n)
    {
    }

public:
    /** The type of params used in handlers.
    */
    using params_type = P;

    /** A handle to a route added to this router.

        The handle is returned by the functions which
        add routes, and allows more handlers to be
        appended to the same route:
        @code
        r.get( "/users/<id>", load_user )
            .all( check_owner )
            .all( show_user );
        @endcode
    */
    class fluent_route;

    basic_router(basic_router const&) = delete;
    basic_router& operator=(basic_router const&) = delete;

    basic_router(basic_router&&) noexcept = default;
    basic_router& operator=(basic_router&&) noexcept = default;

    /** Constructor.

        Creates an empty router with the specified configuration.

        @param options The configuration options to use.
    */
    explicit
    basic_router(
        router_options options = {})
        : router_base(options.case_sensitive_)
    {
    }

    /** Add a nested router under a path prefix.

        A child router bound to `prefix` is appended to
        the children of this router, and `configure` is
        called with it before returning. The handlers
        `hn...` run for every request entering the child,
        before any of its own children are tried.

        @par Example
        @code
        r.group( "/admin",
            []( router& admin )
            {
                admin.get( "/stats$", show_stats );
            },
            require_login );
        @endcode

        @throw std::length_error The nesting exceeds
        @ref max_depth.

        @throw system::system_error `prefix` is malformed.

        @param prefix The pattern the child consumes.

        @param configure A function invoked with a
        reference to the child router.

        @param hn Handlers of the child router.
    */
    template<class F, class... HN>
    void group(
        std::string_view prefix,
        F&& configure,
        HN&&... hn)
    {
        static_assert(std::is_invocable_v<F, basic_router&>,
            "configure must accept basic_router&");
        static_assert(handler_crvals<HN...>,
            "pass handlers by value or std::move()");
        static_assert(handler_check<HN...>,
            "invalid handler signature");
        auto& n = add_group(prefix, make_handlers(
            std::forward<HN>(hn)...));
        basic_router child(n);
        std::invoke(std::forward<F>(configure), child);
    }

    /** Add a route.

        @par Example
        @code
        r.to( "GET,HEAD /files/<name:.+>", send_file );
        @endcode

        @throw system::system_error `spec` is malformed.

        @param spec The route specification, an optional
        comma separated method list followed by a single
        space, then the path pattern.

        @param h1 The first handler to add.

        @param hn Additional handlers to add, invoked after @p h1 in
        registration order.

        @return A handle to the new route.
    */
    template<class H1, class... HN>
    fluent_route to(
        std::string_view spec,
        H1&& h1, HN&&... hn)
    {
        static_assert(handler_crvals<H1, HN...>,
            "pass handlers by value or std::move()");
        static_assert(handler_check<H1, HN...>,
            "invalid handler signature");
        return fluent_route(add_route(spec, make_handlers(
            std::forward<H1>(h1), std::forward<HN>(hn)...)));
    }

    /** Add a route for GET requests.
    */
    template<class H1, class... HN>
    fluent_route get(std::string_view pattern, H1&& h1, HN&&... hn)
    {
        return to(with_method("GET", pattern),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for POST requests.
    */
    template<class H1, class... HN>
    fluent_route post(std::string_view pattern, H1&& h1, HN&&... hn)
    {
        return to(with_method("POST", pattern),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for PUT requests.
    */
    template<class H1, class... HN>
    fluent_route put(std::string_view pattern, H1&& h1, HN&&... hn)
    {
        return to(with_method("PUT", pattern),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for PATCH requests.
    */
    template<class H1, class... HN>
    fluent_route patch(std::string_view pattern, H1&& h1, HN&&... hn)
    {
        return to(with_method("PATCH", pattern),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for DELETE requests.
    */
    template<class H1, class... HN>
    fluent_route del(std::string_view pattern, H1&& h1, HN&&... hn)
    {
        return to(with_method("DELETE", pattern),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for HEAD requests.
    */
    template<class H1, class... HN>
    fluent_route head(std::string_view pattern, H1&& h1, HN&&... hn)
    {
        return to(with_method("HEAD", pattern),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add a route for OPTIONS requests.
    */
    template<class H1, class... HN>
    fluent_route options(std::string_view pattern, H1&& h1, HN&&... hn)
    {
        return to(with_method("OPTIONS", pattern),
            std::forward<H1>(h1), std::forward<HN>(hn)...);
    }

    /** Add middleware handlers.

        The handlers run for every request reaching this
        router while no error is pending, at their
        position in registration order. A middleware
        handler calls @ref route_params_base::next to
        let later handlers and routes run.

        @param h1 The first handler to add.

        @param hn Additional handlers to add, invoked after @p h1 in
        registration order.
    */
    template<class H1, class... HN>
    fluent_route use(H1&& h1, HN&&... hn)
    {
        static_assert(handler_crvals<H1, HN...>,
            "pass handlers by value or std::move()");
        static_assert(handler_check<H1, HN...>,
            "invalid handler signature");
        return fluent_route(add_middleware(make_handlers(
            std::forward<H1>(h1), std::forward<HN>(hn)...),
            false));
    }

    /** Add error handlers.

        The handlers run only while an error is pending.
        A handler which calls @ref route_params_base::clear_error
        and then @ref route_params_base::next returns the
        dispatch to normal routing.

        @par Example
        @code
        r.error(
            []( route_params_base& p )
            {
                p.clear_error();
                return std::string( "something went wrong" );
            } );
        @endcode

        @param h1 The first handler to add.

        @param hn Additional handlers to add, invoked after @p h1 in
        registration order.
    */
    template<class H1, class... HN>
    fluent_route error(H1&& h1, HN&&... hn)
    {
        static_assert(handler_crvals<H1, HN...>,
            "pass handlers by value or std::move()");
        static_assert(handler_check<H1, HN...>,
            "invalid handler signature");
        return fluent_route(add_middleware(make_handlers(
            std::forward<H1>(h1), std::forward<HN>(hn)...),
            true));
    }

    /** Dispatch a request.

        The params object is reset, then handlers run
        until the chain is exhausted or a handler
        returns without passing control on.

        @return The error pending when the dispatch
        ended, or an empty error code.
    */
    system::error_code
    dispatch(
        std::string_view verb,
        std::string_view path,
        P& p,
        response_sink& res) const
    {
        return dispatch_impl(verb, path, p, res);
    }

    /** Dispatch a request given a parsed target.

        The path of `url` is percent-decoded before
        matching, except that escaped slashes stay
        escaped.

        @return The error pending when the dispatch
        ended, or an empty error code.
    */
    system::error_code
    serve(
        std::string_view verb,
        urls::url_view const& url,
        P& p,
        response_sink& res) const
    {
        return serve_impl(verb, url, p, res);
    }

private:
    static
    std::string
    with_method(
        std::string_view verb,
        std::string_view pattern)
    {
        std::string s;
        s.reserve(verb.size() + 1 + pattern.size());
        s.append(verb);
        s.push_back(' ');
        s.append(pattern);
        return s;
    }
};

//------------------------------------------------

template<class P>
class basic_router<P>::
    fluent_route
{
public:
    fluent_route(fluent_route const&) = default;

    /** Append handlers to the route.

        The handlers run after those already on the
        route, in registration order, and follow the
        same rules as the handlers passed when the
        route was added.

        @param h1 The first handler to add.

        @param hn Additional handlers to add, invoked after @p h1 in
        registration order.

        @return A handle to the same route, for chaining.
    */
    template<class H1, class... HN>
    auto all(
        H1&& h1, HN&&... hn) ->
            fluent_route
    {
        static_assert(handler_crvals<H1, HN...>,
            "pass handlers by value or std::move()");
        static_assert(handler_check<H1, HN...>,
            "invalid handler signature");
        append_handlers(*node_, make_handlers(
            std::forward<H1>(h1), std::forward<HN>(hn)...));
        return *this;
    }

    /** Return the compiled pattern of the route
    */
    route_pattern const&
    pattern() const noexcept
    {
        return node_pattern(*node_);
    }

    /** Return the number of handlers on the route
    */
    std::size_t
    size() const noexcept
    {
        return handler_count(*node_);
    }

private:
    friend class basic_router;

    explicit
    fluent_route(
        detail::route_node& n) noexcept
        : node_(&n)
    {
    }

    detail::route_node* node_;
};

} // routekit

#endif
