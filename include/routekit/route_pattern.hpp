//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_ROUTE_PATTERN_HPP
#define ROUTEKIT_ROUTE_PATTERN_HPP

#include <routekit/detail/config.hpp>
#include <routekit/method.hpp>
#include <boost/regex_fwd.hpp>
#include <boost/system/result.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace routekit {

/** Parameter values captured from a request path

    Keys are the token names of the matching patterns.
*/
using params_map = std::map<
    std::string, std::string, std::less<>>;

/** The outcome of matching a path against a pattern
*/
struct path_match
{
    /** True if the pattern accepted the path
    */
    bool matched = false;

    /** The unconsumed part of the path

        On rejection this is the path which was
        passed in.
    */
    std::string_view rest;

    /** Parameters captured by the pattern
    */
    params_map params;
};

class route_pattern;

/** Compile a route specification

    The specification has this form:
    @code
    [ METHOD *( "," METHOD ) SP ] path-pattern
    @endcode

    The path pattern is text interleaved with tokens
    of the form `<name>` or `<name:regex>`. Text outside
    tokens is a regular expression fragment. A token
    without a regex matches `[^/]+`. Patterns with no
    tokens and no regex metacharacters are matched by
    plain prefix comparison.

    @par Example
    @code
    auto rv = parse_route_pattern( "GET,HEAD /users/<id:\\d+>" );
    @endcode

    @param spec The specification string.

    @param case_sensitive `false` to fold ASCII case
    when matching.

    @return The compiled pattern, or an error from
    @ref error describing the defect.
*/
ROUTEKIT_DECL
system::result<route_pattern>
parse_route_pattern(
    std::string_view spec,
    bool case_sensitive = true);

//------------------------------------------------

/** A compiled method list and path matcher

    Objects of this type are immutable once compiled
    and may be used concurrently.
*/
class route_pattern
{
public:
    /** Constructor

        A default constructed pattern accepts every
        method and every path, consuming nothing.
    */
    route_pattern() = default;

    /** Constructor

        @throw system::system_error The specification
        is malformed.

        @see @ref parse_route_pattern
    */
    ROUTEKIT_DECL
    explicit
    route_pattern(
        std::string_view spec,
        bool case_sensitive = true);

    /** Return the accepted methods, empty for all
    */
    method_set const&
    methods() const noexcept
    {
        return methods_;
    }

    /** Return the path pattern without the method list
    */
    std::string_view
    pattern() const noexcept
    {
        return pattern_;
    }

    /** Return true if matching uses prefix comparison
    */
    bool
    is_literal() const noexcept
    {
        return re_ == nullptr;
    }

    /** Return the token names in order of appearance
    */
    std::vector<std::string> const&
    param_names() const noexcept
    {
        return names_;
    }

    /** Match a method and a path

        A non-empty method set which does not contain
        `verb` rejects without looking at the path.
    */
    ROUTEKIT_DECL
    path_match
    match(
        std::string_view verb,
        std::string_view path) const;

    /** Match the beginning of a path
    */
    ROUTEKIT_DECL
    path_match
    match_path(
        std::string_view path) const;

private:
    friend ROUTEKIT_DECL
    system::result<route_pattern>
    parse_route_pattern(std::string_view, bool);

    method_set methods_;
    std::string pattern_;
    std::vector<std::string> names_;
    std::shared_ptr<boost::regex const> re_;
    bool icase_ = false;
};

} // routekit

#endif
