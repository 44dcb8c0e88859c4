//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/route_rule.hpp"
#include <routekit/route_pattern.hpp>
#include <routekit/error.hpp>
#include <boost/regex.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <algorithm>

namespace routekit {

/*

spec                    methods     pattern         matcher
------------------------------------------------------------------
/users                  *           /users          prefix
GET /users              GET         /users          prefix
GET,POST /users         GET,POST    /users          prefix
/users/<id>             *           /users/<id>     ^/users/(?<id>[^/]+)
/users/<id:\d+>         *           /users/<id..>   ^/users/(?<id>\d+)
.*                      *           .*              ^.*
/a b                    *           /a b            prefix
get /x                  get         /x              prefix
GET, /x                 invalid

*/

system::result<route_pattern>
parse_route_pattern(
    std::string_view spec,
    bool case_sensitive)
{
    route_pattern rv;
    rv.icase_ = ! case_sensitive;

    // a method list ends at the first space,
    // which must come before the path begins
    auto const sp = spec.find(' ');
    if( sp != std::string_view::npos &&
        sp < spec.find_first_of("/<"))
    {
        auto r = grammar::parse(
            spec.substr(0, sp),
            detail::method_list_rule);
        if(r.has_error())
            ROUTEKIT_RETURN_EC(
                error::invalid_method);
        for(auto verb : *r)
            rv.methods_.insert(verb);
        spec.remove_prefix(sp + 1);
    }
    rv.pattern_ = spec;

    std::string expr;
    expr.reserve(rv.pattern_.size() + 16);
    bool literal = true;
    char const* it = rv.pattern_.data();
    char const* const end = it + rv.pattern_.size();
    while(it != end)
    {
        if(*it == '<')
        {
            auto tok = grammar::parse(
                it, end, detail::param_token_rule);
            if(tok.has_error())
                ROUTEKIT_RETURN_EC(
                    error::invalid_pattern);
            std::string name(tok->name);
            if(std::find(
                rv.names_.begin(),
                rv.names_.end(),
                name) != rv.names_.end())
                ROUTEKIT_RETURN_EC(
                    error::duplicate_param);
            expr.append("(?<");
            expr.append(name);
            expr.push_back('>');
            if(tok->regex.empty())
                expr.append("[^/]+");
            else
                expr.append(tok->regex);
            expr.push_back(')');
            rv.names_.push_back(std::move(name));
            literal = false;
            continue;
        }
        if(*it == '\\')
        {
            // an escaped '<' is not a token
            literal = false;
            expr.push_back(*it++);
            if(it == end)
                break;
            expr.push_back(*it++);
            continue;
        }
        if(detail::is_regex_meta(*it))
            literal = false;
        expr.push_back(*it++);
    }
    if(literal)
        return rv;

    // '^' and '$' anchor to the whole path,
    // never to an embedded newline
    auto flags = boost::regex::perl | boost::regex::no_mod_m;
    if(rv.icase_)
        flags |= boost::regex::icase;
    try
    {
        rv.re_ = std::make_shared<
            boost::regex const>(expr, flags);
    }
    catch(boost::regex_error const&)
    {
        ROUTEKIT_RETURN_EC(
            error::invalid_regex);
    }
    return rv;
}

//------------------------------------------------

route_pattern::
route_pattern(
    std::string_view spec,
    bool case_sensitive)
    : route_pattern(parse_route_pattern(
        spec, case_sensitive).value())
{
}

path_match
route_pattern::
match(
    std::string_view verb,
    std::string_view path) const
{
    if( ! methods_.empty() &&
        ! methods_.contains(verb))
    {
        path_match mr;
        mr.rest = path;
        return mr;
    }
    return match_path(path);
}

path_match
route_pattern::
match_path(
    std::string_view path) const
{
    path_match mr;
    mr.rest = path;
    if(! re_)
    {
        if(pattern_.size() > path.size())
            return mr;
        auto const head =
            path.substr(0, pattern_.size());
        if(icase_)
        {
            if(! grammar::ci_is_equal(head, pattern_))
                return mr;
        }
        else if(head != pattern_)
        {
            return mr;
        }
        mr.matched = true;
        mr.rest = path.substr(pattern_.size());
        return mr;
    }

    boost::cmatch m;
    if(! boost::regex_search(
            path.data(),
            path.data() + path.size(),
            m, *re_,
            boost::match_continuous))
        return mr;
    mr.matched = true;
    mr.rest = path.substr(
        static_cast<std::size_t>(m.length(0)));
    for(auto const& name : names_)
    {
        auto const& sub = m[name];
        if(sub.matched)
            mr.params.emplace(name, sub.str());
        else
            mr.params.emplace(name, std::string());
    }
    return mr;
}

} // routekit
