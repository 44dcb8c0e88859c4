//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_SRC_DETAIL_ROUTE_RULE_HPP
#define ROUTEKIT_SRC_DETAIL_ROUTE_RULE_HPP

#include <routekit/detail/config.hpp>
#include <boost/url/grammar/alpha_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>
#include <boost/system/result.hpp>
#include <string_view>
#include <type_traits>
#include <vector>

namespace routekit {
namespace detail {

/*
route-spec      = [ method-list SP ] path-pattern
method-list     = method *( "," method )
method          = 1*tchar
path-pattern    = *( text / param-token )
param-token     = "<" param-name [ ":" param-regex ] ">"
param-name      = ALPHA *( ALPHA / DIGIT / "_" )
param-regex     = 1*( regex-char )  ; "<" ">" pairs nest, "\" escapes
*/

//------------------------------------------------

/** Rule for parsing a non-empty token of chars

    @par Requires
    @code
    std::is_empty<CharSet>::value == true
    @endcode
*/
template<class CharSet>
struct token_rule
{
    using value_type = std::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        static_assert(std::is_empty<CharSet>::value, "");
        if(it == end)
            return grammar::error::syntax;
        auto it1 = grammar::find_if_not(it, end, CharSet{});
        if(it1 == it)
            return grammar::error::mismatch;
        auto s = std::string_view(it, it1 - it);
        it = it1;
        return s;
    }
};

//------------------------------------------------

// RFC 9110 tchar
struct tchar
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        switch(ch)
        {
        case '!': case '#': case '$': case '%':
        case '&': case '\'': case '*': case '+':
        case '-': case '.': case '^': case '_':
        case '`': case '|': case '~':
            return true;
        default:
            break;
        }
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= '0' && ch <= '9') ||
            (ch >= 'A' && ch <= 'Z');
    }
};

struct ident_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= '0' && ch <= '9') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch == '_');
    }
};

constexpr token_rule<tchar> method_rule{};

constexpr struct
{
    using value_type = std::vector<std::string_view>;

    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>
    {
        value_type v;
        for(;;)
        {
            auto rv = grammar::parse(
                it, end, method_rule);
            if(rv.has_error())
                return rv.error();
            v.push_back(*rv);
            if(it == end)
                break;
            if(*it != ',')
                ROUTEKIT_RETURN_EC(
                    grammar::error::mismatch);
            ++it;
        }
        return v;
    }
} method_list_rule{};

constexpr struct
{
    using value_type = std::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end)
            ROUTEKIT_RETURN_EC(
                grammar::error::syntax);
        if(! grammar::alpha_chars(*it))
            ROUTEKIT_RETURN_EC(
                grammar::error::syntax);
        auto it0 = it++;
        it = grammar::find_if_not(
            it, end, ident_char{});
        return std::string_view(it0, it - it0);
    }
} param_name_rule{};

//------------------------------------------------

/** A parameter token in a path pattern
*/
struct param_token
{
    std::string_view name;

    // empty for the default
    std::string_view regex;
};

constexpr struct
{
    using value_type = param_token;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end || *it != '<')
            ROUTEKIT_RETURN_EC(
                grammar::error::mismatch);
        ++it;
        value_type v;
        {
            auto rv = grammar::parse(
                it, end, param_name_rule);
            if(rv.has_error())
                return rv.error();
            v.name = *rv;
        }
        if(it == end)
            ROUTEKIT_RETURN_EC(
                grammar::error::syntax);
        if(*it == '>')
        {
            ++it;
            return v;
        }
        if(*it != ':')
            ROUTEKIT_RETURN_EC(
                grammar::error::syntax);
        ++it;
        auto const it0 = it;
        std::size_t depth = 0;
        while(it != end)
        {
            char const c = *it;
            if(c == '\\')
            {
                if(++it == end)
                    break;
                ++it;
                continue;
            }
            if(c == '<')
            {
                ++depth;
            }
            else if(c == '>')
            {
                if(depth == 0)
                    break;
                --depth;
            }
            ++it;
        }
        // unterminated
        if(it == end)
            ROUTEKIT_RETURN_EC(
                grammar::error::syntax);
        // empty regex
        if(it == it0)
            ROUTEKIT_RETURN_EC(
                grammar::error::syntax);
        v.regex = std::string_view(it0, it - it0);
        ++it;
        return v;
    }
} param_token_rule{};

// true for characters with a meaning in a regex
inline
bool
is_regex_meta(char c) noexcept
{
    switch(c)
    {
    case '\\': case '^': case '$': case '.':
    case '|': case '?': case '*': case '+':
    case '(': case ')': case '[': case ']':
    case '{': case '}':
        return true;
    default:
        break;
    }
    return false;
}

} // detail
} // routekit

#endif
