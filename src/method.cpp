//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <routekit/method.hpp>
#include <algorithm>

namespace routekit {

method
string_to_method(
    std::string_view s) noexcept
{
    if(s.empty())
        return method::unknown;
    switch(s[0])
    {
    case 'C':
        if(s == "CONNECT")
            return method::connect;
        break;
    case 'D':
        if(s == "DELETE")
            return method::delete_;
        break;
    case 'G':
        if(s == "GET")
            return method::get;
        break;
    case 'H':
        if(s == "HEAD")
            return method::head;
        break;
    case 'O':
        if(s == "OPTIONS")
            return method::options;
        break;
    case 'P':
        if(s == "POST")
            return method::post;
        if(s == "PUT")
            return method::put;
        if(s == "PATCH")
            return method::patch;
        break;
    case 'T':
        if(s == "TRACE")
            return method::trace;
        break;
    default:
        break;
    }
    return method::unknown;
}

std::string_view
to_string(method m) noexcept
{
    switch(m)
    {
    case method::delete_:   return "DELETE";
    case method::get:       return "GET";
    case method::head:      return "HEAD";
    case method::post:      return "POST";
    case method::put:       return "PUT";
    case method::connect:   return "CONNECT";
    case method::options:   return "OPTIONS";
    case method::trace:     return "TRACE";
    case method::patch:     return "PATCH";
    default:
        break;
    }
    return "<unknown>";
}

//------------------------------------------------

void
method_set::
insert(std::string_view verb)
{
    auto const m = string_to_method(verb);
    if(m != method::unknown)
    {
        known_ |= 1u << static_cast<unsigned>(m);
        return;
    }
    if(! contains(verb))
        custom_.emplace_back(verb);
}

bool
method_set::
contains(std::string_view verb) const noexcept
{
    auto const m = string_to_method(verb);
    if(m != method::unknown)
        return (known_ & (1u << static_cast<unsigned>(m))) != 0;
    return std::find(
        custom_.begin(), custom_.end(), verb) != custom_.end();
}

} // routekit
