//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/pct_decode.hpp"
#include <boost/url/decode_view.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <string_view>

namespace routekit {
namespace detail {

namespace {

// offset of the first escaped '/' or '\'
std::size_t
find_escaped_separator(
    std::string_view s) noexcept
{
    // every '%' starts a valid escape
    for(auto i = s.find('%');
        i != std::string_view::npos;
        i = s.find('%', i + 3))
    {
        auto const esc = s.substr(i, 3);
        if( grammar::ci_is_equal(esc, std::string_view("%2f")) ||
            grammar::ci_is_equal(esc, std::string_view("%5c")))
            return i;
    }
    return std::string_view::npos;
}

} // (anon)

std::string
pct_decode_path(
    urls::pct_string_view s)
{
    std::string result;
    result.reserve(s.decoded_size());
    std::string_view rest(s.data(), s.size());
    for(;;)
    {
        auto const pos = find_escaped_separator(rest);

        // a prefix of a valid encoding cut before
        // a '%' is itself a valid encoding
        urls::pct_string_view const part(
            rest.substr(0, pos));
        urls::decode_view const dv = *part;
        result.append(dv.begin(), dv.end());
        if(pos == std::string_view::npos)
            break;
        result.append(rest.substr(pos, 3));
        rest.remove_prefix(pos + 3);
    }
    return result;
}

} // detail
} // routekit
