//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_SRC_DETAIL_PCT_DECODE_HPP
#define ROUTEKIT_SRC_DETAIL_PCT_DECODE_HPP

#include <routekit/detail/config.hpp>
#include <boost/url/pct_string_view.hpp>
#include <string>

namespace routekit {
namespace detail {

// Decode a request path for matching.
// Escaped separators "%2F" and "%5C" are kept
// as they are so they never split a segment.
std::string
pct_decode_path(
    urls::pct_string_view s);

} // detail
} // routekit

#endif
