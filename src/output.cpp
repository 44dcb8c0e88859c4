//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <routekit/output.hpp>
#include <fmt/format.h>
#include <type_traits>

namespace routekit {

system::error_code
write_output(
    response_sink& sink,
    output_value const& v)
{
    if(std::holds_alternative<std::monostate>(v))
        return {};

    if(auto* dw = sink.get_data_writer())
        return dw->write_data(v);

    return std::visit(
        [&sink](auto const& x) -> system::error_code
        {
            using T = std::decay_t<decltype(x)>;
            if constexpr(std::is_same_v<T, std::monostate>)
            {
                return {};
            }
            else if constexpr(std::is_same_v<
                T, std::vector<unsigned char>>)
            {
                return sink.write(std::string_view(
                    reinterpret_cast<char const*>(x.data()),
                    x.size()));
            }
            else if constexpr(std::is_same_v<T, std::string>)
            {
                return sink.write(x);
            }
            else
            {
                return sink.write(fmt::to_string(x));
            }
        }, v);
}

} // routekit
