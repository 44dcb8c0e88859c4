//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_OUTPUT_HPP
#define ROUTEKIT_OUTPUT_HPP

#include <routekit/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace routekit {

/** The value produced by a route handler

    A handler produces at most one value. The
    alternatives form a closed set:

    @li `std::monostate`: no output
    @li `std::vector<unsigned char>`: raw bytes
    @li `std::string`: text
    @li `bool`, `std::int64_t`, `double`: scalars,
        formatted as text when written
*/
using output_value = std::variant<
    std::monostate,
    std::vector<unsigned char>,
    std::string,
    bool,
    std::int64_t,
    double>;

/** The result of invoking a route handler

    A failing result becomes the pending error
    of the request.
*/
using handler_result = system::result<output_value>;

//------------------------------------------------

/** Optional capability of a response sink

    When the sink provides a data writer, handler
    output is handed to it unchanged instead of
    being written as bytes.
*/
class ROUTEKIT_SYMBOL_VISIBLE
    data_writer
{
public:
    virtual system::error_code write_data(
        output_value const& v) = 0;

protected:
    ~data_writer() = default;
};

/** The destination for handler output
*/
class ROUTEKIT_SYMBOL_VISIBLE
    response_sink
{
public:
    virtual ~response_sink() = default;

    /** Write bytes to the response
    */
    virtual system::error_code write(
        std::string_view data) = 0;

    /** Return the typed writer, or `nullptr`
    */
    virtual data_writer* get_data_writer() noexcept
    {
        return nullptr;
    }
};

/** Write a handler's output to a sink

    The precedence is fixed:

    @li If the value is empty, nothing happens.
    @li If the sink has a @ref data_writer, the
        value is passed to it.
    @li Bytes and text are written verbatim.
    @li Scalars are formatted and written as text.

    @return The error reported by the sink, if any.
*/
ROUTEKIT_DECL
system::error_code
write_output(
    response_sink& sink,
    output_value const& v);

} // routekit

#endif
