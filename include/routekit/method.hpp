//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_METHOD_HPP
#define ROUTEKIT_METHOD_HPP

#include <routekit/detail/config.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace routekit {

/** Well-known request methods

    Methods which do not appear here are still
    accepted by the router; they are compared
    as case-sensitive strings instead.
*/
enum class method : char
{
    unknown = 0,
    delete_,
    get,
    head,
    post,
    put,
    connect,
    options,
    trace,
    patch
};

/** Return the method for a string, or `method::unknown`

    The comparison is case-sensitive.
*/
ROUTEKIT_DECL
method
string_to_method(
    std::string_view s) noexcept;

/** Return the string for a method
*/
ROUTEKIT_DECL
std::string_view
to_string(method m) noexcept;

//------------------------------------------------

/** A set of request methods

    An empty set matches every method.
*/
class method_set
{
public:
    method_set() = default;

    /** Return true if the set holds no methods
    */
    bool
    empty() const noexcept
    {
        return known_ == 0 && custom_.empty();
    }

    /** Add a method to the set
    */
    ROUTEKIT_DECL
    void
    insert(std::string_view verb);

    /** Return true if `verb` is in the set

        An empty set contains nothing; callers
        treat emptiness as "any method".
    */
    ROUTEKIT_DECL
    bool
    contains(std::string_view verb) const noexcept;

private:
    std::uint32_t known_ = 0;
    std::vector<std::string> custom_;
};

} // routekit

#endif
