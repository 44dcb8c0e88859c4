//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_IMPL_ERROR_HPP
#define ROUTEKIT_IMPL_ERROR_HPP

#include <boost/system/error_category.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <string>
#include <system_error>
#include <type_traits>

namespace boost {
namespace system {

template<>
struct is_error_code_enum<
    ::routekit::error>
{
    static bool const value = true;
};

} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::routekit::error>
    : std::true_type {};
} // std

namespace routekit {

namespace detail {

struct ROUTEKIT_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    ROUTEKIT_DECL const char* name(
        ) const noexcept override;
    ROUTEKIT_DECL std::string message(
        int) const override;
    ROUTEKIT_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x7b1f3c29e5d8a640)
    {
    }
};

ROUTEKIT_DECL extern
    error_cat_type error_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

} // routekit

#endif
