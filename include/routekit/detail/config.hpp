//
// Copyright (c) 2025 The routekit authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef ROUTEKIT_DETAIL_CONFIG_HPP
#define ROUTEKIT_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <boost/assert/source_location.hpp>

namespace routekit {

//------------------------------------------------

# if (defined(ROUTEKIT_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(ROUTEKIT_STATIC_LINK)
#  if defined(ROUTEKIT_SOURCE)
#   define ROUTEKIT_DECL        BOOST_SYMBOL_EXPORT
#   define ROUTEKIT_BUILD_DLL
#  else
#   define ROUTEKIT_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  ROUTEKIT_DECL
#  define ROUTEKIT_DECL
# endif

#if defined(__MINGW32__)
    #define ROUTEKIT_SYMBOL_VISIBLE ROUTEKIT_DECL
#else
    #define ROUTEKIT_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef ROUTEKIT_NO_SOURCE_LOCATION
# define ROUTEKIT_ERR(ev) (::boost::system::error_code(ev))
# define ROUTEKIT_RETURN_EC(ev) return (ev)
#else
# define ROUTEKIT_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
# define ROUTEKIT_RETURN_EC(ev)                                          \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // routekit

// lift the libraries we use into our namespace
namespace boost {
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace routekit {
namespace system = ::boost::system;
namespace urls = ::boost::urls;
namespace grammar = ::boost::urls::grammar;
} // routekit

#endif
