//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_DETAIL_CONFIG_HPP
#define EMROUTE_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

//------------------------------------------------

# if (defined(EMROUTE_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(EMROUTE_STATIC_LINK)
#  if defined(EMROUTE_SOURCE)
#   define EMROUTE_DECL        BOOST_SYMBOL_EXPORT
#   define EMROUTE_BUILD_DLL
#  else
#   define EMROUTE_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  EMROUTE_DECL
#  define EMROUTE_DECL
# endif

#if defined(__MINGW32__)
    #define EMROUTE_SYMBOL_VISIBLE EMROUTE_DECL
#else
    #define EMROUTE_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef EMROUTE_NO_SOURCE_LOCATION
# define EMROUTE_ERR(ev) (::boost::system::error_code(ev))
# define EMROUTE_RETURN_EC(ev) return (ev)
#else
# define EMROUTE_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
# define EMROUTE_RETURN_EC(ev)                                           \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

//-----------------------------------------------

// lift the boost libraries we build on into our namespace
namespace boost {
namespace core {}
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace emroute {
namespace core = ::boost::core;
namespace system = ::boost::system;
namespace urls = ::boost::urls;
namespace grammar = ::boost::urls::grammar;
} // emroute

#endif
