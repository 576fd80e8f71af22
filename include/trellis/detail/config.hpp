//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_DETAIL_CONFIG_HPP
#define TRELLIS_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace trellis {

//------------------------------------------------

# if (defined(TRELLIS_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(TRELLIS_STATIC_LINK)
#  if defined(TRELLIS_SOURCE)
#   define TRELLIS_DECL        BOOST_SYMBOL_EXPORT
#   define TRELLIS_BUILD_DLL
#  else
#   define TRELLIS_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  TRELLIS_DECL
#  define TRELLIS_DECL
# endif

#if defined(__MINGW32__)
    #define TRELLIS_SYMBOL_VISIBLE TRELLIS_DECL
#else
    #define TRELLIS_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef TRELLIS_NO_SOURCE_LOCATION
# define TRELLIS_ERR(ev) (::boost::system::error_code(ev))
# define TRELLIS_RETURN_EC(ev) return (ev)
#else
# define TRELLIS_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
# define TRELLIS_RETURN_EC(ev)                                           \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // trellis

// lift system and grammar into our namespace
namespace boost {
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace trellis {
namespace system = ::boost::system;
namespace grammar = ::boost::urls::grammar;
} // trellis

#endif
