//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_DETAIL_CONFIG_HPP
#define PATHMATCH_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace pathmatch {

//------------------------------------------------

# if (defined(PATHMATCH_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(PATHMATCH_STATIC_LINK)
#  if defined(PATHMATCH_SOURCE)
#   define PATHMATCH_DECL        BOOST_SYMBOL_EXPORT
#   define PATHMATCH_BUILD_DLL
#  else
#   define PATHMATCH_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  PATHMATCH_DECL
#  define PATHMATCH_DECL
# endif

#if defined(__MINGW32__)
    #define PATHMATCH_SYMBOL_VISIBLE PATHMATCH_DECL
#else
    #define PATHMATCH_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//------------------------------------------------

/** The path separator and required first character
    of every pattern and every path.
*/
constexpr char path_separator = '/';

} // pathmatch

// lift the boost namespaces we use into ours
namespace boost {
namespace core {}
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace pathmatch {
namespace grammar = ::boost::urls::grammar;
namespace system = ::boost::system;
namespace core = ::boost::core;
} // pathmatch

#endif
