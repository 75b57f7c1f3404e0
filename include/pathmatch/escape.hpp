//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_ESCAPE_HPP
#define PATHMATCH_ESCAPE_HPP

#include <pathmatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>

namespace pathmatch {

/** Escape text for use as a literal pattern segment.

    Precedes each character which has special meaning
    in a pattern with a backslash:

    @li `\` becomes `\\`
    @li `{` becomes `\{`
    @li `}` becomes `\}`
    @li `*` becomes `\*`

    The compiler removes the backslashes again, so the
    resulting segment matches exactly the original text.
    The '/' separator is not escaped.

    @par Example
    @code
    std::string s = escape( "user{id}" );
    // s == "user\\{id\\}"
    @endcode

    @param s The string to escape.

    @return A new string with special characters escaped.
*/
PATHMATCH_DECL
std::string
escape(core::string_view s);

} // pathmatch

#endif
