//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/escape.hpp>

namespace pathmatch {

std::string
escape( core::string_view s )
{
    std::string result;
    result.reserve( s.size() );

    for( char c : s )
    {
        switch( c )
        {
        case '\\':
        case '{':
        case '}':
        case '*':
            result.push_back( '\\' );
            result.push_back( c );
            break;
        default:
            result.push_back( c );
            break;
        }
    }

    return result;
}

} // pathmatch
