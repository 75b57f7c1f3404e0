//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/pattern_rule.hpp"

namespace pathmatch {
namespace detail {

core::string_view
trim(core::string_view s) noexcept
{
    ws_char ws;
    while(! s.empty() && ws(s.front()))
        s.remove_prefix(1);
    while(! s.empty() && ws(s.back()))
        s.remove_suffix(1);
    return s;
}

bool
ends_with_close_brace(
    core::string_view s) noexcept
{
    if(s.empty() || s.back() != '}')
        return false;
    // count the backslashes before the brace
    std::size_t n = 0;
    auto i = s.size() - 1;
    while(i > 0 && s[i - 1] == '\\')
    {
        ++n;
        --i;
    }
    return (n % 2) == 0;
}

} // detail
} // pathmatch
