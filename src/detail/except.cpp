//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/detail/except.hpp>
#include <pathmatch/error.hpp>
#include <boost/throw_exception.hpp>
#include <stdexcept>

namespace pathmatch {
namespace detail {

void
throw_invalid_argument(
    char const* what,
    boost::source_location const& loc)
{
    boost::throw_exception(
        std::invalid_argument(what), loc);
}

void
throw_invalid_pattern(
    system::error_code const& ec,
    core::string_view pattern,
    std::size_t position,
    boost::source_location const& loc)
{
    boost::throw_exception(
        invalid_pattern(ec, pattern, position), loc);
}

} // detail
} // pathmatch
