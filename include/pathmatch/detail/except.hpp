//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_DETAIL_EXCEPT_HPP
#define PATHMATCH_DETAIL_EXCEPT_HPP

#include <pathmatch/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>

namespace pathmatch {
namespace detail {

BOOST_NORETURN PATHMATCH_DECL void throw_invalid_argument(
    char const* what,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_NORETURN PATHMATCH_DECL void throw_invalid_pattern(
    system::error_code const& ec,
    core::string_view pattern,
    std::size_t position,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // pathmatch

#endif
