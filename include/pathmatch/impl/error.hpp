//
// Copyright (c) 2021 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_IMPL_ERROR_HPP
#define PATHMATCH_IMPL_ERROR_HPP

#include <boost/system/error_code.hpp>
#include <system_error>
#include <type_traits>

namespace boost {
namespace system {

template<>
struct is_error_code_enum<
    ::pathmatch::error>
{
    static bool const value = true;
};

} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::pathmatch::error>
    : std::true_type {};
} // std

namespace pathmatch {

namespace detail {

struct PATHMATCH_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    PATHMATCH_DECL const char* name(
        ) const noexcept override;
    PATHMATCH_DECL std::string message(
        int) const override;
    PATHMATCH_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x6d2c0f3a91e4b857)
    {
    }
};

PATHMATCH_DECL extern
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

} // pathmatch

#endif
