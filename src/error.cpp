//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/error.hpp>

namespace pathmatch {

namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "pathmatch";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::success: return "success";
    case error::missing_leading_slash: return "pattern must start with '/'";
    case error::double_slash: return "double slashes not allowed";
    case error::unmatched_brace: return "unmatched brace";
    case error::nested_brace: return "nested variable patterns not allowed";
    case error::empty_variable_name: return "variable name cannot be empty";
    case error::invalid_variable_name: return "invalid variable name";
    case error::invalid_constraint: return "invalid constraint";
    case error::too_many_segments: return "pattern exceeds maximum segment count";
    case error::invalid_wildcard: return "wildcard must span a whole segment";
    case error::invalid_variable_segment: return "variable must span a whole segment";
    case error::duplicate_variable: return "duplicate variable name";
    default:
        return "unknown";
    }
}

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
#else
error_cat_type error_cat;
#endif

} // detail

//------------------------------------------------

namespace {

std::string
make_what(
    core::string_view pattern,
    std::size_t position)
{
    std::string s = "pattern \"";
    s.append(pattern.data(), pattern.size());
    s.push_back('"');
    if(position != invalid_pattern::npos)
    {
        s.append(" at position ");
        s.append(std::to_string(position));
    }
    return s;
}

} // (anon)

invalid_pattern::
invalid_pattern(
    system::error_code const& ec,
    core::string_view pattern,
    std::size_t position)
    : system::system_error(
        ec, make_what(pattern, position))
    , pattern_(pattern.data(), pattern.size())
    , position_(position)
{
}

} // pathmatch
