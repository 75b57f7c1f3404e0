//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/match_result.hpp>
#include <string_view>

namespace pathmatch {

match_result
match_result::
no_match(
    core::string_view path,
    core::string_view pattern)
{
    match_result mr;
    mr.path_.assign(path.data(), path.size());
    mr.pattern_.assign(pattern.data(), pattern.size());
    return mr;
}

match_result::
match_result(
    std::string path,
    std::string pattern,
    std::vector<std::string> segments,
    variable_map variables,
    std::vector<std::string> captures)
    : path_(std::move(path))
    , pattern_(std::move(pattern))
    , segments_(std::move(segments))
    , variables_(std::move(variables))
    , captures_(std::move(captures))
    , matched_(true)
{
}

std::string const*
match_result::
find(core::string_view name) const noexcept
{
    auto it = variables_.find(std::string_view(
        name.data(), name.size()));
    if(it == variables_.end())
        return nullptr;
    return &it->second;
}

std::vector<std::string>
match_result::
variable_names() const
{
    std::vector<std::string> v;
    v.reserve(variables_.size());
    for(auto const& kv : variables_)
        v.push_back(kv.first);
    return v;
}

bool
operator==(
    match_result const& a,
    match_result const& b) noexcept
{
    return
        a.matched_ == b.matched_ &&
        a.path_ == b.path_ &&
        a.pattern_ == b.pattern_ &&
        a.segments_ == b.segments_ &&
        a.variables_ == b.variables_ &&
        a.captures_ == b.captures_;
}

} // pathmatch
