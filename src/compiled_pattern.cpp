//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/compiled_pattern.hpp>
#include <algorithm>

namespace pathmatch {

// Members ordered largest-to-smallest for optimal packing
struct compiled_pattern::impl
{
    std::string source;
    std::vector<segment> segs;
    std::size_t rank = 0;
    std::size_t multi_wildcards = 0;
    bool has_wildcard = false;
    bool has_variables = false;
    bool case_insensitive;
    bool optional_trailing_slash;
    bool trailing_slash;

    impl(
        std::string source_,
        std::vector<segment> segs_,
        bool ci,
        bool opt_slash)
        : source(std::move(source_))
        , segs(std::move(segs_))
        , case_insensitive(ci)
        , optional_trailing_slash(opt_slash)
        , trailing_slash(
            source.size() > 1 &&
            source.back() == path_separator)
    {
        for(auto const& s : segs)
        {
            switch(s.kind())
            {
            case segment_kind::literal:
                break;
            case segment_kind::variable:
                has_variables = true;
                break;
            case segment_kind::multi_wildcard:
                ++multi_wildcards;
                has_wildcard = true;
                break;
            case segment_kind::wildcard:
                has_wildcard = true;
                break;
            }
            rank += rank_of(s);
        }
    }
};

compiled_pattern::
compiled_pattern(
    std::string source,
    std::vector<segment> segments,
    bool case_insensitive,
    bool optional_trailing_slash)
    : impl_(std::make_shared<impl const>(
        std::move(source),
        std::move(segments),
        case_insensitive,
        optional_trailing_slash))
{
}

std::string const&
compiled_pattern::
source() const noexcept
{
    return impl_->source;
}

std::vector<segment> const&
compiled_pattern::
segments() const noexcept
{
    return impl_->segs;
}

bool
compiled_pattern::
is_static() const noexcept
{
    return
        ! impl_->has_wildcard &&
        ! impl_->has_variables;
}

bool
compiled_pattern::
has_wildcard() const noexcept
{
    return impl_->has_wildcard;
}

bool
compiled_pattern::
has_variables() const noexcept
{
    return impl_->has_variables;
}

bool
compiled_pattern::
case_insensitive() const noexcept
{
    return impl_->case_insensitive;
}

bool
compiled_pattern::
optional_trailing_slash() const noexcept
{
    return impl_->optional_trailing_slash;
}

bool
compiled_pattern::
trailing_slash() const noexcept
{
    return impl_->trailing_slash;
}

std::size_t
compiled_pattern::
specificity_rank() const noexcept
{
    return impl_->rank;
}

std::size_t
compiled_pattern::
multi_wildcard_count() const noexcept
{
    return impl_->multi_wildcards;
}

std::vector<std::string>
compiled_pattern::
variable_names() const
{
    std::vector<std::string> v;
    for(auto const& s : impl_->segs)
    {
        if(! s.is_variable())
            continue;
        auto const name = s.text();
        auto const it = std::find_if(v.begin(), v.end(),
            [name](std::string const& n)
            {
                return core::string_view(n) == name;
            });
        if(it == v.end())
            v.emplace_back(name.data(), name.size());
    }
    return v;
}

std::size_t
compiled_pattern::
rank_of(segment const& s) noexcept
{
    switch(s.kind())
    {
    case segment_kind::literal:
        return 1000;
    case segment_kind::variable:
        return s.has_constraint() ? 200 : 100;
    case segment_kind::wildcard:
        return 10;
    case segment_kind::multi_wildcard:
        return 1;
    }
    return 0;
}

bool
operator==(
    compiled_pattern const& a,
    compiled_pattern const& b) noexcept
{
    if(a.impl_ == b.impl_)
        return true;
    return
        a.impl_->source == b.impl_->source &&
        a.impl_->segs == b.impl_->segs &&
        a.impl_->case_insensitive == b.impl_->case_insensitive &&
        a.impl_->optional_trailing_slash ==
            b.impl_->optional_trailing_slash;
}

} // pathmatch
