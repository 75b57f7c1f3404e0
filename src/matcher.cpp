//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/matcher.hpp>
#include "src/detail/pattern_rule.hpp"
#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace pathmatch {

namespace {

// Walks the segments of a pattern against the
// components of a path. Bindings are recorded as
// component ranges so a failed '**' split can be
// rolled back by truncation.
class walker
{
public:
    walker(
        std::vector<segment> const& segs,
        std::vector<core::string_view> const& comps,
        bool case_insensitive) noexcept
        : segs_(segs)
        , comps_(comps)
        , ci_(case_insensitive)
    {
    }

    bool
    run()
    {
        return walk(0, 0);
    }

    void
    collect(
        variable_map& vars,
        std::vector<std::string>& captures) const
    {
        for(auto const& b : bindings_)
        {
            auto const& s = segs_[b.seg];
            if(s.is_variable())
            {
                s.extract_variables(
                    comps_[b.first], vars);
                continue;
            }
            captures.push_back(join(b.first, b.last));
        }
    }

private:
    struct binding
    {
        std::size_t seg;
        std::size_t first;
        std::size_t last;
    };

    std::string
    join(
        std::size_t first,
        std::size_t last) const
    {
        std::string s;
        for(auto i = first; i != last; ++i)
        {
            if(i != first)
                s.push_back(path_separator);
            s.append(comps_[i].data(), comps_[i].size());
        }
        return s;
    }

    bool
    walk(std::size_t si, std::size_t ci)
    {
        auto const ns = segs_.size();
        auto const nc = comps_.size();
        while(si < ns)
        {
            auto const& s = segs_[si];
            switch(s.kind())
            {
            case segment_kind::multi_wildcard:
                if(si + 1 < ns)
                    return split(si, ci);
                if(ci >= nc)
                    return false;
                bindings_.push_back({ si, ci, nc });
                ci = nc;
                break;

            case segment_kind::wildcard:
                if(ci >= nc)
                    return false;
                bindings_.push_back({ si, ci, ci + 1 });
                ++ci;
                break;

            case segment_kind::variable:
                if(ci >= nc || ! s.matches(comps_[ci]))
                    return false;
                bindings_.push_back({ si, ci, ci + 1 });
                ++ci;
                break;

            case segment_kind::literal:
                if(ci >= nc || ! s.matches(comps_[ci], ci_))
                    return false;
                ++ci;
                break;
            }
            ++si;
        }
        return ci == nc;
    }

    // '**' followed by more segments. Try each split
    // point left to right, the first one where the
    // tail consumes the rest of the path wins. The
    // outcome of walk(si, ci) depends only on its
    // arguments, so each failing pair is tried once.
    bool
    split(std::size_t si, std::size_t ci)
    {
        auto const nc = comps_.size();
        auto const need = segs_.size() - (si + 1);
        auto const mark = bindings_.size();
        if(failed_.empty())
            failed_.resize(
                (segs_.size() + 1) * (nc + 1), false);
        for(auto i = ci + 1; i + need <= nc; ++i)
        {
            auto const key = (si + 1) * (nc + 1) + i;
            if(failed_[key])
                continue;
            bindings_.push_back({ si, ci, i });
            if(walk(si + 1, i))
                return true;
            bindings_.resize(mark);
            failed_[key] = true;
        }
        return false;
    }

    std::vector<segment> const& segs_;
    std::vector<core::string_view> const& comps_;
    std::vector<binding> bindings_;

    // walk(si, ci) is known to fail
    std::vector<bool> failed_;
    bool ci_;
};

} // (anon)

match_result
match(
    core::string_view path,
    compiled_pattern const& pattern)
{
    auto const p = detail::trim(path);
    if( p.empty() ||
        p.front() != path_separator ||
        p.find("//") != core::string_view::npos)
        return match_result::no_match(
            p, pattern.source());

    // trailing slash policy, the root is exempt
    core::string_view rest = p;
    bool const slash =
        rest.size() > 1 &&
        rest.back() == path_separator;
    if( ! pattern.optional_trailing_slash() &&
        slash != pattern.trailing_slash())
        return match_result::no_match(
            p, pattern.source());
    if(slash)
        rest.remove_suffix(1);

    std::vector<core::string_view> comps;
    rest.remove_prefix(1);
    while(! rest.empty())
    {
        auto const n = rest.find(path_separator);
        comps.push_back(rest.substr(0, n));
        if(n == core::string_view::npos)
            break;
        rest.remove_prefix(n + 1);
    }

    walker w(
        pattern.segments(),
        comps,
        pattern.case_insensitive());
    if(! w.run())
        return match_result::no_match(
            p, pattern.source());

    variable_map vars;
    std::vector<std::string> captures;
    w.collect(vars, captures);
    std::vector<std::string> segs;
    segs.reserve(comps.size());
    for(auto c : comps)
        segs.emplace_back(c.data(), c.size());
    return match_result(
        std::string(p.data(), p.size()),
        pattern.source(),
        std::move(segs),
        std::move(vars),
        std::move(captures));
}

match_result
match_best(
    core::string_view path,
    std::span<compiled_pattern const> patterns)
{
    std::vector<compiled_pattern const*> v;
    v.reserve(patterns.size());
    for(auto const& p : patterns)
        v.push_back(&p);
    std::stable_sort(v.begin(), v.end(),
        [](compiled_pattern const* a,
            compiled_pattern const* b)
        {
            return more_specific{}(*a, *b);
        });
    for(auto p : v)
    {
        auto r = match(path, *p);
        if(r.matched())
            return r;
    }
    return match_result::no_match(
        detail::trim(path), {});
}

bool
more_specific::
operator()(
    compiled_pattern const& a,
    compiled_pattern const& b) const noexcept
{
    if(a.is_static() != b.is_static())
        return a.is_static();
    if(a.multi_wildcard_count() != b.multi_wildcard_count())
        return a.multi_wildcard_count() < b.multi_wildcard_count();
    if(a.specificity_rank() != b.specificity_rank())
        return a.specificity_rank() > b.specificity_rank();
    return a.source() < b.source();
}

} // pathmatch
