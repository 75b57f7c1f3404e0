//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/pattern_compiler.hpp>
#include <pathmatch/error.hpp>
#include <pathmatch/matcher.hpp>
#include <pathmatch/detail/except.hpp>
#include "src/detail/logger.hpp"
#include "src/detail/lru_cache.hpp"
#include "src/detail/pattern_rule.hpp"
#include <algorithm>
#include <mutex>
#include <string_view>

namespace pathmatch {

namespace {

// Checks the structure of the whole pattern
// before it is split into segments.
system::error_code
validate(
    core::string_view s,
    parser_config const& cfg,
    std::size_t& pos) noexcept
{
    if(s.empty() || s.front() != path_separator)
    {
        pos = 0;
        return error::missing_leading_slash;
    }
    pos = s.find("//");
    if(pos != core::string_view::npos)
        return error::double_slash;

    auto const n = s.size();
    std::size_t open = core::string_view::npos;
    std::size_t slashes = 0;
    for(std::size_t i = 0; i < n; ++i)
    {
        char const c = s[i];
        switch(c)
        {
        case '\\':
            // a backslash never escapes the separator
            if(i + 1 < n && s[i + 1] != path_separator)
                ++i;
            break;

        case path_separator:
            if(open != core::string_view::npos)
            {
                pos = open;
                return error::unmatched_brace;
            }
            ++slashes;
            break;

        case '{':
            if(open != core::string_view::npos)
            {
                pos = i;
                return error::nested_brace;
            }
            open = i;
            break;

        case '}':
            if(open == core::string_view::npos)
            {
                pos = i;
                return error::unmatched_brace;
            }
            open = core::string_view::npos;
            break;

        default:
            break;
        }
    }
    if(open != core::string_view::npos)
    {
        pos = open;
        return error::unmatched_brace;
    }
    if(slashes > cfg.max_segments)
    {
        pos = invalid_pattern::npos;
        return error::too_many_segments;
    }
    pos = invalid_pattern::npos;
    return {};
}

std::optional<compiled_pattern>
compile_pattern(
    core::string_view s,
    parser_config const& cfg,
    system::error_code& ec,
    std::size_t& pos)
{
    ec = validate(s, cfg, pos);
    if(ec.failed())
        return std::nullopt;

    std::vector<segment> segs;
    std::vector<std::string> names;
    auto const n = s.size();
    std::size_t i = 1;
    while(i < n)
    {
        auto j = s.find(path_separator, i);
        if(j == core::string_view::npos)
            j = n;
        pos = i;
        auto rv = grammar::parse(
            s.substr(i, j - i), detail::segment_rule);
        if(rv.has_error())
        {
            ec = rv.error();
            return std::nullopt;
        }
        auto& raw = *rv;
        switch(raw.kind)
        {
        case segment_kind::literal:
            if(cfg.strict && raw.bare_star)
            {
                ec = error::invalid_wildcard;
                return std::nullopt;
            }
            if(cfg.strict && raw.bare_brace)
            {
                ec = error::invalid_variable_segment;
                return std::nullopt;
            }
            segs.push_back(segment::literal(
                std::move(raw.text)));
            break;

        case segment_kind::variable:
        {
            if( cfg.strict &&
                std::find(names.begin(), names.end(),
                    raw.text) != names.end())
            {
                ec = error::duplicate_variable;
                return std::nullopt;
            }
            names.push_back(raw.text);
            auto seg = segment::variable(
                std::move(raw.text),
                raw.constraint,
                ec);
            if(ec.failed())
                return std::nullopt;
            segs.push_back(std::move(seg));
            break;
        }

        case segment_kind::wildcard:
            segs.push_back(segment::wildcard());
            break;

        case segment_kind::multi_wildcard:
            segs.push_back(segment::wildcard(true));
            break;
        }
        i = j + 1;
    }

    pos = invalid_pattern::npos;
    ec = {};
    return compiled_pattern(
        std::string(s.data(), s.size()),
        std::move(segs),
        cfg.case_insensitive,
        cfg.optional_trailing_slash);
}

char
kind_char(segment_kind k) noexcept
{
    switch(k)
    {
    case segment_kind::literal:         return 'l';
    case segment_kind::variable:        return 'v';
    case segment_kind::wildcard:        return 'w';
    case segment_kind::multi_wildcard:  return 'm';
    }
    return '?';
}

// A compiled_pattern may be built by hand with any
// source text, so the key describes every segment.
void
append_key(
    std::string& key,
    compiled_pattern const& p)
{
    key.push_back('\0');
    key.append(p.source());
    key.push_back('\0');
    key.push_back(p.case_insensitive() ? 'i' : '-');
    key.push_back(p.optional_trailing_slash() ? 't' : '-');
    for(auto const& seg : p.segments())
    {
        key.push_back(kind_char(seg.kind()));
        key.append(seg.to_string());
        key.push_back('\0');
    }
}

} // (anon)

//------------------------------------------------

struct pattern_compiler::impl
{
    // Everything which is discarded together when
    // the configuration changes
    struct state
    {
        std::shared_ptr<parser_config const> cfg;
        detail::lru_cache<std::string, compiled_pattern> patterns;
        detail::lru_cache<std::string, match_result> results;

        explicit
        state(std::shared_ptr<parser_config const> cfg_)
            : cfg(std::move(cfg_))
            , patterns(cfg->cache_capacity)
            , results(cfg->cache_capacity)
        {
        }
    };

    mutable std::mutex m;
    std::shared_ptr<state> st;

    explicit
    impl(parser_config cfg)
        : st(std::make_shared<state>(
            make_parser_config(std::move(cfg))))
    {
    }

    std::shared_ptr<state>
    get() const
    {
        std::lock_guard<std::mutex> lock(m);
        return st;
    }

    template<class F>
    void
    update(F const& f)
    {
        std::shared_ptr<parser_config const> cfg;
        {
            std::lock_guard<std::mutex> lock(m);
            parser_config next = *st->cfg;
            f(next);
            cfg = make_parser_config(std::move(next));
            st = std::make_shared<state>(cfg);
        }
        PATHMATCH_LOG(debug,
            "configuration changed: case_insensitive={} "
            "optional_trailing_slash={} strict={} "
            "max_segments={} cache_capacity={}",
            cfg->case_insensitive,
            cfg->optional_trailing_slash,
            cfg->strict,
            cfg->max_segments,
            cfg->cache_capacity);
    }

    std::optional<compiled_pattern>
    compile(
        core::string_view pattern,
        system::error_code& ec,
        std::size_t& pos)
    {
        auto const s = detail::trim(pattern);
        std::string key(s.data(), s.size());
        auto const sp = get();
        if(auto hit = sp->patterns.get(key))
        {
            ec = {};
            pos = invalid_pattern::npos;
            return hit;
        }
        auto rv = compile_pattern(s, *sp->cfg, ec, pos);
        if(! rv)
        {
            PATHMATCH_LOG(debug,
                "failed to compile \"{}\": {}",
                key, ec.message());
            return rv;
        }
        if(sp->patterns.put(key, *rv))
            PATHMATCH_LOG(trace,
                "pattern cache full, evicted the least recently "
                "used entry while inserting \"{}\"",
                key);
        return rv;
    }

    match_result
    cached(
        std::string const& key,
        core::string_view path,
        std::span<compiled_pattern const> patterns,
        bool best)
    {
        auto const sp = get();
        if(auto hit = sp->results.get(key))
            return std::move(*hit);
        auto r = best
            ? pathmatch::match_best(path, patterns)
            : pathmatch::match(path, patterns.front());
        if(sp->results.put(key, r))
            PATHMATCH_LOG(trace,
                "match cache full, evicted the least recently "
                "used entry while inserting \"{}\"",
                std::string_view(path.data(), path.size()));
        return r;
    }
};

//------------------------------------------------

pattern_compiler::
pattern_compiler(
    parser_config cfg)
    : impl_(std::make_unique<impl>(std::move(cfg)))
{
}

pattern_compiler::
~pattern_compiler() = default;

compiled_pattern
pattern_compiler::
compile(core::string_view pattern)
{
    system::error_code ec;
    std::size_t pos = invalid_pattern::npos;
    auto rv = impl_->compile(pattern, ec, pos);
    if(! rv)
    {
        detail::throw_invalid_pattern(
            ec, detail::trim(pattern), pos);
    }
    return std::move(*rv);
}

std::optional<compiled_pattern>
pattern_compiler::
compile(
    core::string_view pattern,
    system::error_code& ec)
{
    std::size_t pos;
    return impl_->compile(pattern, ec, pos);
}

match_result
pattern_compiler::
match(
    core::string_view path,
    compiled_pattern const& pattern)
{
    std::string key("m");
    key.append(path.data(), path.size());
    append_key(key, pattern);
    return impl_->cached(key, path,
        std::span<compiled_pattern const>(&pattern, 1),
        false);
}

match_result
pattern_compiler::
match_best(
    core::string_view path,
    std::span<compiled_pattern const> patterns)
{
    std::string key("b");
    key.append(path.data(), path.size());
    for(auto const& p : patterns)
        append_key(key, p);
    return impl_->cached(key, path, patterns, true);
}

bool
pattern_compiler::
matches(
    core::string_view path,
    core::string_view pattern)
{
    system::error_code ec;
    auto rv = compile(pattern, ec);
    if(! rv)
        return false;
    return match(path, *rv).matched();
}

std::vector<std::string>
pattern_compiler::
variable_names(core::string_view pattern)
{
    system::error_code ec;
    auto rv = compile(pattern, ec);
    if(! rv)
        return {};
    return rv->variable_names();
}

std::shared_ptr<parser_config const>
pattern_compiler::
config() const
{
    return impl_->get()->cfg;
}

pattern_compiler&
pattern_compiler::
set_config(parser_config cfg)
{
    impl_->update([&cfg](parser_config& next)
    {
        next = cfg;
    });
    return *this;
}

pattern_compiler&
pattern_compiler::
case_insensitive(bool value)
{
    impl_->update([value](parser_config& next)
    {
        next.case_insensitive = value;
    });
    return *this;
}

pattern_compiler&
pattern_compiler::
optional_trailing_slash(bool value)
{
    impl_->update([value](parser_config& next)
    {
        next.optional_trailing_slash = value;
    });
    return *this;
}

pattern_compiler&
pattern_compiler::
strict(bool value)
{
    impl_->update([value](parser_config& next)
    {
        next.strict = value;
    });
    return *this;
}

std::size_t
pattern_compiler::
pattern_cache_size() const
{
    return impl_->get()->patterns.size();
}

std::size_t
pattern_compiler::
match_cache_size() const
{
    return impl_->get()->results.size();
}

} // pathmatch
