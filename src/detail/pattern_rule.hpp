//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_SRC_DETAIL_PATTERN_RULE_HPP
#define PATHMATCH_SRC_DETAIL_PATTERN_RULE_HPP

#include <pathmatch/detail/config.hpp>
#include <pathmatch/error.hpp>
#include <pathmatch/segment.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <boost/url/grammar/alpha_chars.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>
#include <cstddef>
#include <string>

namespace pathmatch {
namespace detail {

/*
pattern           =  "/" [ segment *( "/" segment ) ] [ "/" ]
segment           =  multi-wildcard / wildcard / variable / literal
multi-wildcard    =  "**"
wildcard          =  "*"
variable          =  "{" *WS name *WS [ ":" *WS constraint *WS ] "}"
name              =  ( ALPHA / "_" ) *( ALPHA / DIGIT / "_" )
constraint        =  1*( constraint-char )         ; a regular expression
literal           =  1*( literal-char / escaped )
escaped           =  "\" any-char
literal-char      =  any char except "/" "{" "}" "\"
constraint-char   =  any char except "{" "}", or escaped
*/

//------------------------------------------------

struct ident_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= '0' && ch <= '9') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch == '_');
    }
};

struct ws_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            ch == ' ' || ch == '\t' ||
            ch == '\r' || ch == '\n' ||
            ch == '\f' || ch == '\v';
    }
};

// remove leading and trailing whitespace
core::string_view
trim(core::string_view s) noexcept;

//------------------------------------------------

/** A segment of a pattern before its constraint is compiled
*/
struct raw_segment
{
    // literal text with escapes removed, or variable name
    std::string text;
    core::string_view constraint;
    segment_kind kind = segment_kind::literal;

    // literal contains an unescaped '*'
    bool bare_star = false;

    // literal contains an unescaped '{' or '}'
    bool bare_brace = false;
};

constexpr struct
{
    using value_type = std::string;

    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>
    {
        auto it0 = it;
        it = grammar::find_if_not(
            it, end, ident_char{});
        if(it == it0)
            return error::empty_variable_name;
        if(it != end ||
            ! grammar::alpha_chars(*it0) && *it0 != '_')
        {
            it = it0;
            return error::invalid_variable_name;
        }
        return std::string(it0, end);
    }
} name_rule{};

constexpr struct
{
    using value_type = raw_segment;

    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>
    {
        if( it == end ||
            *it != '{' ||
            *(end - 1) != '}')
            return grammar::error::mismatch;

        value_type v;
        v.kind = segment_kind::variable;
        core::string_view body(
            it + 1, end - 1);

        // the name ends at the first ':'
        core::string_view name = body;
        auto const colon = body.find(':');
        if(colon != core::string_view::npos)
        {
            name = body.substr(0, colon);
            v.constraint = trim(
                body.substr(colon + 1));
            if(v.constraint.empty())
                return error::invalid_constraint;
        }
        name = trim(name);
        if(name.empty())
            return error::empty_variable_name;
        auto rv = grammar::parse(
            name, name_rule);
        if(rv.has_error())
            return rv.error();
        v.text = std::move(*rv);
        it = end;
        return v;
    }
} variable_rule{};

constexpr struct
{
    using value_type = raw_segment;

    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>
    {
        if(it == end)
            return grammar::error::need_more;
        value_type v;
        v.text.reserve(end - it);
        while(it != end)
        {
            char c = *it++;
            if(c == '\\' && it != end)
            {
                v.text.push_back(*it++);
                continue;
            }
            if(c == '*')
                v.bare_star = true;
            else if(c == '{' || c == '}')
                v.bare_brace = true;
            v.text.push_back(c);
        }
        return v;
    }
} literal_rule{};

//------------------------------------------------

// true if the last character of s is an unescaped '}'
bool
ends_with_close_brace(
    core::string_view s) noexcept;

constexpr struct
{
    using value_type = raw_segment;

    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>
    {
        core::string_view s(it, end);
        if(s == "**")
        {
            it = end;
            value_type v;
            v.kind = segment_kind::multi_wildcard;
            return v;
        }
        if(s == "*")
        {
            it = end;
            value_type v;
            v.kind = segment_kind::wildcard;
            return v;
        }
        if( ! s.empty() &&
            s.front() == '{' &&
            ends_with_close_brace(s))
        {
            return variable_rule.parse(it, end);
        }
        return literal_rule.parse(it, end);
    }
} segment_rule{};

} // detail
} // pathmatch

#endif
