//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/segment.hpp>
#include <pathmatch/error.hpp>
#include <pathmatch/escape.hpp>
#include <pathmatch/detail/except.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/grammar/ci_string.hpp>
#include <re2/re2.h>

namespace pathmatch {

segment
segment::
literal(std::string value)
{
    return segment(literal_segment{
        std::move(value) });
}

segment
segment::
variable(std::string name)
{
    return segment(variable_segment{
        std::move(name), {}, nullptr });
}

segment
segment::
variable(
    std::string name,
    core::string_view constraint,
    system::error_code& ec)
{
    if(constraint.empty())
    {
        ec = {};
        return variable(std::move(name));
    }
    re2::RE2::Options opt;
    opt.set_log_errors(false);
    auto re = std::make_shared<re2::RE2 const>(
        std::string(constraint.data(), constraint.size()), opt);
    if(! re->ok())
    {
        ec = error::invalid_constraint;
        return variable(std::move(name));
    }
    ec = {};
    return segment(variable_segment{
        std::move(name),
        std::string(constraint.data(), constraint.size()),
        std::move(re) });
}

segment
segment::
variable(
    std::string name,
    core::string_view constraint)
{
    system::error_code ec;
    auto s = variable(
        std::move(name), constraint, ec);
    if(ec.failed())
        detail::throw_invalid_pattern(
            ec, constraint, invalid_pattern::npos);
    return s;
}

segment
segment::
wildcard(bool multi_segment)
{
    return segment(wildcard_segment{
        multi_segment });
}

segment_kind
segment::
kind() const noexcept
{
    struct visitor
    {
        segment_kind operator()(
            literal_segment const&) const noexcept
        {
            return segment_kind::literal;
        }

        segment_kind operator()(
            variable_segment const&) const noexcept
        {
            return segment_kind::variable;
        }

        segment_kind operator()(
            wildcard_segment const& w) const noexcept
        {
            return w.multi_segment
                ? segment_kind::multi_wildcard
                : segment_kind::wildcard;
        }
    };
    return std::visit(visitor{}, v_);
}

bool
segment::
has_constraint() const noexcept
{
    auto const* v = std::get_if<variable_segment>(&v_);
    return v && v->re != nullptr;
}

core::string_view
segment::
text() const noexcept
{
    if(auto const* l = std::get_if<literal_segment>(&v_))
        return l->value;
    if(auto const* v = std::get_if<variable_segment>(&v_))
        return v->name;
    return {};
}

core::string_view
segment::
constraint() const noexcept
{
    if(auto const* v = std::get_if<variable_segment>(&v_))
        return v->constraint;
    return {};
}

bool
segment::
matches(
    core::string_view component,
    bool case_insensitive) const noexcept
{
    struct visitor
    {
        core::string_view s;
        bool ci;

        bool operator()(
            literal_segment const& l) const noexcept
        {
            if(! ci)
                return s == core::string_view(l.value);
            return grammar::ci_is_equal(s, l.value);
        }

        bool operator()(
            variable_segment const& v) const noexcept
        {
            if(s.empty())
                return false;
            if(! v.re)
                return true;
            return re2::RE2::FullMatch(
                re2::StringPiece(s.data(), s.size()), *v.re);
        }

        bool operator()(
            wildcard_segment const&) const noexcept
        {
            return true;
        }
    };
    return std::visit(
        visitor{ component, case_insensitive }, v_);
}

void
segment::
extract_variables(
    core::string_view component,
    variable_map& vars) const
{
    auto const* v = std::get_if<variable_segment>(&v_);
    if(! v)
        return;
    auto it = vars.find(v->name);
    if(it != vars.end())
        it->second.assign(component.data(), component.size());
    else
        vars.emplace(v->name, std::string(
            component.data(), component.size()));
}

std::string
segment::
to_string() const
{
    struct visitor
    {
        std::string operator()(
            literal_segment const& l) const
        {
            return escape(l.value);
        }

        std::string operator()(
            variable_segment const& v) const
        {
            std::string s = "{";
            s += v.name;
            if(! v.constraint.empty())
            {
                s.push_back(':');
                s += v.constraint;
            }
            s.push_back('}');
            return s;
        }

        std::string operator()(
            wildcard_segment const& w) const
        {
            return w.multi_segment ? "**" : "*";
        }
    };
    return std::visit(visitor{}, v_);
}

bool
operator==(
    segment const& a,
    segment const& b) noexcept
{
    if(a.kind() != b.kind())
        return false;
    return
        a.text() == b.text() &&
        a.constraint() == b.constraint();
}

} // pathmatch
