//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_SEGMENT_HPP
#define PATHMATCH_SEGMENT_HPP

#include <pathmatch/detail/config.hpp>
#include <pathmatch/match_result.hpp>
#include <boost/system/error_code.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace re2 {
class RE2;
} // re2

namespace pathmatch {

/** The kind of a pattern segment
*/
enum class segment_kind : std::uint8_t
{
    /// Matches one component equal to a fixed string.
    literal,

    /// Matches one non-empty component and binds it to a name.
    variable,

    /// '*', matches exactly one component.
    wildcard,

    /// '**', matches one or more components.
    multi_wildcard
};

/// A fixed string, as in "users".
struct literal_segment
{
    std::string value;
};

/// A named variable, as in "{id}" or "{id:[0-9]+}".
struct variable_segment
{
    std::string name;

    // empty for no constraint
    std::string constraint;

    // null for no constraint
    std::shared_ptr<re2::RE2 const> re;
};

/// A wildcard, "*" or "**".
struct wildcard_segment
{
    bool multi_segment = false;
};

//------------------------------------------------

/** One '/'-delimited component of a compiled pattern.

    Segments are immutable values. Copies share the
    compiled constraint of a variable, which is safe
    to use from multiple threads at once.
*/
class segment
{
public:
    using value_type = std::variant<
        literal_segment,
        variable_segment,
        wildcard_segment>;

    /// Return a literal segment.
    PATHMATCH_DECL
    static segment literal(std::string value);

    /// Return an unconstrained variable segment.
    PATHMATCH_DECL
    static segment variable(std::string name);

    /** Return a constrained variable segment.

        The constraint is compiled once, as a regular
        expression which must match the whole component.

        @param ec Set to @ref error::invalid_constraint
        if the constraint does not compile.
    */
    PATHMATCH_DECL
    static segment variable(
        std::string name,
        core::string_view constraint,
        system::error_code& ec);

    /** Return a constrained variable segment.

        @throws invalid_pattern The constraint does
        not compile.
    */
    PATHMATCH_DECL
    static segment variable(
        std::string name,
        core::string_view constraint);

    /// Return a wildcard segment.
    PATHMATCH_DECL
    static segment wildcard(bool multi_segment = false);

    /// Return the kind of segment.
    PATHMATCH_DECL
    segment_kind kind() const noexcept;

    bool is_literal() const noexcept
    {
        return kind() == segment_kind::literal;
    }

    bool is_variable() const noexcept
    {
        return kind() == segment_kind::variable;
    }

    /// Return true for both '*' and '**'.
    bool is_wildcard() const noexcept
    {
        auto const k = kind();
        return
            k == segment_kind::wildcard ||
            k == segment_kind::multi_wildcard;
    }

    bool is_multi_wildcard() const noexcept
    {
        return kind() == segment_kind::multi_wildcard;
    }

    /// Return true for a variable with a constraint.
    PATHMATCH_DECL
    bool has_constraint() const noexcept;

    /** Return the literal text or the variable name.

        Empty for wildcards.
    */
    PATHMATCH_DECL
    core::string_view text() const noexcept;

    /** Return the constraint source text.

        Empty unless this is a constrained variable.
    */
    PATHMATCH_DECL
    core::string_view constraint() const noexcept;

    /** Return true if one path component fits this segment.

        A wildcard accepts any component. The
        `case_insensitive` flag applies to literals
        only.
    */
    PATHMATCH_DECL
    bool
    matches(
        core::string_view component,
        bool case_insensitive = false) const noexcept;

    /** Bind a matched component.

        Inserts `name -> component` into `vars` if this
        is a variable, otherwise does nothing. An
        existing binding of the same name is replaced.
    */
    PATHMATCH_DECL
    void
    extract_variables(
        core::string_view component,
        variable_map& vars) const;

    /** Return the segment as it is written in a pattern.

        Literal text is escaped with @ref escape.
    */
    PATHMATCH_DECL
    std::string to_string() const;

    PATHMATCH_DECL
    friend
    bool
    operator==(
        segment const& a,
        segment const& b) noexcept;

    friend
    bool
    operator!=(
        segment const& a,
        segment const& b) noexcept
    {
        return !(a == b);
    }

private:
    explicit
    segment(value_type v) noexcept
        : v_(std::move(v))
    {
    }

    value_type v_;
};

} // pathmatch

#endif
