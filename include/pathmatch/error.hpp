//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_ERROR_HPP
#define PATHMATCH_ERROR_HPP

#include <pathmatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <string>

namespace pathmatch {

/** Error codes returned when compiling a pattern.

    Every value except @ref error::success describes
    a syntax problem in a route pattern. Matching a
    path never produces an error; a path which does
    not fit a pattern simply does not match.
*/
enum class error
{
    /// The operation completed successfully.
    success = 0,

    /// The pattern does not begin with a '/'.
    missing_leading_slash,

    /// The pattern contains an empty segment ("//").
    double_slash,

    /// A '{' has no closing '}', or a '}' has no opening '{'.
    unmatched_brace,

    /// A '{' appears inside a variable.
    nested_brace,

    /// A variable has an empty name, as in "{}".
    empty_variable_name,

    /// A variable name is not an identifier.
    invalid_variable_name,

    /// A variable constraint is not a valid regular expression.
    invalid_constraint,

    /// The pattern has more segments than the configured maximum.
    too_many_segments,

    /// A literal segment contains an unescaped '*' (strict mode).
    invalid_wildcard,

    /// Braces do not span a whole segment (strict mode).
    invalid_variable_segment,

    /// The same variable name is bound twice (strict mode).
    duplicate_variable
};

//------------------------------------------------

/** Exception thrown when a pattern fails to compile.

    The error code identifies the problem. The
    offending pattern text and, where known, the
    character offset of the problem are available
    for diagnostics.
*/
class PATHMATCH_SYMBOL_VISIBLE
    invalid_pattern
    : public system::system_error
{
    std::string pattern_;
    std::size_t position_;

public:
    /// Returned by @ref position when no offset is known.
    static constexpr std::size_t npos = std::size_t(-1);

    PATHMATCH_DECL
    invalid_pattern(
        system::error_code const& ec,
        core::string_view pattern,
        std::size_t position = npos);

    /// Return the pattern which failed to compile.
    std::string const&
    pattern() const noexcept
    {
        return pattern_;
    }

    /// Return the offset of the problem, or @ref npos.
    std::size_t
    position() const noexcept
    {
        return position_;
    }
};

} // pathmatch

#include <pathmatch/impl/error.hpp>

#endif
