//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_MATCHER_HPP
#define PATHMATCH_MATCHER_HPP

#include <pathmatch/detail/config.hpp>
#include <pathmatch/compiled_pattern.hpp>
#include <pathmatch/match_result.hpp>
#include <boost/core/detail/string_view.hpp>
#include <span>

namespace pathmatch {

/** Match a path against a compiled pattern

    The path must begin with '/'. Leading and
    trailing whitespace is ignored. A path which
    contains an empty component, as in "/a//b",
    never matches.

    Matching never fails with an error: a path
    which does not match, including a malformed
    path, yields a result where `matched()` is
    `false`.

    @par Example
    @code
    pattern_compiler pc;
    auto p = pc.compile( "/users/{id}/**" );
    auto r = match( "/users/42/a/b", p );
    assert( r.variables().at( "id" ) == "42" );
    assert( r.captures().front() == "a/b" );
    @endcode

    @param path The request path.
    @param pattern The pattern to match against.
*/
PATHMATCH_DECL
match_result
match(
    core::string_view path,
    compiled_pattern const& pattern);

/** Match a path against the most specific of several patterns

    Candidates are tried from most to least
    specific, as ordered by @ref more_specific,
    and the first match is returned. When none
    match, the result has an empty pattern.

    @param path The request path.
    @param patterns The candidates, in any order.
*/
PATHMATCH_DECL
match_result
match_best(
    core::string_view path,
    std::span<compiled_pattern const> patterns);

/** A strict weak ordering of patterns by specificity

    A pattern orders before another when it is:
    @li static while the other is not, else
    @li has fewer '**' segments, else
    @li has a higher specificity rank, else
    @li has a lexicographically smaller source.
*/
struct more_specific
{
    PATHMATCH_DECL
    bool
    operator()(
        compiled_pattern const& a,
        compiled_pattern const& b) const noexcept;
};

} // pathmatch

#endif
