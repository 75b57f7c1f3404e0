//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_PATTERN_COMPILER_HPP
#define PATHMATCH_PATTERN_COMPILER_HPP

#include <pathmatch/detail/config.hpp>
#include <pathmatch/compiled_pattern.hpp>
#include <pathmatch/match_result.hpp>
#include <pathmatch/parser_config.hpp>
#include <boost/system/error_code.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pathmatch {

#ifdef BOOST_MSVC
#pragma warning(push)
#pragma warning(disable: 4251) // unique_ptr needs dll-interface
#endif

/** Compiles path patterns and matches paths against them

    Patterns have this syntax:

    @code
    pattern     = "/" [ segment *( "/" segment ) ] [ "/" ]
    segment     = "**" / "*" / variable / literal
    variable    = "{" name [ ":" constraint ] "}"
    @endcode

    A literal matches one path component with the
    same text. A backslash escapes the character
    after it, so "\*" and "\{" are literal text. A
    variable matches any non-empty component and
    binds it to the name. The optional constraint is
    a regular expression which the whole component
    must match. '*' matches exactly one component,
    and '**' matches one or more.

    Compiled patterns and match results are kept in
    bounded caches which evict the least recently
    used entry. Changing the configuration empties
    both caches.

    @par Thread Safety
    All member functions may be called concurrently.

    @par Example
    @code
    pattern_compiler pc;
    auto p = pc.compile( "/api/users/{id:[0-9]+}" );
    auto r = pc.match( "/api/users/42", p );
    assert( r.matched() );
    assert( *r.find( "id" ) == "42" );
    @endcode
*/
class PATHMATCH_DECL
    pattern_compiler
{
public:
    /** Constructor

        @throws std::invalid_argument The
        configuration is not valid.
    */
    explicit
    pattern_compiler(
        parser_config cfg = {});

    ~pattern_compiler();

    pattern_compiler(
        pattern_compiler const&) = delete;
    pattern_compiler& operator=(
        pattern_compiler const&) = delete;

    /** Compile a pattern

        Leading and trailing whitespace is ignored.
        The flags of the current configuration are
        stored in the result.

        @throws invalid_pattern The pattern is not
        valid.
    */
    compiled_pattern
    compile(core::string_view pattern);

    /** Compile a pattern

        @param ec Set to the error on failure.

        @return The compiled pattern, or an empty
        optional on failure.
    */
    std::optional<compiled_pattern>
    compile(
        core::string_view pattern,
        system::error_code& ec);

    /// Match a path against a pattern, caching the result.
    match_result
    match(
        core::string_view path,
        compiled_pattern const& pattern);

    /** Match a path against the most specific of several patterns

        The result is cached.

        @see pathmatch::match_best
    */
    match_result
    match_best(
        core::string_view path,
        std::span<compiled_pattern const> patterns);

    /** Return true if a path matches a pattern string

        An invalid pattern never matches.
    */
    bool
    matches(
        core::string_view path,
        core::string_view pattern);

    /** Return the variable names of a pattern string

        An invalid pattern has no names.
    */
    std::vector<std::string>
    variable_names(core::string_view pattern);

    /// Return the current configuration.
    std::shared_ptr<parser_config const>
    config() const;

    /** Replace the configuration

        Both caches are emptied.

        @throws std::invalid_argument The
        configuration is not valid.
    */
    pattern_compiler&
    set_config(parser_config cfg);

    /// Set case-insensitive matching of literals.
    pattern_compiler&
    case_insensitive(bool value);

    /// Set whether a trailing slash is optional.
    pattern_compiler&
    optional_trailing_slash(bool value);

    /// Set strict compilation.
    pattern_compiler&
    strict(bool value);

    /// Return the number of cached patterns.
    std::size_t
    pattern_cache_size() const;

    /// Return the number of cached match results.
    std::size_t
    match_cache_size() const;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

#ifdef BOOST_MSVC
#pragma warning(pop)
#endif

} // pathmatch

#endif
