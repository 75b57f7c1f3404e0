//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_COMPILED_PATTERN_HPP
#define PATHMATCH_COMPILED_PATTERN_HPP

#include <pathmatch/detail/config.hpp>
#include <pathmatch/segment.hpp>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace pathmatch {

#ifdef BOOST_MSVC
#pragma warning(push)
#pragma warning(disable: 4251) // shared_ptr needs dll-interface
#endif

/** A route pattern ready for matching.

    Instances are produced by @ref pattern_compiler.
    The segments and all derived properties are
    computed once at construction and never change.
    Copies share the same immutable representation,
    so a compiled pattern may be used from any number
    of threads without synchronization.
*/
class PATHMATCH_DECL
    compiled_pattern
{
    struct impl;
    std::shared_ptr<impl const> impl_;

public:
    /** Constructor

        @param source The normalized pattern text.
        @param segments The parsed segments, in order.
        @param case_insensitive Compare literals without regard to case.
        @param optional_trailing_slash Ignore a trailing '/'.
    */
    compiled_pattern(
        std::string source,
        std::vector<segment> segments,
        bool case_insensitive = false,
        bool optional_trailing_slash = false);

    /// Return the normalized pattern text.
    std::string const& source() const noexcept;

    /// Return the segments in order.
    std::vector<segment> const& segments() const noexcept;

    /// Return true if there are no wildcards or variables.
    bool is_static() const noexcept;

    /// Return true if any segment is '*' or '**'.
    bool has_wildcard() const noexcept;

    /// Return true if any segment is a variable.
    bool has_variables() const noexcept;

    bool case_insensitive() const noexcept;

    bool optional_trailing_slash() const noexcept;

    /** Return true if the source text ends in '/'.

        Always false for the root pattern "/".
    */
    bool trailing_slash() const noexcept;

    /** Return the specificity rank.

        Larger values are more specific. The rank is
        a weighted sum over the segments: a literal
        counts most, then a constrained variable, a
        variable, '*', and '**' least.
    */
    std::size_t specificity_rank() const noexcept;

    /// Return the number of '**' segments.
    std::size_t multi_wildcard_count() const noexcept;

    /** Return the variable names in pattern order

        A name bound more than once appears once,
        at its first position.
    */
    std::vector<std::string> variable_names() const;

    /// Return true if both refer to the same representation.
    bool shares(compiled_pattern const& other) const noexcept
    {
        return impl_ == other.impl_;
    }

    /** Return the rank contributed by one segment.
    */
    static std::size_t rank_of(segment const& s) noexcept;

    friend
    PATHMATCH_DECL
    bool
    operator==(
        compiled_pattern const& a,
        compiled_pattern const& b) noexcept;

    friend
    bool
    operator!=(
        compiled_pattern const& a,
        compiled_pattern const& b) noexcept
    {
        return !(a == b);
    }
};

#ifdef BOOST_MSVC
#pragma warning(pop)
#endif

} // pathmatch

#endif
