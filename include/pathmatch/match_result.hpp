//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_MATCH_RESULT_HPP
#define PATHMATCH_MATCH_RESULT_HPP

#include <pathmatch/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace pathmatch {

/** Variables bound by a successful match, keyed by name.
*/
using variable_map = std::map<
    std::string, std::string, std::less<>>;

/** The outcome of matching one path against one pattern.

    A default-constructed result does not match.
    Results are plain values and may be copied
    and shared freely.
*/
class match_result
{
public:
    match_result() = default;

    /** Return a result which does not match.
    */
    PATHMATCH_DECL
    static
    match_result
    no_match(
        core::string_view path,
        core::string_view pattern);

    /** Constructor

        Creates a successful result.
    */
    PATHMATCH_DECL
    match_result(
        std::string path,
        std::string pattern,
        std::vector<std::string> segments,
        variable_map variables,
        std::vector<std::string> captures);

    /// Return true if the path matched.
    bool
    matched() const noexcept
    {
        return matched_;
    }

    /// Return true if the path matched.
    explicit
    operator bool() const noexcept
    {
        return matched_;
    }

    /// Return the path which was matched.
    std::string const&
    path() const noexcept
    {
        return path_;
    }

    /// Return the source text of the pattern.
    std::string const&
    pattern() const noexcept
    {
        return pattern_;
    }

    /** Return the path components.

        Empty unless the path matched.
    */
    std::vector<std::string> const&
    segments() const noexcept
    {
        return segments_;
    }

    /// Return the bound variables.
    variable_map const&
    variables() const noexcept
    {
        return variables_;
    }

    /** Return the text consumed by each wildcard.

        One entry per '*' or '**' segment, in
        pattern order. Components consumed by a
        '**' are joined with '/'.
    */
    std::vector<std::string> const&
    captures() const noexcept
    {
        return captures_;
    }

    /** Return the value of a variable, or nullptr.
    */
    PATHMATCH_DECL
    std::string const*
    find(core::string_view name) const noexcept;

    /// Return true if a variable with this name was bound.
    bool
    contains(core::string_view name) const noexcept
    {
        return find(name) != nullptr;
    }

    /// Return the names of the bound variables.
    PATHMATCH_DECL
    std::vector<std::string>
    variable_names() const;

    PATHMATCH_DECL
    friend
    bool
    operator==(
        match_result const& a,
        match_result const& b) noexcept;

    friend
    bool
    operator!=(
        match_result const& a,
        match_result const& b) noexcept
    {
        return !(a == b);
    }

private:
    std::string path_;
    std::string pattern_;
    std::vector<std::string> segments_;
    variable_map variables_;
    std::vector<std::string> captures_;
    bool matched_ = false;
};

} // pathmatch

#endif
