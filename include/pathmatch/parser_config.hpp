//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_PARSER_CONFIG_HPP
#define PATHMATCH_PARSER_CONFIG_HPP

#include <pathmatch/detail/config.hpp>
#include <cstddef>
#include <memory>

namespace pathmatch {

/** Pattern compiler configuration settings.

    @see @ref make_parser_config,
         @ref pattern_compiler.
*/
struct parser_config
{
    /** Compare literal segments without regard to case.

        Only ASCII letters are folded. Variable
        constraints are always case-sensitive.
    */
    bool case_insensitive = false;

    /** Ignore a single trailing '/' on paths and patterns.

        When false, a path matches only if it agrees
        with the pattern on the presence of a trailing
        slash. The root path "/" is never affected.
    */
    bool optional_trailing_slash = false;

    /** Reject ambiguous pattern syntax.

        In strict mode a pattern fails to compile when a
        literal segment contains an unescaped '*', when
        braces do not span a whole segment, or when a
        variable name appears twice.
    */
    bool strict = false;

    /** Maximum number of segments in a pattern.

        This also bounds the depth of backtracking
        when matching. This cannot be zero.
    */
    std::size_t max_segments = 256;

    /** Maximum entries in each compiler cache.

        Least recently used entries are evicted once
        the limit is reached. Zero disables caching.
    */
    std::size_t cache_capacity = 1000;
};

/** Return a validated, immutable copy of a configuration.

    @throws std::invalid_argument `cfg.max_segments == 0`.
*/
PATHMATCH_DECL
std::shared_ptr<parser_config const>
make_parser_config(parser_config cfg);

} // pathmatch

#endif
