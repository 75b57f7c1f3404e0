//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_HPP
#define PATHMATCH_HPP

#include <pathmatch/compiled_pattern.hpp>
#include <pathmatch/error.hpp>
#include <pathmatch/escape.hpp>
#include <pathmatch/log.hpp>
#include <pathmatch/match_result.hpp>
#include <pathmatch/matcher.hpp>
#include <pathmatch/parser_config.hpp>
#include <pathmatch/pattern_compiler.hpp>
#include <pathmatch/segment.hpp>

#endif
