//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_LOG_HPP
#define PATHMATCH_LOG_HPP

#include <pathmatch/detail/config.hpp>
#include <memory>

namespace spdlog {
class logger;
} // spdlog

namespace pathmatch {

/** Install the logger used by the library

    By default the library logs to a logger named
    "pathmatch" which writes warnings and worse to
    standard error. The library reports failed
    compilations and configuration changes at the
    debug level, and cache evictions at the trace
    level.

    @param lg The new logger. If null, the default
    logger is restored.
*/
PATHMATCH_DECL
void
set_logger(std::shared_ptr<spdlog::logger> lg);

/// Return the logger used by the library.
PATHMATCH_DECL
std::shared_ptr<spdlog::logger>
get_logger();

} // pathmatch

#endif
