//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/log.hpp>
#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>

namespace pathmatch {

namespace {

std::shared_ptr<spdlog::logger>
make_default_logger()
{
    // not registered, so a host logger with the
    // same name does not collide
    auto lg = std::make_shared<spdlog::logger>(
        "pathmatch",
        std::make_shared<
            spdlog::sinks::stderr_color_sink_mt>());
    lg->set_level(spdlog::level::warn);
    return lg;
}

struct logger_slot
{
    std::mutex m;
    std::shared_ptr<spdlog::logger> lg =
        make_default_logger();
};

logger_slot&
slot()
{
    static logger_slot s;
    return s;
}

} // (anon)

void
set_logger(std::shared_ptr<spdlog::logger> lg)
{
    if(! lg)
        lg = make_default_logger();
    auto& s = slot();
    std::lock_guard<std::mutex> lock(s.m);
    s.lg = std::move(lg);
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto& s = slot();
    std::lock_guard<std::mutex> lock(s.m);
    return s.lg;
}

} // pathmatch
