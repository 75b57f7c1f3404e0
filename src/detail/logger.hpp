//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef PATHMATCH_SRC_DETAIL_LOGGER_HPP
#define PATHMATCH_SRC_DETAIL_LOGGER_HPP

#include <pathmatch/log.hpp>
#include <spdlog/spdlog.h>

// The level is checked before the arguments are formatted
#define PATHMATCH_LOG(LEVEL, ...)                                   \
    do {                                                            \
        auto const pathmatch_lg_ = ::pathmatch::get_logger();       \
        if(pathmatch_lg_->should_log(::spdlog::level::LEVEL))       \
            pathmatch_lg_->log(                                     \
                ::spdlog::source_loc{__FILE__, __LINE__, __func__}, \
                ::spdlog::level::LEVEL, __VA_ARGS__);               \
    } while(false)

#endif
