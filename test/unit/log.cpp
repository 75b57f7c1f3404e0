//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathmatch/log.hpp>

#include <pathmatch/pattern_compiler.hpp>
#include <spdlog/logger.h>
#include <spdlog/sinks/ostream_sink.h>

#include "unit_test.hpp"

#include <sstream>

namespace pathmatch {

struct log_test
{
    void
    testDefault()
    {
        auto lg = get_logger();
        BOOST_TEST(lg != nullptr);
        BOOST_TEST_EQ(lg->name(), "pathmatch");
        BOOST_TEST(lg->level() == spdlog::level::warn);
    }

    void
    testCapture()
    {
        std::ostringstream os;
        auto sink = std::make_shared<
            spdlog::sinks::ostream_sink_mt>(os);
        auto lg = std::make_shared<
            spdlog::logger>("test", sink);
        lg->set_pattern("%l %v");
        lg->set_level(spdlog::level::trace);
        set_logger(lg);
        BOOST_TEST(get_logger() == lg);

        parser_config cfg;
        cfg.cache_capacity = 1;
        pattern_compiler pc(cfg);
        system::error_code ec;
        pc.compile("/bad//pattern", ec);
        BOOST_TEST(ec.failed());
        lg->flush();
        auto s = os.str();
        BOOST_TEST(s.find("debug") != std::string::npos);
        BOOST_TEST(s.find("/bad//pattern") != std::string::npos);

        // evictions are traced
        os.str({});
        pc.compile("/a");
        pc.compile("/b");
        lg->flush();
        s = os.str();
        BOOST_TEST(s.find("trace") != std::string::npos);
        BOOST_TEST(s.find("least recently used") != std::string::npos);
        BOOST_TEST(s.find("inserting \"/b\"") != std::string::npos);

        // configuration changes are logged
        os.str({});
        pc.strict(true);
        lg->flush();
        s = os.str();
        BOOST_TEST(s.find("strict=true") != std::string::npos);

        // nothing below the level is written
        os.str({});
        lg->set_level(spdlog::level::warn);
        pc.compile("", ec);
        lg->flush();
        BOOST_TEST(os.str().empty());

        // null restores the default
        set_logger(nullptr);
        BOOST_TEST_EQ(get_logger()->name(), "pathmatch");
    }

    void
    run()
    {
        testDefault();
        testCapture();
    }
};

} // pathmatch

PATHMATCH_TEST_SUITE(
    log_test,
    "pathmatch.log")
