//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathmatch/escape.hpp>

#include <pathmatch/pattern_compiler.hpp>
#include <pathmatch/matcher.hpp>

#include "unit_test.hpp"

namespace pathmatch {

struct escape_test
{
    void
    testEscape()
    {
        BOOST_TEST_EQ(escape(""), "");
        BOOST_TEST_EQ(escape("users"), "users");
        BOOST_TEST_EQ(escape("*"), "\\*");
        BOOST_TEST_EQ(escape("**"), "\\*\\*");
        BOOST_TEST_EQ(escape("{id}"), "\\{id\\}");
        BOOST_TEST_EQ(escape("a\\b"), "a\\\\b");
        BOOST_TEST_EQ(escape("file.*.js"), "file.\\*.js");
    }

    // escaped text compiles to a literal with the original value
    void
    testRoundTrip()
    {
        pattern_compiler pc;
        for(auto s : {
            "*", "**", "{id}", "a\\b", "x{y}z", "v1.*" })
        {
            auto p = pc.compile("/" + escape(s));
            BOOST_TEST_EQ(p.segments().size(), 1u);
            BOOST_TEST(p.segments()[0].is_literal());
            BOOST_TEST_EQ(p.segments()[0].text(), s);
            BOOST_TEST(p.is_static());
            BOOST_TEST(match(std::string("/") + s, p).matched());
        }

        // not a wildcard once escaped
        auto p = pc.compile("/files/" + escape("*"));
        BOOST_TEST(match("/files/*", p).matched());
        BOOST_TEST(! match("/files/a", p).matched());
    }

    void
    run()
    {
        testEscape();
        testRoundTrip();
    }
};

} // pathmatch

PATHMATCH_TEST_SUITE(
    escape_test,
    "pathmatch.escape")
