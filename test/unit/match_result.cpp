//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathmatch/match_result.hpp>

#include "unit_test.hpp"

namespace pathmatch {

struct match_result_test
{
    void
    testDefault()
    {
        match_result r;
        BOOST_TEST(! r.matched());
        BOOST_TEST(! r);
        BOOST_TEST(r.path().empty());
        BOOST_TEST(r.pattern().empty());
        BOOST_TEST(r.segments().empty());
        BOOST_TEST(r.variables().empty());
        BOOST_TEST(r.captures().empty());
        BOOST_TEST(r.find("id") == nullptr);
        BOOST_TEST(r.variable_names().empty());
    }

    void
    testNoMatch()
    {
        auto r = match_result::no_match("/a", "/b");
        BOOST_TEST(! r.matched());
        BOOST_TEST_EQ(r.path(), "/a");
        BOOST_TEST_EQ(r.pattern(), "/b");
        BOOST_TEST(r.variables().empty());
        BOOST_TEST(r != match_result());
        BOOST_TEST(r == match_result::no_match("/a", "/b"));
    }

    void
    testMatched()
    {
        match_result r(
            "/users/42/files/a/b",
            "/users/{id}/files/**",
            { "users", "42", "files", "a", "b" },
            { { "id", "42" } },
            { "a/b" });
        BOOST_TEST(r.matched());
        BOOST_TEST(static_cast<bool>(r));
        BOOST_TEST_EQ(r.segments().size(), 5u);
        BOOST_TEST(r.contains("id"));
        BOOST_TEST(! r.contains("ID"));
        BOOST_TEST_EQ(*r.find("id"), "42");
        BOOST_TEST_EQ(r.captures().size(), 1u);
        BOOST_TEST_EQ(r.captures()[0], "a/b");

        auto const names = r.variable_names();
        BOOST_TEST_EQ(names.size(), 1u);
        BOOST_TEST_EQ(names[0], "id");

        auto copy = r;
        BOOST_TEST(copy == r);
        BOOST_TEST(copy != match_result::no_match(
            r.path(), r.pattern()));
    }

    void
    run()
    {
        testDefault();
        testNoMatch();
        testMatched();
    }
};

} // pathmatch

PATHMATCH_TEST_SUITE(
    match_result_test,
    "pathmatch.match_result")
