//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <pathmatch/segment.hpp>

#include <pathmatch/error.hpp>

#include "unit_test.hpp"

namespace pathmatch {

struct segment_test
{
    void
    testLiteral()
    {
        auto s = segment::literal("users");
        BOOST_TEST(s.kind() == segment_kind::literal);
        BOOST_TEST(s.is_literal());
        BOOST_TEST(! s.is_variable());
        BOOST_TEST(! s.is_wildcard());
        BOOST_TEST(! s.has_constraint());
        BOOST_TEST_EQ(s.text(), "users");
        BOOST_TEST(s.constraint().empty());

        BOOST_TEST(  s.matches("users"));
        BOOST_TEST(! s.matches("Users"));
        BOOST_TEST(  s.matches("Users", true));
        BOOST_TEST(  s.matches("USERS", true));
        BOOST_TEST(! s.matches("user", true));
        BOOST_TEST(! s.matches(""));

        variable_map vars;
        s.extract_variables("users", vars);
        BOOST_TEST(vars.empty());

        BOOST_TEST_EQ(s.to_string(), "users");
        BOOST_TEST_EQ(
            segment::literal("a*{b}").to_string(),
            "a\\*\\{b\\}");
    }

    void
    testVariable()
    {
        auto s = segment::variable("id");
        BOOST_TEST(s.kind() == segment_kind::variable);
        BOOST_TEST(s.is_variable());
        BOOST_TEST(! s.has_constraint());
        BOOST_TEST_EQ(s.text(), "id");
        BOOST_TEST(s.matches("42"));
        BOOST_TEST(s.matches("anything"));
        BOOST_TEST(! s.matches(""));
        BOOST_TEST_EQ(s.to_string(), "{id}");

        variable_map vars;
        s.extract_variables("42", vars);
        BOOST_TEST_EQ(vars.size(), 1u);
        BOOST_TEST_EQ(vars["id"], "42");

        // a later binding replaces an earlier one
        s.extract_variables("43", vars);
        BOOST_TEST_EQ(vars["id"], "43");
    }

    void
    testConstraint()
    {
        auto s = segment::variable("id", "[0-9]+");
        BOOST_TEST(s.has_constraint());
        BOOST_TEST_EQ(s.constraint(), "[0-9]+");
        BOOST_TEST(  s.matches("123"));
        BOOST_TEST(! s.matches("abc"));

        // the whole component must match
        BOOST_TEST(! s.matches("12a"));
        BOOST_TEST(! s.matches("a12"));
        BOOST_TEST_EQ(s.to_string(), "{id:[0-9]+}");

        // constraints ignore the case flag
        auto t = segment::variable("v", "[a-z]+");
        BOOST_TEST(  t.matches("abc", true));
        BOOST_TEST(! t.matches("ABC", true));

        // empty constraint means none
        system::error_code ec;
        auto u = segment::variable("x", "", ec);
        BOOST_TEST(! ec.failed());
        BOOST_TEST(! u.has_constraint());

        segment::variable("x", "[0-9", ec);
        BOOST_TEST(ec == error::invalid_constraint);

        BOOST_TEST_THROWS(
            segment::variable("x", "(abc"),
            invalid_pattern);
    }

    void
    testWildcard()
    {
        auto s = segment::wildcard();
        BOOST_TEST(s.kind() == segment_kind::wildcard);
        BOOST_TEST(s.is_wildcard());
        BOOST_TEST(! s.is_multi_wildcard());
        BOOST_TEST(s.text().empty());
        BOOST_TEST(s.matches("anything"));
        BOOST_TEST_EQ(s.to_string(), "*");

        auto m = segment::wildcard(true);
        BOOST_TEST(m.kind() == segment_kind::multi_wildcard);
        BOOST_TEST(m.is_wildcard());
        BOOST_TEST(m.is_multi_wildcard());
        BOOST_TEST_EQ(m.to_string(), "**");

        variable_map vars;
        m.extract_variables("a", vars);
        BOOST_TEST(vars.empty());
    }

    void
    testEquality()
    {
        BOOST_TEST(segment::literal("a") == segment::literal("a"));
        BOOST_TEST(segment::literal("a") != segment::literal("b"));
        BOOST_TEST(segment::literal("a") != segment::variable("a"));
        BOOST_TEST(segment::variable("a") == segment::variable("a"));
        BOOST_TEST(
            segment::variable("a", "[0-9]+") !=
            segment::variable("a"));
        BOOST_TEST(segment::wildcard() == segment::wildcard());
        BOOST_TEST(segment::wildcard() != segment::wildcard(true));

        // copies share the compiled constraint
        auto s = segment::variable("id", "[0-9]+");
        auto t = s;
        BOOST_TEST(s == t);
        BOOST_TEST(t.matches("7"));
    }

    void
    run()
    {
        testLiteral();
        testVariable();
        testConstraint();
        testWildcard();
        testEquality();
    }
};

} // pathmatch

PATHMATCH_TEST_SUITE(
    segment_test,
    "pathmatch.segment")
