//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <pathmatch/pattern_compiler.hpp>
#include <pathmatch/matcher.hpp>

#include "unit_test.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace pathmatch {

// Results computed from several threads at once
// agree with results computed from one thread.
struct concurrency_test
{
    struct job
    {
        char const* path;
        char const* pattern;
    };

    static
    std::vector<job>
    jobs()
    {
        return {
            { "/api/users/42/posts/7", "/api/users/{id}/posts/{postId}" },
            { "/health", "/health" },
            { "/healthz", "/health" },
            { "/files/a.png", "/files/*" },
            { "/files/a/b.png", "/files/*" },
            { "/api/v1/users", "/api/**" },
            { "/api", "/api/**" },
            { "/static/a/b/file.js", "/static/**/file.js" },
            { "/static/file.js", "/static/**/file.js" },
            { "/items/123", "/items/{sku:[0-9]+}" },
            { "/items/abc", "/items/{sku:[0-9]+}" },
            { "/a/1/2/m/3/z", "/a/**/m/**/z" },
        };
    }

    void
    testCompileAndMatch()
    {
        auto const v = jobs();

        std::vector<match_result> expected;
        {
            pattern_compiler pc;
            for(auto const& j : v)
                expected.push_back(
                    match(j.path, pc.compile(j.pattern)));
        }

        parser_config cfg;
        cfg.cache_capacity = 8;
        pattern_compiler pc(cfg);
        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        for(int t = 0; t < 8; ++t)
        {
            threads.emplace_back([&, t]
            {
                for(int i = 0; i < 200; ++i)
                {
                    auto const n = (i + t) % v.size();
                    auto p = pc.compile(v[n].pattern);
                    if(pc.match(v[n].path, p) != expected[n])
                        ++failures;
                    if(pc.matches(v[n].path, v[n].pattern) !=
                            expected[n].matched())
                        ++failures;
                }
            });
        }
        for(auto& th : threads)
            th.join();
        BOOST_TEST_EQ(failures.load(), 0);
    }

    void
    testBest()
    {
        pattern_compiler pc;
        std::vector<compiled_pattern> v{
            pc.compile("/users/{id}"),
            pc.compile("/users/me"),
            pc.compile("/users/**") };
        std::atomic<int> failures{0};
        std::vector<std::thread> threads;
        for(int t = 0; t < 4; ++t)
        {
            threads.emplace_back([&]
            {
                for(int i = 0; i < 500; ++i)
                {
                    if(pc.match_best("/users/me", v).pattern() != "/users/me")
                        ++failures;
                    if(pc.match_best("/users/7", v).pattern() != "/users/{id}")
                        ++failures;
                    if(pc.match_best("/users/7/x", v).pattern() != "/users/**")
                        ++failures;
                }
            });
        }
        for(auto& th : threads)
            th.join();
        BOOST_TEST_EQ(failures.load(), 0);
    }

    void
    testConfigChanges()
    {
        pattern_compiler pc;
        std::atomic<bool> done{false};
        std::atomic<int> failures{0};
        std::thread writer([&]
        {
            for(int i = 0; i < 100; ++i)
                pc.optional_trailing_slash(i % 2 == 0);
            done = true;
        });
        std::thread reader([&]
        {
            while(! done)
            {
                auto p = pc.compile("/a/{b}");
                auto r = pc.match("/a/x", p);
                if(! r.matched() || *r.find("b") != "x")
                    ++failures;
            }
        });
        writer.join();
        reader.join();
        BOOST_TEST_EQ(failures.load(), 0);
    }

    void
    run()
    {
        testCompileAndMatch();
        testBest();
        testConfigChanges();
    }
};

} // pathmatch

PATHMATCH_TEST_SUITE(
    concurrency_test,
    "pathmatch.concurrency")
