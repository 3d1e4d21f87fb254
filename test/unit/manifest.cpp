//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <emroute/manifest.hpp>

#include <emroute/route_trie.hpp>

#include <boost/core/lightweight_test.hpp>
#include <boost/system/system_error.hpp>

#include <string>
#include <vector>

namespace emroute {

struct manifest_test
{
    static
    pattern
    parse(core::string_view s)
    {
        auto rv = parse_pattern(s);
        BOOST_TEST(rv.has_value());
        if(rv.has_error())
            return {};
        return *rv;
    }

    // a orders strictly before b
    void
    check(
        core::string_view a,
        core::string_view b)
    {
        BOOST_TEST_LT(compare_specificity(parse(a), parse(b)), 0);
        BOOST_TEST_GT(compare_specificity(parse(b), parse(a)), 0);
    }

    void
    checkEqual(
        core::string_view a,
        core::string_view b)
    {
        BOOST_TEST_EQ(compare_specificity(parse(a), parse(b)), 0);
        BOOST_TEST_EQ(compare_specificity(parse(b), parse(a)), 0);
    }

    void
    testCompare()
    {
        // catch-alls last
        check("/a", "/a/b/:rest*");
        check("/:x", "/:rest*");

        // more segments first
        check("/a/b/c", "/a/b");
        check("/:x/:y", "/a");
        check("/a/:r/:s/:rest*", "/a/:rest*");

        // literal before parameter
        check("/a/b", "/a/:x");
        check("/a/:x", "/:y/b");
        check("/a/:rest*", "/:p/:rest*");

        checkEqual("/a/:x", "/a/:y");
        checkEqual("/", "/");
        checkEqual("/a/:rest*", "/a/:other*");
    }

    // the trie and the comparator agree,
    // whatever the registration order
    void
    testAgreesWithTrie()
    {
        struct
        {
            char const* general;
            char const* specific;
            char const* path;
        } const cases[] = {
            { "/a/:x",       "/a/b",         "/a/b" },
            { "/a/:rest*",   "/a/:x",        "/a/q" },
            { "/a/:rest*",   "/a/b/c",       "/a/b/c" },
            { "/:x/b",       "/a/:y",        "/a/b" },
            { "/:rest*",     "/docs/:rest*", "/docs/x" },
        };
        for(auto const& c : cases)
        {
            check(c.specific, c.general);

            route_config g{ c.general };
            route_config s{ c.specific };
            route_trie t;
            t.insert(g.pattern, g);
            t.insert(s.pattern, s);
            auto mr = t.match(c.path);
            if(BOOST_TEST(mr.has_value()))
                BOOST_TEST_EQ(mr->route->pattern, c.specific);
        }
    }

    void
    testSort()
    {
        std::vector<route_config> v;
        for(auto s : {
            "/:rest*",
            "/about",
            "/projects/:id",
            "/projects/new",
            "/docs/:rest*",
            "/projects/:id/tasks",
            "/",
            "/contact" })
        {
            route_config rc;
            rc.pattern = s;
            v.push_back(rc);
        }

        sort_by_specificity(v);

        std::vector<std::string> got;
        for(auto const& rc : v)
            got.push_back(rc.pattern);
        std::vector<std::string> const want = {
            "/projects/:id/tasks",
            "/projects/new",
            "/projects/:id",
            "/about",
            "/contact",
            "/",
            "/docs/:rest*",
            "/:rest*" };
        BOOST_TEST_ALL_EQ(
            got.begin(), got.end(),
            want.begin(), want.end());
    }

    void
    testSortMalformed()
    {
        std::vector<route_config> v(3);
        v[0].pattern = "/:rest*";
        v[1].pattern = "/a/:x*/b";
        v[2].pattern = "/a";
        BOOST_TEST_THROWS(
            sort_by_specificity(v),
            system::system_error);

        // left untouched
        if(BOOST_TEST_EQ(v.size(), 3u))
        {
            BOOST_TEST_EQ(v[0].pattern, "/:rest*");
            BOOST_TEST_EQ(v[1].pattern, "/a/:x*/b");
            BOOST_TEST_EQ(v[2].pattern, "/a");
        }
    }

    void
    testManifest()
    {
        route_manifest m;
        BOOST_TEST(m.routes.empty());
        BOOST_TEST(m.error_boundaries.empty());
        BOOST_TEST(m.status_pages.empty());
        BOOST_TEST(! m.error_handler);

        route_config nf;
        nf.pattern = "/404";
        nf.status_code = 404;
        m.status_pages[404] = nf;
        m.error_handler = route_config{ "/", route_kind::error, "routes/index.error.ts" };
        BOOST_TEST_EQ(m.status_pages.at(404).status_code, 404u);
        BOOST_TEST(m.error_handler->kind == route_kind::error);
    }

    void
    run()
    {
        testCompare();
        testAgreesWithTrie();
        testSort();
        testSortMalformed();
        testManifest();
    }
};

} // emroute

int main()
{
    emroute::manifest_test().run();
    return boost::report_errors();
}
