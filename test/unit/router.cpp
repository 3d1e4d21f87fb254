//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <emroute/router.hpp>

#include <boost/core/lightweight_test.hpp>
#include <boost/system/system_error.hpp>
#include <boost/url/parse.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace emroute {

struct router_test
{
    static
    route_manifest
    make_manifest()
    {
        route_manifest m;
        m.routes.push_back({ "/" , route_kind::page, "routes/index.page.ts" });
        m.routes.push_back({ "/about", route_kind::page, "routes/about.page.md" });
        m.routes.push_back({ "/projects/:id", route_kind::page,
            "routes/projects/[id].page.ts" });
        m.routes.push_back({ "/docs/:rest*", route_kind::page,
            "routes/docs/[...rest].page.ts" });
        m.error_boundaries.push_back({ "/projects",
            "routes/projects/index.error.ts" });
        m.status_pages[404] = route_config{ "/404",
            route_kind::error, "routes/404.page.html", {}, {}, 404 };
        m.error_handler = route_config{ "/",
            route_kind::error, "routes/index.error.ts" };
        return m;
    }

    void
    testTable()
    {
        auto t = make_route_table(make_manifest());
        BOOST_TEST_EQ(t->trie().size(), 4u);
        BOOST_TEST_EQ(t->manifest().routes.size(), 4u);

        auto mr = t->match("/projects/9");
        if(BOOST_TEST(mr.has_value()))
        {
            BOOST_TEST_EQ(mr->route->module_path,
                "routes/projects/[id].page.ts");
            BOOST_TEST_EQ(mr->params.at("id"), "9");
        }

        auto eb = t->find_boundary("/projects/9");
        if(BOOST_TEST(eb != nullptr))
            BOOST_TEST_EQ(eb->pattern, "/projects");

        auto sp = t->status_page(404);
        if(BOOST_TEST(sp != nullptr))
            BOOST_TEST_EQ(sp->status_code, 404u);
        BOOST_TEST(t->status_page(500) == nullptr);

        auto eh = t->error_handler();
        if(BOOST_TEST(eh != nullptr))
            BOOST_TEST_EQ(eh->module_path, "routes/index.error.ts");

        BOOST_TEST(t->find_route("/docs/:path*") != nullptr);

        // empty manifest
        auto t0 = make_route_table({});
        BOOST_TEST_EQ(t0->trie().size(), 0u);
        BOOST_TEST(t0->error_handler() == nullptr);
        BOOST_TEST(! t0->match("/").has_value());

        // malformed
        route_manifest bad;
        bad.routes.push_back({ "/a/:rest*/b" });
        BOOST_TEST_THROWS(
            make_route_table(std::move(bad)),
            system::system_error);
    }

    void
    testMatch()
    {
        router r(make_manifest());

        auto rr = r.match("/projects/42");
        if(BOOST_TEST(rr.has_value()))
        {
            BOOST_TEST(rr->route != nullptr);
            BOOST_TEST_EQ(rr->route->pattern, "/projects/:id");
            BOOST_TEST_EQ(rr->params.at("id"), "42");
        }

        rr = r.match("/docs/a/b%20c");
        if(BOOST_TEST(rr.has_value()))
            BOOST_TEST_EQ(rr->params.at("rest"), "a/b c");

        rr = r.match("/about/");
        if(BOOST_TEST(rr.has_value()))
            BOOST_TEST_EQ(rr->route->pattern, "/about");

        BOOST_TEST(! r.match("/projects").has_value());
        BOOST_TEST(! r.match("/nope").has_value());
    }

    void
    testRootFallback()
    {
        // enabled
        {
            router r;
            auto rr = r.match("/");
            if(BOOST_TEST(rr.has_value()))
            {
                BOOST_TEST(rr->route.get() == &default_root_route());
                BOOST_TEST_EQ(rr->route->module_path, "__default_root__");
                BOOST_TEST(rr->route->kind == route_kind::page);
                BOOST_TEST(rr->params.empty());
            }
            BOOST_TEST(r.match("").has_value());
            BOOST_TEST(! r.match("/x").has_value());
        }

        // a registered root wins
        {
            router r(make_manifest());
            auto rr = r.match("/");
            if(BOOST_TEST(rr.has_value()))
                BOOST_TEST_EQ(rr->route->module_path,
                    "routes/index.page.ts");
        }

        // disabled
        {
            router_config cfg;
            cfg.root_fallback = false;
            router r(make_router_config(cfg));
            BOOST_TEST(! r.match("/").has_value());
        }
    }

    void
    testUrl()
    {
        router r(make_manifest());

        auto u = urls::parse_uri_reference("/projects/7?tab=1#top");
        if(! BOOST_TEST(u.has_value()))
            return;
        auto rr = r.match(*u);
        if(BOOST_TEST(rr.has_value()))
            BOOST_TEST_EQ(rr->params.at("id"), "7");

        u = urls::parse_uri_reference("https://example.com/docs/x%20y");
        if(! BOOST_TEST(u.has_value()))
            return;
        rr = r.match(*u);
        if(BOOST_TEST(rr.has_value()))
            BOOST_TEST_EQ(rr->params.at("rest"), "x y");
    }

    void
    testLookups()
    {
        router r(make_manifest());

        auto eb = r.find_boundary("/projects/1");
        if(BOOST_TEST(eb != nullptr))
            BOOST_TEST_EQ(eb->module_path,
                "routes/projects/index.error.ts");
        BOOST_TEST(r.find_boundary("/about") == nullptr);

        auto rc = r.find_route("/projects/:x");
        if(BOOST_TEST(rc != nullptr))
            BOOST_TEST_EQ(rc->pattern, "/projects/:id");
        BOOST_TEST(r.find_route("/projects/1") == nullptr);

        auto sp = r.status_page(404);
        if(BOOST_TEST(sp != nullptr))
            BOOST_TEST_EQ(sp->module_path, "routes/404.page.html");
        BOOST_TEST(r.status_page(401) == nullptr);

        BOOST_TEST(r.error_handler() != nullptr);
        BOOST_TEST(router().error_handler() == nullptr);
    }

    void
    testReload()
    {
        router r(make_manifest());
        auto const t0 = r.snapshot();
        auto old = r.match("/about");
        if(! BOOST_TEST(old.has_value()))
            return;

        route_manifest m;
        m.routes.push_back({ "/contact" });
        r.reload(std::move(m));

        BOOST_TEST(r.snapshot() != t0);
        BOOST_TEST(! r.match("/about").has_value());
        BOOST_TEST(r.match("/contact").has_value());

        // earlier results stay valid
        BOOST_TEST_EQ(old->route->pattern, "/about");
        BOOST_TEST_EQ(t0->trie().size(), 4u);
        auto mr = t0->match("/about");
        BOOST_TEST(mr.has_value());

        // a failed reload keeps the current table
        auto const t1 = r.snapshot();
        route_manifest bad;
        bad.routes.push_back({ "/ok" });
        bad.error_boundaries.push_back({ "/:a*/:b*" });
        BOOST_TEST_THROWS(
            r.reload(std::move(bad)),
            system::system_error);
        BOOST_TEST(r.snapshot() == t1);
        BOOST_TEST(r.match("/contact").has_value());
        BOOST_TEST(! r.match("/ok").has_value());
    }

    void
    testConcurrentReload()
    {
        route_manifest ma;
        ma.routes.push_back({ "/a/:id", route_kind::page, "a" });
        ma.routes.push_back({ "/shared", route_kind::page, "a" });
        route_manifest mb;
        mb.routes.push_back({ "/b/:id", route_kind::page, "b" });
        mb.routes.push_back({ "/shared", route_kind::page, "b" });

        router r(ma);
        std::atomic<bool> stop(false);
        std::atomic<int> failures(0);

        std::vector<std::thread> readers;
        for(int i = 0; i < 4; ++i)
        {
            readers.emplace_back([&]
            {
                while(! stop.load())
                {
                    // every result comes from one whole table
                    auto const t = r.snapshot();
                    auto const& mod =
                        t->manifest().routes.front().module_path;
                    auto rr = t->match("/shared");
                    if(! rr || rr->route->module_path != mod)
                        ++failures;

                    auto s = r.match("/shared");
                    if(! s || (
                        s->route->module_path != "a" &&
                        s->route->module_path != "b"))
                        ++failures;
                }
            });
        }

        for(int i = 0; i < 200; ++i)
            r.reload((i % 2) ? ma : mb);

        stop = true;
        for(auto& t : readers)
            t.join();

        BOOST_TEST_EQ(failures.load(), 0);
    }

    void
    run()
    {
        testTable();
        testMatch();
        testRootFallback();
        testUrl();
        testLookups();
        testReload();
        testConcurrentReload();
    }
};

} // emroute

int main()
{
    emroute::router_test().run();
    return boost::report_errors();
}
