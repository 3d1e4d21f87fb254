//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <emroute/router.hpp>
#include <emroute/path.hpp>
#include <spdlog/spdlog.h>
#include <atomic>

namespace emroute {

namespace {

route_config
make_default_root()
{
    route_config rc;
    rc.pattern = "/";
    rc.kind = route_kind::page;
    rc.module_path = "__default_root__";
    return rc;
}

// shares ownership of the table
template<class T>
std::shared_ptr<T const>
alias(
    shared_route_table const& t,
    T const* p) noexcept
{
    if(! p)
        return nullptr;
    return std::shared_ptr<T const>(t, p);
}

} // (anon)

route_config const&
default_root_route() noexcept
{
    static route_config const rc = make_default_root();
    return rc;
}

//------------------------------------------------

route_table::
route_table(
    route_manifest m,
    shared_router_config cfg)
    : cfg_(cfg ? std::move(cfg) : make_router_config())
    , manifest_(std::move(m))
    , trie_(cfg_)
{
    for(auto const& rc : manifest_.routes)
        trie_.insert(rc.pattern, rc);
    for(auto const& eb : manifest_.error_boundaries)
        trie_.insert_boundary(eb.pattern, eb);

    cfg_->log().debug(
            "route table built: {} routes, {} error boundaries, {} status pages",
            trie_.size(),
            manifest_.error_boundaries.size(),
            manifest_.status_pages.size());
}

route_config const*
route_table::
status_page(unsigned code) const noexcept
{
    auto it = manifest_.status_pages.find(code);
    if(it == manifest_.status_pages.end())
        return nullptr;
    return &it->second;
}

shared_route_table
make_route_table(
    route_manifest m,
    shared_router_config cfg)
{
    return std::make_shared<route_table>(
        std::move(m), std::move(cfg));
}

//------------------------------------------------

router::
router(
    shared_router_config cfg)
    : router(route_manifest{}, std::move(cfg))
{
}

router::
router(
    route_manifest m,
    shared_router_config cfg)
    : cfg_(cfg ? std::move(cfg) : make_router_config())
    , table_(make_route_table(std::move(m), cfg_))
{
}

void
router::
reload(route_manifest m)
{
    // build completely before anyone can see it
    auto t = make_route_table(std::move(m), cfg_);
    std::atomic_store(&table_, std::move(t));
    cfg_->log().debug("route table published");
}

shared_route_table
router::
snapshot() const noexcept
{
    return std::atomic_load(&table_);
}

std::optional<resolved_route>
router::
match(core::string_view path) const
{
    auto const t = snapshot();
    auto mr = t->match(path);
    if(mr)
        return resolved_route{
            alias(t, mr->route),
            std::move(mr->params) };
    if( cfg_->root_fallback &&
        normalize_path(path) == "/")
        return resolved_route{
            std::shared_ptr<route_config const>(
                std::shared_ptr<void>(),
                &default_root_route()),
            {} };
    return std::nullopt;
}

std::optional<resolved_route>
router::
match(urls::url_view const& u) const
{
    return match(core::string_view(u.encoded_path()));
}

std::shared_ptr<error_boundary const>
router::
find_boundary(core::string_view path) const
{
    auto const t = snapshot();
    return alias(t, t->find_boundary(path));
}

std::shared_ptr<route_config const>
router::
find_route(core::string_view pat) const
{
    auto const t = snapshot();
    return alias(t, t->find_route(pat));
}

std::shared_ptr<route_config const>
router::
status_page(unsigned code) const
{
    auto const t = snapshot();
    return alias(t, t->status_page(code));
}

std::shared_ptr<route_config const>
router::
error_handler() const
{
    auto const t = snapshot();
    return alias(t, t->error_handler());
}

} // emroute
