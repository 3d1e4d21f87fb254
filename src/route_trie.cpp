//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/trie_node.hpp"
#include <emroute/path.hpp>
#include <emroute/detail/except.hpp>
#include <boost/assert.hpp>
#include <spdlog/spdlog.h>
#include <string_view>
#include <vector>

/*

registered          path            result
-----------------------------------------------------------
/a/b, /a/:x         /a/b            /a/b
/a/b, /a/:x         /a/c            /a/:x       x=c
/f/:id/edit, /f/:r* /f/1/edit       /f/:id/edit id=1
/f/:id/edit, /f/:r* /f/1/download   /f/:r*      r=1/download
/docs/:r*           /docs           /docs/:r*   r=
/docs, /docs/:r*    /docs           /docs
/t/:name            /t/a%20b        /t/:name    name=a b
/t/:name            /t/%ZZ          /t/:name    name=%ZZ

*/

namespace emroute {

namespace {

using seg_iter =
    std::vector<core::string_view>::const_iterator;

std::string_view
to_sv(core::string_view s) noexcept
{
    return { s.data(), s.size() };
}

} // (anon)

//------------------------------------------------

route_trie::
~route_trie()
{
    delete impl_;
}

route_trie::
route_trie(
    shared_router_config cfg)
    : impl_(new impl(cfg
        ? std::move(cfg)
        : make_router_config()))
{
}

route_trie::
route_trie(
    route_trie&& other) noexcept
    : impl_(other.impl_)
{
    other.impl_ = nullptr;
}

route_trie&
route_trie::
operator=(
    route_trie&& other) noexcept
{
    delete impl_;
    impl_ = other.impl_;
    other.impl_ = nullptr;
    return *this;
}

//------------------------------------------------

namespace {

// Walk the trie along a pattern, creating
// nodes as needed, and return the final node.
template<class Node>
Node&
make_path(
    Node& root,
    pattern const& pat,
    spdlog::logger& log)
{
    Node* n = &root;
    for(auto const& seg : pat)
    {
        switch(seg.kind)
        {
        case segment_kind::literal:
        {
            auto& child = n->statics[seg.text];
            if(! child)
                child.reset(new Node);
            n = child.get();
            break;
        }

        case segment_kind::param:
            if(! n->dynamic)
            {
                n->dynamic.reset(new Node);
                n->dynamic_name = seg.text;
            }
            else if(n->dynamic_name != seg.text)
            {
                log.warn(
                    "route parameter ':{}' in '{}' shadowed by ':{}'",
                    seg.text, pat.to_string(), n->dynamic_name);
            }
            n = n->dynamic.get();
            break;

        case segment_kind::catch_all:
            if(! n->catch_all)
            {
                n->catch_all.reset(new Node);
                n->catch_all_name = seg.text;
            }
            else if(n->catch_all_name != seg.text)
            {
                log.warn(
                    "route catch-all ':{}*' in '{}' shadowed by ':{}*'",
                    seg.text, pat.to_string(), n->catch_all_name);
            }
            n = n->catch_all.get();
            break;
        }
    }
    return *n;
}

pattern
parse_or_throw(
    core::string_view pat,
    spdlog::logger& log)
{
    auto rv = parse_pattern(pat);
    if(rv.has_error())
    {
        log.error(
            "malformed route pattern '{}': {}",
            to_sv(pat), rv.error().message());
        detail::throw_system_error(rv.error());
    }
    return std::move(*rv);
}

} // (anon)

void
route_trie::
insert(
    core::string_view pat,
    route_config const& rc)
{
    BOOST_ASSERT(impl_);
    insert(parse_or_throw(
        pat, impl_->cfg->log()), rc);
}

void
route_trie::
insert(
    pattern const& pat,
    route_config const& rc)
{
    BOOST_ASSERT(impl_);
    auto& log = impl_->cfg->log();
    auto& n = make_path(impl_->root, pat, log);
    if(n.route)
    {
        log.debug(
            "route '{}' shadowed by earlier route '{}'",
            rc.pattern, n.route->pattern);
        return;
    }
    n.route = &rc;
    ++impl_->count;
}

void
route_trie::
insert_boundary(
    core::string_view pat,
    error_boundary const& eb)
{
    BOOST_ASSERT(impl_);
    insert_boundary(parse_or_throw(
        pat, impl_->cfg->log()), eb);
}

void
route_trie::
insert_boundary(
    pattern const& pat,
    error_boundary const& eb)
{
    BOOST_ASSERT(impl_);
    auto& log = impl_->cfg->log();
    auto& n = make_path(impl_->root, pat, log);
    if(n.boundary)
    {
        log.debug(
            "error boundary '{}' shadowed by earlier boundary '{}'",
            eb.pattern, n.boundary->pattern);
        return;
    }
    n.boundary = &eb;
}

//------------------------------------------------

namespace {

// Bindings are added while unwinding, and only
// along the branch that succeeded.
template<class Node>
std::optional<match_result>
resolve(
    Node const& n,
    seg_iter it,
    seg_iter const end)
{
    if(it == end)
    {
        if(n.route)
            return match_result{ n.route, {} };
        if( n.catch_all &&
            n.catch_all->route)
        {
            match_result mr{ n.catch_all->route, {} };
            mr.params.append(n.catch_all_name, {});
            return mr;
        }
        return std::nullopt;
    }

    auto const head = *it;

    // static
    {
        auto const sit = n.statics.find(to_sv(head));
        if(sit != n.statics.end())
        {
            auto rv = resolve(*sit->second, it + 1, end);
            if(rv)
                return rv;
        }
    }

    // dynamic
    if(n.dynamic)
    {
        auto rv = resolve(*n.dynamic, it + 1, end);
        if(rv)
        {
            rv->params.prepend(
                n.dynamic_name,
                decode_segment(head));
            return rv;
        }
    }

    // catch-all, takes the rest of the path
    if( n.catch_all &&
        n.catch_all->route)
    {
        // segments are views into one contiguous path
        auto const& last = *(end - 1);
        core::string_view const rest(
            head.data(),
            (last.data() + last.size()) - head.data());
        match_result mr{ n.catch_all->route, {} };
        mr.params.append(
            n.catch_all_name,
            decode_segment(rest));
        return mr;
    }

    return std::nullopt;
}

} // (anon)

std::optional<match_result>
route_trie::
match(core::string_view path) const
{
    BOOST_ASSERT(impl_);
    auto const s = normalize_path(path);
    auto const segs = split_path(s);
    if(segs.size() > impl_->cfg->max_segments)
        return std::nullopt;
    return resolve(impl_->root,
        segs.begin(), segs.end());
}

error_boundary const*
route_trie::
find_boundary(core::string_view path) const
{
    BOOST_ASSERT(impl_);
    auto const s = normalize_path(path);
    auto const segs = split_path(s);
    if(segs.size() > impl_->cfg->max_segments)
        return nullptr;

    node const* n = &impl_->root;
    error_boundary const* found = n->boundary;
    for(auto const seg : segs)
    {
        auto const sit = n->statics.find(to_sv(seg));
        if(sit != n->statics.end())
        {
            n = sit->second.get();
        }
        else if(n->dynamic)
        {
            n = n->dynamic.get();
        }
        else if(n->catch_all)
        {
            // consumes the rest of the path
            if(n->catch_all->boundary)
                found = n->catch_all->boundary;
            break;
        }
        else
        {
            break;
        }
        if(n->boundary)
            found = n->boundary;
    }
    return found;
}

route_config const*
route_trie::
find_route(core::string_view pat) const
{
    BOOST_ASSERT(impl_);
    auto rv = parse_pattern(pat);
    if(rv.has_error())
        return nullptr;
    node const* n = &impl_->root;
    for(auto const& seg : *rv)
    {
        switch(seg.kind)
        {
        case segment_kind::literal:
        {
            auto const sit = n->statics.find(seg.text);
            if(sit == n->statics.end())
                return nullptr;
            n = sit->second.get();
            break;
        }
        case segment_kind::param:
            n = n->dynamic.get();
            break;
        case segment_kind::catch_all:
            n = n->catch_all.get();
            break;
        }
        if(! n)
            return nullptr;
    }
    return n->route;
}

std::size_t
route_trie::
size() const noexcept
{
    BOOST_ASSERT(impl_);
    return impl_->count;
}

} // emroute
