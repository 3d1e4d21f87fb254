//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_ROUTER_HPP
#define EMROUTE_ROUTER_HPP

#include <emroute/detail/config.hpp>
#include <emroute/config.hpp>
#include <emroute/manifest.hpp>
#include <emroute/route_trie.hpp>
#include <emroute/route_types.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/url/url_view.hpp>
#include <memory>
#include <optional>

namespace emroute {

/** The route used for "/" when nothing else matches.

    Its pattern is "/", its kind is page and its
    module path is "__default_root__".
*/
EMROUTE_DECL
route_config const&
default_root_route() noexcept;

//------------------------------------------------

/** An immutable snapshot of a route manifest.

    The table owns the manifest and a @ref route_trie
    built from it. Construction either completes or
    throws; once constructed the table is never
    modified and may be shared freely between threads.

    @see @ref make_route_table, @ref router.
*/
class route_table
{
    shared_router_config cfg_;
    route_manifest manifest_;
    route_trie trie_;

public:
    /** Constructor.

        Routes are inserted in manifest order, so the
        first of two routes ending at the same position
        wins. Error boundaries are inserted likewise.

        @throws system::system_error if any route or
        boundary pattern is malformed.
    */
    EMROUTE_DECL
    explicit
    route_table(
        route_manifest m,
        shared_router_config cfg =
            make_router_config());

    // the trie points into the manifest
    route_table(route_table const&) = delete;
    route_table& operator=(route_table const&) = delete;

    route_manifest const&
    manifest() const noexcept
    {
        return manifest_;
    }

    route_trie const&
    trie() const noexcept
    {
        return trie_;
    }

    /// @copydoc route_trie::match
    std::optional<match_result>
    match(core::string_view path) const
    {
        return trie_.match(path);
    }

    /// @copydoc route_trie::find_boundary
    error_boundary const*
    find_boundary(core::string_view path) const
    {
        return trie_.find_boundary(path);
    }

    /// @copydoc route_trie::find_route
    route_config const*
    find_route(core::string_view pat) const
    {
        return trie_.find_route(pat);
    }

    /** Return the page for a status code, or `nullptr`
    */
    EMROUTE_DECL
    route_config const*
    status_page(unsigned code) const noexcept;

    /** Return the root error handler, or `nullptr`
    */
    route_config const*
    error_handler() const noexcept
    {
        return manifest_.error_handler
            ? &*manifest_.error_handler
            : nullptr;
    }
};

/** Shared pointer to an immutable route table
*/
using shared_route_table =
    std::shared_ptr<route_table const>;

/** Build a route table.

    @throws system::system_error if any route or
    boundary pattern is malformed.
*/
EMROUTE_DECL
shared_route_table
make_route_table(
    route_manifest m,
    shared_router_config cfg =
        make_router_config());

//------------------------------------------------

/** A matched route which keeps its table alive.
*/
struct resolved_route
{
    /// The matched route, never null
    std::shared_ptr<route_config const> route;

    /// Decoded parameters, in pattern order
    route_params params;
};

/** Routes paths using a replaceable route table.

    Lookups read the current table; @ref reload builds
    a new table off to the side and publishes it with
    an atomic swap. Lookups in flight keep using the
    table they started with, and results hold a
    reference to their table, so a reload never
    invalidates a result.

    All member functions may be called concurrently.

    @par Example
    @code
    route_manifest m;
    m.routes.push_back({ "/projects/:id" });

    router r( std::move(m) );
    auto rr = r.match( "/projects/42" );
    assert( rr->params.at( "id" ) == "42" );
    @endcode
*/
class router
{
    shared_router_config cfg_;
    shared_route_table table_;

public:
    /** Constructor.

        The router starts with an empty table.
    */
    EMROUTE_DECL
    explicit
    router(
        shared_router_config cfg =
            make_router_config());

    /** Constructor.

        @throws system::system_error if any pattern
        in the manifest is malformed.
    */
    EMROUTE_DECL
    explicit
    router(
        route_manifest m,
        shared_router_config cfg =
            make_router_config());

    router(router const&) = delete;
    router& operator=(router const&) = delete;

    /** Replace the route table.

        @par Exception Safety
        Strong guarantee. If the manifest is malformed
        the current table stays in place.

        @throws system::system_error if any pattern
        in the manifest is malformed.
    */
    EMROUTE_DECL
    void
    reload(route_manifest m);

    /** Return the current route table
    */
    EMROUTE_DECL
    shared_route_table
    snapshot() const noexcept;

    /** Match a path to a route.

        If nothing matches the root path and
        @ref router_config::root_fallback is set,
        @ref default_root_route is returned.
    */
    EMROUTE_DECL
    std::optional<resolved_route>
    match(core::string_view path) const;

    /** Match the path of a URL to a route.

        The query and fragment are ignored.
    */
    EMROUTE_DECL
    std::optional<resolved_route>
    match(urls::url_view const& u) const;

    /** Find the nearest error boundary for a path
    */
    EMROUTE_DECL
    std::shared_ptr<error_boundary const>
    find_boundary(core::string_view path) const;

    /** Look up a route by its exact pattern
    */
    EMROUTE_DECL
    std::shared_ptr<route_config const>
    find_route(core::string_view pat) const;

    /** Return the page for a status code
    */
    EMROUTE_DECL
    std::shared_ptr<route_config const>
    status_page(unsigned code) const;

    /** Return the root error handler
    */
    EMROUTE_DECL
    std::shared_ptr<route_config const>
    error_handler() const;
};

} // emroute

#endif
