//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_ROUTE_TRIE_HPP
#define EMROUTE_ROUTE_TRIE_HPP

#include <emroute/detail/config.hpp>
#include <emroute/config.hpp>
#include <emroute/pattern.hpp>
#include <emroute/route_types.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <optional>

namespace emroute {

/** The result of matching a path against a @ref route_trie
*/
struct match_result
{
    /// The matched route, never null
    route_config const* route = nullptr;

    /// Decoded parameters, in pattern order
    route_params params;
};

//------------------------------------------------

/** A segment trie of routes and error boundaries.

    Each node of the trie holds static children keyed
    by exact segment text, at most one parameter child,
    at most one catch-all child, an optional terminal
    route and an optional error boundary.

    Routes and boundaries are not owned; they must
    outlive the trie. After construction completes the
    trie may be read concurrently from any number of
    threads.

    @par Example
    @code
    route_config about{ "/about" };
    route_config project{ "/projects/:id" };

    route_trie t;
    t.insert( about.pattern, about );
    t.insert( project.pattern, project );

    auto mr = t.match( "/projects/42" );
    assert( mr->route == &project );
    assert( mr->params.at( "id" ) == "42" );
    @endcode
*/
class route_trie
{
    struct node;
    struct impl;

    impl* impl_;

public:
    /** Destructor.
    */
    EMROUTE_DECL
    ~route_trie();

    /** Constructor.

        @param cfg The configuration to use.
    */
    EMROUTE_DECL
    explicit
    route_trie(
        shared_router_config cfg =
            make_router_config());

    /** Constructor.

        The moved-from object may only be
        destroyed or assigned to.
    */
    EMROUTE_DECL
    route_trie(route_trie&& other) noexcept;

    /** Assignment.
    */
    EMROUTE_DECL
    route_trie&
    operator=(route_trie&& other) noexcept;

    route_trie(route_trie const&) = delete;
    route_trie& operator=(route_trie const&) = delete;

    /** Register a route.

        If a route already ends at the same position in
        the trie, the first registration is kept and
        this one is ignored. If a parameter was already
        registered at the same position under another
        name, the first name is used.

        @throws system::system_error if the pattern
        is malformed.
    */
    EMROUTE_DECL
    void
    insert(
        core::string_view pat,
        route_config const& rc);

    /** Register a route with a parsed pattern.
    */
    EMROUTE_DECL
    void
    insert(
        pattern const& pat,
        route_config const& rc);

    /** Register an error boundary.

        @throws system::system_error if the pattern
        is malformed.
    */
    EMROUTE_DECL
    void
    insert_boundary(
        core::string_view pat,
        error_boundary const& eb);

    /** Register an error boundary with a parsed pattern.
    */
    EMROUTE_DECL
    void
    insert_boundary(
        pattern const& pat,
        error_boundary const& eb);

    /** Match a path to the most specific route.

        At every depth a static child is tried first,
        then the parameter child, then the catch-all.
        A branch that dead-ends deeper down is abandoned
        and the next branch is tried.

        @return The matched route and its parameters,
        or nothing if no route matches.

        @param path The undecoded request path,
        without query or fragment.
    */
    EMROUTE_DECL
    std::optional<match_result>
    match(core::string_view path) const;

    /** Find the nearest error boundary for a path.

        The walk commits to the highest-priority
        child at every depth and never backtracks.

        @return The deepest boundary along the
        walk, or `nullptr`.
    */
    EMROUTE_DECL
    error_boundary const*
    find_boundary(core::string_view path) const;

    /** Look up a route by its exact pattern.

        Parameter names are not compared, so
        `/projects/:pid` finds the route registered
        as `/projects/:id`.

        @return The route, or `nullptr` if none is
        registered or the pattern is malformed.
    */
    EMROUTE_DECL
    route_config const*
    find_route(core::string_view pat) const;

    /** Return the number of routes registered
    */
    EMROUTE_DECL
    std::size_t
    size() const noexcept;
};

} // emroute

#endif
