//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_MANIFEST_HPP
#define EMROUTE_MANIFEST_HPP

#include <emroute/detail/config.hpp>
#include <emroute/pattern.hpp>
#include <emroute/route_types.hpp>
#include <map>
#include <optional>
#include <vector>

namespace emroute {

/** The declarative set of routes for an application.

    Routes are registered in order: when two routes
    are equally specific for a path, the first one
    wins. Status pages and the error handler are not
    matched against paths; they are looked up by
    status code or used as the last resort.
*/
struct route_manifest
{
    /// All page and redirect routes, in registration order
    std::vector<route_config> routes;

    /// Error boundaries by pattern prefix
    std::vector<error_boundary> error_boundaries;

    /// Status-specific pages such as 404, 401, 403
    std::map<unsigned, route_config> status_pages;

    /// The root error handler
    std::optional<route_config> error_handler;
};

/** Compare two patterns by specificity.

    The more specific pattern orders first:

    @li patterns without a catch-all before
        patterns with one,
    @li then more segments before fewer,
    @li then, at the first position where one
        segment is a literal and the other is not,
        the literal.

    @return A negative value if `a` orders before
    `b`, a positive value if after, otherwise zero.
*/
EMROUTE_DECL
int
compare_specificity(
    pattern const& a,
    pattern const& b) noexcept;

/** Sort routes from most to least specific.

    Routes of equal specificity keep their
    relative order.

    @throws system::system_error if a route
    pattern is malformed.
*/
EMROUTE_DECL
void
sort_by_specificity(
    std::vector<route_config>& routes);

} // emroute

#endif
