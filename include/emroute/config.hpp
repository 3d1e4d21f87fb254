//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_CONFIG_HPP
#define EMROUTE_CONFIG_HPP

#include <emroute/detail/config.hpp>

#include <cstddef>
#include <memory>

namespace spdlog {
class logger;
} // spdlog

namespace emroute {

/** Router configuration settings.

    @see @ref make_router_config,
         @ref route_trie,
         @ref router.
*/
struct router_config
{
    /** Maximum number of path segments.

        A path with more segments than this never
        matches a route and resolves no error
        boundary. This bounds the recursion depth
        of the matcher.

        This cannot be zero.
    */
    std::size_t max_segments = 256;

    /** Answer "/" with the default root route.

        When true and no registered route matches
        the root path, @ref router::match returns
        @ref default_root_route instead of nothing.
    */
    bool root_fallback = true;

    /** Logger used when building route tables.

        When null, spdlog's default logger is used.
    */
    std::shared_ptr<spdlog::logger> logger;
};

/** Router configuration with computed fields.

    @see @ref make_router_config.
*/
struct router_config_impl : router_config
{
    /// The logger, never null.
    spdlog::logger& log() const noexcept
    {
        return *logger;
    }
};

/** Shared pointer to immutable router configuration.

    @see @ref router_config_impl, @ref make_router_config.
*/
using shared_router_config =
    std::shared_ptr<router_config_impl const>;

/** Create router configuration with computed values.

    @param cfg User-provided configuration settings.

    @return Shared pointer to the validated configuration.

    @throws std::invalid_argument if `cfg.max_segments == 0`.

    @see @ref router_config.
*/
EMROUTE_DECL
shared_router_config
make_router_config(router_config cfg = {});

} // emroute

#endif
