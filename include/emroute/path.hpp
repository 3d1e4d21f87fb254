//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_PATH_HPP
#define EMROUTE_PATH_HPP

#include <emroute/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <string>
#include <vector>

namespace emroute {

/** Normalize a request path.

    A missing leading slash is added, and one
    trailing slash is removed unless the path is
    the root.

    @par Example
    @code
    assert( normalize_path( "/about/" ) == "/about" );
    assert( normalize_path( "about" ) == "/about" );
    assert( normalize_path( "" ) == "/" );
    @endcode
*/
EMROUTE_DECL
std::string
normalize_path(core::string_view path);

/** Split a normalized path into raw segments.

    The root path has no segments. Segments are
    not decoded, and empty segments between
    consecutive slashes are kept.

    @par Preconditions
    `path` was returned by @ref normalize_path.
*/
EMROUTE_DECL
std::vector<core::string_view>
split_path(core::string_view path);

/** Percent-decode a path segment.

    Malformed escapes, or escapes which decode
    to bytes that are not valid UTF-8, leave the
    segment unchanged. This function never fails.
*/
EMROUTE_DECL
std::string
decode_segment(core::string_view s);

/** Return every prefix of a path, shortest first.

    @par Example
    @code
    // { "/", "/projects", "/projects/1", "/projects/1/tasks" }
    auto v = build_route_hierarchy( "/projects/1/tasks" );
    @endcode
*/
EMROUTE_DECL
std::vector<std::string>
build_route_hierarchy(core::string_view path);

} // emroute

#endif
