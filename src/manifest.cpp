//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <emroute/manifest.hpp>
#include <emroute/detail/except.hpp>
#include <algorithm>
#include <cstddef>

namespace emroute {

int
compare_specificity(
    pattern const& a,
    pattern const& b) noexcept
{
    auto const wa = a.has_catch_all();
    auto const wb = b.has_catch_all();
    if(wa != wb)
        return wa ? 1 : -1;

    if(a.size() != b.size())
        return a.size() > b.size() ? -1 : 1;

    for(std::size_t i = 0; i < a.size(); ++i)
    {
        auto const da = a[i].kind != segment_kind::literal;
        auto const db = b[i].kind != segment_kind::literal;
        if(da != db)
            return da ? 1 : -1;
    }
    return 0;
}

void
sort_by_specificity(
    std::vector<route_config>& routes)
{
    // parse everything first so a malformed
    // pattern leaves the routes untouched
    std::vector<pattern> pats;
    pats.reserve(routes.size());
    for(auto const& rc : routes)
    {
        auto rv = parse_pattern(rc.pattern);
        if(rv.has_error())
            detail::throw_system_error(rv.error());
        pats.push_back(std::move(*rv));
    }

    std::vector<std::size_t> order(routes.size());
    for(std::size_t i = 0; i < order.size(); ++i)
        order[i] = i;
    std::stable_sort(order.begin(), order.end(),
        [&pats](std::size_t i, std::size_t j)
        {
            return compare_specificity(
                pats[i], pats[j]) < 0;
        });

    std::vector<route_config> sorted;
    sorted.reserve(routes.size());
    for(auto i : order)
        sorted.push_back(std::move(routes[i]));
    routes = std::move(sorted);
}

} // emroute
