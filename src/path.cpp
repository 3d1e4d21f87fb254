//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <emroute/path.hpp>
#include "src/detail/pct_decode.hpp"

namespace emroute {

std::string
normalize_path(core::string_view path)
{
    std::string s;
    s.reserve(path.size() + 1);
    if( path.empty() ||
        path.front() != '/')
        s.push_back('/');
    s.append(path.data(), path.size());
    if( s.size() > 1 &&
        s.back() == '/')
        s.pop_back();
    return s;
}

std::vector<core::string_view>
split_path(core::string_view path)
{
    std::vector<core::string_view> v;
    if(path.size() <= 1)
        return v;
    auto it = path.data() + 1;
    auto const end = path.data() + path.size();
    for(;;)
    {
        auto it1 = it;
        while(it1 != end && *it1 != '/')
            ++it1;
        v.emplace_back(it, it1 - it);
        if(it1 == end)
            break;
        it = it1 + 1;
    }
    return v;
}

std::string
decode_segment(core::string_view s)
{
    return detail::safe_decode(s);
}

std::vector<std::string>
build_route_hierarchy(core::string_view path)
{
    std::vector<std::string> v;
    v.emplace_back("/");
    auto const s = normalize_path(path);
    std::string current;
    for(auto seg : split_path(s))
    {
        if(seg.empty())
            continue;
        current.push_back('/');
        current.append(seg.data(), seg.size());
        v.push_back(current);
    }
    return v;
}

} // emroute
