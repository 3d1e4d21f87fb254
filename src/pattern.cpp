//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <emroute/pattern.hpp>
#include "src/detail/pattern_rule.hpp"

namespace emroute {

std::size_t
pattern::
param_count() const noexcept
{
    std::size_t n = 0;
    for(auto const& seg : segs_)
        if(seg.kind != segment_kind::literal)
            ++n;
    return n;
}

std::string
pattern::
to_string() const
{
    if(segs_.empty())
        return "/";
    std::string s;
    for(auto const& seg : segs_)
    {
        s.push_back('/');
        switch(seg.kind)
        {
        case segment_kind::literal:
            s.append(seg.text);
            break;
        case segment_kind::param:
            s.push_back(':');
            s.append(seg.text);
            break;
        case segment_kind::catch_all:
            s.push_back(':');
            s.append(seg.text);
            s.push_back('*');
            break;
        }
    }
    return s;
}

system::result<pattern>
parse_pattern(core::string_view s)
{
    auto rv = grammar::parse(
        s, detail::pattern_rule);
    if(rv.has_error())
        return rv.error();
    return pattern(std::move(*rv));
}

} // emroute
