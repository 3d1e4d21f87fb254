//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <emroute/route_types.hpp>
#include <emroute/detail/except.hpp>

namespace emroute {

core::string_view
to_string(route_kind k) noexcept
{
    switch(k)
    {
    case route_kind::page:      return "page";
    case route_kind::redirect:  return "redirect";
    case route_kind::error:     return "error";
    default:
        return "?";
    }
}

auto
route_params::
find(core::string_view name) const noexcept ->
    const_iterator
{
    auto it = v_.begin();
    for(; it != v_.end(); ++it)
        if(core::string_view(it->first) == name)
            break;
    return it;
}

std::string const&
route_params::
at(core::string_view name) const
{
    auto it = find(name);
    if(it == v_.end())
        detail::throw_out_of_range();
    return it->second;
}

} // emroute
