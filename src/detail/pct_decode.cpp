//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/pct_decode.hpp"

namespace emroute {
namespace detail {

std::string
pct_decode(
    urls::pct_string_view s)
{
    std::string result;
    core::string_view sv(s);
    result.reserve(s.size());
    auto it = sv.data();
    auto const end = it + sv.size();
    for(;;)
    {
        if(it == end)
            break;
        if(*it != '%')
        {
            result.push_back(*it++);
            continue;
        }
        ++it;
        // pct_string_view can never have invalid pct-encodings
        auto d0 = grammar::hexdig_value(*it++);
        auto d1 = grammar::hexdig_value(*it++);
        result.push_back(static_cast<char>(d0 * 16 + d1));
    }
    return result;
}

bool
is_utf8(
    core::string_view s) noexcept
{
    auto it = reinterpret_cast<
        unsigned char const*>(s.data());
    auto const end = it + s.size();
    while(it != end)
    {
        unsigned char const c = *it++;
        if(c < 0x80)
            continue;
        std::size_t n;
        unsigned cp;
        if((c & 0xE0) == 0xC0)
        {
            n = 1;
            cp = c & 0x1F;
        }
        else if((c & 0xF0) == 0xE0)
        {
            n = 2;
            cp = c & 0x0F;
        }
        else if((c & 0xF8) == 0xF0)
        {
            n = 3;
            cp = c & 0x07;
        }
        else
        {
            return false;
        }
        if(static_cast<std::size_t>(end - it) < n)
            return false;
        for(std::size_t i = 0; i < n; ++i)
        {
            unsigned char const cc = *it++;
            if((cc & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong, surrogate, or out of range
        if( (n == 1 && cp < 0x80) ||
            (n == 2 && cp < 0x800) ||
            (n == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) ||
            cp > 0x10FFFF)
            return false;
    }
    return true;
}

std::string
safe_decode(
    core::string_view s)
{
    auto rv = urls::make_pct_string_view(s);
    if(rv.has_error())
        return std::string(s.data(), s.size());
    auto decoded = pct_decode(*rv);
    if(! is_utf8(decoded))
        return std::string(s.data(), s.size());
    return decoded;
}

} // detail
} // emroute
