//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_SRC_DETAIL_PATTERN_RULE_HPP
#define EMROUTE_SRC_DETAIL_PATTERN_RULE_HPP

#include <emroute/detail/config.hpp>
#include <emroute/error.hpp>
#include <emroute/pattern.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/grammar/parse.hpp>
#include <vector>

namespace emroute {
namespace detail {

/*
route-pattern     = *( "/" ) [ segment *( 1*( "/" ) segment ) ] *( "/" )
segment           = catch-all-segment / param-segment / literal-segment
param-segment     = ":" param-name
catch-all-segment = ":" param-name "*"
param-name        = 1*( %x21-2E / %x30-7E / %x80-FF )   ; anything but "/"
literal-segment   = 1*( %x00-2E / %x30-FF )

A catch-all-segment must be the last segment.
*/

//------------------------------------------------

constexpr grammar::lut_chars slash_chars("/");

/** Rule for one slash-delimited token of a route pattern
*/
struct segment_rule_t
{
    using value_type = segment;

    auto
    parse(
        char const*& it,
        char const* end) const ->
            system::result<value_type>
    {
        auto const it0 = it;
        it = grammar::find_if(it, end, slash_chars);
        core::string_view s(it0, it - it0);
        if(s.empty())
            EMROUTE_RETURN_EC(
                grammar::error::mismatch);
        value_type v;
        if(s.front() != ':')
        {
            v.text.assign(s.data(), s.size());
            return v;
        }
        s.remove_prefix(1);
        if(! s.empty() && s.back() == '*')
        {
            s.remove_suffix(1);
            v.kind = segment_kind::catch_all;
        }
        else
        {
            v.kind = segment_kind::param;
        }
        if(s.empty())
            EMROUTE_RETURN_EC(
                error::missing_name);
        v.text.assign(s.data(), s.size());
        return v;
    }
};

constexpr segment_rule_t segment_rule{};

//------------------------------------------------

struct pattern_rule_t
{
    using value_type = std::vector<segment>;

    auto
    parse(
        char const*& it,
        char const* const end) const ->
            system::result<value_type>
    {
        value_type rv;
        std::size_t catch_alls = 0;
        while(it != end)
        {
            if(*it == '/')
            {
                ++it;
                continue;
            }
            auto rv1 = grammar::parse(
                it, end, segment_rule);
            if(rv1.has_error())
                return rv1.error();
            if(rv1->kind == segment_kind::catch_all)
                ++catch_alls;
            rv.push_back(std::move(*rv1));
        }
        if(catch_alls > 1)
            EMROUTE_RETURN_EC(
                error::multiple_catch_all);
        if( catch_alls == 1 &&
            rv.back().kind != segment_kind::catch_all)
            EMROUTE_RETURN_EC(
                error::catch_all_not_last);
        // gcc 7 bug workaround
        return system::result<value_type>(std::move(rv));
    }
};

constexpr pattern_rule_t pattern_rule{};

} // detail
} // emroute

#endif
