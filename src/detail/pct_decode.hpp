//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_SRC_DETAIL_PCT_DECODE_HPP
#define EMROUTE_SRC_DETAIL_PCT_DECODE_HPP

#include <emroute/detail/config.hpp>
#include <boost/url/pct_string_view.hpp>
#include <boost/url/grammar/hexdig_chars.hpp>
#include <string>

namespace emroute {
namespace detail {

// decode all percent escapes
std::string
pct_decode(
    urls::pct_string_view s);

// true if s is well-formed UTF-8
bool
is_utf8(
    core::string_view s) noexcept;

// decode all percent escapes, returning s
// unchanged if an escape is malformed or the
// decoded bytes are not valid UTF-8
std::string
safe_decode(
    core::string_view s);

} // detail
} // emroute

#endif
