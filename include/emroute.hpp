//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_HPP
#define EMROUTE_HPP

#include <emroute/config.hpp>
#include <emroute/error.hpp>
#include <emroute/manifest.hpp>
#include <emroute/path.hpp>
#include <emroute/pattern.hpp>
#include <emroute/route_trie.hpp>
#include <emroute/route_types.hpp>
#include <emroute/router.hpp>

#endif
