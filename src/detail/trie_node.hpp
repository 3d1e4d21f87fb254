//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_SRC_DETAIL_TRIE_NODE_HPP
#define EMROUTE_SRC_DETAIL_TRIE_NODE_HPP

#include <emroute/route_trie.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace emroute {

// One position in the trie.
// A node may carry a route and a catch-all child at
// the same time: "this path" and "anything deeper".
struct route_trie::node
{
    std::map<std::string,
        std::unique_ptr<node>,
        std::less<>> statics;

    // single slot: first registered name wins
    std::unique_ptr<node> dynamic;
    std::string dynamic_name;

    // always terminal, never has children
    std::unique_ptr<node> catch_all;
    std::string catch_all_name;

    route_config const* route = nullptr;
    error_boundary const* boundary = nullptr;
};

struct route_trie::impl
{
    node root;
    shared_router_config cfg;
    std::size_t count = 0;

    explicit
    impl(shared_router_config cfg_) noexcept
        : cfg(std::move(cfg_))
    {
    }
};

} // emroute

#endif
