//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <emroute/config.hpp>
#include <emroute/detail/except.hpp>
#include <spdlog/spdlog.h>

#include <memory>

namespace emroute {

shared_router_config
make_router_config(router_config cfg)
{
    if(cfg.max_segments < 1)
        detail::throw_invalid_argument(
            "max_segments must be at least 1");

    auto impl = std::make_shared<router_config_impl>();
    static_cast<router_config&>(*impl) = std::move(cfg);

    if(! impl->logger)
        impl->logger = spdlog::default_logger();

    return impl;
}

} // emroute
