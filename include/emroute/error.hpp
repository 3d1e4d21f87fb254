//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_ERROR_HPP
#define EMROUTE_ERROR_HPP

#include <emroute/detail/config.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/result.hpp>

namespace emroute {

/** Error codes returned when parsing a route pattern.

    Every value is equivalent to
    @ref condition::malformed_pattern.

    @see @ref parse_pattern.
*/
enum class error
{
    /// A catch-all segment is followed by other segments
    catch_all_not_last = 1,

    /// The pattern has more than one catch-all segment
    multiple_catch_all,

    /// A parameter or catch-all segment has no name
    missing_name
};

//------------------------------------------------

/** Error conditions for route registration.
*/
enum class condition
{
    /** The route pattern is structurally invalid.

        This is a defect in the route definition
        and is reported when the route is registered,
        never while matching a path.
    */
    malformed_pattern = 1
};

} // emroute

#include <emroute/impl/error.hpp>

#endif
