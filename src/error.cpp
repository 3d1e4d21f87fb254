//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <emroute/error.hpp>

namespace emroute {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "emroute";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::catch_all_not_last: return "catch-all segment is not last";
    case error::multiple_catch_all: return "more than one catch-all segment";
    case error::missing_name: return "missing parameter name";
    default:
        return "unknown";
    }
}

system::error_condition
error_cat_type::
default_error_condition(
    int ev) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::catch_all_not_last:
    case error::multiple_catch_all:
    case error::missing_name:
        return condition::malformed_pattern;
    default:
        return { ev, *this };
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "emroute.condition";
}

std::string
condition_cat_type::
message(int cv) const
{
    return message(cv, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int cv,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(cv))
    {
    default:
    case condition::malformed_pattern:
        return "malformed route pattern";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int cv) const noexcept
{
    switch(static_cast<condition>(cv))
    {
    case condition::malformed_pattern:
        return ec.category() == error_cat;
    default:
        return false;
    }
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail
} // emroute
