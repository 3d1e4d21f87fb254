//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_ROUTE_TYPES_HPP
#define EMROUTE_ROUTE_TYPES_HPP

#include <emroute/detail/config.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace emroute {

/** The kind of file a route was declared by
*/
enum class route_kind : unsigned char
{
    /// An ordinary page
    page,

    /// A redirect
    redirect,

    /// An error handler
    error
};

/** Return the name of a route kind
*/
EMROUTE_DECL
core::string_view
to_string(route_kind k) noexcept;

/** Companion files discovered alongside a route.

    An empty string means the file is absent.
*/
struct route_files
{
    std::string ts;
    std::string js;
    std::string html;
    std::string md;
    std::string css;

    bool
    empty() const noexcept
    {
        return
            ts.empty() &&
            js.empty() &&
            html.empty() &&
            md.empty() &&
            css.empty();
    }
};

/** A single route definition.

    The matching core never inspects anything other
    than @ref pattern; the remaining members are carried
    through to the caller unchanged.
*/
struct route_config
{
    /// Pattern such as "/projects/:id"
    std::string pattern;

    route_kind kind = route_kind::page;

    /// Module to load for this route
    std::string module_path;

    route_files files;

    /// Pattern of the parent route, empty if none
    std::string parent;

    /// Status code for status pages, zero if none
    unsigned status_code = 0;
};

/** An error boundary scoped to a path prefix
*/
struct error_boundary
{
    /// Prefix pattern such as "/projects"
    std::string pattern;

    /// Module path of the error handler
    std::string module_path;
};

//------------------------------------------------

/** Parameters extracted from a matched path.

    Entries appear in the order of the pattern's
    segments. Values are percent-decoded. Names are
    never deduplicated: if a pattern repeats a name,
    every binding is kept and @ref find returns the
    first.
*/
class route_params
{
public:
    using value_type =
        std::pair<std::string, std::string>;
    using const_iterator =
        std::vector<value_type>::const_iterator;

    route_params() = default;

    const_iterator
    begin() const noexcept
    {
        return v_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return v_.end();
    }

    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    /** Return the first binding for a name, or end()
    */
    EMROUTE_DECL
    const_iterator
    find(core::string_view name) const noexcept;

    bool
    contains(core::string_view name) const noexcept
    {
        return find(name) != end();
    }

    /** Return the value bound to a name.

        @throws std::out_of_range if there is no
        binding for `name`.
    */
    EMROUTE_DECL
    std::string const&
    at(core::string_view name) const;

    /// Append a binding
    void
    append(
        std::string name,
        std::string value)
    {
        v_.emplace_back(
            std::move(name),
            std::move(value));
    }

    /// Insert a binding ahead of all others
    void
    prepend(
        std::string name,
        std::string value)
    {
        v_.emplace(v_.begin(),
            std::move(name),
            std::move(value));
    }

    friend
    bool
    operator==(
        route_params const& a,
        route_params const& b) noexcept
    {
        return a.v_ == b.v_;
    }

    friend
    bool
    operator!=(
        route_params const& a,
        route_params const& b) noexcept
    {
        return !(a == b);
    }

private:
    std::vector<value_type> v_;
};

} // emroute

#endif
