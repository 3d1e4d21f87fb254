//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef EMROUTE_PATTERN_HPP
#define EMROUTE_PATTERN_HPP

#include <emroute/detail/config.hpp>
#include <emroute/error.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/system/result.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace emroute {

/** The kind of a route pattern segment
*/
enum class segment_kind : unsigned char
{
    /// Matches the exact text
    literal,

    /// Matches any single segment, e.g. `:id`
    param,

    /// Matches zero or more trailing segments, e.g. `:rest*`
    catch_all
};

/** A unit of matching in a route pattern
*/
struct segment
{
    segment_kind kind = segment_kind::literal;

    // the literal text, or the parameter name
    std::string text;

    friend
    bool
    operator==(
        segment const& a,
        segment const& b) noexcept
    {
        return a.kind == b.kind && a.text == b.text;
    }

    friend
    bool
    operator!=(
        segment const& a,
        segment const& b) noexcept
    {
        return !(a == b);
    }
};

//------------------------------------------------

/** A parsed route pattern.

    A pattern is the ordered list of segments obtained
    by splitting a pattern string such as
    `/projects/:id/:rest*` on slashes. Empty segments
    are discarded, so `/`, leading slashes and trailing
    slashes all normalize away.

    A catch-all segment, when present, is always the
    last segment.

    @see @ref parse_pattern.
*/
class pattern
{
    std::vector<segment> segs_;

public:
    using value_type = segment;
    using const_iterator =
        std::vector<segment>::const_iterator;

    /** Constructor.

        Default-constructed patterns match the root path.
    */
    pattern() = default;

    /** Constructor.

        @par Preconditions
        At most one catch-all, and only last.
    */
    explicit
    pattern(std::vector<segment> segs) noexcept
        : segs_(std::move(segs))
    {
    }

    const_iterator
    begin() const noexcept
    {
        return segs_.begin();
    }

    const_iterator
    end() const noexcept
    {
        return segs_.end();
    }

    std::size_t
    size() const noexcept
    {
        return segs_.size();
    }

    bool
    empty() const noexcept
    {
        return segs_.empty();
    }

    segment const&
    operator[](std::size_t i) const noexcept
    {
        return segs_[i];
    }

    /// Return true if the last segment is a catch-all
    bool
    has_catch_all() const noexcept
    {
        return ! segs_.empty() &&
            segs_.back().kind == segment_kind::catch_all;
    }

    /** Return the number of parameter and catch-all segments
    */
    EMROUTE_DECL
    std::size_t
    param_count() const noexcept;

    /** Return the canonical string form.

        Segments are joined with slashes and decorated
        with `:` and `*` as appropriate. The empty
        pattern is `/`.
    */
    EMROUTE_DECL
    std::string
    to_string() const;

    friend
    bool
    operator==(
        pattern const& a,
        pattern const& b) noexcept
    {
        return a.segs_ == b.segs_;
    }

    friend
    bool
    operator!=(
        pattern const& a,
        pattern const& b) noexcept
    {
        return !(a == b);
    }
};

/** Parse a route pattern string.

    Each slash-separated token is classified:

    @li `:name` is a parameter segment,
    @li `:name*` is a catch-all segment,
    @li anything else is a literal segment,
        taken verbatim with no decoding.

    @par Example
    @code
    auto rv = parse_pattern( "/projects/:id/:rest*" );
    assert( rv.has_value() );
    assert( rv->size() == 3 );
    @endcode

    @return The parsed pattern, or an error equivalent
    to @ref condition::malformed_pattern.

    @param s The pattern string.
*/
EMROUTE_DECL
system::result<pattern>
parse_pattern(core::string_view s);

} // emroute

#endif
