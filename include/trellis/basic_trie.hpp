//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_BASIC_TRIE_HPP
#define TRELLIS_BASIC_TRIE_HPP

#include <trellis/detail/config.hpp>
#include <trellis/detail/trie_base.hpp>
#include <trellis/basic_router.hpp>
#include <trellis/route_params.hpp>
#include <trellis/trie_options.hpp>
#include <cstddef>
#include <deque>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

/** A route matched by a lookup.

    The payload is a reference into the trie which
    produced the match, and stays valid for the
    lifetime of that trie.
*/
template<class T>
struct route_match
{
    /// The payload registered with the route
    T const& data;

    /// The parameters extracted from the path
    route_params params;
};

/** A trie mapping request paths to route payloads.

    Routes are inserted with a path pattern, a method and an
    opaque payload. Lookups take a concrete path and a method
    and return the matching payloads together with the path
    parameters extracted for each one.

    @par Patterns

    A pattern is a sequence of `/`-separated segments:

    @li `users` matches the segment exactly.

    @li `:id` matches any one segment and binds it to `id`.

    @li `*` matches any one segment and binds it to `_0`,
        `_1` and so on. When it is the last segment it also
        matches a path which ends just before it.

    @li `:id(\\d+)`, `:name.:ext` match any one segment and bind
        the named groups of the anchored pattern formed by the
        segment. A segment which does not match the pattern
        still matches the route, without those parameters.

    @li `**:rest` or `**rest` matches the rest of the path,
        including none of it, and binds it to `rest`. `**`
        binds it to `_`. This must be the last segment.

    Empty segments are ignored, in patterns and in paths, so
    a trailing slash never changes the result.

    @par Match Order

    @ref find_all visits the trie depth-first. At each node it
    collects, in this order: routes ending in a catch-all at
    this node; matches below the parameter child; matches below
    the literal child for the current segment; and finally the
    routes ending at this node when the path is exhausted.
    Routes registered for the same pattern and method keep their
    insertion order. A route for the exact method hides the
    routes registered for any method at the same node.

    @ref find returns the first of these matches. This is the
    traversal order and not a ranking by specificity: a
    catch-all declared at `/a/**` is returned before the
    literal route `/a/b` for the path `/a/b`.

    @par Thread Safety

    Lookups are `const` and may be called concurrently once
    all insertions are complete. Insertion must not be
    performed concurrently with any other member function.
    Use @ref shared_trie to replace a trie while serving.

    @tparam T The payload type.
*/
template<class T>
class basic_trie : public detail::trie_base
{
    // stable addresses for route_match::data
    std::deque<T> data_;

public:
    /** The type of payload stored with each route.
    */
    using value_type = T;

    /** The type of match returned by lookups.
    */
    using match_type = route_match<T>;

    basic_trie(basic_trie const&) = delete;
    basic_trie& operator=(basic_trie const&) = delete;

    basic_trie(basic_trie&&) = default;
    basic_trie& operator=(basic_trie&&) = default;

    /** Constructor.

        Creates an empty trie with the specified options.
    */
    explicit
    basic_trie(
        trie_options opt = {})
        : trie_base(opt)
    {
    }

    /** Constructor.

        Creates a trie holding every route declared on
        `r`, inserted in declaration order.

        @throws boost::system::system_error If a declaration
        is invalid. The error compares equal to
        @ref condition::configuration_error.
    */
    explicit
    basic_trie(
        basic_router<T>&& r,
        trie_options opt = {})
        : trie_base(opt)
    {
        for(auto& d : r.v_)
            insert(d.pattern, d.method, std::move(d.data));
        r.v_.clear();
    }

    /** Return the number of inserted routes.
    */
    std::size_t
    size() const noexcept
    {
        return data_.size();
    }

    /** Return true if no routes are inserted.
    */
    bool
    empty() const noexcept
    {
        return data_.empty();
    }

    /** Insert a route.

        The payload is appended after any routes already
        registered for the same pattern and method.

        @param pattern The path pattern.

        @param method The method to match. The empty string
        matches any method.

        @param data The payload to store.

        @throws boost::system::system_error If the pattern or
        the method is invalid. The error compares equal to
        @ref condition::configuration_error and the trie is
        unchanged.
    */
    void
    insert(
        std::string_view pattern,
        std::string_view method,
        T data)
    {
        data_.push_back(std::move(data));
        try
        {
            insert_impl(pattern, method,
                data_.size() - 1);
        }
        catch(...)
        {
            data_.pop_back();
            throw;
        }
    }

    /** Return every route matching a path.

        @param path The request path, without query.

        @param method The request method.

        @return The matches in traversal order. The
        result is empty if nothing matches.
    */
    std::vector<match_type>
    find_all(
        std::string_view path,
        std::string_view method) const
    {
        return make_matches(find_impl(
            path, method, static_cast<std::size_t>(-1)));
    }

    /** Return the first route matching a path.

        This is the first element that @ref find_all
        would return.

        @param path The request path, without query.

        @param method The request method.

        @return The match, or an empty optional.
    */
    std::optional<match_type>
    find(
        std::string_view path,
        std::string_view method) const
    {
        auto v = find_impl(path, method, 1);
        if(v.empty())
            return std::nullopt;
        return match_type{
            data_[v.front().id],
            std::move(v.front().params) };
    }

private:
    std::vector<match_type>
    make_matches(std::vector<match>&& v) const
    {
        std::vector<match_type> result;
        result.reserve(v.size());
        for(auto& m : v)
            result.push_back(match_type{
                data_[m.id], std::move(m.params) });
        return result;
    }
};

} // trellis

#endif
