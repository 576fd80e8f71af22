//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_ROUTE_PARAMS_HPP
#define TRELLIS_ROUTE_PARAMS_HPP

#include <trellis/detail/config.hpp>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trellis {

/** The path parameters extracted from a matched route.

    Names appear in the order they were first bound.
    Parameters which did not participate in the match
    are absent rather than empty.

    @par Example
    @code
    auto m = trie.find( "/users/42", "GET" );
    if( m && m->params.contains( "id" ) )
        std::cout << m->params.at( "id" );
    @endcode
*/
class route_params
{
public:
    using value_type = std::pair<std::string, std::string>;
    using const_iterator = std::vector<value_type>::const_iterator;
    using iterator = const_iterator;

    route_params() = default;

    route_params(
        std::initializer_list<value_type> init)
    {
        for(auto const& v : init)
            set(v.first, v.second);
    }

    /** Bind a value to a name.

        If the name is already bound its value
        is replaced, keeping its original position.
    */
    TRELLIS_DECL
    void
    set(
        std::string_view name,
        std::string_view value);

    /** Return a pointer to the value for a name, or `nullptr`.
    */
    TRELLIS_DECL
    std::string const*
    find(
        std::string_view name) const noexcept;

    /** Return true if a name is bound.
    */
    bool
    contains(
        std::string_view name) const noexcept
    {
        return find(name) != nullptr;
    }

    /** Return the value for a name.

        @throws std::out_of_range If the name is not bound.
    */
    TRELLIS_DECL
    std::string const&
    at(
        std::string_view name) const;

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

} // trellis

#endif
