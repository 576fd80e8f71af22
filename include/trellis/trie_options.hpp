//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_TRIE_OPTIONS_HPP
#define TRELLIS_TRIE_OPTIONS_HPP

#include <trellis/detail/config.hpp>

namespace trellis {

template<class> class basic_trie;

namespace detail {
class trie_base;
} // detail

/** Configuration options for route tries.

    The options are fixed when the trie is constructed
    and apply to every insertion and lookup.

    @par Example
    @code
    basic_trie<handler> t( trie_options()
        .normalize_method( true )
        .case_sensitive( false ) );
    @endcode
*/
struct trie_options
{
    /** Constructor.

        By default methods are normalized and
        literal segments are case-sensitive.
    */
    trie_options() = default;

    /** Set whether method names are upper-cased.

        When enabled, the method passed to insert and to
        lookups is converted to upper case first, so that
        `"get"` and `"GET"` name the same method. The empty
        method is never affected.

        @param value `true` to normalize method names.

        @return A reference to `*this` for chaining.
    */
    trie_options&
    normalize_method(
        bool value) noexcept
    {
        v_ = (v_ & ~1u) | (value ? 1u : 0u);
        return *this;
    }

    /** Set whether literal segments are case-sensitive.

        When disabled, the literal segment `"Users"` in a
        pattern matches the request segment `"users"`.
        Extracted parameter values always keep the case
        of the request path.

        @param value `true` to compare literal segments
        exactly.

        @return A reference to `*this` for chaining.
    */
    trie_options&
    case_sensitive(
        bool value) noexcept
    {
        v_ = (v_ & ~2u) | (value ? 2u : 0u);
        return *this;
    }

private:
    friend class detail::trie_base;

    bool
    is_normalize_method() const noexcept
    {
        return (v_ & 1u) != 0;
    }

    bool
    is_case_sensitive() const noexcept
    {
        return (v_ & 2u) != 0;
    }

    unsigned int v_ = 3;
};

} // trellis

#endif
