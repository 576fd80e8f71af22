//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_DETAIL_TRIE_BASE_HPP
#define TRELLIS_DETAIL_TRIE_BASE_HPP

#include <trellis/detail/config.hpp>
#include <trellis/route_params.hpp>
#include <trellis/trie_options.hpp>
#include <cstddef>
#include <string_view>
#include <vector>

namespace trellis {
namespace detail {

// implementation for all tries
class TRELLIS_DECL
    trie_base
{
    struct impl;
    impl* impl_;

protected:
    // A matched entry, identified by the
    // id it was inserted with
    struct match
    {
        std::size_t id;
        route_params params;
    };

    ~trie_base();
    explicit trie_base(trie_options const&);
    trie_base(trie_base&&) noexcept;
    trie_base& operator=(trie_base&&) noexcept;

    // throws system_error on a bad pattern or method,
    // leaving the trie unchanged
    void insert_impl(
        std::string_view pattern,
        std::string_view method,
        std::size_t id);

    // returns at most `limit` matches in traversal order
    std::vector<match> find_impl(
        std::string_view path,
        std::string_view method,
        std::size_t limit) const;
};

} // detail
} // trellis

#endif
