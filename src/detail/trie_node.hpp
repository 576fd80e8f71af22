//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_SRC_DETAIL_TRIE_NODE_HPP
#define TRELLIS_SRC_DETAIL_TRIE_NODE_HPP

#include <trellis/detail/config.hpp>
#include "src/detail/route_rule.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace trellis {
namespace detail {

// allows lookup by string_view
struct string_hash
{
    using is_transparent = void;

    std::size_t
    operator()(std::string_view s) const noexcept
    {
        return std::hash<std::string_view>{}(s);
    }
};

template<class T>
using string_map = std::unordered_map<
    std::string, T, string_hash, std::equal_to<>>;

// A payload registered at a node
struct route_entry
{
    std::size_t id;
    params_map params;
};

using entry_list = std::vector<route_entry>;

// One segment position in the trie
struct trie_node
{
    string_map<std::unique_ptr<trie_node>> literals;
    std::unique_ptr<trie_node> param;
    std::unique_ptr<trie_node> wildcard;

    // the empty method matches any method
    string_map<entry_list> methods;

    // Returns the entries for the method,
    // else the entries for any method
    entry_list const*
    find_entries(
        std::string_view method) const noexcept
    {
        auto it = methods.find(method);
        if(it != methods.end() && ! it->second.empty())
            return &it->second;
        if(method.empty())
            return nullptr;
        it = methods.find(std::string_view());
        if(it != methods.end() && ! it->second.empty())
            return &it->second;
        return nullptr;
    }
};

} // detail
} // trellis

#endif
