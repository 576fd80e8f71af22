//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <trellis/detail/trie_base.hpp>
#include <trellis/detail/except.hpp>
#include <trellis/detail/path.hpp>
#include <trellis/error.hpp>
#include <trellis/logger.hpp>
#include "src/detail/route_rule.hpp"
#include "src/detail/trie_node.hpp"
#include <spdlog/spdlog.h>
#include <string>

/*

Traversal order at each node, for a path of n segments
and the current segment index i:

    1. wildcard child entries           (rest of path, possibly empty)
    2. param child, recursively         (always, i may pass n)
       param child optional entries     (i == n, capture)
    3. literal child, recursively       (i < n)
    4. this node's entries              (i == n)

This order is part of the interface. find() returns the
first match in this order, not the most specific one.

*/

namespace trellis {
namespace detail {

namespace {

char
to_upper(char c) noexcept
{
    if(c >= 'a' && c <= 'z')
        return static_cast<char>(c - 'a' + 'A');
    return c;
}

char
to_lower(char c) noexcept
{
    if(c >= 'A' && c <= 'Z')
        return static_cast<char>(c - 'A' + 'a');
    return c;
}

std::string
to_upper(std::string_view s)
{
    std::string r(s);
    for(auto& c : r)
        c = to_upper(c);
    return r;
}

std::string
to_lower(std::string_view s)
{
    std::string r(s);
    for(auto& c : r)
        c = to_lower(c);
    return r;
}

} // (anon)

struct trie_base::impl
{
    trie_node root;
    bool normalize_method;
    bool case_sensitive;

    impl(
        bool normalize_method_,
        bool case_sensitive_) noexcept
        : normalize_method(normalize_method_)
        , case_sensitive(case_sensitive_)
    {
    }

    std::string
    method_key(std::string_view method) const
    {
        if(normalize_method)
            return to_upper(method);
        return std::string(method);
    }

    void
    collect(
        trie_node const& node,
        std::string_view method,
        segments_type const& segs,
        std::size_t i,
        std::vector<route_entry const*>& v) const
    {
        auto const append =
            [&v](entry_list const& el)
            {
                for(auto const& e : el)
                    v.push_back(&e);
            };

        // 1. wildcard
        if(node.wildcard)
        {
            if(auto el = node.wildcard->
                    find_entries(method))
                append(*el);
        }

        // 2. param
        if(node.param)
        {
            collect(*node.param,
                method, segs, i + 1, v);
            if(i == segs.size())
            {
                if(auto el = node.param->
                        find_entries(method))
                {
                    auto const& pm = el->front().params;
                    if(! pm.empty() && pm.back().capture)
                        append(*el);
                }
            }
        }

        // 3. literal
        if(i < segs.size())
        {
            auto it = node.literals.find(segs[i]);
            if(it != node.literals.end())
                collect(*it->second,
                    method, segs, i + 1, v);
        }

        // 4. end of path
        if(i == segs.size())
        {
            if(auto el = node.find_entries(method))
                append(*el);
        }
    }
};

//------------------------------------------------

trie_base::
~trie_base()
{
    delete impl_;
}

trie_base::
trie_base(
    trie_options const& opt)
    : impl_(new impl(
        opt.is_normalize_method(),
        opt.is_case_sensitive()))
{
}

trie_base::
trie_base(
    trie_base&& other) noexcept
    : impl_(other.impl_)
{
    other.impl_ = nullptr;
}

trie_base&
trie_base::
operator=(
    trie_base&& other) noexcept
{
    delete impl_;
    impl_ = other.impl_;
    other.impl_ = nullptr;
    return *this;
}

void
trie_base::
insert_impl(
    std::string_view pattern,
    std::string_view method,
    std::size_t id)
{
    auto const lg = get_logger();
    if(! is_method_token(method))
    {
        lg->error("route {} {}: {}",
            method, pattern, "bad method");
        detail::throw_system_error(
            TRELLIS_ERR(error::bad_method));
    }
    auto rv = parse_route_pattern(pattern);
    if(rv.has_error())
    {
        lg->error("route {} {}: {}",
            method, pattern, rv.error().message());
        detail::throw_system_error(rv.error());
    }

    trie_node* node = &impl_->root;
    for(auto const& seg : rv->segs)
    {
        switch(seg.kind)
        {
        case seg_kind::literal:
        {
            auto key = impl_->case_sensitive ?
                std::string(seg.text) : to_lower(seg.text);
            auto& child = node->literals[std::move(key)];
            if(! child)
                child = std::make_unique<trie_node>();
            node = child.get();
            break;
        }

        case seg_kind::param:
            if(! node->param)
                node->param = std::make_unique<trie_node>();
            node = node->param.get();
            break;

        case seg_kind::wildcard:
            if(! node->wildcard)
                node->wildcard = std::make_unique<trie_node>();
            node = node->wildcard.get();
            break;
        }
    }

    auto key = impl_->method_key(method);
    node->methods[key].push_back(
        route_entry{ id, std::move(rv->params) });

    lg->debug("route {} {} registered",
        key.empty() ? std::string_view("*") :
            std::string_view(key), pattern);
}

auto
trie_base::
find_impl(
    std::string_view path,
    std::string_view method,
    std::size_t limit) const ->
        std::vector<match>
{
    auto const segs = split_path(path);
    auto const key = impl_->method_key(method);

    std::vector<route_entry const*> v;
    if(impl_->case_sensitive)
    {
        impl_->collect(impl_->root, key, segs, 0, v);
    }
    else
    {
        // literal lookups use the folded path,
        // parameters keep the original case
        std::vector<std::string> folded;
        folded.reserve(segs.size());
        for(auto s : segs)
            folded.push_back(to_lower(s));
        segments_type fs(folded.begin(), folded.end());
        impl_->collect(impl_->root, key, fs, 0, v);
    }

    SPDLOG_LOGGER_TRACE(get_logger(),
        "lookup {} {}: {} match(es)", key, path, v.size());

    std::vector<match> result;
    auto const n = v.size() < limit ? v.size() : limit;
    result.reserve(n);
    for(std::size_t i = 0; i < n; ++i)
        result.push_back(match{ v[i]->id,
            extract_params(segs, v[i]->params) });
    return result;
}

} // detail
} // trellis
