//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <trellis/detail/path.hpp>

/*

path            segments
---------------------------------
""              {}
/               {}
/a              { a }
/a/             { a }
a/b             { a, b }
//a///b//       { a, b }

*/

namespace trellis {
namespace detail {

namespace {

bool
is_blank(char c) noexcept
{
    return
        c == ' ' || c == '\t' ||
        c == '\r' || c == '\n' ||
        c == '\f' || c == '\v';
}

std::string_view
trim(std::string_view s) noexcept
{
    while(! s.empty() && is_blank(s.front()))
        s.remove_prefix(1);
    while(! s.empty() && is_blank(s.back()))
        s.remove_suffix(1);
    return s;
}

} // (anon)

segments_type
split_path(std::string_view path)
{
    segments_type v;
    auto it = path.data();
    auto const end = it + path.size();
    while(it != end)
    {
        if(*it == '/')
        {
            ++it;
            continue;
        }
        auto const it0 = it;
        while(it != end && *it != '/')
            ++it;
        v.emplace_back(it0, static_cast<
            std::size_t>(it - it0));
    }
    return v;
}

std::string
join_path(
    std::initializer_list<std::string_view> parts)
{
    std::string s;
    for(auto part : parts)
    {
        for(auto seg : split_path(part))
        {
            seg = trim(seg);
            if(seg.empty())
                continue;
            s.push_back('/');
            s.append(seg.data(), seg.size());
        }
    }
    if(s.empty())
        s.push_back('/');
    return s;
}

} // detail
} // trellis
