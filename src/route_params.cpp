//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <trellis/route_params.hpp>
#include <trellis/detail/except.hpp>

namespace trellis {

void
route_params::
set(
    std::string_view name,
    std::string_view value)
{
    for(auto& v : v_)
    {
        if(v.first == name)
        {
            v.second.assign(
                value.data(), value.size());
            return;
        }
    }
    v_.emplace_back(
        std::string(name),
        std::string(value));
}

std::string const*
route_params::
find(
    std::string_view name) const noexcept
{
    for(auto const& v : v_)
        if(v.first == name)
            return &v.second;
    return nullptr;
}

std::string const&
route_params::
at(
    std::string_view name) const
{
    auto p = find(name);
    if(! p)
        detail::throw_out_of_range();
    return *p;
}

} // trellis
