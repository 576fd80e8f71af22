//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_DETAIL_PATH_HPP
#define TRELLIS_DETAIL_PATH_HPP

#include <trellis/detail/config.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace trellis {
namespace detail {

using segments_type = std::vector<std::string_view>;

// Splits a path into its non-empty segments.
// The views refer to the characters of `path`.
TRELLIS_DECL
segments_type
split_path(std::string_view path);

// Joins path parts into a normalized path.
// Blanks around each segment and empty segments
// are dropped, the result starts with one slash
// and has no trailing slash.
TRELLIS_DECL
std::string
join_path(
    std::initializer_list<std::string_view> parts);

} // detail
} // trellis

#endif
