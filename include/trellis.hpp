//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_HPP
#define TRELLIS_HPP

#include <trellis/basic_router.hpp>
#include <trellis/basic_trie.hpp>
#include <trellis/error.hpp>
#include <trellis/logger.hpp>
#include <trellis/route_params.hpp>
#include <trellis/shared_trie.hpp>
#include <trellis/trie_options.hpp>

#endif
