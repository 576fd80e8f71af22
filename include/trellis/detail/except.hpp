//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_DETAIL_EXCEPT_HPP
#define TRELLIS_DETAIL_EXCEPT_HPP

#include <trellis/detail/config.hpp>
#include <boost/assert/source_location.hpp>
#include <boost/system/error_code.hpp>

namespace trellis {
namespace detail {

BOOST_NORETURN TRELLIS_DECL void throw_out_of_range(
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

BOOST_NORETURN TRELLIS_DECL void throw_system_error(
    system::error_code const& ec,
    boost::source_location const& loc = BOOST_CURRENT_LOCATION);

} // detail
} // trellis

#endif
