//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_LOGGER_HPP
#define TRELLIS_LOGGER_HPP

#include <trellis/detail/config.hpp>
#include <spdlog/logger.h>
#include <memory>

namespace trellis {

/** Replace the logger used by the library.

    Route registration is reported at `debug` level and
    rejected patterns at `error` level. Lookups are reported
    at `trace` level, which is compiled out unless
    `SPDLOG_ACTIVE_LEVEL` enables it.

    Passing `nullptr` restores the spdlog default logger.

    @par Thread Safety
    May be called concurrently with lookups.
*/
TRELLIS_DECL
void
set_logger(
    std::shared_ptr<spdlog::logger> lg);

/** Return the logger used by the library.

    @return The logger installed with @ref set_logger,
    or the spdlog default logger if none was installed.
*/
TRELLIS_DECL
std::shared_ptr<spdlog::logger>
get_logger();

} // trellis

#endif
