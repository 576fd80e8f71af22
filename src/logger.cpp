//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <trellis/logger.hpp>
#include <spdlog/spdlog.h>
#include <mutex>
#include <utility>

namespace trellis {

namespace {

struct logger_slot
{
    std::mutex m;
    std::shared_ptr<spdlog::logger> lg;
};

logger_slot&
slot()
{
    static logger_slot s;
    return s;
}

} // (anon)

void
set_logger(
    std::shared_ptr<spdlog::logger> lg)
{
    auto& s = slot();
    std::lock_guard<std::mutex> lock(s.m);
    s.lg = std::move(lg);
}

std::shared_ptr<spdlog::logger>
get_logger()
{
    auto& s = slot();
    {
        std::lock_guard<std::mutex> lock(s.m);
        if(s.lg)
            return s.lg;
    }
    return spdlog::default_logger();
}

} // trellis
