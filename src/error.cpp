//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <trellis/error.hpp>

namespace trellis {
namespace detail {

const char*
error_cat_type::
name() const noexcept
{
    return "trellis";
}

std::string
error_cat_type::
message(int ev) const
{
    return message(ev, nullptr, 0);
}

char const*
error_cat_type::
message(
    int ev,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<error>(ev))
    {
    case error::success: return "success";
    case error::bad_param_name: return "bad parameter name";
    case error::bad_param_pattern: return "bad parameter pattern";
    case error::misplaced_wildcard: return "catch-all is not the last segment";
    case error::duplicate_param: return "duplicate parameter name";
    case error::bad_method: return "bad method";
    default:
        return "unknown";
    }
}

//-----------------------------------------------

const char*
condition_cat_type::
name() const noexcept
{
    return "trellis";
}

std::string
condition_cat_type::
message(int cv) const
{
    return message(cv, nullptr, 0);
}

char const*
condition_cat_type::
message(
    int cv,
    char*,
    std::size_t) const noexcept
{
    switch(static_cast<condition>(cv))
    {
    default:
    case condition::configuration_error:
        return "configuration error";
    }
}

bool
condition_cat_type::
equivalent(
    system::error_code const& ec,
    int cv) const noexcept
{
    switch(static_cast<condition>(cv))
    {
    case condition::configuration_error:
        return
            ec.category() == error_cat &&
            ec.value() != 0;

    default:
        break;
    }
    return false;
}

//-----------------------------------------------

// msvc 14.0 has a bug that warns about inability
// to use constexpr construction here, even though
// there's no constexpr construction
#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( push )
# pragma warning( disable : 4592 )
#endif

#if defined(__cpp_constinit) && __cpp_constinit >= 201907L
constinit error_cat_type error_cat;
constinit condition_cat_type condition_cat;
#else
error_cat_type error_cat;
condition_cat_type condition_cat;
#endif

#if defined(_MSC_VER) && _MSC_VER <= 1900
# pragma warning( pop )
#endif

} // detail
} // trellis
