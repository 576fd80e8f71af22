//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_IMPL_ERROR_HPP
#define TRELLIS_IMPL_ERROR_HPP

#include <boost/system/error_category.hpp>
#include <boost/system/is_error_code_enum.hpp>
#include <boost/system/is_error_condition_enum.hpp>
#include <string>
#include <system_error>
#include <type_traits>

namespace boost {
namespace system {

template<>
struct is_error_code_enum<
    ::trellis::error>
{
    static bool const value = true;
};

template<>
struct is_error_condition_enum<
    ::trellis::condition>
{
    static bool const value = true;
};

} // system
} // boost

namespace std {
template<>
struct is_error_code_enum<
    ::trellis::error>
    : std::true_type {};

template<>
struct is_error_condition_enum<
    ::trellis::condition>
    : std::true_type {};
} // std

namespace trellis {

namespace detail {

struct TRELLIS_SYMBOL_VISIBLE
    error_cat_type
    : system::error_category
{
    TRELLIS_DECL const char* name(
        ) const noexcept override;
    TRELLIS_DECL std::string message(
        int) const override;
    TRELLIS_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR error_cat_type()
        : error_category(0x6b1d3f09a2c47e51)
    {
    }
};

struct TRELLIS_SYMBOL_VISIBLE
    condition_cat_type
    : system::error_category
{
    TRELLIS_DECL const char* name(
        ) const noexcept override;
    TRELLIS_DECL std::string message(
        int) const override;
    TRELLIS_DECL char const* message(
        int, char*, std::size_t
            ) const noexcept override;
    TRELLIS_DECL bool equivalent(
        system::error_code const&, int
            ) const noexcept override;
    BOOST_SYSTEM_CONSTEXPR condition_cat_type()
        : error_category(0xd40e7a5c18b3f962)
    {
    }
};

TRELLIS_DECL extern
    error_cat_type error_cat;
TRELLIS_DECL extern
    condition_cat_type condition_cat;

} // detail

inline
BOOST_SYSTEM_CONSTEXPR
system::error_code
make_error_code(
    error ev) noexcept
{
    return system::error_code{
        static_cast<std::underlying_type<
            error>::type>(ev),
        detail::error_cat};
}

inline
BOOST_SYSTEM_CONSTEXPR
system::error_condition
make_error_condition(
    condition c) noexcept
{
    return system::error_condition{
        static_cast<std::underlying_type<
            condition>::type>(c),
        detail::condition_cat};
}

} // trellis

#endif
