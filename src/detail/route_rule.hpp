//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_SRC_DETAIL_ROUTE_RULE_HPP
#define TRELLIS_SRC_DETAIL_ROUTE_RULE_HPP

#include <trellis/detail/config.hpp>
#include <trellis/detail/path.hpp>
#include <trellis/route_params.hpp>
#include <boost/core/detail/string_view.hpp>
#include <boost/regex.hpp>
#include <boost/system/result.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/error.hpp>
#include <boost/url/grammar/parse.hpp>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace trellis {
namespace detail {

namespace core = ::boost::core;

//------------------------------------------------

/*
route-pattern     =  *( "/" segment ) [ "/" ]
segment           = wildcard-segment / param-segment / literal-segment
wildcard-segment  = "**" [ [ ":" ] param-name ]    ; last segment only
param-segment     = "*" / ( *literal-char 1*( ":" param-name [ constraint ] *literal-char ) )
literal-segment   = 1*literal-char
literal-char      = %x21-7E except ( "/" / ":" )
param-name        = 1*( ALPHA / DIGIT / "_" )
constraint        = "(" balanced-text ")"
*/

//------------------------------------------------

struct ident_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        return
            (ch >= 'a' && ch <= 'z') ||
            (ch >= '0' && ch <= '9') ||
            (ch >= 'A' && ch <= 'Z') ||
            (ch == '_');
    }
};

// RFC 9110 tchar
struct token_char
{
    constexpr
    bool
    operator()(char ch) const noexcept
    {
        switch(ch)
        {
        case '!': case '#': case '$': case '%': case '&':
        case '\'': case '*': case '+': case '-': case '.':
        case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return ident_char{}(ch);
        }
    }
};

constexpr struct
{
    using value_type = core::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end)
            TRELLIS_RETURN_EC(
                grammar::error::need_more);
        auto const it0 = it;
        it = grammar::find_if_not(
            it, end, ident_char{});
        if(it == it0)
            TRELLIS_RETURN_EC(
                grammar::error::mismatch);
        return core::string_view(it0, it);
    }
} param_name_rule{};

// The text between balanced parentheses,
// or empty if there is no opening parenthesis
constexpr struct
{
    using value_type = core::string_view;

    auto
    parse(
        char const*& it,
        char const* end) const noexcept ->
            system::result<value_type>
    {
        if(it == end || *it != '(')
            return core::string_view();
        auto const it0 = ++it;
        std::size_t depth = 1;
        while(it != end)
        {
            if(*it == '\\')
            {
                if(++it == end)
                    break;
            }
            else if(*it == '(')
            {
                ++depth;
            }
            else if(*it == ')')
            {
                if(--depth == 0)
                    break;
            }
            ++it;
        }
        if(it == end)
        {
            it = it0 - 1;
            TRELLIS_RETURN_EC(
                grammar::error::invalid);
        }
        if(it == it0)
        {
            // empty constraint
            it = it0 - 1;
            TRELLIS_RETURN_EC(
                grammar::error::invalid);
        }
        return core::string_view(it0, it++);
    }
} constraint_rule{};

//------------------------------------------------

// Binds named groups of a compiled
// pattern matched against one segment
struct pattern_bind
{
    boost::regex re;
    std::vector<std::string> names;
};

// One instruction of a params map
struct param_binding
{
    // segment position
    std::size_t index = 0;

    // bind the rest of the path from index
    bool tail = false;

    // unnamed "*" or "**"
    bool capture = false;

    std::variant<std::string, pattern_bind> target;
};

using params_map = std::vector<param_binding>;

enum class seg_kind : unsigned char
{
    literal,
    param,
    wildcard
};

struct route_seg
{
    seg_kind kind = seg_kind::literal;

    // literal text, only for seg_kind::literal
    std::string_view text;
};

struct route_pattern
{
    std::vector<route_seg> segs;
    params_map params;
};

/** Parse a route pattern.

    The returned literal segments refer to
    the characters of `pattern`.
*/
TRELLIS_DECL
system::result<route_pattern>
parse_route_pattern(
    std::string_view pattern);

/** Build the parameters for a matched path.

    Bindings whose segment is past the end of
    the path, and pattern bindings which do not
    match their segment, produce no parameter.
*/
TRELLIS_DECL
route_params
extract_params(
    segments_type const& segs,
    params_map const& pm);

// Return true if `s` is a valid method token
TRELLIS_DECL
bool
is_method_token(
    std::string_view s) noexcept;

} // detail
} // trellis

#endif
