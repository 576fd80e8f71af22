//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/route_rule.hpp"
#include <trellis/error.hpp>
#include <trellis/logger.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>

/*

pattern             kind        binding
-----------------------------------------------------------
users               literal
:id                 param       id = segment
*                   param       _0 = segment (capture)
:id(\d+)            param       id = group of ^(?<id>\d+)$
:name.:ext          param       name, ext = groups of ^(?<name>[^/]+)\.(?<ext>[^/]+)$
**                  wildcard    _ = rest of path (capture)
**:rest, **rest     wildcard    rest = rest of path

*/

namespace trellis {
namespace detail {

namespace {

void
append_escaped(
    std::string& re,
    core::string_view s)
{
    for(char c : s)
    {
        switch(c)
        {
        case '\\': case '^': case '$': case '.':
        case '|': case '?': case '*': case '+':
        case '(': case ')': case '[': case ']':
        case '{': case '}':
            re.push_back('\\');
            break;
        default:
            break;
        }
        re.push_back(c);
    }
}

bool
has_name(
    params_map const& pm,
    std::string_view name) noexcept
{
    for(auto const& b : pm)
    {
        if(auto s = std::get_if<std::string>(&b.target))
        {
            if(*s == name)
                return true;
            continue;
        }
        auto const& pb = std::get<pattern_bind>(b.target);
        if(std::find(pb.names.begin(),
                pb.names.end(), name) != pb.names.end())
            return true;
    }
    return false;
}

// Returns the name if `s` is exactly ":name"
system::result<core::string_view>
plain_param_name(
    core::string_view s)
{
    if(s.front() != ':')
        TRELLIS_RETURN_EC(grammar::error::mismatch);
    return grammar::parse(
        s.substr(1), param_name_rule);
}

// Parses a wildcard name after "**"
system::result<std::string>
parse_wildcard_name(
    core::string_view s)
{
    if(s.empty())
        return std::string("_");
    if(s.front() == ':')
        s.remove_prefix(1);
    auto rv = grammar::parse(s, param_name_rule);
    if(rv.has_error())
        TRELLIS_RETURN_EC(error::bad_param_name);
    return std::string(rv->data(), rv->size());
}

// Compiles a segment containing one or more
// ":name" tokens into an anchored pattern
system::result<pattern_bind>
parse_pattern_segment(
    core::string_view s)
{
    pattern_bind pb;
    std::string re;
    auto it = s.data();
    auto const end = it + s.size();
    while(it != end)
    {
        auto const it0 = it;
        while(it != end && *it != ':')
            ++it;
        append_escaped(re, core::string_view(it0, it));
        if(it == end)
            break;
        ++it;
        auto rv = grammar::parse(
            it, end, param_name_rule);
        if(rv.has_error())
            TRELLIS_RETURN_EC(error::bad_param_name);
        auto rc = grammar::parse(
            it, end, constraint_rule);
        if(rc.has_error())
            TRELLIS_RETURN_EC(error::bad_param_pattern);
        std::string name(rv->data(), rv->size());
        if(std::find(pb.names.begin(),
                pb.names.end(), name) != pb.names.end())
            TRELLIS_RETURN_EC(error::duplicate_param);
        re.append("(?<");
        re.append(name);
        re.push_back('>');
        if(rc->empty())
            re.append("[^/]+");
        else
            re.append(rc->data(), rc->size());
        re.push_back(')');
        pb.names.push_back(std::move(name));
    }
    pb.re.assign(re,
        boost::regex::perl |
        boost::regex::no_except);
    if(pb.re.status() != 0)
        TRELLIS_RETURN_EC(error::bad_param_pattern);
    return pb;
}

} // (anon)

system::result<route_pattern>
parse_route_pattern(
    std::string_view pattern)
{
    route_pattern rp;
    std::size_t unnamed = 0;
    auto const segs = split_path(pattern);
    for(std::size_t i = 0; i < segs.size(); ++i)
    {
        core::string_view const s = segs[i];

        // wildcard
        if(s.starts_with("**"))
        {
            if(i + 1 != segs.size())
                TRELLIS_RETURN_EC(error::misplaced_wildcard);
            auto rv = parse_wildcard_name(s.substr(2));
            if(rv.has_error())
                return rv.error();
            if(has_name(rp.params, *rv))
                TRELLIS_RETURN_EC(error::duplicate_param);
            param_binding b;
            b.index = i;
            b.tail = true;
            b.capture = s.size() == 2;
            b.target = std::move(*rv);
            rp.params.push_back(std::move(b));
            rp.segs.push_back({ seg_kind::wildcard, {} });
            break;
        }

        // unnamed param
        if(s == "*")
        {
            param_binding b;
            b.index = i;
            b.capture = true;
            b.target = "_" + std::to_string(unnamed++);
            if(has_name(rp.params,
                    std::get<std::string>(b.target)))
                TRELLIS_RETURN_EC(error::duplicate_param);
            rp.params.push_back(std::move(b));
            rp.segs.push_back({ seg_kind::param, {} });
            continue;
        }

        // literal
        if(s.find(':') == core::string_view::npos)
        {
            rp.segs.push_back({ seg_kind::literal, segs[i] });
            continue;
        }

        param_binding b;
        b.index = i;
        if(auto name = plain_param_name(s))
        {
            if(has_name(rp.params, *name))
                TRELLIS_RETURN_EC(error::duplicate_param);
            b.target = std::string(name->data(), name->size());
        }
        else
        {
            auto rv = parse_pattern_segment(s);
            if(rv.has_error())
                return rv.error();
            for(auto const& n : rv->names)
                if(has_name(rp.params, n))
                    TRELLIS_RETURN_EC(error::duplicate_param);
            b.target = std::move(*rv);
        }
        rp.params.push_back(std::move(b));
        rp.segs.push_back({ seg_kind::param, {} });
    }
    return rp;
}

route_params
extract_params(
    segments_type const& segs,
    params_map const& pm)
{
    route_params params;
    for(auto const& b : pm)
    {
        if(b.index >= segs.size())
            continue;
        if(b.tail)
        {
            std::string s;
            for(auto i = b.index; i < segs.size(); ++i)
            {
                if(i != b.index)
                    s.push_back('/');
                s.append(segs[i].data(), segs[i].size());
            }
            params.set(std::get<std::string>(b.target), s);
            continue;
        }
        auto const seg = segs[b.index];
        std::visit(
            [&](auto const& t)
            {
                using T = std::decay_t<decltype(t)>;
                if constexpr(std::is_same_v<T, std::string>)
                {
                    params.set(t, seg);
                }
                else
                {
                    boost::cmatch m;
                    try
                    {
                        if(! boost::regex_match(
                                seg.data(), seg.data() + seg.size(),
                                m, t.re))
                            return;
                    }
                    catch(std::runtime_error const& e)
                    {
                        // complexity or stack limit exceeded,
                        // treated as a failed match
                        get_logger()->warn(
                            "segment {}: {}", seg, e.what());
                        return;
                    }
                    for(auto const& name : t.names)
                    {
                        auto const& sub = m[name];
                        if(sub.matched)
                            params.set(name, std::string_view(
                                sub.first, static_cast<std::size_t>(
                                    sub.second - sub.first)));
                    }
                }
            },
            b.target);
    }
    return params;
}

bool
is_method_token(
    std::string_view s) noexcept
{
    return std::all_of(s.begin(), s.end(), token_char{});
}

} // detail
} // trellis
