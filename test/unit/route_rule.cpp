//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "src/detail/route_rule.hpp"
#include <trellis/basic_trie.hpp>
#include <trellis/error.hpp>

#include <boost/core/lightweight_test.hpp>
#include <string>
#include <vector>

namespace trellis {
namespace detail {

struct route_rule_test
{
    static
    route_pattern
    parse(std::string_view s)
    {
        auto rv = parse_route_pattern(s);
        if(! BOOST_TEST(rv.has_value()))
            return {};
        return std::move(*rv);
    }

    static
    void
    bad(
        std::string_view s,
        error e)
    {
        auto rv = parse_route_pattern(s);
        if(! BOOST_TEST(rv.has_error()))
            return;
        BOOST_TEST(rv.error() == e);
        BOOST_TEST(rv.error() ==
            condition::configuration_error);
    }

    static
    std::string const&
    name_of(param_binding const& b)
    {
        return std::get<std::string>(b.target);
    }

    void
    testGrammar()
    {
        auto ok = [](std::string_view s, std::string_view name)
        {
            auto rv = grammar::parse(s, param_name_rule);
            if(BOOST_TEST(rv.has_value()))
                BOOST_TEST_EQ(std::string_view(*rv), name);
        };
        ok("id", "id");
        ok("user_id", "user_id");
        ok("_0", "_0");
        BOOST_TEST(grammar::parse("", param_name_rule).has_error());
        BOOST_TEST(grammar::parse("-x", param_name_rule).has_error());
        BOOST_TEST(grammar::parse("a-b", param_name_rule).has_error());

        auto body = [](std::string_view s) ->
            system::result<core::string_view>
        {
            return grammar::parse(s, constraint_rule);
        };
        BOOST_TEST(body("").has_value() && body("")->empty());
        BOOST_TEST(body("(\\d+)").has_value());
        BOOST_TEST_EQ(std::string_view(*body("(\\d+)")), "\\d+");
        BOOST_TEST_EQ(std::string_view(*body("(a(b)c)")), "a(b)c");
        BOOST_TEST_EQ(std::string_view(*body("(\\))")), "\\)");
        BOOST_TEST(body("()").has_error());
        BOOST_TEST(body("(ab").has_error());
        BOOST_TEST(body("(a(b)").has_error());
    }

    void
    testLiteral()
    {
        auto const rp = parse("/api/users/");
        BOOST_TEST_EQ(rp.segs.size(), 2u);
        BOOST_TEST(rp.segs[0].kind == seg_kind::literal);
        BOOST_TEST_EQ(rp.segs[0].text, "api");
        BOOST_TEST_EQ(rp.segs[1].text, "users");
        BOOST_TEST(rp.params.empty());

        BOOST_TEST(parse("/").segs.empty());
        BOOST_TEST(parse("").segs.empty());
    }

    void
    testParam()
    {
        auto const rp = parse("/users/:id/posts/:post_id");
        BOOST_TEST_EQ(rp.segs.size(), 4u);
        BOOST_TEST(rp.segs[1].kind == seg_kind::param);
        BOOST_TEST(rp.segs[3].kind == seg_kind::param);
        BOOST_TEST_EQ(rp.params.size(), 2u);
        BOOST_TEST_EQ(rp.params[0].index, 1u);
        BOOST_TEST_EQ(name_of(rp.params[0]), "id");
        BOOST_TEST(! rp.params[0].tail);
        BOOST_TEST(! rp.params[0].capture);
        BOOST_TEST_EQ(rp.params[1].index, 3u);
        BOOST_TEST_EQ(name_of(rp.params[1]), "post_id");
    }

    void
    testUnnamed()
    {
        auto const rp = parse("/a/*/b/*");
        BOOST_TEST_EQ(rp.params.size(), 2u);
        BOOST_TEST_EQ(name_of(rp.params[0]), "_0");
        BOOST_TEST_EQ(name_of(rp.params[1]), "_1");
        BOOST_TEST(rp.params[0].capture);
        BOOST_TEST(rp.params[1].capture);
        BOOST_TEST(rp.segs[1].kind == seg_kind::param);
    }

    void
    testWildcard()
    {
        {
            auto const rp = parse("/files/**rest");
            BOOST_TEST_EQ(rp.segs.size(), 2u);
            BOOST_TEST(rp.segs[1].kind == seg_kind::wildcard);
            BOOST_TEST_EQ(rp.params.size(), 1u);
            BOOST_TEST_EQ(rp.params[0].index, 1u);
            BOOST_TEST(rp.params[0].tail);
            BOOST_TEST(! rp.params[0].capture);
            BOOST_TEST_EQ(name_of(rp.params[0]), "rest");
        }
        {
            auto const rp = parse("/files/**:path");
            BOOST_TEST_EQ(name_of(rp.params[0]), "path");
        }
        {
            auto const rp = parse("/**");
            BOOST_TEST_EQ(rp.segs.size(), 1u);
            BOOST_TEST_EQ(rp.params[0].index, 0u);
            BOOST_TEST(rp.params[0].tail);
            BOOST_TEST(rp.params[0].capture);
            BOOST_TEST_EQ(name_of(rp.params[0]), "_");
        }
    }

    void
    testPattern()
    {
        auto const rp = parse("/v:version/:name.:ext/:id(\\d+)");
        BOOST_TEST_EQ(rp.segs.size(), 3u);
        BOOST_TEST_EQ(rp.params.size(), 3u);
        for(auto const& b : rp.params)
            BOOST_TEST(std::holds_alternative<
                pattern_bind>(b.target));
        auto const& pb =
            std::get<pattern_bind>(rp.params[1].target);
        BOOST_TEST_EQ(pb.names.size(), 2u);
        BOOST_TEST_EQ(pb.names[0], "name");
        BOOST_TEST_EQ(pb.names[1], "ext");
    }

    void
    testErrors()
    {
        bad("/:", error::bad_param_name);
        bad("/user:", error::bad_param_name);
        bad("/:-x", error::bad_param_name);
        bad("/**bad-name", error::bad_param_name);
        bad("/**:", error::bad_param_name);
        bad("/:id(\\d+", error::bad_param_pattern);
        bad("/:id()", error::bad_param_pattern);
        bad("/:id([)", error::bad_param_pattern);
        bad("/**/x", error::misplaced_wildcard);
        bad("/a/**rest/b", error::misplaced_wildcard);
        bad("/:a/:a", error::duplicate_param);
        bad("/:a-:a", error::duplicate_param);
        bad("/:a/:b.:a", error::duplicate_param);
        bad("/:id/**id", error::duplicate_param);
    }

    void
    testExtract()
    {
        auto extract = [](
            std::string_view pattern,
            std::string_view path)
        {
            auto const rp = parse(pattern);
            return extract_params(
                split_path(path), rp.params);
        };

        BOOST_TEST(extract("/users/:id", "/users/42") ==
            route_params({ { "id", "42" } }));
        BOOST_TEST(extract("/users", "/users") ==
            route_params());
        BOOST_TEST(extract("/files/**rest", "/files/a/b/c") ==
            route_params({ { "rest", "a/b/c" } }));

        // past the end of the path
        BOOST_TEST(extract("/files/**rest", "/files") ==
            route_params());
        BOOST_TEST(extract("/opt/*", "/opt") ==
            route_params());

        // named groups
        BOOST_TEST(extract("/:name.:ext", "/report.tar.gz") ==
            route_params({ { "name", "report.tar" }, { "ext", "gz" } }));
        BOOST_TEST(extract("/v:version", "/v2") ==
            route_params({ { "version", "2" } }));
        BOOST_TEST(extract("/:id(\\d+)", "/123") ==
            route_params({ { "id", "123" } }));

        // anchored, and omitted on mismatch
        BOOST_TEST(extract("/:id(\\d+)", "/12a") ==
            route_params());
        BOOST_TEST(extract("/v:version", "/x2") ==
            route_params());

        // escaped literal text
        BOOST_TEST(extract("/:name.json", "/dataxjson") ==
            route_params());
        BOOST_TEST(extract("/:name.json", "/data.json") ==
            route_params({ { "name", "data" } }));
    }

    void
    testRunawayPattern()
    {
        // nested repetition exceeds the matcher's complexity
        // bound, which is a failed match and not an error
        std::string const seg(64, 'a');
        auto const rp = parse("/x/:id((a+)+b)");
        route_params p;
        BOOST_TEST_NO_THROW(p = extract_params(
            split_path("/x/" + seg), rp.params));
        BOOST_TEST(p.empty());

        basic_trie<int> t;
        t.insert("/x/:id((a+)+b)", "GET", 1);
        std::vector<route_match<int>> v;
        BOOST_TEST_NO_THROW(v = t.find_all("/x/" + seg, "GET"));
        if(BOOST_TEST_EQ(v.size(), 1u))
        {
            BOOST_TEST_EQ(v[0].data, 1);
            BOOST_TEST(! v[0].params.contains("id"));
        }
        BOOST_TEST_NO_THROW(t.find("/x/" + seg, "GET"));

        // short input still matches
        auto m = t.find("/x/aab", "GET");
        if(BOOST_TEST(m.has_value()))
            BOOST_TEST_EQ(m->params.at("id"), "aab");
    }

    void
    testMethodToken()
    {
        BOOST_TEST(is_method_token(""));
        BOOST_TEST(is_method_token("GET"));
        BOOST_TEST(is_method_token("get"));
        BOOST_TEST(is_method_token("M-SEARCH"));
        BOOST_TEST(! is_method_token("GE T"));
        BOOST_TEST(! is_method_token("GET/"));
        BOOST_TEST(! is_method_token("(GET)"));
    }

    void
    run()
    {
        testGrammar();
        testLiteral();
        testParam();
        testUnnamed();
        testWildcard();
        testPattern();
        testErrors();
        testExtract();
        testRunawayPattern();
        testMethodToken();
    }
};

} // detail
} // trellis

int
main()
{
    trellis::detail::route_rule_test().run();
    return boost::report_errors();
}
