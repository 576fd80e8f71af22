//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

// Test that header file is self-contained.
#include <trellis/detail/path.hpp>

#include <boost/core/lightweight_test.hpp>

namespace trellis {
namespace detail {

struct path_test
{
    void
    check(
        std::string_view path,
        std::initializer_list<std::string_view> init)
    {
        segments_type const v0(init);
        auto const v = split_path(path);
        BOOST_TEST_EQ(v.size(), v0.size());
        if(v.size() != v0.size())
            return;
        for(std::size_t i = 0; i < v.size(); ++i)
            BOOST_TEST_EQ(v[i], v0[i]);
    }

    void
    testSplit()
    {
        check("", {});
        check("/", {});
        check("//", {});
        check("/a", { "a" });
        check("a", { "a" });
        check("/a/", { "a" });
        check("a/b", { "a", "b" });
        check("/users/42", { "users", "42" });
        check("//a///b//", { "a", "b" });
        check("/files/**rest", { "files", "**rest" });

        // views refer to the input
        std::string_view const s = "/abc/def";
        auto const v = split_path(s);
        BOOST_TEST_EQ(v.size(), 2u);
        BOOST_TEST(v[0].data() == s.data() + 1);
        BOOST_TEST(v[1].data() == s.data() + 5);
    }

    void
    testJoin()
    {
        BOOST_TEST_EQ(join_path({}), "/");
        BOOST_TEST_EQ(join_path({ "" }), "/");
        BOOST_TEST_EQ(join_path({ "/" }), "/");
        BOOST_TEST_EQ(join_path({ "api" }), "/api");
        BOOST_TEST_EQ(join_path({ "/api/" }), "/api");
        BOOST_TEST_EQ(join_path({ "//api" }), "/api");
        BOOST_TEST_EQ(join_path({ " api " }), "/api");
        BOOST_TEST_EQ(join_path({ "/", "/users" }), "/users");
        BOOST_TEST_EQ(join_path({ "/api", "users/" }), "/api/users");
        BOOST_TEST_EQ(join_path({ "/api", "/" }), "/api");
        BOOST_TEST_EQ(join_path({ "/api", "/ /", "v1" }), "/api/v1");
        BOOST_TEST_EQ(join_path({ "/api/v1", ":id" }), "/api/v1/:id");
    }

    void
    run()
    {
        testSplit();
        testJoin();
    }
};

} // detail
} // trellis

int
main()
{
    trellis::detail::path_test().run();
    return boost::report_errors();
}
