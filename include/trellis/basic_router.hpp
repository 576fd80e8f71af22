//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_BASIC_ROUTER_HPP
#define TRELLIS_BASIC_ROUTER_HPP

#include <trellis/detail/config.hpp>
#include <trellis/detail/path.hpp>
#include <trellis/logger.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace trellis {

template<class> class basic_trie;

/** A container of route declarations.

    `basic_router` collects the routes of an application, or of
    a sub-application, before any trie exists. Each declaration
    pairs a method and a path pattern with an opaque payload.
    Patterns are prefixed with the router's own prefix when
    they are declared.

    A router is turned into a @ref basic_trie by moving it into
    the trie's constructor, which inserts every declaration in
    order.

    @par Example
    @code
    basic_router<handler> users( "/users" );
    users.add( "GET", "/", list_users );
    users.add( "GET", "/:id", show_user );

    basic_router<handler> app( "/api" );
    app.use( std::move(users) );        // GET /api/users, GET /api/users/:id
    app.all( "/**", proxy_upstream );

    basic_trie<handler> trie( std::move(app) );
    @endcode

    @par Mounting

    A sub-application is mounted with @ref use. Every route of
    the child is re-declared on the parent with the parent's
    prefix prepended, in the child's declaration order. Mounted
    routes may overlap with existing ones; the trie keeps all of
    them and @ref basic_trie::find_all returns every match.

    @par Thread Safety

    Distinct objects: Safe.

    Shared objects: Unsafe.

    @tparam T The payload type. It must be move constructible.
*/
template<class T>
class basic_router
{
    static_assert(
        std::is_move_constructible<T>::value,
        "T must be move constructible");

    template<class> friend class basic_trie;

    struct declaration
    {
        std::string method;
        std::string pattern;
        T data;
    };

    std::string prefix_;
    std::vector<declaration> v_;

public:
    /** The type of payload stored with each route.
    */
    using value_type = T;

    /** A fluent interface for declaring routes on one pattern.

        @code
        router.route( "/users/:id" )
            .add( "GET", show_user )
            .add( "PUT", update_user )
            .all( log_access );
        @endcode
    */
    class fluent_route;

    basic_router(basic_router const&) = delete;
    basic_router& operator=(basic_router const&) = delete;

    basic_router(basic_router&&) = default;
    basic_router& operator=(basic_router&&) = default;

    /** Constructor.

        @param prefix The path prefix applied to every route
        declared on this router. It is normalized, so that
        `"api/"`, `"/api"` and `"//api"` are equivalent.
    */
    explicit
    basic_router(
        std::string_view prefix = {})
        : prefix_(detail::join_path({ prefix }))
    {
    }

    /** Return the normalized prefix of this router.
    */
    std::string const&
    prefix() const noexcept
    {
        return prefix_;
    }

    /** Return the number of declared routes.
    */
    std::size_t
    size() const noexcept
    {
        return v_.size();
    }

    /** Return true if no routes are declared.
    */
    bool
    empty() const noexcept
    {
        return v_.empty();
    }

    /** Declare a route for a method.

        The pattern is not validated until the router
        is inserted into a trie.

        @param method The method to match. The empty
        string matches any method.

        @param pattern The path pattern, relative to
        the router's prefix.

        @param data The payload to store.
    */
    void
    add(
        std::string_view method,
        std::string_view pattern,
        T data)
    {
        v_.push_back(declaration{
            std::string(method),
            detail::join_path({ prefix_, pattern }),
            std::move(data) });
    }

    /** Declare a route for several methods.

        One declaration is made for each method,
        each holding a copy of the payload.
    */
    void
    add(
        std::initializer_list<std::string_view> methods,
        std::string_view pattern,
        T const& data)
    {
        for(auto m : methods)
            add(m, pattern, data);
    }

    /** Declare a route matching any method.

        This is equivalent to calling `add( "", pattern, data )`.
    */
    void
    all(
        std::string_view pattern,
        T data)
    {
        add(std::string_view(), pattern, std::move(data));
    }

    /** Return a fluent route for a pattern.
    */
    auto
    route(
        std::string_view pattern) -> fluent_route
    {
        return fluent_route(*this, pattern);
    }

    /** Mount a sub-application.

        Every route of `child` is declared on this router,
        in order, with this router's prefix prepended to
        the child's pattern. The child is left empty.

        @param child The router to mount.
    */
    void
    use(basic_router&& child)
    {
        v_.reserve(v_.size() + child.v_.size());
        for(auto& d : child.v_)
            v_.push_back(declaration{
                std::move(d.method),
                detail::join_path({ prefix_, d.pattern }),
                std::move(d.data) });
        get_logger()->debug(
            "mounted {} route(s) from {} under {}",
            child.v_.size(), child.prefix_, prefix_);
        child.v_.clear();
    }
};

//------------------------------------------------

template<class T>
class basic_router<T>::
    fluent_route
{
public:
    fluent_route(fluent_route const&) = default;

    /** Declare the pattern for a method.
    */
    auto
    add(
        std::string_view method,
        T data) -> fluent_route
    {
        owner_.add(method, pattern_, std::move(data));
        return *this;
    }

    /** Declare the pattern for any method.
    */
    auto
    all(T data) -> fluent_route
    {
        owner_.all(pattern_, std::move(data));
        return *this;
    }

private:
    friend class basic_router;

    fluent_route(
        basic_router& owner,
        std::string_view pattern)
        : pattern_(pattern)
        , owner_(owner)
    {
    }

    std::string_view pattern_;
    basic_router& owner_;
};

} // trellis

#endif
