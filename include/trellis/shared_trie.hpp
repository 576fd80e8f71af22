//
// Copyright (c) 2025 The Trellis Authors
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef TRELLIS_SHARED_TRIE_HPP
#define TRELLIS_SHARED_TRIE_HPP

#include <trellis/detail/config.hpp>
#include <trellis/basic_trie.hpp>
#include <trellis/logger.hpp>
#include <memory>
#include <mutex>
#include <utility>

namespace trellis {

/** A trie which may be replaced while lookups are in flight.

    A new trie is built off to the side and installed with
    @ref store. Callers obtain the current trie with @ref load
    and keep using that snapshot, including references to
    its payloads, for as long as they hold it.

    @par Example
    @code
    shared_trie<handler> routes( build_routes() );

    // request thread
    auto t = routes.load();
    if(auto m = t->find( path, method ))
        m->data( m->params );

    // reload thread
    routes.store( build_routes() );
    @endcode

    @par Thread Safety
    All member functions may be called concurrently.
*/
template<class T>
class shared_trie
{
    mutable std::mutex m_;
    std::shared_ptr<basic_trie<T> const> p_;

public:
    /** The type of snapshot returned by @ref load.
    */
    using snapshot = std::shared_ptr<basic_trie<T> const>;

    shared_trie(shared_trie const&) = delete;
    shared_trie& operator=(shared_trie const&) = delete;

    /** Constructor.

        The initial trie is empty.
    */
    shared_trie()
        : p_(std::make_shared<basic_trie<T> const>())
    {
    }

    /** Constructor.

        @param t The initial trie.
    */
    explicit
    shared_trie(basic_trie<T>&& t)
        : p_(std::make_shared<basic_trie<T> const>(
            std::move(t)))
    {
    }

    /** Return the current trie.

        The returned snapshot is never null.
    */
    snapshot
    load() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return p_;
    }

    /** Replace the current trie.

        Snapshots already returned by @ref load are
        unaffected. The previous trie is destroyed when
        its last snapshot is released.

        @param t The new trie.
    */
    void
    store(basic_trie<T>&& t)
    {
        snapshot p = std::make_shared<
            basic_trie<T> const>(std::move(t));
        auto const n = p->size();
        {
            std::lock_guard<std::mutex> lock(m_);
            p_.swap(p);
        }
        // p holds the old trie, released outside the lock
        get_logger()->info(
            "route table replaced, {} route(s)", n);
    }
};

} // trellis

#endif
