//
// Copyright (c) 2023-2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef CMDCHAT_COMMON_INCLUDE_UTIL_ASYNC_MUTEX_HPP
#define CMDCHAT_COMMON_INCLUDE_UTIL_ASYNC_MUTEX_HPP

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/as_tuple.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/channel.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <cassert>
#include <memory>

#include "error.hpp"

namespace cmdchat {

// An asynchronous mutex to guarantee mutual exclusion in async code.
// This is not thread-safe: it ensures mutual exclusion between coroutines
// running in the same thread. Used to serialize websocket writes.
class async_mutex
{
    // Is the mutex locked?
    bool locked_{false};

    // Set by cancel(). A cancelled mutex can't be acquired anymore
    bool cancelled_{false};

    // Acts as a condition variable, so that coroutines waiting to acquire
    // the mutex can be notified when another coroutine releases it
    boost::asio::experimental::channel<void(error_code)> chan_;

    struct guard_deleter
    {
        void operator()(async_mutex* self) const noexcept { self->unlock(); }
    };

public:
    // Constructors, assignments, destructor
    explicit async_mutex(boost::asio::any_io_executor ex) : chan_(std::move(ex)) {}
    async_mutex(const async_mutex&) = delete;
    async_mutex(async_mutex&&) = default;
    async_mutex& operator=(const async_mutex&) = delete;
    async_mutex& operator=(async_mutex&&) = default;
    ~async_mutex() = default;

    // Is the mutex locked?
    bool locked() const noexcept { return locked_; }

    // Suspends the current coroutine until the mutex can be acquired, then acquires it.
    // Fails with operation_aborted if cancel() is called while waiting, or was called before.
    boost::asio::awaitable<error_code> lock()
    {
        // A waiter woken by unlock() may find the mutex acquired by a coroutine
        // that never had to wait. In this case, wait again.
        while (locked_ && !cancelled_)
        {
            auto [ec] = co_await chan_.async_receive(boost::asio::as_tuple(boost::asio::use_awaitable));
            if (ec)
                co_return ec;
        }

        if (cancelled_)
            co_return boost::asio::error::operation_aborted;

        locked_ = true;
        co_return error_code();
    }

    // Try to acquire without suspending
    bool try_lock() noexcept
    {
        if (locked_ || cancelled_)
            return false;
        locked_ = true;
        return true;
    }

    // Unlock. The mutex must be locked
    void unlock() noexcept
    {
        assert(locked_);
        locked_ = false;

        // Notify a waiting coroutine, if any
        chan_.try_send(error_code());
    }

    // Makes all current and future calls to lock() fail. Used when tearing down
    // the object that owns the mutex, so that no coroutine stays suspended.
    void cancel()
    {
        cancelled_ = true;
        chan_.cancel();
    }

    // RAII-style lock. The returned guard is empty if the lock couldn't be acquired
    using guard = std::unique_ptr<async_mutex, guard_deleter>;
    boost::asio::awaitable<guard> lock_with_guard()
    {
        auto ec = co_await lock();
        co_return ec ? guard() : guard(this);
    }
};

}  // namespace cmdchat

#endif
