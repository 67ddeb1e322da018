/**
 * @file WaitQueue.hh
 *
 * Licensed under the MIT License <https://opensource.org/licenses/MIT>.
 * SPDX-License-Identifier: MIT
 * Copyright (c) 2022 Zachary Parker
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy of
 * this software and associated documentation files (the "Software"), to deal in
 * the Software without restriction, including without limitation the rights to
 * use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
 * of the Software, and to permit persons to whom the Software is furnished to do
 * so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#ifndef __MESHWIRE_UTIL_WAIT_QUEUE_HH__
#define __MESHWIRE_UTIL_WAIT_QUEUE_HH__

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace meshwire::util {

/**
 * Unbounded FIFO with blocking, timed and non-blocking get.
 *
 * An empty result from a get means the wait timed out, the queue was
 * empty (tryGet), or the queue was cancelled.
 */
template <typename T, typename Alloc = std::allocator<T>, template <typename, typename> class Q = std::deque>
class WaitQueue
{
public:
    using Clock = std::chrono::steady_clock;
    using Mutex = std::timed_mutex;
    using Lock = std::unique_lock<Mutex>;
    using Value = T;
    using ReturnType = std::optional<Value>;
    using Queue = Q<Value, Alloc>;

    void put(Value t)
    {
        {
            Lock lk(mtx_);
            q_.push_back(std::move(t));
        }

        cond_.notify_one();
    }

    ReturnType get()
    {
        return doGet(nullptr);
    }

    template <typename Rep, typename Period>
    ReturnType get(const std::chrono::duration<Rep, Period> &tmo)
    {
        const auto deadline = Clock::now() + tmo;
        return doGet(&deadline);
    }

    ReturnType tryGet()
    {
        Lock lk(mtx_);

        if (q_.empty())
            return { };

        return pop();
    }

    /**
     * Wake all waiters; gets return nothing until resume().
     */
    void cancel() noexcept
    {
        {
            Lock lk(mtx_);
            done_ = true;
        }

        cond_.notify_all();
    }

    void resume() noexcept
    {
        Lock lk(mtx_);
        done_ = false;
    }

    bool done() const noexcept
    {
        return done_;
    }

    size_t size() const
    {
        Lock lk(mtx_);
        return q_.size();
    }

    bool empty() const
    {
        return !size();
    }

private:
    ReturnType doGet(const Clock::time_point *deadline)
    {
        Lock lk(mtx_, std::defer_lock_t{ });

        if (deadline)
        {
            if (!lk.try_lock_until(*deadline))
                return { };
        }
        else
        {
            lk.lock();
        }

        const auto ready = [this]{ return done_ || !q_.empty(); };

        if (!deadline)
            cond_.wait(lk, ready);
        else if (!cond_.wait_until(lk, *deadline, ready))
            return { };

        if (done_)
            return { };

        return pop();
    }

    Value pop()
    {
        auto t = std::move(q_.front());
        q_.pop_front();
        return t;
    }

    mutable Mutex mtx_;
    std::condition_variable_any cond_;
    Queue q_;
    std::atomic_bool done_{ };
};

}

#endif
