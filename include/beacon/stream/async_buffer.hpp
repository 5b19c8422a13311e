#pragma once

/// @file async_buffer.hpp
/// @brief Unbounded ordered buffer bridging push-style producers to one pulling consumer
///
/// AsyncBuffer accepts push() from any number of threads and hands the
/// elements, in the order the pushes entered its critical section, to a
/// single consumer that either co_awaits next() or blocks in wait_next().
/// A parked coroutine is resumed on the RunLoop it was suspended from
/// (see sync_wait), never on the pushing thread.
///
/// ```cpp
/// auto buffer = std::make_shared<AsyncBuffer<int>>();
///
/// // Producer side (any thread)
/// buffer->push(1);
/// buffer->close();
///
/// // Consumer side (inside a Task)
/// while (auto value = co_await buffer->next()) {
///     // Handle *value
/// }
/// ```

#include "fwd.hpp"
#include "run_loop.hpp"
#include <beacon/core/log.hpp>

#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace beacon_stream {

/// Ordered async buffer
/// @tparam T Element type (must be movable)
///
/// State is a FIFO queue, a sticky closed flag and one waiter slot. At most
/// one take (next/wait_next/wait_next_for) may be outstanding at a time; a
/// second concurrent take is logged as a contract violation and answered
/// without suspending.
template<typename T>
class AsyncBuffer {
public:
    using value_type = T;
    using size_type = std::size_t;

    // =========================================================================
    // Next Awaitable
    // =========================================================================

    /// Awaitable returned by next(); `co_await` yields std::optional<T>
    class NextAwaitable {
    public:
        explicit NextAwaitable(AsyncBuffer& buffer) : m_buffer(buffer) {}

        bool await_ready() {
            std::lock_guard<std::mutex> lock(m_buffer.m_mutex);
            return !m_buffer.m_queue.empty() || m_buffer.m_closed;
        }

        bool await_suspend(std::coroutine_handle<> handle) {
            std::lock_guard<std::mutex> lock(m_buffer.m_mutex);
            if (!m_buffer.m_queue.empty() || m_buffer.m_closed) {
                return false;
            }
            if (m_buffer.has_waiter_locked()) {
                m_buffer.report_concurrent_take();
                return false;
            }
            m_buffer.m_waiter = handle;
            m_buffer.m_waiter_loop = RunLoop::current();
            return true;
        }

        std::optional<T> await_resume() {
            std::lock_guard<std::mutex> lock(m_buffer.m_mutex);
            return m_buffer.pop_locked();
        }

    private:
        AsyncBuffer& m_buffer;
    };

    // =========================================================================
    // Constructors
    // =========================================================================

    AsyncBuffer() = default;

    // Non-copyable, non-movable (shared between producers and the consumer)
    AsyncBuffer(const AsyncBuffer&) = delete;
    AsyncBuffer& operator=(const AsyncBuffer&) = delete;
    AsyncBuffer(AsyncBuffer&&) = delete;
    AsyncBuffer& operator=(AsyncBuffer&&) = delete;

    // =========================================================================
    // Producer Side
    // =========================================================================

    /// Append an element. A parked coroutine is handed to its run loop and a
    /// blocked thread is notified; neither runs consumer code on the caller.
    /// No-op once closed.
    void push(T value) {
        std::coroutine_handle<> to_resume;
        RunLoop* loop = nullptr;
        bool notify = false;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return;
            }
            m_queue.push_back(std::move(value));
            to_resume = std::exchange(m_waiter, nullptr);
            loop = std::exchange(m_waiter_loop, nullptr);
            notify = m_blocked_waiters > 0;
        }

        if (notify) {
            m_condition.notify_one();
        }
        if (to_resume) {
            resume_on(loop, to_resume);
        }
    }

    /// Mark the buffer closed. Queued elements are still delivered; after
    /// they drain every take yields std::nullopt. Idempotent.
    void close() {
        std::coroutine_handle<> to_resume;
        RunLoop* loop = nullptr;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return;
            }
            m_closed = true;
            to_resume = std::exchange(m_waiter, nullptr);
            loop = std::exchange(m_waiter_loop, nullptr);
        }

        m_condition.notify_all();
        if (to_resume) {
            resume_on(loop, to_resume);
        }
    }

    // =========================================================================
    // Consumer Side
    // =========================================================================

    /// Take the next element, suspending the calling coroutine while the
    /// buffer is empty and open
    [[nodiscard]] NextAwaitable next() {
        return NextAwaitable(*this);
    }

    /// Take the next element, blocking the calling thread while the buffer
    /// is empty and open
    [[nodiscard]] std::optional<T> wait_next() {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_queue.empty() && !m_closed && has_waiter_locked()) {
            report_concurrent_take();
            return std::nullopt;
        }

        ++m_blocked_waiters;
        m_condition.wait(lock, [this] {
            return !m_queue.empty() || m_closed;
        });
        --m_blocked_waiters;

        return pop_locked();
    }

    /// Blocking take with timeout. std::nullopt means either end of
    /// sequence or timeout; drained() tells them apart.
    [[nodiscard]] std::optional<T> wait_next_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_queue.empty() && !m_closed && has_waiter_locked()) {
            report_concurrent_take();
            return std::nullopt;
        }

        ++m_blocked_waiters;
        m_condition.wait_for(lock, timeout, [this] {
            return !m_queue.empty() || m_closed;
        });
        --m_blocked_waiters;

        return pop_locked();
    }

    /// Take the oldest element if one is queued, never waits
    [[nodiscard]] std::optional<T> try_next() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return pop_locked();
    }

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    /// Closed and nothing left to deliver
    [[nodiscard]] bool drained() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed && m_queue.empty();
    }

    [[nodiscard]] size_type pending_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    [[nodiscard]] bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    /// A consumer is currently suspended or blocked on this buffer
    [[nodiscard]] bool has_waiter() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return has_waiter_locked();
    }

private:
    [[nodiscard]] bool has_waiter_locked() const noexcept {
        return static_cast<bool>(m_waiter) || m_blocked_waiters > 0;
    }

    [[nodiscard]] std::optional<T> pop_locked() {
        if (m_queue.empty()) {
            return std::nullopt;
        }
        std::optional<T> value(std::move(m_queue.front()));
        m_queue.pop_front();
        return value;
    }

    void report_concurrent_take() const {
        beacon_core::stream_logger()->error(
            "AsyncBuffer: concurrent take rejected, only one consumer may wait at a time");
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<T> m_queue;
    std::coroutine_handle<> m_waiter;
    RunLoop* m_waiter_loop = nullptr;
    size_type m_blocked_waiters = 0;
    bool m_closed = false;
};

} // namespace beacon_stream
