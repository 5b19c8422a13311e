#pragma once

/// @file run_loop.hpp
/// @brief Single-threaded queue of coroutines to resume
///
/// A RunLoop belongs to the thread that drives it (sync_wait installs one
/// for its duration). Producers never resume a consumer themselves: they
/// schedule() the consumer's handle on its loop and return.

#include "fwd.hpp"

#include <condition_variable>
#include <coroutine>
#include <deque>
#include <mutex>
#include <utility>

namespace beacon_stream {

class RunLoop {
public:
    RunLoop() = default;

    RunLoop(const RunLoop&) = delete;
    RunLoop& operator=(const RunLoop&) = delete;

    /// Queue a handle for resumption on the loop's thread. Any thread.
    void schedule(std::coroutine_handle<> handle) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_ready.push_back(handle);
        }
        m_condition.notify_one();
    }

    /// Ask run() to return once the queue is empty. Any thread.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopped = true;
        }
        m_condition.notify_one();
    }

    /// Resume queued handles on the calling thread until stop()
    void run() {
        for (;;) {
            std::coroutine_handle<> next;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_condition.wait(lock, [this] { return !m_ready.empty() || m_stopped; });
                if (m_ready.empty()) {
                    return;
                }
                next = m_ready.front();
                m_ready.pop_front();
            }
            next.resume();
        }
    }

    /// Loop driving the calling thread, nullptr outside sync_wait
    [[nodiscard]] static RunLoop* current() noexcept { return current_slot(); }

    /// Installs a loop as current() for the enclosing scope
    class Scope {
    public:
        explicit Scope(RunLoop& loop) noexcept
            : m_previous(std::exchange(current_slot(), &loop)) {}

        ~Scope() { current_slot() = m_previous; }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        RunLoop* m_previous;
    };

private:
    static RunLoop*& current_slot() noexcept {
        thread_local RunLoop* loop = nullptr;
        return loop;
    }

    std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<std::coroutine_handle<>> m_ready;
    bool m_stopped = false;
};

/// Resume `handle` on `loop`, or right here when the waiter had none
inline void resume_on(RunLoop* loop, std::coroutine_handle<> handle) {
    if (loop) {
        loop->schedule(handle);
    } else {
        handle.resume();
    }
}

} // namespace beacon_stream
