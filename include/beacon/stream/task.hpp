#pragma once

/// @file task.hpp
/// @brief Lazily started coroutine type and a blocking driver for it
///
/// Task<T> lets consumers write sequential loops over asynchronous
/// sequences. A task does nothing until it is awaited or handed to
/// sync_wait(). sync_wait() drives a RunLoop on the calling thread, so a
/// task that suspends on an AsyncBuffer continues on that thread when a
/// producer pushes from another one.
///
/// ```cpp
/// Task<int> sum(std::shared_ptr<AsyncBuffer<int>> buffer) {
///     int total = 0;
///     while (auto value = co_await buffer->next()) {
///         total += *value;
///     }
///     co_return total;
/// }
///
/// int total = sync_wait(sum(buffer));
/// ```

#include "fwd.hpp"
#include "run_loop.hpp"

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace beacon_stream {

namespace detail {

// =============================================================================
// Promise Base
// =============================================================================

/// Shared promise behaviour: lazy start, continuation hand-off at the end
class TaskPromiseBase {
public:
    struct FinalAwaitable {
        bool await_ready() const noexcept { return false; }

        template<typename Promise>
        std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> handle) noexcept {
            if (auto continuation = handle.promise().m_continuation) {
                return continuation;
            }
            return std::noop_coroutine();
        }

        void await_resume() const noexcept {}
    };

    std::suspend_always initial_suspend() const noexcept { return {}; }
    FinalAwaitable final_suspend() const noexcept { return {}; }

    void unhandled_exception() noexcept {
        m_exception = std::current_exception();
    }

    void set_continuation(std::coroutine_handle<> continuation) noexcept {
        m_continuation = continuation;
    }

protected:
    void rethrow_if_failed() const {
        if (m_exception) {
            std::rethrow_exception(m_exception);
        }
    }

private:
    std::coroutine_handle<> m_continuation;
    std::exception_ptr m_exception;
};

template<typename T>
class TaskPromise : public TaskPromiseBase {
public:
    Task<T> get_return_object() noexcept;

    template<typename U>
        requires std::is_convertible_v<U&&, T>
    void return_value(U&& value) {
        m_value.emplace(std::forward<U>(value));
    }

    T result() {
        rethrow_if_failed();
        return std::move(*m_value);
    }

private:
    std::optional<T> m_value;
};

template<>
class TaskPromise<void> : public TaskPromiseBase {
public:
    Task<void> get_return_object() noexcept;

    void return_void() noexcept {}

    void result() {
        rethrow_if_failed();
    }
};

} // namespace detail

// =============================================================================
// Task
// =============================================================================

/// Lazily started, move-only coroutine producing a T
template<typename T>
class Task {
public:
    using promise_type = detail::TaskPromise<T>;
    using handle_type = std::coroutine_handle<promise_type>;

    Task() = default;
    explicit Task(handle_type handle) noexcept : m_handle(handle) {}

    Task(Task&& other) noexcept : m_handle(std::exchange(other.m_handle, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (m_handle) {
                m_handle.destroy();
            }
            m_handle = std::exchange(other.m_handle, nullptr);
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    ~Task() {
        if (m_handle) {
            m_handle.destroy();
        }
    }

    [[nodiscard]] bool valid() const noexcept { return static_cast<bool>(m_handle); }
    [[nodiscard]] bool done() const noexcept { return m_handle && m_handle.done(); }

    // Awaiting a task starts it and resumes the awaiter when it finishes
    bool await_ready() const noexcept { return !m_handle || m_handle.done(); }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept {
        m_handle.promise().set_continuation(awaiting);
        return m_handle;
    }

    T await_resume() {
        return m_handle.promise().result();
    }

private:
    handle_type m_handle;
};

namespace detail {

template<typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>(std::coroutine_handle<TaskPromise<T>>::from_promise(*this));
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>(std::coroutine_handle<TaskPromise<void>>::from_promise(*this));
}

// =============================================================================
// sync_wait support
// =============================================================================

/// Outer coroutine driven by sync_wait; stops the loop when it finishes
class SyncWaitTask {
public:
    struct promise_type {
        RunLoop* loop = nullptr;

        SyncWaitTask get_return_object() noexcept {
            return SyncWaitTask(std::coroutine_handle<promise_type>::from_promise(*this));
        }

        std::suspend_always initial_suspend() const noexcept { return {}; }

        auto final_suspend() const noexcept {
            struct Notifier {
                bool await_ready() const noexcept { return false; }
                void await_suspend(std::coroutine_handle<promise_type> handle) const noexcept {
                    handle.promise().loop->stop();
                }
                void await_resume() const noexcept {}
            };
            return Notifier{};
        }

        void return_void() noexcept {}

        // The wrapped Task stores its own exception; nothing escapes here
        void unhandled_exception() noexcept {}
    };

    explicit SyncWaitTask(std::coroutine_handle<promise_type> handle) noexcept : m_handle(handle) {}

    SyncWaitTask(SyncWaitTask&& other) noexcept : m_handle(std::exchange(other.m_handle, nullptr)) {}
    SyncWaitTask(const SyncWaitTask&) = delete;
    SyncWaitTask& operator=(const SyncWaitTask&) = delete;
    SyncWaitTask& operator=(SyncWaitTask&&) = delete;

    ~SyncWaitTask() {
        if (m_handle) {
            m_handle.destroy();
        }
    }

    void run(RunLoop& loop) {
        RunLoop::Scope scope(loop);
        m_handle.promise().loop = &loop;
        m_handle.resume();
        loop.run();
    }

private:
    std::coroutine_handle<promise_type> m_handle;
};

template<typename T>
SyncWaitTask make_sync_wait_task(Task<T>& task, std::optional<T>& result, std::exception_ptr& error) {
    try {
        result.emplace(co_await task);
    } catch (...) {
        error = std::current_exception();
    }
}

inline SyncWaitTask make_sync_wait_task(Task<void>& task, std::exception_ptr& error) {
    try {
        co_await task;
    } catch (...) {
        error = std::current_exception();
    }
}

} // namespace detail

// =============================================================================
// sync_wait
// =============================================================================

/// Run a task to completion on the calling thread. While the task is
/// suspended the thread serves the task's RunLoop; every resumption of the
/// task happens here. Rethrows the task's exception.
template<typename T>
T sync_wait(Task<T> task) {
    RunLoop loop;
    std::exception_ptr error;

    if constexpr (std::is_void_v<T>) {
        auto driver = detail::make_sync_wait_task(task, error);
        driver.run(loop);
        if (error) {
            std::rethrow_exception(error);
        }
    } else {
        std::optional<T> result;
        auto driver = detail::make_sync_wait_task(task, result, error);
        driver.run(loop);
        if (error) {
            std::rethrow_exception(error);
        }
        return std::move(*result);
    }
}

} // namespace beacon_stream
