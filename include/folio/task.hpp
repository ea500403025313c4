#ifndef FOLIO_TASK_HPP
#define FOLIO_TASK_HPP

#include <coroutine>
#include <cstddef>
#include <deque>
#include <exception>
#include <memory_resource>
#include <optional>
#include <type_traits>
#include <utility>

#include "folio/util/assert.hpp"

#include "folio/fwd.hpp"

namespace folio {

/// @brief A lazily started coroutine which eventually produces a `T`.
///
/// A task does not run until it is either awaited by another coroutine
/// or started by a driver such as `run_layout`.
/// When awaited, the awaiting coroutine is suspended and resumed once the task completes.
/// Exceptions which escape the coroutine body are rethrown to the awaiting coroutine.
///
/// A task exclusively owns its coroutine frame.
/// Destroying a task which has not completed abandons the computation.
template <typename T>
struct [[nodiscard]] Task {
    static_assert(!std::is_reference_v<T> && !std::is_void_v<T>);

    struct promise_type;
    using Handle = std::coroutine_handle<promise_type>;

    struct Final_Awaiter {
        [[nodiscard]]
        bool await_ready() const noexcept
        {
            return false;
        }

        [[nodiscard]]
        std::coroutine_handle<> await_suspend(Handle self) const noexcept
        {
            const std::coroutine_handle<> continuation = self.promise().continuation;
            return continuation ? continuation : std::noop_coroutine();
        }

        void await_resume() const noexcept { }
    };

    struct promise_type {
        std::optional<T> result;
        std::exception_ptr exception;
        std::coroutine_handle<> continuation;

        [[nodiscard]]
        Task get_return_object() noexcept
        {
            return Task { Handle::from_promise(*this) };
        }

        [[nodiscard]]
        std::suspend_always initial_suspend() const noexcept
        {
            return {};
        }

        [[nodiscard]]
        Final_Awaiter final_suspend() const noexcept
        {
            return {};
        }

        template <typename U = T>
            requires std::is_constructible_v<T, U&&>
        void return_value(U&& value)
        {
            result.emplace(std::forward<U>(value));
        }

        void unhandled_exception() noexcept
        {
            exception = std::current_exception();
        }
    };

    struct Awaiter {
        Handle handle;

        [[nodiscard]]
        bool await_ready() const noexcept
        {
            return handle.done();
        }

        [[nodiscard]]
        std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) const noexcept
        {
            handle.promise().continuation = awaiting;
            return handle;
        }

        T await_resume() const
        {
            return take_result(handle);
        }
    };

private:
    Handle m_handle;

    [[nodiscard]]
    explicit Task(Handle handle) noexcept
        : m_handle { handle }
    {
    }

    static T take_result(Handle handle)
    {
        promise_type& promise = handle.promise();
        if (promise.exception) {
            std::rethrow_exception(std::exchange(promise.exception, nullptr));
        }
        FOLIO_ASSERT(promise.result.has_value());
        T result = std::move(*promise.result);
        promise.result.reset();
        return result;
    }

public:
    [[nodiscard]]
    Task(Task&& other) noexcept
        : m_handle { std::exchange(other.m_handle, nullptr) }
    {
    }

    Task& operator=(Task&& other) noexcept
    {
        if (this != &other) {
            reset();
            m_handle = std::exchange(other.m_handle, nullptr);
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    ~Task()
    {
        reset();
    }

    /// @brief Destroys the coroutine frame, abandoning the computation if it is unfinished.
    void reset() noexcept
    {
        if (m_handle) {
            m_handle.destroy();
            m_handle = nullptr;
        }
    }

    [[nodiscard]]
    bool valid() const noexcept
    {
        return bool(m_handle);
    }

    [[nodiscard]]
    bool done() const noexcept
    {
        FOLIO_ASSERT(m_handle);
        return m_handle.done();
    }

    /// @brief Runs the task until it completes or suspends for the first time.
    /// The task shall not have been started or awaited yet.
    void start()
    {
        FOLIO_ASSERT(m_handle);
        FOLIO_ASSERT(!m_handle.done());
        m_handle.resume();
    }

    /// @brief Returns the result of a completed task,
    /// or rethrows the exception which escaped the coroutine.
    /// `done()` shall be `true`, and the result can only be obtained once.
    [[nodiscard]]
    T get_result()
    {
        FOLIO_ASSERT(done());
        return take_result(m_handle);
    }

    [[nodiscard]]
    Awaiter operator co_await() && noexcept
    {
        FOLIO_ASSERT(m_handle);
        return Awaiter { m_handle };
    }
};

/// @brief A single-threaded queue of suspended coroutines which are ready to be resumed.
///
/// The scheduler does not own the coroutines it holds;
/// they are owned by the `Task`s that created them.
/// If a task is abandoned while one of its coroutines is queued,
/// the scheduler has to be `clear`ed before it is used again.
struct Layout_Scheduler {
private:
    std::pmr::deque<std::coroutine_handle<>> m_ready;

public:
    [[nodiscard]]
    explicit Layout_Scheduler(std::pmr::memory_resource* memory)
        : m_ready { memory }
    {
    }

    void post(std::coroutine_handle<> handle)
    {
        FOLIO_ASSERT(handle);
        m_ready.push_back(handle);
    }

    /// @brief Resumes the coroutine which was posted first, if any.
    /// @returns `true` iff a coroutine was resumed.
    bool run_one();

    /// @brief Forgets all queued coroutines without resuming them.
    void clear() noexcept
    {
        m_ready.clear();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_ready.empty();
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_ready.size();
    }
};

/// @brief The awaitable returned by `Layout_Context::yield`.
/// Suspends the awaiting coroutine and posts it to the scheduler,
/// or does nothing if there is no scheduler.
struct Yield_Awaiter {
    Layout_Scheduler* scheduler;

    [[nodiscard]]
    bool await_ready() const noexcept
    {
        return scheduler == nullptr;
    }

    void await_suspend(std::coroutine_handle<> awaiting) const
    {
        scheduler->post(awaiting);
    }

    void await_resume() const noexcept { }
};

/// @brief Starts `task` and resumes coroutines from `scheduler` until `task` is complete.
/// Coroutines belonging to other tasks which happen to be queued in `scheduler`
/// are resumed along the way.
/// @returns The result of `task`.
template <typename T>
[[nodiscard]]
T run_layout(Task<T> task, Layout_Scheduler& scheduler)
{
    task.start();
    while (!task.done()) {
        // If nothing is queued, the task awaits something that will never be resumed.
        const bool resumed = scheduler.run_one();
        FOLIO_ASSERT(resumed);
    }
    return task.get_result();
}

/// @brief Runs `task` to completion without a scheduler.
/// This only works for tasks which never suspend other than by awaiting other tasks,
/// such as any layout that is given a context without scheduler.
template <typename T>
[[nodiscard]]
T run_layout(Task<T> task)
{
    task.start();
    FOLIO_ASSERT(task.done());
    return task.get_result();
}

} // namespace folio

#endif
