/* This file is part of Causeway project
 * Copyright (c) 2025 Causeway contributors
 * This code is distributed under the license specified in:
 * LICENSE */
#ifndef CAUSEWAY_ASYNC_HPP
#define CAUSEWAY_ASYNC_HPP

#include <future>
#include <cw/error.hpp>
#include <cw/logger.hpp>

namespace causeway::async {
    // The result of a unit of work running on its own thread. It is handed to the joiner exactly once.
    template<typename T>
    struct task {
        explicit task(std::future<result<T>> &&f): _future { std::move(f) }
        {
        }

        task(task &&) =default;
        task &operator=(task &&) =delete;

        ~task()
        {
            if (_future.valid()) {
                if (auto res = _future.get(); !res)
                    logger::warn("a task has been destroyed without being joined and it failed with: {}", res.error());
            }
        }

        bool joinable() const noexcept
        {
            return _future.valid();
        }

        result<T> join()
        {
            if (!_future.valid()) [[unlikely]]
                fatal("a task can be joined only once");
            return _future.get();
        }
    private:
        std::future<result<T>> _future;
    };

    // Exceptions thrown by f are converted into the task's error
    template<typename F>
    auto spawn(F &&f)
    {
        using res_type = capture_result_t<std::decay_t<F> &>;
        using value_type = typename res_type::value_type;
        return task<value_type> {
            std::async(std::launch::async, [f = std::forward<F>(f)]() mutable -> res_type {
                return capture(f);
            })
        };
    }
}

#endif // !CAUSEWAY_ASYNC_HPP
