//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine Task type bridging coroutine bodies to std::future for C++20
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <utility>

namespace dorismcp {
namespace async {

namespace detail {
// Shared promise plumbing for Task<T> and Task<void>
template <typename T>
struct PromiseBase {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};
} // namespace detail

//==========================================================================================================
// Task<T>
// Purpose: Coroutine return type that starts running immediately and publishes its outcome through a
//          std::future. Exceptions escaping the coroutine body are stored in the future.
// Usage:
//   Task<int> compute() { co_return 42; }
//   std::future<int> f = compute().toFuture();
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;

    struct promise_type : detail::PromiseBase<T> {
        Task get_return_object() noexcept { return Task{ this->promise.get_future() }; }
        template <typename U>
        requires std::convertible_to<U, T>
        void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
    };

    Task(Task&& other) noexcept = default;
    Task& operator=(Task&& other) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

template <>
class Task<void> {
public:
    using value_type = void;

    struct promise_type : detail::PromiseBase<void> {
        Task get_return_object() noexcept { return Task{ this->promise.get_future() }; }
        void return_void() { this->promise.set_value(); }
    };

    Task(Task&& other) noexcept = default;
    Task& operator=(Task&& other) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<void> toFuture() { return std::move(fut); }

private:
    explicit Task(std::future<void>&& f) : fut(std::move(f)) {}
    std::future<void> fut;
};

} // namespace async
} // namespace dorismcp
