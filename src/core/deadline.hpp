#pragma once

/// @file src/core/deadline.hpp
/// @brief Run a collaborator call on its own thread with a wall-clock budget.
///
/// Used for proof verification and chain-step calls. The call runs on a
/// detached thread that shares ownership of its task, so a caller that gives
/// up after `budget` never waits on it and never leaves a dangling reference
/// behind. Whatever the callable captures must therefore be owned
/// (values or shared_ptr), never borrowed from the caller's stack.
///
/// A timeout and a thrown std::exception both yield `std::nullopt`.

#include "flash/log.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

namespace flash::detail {

template <typename Fn>
[[nodiscard]] std::optional<std::invoke_result_t<Fn&>>
run_with_deadline(Fn fn, std::chrono::milliseconds budget, std::string_view what) {
    using R = std::invoke_result_t<Fn&>;

    auto task   = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    auto future = task->get_future();

    try {
        std::thread([task] { (*task)(); }).detach();
    } catch (const std::system_error& ex) {
        log::warn("deadline", "{}: could not start worker: {}", what, ex.what());
        return std::nullopt;
    }

    if (future.wait_for(budget) != std::future_status::ready) {
        log::warn("deadline", "{}: no answer within {} ms", what, budget.count());
        return std::nullopt;
    }

    try {
        return future.get();
    } catch (const std::exception& ex) {
        log::warn("deadline", "{}: failed: {}", what, ex.what());
        return std::nullopt;
    }
}

} // namespace flash::detail
