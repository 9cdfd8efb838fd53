#pragma once
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <type_traits>
#include "core/media_errors.hpp"
#include "logging/logger.hpp"

class ErrorRecovery
{
public:
    // Timeout wrapper for long-running media operations.
    // The work runs on a detached thread that owns its arguments; on timeout the
    // caller gets InternalFailure right away and the result is discarded later.
    template <typename Func>
    static auto callWithTimeout(Func func, std::chrono::milliseconds timeout, const std::string &operation_name)
        -> std::invoke_result_t<Func>
    {
        using Result = std::invoke_result_t<Func>;

        auto promise = std::make_shared<std::promise<Result>>();
        std::future<Result> future = promise->get_future();

        std::thread worker([promise, func = std::move(func)]() mutable
                           {
            try {
                if constexpr (std::is_void_v<Result>) {
                    func();
                    promise->set_value();
                } else {
                    promise->set_value(func());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            } });
        worker.detach();

        if (future.wait_for(timeout) == std::future_status::timeout)
        {
            Logger::error("Operation '" + operation_name + "' timed out after " +
                          std::to_string(timeout.count()) + "ms");
            throw InternalFailure("Operation '" + operation_name + "' timed out");
        }

        return future.get();
    }
};
