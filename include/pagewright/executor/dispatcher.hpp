#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "pagewright/core/error.hpp"
#include "pagewright/executor/task.hpp"
#include "pagewright/executor/worker.hpp"

namespace pagewright::executor {

/// Caller-facing handle to a Worker. Cheap to copy; every copy talks to the
/// same worker. The dispatcher never touches the resource itself: it wraps
/// the operation in a Task, enqueues it and waits for the reply.
template <typename Resource>
class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<Worker<Resource>> worker) : worker_(std::move(worker)) {}

    /// Runs `op` on the worker and blocks until it has completed.
    /// Returns the operation's value, or its failure unchanged.
    template <typename F>
    auto submit(F op) -> Result<detail::operation_value_t<F, Resource>> {
        using T = detail::operation_value_t<F, Resource>;

        auto future = enqueue<T>(std::move(op));
        if (!future) {
            return std::unexpected(future.error());
        }
        return await_reply(*future);
    }

    /// Like submit(), but stops waiting after `timeout`. The operation is not
    /// cancelled and still runs to completion on the worker.
    template <typename F, typename Rep, typename Period>
    auto submit_for(F op, std::chrono::duration<Rep, Period> timeout)
        -> Result<detail::operation_value_t<F, Resource>> {
        using T = detail::operation_value_t<F, Resource>;

        auto future = enqueue<T>(std::move(op));
        if (!future) {
            return std::unexpected(future.error());
        }
        if (future->wait_for(timeout) == std::future_status::timeout) {
            return std::unexpected(make_error(
                ErrorCode::Timeout, "Timed out waiting for worker reply",
                std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()) +
                    "ms"));
        }
        return await_reply(*future);
    }

    /// Coroutine flavour of submit(): suspends the calling coroutine instead
    /// of blocking its thread. Completion resumes on the coroutine's executor.
    template <typename F>
    auto async_submit(F op)
        -> boost::asio::awaitable<Result<detail::operation_value_t<F, Resource>>> {
        using T = detail::operation_value_t<F, Resource>;

        if (auto valid = validate(op); !valid) {
            co_return make_fail(valid.error());
        }

        co_return co_await boost::asio::async_initiate<decltype(boost::asio::use_awaitable),
                                                       void(Result<T>)>(
            [worker = worker_](auto handler, F operation) {
                auto work = boost::asio::make_work_guard(
                    boost::asio::get_associated_executor(handler));

                auto reply = [handler = std::move(handler),
                              work = std::move(work)](Result<T> result) mutable {
                    auto ex = work.get_executor();
                    boost::asio::post(ex, [handler = std::move(handler),
                                           result = std::move(result)]() mutable {
                        std::move(handler)(std::move(result));
                    });
                    work.reset();
                };

                // A rejected task is abandoned, which completes the handler.
                (void)worker->post(Task<Resource>(std::move(operation), std::move(reply)));
            },
            boost::asio::use_awaitable, std::move(op));
    }

    [[nodiscard]] auto worker() const -> const std::shared_ptr<Worker<Resource>>& {
        return worker_;
    }

    friend auto operator==(const Dispatcher& a, const Dispatcher& b) -> bool {
        return a.worker_ == b.worker_;
    }

private:
    template <typename F>
    auto validate(const F& op) const -> VoidResult {
        static_assert(std::is_invocable_v<F&, Resource&>,
                      "operation must be callable with Resource&");

        if constexpr (detail::is_nullable_v<F>) {
            if (!op) {
                return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                                  "Operation must not be null"));
            }
        }
        if (!worker_) {
            return std::unexpected(make_error(ErrorCode::InvalidState,
                                              "Dispatcher is not bound to a worker"));
        }
        if (worker_->on_worker_thread()) {
            return std::unexpected(make_error(ErrorCode::InvalidState,
                                              "Cannot submit from the worker thread",
                                              worker_->name()));
        }
        return {};
    }

    template <typename T, typename F>
    auto enqueue(F op) -> Result<std::future<Result<T>>> {
        if (auto valid = validate(op); !valid) {
            return std::unexpected(valid.error());
        }

        std::promise<Result<T>> promise;
        auto future = promise.get_future();
        // A rejected task is abandoned, so the future still carries the error.
        (void)worker_->post(Task<Resource>(std::move(op), PromiseReply<T>(std::move(promise))));
        return future;
    }

    template <typename T>
    static auto await_reply(std::future<Result<T>>& future) -> Result<T> {
        try {
            return future.get();
        } catch (const std::future_error& e) {
            return std::unexpected(make_error(ErrorCode::QueueClosed,
                                              "Task was dropped before it replied", e.what()));
        }
    }

    std::shared_ptr<Worker<Resource>> worker_;
};

} // namespace pagewright::executor
