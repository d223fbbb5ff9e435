#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "pagewright/core/error.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/executor/mailbox.hpp"
#include "pagewright/executor/task.hpp"

namespace pagewright::executor {

enum class WorkerState {
    Idle,
    Executing,
};

/// Owns a thread-confined resource and runs tasks against it, one at a
/// time, in mailbox order.
///
/// The resource is built by the factory on the worker thread, only ever
/// touched by tasks running on that thread, and destroyed there when the
/// worker shuts down. A failing task never stops the loop.
template <typename Resource>
class Worker {
public:
    using Factory = std::function<Result<std::unique_ptr<Resource>>()>;

    /// Spawns the worker thread and waits for the resource to be built.
    /// A factory failure is returned here and no worker survives.
    static auto start(Factory factory, std::string name = "worker")
        -> Result<std::shared_ptr<Worker>> {
        if (!factory) {
            return std::unexpected(make_error(ErrorCode::InvalidArgument,
                                              "Worker factory must not be empty"));
        }

        auto worker = std::shared_ptr<Worker>(new Worker(std::move(name)));

        std::promise<VoidResult> ready;
        auto ready_future = ready.get_future();
        worker->thread_ = std::thread(&Worker::run, worker->shared_,
                                      std::move(factory), std::move(ready));

        auto init = ready_future.get();
        if (!init) {
            worker->thread_.join();
            return std::unexpected(init.error());
        }
        return worker;
    }

    ~Worker() {
        shared_->mailbox.close();
        if (!thread_.joinable()) {
            return;
        }
        if (std::this_thread::get_id() == thread_.get_id()) {
            // Last reference dropped by a task; the thread keeps the shared
            // state alive and exits once the mailbox drains.
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;
    Worker(Worker&&) = delete;
    Worker& operator=(Worker&&) = delete;

    /// Enqueues a task. If the worker is shutting down the task is abandoned
    /// with QueueClosed, which also completes its reply.
    auto post(Task<Resource>&& task) -> VoidResult {
        if (!shared_->mailbox.push(std::move(task))) {
            auto error = make_error(ErrorCode::QueueClosed, "Worker is shutting down",
                                    shared_->name);
            task.abandon(error);
            return std::unexpected(std::move(error));
        }
        return {};
    }

    [[nodiscard]] auto on_worker_thread() const -> bool {
        return std::this_thread::get_id() == shared_->thread_id.load();
    }

    [[nodiscard]] auto state() const -> WorkerState { return shared_->state.load(); }
    [[nodiscard]] auto pending() const -> size_t { return shared_->mailbox.size(); }
    [[nodiscard]] auto executed() const -> uint64_t { return shared_->executed.load(); }
    [[nodiscard]] auto name() const -> const std::string& { return shared_->name; }

private:
    struct Shared {
        explicit Shared(std::string n) : name(std::move(n)) {}

        std::string name;
        Mailbox<Task<Resource>> mailbox;
        std::atomic<std::thread::id> thread_id{};
        std::atomic<WorkerState> state{WorkerState::Idle};
        std::atomic<uint64_t> executed{0};
    };

    explicit Worker(std::string name) : shared_(std::make_shared<Shared>(std::move(name))) {}

    static void run(std::shared_ptr<Shared> shared, Factory factory,
                    std::promise<VoidResult> ready) {
        shared->thread_id = std::this_thread::get_id();

        std::unique_ptr<Resource> resource;
        try {
            auto created = factory();
            if (!created) {
                LOG_ERROR("Worker '{}' failed to build its resource: {}", shared->name,
                          created.error().what());
                ready.set_value(std::unexpected(created.error()));
                return;
            }
            resource = std::move(*created);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker '{}' resource factory threw: {}", shared->name, e.what());
            ready.set_value(std::unexpected(make_error(ErrorCode::InternalError,
                                                       "Resource construction failed",
                                                       e.what())));
            return;
        } catch (...) {
            LOG_ERROR("Worker '{}' resource factory threw a non-standard exception",
                      shared->name);
            ready.set_value(std::unexpected(make_error(ErrorCode::InternalError,
                                                       "Resource construction failed",
                                                       "non-standard exception")));
            return;
        }

        if (!resource) {
            ready.set_value(std::unexpected(make_error(ErrorCode::InternalError,
                                                       "Resource factory returned null",
                                                       shared->name)));
            return;
        }

        LOG_DEBUG("Worker '{}' started", shared->name);
        ready.set_value(VoidResult{});

        while (auto task = shared->mailbox.pop()) {
            shared->state = WorkerState::Executing;
            LOG_TRACE("Worker '{}' executing task #{}", shared->name, task->sequence());
            try {
                task->run(*resource);
            } catch (const std::exception& e) {
                // Only reply delivery can get here; the operation itself is
                // already guarded.
                LOG_ERROR("Worker '{}' could not deliver reply for task #{}: {}",
                          shared->name, task->sequence(), e.what());
            } catch (...) {
                LOG_ERROR("Worker '{}' could not deliver reply for task #{}", shared->name,
                          task->sequence());
            }
            shared->executed.fetch_add(1);
            shared->state = WorkerState::Idle;
        }

        resource.reset();
        LOG_DEBUG("Worker '{}' stopped after {} tasks", shared->name, shared->executed.load());
    }

    std::shared_ptr<Shared> shared_;
    std::thread thread_;
};

} // namespace pagewright::executor
