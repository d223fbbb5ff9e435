#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "pagewright/core/error.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/executor/dispatcher.hpp"
#include "pagewright/executor/worker.hpp"

namespace pagewright::executor {

/// Lazily creates the one Worker for a resource and hands out dispatchers
/// to it.
///
/// A Host is an ordinary object: the application creates it once and passes
/// it (or the dispatcher it returns) to whoever needs the resource.
template <typename Resource>
class Host {
public:
    using Factory = typename Worker<Resource>::Factory;

    explicit Host(Factory factory, std::string name = "worker")
        : factory_(std::move(factory)), name_(std::move(name)) {}

    Host(const Host&) = delete;
    Host& operator=(const Host&) = delete;

    /// Returns the shared dispatcher, starting the worker on the first call.
    /// Concurrent first calls serialize on the lock, so only one worker is
    /// ever built. If building fails the error goes to the caller that
    /// attempted it and the next call tries again.
    auto get_or_create() -> Result<Dispatcher<Resource>> {
        std::lock_guard lock(mutex_);
        if (worker_) {
            return Dispatcher<Resource>(worker_);
        }

        LOG_INFO("Starting worker '{}'", name_);
        auto worker = Worker<Resource>::start(factory_, name_);
        if (!worker) {
            LOG_WARN("Worker '{}' failed to start: {}", name_, worker.error().what());
            return std::unexpected(worker.error());
        }
        worker_ = std::move(*worker);
        return Dispatcher<Resource>(worker_);
    }

    [[nodiscard]] auto initialized() const -> bool {
        std::lock_guard lock(mutex_);
        return worker_ != nullptr;
    }

    [[nodiscard]] auto name() const -> const std::string& { return name_; }

private:
    Factory factory_;
    std::string name_;
    mutable std::mutex mutex_;
    std::shared_ptr<Worker<Resource>> worker_;
};

} // namespace pagewright::executor
