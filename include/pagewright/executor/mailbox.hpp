#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace pagewright::executor {

/// Unbounded FIFO queue with many producers and one consumer.
///
/// Items come out in exactly the order they went in. After close(), pushes
/// are rejected and pop() drains what is left before returning nullopt.
template <typename Item>
class Mailbox {
public:
    Mailbox() = default;

    Mailbox(const Mailbox&) = delete;
    Mailbox& operator=(const Mailbox&) = delete;

    /// Appends `item`. Returns false, leaving `item` untouched, if the
    /// mailbox has been closed. Items exposing set_sequence() are stamped
    /// with their 1-based enqueue position.
    auto push(Item&& item) -> bool {
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            ++pushed_;
            if constexpr (requires { item.set_sequence(uint64_t{}); }) {
                item.set_sequence(pushed_);
            }
            items_.push_back(std::move(item));
        }
        ready_.notify_one();
        return true;
    }

    /// Blocks until an item is available. Returns nullopt once the mailbox
    /// is closed and empty.
    auto pop() -> std::optional<Item> {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) {
            return std::nullopt;
        }
        Item item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    [[nodiscard]] auto closed() const -> bool {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] auto size() const -> size_t {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    /// Total number of items ever accepted.
    [[nodiscard]] auto pushed() const -> uint64_t {
        std::lock_guard lock(mutex_);
        return pushed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Item> items_;
    uint64_t pushed_ = 0;
    bool closed_ = false;
};

} // namespace pagewright::executor
