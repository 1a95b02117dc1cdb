#pragma once

#include "control/protocol.hpp"
#include "sway/events.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

// Blocking FIFO with a fixed capacity, many producers and one consumer.
// push() waits while the queue is full, which throttles producers to the
// consumer's pace.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false (and drops `item`) once the queue is closed.
    bool push(T item) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) return false;
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Waits for the next item. nullopt once the queue is closed.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (closed_) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    // Refuse further pushes, wake all waiters and hand back what was still queued.
    std::vector<T> close() {
        std::lock_guard lock(mutex_);
        closed_ = true;
        std::vector<T> rest(std::make_move_iterator(items_.begin()),
                            std::make_move_iterator(items_.end()));
        items_.clear();
        not_full_.notify_all();
        not_empty_.notify_all();
        return rest;
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
};

// A parsed control request and the client connection waiting for its reply.
struct ControlRequest {
    Command command;
    int client_fd = -1;
};

// Ask the engine to stop. `connection_lost` marks an unrecoverable compositor failure.
struct Terminate {
    bool connection_lost = false;
};

using Input = std::variant<Event, ControlRequest, Terminate>;
using InputQueue = BoundedQueue<Input>;
