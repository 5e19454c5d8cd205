#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "cobra/common/types.hpp"

namespace cobra::jobs {

// Unbounded multi-producer queue. pop() blocks until a message arrives or
// the queue is closed and drained.
template <typename T> class MessageQueue {
public:
    MessageQueue()                               = default;
    ~MessageQueue()                              = default;
    MessageQueue(const MessageQueue&)            = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;
    MessageQueue(MessageQueue&&)                 = delete;
    MessageQueue& operator=(MessageQueue&&)      = delete;

    // Returns false once the queue is closed.
    bool push(T message) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_messages.push_back(std::move(message));
        }
        m_cv.notify_one();
        return true;
    }

    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_closed || !m_messages.empty(); });
        return take_front();
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout,
                      [this] { return m_closed || !m_messages.empty(); });
        return take_front();
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return take_front();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    [[nodiscard]] bool is_closed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

    [[nodiscard]] SizeType size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_messages.size();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<T> m_messages;
    bool m_closed{false};

    // Caller holds m_mutex.
    std::optional<T> take_front() {
        if (m_messages.empty()) {
            return std::nullopt;
        }
        T message = std::move(m_messages.front());
        m_messages.pop_front();
        return message;
    }
};

} // namespace cobra::jobs
