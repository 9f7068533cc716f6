#pragma once

#include <msgbroker/message.hpp>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>

namespace msgbroker {

/**
 * @brief Small bounded FIFO between producers and a topic's router.
 *
 * Producers block in @ref push while the buffer is full; the consumer blocks
 * in @ref pop while it is empty.  Both waits give up as soon as the supplied
 * stop token is triggered.
 */
class IngestBuffer {
  private:
    const size_t m_capacity;
    std::deque<std::unique_ptr<Message>> m_queue;
    std::mutex m_mutex;
    std::condition_variable_any m_not_empty;
    std::condition_variable_any m_not_full;

  public:
    explicit IngestBuffer(size_t capacity) : m_capacity(capacity) {}

    /// @return `false` if @p stop fired before there was room.
    bool push(std::unique_ptr<Message> msg, std::stop_token stop) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_not_full.wait(lock, stop,
                                 [&] { return m_queue.size() < m_capacity; }) ||
                stop.stop_requested()) {
                return false;
            }
            m_queue.push_back(std::move(msg));
        }
        m_not_empty.notify_one();
        return true;
    }

    /// @return Next message, or `std::nullopt` once @p stop fired.
    std::optional<std::unique_ptr<Message>> pop(std::stop_token stop) {
        std::unique_ptr<Message> msg;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_not_empty.wait(lock, stop,
                                  [&] { return !m_queue.empty(); })) {
                return std::nullopt;
            }
            msg = std::move(m_queue.front());
            m_queue.pop_front();
        }
        m_not_full.notify_one();
        return msg;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    size_t capacity() const { return m_capacity; }
};

} // namespace msgbroker
