#pragma once

#include <msgbroker/logging.hpp>
#include <msgbroker/message.hpp>

#include <boost/lockfree/queue.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>

namespace msgbroker {

static inline constexpr size_t cache_line_size = 64U;

// ==========================================================================
// Configuration helpers – compile-time sizing of channel queues
// ==========================================================================

struct DefaultQueueConfig {
    static constexpr size_t fast_queue_size = 1024; ///< Ring capacity.
};

// ==========================================================================
// MessageQueue – lock‑free fast path + locked overflow path
// ==========================================================================

/**
 * @brief Multi‑producer / single‑consumer FIFO of owned messages.
 *
 * A bounded lock‑free ring (Boost.Lockfree) constitutes the *fast path*.
 * If the ring is full, writers push to a secondary std::queue protected
 * by a mutex.  Once anything sits in the slow path every further push goes
 * there too, until the consumer has moved the backlog back into the ring;
 * this keeps the queue strictly FIFO.
 *
 * The queue owns the messages it holds: `push` takes ownership, `pop`
 * hands it back and the destructor frees whatever is left.
 *
 * @tparam config Struct providing `fast_queue_size`.
 */
template <typename config = DefaultQueueConfig> class MessageQueue {
  private:
    // Slow overflow path
    std::queue<Message*> m_slow_queue;
    std::mutex m_mutex;
    std::atomic<size_t> m_slow_size{0};

    // Fast lock‑free ring
    boost::lockfree::queue<Message*,
                           boost::lockfree::capacity<config::fast_queue_size>>
        m_fast_queue;

    alignas(cache_line_size) std::atomic<size_t> m_size{0};

    logging::Logger m_logger;

    // Caller holds m_mutex.
    void push_slow_no_lock(Message* msg) {
        m_slow_queue.push(msg);
        m_slow_size.store(m_slow_queue.size(), std::memory_order_release);
        MSGBROKER_LOG_DEBUG(m_logger, "pushed to slow queue: slow queue size={}",
                            m_slow_queue.size());
    }

    // Drain slow queue back to ring. Consumer side only.
    void drain_slow() {
        if (m_slow_size.load(std::memory_order_acquire) > 0) {
            std::lock_guard<std::mutex> lock(m_mutex);
            while (!m_slow_queue.empty()) {
                Message* msg = m_slow_queue.front();
                if (!m_fast_queue.push(msg)) {
                    break;
                }
                m_slow_queue.pop();
            }
            m_slow_size.store(m_slow_queue.size(), std::memory_order_release);
        }
    }

  public:
    MessageQueue() : m_logger(logging::create_logger("message-queue")) {}

    MessageQueue(const MessageQueue&) = delete;
    MessageQueue& operator=(const MessageQueue&) = delete;

    ~MessageQueue() {
        Message* msg = nullptr;
        while (m_fast_queue.pop(msg)) {
            delete msg;
        }
        while (!m_slow_queue.empty()) {
            delete m_slow_queue.front();
            m_slow_queue.pop();
        }
    }

    /** @brief Non‑blocking push usable from *any* thread. */
    void push(std::unique_ptr<Message> msg) {
        Message* raw_msg = msg.release();
        m_size.fetch_add(1, std::memory_order_relaxed);
        if (m_slow_size.load(std::memory_order_acquire) == 0 &&
            m_fast_queue.push(raw_msg)) {
            return;
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        push_slow_no_lock(raw_msg);
    }

    /**
     * @return Next message or `std::nullopt` when the queue is empty.
     */
    std::optional<std::unique_ptr<Message>> pop() {
        drain_slow(); // Give overflow messages a chance first.

        Message* msg = nullptr;
        if (m_fast_queue.pop(msg)) {
            m_size.fetch_sub(1, std::memory_order_relaxed);
            return std::unique_ptr<Message>(msg);
        }

        return std::nullopt;
    }

    /// Approximate number of queued messages.
    size_t size() const { return m_size.load(std::memory_order_relaxed); }
};

} // namespace msgbroker
