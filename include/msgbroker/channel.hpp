#pragma once

#include <msgbroker/errors.hpp>
#include <msgbroker/logging.hpp>
#include <msgbroker/message.hpp>
#include <msgbroker/message_queue.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace msgbroker {

// ==========================================================================
// Channel – per‑subscriber delivery queue seen from the topic
// ==========================================================================

/**
 * @brief Consumer‑side queue that receives a copy of every topic message.
 *
 * The topic only ever hands messages over and closes the channel; what a
 * channel does with delivery, acknowledgement and requeueing is its own
 * business.  `put_message` may be called from the topic's dispatch threads
 * concurrently with the channel's consumer.
 */
class Channel {
  public:
    virtual ~Channel() = default;

    virtual const std::string& name() const = 0;

    /// Take ownership of one message copy. Must not block for long.
    virtual void put_message(std::unique_ptr<Message> msg) = 0;

    /// @throws channel_error (or another msgbroker::error) on failure.
    virtual void close() = 0;
};

using ChannelFactory = std::function<std::shared_ptr<Channel>(
    const std::string& topic_name, const std::string& channel_name)>;

/**
 * @brief Default in‑memory channel backed by a @ref MessageQueue.
 *
 * Consumers drain it with @ref pop.  Messages delivered after `close()`
 * are dropped with a warning.
 */
template <typename config = DefaultQueueConfig>
class QueueChannel : public Channel {
  private:
    const std::string m_topic_name;
    const std::string m_name;
    MessageQueue<config> m_queue;
    std::atomic<bool> m_closed{false};
    logging::Logger m_logger;

  public:
    QueueChannel(const std::string& topic_name, const std::string& name)
        : m_topic_name(topic_name), m_name(name),
          m_logger(logging::create_logger("channel-" + topic_name + ":" +
                                          name)) {}

    const std::string& name() const override { return m_name; }
    const std::string& topic_name() const { return m_topic_name; }

    void put_message(std::unique_ptr<Message> msg) override {
        if (m_closed.load(std::memory_order_acquire)) {
            MSGBROKER_LOG_WARNING(m_logger,
                                  "CHANNEL({}:{}): dropping message, closed",
                                  m_topic_name, m_name);
            return;
        }
        m_queue.push(std::move(msg));
    }

    void close() override {
        if (m_closed.exchange(true, std::memory_order_acq_rel)) {
            throw channel_error("channel " + m_topic_name + ":" + m_name +
                                " already closed");
        }
        MSGBROKER_LOG_INFO(m_logger, "CHANNEL({}:{}): closing", m_topic_name,
                           m_name);
    }

    bool closed() const { return m_closed.load(std::memory_order_acquire); }

    /// Next delivered message, if any. Single consumer.
    std::optional<std::unique_ptr<Message>> pop() { return m_queue.pop(); }

    size_t depth() const { return m_queue.size(); }
};

/// Factory producing @ref QueueChannel instances.
template <typename config = DefaultQueueConfig>
ChannelFactory queue_channel_factory() {
    return [](const std::string& topic_name, const std::string& channel_name) {
        return std::make_shared<QueueChannel<config>>(topic_name,
                                                      channel_name);
    };
}

} // namespace msgbroker
