#pragma once

#include <msgbroker/backend_queue.hpp>
#include <msgbroker/channel.hpp>
#include <msgbroker/disk_queue.hpp>
#include <msgbroker/errors.hpp>
#include <msgbroker/logging.hpp>
#include <msgbroker/message.hpp>
#include <msgbroker/topic.hpp>

#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace msgbroker {

using BackendFactory =
    std::function<std::unique_ptr<BackendQueue>(const std::string& topic_name)>;

/// Backend factory creating one @ref DiskQueue per topic.
inline BackendFactory disk_queue_factory(const TopicOptions& options) {
    return [data_path = options.data_path,
            max_bytes_per_file = options.max_bytes_per_file](
               const std::string& topic_name) -> std::unique_ptr<BackendQueue> {
        return std::make_unique<DiskQueue>(topic_name, data_path,
                                           max_bytes_per_file);
    };
}

/**
 * @brief Registry of named topics.
 *
 * Topics are created on first reference and announced to everything
 * registered through @ref on_new_topic.  Closing the broker closes every
 * topic.
 */
class Broker {
  public:
    using TopicListener = std::function<void(const std::shared_ptr<Topic>&)>;

  private:
    const TopicOptions m_options;
    BackendFactory m_backend_factory;
    ChannelFactory m_channel_factory;

    mutable std::shared_mutex m_mutex; ///< Guards topics and listeners.
    std::unordered_map<std::string, std::shared_ptr<Topic>> m_topics;
    std::vector<TopicListener> m_listeners;
    bool m_closed{false};

    logging::Logger m_logger;

  public:
    Broker(TopicOptions options, BackendFactory backend_factory,
           ChannelFactory channel_factory)
        : m_options(std::move(options)),
          m_backend_factory(std::move(backend_factory)),
          m_channel_factory(std::move(channel_factory)),
          m_logger(logging::create_logger("broker")) {
        m_options.validate();
    }

    explicit Broker(TopicOptions options = {})
        : Broker(options, disk_queue_factory(options),
                 queue_channel_factory()) {}

    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;

    ~Broker() {
        bool closed;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            closed = m_closed;
        }
        if (!closed) {
            try {
                close();
            } catch (const error& e) {
                MSGBROKER_LOG_ERROR(m_logger, "BROKER: close failed - {}",
                                    e.what());
            }
        }
    }

    /// Register a callback invoked with every topic created from now on.
    void on_new_topic(TopicListener listener) {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_listeners.push_back(std::move(listener));
    }

    /**
     * @brief Get or create the topic called @p name.
     * @throws topic_error after @ref close.
     */
    std::shared_ptr<Topic> get_topic(const std::string& name) {
        std::shared_ptr<Topic> topic;
        std::vector<TopicListener> listeners;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            if (m_closed) {
                throw topic_error("broker is closed");
            }
            auto it = m_topics.find(name);
            if (it != m_topics.end()) {
                return it->second;
            }
            topic = std::make_shared<Topic>(name, m_options,
                                            m_backend_factory(name),
                                            m_channel_factory);
            m_topics.emplace(name, topic);
            listeners = m_listeners;
        }
        MSGBROKER_LOG_INFO(m_logger, "BROKER: new topic({})", name);
        for (auto& listener : listeners) {
            listener(topic);
        }
        return topic;
    }

    /// @return The topic, or `nullptr` if it does not exist.
    std::shared_ptr<Topic> find_topic(const std::string& name) const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_topics.find(name);
        return it == m_topics.end() ? nullptr : it->second;
    }

    /**
     * @brief Remove and close one topic.
     * @return `false` if no such topic exists.
     * @throws backend_error when the topic's backend fails to close.
     */
    bool delete_topic(const std::string& name) {
        std::shared_ptr<Topic> topic;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_topics.find(name);
            if (it == m_topics.end()) {
                return false;
            }
            topic = std::move(it->second);
            m_topics.erase(it);
        }
        MSGBROKER_LOG_INFO(m_logger, "BROKER: deleting topic({})", name);
        topic->close();
        return true;
    }

    /// Publish @p body on @p topic_name with a fresh id and timestamp.
    void put_message(const std::string& topic_name, Bytes body) {
        get_topic(topic_name)->put_message(
            std::make_unique<Message>(make_message_id(), std::move(body)));
    }

    size_t topic_count() const {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        return m_topics.size();
    }

    /**
     * @brief Close every topic.
     *
     * All topics get a close attempt; the first failure is rethrown
     * afterwards.
     */
    void close() {
        std::unordered_map<std::string, std::shared_ptr<Topic>> topics;
        {
            std::unique_lock<std::shared_mutex> lock(m_mutex);
            if (m_closed) {
                throw topic_error("broker already closed");
            }
            m_closed = true;
            topics.swap(m_topics);
        }
        MSGBROKER_LOG_INFO(m_logger, "BROKER: closing {} topics",
                           topics.size());

        std::exception_ptr first_error;
        for (auto& [name, topic] : topics) {
            if (topic->closed()) {
                continue;
            }
            try {
                topic->close();
            } catch (const error& e) {
                MSGBROKER_LOG_ERROR(m_logger, "BROKER: topic({}) close - {}",
                                    name, e.what());
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }
};

} // namespace msgbroker
