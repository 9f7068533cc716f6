/**
 * @file topic.hpp
 * @brief Topic – ingest router and fan‑out pump.
 *
 * A topic accepts messages from producers and copies each one to every
 * channel subscribed to it.  Two threads do the work:
 *
 *   * **router** – pops the small ingest buffer in arrival order and puts
 *     every message into exactly one of the bounded in‑memory buffer (when
 *     it has room) or the durable backend queue.
 *   * **pump**   – started with the first channel; takes messages from the
 *     memory buffer and from the backend queue and posts one copy per
 *     channel to the topic's dispatch pool.
 *
 * Both threads stop on the topic's own stop source.  Neither drains what
 * is still buffered when that happens.
 */

#pragma once

#include <msgbroker/backend_queue.hpp>
#include <msgbroker/channel.hpp>
#include <msgbroker/disk_queue.hpp>
#include <msgbroker/errors.hpp>
#include <msgbroker/ingest_buffer.hpp>
#include <msgbroker/logging.hpp>
#include <msgbroker/message.hpp>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/lockfree/spsc_queue.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

namespace msgbroker {

// ==========================================================================
// Configuration
// ==========================================================================

struct TopicOptions {
    /// Capacity of the in‑memory buffer. 0 sends everything to the backend.
    size_t mem_queue_size = 10000;
    /// Producer side buffering in front of the router.
    size_t ingest_buffer_size = 5;
    /// Where the default DiskQueue keeps its files.
    std::string data_path = ".";
    std::int64_t max_bytes_per_file = 100 * 1024 * 1024;
    /// Threads delivering copies to channels.
    size_t dispatch_threads = 1;

    void validate() const {
        if (ingest_buffer_size == 0) {
            throw std::invalid_argument("ingest_buffer_size must be positive");
        }
        if (dispatch_threads == 0) {
            throw std::invalid_argument("dispatch_threads must be positive");
        }
        if (max_bytes_per_file <= 0) {
            throw std::invalid_argument("max_bytes_per_file must be positive");
        }
    }
};

/// Snapshot of a topic's counters.
struct TopicStats {
    std::uint64_t accepted = 0;
    std::uint64_t routed_to_memory = 0;
    std::uint64_t routed_to_backend = 0;
    std::uint64_t dropped = 0;    ///< Lost on encode or backend failure.
    std::uint64_t fanned_out = 0; ///< Messages handed to the channels.
    std::uint64_t skipped = 0;    ///< Unreadable backend records.
};

// ==========================================================================
// Topic
// ==========================================================================

class Topic {
  private:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    struct Subscription {
        std::shared_ptr<Channel> channel;
        Strand strand; ///< Serialises deliveries to this channel.
    };

    struct Counters {
        std::atomic<std::uint64_t> accepted{0};
        std::atomic<std::uint64_t> routed_to_memory{0};
        std::atomic<std::uint64_t> routed_to_backend{0};
        std::atomic<std::uint64_t> dropped{0};
        std::atomic<std::uint64_t> fanned_out{0};
        std::atomic<std::uint64_t> skipped{0};
    };

    const std::string m_name;
    const TopicOptions m_options;
    logging::Logger m_logger;

    std::unique_ptr<BackendQueue> m_backend;
    ChannelFactory m_channel_factory;

    std::stop_source m_stop;

    IngestBuffer m_ingest;
    // Router → pump. Single producer, single consumer.
    boost::lockfree::spsc_queue<Message*> m_memory;
    std::atomic<std::int64_t> m_memory_depth{0};

    // Pump wake‑ups: bumped whenever the router stored something.
    std::mutex m_wakeup_mutex;
    std::condition_variable_any m_wakeup;
    std::uint64_t m_wakeup_generation{0};

    // Must outlive m_channels: every strand refers to the pool's service.
    boost::asio::thread_pool m_dispatch_pool;

    mutable std::shared_mutex m_registry_mutex; ///< Guards the two below.
    std::unordered_map<std::string, Subscription> m_channels;
    bool m_pump_started{false};

    Counters m_counters;
    std::atomic<bool> m_closed{false};

    std::thread m_router;
    std::thread m_pump;

    static TopicOptions validated(TopicOptions options) {
        options.validate();
        return options;
    }

    void notify_pump() {
        {
            std::lock_guard<std::mutex> lock(m_wakeup_mutex);
            ++m_wakeup_generation;
        }
        m_wakeup.notify_one();
    }

    // -------------------------------------------------------------------
    // Router
    // -------------------------------------------------------------------

    void router(std::stop_token stop) {
        while (!stop.stop_requested()) {
            auto msg = m_ingest.pop(stop);
            if (!msg || stop.stop_requested()) {
                break;
            }
            route(std::move(*msg));
        }
        MSGBROKER_LOG_DEBUG(m_logger, "TOPIC({}): router exiting", m_name);
    }

    void route(std::unique_ptr<Message> msg) {
        if (m_options.mem_queue_size > 0) {
            m_memory_depth.fetch_add(1, std::memory_order_relaxed);
            if (m_memory.push(msg.get())) {
                msg.release(); // Owned by m_memory now.
                m_counters.routed_to_memory.fetch_add(
                    1, std::memory_order_relaxed);
                notify_pump();
                return;
            }
            m_memory_depth.fetch_sub(1, std::memory_order_relaxed);
        }

        Bytes data;
        try {
            data = msg->encode();
        } catch (const std::exception& e) {
            MSGBROKER_LOG_ERROR(m_logger,
                                "TOPIC({}): failed to encode message - {}",
                                m_name, e.what());
            m_counters.dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        try {
            m_backend->put(data);
        } catch (const backend_error& e) {
            // No requeue: the message is lost.
            MSGBROKER_LOG_ERROR(m_logger, "TOPIC({}): backend put failed - {}",
                                m_name, e.what());
            m_counters.dropped.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        m_counters.routed_to_backend.fetch_add(1, std::memory_order_relaxed);
        notify_pump();
    }

    // -------------------------------------------------------------------
    // Pump
    // -------------------------------------------------------------------

    void message_pump(std::stop_token stop) {
        bool prefer_backend = false;
        while (!stop.stop_requested()) {
            std::uint64_t seen;
            {
                std::lock_guard<std::mutex> lock(m_wakeup_mutex);
                seen = m_wakeup_generation;
            }

            // Alternate sources so that neither can starve the other.
            const bool worked =
                pump_once(prefer_backend) || pump_once(!prefer_backend);
            prefer_backend = !prefer_backend;
            if (worked) {
                continue;
            }

            std::unique_lock<std::mutex> lock(m_wakeup_mutex);
            m_wakeup.wait(lock, stop,
                          [&] { return m_wakeup_generation != seen; });
        }
        MSGBROKER_LOG_DEBUG(m_logger, "TOPIC({}): pump exiting", m_name);
    }

    /// @return `true` if a message or record was consumed from the source.
    bool pump_once(bool from_backend) {
        if (!from_backend) {
            Message* raw = nullptr;
            if (!m_memory.pop(raw)) {
                return false;
            }
            m_memory_depth.fetch_sub(1, std::memory_order_relaxed);
            std::unique_ptr<Message> msg(raw);
            fan_out(*msg);
            return true;
        }

        std::optional<Bytes> data;
        try {
            data = m_backend->try_receive();
        } catch (const backend_error& e) {
            MSGBROKER_LOG_ERROR(m_logger,
                                "TOPIC({}): failed to read backend - {}",
                                m_name, e.what());
            m_counters.skipped.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
        if (!data) {
            return false;
        }

        std::unique_ptr<Message> msg;
        try {
            msg = Message::decode(*data);
        } catch (const decode_error& e) {
            MSGBROKER_LOG_ERROR(m_logger,
                                "TOPIC({}): failed to decode message - {}",
                                m_name, e.what());
            m_counters.skipped.fetch_add(1, std::memory_order_relaxed);
            return true;
        }
        fan_out(*msg);
        return true;
    }

    void fan_out(const Message& msg) {
        std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
        for (auto& [channel_name, subscription] : m_channels) {
            // Every channel gets its own instance.
            boost::asio::post(
                subscription.strand,
                [this, channel = subscription.channel,
                 copy = msg.copy()]() mutable {
                    deliver(*channel, std::move(copy));
                });
        }
        m_counters.fanned_out.fetch_add(1, std::memory_order_relaxed);
    }

    void deliver(Channel& channel, std::unique_ptr<Message> msg) {
        try {
            channel.put_message(std::move(msg));
        } catch (const std::exception& e) {
            MSGBROKER_LOG_ERROR(m_logger,
                                "TOPIC({}): channel({}) put failed - {}",
                                m_name, channel.name(), e.what());
        }
    }

  public:
    /**
     * @param name            Topic name, unique within a broker.
     * @param options         Buffer sizes and dispatch settings.
     * @param backend         Overflow storage, owned by the topic.
     * @param channel_factory Creates channels on first @ref get_channel.
     *
     * Starts the router immediately; the pump waits for the first channel.
     */
    Topic(const std::string& name, TopicOptions options,
          std::unique_ptr<BackendQueue> backend,
          ChannelFactory channel_factory)
        : m_name(name), m_options(validated(std::move(options))),
          m_logger(logging::create_logger("topic-" + name)),
          m_backend(std::move(backend)),
          m_channel_factory(std::move(channel_factory)),
          m_ingest(m_options.ingest_buffer_size),
          m_memory(m_options.mem_queue_size > 0 ? m_options.mem_queue_size
                                                : 1),
          m_dispatch_pool(m_options.dispatch_threads) {
        if (!m_backend) {
            throw std::invalid_argument("topic " + name + " has no backend");
        }
        if (!m_channel_factory) {
            throw std::invalid_argument("topic " + name +
                                        " has no channel factory");
        }
        m_router = std::thread(&Topic::router, this, m_stop.get_token());
        MSGBROKER_LOG_INFO(m_logger, "TOPIC({}): created", m_name);
    }

    /// Topic backed by a @ref DiskQueue under `options.data_path`, with
    /// @ref QueueChannel channels.
    Topic(const std::string& name, TopicOptions options)
        : Topic(name, options,
                std::make_unique<DiskQueue>(name, options.data_path,
                                            options.max_bytes_per_file),
                queue_channel_factory()) {}

    Topic(const Topic&) = delete;
    Topic& operator=(const Topic&) = delete;

    ~Topic() {
        if (!m_closed.load(std::memory_order_acquire)) {
            try {
                close();
            } catch (const error& e) {
                MSGBROKER_LOG_ERROR(m_logger, "TOPIC({}): close failed - {}",
                                    m_name, e.what());
            }
        }
        Message* raw = nullptr;
        while (m_memory.pop(raw)) {
            delete raw;
        }
    }

    const std::string& name() const { return m_name; }
    const TopicOptions& options() const { return m_options; }

    /**
     * @brief Get or create the channel called @p channel_name.
     *
     * The first call for any channel starts the pump.  Repeated calls with
     * the same name return the same instance.
     * @throws topic_error after @ref close.
     */
    std::shared_ptr<Channel> get_channel(const std::string& channel_name) {
        std::unique_lock<std::shared_mutex> lock(m_registry_mutex);
        if (m_closed.load(std::memory_order_acquire)) {
            throw topic_error("topic " + m_name + " is closed");
        }

        std::shared_ptr<Channel> channel;
        auto it = m_channels.find(channel_name);
        if (it != m_channels.end()) {
            channel = it->second.channel;
        } else {
            channel = m_channel_factory(m_name, channel_name);
            m_channels.emplace(
                channel_name,
                Subscription{channel, boost::asio::make_strand(m_dispatch_pool)});
            MSGBROKER_LOG_INFO(m_logger, "TOPIC({}): new channel({})", m_name,
                               channel_name);
        }

        if (!m_pump_started) {
            m_pump_started = true;
            m_pump = std::thread(&Topic::message_pump, this, m_stop.get_token());
        }
        return channel;
    }

    /**
     * @brief Hand a message to the topic.
     *
     * Blocks while the ingest buffer is full.
     * @throws topic_error once the topic is closing or closed.
     */
    void put_message(std::unique_ptr<Message> msg) {
        if (m_closed.load(std::memory_order_acquire)) {
            throw topic_error("topic " + m_name + " is closed");
        }
        m_counters.accepted.fetch_add(1, std::memory_order_relaxed);
        if (!m_ingest.push(std::move(msg), m_stop.get_token())) {
            m_counters.accepted.fetch_sub(1, std::memory_order_relaxed);
            throw topic_error("topic " + m_name + " is closing");
        }
    }

    /**
     * @brief Stop both loops, close every channel, then the backend.
     *
     * Channel close failures are logged and do not stop the remaining
     * channels from being closed.
     * @throws backend_error when closing the backend queue fails.
     * @throws topic_error when the topic was already closed.
     */
    void close() {
        {
            std::unique_lock<std::shared_mutex> lock(m_registry_mutex);
            if (m_closed.exchange(true, std::memory_order_acq_rel)) {
                throw topic_error("topic " + m_name + " already closed");
            }
        }
        MSGBROKER_LOG_INFO(m_logger, "TOPIC({}): closing", m_name);

        m_stop.request_stop();
        if (m_router.joinable()) {
            m_router.join();
        }
        if (m_pump.joinable()) {
            m_pump.join();
        }
        // Let deliveries already posted reach their channels.
        m_dispatch_pool.join();

        {
            std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
            for (auto& [channel_name, subscription] : m_channels) {
                try {
                    subscription.channel->close();
                } catch (const std::exception& e) {
                    MSGBROKER_LOG_ERROR(m_logger,
                                        "TOPIC({}): channel({}) close - {}",
                                        m_name, channel_name, e.what());
                }
            }
        }

        m_backend->close();
    }

    bool closed() const { return m_closed.load(std::memory_order_acquire); }

    bool pump_started() const {
        std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
        return m_pump_started;
    }

    size_t channel_count() const {
        std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
        return m_channels.size();
    }

    /// Messages waiting in the in‑memory buffer.
    std::int64_t memory_depth() const {
        return m_memory_depth.load(std::memory_order_relaxed);
    }

    /// Records waiting in the backend queue.
    std::int64_t backend_depth() const { return m_backend->depth(); }

    TopicStats stats() const {
        TopicStats s;
        s.accepted = m_counters.accepted.load(std::memory_order_relaxed);
        s.routed_to_memory =
            m_counters.routed_to_memory.load(std::memory_order_relaxed);
        s.routed_to_backend =
            m_counters.routed_to_backend.load(std::memory_order_relaxed);
        s.dropped = m_counters.dropped.load(std::memory_order_relaxed);
        s.fanned_out = m_counters.fanned_out.load(std::memory_order_relaxed);
        s.skipped = m_counters.skipped.load(std::memory_order_relaxed);
        return s;
    }
};

} // namespace msgbroker
