#pragma once

#include <msgbroker/msgbroker.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace msgbroker::testing {

/// Poll @p pred until it holds or @p timeout expires.
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}

/// Message whose id starts with @p n, so tests can tell messages apart.
inline std::unique_ptr<Message> make_message(std::uint8_t n,
                                             const std::string& body = "msg") {
    MessageId id{};
    id[0] = n;
    return std::make_unique<Message>(id, to_bytes(body));
}

/// Scratch directory removed on destruction.
class TempDir {
  private:
    std::filesystem::path m_path;

  public:
    TempDir() {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path() /
                 ("msgbroker-test-" + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    const std::filesystem::path& path() const { return m_path; }
    std::string str() const { return m_path.string(); }
};

/// In‑memory BackendQueue that records calls and can be told to fail.
class FakeBackendQueue : public BackendQueue {
  private:
    mutable std::mutex m_mutex;
    std::deque<Bytes> m_records;
    bool m_closed{false};

  public:
    std::atomic<bool> fail_puts{false};
    std::atomic<bool> fail_close{false};
    std::atomic<int> put_calls{0};
    std::atomic<int> close_calls{0};

    void put(const Bytes& data) override {
        ++put_calls;
        if (fail_puts) {
            throw backend_error("disk full");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records.push_back(data);
    }

    std::optional<Bytes> try_receive() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_records.empty()) {
            return std::nullopt;
        }
        Bytes data = std::move(m_records.front());
        m_records.pop_front();
        return data;
    }

    std::int64_t depth() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<std::int64_t>(m_records.size());
    }

    void close() override {
        ++close_calls;
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            throw backend_error("already closed");
        }
        m_closed = true;
        if (fail_close) {
            throw backend_error("sync failed");
        }
    }

    /// Records currently stored, oldest first.
    std::vector<Bytes> records() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return {m_records.begin(), m_records.end()};
    }
};

/// Channel keeping everything it receives.
class RecordingChannel : public Channel {
  private:
    const std::string m_name;
    mutable std::mutex m_mutex;
    std::vector<std::unique_ptr<Message>> m_messages;

  public:
    std::atomic<int> close_calls{0};
    bool fail_close{false};
    bool fail_put{false};

    explicit RecordingChannel(const std::string& name) : m_name(name) {}

    const std::string& name() const override { return m_name; }

    void put_message(std::unique_ptr<Message> msg) override {
        if (fail_put) {
            throw std::runtime_error("channel " + m_name + " is full");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_messages.push_back(std::move(msg));
    }

    void close() override {
        ++close_calls;
        if (fail_close) {
            throw channel_error("channel " + m_name + " refused to close");
        }
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_messages.size();
    }

    /// First id byte of every message received, in arrival order.
    std::vector<std::uint8_t> ids() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<std::uint8_t> out;
        for (const auto& msg : m_messages) {
            out.push_back(msg->id()[0]);
        }
        return out;
    }

    /// Direct access; only valid while no deliveries are in flight.
    Message& at(size_t index) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return *m_messages.at(index);
    }
};

/// ChannelFactory creating RecordingChannels and remembering them.
class RecordingChannelFactory {
  private:
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<RecordingChannel>> m_channels;

  public:
    std::atomic<int> calls{0};
    std::vector<std::string> failing_close;
    std::vector<std::string> failing_put;

    ChannelFactory make() {
        return [this](const std::string&, const std::string& name) {
            ++calls;
            auto channel = std::make_shared<RecordingChannel>(name);
            for (const auto& failing : failing_close) {
                if (failing == name) {
                    channel->fail_close = true;
                }
            }
            for (const auto& failing : failing_put) {
                if (failing == name) {
                    channel->fail_put = true;
                }
            }
            std::lock_guard<std::mutex> lock(m_mutex);
            m_channels[name] = channel;
            return channel;
        };
    }

    std::shared_ptr<RecordingChannel> channel(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_channels.find(name);
        return it == m_channels.end() ? nullptr : it->second;
    }
};

/// Relative position of @p id inside @p ids, or -1.
inline int position_of(const std::vector<std::uint8_t>& ids, std::uint8_t id) {
    for (size_t i = 0; i < ids.size(); ++i) {
        if (ids[i] == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

} // namespace msgbroker::testing
