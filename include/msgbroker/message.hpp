/**
 * @file message.hpp
 * @brief Message envelope and its binary encoding.
 *
 * A Message carries an opaque 16 byte id, an opaque body and the creation
 * timestamp.  Those three never change once the message exists.  The
 * `attempts` counter is delivery metadata owned by whichever channel holds
 * the instance, which is why every channel receives its own @ref
 * Message::copy rather than a shared instance.
 *
 * Wire/disk layout (big‑endian):
 * @verbatim
 *   [ timestamp : int64 ][ attempts : uint16 ][ id : 16 bytes ][ body ... ]
 * @endverbatim
 */

#pragma once

#include <msgbroker/errors.hpp>

#include <boost/endian/conversion.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace msgbroker {

using Bytes = std::vector<std::uint8_t>;
using MessageId = std::array<std::uint8_t, 16>;

/// Build a byte buffer from text (handy for producers and tests).
inline Bytes to_bytes(std::string_view text) {
    return Bytes(text.begin(), text.end());
}

/// Fresh random id for broker‑assigned messages.
inline MessageId make_message_id() {
    thread_local boost::uuids::random_generator generator;
    const boost::uuids::uuid uuid = generator();
    MessageId id;
    std::copy(uuid.begin(), uuid.end(), id.begin());
    return id;
}

/// Nanoseconds since the Unix epoch.
inline std::int64_t now_nanoseconds() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

class Message {
  public:
    static constexpr size_t header_size = 8 + 2 + 16;

  private:
    MessageId m_id;
    Bytes m_body;
    std::int64_t m_timestamp;
    std::uint16_t m_attempts{0};

  public:
    Message(const MessageId& id, Bytes body)
        : m_id(id), m_body(std::move(body)), m_timestamp(now_nanoseconds()) {}

    Message(const MessageId& id, Bytes body, std::int64_t timestamp)
        : m_id(id), m_body(std::move(body)), m_timestamp(timestamp) {}

    const MessageId& id() const { return m_id; }
    const Bytes& body() const { return m_body; }
    std::int64_t timestamp() const { return m_timestamp; }

    std::uint16_t attempts() const { return m_attempts; }
    void set_attempts(std::uint16_t attempts) { m_attempts = attempts; }
    void increment_attempts() { ++m_attempts; }

    /**
     * @brief Independent instance for one channel.
     *
     * Same id, body and timestamp in separate storage; delivery metadata
     * starts fresh.
     */
    std::unique_ptr<Message> copy() const {
        return std::make_unique<Message>(m_id, m_body, m_timestamp);
    }

    Bytes encode() const {
        Bytes out(header_size + m_body.size());
        std::uint8_t* p = out.data();
        boost::endian::store_big_s64(p, m_timestamp);
        boost::endian::store_big_u16(p + 8, m_attempts);
        std::memcpy(p + 10, m_id.data(), m_id.size());
        if (!m_body.empty()) {
            std::memcpy(p + header_size, m_body.data(), m_body.size());
        }
        return out;
    }

    /// @throws decode_error when @p data is shorter than the header.
    static std::unique_ptr<Message> decode(const Bytes& data) {
        if (data.size() < header_size) {
            throw decode_error("message too short: " +
                               std::to_string(data.size()) + " bytes");
        }
        const std::uint8_t* p = data.data();
        MessageId id;
        std::memcpy(id.data(), p + 10, id.size());
        auto msg = std::make_unique<Message>(
            id, Bytes(data.begin() + header_size, data.end()),
            boost::endian::load_big_s64(p));
        msg->set_attempts(boost::endian::load_big_u16(p + 8));
        return msg;
    }

    /// Content equality: id, body and timestamp. Delivery metadata ignored.
    bool operator==(const Message& other) const {
        return m_id == other.m_id && m_timestamp == other.m_timestamp &&
               m_body == other.m_body;
    }
};

} // namespace msgbroker
