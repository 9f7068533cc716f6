#pragma once

#include <msgbroker/message.hpp>

#include <cstdint>
#include <optional>

namespace msgbroker {

/**
 * @brief Durable, ordered queue of opaque byte records.
 *
 * The topic appends overflow messages with `put` from its router thread and
 * drains them with `try_receive` from its pump thread; implementations must
 * allow those two calls to run concurrently.  Records come back in append
 * order.  The receive side is an endless stream: once a record has been
 * returned it is gone.
 */
class BackendQueue {
  public:
    virtual ~BackendQueue() = default;

    /// Append one record. @throws backend_error
    virtual void put(const Bytes& data) = 0;

    /**
     * @brief Next record, or `std::nullopt` when nothing is stored.
     * @throws backend_error when stored data turned out unreadable; the
     *         queue has already moved past it.
     */
    virtual std::optional<Bytes> try_receive() = 0;

    /// Number of records appended but not yet received.
    virtual std::int64_t depth() const = 0;

    /// @throws backend_error on failure or when already closed.
    virtual void close() = 0;
};

} // namespace msgbroker
