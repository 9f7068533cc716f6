#pragma once

#include <stdexcept>
#include <string>

namespace msgbroker {

/// Base class of every error raised by the library.
class error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Bytes handed to Message::decode() do not form a message.
class decode_error : public error {
  public:
    using error::error;
};

/// Backend queue I/O failure or use after close.
class backend_error : public error {
  public:
    using error::error;
};

class channel_error : public error {
  public:
    using error::error;
};

/// Topic used after close().
class topic_error : public error {
  public:
    using error::error;
};

} // namespace msgbroker
