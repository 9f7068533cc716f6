/**
 * @file msgbroker.hpp
 * @brief Header‑only message routing core of a pub/sub broker.
 *
 *   * **Message**      – immutable envelope {id, body, timestamp} with a
 *     bit‑exact binary encoding.
 *   * **MessageQueue** – MPSC FIFO with a Boost.Lockfree fast path and a
 *     tiny locked overflow path.
 *   * **Channel**      – per‑subscriber delivery queue; @ref QueueChannel
 *     is the default in‑memory one.
 *   * **DiskQueue**    – durable overflow storage behind the
 *     @ref BackendQueue interface.
 *   * **Topic**        – ingest router + fan‑out pump.
 *   * **Broker**       – registry of named topics.
 *
 * The code is header‑only and depends on Boost (Lockfree, Asio, Endian,
 * Uuid) and optionally the `quill` logging library.
 *
 * @note All public types live inside the `msgbroker` namespace.
 */

#pragma once

#include <msgbroker/backend_queue.hpp>
#include <msgbroker/broker.hpp>
#include <msgbroker/channel.hpp>
#include <msgbroker/disk_queue.hpp>
#include <msgbroker/errors.hpp>
#include <msgbroker/ingest_buffer.hpp>
#include <msgbroker/logging.hpp>
#include <msgbroker/message.hpp>
#include <msgbroker/message_queue.hpp>
#include <msgbroker/topic.hpp>
