/* capchan: Typed capability channels
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "capchan/transport/transport_fwd.hpp"
#include "capchan/util/native_handle.hpp"
#include <flow/log/log.hpp>

namespace capchan::transport
{

// Types.

/**
 * The receiving half of a raw transport channel: owns one descriptor (the server side of a connected
 * `SOCK_SEQPACKET` socket) and receives the messages sent by any Raw_sender to it, whole and in order.
 * Each message is a blob plus an ordered list of Raw_sender objects (the handles that arrived out-of-band,
 * now owned by the receiving caller).
 *
 * Once every sender descriptor (in every process) has been closed and all queued messages have been received,
 * recv() and try_recv() emit `boost::asio::error::eof`.
 *
 * A Raw_receiver is move-only.  A default-constructed or moved-from one is null(), and its operations fail with
 * error::Code::S_NULL_HANDLE.
 *
 * ### Thread safety ###
 * One receiving thread at a time.  shutdown() may be invoked concurrently with a blocked recv() (that is its
 * purpose).
 */
class Raw_receiver :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /// Creates a null() receiver.
  Raw_receiver();

  /**
   * Takes ownership of the given descriptor which must be a connected `SOCK_SEQPACKET` socket.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Human-readable nickname, as shown in logs/output.
   * @param native_peer_socket_moved
   *        The descriptor.  Becomes null().
   */
  explicit Raw_receiver(flow::log::Logger* logger_ptr, util::String_view nickname,
                        util::Native_handle&& native_peer_socket_moved);

  /**
   * Move-constructs from `src`; `src` becomes null().
   * @param src
   *        Source object.
   */
  Raw_receiver(Raw_receiver&& src) noexcept;

  /// Disallow copying.
  Raw_receiver(const Raw_receiver&) = delete;

  /// Closes the descriptor if any.
  ~Raw_receiver();

  // Methods.

  /**
   * Move-assigns from `src`: closes our descriptor (if any) and takes `src`'s; `src` becomes null().
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Raw_receiver& operator=(Raw_receiver&& src) noexcept;

  /// Disallow copying.
  Raw_receiver& operator=(const Raw_receiver&) = delete;

  /**
   * Blocks until a message is available (or the channel is closed) and receives it.
   *
   * @param target_blob
   *        On success: resized to and filled with the message bytes.
   * @param target_snds
   *        On success: cleared and loaded with the out-of-band senders, in the order they were sent.
   *        On failure: cleared.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NULL_HANDLE; `boost::asio::error::eof` (all senders gone, or shutdown() was called);
   *        error::Code::S_LOW_LVL_UNEXPECTED_CONTROL_DATA; error::Code::S_LOW_LVL_MESSAGE_TRUNCATED;
   *        other system codes from seqpacket_socket.
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  bool recv(util::Blob* target_blob, Raw_sender_list* target_snds, Error_code* err_code = 0);

  /**
   * Identical to recv() except, if no message is queued, it returns immediately emitting
   * `boost::asio::error::would_block`.
   *
   * @param target_blob
   *        See recv().
   * @param target_snds
   *        See recv().
   * @param err_code
   *        See recv(); plus `boost::asio::error::would_block`.
   * @return See recv().
   */
  bool try_recv(util::Blob* target_blob, Raw_sender_list* target_snds, Error_code* err_code = 0);

  /**
   * Shuts down the receive direction: a concurrently blocked recv() wakes, and once already-queued messages
   * (if any) are consumed, recv() emits `boost::asio::error::eof`.  Idempotent; no-op if null().
   */
  void shutdown();

  /**
   * The descriptor owned by `*this` (null() if we are null()).  Still owned by `*this`.
   * @return See above.
   */
  util::Native_handle native_handle() const;

  /**
   * Returns `true` if and only if there is no descriptor.
   * @return See above.
   */
  bool null() const;

  /**
   * Returns nickname, a brief string suitable for logging.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Methods.

  /**
   * Implements recv() and try_recv(): the latter if `blocking == false`.
   *
   * @param blocking
   *        Whether to wait for a message if none is queued.
   * @param target_blob
   *        See recv().
   * @param target_snds
   *        See recv().
   * @param err_code
   *        See recv().  Not null.
   * @return See recv().
   */
  bool recv_impl(bool blocking, util::Blob* target_blob, Raw_sender_list* target_snds, Error_code* err_code);

  // Data.

  /// See nickname().
  std::string m_nickname;

  /// The owned descriptor, or null.
  util::Native_handle m_peer_socket;

  /// Count of messages received so far; for logging.
  uint64_t m_n_rcvd;
}; // class Raw_receiver

} // namespace capchan::transport
