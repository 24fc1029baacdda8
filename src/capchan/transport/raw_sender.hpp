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
 * The sending half of a raw transport channel: owns one descriptor (the client side of a connected
 * `SOCK_SEQPACKET` socket) and sends messages, each consisting of a blob plus an ordered list of native handles,
 * to the Raw_receiver at the other end.
 *
 * ### Ownership, copying ###
 * A Raw_sender owns its descriptor and closes it in the destructor.  It is move-only; a second, independent
 * sender to the same receiver is obtained via clone() (which `dup()`s the descriptor).  The receiver observes
 * disconnection once every such descriptor, in every process, has been closed.
 *
 * ### Null state ###
 * A default-constructed or moved-from Raw_sender is null(): it holds no descriptor, and send() and clone() fail
 * with error::Code::S_NULL_HANDLE.
 *
 * ### Thread safety ###
 * send() on the same object from multiple threads concurrently is safe: each message goes out in one `sendmsg()`
 * call, so messages never interleave.  Move-assignment and destruction concurrently with anything else are not
 * safe.
 */
class Raw_sender :
  public flow::log::Log_context
{
public:
  // Constants.

  /**
   * The maximum blob size accepted by send().  Larger messages are refused with
   * error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT.  It is well under the default Linux socket buffer size, so that a
   * message of this size can always eventually be queued.
   */
  static constexpr size_t S_MAX_MESSAGE_SIZE = 128 * 1024;

  // Constructors/destructor.

  /// Creates a null() sender.
  Raw_sender();

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
  explicit Raw_sender(flow::log::Logger* logger_ptr, util::String_view nickname,
                      util::Native_handle&& native_peer_socket_moved);

  /**
   * Move-constructs from `src`; `src` becomes null().
   * @param src
   *        Source object.
   */
  Raw_sender(Raw_sender&& src) noexcept;

  /// Disallow copying; use clone().
  Raw_sender(const Raw_sender&) = delete;

  /// Closes the descriptor if any.
  ~Raw_sender();

  // Methods.

  /**
   * Move-assigns from `src`: closes our descriptor (if any) and takes `src`'s; `src` becomes null().
   * No-op if `&src == this`.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Raw_sender& operator=(Raw_sender&& src) noexcept;

  /// Disallow copying; use clone().
  Raw_sender& operator=(const Raw_sender&) = delete;

  /**
   * Connects to the Raw_one_shot_listener listening at the given name.  The result is a sender whose messages
   * arrive at the Raw_receiver the listener's Raw_one_shot_listener::accept() yields.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param name
   *        Name previously obtained from Raw_one_shot_listener::name().
   * @param target_snd
   *        On success `*target_snd` is move-assigned the new sender.  Otherwise untouched.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes from `connect()`, notably `boost::asio::error::connection_refused` if nothing listens
   *        at `name` (never did, or already accepted its one connection); error from
   *        seqpacket_socket::endpoint_at_name().
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  static bool connect(flow::log::Logger* logger_ptr, const std::string& name, Raw_sender* target_snd,
                      Error_code* err_code = 0);

  /**
   * Creates another sender to the same receiver, holding a duplicate descriptor.
   *
   * @param target_snd
   *        On success `*target_snd` is move-assigned the new sender.  Otherwise untouched.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NULL_HANDLE; system codes from util::duplicate_native_handle().
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  bool clone(Raw_sender* target_snd, Error_code* err_code = 0) const;

  /**
   * Sends one message: the blob and, out-of-band, the given native handles in order.  The handles are borrowed:
   * they remain open and owned by the caller; the receiving process gets its own duplicates.  Blocks only while
   * the socket send buffer is full.
   *
   * @param blob
   *        The message bytes.  Must not be empty.
   * @param hndls
   *        Native handles to transmit along with it.  Typically these are the descriptors of other
   *        Raw_sender objects (see native_handle()).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NULL_HANDLE; error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT; error::Code::S_TOO_MANY_HANDLES;
   *        `boost::asio::error::broken_pipe` or `boost::asio::error::connection_reset` if the receiver is gone;
   *        other system codes from seqpacket_socket::nb_write_with_native_handles().
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  bool send(const util::Blob_const& blob, const Native_handle_list& hndls, Error_code* err_code = 0);

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
  // Data.

  /// See nickname().
  std::string m_nickname;

  /// The owned descriptor, or null.
  util::Native_handle m_peer_socket;
}; // class Raw_sender

} // namespace capchan::transport
