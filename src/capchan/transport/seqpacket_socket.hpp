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
#include <boost/asio.hpp>

/**
 * Additional (versus boost.asio) APIs for work with local *sequenced-packet* (Unix domain, `SOCK_SEQPACKET`)
 * sockets, including transmission of any number of native handles along with each packet.
 *
 * boost.asio ships `local::stream_protocol` and `local::datagram_protocol` but no `SOCK_SEQPACKET` flavor;
 * #Protocol supplies it, which is enough for boost.asio's `local::connect_pair()`, `basic_seq_packet_socket`,
 * `basic_socket_acceptor` and `local::basic_endpoint` to work as with the built-in flavors.  `SOCK_SEQPACKET`
 * is the right tool for the raw transport: it is connection-oriented (so peer death is detectable, as EOF or
 * `EPIPE`); it preserves message boundaries; and each `sendmsg()` is atomic with its ancillary data.
 *
 * The I/O functions are non-blocking; wait_readable() and wait_writable() supply the blocking part where needed.
 */
namespace capchan::transport::seqpacket_socket
{

// Types.

/**
 * A boost.asio `Protocol`-concept type for local (Unix domain) sequenced-packet sockets.
 * Instances are stateless and interchangeable.
 */
class Protocol
{
public:
  // Types.

  /// The endpoint type: an `AF_UNIX` socket address.
  using endpoint = boost::asio::local::basic_endpoint<Protocol>;

  /// The connected-socket type.
  using socket = boost::asio::basic_seq_packet_socket<Protocol>;

  /// The acceptor (listening socket) type.
  using acceptor = boost::asio::basic_socket_acceptor<Protocol>;

  // Methods.

  /**
   * Socket type for `socket()`.
   * @return `SOCK_SEQPACKET`.
   */
  int type() const;

  /**
   * Protocol for `socket()`.
   * @return 0.
   */
  int protocol() const;

  /**
   * Address family for `socket()`.
   * @return `AF_UNIX`.
   */
  int family() const;
}; // class Protocol

/// Short-hand for boost.asio connected sequenced-packet socket.
using Peer_socket = Protocol::socket;

/// Short-hand for boost.asio acceptor (listening) sequenced-packet socket.
using Acceptor = Protocol::acceptor;

/// Short-hand for boost.asio local-socket address.
using Endpoint = Protocol::endpoint;

// Constants.

/**
 * The maximum number of native handles Linux accepts in one `SCM_RIGHTS` control message (`SCM_MAX_FD`).
 * Attempting to send more fails with `EINVAL`; we check ahead of time and emit a nicer error.
 */
constexpr size_t S_MAX_HANDLES_PER_MESSAGE = 253;

// Free functions.

/**
 * Returns an #Endpoint corresponding to the given name in the Linux abstract socket namespace (not the file
 * system).  The name is used as-is (no NUL terminator; the leading NUL denoting "abstract" is added here).
 *
 * @param logger_ptr
 *        Logger to use for subsequently logging.
 * @param name
 *        The name.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        whatever boost.asio reports for an invalid address, e.g., because the name is too long.
 * @return The endpoint; default-constructed endpoint on error.
 */
Endpoint endpoint_at_name(flow::log::Logger* logger_ptr, const std::string& name, Error_code* err_code = 0);

/**
 * Sends, without blocking, one packet consisting of the given blob plus the given native handles (0 or more, up to
 * #S_MAX_HANDLES_PER_MESSAGE), the handles via `SCM_RIGHTS` ancillary data.  Either the whole packet goes out or
 * nothing does; if the socket buffer is full `boost::asio::error::would_block` is emitted and nothing is sent.
 *
 * The handles in `payload_hndls` are not touched: the kernel effectively `dup()`s them into the receiving process.
 * The caller may close them afterwards as desired.
 *
 * @param logger_ptr
 *        Logger to use for subsequently logging.
 * @param peer_socket
 *        The connected `SOCK_SEQPACKET` descriptor.  Must not be null().
 * @param payload_hndls
 *        Native handles to transmit.  May be empty.  Each must not be null().
 * @param payload_blob
 *        The blob to transmit.  Must not be empty (an empty packet is indistinguishable from EOF to the receiver).
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        `boost::asio::error::would_block` (not a real error; try again later);
 *        error::Code::S_TOO_MANY_HANDLES; other system codes from `sendmsg()`, e.g., `EPIPE` if the
 *        receiving side is closed, `EMSGSIZE` if the blob exceeds the socket buffer.
 * @return Bytes sent: `payload_blob.size()` on success; 0 otherwise.
 */
size_t nb_write_with_native_handles(flow::log::Logger* logger_ptr, util::Native_handle peer_socket,
                                    const Native_handle_list& payload_hndls, const util::Blob_const& payload_blob,
                                    Error_code* err_code = 0);

/**
 * Receives, without blocking, the size in bytes of the next packet without dequeuing it (`MSG_PEEK | MSG_TRUNC`).
 * If the peer has closed its side (or the receive direction was shut down) and no packets remain,
 * `boost::asio::error::eof` is emitted.
 *
 * @param logger_ptr
 *        Logger to use for subsequently logging.
 * @param peer_socket
 *        The connected `SOCK_SEQPACKET` descriptor.  Must not be null().
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        `boost::asio::error::would_block` (not a real error; nothing is queued yet); `boost::asio::error::eof`;
 *        other system codes from `recv()`.
 * @return Size of the next packet; 0 if not available.
 */
size_t nb_peek_message_size(flow::log::Logger* logger_ptr, util::Native_handle peer_socket,
                            Error_code* err_code = 0);

/**
 * Receives, without blocking, one packet: its blob into the given buffer and any accompanying native handles into
 * `*target_payload_hndls` (with close-on-exec set).  The buffer must be large enough for the whole packet
 * (see nb_peek_message_size()); otherwise the excess is lost and error::Code::S_LOW_LVL_MESSAGE_TRUNCATED is emitted.
 *
 * On any error no handles are returned: any that did arrive with a bad packet are closed.
 *
 * @param logger_ptr
 *        Logger to use for subsequently logging.
 * @param peer_socket
 *        The connected `SOCK_SEQPACKET` descriptor.  Must not be null().
 * @param target_payload_hndls
 *        Cleared; then, on success, loaded with the received handles in the order the sender listed them.
 *        The caller owns them.
 * @param target_payload_blob
 *        Buffer for the blob.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        `boost::asio::error::would_block` (not a real error; nothing is queued yet); `boost::asio::error::eof`;
 *        error::Code::S_LOW_LVL_MESSAGE_TRUNCATED; error::Code::S_LOW_LVL_UNEXPECTED_CONTROL_DATA;
 *        other system codes from `recvmsg()`.
 * @return Bytes received into `target_payload_blob`; 0 on error.
 */
size_t nb_read_with_native_handles(flow::log::Logger* logger_ptr, util::Native_handle peer_socket,
                                   Native_handle_list* target_payload_hndls,
                                   const util::Blob_mutable& target_payload_blob,
                                   Error_code* err_code = 0);

/**
 * Blocks until the given descriptor is readable (which includes EOF/hang-up/error conditions).
 *
 * @param peer_socket
 *        Descriptor.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system codes from `poll()`.
 */
void wait_readable(util::Native_handle peer_socket, Error_code* err_code = 0);

/**
 * Blocks until the given descriptor is writable (which includes hang-up/error conditions).
 *
 * @param peer_socket
 *        Descriptor.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system codes from `poll()`.
 */
void wait_writable(util::Native_handle peer_socket, Error_code* err_code = 0);

} // namespace capchan::transport::seqpacket_socket
