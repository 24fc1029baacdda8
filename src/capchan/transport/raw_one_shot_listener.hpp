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
#include "capchan/transport/seqpacket_socket.hpp"
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>

namespace capchan::transport
{

// Types.

/**
 * A named bootstrap endpoint that accepts exactly one connection, then stops listening.  Typical use: process A
 * creates a Raw_one_shot_listener; passes name() to process B out-of-band (command line, environment, file...);
 * B does Raw_sender::connect() to that name and sends a first message; A does accept() which yields the
 * Raw_receiver for that connection along with the first message.  From then on anything the two need (including
 * more channels, in either direction) can travel over that connection.
 *
 * The name is randomly generated in the Linux abstract socket namespace, so no file system object exists and
 * nothing needs to be cleaned up on exit; and it is unguessable in practice.
 *
 * ### Lifecycle ###
 * Listening starts in the constructor.  accept() (or accept_connection()) may be called once: success or failure,
 * the listening socket is closed upon return, so later connection attempts by anyone fail (`connection_refused`).
 * Destroying the object without accept() likewise stops listening.
 *
 * ### Thread safety ###
 * None: use from one thread at a time.
 */
class Raw_one_shot_listener :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constants.

  /// Prefix of every name(); the rest is a random UUID.
  static const std::string S_NAME_PREFIX;

  // Constructors/destructor.

  /**
   * Picks a fresh name and starts listening on it.  If `err_code` is null, throws `flow::error::Runtime_error`
   * on failure; otherwise sets `*err_code` and the object is unusable (accept() will fail).
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes from `socket()`, `bind()`, `listen()`.
   */
  explicit Raw_one_shot_listener(flow::log::Logger* logger_ptr, Error_code* err_code = 0);

  /// Stops listening if still listening.
  ~Raw_one_shot_listener();

  // Methods.

  /**
   * The name at which we listen (or listened); give it to Raw_sender::connect() in the client process.
   * @return See above.
   */
  const std::string& name() const;

  /**
   * Blocks until one client connects and sends its first message; then yields the connection's receiver and that
   * message.  Equivalent to accept_connection() followed by Raw_receiver::recv() on the result.  The listening
   * socket is closed upon return, whether successful or not.
   *
   * @param target_rcv
   *        On success move-assigned the receiver for the accepted connection.  Otherwise untouched.
   * @param target_blob
   *        On success: the first message's bytes.  See Raw_receiver::recv().
   * @param target_snds
   *        On success: the first message's senders.  See Raw_receiver::recv().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        those of accept_connection(); those of Raw_receiver::recv() (e.g., `boost::asio::error::eof` if
   *        the client disconnected without sending anything).
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  bool accept(Raw_receiver* target_rcv, util::Blob* target_blob, Raw_sender_list* target_snds,
              Error_code* err_code = 0);

  /**
   * The first half of accept(): blocks until one client connects; yields the connection's receiver without
   * receiving anything on it.  For callers that process the first message themselves (and so can tell a failed
   * connection from a bad first message).  The listening socket is closed upon return, whether successful or not.
   *
   * @param target_rcv
   *        On success move-assigned the receiver for the accepted connection.  Otherwise untouched.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_LISTENER_ALREADY_ACCEPTED (accept() or accept_connection() already called, or the
   *        constructor failed); system codes from `accept()`.
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  bool accept_connection(Raw_receiver* target_rcv, Error_code* err_code = 0);

private:
  // Data.

  /// See name().
  std::string m_name;

  /// The boost.asio loop required by #m_acceptor; only synchronous operations are performed.
  flow::util::Task_engine m_task_engine;

  /// The listening socket; null if not listening (constructor failed, or accept_connection() has been called).
  boost::movelib::unique_ptr<seqpacket_socket::Acceptor> m_acceptor;
}; // class Raw_one_shot_listener

} // namespace capchan::transport
