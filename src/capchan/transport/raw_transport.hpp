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

#include "capchan/transport/raw_sender.hpp"
#include "capchan/transport/raw_receiver.hpp"
#include "capchan/transport/raw_one_shot_listener.hpp"

/**
 * @namespace capchan::transport
 *
 * Raw transport contract
 * ----------------------
 * The typed layer (capchan::chan) relies on exactly the following from the raw transport, and on nothing else:
 *   - create_raw_pair() yields a connected, unnamed (Raw_sender, Raw_receiver) pair.
 *   - Raw_sender::send() transmits (blob, ordered handle list) as one message.  Messages from one sender arrive
 *     whole, in send order.  The handles sent are typically other Raw_sender descriptors; they arrive, in order,
 *     as Raw_sender objects owned by the receiving side.  Raw_sender::clone() yields another sender to the same
 *     receiver.
 *   - Raw_receiver::recv() blocks for the next message; Raw_receiver::try_recv() does not.  Once all senders are
 *     gone and the queue is drained, both report `boost::asio::error::eof`.
 *   - Raw_sender::send() to a receiver that is gone reports `boost::asio::error::broken_pipe` (or
 *     `connection_reset`).
 *   - Raw_one_shot_listener exposes a name(); Raw_sender::connect() to that name, followed by a first message,
 *     completes Raw_one_shot_listener::accept() which yields the receiver and that first message.  The listener
 *     then stops listening.  (Raw_one_shot_listener::accept_connection() is the same minus the first message.)
 *
 * The implementation is Linux `AF_UNIX`/`SOCK_SEQPACKET` sockets with `SCM_RIGHTS` descriptor passing; see
 * seqpacket_socket.
 */
