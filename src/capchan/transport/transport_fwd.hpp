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

#include "capchan/util/util_fwd.hpp"
#include <vector>

/**
 * capchan module providing the raw transport: the untyped, connected, message-oriented pipe over which the typed
 * layer (capchan::chan) is built.  Each message is one blob plus an ordered list of sender endpoints
 * (Raw_sender) carried out-of-band; a message is delivered whole, in order, or not at all.
 *
 * See raw_transport.hpp for the contract (what the typed layer relies upon); Raw_sender, Raw_receiver and
 * Raw_one_shot_listener for the implementation; and seqpacket_socket for the low-level socket plumbing they share.
 */
namespace capchan::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Raw_sender;
class Raw_receiver;
class Raw_one_shot_listener;

/// Ordered list of raw senders, as received out-of-band along with one message blob.
using Raw_sender_list = std::vector<Raw_sender>;

/// Ordered list of (borrowed, not owned) native handles to send out-of-band along with one message blob.
using Native_handle_list = std::vector<util::Native_handle>;

// Free functions.

/**
 * Creates a connected, unnamed raw sender/receiver pair.  Both are in the current process; either may then be
 * sent to another process (the sender via Raw_sender::send(); the receiver, as a rule, never is).
 *
 * @param logger_ptr
 *        Logger to use for subsequently logging (passed to the new objects too).
 * @param nickname
 *        Human-readable nickname for the pair, as shown in logs/output.
 * @param target_snd
 *        On success `*target_snd` is move-assigned the sending half.  Otherwise untouched.
 * @param target_rcv
 *        On success `*target_rcv` is move-assigned the receiving half.  Otherwise untouched.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system codes from `socketpair()` (e.g., too many open files).
 * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
 */
bool create_raw_pair(flow::log::Logger* logger_ptr, util::String_view nickname,
                     Raw_sender* target_snd, Raw_receiver* target_rcv, Error_code* err_code = 0);

/**
 * Prints string representation of the given Raw_sender to the given `ostream`.
 *
 * @relatesalso Raw_sender
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Raw_sender& val);

/**
 * Prints string representation of the given Raw_receiver to the given `ostream`.
 *
 * @relatesalso Raw_receiver
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Raw_receiver& val);

/**
 * Prints string representation of the given Raw_one_shot_listener to the given `ostream`.
 *
 * @relatesalso Raw_one_shot_listener
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Raw_one_shot_listener& val);

} // namespace capchan::transport
