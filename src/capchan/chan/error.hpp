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

#include "capchan/common.hpp"

/**
 * Namespace containing the capchan::chan module's extension of boost.system error conventions.  Unlike the lower
 * layers, capchan::chan reports *only* codes from this set: each lower-layer error (system, transport::error,
 * codec::error) is logged and then mapped onto the coarser code here which tells the user what kind of thing
 * failed.  So one can reliably write, e.g., `if (err_code == chan::error::Code::S_RECV_DISCONNECTED)`.
 *
 * @see capchan::transport::error, capchan::codec::error.
 */
namespace capchan::chan::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by capchan::chan functions/methods.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() and its
 * symbol (minus `S_`) to Category::code_symbol().  Add it to the end, but ahead of Code::S_END_SENTINEL; never
 * delete a value (mark it deprecated instead).
 */
enum class Code
{
  /// Could not establish a channel: pair allocation failed, or nothing (any longer) listens at the given name.
  S_CONNECTION_FAILED = S_CODE_LOWEST_INT_VALUE,

  /// Could not send message: the value could not be encoded (e.g., it contains a null sender).
  S_SEND_ENCODE_FAILED,

  /// Could not send message: the receiver is gone.
  S_SEND_PEER_GONE,

  /// Could not send message: the transport refused or failed (e.g., message too large; too many senders inside).
  S_SEND_TRANSPORT_FAILED,

  /// No more messages: all senders are gone (or the receiver was shut down).
  S_RECV_DISCONNECTED,

  /// Received message could not be decoded into the expected type.
  S_RECV_DECODE_FAILED,

  /// Received message refers to a sender that was not delivered with it.
  S_RECV_HANDLE_INDEX_OUT_OF_RANGE,

  /// Non-blocking receive found no message queued.  Not a failure of the channel.
  S_RECV_WOULD_BLOCK,

  /// One-shot server could not accept a connection (or accept() was already used).
  S_ACCEPT_FAILED,

  /// One-shot server accepted a connection but did not obtain a decodable first message.
  S_ACCEPT_FIRST_MESSAGE_FAILED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()` template
 * implementation work; i.e., so that one can implicitly convert from Code to #Error_code.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a chan::error::Code from a standard input stream: either the `int` value or the
 * case-insensitive symbol minus `S_`, e.g. "recv_disconnected".  No match => Code::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a chan::error::Code to a standard output stream, e.g. Code::S_RECV_DISCONNECTED =>
 * `"RECV_DISCONNECTED"`.  The output is compatible with the reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace capchan::chan::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` `Code` convertible to `Error_code`.  This is the
 * official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::capchan::chan::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
