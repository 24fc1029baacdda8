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
 * Namespace containing the capchan::transport module's extension of boost.system error conventions, so that that
 * API can return codes/messages from within its own new set of error codes/messages.  Note that most errors
 * capchan::transport reports are system errors and do not draw from this set but rather from `boost::asio::error`
 * or `boost::system::errc`.  (If you're familiar with the boost.system framework, you'll know such mixing is
 * normal.)
 *
 * @see capchan::chan::error which covers errors from the typed layer (capchan::chan).
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace capchan::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by capchan::transport functions/methods *outside of*
 * system-triggered errors such as `boost::asio::error::connection_reset`.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() and its
 * symbol (minus `S_`) to Category::code_symbol().  Add it to the end, but ahead of Code::S_END_SENTINEL; never
 * delete a value (mark it deprecated instead).
 */
enum class Code
{
  /// Will not send message: blob size exceeds the transport's per-message limit.
  S_MESSAGE_SIZE_EXCEEDS_LIMIT = S_CODE_LOWEST_INT_VALUE,

  /// Will not send message: native handle count exceeds the per-message limit of the descriptor-passing mechanism.
  S_TOO_MANY_HANDLES,

  /// Unable to receive incoming traffic: ancillary data was truncated or of an unexpected kind.
  S_LOW_LVL_UNEXPECTED_CONTROL_DATA,

  /// Unable to receive incoming traffic: the message did not fit the space reserved for it.
  S_LOW_LVL_MESSAGE_TRUNCATED,

  /// Operation invoked on a transport endpoint holding no native handle (default-constructed or moved-from).
  S_NULL_HANDLE,

  /// One-shot listener has already accepted its one connection (or failed trying) and is no longer listening.
  S_LISTENER_ALREADY_ACCEPTED,

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
 * Deserializes a transport::error::Code from a standard input stream: either the `int` value or the
 * case-insensitive symbol minus `S_`, e.g. "too_many_handles".  No match => Code::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream, e.g. Code::S_TOO_MANY_HANDLES =>
 * `"TOO_MANY_HANDLES"`.  The output is compatible with the reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace capchan::transport::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` `Code` convertible to `Error_code`.  This is the
 * official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::capchan::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
