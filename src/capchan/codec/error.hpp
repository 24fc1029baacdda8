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
 * Namespace containing the capchan::codec module's extension of boost.system error conventions: the ways a value
 * can fail to encode into, or decode from, the wire form.  capchan::chan maps these onto its own, coarser codes
 * (logging the original).
 *
 * @see capchan::transport::error, capchan::chan::error.
 */
namespace capchan::codec::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by capchan::codec functions/methods, plus
 * those of Decode_context::clone_sender_at(), which may also report a system error.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to error.cpp's Category::message() and its
 * symbol (minus `S_`) to Category::code_symbol().  Add it to the end, but ahead of Code::S_END_SENTINEL; never
 * delete a value (mark it deprecated instead).
 */
enum class Code
{
  /// Cannot encode a capability: the sender is null (default-constructed or moved-from).
  S_NULL_CAPABILITY = S_CODE_LOWEST_INT_VALUE,

  /// Could not serialize the wire value tree into message bytes.
  S_SERIALIZE_FAILED,

  /// Could not parse the message bytes as a wire envelope.
  S_MALFORMED_MESSAGE,

  /// Message declares a different number of capabilities than were delivered with it.
  S_CAPABILITY_COUNT_MISMATCH,

  /// Wire value is of a different kind than the target type requires.
  S_WRONG_KIND,

  /// Wire integer value does not fit the target integer type.
  S_INTEGER_OUT_OF_RANGE,

  /// Wire sequence has a different number of elements than the target pair/tuple/map entry requires.
  S_WRONG_ARITY,

  /// Wire record fields do not match the target structure's fields (count, names or order).
  S_RECORD_FIELD_MISMATCH,

  /// Capability index in message has no corresponding delivered capability.
  S_CAPABILITY_INDEX_OUT_OF_RANGE,

  /// Wire floating-point value is finite but does not fit the target floating-point type.
  S_FLOAT_OUT_OF_RANGE,

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
 * Deserializes a codec::error::Code from a standard input stream: either the `int` value or the
 * case-insensitive symbol minus `S_`, e.g. "wrong_kind".  No match => Code::S_END_SENTINEL.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a codec::error::Code to a standard output stream, e.g. Code::S_WRONG_KIND =>
 * `"WRONG_KIND"`.  The output is compatible with the reverse `istream>>` operator.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace capchan::codec::error

namespace boost::system
{

// Types.

/**
 * Specialization that authorizes boost.system to make `enum` `Code` convertible to `Error_code`.  This is the
 * official way to accomplish that, as documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::capchan::codec::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
