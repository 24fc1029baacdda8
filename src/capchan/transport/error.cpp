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
#include "capchan/transport/error.hpp"
#include "capchan/util/util_fwd.hpp"
#include <flow/util/util.hpp>

namespace capchan::transport::error
{

// Types.

/**
 * The boost.system category for errors returned by the capchan::transport module.  Think of it as the polymorphic
 * counterpart of error::Code; it kicks in when, for `Error_code ec`, something like `ec.message()` is invoked.
 * Not available outside this translation unit.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category`.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer value of a Code, returns a description of that error.
   *
   * @param val
   *        Error code of a Category error (a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: e.g., Code::S_TOO_MANY_HANDLES => `"TOO_MANY_HANDLES"`.
   *
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "capchan/transport";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT:
    return "Will not send message: blob size exceeds the transport's per-message limit.";
  case Code::S_TOO_MANY_HANDLES:
    return "Will not send message: native handle count exceeds the per-message limit of the descriptor-passing "
           "mechanism.";
  case Code::S_LOW_LVL_UNEXPECTED_CONTROL_DATA:
    return "Unable to receive incoming traffic: ancillary data was truncated or of an unexpected kind.";
  case Code::S_LOW_LVL_MESSAGE_TRUNCATED:
    return "Unable to receive incoming traffic: the message did not fit the space reserved for it.";
  case Code::S_NULL_HANDLE:
    return "Operation invoked on a transport endpoint holding no native handle (default-constructed or "
           "moved-from).";
  case Code::S_LISTENER_ALREADY_ACCEPTED:
    return "One-shot listener has already accepted its one connection (or failed trying) and is no longer "
           "listening.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT:
    return "MESSAGE_SIZE_EXCEEDS_LIMIT";
  case Code::S_TOO_MANY_HANDLES:
    return "TOO_MANY_HANDLES";
  case Code::S_LOW_LVL_UNEXPECTED_CONTROL_DATA:
    return "LOW_LVL_UNEXPECTED_CONTROL_DATA";
  case Code::S_LOW_LVL_MESSAGE_TRUNCATED:
    return "LOW_LVL_MESSAGE_TRUNCATED";
  case Code::S_NULL_HANDLE:
    return "NULL_HANDLE";
  case Code::S_LISTENER_ALREADY_ACCEPTED:
    return "LISTENER_ALREADY_ACCEPTED";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace capchan::transport::error
