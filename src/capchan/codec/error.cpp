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
#include "capchan/codec/error.hpp"
#include "capchan/util/util_fwd.hpp"
#include <flow/util/util.hpp>

namespace capchan::codec::error
{

// Types.

/**
 * The boost.system category for errors returned by the capchan::codec module.  Think of it as the polymorphic
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
   * The guts of the `ostream << Code` operation: e.g., Code::S_WRONG_KIND => `"WRONG_KIND"`.
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
  return "capchan/codec";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_NULL_CAPABILITY:
    return "Cannot encode a capability: the sender is null (default-constructed or moved-from).";
  case Code::S_SERIALIZE_FAILED:
    return "Could not serialize the wire value tree into message bytes.";
  case Code::S_MALFORMED_MESSAGE:
    return "Could not parse the message bytes as a wire envelope.";
  case Code::S_CAPABILITY_COUNT_MISMATCH:
    return "Message declares a different number of capabilities than were delivered with it.";
  case Code::S_WRONG_KIND:
    return "Wire value is of a different kind than the target type requires.";
  case Code::S_INTEGER_OUT_OF_RANGE:
    return "Wire integer value does not fit the target integer type.";
  case Code::S_WRONG_ARITY:
    return "Wire sequence has a different number of elements than the target pair/tuple/map entry requires.";
  case Code::S_RECORD_FIELD_MISMATCH:
    return "Wire record fields do not match the target structure's fields (count, names or order).";
  case Code::S_CAPABILITY_INDEX_OUT_OF_RANGE:
    return "Capability index in message has no corresponding delivered capability.";
  case Code::S_FLOAT_OUT_OF_RANGE:
    return "Wire floating-point value is finite but does not fit the target floating-point type.";

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
  case Code::S_NULL_CAPABILITY:
    return "NULL_CAPABILITY";
  case Code::S_SERIALIZE_FAILED:
    return "SERIALIZE_FAILED";
  case Code::S_MALFORMED_MESSAGE:
    return "MALFORMED_MESSAGE";
  case Code::S_CAPABILITY_COUNT_MISMATCH:
    return "CAPABILITY_COUNT_MISMATCH";
  case Code::S_WRONG_KIND:
    return "WRONG_KIND";
  case Code::S_INTEGER_OUT_OF_RANGE:
    return "INTEGER_OUT_OF_RANGE";
  case Code::S_WRONG_ARITY:
    return "WRONG_ARITY";
  case Code::S_RECORD_FIELD_MISMATCH:
    return "RECORD_FIELD_MISMATCH";
  case Code::S_CAPABILITY_INDEX_OUT_OF_RANGE:
    return "CAPABILITY_INDEX_OUT_OF_RANGE";
  case Code::S_FLOAT_OUT_OF_RANGE:
    return "FLOAT_OUT_OF_RANGE";

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

} // namespace capchan::codec::error
