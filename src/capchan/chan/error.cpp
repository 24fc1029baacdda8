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
#include "capchan/chan/error.hpp"
#include "capchan/util/util_fwd.hpp"
#include <flow/util/util.hpp>

namespace capchan::chan::error
{

// Types.

/**
 * The boost.system category for errors returned by the capchan::chan module.  Think of it as the polymorphic
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
   * The guts of the `ostream << Code` operation: e.g., Code::S_RECV_DISCONNECTED => `"RECV_DISCONNECTED"`.
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
  return "capchan/chan";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_CONNECTION_FAILED:
    return "Could not establish a channel: pair allocation failed, or nothing (any longer) listens at the given name.";
  case Code::S_SEND_ENCODE_FAILED:
    return "Could not send message: the value could not be encoded (e.g., it contains a null sender).";
  case Code::S_SEND_PEER_GONE:
    return "Could not send message: the receiver is gone.";
  case Code::S_SEND_TRANSPORT_FAILED:
    return "Could not send message: the transport refused or failed (e.g., message too large; too many senders "
           "inside).";
  case Code::S_RECV_DISCONNECTED:
    return "No more messages: all senders are gone (or the receiver was shut down).";
  case Code::S_RECV_DECODE_FAILED:
    return "Received message could not be decoded into the expected type.";
  case Code::S_RECV_HANDLE_INDEX_OUT_OF_RANGE:
    return "Received message refers to a sender that was not delivered with it.";
  case Code::S_RECV_WOULD_BLOCK:
    return "Non-blocking receive found no message queued.  Not a failure of the channel.";
  case Code::S_ACCEPT_FAILED:
    return "One-shot server could not accept a connection (or accept() was already used).";
  case Code::S_ACCEPT_FIRST_MESSAGE_FAILED:
    return "One-shot server accepted a connection but did not obtain a decodable first message.";

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
  case Code::S_CONNECTION_FAILED:
    return "CONNECTION_FAILED";
  case Code::S_SEND_ENCODE_FAILED:
    return "SEND_ENCODE_FAILED";
  case Code::S_SEND_PEER_GONE:
    return "SEND_PEER_GONE";
  case Code::S_SEND_TRANSPORT_FAILED:
    return "SEND_TRANSPORT_FAILED";
  case Code::S_RECV_DISCONNECTED:
    return "RECV_DISCONNECTED";
  case Code::S_RECV_DECODE_FAILED:
    return "RECV_DECODE_FAILED";
  case Code::S_RECV_HANDLE_INDEX_OUT_OF_RANGE:
    return "RECV_HANDLE_INDEX_OUT_OF_RANGE";
  case Code::S_RECV_WOULD_BLOCK:
    return "RECV_WOULD_BLOCK";
  case Code::S_ACCEPT_FAILED:
    return "ACCEPT_FAILED";
  case Code::S_ACCEPT_FIRST_MESSAGE_FAILED:
    return "ACCEPT_FIRST_MESSAGE_FAILED";

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

} // namespace capchan::chan::error
