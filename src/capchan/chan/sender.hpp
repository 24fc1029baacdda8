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

#include "capchan/chan/chan_fwd.hpp"
#include "capchan/chan/error.hpp"
#include "capchan/chan/detail/channel_impl.hpp"
#include "capchan/codec/codec.hpp"
#include "capchan/transport/raw_sender.hpp"
#include <flow/error/error.hpp>

namespace capchan::chan
{

// Types.

/**
 * The sending end of a typed channel: sends values of type `T` to the one Receiver<T> it is connected to.
 * Obtain one via channel() or connect(), or by receiving it inside a message.
 *
 * ### Copying ###
 * A Sender is copyable: a copy holds a duplicate descriptor and sends to the same Receiver, independently of
 * the original (either can be destroyed without affecting the other).  The Receiver sees disconnection only once
 * every copy, in every process, is gone.  Copying can fail only in case of descriptor exhaustion; then the copy
 * constructor/assignment throws `flow::error::Runtime_error`.
 *
 * ### Sending a Sender ###
 * A Sender (or any value containing Senders) can itself be the payload of another Sender.  The receiving side gets
 * a Sender that works exactly like a copy of the original.  The Sender being sent is not affected.
 *
 * ### Null state ###
 * A default-constructed or moved-from Sender is null(): send() fails, and it cannot be sent (encoding fails).
 *
 * ### Thread safety ###
 * send() may be invoked concurrently on one object; each message is transmitted atomically.  Other concurrent
 * access involving a non-`const` method is not safe.
 *
 * @tparam T
 *         The payload type: any type with a codec::Codec.  It also determines the payload type of the Receiver at
 *         the other end; matching is by convention only (nothing is checked at runtime beyond decoding).
 */
template<typename T>
class Sender :
  public flow::log::Log_context
{
public:
  // Types.

  /// The payload type.
  using Value = T;

  // Constructors/destructor.

  /// Creates a null() sender.
  Sender();

  /**
   * Wraps a raw sender.  Normally one does not use this directly; see channel(), connect().
   *
   * @param raw_snd_moved
   *        The raw sender.  Becomes null.
   */
  explicit Sender(transport::Raw_sender&& raw_snd_moved);

  /**
   * Copy constructor: duplicates the descriptor (unless `src` is null()).
   *
   * @param src
   *        Source object.
   */
  Sender(const Sender& src);

  /**
   * Move constructor.
   *
   * @param src
   *        Source object.  Becomes null().
   */
  Sender(Sender&& src) noexcept;

  // Methods.

  /**
   * Copy assignment: closes our descriptor (if any) and duplicates `src`'s (unless it is null()).
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Sender& operator=(const Sender& src);

  /**
   * Move assignment: closes our descriptor (if any) and takes `src`'s.
   *
   * @param src
   *        Source object.  Becomes null().
   * @return `*this`.
   */
  Sender& operator=(Sender&& src) noexcept;

  /**
   * Connects to the One_shot_server<T> publishing the given name.  The resulting Sender's first send() completes
   * that server's One_shot_server::accept().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param name
   *        Name from One_shot_server's constructor.
   * @param target_snd
   *        On success move-assigned the connected Sender.  Otherwise untouched.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CONNECTION_FAILED (no server at that name, or it has already accepted).
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  static bool connect(flow::log::Logger* logger_ptr, const std::string& name, Sender* target_snd,
                      Error_code* err_code = 0);

  /**
   * Sends a value.  Blocks only while the channel's buffer is full.
   *
   * The value is encoded with a fresh codec::Encode_context: every Sender inside `value` (at any depth) is
   * transmitted as a capability.  The message (bytes plus capabilities) is then handed to the transport in one
   * piece.  Failure leaves no state behind; the next send() starts from scratch.
   *
   * @param value
   *        The value.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SEND_ENCODE_FAILED (e.g., `value` contains a null() Sender),
   *        error::Code::S_SEND_PEER_GONE (the Receiver is gone),
   *        error::Code::S_SEND_TRANSPORT_FAILED (e.g., message too large, too many Senders inside; or `*this`
   *        is null()).
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  bool send(const T& value, Error_code* err_code = 0);

  /**
   * Returns `true` if and only if `*this` holds no channel.
   * @return See above.
   */
  bool null() const;

  /**
   * The underlying raw sender.
   * @return See above.
   */
  const transport::Raw_sender& raw() const;

private:
  // Data.

  /// The underlying raw sender.
  transport::Raw_sender m_raw;
}; // class Sender

// Free functions: in *_fwd.hpp.

} // namespace capchan::chan

namespace capchan::codec
{

// Types.

/**
 * Codec for chan::Sender: the capability itself.  Encoding appends the sender's descriptor to the message's
 * Encode_context and writes its index; decoding resolves the index against the Decode_context into a new sender.
 *
 * @tparam U
 *         The payload type of the sender.
 */
template<typename U>
struct Codec<chan::Sender<U>>
{
  /// See Codec.
  static bool encode(const chan::Sender<U>& value, wire::Value* target, Encode_context* ctx, Error_code* err_code)
  {
    if (value.null())
    {
      FLOW_LOG_SET_CONTEXT(ctx->get_logger(), Log_component::S_CODEC);
      FLOW_LOG_WARNING("Encode_context [" << *ctx << "]: Cannot encode null sender.");
      *err_code = error::Code::S_NULL_CAPABILITY;
      return false;
    }
    // else

    target->set_capability_index(static_cast<uint32_t>(ctx->add_capability(value.raw().native_handle())));
    err_code->clear();
    return true;
  }

  /// See Codec.
  static bool decode(const wire::Value& src, chan::Sender<U>* target, Decode_context* ctx, Error_code* err_code)
  {
    if (!detail::check_kind(src, wire::Value::kCapabilityIndex, *ctx, err_code))
    {
      return false;
    }
    // else

    transport::Raw_sender raw_snd;
    if (!ctx->clone_sender_at(src.capability_index(), &raw_snd, err_code))
    {
      return false; // It logged.
    }
    // else

    *target = chan::Sender<U>(std::move(raw_snd));
    err_code->clear();
    return true;
  }
}; // struct Codec<chan::Sender>

} // namespace capchan::codec

namespace capchan::chan
{

// Template implementations.

/// Internally used macro; public API users should disregard.
#define TEMPLATE_CHAN_SENDER \
  template<typename T>
/// Internally used macro; public API users should disregard.
#define CLASS_CHAN_SENDER \
  Sender<T>

TEMPLATE_CHAN_SENDER
CLASS_CHAN_SENDER::Sender() :
  flow::log::Log_context(nullptr, Log_component::S_CHAN)
{
  // That's it.
}

TEMPLATE_CHAN_SENDER
CLASS_CHAN_SENDER::Sender(transport::Raw_sender&& raw_snd_moved) :
  flow::log::Log_context(raw_snd_moved.get_logger(), Log_component::S_CHAN),
  m_raw(std::move(raw_snd_moved))
{
  FLOW_LOG_TRACE("Sender [" << *this << "]: Created.");
}

TEMPLATE_CHAN_SENDER
CLASS_CHAN_SENDER::Sender(const Sender& src) :
  flow::log::Log_context(src)
{
  if (!src.null())
  {
    src.m_raw.clone(&m_raw); // Throws on error.
  }
}

TEMPLATE_CHAN_SENDER
CLASS_CHAN_SENDER::Sender(Sender&& src) noexcept :
  flow::log::Log_context(std::move(src)),
  m_raw(std::move(src.m_raw))
{
  // Nothing else.
}

TEMPLATE_CHAN_SENDER
CLASS_CHAN_SENDER& CLASS_CHAN_SENDER::operator=(const Sender& src)
{
  if (&src != this)
  {
    // Clone first: if it throws, *this is unchanged.
    transport::Raw_sender raw_snd;
    if (!src.null())
    {
      src.m_raw.clone(&raw_snd); // Throws on error.
    }
    flow::log::Log_context::operator=(src);
    m_raw = std::move(raw_snd);
  }
  return *this;
}

TEMPLATE_CHAN_SENDER
CLASS_CHAN_SENDER& CLASS_CHAN_SENDER::operator=(Sender&& src) noexcept
{
  if (&src != this)
  {
    flow::log::Log_context::operator=(std::move(src));
    m_raw = std::move(src.m_raw);
  }
  return *this;
}

TEMPLATE_CHAN_SENDER
bool CLASS_CHAN_SENDER::connect(flow::log::Logger* logger_ptr, const std::string& name, Sender* target_snd,
                                Error_code* err_code)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return connect(logger_ptr, name, target_snd, actual_err_code); },
         &ok, err_code, "chan::Sender::connect()"))
  {
    return ok;
  }
  // else

  assert(target_snd);

  transport::Raw_sender raw_snd;
  Error_code raw_err_code;
  if (!transport::Raw_sender::connect(logger_ptr, name, &raw_snd, &raw_err_code))
  {
    // It logged the details.
    *err_code = error::Code::S_CONNECTION_FAILED;
    return false;
  }
  // else

  *target_snd = Sender(std::move(raw_snd));
  err_code->clear();
  return true;
} // Sender::connect()

TEMPLATE_CHAN_SENDER
bool CLASS_CHAN_SENDER::send(const T& value, Error_code* err_code)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return send(value, actual_err_code); },
         &ok, err_code, "chan::Sender::send()"))
  {
    return ok;
  }
  // else

  if (null())
  {
    FLOW_LOG_WARNING("Sender [" << *this << "]: Cannot send: null.");
    *err_code = error::Code::S_SEND_TRANSPORT_FAILED;
    return false;
  }
  // else

  // Fresh context: capabilities of this one message only.
  codec::Encode_context ctx(get_logger());
  std::string bytes;
  Error_code codec_err_code;
  if (!codec::encode(value, &ctx, &bytes, &codec_err_code))
  {
    *err_code = detail::to_send_encode_error(get_logger(), codec_err_code);
    return false;
  }
  // else

  FLOW_LOG_TRACE("Sender [" << *this << "]: Sending [" << bytes.size() << "]-byte message with "
                 "[" << ctx.size() << "] capabilities.");
  return detail::send_encoded(&m_raw, bytes, ctx, err_code);
} // Sender::send()

TEMPLATE_CHAN_SENDER
bool CLASS_CHAN_SENDER::null() const
{
  return m_raw.null();
}

TEMPLATE_CHAN_SENDER
const transport::Raw_sender& CLASS_CHAN_SENDER::raw() const
{
  return m_raw;
}

/// @cond
// -^- Doxygen, please ignore the following.  It gets confused by something here and gives warnings.

TEMPLATE_CHAN_SENDER
std::ostream& operator<<(std::ostream& os, const CLASS_CHAN_SENDER& val)
{
  return os << "[raw " << val.raw() << "]@" << static_cast<const void*>(&val);
}

// -v- Doxygen, please stop ignoring.
/// @endcond

#undef CLASS_CHAN_SENDER
#undef TEMPLATE_CHAN_SENDER

} // namespace capchan::chan
