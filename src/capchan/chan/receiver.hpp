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
#include "capchan/transport/raw_receiver.hpp"
#include <flow/error/error.hpp>
#include <flow/util/blob.hpp>

namespace capchan::chan
{

// Types.

/**
 * The receiving end of a typed channel: receives values of type `T`, in the order they were sent, from every
 * Sender<T> connected to it.  Obtain one via channel() or One_shot_server::accept().
 *
 * A Receiver is move-only; it cannot be sent inside a message.
 *
 * ### Disconnection ###
 * Once every Sender (every copy, in every process, including those in messages not yet received) is gone, and
 * the already-queued messages have been received, recv() fails with error::Code::S_RECV_DISCONNECTED.
 *
 * ### Thread safety ###
 * One receiving thread at a time.  shutdown() may be invoked from another thread concurrently with a blocked
 * recv(); that is its purpose.
 *
 * @tparam T
 *         The payload type: any default-constructible type with a codec::Codec.
 */
template<typename T>
class Receiver :
  public flow::log::Log_context
{
public:
  // Types.

  /// The payload type.
  using Value = T;

  // Constructors/destructor.

  /// Creates a null() receiver.
  Receiver();

  /**
   * Wraps a raw receiver.  Normally one does not use this directly; see channel(), One_shot_server.
   *
   * @param raw_rcv_moved
   *        The raw receiver.  Becomes null.
   */
  explicit Receiver(transport::Raw_receiver&& raw_rcv_moved);

  /**
   * Move constructor.
   *
   * @param src
   *        Source object.  Becomes null().
   */
  Receiver(Receiver&& src) noexcept;

  // Methods.

  /**
   * Move assignment: closes our descriptor (if any) and takes `src`'s.
   *
   * @param src
   *        Source object.  Becomes null().
   * @return `*this`.
   */
  Receiver& operator=(Receiver&& src) noexcept;

  /**
   * Receives the next value, blocking until one is available or the channel is disconnected.
   *
   * The capabilities delivered with the message are installed into a fresh codec::Decode_context for the
   * duration of decoding; each Sender inside the value is a new Sender (own descriptor) cloned from the delivered
   * one.  The delivered originals are closed before returning, whether decoding succeeded or not.
   *
   * @param target_value
   *        On success move-assigned the value.  Otherwise untouched.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_RECV_DISCONNECTED (all Senders gone, shutdown(), or `*this` is null()),
   *        error::Code::S_RECV_DECODE_FAILED (message malformed or of the wrong shape for `T`),
   *        error::Code::S_RECV_HANDLE_INDEX_OUT_OF_RANGE (message refers to a capability not delivered with it).
   *        Note that after a decode failure the channel remains usable: the bad message is consumed.
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  bool recv(T* target_value, Error_code* err_code = 0);

  /**
   * Identical to recv() except, if no message is queued, it returns immediately emitting
   * error::Code::S_RECV_WOULD_BLOCK.
   *
   * @param target_value
   *        See recv().
   * @param err_code
   *        See recv(); plus error::Code::S_RECV_WOULD_BLOCK.
   * @return See recv().
   */
  bool try_recv(T* target_value, Error_code* err_code = 0);

  /**
   * Causes a concurrently blocked recv() (and every subsequent one, once already-queued messages are consumed) to
   * fail with error::Code::S_RECV_DISCONNECTED.  Senders are unaffected until they notice the receiver is gone.
   * No-op if null().
   */
  void shutdown();

  /**
   * Returns `true` if and only if `*this` holds no channel.
   * @return See above.
   */
  bool null() const;

  /**
   * The underlying raw receiver.
   * @return See above.
   */
  const transport::Raw_receiver& raw() const;

private:
  // Methods.

  /**
   * Implements recv() and try_recv(): the latter if `blocking == false`.
   *
   * @param blocking
   *        See above.
   * @param target_value
   *        See recv().
   * @param err_code
   *        See recv().  Not null.
   * @return See recv().
   */
  bool recv_impl(bool blocking, T* target_value, Error_code* err_code);

  // Data.

  /// The underlying raw receiver.
  transport::Raw_receiver m_raw;

  /// Message bytes of the last recv(); kept to reuse its buffer.
  util::Blob m_blob;
}; // class Receiver

// Free functions: in *_fwd.hpp.

// Template implementations.

/// Internally used macro; public API users should disregard.
#define TEMPLATE_CHAN_RECEIVER \
  template<typename T>
/// Internally used macro; public API users should disregard.
#define CLASS_CHAN_RECEIVER \
  Receiver<T>

TEMPLATE_CHAN_RECEIVER
CLASS_CHAN_RECEIVER::Receiver() :
  flow::log::Log_context(nullptr, Log_component::S_CHAN)
{
  // That's it.
}

TEMPLATE_CHAN_RECEIVER
CLASS_CHAN_RECEIVER::Receiver(transport::Raw_receiver&& raw_rcv_moved) :
  flow::log::Log_context(raw_rcv_moved.get_logger(), Log_component::S_CHAN),
  m_raw(std::move(raw_rcv_moved)),
  m_blob(get_logger())
{
  FLOW_LOG_TRACE("Receiver [" << *this << "]: Created.");
}

TEMPLATE_CHAN_RECEIVER
CLASS_CHAN_RECEIVER::Receiver(Receiver&& src) noexcept :
  flow::log::Log_context(std::move(src)),
  m_raw(std::move(src.m_raw)),
  m_blob(std::move(src.m_blob))
{
  // Nothing else.
}

TEMPLATE_CHAN_RECEIVER
CLASS_CHAN_RECEIVER& CLASS_CHAN_RECEIVER::operator=(Receiver&& src) noexcept
{
  if (&src != this)
  {
    flow::log::Log_context::operator=(std::move(src));
    m_raw = std::move(src.m_raw);
    m_blob = std::move(src.m_blob);
  }
  return *this;
}

TEMPLATE_CHAN_RECEIVER
bool CLASS_CHAN_RECEIVER::recv(T* target_value, Error_code* err_code)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return recv(target_value, actual_err_code); },
         &ok, err_code, "chan::Receiver::recv()"))
  {
    return ok;
  }
  // else
  return recv_impl(true, target_value, err_code);
}

TEMPLATE_CHAN_RECEIVER
bool CLASS_CHAN_RECEIVER::try_recv(T* target_value, Error_code* err_code)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return try_recv(target_value, actual_err_code); },
         &ok, err_code, "chan::Receiver::try_recv()"))
  {
    return ok;
  }
  // else
  return recv_impl(false, target_value, err_code);
}

TEMPLATE_CHAN_RECEIVER
bool CLASS_CHAN_RECEIVER::recv_impl(bool blocking, T* target_value, Error_code* err_code)
{
  assert(target_value);

  if (null())
  {
    FLOW_LOG_WARNING("Receiver [" << *this << "]: Cannot receive: null.");
    *err_code = error::Code::S_RECV_DISCONNECTED;
    return false;
  }
  // else

  transport::Raw_sender_list delivered_snds;
  if (!detail::recv_raw(&m_raw, blocking, &m_blob, &delivered_snds, err_code))
  {
    return false; // It logged (or it's would-block which is not worth logging at this level).
  }
  // else

  /* The context owns the delivered senders from here on; they are closed when it goes away, at the end of this
   * scope, however decoding goes. */
  codec::Decode_context ctx(get_logger(), std::move(delivered_snds));

  T value;
  Error_code codec_err_code;
  if (!codec::decode(util::Blob_const(m_blob.const_data(), m_blob.size()), &ctx, &value, &codec_err_code))
  {
    *err_code = detail::to_recv_decode_error(get_logger(), codec_err_code);
    return false;
  }
  // else

  FLOW_LOG_TRACE("Receiver [" << *this << "]: Received [" << m_blob.size() << "]-byte message with "
                 "[" << ctx.size() << "] capabilities; decoded OK.");
  *target_value = std::move(value);
  err_code->clear();
  return true;
} // Receiver::recv_impl()

TEMPLATE_CHAN_RECEIVER
void CLASS_CHAN_RECEIVER::shutdown()
{
  FLOW_LOG_INFO("Receiver [" << *this << "]: Shutting down receive direction.");
  m_raw.shutdown();
}

TEMPLATE_CHAN_RECEIVER
bool CLASS_CHAN_RECEIVER::null() const
{
  return m_raw.null();
}

TEMPLATE_CHAN_RECEIVER
const transport::Raw_receiver& CLASS_CHAN_RECEIVER::raw() const
{
  return m_raw;
}

/// @cond
// -^- Doxygen, please ignore the following.  It gets confused by something here and gives warnings.

TEMPLATE_CHAN_RECEIVER
std::ostream& operator<<(std::ostream& os, const CLASS_CHAN_RECEIVER& val)
{
  return os << "[raw " << val.raw() << "]@" << static_cast<const void*>(&val);
}

// -v- Doxygen, please stop ignoring.
/// @endcond

#undef CLASS_CHAN_RECEIVER
#undef TEMPLATE_CHAN_RECEIVER

} // namespace capchan::chan
