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

#include "capchan/codec/codec_fwd.hpp"
#include "capchan/transport/raw_sender.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>

namespace capchan::codec
{

// Types.

/**
 * The capabilities of one message being encoded: an ordered list of native handles (borrowed from the senders
 * being encoded), each one's position being its capability index.  One is created, empty, for each message;
 * it is passed by pointer to every Codec::encode() involved in that message, nested ones included, so the
 * indices form one sequence in the order capabilities are encountered.  Never shared between messages.
 *
 * The handles are not owned: the senders they came from must outlive the send of the message.
 */
class Encode_context :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Creates an empty context.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging (by the codecs too).
   */
  explicit Encode_context(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Appends a capability.
   *
   * @param hndl
   *        Its handle (not null()).
   * @return Its capability index: the number of capabilities added before it.
   */
  size_t add_capability(util::Native_handle hndl);

  /**
   * The handles added so far, in index order.
   * @return See above.
   */
  const transport::Native_handle_list& capabilities() const;

  /**
   * Number of capabilities added so far.
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// See capabilities().
  transport::Native_handle_list m_hndls;
}; // class Encode_context

/**
 * The capabilities delivered with one received message, owned by the context until it is destroyed (which
 * closes them).  Decoding a capability index clones (duplicates) the sender at that position, so the result is
 * independent of the context.  A capability index without a corresponding delivered sender is an error
 * (error::Code::S_CAPABILITY_INDEX_OUT_OF_RANGE), as a message is only as trustworthy as its sender.
 */
class Decode_context :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Takes ownership of the delivered senders.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging (by the codecs too).
   * @param delivered_snds
   *        The senders delivered with the message, in order.  Becomes empty.
   */
  explicit Decode_context(flow::log::Logger* logger_ptr, transport::Raw_sender_list&& delivered_snds);

  /// Closes the delivered senders (not any clones made by clone_sender_at()).
  ~Decode_context();

  // Methods.

  /**
   * Resolves a capability index into a new sender, a clone of the delivered one at that position.
   *
   * @param idx
   *        Capability index as decoded from the message.
   * @param target_snd
   *        On success move-assigned the clone.  Otherwise untouched.
   * @param err_code
   *        Must not be null.  Set to success or: error::Code::S_CAPABILITY_INDEX_OUT_OF_RANGE; error from
   *        transport::Raw_sender::clone().
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  bool clone_sender_at(size_t idx, transport::Raw_sender* target_snd, Error_code* err_code);

  /**
   * Number of delivered senders.
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// The delivered senders, in order.
  transport::Raw_sender_list m_snds;

  /// How many times clone_sender_at() succeeded; for logging.
  size_t m_n_resolved;
}; // class Decode_context

} // namespace capchan::codec
