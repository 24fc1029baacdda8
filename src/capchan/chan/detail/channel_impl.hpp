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
#include "capchan/codec/capability_context.hpp"
#include "capchan/transport/raw_receiver.hpp"

/**
 * Internal non-template helpers of the chan::Sender, chan::Receiver and chan::One_shot_server templates: the
 * parts that do not depend on the payload type, chiefly mapping lower-layer errors onto chan::error::Code.
 */
namespace capchan::chan::detail
{

// Free functions.

/**
 * Sends an encoded message (bytes plus the capabilities collected while encoding).
 *
 * @param raw_snd
 *        The sender.
 * @param bytes
 *        Encoded value.
 * @param ctx
 *        Context used to encode it.
 * @param err_code
 *        Not null.  Set to success or error::Code::S_SEND_PEER_GONE or error::Code::S_SEND_TRANSPORT_FAILED.
 * @return `true` on success.
 */
bool send_encoded(transport::Raw_sender* raw_snd, const std::string& bytes, const codec::Encode_context& ctx,
                  Error_code* err_code);

/**
 * Maps a failure to encode onto a chan::error::Code, logging the original.
 *
 * @param logger_ptr
 *        Logger.
 * @param codec_err_code
 *        Truthy error from codec::encode().
 * @return error::Code::S_SEND_ENCODE_FAILED.
 */
Error_code to_send_encode_error(flow::log::Logger* logger_ptr, const Error_code& codec_err_code);

/**
 * Receives one message (blocking or not) from the raw receiver.
 *
 * @param raw_rcv
 *        The receiver.
 * @param blocking
 *        Whether to wait until a message is available.
 * @param target_blob
 *        Receives the bytes.
 * @param target_snds
 *        Receives the delivered senders.
 * @param err_code
 *        Not null.  Set to success or error::Code::S_RECV_DISCONNECTED or error::Code::S_RECV_WOULD_BLOCK
 *        (if `!blocking`) or error::Code::S_RECV_DECODE_FAILED (if the message itself was not well-formed at
 *        the transport level).
 * @return `true` on success.
 */
bool recv_raw(transport::Raw_receiver* raw_rcv, bool blocking, util::Blob* target_blob,
              transport::Raw_sender_list* target_snds, Error_code* err_code);

/**
 * Maps a failure to decode onto a chan::error::Code, logging the original.
 *
 * @param logger_ptr
 *        Logger.
 * @param codec_err_code
 *        Truthy error from codec::decode().
 * @return error::Code::S_RECV_HANDLE_INDEX_OUT_OF_RANGE or error::Code::S_RECV_DECODE_FAILED.
 */
Error_code to_recv_decode_error(flow::log::Logger* logger_ptr, const Error_code& codec_err_code);

} // namespace capchan::chan::detail
