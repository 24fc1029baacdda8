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
#include "capchan/chan/detail/channel_impl.hpp"
#include "capchan/chan/error.hpp"
#include "capchan/codec/error.hpp"
#include "capchan/transport/raw_sender.hpp"
#include "capchan/transport/error.hpp"
#include <boost/asio/error.hpp>

namespace capchan::chan::detail
{

// Free function implementations.

bool send_encoded(transport::Raw_sender* raw_snd, const std::string& bytes, const codec::Encode_context& ctx,
                  Error_code* err_code)
{
  namespace sys_err_codes = boost::system::errc;

  assert(raw_snd && err_code);

  Error_code raw_err_code;
  if (raw_snd->send(util::Blob_const(bytes.data(), bytes.size()), ctx.capabilities(), &raw_err_code))
  {
    err_code->clear();
    return true;
  }
  // else

  FLOW_LOG_SET_CONTEXT(raw_snd->get_logger(), Log_component::S_CHAN);
  if ((raw_err_code == sys_err_codes::broken_pipe) || (raw_err_code == sys_err_codes::connection_reset)
      || (raw_err_code == sys_err_codes::not_connected))
  {
    FLOW_LOG_TRACE("Sender [" << *raw_snd << "]: Receiver is gone.");
    *err_code = error::Code::S_SEND_PEER_GONE;
  }
  else
  {
    FLOW_LOG_WARNING("Sender [" << *raw_snd << "]: Transport could not send [" << bytes.size() << "]-byte message "
                     "with [" << ctx.size() << "] capabilities: "
                     "[" << raw_err_code << "] [" << raw_err_code.message() << "].");
    *err_code = error::Code::S_SEND_TRANSPORT_FAILED;
  }
  return false;
} // send_encoded()

Error_code to_send_encode_error(flow::log::Logger* logger_ptr, const Error_code& codec_err_code)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CHAN);
  FLOW_LOG_WARNING("Value could not be encoded for sending: "
                   "[" << codec_err_code << "] [" << codec_err_code.message() << "].");
  return error::Code::S_SEND_ENCODE_FAILED;
}

bool recv_raw(transport::Raw_receiver* raw_rcv, bool blocking, util::Blob* target_blob,
              transport::Raw_sender_list* target_snds, Error_code* err_code)
{
  assert(raw_rcv && err_code);

  Error_code raw_err_code;
  if (blocking ? raw_rcv->recv(target_blob, target_snds, &raw_err_code)
               : raw_rcv->try_recv(target_blob, target_snds, &raw_err_code))
  {
    err_code->clear();
    return true;
  }
  // else

  FLOW_LOG_SET_CONTEXT(raw_rcv->get_logger(), Log_component::S_CHAN);
  if (raw_err_code == boost::asio::error::would_block)
  {
    *err_code = error::Code::S_RECV_WOULD_BLOCK;
  }
  else if (raw_err_code == boost::asio::error::eof)
  {
    FLOW_LOG_TRACE("Receiver [" << *raw_rcv << "]: Disconnected.");
    *err_code = error::Code::S_RECV_DISCONNECTED;
  }
  else if ((raw_err_code == transport::error::Code::S_LOW_LVL_UNEXPECTED_CONTROL_DATA)
           || (raw_err_code == transport::error::Code::S_LOW_LVL_MESSAGE_TRUNCATED))
  {
    FLOW_LOG_WARNING("Receiver [" << *raw_rcv << "]: Received a malformed message: "
                     "[" << raw_err_code << "] [" << raw_err_code.message() << "].");
    *err_code = error::Code::S_RECV_DECODE_FAILED;
  }
  else
  {
    // Null receiver, connection reset, etc.: either way nothing more can arrive.
    FLOW_LOG_WARNING("Receiver [" << *raw_rcv << "]: Transport failed to receive; treating as disconnected: "
                     "[" << raw_err_code << "] [" << raw_err_code.message() << "].");
    *err_code = error::Code::S_RECV_DISCONNECTED;
  }
  return false;
} // recv_raw()

Error_code to_recv_decode_error(flow::log::Logger* logger_ptr, const Error_code& codec_err_code)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_CHAN);
  FLOW_LOG_WARNING("Received message could not be decoded: "
                   "[" << codec_err_code << "] [" << codec_err_code.message() << "].");
  return (codec_err_code == codec::error::Code::S_CAPABILITY_INDEX_OUT_OF_RANGE)
           ? error::Code::S_RECV_HANDLE_INDEX_OUT_OF_RANGE
           : error::Code::S_RECV_DECODE_FAILED;
}

} // namespace capchan::chan::detail
