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
#include "capchan/transport/raw_transport.hpp"
#include "capchan/transport/seqpacket_socket.hpp"
#include <flow/error/error.hpp>

namespace capchan::transport
{

// Free function implementations.

bool create_raw_pair(flow::log::Logger* logger_ptr, util::String_view nickname,
                     Raw_sender* target_snd, Raw_receiver* target_rcv, Error_code* err_code)
{
  using seqpacket_socket::Peer_socket;
  using flow::util::Task_engine;
  using flow::util::ostream_op_string;
  using boost::asio::local::connect_pair;

  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return create_raw_pair(logger_ptr, nickname, target_snd, target_rcv, actual_err_code); },
         &ok, err_code, "transport::create_raw_pair()"))
  {
    return ok;
  }
  // else

  assert(target_snd && target_rcv);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  // As in Raw_sender::connect(): boost.asio is used only to create the descriptors, which are then release()d.
  Task_engine task_engine;
  Peer_socket snd_socket(task_engine);
  Peer_socket rcv_socket(task_engine);
  connect_pair(snd_socket, rcv_socket, *err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Could not create raw channel pair [" << nickname << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else

  util::Native_handle snd_hndl(snd_socket.release(*err_code));
  if (!*err_code)
  {
    util::Native_handle rcv_hndl(rcv_socket.release(*err_code));
    if (!*err_code)
    {
      *target_snd = Raw_sender(logger_ptr, ostream_op_string(nickname, "/snd"), std::move(snd_hndl));
      *target_rcv = Raw_receiver(logger_ptr, ostream_op_string(nickname, "/rcv"), std::move(rcv_hndl));
      FLOW_LOG_TRACE("Created raw channel pair: [" << *target_snd << "] => [" << *target_rcv << "].");
      return true;
    }
    // else
    util::close_native_handle(&snd_hndl);
  }

  FLOW_LOG_WARNING("Could not take raw channel pair [" << nickname << "] descriptors from boost.asio: "
                   "[" << *err_code << "] [" << err_code->message() << "].");
  return false;
} // create_raw_pair()

} // namespace capchan::transport
