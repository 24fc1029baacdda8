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

#include "capchan/chan/sender.hpp"
#include "capchan/chan/receiver.hpp"
#include "capchan/transport/raw_transport.hpp"

namespace capchan::chan
{

// Free functions.

/**
 * Creates a new channel: a connected Sender/Receiver pair for payload type `T`.  Typically one keeps the Receiver
 * and hands the Sender (or copies of it) to other processes by sending it over an existing channel.
 *
 * @tparam T
 *         The payload type.
 * @param logger_ptr
 *        Logger to use for subsequently logging (by the new objects too).
 * @param target_snd
 *        On success move-assigned the sender.  Otherwise untouched.
 * @param target_rcv
 *        On success move-assigned the receiver.  Otherwise untouched.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_CONNECTION_FAILED (the underlying system error is logged).
 * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
 */
template<typename T>
bool channel(flow::log::Logger* logger_ptr, Sender<T>* target_snd, Receiver<T>* target_rcv, Error_code* err_code = 0);

// Template implementations.

template<typename T>
bool channel(flow::log::Logger* logger_ptr, Sender<T>* target_snd, Receiver<T>* target_rcv, Error_code* err_code)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return channel(logger_ptr, target_snd, target_rcv, actual_err_code); },
         &ok, err_code, "chan::channel()"))
  {
    return ok;
  }
  // else

  assert(target_snd && target_rcv);

  transport::Raw_sender raw_snd;
  transport::Raw_receiver raw_rcv;
  Error_code raw_err_code;
  if (!transport::create_raw_pair(logger_ptr, "chan", &raw_snd, &raw_rcv, &raw_err_code))
  {
    // It logged the system error.
    *err_code = error::Code::S_CONNECTION_FAILED;
    return false;
  }
  // else

  *target_snd = Sender<T>(std::move(raw_snd));
  *target_rcv = Receiver<T>(std::move(raw_rcv));
  err_code->clear();
  return true;
} // channel()

} // namespace capchan::chan
