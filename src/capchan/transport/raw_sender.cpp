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
#include "capchan/transport/raw_sender.hpp"
#include "capchan/transport/seqpacket_socket.hpp"
#include "capchan/transport/error.hpp"
#include <flow/error/error.hpp>

namespace capchan::transport
{

// Implementations.

Raw_sender::Raw_sender() :
  flow::log::Log_context(nullptr, Log_component::S_TRANSPORT)
{
  // That's it.
}

Raw_sender::Raw_sender(flow::log::Logger* logger_ptr, util::String_view nickname,
                       util::Native_handle&& native_peer_socket_moved) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname),
  m_peer_socket(std::move(native_peer_socket_moved))
{
  FLOW_LOG_TRACE("Raw_sender [" << *this << "]: Took ownership of descriptor.");
}

Raw_sender::Raw_sender(Raw_sender&& src) noexcept :
  flow::log::Log_context(std::move(src)),
  m_nickname(std::move(src.m_nickname)),
  m_peer_socket(std::move(src.m_peer_socket))
{
  // m_peer_socket move-ctor nullified src.m_peer_socket.
}

Raw_sender::~Raw_sender()
{
  if (!m_peer_socket.null())
  {
    FLOW_LOG_TRACE("Raw_sender [" << *this << "]: Closing descriptor.");
    util::close_native_handle(&m_peer_socket);
  }
}

Raw_sender& Raw_sender::operator=(Raw_sender&& src) noexcept
{
  if (&src != this)
  {
    util::close_native_handle(&m_peer_socket);
    flow::log::Log_context::operator=(std::move(src));
    m_nickname = std::move(src.m_nickname);
    m_peer_socket = std::move(src.m_peer_socket);
  }
  return *this;
}

bool Raw_sender::connect(flow::log::Logger* logger_ptr, const std::string& name, Raw_sender* target_snd,
                         Error_code* err_code)
{
  using seqpacket_socket::Peer_socket;
  using seqpacket_socket::endpoint_at_name;
  using flow::util::Task_engine;
  using flow::util::ostream_op_string;

  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return connect(logger_ptr, name, target_snd, actual_err_code); },
         &ok, err_code, "Raw_sender::connect()"))
  {
    return ok;
  }
  // else

  assert(target_snd);

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  const auto endpoint = endpoint_at_name(logger_ptr, name, err_code);
  if (*err_code)
  {
    return false; // It logged.
  }
  // else

  /* A transient Task_engine suffices: the connect is synchronous, and afterwards we release() the descriptor
   * out of boost.asio's hands entirely. */
  Task_engine task_engine;
  Peer_socket peer_socket(task_engine);
  peer_socket.connect(endpoint, *err_code);
  if (*err_code)
  {
    FLOW_LOG_INFO("Could not connect to one-shot listener at name [" << name << "]: "
                  "[" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else

  util::Native_handle native_peer_socket(peer_socket.release(*err_code));
  if (*err_code)
  {
    FLOW_LOG_WARNING("Connected to one-shot listener at name [" << name << "] but could not take the descriptor "
                     "from boost.asio: [" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else

  *target_snd = Raw_sender(logger_ptr, ostream_op_string("snd->", name), std::move(native_peer_socket));
  FLOW_LOG_INFO("Raw_sender [" << *target_snd << "]: Connected to one-shot listener at name [" << name << "].");
  return true;
} // Raw_sender::connect()

bool Raw_sender::clone(Raw_sender* target_snd, Error_code* err_code) const
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return clone(target_snd, actual_err_code); },
         &ok, err_code, "Raw_sender::clone()"))
  {
    return ok;
  }
  // else

  assert(target_snd);

  if (null())
  {
    FLOW_LOG_WARNING("Raw_sender [" << *this << "]: Cannot clone: null.");
    *err_code = error::Code::S_NULL_HANDLE;
    return false;
  }
  // else

  auto dup_hndl = util::duplicate_native_handle(get_logger(), m_peer_socket, err_code);
  if (*err_code)
  {
    return false; // It logged.
  }
  // else

  *target_snd = Raw_sender(get_logger(), m_nickname, std::move(dup_hndl));
  return true;
} // Raw_sender::clone()

bool Raw_sender::send(const util::Blob_const& blob, const Native_handle_list& hndls, Error_code* err_code)
{
  using seqpacket_socket::nb_write_with_native_handles;
  using seqpacket_socket::wait_writable;

  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return send(blob, hndls, actual_err_code); },
         &ok, err_code, "Raw_sender::send()"))
  {
    return ok;
  }
  // else

  if (null())
  {
    FLOW_LOG_WARNING("Raw_sender [" << *this << "]: Cannot send: null.");
    *err_code = error::Code::S_NULL_HANDLE;
    return false;
  }
  // else

  if (blob.size() > S_MAX_MESSAGE_SIZE)
  {
    FLOW_LOG_WARNING("Raw_sender [" << *this << "]: Cannot send [" << blob.size() << "]-byte message: "
                     "limit is [" << S_MAX_MESSAGE_SIZE << "] bytes.");
    *err_code = error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT;
    return false;
  }
  // else

  while (true)
  {
    nb_write_with_native_handles(get_logger(), m_peer_socket, hndls, blob, err_code);
    if (*err_code != boost::asio::error::would_block)
    {
      break; // Success or fatal error; either way it logged.
    }
    // else

    FLOW_LOG_TRACE("Raw_sender [" << *this << "]: Send buffer full; waiting for writability.");
    wait_writable(m_peer_socket, err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Raw_sender [" << *this << "]: Waiting for writability failed: "
                       "[" << *err_code << "] [" << err_code->message() << "].");
      break;
    }
  }

  return !*err_code;
} // Raw_sender::send()

util::Native_handle Raw_sender::native_handle() const
{
  return m_peer_socket;
}

bool Raw_sender::null() const
{
  return m_peer_socket.null();
}

const std::string& Raw_sender::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Raw_sender& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val) << '/' << val.native_handle();
}

} // namespace capchan::transport
