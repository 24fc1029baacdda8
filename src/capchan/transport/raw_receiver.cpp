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
#include "capchan/transport/raw_receiver.hpp"
#include "capchan/transport/raw_sender.hpp"
#include "capchan/transport/seqpacket_socket.hpp"
#include "capchan/transport/error.hpp"
#include <flow/error/error.hpp>
#include <sys/socket.h>

namespace capchan::transport
{

// Implementations.

Raw_receiver::Raw_receiver() :
  flow::log::Log_context(nullptr, Log_component::S_TRANSPORT),
  m_n_rcvd(0)
{
  // That's it.
}

Raw_receiver::Raw_receiver(flow::log::Logger* logger_ptr, util::String_view nickname,
                           util::Native_handle&& native_peer_socket_moved) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname),
  m_peer_socket(std::move(native_peer_socket_moved)),
  m_n_rcvd(0)
{
  FLOW_LOG_TRACE("Raw_receiver [" << *this << "]: Took ownership of descriptor.");
}

Raw_receiver::Raw_receiver(Raw_receiver&& src) noexcept :
  flow::log::Log_context(std::move(src)),
  m_nickname(std::move(src.m_nickname)),
  m_peer_socket(std::move(src.m_peer_socket)),
  m_n_rcvd(src.m_n_rcvd)
{
  src.m_n_rcvd = 0;
}

Raw_receiver::~Raw_receiver()
{
  if (!m_peer_socket.null())
  {
    FLOW_LOG_TRACE("Raw_receiver [" << *this << "]: Closing descriptor after [" << m_n_rcvd << "] messages "
                   "received.");
    util::close_native_handle(&m_peer_socket);
  }
}

Raw_receiver& Raw_receiver::operator=(Raw_receiver&& src) noexcept
{
  if (&src != this)
  {
    util::close_native_handle(&m_peer_socket);
    flow::log::Log_context::operator=(std::move(src));
    m_nickname = std::move(src.m_nickname);
    m_peer_socket = std::move(src.m_peer_socket);
    m_n_rcvd = src.m_n_rcvd;
    src.m_n_rcvd = 0;
  }
  return *this;
}

bool Raw_receiver::recv(util::Blob* target_blob, Raw_sender_list* target_snds, Error_code* err_code)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return recv(target_blob, target_snds, actual_err_code); },
         &ok, err_code, "Raw_receiver::recv()"))
  {
    return ok;
  }
  // else
  return recv_impl(true, target_blob, target_snds, err_code);
}

bool Raw_receiver::try_recv(util::Blob* target_blob, Raw_sender_list* target_snds, Error_code* err_code)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return try_recv(target_blob, target_snds, actual_err_code); },
         &ok, err_code, "Raw_receiver::try_recv()"))
  {
    return ok;
  }
  // else
  return recv_impl(false, target_blob, target_snds, err_code);
}

bool Raw_receiver::recv_impl(bool blocking, util::Blob* target_blob, Raw_sender_list* target_snds,
                             Error_code* err_code)
{
  using seqpacket_socket::nb_peek_message_size;
  using seqpacket_socket::nb_read_with_native_handles;
  using seqpacket_socket::wait_readable;
  using flow::util::ostream_op_string;

  assert(target_blob && target_snds && err_code);
  target_snds->clear();

  if (null())
  {
    FLOW_LOG_WARNING("Raw_receiver [" << *this << "]: Cannot receive: null.");
    *err_code = error::Code::S_NULL_HANDLE;
    return false;
  }
  // else

  /* Learn the size of the next message first, so the blob can be sized exactly; the message itself stays queued
   * until nb_read_with_native_handles().  We are the only reader, so it cannot vanish in-between. */
  size_t msg_sz;
  while (true)
  {
    msg_sz = nb_peek_message_size(get_logger(), m_peer_socket, err_code);
    if (*err_code != boost::asio::error::would_block)
    {
      break;
    }
    // else
    if (!blocking)
    {
      return false; // *err_code is would_block, as promised.
    }
    // else

    wait_readable(m_peer_socket, err_code);
    if (*err_code)
    {
      FLOW_LOG_WARNING("Raw_receiver [" << *this << "]: Waiting for readability failed: "
                       "[" << *err_code << "] [" << err_code->message() << "].");
      return false;
    }
  } // while (true)

  if (*err_code)
  {
    if (*err_code == boost::asio::error::eof)
    {
      FLOW_LOG_INFO("Raw_receiver [" << *this << "]: No more messages: all senders are gone (or receive "
                    "direction shut down).  [" << m_n_rcvd << "] messages were received.");
    }
    return false; // Other errors were logged.
  }
  // else

  Native_handle_list hndls;
  if (target_blob->capacity() < msg_sz)
  {
    target_blob->make_zero(); // Blob can only grow from the zero state.
  }
  target_blob->resize(msg_sz, 0);
  const size_t n_rcvd
    = nb_read_with_native_handles(get_logger(), m_peer_socket, &hndls,
                                  util::Blob_mutable(target_blob->data(), target_blob->size()), err_code);
  if (*err_code)
  {
    return false; // It logged; and it closed any handles.
  }
  // else
  assert(n_rcvd == msg_sz);

  ++m_n_rcvd;
  target_snds->reserve(hndls.size());
  for (auto& hndl : hndls)
  {
    target_snds->emplace_back(get_logger(), ostream_op_string(m_nickname, "/rcvd#", m_n_rcvd, '.',
                                                              target_snds->size()),
                              std::move(hndl));
  }

  FLOW_LOG_TRACE("Raw_receiver [" << *this << "]: Received message #[" << m_n_rcvd << "] of "
                 "[" << n_rcvd << "] bytes plus [" << target_snds->size() << "] senders.");
  return true;
} // Raw_receiver::recv_impl()

void Raw_receiver::shutdown()
{
  if (null())
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Raw_receiver [" << *this << "]: Shutting down receive direction.");
  if (::shutdown(m_peer_socket.m_native_handle, SHUT_RD) == -1)
  {
    const Error_code sys_err_code(errno, boost::system::system_category());
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  }
}

util::Native_handle Raw_receiver::native_handle() const
{
  return m_peer_socket;
}

bool Raw_receiver::null() const
{
  return m_peer_socket.null();
}

const std::string& Raw_receiver::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Raw_receiver& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val) << '/' << val.native_handle();
}

} // namespace capchan::transport
