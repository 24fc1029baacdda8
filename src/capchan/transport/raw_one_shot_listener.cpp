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
#include "capchan/transport/raw_one_shot_listener.hpp"
#include "capchan/transport/raw_receiver.hpp"
#include "capchan/transport/raw_sender.hpp"
#include "capchan/transport/error.hpp"
#include <flow/error/error.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace capchan::transport
{

// Static initializations.

const std::string Raw_one_shot_listener::S_NAME_PREFIX = "capchan_oneshot_";

// Implementations.

Raw_one_shot_listener::Raw_one_shot_listener(flow::log::Logger* logger_ptr, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_name(S_NAME_PREFIX + boost::uuids::to_string(boost::uuids::random_generator()()))
{
  using seqpacket_socket::Acceptor;
  using seqpacket_socket::Protocol;
  using seqpacket_socket::endpoint_at_name;
  using flow::error::Runtime_error;

  Error_code sys_err_code;

  const auto local_endpoint = endpoint_at_name(get_logger(), m_name, &sys_err_code);
  if (!sys_err_code)
  {
    /* Unlike the convenience constructor (which listens with the maximum backlog), open/bind/listen one step at a
     * time: only one connection is ever accepted, so a backlog of 1 is all that is wanted. */
    m_acceptor.reset(new Acceptor(m_task_engine));
    m_acceptor->open(Protocol(), sys_err_code);
    if (!sys_err_code)
    {
      m_acceptor->bind(local_endpoint, sys_err_code);
    }
    if (!sys_err_code)
    {
      m_acceptor->listen(1, sys_err_code);
    }
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("One-shot listener [" << *this << "]: Unable to open/bind/listen native local seqpacket "
                       "socket; details logged below.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      m_acceptor.reset();
    }
  }
  // else { It logged. }

  if (sys_err_code)
  {
    if (err_code)
    {
      *err_code = sys_err_code;
      return;
    }
    // else
    throw Runtime_error(sys_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  FLOW_LOG_INFO("One-shot listener [" << *this << "]: Listening for the one incoming connection.");
} // Raw_one_shot_listener::Raw_one_shot_listener()

Raw_one_shot_listener::~Raw_one_shot_listener()
{
  if (m_acceptor)
  {
    FLOW_LOG_INFO("One-shot listener [" << *this << "]: Destroyed without accepting; no longer listening.");
  }
  // m_acceptor destructor closes the socket.
}

bool Raw_one_shot_listener::accept(Raw_receiver* target_rcv, util::Blob* target_blob, Raw_sender_list* target_snds,
                                   Error_code* err_code)
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return accept(target_rcv, target_blob, target_snds, actual_err_code); },
         &ok, err_code, "Raw_one_shot_listener::accept()"))
  {
    return ok;
  }
  // else

  assert(target_rcv);

  Raw_receiver rcv;
  if (!accept_connection(&rcv, err_code))
  {
    return false; // It logged.
  }
  // else

  FLOW_LOG_INFO("One-shot listener [" << *this << "]: Awaiting the first message on [" << rcv << "].");
  if (!rcv.recv(target_blob, target_snds, err_code))
  {
    FLOW_LOG_WARNING("One-shot listener [" << *this << "]: Accepted connection but did not receive the first "
                     "message: [" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else

  *target_rcv = std::move(rcv);
  return true;
} // Raw_one_shot_listener::accept()

bool Raw_one_shot_listener::accept_connection(Raw_receiver* target_rcv, Error_code* err_code)
{
  using seqpacket_socket::Peer_socket;
  using flow::util::ostream_op_string;

  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool { return accept_connection(target_rcv, actual_err_code); },
         &ok, err_code, "Raw_one_shot_listener::accept_connection()"))
  {
    return ok;
  }
  // else

  assert(target_rcv);

  if (!m_acceptor)
  {
    FLOW_LOG_WARNING("One-shot listener [" << *this << "]: Asked to accept, but not listening.");
    *err_code = error::Code::S_LISTENER_ALREADY_ACCEPTED;
    return false;
  }
  // else

  FLOW_LOG_INFO("One-shot listener [" << *this << "]: Awaiting the one incoming connection.");

  Peer_socket peer_socket(m_task_engine);
  m_acceptor->accept(peer_socket, *err_code);

  // Whatever happened, we are done listening.
  m_acceptor.reset();

  if (*err_code)
  {
    FLOW_LOG_WARNING("One-shot listener [" << *this << "]: accept() failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else

  util::Native_handle native_peer_socket(peer_socket.release(*err_code));
  if (*err_code)
  {
    FLOW_LOG_WARNING("One-shot listener [" << *this << "]: Accepted connection but could not take the descriptor "
                     "from boost.asio: [" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else

  *target_rcv = Raw_receiver(get_logger(), ostream_op_string("rcv<-", m_name), std::move(native_peer_socket));
  FLOW_LOG_INFO("One-shot listener [" << *this << "]: Accepted connection [" << *target_rcv << "]; "
                "no longer listening.");
  return true;
} // Raw_one_shot_listener::accept_connection()

const std::string& Raw_one_shot_listener::name() const
{
  return m_name;
}

std::ostream& operator<<(std::ostream& os, const Raw_one_shot_listener& val)
{
  return os << '[' << val.name() << "]@" << static_cast<const void*>(&val);
}

} // namespace capchan::transport
