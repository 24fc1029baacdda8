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
#include "capchan/transport/seqpacket_socket.hpp"
#include "capchan/transport/error.hpp"
#include <flow/common.hpp>
#include <flow/error/error.hpp>
#include <sys/types.h>
#include <sys/socket.h>
#include <poll.h>
#include <cstring>

namespace capchan::transport::seqpacket_socket
{

namespace
{

// Local types.

/**
 * Control-message buffer large enough for the maximum number of descriptors in one `SCM_RIGHTS` message.
 * The union with `cmsghdr` forces the alignment the `CMSG_*()` macros expect (trick from Linux `man cmsg`).
 */
union Msg_control_buf
{
  /// The ancillary-data area.
  uint8_t m_buf[CMSG_SPACE(sizeof(util::Native_handle::handle_t) * S_MAX_HANDLES_PER_MESSAGE)];
  /// Not used except for alignment.
  cmsghdr m_align;
};

// Local functions.

/**
 * Closes each handle in the list; then clears the list.
 *
 * @param hndls
 *        Handles to close.
 */
void close_all(Native_handle_list* hndls)
{
  for (auto& hndl : *hndls)
  {
    util::close_native_handle(&hndl);
  }
  hndls->clear();
}

/**
 * `poll()`s the one descriptor for the given event until it is signaled; retries on `EINTR`.
 *
 * @param hndl
 *        Descriptor.
 * @param events
 *        `POLLIN` or `POLLOUT`.
 * @return Success or system error.
 */
Error_code wait_for(util::Native_handle hndl, short events)
{
  using boost::system::system_category;
  using ::poll;
  using ::pollfd;

  pollfd poll_fd;
  poll_fd.fd = hndl.m_native_handle;
  poll_fd.events = events;
  poll_fd.revents = 0;

  while (true)
  {
    // -1 => no timeout.  POLLHUP/POLLERR are reported regardless of `events`, which wakes us as desired.
    if (poll(&poll_fd, 1, -1) != -1)
    {
      return Error_code();
    }
    // else
    if (errno != EINTR)
    {
      return Error_code(errno, system_category());
    }
    // else { Signal interrupted the wait; wait again. }
  }
} // wait_for()

} // namespace (anon)

// Protocol implementations.

int Protocol::type() const
{
  return SOCK_SEQPACKET;
}

int Protocol::protocol() const
{
  return 0;
}

int Protocol::family() const
{
  return AF_UNIX;
}

// Free function implementations.

Endpoint endpoint_at_name(flow::log::Logger* logger_ptr, const std::string& name, Error_code* err_code)
{
  using boost::system::system_error;
  using std::string;

  Endpoint endpoint;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Endpoint
           { return endpoint_at_name(logger_ptr, name, actual_err_code); },
         &endpoint, err_code, "seqpacket_socket::endpoint_at_name()"))
  {
    return endpoint;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  /* Linux abstract namespace: sun_path[0] is NUL; the rest (up to the address length) is the name.  The
   * `string`-taking endpoint::path() overload carries the embedded NUL and sets the length accordingly, whereas
   * the `const char*` one would stop at it. */
  string abstract_namespace_name(size_t(1), '\0');
  abstract_namespace_name += name;
  FLOW_LOG_TRACE("Abstract-namespace name consists of 1 NUL + [" << name << "]; "
                 "total of [" << abstract_namespace_name.size() << "] bytes.");

  auto& sys_err_code = *err_code;
  try
  {
    // Throws on error; in practice only on too-long name.
    endpoint.path(abstract_namespace_name);
    sys_err_code.clear();
  }
  catch (const system_error& exc)
  {
    FLOW_LOG_WARNING("Unable to set up native local endpoint structure for name [" << name << "]; "
                     "could be due to name length; details logged below.");
    sys_err_code = exc.code();
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    endpoint = Endpoint();
  }

  return endpoint;
} // endpoint_at_name()

size_t nb_write_with_native_handles(flow::log::Logger* logger_ptr, util::Native_handle peer_socket,
                                    const Native_handle_list& payload_hndls, const util::Blob_const& payload_blob,
                                    Error_code* err_code)
{
  using boost::system::system_category;
  namespace sys_err_codes = boost::system::errc;
  using ::sendmsg;
  using ::msghdr;
  using ::iovec;
  using ::cmsghdr;
  using ::MSG_DONTWAIT;
  using ::MSG_NOSIGNAL;

  size_t n_sent;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> size_t
           { return nb_write_with_native_handles(logger_ptr, peer_socket, payload_hndls, payload_blob,
                                                 actual_err_code); },
         &n_sent, err_code, "seqpacket_socket::nb_write_with_native_handles()"))
  {
    return n_sent;
  }
  // else

  assert((!peer_socket.null()) && "Disallowed per contract.");
  assert((payload_blob.size() != 0) && "Disallowed per contract.");

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);
  FLOW_LOG_TRACE("Connected local seqpacket socket [" << peer_socket << "] wants to write [" << payload_blob.size()
                 << "] bytes plus [" << payload_hndls.size() << "] native handles.  Will try to send.");

  if (payload_hndls.size() > S_MAX_HANDLES_PER_MESSAGE)
  {
    FLOW_LOG_WARNING("Connected local seqpacket socket [" << peer_socket << "] was asked to send "
                     "[" << payload_hndls.size() << "] native handles in one message; but the limit is "
                     "[" << S_MAX_HANDLES_PER_MESSAGE << "].  Nothing sent.");
    *err_code = error::Code::S_TOO_MANY_HANDLES;
    return 0;
  }
  // else

  iovec iov = { const_cast<void*>(payload_blob.data()), payload_blob.size() };
  msghdr sendmsg_hdr;
  std::memset(&sendmsg_hdr, 0, sizeof(sendmsg_hdr));
  sendmsg_hdr.msg_iov = &iov;
  sendmsg_hdr.msg_iovlen = 1;

  Msg_control_buf msg_control_as_union;
  if (!payload_hndls.empty())
  {
    const size_t hndls_sz = sizeof(util::Native_handle::handle_t) * payload_hndls.size();
    std::memset(msg_control_as_union.m_buf, 0, sizeof(msg_control_as_union.m_buf));
    sendmsg_hdr.msg_control = msg_control_as_union.m_buf;
    sendmsg_hdr.msg_controllen = CMSG_SPACE(hndls_sz);

    cmsghdr* const sendmsg_hdr_cmsg_ptr = CMSG_FIRSTHDR(&sendmsg_hdr);
    sendmsg_hdr_cmsg_ptr->cmsg_level = SOL_SOCKET;
    sendmsg_hdr_cmsg_ptr->cmsg_type = SCM_RIGHTS;
    sendmsg_hdr_cmsg_ptr->cmsg_len = CMSG_LEN(hndls_sz);

    auto fd_ptr = reinterpret_cast<util::Native_handle::handle_t*>(CMSG_DATA(sendmsg_hdr_cmsg_ptr));
    for (const auto& hndl : payload_hndls)
    {
      assert((!hndl.null()) && "Disallowed per contract.");
      *(fd_ptr++) = hndl.m_native_handle;
    }
  }
  // else { No ancillary data at all; msg_control[len] stay 0. }

  const auto n_sent_or_error
    = sendmsg(peer_socket.m_native_handle, &sendmsg_hdr,
              MSG_DONTWAIT | MSG_NOSIGNAL); // No SIGPIPE on closed peer; EPIPE instead.

  if (n_sent_or_error == -1)
  {
    // With SOCK_SEQPACKET nothing at all was sent: neither blob nor handles.
    const Error_code sys_err_code(errno, system_category());
    if ((sys_err_code == sys_err_codes::operation_would_block) ||
        (sys_err_code == sys_err_codes::resource_unavailable_try_again))
    {
      FLOW_LOG_TRACE("Write attempt indicated would-block; not an error condition.  Nothing sent.");
      *err_code = boost::asio::error::would_block;
      return 0;
    }
    // else

    if ((sys_err_code == sys_err_codes::broken_pipe) || (sys_err_code == sys_err_codes::connection_reset))
    {
      // Peer is gone; routine enough to not be a WARNING.
      FLOW_LOG_INFO("Connected local seqpacket socket [" << peer_socket << "] tried to write; but the "
                    "receiving side is closed [" << sys_err_code << "] [" << sys_err_code.message() << "].  "
                    "Nothing sent.");
      *err_code = sys_err_code;
      return 0;
    }
    // else

    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("Connected local seqpacket socket [" << peer_socket << "] tried to write "
                     "[" << payload_blob.size() << "] bytes plus [" << payload_hndls.size() << "] native handles; "
                     "but an unrecoverable error occurred.  Nothing sent.");
    *err_code = sys_err_code;
    return 0;
  } // if (n_sent_or_error == -1)
  // else

  // Sequenced-packet semantics: all or nothing.
  assert(size_t(n_sent_or_error) == payload_blob.size());

  FLOW_LOG_TRACE("sendmsg() reports the [" << payload_hndls.size() << "] native handles and the "
                 "[" << n_sent_or_error << "]-byte blob were successfully sent.");
  err_code->clear();
  return n_sent_or_error;
} // nb_write_with_native_handles()

size_t nb_peek_message_size(flow::log::Logger* logger_ptr, util::Native_handle peer_socket, Error_code* err_code)
{
  using boost::system::system_category;
  namespace sys_err_codes = boost::system::errc;
  using ::recv;

  size_t n_peeked;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> size_t
           { return nb_peek_message_size(logger_ptr, peer_socket, actual_err_code); },
         &n_peeked, err_code, "seqpacket_socket::nb_peek_message_size()"))
  {
    return n_peeked;
  }
  // else

  assert((!peer_socket.null()) && "Disallowed per contract.");

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);

  /* MSG_TRUNC with a 1-byte buffer: Linux returns the real length of the packet, not the 1 copied byte.  MSG_PEEK:
   * leave it (and its ancillary data, which we do not request here) in the queue. */
  uint8_t dummy;
  const auto n_or_error = recv(peer_socket.m_native_handle, &dummy, sizeof(dummy),
                               MSG_PEEK | MSG_TRUNC | MSG_DONTWAIT);

  if (n_or_error == -1)
  {
    const Error_code sys_err_code(errno, system_category());
    if ((sys_err_code == sys_err_codes::operation_would_block) ||
        (sys_err_code == sys_err_codes::resource_unavailable_try_again))
    {
      *err_code = boost::asio::error::would_block;
      return 0;
    }
    // else

    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("Connected local seqpacket socket [" << peer_socket << "] tried to peek at the next message; "
                     "but an unrecoverable error occurred.");
    *err_code = sys_err_code;
    return 0;
  }
  // else

  if (n_or_error == 0)
  {
    // Our senders never send empty packets; so this is an orderly close (or local receive shutdown).
    FLOW_LOG_TRACE("Connected local seqpacket socket [" << peer_socket << "] peek returned EOF, meaning orderly "
                   "connection shutdown.");
    *err_code = boost::asio::error::eof;
    return 0;
  }
  // else

  err_code->clear();
  return n_or_error;
} // nb_peek_message_size()

size_t nb_read_with_native_handles(flow::log::Logger* logger_ptr, util::Native_handle peer_socket,
                                   Native_handle_list* target_payload_hndls,
                                   const util::Blob_mutable& target_payload_blob,
                                   Error_code* err_code)
{
  using boost::system::system_category;
  namespace sys_err_codes = boost::system::errc;
  using ::recvmsg;
  using ::msghdr;
  using ::iovec;
  using ::cmsghdr;
  using ::MSG_DONTWAIT;
  using ::MSG_CMSG_CLOEXEC;

  size_t n_rcvd;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> size_t
           { return nb_read_with_native_handles(logger_ptr, peer_socket, target_payload_hndls, target_payload_blob,
                                                actual_err_code); },
         &n_rcvd, err_code, "seqpacket_socket::nb_read_with_native_handles()"))
  {
    return n_rcvd;
  }
  // else

  assert(target_payload_hndls);
  assert((!peer_socket.null()) && "Disallowed per contract.");
  auto& target_hndls = *target_payload_hndls;
  target_hndls.clear();

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSPORT);
  FLOW_LOG_TRACE("Connected local seqpacket socket [" << peer_socket << "] wants to read up to "
                 "[" << target_payload_blob.size() << "] bytes plus any native handles.  Will try to receive.");

  iovec iov = { target_payload_blob.data(), target_payload_blob.size() };
  msghdr recvmsg_hdr;
  std::memset(&recvmsg_hdr, 0, sizeof(recvmsg_hdr));
  recvmsg_hdr.msg_iov = &iov;
  recvmsg_hdr.msg_iovlen = 1;

  Msg_control_buf msg_control_as_union;
  std::memset(msg_control_as_union.m_buf, 0, sizeof(msg_control_as_union.m_buf));
  recvmsg_hdr.msg_control = msg_control_as_union.m_buf;
  recvmsg_hdr.msg_controllen = sizeof(msg_control_as_union.m_buf);

  const auto n_rcvd_or_error
    = recvmsg(peer_socket.m_native_handle, &recvmsg_hdr,
              MSG_DONTWAIT | MSG_CMSG_CLOEXEC); // Received descriptors are not inherited across exec().

  if (n_rcvd_or_error == -1)
  {
    const Error_code sys_err_code(errno, system_category());
    if ((sys_err_code == sys_err_codes::operation_would_block) ||
        (sys_err_code == sys_err_codes::resource_unavailable_try_again))
    {
      FLOW_LOG_TRACE("Read attempt indicated would-block; not an error condition.  Nothing received.");
      *err_code = boost::asio::error::would_block;
      return 0;
    }
    // else

    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("Connected local seqpacket socket [" << peer_socket << "] tried to read; "
                     "but an unrecoverable error occurred.  Nothing received.");
    *err_code = sys_err_code;
    return 0;
  } // if (n_rcvd_or_error == -1)
  // else

  /* Harvest the handles first (even if we end up failing below): any that arrived are now ours, and we must not
   * leak them. */
  bool unexpected_control_data = false;
  for (cmsghdr* cmsg_ptr = CMSG_FIRSTHDR(&recvmsg_hdr);
       cmsg_ptr;
       cmsg_ptr = CMSG_NXTHDR(&recvmsg_hdr, cmsg_ptr))
  {
    if ((cmsg_ptr->cmsg_level == SOL_SOCKET) && (cmsg_ptr->cmsg_type == SCM_RIGHTS))
    {
      const size_t n_fds = (cmsg_ptr->cmsg_len - CMSG_LEN(0)) / sizeof(util::Native_handle::handle_t);
      const auto fd_ptr = reinterpret_cast<const util::Native_handle::handle_t*>(CMSG_DATA(cmsg_ptr));
      for (size_t idx = 0; idx != n_fds; ++idx)
      {
        target_hndls.emplace_back(fd_ptr[idx]);
      }
    }
    else
    {
      FLOW_LOG_WARNING("Connected local seqpacket socket [" << peer_socket << "] received unexpected ancillary "
                       "data of cmsg_level|cmsg_type [" << cmsg_ptr->cmsg_level << '|' << cmsg_ptr->cmsg_type << "].");
      unexpected_control_data = true;
    }
  }

  if (n_rcvd_or_error == 0)
  {
    // Our senders never send empty packets; so this is an orderly close.  (Handles with EOF?  Impossible; but...)
    close_all(&target_hndls);
    FLOW_LOG_TRACE("Connected local seqpacket socket [" << peer_socket << "] read returned EOF, meaning orderly "
                   "connection shutdown.  Nothing received.");
    *err_code = boost::asio::error::eof;
    return 0;
  }
  // else

  if (unexpected_control_data || ((recvmsg_hdr.msg_flags & MSG_CTRUNC) != 0))
  {
    FLOW_LOG_WARNING("Connected local seqpacket socket [" << peer_socket << "] read [" << n_rcvd_or_error << "] "
                     "bytes but the ancillary data were truncated or unexpected (out-flags "
                     "[0x" << std::hex << recvmsg_hdr.msg_flags << std::dec << "]).  Closing the "
                     "[" << target_hndls.size() << "] native handles that did arrive; acting as if nothing "
                     "received + error.");
    close_all(&target_hndls);
    *err_code = error::Code::S_LOW_LVL_UNEXPECTED_CONTROL_DATA;
    return 0;
  }
  // else

  if ((recvmsg_hdr.msg_flags & MSG_TRUNC) != 0)
  {
    FLOW_LOG_WARNING("Connected local seqpacket socket [" << peer_socket << "] read a message that did not fit "
                     "into the [" << target_payload_blob.size() << "]-byte buffer; the rest was discarded.  "
                     "Closing the [" << target_hndls.size() << "] native handles that arrived with it; "
                     "acting as if nothing received + error.");
    close_all(&target_hndls);
    *err_code = error::Code::S_LOW_LVL_MESSAGE_TRUNCATED;
    return 0;
  }
  // else

  FLOW_LOG_TRACE("recvmsg() reports receipt of [" << target_hndls.size() << "] native handles and a "
                 "[" << n_rcvd_or_error << "]-byte blob.");
  err_code->clear();
  return n_rcvd_or_error;
} // nb_read_with_native_handles()

void wait_readable(util::Native_handle peer_socket, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { wait_readable(peer_socket, actual_err_code); },
         err_code, "seqpacket_socket::wait_readable()"))
  {
    return;
  }
  // else

  *err_code = wait_for(peer_socket, POLLIN);
}

void wait_writable(util::Native_handle peer_socket, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { wait_writable(peer_socket, actual_err_code); },
         err_code, "seqpacket_socket::wait_writable()"))
  {
    return;
  }
  // else

  *err_code = wait_for(peer_socket, POLLOUT);
}

} // namespace capchan::transport::seqpacket_socket
