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

#include "capchan/chan/receiver.hpp"
#include "capchan/chan/sender.hpp"
#include "capchan/transport/raw_one_shot_listener.hpp"
#include <boost/move/make_unique.hpp>
#include <boost/move/unique_ptr.hpp>

namespace capchan::chan
{

// Types.

/**
 * Ephemeral bootstrap endpoint: publishes a name at which exactly one client -- typically another process, told
 * the name via command line or environment -- can connect using Sender<T>::connect().  accept() then yields the
 * Receiver for that connection together with the first value the client sent.  Usually the first value contains
 * Senders through which the two processes set up whatever channels they need from then on.
 *
 * ### Life cycle ###
 * Created (listening at name()) -> accepted (not listening; terminal).  accept() consumes the server: it must be
 * invoked on an rvalue, e.g. `std::move(server).accept(...)`.  Once accept() returns (successfully or not), a
 * Sender<T>::connect() to the same name fails.  A moved-from or already-accepted server refuses accept() with
 * error::Code::S_ACCEPT_FAILED.
 *
 * @tparam T
 *         The payload type of the resulting Receiver.
 */
template<typename T>
class One_shot_server :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Starts listening at a fresh name.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param name
   *        On success set to the name; give it to Sender<T>::connect() in the client.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CONNECTION_FAILED (the underlying system error is logged).  On error accept() will fail.
   */
  explicit One_shot_server(flow::log::Logger* logger_ptr, std::string* name, Error_code* err_code = 0);

  /**
   * Move constructor.
   *
   * @param src
   *        Source object.  accept() on it will fail.
   */
  One_shot_server(One_shot_server&& src);

  // Methods.

  /**
   * Move assignment.
   *
   * @param src
   *        Source object.  accept() on it will fail.
   * @return `*this`.
   */
  One_shot_server& operator=(One_shot_server&& src);

  /**
   * Blocks until one client connects and sends its first message; yields the connection's Receiver and that
   * message's value.  The listening endpoint is closed before this returns.
   *
   * @param target_rcv
   *        On success move-assigned the receiver for the rest of the client's messages.  Otherwise untouched.
   * @param target_first_value
   *        On success move-assigned the first value.  Otherwise untouched.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ACCEPT_FAILED (connection could not be accepted; or already accepted, moved-from,
   *        or the constructor failed),
   *        error::Code::S_ACCEPT_FIRST_MESSAGE_FAILED (client disconnected before sending, or the first message
   *        could not be decoded; the cause is logged).
   * @return `true` on success; `false` if an error occurred (and `*err_code` was set).
   */
  bool accept(Receiver<T>* target_rcv, T* target_first_value, Error_code* err_code = 0) &&;

  /**
   * The name at which we listen (or listened); empty if the constructor failed or `*this` is moved-from.
   * @return See above.
   */
  const std::string& name() const;

private:
  // Data.

  /// See name().
  std::string m_name;

  /// The listener; null if the constructor failed, accept() was called, or `*this` is moved-from.
  boost::movelib::unique_ptr<transport::Raw_one_shot_listener> m_listener;
}; // class One_shot_server

// Free functions: in *_fwd.hpp.

// Template implementations.

/// Internally used macro; public API users should disregard.
#define TEMPLATE_CHAN_ONE_SHOT_SERVER \
  template<typename T>
/// Internally used macro; public API users should disregard.
#define CLASS_CHAN_ONE_SHOT_SERVER \
  One_shot_server<T>

TEMPLATE_CHAN_ONE_SHOT_SERVER
CLASS_CHAN_ONE_SHOT_SERVER::One_shot_server(flow::log::Logger* logger_ptr, std::string* name, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_CHAN)
{
  using boost::movelib::make_unique;

  assert(name);

  Error_code raw_err_code;
  auto listener = make_unique<transport::Raw_one_shot_listener>(logger_ptr, &raw_err_code);
  if (raw_err_code)
  {
    // It logged the system error.
    const Error_code our_err_code = error::Code::S_CONNECTION_FAILED;
    if (!err_code)
    {
      throw flow::error::Runtime_error(our_err_code, "chan::One_shot_server::One_shot_server()");
    }
    // else
    *err_code = our_err_code;
    return;
  }
  // else

  m_listener = std::move(listener);
  m_name = m_listener->name();
  *name = m_name;
  FLOW_LOG_INFO("One_shot_server [" << *this << "]: Listening.");
  if (err_code)
  {
    err_code->clear();
  }
} // One_shot_server::One_shot_server()

TEMPLATE_CHAN_ONE_SHOT_SERVER
CLASS_CHAN_ONE_SHOT_SERVER::One_shot_server(One_shot_server&& src) :
  flow::log::Log_context(std::move(src)),
  m_name(std::move(src.m_name)),
  m_listener(std::move(src.m_listener))
{
  src.m_name.clear();
}

TEMPLATE_CHAN_ONE_SHOT_SERVER
CLASS_CHAN_ONE_SHOT_SERVER& CLASS_CHAN_ONE_SHOT_SERVER::operator=(One_shot_server&& src)
{
  if (&src != this)
  {
    flow::log::Log_context::operator=(std::move(src));
    m_name = std::move(src.m_name);
    m_listener = std::move(src.m_listener);
    src.m_name.clear();
  }
  return *this;
}

TEMPLATE_CHAN_ONE_SHOT_SERVER
bool CLASS_CHAN_ONE_SHOT_SERVER::accept(Receiver<T>* target_rcv, T* target_first_value, Error_code* err_code) &&
{
  bool ok;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return std::move(*this).accept(target_rcv, target_first_value, actual_err_code); },
         &ok, err_code, "chan::One_shot_server::accept()"))
  {
    return ok;
  }
  // else

  assert(target_rcv && target_first_value);

  if (!m_listener)
  {
    FLOW_LOG_WARNING("One_shot_server [" << *this << "]: Cannot accept: already accepted, moved-from, or "
                     "never started listening.");
    *err_code = error::Code::S_ACCEPT_FAILED;
    return false;
  }
  // else

  // Whatever happens, we are done listening once this returns.
  const auto listener = std::move(m_listener);

  transport::Raw_receiver raw_rcv;
  Error_code raw_err_code;
  if (!listener->accept_connection(&raw_rcv, &raw_err_code))
  {
    FLOW_LOG_WARNING("One_shot_server [" << *this << "]: Accepting connection failed "
                     "[" << raw_err_code << "] [" << raw_err_code.message() << "].");
    *err_code = error::Code::S_ACCEPT_FAILED;
    return false;
  }
  // else

  Receiver<T> rcv(std::move(raw_rcv));
  T first_value;
  Error_code rcv_err_code;
  if (!rcv.recv(&first_value, &rcv_err_code))
  {
    FLOW_LOG_WARNING("One_shot_server [" << *this << "]: Accepted connection, but receiving its first message "
                     "failed [" << rcv_err_code << "] [" << rcv_err_code.message() << "].");
    *err_code = error::Code::S_ACCEPT_FIRST_MESSAGE_FAILED;
    return false;
  }
  // else

  FLOW_LOG_INFO("One_shot_server [" << *this << "]: Accepted connection [" << rcv << "] and its first message.");
  *target_rcv = std::move(rcv);
  *target_first_value = std::move(first_value);
  err_code->clear();
  return true;
} // One_shot_server::accept()

TEMPLATE_CHAN_ONE_SHOT_SERVER
const std::string& CLASS_CHAN_ONE_SHOT_SERVER::name() const
{
  return m_name;
}

TEMPLATE_CHAN_ONE_SHOT_SERVER
std::ostream& operator<<(std::ostream& os, const CLASS_CHAN_ONE_SHOT_SERVER& val)
{
  return os << "[name [" << val.name() << "]]@" << static_cast<const void*>(&val);
}

#undef CLASS_CHAN_ONE_SHOT_SERVER
#undef TEMPLATE_CHAN_ONE_SHOT_SERVER

} // namespace capchan::chan
