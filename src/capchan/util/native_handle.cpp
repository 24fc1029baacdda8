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
#include "capchan/util/native_handle.hpp"
#include "capchan/common.hpp"
#include <flow/error/error.hpp>
#include <flow/log/log.hpp>
#include <fcntl.h>
#include <unistd.h>

namespace capchan::util
{

// Static initializers.

const Native_handle::handle_t Native_handle::S_NULL_HANDLE = -1;

// Native_handle implementations.

Native_handle::Native_handle(handle_t native_handle) :
  m_native_handle(native_handle)
{
  // Nope.
}

Native_handle::Native_handle(Native_handle&& src) noexcept
{
  m_native_handle = S_NULL_HANDLE;
  operator=(std::move(src));
}

Native_handle::Native_handle(const Native_handle&) = default;

Native_handle& Native_handle::operator=(Native_handle&& src) noexcept
{
  using std::swap;

  if (*this != src)
  {
    m_native_handle = S_NULL_HANDLE;
    swap(m_native_handle, src.m_native_handle);
  }
  return *this;
}

Native_handle& Native_handle::operator=(const Native_handle&) = default;

bool Native_handle::null() const
{
  return m_native_handle == S_NULL_HANDLE;
}

std::ostream& operator<<(std::ostream& os, const Native_handle& val)
{
  os << "native_hndl[";
  if (val.null())
  {
    os << "NONE";
  }
  else
  {
    os << val.m_native_handle;
  }
  return os << ']';
}

Native_handle duplicate_native_handle(flow::log::Logger* logger_ptr, Native_handle hndl, Error_code* err_code)
{
  using boost::system::system_category;
  using ::fcntl;
  // using ::F_DUPFD_CLOEXEC; // It's a macro apparently.

  Native_handle dup_hndl;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Native_handle
           { return duplicate_native_handle(logger_ptr, hndl, actual_err_code); },
         &dup_hndl, err_code, "util::duplicate_native_handle()"))
  {
    return dup_hndl;
  }
  // else

  assert((!hndl.null()) && "Disallowed per contract.");

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  // The 3rd arg is the lowest acceptable new FD; 0 means "any."  CLOEXEC so a fork()+exec() child does not inherit.
  const auto new_fd_or_error = fcntl(hndl.m_native_handle, F_DUPFD_CLOEXEC, 0);
  if (new_fd_or_error == -1)
  {
    const Error_code sys_err_code(errno, system_category());
    FLOW_LOG_WARNING("Tried to duplicate descriptor [" << hndl << "] but failed; details follow.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    *err_code = sys_err_code;
    return dup_hndl; // Null.
  }
  // else

  dup_hndl.m_native_handle = new_fd_or_error;
  FLOW_LOG_TRACE("Duplicated descriptor [" << hndl << "] => [" << dup_hndl << "].");
  err_code->clear();
  return dup_hndl;
} // duplicate_native_handle()

void close_native_handle(Native_handle* hndl)
{
  assert(hndl);
  if (hndl->null())
  {
    return;
  }
  // else

  /* Linux close() releases the descriptor even when it reports EINTR/EIO, so retrying would be wrong, and there
   * is nothing useful to do with the error here. */
  ::close(hndl->m_native_handle);
  *hndl = Native_handle();
}

} // namespace capchan::util
