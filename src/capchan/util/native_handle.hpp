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

#include <ostream>
#include <flow/common.hpp>
#include <flow/log/log.hpp>

namespace capchan::util
{

#ifndef FLOW_OS_LINUX
static_assert(false, "capchan transmits descriptors via SCM_RIGHTS and names sockets in the Linux abstract "
                       "namespace; a core feature.  Build in Linux only.");
#endif

// Types.

/**
 * A monolayer-thin wrapper around a native handle, a/k/a descriptor a/k/a FD.  It does *not* own the descriptor:
 * copying it copies the integer, and destroying it does nothing.  Ownership is the business of whoever stores it
 * (e.g., transport::Raw_sender closes its descriptor in its destructor).
 *
 * It is either null() or stores a native handle.  In the former case `m_native_handle == S_NULL_HANDLE`.
 *
 * Move construction/assignment nullify the source, so that "moving" a handle from one owner to another does not
 * leave a stray copy of the integer behind in the source.
 */
struct Native_handle
{
  // Types.

  /// The native handle type.  Much logic relies on this type being light-weight (fast to copy).
  using handle_t = int;

  // Constants.

  /// The value for #m_native_handle such that `null() == true`; no valid handle ever equals this.
  static const handle_t S_NULL_HANDLE;

  // Data.

  /// The native handle (possibly equal to #S_NULL_HANDLE).
  handle_t m_native_handle;

  // Constructors/destructor.

  /**
   * Constructs with given payload; also subsumes no-args construction to mean a `null() == true` object.
   *
   * @param native_handle
   *        Payload.
   */
  Native_handle(handle_t native_handle = S_NULL_HANDLE);

  /**
   * Constructs object equal to `src`, while making `src` null().
   *
   * @param src
   *        Source object which will be made `null() == true`.
   */
  Native_handle(Native_handle&& src) noexcept;

  /**
   * Copy constructor.
   * @param src
   *        Source object.
   */
  Native_handle(const Native_handle& src);

  // Methods.

  /**
   * Move assignment; acts similarly to move ctor; but no-op if `*this == src`.
   * @param src
   *        Source object which will be made `null() == true`, unless `*this == src`.
   * @return `*this`.
   */
  Native_handle& operator=(Native_handle&& src) noexcept;

  /**
   * Copy assignment; acts similarly to copy ctor.
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Native_handle& operator=(const Native_handle& src);

  /**
   * Returns `true` if and only if #m_native_handle equals #S_NULL_HANDLE.
   * @return See above.
   */
  bool null() const;
}; // struct Native_handle

// Free functions.

/**
 * Prints string representation of the given Native_handle to the given `ostream`.
 *
 * @relatesalso Native_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Native_handle& val);

/**
 * Creates a new descriptor referring to the same open file description as `hndl` (close-on-exec set), a/k/a
 * `dup()`.  The two are from then on closed independently.  WARNING logged on error.
 *
 * @param logger_ptr
 *        Logger to use for subsequently logging.
 * @param hndl
 *        Descriptor to duplicate.  Must not be null().
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system codes from `fcntl()` (e.g., too many open files).
 * @return The new handle; null() on error.
 */
Native_handle duplicate_native_handle(flow::log::Logger* logger_ptr, Native_handle hndl,
                                      flow::Error_code* err_code = 0);

/**
 * Closes the descriptor, unless null(), and makes `hndl` null().  Errors from `close()` are ignored, as the
 * descriptor is released either way.
 *
 * @param hndl
 *        Descriptor to close.
 */
void close_native_handle(Native_handle* hndl);

} // namespace capchan::util
