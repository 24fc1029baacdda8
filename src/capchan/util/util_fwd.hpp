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

#include "capchan/util/native_handle.hpp"
#include "capchan/common.hpp"
#include <flow/util/blob.hpp>
#include <flow/util/string_view.hpp>
#include <boost/asio/buffer.hpp>

/**
 * Flow-like grab-bag of tiny items used across capchan.
 */
namespace capchan::util
{

// Types.

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 * It is boost.asio's `const_buffer`, so boost.asio's buffer helpers apply to it.
 */
using Blob_const = boost::asio::const_buffer;

/// Short-hand for a mutable blob somewhere in memory, stored as exactly a `void*` and a `size_t`.
using Blob_mutable = boost::asio::mutable_buffer;

/// Short-hand for Flow's resizable, heap-backed byte buffer; received payloads are stored in these.
using Blob = flow::util::Blob;

} // namespace capchan::util
