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

/* Must precede "capchan/detail/common.hpp": flow/util/util.hpp brings in flow/common.hpp, which `#define`s
 * FLOW_LOG_CFG_COMPONENT_ENUM_* for Flow's own components; our detail header #undef-s and re-`#define`s them. */
#include <flow/util/util.hpp>

#include "capchan/detail/common.hpp"
#include <boost/unordered_map.hpp>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any capchan/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for capchan: typed channels between processes, in which a message may carry (recursively)
 * further channel endpoints.
 *
 * capchan modules overview
 * ------------------------
 * Bottom-up:
 *   -# capchan::util: Tiny building blocks, most notably util::Native_handle (a descriptor wrapper) and the
 *      blob aliases.
 *   -# capchan::transport: The raw transport.  A transport::Raw_sender / transport::Raw_receiver pair is one
 *      connected `AF_UNIX`/`SOCK_SEQPACKET` socket pair; each send delivers one blob plus an ordered list of
 *      transport::Raw_sender descriptors, atomically, via `SCM_RIGHTS`.  transport::Raw_one_shot_listener is the
 *      named, accept-once bootstrap endpoint.  See transport/raw_transport.hpp for the contract the upper layers
 *      rely on.
 *   -# capchan::codec: Conversion between C++ values and the wire value tree (a protobuf-generated schema) and
 *      between the tree and a blob.  codec::Encode_context and codec::Decode_context correlate in-band capability
 *      indices with the out-of-band handle list of one message.
 *   -# capchan::chan: The user-facing typed layer: chan::Sender, chan::Receiver, chan::channel(),
 *      chan::One_shot_server.  This is *the point* of capchan.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * capchan requires Flow and Boost, internally and in some APIs.  `flow::log` is the assumed logging system;
 * `flow::Error_code` (boost.system) and Flow's error-reporting conventions are used for errors; boost.asio
 * supplies the local socket plumbing.
 *
 * ### Error reporting ###
 * Inherited from Flow: a fallible function takes `Error_code* err_code` as its last argument.  If non-null it is
 * set to success or the specific failure, and nothing is thrown; if null, failure throws `flow::error::Runtime_error`
 * storing the same code.
 *
 * ### Logging ###
 * Supply a `flow::log::Logger*` to the constructors and free functions (null means log nowhere).  Components are
 * enumerated by capchan::Log_component.
 */
namespace capchan
{

// Types.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef CAPCHAN_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing the log components used by capchan internal logging.
 * Its members are generated by `flow::log` macro magic from `log_component_enum_declare.macros.hpp`; look there
 * for the actual list.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in capchan::Log_component to its
 * string representation as used in log output and verbosity config.  Pass it to
 * `flow::log::Config::init_component_names()`.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_CAPCHAN_LOG_COMPONENT_NAME_MAP;

#endif // CAPCHAN_DOXYGEN_ONLY

} // namespace capchan
