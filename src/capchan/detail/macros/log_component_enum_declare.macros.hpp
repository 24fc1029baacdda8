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

/// @cond
// -^- Doxygen, please ignore the following.  This is wacky macro magic and not a regular `#pragma once` header.

/* Modeled off the similarly-named file in Flow.  Add new components at the end; never reuse a value. */

// Rarely used component corresponding to log call sites outside namespace `capchan::X`, for all X in ::capchan.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace capchan::transport.
FLOW_LOG_CFG_COMPONENT_DEFINE(TRANSPORT, 1)
// Logging from namespace capchan::codec.
FLOW_LOG_CFG_COMPONENT_DEFINE(CODEC, 2)
// Logging from namespace capchan::chan.
FLOW_LOG_CFG_COMPONENT_DEFINE(CHAN, 3)
// Logging from namespace capchan::util.
FLOW_LOG_CFG_COMPONENT_DEFINE(UTIL, 4)
// Logging from namespace capchan::*::test.
FLOW_LOG_CFG_COMPONENT_DEFINE(TEST, 5)

// -v- Doxygen, please stop ignoring.
/// @endcond
