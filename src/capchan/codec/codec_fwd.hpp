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

#include "capchan/transport/transport_fwd.hpp"

/**
 * capchan module converting C++ values to and from message bytes, with capabilities (channel senders) inside the
 * value carried out-of-band.
 *
 * A value of type `T` is encoded by Codec<T> into a `wire::Value` tree (the protobuf-generated schema in
 * capchan_wire.proto); the tree goes into a `wire::Envelope` which is serialized into the message bytes.
 * A capability found during encoding is not written as bytes: its handle is appended to the Encode_context,
 * and its position in that list (its *capability index*) is written in its place.  The list is sent
 * out-of-band with the bytes.  On the receiving side the delivered handles are installed into a Decode_context,
 * and a capability index in the tree is resolved against it.
 *
 * See codec.hpp for the supported types and how to add one.
 */
namespace capchan::codec
{

// Types.

// Find doc headers near the bodies of these compound types.

class Encode_context;
class Decode_context;

template<typename T, typename Enable = void>
struct Codec;

// Free functions.

/**
 * Prints string representation of the given Encode_context to the given `ostream`.
 *
 * @relatesalso Encode_context
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Encode_context& val);

/**
 * Prints string representation of the given Decode_context to the given `ostream`.
 *
 * @relatesalso Decode_context
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Decode_context& val);

} // namespace capchan::codec
