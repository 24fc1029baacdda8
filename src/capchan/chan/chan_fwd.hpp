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

#include "capchan/codec/codec_fwd.hpp"

/**
 * capchan module containing the typed channel API, the main point of capchan: a chan::Sender<T> sends values of
 * type `T` to the one chan::Receiver<T> it is connected to, possibly in another process; and a value may contain
 * further Sender objects (capabilities), which arrive at the receiving side as working Sender objects of their
 * own.  So, once two processes share one channel, any number of further channels between any processes that
 * hold endpoints can be set up by just sending Sender objects around.
 *
 * The first channel between two processes is set up via One_shot_server: one process creates it and publishes
 * its name (out-of-band); the other does Sender<T>::connect() to that name, and its first send completes the
 * server's accept().
 *
 * Quick example:
 *
 *   ~~~
 *   // Process A: server side.
 *   std::string name;
 *   chan::One_shot_server<chan::Sender<std::string>> server(logger, &name); // Publish `name` to B somehow.
 *   chan::Receiver<chan::Sender<std::string>> rcv;
 *   chan::Sender<std::string> reply_snd;
 *   std::move(server).accept(&rcv, &reply_snd); // B's reply channel arrives as a usable Sender.
 *   reply_snd.send("hello");
 *
 *   // Process B: client side.
 *   chan::Sender<chan::Sender<std::string>> snd;
 *   chan::Sender<chan::Sender<std::string>>::connect(logger, name, &snd);
 *   chan::Sender<std::string> my_snd;
 *   chan::Receiver<std::string> my_rcv;
 *   chan::channel(logger, &my_snd, &my_rcv);
 *   snd.send(my_snd);
 *   std::string greeting;
 *   my_rcv.recv(&greeting); // "hello".
 *   ~~~
 *
 * Payload types are those with a codec::Codec, which includes Sender itself (and so containers/structures of
 * senders).  A Receiver cannot be sent.
 */
namespace capchan::chan
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename T>
class Sender;
template<typename T>
class Receiver;
template<typename T>
class One_shot_server;

// Free functions.

/**
 * Prints string representation of the given Sender to the given `ostream`.
 *
 * @relatesalso Sender
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const Sender<T>& val);

/**
 * Prints string representation of the given Receiver to the given `ostream`.
 *
 * @relatesalso Receiver
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const Receiver<T>& val);

/**
 * Prints string representation of the given One_shot_server to the given `ostream`.
 *
 * @relatesalso One_shot_server
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename T>
std::ostream& operator<<(std::ostream& os, const One_shot_server<T>& val);

} // namespace capchan::chan
