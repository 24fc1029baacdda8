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

#include "capchan/transport/raw_transport.hpp"
#include "capchan/transport/error.hpp"
#include "capchan/test/test_common_util.hpp"
#include "capchan/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/asio/error.hpp>
#include <chrono>
#include <sstream>
#include <thread>

namespace capchan::transport::test
{

namespace
{

using capchan::test::Test_logger;
using capchan::test::get_test_name;
using util::Blob;
using util::Blob_const;
using std::string;

/// Blob_const viewing a string's bytes.
Blob_const to_blob(const string& str)
{
  return Blob_const(str.data(), str.size());
}

/// The bytes of a received Blob as a string.
string to_string(const Blob& blob)
{
  return string(reinterpret_cast<const char*>(blob.const_data()), blob.size());
}

/// Creates a connected pair named after the current test.
void make_pair(Test_logger* logger, Raw_sender* snd, Raw_receiver* rcv)
{
  ASSERT_TRUE(create_raw_pair(logger, get_test_name(), snd, rcv));
  ASSERT_FALSE(snd->null());
  ASSERT_FALSE(rcv->null());
}

} // Anonymous namespace

TEST(Raw_transport, Bytes_and_handles_arrive_jointly_in_order)
{
  Test_logger logger;
  Raw_sender snd;
  Raw_receiver rcv;
  make_pair(&logger, &snd, &rcv);

  // A second pair whose sender we pass around as a capability.
  Raw_sender cap_snd;
  Raw_receiver cap_rcv;
  make_pair(&logger, &cap_snd, &cap_rcv);

  const string MSG1 = "first";
  const string MSG2 = "second, with two handles";
  const string MSG3 = string(1000, 'x');

  EXPECT_TRUE(snd.send(to_blob(MSG1), {}));
  EXPECT_TRUE(snd.send(to_blob(MSG2), { cap_snd.native_handle(), cap_snd.native_handle() }));
  EXPECT_TRUE(snd.send(to_blob(MSG3), { cap_snd.native_handle() }));

  Blob blob(&logger);
  Raw_sender_list snds;

  ASSERT_TRUE(rcv.recv(&blob, &snds));
  EXPECT_EQ(to_string(blob), MSG1);
  EXPECT_TRUE(snds.empty());

  ASSERT_TRUE(rcv.recv(&blob, &snds));
  EXPECT_EQ(to_string(blob), MSG2);
  ASSERT_EQ(snds.size(), 2u);
  for (const auto& rcvd_snd : snds)
  {
    EXPECT_FALSE(rcvd_snd.null());
    // Each delivered handle is a descriptor of its own.
    EXPECT_NE(rcvd_snd.native_handle().m_native_handle, cap_snd.native_handle().m_native_handle);
  }
  EXPECT_NE(snds[0].native_handle().m_native_handle, snds[1].native_handle().m_native_handle);

  // The delivered senders reach the same receiver as the original.
  const string VIA_CAP = "via delivered handle";
  EXPECT_TRUE(snds[1].send(to_blob(VIA_CAP), {}));
  Raw_sender_list cap_snds;
  ASSERT_TRUE(cap_rcv.recv(&blob, &cap_snds));
  EXPECT_EQ(to_string(blob), VIA_CAP);

  ASSERT_TRUE(rcv.recv(&blob, &snds));
  EXPECT_EQ(to_string(blob), MSG3);
  EXPECT_EQ(snds.size(), 1u);
} // TEST(Raw_transport, Bytes_and_handles_arrive_jointly_in_order)

TEST(Raw_transport, Largest_message)
{
  Test_logger logger;
  Raw_sender snd;
  Raw_receiver rcv;
  make_pair(&logger, &snd, &rcv);

  const string BIG(Raw_sender::S_MAX_MESSAGE_SIZE, 'b');
  const string SMALL = "s";
  Blob blob(&logger);
  Raw_sender_list snds;

  // Small, then big: the blob must grow on the second receive.
  EXPECT_TRUE(snd.send(to_blob(SMALL), {}));
  ASSERT_TRUE(rcv.recv(&blob, &snds));
  EXPECT_EQ(to_string(blob), SMALL);
  EXPECT_TRUE(snd.send(to_blob(BIG), {}));
  ASSERT_TRUE(rcv.recv(&blob, &snds));
  EXPECT_EQ(to_string(blob), BIG);

  Error_code err_code;
  const string TOO_BIG(Raw_sender::S_MAX_MESSAGE_SIZE + 1, 'B');
  EXPECT_FALSE(snd.send(to_blob(TOO_BIG), {}, &err_code));
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT);

  // The failure left nothing behind.
  EXPECT_FALSE(rcv.try_recv(&blob, &snds, &err_code));
  EXPECT_EQ(err_code, boost::asio::error::would_block);
} // TEST(Raw_transport, Largest_message)

TEST(Raw_transport, Too_many_handles)
{
  Test_logger logger;
  Raw_sender snd;
  Raw_receiver rcv;
  make_pair(&logger, &snd, &rcv);

  const Native_handle_list MAX_HNDLS(seqpacket_socket::S_MAX_HANDLES_PER_MESSAGE, snd.native_handle());
  auto too_many_hndls = MAX_HNDLS;
  too_many_hndls.push_back(snd.native_handle());

  Error_code err_code;
  EXPECT_FALSE(snd.send(to_blob("x"), too_many_hndls, &err_code));
  EXPECT_EQ(err_code, error::Code::S_TOO_MANY_HANDLES);

  EXPECT_TRUE(snd.send(to_blob("y"), MAX_HNDLS, &err_code)) << err_code.message();
  Blob blob(&logger);
  Raw_sender_list snds;
  ASSERT_TRUE(rcv.recv(&blob, &snds));
  EXPECT_EQ(to_string(blob), "y");
  EXPECT_EQ(snds.size(), seqpacket_socket::S_MAX_HANDLES_PER_MESSAGE);
} // TEST(Raw_transport, Too_many_handles)

TEST(Raw_transport, Eof_after_all_senders_gone)
{
  Test_logger logger;
  Raw_sender snd;
  Raw_receiver rcv;
  make_pair(&logger, &snd, &rcv);

  Raw_sender snd_clone;
  ASSERT_TRUE(snd.clone(&snd_clone));
  EXPECT_NE(snd_clone.native_handle().m_native_handle, snd.native_handle().m_native_handle);

  EXPECT_TRUE(snd.send(to_blob("from original"), {}));
  snd = Raw_sender(); // Closes it.
  EXPECT_TRUE(snd.null());

  Error_code err_code;
  Blob blob(&logger);
  Raw_sender_list snds;
  EXPECT_FALSE(snd.send(to_blob("null"), {}, &err_code));
  EXPECT_EQ(err_code, error::Code::S_NULL_HANDLE);

  // The clone keeps the channel open.
  ASSERT_TRUE(rcv.recv(&blob, &snds));
  EXPECT_EQ(to_string(blob), "from original");
  EXPECT_FALSE(rcv.try_recv(&blob, &snds, &err_code));
  EXPECT_EQ(err_code, boost::asio::error::would_block);

  EXPECT_TRUE(snd_clone.send(to_blob("from clone"), {}));
  {
    const auto gone = std::move(snd_clone);
  }

  // Buffered messages are still delivered; then EOF.
  ASSERT_TRUE(rcv.recv(&blob, &snds));
  EXPECT_EQ(to_string(blob), "from clone");
  EXPECT_FALSE(rcv.recv(&blob, &snds, &err_code));
  EXPECT_EQ(err_code, boost::asio::error::eof);
  EXPECT_FALSE(rcv.recv(&blob, &snds, &err_code));
  EXPECT_EQ(err_code, boost::asio::error::eof);
} // TEST(Raw_transport, Eof_after_all_senders_gone)

TEST(Raw_transport, Sender_sees_receiver_gone)
{
  Test_logger logger;
  Raw_sender snd;
  Raw_receiver rcv;
  make_pair(&logger, &snd, &rcv);

  rcv = Raw_receiver();
  Error_code err_code;
  EXPECT_FALSE(snd.send(to_blob("nobody home"), {}, &err_code));
  EXPECT_TRUE((err_code == boost::asio::error::broken_pipe) || (err_code == boost::asio::error::connection_reset)
              || (err_code == boost::asio::error::not_connected))
    << err_code << ' ' << err_code.message();
}

TEST(Raw_transport, Shutdown_wakes_blocked_recv)
{
  Test_logger logger;
  Raw_sender snd;
  Raw_receiver rcv;
  make_pair(&logger, &snd, &rcv);

  Error_code err_code;
  std::thread rcv_thread([&]()
  {
    Blob blob(&logger);
    Raw_sender_list snds;
    rcv.recv(&blob, &snds, &err_code);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  rcv.shutdown();
  rcv_thread.join();

  EXPECT_EQ(err_code, boost::asio::error::eof);
  // Idempotent.
  rcv.shutdown();
}

TEST(Raw_transport, One_shot_listener)
{
  Test_logger logger;
  Raw_one_shot_listener listener(&logger);
  EXPECT_EQ(listener.name().find(Raw_one_shot_listener::S_NAME_PREFIX), 0u);

  Raw_sender snd;
  ASSERT_TRUE(Raw_sender::connect(&logger, listener.name(), &snd));
  EXPECT_TRUE(snd.send(to_blob("hello"), {}));

  Raw_receiver rcv;
  Blob blob(&logger);
  Raw_sender_list snds;
  ASSERT_TRUE(listener.accept(&rcv, &blob, &snds));
  EXPECT_EQ(to_string(blob), "hello");

  // Listening has stopped.
  Error_code err_code;
  Raw_sender snd2;
  EXPECT_FALSE(Raw_sender::connect(&logger, listener.name(), &snd2, &err_code));
  EXPECT_TRUE(err_code);
  EXPECT_TRUE(snd2.null());
  EXPECT_FALSE(listener.accept_connection(&rcv, &err_code));
  EXPECT_EQ(err_code, error::Code::S_LISTENER_ALREADY_ACCEPTED);

  // The accepted connection carries on.
  EXPECT_TRUE(snd.send(to_blob("again"), {}));
  ASSERT_TRUE(rcv.recv(&blob, &snds));
  EXPECT_EQ(to_string(blob), "again");
} // TEST(Raw_transport, One_shot_listener)

TEST(Raw_transport, Connect_to_nothing)
{
  Test_logger logger;
  Raw_sender snd;
  Error_code err_code;
  EXPECT_FALSE(Raw_sender::connect(&logger, Raw_one_shot_listener::S_NAME_PREFIX + "no_such_name", &snd, &err_code));
  EXPECT_TRUE(err_code);
  EXPECT_THROW(Raw_sender::connect(&logger, Raw_one_shot_listener::S_NAME_PREFIX + "no_such_name", &snd),
               flow::error::Runtime_error);
}

TEST(Transport_error, Codes_stream_both_ways)
{
  std::stringstream ss;
  ss << error::Code::S_TOO_MANY_HANDLES;
  EXPECT_EQ(ss.str(), "TOO_MANY_HANDLES");
  error::Code code;
  ss >> code;
  EXPECT_EQ(code, error::Code::S_TOO_MANY_HANDLES);

  const Error_code err_code = error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT;
  EXPECT_STREQ(err_code.category().name(), "capchan/transport");
  EXPECT_FALSE(err_code.message().empty());
}

} // namespace capchan::transport::test
