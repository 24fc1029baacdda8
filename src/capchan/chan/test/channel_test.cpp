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

#include "capchan/chan/channel.hpp"
#include "capchan/chan/error.hpp"
#include "capchan/transport/raw_transport.hpp"
#include "capchan/test/test_logger.hpp"
#include "capchan_wire.pb.h"
#include <gtest/gtest.h>
#include <boost/fusion/include/adapt_struct.hpp>
#include <chrono>
#include <sstream>
#include <thread>
#include <tuple>
#include <type_traits>

namespace capchan::chan::test
{

/// A request carrying where to send the reply.
struct Request
{
  /// What to do.
  std::string m_op;
  /// Arguments.
  std::vector<int64_t> m_args;
  /// Where the result goes.
  Sender<int64_t> m_reply_to;
};

} // namespace capchan::chan::test

BOOST_FUSION_ADAPT_STRUCT(capchan::chan::test::Request, m_op, m_args, m_reply_to)

namespace capchan::chan::test
{

namespace
{

using capchan::test::Test_logger;
using std::string;
using std::vector;

/// Creates a channel, failing the test if that fails.
template<typename T>
void make_channel(Test_logger* logger, Sender<T>* snd, Receiver<T>* rcv)
{
  ASSERT_TRUE(channel(logger, snd, rcv));
  ASSERT_FALSE(snd->null());
  ASSERT_FALSE(rcv->null());
}

/// Sends raw bytes with no capabilities through a raw pair; returns the receiving end wrapped as Receiver<T>.
template<typename T>
Receiver<T> receiver_of_raw_bytes(Test_logger* logger, const string& bytes)
{
  transport::Raw_sender raw_snd;
  transport::Raw_receiver raw_rcv;
  EXPECT_TRUE(transport::create_raw_pair(logger, "raw", &raw_snd, &raw_rcv));
  EXPECT_TRUE(raw_snd.send(util::Blob_const(bytes.data(), bytes.size()), {}));
  return Receiver<T>(std::move(raw_rcv));
}

} // Anonymous namespace

TEST(Channel, Round_trip_and_fifo)
{
  Test_logger logger;
  Sender<std::pair<int, string>> snd;
  Receiver<std::pair<int, string>> rcv;
  make_channel(&logger, &snd, &rcv);

  constexpr int N_MSGS = 100;
  for (int idx = 0; idx != N_MSGS; ++idx)
  {
    ASSERT_TRUE(snd.send({ idx, string(idx, 'x') }));
  }
  for (int idx = 0; idx != N_MSGS; ++idx)
  {
    std::pair<int, string> val;
    ASSERT_TRUE(rcv.recv(&val));
    EXPECT_EQ(val.first, idx);
    EXPECT_EQ(val.second, string(idx, 'x'));
  }

  Error_code err_code;
  std::pair<int, string> val;
  EXPECT_FALSE(rcv.try_recv(&val, &err_code));
  EXPECT_EQ(err_code, error::Code::S_RECV_WOULD_BLOCK);
}

TEST(Channel, Capability_transfer)
{
  Test_logger logger;
  Sender<int64_t> result_snd;
  Receiver<int64_t> result_rcv;
  make_channel(&logger, &result_snd, &result_rcv);
  Sender<Request> req_snd;
  Receiver<Request> req_rcv;
  make_channel(&logger, &req_snd, &req_rcv);

  ASSERT_TRUE(req_snd.send(Request{ "sum", { 1, 2, 39 }, result_snd }));
  // The original is unaffected by having been sent; and can go away independently of what was sent.
  EXPECT_FALSE(result_snd.null());
  result_snd = Sender<int64_t>();

  Request req;
  {
    Request delivered;
    ASSERT_TRUE(req_rcv.recv(&delivered));
    req = std::move(delivered);
  }
  EXPECT_EQ(req.m_op, "sum");
  ASSERT_FALSE(req.m_reply_to.null());

  int64_t sum = 0;
  for (const auto arg : req.m_args)
  {
    sum += arg;
  }
  EXPECT_TRUE(req.m_reply_to.send(sum));

  int64_t result;
  ASSERT_TRUE(result_rcv.recv(&result));
  EXPECT_EQ(result, 42);

  // Once the received copy is gone too, the result channel is disconnected.
  req = Request();
  Error_code err_code;
  EXPECT_FALSE(result_rcv.recv(&result, &err_code));
  EXPECT_EQ(err_code, error::Code::S_RECV_DISCONNECTED);
} // TEST(Channel, Capability_transfer)

TEST(Channel, Capability_indices_follow_encounter_order)
{
  Test_logger logger;
  Sender<int> a_snd;
  Receiver<int> a_rcv;
  make_channel(&logger, &a_snd, &a_rcv);
  Sender<string> b_snd;
  Receiver<string> b_rcv;
  make_channel(&logger, &b_snd, &b_rcv);

  using Nested = std::tuple<Sender<int>, vector<std::optional<Sender<string>>>>;
  const Nested value(a_snd, { std::nullopt, b_snd });

  // First-encountered order, regardless of nesting depth.
  codec::Encode_context ctx(&logger);
  string bytes;
  ASSERT_TRUE(codec::encode(value, &ctx, &bytes));
  ASSERT_EQ(ctx.size(), 2u);
  EXPECT_EQ(ctx.capabilities()[0].m_native_handle, a_snd.raw().native_handle().m_native_handle);
  EXPECT_EQ(ctx.capabilities()[1].m_native_handle, b_snd.raw().native_handle().m_native_handle);

  // And each decodes back into a sender to the right place.
  Sender<Nested> snd;
  Receiver<Nested> rcv;
  make_channel(&logger, &snd, &rcv);
  ASSERT_TRUE(snd.send(value));
  Nested rcvd;
  ASSERT_TRUE(rcv.recv(&rcvd));
  const auto& rcvd_senders = std::get<1>(rcvd);
  ASSERT_EQ(rcvd_senders.size(), 2u);
  EXPECT_FALSE(rcvd_senders[0]);
  ASSERT_TRUE(rcvd_senders[1]);

  EXPECT_TRUE(std::get<0>(rcvd).send(7));
  auto b_rcvd_snd = *rcvd_senders[1];
  EXPECT_TRUE(b_rcvd_snd.send("seven"));
  int a_val;
  string b_val;
  ASSERT_TRUE(a_rcv.recv(&a_val));
  ASSERT_TRUE(b_rcv.recv(&b_val));
  EXPECT_EQ(a_val, 7);
  EXPECT_EQ(b_val, "seven");
} // TEST(Channel, Capability_indices_follow_encounter_order)

TEST(Channel, Concurrent_senders_carry_own_capabilities)
{
  using Tagged_reply_to = std::tuple<int, Sender<int>>;

  Test_logger logger;
  FLOW_LOG_SET_CONTEXT(&logger, Log_component::S_TEST);

  Sender<Tagged_reply_to> req_snd;
  Receiver<Tagged_reply_to> req_rcv;
  make_channel(&logger, &req_snd, &req_rcv);

  constexpr int N_THREADS = 8;
  constexpr int N_MSGS_PER_THREAD = 20;

  vector<Sender<int>> reply_snds(N_THREADS);
  vector<Receiver<int>> reply_rcvs(N_THREADS);
  for (int idx = 0; idx != N_THREADS; ++idx)
  {
    make_channel(&logger, &reply_snds[idx], &reply_rcvs[idx]);
  }

  // Each thread sends through its own copy of req_snd, each message carrying that thread's reply Sender.
  vector<std::thread> threads;
  for (int idx = 0; idx != N_THREADS; ++idx)
  {
    threads.emplace_back([&reply_snds, idx, snd = req_snd]() mutable
    {
      for (int msg_idx = 0; msg_idx != N_MSGS_PER_THREAD; ++msg_idx)
      {
        EXPECT_TRUE(snd.send(Tagged_reply_to(idx, reply_snds[idx])));
      }
    });
  }

  // Answer each request through the Sender it carried.
  for (int count = 0; count != N_THREADS * N_MSGS_PER_THREAD; ++count)
  {
    Tagged_reply_to req;
    if (!req_rcv.recv(&req))
    {
      ADD_FAILURE() << "Request [" << count << "] not received.";
      req_rcv = Receiver<Tagged_reply_to>(); // Unblock any sender stuck on a full channel.
      break;
    }
    // else
    const int idx = std::get<0>(req);
    EXPECT_TRUE((idx >= 0) && (idx < N_THREADS));
    EXPECT_FALSE(std::get<1>(req).null());
    if (!std::get<1>(req).null())
    {
      EXPECT_TRUE(std::get<1>(req).send(idx));
    }
  }

  for (auto& thread : threads)
  {
    thread.join();
  }
  FLOW_LOG_INFO("All [" << N_THREADS << "] sender threads done; checking replies.");

  for (int idx = 0; idx != N_THREADS; ++idx)
  {
    for (int msg_idx = 0; msg_idx != N_MSGS_PER_THREAD; ++msg_idx)
    {
      int val;
      Error_code err_code;
      ASSERT_TRUE(reply_rcvs[idx].try_recv(&val, &err_code)) << "Thread [" << idx << "]: " << err_code;
      EXPECT_EQ(val, idx);
    }
    int val;
    Error_code err_code;
    EXPECT_FALSE(reply_rcvs[idx].try_recv(&val, &err_code));
    EXPECT_EQ(err_code, error::Code::S_RECV_WOULD_BLOCK);
  }
} // TEST(Channel, Concurrent_senders_carry_own_capabilities)

TEST(Channel, Null_sender_cannot_be_sent)
{
  Test_logger logger;
  Sender<Sender<int>> snd;
  Receiver<Sender<int>> rcv;
  make_channel(&logger, &snd, &rcv);

  Error_code err_code;
  EXPECT_FALSE(snd.send(Sender<int>(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_SEND_ENCODE_FAILED);
  EXPECT_THROW(snd.send(Sender<int>()), flow::error::Runtime_error);

  // Nothing was sent; and the next send starts clean.
  Sender<int> good;
  EXPECT_FALSE(rcv.try_recv(&good, &err_code));
  EXPECT_EQ(err_code, error::Code::S_RECV_WOULD_BLOCK);

  Sender<int> inner_snd;
  Receiver<int> inner_rcv;
  make_channel(&logger, &inner_snd, &inner_rcv);
  ASSERT_TRUE(snd.send(inner_snd));
  ASSERT_TRUE(rcv.recv(&good));
  EXPECT_FALSE(good.null());
}

TEST(Channel, Out_of_range_capability_index)
{
  Test_logger logger;

  // A message referring to capability 5, delivered with none.
  codec::wire::Envelope envelope;
  envelope.set_n_capabilities(0);
  envelope.mutable_root()->set_capability_index(5);
  auto rcv = receiver_of_raw_bytes<Sender<int>>(&logger, envelope.SerializeAsString());

  Sender<int> snd;
  Error_code err_code;
  EXPECT_FALSE(rcv.recv(&snd, &err_code));
  EXPECT_EQ(err_code, error::Code::S_RECV_HANDLE_INDEX_OUT_OF_RANGE);
  EXPECT_TRUE(snd.null());
}

TEST(Channel, Decode_failure_consumes_message)
{
  Test_logger logger;

  transport::Raw_sender raw_snd;
  transport::Raw_receiver raw_rcv;
  ASSERT_TRUE(transport::create_raw_pair(&logger, "raw", &raw_snd, &raw_rcv));
  const string GARBAGE = "\xff\xff\xff";
  ASSERT_TRUE(raw_snd.send(util::Blob_const(GARBAGE.data(), GARBAGE.size()), {}));

  // Payload types match by convention only: wrap the same channel with mismatched types.
  transport::Raw_sender raw_snd2;
  transport::Raw_sender raw_snd3;
  ASSERT_TRUE(raw_snd.clone(&raw_snd2));
  ASSERT_TRUE(raw_snd.clone(&raw_snd3));
  Sender<string> str_snd(std::move(raw_snd));
  Sender<int> int_snd(std::move(raw_snd2));
  Sender<uint8_t> byte_snd(std::move(raw_snd3));
  Receiver<uint8_t> rcv(std::move(raw_rcv));

  EXPECT_TRUE(str_snd.send("not a number"));
  EXPECT_TRUE(int_snd.send(300));
  EXPECT_TRUE(byte_snd.send(42));

  uint8_t val = 0;
  Error_code err_code;
  for (int idx = 0; idx != 3; ++idx)
  {
    EXPECT_FALSE(rcv.recv(&val, &err_code));
    EXPECT_EQ(err_code, error::Code::S_RECV_DECODE_FAILED);
  }
  ASSERT_TRUE(rcv.recv(&val, &err_code));
  EXPECT_EQ(val, 42);
} // TEST(Channel, Decode_failure_consumes_message)

TEST(Channel, Disconnected_after_all_copies_gone)
{
  Test_logger logger;
  Sender<string> snd;
  Receiver<string> rcv;
  make_channel(&logger, &snd, &rcv);

  auto snd_copy = snd;
  Sender<string> snd_assigned;
  snd_assigned = snd_copy;
  EXPECT_FALSE(snd_assigned.null());
  EXPECT_NE(snd_copy.raw().native_handle().m_native_handle, snd.raw().native_handle().m_native_handle);

  EXPECT_TRUE(snd.send("1"));
  EXPECT_TRUE(snd_copy.send("2"));
  EXPECT_TRUE(snd_assigned.send("3"));
  snd = Sender<string>();
  snd_copy = Sender<string>();

  string val;
  Error_code err_code;
  ASSERT_TRUE(rcv.recv(&val));
  EXPECT_EQ(val, "1");

  auto snd_moved = std::move(snd_assigned);
  EXPECT_TRUE(snd_assigned.null());
  EXPECT_TRUE(snd_moved.send("4"));
  snd_moved = Sender<string>();

  // Buffered messages are still delivered; then disconnection is reported.
  for (const auto& expected : { "2", "3", "4" })
  {
    ASSERT_TRUE(rcv.recv(&val));
    EXPECT_EQ(val, expected);
  }
  EXPECT_FALSE(rcv.recv(&val, &err_code));
  EXPECT_EQ(err_code, error::Code::S_RECV_DISCONNECTED);
  EXPECT_FALSE(rcv.try_recv(&val, &err_code));
  EXPECT_EQ(err_code, error::Code::S_RECV_DISCONNECTED);
} // TEST(Channel, Disconnected_after_all_copies_gone)

TEST(Channel, Moves_keep_descriptors)
{
  static_assert(std::is_nothrow_move_constructible_v<Sender<string>>);
  static_assert(std::is_nothrow_move_assignable_v<Sender<string>>);
  static_assert(std::is_nothrow_move_constructible_v<Receiver<string>>);
  static_assert(std::is_nothrow_move_assignable_v<Receiver<string>>);
  static_assert(std::is_nothrow_move_constructible_v<transport::Raw_sender>);
  static_assert(std::is_nothrow_move_constructible_v<transport::Raw_receiver>);

  Test_logger logger;
  Sender<string> snd;
  Receiver<string> rcv;
  make_channel(&logger, &snd, &rcv);
  const auto native_hndl = snd.raw().native_handle().m_native_handle;

  // Growing the vector relocates the element by moving it; the descriptor stays the same.
  vector<Sender<string>> snds;
  snds.push_back(std::move(snd));
  for (int idx = 0; idx != 32; ++idx)
  {
    snds.emplace_back();
  }
  EXPECT_TRUE(snd.null());
  EXPECT_EQ(snds.front().raw().native_handle().m_native_handle, native_hndl);

  EXPECT_TRUE(snds.front().send("moved"));
  string val;
  ASSERT_TRUE(rcv.recv(&val));
  EXPECT_EQ(val, "moved");
} // TEST(Channel, Moves_keep_descriptors)

TEST(Channel, Peer_gone)
{
  Test_logger logger;
  Sender<int> snd;
  Receiver<int> rcv;
  make_channel(&logger, &snd, &rcv);

  rcv = Receiver<int>();
  Error_code err_code;
  EXPECT_FALSE(snd.send(1, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SEND_PEER_GONE);

  // Null objects fail cleanly.
  EXPECT_FALSE(Sender<int>().send(1, &err_code));
  EXPECT_EQ(err_code, error::Code::S_SEND_TRANSPORT_FAILED);
  int val;
  EXPECT_FALSE(rcv.recv(&val, &err_code));
  EXPECT_EQ(err_code, error::Code::S_RECV_DISCONNECTED);
}

TEST(Channel, Shutdown_wakes_blocked_recv)
{
  Test_logger logger;
  Sender<int> snd;
  Receiver<int> rcv;
  make_channel(&logger, &snd, &rcv);

  Error_code err_code;
  std::thread rcv_thread([&]()
  {
    int val;
    rcv.recv(&val, &err_code);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  rcv.shutdown();
  rcv_thread.join();
  EXPECT_EQ(err_code, error::Code::S_RECV_DISCONNECTED);
}

TEST(Chan_error, Codes_stream_both_ways)
{
  std::stringstream ss;
  ss << error::Code::S_RECV_HANDLE_INDEX_OUT_OF_RANGE;
  EXPECT_EQ(ss.str(), "RECV_HANDLE_INDEX_OUT_OF_RANGE");
  error::Code code;
  ss >> code;
  EXPECT_EQ(code, error::Code::S_RECV_HANDLE_INDEX_OUT_OF_RANGE);

  const Error_code err_code = error::Code::S_CONNECTION_FAILED;
  EXPECT_STREQ(err_code.category().name(), "capchan/chan");
  EXPECT_FALSE(err_code.message().empty());
}

} // namespace capchan::chan::test
