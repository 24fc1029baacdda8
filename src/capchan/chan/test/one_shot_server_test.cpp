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

#include "capchan/chan/one_shot_server.hpp"
#include "capchan/chan/channel.hpp"
#include "capchan/chan/error.hpp"
#include "capchan/test/test_common_util.hpp"
#include "capchan/test/test_logger.hpp"
#include <gtest/gtest.h>

namespace capchan::chan::test
{

namespace
{

using capchan::test::Test_logger;
using std::string;

/// First message of a client: its name and where to send it replies.
using Hello = std::tuple<string, Sender<string>>;

} // Anonymous namespace

TEST(One_shot_server, Accept_consumes_server)
{
  Test_logger logger;
  string name;
  One_shot_server<string> server(&logger, &name);
  EXPECT_FALSE(name.empty());
  EXPECT_EQ(server.name(), name);

  // The connection is queued by the listener until accept(); so a single thread suffices here.
  Sender<string> snd;
  ASSERT_TRUE(Sender<string>::connect(&logger, name, &snd));
  ASSERT_TRUE(snd.send("first"));
  ASSERT_TRUE(snd.send("second"));

  Receiver<string> rcv;
  string first;
  ASSERT_TRUE(std::move(server).accept(&rcv, &first));
  EXPECT_EQ(first, "first");
  string val;
  ASSERT_TRUE(rcv.recv(&val));
  EXPECT_EQ(val, "second");

  // Nobody listens any longer.
  Error_code err_code;
  Sender<string> snd2;
  EXPECT_FALSE(Sender<string>::connect(&logger, name, &snd2, &err_code));
  EXPECT_EQ(err_code, error::Code::S_CONNECTION_FAILED);
  EXPECT_TRUE(snd2.null());

  // And the server cannot accept again.
  EXPECT_FALSE(std::move(server).accept(&rcv, &first, &err_code));
  EXPECT_EQ(err_code, error::Code::S_ACCEPT_FAILED);
} // TEST(One_shot_server, Accept_consumes_server)

TEST(One_shot_server, Moved_from_server_refuses)
{
  Test_logger logger;
  string name;
  One_shot_server<int> server(&logger, &name);
  auto server2 = std::move(server);
  EXPECT_TRUE(server.name().empty());
  EXPECT_EQ(server2.name(), name);

  Receiver<int> rcv;
  int first;
  Error_code err_code;
  EXPECT_FALSE(std::move(server).accept(&rcv, &first, &err_code));
  EXPECT_EQ(err_code, error::Code::S_ACCEPT_FAILED);
  EXPECT_TRUE(rcv.null());
}

TEST(One_shot_server, Client_leaves_without_first_message)
{
  Test_logger logger;
  string name;
  One_shot_server<int> server(&logger, &name);
  {
    Sender<int> snd;
    ASSERT_TRUE(Sender<int>::connect(&logger, name, &snd));
  }

  Receiver<int> rcv;
  int first;
  Error_code err_code;
  EXPECT_FALSE(std::move(server).accept(&rcv, &first, &err_code));
  EXPECT_EQ(err_code, error::Code::S_ACCEPT_FIRST_MESSAGE_FAILED);
  EXPECT_TRUE(rcv.null());
}

TEST(One_shot_server, Connect_to_nothing)
{
  Test_logger logger;
  Sender<int> snd;
  Error_code err_code;
  EXPECT_FALSE(Sender<int>::connect(&logger, "capchan_oneshot_no_such_name", &snd, &err_code));
  EXPECT_EQ(err_code, error::Code::S_CONNECTION_FAILED);
  EXPECT_THROW(Sender<int>::connect(&logger, "capchan_oneshot_no_such_name", &snd), flow::error::Runtime_error);
}

TEST(One_shot_server, Bootstrap_across_processes)
{
  using capchan::test::start_child_process;
  using capchan::test::wait_child_process;

  Test_logger logger;
  string name;
  One_shot_server<Hello> server(&logger, &name);

  // The child knows only the name; everything else travels through channels.
  const auto child_pid = start_child_process([&]() -> int
  {
    Test_logger child_logger;
    Error_code err_code;
    Sender<Hello> hello_snd;
    if (!Sender<Hello>::connect(&child_logger, name, &hello_snd, &err_code))
    {
      return 10;
    }
    // else
    Sender<string> reply_snd;
    Receiver<string> reply_rcv;
    if (!channel(&child_logger, &reply_snd, &reply_rcv, &err_code))
    {
      return 11;
    }
    // else
    if (!hello_snd.send(Hello("child", reply_snd), &err_code))
    {
      return 12;
    }
    // else
    reply_snd = Sender<string>(); // So that, should the parent fail, recv() below reports it instead of hanging.
    string reply;
    if (!reply_rcv.recv(&reply, &err_code))
    {
      return 13;
    }
    // else
    return (reply == "hello, child") ? 0 : 14;
  });
  ASSERT_NE(child_pid, -1);

  Receiver<Hello> rcv;
  Hello hello;
  const bool accepted = std::move(server).accept(&rcv, &hello);
  if (accepted)
  {
    EXPECT_EQ(std::get<0>(hello), "child");
    EXPECT_TRUE(std::get<1>(hello).send("hello, " + std::get<0>(hello)));
  }
  EXPECT_EQ(wait_child_process(child_pid), 0);
  EXPECT_TRUE(accepted);
} // TEST(One_shot_server, Bootstrap_across_processes)

} // namespace capchan::chan::test
