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

#include <capchan/chan/channel.hpp>
#include <capchan/chan/one_shot_server.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We use a compiled thing or two (the transport, the error categories, the generated
 * wire schema) and a template (header-only) thing or two, not so much for correctness testing but to see
 * it build successfully and run without barfing. */
int main(int argc, char const * const * argv)
{
  using capchan::chan::Sender;
  using capchan::chan::Receiver;
  using capchan::chan::One_shot_server;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Error_code;
  using flow::Flow_log_component;

  using std::string;
  using std::exception;

  const string LOG_FILE = "capchan_link_test.log";
  const int BAD_EXIT = 1;

  /* Set up logging within this function.  We could easily just use `cout` and `cerr` instead, but this
   * Flow stuff will give us time stamps and such for free, so why not? */
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the capchan/Flow logging will go into this file.
  const string log_file((argc >= 2) ? string(argv[1]) : LOG_FILE);
  FLOW_LOG_INFO("Opening log file [" << log_file << "] for capchan/Flow logs only.");
  Config log_config = std_log_config;
  log_config.init_component_to_union_idx_mapping<capchan::Log_component>(2000, 999);
  log_config.init_component_names<capchan::Log_component>(capchan::S_CAPCHAN_LOG_COMPONENT_NAME_MAP,
                                                           false, "capchan-");
  log_config.configure_default_verbosity(Sev::S_DATA, true); // High-verbosity.  Use S_INFO in production.
  Async_file_logger log_logger(nullptr, &log_config, log_file, false /* No rotation; we're no serious business. */);

  try
  {
    /* Bootstrap a connection by name; over it send a Sender of a second channel; use that.  As a reminder
     * we're not trying to demo the library here; normally the client would be another process. */
    string name;
    One_shot_server<Sender<string>> server(&log_logger, &name);

    Sender<Sender<string>> boot_snd;
    Sender<Sender<string>>::connect(&log_logger, name, &boot_snd);

    Sender<string> snd;
    Receiver<string> rcv;
    capchan::chan::channel(&log_logger, &snd, &rcv);
    boot_snd.send(snd);

    Receiver<Sender<string>> boot_rcv;
    Sender<string> rcvd_snd;
    std::move(server).accept(&boot_rcv, &rcvd_snd);

    const string PAYLOAD = "Hello, world!";
    rcvd_snd.send(PAYLOAD);
    FLOW_LOG_INFO("Sent message via received sender: [" << PAYLOAD << "].");

    string str;
    rcv.recv(&str);
    FLOW_LOG_INFO("Received message we sent: [" << str << "].");

    FLOW_LOG_INFO("Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
