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

#include "capchan/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <cerrno>
#include <exception>
#include <iostream>
#include <sys/wait.h>
#include <unistd.h>

namespace capchan::test
{

std::string get_test_name()
{
  const auto test_info = ::testing::UnitTest::GetInstance()->current_test_info();
  if (!test_info)
  {
    return "no_test";
  }
  // else
  return std::string(test_info->test_suite_name()) + '.' + test_info->name();
}

pid_t start_child_process(const std::function<int()>& child_body)
{
  const pid_t pid = ::fork();
  if (pid != 0)
  {
    return pid; // Parent (or fork() failed).
  }
  // else

  int code;
  try
  {
    code = child_body();
  }
  catch (const std::exception& exc)
  {
    std::cerr << "Child process caught exception: [" << exc.what() << "].\n";
    code = 2;
  }
  ::_exit(code); // Skip atexit handlers and gtest teardown: those belong to the parent.
} // start_child_process()

int wait_child_process(pid_t pid)
{
  int status;
  while (::waitpid(pid, &status, 0) == -1)
  {
    if (errno != EINTR)
    {
      return -1;
    }
  }
  return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace capchan::test
