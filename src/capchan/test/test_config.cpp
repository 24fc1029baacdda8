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

#include "capchan/test/test_config.hpp"
#include <flow/util/util.hpp>
#include <iostream>
#include <sstream>

namespace capchan::test
{

// Static initializations.

const std::string Test_config::S_LOG_SEV_OPTION = "--capchan-log-sev=";

// Implementations.

Test_config& Test_config::get_singleton()
{
  static Test_config s_config;
  return s_config;
}

bool Test_config::parse_args(int* argc, char** argv)
{
  using flow::log::Sev;
  using std::string;

  int n_kept = 1;
  for (int idx = 1; idx != *argc; ++idx)
  {
    const string arg(argv[idx]);
    if (arg.compare(0, S_LOG_SEV_OPTION.size(), S_LOG_SEV_OPTION) != 0)
    {
      argv[n_kept++] = argv[idx];
      continue;
    }
    // else

    std::istringstream is(arg.substr(S_LOG_SEV_OPTION.size()));
    Sev sev;
    if (!(is >> sev)) // Sev names are case-insensitive, e.g. "trace"; or the int value.
    {
      std::cerr << "Bad severity in [" << arg << "]; expected e.g. [" << S_LOG_SEV_OPTION << "INFO].\n";
      return false;
    }
    // else
    m_sev = sev;
  }

  *argc = n_kept;
  argv[n_kept] = nullptr;
  return true;
} // Test_config::parse_args()

} // namespace capchan::test
