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

#pragma once

#include <flow/log/log.hpp>
#include <string>

namespace capchan::test
{

/**
 * Process-wide settings of the unit tests, set from the command line by the test `main()` before any test runs.
 */
class Test_config
{
public:
  /// Command-line option prefix selecting #m_sev, e.g. `--capchan-log-sev=TRACE`.
  static const std::string S_LOG_SEV_OPTION;

  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static Test_config& get_singleton();

  /**
   * Consumes the options we understand from the command line.  Leaves the rest (e.g., those of gtest) in place.
   *
   * @param argc
   *        Pointer to `main()` argument count; updated.
   * @param argv
   *        `main()` arguments; those consumed are removed.
   * @return `false` if an option we understand had a bad value (a message was printed to `cerr`); else `true`.
   */
  bool parse_args(int* argc, char** argv);

  /// Lowest severity logged by Test_logger.
  flow::log::Sev m_sev = flow::log::Sev::S_WARNING;

private:
  /// Singleton.
  Test_config() = default;
}; // class Test_config

} // namespace capchan::test
