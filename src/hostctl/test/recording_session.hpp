/* Hostctl: Core
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

#include <hostctl/dispatch/session_api.hpp>
#include <hostctl/util/util_fwd.hpp>
#include <boost/unordered_map.hpp>
#include <atomic>
#include <string>
#include <vector>

namespace hostctl::test
{

/**
 * Mock host.  Records every invoke() (name, params, thread) and, per command name, can be told to return a given
 * result, to throw, or to take a while.  By default returns `{"command": <name>, "params": <params>}`.
 *
 * Setters must be called before the session is handed to a serializer; the accessors may be called at any time
 * from any thread.
 */
class Recording_session :
  public dispatch::Session_api
{
public:
  // Types.

  /// One recorded invoke().
  struct Invocation
  {
    /// Command name.
    std::string m_name;
    /// Parameters.
    Json m_params;
    /// Calling thread.
    flow::util::Thread_id m_thread_id;
  };

  /// Custom behavior for one command name.
  using Handler_func = Function<Json (const Json& params)>;

  // Methods.

  Json invoke(const std::string& command_name, const Json& params) override;

  /**
   * Makes `command_name` run `handler` (after recording).
   *
   * @param command_name Name.
   * @param handler Behavior.
   */
  void on(const std::string& command_name, Handler_func&& handler);

  /**
   * Makes `command_name` throw `std::runtime_error(message)`.
   *
   * @param command_name Name.
   * @param message what().
   */
  void throw_on(const std::string& command_name, const std::string& message);

  /**
   * Makes `command_name` sleep for `duration` (then behave as default).
   *
   * @param command_name Name.
   * @param duration How long.
   */
  void delay_on(const std::string& command_name, util::Fine_duration duration);

  /**
   * Copy of all invocations so far, in order.
   *
   * @return See above.
   */
  std::vector<Invocation> invocations() const;

  /**
   * Number of invocations so far, of `command_name` or (if empty) of anything.
   *
   * @param command_name Name or empty.
   *
   * @return See above.
   */
  size_t count(const std::string& command_name = "") const;

  /**
   * Params of the latest invocation of `command_name`; `null` if none.
   *
   * @param command_name Name.
   *
   * @return See above.
   */
  Json last_params(const std::string& command_name) const;

  /**
   * Highest number of invoke() calls ever in progress at once.  Anything above 1 is a bug.
   *
   * @return See above.
   */
  unsigned int max_concurrency() const;

private:
  /// Protects #m_invocations.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// See invocations().
  std::vector<Invocation> m_invocations;

  /// Custom behaviors.
  boost::unordered_map<std::string, Handler_func> m_handlers;

  /// invoke() calls in progress.
  std::atomic<unsigned int> m_n_in_progress{0};

  /// See max_concurrency().
  std::atomic<unsigned int> m_max_concurrency{0};
}; // class Recording_session

} // namespace hostctl::test
