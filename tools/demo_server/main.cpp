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

#include <hostctl/server/server.hpp>
#include <hostctl/dispatch/command_registry.hpp>
#include <hostctl/dispatch/standard_catalog.hpp>
#include <hostctl/dispatch/session_api.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <map>
#include <stdexcept>

namespace
{

/**
 * Stand-in host: a parameter store.  `set_*` commands store their params under the command name (last write
 * wins); `get_*` commands return the store; `fire_*` commands count; the rest are acknowledged.
 * Called only from the serializer's consumer context, so no locking.
 */
class Param_store_session :
  public hostctl::dispatch::Session_api
{
public:
  hostctl::Json invoke(const std::string& command_name, const hostctl::Json& params) override
  {
    using hostctl::Json;

    ++m_n_invoked;
    if (command_name.compare(0, 4, "set_") == 0)
    {
      m_state[command_name] = params;
      return params;
    }
    // else
    if (command_name.compare(0, 4, "get_") == 0)
    {
      Json state = Json::object();
      for (const auto& entry : m_state)
      {
        state[entry.first] = entry.second;
      }
      return Json{ { "commands_executed", m_n_invoked }, { "state", std::move(state) } };
    }
    // else
    if (command_name.compare(0, 5, "fire_") == 0)
    {
      return Json{ { "fired", ++m_n_fired } };
    }
    // else
    if (command_name == "fail")
    {
      throw std::runtime_error("Command [fail] always fails");
    }
    // else
    return Json{ { "acknowledged", command_name } };
  }

private:
  std::map<std::string, hostctl::Json> m_state;
  uint64_t m_n_invoked = 0;
  uint64_t m_n_fired = 0;
}; // class Param_store_session

} // namespace (anon)

/* Runs the dispatch core over the parameter store above until SIGINT/SIGTERM.  Try it with, e.g.,
 * `echo '{"type": "get_session_info"}' | nc 127.0.0.1 9877`. */
int main(int argc, char const * const * argv)
{
  using hostctl::server::Server;
  using hostctl::server::Server_config;
  using hostctl::server::parse_server_config;
  using hostctl::dispatch::Command_registry;
  using hostctl::dispatch::Safety_tier;
  using hostctl::dispatch::Serializer_mode;
  using hostctl::Log_component;
  using hostctl::util::Task_engine;
  using hostctl::util::Timer;

  using flow::log::Simple_ostream_logger;
  using flow::log::Config;
  using flow::Error_code;
  using flow::Flow_log_component;

  using std::exception;

  const int BAD_EXIT = 1;
  const auto HOST_TICK = boost::chrono::milliseconds(10);

  Server_config config;
  Error_code err_code;
  if (parse_server_config(argc, argv, &config, &std::cerr, &err_code))
  {
    return 0; // --help.
  }
  // else
  if (err_code)
  {
    return BAD_EXIT;
  }
  // else

  Config log_config(config.m_log_severity);
  log_config.init_component_to_union_idx_mapping<Log_component>
    (100, Config::standard_component_payload_enum_sparse_length<Log_component>());
  log_config.init_component_names<Log_component>(hostctl::S_HOSTCTL_LOG_COMPONENT_NAME_MAP, false, "hostctl-");
  log_config.init_component_to_union_idx_mapping<Flow_log_component>
    (1000, Config::standard_component_payload_enum_sparse_length<Flow_log_component>());
  log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");

  Simple_ostream_logger logger(&log_config);
  FLOW_LOG_SET_CONTEXT(&logger, Log_component::S_SERVER);

  try
  {
    Param_store_session session;
    Command_registry registry(&logger);
    hostctl::dispatch::register_standard_commands(&registry);
    registry.register_command("fail", Safety_tier::S_NEVER_LOSSY);

    Server server(&logger, &session, &registry, config);

    Task_engine task_engine;
    Timer host_tick(task_engine);
    hostctl::Function<void ()> schedule_tick;
    schedule_tick = [&]()
    {
      host_tick.expires_after(HOST_TICK);
      host_tick.async_wait([&](const Error_code& sys_err_code)
      {
        if (sys_err_code)
        {
          return; // Canceled: exiting.
        }
        // else
        server.serializer().run_pending(); // The "host main loop" draining commands each frame.
        schedule_tick();
      });
    };
    if (config.m_serializer_mode == Serializer_mode::S_HOST_DRIVEN)
    {
      schedule_tick();
    }

    boost::asio::signal_set signals(task_engine, SIGINT, SIGTERM);
    signals.async_wait([&](const Error_code& sys_err_code, int sig_number)
    {
      if (sys_err_code)
      {
        return;
      }
      // else
      FLOW_LOG_INFO("Caught signal [" << sig_number << "]; exiting.");
      host_tick.cancel();
    });

    FLOW_LOG_INFO("Serving on [" << server.reliable_endpoint() << "] (reliable) and "
                  "[" << server.lossy_endpoint() << "] (lossy).  Ctrl-C to exit.");
    task_engine.run(); // Returns once the signal has arrived and the tick (if any) has been canceled.

    FLOW_LOG_INFO("Lossy stats at exit: [" << server.lossy_stats() << "].");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
