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

#include "hostctl/server/server.hpp"
#include "hostctl/client/client_connection.hpp"
#include "hostctl/dispatch/command_registry.hpp"
#include "hostctl/dispatch/standard_catalog.hpp"
#include "hostctl/error.hpp"
#include "hostctl/test/test_logger.hpp"
#include "hostctl/test/recording_session.hpp"
#include "hostctl/test/test_common_util.hpp"
#include <flow/error/error.hpp>
#include <boost/move/make_unique.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <sstream>
#include <thread>
#include <vector>

namespace hostctl::server::test
{

using hostctl::test::Test_logger;
using hostctl::test::Recording_session;
using hostctl::test::wait_until;
using boost::chrono::milliseconds;

namespace
{

/// Parses `args` (program name prepended) into `*config`; returns the parser's result; output goes to `*os`.
bool parse(std::vector<const char*> args, Server_config* config, std::ostringstream* os, Error_code* err_code)
{
  args.insert(args.begin(), "hostctl_demo_server");
  return parse_server_config(int(args.size()), args.data(), config, os, err_code);
}

Server_config ephemeral_config()
{
  Server_config config;
  config.m_reliable_port = 0;
  config.m_lossy_port = 0;
  return config;
}

client::Client_config client_config_for(const Server& server)
{
  client::Client_config config;
  config.m_reliable_port = server.reliable_endpoint().port();
  config.m_lossy_port = server.lossy_endpoint().port();
  config.m_connect_retry_delay = milliseconds(10);
  return config;
}

} // namespace (anon)

TEST(Server_config, Defaults)
{
  const Server_config config;
  EXPECT_EQ(config.m_host, "127.0.0.1");
  EXPECT_EQ(config.m_reliable_port, 9877);
  EXPECT_EQ(config.m_lossy_port, 9878);
  EXPECT_EQ(config.m_serializer_mode, dispatch::Serializer_mode::S_OWN_THREAD);
  EXPECT_GT(config.m_queue_capacity, 0u);

  // Parsing nothing changes nothing.
  Server_config parsed;
  std::ostringstream os;
  Error_code err_code;
  EXPECT_FALSE(parse({}, &parsed, &os, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(parsed.m_reliable_port, config.m_reliable_port);
  EXPECT_EQ(parsed.m_reliable.m_read_timeout, config.m_reliable.m_read_timeout);
  EXPECT_EQ(parsed.m_reliable.m_completion_timeout, config.m_reliable.m_completion_timeout);
  EXPECT_TRUE(os.str().empty());
}

TEST(Server_config, All_options)
{
  Server_config config;
  std::ostringstream os;
  Error_code err_code;
  EXPECT_FALSE(parse({ "--host", "0.0.0.0", "--reliable-port", "19877", "--lossy-port", "19878",
                       "--queue-capacity", "16", "--max-message-size", "4096", "--read-timeout-ms", "250",
                       "--idle-timeout-ms", "0", "--write-timeout-ms", "750", "--completion-timeout-ms", "1500",
                       "--host-driven", "--log-level", "TRACE" },
                     &config, &os, &err_code));
  ASSERT_FALSE(err_code) << os.str();

  EXPECT_EQ(config.m_host, "0.0.0.0");
  EXPECT_EQ(config.m_reliable_port, 19877);
  EXPECT_EQ(config.m_lossy_port, 19878);
  EXPECT_EQ(config.m_queue_capacity, 16u);
  EXPECT_EQ(config.m_reliable.m_max_message_size, 4096u);
  EXPECT_EQ(config.m_reliable.m_read_timeout, milliseconds(250));
  EXPECT_EQ(config.m_reliable.m_idle_timeout, util::Fine_duration::zero());
  EXPECT_EQ(config.m_reliable.m_write_timeout, milliseconds(750));
  EXPECT_EQ(config.m_reliable.m_completion_timeout, milliseconds(1500));
  EXPECT_EQ(config.m_serializer_mode, dispatch::Serializer_mode::S_HOST_DRIVEN);
  EXPECT_EQ(config.m_log_severity, flow::log::Sev::S_TRACE);

  std::ostringstream printed;
  printed << config;
  EXPECT_NE(printed.str().find("19877"), std::string::npos);
}

TEST(Server_config, Help)
{
  Server_config config;
  config.m_reliable_port = 1234;
  std::ostringstream os;
  Error_code err_code;
  EXPECT_TRUE(parse({ "--reliable-port", "5", "--help" }, &config, &os, &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_NE(os.str().find("--reliable-port"), std::string::npos);
  EXPECT_NE(os.str().find("--host-driven"), std::string::npos);
  EXPECT_EQ(config.m_reliable_port, 1234); // Untouched.
}

TEST(Server_config, Bad_command_lines)
{
  const std::vector<std::vector<const char*>> BAD_ARGS
    = { { "--no-such-option" },
        { "--reliable-port", "70000" },
        { "--reliable-port", "nine" },
        { "--host", "localhost" }, // Must be an address.
        { "--queue-capacity", "0" },
        { "--max-message-size", "0" },
        { "--read-timeout-ms", "0" },
        { "--completion-timeout-ms", "0" },
        { "--log-level", "LOUD" },
        { "--host" } };

  for (const auto& args : BAD_ARGS)
  {
    Server_config config;
    config.m_queue_capacity = 77;
    std::ostringstream os;
    Error_code err_code;
    EXPECT_FALSE(parse(args, &config, &os, &err_code));
    EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT) << "First arg [" << args.front() << "].";
    EXPECT_NE(os.str().find("Bad command line"), std::string::npos);
    EXPECT_EQ(config.m_queue_capacity, 77u); // Nothing half-applied.
  }

  Server_config config;
  std::ostringstream os;
  try
  {
    parse({ "--queue-capacity", "0" }, &config, &os, nullptr);
    ADD_FAILURE() << "Expected an exception.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_INVALID_ARGUMENT);
  }
}

TEST(Server, Serves_both_transports)
{
  Test_logger logger;
  Recording_session session;
  dispatch::Command_registry registry(&logger);
  dispatch::register_standard_commands(&registry);
  registry.register_command("get_info", dispatch::Safety_tier::S_NEVER_LOSSY);

  Server server(&logger, &session, &registry, ephemeral_config());
  EXPECT_TRUE(registry.sealed());
  EXPECT_NE(server.reliable_endpoint().port(), 0);
  EXPECT_NE(server.lossy_endpoint().port(), 0);

  Error_code err_code;
  registry.register_command("too_late", dispatch::Safety_tier::S_NEVER_LOSSY, &err_code);
  EXPECT_EQ(err_code, error::Code::S_REGISTRY_SEALED);

  client::Client_connection client(&logger, client_config_for(server));
  EXPECT_EQ(client.call("get_info")["command"], "get_info");
  EXPECT_EQ(server.reliable_connection_count(), 1u);

  client.cast("set_master_volume", Json{ { "volume", 0.5 } });
  ASSERT_TRUE(wait_until([&]() { return session.count("set_master_volume") == 1; }));
  EXPECT_EQ(server.lossy_stats().m_submitted, 1u);

  // Both transports went through the same single consumer.
  EXPECT_EQ(session.max_concurrency(), 1u);
  const auto invocations = session.invocations();
  ASSERT_EQ(invocations.size(), 2u);
  EXPECT_EQ(invocations[0].m_thread_id, invocations[1].m_thread_id);
}

TEST(Server, Fifo_across_transports)
{
  Test_logger logger;
  Recording_session session;
  dispatch::Command_registry registry(&logger);
  dispatch::register_standard_commands(&registry);
  registry.register_command("hold", dispatch::Safety_tier::S_NEVER_LOSSY);
  session.delay_on("hold", milliseconds(500));

  Server server(&logger, &session, &registry, ephemeral_config());
  auto& serializer = server.serializer();

  // Occupy the consumer, so everything below queues up behind it.
  client::Client_connection holder(&logger, client_config_for(server));
  std::thread hold_thread([&]() { holder.call("hold"); });
  EXPECT_TRUE(wait_until([&]() { return session.count("hold") == 1; })); // (Threads must be joined below.)

  client::Client_connection caster(&logger, client_config_for(server));
  std::vector<boost::movelib::unique_ptr<client::Client_connection>> callers;
  std::vector<std::thread> call_threads;

  /* Alternate transports; wait for each submission to be queued before the next, so the submission order is
   * known. */
  const std::vector<std::pair<std::string, bool>> SUBMISSIONS // (name, lossy?)
    = { { "set_track_volume", true }, { "set_tempo", false }, { "set_track_pan", true },
        { "get_session_info", false }, { "fire_clip", true }, { "undo", false } };
  size_t n_queued = 0;
  for (const auto& submission : SUBMISSIONS)
  {
    const Json params{ { "seq", n_queued } };
    if (submission.second)
    {
      caster.cast(submission.first, params);
    }
    else
    {
      callers.push_back(boost::movelib::make_unique<client::Client_connection>(&logger, client_config_for(server)));
      auto& caller = *callers.back();
      const auto name = submission.first;
      call_threads.emplace_back([&caller, name, params]() { caller.call(name, params); });
    }
    ++n_queued;
    EXPECT_TRUE(wait_until([&]() { return serializer.queued() == n_queued; })) << submission.first;
  }

  hold_thread.join();
  for (auto& call_thread : call_threads)
  {
    call_thread.join();
  }
  ASSERT_TRUE(wait_until([&]() { return session.count() == SUBMISSIONS.size() + 1; }));

  const auto invocations = session.invocations();
  EXPECT_EQ(invocations[0].m_name, "hold");
  for (size_t idx = 0; idx != SUBMISSIONS.size(); ++idx)
  {
    EXPECT_EQ(invocations[idx + 1].m_name, SUBMISSIONS[idx].first);
    EXPECT_EQ(invocations[idx + 1].m_params.at("seq"), Json(idx));
  }
}

TEST(Server, Host_driven)
{
  Test_logger logger;
  Recording_session session;
  dispatch::Command_registry registry(&logger);
  dispatch::register_standard_commands(&registry);

  auto config = ephemeral_config();
  config.m_serializer_mode = dispatch::Serializer_mode::S_HOST_DRIVEN;
  Server server(&logger, &session, &registry, config);

  std::atomic<bool> done(false);
  flow::util::Thread_id host_thread_id;
  std::thread host_thread([&]()
  {
    host_thread_id = flow::util::this_thread::get_id();
    while (!done)
    {
      server.serializer().run_pending();
      flow::util::this_thread::sleep_for(milliseconds(5)); // The "frame."
    }
  });

  client::Client_connection client(&logger, client_config_for(server));
  for (int idx = 0; idx != 5; ++idx)
  {
    EXPECT_EQ(client.call("set_tempo", Json{ { "tempo", 100 + idx } })["params"]["tempo"], 100 + idx);
  }

  done = true;
  host_thread.join();

  ASSERT_EQ(session.count("set_tempo"), 5u);
  for (const auto& invocation : session.invocations())
  {
    EXPECT_EQ(invocation.m_thread_id, host_thread_id);
  }
}

TEST(Server, Bad_config)
{
  Test_logger logger;
  Recording_session session;
  dispatch::Command_registry registry(&logger);

  auto config = ephemeral_config();
  config.m_host = "not an address";
  Error_code err_code;
  Server bad_host(&logger, &session, &registry, config, &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  config = ephemeral_config();
  config.m_queue_capacity = 0;
  EXPECT_THROW({ Server bad_capacity(&logger, &session, &registry, config); }, flow::error::Runtime_error);
}

TEST(Server, Port_in_use)
{
  Test_logger logger;
  Recording_session session;
  dispatch::Command_registry registry(&logger);
  dispatch::register_standard_commands(&registry);

  Server first(&logger, &session, &registry, ephemeral_config());

  auto config = ephemeral_config();
  config.m_reliable_port = first.reliable_endpoint().port();
  Error_code err_code;
  Server second(&logger, &session, &registry, config, &err_code);
  EXPECT_TRUE(err_code);

  // The survivor is unaffected.
  client::Client_connection client(&logger, client_config_for(first));
  EXPECT_EQ(client.call("get_session_info")["command"], "get_session_info");
}

} // namespace hostctl::server::test
