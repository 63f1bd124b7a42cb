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

#include "hostctl/dispatch/command_registry.hpp"
#include "hostctl/dispatch/standard_catalog.hpp"
#include "hostctl/dispatch/command.hpp"
#include "hostctl/error.hpp"
#include "hostctl/test/test_logger.hpp"
#include "hostctl/test/recording_session.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>

namespace hostctl::dispatch::test
{

using hostctl::test::Test_logger;
using hostctl::test::Recording_session;

TEST(Command_registry, Classifies_registered_names)
{
  Test_logger logger;
  Command_registry registry(&logger);
  registry.register_command("set_track_volume", Safety_tier::S_LOSSY_ELIGIBLE);
  registry.register_command("create_midi_track", Safety_tier::S_NEVER_LOSSY);
  registry.seal();

  EXPECT_TRUE(registry.sealed());
  EXPECT_EQ(registry.size(), 2u);

  const auto* descriptor = registry.classify("set_track_volume");
  ASSERT_NE(descriptor, nullptr);
  EXPECT_EQ(descriptor->m_name, "set_track_volume");
  EXPECT_EQ(descriptor->m_safety_tier, Safety_tier::S_LOSSY_ELIGIBLE);

  descriptor = registry.classify("create_midi_track");
  ASSERT_NE(descriptor, nullptr);
  EXPECT_EQ(descriptor->m_safety_tier, Safety_tier::S_NEVER_LOSSY);

  EXPECT_EQ(registry.classify("no_such_command"), nullptr);
  EXPECT_EQ(registry.classify(""), nullptr);
}

TEST(Command_registry, Registration_errors)
{
  Test_logger logger;
  Command_registry registry(&logger);
  Error_code err_code;

  registry.register_command("undo", Safety_tier::S_NEVER_LOSSY, &err_code);
  EXPECT_FALSE(err_code);

  registry.register_command("undo", Safety_tier::S_LOSSY_ELIGIBLE, &err_code);
  EXPECT_EQ(err_code, error::Code::S_REGISTRY_DUPLICATE_NAME);
  EXPECT_EQ(registry.classify("undo")->m_safety_tier, Safety_tier::S_NEVER_LOSSY); // First one stands.

  registry.register_command("", Safety_tier::S_NEVER_LOSSY, &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  registry.register_command("x", Safety_tier::S_NEVER_LOSSY, Handler_func(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  registry.seal();
  registry.register_command("redo", Safety_tier::S_NEVER_LOSSY, &err_code);
  EXPECT_EQ(err_code, error::Code::S_REGISTRY_SEALED);
  EXPECT_EQ(registry.classify("redo"), nullptr);

  // Null err_code => throw.
  EXPECT_THROW(registry.register_command("redo", Safety_tier::S_NEVER_LOSSY), flow::error::Runtime_error);
}

TEST(Command_registry, Forwarding_handler_invokes_session)
{
  Recording_session session;
  Command command;
  command.m_name = "set_tempo";
  command.m_params = Json{ { "tempo", 99 } };

  const auto result = Command_registry::forwarding_handler()(session, command);
  EXPECT_EQ(result, (Json{ { "command", "set_tempo" }, { "params", { { "tempo", 99 } } } }));
  ASSERT_EQ(session.count(), 1u);
  EXPECT_EQ(session.last_params("set_tempo"), command.m_params);
}

TEST(Command_registry, Custom_handler_is_kept)
{
  Test_logger logger;
  Command_registry registry(&logger);
  registry.register_command("ping", Safety_tier::S_NEVER_LOSSY,
                            [](Session_api&, const Command&) -> Json { return "pong"; });
  registry.seal();

  Recording_session session;
  Command command;
  command.m_name = "ping";
  EXPECT_EQ(registry.classify("ping")->m_handler(session, command), Json("pong"));
  EXPECT_EQ(session.count(), 0u);
}

TEST(Standard_catalog, Tiers)
{
  Test_logger logger;
  Command_registry registry(&logger);
  register_standard_commands(&registry);
  registry.seal();

  const char* const LOSSY[] = { "set_device_parameter", "batch_set_device_parameters", "set_track_volume",
                                "set_track_pan", "set_track_mute", "set_track_solo", "set_track_arm",
                                "set_clip_launch_mode", "fire_clip", "set_master_volume" };
  size_t n_lossy = 0;
  for (const auto name : LOSSY)
  {
    const auto* descriptor = registry.classify(name);
    ASSERT_NE(descriptor, nullptr) << name;
    EXPECT_EQ(descriptor->m_safety_tier, Safety_tier::S_LOSSY_ELIGIBLE) << name;
    EXPECT_TRUE(standard_command_lossy_eligible(name)) << name;
    ++n_lossy;
  }

  // Representative never-lossy members: creation/deletion, queries, transport, undo/redo, loading.
  for (const auto name : { "create_midi_track", "delete_track", "get_session_info", "get_track_info",
                           "start_playback", "stop_playback", "start_recording", "undo", "redo",
                           "load_browser_item", "set_tempo" })
  {
    const auto* descriptor = registry.classify(name);
    ASSERT_NE(descriptor, nullptr) << name;
    EXPECT_EQ(descriptor->m_safety_tier, Safety_tier::S_NEVER_LOSSY) << name;
    EXPECT_FALSE(standard_command_lossy_eligible(name)) << name;
  }

  EXPECT_GT(registry.size(), n_lossy);
  EXPECT_FALSE(standard_command_lossy_eligible("no_such_command"));
}

TEST(Standard_catalog, Twice_is_duplicate)
{
  Test_logger logger;
  Command_registry registry(&logger);
  register_standard_commands(&registry);
  Error_code err_code;
  register_standard_commands(&registry, &err_code);
  EXPECT_EQ(err_code, error::Code::S_REGISTRY_DUPLICATE_NAME);
}

} // namespace hostctl::dispatch::test
