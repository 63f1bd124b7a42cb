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

/// @file
#include "hostctl/dispatch/standard_catalog.hpp"
#include "hostctl/dispatch/command_registry.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <iterator>

namespace hostctl::dispatch
{

namespace
{

/// Lossy-eligible: last-write-wins setters and fire-style triggers.
const char* const S_LOSSY_ELIGIBLE_NAMES[] =
{
  "set_device_parameter",
  "batch_set_device_parameters",
  "set_track_volume",
  "set_track_pan",
  "set_track_mute",
  "set_track_solo",
  "set_track_arm",
  "set_clip_launch_mode",
  "fire_clip",
  "set_master_volume"
};

/// Never-lossy.
const char* const S_NEVER_LOSSY_NAMES[] =
{
  // Queries.
  "get_session_info",
  "get_track_info",
  "get_device_parameters",
  "get_playhead_position",
  "get_clip_notes",
  "get_clip_follow_actions",
  "get_master_track_info",
  "get_return_tracks",
  "get_all_tracks",
  "get_all_scenes",
  "get_session_overview",
  "get_all_clips_in_track",
  "get_clip_envelopes",
  "get_clip_warp_markers",
  "get_browser_item",
  "get_browser_categories",
  "get_browser_items",
  "get_browser_tree",
  "get_browser_items_at_path",

  // Creation/deletion/structure.
  "create_midi_track",
  "create_audio_track",
  "delete_track",
  "delete_all_tracks",
  "duplicate_track",
  "group_tracks",
  "ungroup_tracks",
  "create_scene",
  "delete_scene",
  "duplicate_scene",
  "create_clip",
  "delete_clip",
  "duplicate_clip",
  "duplicate_clip_to",
  "move_clip",
  "crop_clip",
  "resize_clip",
  "stretch_clip",
  "mix_clip",
  "quantize_clip",
  "transpose_clip",
  "add_notes_to_clip",
  "delete_notes_from_clip",
  "set_note_velocity",
  "set_note_duration",
  "set_note_pitch",
  "delete_device",
  "duplicate_device",
  "move_device",
  "create_locator",
  "delete_locator",
  "add_warp_marker",
  "delete_warp_marker",
  "add_automation_point",
  "clear_automation",

  // Naming/settings whose loss is not silently corrected.
  "set_track_name",
  "set_track_color",
  "set_track_fold",
  "set_track_monitoring_state",
  "set_scene_name",
  "set_clip_name",
  "set_clip_loop",
  "set_clip_warp_mode",
  "set_clip_follow_action",
  "set_tempo",
  "set_time_signature",
  "set_metronome",
  "set_loop",
  "toggle_device_bypass",

  // Transport control.
  "start_playback",
  "stop_playback",
  "start_recording",
  "stop_recording",
  "stop_clip",
  "fire_scene",
  "set_playhead_position",
  "jump_to_locator",

  // Undo/redo; browsing/loading; maintenance.
  "undo",
  "redo",
  "load_browser_item",
  "load_instrument_or_effect",
  "load_instrument_preset",
  "reload_script"
};

} // namespace (anon)

void register_standard_commands(Command_registry* registry, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { register_standard_commands(registry, actual_err_code); },
         err_code, "dispatch::register_standard_commands()"))
  {
    return;
  }
  // else
  assert(registry);

  for (const auto name : S_LOSSY_ELIGIBLE_NAMES)
  {
    registry->register_command(name, Safety_tier::S_LOSSY_ELIGIBLE, err_code);
    if (*err_code)
    {
      return;
    }
  }
  for (const auto name : S_NEVER_LOSSY_NAMES)
  {
    registry->register_command(name, Safety_tier::S_NEVER_LOSSY, err_code);
    if (*err_code)
    {
      return;
    }
  }
} // register_standard_commands()

bool standard_command_lossy_eligible(util::String_view name)
{
  return std::find_if(std::begin(S_LOSSY_ELIGIBLE_NAMES), std::end(S_LOSSY_ELIGIBLE_NAMES),
                      [&](const char* candidate) { return name == util::String_view(candidate); })
         != std::end(S_LOSSY_ELIGIBLE_NAMES);
}

} // namespace hostctl::dispatch
