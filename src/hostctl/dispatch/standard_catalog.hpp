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
#pragma once

#include "hostctl/dispatch/dispatch_fwd.hpp"

namespace hostctl::dispatch
{

// Free functions.

/**
 * Registers the host's standard command surface into `registry`, every entry using
 * Command_registry::forwarding_handler().  The lossy-eligible subset is exactly the idempotent value setters and
 * fire-style triggers:
 *   - `set_device_parameter`, `batch_set_device_parameters`;
 *   - `set_track_volume`, `set_track_pan`, `set_track_mute`, `set_track_solo`, `set_track_arm`;
 *   - `set_clip_launch_mode`, `fire_clip`;
 *   - `set_master_volume`.
 *
 * Everything else (creation/deletion, queries, transport control, undo/redo, browsing/loading) is never-lossy.
 *
 * #Error_code generated: see Command_registry::register_command().  On error, some commands may have been
 * registered.
 *
 * @param registry
 *        Unsealed registry.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.
 */
void register_standard_commands(Command_registry* registry, Error_code* err_code = 0);

/**
 * Whether the given name is in the standard catalog's lossy-eligible subset.
 *
 * @param name
 *        Command name.
 * @return See above.
 */
bool standard_command_lossy_eligible(util::String_view name);

} // namespace hostctl::dispatch
