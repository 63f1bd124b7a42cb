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

/// @cond
// -^- Doxygen, please ignore the following.  This is wacky macro magic and not a regular `#pragma once` header.

/* Modeled off the similarly-named file in Flow.  If adding/editing refresh oneself on its docs first:
 * the numeric values must stay unique and should never be reused. */

// Rarely used component corresponding to log call sites outside namespace `hostctl::X`, for all X in ::hostctl.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace hostctl::dispatch.
FLOW_LOG_CFG_COMPONENT_DEFINE(DISPATCH, 1)
// Logging from namespace hostctl::transport.
FLOW_LOG_CFG_COMPONENT_DEFINE(TRANSPORT, 2)
// Logging from namespace hostctl::client.
FLOW_LOG_CFG_COMPONENT_DEFINE(CLIENT, 3)
// Logging from namespace hostctl::server.
FLOW_LOG_CFG_COMPONENT_DEFINE(SERVER, 4)
// Logging from namespace hostctl::*::test.
FLOW_LOG_CFG_COMPONENT_DEFINE(TEST, 5)

// -v- Doxygen, please stop ignoring.
/// @endcond
