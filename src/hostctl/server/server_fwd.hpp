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

#include "hostctl/transport/transport_fwd.hpp"

/**
 * hostctl module that wires dispatch and transport into one object: Server.  A host constructs its
 * dispatch::Session_api and dispatch::Command_registry, fills a Server_config (possibly via parse_server_config()),
 * and constructs a Server; destroying it shuts everything down.
 */
namespace hostctl::server
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Server_config;
class Server;

// Free functions.

/**
 * Prints string representation of the given Server to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Server& val);

/**
 * Prints string representation of the given Server_config to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Server_config& val);

} // namespace hostctl::server
