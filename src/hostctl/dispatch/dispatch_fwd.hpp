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

#include "hostctl/util/util_fwd.hpp"
#include <iosfwd>

/**
 * hostctl module containing the transport-agnostic core: what a command is, which commands exist and over which
 * transport each may legally travel, and the single execution context in which they run against the host.
 *
 * The listeners in hostctl::transport are producers; the Execution_serializer is the one consumer.  Nothing in
 * this namespace knows about sockets.
 */
namespace hostctl::dispatch
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Command;
struct Response;
struct Command_descriptor;
class Command_registry;
class Session_api;
class Execution_serializer;

/// Which transport carried a Command into the process.
enum class Transport
{
  /// Connection-oriented; exactly one Response per request.
  S_RELIABLE,
  /// Connectionless, best-effort; no Response ever.
  S_LOSSY
};

/**
 * Per-command classification determining which transport may legally carry it.  Stored once, centrally, in
 * Command_registry; listeners never make their own eligibility decisions.
 *
 * A lossy sender gets no acknowledgment and there is no retry, so a command may be #S_LOSSY_ELIGIBLE only if
 * repeated application converges regardless of which intermediate submissions were dropped: idempotent
 * last-write-wins value setters, reversible toggles, trigger-style fires.
 */
enum class Safety_tier
{
  /**
   * State creation/deletion, anything returning a value, transport control (record/play/stop), undo/redo,
   * anything with irreversible side effects.  Rejected (never executed) if it arrives over the lossy transport.
   */
  S_NEVER_LOSSY,
  /// Idempotent, high-frequency, reversible setters and fire-style triggers.  Either transport.
  S_LOSSY_ELIGIBLE
};

/**
 * How the Execution_serializer's single consumer context is realized.
 */
enum class Serializer_mode
{
  /// The serializer starts and owns one dedicated consumer thread.
  S_OWN_THREAD,
  /**
   * The host drains the queue itself by calling Execution_serializer::run_pending() from the one context in
   * which it permits state mutation (e.g., its main/render loop or its own message-scheduling callback).
   */
  S_HOST_DRIVEN
};

/**
 * Handler bound to a command name in Command_registry.  Invoked only from the Execution_serializer's consumer
 * context.  Returns the result value; throws (a `std::exception`-derived type) to report failure.
 */
using Handler_func = Function<Json (Session_api& session, const Command& command)>;

// Free functions.

/**
 * Prints string representation of the given Transport to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Transport val);

/**
 * Prints string representation of the given Safety_tier to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Safety_tier val);

/**
 * Prints string representation of the given Serializer_mode to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Serializer_mode val);

/**
 * Prints string representation of the given Command (name, transport; not the parameters) to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Command& val);

/**
 * Prints string representation of the given Execution_serializer to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Execution_serializer& val);

} // namespace hostctl::dispatch
