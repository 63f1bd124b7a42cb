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
#include <boost/unordered_map.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <string>

namespace hostctl::dispatch
{

// Types.

/**
 * One Command_registry entry.  Immutable once the registry is sealed.
 */
struct Command_descriptor
{
  /// Command name; equals the wire `type`.
  std::string m_name;

  /// What executes it (in the Execution_serializer's consumer context).
  Handler_func m_handler;

  /// Which transports may carry it.
  Safety_tier m_safety_tier;
}; // struct Command_descriptor

/**
 * The closed set of commands the process accepts, each with its handler and its Safety_tier.  This table is the
 * one place where transport eligibility is decided: the listeners consult classify() and act on the tier; they
 * never decide eligibility themselves.
 *
 * ### Lifecycle ###
 * Registration (register_command()) happens during startup, from one thread.  Then seal() is called (Server does
 * so automatically), after which the set is frozen: further registration fails with
 * error::Code::S_REGISTRY_SEALED.  After seal() the object is read-only and classify() may be called from any
 * number of threads concurrently with no locking.  Registering concurrently with classify() is not allowed.
 *
 * A Command_descriptor pointer returned by classify() stays valid for the lifetime of `*this`.
 */
class Command_registry :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs an empty, unsealed registry.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Command_registry(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Adds a command.
   *
   * #Error_code generated: error::Code::S_REGISTRY_SEALED, error::Code::S_REGISTRY_DUPLICATE_NAME,
   * error::Code::S_INVALID_ARGUMENT (empty name or empty handler).
   *
   * @param name
   *        Command name.
   * @param tier
   *        Its safety tier.
   * @param handler
   *        Its handler.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.
   */
  void register_command(util::String_view name, Safety_tier tier, Handler_func&& handler,
                        Error_code* err_code = 0);

  /**
   * Same as the other overload, with forwarding_handler() as the handler: the command is executed by passing its
   * name and parameters straight to Session_api::invoke().
   *
   * @param name
   *        See other overload.
   * @param tier
   *        See other overload.
   * @param err_code
   *        See other overload.
   */
  void register_command(util::String_view name, Safety_tier tier, Error_code* err_code = 0);

  /// Freezes the set of commands.  Idempotent.
  void seal();

  /**
   * Whether seal() has been called.
   * @return See above.
   */
  bool sealed() const;

  /**
   * Looks up a command by name.
   *
   * @param name
   *        Command name.
   * @return The descriptor; or null if not registered.
   */
  const Command_descriptor* classify(util::String_view name) const;

  /**
   * Number of registered commands.
   * @return See above.
   */
  size_t size() const;

  /**
   * The handler that calls `session.invoke(command.m_name, command.m_params)` and returns its result.
   * @return See above.
   */
  static Handler_func forwarding_handler();

private:
  // Types.

  /// Name to descriptor.  Stored by value; node-based, so descriptor addresses are stable.
  using Descriptor_map = boost::unordered_map<std::string, Command_descriptor>;

  // Data.

  /// All commands.
  Descriptor_map m_descriptors;

  /// Set by seal().
  std::atomic<bool> m_sealed;
}; // class Command_registry

// Free functions: in *_fwd.hpp.

} // namespace hostctl::dispatch
