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
#include <string>

namespace hostctl::dispatch
{

/**
 * The host's own state-mutation surface, injected into hostctl.  hostctl does not own host state and does not
 * implement any command's domain logic; every registered handler ultimately reaches the host through this.
 *
 * ### Thread safety ###
 * invoke() is called only from the Execution_serializer's consumer context; hence never concurrently with itself.
 * Implementations need no locking on account of hostctl.
 *
 * ### Errors ###
 * Report failure by throwing a type derived from `std::exception`; its `what()` becomes the error Response message.
 * An invoke() may run even though nobody will observe its result (its reliable requester timed out or
 * disconnected); it must tolerate that.
 */
class Session_api
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Session_api();

  // Methods.

  /**
   * Executes the named command against host state.
   *
   * @param command_name
   *        Registered command name.
   * @param params
   *        Parameters; always a JSON object (possibly empty).
   * @return Result value; any JSON.  `null` is fine.
   */
  virtual Json invoke(const std::string& command_name, const Json& params) = 0;
}; // class Session_api

} // namespace hostctl::dispatch
