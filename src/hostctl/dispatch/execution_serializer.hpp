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

#include "hostctl/dispatch/command.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>

namespace hostctl::dispatch
{

/**
 * The single choke point at which Command objects touch host state: a bounded multi-producer, single-consumer FIFO
 * of pending tasks, each executed exactly once, one at a time, against the injected Session_api.
 *
 * Any number of producers (each reliable connection, the lossy receive loop) call submit() concurrently.  submit()
 * never blocks: it either enqueues or fails immediately.  The consumer dequeues in FIFO order and runs each
 * Command's handler to completion (return or throw) before starting the next; hence Session_api::invoke() is never
 * entered concurrently with itself.  Then it hands the Response to the task's `on_complete` *from the consumer
 * context*; a producer that wants to wait for it arranges its own hop back (the reliable listener posts onto its
 * connection's loop; the lossy listener passes a no-op).
 *
 * ### Ordering ###
 * Execution order equals submission order across all producers combined (one global FIFO).  A slow Command thus
 * delays every Command submitted after it, regardless of connection or transport.  No relative order between the two
 * transports is promised beyond that: their submissions simply interleave in whatever order submit() was reached.
 *
 * ### Consumer context ###
 * Serializer_mode::S_OWN_THREAD: a dedicated thread is started in the constructor and drains the queue.
 * Serializer_mode::S_HOST_DRIVEN: nothing is drained until the host calls run_pending() from the one context where it
 * permits state mutation (typically each tick of its main loop).  run_pending() must always be called from that same
 * one thread.
 *
 * ### Backpressure ###
 * At most `capacity` tasks may be pending (queued, not yet started).  When full, submit() fails with
 * error::Code::S_SERIALIZER_QUEUE_FULL and the task is not accepted: the policy is reject, never block.
 *
 * ### Failures ###
 * A handler exception (any `std::exception`) is caught for that one Command, logged, and turned into an error
 * Response with the exception's `what()` as message.  It never ends the consumer loop or affects other Commands.
 *
 * ### Shutdown ###
 * stop() (or the destructor) refuses further submissions; any accepted-but-not-started tasks are not executed; each
 * gets an error Response (error::Code::S_SERIALIZER_STOPPED) so every reliable requester still gets its one answer.
 */
class Execution_serializer :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /**
   * Called exactly once per accepted Command, from the consumer context, with its Response.  Must not block for
   * long: every later Command waits behind it.
   */
  using On_complete_func = Function<void (Response&& response)>;

  // Constructors/destructor.

  /**
   * Constructs the serializer.  In Serializer_mode::S_OWN_THREAD, the consumer thread is running upon return.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param session
   *        The host; must outlive `*this`.  Touched only from the consumer context.
   * @param capacity
   *        Max pending tasks; must be positive.
   * @param mode
   *        See class doc header.
   */
  explicit Execution_serializer(flow::log::Logger* logger_ptr, Session_api* session, size_t capacity,
                                Serializer_mode mode = Serializer_mode::S_OWN_THREAD);

  /// Executes stop().  In Serializer_mode::S_OWN_THREAD joins the consumer thread.
  ~Execution_serializer();

  // Methods.

  /**
   * Enqueues `command` for execution; `on_complete` will later receive its Response.  Thread-safe; non-blocking.
   *
   * #Error_code generated: error::Code::S_SERIALIZER_QUEUE_FULL, error::Code::S_SERIALIZER_STOPPED,
   * error::Code::S_INVALID_ARGUMENT (`command` was not classified, i.e., no `m_descriptor`; or empty `on_complete`).
   * On error, nothing was enqueued, and `on_complete` will not be called.
   *
   * @param command
   *        Classified Command.  Moved-from on success.
   * @param on_complete
   *        See #On_complete_func.  Moved-from on success.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.
   */
  void submit(Command&& command, On_complete_func&& on_complete, Error_code* err_code = 0);

  /**
   * Serializer_mode::S_HOST_DRIVEN only: executes up to `max_tasks` ready tasks (all ready tasks if 0) in the calling
   * context and returns how many ran.  Never waits for a task to arrive.  In Serializer_mode::S_OWN_THREAD this is a
   * no-op returning 0.
   *
   * @param max_tasks
   *        See above.
   * @return See above.
   */
  size_t run_pending(size_t max_tasks = 0);

  /**
   * Refuses further submit()s and answers every not-yet-started task with error::Code::S_SERIALIZER_STOPPED.  A
   * task in progress in another thread finishes first (own-thread mode joins it).  Idempotent.
   *
   * In Serializer_mode::S_HOST_DRIVEN it must not be called concurrently with run_pending().  Must not be called
   * from the consumer context.
   */
  void stop();

  /**
   * Whether stop() has been called.
   * @return See above.
   */
  bool stopped() const;

  /**
   * Tasks accepted but not yet started.
   * @return See above.
   */
  size_t queued() const;

  /**
   * Max of queued().
   * @return See above.
   */
  size_t capacity() const;

  /**
   * Commands whose handler has been run (successfully or not) so far.
   * @return See above.
   */
  uint64_t executed_count() const;

  /**
   * The mode given to constructor.
   * @return See above.
   */
  Serializer_mode mode() const;

private:
  // Methods.

  /**
   * The pending task body: runs `command`'s handler (or not, if stopped) and passes the Response to
   * `on_complete`.  Consumer context.
   *
   * @param command
   *        Command.
   * @param on_complete
   *        Completion.
   */
  void execute(Command& command, const On_complete_func& on_complete);

  /**
   * Posts the task onto the consumer's queue.
   *
   * @param task
   *        Task.
   */
  void post(util::Task&& task);

  /**
   * Runs (in the calling thread) the tasks still enqueued after the consumer has stopped, so each gets its error
   * Response.
   *
   * @param task_engine
   *        Engine holding them.
   * @return How many ran.
   */
  size_t drain_after_stop(util::Task_engine* task_engine);

  // Data.

  /// See constructor.
  Session_api* const m_session;

  /// See constructor.
  const size_t m_capacity;

  /// See constructor.
  const Serializer_mode m_mode;

  /// See queued().
  std::atomic<size_t> m_queued;

  /// See executed_count().
  std::atomic<uint64_t> m_executed;

  /// See stopped().
  std::atomic<bool> m_stopped;

  /// Makes submit()'s check of #m_stopped and its post atomic with respect to stop() setting #m_stopped.
  flow::util::Mutex_non_recursive m_submit_mutex;

  /// Serializer_mode::S_OWN_THREAD: the consumer thread and its queue.  Else null.
  boost::movelib::unique_ptr<flow::async::Single_thread_task_loop> m_worker;

  /// Serializer_mode::S_HOST_DRIVEN: the queue, drained by run_pending().  Else null.
  boost::movelib::unique_ptr<util::Task_engine> m_host_engine;
}; // class Execution_serializer

} // namespace hostctl::dispatch
