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
#include "hostctl/dispatch/execution_serializer.hpp"
#include "hostctl/dispatch/command_registry.hpp"
#include "hostctl/dispatch/session_api.hpp"
#include "hostctl/error.hpp"
#include <flow/error/error.hpp>
#include <flow/async/util.hpp>
#include <boost/move/make_unique.hpp>
#include <ostream>

namespace hostctl::dispatch
{

Execution_serializer::Execution_serializer(flow::log::Logger* logger_ptr, Session_api* session, size_t capacity,
                                           Serializer_mode mode) :
  flow::log::Log_context(logger_ptr, Log_component::S_DISPATCH),
  m_session(session),
  m_capacity(capacity),
  m_mode(mode),
  m_queued(0),
  m_executed(0),
  m_stopped(false)
{
  using flow::async::Single_thread_task_loop;
  using flow::async::reset_thread_pinning;
  using boost::movelib::make_unique;

  assert(m_session && "Session_api must be non-null.");
  assert((m_capacity != 0) && "Queue capacity must be positive.");

  if (m_mode == Serializer_mode::S_OWN_THREAD)
  {
    m_worker = make_unique<Single_thread_task_loop>(get_logger(), "hostctl_exec");
    m_worker->start([this]()
    {
      reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.
      FLOW_LOG_INFO("Execution_serializer [" << *this << "]: Consumer thread started.");
    });
  }
  else
  {
    m_host_engine = make_unique<util::Task_engine>();
  }

  FLOW_LOG_INFO("Execution_serializer [" << *this << "]: Ready; capacity [" << m_capacity << "].");
} // Execution_serializer::Execution_serializer()

Execution_serializer::~Execution_serializer()
{
  stop();
}

void Execution_serializer::submit(Command&& command, On_complete_func&& on_complete, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { submit(std::move(command), std::move(on_complete), actual_err_code); },
         err_code, "Execution_serializer::submit()"))
  {
    return;
  }
  // else

  if ((!command.m_descriptor) || (!on_complete))
  {
    FLOW_LOG_WARNING("Execution_serializer [" << *this << "]: Refusing command " << command << ": not classified "
                     "or no completion handler.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else

  // Checking #m_stopped and posting must not straddle stop() setting it, or the task lands on a dead queue.
  flow::util::Lock_guard<decltype(m_submit_mutex)> lock(m_submit_mutex);
  if (m_stopped)
  {
    FLOW_LOG_TRACE("Execution_serializer [" << *this << "]: Refusing command " << command << ": stopped.");
    *err_code = error::Code::S_SERIALIZER_STOPPED;
    return;
  }
  // else

  // Reserve a slot; fail rather than wait if there is none.
  auto n_queued = m_queued.load();
  do
  {
    if (n_queued >= m_capacity)
    {
      FLOW_LOG_TRACE("Execution_serializer [" << *this << "]: Refusing command " << command << ": queue full "
                     "at [" << n_queued << "] tasks.");
      *err_code = error::Code::S_SERIALIZER_QUEUE_FULL;
      return;
    }
  }
  while (!m_queued.compare_exchange_weak(n_queued, n_queued + 1));

  FLOW_LOG_TRACE("Execution_serializer [" << *this << "]: Enqueuing command " << command << "; "
                 "[" << (n_queued + 1) << "] now queued.");

  post([this, command = std::move(command), on_complete = std::move(on_complete)]() mutable
  {
    // We are in the consumer context.
    execute(command, on_complete);
  });
  err_code->clear();
} // Execution_serializer::submit()

void Execution_serializer::post(util::Task&& task)
{
  if (m_worker)
  {
    m_worker->post(std::move(task));
  }
  else
  {
    boost::asio::post(*m_host_engine, std::move(task));
  }
}

void Execution_serializer::execute(Command& command, const On_complete_func& on_complete)
{
  --m_queued;

  Response response;
  if (m_stopped)
  {
    FLOW_LOG_TRACE("Execution_serializer [" << *this << "]: Not executing command " << command << ": stopped.");
    response = Response::failure(error::Code::S_SERIALIZER_STOPPED, "Server is shutting down");
  }
  else
  {
    FLOW_LOG_TRACE("Execution_serializer [" << *this << "]: Executing command " << command << ".");
    try
    {
      response = Response::success(command.m_descriptor->m_handler(*m_session, command));
    }
    catch (const std::exception& exc)
    {
      FLOW_LOG_WARNING("Execution_serializer [" << *this << "]: Handler for command " << command << " "
                       "threw: [" << exc.what() << "].  Converting to error response; continuing.");
      response = Response::failure(error::Code::S_HANDLER_FAILED, exc.what());
    }
    ++m_executed;
  }

  response.m_correlation = std::move(command.m_correlation);
  on_complete(std::move(response));
} // Execution_serializer::execute()

size_t Execution_serializer::run_pending(size_t max_tasks)
{
  if (!m_host_engine)
  {
    FLOW_LOG_WARNING("Execution_serializer [" << *this << "]: run_pending() called, but the serializer drains "
                     "itself in its own thread.  Ignoring.");
    return 0;
  }
  // else

  // poll() and friends return immediately once out of ready handlers; restart() lets the next call proceed.
  m_host_engine->restart();
  if (max_tasks == 0)
  {
    return m_host_engine->poll();
  }
  // else
  size_t n_ran = 0;
  while ((n_ran != max_tasks) && (m_host_engine->poll_one() != 0))
  {
    ++n_ran;
  }
  return n_ran;
} // Execution_serializer::run_pending()

void Execution_serializer::stop()
{
  using flow::async::Single_thread_task_loop;

  {
    flow::util::Lock_guard<decltype(m_submit_mutex)> lock(m_submit_mutex);
    if (m_stopped.exchange(true))
    {
      return;
    }
  }
  // From now on no submit() posts; whatever it did post is answered below.

  FLOW_LOG_INFO("Execution_serializer [" << *this << "]: Stopping; [" << m_queued << "] tasks still queued will "
                "be answered with an error and not executed.");

  size_t n_drained = 0;
  if (m_worker)
  {
    m_worker->stop();
    // Consumer thread is (synchronously!) no more.

    // Run leftover handlers from a transient thread; they post completions but must not execute handlers.
    Single_thread_task_loop one_thread(get_logger(), "hostctl_exec_fin");
    one_thread.start([&]() { n_drained = drain_after_stop(m_worker->task_engine().get()); });
  }
  else
  {
    n_drained = drain_after_stop(m_host_engine.get());
  }

  FLOW_LOG_INFO("Execution_serializer [" << *this << "]: Stopped.  Answered [" << n_drained << "] leftover "
                "tasks; executed [" << m_executed << "] in total.");
} // Execution_serializer::stop()

size_t Execution_serializer::drain_after_stop(util::Task_engine* task_engine)
{
  task_engine->restart();
  const auto count = task_engine->poll();
  task_engine->stop();
  return count;
}

bool Execution_serializer::stopped() const
{
  return m_stopped;
}

size_t Execution_serializer::queued() const
{
  return m_queued;
}

size_t Execution_serializer::capacity() const
{
  return m_capacity;
}

uint64_t Execution_serializer::executed_count() const
{
  return m_executed;
}

Serializer_mode Execution_serializer::mode() const
{
  return m_mode;
}

std::ostream& operator<<(std::ostream& os, Serializer_mode val)
{
  return os << ((val == Serializer_mode::S_OWN_THREAD) ? "own-thread" : "host-driven");
}

std::ostream& operator<<(std::ostream& os, const Execution_serializer& val)
{
  return os << '[' << val.mode() << "]@" << static_cast<const void*>(&val);
}

} // namespace hostctl::dispatch
