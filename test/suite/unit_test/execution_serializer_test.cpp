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

#include "hostctl/dispatch/execution_serializer.hpp"
#include "hostctl/dispatch/command_registry.hpp"
#include "hostctl/dispatch/command.hpp"
#include "hostctl/error.hpp"
#include "hostctl/test/test_logger.hpp"
#include "hostctl/test/recording_session.hpp"
#include "hostctl/test/test_common_util.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>

namespace hostctl::dispatch::test
{

using hostctl::test::Test_logger;
using hostctl::test::Recording_session;
using hostctl::test::wait_until;
using flow::util::Lock_guard;
using flow::util::Mutex_non_recursive;

namespace
{

/// Registry + session + a place to collect Responses; the usual fixture.
class Execution_serializer_test :
  public ::testing::Test
{
protected:
  Execution_serializer_test() :
    m_registry(&m_logger)
  {
    for (const auto name : { "step", "slow", "boom" })
    {
      m_registry.register_command(name, Safety_tier::S_NEVER_LOSSY);
    }
    m_registry.seal();
    m_session.throw_on("boom", "kaboom");
    m_session.delay_on("slow", boost::chrono::milliseconds(20));
  }

  Command make_command(const std::string& name, int seq) const
  {
    Command command;
    command.m_name = name;
    command.m_params = Json{ { "seq", seq } };
    command.m_correlation = Json(seq);
    command.m_descriptor = m_registry.classify(name);
    return command;
  }

  Execution_serializer::On_complete_func collector()
  {
    return [this](Response&& response)
    {
      Lock_guard<Mutex_non_recursive> lock(m_mutex);
      m_responses.push_back(std::move(response));
    };
  }

  size_t n_responses() const
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    return m_responses.size();
  }

  std::vector<Response> responses() const
  {
    Lock_guard<Mutex_non_recursive> lock(m_mutex);
    return m_responses;
  }

  Test_logger m_logger;
  Command_registry m_registry;
  Recording_session m_session;
  mutable Mutex_non_recursive m_mutex;
  std::vector<Response> m_responses;
}; // class Execution_serializer_test

} // namespace (anon)

TEST_F(Execution_serializer_test, Executes_in_submission_order_on_one_thread)
{
  const int N = 60;
  Execution_serializer serializer(&m_logger, &m_session, 1000);
  EXPECT_EQ(serializer.mode(), Serializer_mode::S_OWN_THREAD);

  for (int seq = 0; seq != N; ++seq)
  {
    // Every 7th takes a while; FIFO must hold regardless.
    serializer.submit(make_command(((seq % 7) == 0) ? "slow" : "step", seq), collector());
  }

  ASSERT_TRUE(wait_until([&]() { return n_responses() == N; }));

  const auto invocations = m_session.invocations();
  ASSERT_EQ(invocations.size(), size_t(N));
  for (int seq = 0; seq != N; ++seq)
  {
    EXPECT_EQ(invocations[seq].m_params.at("seq"), Json(seq));
    EXPECT_EQ(invocations[seq].m_thread_id, invocations[0].m_thread_id);
  }
  EXPECT_NE(invocations[0].m_thread_id, flow::util::this_thread::get_id());
  EXPECT_EQ(m_session.max_concurrency(), 1u);

  const auto all_responses = responses();
  for (int seq = 0; seq != N; ++seq)
  {
    ASSERT_TRUE(all_responses[seq].ok());
    ASSERT_TRUE(all_responses[seq].m_correlation);
    EXPECT_EQ(*all_responses[seq].m_correlation, Json(seq)); // Completion order too.
  }
  EXPECT_EQ(serializer.executed_count(), uint64_t(N));
}

TEST_F(Execution_serializer_test, Global_fifo_across_producers)
{
  const int N_PRODUCERS = 4;
  const int N_EACH = 100;
  Execution_serializer serializer(&m_logger, &m_session, N_PRODUCERS * N_EACH);

  // The submission order is whatever order submit() was reached in; record it under the same lock.
  Mutex_non_recursive submit_mutex;
  std::vector<int> submitted;

  std::vector<std::thread> producers;
  for (int producer = 0; producer != N_PRODUCERS; ++producer)
  {
    producers.emplace_back([&, producer]()
    {
      for (int idx = 0; idx != N_EACH; ++idx)
      {
        const int seq = (producer * N_EACH) + idx;
        Lock_guard<Mutex_non_recursive> lock(submit_mutex);
        serializer.submit(make_command(((idx % 25) == 0) ? "slow" : "step", seq), collector());
        submitted.push_back(seq);
      }
    });
  }
  for (auto& producer : producers)
  {
    producer.join();
  }

  ASSERT_TRUE(wait_until([&]() { return n_responses() == (N_PRODUCERS * N_EACH); }, boost::chrono::seconds(20)));

  const auto invocations = m_session.invocations();
  ASSERT_EQ(invocations.size(), submitted.size());
  for (size_t idx = 0; idx != submitted.size(); ++idx)
  {
    ASSERT_EQ(invocations[idx].m_params.at("seq"), Json(submitted[idx])) << "position [" << idx << "]";
  }
  EXPECT_EQ(m_session.max_concurrency(), 1u);
}

TEST_F(Execution_serializer_test, Handler_exception_becomes_error_response)
{
  Execution_serializer serializer(&m_logger, &m_session, 10);

  serializer.submit(make_command("boom", 1), collector());
  serializer.submit(make_command("step", 2), collector());
  ASSERT_TRUE(wait_until([&]() { return n_responses() == 2; }));

  const auto all_responses = responses();
  EXPECT_FALSE(all_responses[0].ok());
  EXPECT_EQ(all_responses[0].m_message, "kaboom");
  EXPECT_EQ(all_responses[0].m_err_code, error::Code::S_HANDLER_FAILED);
  EXPECT_EQ(*all_responses[0].m_correlation, Json(1));

  EXPECT_TRUE(all_responses[1].ok()); // The loop survived.
  EXPECT_EQ(all_responses[1].m_result.at("params").at("seq"), Json(2));
  EXPECT_GE(m_logger.warning_count("kaboom"), 1u);
}

TEST_F(Execution_serializer_test, Host_driven_runs_only_in_run_pending)
{
  Execution_serializer serializer(&m_logger, &m_session, 10, Serializer_mode::S_HOST_DRIVEN);

  for (int seq = 0; seq != 3; ++seq)
  {
    serializer.submit(make_command("step", seq), collector());
  }
  flow::util::this_thread::sleep_for(boost::chrono::milliseconds(20));
  EXPECT_EQ(m_session.count(), 0u);
  EXPECT_EQ(serializer.queued(), 3u);

  EXPECT_EQ(serializer.run_pending(1), 1u);
  EXPECT_EQ(m_session.count(), 1u);
  EXPECT_EQ(n_responses(), 1u); // on_complete ran right there, too.

  EXPECT_EQ(serializer.run_pending(), 2u);
  EXPECT_EQ(serializer.run_pending(), 0u);

  const auto invocations = m_session.invocations();
  ASSERT_EQ(invocations.size(), 3u);
  for (const auto& invocation : invocations)
  {
    EXPECT_EQ(invocation.m_thread_id, flow::util::this_thread::get_id());
  }
  EXPECT_EQ(serializer.queued(), 0u);
}

TEST_F(Execution_serializer_test, Full_queue_refuses)
{
  Execution_serializer serializer(&m_logger, &m_session, 2, Serializer_mode::S_HOST_DRIVEN);
  EXPECT_EQ(serializer.capacity(), 2u);

  Error_code err_code;
  serializer.submit(make_command("step", 0), collector(), &err_code);
  EXPECT_FALSE(err_code);
  serializer.submit(make_command("step", 1), collector(), &err_code);
  EXPECT_FALSE(err_code);
  serializer.submit(make_command("step", 2), collector(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_SERIALIZER_QUEUE_FULL);

  EXPECT_EQ(serializer.run_pending(), 2u);
  serializer.submit(make_command("step", 3), collector(), &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(serializer.run_pending(), 1u);

  const auto all_responses = responses();
  ASSERT_EQ(all_responses.size(), 3u);
  EXPECT_EQ(*all_responses[2].m_correlation, Json(3)); // The refused one never ran.
}

TEST_F(Execution_serializer_test, Stop_answers_leftovers_without_executing)
{
  Execution_serializer serializer(&m_logger, &m_session, 10, Serializer_mode::S_HOST_DRIVEN);
  for (int seq = 0; seq != 3; ++seq)
  {
    serializer.submit(make_command("step", seq), collector());
  }

  serializer.stop();
  EXPECT_TRUE(serializer.stopped());
  EXPECT_EQ(m_session.count(), 0u);
  const auto all_responses = responses();
  ASSERT_EQ(all_responses.size(), 3u);
  for (const auto& response : all_responses)
  {
    EXPECT_FALSE(response.ok());
    EXPECT_EQ(response.m_err_code, error::Code::S_SERIALIZER_STOPPED);
  }

  Error_code err_code;
  serializer.submit(make_command("step", 9), collector(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_SERIALIZER_STOPPED);
  serializer.stop(); // Harmless.
}

TEST_F(Execution_serializer_test, Stop_racing_submitters_answers_every_accepted_command)
{
  const int N_PRODUCERS = 4;

  for (int round = 0; round != 20; ++round)
  {
    Execution_serializer serializer(&m_logger, &m_session, 100000);
    std::atomic<bool> go(false);
    std::atomic<uint64_t> n_accepted(0);
    std::atomic<uint64_t> n_answered(0);

    std::vector<std::thread> producers;
    for (int producer_idx = 0; producer_idx != N_PRODUCERS; ++producer_idx)
    {
      producers.emplace_back([&]()
      {
        while (!go) {}
        for (int seq = 0; seq != 2000; ++seq)
        {
          Error_code err_code;
          serializer.submit(make_command("step", seq), [&](Response&&) { ++n_answered; }, &err_code);
          if (err_code)
          {
            EXPECT_EQ(err_code, error::Code::S_SERIALIZER_STOPPED);
            return;
          }
          // else
          ++n_accepted;
        }
      });
    }

    go = true;
    flow::util::this_thread::sleep_for(boost::chrono::microseconds(200 * round));
    serializer.stop();
    for (auto& producer : producers)
    {
      producer.join();
    }

    // Nothing accepted may have slipped past stop() unanswered.
    EXPECT_EQ(n_answered, n_accepted) << "Round [" << round << "].";
  }
}

TEST_F(Execution_serializer_test, Own_thread_stop_is_clean)
{
  {
    Execution_serializer serializer(&m_logger, &m_session, 100);
    for (int seq = 0; seq != 20; ++seq)
    {
      serializer.submit(make_command("slow", seq), collector());
    }
  } // Destructor stops while most are still queued.

  // Every accepted task got exactly one answer: executed or refused.
  const auto all_responses = responses();
  ASSERT_EQ(all_responses.size(), 20u);
  size_t n_ok = 0;
  for (const auto& response : all_responses)
  {
    if (response.ok())
    {
      ++n_ok;
    }
    else
    {
      EXPECT_EQ(response.m_err_code, error::Code::S_SERIALIZER_STOPPED);
    }
  }
  EXPECT_EQ(n_ok, m_session.count());
}

TEST_F(Execution_serializer_test, Bad_submissions)
{
  Execution_serializer serializer(&m_logger, &m_session, 10, Serializer_mode::S_HOST_DRIVEN);
  Error_code err_code;

  Command unclassified;
  unclassified.m_name = "step";
  serializer.submit(std::move(unclassified), collector(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);

  serializer.submit(make_command("step", 0), Execution_serializer::On_complete_func(), &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
  EXPECT_EQ(serializer.queued(), 0u);
}

TEST_F(Execution_serializer_test, Run_pending_ignored_in_own_thread_mode)
{
  Execution_serializer serializer(&m_logger, &m_session, 10);
  EXPECT_EQ(serializer.run_pending(), 0u);
  EXPECT_EQ(m_logger.warning_count("run_pending"), 1u);
}

} // namespace hostctl::dispatch::test
