/**                                                                                           //
 * Copyright (c) 2015-2017, The Kovri I2P Router Project                                      //
 *                                                                                            //
 * All rights reserved.                                                                       //
 *                                                                                            //
 * Redistribution and use in source and binary forms, with or without modification, are       //
 * permitted provided that the following conditions are met:                                  //
 *                                                                                            //
 * 1. Redistributions of source code must retain the above copyright notice, this list of     //
 *    conditions and the following disclaimer.                                                //
 *                                                                                            //
 * 2. Redistributions in binary form must reproduce the above copyright notice, this list     //
 *    of conditions and the following disclaimer in the documentation and/or other            //
 *    materials provided with the distribution.                                               //
 *                                                                                            //
 * 3. Neither the name of the copyright holder nor the names of its contributors may be       //
 *    used to endorse or promote products derived from this software without specific         //
 *    prior written permission.                                                               //
 *                                                                                            //
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY        //
 * EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF    //
 * MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL     //
 * THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,       //
 * SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,               //
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS    //
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,          //
 * STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF    //
 * THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.               //
 */

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#include <chrono>

#include "core/congestion/algorithm.h"
#include "core/congestion/rtt.h"
#include "helpers.h"

namespace core = shallot::core;
namespace tests = shallot::tests;

struct RoundtripTimeEstimatorFixture
{
  typedef core::RoundtripTimeEstimator::Clock Clock;

  RoundtripTimeEstimatorFixture()
      : m_Rtt(core::RoundTripEstimatorParams()),
        m_Cwnd(core::CongestionWindowParams()),
        m_Start(Clock::now())
  {
  }

  /// @brief Feeds one data-to-SENDME sample of the given length
  void Sample(
      std::chrono::milliseconds rtt,
      core::CongestionState state = core::CongestionState::e_SlowStart)
  {
    m_Rtt.ExpectSendme(m_Start);
    m_Rtt.Update(m_Start + rtt, state, m_Cwnd);
  }

  core::RoundtripTimeEstimator m_Rtt;
  core::CongestionWindow m_Cwnd;
  Clock::time_point m_Start;
};

BOOST_FIXTURE_TEST_SUITE(RoundtripTimeEstimatorTests, RoundtripTimeEstimatorFixture)

BOOST_AUTO_TEST_CASE(NoSample)
{
  BOOST_CHECK(!m_Rtt.IsReady());
  BOOST_CHECK(!m_Rtt.GetEwmaRttUsec());
  BOOST_CHECK(!m_Rtt.GetMinRttUsec());
  BOOST_CHECK_EXCEPTION(
      m_Rtt.Update(m_Start, core::CongestionState::e_SlowStart, m_Cwnd),
      core::ProtocolError,
      tests::IsKind(core::ErrorKind::e_CircProto));
}

BOOST_AUTO_TEST_CASE(SlowStartEwma)
{
  Sample(std::chrono::milliseconds(100));
  BOOST_CHECK(m_Rtt.IsReady());
  BOOST_CHECK_EQUAL(*m_Rtt.GetEwmaRttUsec(), 100000);
  BOOST_CHECK_EQUAL(*m_Rtt.GetMinRttUsec(), 100000);
  BOOST_CHECK_EQUAL(*m_Rtt.GetMaxRttUsec(), 100000);

  // Slow start weighs new samples with N = 2: (2 * raw + prev) / 3
  Sample(std::chrono::milliseconds(400));
  BOOST_CHECK_EQUAL(*m_Rtt.GetEwmaRttUsec(), 300000);
  BOOST_CHECK_EQUAL(*m_Rtt.GetMinRttUsec(), 100000);
  BOOST_CHECK_EQUAL(*m_Rtt.GetMaxRttUsec(), 400000);

  Sample(std::chrono::milliseconds(30));
  BOOST_CHECK_EQUAL(*m_Rtt.GetEwmaRttUsec(), 120000);
  BOOST_CHECK_EQUAL(*m_Rtt.GetMaxRttUsec(), 400000);
}

BOOST_AUTO_TEST_CASE(StalledClock)
{
  Sample(std::chrono::milliseconds(0));
  BOOST_CHECK(m_Rtt.IsClockStalled());
  BOOST_CHECK(!m_Rtt.IsReady());
  BOOST_CHECK(!m_Rtt.GetEwmaRttUsec());

  // Slow start samples are taken but can't be checked against an estimate,
  // so the stall sticks
  Sample(std::chrono::milliseconds(50));
  BOOST_CHECK_EQUAL(*m_Rtt.GetEwmaRttUsec(), 50000);
  BOOST_CHECK(m_Rtt.IsClockStalled());

  // A sane sample against the estimate clears it
  Sample(std::chrono::milliseconds(60), core::CongestionState::e_Steady);
  BOOST_CHECK(!m_Rtt.IsClockStalled());
  BOOST_CHECK(m_Rtt.IsReady());
}

BOOST_AUTO_TEST_CASE(ClockJump)
{
  Sample(std::chrono::milliseconds(1));
  // Outside slow start samples are checked against the current estimate
  Sample(std::chrono::hours(1), core::CongestionState::e_Steady);
  BOOST_CHECK_EQUAL(*m_Rtt.GetEwmaRttUsec(), 1000);
  BOOST_CHECK_EQUAL(*m_Rtt.GetMaxRttUsec(), 1000);
}

BOOST_AUTO_TEST_SUITE_END()
