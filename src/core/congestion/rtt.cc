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

#include "core/congestion/rtt.h"

#include <algorithm>
#include <limits>

#include "core/util/error.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
namespace
{
// Samples this many times off the current EWMA mean the clock jumped
const std::int64_t DELTA_DISCREPANCY_RATIO_MAX = 5000;

boost::optional<std::uint32_t> ToUsec(
    const boost::optional<std::chrono::microseconds>& rtt)
{
  if (!rtt)
    return boost::none;
  const auto usec = rtt->count();
  if (usec > std::numeric_limits<std::uint32_t>::max())
    return std::numeric_limits<std::uint32_t>::max();
  return static_cast<std::uint32_t>(usec);
}
}  // namespace

RoundtripTimeEstimator::RoundtripTimeEstimator(
    const RoundTripEstimatorParams& params)
    : m_Params(params), m_ClockStalled(false)
{
}

boost::optional<std::uint32_t> RoundtripTimeEstimator::GetEwmaRttUsec() const
{
  return ToUsec(m_EwmaRtt);
}

boost::optional<std::uint32_t> RoundtripTimeEstimator::GetMinRttUsec() const
{
  return ToUsec(m_MinRtt);
}

boost::optional<std::uint32_t> RoundtripTimeEstimator::GetMaxRttUsec() const
{
  return ToUsec(m_MaxRtt);
}

void RoundtripTimeEstimator::ExpectSendme(Clock::time_point now)
{
  m_SendmeExpectedFrom.push_back(now);
}

bool RoundtripTimeEstimator::CanCrosscheckWithCurrentEstimate(
    bool in_slow_start) const
{
  // In slow start the RTT moves too much to be compared against
  return !in_slow_start && m_EwmaRtt;
}

bool RoundtripTimeEstimator::CheckClockStalled(
    Clock::duration raw_rtt,
    bool in_slow_start)
{
  if (raw_rtt == Clock::duration::zero())
    {
      m_ClockStalled = true;
      return true;
    }
  if (!CanCrosscheckWithCurrentEstimate(in_slow_start))
    return false;
  const auto raw = std::chrono::duration_cast<std::chrono::microseconds>(raw_rtt);
  const auto ewma = *m_EwmaRtt;
  if (raw.count() > ewma.count() * DELTA_DISCREPANCY_RATIO_MAX)
    {
      // Clock jumped forward, ignore the sample but don't mark as stalled
      LOG(debug) << "RoundtripTimeEstimator: clock jumped forward, ignoring RTT sample";
      return true;
    }
  if (ewma.count() > raw.count() * DELTA_DISCREPANCY_RATIO_MAX)
    // Keep whatever stalled state we had
    return m_ClockStalled;
  m_ClockStalled = false;
  return false;
}

void RoundtripTimeEstimator::Update(
    Clock::time_point now,
    CongestionState state,
    const CongestionWindow& cwnd)
{
  if (m_SendmeExpectedFrom.empty())
    throw ProtocolError(
        ErrorKind::e_CircProto, "Informed of a SENDME we weren't expecting");
  const Clock::time_point data_sent_at = m_SendmeExpectedFrom.front();
  m_SendmeExpectedFrom.pop_front();
  const Clock::duration raw_rtt =
      now > data_sent_at ? now - data_sent_at : Clock::duration::zero();

  const bool in_slow_start = state == CongestionState::e_SlowStart;
  if (CheckClockStalled(raw_rtt, in_slow_start))
    return;

  const auto raw = std::chrono::duration_cast<std::chrono::microseconds>(raw_rtt);
  m_MaxRtt = m_MaxRtt ? std::max(*m_MaxRtt, raw) : raw;
  m_LastRtt = raw;

  std::uint64_t ewma_n =
      in_slow_start
          ? m_Params.ewma_ss_max
          : std::min<std::uint64_t>(
                (cwnd.GetUpdateRate(state) * m_Params.ewma_cwnd_pct) / 100,
                m_Params.ewma_max);
  ewma_n = std::max<std::uint64_t>(ewma_n, 2);

  const std::uint64_t raw_usec = raw.count();
  std::uint64_t ewma_usec = raw_usec;
  if (m_EwmaRtt)
    {
      const std::uint64_t prev = m_EwmaRtt->count();
      ewma_usec = ((raw_usec * 2) + ((ewma_n - 1) * prev)) / (ewma_n + 1);
    }
  const std::chrono::microseconds ewma(ewma_usec);
  m_EwmaRtt = ewma;

  if (!m_MinRtt)
    {
      m_MinRtt = ewma;
      return;
    }
  if (cwnd.Get() == cwnd.GetMin() && !in_slow_start)
    {
      // Stuck at the minimum window, so our min RTT is likely stale:
      // move it towards the current EWMA
      const std::uint64_t max = std::max(ewma, *m_MinRtt).count();
      const std::uint64_t min = std::min(ewma, *m_MinRtt).count();
      const std::uint64_t pct = m_Params.rtt_reset_pct;
      m_MinRtt = std::chrono::microseconds(
          (pct * max / 100) + (100 - pct) * min / 100);
    }
  else if (ewma < *m_MinRtt)
    {
      m_MinRtt = ewma;
    }
}

}  // namespace core
}  // namespace shallot
