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

#include "core/congestion/vegas.h"

#include <algorithm>

#include "core/congestion/rtt.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
namespace
{
std::uint32_t SaturatingSub(std::uint32_t a, std::uint32_t b)
{
  return a > b ? a - b : 0;
}
}  // namespace

void BdpEstimator::Update(
    const CongestionWindow& cwnd,
    const RoundtripTimeEstimator& rtt,
    const CongestionSignals& signals)
{
  const auto min_rtt = rtt.GetMinRttUsec();
  const auto ewma_rtt = rtt.GetEwmaRttUsec();
  // A stalled clock (or no sample yet) means RTT is useless: BDP is the cwnd
  if (rtt.IsClockStalled() || !min_rtt || !ewma_rtt || !*ewma_rtt)
    {
      m_Bdp = signals.channel_blocked
                  ? std::max(
                        SaturatingSub(cwnd.Get(), signals.channel_outbound_size),
                        cwnd.GetMin())
                  : cwnd.Get();
      return;
    }
  // cwnd * min_rtt / ewma_rtt
  const std::uint64_t bdp =
      static_cast<std::uint64_t>(cwnd.Get()) * *min_rtt / *ewma_rtt;
  m_Bdp = static_cast<std::uint32_t>(
      std::min<std::uint64_t>(bdp, UINT32_MAX));
}

Vegas::Vegas(
    const VegasParams& params,
    CongestionState state,
    const CongestionWindow& cwnd)
    : m_Params(params),
      m_Cwnd(cwnd),
      m_CellsUntilSendme(cwnd.GetSendmeInc()),
      m_SendmeUntilCwndUpdate(cwnd.GetUpdateRate(state)),
      m_SendmePerCwnd(0),
      m_Inflight(0),
      m_IsBlockedOnChan(false)
{
}

bool Vegas::IsNextCellSendme() const
{
  // Called after DataSent() has counted the cell in flight
  return m_Inflight % m_Cwnd.GetSendmeInc() == 0;
}

void Vegas::SendmeReceived(
    CongestionState& state,
    RoundtripTimeEstimator& rtt,
    const CongestionSignals& signals)
{
  m_SendmeUntilCwndUpdate = SaturatingSub(m_SendmeUntilCwndUpdate, 1);
  m_SendmePerCwnd = SaturatingSub(m_SendmePerCwnd, 1);

  // RTT was updated by the caller, BDP is ours to update
  m_Bdp.Update(m_Cwnd, rtt, signals);

  // A change of blocked state is an immediate congestion signal
  if (rtt.IsReady() && signals.channel_blocked != m_IsBlockedOnChan)
    m_SendmeUntilCwndUpdate = 0;
  m_IsBlockedOnChan = signals.channel_blocked;

  if (!rtt.IsReady() && !m_IsBlockedOnChan)
    {
      m_Inflight = SaturatingSub(m_Inflight, m_Cwnd.GetSendmeInc());
      return;
    }

  const auto& queue = m_Params.cell_in_queue;
  const std::uint32_t queue_use = SaturatingSub(m_Cwnd.Get(), m_Bdp.Get());

  m_Cwnd.EvalFullness(
      m_Inflight, m_Params.cwnd_full_gap, m_Params.cwnd_full_min_pct);

  if (state == CongestionState::e_SlowStart)
    {
      if (queue_use < queue.gamma && !m_IsBlockedOnChan)
        {
          // No increment unless the window is actually in use
          if (m_Cwnd.IsFull())
            {
              const std::uint32_t inc = m_Cwnd.Rfc3742SsInc(queue.ss_cwnd_cap);
              if (inc * m_Cwnd.SendmePerCwnd()
                  <= m_Cwnd.GetIncrement() * m_Cwnd.GetIncrementRate())
                state = CongestionState::e_Steady;
            }
        }
      else
        {
          // Congestion signal: drop to the gamma threshold
          m_Cwnd.Set(m_Bdp.Get() + queue.gamma);
          state = CongestionState::e_Steady;
        }
      if (m_Cwnd.Get() >= m_Params.ss_cwnd_max)
        {
          m_Cwnd.Set(m_Params.ss_cwnd_max);
          state = CongestionState::e_Steady;
        }
    }
  else if (!m_SendmeUntilCwndUpdate)
    {
      // Steady state only moves once per update period
      if (queue_use > queue.delta)
        m_Cwnd.Set(SaturatingSub(
            m_Bdp.Get() + queue.delta, m_Cwnd.GetIncrement()));
      else if (queue_use > queue.beta || m_IsBlockedOnChan)
        m_Cwnd.Dec();
      else if (m_Cwnd.IsFull() && queue_use < queue.alpha)
        m_Cwnd.Inc();
    }

  if (!m_SendmeUntilCwndUpdate)
    m_SendmeUntilCwndUpdate = m_Cwnd.GetUpdateRate(state);
  if (!m_SendmePerCwnd)
    m_SendmePerCwnd = m_Cwnd.SendmePerCwnd();

  if (m_Params.cwnd_full_per_cwnd)
    {
      if (m_SendmePerCwnd == m_Cwnd.SendmePerCwnd())
        m_Cwnd.ResetFull();
    }
  else if (m_SendmeUntilCwndUpdate == m_Cwnd.GetUpdateRate(state))
    {
      m_Cwnd.ResetFull();
    }

  m_Inflight = SaturatingSub(m_Inflight, m_Cwnd.GetSendmeInc());
}

void Vegas::SendmeSent()
{
  m_CellsUntilSendme = m_Cwnd.GetSendmeInc();
}

bool Vegas::DataReceived()
{
  if (!m_CellsUntilSendme)
    {
      // Code flow error rather than a protocol violation: don't close the
      // circuit, just avoid sending two SENDMEs back to back
      LOG(error) << "Vegas: unexpected data cell while a SENDME is pending";
      return false;
    }
  --m_CellsUntilSendme;
  return m_CellsUntilSendme == 0;
}

void Vegas::DataSent()
{
  // May go above cwnd, the window can shrink while we are sending
  ++m_Inflight;
}

}  // namespace core
}  // namespace shallot
