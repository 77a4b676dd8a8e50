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

#include "core/congestion/algorithm.h"

#include <algorithm>

namespace shallot
{
namespace core
{
CongestionWindow::CongestionWindow(const CongestionWindowParams& params)
    : m_Params(params), m_Value(params.cwnd_init), m_IsFull(false)
{
}

void CongestionWindow::Dec()
{
  const std::uint32_t inc = GetIncrement();
  m_Value = std::max(m_Value > inc ? m_Value - inc : 0, m_Params.cwnd_min);
}

void CongestionWindow::Inc()
{
  const std::uint64_t value = static_cast<std::uint64_t>(m_Value) + GetIncrement();
  m_Value = static_cast<std::uint32_t>(
      std::min<std::uint64_t>(value, m_Params.cwnd_max));
}

std::uint32_t CongestionWindow::GetUpdateRate(CongestionState state) const
{
  if (state == CongestionState::e_SlowStart)
    return 1;
  const std::uint32_t per_update = GetIncrementRate() * GetSendmeInc();
  return (Get() + per_update / 2) / per_update;
}

std::uint32_t CongestionWindow::SendmePerCwnd() const
{
  return (Get() + (GetSendmeInc() / 2)) / GetSendmeInc();
}

std::uint32_t CongestionWindow::Rfc3742SsInc(std::uint32_t ss_cap)
{
  std::uint32_t inc;
  if (Get() <= ss_cap)
    inc = ((m_Params.cwnd_inc_pct_ss * GetSendmeInc()) + 50) / 100;
  else
    inc = std::max<std::uint32_t>(
        ((GetSendmeInc() * ss_cap) + Get()) / (Get() * 2), 1);
  m_Value += inc;
  return inc;
}

void CongestionWindow::EvalFullness(
    std::uint32_t inflight,
    std::uint32_t full_gap,
    std::uint32_t full_minpct)
{
  if ((inflight + (GetSendmeInc() * full_gap)) >= Get())
    m_IsFull = true;
  else if ((100 * static_cast<std::uint64_t>(inflight))
           < (static_cast<std::uint64_t>(full_minpct) * Get()))
    m_IsFull = false;
}

}  // namespace core
}  // namespace shallot
