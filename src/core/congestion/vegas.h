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

#ifndef SRC_CORE_CONGESTION_VEGAS_H_
#define SRC_CORE_CONGESTION_VEGAS_H_

#include <cstdint>

#include "core/congestion/algorithm.h"
#include "core/congestion/params.h"

namespace shallot
{
namespace core
{
/// @class BdpEstimator
/// @brief Bandwidth-delay product estimate, in cells
class BdpEstimator
{
 public:
  std::uint32_t Get() const noexcept
  {
    return m_Bdp;
  }

  void Update(
      const CongestionWindow& cwnd,
      const RoundtripTimeEstimator& rtt,
      const CongestionSignals& signals);

 private:
  std::uint32_t m_Bdp = 0;
};

/// @class Vegas
/// @brief TCP Vegas adapted to Tor circuits (prop324, TOR_VEGAS)
/// @details Estimates the queue use at relays as cwnd - BDP and grows or
///   shrinks cwnd to keep it between the alpha/beta/delta thresholds
class Vegas final : public CongestionControlAlgorithm
{
 public:
  Vegas(
      const VegasParams& params,
      CongestionState state,
      const CongestionWindow& cwnd);

  bool IsNextCellSendme() const override;

  bool CanSend() const override
  {
    return m_Inflight < m_Cwnd.Get();
  }

  const CongestionWindow* GetCwnd() const override
  {
    return &m_Cwnd;
  }

  void SendmeReceived(
      CongestionState& state,
      RoundtripTimeEstimator& rtt,
      const CongestionSignals& signals) override;

  void SendmeSent() override;

  bool DataReceived() override;

  void DataSent() override;

  std::uint32_t GetSendWindow() const override
  {
    return m_Cwnd.Get();
  }

  bool UsesStreamSendme() const override
  {
    return false;
  }

  bool UsesXonXoff() const override
  {
    return true;
  }

  std::uint32_t GetInflight() const noexcept
  {
    return m_Inflight;
  }

 private:
  VegasParams m_Params;
  BdpEstimator m_Bdp;
  CongestionWindow m_Cwnd;
  std::uint32_t m_CellsUntilSendme;
  /// SENDMEs left until we act on a congestion event again
  std::uint32_t m_SendmeUntilCwndUpdate;
  /// Counts down a cwnd worth of SENDMEs, to track fullness
  std::uint32_t m_SendmePerCwnd;
  /// Cells sent but not yet acknowledged by a SENDME
  std::uint32_t m_Inflight;
  bool m_IsBlockedOnChan;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CONGESTION_VEGAS_H_
