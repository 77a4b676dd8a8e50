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

#ifndef SRC_CORE_CONGESTION_FIXED_WINDOW_H_
#define SRC_CORE_CONGESTION_FIXED_WINDOW_H_

#include <cstdint>

#include "core/congestion/algorithm.h"
#include "core/congestion/params.h"

namespace shallot
{
namespace core
{
/// Circuit-level SENDME increment of the fixed-window algorithm
const std::uint32_t CIRC_SENDME_INC = 100;

/// @class FixedWindow
/// @brief Legacy flow control: fixed send and receive windows replenished
///   by one SENDME every CIRC_SENDME_INC cells
class FixedWindow final : public CongestionControlAlgorithm
{
 public:
  explicit FixedWindow(const FixedWindowParams& params);

  bool IsNextCellSendme() const override;

  bool CanSend() const override
  {
    return m_SendWindow > 0;
  }

  const CongestionWindow* GetCwnd() const override
  {
    return nullptr;
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
    return m_SendWindow;
  }

  bool UsesStreamSendme() const override
  {
    return true;
  }

  bool UsesXonXoff() const override
  {
    return false;
  }

 private:
  std::uint32_t m_WindowMax;
  std::uint32_t m_SendWindow, m_RecvWindow;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CONGESTION_FIXED_WINDOW_H_
