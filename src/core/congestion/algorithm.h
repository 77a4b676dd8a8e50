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

#ifndef SRC_CORE_CONGESTION_ALGORITHM_H_
#define SRC_CORE_CONGESTION_ALGORITHM_H_

#include <cstddef>
#include <cstdint>

#include "core/congestion/params.h"

namespace shallot
{
namespace core
{
class RoundtripTimeEstimator;

/// @enum CongestionState
/// @brief Phase of a cwnd-based algorithm
enum struct CongestionState : std::uint8_t
{
  e_SlowStart,
  e_Steady,
};

/// @class CongestionSignals
/// @brief What the channel tells us about congestion when a SENDME arrives
struct CongestionSignals
{
  /// The channel's outbound queue can't take more cells
  bool channel_blocked = false;
  /// Cells waiting in the channel's outbound queue
  std::uint32_t channel_outbound_size = 0;
};

/// @class CongestionWindow
/// @brief Congestion window (cwnd) in cells
class CongestionWindow
{
 public:
  explicit CongestionWindow(const CongestionWindowParams& params);

  /// @brief Shrinks by one increment, never below cwnd_min
  void Dec();

  /// @brief Grows by one increment, never above cwnd_max
  void Inc();

  std::uint32_t Get() const noexcept
  {
    return m_Value;
  }

  void Set(std::uint32_t value) noexcept
  {
    m_Value = value;
  }

  std::uint32_t GetMin() const noexcept
  {
    return m_Params.cwnd_min;
  }

  std::uint32_t GetIncrement() const noexcept
  {
    return m_Params.cwnd_inc;
  }

  std::uint32_t GetIncrementRate() const noexcept
  {
    return m_Params.cwnd_inc_rate;
  }

  std::uint32_t GetSendmeInc() const noexcept
  {
    return m_Params.sendme_inc;
  }

  /// @return Number of SENDMEs between two cwnd updates
  std::uint32_t GetUpdateRate(CongestionState state) const;

  /// @return Number of SENDMEs we expect per cwnd
  std::uint32_t SendmePerCwnd() const;

  /// @brief RFC 3742 limited slow start increment, applied to the window
  /// @return The increment applied
  std::uint32_t Rfc3742SsInc(std::uint32_t ss_cap);

  /// @brief Evaluates whether the window is being fully used
  void EvalFullness(
      std::uint32_t inflight,
      std::uint32_t full_gap,
      std::uint32_t full_minpct);

  bool IsFull() const noexcept
  {
    return m_IsFull;
  }

  void ResetFull() noexcept
  {
    m_IsFull = false;
  }

 private:
  CongestionWindowParams m_Params;
  std::uint32_t m_Value;
  bool m_IsFull;
};

/// @class CongestionControlAlgorithm
/// @brief Decides when we may send and when SENDMEs are due
class CongestionControlAlgorithm
{
 public:
  virtual ~CongestionControlAlgorithm() = default;

  /// @return True if the next cell sent is one the peer will SENDME for
  virtual bool IsNextCellSendme() const = 0;

  virtual bool CanSend() const = 0;

  /// @return Congestion window, null for window-less algorithms
  virtual const CongestionWindow* GetCwnd() const = 0;

  /// @throw ProtocolError on a flow or congestion control violation
  virtual void SendmeReceived(
      CongestionState& state,
      RoundtripTimeEstimator& rtt,
      const CongestionSignals& signals) = 0;

  virtual void SendmeSent() = 0;

  /// @return True if a SENDME must now be sent
  virtual bool DataReceived() = 0;

  virtual void DataSent() = 0;

  /// @return Remaining send window (cells), used for diagnostics
  virtual std::uint32_t GetSendWindow() const = 0;

  /// @return True if streams still use stream-level SENDMEs
  virtual bool UsesStreamSendme() const = 0;

  /// @return True if streams are flow controlled with XON/XOFF
  virtual bool UsesXonXoff() const = 0;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CONGESTION_ALGORITHM_H_
