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

#ifndef SRC_CORE_CONGESTION_RTT_H_
#define SRC_CORE_CONGESTION_RTT_H_

#include <boost/optional.hpp>

#include <chrono>
#include <cstdint>
#include <deque>

#include "core/congestion/algorithm.h"
#include "core/congestion/params.h"

namespace shallot
{
namespace core
{
/// @class RoundtripTimeEstimator
/// @brief Estimates circuit round trip time from data-to-SENDME delays
/// @details Keeps an EWMA of observed RTTs and the minimum seen, and detects
///   stalled or jumping clocks so that bogus samples are ignored
class RoundtripTimeEstimator
{
 public:
  typedef std::chrono::steady_clock Clock;

  explicit RoundtripTimeEstimator(const RoundTripEstimatorParams& params);

  /// @return True once we have a usable sample and the clock isn't stalled
  bool IsReady() const noexcept
  {
    return !m_ClockStalled && m_LastRtt;
  }

  bool IsClockStalled() const noexcept
  {
    return m_ClockStalled;
  }

  /// @return EWMA of the RTT in microseconds, if known
  boost::optional<std::uint32_t> GetEwmaRttUsec() const;

  /// @return Minimum RTT in microseconds, if known
  boost::optional<std::uint32_t> GetMinRttUsec() const;

  /// @return Maximum RTT in microseconds, if known
  boost::optional<std::uint32_t> GetMaxRttUsec() const;

  /// @brief Notes that a cell which will be SENDMEd was sent at the given time
  void ExpectSendme(Clock::time_point now);

  /// @brief Takes a sample from a SENDME received at the given time
  /// @throw ProtocolError (e_CircProto) if no SENDME was expected
  void Update(
      Clock::time_point now,
      CongestionState state,
      const CongestionWindow& cwnd);

 private:
  bool CanCrosscheckWithCurrentEstimate(bool in_slow_start) const;

  bool CheckClockStalled(Clock::duration raw_rtt, bool in_slow_start);

 private:
  RoundTripEstimatorParams m_Params;
  std::deque<Clock::time_point> m_SendmeExpectedFrom;
  boost::optional<std::chrono::microseconds> m_LastRtt, m_EwmaRtt, m_MinRtt,
      m_MaxRtt;
  bool m_ClockStalled;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CONGESTION_RTT_H_
