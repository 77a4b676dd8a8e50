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

#ifndef SRC_CORE_CONGESTION_CONGESTION_H_
#define SRC_CORE_CONGESTION_CONGESTION_H_

#include <cstdint>
#include <memory>

#include "core/cell/cell.h"
#include "core/congestion/algorithm.h"
#include "core/congestion/params.h"
#include "core/congestion/rtt.h"
#include "core/congestion/sendme.h"

namespace shallot
{
namespace core
{
/// @class CongestionControl
/// @brief Congestion control state of one circuit hop
/// @details Not thread-safe: the owning CircHop guards it with a mutex
///   shared by both halves of the circuit reactor
class CongestionControl
{
 public:
  typedef RoundtripTimeEstimator::Clock Clock;

  explicit CongestionControl(const CongestionControlParams& params);

  /// @return True if a cell counting towards windows may be sent now
  bool CanSend() const;

  /// @brief Handles a circuit SENDME received from the hop
  /// @throw ProtocolError on a bad tag or a window violation
  void NoteSendmeReceived(
      const SendmeTag& tag,
      const CongestionSignals& signals,
      Clock::time_point now = Clock::now());

  /// @brief To be called after a circuit SENDME was sent to the hop
  void NoteSendmeSent();

  /// @brief To be called for every counted cell received from the hop
  /// @return True if a circuit SENDME is now due
  bool NoteDataReceived();

  /// @brief To be called once a counted cell was handed to the channel
  /// @param tag Tag of the sent cell, recorded if the hop will SENDME it
  void NoteDataSent(
      const SendmeTag& tag,
      Clock::time_point now = Clock::now());

  bool UsesStreamSendme() const
  {
    return m_Algorithm->UsesStreamSendme();
  }

  bool UsesXonXoff() const
  {
    return m_Algorithm->UsesXonXoff();
  }

  CongestionState GetState() const noexcept
  {
    return m_State;
  }

  CongestionAlgorithm GetAlgorithmType() const noexcept
  {
    return m_AlgorithmType;
  }

  const CongestionControlAlgorithm& GetAlgorithm() const
  {
    return *m_Algorithm;
  }

  const RoundtripTimeEstimator& GetRtt() const noexcept
  {
    return m_Rtt;
  }

  std::size_t GetExpectedSendmeCount() const noexcept
  {
    return m_Sendme.GetExpectedCount();
  }

 private:
  CongestionAlgorithm m_AlgorithmType;
  std::unique_ptr<CongestionControlAlgorithm> m_Algorithm;
  CongestionState m_State;
  RoundtripTimeEstimator m_Rtt;
  SendmeValidator m_Sendme;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CONGESTION_CONGESTION_H_
