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

#include "core/congestion/congestion.h"

#include <memory>

#include "core/congestion/fixed_window.h"
#include "core/congestion/vegas.h"
#include "core/util/error.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
namespace
{
std::unique_ptr<CongestionControlAlgorithm> MakeAlgorithm(
    const CongestionControlParams& params,
    CongestionState state)
{
  switch (params.alg)
    {
      case CongestionAlgorithm::e_FixedWindow:
        return std::make_unique<FixedWindow>(params.fixed_window);
      case CongestionAlgorithm::e_Vegas:
        return std::make_unique<Vegas>(
            params.vegas, state, CongestionWindow(params.cwnd));
      default:
        throw ProtocolError(
            ErrorKind::e_Internal, "Unknown congestion control algorithm");
    }
}
}  // namespace

CongestionControl::CongestionControl(const CongestionControlParams& params)
    : m_AlgorithmType(params.alg),
      m_Algorithm(MakeAlgorithm(params, CongestionState::e_SlowStart)),
      m_State(CongestionState::e_SlowStart),
      m_Rtt(params.rtt)
{
}

bool CongestionControl::CanSend() const
{
  return m_Algorithm->CanSend();
}

void CongestionControl::NoteSendmeReceived(
    const SendmeTag& tag,
    const CongestionSignals& signals,
    Clock::time_point now)
{
  m_Sendme.Validate(tag);
  // Window-less algorithms never asked the estimator to expect a SENDME
  if (const CongestionWindow* cwnd = m_Algorithm->GetCwnd())
    m_Rtt.Update(now, m_State, *cwnd);
  m_Algorithm->SendmeReceived(m_State, m_Rtt, signals);
  LOG(trace) << "CongestionControl: SENDME received, send window "
             << m_Algorithm->GetSendWindow();
}

void CongestionControl::NoteSendmeSent()
{
  m_Algorithm->SendmeSent();
}

bool CongestionControl::NoteDataReceived()
{
  return m_Algorithm->DataReceived();
}

void CongestionControl::NoteDataSent(
    const SendmeTag& tag,
    Clock::time_point now)
{
  m_Algorithm->DataSent();
  if (!m_Algorithm->IsNextCellSendme())
    return;
  m_Sendme.Record(tag);
  if (m_Algorithm->GetCwnd())
    m_Rtt.ExpectSendme(now);
}

}  // namespace core
}  // namespace shallot
