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

#include "core/congestion/fixed_window.h"

#include "core/util/error.h"

namespace shallot
{
namespace core
{
FixedWindow::FixedWindow(const FixedWindowParams& params)
    : m_WindowMax(params.circ_window_max),
      m_SendWindow(params.circ_window_start),
      m_RecvWindow(params.circ_window_start)
{
}

bool FixedWindow::IsNextCellSendme() const
{
  // Called after DataSent() has taken from the window
  return m_SendWindow % CIRC_SENDME_INC == 0;
}

void FixedWindow::SendmeReceived(
    CongestionState&,
    RoundtripTimeEstimator&,
    const CongestionSignals&)
{
  if (m_SendWindow + CIRC_SENDME_INC > m_WindowMax)
    throw ProtocolError(
        ErrorKind::e_CircProto, "Received a SENDME when none was expected");
  m_SendWindow += CIRC_SENDME_INC;
}

void FixedWindow::SendmeSent()
{
  m_RecvWindow += CIRC_SENDME_INC;
}

bool FixedWindow::DataReceived()
{
  if (!m_RecvWindow)
    throw ProtocolError(
        ErrorKind::e_CircProto, "Received a data cell in violation of a window");
  --m_RecvWindow;
  return m_RecvWindow % CIRC_SENDME_INC == 0;
}

void FixedWindow::DataSent()
{
  if (!m_SendWindow)
    throw ProtocolError(
        ErrorKind::e_Internal, "Sent a data cell with an empty send window");
  --m_SendWindow;
}

}  // namespace core
}  // namespace shallot
