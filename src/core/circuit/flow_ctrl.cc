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

#include "core/circuit/flow_ctrl.h"

#include <limits>

#include "core/util/log.h"

namespace shallot
{
namespace core
{
StreamFlowCtrl::StreamFlowCtrl(FlowCtrlMode mode)
    : m_Mode(mode),
      m_LastSent(LastSent::e_None),
      m_IsXonReceived(true),
      m_RateLimit(0),
      m_BytesSent(0)
{
}

StreamFlowCtrl StreamFlowCtrl::Window()
{
  return StreamFlowCtrl(FlowCtrlMode::e_Window);
}

StreamFlowCtrl StreamFlowCtrl::XonXoff(const FlowCtrlParams& params)
{
  StreamFlowCtrl flow_ctrl(FlowCtrlMode::e_XonXoff);
  flow_ctrl.m_Params = params;
  return flow_ctrl;
}

bool StreamFlowCtrl::CanSend(const RelayMsg& msg) const
{
  if (!CmdCountsTowardsWindows(msg.cmd))
    return true;
  if (m_Mode == FlowCtrlMode::e_Window)
    return m_Window.Get() > 0;
  return m_IsXonReceived;
}

void StreamFlowCtrl::TakeCapacityToSend(const RelayMsg& msg)
{
  if (!CmdCountsTowardsWindows(msg.cmd))
    return;
  if (m_Mode == FlowCtrlMode::e_Window)
    {
      m_Window.Take();
      return;
    }
  // The rate limit is enforced by the stream reader, XOFF stops it here
  if (!m_IsXonReceived)
    throw ProtocolError(
        ErrorKind::e_Internal, "Tried to send DATA on a stream after XOFF");
  m_BytesSent += msg.body.size();
}

void StreamFlowCtrl::PutForIncomingSendme(const RelayMsg&)
{
  if (m_Mode == FlowCtrlMode::e_XonXoff)
    throw ProtocolError(
        ErrorKind::e_CircProto,
        "Stream level SENDME not allowed due to congestion control");
  m_Window.Put();
}

void StreamFlowCtrl::HandleIncomingXon(const RelayMsg& msg)
{
  if (m_Mode == FlowCtrlMode::e_Window)
    throw ProtocolError(
        ErrorKind::e_CircProto,
        "XON messages not allowed with window flow control");
  const std::uint32_t kbps = ParseXonRate(msg.body);
  if (!m_BytesSent)
    throw ProtocolError(
        ErrorKind::e_CircProto, "Received XON before sending any data");
  if (!kbps || kbps == std::numeric_limits<std::uint32_t>::max())
    m_RateLimit = 0;
  else
    m_RateLimit = static_cast<std::uint64_t>(kbps) * 1000 / 8;
  m_IsXonReceived = true;
  LOG(trace) << "StreamFlowCtrl: XON, rate limit " << m_RateLimit << " B/s";
}

void StreamFlowCtrl::HandleIncomingXoff(const RelayMsg& msg)
{
  if (m_Mode == FlowCtrlMode::e_Window)
    throw ProtocolError(
        ErrorKind::e_CircProto,
        "XOFF messages not allowed with window flow control");
  if (msg.body.empty() || msg.body[0] != 0)
    throw ProtocolError(
        ErrorKind::e_CircProto, "Unrecognized XOFF version");
  if (!m_BytesSent)
    throw ProtocolError(
        ErrorKind::e_CircProto, "Received XOFF before sending any data");
  if (!m_IsXonReceived)
    throw ProtocolError(
        ErrorKind::e_CircProto, "Received consecutive XOFF messages");
  m_IsXonReceived = false;
  m_RateLimit = 0;
  LOG(trace) << "StreamFlowCtrl: XOFF";
}

boost::optional<RelayMsg> StreamFlowCtrl::MaybeSendXon(
    StreamId id,
    std::uint32_t rate,
    std::size_t buffer_len)
{
  if (m_Mode != FlowCtrlMode::e_XonXoff)
    return boost::none;
  if (buffer_len > m_Params.GetXoffLimit())
    return boost::none;
  m_LastSent = LastSent::e_Xon;
  return RelayMsg::Xon(id, rate);
}

boost::optional<RelayMsg> StreamFlowCtrl::MaybeSendXoff(
    StreamId id,
    std::size_t buffer_len)
{
  if (m_Mode != FlowCtrlMode::e_XonXoff)
    return boost::none;
  if (m_LastSent == LastSent::e_Xoff)
    return boost::none;
  if (buffer_len <= m_Params.GetXoffLimit())
    return boost::none;
  m_LastSent = LastSent::e_Xoff;
  return RelayMsg::Xoff(id);
}

}  // namespace core
}  // namespace shallot
