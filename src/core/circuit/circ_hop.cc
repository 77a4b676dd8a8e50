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

#include "core/circuit/circ_hop.h"

#include <string>

#include "core/util/error.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
CellBudget::CellBudget(const boost::optional<std::uint32_t>& limit)
{
  if (limit)
    m_Remaining = static_cast<std::uint64_t>(*limit) + 1;
}

bool CellBudget::TryDecrement() noexcept
{
  if (!m_Remaining)
    return true;
  if (*m_Remaining == 1)
    return false;
  --*m_Remaining;
  return true;
}

boost::optional<std::uint32_t> CellBudget::GetRemaining() const noexcept
{
  if (!m_Remaining)
    return boost::none;
  return static_cast<std::uint32_t>(*m_Remaining - 1);
}

CircHop::CircHop(HopNum hop, const HopSettings& settings)
    : m_Hop(hop),
      m_Settings(settings),
      m_InboundBudget(settings.n_incoming_cells_permitted),
      m_OutboundBudget(settings.n_outgoing_cells_permitted),
      m_Ccontrol(settings.ccontrol)
{
}

void CircHop::SetSendWaker(std::shared_ptr<Waker> waker)
{
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  m_SendWaker = waker;
}

void CircHop::WakeSender()
{
  std::shared_ptr<Waker> waker;
  {
    std::unique_lock<std::mutex> l(m_StreamsMutex);
    waker = m_SendWaker;
  }
  if (waker)
    waker->Wake();
}

std::pair<RelayMsg, StreamId> CircHop::BeginStream(
    RelayMsg msg,
    std::shared_ptr<StreamQueue> sink,
    std::unique_ptr<CmdChecker> cmd_checker)
{
  StreamFlowCtrl flow_ctrl = UsesStreamSendme()
                                 ? StreamFlowCtrl::Window()
                                 : StreamFlowCtrl::XonXoff(m_Settings.flow_ctrl);
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  const StreamId id = m_Streams.AddEnt(
      std::move(sink), std::move(flow_ctrl), std::move(cmd_checker));
  msg.stream_id = id;
  LOG(debug) << "CircHop: hop " << m_Hop << " began stream " << id << " with "
             << GetRelayCmdName(msg.cmd);
  return std::make_pair(std::move(msg), id);
}

boost::optional<RelayMsg> CircHop::CloseStream(StreamId id, EndReason reason)
{
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  if (m_Streams.Terminate(id) == ShouldSendEnd::e_DontSend)
    return boost::none;
  return RelayMsg::End(id, reason);
}

void CircHop::HandleMsg(const RelayMsg& msg)
{
  if (!msg.stream_id)
    throw ProtocolError(
        ErrorKind::e_CircProto,
        "Unexpected " + GetRelayCmdName(msg.cmd)
            + " cell with no stream ID");
  const StreamId id = *msg.stream_id;
  bool may_unblock = false;
  {
    // Nothing below waits: sinks are only ever offered a message
    std::unique_lock<std::mutex> l(m_StreamsMutex);
    StreamEnt* ent = m_Streams.Get(id);
    if (!ent || ent->state == StreamEnt::State::e_EndReceived)
      throw ProtocolError(
          ErrorKind::e_CircProto, "Unexpected message on unknown stream");
    if (ent->state == StreamEnt::State::e_EndSent)
      {
        if (ent->half->HandleMsg(msg) == StreamStatus::e_Closed)
          m_Streams.EndingMsgReceived(id);
        return;
      }
    OpenStreamEnt& open = *ent->open;
    switch (msg.cmd)
      {
        case RelayCmd::e_Sendme:
          open.flow_ctrl.PutForIncomingSendme(msg);
          may_unblock = true;
          break;
        case RelayCmd::e_Xon:
          open.flow_ctrl.HandleIncomingXon(msg);
          may_unblock = true;
          break;
        case RelayCmd::e_Xoff:
          open.flow_ctrl.HandleIncomingXoff(msg);
          break;
        default:
          {
            const StreamStatus status = open.cmd_checker->CheckMsg(msg);
            switch (open.sink->TryPut(msg))
              {
                case SendStatus::e_Sent:
                  break;
                case SendStatus::e_Full:
                  throw ProtocolError(
                      ErrorKind::e_CircProto,
                      "Stream sink would block; received too many cells on "
                      "stream ID "
                          + std::to_string(id));
                case SendStatus::e_Closed:
                  // Accounted for in the half-closed stream's window
                  if (CmdCountsTowardsWindows(msg.cmd) && open.dropped < 0xFFFF)
                    ++open.dropped;
                  break;
              }
            if (status == StreamStatus::e_Closed)
              m_Streams.EndingMsgReceived(id);
          }
      }
  }
  if (may_unblock)
    WakeSender();
}

StreamSendStatus CircHop::AboutToSend(const RelayMsg& msg)
{
  if (!msg.stream_id)
    return StreamSendStatus::e_Sendable;
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  StreamEnt* ent = m_Streams.Get(*msg.stream_id);
  if (!ent || ent->state != StreamEnt::State::e_Open)
    return StreamSendStatus::e_NotOpen;
  if (!ent->open->flow_ctrl.CanSend(msg))
    return StreamSendStatus::e_Blocked;
  ent->open->flow_ctrl.TakeCapacityToSend(msg);
  return StreamSendStatus::e_Sendable;
}

boost::optional<RelayMsg> CircHop::MaybeSendXon(
    std::uint32_t rate,
    StreamId id)
{
  if (!UsesXonXoff())
    return boost::none;
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  StreamEnt* ent = m_Streams.Get(id);
  if (!ent || ent->state != StreamEnt::State::e_Open)
    return boost::none;
  const std::size_t buffer_len =
      ent->open->sink->GetSize() * relay_v0::MAX_DATA_LEN;
  return ent->open->flow_ctrl.MaybeSendXon(id, rate, buffer_len);
}

boost::optional<RelayMsg> CircHop::MaybeSendXoff(StreamId id)
{
  if (!UsesXonXoff())
    return boost::none;
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  StreamEnt* ent = m_Streams.Get(id);
  if (!ent || ent->state != StreamEnt::State::e_Open)
    return boost::none;
  const std::size_t buffer_len =
      ent->open->sink->GetSize() * relay_v0::MAX_DATA_LEN;
  return ent->open->flow_ctrl.MaybeSendXoff(id, buffer_len);
}

std::size_t CircHop::GetOpenStreamCount() const
{
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  return m_Streams.GetOpenCount();
}

bool CircHop::HasActiveStreams() const
{
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  return m_Streams.GetSize() != 0;
}

boost::optional<StreamMap::Clock::time_point> CircHop::GetUnusedSince() const
{
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  return m_Streams.GetUnusedSince();
}

void CircHop::CloseStreams()
{
  std::unique_lock<std::mutex> l(m_StreamsMutex);
  m_Streams.CloseAll();
}

void CircHop::DecrementInboundCellLimit()
{
  if (!m_InboundBudget.TryDecrement())
    throw ProtocolError(
        ErrorKind::e_ExcessInboundCells,
        "Received too many inbound cells from hop " + m_Hop.ToString());
}

void CircHop::DecrementOutboundCellLimit()
{
  if (!m_OutboundBudget.TryDecrement())
    throw ProtocolError(
        ErrorKind::e_ExcessOutboundCells,
        "Tried to send too many outbound cells to hop " + m_Hop.ToString());
}

bool CircHop::CanSend() const
{
  std::unique_lock<std::mutex> l(m_CcMutex);
  return m_Ccontrol.CanSend();
}

void CircHop::NoteSendmeReceived(
    const SendmeTag& tag,
    const CongestionSignals& signals)
{
  {
    std::unique_lock<std::mutex> l(m_CcMutex);
    m_Ccontrol.NoteSendmeReceived(tag, signals);
  }
  WakeSender();
}

void CircHop::NoteSendmeSent()
{
  std::unique_lock<std::mutex> l(m_CcMutex);
  m_Ccontrol.NoteSendmeSent();
}

bool CircHop::NoteDataReceived()
{
  std::unique_lock<std::mutex> l(m_CcMutex);
  return m_Ccontrol.NoteDataReceived();
}

void CircHop::NoteDataSent(const SendmeTag& tag)
{
  std::unique_lock<std::mutex> l(m_CcMutex);
  m_Ccontrol.NoteDataSent(tag);
}

bool CircHop::UsesStreamSendme() const
{
  std::unique_lock<std::mutex> l(m_CcMutex);
  return m_Ccontrol.UsesStreamSendme();
}

bool CircHop::UsesXonXoff() const
{
  std::unique_lock<std::mutex> l(m_CcMutex);
  return m_Ccontrol.UsesXonXoff();
}

}  // namespace core
}  // namespace shallot
