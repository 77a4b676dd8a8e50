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

#include "core/circuit/backward_reactor.h"

#include <limits>
#include <utility>

#include "core/util/error.h"
#include "core/util/exception.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
BackwardReactor::BackwardReactor(
    CircId id,
    std::shared_ptr<CircHopList> hops,
    std::shared_ptr<CircCmdQueue> commands,
    std::shared_ptr<StreamRequestQueue> streams,
    std::unique_ptr<CellSink> output,
    ChannelHandle channel,
    std::unique_ptr<CellStream> secondary,
    std::shared_ptr<PaddingQueue> padding)
    : m_CircId(id),
      m_Hops(std::move(hops)),
      m_Commands(std::move(commands)),
      m_Streams(std::move(streams)),
      m_Output(std::move(output)),
      m_Channel(std::move(channel)),
      m_Secondary(std::move(secondary)),
      m_Padding(std::move(padding)),
      m_Control(std::make_shared<CircCtrlQueue>()),
      m_IsBlocked(false),
      m_IsClosed(false)
{
  m_Hops->SetSendWaker(GetWaker());
  m_Commands->AddWaker(GetWaker());
  m_Streams->AddWaker(GetWaker());
  m_Control->AddWaker(GetWaker());
  m_Output->SetWaker(GetWaker());
  if (m_Secondary)
    m_Secondary->SetWaker(GetWaker());
  if (m_Padding)
    m_Padding->AddWaker(GetWaker());
}

BackwardReactor::~BackwardReactor()
{
  Shutdown();
}

ReactorStatus BackwardReactor::Poll()
{
  if (m_IsClosed)
    return ReactorStatus::e_Shutdown;
  try
    {
      bool progress = false;

      // Not gated: these decide whether the gated sources may run at all
      if (auto ctrl = m_Control->TryGet())
        {
          progress = true;
          if (!HandleControl(*ctrl))
            return Shutdown();
        }
      else if (m_Control->IsDrained())
        {
          return Shutdown();
        }
      if (m_Padding)
        if (auto event = m_Padding->TryGet())
          {
            progress = true;
            HandlePadding(*event);
          }

      m_Output->PollFlush();
      const ReactorStatus idle =
          progress ? ReactorStatus::e_Progress : ReactorStatus::e_Idle;
      if (!m_Output->PollReady())
        return idle;

      if (!m_Outgoing.empty())
        {
          auto own = std::move(m_Outgoing.front());
          m_Outgoing.pop_front();
          SendRelayMsg(*GetHop(own.first), own.second);
          return ReactorStatus::e_Progress;
        }
      if (m_IsBlocked)
        return idle;

      if (SendStreamRequest())
        progress = true;

      if (m_Output->PollReady())
        {
          if (auto cmd = m_Commands->TryGet())
            {
              progress = true;
              HandleCommand(*cmd);
            }
          else if (m_Commands->IsDrained())
            {
              LOG(debug) << "BackwardReactor: circuit " << m_CircId
                         << ": forward half is gone";
              return Shutdown();
            }
        }

      if (m_Secondary && m_Output->PollReady())
        if (m_Secondary->TryNext())
          throw ProtocolError(
              ErrorKind::e_Internal, "Cell relaying is not implemented");

      return progress ? ReactorStatus::e_Progress : ReactorStatus::e_Idle;
    }
  catch (...)
    {
      core::Exception ex("BackwardReactor");
      ex.Dispatch(__func__);
      Shutdown();
      throw;
    }
}

bool BackwardReactor::HandleControl(const CircCtrlMsg& msg)
{
  switch (msg.type)
    {
      case CircCtrlMsg::Type::e_Shutdown:
        LOG(debug) << "BackwardReactor: circuit " << m_CircId
                   << ": shutdown requested";
        return false;
      case CircCtrlMsg::Type::e_CloseStream:
        if (auto end =
                GetHop(msg.hop)->CloseStream(msg.stream_id, msg.reason))
          m_Outgoing.emplace_back(msg.hop, std::move(*end));
        return true;
    }
  return true;
}

void BackwardReactor::HandlePadding(const PaddingEvent& event)
{
  switch (event.type)
    {
      case PaddingEvent::Type::e_SendPadding:
        m_Outgoing.emplace_back(
            event.hop, RelayMsg{RelayCmd::e_Drop, boost::none, {}});
        break;
      case PaddingEvent::Type::e_StartBlocking:
        m_IsBlocked = true;
        break;
      case PaddingEvent::Type::e_StopBlocking:
        m_IsBlocked = false;
        break;
    }
}

void BackwardReactor::HandleCommand(const CircCmd& cmd)
{
  auto hop = GetHop(cmd.hop);
  switch (cmd.type)
    {
      case CircCmd::Type::e_HandleSendme:
        HandleSendme(*hop, cmd.msg);
        break;
      case CircCmd::Type::e_SendRelayMsg:
      case CircCmd::Type::e_SendXon:
      case CircCmd::Type::e_SendXoff:
        SendRelayMsg(*hop, cmd.msg);
        break;
    }
}

bool BackwardReactor::SendStreamRequest()
{
  bool progress = false;
  if (!m_PendingRequest)
    {
      m_PendingRequest = m_Streams->TryGet();
      if (!m_PendingRequest)
        return false;
      progress = true;
    }
  auto hop = GetHop(m_PendingRequest->hop);
  const RelayMsg& msg = m_PendingRequest->msg;
  if (CmdCountsTowardsWindows(msg.cmd) && !hop->CanSend())
    return progress;
  switch (hop->AboutToSend(msg))
    {
      case StreamSendStatus::e_Blocked:
        return progress;
      case StreamSendStatus::e_NotOpen:
        LOG(debug) << "BackwardReactor: circuit " << m_CircId << ": dropping "
                   << GetRelayCmdName(msg.cmd) << " on closed stream";
        break;
      case StreamSendStatus::e_Sendable:
        SendRelayMsg(*hop, msg);
        break;
    }
  m_PendingRequest = boost::none;
  return true;
}

void BackwardReactor::SendRelayMsg(CircHop& hop, const RelayMsg& msg)
{
  RelayCellBody body = EncodeRelayMsg(hop.GetRelayFormat(), msg);
  hop.DecrementOutboundCellLimit();
  const SendmeTag tag = m_Hops->Encrypt(body, hop.GetHopNum());
  m_Output->StartSend(MakeRelayCell(m_CircId, body));
  LOG(trace) << "BackwardReactor: circuit " << m_CircId << ": sent "
             << GetRelayCmdName(msg.cmd) << " to hop " << hop.GetHopNum();
  // Only now that the cell is on its way
  if (CmdCountsTowardsWindows(msg.cmd))
    hop.NoteDataSent(tag);
  else if (msg.cmd == RelayCmd::e_Sendme && !msg.stream_id)
    hop.NoteSendmeSent();
}

void BackwardReactor::HandleSendme(CircHop& hop, const RelayMsg& msg)
{
  const SendmeMsg sendme = SendmeMsg::Parse(msg.body);
  if (!sendme.GetTag())
    throw ProtocolError(
        ErrorKind::e_CircProto, "missing tag on circuit sendme");
  hop.NoteSendmeReceived(*sendme.GetTag(), GetSignals());
}

std::shared_ptr<CircHop> BackwardReactor::GetHop(HopNum hop) const
{
  // Hops are only ever appended, so the check can't go stale
  if (hop.Get() >= m_Hops->GetSize())
    throw ProtocolError(
        ErrorKind::e_Internal,
        "Tried to send to non-existent hop " + hop.ToString());
  return m_Hops->GetHop(hop);
}

CongestionSignals BackwardReactor::GetSignals()
{
  CongestionSignals signals;
  signals.channel_blocked = !m_Output->PollReady();
  const std::size_t queued = m_Output->GetQueuedCount();
  signals.channel_outbound_size =
      queued > std::numeric_limits<std::uint32_t>::max()
          ? std::numeric_limits<std::uint32_t>::max()
          : static_cast<std::uint32_t>(queued);
  return signals;
}

ReactorStatus BackwardReactor::Shutdown()
{
  if (m_IsClosed)
    return ReactorStatus::e_Shutdown;
  m_IsClosed = true;
  m_Control->Close();
  m_Commands->Close();
  m_Streams->Close();
  m_Outgoing.clear();
  m_PendingRequest = boost::none;
  m_Channel.CloseCircuit(m_CircId);
  LOG(debug) << "BackwardReactor: circuit " << m_CircId << " closed";
  return ReactorStatus::e_Shutdown;
}

}  // namespace core
}  // namespace shallot
