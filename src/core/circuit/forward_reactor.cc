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

#include "core/circuit/forward_reactor.h"

#include <stdexcept>
#include <utility>

#include "core/util/error.h"
#include "core/util/exception.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
ForwardReactor::ForwardReactor(
    CircId id,
    std::shared_ptr<CircMsgQueue> input,
    std::shared_ptr<CircHopList> hops,
    std::shared_ptr<CircCmdQueue> commands,
    ChannelHandle channel)
    : m_CircId(id),
      m_Input(std::move(input)),
      m_Hops(std::move(hops)),
      m_Commands(std::move(commands)),
      m_Channel(std::move(channel)),
      m_IsClosed(false)
{
  m_Input->AddWaker(GetWaker());
  // Woken when the backward half makes room in the queue or closes it
  m_Commands->AddWaker(GetWaker());
}

ForwardReactor::~ForwardReactor()
{
  Shutdown();
}

ReactorStatus ForwardReactor::Poll()
{
  if (m_IsClosed)
    return ReactorStatus::e_Shutdown;
  try
    {
      if (m_Commands->IsClosed())
        return BackwardHalfGone();
      // Nothing more is read until the backward half made room
      switch (FlushCommands())
        {
          case SendStatus::e_Sent:
            break;
          case SendStatus::e_Full:
            return ReactorStatus::e_Idle;
          case SendStatus::e_Closed:
            return BackwardHalfGone();
        }
      auto msg = m_Input->TryGet();
      if (!msg)
        {
          if (!m_Input->IsDrained())
            return ReactorStatus::e_Idle;
          LOG(debug) << "ForwardReactor: circuit " << m_CircId
                     << ": channel closed the circuit";
          return Shutdown();
        }
      if (!HandleChanMsg(*msg))
        return Shutdown();
      if (FlushCommands() == SendStatus::e_Closed)
        return BackwardHalfGone();
      return ReactorStatus::e_Progress;
    }
  catch (...)
    {
      core::Exception ex("ForwardReactor");
      ex.Dispatch(__func__);
      Shutdown();
      throw;
    }
}

bool ForwardReactor::HandleChanMsg(const ChanMsg& msg)
{
  switch (msg.cmd)
    {
      case ChanCmd::e_Relay:
      case ChanCmd::e_RelayEarly:
        HandleRelayCell(msg);
        return true;
      case ChanCmd::e_Destroy:
        LOG(debug) << "ForwardReactor: circuit " << m_CircId
                   << " destroyed by peer";
        return false;
      default:
        throw ProtocolError(
            ErrorKind::e_CircProto,
            "Unexpected " + GetChanCmdName(msg.cmd) + " cell on client circuit");
    }
}

void ForwardReactor::HandleRelayCell(const ChanMsg& msg)
{
  RelayCellBody body;
  try
    {
      body = GetRelayCellBody(msg);
    }
  catch (const std::length_error&)
    {
      throw ProtocolError(
          ErrorKind::e_CircProto, "Relay cell with bad body length");
    }
  const auto recognized = m_Hops->Decrypt(body);
  const HopNum hop = recognized.first;
  auto circ_hop = m_Hops->GetHop(hop);
  circ_hop->DecrementInboundCellLimit();
  RelayMsg relay = DecodeRelayMsg(circ_hop->GetRelayFormat(), body);
  LOG(trace) << "ForwardReactor: circuit " << m_CircId << ": "
             << GetRelayCmdName(relay.cmd) << " from hop " << hop;

  // The SENDME is authenticated with the tag of the cell which made it due
  if (CmdCountsTowardsWindows(relay.cmd) && circ_hop->NoteDataReceived())
    SendCommand(
        CircCmd{CircCmd::Type::e_SendRelayMsg,
                hop,
                RelayMsg::Sendme(recognized.second)});

  if (!relay.stream_id)
    {
      switch (relay.cmd)
        {
          case RelayCmd::e_Sendme:
            SendCommand(
                CircCmd{CircCmd::Type::e_HandleSendme, hop, std::move(relay)});
            return;
          case RelayCmd::e_Drop:
            return;
          default:
            // Refused by the hop below
            break;
        }
    }

  const bool is_data = relay.cmd == RelayCmd::e_Data;
  circ_hop->HandleMsg(relay);
  if (is_data)
    if (auto xoff = circ_hop->MaybeSendXoff(*relay.stream_id))
      SendCommand(CircCmd{CircCmd::Type::e_SendXoff, hop, std::move(*xoff)});
}

void ForwardReactor::SendCommand(CircCmd cmd)
{
  m_Unsent.push_back(std::move(cmd));
}

SendStatus ForwardReactor::FlushCommands()
{
  while (!m_Unsent.empty())
    {
      // A refused command stays queued here, so hand over a copy
      const SendStatus status = m_Commands->TryPut(m_Unsent.front());
      if (status != SendStatus::e_Sent)
        return status;
      m_Unsent.pop_front();
    }
  return SendStatus::e_Sent;
}

ReactorStatus ForwardReactor::BackwardHalfGone()
{
  LOG(debug) << "ForwardReactor: circuit " << m_CircId
             << ": backward half is gone";
  return Shutdown();
}

ReactorStatus ForwardReactor::Shutdown()
{
  if (m_IsClosed)
    return ReactorStatus::e_Shutdown;
  m_IsClosed = true;
  m_Unsent.clear();
  m_Input->Close();
  m_Commands->Close();
  m_Hops->CloseStreams();
  m_Channel.CloseCircuit(m_CircId);
  LOG(debug) << "ForwardReactor: circuit " << m_CircId << " closed";
  return ReactorStatus::e_Shutdown;
}

}  // namespace core
}  // namespace shallot
