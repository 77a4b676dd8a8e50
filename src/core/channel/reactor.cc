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

#include "core/channel/reactor.h"

#include <exception>
#include <string>
#include <utility>

#include "core/util/error.h"
#include "core/util/exception.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
namespace
{
std::exception_ptr MakeChannelClosedError()
{
  return std::make_exception_ptr(
      ProtocolError(ErrorKind::e_ChannelClosed, "Channel closed"));
}

std::string FormatCircId(const boost::optional<CircId>& id)
{
  return id ? std::to_string(*id) : "0";
}
}  // namespace

ChannelHandle::ChannelHandle(
    std::shared_ptr<CtrlQueue> control,
    std::shared_ptr<CellQueue> cells)
    : m_Control(std::move(control)), m_Cells(std::move(cells))
{
}

std::future<PendingCircuit> ChannelHandle::AllocateCircuit()
{
  auto reply = std::make_shared<std::promise<PendingCircuit>>();
  std::future<PendingCircuit> result = reply->get_future();
  CtrlMsg msg{CtrlMsg::Type::e_AllocateCircuit, 0, reply};
  if (m_Control->TryPut(std::move(msg)) != SendStatus::e_Sent)
    reply->set_exception(MakeChannelClosedError());
  return result;
}

void ChannelHandle::CloseCircuit(CircId id)
{
  if (m_Control->TryPut(CtrlMsg{CtrlMsg::Type::e_CloseCircuit, id, nullptr})
      == SendStatus::e_Closed)
    LOG(debug) << "ChannelHandle: channel closed, not closing circuit " << id;
}

void ChannelHandle::Shutdown()
{
  // Either way the reactor sees a shutdown
  if (m_Control->TryPut(CtrlMsg{CtrlMsg::Type::e_Shutdown, 0, nullptr})
      != SendStatus::e_Sent)
    m_Control->Close();
}

ChannelReactor::ChannelReactor(
    std::unique_ptr<CellStream> input,
    std::unique_ptr<CellSink> output,
    CircIdRange range,
    std::uint32_t half_circ_cells,
    std::size_t queue_size)
    : m_State(ChannelState::e_Running),
      m_Input(std::move(input)),
      m_Output(std::move(output)),
      m_Control(std::make_shared<CtrlQueue>()),
      m_Cells(std::make_shared<CellQueue>(queue_size)),
      m_Circs(range),
      m_HalfCircCells(half_circ_cells),
      m_QueueSize(queue_size)
{
  m_Input->SetWaker(GetWaker());
  m_Output->SetWaker(GetWaker());
  m_Control->AddWaker(GetWaker());
  m_Cells->AddWaker(GetWaker());
}

ChannelReactor::~ChannelReactor()
{
  Shutdown();
}

ChannelHandle ChannelReactor::GetHandle() const
{
  return ChannelHandle(m_Control, m_Cells);
}

ReactorStatus ChannelReactor::Poll()
{
  if (m_State == ChannelState::e_Closed)
    return ReactorStatus::e_Shutdown;
  try
    {
      bool progress = false;

      // Control messages first, they may change what we do with the rest
      if (auto ctrl = m_Control->TryGet())
        {
          progress = true;
          if (!HandleControl(std::move(*ctrl)))
            return Shutdown();
        }
      else if (m_Control->IsDrained())
        {
          return Shutdown();
        }

      // A stalled circuit holds back the whole inbound stream
      if (m_Stalled)
        {
          const CircEnt* ent = m_Circs.Get(m_Stalled->first);
          if (!ent || ent->state != CircEnt::State::e_Open)
            {
              LOG(debug) << "ChannelReactor: circuit " << m_Stalled->first
                         << " went away, dropping its stalled cell";
              m_Stalled = boost::none;
              progress = true;
            }
          else if (DeliverToCircuit(m_Stalled->first, m_Stalled->second))
            {
              m_Stalled = boost::none;
              progress = true;
            }
        }
      else if (auto cell = m_Input->TryNext())
        {
          progress = true;
          HandleCell(std::move(*cell));
        }
      else if (m_Input->IsTerminated())
        {
          LOG(debug) << "ChannelReactor: inbound stream ended";
          return Shutdown();
        }

      if (m_Output->PollReady())
        {
          if (!m_SpecialOutgoing.empty())
            {
              progress = true;
              ChanCell cell = std::move(m_SpecialOutgoing.front());
              m_SpecialOutgoing.pop_front();
              m_Output->StartSend(std::move(cell));
            }
          else if (auto cell = m_Cells->TryGet())
            {
              progress = true;
              m_Output->StartSend(std::move(*cell));
            }
          else if (m_Cells->IsDrained())
            {
              return Shutdown();
            }
        }
      m_Output->PollFlush();

      return progress ? ReactorStatus::e_Progress : ReactorStatus::e_Idle;
    }
  catch (...)
    {
      core::Exception ex("ChannelReactor");
      ex.Dispatch(__func__);
      Shutdown();
      throw;
    }
}

bool ChannelReactor::HandleControl(CtrlMsg msg)
{
  switch (msg.type)
    {
      case CtrlMsg::Type::e_Shutdown:
        return false;
      case CtrlMsg::Type::e_CloseCircuit:
        CloseCircuit(msg.circ_id);
        break;
      case CtrlMsg::Type::e_AllocateCircuit:
        {
          auto created = std::make_shared<CircMsgQueue>(1);
          auto cells = std::make_shared<CircMsgQueue>(m_QueueSize);
          // So that a stalled cell is retried once the circuit reads
          cells->AddWaker(GetWaker());
          try
            {
              const CircId id = m_Circs.AddEnt(created, cells);
              LOG(debug) << "ChannelReactor: allocated circuit " << id;
              msg.reply->set_value(PendingCircuit{id, created, cells});
            }
          catch (const ProtocolError& ex)
            {
              LOG(warning) << "ChannelReactor: " << ex.what();
              msg.reply->set_exception(std::current_exception());
            }
          break;
        }
    }
  return true;
}

void ChannelReactor::HandleCell(ChanCell cell)
{
  const ChanCmd cmd = cell.msg.cmd;
  switch (cmd)
    {
      case ChanCmd::e_Relay:
      case ChanCmd::e_RelayEarly:
        DeliverRelay(cell.circ_id, std::move(cell.msg));
        return;
      case ChanCmd::e_Destroy:
        DeliverDestroy(cell.circ_id, std::move(cell.msg));
        return;
      case ChanCmd::e_Created:
      case ChanCmd::e_CreatedFast:
      case ChanCmd::e_Created2:
        DeliverCreated(cell.circ_id, std::move(cell.msg));
        return;
      case ChanCmd::e_Create:
      case ChanCmd::e_CreateFast:
      case ChanCmd::e_Create2:
        throw ProtocolError(
            ErrorKind::e_ChanProto,
            GetChanCmdName(cmd) + " cell on client channel");
      case ChanCmd::e_Versions:
      case ChanCmd::e_Certs:
      case ChanCmd::e_AuthChallenge:
      case ChanCmd::e_Authenticate:
      case ChanCmd::e_Authorize:
      case ChanCmd::e_Netinfo:
        throw ProtocolError(
            ErrorKind::e_ChanProto,
            GetChanCmdName(cmd) + " cell after handshake is done");
      case ChanCmd::e_Padding:
      case ChanCmd::e_VPadding:
      case ChanCmd::e_PaddingNegotiate:
        return;
      default:
        LOG(debug) << "ChannelReactor: dropping " << GetChanCmdName(cmd)
                   << " on circuit " << FormatCircId(cell.circ_id);
        return;
    }
}

void ChannelReactor::DeliverRelay(
    const boost::optional<CircId>& id,
    ChanMsg msg)
{
  if (!id)
    throw ProtocolError(ErrorKind::e_ChanProto, "Relay cell without circuit ID");
  CircEnt* ent = m_Circs.Get(*id);
  if (!ent)
    throw ProtocolError(
        ErrorKind::e_ChanProto, "Relay cell on nonexistent circuit");
  switch (ent->state)
    {
      case CircEnt::State::e_Opening:
        throw ProtocolError(
            ErrorKind::e_ChanProto,
            "Relay cell on pending circuit before CREATED* received");
      case CircEnt::State::e_Open:
        if (!DeliverToCircuit(*id, msg))
          {
            LOG(trace) << "ChannelReactor: circuit " << *id << " is full";
            m_Stalled = std::make_pair(*id, std::move(msg));
          }
        return;
      case CircEnt::State::e_DestroySent:
        ent->half_circ->ReceiveCell();
        return;
    }
}

bool ChannelReactor::DeliverToCircuit(CircId id, ChanMsg& msg)
{
  CircEnt* ent = m_Circs.Get(id);
  switch (ent->cell_sender->TryPut(msg))
    {
      case SendStatus::e_Sent:
        return true;
      case SendStatus::e_Full:
        return false;
      case SendStatus::e_Closed:
      default:
        LOG(debug) << "ChannelReactor: receiver of circuit " << id
                   << " went away, destroying it";
        OutboundDestroyCirc(id);
        return true;
    }
}

void ChannelReactor::DeliverCreated(
    const boost::optional<CircId>& id,
    ChanMsg msg)
{
  if (!id)
    throw ProtocolError(
        ErrorKind::e_ChanProto,
        GetChanCmdName(msg.cmd) + " cell without circuit ID");
  // TODO(unassigned): is this a bug? The circuit is Open before its creator
  // checked the reply, so a failed handshake leaves it Open until closed
  auto created = m_Circs.AdvanceFromOpening(*id);
  LOG(trace) << "ChannelReactor: " << GetChanCmdName(msg.cmd)
             << " on circuit " << *id;
  if (created->TryPut(std::move(msg)) != SendStatus::e_Sent)
    {
      LOG(debug) << "ChannelReactor: creator of circuit " << *id
                 << " went away, destroying it";
      OutboundDestroyCirc(*id);
    }
}

void ChannelReactor::DeliverDestroy(
    const boost::optional<CircId>& id,
    ChanMsg msg)
{
  if (!id)
    throw ProtocolError(
        ErrorKind::e_ChanProto, "DESTROY cell without circuit ID");
  auto ent = m_Circs.Remove(*id);
  if (!ent)
    throw ProtocolError(
        ErrorKind::e_ChanProto, "Destroy for nonexistent circuit");
  switch (ent->state)
    {
      case CircEnt::State::e_Opening:
        LOG(trace) << "ChannelReactor: passing DESTROY to pending circuit "
                   << *id;
        if (ent->created_sender->TryPut(std::move(msg)) != SendStatus::e_Sent)
          LOG(debug) << "ChannelReactor: pending circuit " << *id
                     << " already gone";
        break;
      case CircEnt::State::e_Open:
        LOG(trace) << "ChannelReactor: passing DESTROY to open circuit "
                   << *id;
        if (ent->cell_sender->TryPut(std::move(msg)) != SendStatus::e_Sent)
          LOG(debug) << "ChannelReactor: open circuit " << *id
                     << " can't take DESTROY, closing its queue";
        break;
      case CircEnt::State::e_DestroySent:
        break;
    }
  // Nothing more will ever arrive on this circuit
  if (ent->created_sender)
    ent->created_sender->Close();
  if (ent->cell_sender)
    ent->cell_sender->Close();
}

void ChannelReactor::CloseCircuit(CircId id)
{
  const CircEnt* ent = m_Circs.Get(id);
  if (ent && ent->IsOpenOrOpening())
    OutboundDestroyCirc(id);
}

void ChannelReactor::OutboundDestroyCirc(CircId id)
{
  LOG(trace) << "ChannelReactor: circuit " << id << " is gone, sending DESTROY";
  if (CircEnt* ent = m_Circs.Get(id))
    {
      if (ent->created_sender)
        ent->created_sender->Close();
      if (ent->cell_sender)
        ent->cell_sender->Close();
    }
  m_Circs.DestroySent(id, HalfCirc(m_HalfCircCells));
  m_SpecialOutgoing.push_back(MakeDestroyCell(id, DestroyReason::e_None));
}

ReactorStatus ChannelReactor::Shutdown()
{
  if (m_State == ChannelState::e_Closed)
    return ReactorStatus::e_Shutdown;
  m_State = ChannelState::e_ShuttingDown;
  m_Control->Close();
  // Callers still waiting on an allocation learn the channel is gone
  while (auto ctrl = m_Control->TryGet())
    if (ctrl->reply)
      ctrl->reply->set_exception(MakeChannelClosedError());
  m_Cells->Close();
  m_Circs.CloseAll();
  m_SpecialOutgoing.clear();
  m_Stalled = boost::none;
  m_State = ChannelState::e_Closed;
  LOG(debug) << "ChannelReactor: channel closed";
  return ReactorStatus::e_Shutdown;
}

}  // namespace core
}  // namespace shallot
