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

#include "core/circuit/circuit.h"

#include <utility>

#include "core/channel/cell_transport.h"
#include "core/util/error.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
namespace
{
ProtocolError MakeCircuitClosedError()
{
  return ProtocolError(ErrorKind::e_ChannelClosed, "Circuit closed");
}
}  // namespace

ClientCircuit::ClientCircuit(
    const PendingCircuit& pending,
    ChannelHandle channel,
    const CircParameters& params)
    : m_Id(pending.id),
      m_Params(params),
      m_Hops(std::make_shared<CircHopList>()),
      m_Commands(std::make_shared<CircCmdQueue>(CIRC_CMD_QUEUE_SIZE)),
      m_Streams(std::make_shared<StreamRequestQueue>(STREAM_REQUEST_QUEUE_SIZE))
{
  m_Forward = std::make_shared<ForwardReactor>(
      m_Id, pending.cells, m_Hops, m_Commands, channel);
  m_Backward = std::make_shared<BackwardReactor>(
      m_Id,
      m_Hops,
      m_Commands,
      m_Streams,
      std::make_unique<QueueCellSink>(channel.GetCellSender()),
      channel);
}

ClientCircuit::~ClientCircuit()
{
  Shutdown();
}

void ClientCircuit::Start(boost::asio::io_service& service)
{
  LOG(debug) << "ClientCircuit: starting circuit " << m_Id;
  m_Forward->Start(service);
  m_Backward->Start(service);
}

HopNum ClientCircuit::AddHop(const HopSettings& settings, HopLayers layers)
{
  return m_Hops->AddHop(settings, std::move(layers));
}

HopNum ClientCircuit::ResolveTargetHop(const TargetHop& target) const
{
  return m_Hops->ResolveTargetHop(target);
}

std::shared_ptr<CircHop> ClientCircuit::GetHop(HopNum hop) const
{
  return m_Hops->GetHop(hop);
}

std::pair<StreamId, std::shared_ptr<StreamQueue>> ClientCircuit::BeginStream(
    const TargetHop& target,
    RelayMsg begin,
    std::unique_ptr<CmdChecker> cmd_checker)
{
  if (m_Streams->IsClosed())
    throw MakeCircuitClosedError();
  const HopNum hop = m_Hops->ResolveTargetHop(target);
  auto sink = std::make_shared<StreamQueue>(m_Params.stream_queue_size);
  auto begun = m_Hops->GetHop(hop)->BeginStream(
      std::move(begin), sink, std::move(cmd_checker));
  Enqueue(StreamRequest{hop, std::move(begun.first)});
  return std::make_pair(begun.second, sink);
}

void ClientCircuit::SendStreamMsg(HopNum hop, RelayMsg msg)
{
  Enqueue(StreamRequest{hop, std::move(msg)});
}

void ClientCircuit::Enqueue(StreamRequest request)
{
  if (!m_Streams->Put(std::move(request)))
    throw MakeCircuitClosedError();
}

void ClientCircuit::CloseStream(HopNum hop, StreamId id, EndReason reason)
{
  CircCtrlMsg msg{CircCtrlMsg::Type::e_CloseStream, hop, id, reason};
  if (m_Backward->GetControl()->TryPut(msg) == SendStatus::e_Closed)
    LOG(debug) << "ClientCircuit: circuit " << m_Id
               << " closed, not closing stream " << id;
}

void ClientCircuit::NoteStreamDrained(
    HopNum hop,
    StreamId id,
    std::uint32_t rate)
{
  auto xon = m_Hops->GetHop(hop)->MaybeSendXon(rate, id);
  if (!xon)
    return;
  if (!m_Commands->Put(CircCmd{CircCmd::Type::e_SendXon, hop, std::move(*xon)}))
    LOG(debug) << "ClientCircuit: circuit " << m_Id << " closed, no XON sent";
}

TunnelActivity ClientCircuit::GetActivity() const
{
  return m_Hops->GetLastActivity();
}

void ClientCircuit::Shutdown()
{
  CircCtrlMsg msg{CircCtrlMsg::Type::e_Shutdown, HopNum(), 0, EndReason::e_Misc};
  // Either way the backward half sees a shutdown
  if (m_Backward->GetControl()->TryPut(msg) != SendStatus::e_Sent)
    m_Backward->GetControl()->Close();
}

}  // namespace core
}  // namespace shallot
