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

#include "core/circuit/stream_map.h"

#include <string>
#include <utility>

#include "core/crypto/rand.h"
#include "core/util/error.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
namespace
{
// Every non-zero id, and then some
const std::size_t STREAM_ID_PROBES = 65536;

ProtocolError UnexpectedCmd(RelayCmd cmd, const std::string& stream_type)
{
  return ProtocolError(
      ErrorKind::e_CircProto,
      "Unexpected " + GetRelayCmdName(cmd) + " on " + stream_type + "!");
}
}  // namespace

StreamStatus DataStreamCmdChecker::CheckMsg(const RelayMsg& msg)
{
  switch (msg.cmd)
    {
      case RelayCmd::e_Connected:
        if (!m_ExpectingConnected)
          throw ProtocolError(
              ErrorKind::e_CircProto,
              "Received CONNECTED twice on a stream.");
        m_ExpectingConnected = false;
        return StreamStatus::e_Open;
      case RelayCmd::e_Data:
        if (m_ExpectingConnected)
          throw ProtocolError(
              ErrorKind::e_CircProto,
              "Received DATA before CONNECTED on a stream");
        return StreamStatus::e_Open;
      case RelayCmd::e_End:
        return StreamStatus::e_Closed;
      default:
        throw UnexpectedCmd(msg.cmd, "a data stream");
    }
}

StreamStatus ResolveStreamCmdChecker::CheckMsg(const RelayMsg& msg)
{
  switch (msg.cmd)
    {
      case RelayCmd::e_Resolved:
      case RelayCmd::e_End:
        return StreamStatus::e_Closed;
      default:
        throw UnexpectedCmd(msg.cmd, "a resolve stream");
    }
}

HalfStream::HalfStream(
    StreamFlowCtrl flow_ctrl,
    StreamRecvWindow recv_window,
    std::unique_ptr<CmdChecker> cmd_checker)
    : m_FlowCtrl(std::move(flow_ctrl)),
      m_RecvWindow(recv_window),
      m_CmdChecker(std::move(cmd_checker))
{
}

StreamStatus HalfStream::HandleMsg(const RelayMsg& msg)
{
  switch (msg.cmd)
    {
      case RelayCmd::e_Sendme:
        m_FlowCtrl.PutForIncomingSendme(msg);
        return StreamStatus::e_Open;
      case RelayCmd::e_Xon:
        m_FlowCtrl.HandleIncomingXon(msg);
        return StreamStatus::e_Open;
      case RelayCmd::e_Xoff:
        m_FlowCtrl.HandleIncomingXoff(msg);
        return StreamStatus::e_Open;
      default:
        break;
    }
  if (CmdCountsTowardsWindows(msg.cmd))
    m_RecvWindow.Take();
  return m_CmdChecker->CheckMsg(msg);
}

OpenStreamEnt::OpenStreamEnt(
    std::shared_ptr<StreamQueue> sink,
    StreamFlowCtrl flow_ctrl,
    std::unique_ptr<CmdChecker> cmd_checker)
    : sink(std::move(sink)),
      flow_ctrl(std::move(flow_ctrl)),
      dropped(0),
      cmd_checker(std::move(cmd_checker))
{
}

StreamMap::StreamMap()
    : m_NextStreamId(RandInRange<StreamId>(1, 0xFFFF)), m_OpenCount(0)
{
}

StreamId StreamMap::GetNextId()
{
  const StreamId id = m_NextStreamId;
  ++m_NextStreamId;
  if (!m_NextStreamId)
    m_NextStreamId = 1;
  return id;
}

StreamId StreamMap::AddEnt(
    std::shared_ptr<StreamQueue> sink,
    StreamFlowCtrl flow_ctrl,
    std::unique_ptr<CmdChecker> cmd_checker)
{
  for (std::size_t i = 0; i < STREAM_ID_PROBES; i++)
    {
      const StreamId id = GetNextId();
      if (m_Streams.count(id))
        continue;
      StreamEnt ent;
      ent.state = StreamEnt::State::e_Open;
      ent.open = std::make_unique<OpenStreamEnt>(
          std::move(sink), std::move(flow_ctrl), std::move(cmd_checker));
      m_Streams.emplace(id, std::move(ent));
      ++m_OpenCount;
      m_UnusedSince = boost::none;
      return id;
    }
  throw ProtocolError(
      ErrorKind::e_IdRangeFull, "Couldn't find a free stream id");
}

StreamEnt* StreamMap::Get(StreamId id)
{
  auto it = m_Streams.find(id);
  return it == m_Streams.end() ? nullptr : &it->second;
}

void StreamMap::SetState(StreamEnt& ent, StreamEnt::State state)
{
  if (ent.state == StreamEnt::State::e_Open
      && state != StreamEnt::State::e_Open)
    {
      if (!--m_OpenCount)
        m_UnusedSince = Clock::now();
    }
  ent.state = state;
}

void StreamMap::EndingMsgReceived(StreamId id)
{
  auto it = m_Streams.find(id);
  if (it == m_Streams.end())
    throw ProtocolError(
        ErrorKind::e_CircProto, "Received END cell on nonexistent stream");
  switch (it->second.state)
    {
      case StreamEnt::State::e_EndReceived:
        throw ProtocolError(
            ErrorKind::e_CircProto, "Received two END cells on same stream");
      case StreamEnt::State::e_EndSent:
        LOG(trace) << "StreamMap: stream " << id << " fully closed";
        Remove(id);
        break;
      case StreamEnt::State::e_Open:
        // The application still holds the stream, it sees END and closes
        SetState(it->second, StreamEnt::State::e_EndReceived);
        break;
    }
}

ShouldSendEnd StreamMap::Terminate(StreamId id)
{
  auto it = m_Streams.find(id);
  if (it == m_Streams.end())
    throw ProtocolError(
        ErrorKind::e_Internal,
        "Somehow we terminated a nonexistent stream?");
  StreamEnt& ent = it->second;
  switch (ent.state)
    {
      case StreamEnt::State::e_EndReceived:
        Remove(id);
        return ShouldSendEnd::e_DontSend;
      case StreamEnt::State::e_EndSent:
        throw ProtocolError(
            ErrorKind::e_Internal, "Hang on! We're sending an END twice?");
      case StreamEnt::State::e_Open:
        break;
    }
  StreamRecvWindow recv_window;
  recv_window.DecrementN(ent.open->dropped);
  ent.half = std::make_unique<HalfStream>(
      std::move(ent.open->flow_ctrl),
      recv_window,
      std::move(ent.open->cmd_checker));
  ent.open.reset();
  SetState(ent, StreamEnt::State::e_EndSent);
  return ShouldSendEnd::e_Send;
}

void StreamMap::Remove(StreamId id)
{
  auto it = m_Streams.find(id);
  if (it == m_Streams.end())
    return;
  SetState(it->second, StreamEnt::State::e_EndReceived);
  m_Streams.erase(it);
}

void StreamMap::CloseAll()
{
  for (auto& stream : m_Streams)
    {
      if (stream.second.open)
        stream.second.open->sink->Close();
      SetState(stream.second, StreamEnt::State::e_EndReceived);
    }
  m_Streams.clear();
}

}  // namespace core
}  // namespace shallot
