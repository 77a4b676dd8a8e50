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

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/circuit/circ_hop.h"
#include "core/circuit/circ_hop_list.h"
#include "core/circuit/hop_settings.h"
#include "helpers.h"

namespace core = shallot::core;
namespace tests = shallot::tests;

struct CircHopFixture
{
  CircHopFixture()
      : m_Sink(std::make_shared<core::StreamQueue>(4)),
        m_IsCircProto(tests::IsKind(core::ErrorKind::e_CircProto))
  {
  }

  /// @return Settings of a hop which negotiated congestion control or not
  core::HopSettings Settings(bool supports_cc) const
  {
    return core::HopSettings::FromParameters(m_Params, supports_cc);
  }

  /// @return Stream ID of a new data stream on the hop
  core::StreamId Begin(core::CircHop& hop)
  {
    auto begun = hop.BeginStream(
        core::RelayMsg::Begin(0, "example.com", 80),
        m_Sink,
        std::make_unique<core::DataStreamCmdChecker>());
    BOOST_CHECK(begun.first.stream_id && *begun.first.stream_id == begun.second);
    return begun.second;
  }

  static core::RelayMsg Msg(core::RelayCmd cmd, core::StreamId id)
  {
    return core::RelayMsg{cmd, id, {}};
  }

  core::CircParameters m_Params;
  std::shared_ptr<core::StreamQueue> m_Sink;
  std::function<bool(const core::ProtocolError&)> m_IsCircProto;
};

BOOST_FIXTURE_TEST_SUITE(CircHopTests, CircHopFixture)

BOOST_AUTO_TEST_CASE(NegotiatedSettings)
{
  BOOST_CHECK(
      Settings(true).ccontrol.alg == core::CongestionAlgorithm::e_Vegas);
  BOOST_CHECK(
      Settings(false).ccontrol.alg == core::CongestionAlgorithm::e_FixedWindow);

  const core::HopSettings none = core::HopSettings::FromParameters(
      m_Params, true, core::HopNegotiationType::e_None);
  BOOST_CHECK(none.ccontrol.alg == core::CongestionAlgorithm::e_FixedWindow);

  const core::HopSettings hs = core::HopSettings::FromParameters(
      m_Params, true, core::HopNegotiationType::e_HsV3);
  BOOST_CHECK(hs.ccontrol.alg == core::CongestionAlgorithm::e_FixedWindow);
  BOOST_CHECK(hs.relay_crypt_protocol == core::RelayCryptProtocol::e_HsV3);
  BOOST_CHECK(Settings(true).relay_crypt_protocol == core::RelayCryptProtocol::e_Tor1);
}

BOOST_AUTO_TEST_CASE(CellBudget)
{
  BOOST_CHECK(!core::CellBudget(boost::none).GetRemaining());

  core::CellBudget budget(2u);
  BOOST_CHECK(budget.TryDecrement());
  BOOST_CHECK(budget.TryDecrement());
  BOOST_CHECK(!budget.TryDecrement());
  BOOST_CHECK_EQUAL(*budget.GetRemaining(), 0u);

  core::CellBudget max(0xFFFFFFFFu);
  BOOST_CHECK(max.TryDecrement());
  BOOST_CHECK_EQUAL(*max.GetRemaining(), 0xFFFFFFFEu);
}

BOOST_AUTO_TEST_CASE(HopCellLimits)
{
  m_Params.n_incoming_cells_permitted = 2;
  m_Params.n_outgoing_cells_permitted = 2;
  core::CircHop hop(core::HopNum(1), Settings(true));
  hop.DecrementInboundCellLimit();
  hop.DecrementInboundCellLimit();
  BOOST_CHECK_EXCEPTION(
      hop.DecrementInboundCellLimit(),
      core::ProtocolError,
      [](const core::ProtocolError& ex) {
        return ex.GetKind() == core::ErrorKind::e_ExcessInboundCells
               && std::string(ex.what())
                      == "Received too many inbound cells from hop #2";
      });
  // Directions are budgeted independently
  hop.DecrementOutboundCellLimit();
  hop.DecrementOutboundCellLimit();
  BOOST_CHECK_EXCEPTION(
      hop.DecrementOutboundCellLimit(),
      core::ProtocolError,
      tests::IsKind(core::ErrorKind::e_ExcessOutboundCells));
}

BOOST_AUTO_TEST_CASE(UnlimitedCells)
{
  core::CircHop hop(core::HopNum(0), Settings(true));
  for (int i = 0; i < 10000; i++)
    {
      hop.DecrementInboundCellLimit();
      hop.DecrementOutboundCellLimit();
    }
}

BOOST_AUTO_TEST_CASE(StreamFlowMode)
{
  // Hops without congestion control use stream SENDMEs
  core::CircHop fixed(core::HopNum(0), Settings(false));
  BOOST_CHECK(fixed.UsesStreamSendme());
  const core::StreamId id = Begin(fixed);
  fixed.HandleMsg(Msg(core::RelayCmd::e_Connected, id));
  BOOST_CHECK_EXCEPTION(
      fixed.HandleMsg(core::RelayMsg::Xoff(id)),
      core::ProtocolError,
      m_IsCircProto);
  BOOST_CHECK(!fixed.MaybeSendXoff(id));

  core::CircHop vegas(core::HopNum(0), Settings(true));
  BOOST_CHECK(vegas.UsesXonXoff());
  const core::StreamId vegas_id = Begin(vegas);
  BOOST_CHECK_EXCEPTION(
      vegas.HandleMsg(core::RelayMsg::Sendme(vegas_id)),
      core::ProtocolError,
      m_IsCircProto);
}

BOOST_AUTO_TEST_CASE(DeliverToStream)
{
  core::CircHop hop(core::HopNum(0), Settings(true));
  auto waker = std::make_shared<core::Waker>();
  hop.SetSendWaker(waker);
  const core::StreamId id = Begin(hop);
  BOOST_CHECK_EQUAL(hop.GetOpenStreamCount(), 1u);
  BOOST_CHECK(!hop.GetUnusedSince());

  hop.HandleMsg(Msg(core::RelayCmd::e_Connected, id));
  const std::uint8_t data[] = {1, 2, 3};
  hop.HandleMsg(core::RelayMsg::Data(id, data, sizeof(data)));
  BOOST_CHECK_EQUAL(m_Sink->GetSize(), 2u);
  BOOST_CHECK(m_Sink->TryGet()->cmd == core::RelayCmd::e_Connected);
  BOOST_CHECK_EQUAL(m_Sink->TryGet()->body.size(), 3u);

  // Data sent, so the exit may XOFF us, and XON wakes the sender up
  BOOST_CHECK(
      hop.AboutToSend(core::RelayMsg::Data(id, data, sizeof(data)))
      == core::StreamSendStatus::e_Sendable);
  hop.HandleMsg(core::RelayMsg::Xoff(id));
  BOOST_CHECK(
      hop.AboutToSend(core::RelayMsg::Data(id, data, sizeof(data)))
      == core::StreamSendStatus::e_Blocked);
  const auto seen = waker->GetGeneration();
  hop.HandleMsg(core::RelayMsg::Xon(id, 0));
  BOOST_CHECK(waker->GetGeneration() != seen);
  BOOST_CHECK(
      hop.AboutToSend(core::RelayMsg::Data(id, data, sizeof(data)))
      == core::StreamSendStatus::e_Sendable);
}

BOOST_AUTO_TEST_CASE(UnexpectedMessages)
{
  core::CircHop hop(core::HopNum(0), Settings(true));
  BOOST_CHECK_EXCEPTION(
      hop.HandleMsg(core::RelayMsg{core::RelayCmd::e_Data, boost::none, {}}),
      core::ProtocolError,
      [](const core::ProtocolError& ex) {
        return std::string(ex.what()) == "Unexpected DATA cell with no stream ID";
      });
  BOOST_CHECK_EXCEPTION(
      hop.HandleMsg(Msg(core::RelayCmd::e_Connected, 77)),
      core::ProtocolError,
      [](const core::ProtocolError& ex) {
        return std::string(ex.what()) == "Unexpected message on unknown stream";
      });
}

BOOST_AUTO_TEST_CASE(FullSinkIsAnError)
{
  core::CircHop hop(core::HopNum(0), Settings(true));
  const core::StreamId id = Begin(hop);
  hop.HandleMsg(Msg(core::RelayCmd::e_Connected, id));
  for (int i = 0; i < 3; i++)
    hop.HandleMsg(Msg(core::RelayCmd::e_Data, id));
  // Returns instead of waiting for the reader
  BOOST_CHECK_EXCEPTION(
      hop.HandleMsg(Msg(core::RelayCmd::e_Data, id)),
      core::ProtocolError,
      [id](const core::ProtocolError& ex) {
        return std::string(ex.what())
               == "Stream sink would block; received too many cells on "
                  "stream ID "
                      + std::to_string(id);
      });
}

BOOST_AUTO_TEST_CASE(StreamClosedByPeer)
{
  core::CircHop hop(core::HopNum(0), Settings(true));
  const core::StreamId id = Begin(hop);
  hop.HandleMsg(Msg(core::RelayCmd::e_Connected, id));
  hop.HandleMsg(core::RelayMsg::End(id, core::EndReason::e_Done));
  BOOST_CHECK_EQUAL(hop.GetOpenStreamCount(), 0);
  BOOST_CHECK(hop.GetUnusedSince());
  BOOST_CHECK(hop.HasActiveStreams());
  // The reader saw END: nothing to send back
  BOOST_CHECK(!hop.CloseStream(id, core::EndReason::e_Misc));
  BOOST_CHECK(!hop.HasActiveStreams());
  BOOST_CHECK(
      hop.AboutToSend(Msg(core::RelayCmd::e_Data, id))
      == core::StreamSendStatus::e_NotOpen);
}

BOOST_AUTO_TEST_CASE(StreamClosedByUs)
{
  core::CircHop hop(core::HopNum(0), Settings(true));
  const core::StreamId id = Begin(hop);
  hop.HandleMsg(Msg(core::RelayCmd::e_Connected, id));
  auto end = hop.CloseStream(id, core::EndReason::e_Done);
  BOOST_REQUIRE(end);
  BOOST_CHECK(end->cmd == core::RelayCmd::e_End);
  BOOST_CHECK_EQUAL(*end->stream_id, id);

  // Cells in flight still arrive, they are checked but not delivered
  m_Sink->TryGet();
  hop.HandleMsg(Msg(core::RelayCmd::e_Data, id));
  BOOST_CHECK(m_Sink->IsEmpty());
  hop.HandleMsg(core::RelayMsg::End(id, core::EndReason::e_Done));
  BOOST_CHECK(!hop.HasActiveStreams());
  BOOST_CHECK_EXCEPTION(
      hop.HandleMsg(Msg(core::RelayCmd::e_Data, id)),
      core::ProtocolError,
      m_IsCircProto);
}

BOOST_AUTO_TEST_CASE(ReaderGone)
{
  core::CircHop hop(core::HopNum(0), Settings(true));
  const core::StreamId id = Begin(hop);
  hop.HandleMsg(Msg(core::RelayCmd::e_Connected, id));
  m_Sink->Close();
  // Dropped, but still counted against the stream
  for (int i = 0; i < 10; i++)
    hop.HandleMsg(Msg(core::RelayCmd::e_Data, id));
  BOOST_REQUIRE(hop.CloseStream(id, core::EndReason::e_Misc));
  for (int i = 0; i < 490; i++)
    hop.HandleMsg(Msg(core::RelayCmd::e_Data, id));
  BOOST_CHECK_EXCEPTION(
      hop.HandleMsg(Msg(core::RelayCmd::e_Data, id)),
      core::ProtocolError,
      m_IsCircProto);
}

BOOST_AUTO_TEST_CASE(XoffOnFullBuffer)
{
  m_Params.flow_ctrl.cc_xoff_client = 1;
  m_Params.flow_ctrl.cc_xoff_exit = 1;
  core::CircHop hop(core::HopNum(0), Settings(true));
  const core::StreamId id = Begin(hop);
  hop.HandleMsg(Msg(core::RelayCmd::e_Connected, id));
  BOOST_CHECK(!hop.MaybeSendXoff(id));
  hop.HandleMsg(Msg(core::RelayCmd::e_Data, id));
  // Two queued cells are over a one cell limit
  auto xoff = hop.MaybeSendXoff(id);
  BOOST_REQUIRE(xoff);
  BOOST_CHECK(xoff->cmd == core::RelayCmd::e_Xoff);
  BOOST_CHECK(!hop.MaybeSendXon(0, id));

  m_Sink->TryGet();
  m_Sink->TryGet();
  auto xon = hop.MaybeSendXon(0, id);
  BOOST_REQUIRE(xon);
  BOOST_CHECK(xon->cmd == core::RelayCmd::e_Xon);
}

BOOST_AUTO_TEST_CASE(CircuitSendme)
{
  core::CircHop hop(core::HopNum(0), Settings(false));
  auto waker = std::make_shared<core::Waker>();
  hop.SetSendWaker(waker);
  std::vector<core::SendmeTag> tags;
  std::uint8_t bytes[core::SENDME_TAG_LEN]{};
  for (int i = 0; i < 1000; i++)
    {
      bytes[0] = static_cast<std::uint8_t>(i);
      bytes[1] = static_cast<std::uint8_t>(i >> 8);
      BOOST_REQUIRE(hop.CanSend());
      hop.NoteDataSent(core::SendmeTag(bytes));
      if (i % 100 == 99)
        tags.push_back(core::SendmeTag(bytes));
    }
  BOOST_CHECK(!hop.CanSend());
  const auto seen = waker->GetGeneration();
  hop.NoteSendmeReceived(tags[0], core::CongestionSignals());
  BOOST_CHECK(hop.CanSend());
  BOOST_CHECK(waker->GetGeneration() != seen);
}

BOOST_AUTO_TEST_CASE(ConcurrentHalves)
{
  core::CircHop hop(core::HopNum(0), Settings(false));
  auto sink = std::make_shared<core::StreamQueue>(1000);
  const core::StreamId id = hop.BeginStream(
      core::RelayMsg::Begin(0, "example.com", 80),
      sink,
      std::make_unique<core::DataStreamCmdChecker>()).second;
  hop.HandleMsg(Msg(core::RelayCmd::e_Connected, id));

  // One thread delivers while the other sends: neither holds the hop
  std::atomic<int> sent(0);
  std::thread sender([&hop, &sent, id] {
    for (int i = 0; i < 500; i++)
      if (hop.AboutToSend(Msg(core::RelayCmd::e_Data, id))
          == core::StreamSendStatus::e_Sendable)
        ++sent;
  });
  for (int i = 0; i < 500; i++)
    hop.HandleMsg(Msg(core::RelayCmd::e_Data, id));
  sender.join();
  BOOST_CHECK_EQUAL(sent.load(), 500);
  BOOST_CHECK_EQUAL(sink->GetSize(), 501u);
}

BOOST_AUTO_TEST_CASE(HopList)
{
  tests::FakePath path(3);
  core::CircHopList hops;
  BOOST_CHECK_EXCEPTION(
      hops.ResolveTargetHop(core::TargetHop::Last()),
      core::ProtocolError,
      tests::IsKind(core::ErrorKind::e_NoSuchHop));
  for (std::size_t i = 0; i < path.GetSize(); i++)
    BOOST_CHECK(
        hops.AddHop(Settings(true), path.GetClientLayers(i))
        == core::HopNum(static_cast<std::uint8_t>(i)));
  BOOST_CHECK_EQUAL(hops.GetSize(), 3u);
  BOOST_CHECK(
      hops.ResolveTargetHop(core::TargetHop::Last()) == core::HopNum(2));
  BOOST_CHECK(
      hops.ResolveTargetHop(core::TargetHop::Hop(core::HopNum(1)))
      == core::HopNum(1));
  BOOST_CHECK_EXCEPTION(
      hops.ResolveTargetHop(core::TargetHop::Hop(core::HopNum(3))),
      core::ProtocolError,
      [](const core::ProtocolError& ex) {
        return std::string(ex.what()) == "No hop #4 on circuit";
      });

  BOOST_CHECK(
      hops.GetLastActivity().state == core::TunnelActivity::State::e_NeverUsed);
  const core::StreamId id = Begin(*hops.GetHop(core::HopNum(2)));
  auto activity = hops.GetLastActivity();
  BOOST_CHECK(activity.state == core::TunnelActivity::State::e_InUse);
  BOOST_CHECK_EQUAL(activity.n_open_streams, 1u);
  BOOST_CHECK(hops.HasStreams());

  hops.GetHop(core::HopNum(2))->CloseStream(id, core::EndReason::e_Done);
  activity = hops.GetLastActivity();
  BOOST_CHECK(activity.state == core::TunnelActivity::State::e_Unused);
  BOOST_CHECK(activity.unused_since);

  hops.CloseStreams();
  BOOST_CHECK(!hops.HasStreams());
}

BOOST_AUTO_TEST_SUITE_END()
