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

#include <vector>

#include "core/circuit/flow_ctrl.h"
#include "helpers.h"

namespace core = shallot::core;
namespace tests = shallot::tests;

struct FlowCtrlFixture
{
  FlowCtrlFixture()
      : m_Payload(100, 0x42),
        m_Data(core::RelayMsg::Data(1, m_Payload.data(), m_Payload.size())),
        m_Sendme(core::RelayMsg::Sendme(core::StreamId(1))),
        m_IsCircProto(tests::IsKind(core::ErrorKind::e_CircProto))
  {
  }

  std::vector<std::uint8_t> m_Payload;
  core::RelayMsg m_Data, m_Sendme;
  std::function<bool(const core::ProtocolError&)> m_IsCircProto;
  core::FlowCtrlParams m_Params;
};

BOOST_FIXTURE_TEST_SUITE(FlowCtrlTests, FlowCtrlFixture)

BOOST_AUTO_TEST_CASE(SendWindow)
{
  core::StreamSendWindow window;
  BOOST_CHECK_EQUAL(window.Get(), 500);
  // Full window: nothing to acknowledge
  BOOST_CHECK_EXCEPTION(window.Put(), core::ProtocolError, m_IsCircProto);
  for (int i = 0; i < 50; i++)
    window.Take();
  window.Put();
  BOOST_CHECK_EQUAL(window.Get(), 500);
  for (int i = 0; i < 500; i++)
    window.Take();
  BOOST_CHECK_EXCEPTION(
      window.Take(),
      core::ProtocolError,
      tests::IsKind(core::ErrorKind::e_Internal));
}

BOOST_AUTO_TEST_CASE(RecvWindow)
{
  core::StreamRecvWindow window;
  for (int i = 1; i < 50; i++)
    BOOST_CHECK(!window.Take());
  // Every 50 cells a SENDME is due
  BOOST_CHECK(window.Take());
  BOOST_CHECK_EQUAL(window.Get(), 450);
  window.Put();
  BOOST_CHECK_EQUAL(window.Get(), 500);

  window.DecrementN(499);
  window.Take();
  BOOST_CHECK_EXCEPTION(window.Take(), core::ProtocolError, m_IsCircProto);
  BOOST_CHECK_EXCEPTION(window.DecrementN(1), core::ProtocolError, m_IsCircProto);
}

BOOST_AUTO_TEST_CASE(WindowMode)
{
  core::StreamFlowCtrl flow_ctrl = core::StreamFlowCtrl::Window();
  BOOST_CHECK(flow_ctrl.GetMode() == core::FlowCtrlMode::e_Window);
  for (int i = 0; i < 500; i++)
    {
      BOOST_REQUIRE(flow_ctrl.CanSend(m_Data));
      flow_ctrl.TakeCapacityToSend(m_Data);
    }
  BOOST_CHECK(!flow_ctrl.CanSend(m_Data));
  // Only DATA is flow controlled
  const core::RelayMsg end = core::RelayMsg::End(1, core::EndReason::e_Done);
  BOOST_CHECK(flow_ctrl.CanSend(end));
  BOOST_CHECK_NO_THROW(flow_ctrl.TakeCapacityToSend(end));

  flow_ctrl.PutForIncomingSendme(m_Sendme);
  BOOST_CHECK_EQUAL(flow_ctrl.GetSendWindow().Get(), 50);
  BOOST_CHECK(flow_ctrl.CanSend(m_Data));

  BOOST_CHECK_EXCEPTION(
      flow_ctrl.HandleIncomingXon(core::RelayMsg::Xon(1, 0)),
      core::ProtocolError,
      m_IsCircProto);
  BOOST_CHECK_EXCEPTION(
      flow_ctrl.HandleIncomingXoff(core::RelayMsg::Xoff(1)),
      core::ProtocolError,
      m_IsCircProto);
  // Never asks the peer to slow down
  BOOST_CHECK(!flow_ctrl.MaybeSendXoff(1, 1000000));
  BOOST_CHECK(!flow_ctrl.MaybeSendXon(1, 0, 0));
}

BOOST_AUTO_TEST_CASE(XonXoffMode)
{
  core::StreamFlowCtrl flow_ctrl = core::StreamFlowCtrl::XonXoff(m_Params);
  BOOST_CHECK(flow_ctrl.GetMode() == core::FlowCtrlMode::e_XonXoff);
  BOOST_CHECK(flow_ctrl.IsXonReceived());
  BOOST_CHECK_EXCEPTION(
      flow_ctrl.PutForIncomingSendme(m_Sendme),
      core::ProtocolError,
      m_IsCircProto);

  // Nothing sent yet: the peer has no reason to flow control us
  BOOST_CHECK_EXCEPTION(
      flow_ctrl.HandleIncomingXoff(core::RelayMsg::Xoff(1)),
      core::ProtocolError,
      m_IsCircProto);
  BOOST_CHECK_EXCEPTION(
      flow_ctrl.HandleIncomingXon(core::RelayMsg::Xon(1, 100)),
      core::ProtocolError,
      m_IsCircProto);

  flow_ctrl.TakeCapacityToSend(m_Data);
  flow_ctrl.HandleIncomingXoff(core::RelayMsg::Xoff(1));
  BOOST_CHECK(!flow_ctrl.IsXonReceived());
  BOOST_CHECK(!flow_ctrl.CanSend(m_Data));
  BOOST_CHECK_EXCEPTION(
      flow_ctrl.TakeCapacityToSend(m_Data),
      core::ProtocolError,
      tests::IsKind(core::ErrorKind::e_Internal));
  BOOST_CHECK_EXCEPTION(
      flow_ctrl.HandleIncomingXoff(core::RelayMsg::Xoff(1)),
      core::ProtocolError,
      m_IsCircProto);

  // 8 kbit/s is 1000 bytes/s
  flow_ctrl.HandleIncomingXon(core::RelayMsg::Xon(1, 8));
  BOOST_CHECK(flow_ctrl.CanSend(m_Data));
  BOOST_CHECK_EQUAL(flow_ctrl.GetRateLimit(), 1000);
  // 0 and the maximum both mean unlimited
  flow_ctrl.HandleIncomingXon(core::RelayMsg::Xon(1, 0xFFFFFFFF));
  BOOST_CHECK_EQUAL(flow_ctrl.GetRateLimit(), 0);
}

BOOST_AUTO_TEST_CASE(BadXoffVersion)
{
  core::StreamFlowCtrl flow_ctrl = core::StreamFlowCtrl::XonXoff(m_Params);
  flow_ctrl.TakeCapacityToSend(m_Data);
  core::RelayMsg xoff = core::RelayMsg::Xoff(1);
  xoff.body[0] = 1;
  BOOST_CHECK_EXCEPTION(
      flow_ctrl.HandleIncomingXoff(xoff), core::ProtocolError, m_IsCircProto);
  xoff.body.clear();
  BOOST_CHECK_EXCEPTION(
      flow_ctrl.HandleIncomingXoff(xoff), core::ProtocolError, m_IsCircProto);
}

BOOST_AUTO_TEST_CASE(SendingXonXoff)
{
  core::StreamFlowCtrl flow_ctrl = core::StreamFlowCtrl::XonXoff(m_Params);
  const std::size_t limit = m_Params.GetXoffLimit();
  BOOST_CHECK_EQUAL(limit, 500 * 498);

  BOOST_CHECK(!flow_ctrl.MaybeSendXoff(1, limit));
  auto xoff = flow_ctrl.MaybeSendXoff(1, limit + 1);
  BOOST_REQUIRE(xoff);
  BOOST_CHECK(xoff->cmd == core::RelayCmd::e_Xoff);
  BOOST_CHECK_EQUAL(*xoff->stream_id, 1);
  // Once is enough
  BOOST_CHECK(!flow_ctrl.MaybeSendXoff(1, limit + 1));

  // Still over the limit: too early to resume
  BOOST_CHECK(!flow_ctrl.MaybeSendXon(1, 0, limit + 1));
  auto xon = flow_ctrl.MaybeSendXon(1, 0, 0);
  BOOST_REQUIRE(xon);
  BOOST_CHECK(xon->cmd == core::RelayCmd::e_Xon);
  BOOST_CHECK_EQUAL(core::ParseXonRate(xon->body), 0);

  // After XON, XOFF can be sent again
  BOOST_CHECK(flow_ctrl.MaybeSendXoff(1, limit + 1));
}

BOOST_AUTO_TEST_SUITE_END()
