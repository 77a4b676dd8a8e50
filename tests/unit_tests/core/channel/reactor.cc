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

#include <chrono>
#include <future>
#include <memory>
#include <string>

#include "core/channel/cell_transport.h"
#include "core/channel/reactor.h"
#include "helpers.h"

namespace core = shallot::core;
namespace tests = shallot::tests;

struct ChannelReactorFixture
{
  ChannelReactorFixture()
      : m_FromRelay(std::make_shared<core::CellQueue>()),
        m_ToRelay(std::make_shared<core::CellQueue>()),
        m_Reactor(std::make_shared<core::ChannelReactor>(
            std::make_unique<core::QueueCellStream>(m_FromRelay),
            std::make_unique<core::QueueCellSink>(m_ToRelay),
            core::CircIdRange::e_High,
            2,     // half-closed circuits accept 2 more cells
            4)),   // circuit queue size
        m_Handle(m_Reactor->GetHandle())
  {
  }

  /// @brief Polls until nothing is left to do
  /// @return Last status returned
  core::ReactorStatus PollUntilIdle()
  {
    core::ReactorStatus status = core::ReactorStatus::e_Progress;
    for (int i = 0; i < 1000 && status == core::ReactorStatus::e_Progress; i++)
      status = m_Reactor->Poll();
    return status;
  }

  core::PendingCircuit Allocate()
  {
    auto future = m_Handle.AllocateCircuit();
    PollUntilIdle();
    BOOST_REQUIRE(
        future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
    return future.get();
  }

  /// @brief Allocates a circuit and lets the relay answer CREATED2
  core::PendingCircuit Open()
  {
    core::PendingCircuit circ = Allocate();
    Receive(circ.id, core::ChanCmd::e_Created2);
    PollUntilIdle();
    BOOST_REQUIRE(circ.created->TryGet());
    return circ;
  }

  /// @brief Queues a cell from the relay
  void Receive(
      boost::optional<core::CircId> id,
      core::ChanCmd cmd,
      std::size_t body_len = 0)
  {
    m_FromRelay->TryPut(core::ChanCell{
        id, core::ChanMsg{cmd, std::vector<std::uint8_t>(body_len)}});
  }

  void ReceiveRelay(core::CircId id)
  {
    Receive(id, core::ChanCmd::e_Relay, core::CELL_BODY_LEN);
  }

  /// @brief Polls once and checks that the channel failed with the message
  void CheckChannelError(const std::string& message)
  {
    BOOST_CHECK_EXCEPTION(
        PollUntilIdle(),
        core::ProtocolError,
        [&message](const core::ProtocolError& ex) {
          return ex.IsChannelFatal() && message == ex.what();
        });
    BOOST_CHECK(m_Reactor->GetState() == core::ChannelState::e_Closed);
    // Errors are only reported once
    BOOST_CHECK(m_Reactor->Poll() == core::ReactorStatus::e_Shutdown);
  }

  std::shared_ptr<core::CellQueue> m_FromRelay, m_ToRelay;
  std::shared_ptr<core::ChannelReactor> m_Reactor;
  core::ChannelHandle m_Handle;
};

BOOST_FIXTURE_TEST_SUITE(ChannelReactorTests, ChannelReactorFixture)

BOOST_AUTO_TEST_CASE(AllocateCircuit)
{
  BOOST_CHECK(m_Reactor->ChannelUnusedSince());
  const core::PendingCircuit circ = Allocate();
  // We initiated the channel: high half of the id space
  BOOST_CHECK_GE(circ.id, 0x80000000);
  BOOST_CHECK_EQUAL(m_Reactor->GetCircMap().GetOpenCount(), 1);
  BOOST_CHECK(!m_Reactor->ChannelUnusedSince());
  const core::CircEnt* ent = m_Reactor->GetCircMap().Get(circ.id);
  BOOST_REQUIRE(ent);
  BOOST_CHECK(ent->state == core::CircEnt::State::e_Opening);
}

BOOST_AUTO_TEST_CASE(CreatedOpensCircuit)
{
  const core::PendingCircuit circ = Allocate();
  Receive(circ.id, core::ChanCmd::e_Created2, 64);
  PollUntilIdle();
  auto created = circ.created->TryGet();
  BOOST_REQUIRE(created);
  BOOST_CHECK(created->cmd == core::ChanCmd::e_Created2);
  BOOST_CHECK_EQUAL(created->body.size(), 64);
  BOOST_CHECK(
      m_Reactor->GetCircMap().Get(circ.id)->state
      == core::CircEnt::State::e_Open);

  // Later cells go to the circuit
  ReceiveRelay(circ.id);
  PollUntilIdle();
  auto relay = circ.cells->TryGet();
  BOOST_REQUIRE(relay);
  BOOST_CHECK(relay->cmd == core::ChanCmd::e_Relay);

  // A second CREATED2 is a violation
  Receive(circ.id, core::ChanCmd::e_Created2);
  CheckChannelError("Unexpected CREATED* cell not on opening circuit");
}

BOOST_AUTO_TEST_CASE(CreateOnClientChannel)
{
  Receive(core::CircId(5), core::ChanCmd::e_Create2);
  CheckChannelError("CREATE2 cell on client channel");
}

BOOST_AUTO_TEST_CASE(HandshakeCellAfterHandshake)
{
  Receive(boost::none, core::ChanCmd::e_Netinfo);
  CheckChannelError("NETINFO cell after handshake is done");
}

BOOST_AUTO_TEST_CASE(RelayOnNonexistentCircuit)
{
  ReceiveRelay(0x80000001);
  CheckChannelError("Relay cell on nonexistent circuit");
}

BOOST_AUTO_TEST_CASE(RelayWithoutCircuitId)
{
  Receive(boost::none, core::ChanCmd::e_Relay, core::CELL_BODY_LEN);
  CheckChannelError("Relay cell without circuit ID");
}

BOOST_AUTO_TEST_CASE(RelayOnPendingCircuit)
{
  const core::PendingCircuit circ = Allocate();
  ReceiveRelay(circ.id);
  CheckChannelError("Relay cell on pending circuit before CREATED* received");
  // Circuit queues are closed along with the channel
  BOOST_CHECK(circ.created->IsClosed());
  BOOST_CHECK(circ.cells->IsClosed());
}

BOOST_AUTO_TEST_CASE(CreatedWithoutCircuitId)
{
  Receive(boost::none, core::ChanCmd::e_Created2);
  CheckChannelError("CREATED2 cell without circuit ID");
}

BOOST_AUTO_TEST_CASE(DestroyOnNonexistentCircuit)
{
  Receive(core::CircId(0x80000001), core::ChanCmd::e_Destroy, 1);
  CheckChannelError("Destroy for nonexistent circuit");
}

BOOST_AUTO_TEST_CASE(PaddingIgnored)
{
  Receive(boost::none, core::ChanCmd::e_Padding);
  Receive(boost::none, core::ChanCmd::e_VPadding);
  BOOST_CHECK(PollUntilIdle() == core::ReactorStatus::e_Idle);
  BOOST_CHECK(m_Reactor->GetState() == core::ChannelState::e_Running);
}

BOOST_AUTO_TEST_CASE(DestroyOnPendingCircuit)
{
  const core::PendingCircuit circ = Allocate();
  Receive(circ.id, core::ChanCmd::e_Destroy, 1);
  PollUntilIdle();
  auto destroy = circ.created->TryGet();
  BOOST_REQUIRE(destroy);
  BOOST_CHECK(destroy->cmd == core::ChanCmd::e_Destroy);
  BOOST_CHECK(circ.created->IsDrained());
  BOOST_CHECK(!m_Reactor->GetCircMap().Get(circ.id));
  BOOST_CHECK(m_Reactor->ChannelUnusedSince());
}

BOOST_AUTO_TEST_CASE(DestroyOnOpenCircuit)
{
  const core::PendingCircuit circ = Open();
  Receive(circ.id, core::ChanCmd::e_Destroy, 1);
  PollUntilIdle();
  auto destroy = circ.cells->TryGet();
  BOOST_REQUIRE(destroy);
  BOOST_CHECK(destroy->cmd == core::ChanCmd::e_Destroy);
  BOOST_CHECK(circ.cells->IsDrained());
  BOOST_CHECK_EQUAL(m_Reactor->GetCircMap().GetSize(), 0);
}

BOOST_AUTO_TEST_CASE(CloseCircuit)
{
  const core::PendingCircuit circ = Open();
  m_Handle.CloseCircuit(circ.id);
  PollUntilIdle();
  auto destroy = m_ToRelay->TryGet();
  BOOST_REQUIRE(destroy);
  BOOST_CHECK(destroy->msg.cmd == core::ChanCmd::e_Destroy);
  BOOST_CHECK_EQUAL(*destroy->circ_id, circ.id);
  BOOST_CHECK(circ.cells->IsClosed());
  BOOST_CHECK(
      m_Reactor->GetCircMap().Get(circ.id)->state
      == core::CircEnt::State::e_DestroySent);
  BOOST_CHECK_EQUAL(m_Reactor->GetCircMap().GetOpenCount(), 0);

  // Closing again sends nothing
  m_Handle.CloseCircuit(circ.id);
  PollUntilIdle();
  BOOST_CHECK(m_ToRelay->IsEmpty());

  // The relay may not have seen our DESTROY yet
  ReceiveRelay(circ.id);
  ReceiveRelay(circ.id);
  BOOST_CHECK_NO_THROW(PollUntilIdle());
  ReceiveRelay(circ.id);
  CheckChannelError("Too many cells received on destroyed circuit");
}

BOOST_AUTO_TEST_CASE(DestroyAfterDestroySent)
{
  const core::PendingCircuit circ = Open();
  m_Handle.CloseCircuit(circ.id);
  PollUntilIdle();
  Receive(circ.id, core::ChanCmd::e_Destroy, 1);
  BOOST_CHECK_NO_THROW(PollUntilIdle());
  BOOST_CHECK(!m_Reactor->GetCircMap().Get(circ.id));
  BOOST_CHECK(m_Reactor->GetState() == core::ChannelState::e_Running);
}

BOOST_AUTO_TEST_CASE(CreatorGone)
{
  const core::PendingCircuit circ = Allocate();
  circ.created->Close();
  Receive(circ.id, core::ChanCmd::e_Created2);
  PollUntilIdle();
  auto destroy = m_ToRelay->TryGet();
  BOOST_REQUIRE(destroy);
  BOOST_CHECK(destroy->msg.cmd == core::ChanCmd::e_Destroy);
  BOOST_CHECK(
      m_Reactor->GetCircMap().Get(circ.id)->state
      == core::CircEnt::State::e_DestroySent);
}

BOOST_AUTO_TEST_CASE(CircuitReceiverGone)
{
  const core::PendingCircuit circ = Open();
  circ.cells->Close();
  ReceiveRelay(circ.id);
  PollUntilIdle();
  auto destroy = m_ToRelay->TryGet();
  BOOST_REQUIRE(destroy);
  BOOST_CHECK(destroy->msg.cmd == core::ChanCmd::e_Destroy);
  BOOST_CHECK(m_Reactor->GetState() == core::ChannelState::e_Running);
}

BOOST_AUTO_TEST_CASE(FullCircuitStallsChannel)
{
  const core::PendingCircuit circ = Open();
  for (int i = 0; i < 6; i++)
    ReceiveRelay(circ.id);
  BOOST_CHECK(PollUntilIdle() == core::ReactorStatus::e_Idle);
  // 4 queued, 1 held by the reactor, 1 left unread
  BOOST_CHECK_EQUAL(circ.cells->GetSize(), 4);
  BOOST_CHECK_EQUAL(m_FromRelay->GetSize(), 1);

  // Room on the circuit lets the channel go on
  circ.cells->TryGet();
  PollUntilIdle();
  BOOST_CHECK_EQUAL(circ.cells->GetSize(), 4);
  BOOST_CHECK_EQUAL(m_FromRelay->GetSize(), 0);
  while (circ.cells->TryGet())
    PollUntilIdle();
  BOOST_CHECK(m_FromRelay->IsEmpty());
}

BOOST_AUTO_TEST_CASE(OutboundCells)
{
  const core::PendingCircuit circ = Open();
  core::RelayCellBody body{};
  m_Handle.GetCellSender()->TryPut(core::MakeRelayCell(circ.id, body));
  PollUntilIdle();
  auto cell = m_ToRelay->TryGet();
  BOOST_REQUIRE(cell);
  BOOST_CHECK(cell->msg.cmd == core::ChanCmd::e_Relay);
  BOOST_CHECK_EQUAL(*cell->circ_id, circ.id);
}

BOOST_AUTO_TEST_CASE(Shutdown)
{
  const core::PendingCircuit circ = Open();
  m_Handle.Shutdown();
  BOOST_CHECK(PollUntilIdle() == core::ReactorStatus::e_Shutdown);
  BOOST_CHECK(m_Reactor->GetState() == core::ChannelState::e_Closed);
  BOOST_CHECK(m_Handle.IsClosed());
  BOOST_CHECK(circ.cells->IsClosed());
  // Shutting down twice is harmless
  BOOST_CHECK_NO_THROW(m_Handle.Shutdown());
  BOOST_CHECK(m_Reactor->Poll() == core::ReactorStatus::e_Shutdown);

  auto future = m_Handle.AllocateCircuit();
  BOOST_CHECK_EXCEPTION(
      future.get(),
      core::ProtocolError,
      tests::IsKind(core::ErrorKind::e_ChannelClosed));
}

BOOST_AUTO_TEST_CASE(InboundStreamEnds)
{
  const core::PendingCircuit circ = Allocate();
  m_FromRelay->Close();
  BOOST_CHECK(PollUntilIdle() == core::ReactorStatus::e_Shutdown);
  BOOST_CHECK(circ.created->IsClosed());
}

BOOST_AUTO_TEST_CASE(RunOnStrand)
{
  boost::asio::io_service service;
  // Keeps poll() from stopping the service once it runs out of handlers
  boost::asio::io_service::work work(service);
  m_Reactor->Start(service);
  auto future = m_Handle.AllocateCircuit();
  service.poll();
  BOOST_REQUIRE(
      future.wait_for(std::chrono::seconds(0)) == std::future_status::ready);
  const core::PendingCircuit circ = future.get();

  // Cells arriving later wake the reactor
  Receive(circ.id, core::ChanCmd::e_Created2);
  service.poll();
  BOOST_CHECK(circ.created->TryGet());

  m_Handle.Shutdown();
  service.poll();
  BOOST_CHECK(m_Reactor->IsShutdown());
}

BOOST_AUTO_TEST_SUITE_END()
