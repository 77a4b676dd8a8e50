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

#ifndef SRC_CORE_CIRCUIT_BACKWARD_REACTOR_H_
#define SRC_CORE_CIRCUIT_BACKWARD_REACTOR_H_

#include <boost/optional.hpp>

#include <deque>
#include <memory>
#include <utility>

#include "core/cell/cell.h"
#include "core/cell/relay_cell.h"
#include "core/channel/cell_transport.h"
#include "core/channel/reactor.h"
#include "core/circuit/circ_hop_list.h"
#include "core/circuit/circ_msgs.h"
#include "core/congestion/algorithm.h"
#include "core/util/reactor.h"

namespace shallot
{
namespace core
{
/// @class BackwardReactor
/// @brief Half of a circuit reactor sending the circuit's cells
/// @details Each Poll() first handles one control message and one padding
///   event, since those change whether we may send at all. Then, only if the
///   outbound sink is ready, it sends at most one stream message and handles
///   at most one command of the forward half. A sink that isn't ready leaves
///   every other source untouched, so congestion on the channel propagates
///   back to the streams
class BackwardReactor : public Reactor
{
 public:
  /// @param commands Queue from the forward half
  /// @param streams Messages the application streams want sent
  /// @param output Sink towards the channel
  /// @param secondary Cells to relay from a leaky-pipe peer, if any
  /// @param padding Events of a padding machine, if any
  BackwardReactor(
      CircId id,
      std::shared_ptr<CircHopList> hops,
      std::shared_ptr<CircCmdQueue> commands,
      std::shared_ptr<StreamRequestQueue> streams,
      std::unique_ptr<CellSink> output,
      ChannelHandle channel,
      std::unique_ptr<CellStream> secondary = nullptr,
      std::shared_ptr<PaddingQueue> padding = nullptr);

  ~BackwardReactor();

  const std::shared_ptr<CircCtrlQueue>& GetControl() const noexcept
  {
    return m_Control;
  }

  /// @throw ProtocolError on the error which closed the circuit
  ReactorStatus Poll() override;

  bool IsClosed() const noexcept
  {
    return m_IsClosed;
  }

  bool IsBlocked() const noexcept
  {
    return m_IsBlocked;
  }

 private:
  /// @return False if the reactor must shut down
  bool HandleControl(const CircCtrlMsg& msg);

  void HandlePadding(const PaddingEvent& event);

  void HandleCommand(const CircCmd& cmd);

  /// @return True if a stream request was taken or sent
  bool SendStreamRequest();

  /// @brief Encodes, encrypts and sends a message, then updates the hop's
  ///   congestion control
  void SendRelayMsg(CircHop& hop, const RelayMsg& msg);

  /// @brief Handles a circuit SENDME received from the hop
  void HandleSendme(CircHop& hop, const RelayMsg& msg);

  /// @throw ProtocolError (e_Internal) if the hop isn't on the circuit,
  ///   since every message we queue was addressed to a known hop
  std::shared_ptr<CircHop> GetHop(HopNum hop) const;

  CongestionSignals GetSignals();

  ReactorStatus Shutdown();

 private:
  CircId m_CircId;
  std::shared_ptr<CircHopList> m_Hops;
  std::shared_ptr<CircCmdQueue> m_Commands;
  std::shared_ptr<StreamRequestQueue> m_Streams;
  std::unique_ptr<CellSink> m_Output;
  ChannelHandle m_Channel;
  std::unique_ptr<CellStream> m_Secondary;
  std::shared_ptr<PaddingQueue> m_Padding;
  std::shared_ptr<CircCtrlQueue> m_Control;
  /// END and DROP messages of our own, sent before anything else
  std::deque<std::pair<HopNum, RelayMsg>> m_Outgoing;
  /// Stream message waiting for flow or congestion control
  boost::optional<StreamRequest> m_PendingRequest;
  bool m_IsBlocked;
  bool m_IsClosed;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CIRCUIT_BACKWARD_REACTOR_H_
