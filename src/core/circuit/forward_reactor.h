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

#ifndef SRC_CORE_CIRCUIT_FORWARD_REACTOR_H_
#define SRC_CORE_CIRCUIT_FORWARD_REACTOR_H_

#include <deque>
#include <memory>

#include "core/cell/cell.h"
#include "core/channel/circ_map.h"
#include "core/channel/reactor.h"
#include "core/circuit/circ_hop_list.h"
#include "core/circuit/circ_msgs.h"
#include "core/util/reactor.h"

namespace shallot
{
namespace core
{
/// @class ForwardReactor
/// @brief Half of a circuit reactor handling the cells the channel routes
///   to the circuit
/// @details Authenticates and decrypts each relay cell, charges the hop's
///   inbound budget, and delivers stream messages. Everything that needs the
///   outbound direction (SENDME handling and sending, XOFF) goes to the
///   backward half as a CircCmd. While the backward half has no room for
///   a command, no further cell is read, so a blocked channel stalls the
///   circuit in both directions
class ForwardReactor : public Reactor
{
 public:
  /// @param input Queue the channel delivers the circuit's cells to
  /// @param commands Queue to the backward half, bounded
  ForwardReactor(
      CircId id,
      std::shared_ptr<CircMsgQueue> input,
      std::shared_ptr<CircHopList> hops,
      std::shared_ptr<CircCmdQueue> commands,
      ChannelHandle channel);

  ~ForwardReactor();

  /// @throw ProtocolError on the error which closed the circuit
  ReactorStatus Poll() override;

  bool IsClosed() const noexcept
  {
    return m_IsClosed;
  }

 private:
  /// @return False if the peer destroyed the circuit
  bool HandleChanMsg(const ChanMsg& msg);

  void HandleRelayCell(const ChanMsg& msg);

  /// @brief Queues a command for the backward half, see FlushCommands()
  void SendCommand(CircCmd cmd);

  /// @brief Hands queued commands over to the backward half, in order
  /// @return e_Full if some are still waiting for room
  SendStatus FlushCommands();

  ReactorStatus BackwardHalfGone();

  ReactorStatus Shutdown();

 private:
  CircId m_CircId;
  std::shared_ptr<CircMsgQueue> m_Input;
  std::shared_ptr<CircHopList> m_Hops;
  std::shared_ptr<CircCmdQueue> m_Commands;
  /// Commands the backward half had no room for yet
  std::deque<CircCmd> m_Unsent;
  ChannelHandle m_Channel;
  bool m_IsClosed;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CIRCUIT_FORWARD_REACTOR_H_
