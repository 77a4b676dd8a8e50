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

#ifndef SRC_CORE_CIRCUIT_CIRCUIT_H_
#define SRC_CORE_CIRCUIT_CIRCUIT_H_

#include <boost/asio/io_service.hpp>

#include <cstdint>
#include <memory>
#include <utility>

#include "core/cell/cell.h"
#include "core/cell/relay_cell.h"
#include "core/channel/reactor.h"
#include "core/circuit/backward_reactor.h"
#include "core/circuit/circ_hop_list.h"
#include "core/circuit/circ_msgs.h"
#include "core/circuit/forward_reactor.h"
#include "core/circuit/hop_settings.h"
#include "core/circuit/stream_map.h"
#include "core/crypto/relay_crypt.h"

namespace shallot
{
namespace core
{
/// Capacity of the queue of stream messages waiting to be sent
const std::size_t STREAM_REQUEST_QUEUE_SIZE = 128;

/// @class ClientCircuit
/// @brief Thread-safe handle of an open client circuit and its two reactors
/// @details Built once the channel delivered the CREATED* reply and the
///   handshake produced the first hop's key material
class ClientCircuit
{
 public:
  /// @param pending Circuit as allocated on the channel
  ClientCircuit(
      const PendingCircuit& pending,
      ChannelHandle channel,
      const CircParameters& params);

  ~ClientCircuit();

  CircId GetId() const noexcept
  {
    return m_Id;
  }

  const std::shared_ptr<ForwardReactor>& GetForwardReactor() const noexcept
  {
    return m_Forward;
  }

  const std::shared_ptr<BackwardReactor>& GetBackwardReactor() const noexcept
  {
    return m_Backward;
  }

  /// @brief Runs both halves on the given service
  void Start(boost::asio::io_service& service);

  /// @brief Appends a hop once its handshake completed
  HopNum AddHop(const HopSettings& settings, HopLayers layers);

  /// @throw ProtocolError (e_NoSuchHop) if the hop isn't on the circuit
  HopNum ResolveTargetHop(const TargetHop& target) const;

  /// @throw ProtocolError (e_NoSuchHop) if the hop isn't on the circuit
  std::shared_ptr<CircHop> GetHop(HopNum hop) const;

  /// @brief Opens a stream on a hop
  /// @param begin BEGIN, BEGIN_DIR or RESOLVE message, without stream id
  /// @return Id of the stream and the queue its messages arrive on
  /// @throw ProtocolError (e_ChannelClosed) if the circuit is closed
  std::pair<StreamId, std::shared_ptr<StreamQueue>> BeginStream(
      const TargetHop& target,
      RelayMsg begin,
      std::unique_ptr<CmdChecker> cmd_checker =
          std::make_unique<DataStreamCmdChecker>());

  /// @brief Queues a stream message, blocking while the queue is full
  /// @throw ProtocolError (e_ChannelClosed) if the circuit is closed
  void SendStreamMsg(HopNum hop, RelayMsg msg);

  /// @brief Closes our side of a stream, sending END if needed
  void CloseStream(HopNum hop, StreamId id, EndReason reason);

  /// @brief To be called once the application read from a stream
  /// @param rate Rate to advertise in kbps, 0 for unlimited
  /// @note Blocks while the backward half has no room for the XON
  void NoteStreamDrained(HopNum hop, StreamId id, std::uint32_t rate = 0);

  TunnelActivity GetActivity() const;

  void Shutdown();

 private:
  void Enqueue(StreamRequest request);

 private:
  CircId m_Id;
  CircParameters m_Params;
  std::shared_ptr<CircHopList> m_Hops;
  std::shared_ptr<CircCmdQueue> m_Commands;
  std::shared_ptr<StreamRequestQueue> m_Streams;
  std::shared_ptr<ForwardReactor> m_Forward;
  std::shared_ptr<BackwardReactor> m_Backward;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CIRCUIT_CIRCUIT_H_
