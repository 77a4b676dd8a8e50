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

#ifndef SRC_CORE_CHANNEL_REACTOR_H_
#define SRC_CORE_CHANNEL_REACTOR_H_

#include <boost/optional.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <utility>

#include "core/cell/cell.h"
#include "core/channel/cell_transport.h"
#include "core/channel/circ_map.h"
#include "core/util/queue.h"
#include "core/util/reactor.h"

namespace shallot
{
namespace core
{
/// Default capacity of the queues between a channel and its circuits
const std::size_t CHANNEL_CELL_QUEUE_SIZE = 128;

/// @enum ChannelState
enum struct ChannelState : std::uint8_t
{
  e_Running,
  e_ShuttingDown,
  /// Terminal: the channel can't be used again
  e_Closed,
};

/// @class PendingCircuit
/// @brief Circuit allocated on a channel, waiting for its CREATED* reply
struct PendingCircuit
{
  CircId id;
  /// Gets the CREATED* reply, or a DESTROY if the circuit is refused
  std::shared_ptr<CircMsgQueue> created;
  /// Gets every later message of the circuit
  std::shared_ptr<CircMsgQueue> cells;
};

/// @class CtrlMsg
/// @brief Request to a channel reactor
struct CtrlMsg
{
  enum struct Type : std::uint8_t
  {
    e_Shutdown,
    e_CloseCircuit,
    e_AllocateCircuit,
  };

  Type type;
  /// e_CloseCircuit only
  CircId circ_id;
  /// e_AllocateCircuit only
  std::shared_ptr<std::promise<PendingCircuit>> reply;
};

typedef Queue<CtrlMsg> CtrlQueue;

/// @class ChannelHandle
/// @brief Thread-safe front end of a channel reactor
class ChannelHandle
{
 public:
  ChannelHandle(
      std::shared_ptr<CtrlQueue> control,
      std::shared_ptr<CellQueue> cells);

  /// @brief Asks the reactor for a new circuit id and circuit queues
  /// @return Result, set once the reactor handled the request.
  ///   It holds ProtocolError (e_IdRangeFull, e_ChannelClosed) on failure
  std::future<PendingCircuit> AllocateCircuit();

  /// @brief Asks the reactor to send DESTROY on an open circuit
  /// @note Does nothing once the channel is closed
  void CloseCircuit(CircId id);

  void Shutdown();

  /// @return Queue circuits put their outbound cells on
  const std::shared_ptr<CellQueue>& GetCellSender() const noexcept
  {
    return m_Cells;
  }

  bool IsClosed() const
  {
    return m_Control->IsClosed();
  }

 private:
  std::shared_ptr<CtrlQueue> m_Control;
  std::shared_ptr<CellQueue> m_Cells;
};

/// @class ChannelReactor
/// @brief Routes cells between a channel and its circuits
/// @details Each Poll() handles at most one control message, then at most
///   one inbound cell, then sends at most one outbound cell, and finally
///   flushes the sink. A protocol violation closes the channel: Poll()
///   throws it once, and every later call returns e_Shutdown
class ChannelReactor : public Reactor
{
 public:
  typedef CircMap::Clock Clock;

  /// @param range Circuit id range we allocate from
  /// @param half_circ_cells Cells accepted on a circuit after our DESTROY
  ChannelReactor(
      std::unique_ptr<CellStream> input,
      std::unique_ptr<CellSink> output,
      CircIdRange range,
      std::uint32_t half_circ_cells = HALF_CIRC_CELLS,
      std::size_t queue_size = CHANNEL_CELL_QUEUE_SIZE);

  ~ChannelReactor();

  ChannelHandle GetHandle() const;

  /// @throw ProtocolError on the error which closed the channel
  ReactorStatus Poll() override;

  ChannelState GetState() const noexcept
  {
    return m_State;
  }

  /// @note Owned by the reactor, only touch it from the reactor's thread
  CircMap& GetCircMap() noexcept
  {
    return m_Circs;
  }

  boost::optional<Clock::time_point> ChannelUnusedSince() const noexcept
  {
    return m_Circs.ChannelUnusedSince();
  }

 private:
  /// @return False if the reactor must shut down
  bool HandleControl(CtrlMsg msg);

  void HandleCell(ChanCell cell);

  void DeliverRelay(const boost::optional<CircId>& id, ChanMsg msg);

  void DeliverCreated(const boost::optional<CircId>& id, ChanMsg msg);

  void DeliverDestroy(const boost::optional<CircId>& id, ChanMsg msg);

  /// @return False if the circuit queue is full and the message was kept
  bool DeliverToCircuit(CircId id, ChanMsg& msg);

  /// @brief Sends DESTROY on an open or opening circuit
  void CloseCircuit(CircId id);

  /// @brief Sends DESTROY and remembers the circuit as half-closed
  void OutboundDestroyCirc(CircId id);

  ReactorStatus Shutdown();

 private:
  ChannelState m_State;
  std::unique_ptr<CellStream> m_Input;
  std::unique_ptr<CellSink> m_Output;
  std::shared_ptr<CtrlQueue> m_Control;
  std::shared_ptr<CellQueue> m_Cells;
  CircMap m_Circs;
  std::uint32_t m_HalfCircCells;
  std::size_t m_QueueSize;
  /// Cells of our own (DESTROY) sent before circuit cells
  std::deque<ChanCell> m_SpecialOutgoing;
  /// Relay cell a full circuit queue couldn't take yet
  boost::optional<std::pair<CircId, ChanMsg>> m_Stalled;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CHANNEL_REACTOR_H_
