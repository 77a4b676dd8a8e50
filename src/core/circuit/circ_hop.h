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

#ifndef SRC_CORE_CIRCUIT_CIRC_HOP_H_
#define SRC_CORE_CIRCUIT_CIRC_HOP_H_

#include <boost/optional.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>

#include "core/cell/cell.h"
#include "core/cell/relay_cell.h"
#include "core/circuit/hop_settings.h"
#include "core/circuit/stream_map.h"
#include "core/congestion/congestion.h"
#include "core/util/queue.h"

namespace shallot
{
namespace core
{
/// @class CellBudget
/// @brief Relay cells still permitted in one direction
/// @details Stores the limit plus one, so that the last permitted cell
///   leaves 1 behind and the next one fails. The count never grows
class CellBudget
{
 public:
  /// @param limit Cells permitted, none for unlimited
  explicit CellBudget(const boost::optional<std::uint32_t>& limit);

  /// @return False if the limit was reached
  bool TryDecrement() noexcept;

  /// @return Cells still permitted, none for unlimited
  boost::optional<std::uint32_t> GetRemaining() const noexcept;

 private:
  boost::optional<std::uint64_t> m_Remaining;
};

/// @enum StreamSendStatus
/// @brief Whether a stream message may go out now
enum struct StreamSendStatus : std::uint8_t
{
  /// Capacity was taken, send it
  e_Sendable,
  /// Stream flow control says wait
  e_Blocked,
  /// The stream isn't open anymore, drop it
  e_NotOpen,
};

/// @class CircHop
/// @brief Client state of one hop of a circuit
/// @details Shared by both halves of the circuit reactor. The stream map and
///   the congestion control each have their own mutex, held for the duration
///   of one call only. Calls never wait on a queue, so neither lock is ever
///   held across a reactor suspension point, and the two are never nested
class CircHop
{
 public:
  CircHop(HopNum hop, const HopSettings& settings);

  HopNum GetHopNum() const noexcept
  {
    return m_Hop;
  }

  RelayCellFormat GetRelayFormat() const noexcept
  {
    return m_Settings.relay_format;
  }

  const HopSettings& GetSettings() const noexcept
  {
    return m_Settings;
  }

  /// @brief Waker of the reactor half sending on this hop, woken whenever
  ///   a SENDME or XON may let a blocked message through
  void SetSendWaker(std::shared_ptr<Waker> waker);

  /// @brief Registers a new stream
  /// @param msg BEGIN (or BEGIN_DIR, RESOLVE) message, without stream id
  /// @param sink Queue the stream's inbound messages go to
  /// @return The message with its stream id set, and the id
  /// @throw ProtocolError (e_IdRangeFull) if no stream id is free
  std::pair<RelayMsg, StreamId> BeginStream(
      RelayMsg msg,
      std::shared_ptr<StreamQueue> sink,
      std::unique_ptr<CmdChecker> cmd_checker);

  /// @brief Closes our side of a stream
  /// @return END to send, none if the peer already ended the stream
  boost::optional<RelayMsg> CloseStream(StreamId id, EndReason reason);

  /// @brief Handles an inbound stream message
  /// @throw ProtocolError (e_CircProto) on a protocol violation
  void HandleMsg(const RelayMsg& msg);

  /// @brief Checks stream flow control before sending a stream message
  ///   and takes capacity for it
  StreamSendStatus AboutToSend(const RelayMsg& msg);

  /// @param rate Rate to advertise in kbps, 0 for unlimited
  /// @return XON to send once the stream's buffer drained
  boost::optional<RelayMsg> MaybeSendXon(std::uint32_t rate, StreamId id);

  /// @return XOFF to send if the stream's buffer is too large
  boost::optional<RelayMsg> MaybeSendXoff(StreamId id);

  std::size_t GetOpenStreamCount() const;

  /// @return True while some stream isn't fully closed
  bool HasActiveStreams() const;

  /// @return Time the last open stream went away, see StreamMap
  boost::optional<StreamMap::Clock::time_point> GetUnusedSince() const;

  /// @brief Closes every stream's sink
  void CloseStreams();

  /// @throw ProtocolError (e_ExcessInboundCells) once the limit is reached
  void DecrementInboundCellLimit();

  /// @throw ProtocolError (e_ExcessOutboundCells) once the limit is reached
  void DecrementOutboundCellLimit();

  /// @name Congestion control, locked per call
  /// @{
  bool CanSend() const;

  void NoteSendmeReceived(
      const SendmeTag& tag,
      const CongestionSignals& signals);

  void NoteSendmeSent();

  /// @return True if a circuit SENDME is due
  bool NoteDataReceived();

  void NoteDataSent(const SendmeTag& tag);

  bool UsesStreamSendme() const;

  bool UsesXonXoff() const;
  /// @}

 private:
  void WakeSender();

 private:
  HopNum m_Hop;
  HopSettings m_Settings;
  // Inbound budget is only touched by the forward half, outbound by the
  // backward half
  CellBudget m_InboundBudget, m_OutboundBudget;
  mutable std::mutex m_StreamsMutex;
  StreamMap m_Streams;
  mutable std::mutex m_CcMutex;
  CongestionControl m_Ccontrol;
  std::shared_ptr<Waker> m_SendWaker;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CIRCUIT_CIRC_HOP_H_
