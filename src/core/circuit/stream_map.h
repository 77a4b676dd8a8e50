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

#ifndef SRC_CORE_CIRCUIT_STREAM_MAP_H_
#define SRC_CORE_CIRCUIT_STREAM_MAP_H_

#include <boost/optional.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>

#include "core/cell/relay_cell.h"
#include "core/circuit/flow_ctrl.h"
#include "core/util/queue.h"

namespace shallot
{
namespace core
{
/// @brief Messages a circuit delivers to one stream
typedef Queue<RelayMsg> StreamQueue;

/// @enum StreamStatus
/// @brief Whether a stream is still open after a message
enum struct StreamStatus : std::uint8_t
{
  e_Open,
  e_Closed,
};

/// @enum ShouldSendEnd
enum struct ShouldSendEnd : std::uint8_t
{
  e_Send,
  e_DontSend,
};

/// @class CmdChecker
/// @brief Tells which inbound messages a kind of stream accepts
class CmdChecker
{
 public:
  virtual ~CmdChecker() = default;

  /// @return Whether the stream stays open after the message
  /// @throw ProtocolError (e_CircProto) on a message the stream can't get
  virtual StreamStatus CheckMsg(const RelayMsg& msg) = 0;
};

/// @class DataStreamCmdChecker
/// @brief Checker of streams opened with BEGIN or BEGIN_DIR
class DataStreamCmdChecker : public CmdChecker
{
 public:
  DataStreamCmdChecker() : m_ExpectingConnected(true) {}

  StreamStatus CheckMsg(const RelayMsg& msg) override;

 private:
  bool m_ExpectingConnected;
};

/// @class ResolveStreamCmdChecker
/// @brief Checker of streams opened with RESOLVE
class ResolveStreamCmdChecker : public CmdChecker
{
 public:
  StreamStatus CheckMsg(const RelayMsg& msg) override;
};

/// @class HalfStream
/// @brief Stream we sent END on, and whose END we still wait for
/// @details Keeps the stream's windows so that the peer can't use a closed
///   stream to exceed them
class HalfStream
{
 public:
  HalfStream(
      StreamFlowCtrl flow_ctrl,
      StreamRecvWindow recv_window,
      std::unique_ptr<CmdChecker> cmd_checker);

  /// @return e_Closed once the peer's END (or RESOLVED) arrived
  /// @throw ProtocolError (e_CircProto) on a message the stream can't get
  StreamStatus HandleMsg(const RelayMsg& msg);

  const StreamRecvWindow& GetRecvWindow() const noexcept
  {
    return m_RecvWindow;
  }

 private:
  StreamFlowCtrl m_FlowCtrl;
  StreamRecvWindow m_RecvWindow;
  std::unique_ptr<CmdChecker> m_CmdChecker;
};

/// @class OpenStreamEnt
/// @brief Stream the application still uses
struct OpenStreamEnt
{
  OpenStreamEnt(
      std::shared_ptr<StreamQueue> sink,
      StreamFlowCtrl flow_ctrl,
      std::unique_ptr<CmdChecker> cmd_checker);

  std::shared_ptr<StreamQueue> sink;
  StreamFlowCtrl flow_ctrl;
  /// Counted cells we couldn't deliver since the application went away
  std::uint16_t dropped;
  std::unique_ptr<CmdChecker> cmd_checker;
};

/// @class StreamEnt
struct StreamEnt
{
  enum struct State : std::uint8_t
  {
    e_Open,
    /// The peer sent END, we didn't yet
    e_EndReceived,
    /// We sent END, the peer didn't yet
    e_EndSent,
  };

  State state;
  /// e_Open only
  std::unique_ptr<OpenStreamEnt> open;
  /// e_EndSent only
  std::unique_ptr<HalfStream> half;
};

/// @class StreamMap
/// @brief Streams of one circuit hop, by id
/// @details Not thread-safe: the owning CircHop guards it with a mutex
class StreamMap
{
 public:
  typedef std::chrono::steady_clock Clock;

  StreamMap();

  /// @brief Adds an open stream under a new id
  /// @throw ProtocolError (e_IdRangeFull) if every id is in use
  StreamId AddEnt(
      std::shared_ptr<StreamQueue> sink,
      StreamFlowCtrl flow_ctrl,
      std::unique_ptr<CmdChecker> cmd_checker);

  /// @return Entry of the stream, nullptr if unknown
  StreamEnt* Get(StreamId id);

  /// @brief Handles the peer's END (or an equivalent closing message)
  /// @throw ProtocolError (e_CircProto) on an unknown or ended stream
  void EndingMsgReceived(StreamId id);

  /// @brief Handles our side closing the stream
  /// @return Whether we must send END
  /// @throw ProtocolError (e_Internal) if the stream can't be terminated,
  ///   (e_CircProto) if the peer already exceeded the stream's window
  ShouldSendEnd Terminate(StreamId id);

  void Remove(StreamId id);

  /// @brief Closes the sinks of every open stream and forgets all streams
  void CloseAll();

  std::size_t GetOpenCount() const noexcept
  {
    return m_OpenCount;
  }

  std::size_t GetSize() const noexcept
  {
    return m_Streams.size();
  }

  /// @return Time the last open stream went away, none while some are open
  ///   or if the map never had one
  boost::optional<Clock::time_point> GetUnusedSince() const noexcept
  {
    return m_UnusedSince;
  }

 private:
  StreamId GetNextId();

  void SetState(StreamEnt& ent, StreamEnt::State state);

 private:
  std::map<StreamId, StreamEnt> m_Streams;
  StreamId m_NextStreamId;
  std::size_t m_OpenCount;
  boost::optional<Clock::time_point> m_UnusedSince;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CIRCUIT_STREAM_MAP_H_
