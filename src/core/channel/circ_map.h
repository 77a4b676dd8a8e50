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

#ifndef SRC_CORE_CHANNEL_CIRC_MAP_H_
#define SRC_CORE_CHANNEL_CIRC_MAP_H_

#include <boost/optional.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>

#include "core/cell/cell.h"
#include "core/util/queue.h"

namespace shallot
{
namespace core
{
/// Messages a channel hands to one of its circuits
typedef Queue<ChanMsg> CircMsgQueue;

/// Default number of cells accepted on a circuit after we sent DESTROY
const std::uint32_t HALF_CIRC_CELLS = 3000;

/// @enum CircIdRange
/// @brief Half of the circuit id space a side of a channel allocates from
enum struct CircIdRange : std::uint8_t
{
  /// 1 to 0x7FFFFFFF
  e_Low,
  /// 0x80000000 to 0xFFFFFFFF, used by the channel initiator
  e_High,
};

/// @class HalfCirc
/// @brief Circuit we sent a DESTROY on, which may still receive cells
///   the peer sent before it saw the DESTROY
class HalfCirc
{
 public:
  explicit HalfCirc(std::uint32_t allow_cells) : m_AllowCells(allow_cells) {}

  /// @throw ProtocolError (e_ChanProto) once the budget is spent
  void ReceiveCell();

  std::uint32_t GetAllowedCells() const noexcept
  {
    return m_AllowCells;
  }

 private:
  std::uint32_t m_AllowCells;
};

/// @class CircEnt
/// @brief Channel-side state of one circuit
struct CircEnt
{
  enum struct State : std::uint8_t
  {
    /// CREATE sent, waiting for CREATED
    e_Opening,
    e_Open,
    /// We sent DESTROY, the peer may not have seen it yet
    e_DestroySent,
  };

  static CircEnt Opening(
      std::shared_ptr<CircMsgQueue> created_sender,
      std::shared_ptr<CircMsgQueue> cell_sender);

  static CircEnt Open(std::shared_ptr<CircMsgQueue> cell_sender);

  static CircEnt DestroySent(const HalfCirc& half_circ);

  bool IsOpenOrOpening() const noexcept
  {
    return state != State::e_DestroySent;
  }

  State state;
  /// Receives the CREATED* (or DESTROY) reply, Opening only
  std::shared_ptr<CircMsgQueue> created_sender;
  /// Receives every other message of the circuit, Opening and Open
  std::shared_ptr<CircMsgQueue> cell_sender;
  /// DestroySent only
  boost::optional<HalfCirc> half_circ;
};

/// @class CircMap
/// @brief Circuits of a channel by circuit id
/// @details Keeps a count of circuits which are Opening or Open, and when
///   that count last dropped to zero
class CircMap
{
 public:
  typedef std::chrono::steady_clock Clock;

  explicit CircMap(CircIdRange range);

  /// @brief Adds an Opening circuit under a fresh random id
  /// @throw ProtocolError (e_IdRangeFull) if no free id was found
  CircId AddEnt(
      std::shared_ptr<CircMsgQueue> created_sender,
      std::shared_ptr<CircMsgQueue> cell_sender);

  /// @return Entry, or null if no such circuit
  /// @note The pointer is invalidated by any other call
  CircEnt* Get(CircId id);

  /// @brief Inserts an entry as is, replacing any entry under that id
  void Put(CircId id, CircEnt ent);

  /// @return The removed entry, none if there wasn't any
  boost::optional<CircEnt> Remove(CircId id);

  /// @brief Marks an Opening circuit Open
  /// @return Queue the CREATED* reply must go to
  /// @throw ProtocolError (e_ChanProto) if the circuit isn't Opening
  std::shared_ptr<CircMsgQueue> AdvanceFromOpening(CircId id);

  /// @brief Replaces the entry of a circuit we sent DESTROY on
  void DestroySent(CircId id, const HalfCirc& half_circ);

  /// @return Circuits which are Opening or Open
  std::size_t GetOpenCount() const noexcept
  {
    return m_OpenCount;
  }

  /// @return When the channel last became unused, none while in use
  boost::optional<Clock::time_point> ChannelUnusedSince() const noexcept
  {
    return m_UnusedSince;
  }

  std::size_t GetSize() const noexcept
  {
    return m_Circs.size();
  }

  /// @brief Closes the queues of every circuit and empties the map
  void CloseAll();

 private:
  CircId GetRandomId() const;

  void UpdateUnusedSince();

 private:
  CircIdRange m_Range;
  std::map<CircId, CircEnt> m_Circs;
  std::size_t m_OpenCount;
  boost::optional<Clock::time_point> m_UnusedSince;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CHANNEL_CIRC_MAP_H_
