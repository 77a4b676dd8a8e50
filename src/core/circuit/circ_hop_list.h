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

#ifndef SRC_CORE_CIRCUIT_CIRC_HOP_LIST_H_
#define SRC_CORE_CIRCUIT_CIRC_HOP_LIST_H_

#include <boost/optional.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include "core/cell/cell.h"
#include "core/circuit/circ_hop.h"
#include "core/circuit/hop_settings.h"
#include "core/crypto/crypt_stack.h"
#include "core/crypto/relay_crypt.h"
#include "core/util/queue.h"

namespace shallot
{
namespace core
{
/// @class TargetHop
/// @brief Hop a message is meant for
class TargetHop
{
 public:
  /// @brief Whichever hop is last when the target is resolved
  static TargetHop Last()
  {
    return TargetHop(boost::none);
  }

  static TargetHop Hop(HopNum hop)
  {
    return TargetHop(hop);
  }

  bool IsLast() const noexcept
  {
    return !m_Hop;
  }

  /// @note Only meaningful if !IsLast()
  HopNum GetHop() const
  {
    return *m_Hop;
  }

 private:
  explicit TargetHop(boost::optional<HopNum> hop) : m_Hop(hop) {}

  boost::optional<HopNum> m_Hop;
};

/// @class TunnelActivity
/// @brief Stream use of a circuit, for idle timeouts
struct TunnelActivity
{
  enum struct State : std::uint8_t
  {
    /// No stream was ever opened
    e_NeverUsed,
    e_InUse,
    /// All streams are gone
    e_Unused,
  };

  State state;
  std::size_t n_open_streams;
  /// e_Unused only: when the last stream went away
  boost::optional<StreamMap::Clock::time_point> unused_since;
};

/// @class CircHopList
/// @brief Hops of a circuit together with their relay crypto
/// @details Hops and layers are only ever appended, in lockstep. Each crypt
///   stack has its own lock, so that each reactor half only contends with
///   AddHop()
class CircHopList
{
 public:
  /// @brief Appends a hop and its layers
  /// @return Number of the new hop
  /// @throw ProtocolError (e_Internal) if the circuit is too long
  HopNum AddHop(const HopSettings& settings, HopLayers layers);

  /// @throw ProtocolError (e_NoSuchHop) if the hop isn't on the circuit
  HopNum ResolveTargetHop(const TargetHop& target) const;

  /// @throw ProtocolError (e_NoSuchHop) if the hop isn't on the circuit
  std::shared_ptr<CircHop> GetHop(HopNum hop) const;

  std::size_t GetSize() const;

  /// @brief Onion-wraps a cell for the given hop
  /// @return SENDME tag of the cell
  SendmeTag Encrypt(RelayCellBody& cell, HopNum hop);

  /// @brief Onion-peels an inbound cell
  /// @return Originating hop and SENDME tag of the cell
  std::pair<HopNum, SendmeTag> Decrypt(RelayCellBody& cell);

  /// @brief Sets the waker of the sending reactor half on every hop,
  ///   current and future
  void SetSendWaker(std::shared_ptr<Waker> waker);

  bool HasStreams() const;

  std::size_t GetOpenStreamCount() const;

  TunnelActivity GetLastActivity() const;

  /// @brief Closes the sinks of every stream on every hop
  void CloseStreams();

 private:
  std::vector<std::shared_ptr<CircHop>> GetHops() const;

 private:
  mutable std::mutex m_HopsMutex;
  std::vector<std::shared_ptr<CircHop>> m_Hops;
  std::shared_ptr<Waker> m_SendWaker;
  std::mutex m_OutboundMutex;
  OutboundCryptStack m_Outbound;
  std::mutex m_InboundMutex;
  InboundCryptStack m_Inbound;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CIRCUIT_CIRC_HOP_LIST_H_
