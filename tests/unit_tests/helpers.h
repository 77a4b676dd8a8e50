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

#ifndef TESTS_UNIT_TESTS_HELPERS_H_
#define TESTS_UNIT_TESTS_HELPERS_H_

#include <boost/optional.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "core/cell/cell.h"
#include "core/crypto/relay_crypt.h"
#include "core/util/error.h"

namespace shallot
{
namespace tests
{
/// @return Predicate for BOOST_CHECK_EXCEPTION matching on the error kind
inline std::function<bool(const core::ProtocolError&)> IsKind(
    core::ErrorKind kind)
{
  return [kind](const core::ProtocolError& ex) { return ex.GetKind() == kind; };
}

/// @return Deterministic key material, distinct per index
inline std::vector<std::uint8_t> MakeSeed(
    core::RelayCryptProtocol protocol,
    std::uint8_t index)
{
  std::vector<std::uint8_t> seed(core::GetSeedLength(protocol));
  for (std::size_t i = 0; i < seed.size(); i++)
    seed[i] = static_cast<std::uint8_t>(index * 31 + i);
  return seed;
}

/// @class FakePath
/// @brief Relay side of a circuit's crypto: every hop keeps its own copy of
///   the layers the client negotiated with it
class FakePath
{
 public:
  explicit FakePath(
      std::size_t hops,
      core::RelayCryptProtocol protocol = core::RelayCryptProtocol::e_Tor1)
      : m_Protocol(protocol)
  {
    for (std::size_t i = 0; i < hops; i++)
      m_Relays.push_back(core::CreateHopLayers(m_Protocol, GetSeed(i)));
  }

  std::size_t GetSize() const noexcept
  {
    return m_Relays.size();
  }

  std::vector<std::uint8_t> GetSeed(std::size_t hop) const
  {
    return MakeSeed(m_Protocol, static_cast<std::uint8_t>(hop + 1));
  }

  /// @return Fresh client-side layers for the hop
  core::HopLayers GetClientLayers(std::size_t hop) const
  {
    return core::CreateHopLayers(m_Protocol, GetSeed(hop));
  }

  /// @brief Lets every relay peel its layer off a cell sent by the client
  /// @return Hop that recognized the cell and the cell's SENDME tag
  boost::optional<std::pair<std::size_t, core::SendmeTag>> Receive(
      core::RelayCellBody& cell)
  {
    for (std::size_t i = 0; i < m_Relays.size(); i++)
      if (auto tag = m_Relays[i].forward->DecryptInbound(cell))
        return std::make_pair(i, *tag);
    return boost::none;
  }

  /// @brief Builds a cell from the hop to the client, wrapped by every
  ///   relay in between
  /// @return SENDME tag of the cell
  core::SendmeTag Originate(std::size_t hop, core::RelayCellBody& cell)
  {
    const core::SendmeTag tag = m_Relays.at(hop).backward->OriginateFor(cell);
    for (std::size_t i = hop; i-- > 0;)
      m_Relays[i].backward->EncryptOutbound(cell);
    return tag;
  }

 private:
  core::RelayCryptProtocol m_Protocol;
  std::vector<core::HopLayers> m_Relays;
};

}  // namespace tests
}  // namespace shallot

#endif  // TESTS_UNIT_TESTS_HELPERS_H_
