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

#ifndef SRC_CORE_CRYPTO_RELAY_CRYPT_H_
#define SRC_CORE_CRYPTO_RELAY_CRYPT_H_

#include <boost/optional.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "core/cell/cell.h"

namespace shallot
{
namespace core
{
/// @enum RelayCryptProtocol
/// @brief Cipher and digest pair negotiated for a hop
enum struct RelayCryptProtocol : std::uint8_t
{
  /// AES-128-CTR + SHA-1, regular circuits
  e_Tor1,
  /// AES-256-CTR + SHA3-256, onion service rendezvous hop
  e_HsV3,
};

/// Length of the circuit binding key (KH)
const std::size_t CIRCUIT_BINDING_LEN = 20;

/// @brief Key material binding a circuit hop, derived with the layer keys
typedef std::array<std::uint8_t, CIRCUIT_BINDING_LEN> CircuitBinding;

/// @return Seed length the handshake must supply for the given protocol
/// @details 2 x digest key + 2 x cipher key + circuit binding
std::size_t GetSeedLength(RelayCryptProtocol protocol);

/// @class HopCryptLayer
/// @brief One direction of the symmetric state shared with a hop:
///   a stream cipher keyed once from the seed and a running digest
/// @details A client uses the forward layer to originate and wrap outbound
///   cells, and the backward layer to unwrap inbound ones. A relay does the
///   reverse with the same operations. Layers are never shared between hops.
class HopCryptLayer
{
 public:
  virtual ~HopCryptLayer() = default;

  /// @brief Prepares a cell for the hop which should recognize it
  /// @details Zeroes recognized and digest fields, folds the cell into the
  ///   running digest, stores the truncated digest in the cell and encrypts
  /// @return The SENDME tag the hop will send back for this cell
  virtual SendmeTag OriginateFor(RelayCellBody& cell) = 0;

  /// @brief Applies one layer of keystream to a cell not meant for this hop
  virtual void EncryptOutbound(RelayCellBody& cell) = 0;

  /// @brief Removes one layer of keystream and checks whether the cell is
  ///   now recognized
  /// @details The running digest only advances on a match
  /// @return The SENDME tag of the cell when recognized, none otherwise
  virtual boost::optional<SendmeTag> DecryptInbound(RelayCellBody& cell) = 0;
};

/// @class HopLayers
/// @brief Both directions of a hop's relay crypto, plus its binding key
struct HopLayers
{
  /// Client to relay
  std::unique_ptr<HopCryptLayer> forward;
  /// Relay to client
  std::unique_ptr<HopCryptLayer> backward;
  CircuitBinding binding;
};

/// @brief Builds a hop's layers from handshake key material
/// @param protocol Negotiated cipher/digest pair
/// @param seed Key material, laid out Df | Db | Kf | Kb | KH
/// @throw std::length_error if the seed length is wrong for the protocol
HopLayers CreateHopLayers(
    RelayCryptProtocol protocol,
    const std::vector<std::uint8_t>& seed);

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CRYPTO_RELAY_CRYPT_H_
