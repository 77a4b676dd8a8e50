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

#ifndef SRC_CORE_CRYPTO_CRYPT_STACK_H_
#define SRC_CORE_CRYPTO_CRYPT_STACK_H_

#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

#include "core/cell/cell.h"
#include "core/crypto/relay_crypt.h"

namespace shallot
{
namespace core
{
/// A circuit never has more layers than a HopNum can address
const std::size_t MAX_CRYPT_LAYERS = 255;

/// @class OutboundCryptStack
/// @brief Forward layers of every hop of a circuit, closest hop first
class OutboundCryptStack
{
 public:
  /// @brief Onion-wraps a cell for the given hop
  /// @details The target hop's layer originates the cell, then every layer
  ///   closer to us wraps it, from hop - 1 down to hop 0
  /// @return Tag the target hop will authenticate its SENDME with
  /// @throw ProtocolError (e_NoSuchHop) if the hop is not on the circuit
  SendmeTag Encrypt(RelayCellBody& cell, HopNum hop);

  /// @throw ProtocolError (e_Internal) once MAX_CRYPT_LAYERS is reached
  void AddLayer(std::unique_ptr<HopCryptLayer> layer);

  std::size_t GetSize() const noexcept
  {
    return m_Layers.size();
  }

 private:
  std::vector<std::unique_ptr<HopCryptLayer>> m_Layers;
};

/// @class InboundCryptStack
/// @brief Backward layers of every hop of a circuit, closest hop first
class InboundCryptStack
{
 public:
  /// @brief Onion-peels an inbound cell until some hop recognizes it
  /// @return The originating hop and the cell's SENDME tag
  /// @throw ProtocolError (e_BadCellAuth) if no hop recognizes the cell
  std::pair<HopNum, SendmeTag> Decrypt(RelayCellBody& cell);

  /// @throw ProtocolError (e_Internal) once MAX_CRYPT_LAYERS is reached
  void AddLayer(std::unique_ptr<HopCryptLayer> layer);

  std::size_t GetSize() const noexcept
  {
    return m_Layers.size();
  }

 private:
  std::vector<std::unique_ptr<HopCryptLayer>> m_Layers;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CRYPTO_CRYPT_STACK_H_
