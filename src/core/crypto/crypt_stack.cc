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

#include "core/crypto/crypt_stack.h"

#include "core/util/error.h"

namespace shallot
{
namespace core
{
SendmeTag OutboundCryptStack::Encrypt(RelayCellBody& cell, HopNum hop)
{
  const std::size_t target = hop.Get();
  if (target >= m_Layers.size())
    throw ProtocolError(ErrorKind::e_NoSuchHop, "No such hop " + hop.ToString());
  SendmeTag tag = m_Layers[target]->OriginateFor(cell);
  for (std::size_t layer = target; layer > 0; --layer)
    m_Layers[layer - 1]->EncryptOutbound(cell);
  return tag;
}

void OutboundCryptStack::AddLayer(std::unique_ptr<HopCryptLayer> layer)
{
  if (m_Layers.size() >= MAX_CRYPT_LAYERS)
    throw ProtocolError(ErrorKind::e_Internal, "Too many crypt layers");
  m_Layers.push_back(std::move(layer));
}

std::pair<HopNum, SendmeTag> InboundCryptStack::Decrypt(RelayCellBody& cell)
{
  for (std::size_t layer = 0; layer < m_Layers.size(); ++layer)
    {
      auto tag = m_Layers[layer]->DecryptInbound(cell);
      if (tag)
        return std::make_pair(HopNum(static_cast<std::uint8_t>(layer)), *tag);
    }
  throw ProtocolError(ErrorKind::e_BadCellAuth, "Bad cell authentication");
}

void InboundCryptStack::AddLayer(std::unique_ptr<HopCryptLayer> layer)
{
  if (m_Layers.size() >= MAX_CRYPT_LAYERS)
    throw ProtocolError(ErrorKind::e_Internal, "Too many crypt layers");
  m_Layers.push_back(std::move(layer));
}

}  // namespace core
}  // namespace shallot
