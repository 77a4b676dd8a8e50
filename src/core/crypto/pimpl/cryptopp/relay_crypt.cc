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

#include "core/crypto/relay_crypt.h"

#include <cryptopp/aes.h>
#include <cryptopp/misc.h>
#include <cryptopp/modes.h>
#include <cryptopp/sha.h>
#include <cryptopp/sha3.h>

#include <algorithm>
#include <stdexcept>

#include "core/cell/relay_cell.h"
#include "core/util/exception.h"

namespace shallot
{
namespace core
{
namespace
{
const std::size_t TOR1_KEY_LEN = 16, HSV3_KEY_LEN = 32;

/// @class Tor1Layer
/// @brief tor1 relay crypto: AES-CTR with a zero IV, and a running digest
/// @tparam KeyLen AES key length in bytes
/// @tparam Digest Crypto++ hash (copyable, so candidate states can be kept)
template <std::size_t KeyLen, typename Digest>
class Tor1Layer final : public HopCryptLayer
{
 public:
  Tor1Layer(const std::uint8_t* key, const std::uint8_t* digest_seed)
  {
    std::uint8_t iv[CryptoPP::AES::BLOCKSIZE]{};
    m_Cipher.SetKeyWithIV(key, KeyLen, iv, sizeof(iv));
    m_Digest.Update(digest_seed, Digest::DIGESTSIZE);
  }

  SendmeTag OriginateFor(RelayCellBody& cell) override
  {
    ClearAuthFields(cell);
    m_Digest.Update(cell.data(), cell.size());
    std::uint8_t digest[Digest::DIGESTSIZE];
    // Finalize a copy, the running state must keep going
    Digest(m_Digest).Final(digest);
    std::copy(
        digest,
        digest + relay_v0::DIGEST_LEN,
        cell.begin() + relay_v0::DIGEST_OFFSET);
    EncryptOutbound(cell);
    return SendmeTag(digest);
  }

  void EncryptOutbound(RelayCellBody& cell) override
  {
    m_Cipher.ProcessData(cell.data(), cell.data(), cell.size());
  }

  boost::optional<SendmeTag> DecryptInbound(RelayCellBody& cell) override
  {
    // CTR mode: decryption is the same keystream pass
    m_Cipher.ProcessData(cell.data(), cell.data(), cell.size());
    return IsRecognized(cell);
  }

 private:
  static void ClearAuthFields(RelayCellBody& cell)
  {
    std::fill_n(
        cell.begin() + relay_v0::RECOGNIZED_OFFSET, relay_v0::RECOGNIZED_LEN, 0);
    std::fill_n(cell.begin() + relay_v0::DIGEST_OFFSET, relay_v0::DIGEST_LEN, 0);
  }

  boost::optional<SendmeTag> IsRecognized(RelayCellBody& cell)
  {
    if (cell[relay_v0::RECOGNIZED_OFFSET]
        || cell[relay_v0::RECOGNIZED_OFFSET + 1])
      return boost::none;
    std::uint8_t received[relay_v0::DIGEST_LEN];
    std::copy_n(
        cell.begin() + relay_v0::DIGEST_OFFSET, relay_v0::DIGEST_LEN, received);
    std::fill_n(cell.begin() + relay_v0::DIGEST_OFFSET, relay_v0::DIGEST_LEN, 0);
    // Candidate state is only adopted if the cell turns out to be ours
    Digest candidate(m_Digest);
    candidate.Update(cell.data(), cell.size());
    std::uint8_t digest[Digest::DIGESTSIZE];
    Digest(candidate).Final(digest);
    std::copy_n(
        received, relay_v0::DIGEST_LEN, cell.begin() + relay_v0::DIGEST_OFFSET);
    if (!CryptoPP::VerifyBufsEqual(received, digest, relay_v0::DIGEST_LEN))
      return boost::none;
    m_Digest = candidate;
    return SendmeTag(digest);
  }

 private:
  typename CryptoPP::CTR_Mode<CryptoPP::AES>::Encryption m_Cipher;
  Digest m_Digest;
};

template <std::size_t KeyLen, typename Digest>
HopLayers ConstructLayers(const std::vector<std::uint8_t>& seed)
{
  const std::size_t digest_len = Digest::DIGESTSIZE;
  if (seed.size() != 2 * digest_len + 2 * KeyLen + CIRCUIT_BINDING_LEN)
    throw std::length_error("relay crypto seed has the wrong length");
  const std::uint8_t* df = seed.data();
  const std::uint8_t* db = df + digest_len;
  const std::uint8_t* kf = db + digest_len;
  const std::uint8_t* kb = kf + KeyLen;
  const std::uint8_t* kh = kb + KeyLen;
  HopLayers layers;
  layers.forward = std::make_unique<Tor1Layer<KeyLen, Digest>>(kf, df);
  layers.backward = std::make_unique<Tor1Layer<KeyLen, Digest>>(kb, db);
  std::copy_n(kh, CIRCUIT_BINDING_LEN, layers.binding.begin());
  return layers;
}
}  // namespace

std::size_t GetSeedLength(RelayCryptProtocol protocol)
{
  switch (protocol)
    {
      case RelayCryptProtocol::e_Tor1:
        return 2 * CryptoPP::SHA1::DIGESTSIZE + 2 * TOR1_KEY_LEN
               + CIRCUIT_BINDING_LEN;
      case RelayCryptProtocol::e_HsV3:
        return 2 * CryptoPP::SHA3_256::DIGESTSIZE + 2 * HSV3_KEY_LEN
               + CIRCUIT_BINDING_LEN;
    }
  throw std::invalid_argument("unknown relay crypto protocol");
}

HopLayers CreateHopLayers(
    RelayCryptProtocol protocol,
    const std::vector<std::uint8_t>& seed)
{
  try
    {
      switch (protocol)
        {
          case RelayCryptProtocol::e_Tor1:
            return ConstructLayers<TOR1_KEY_LEN, CryptoPP::SHA1>(seed);
          case RelayCryptProtocol::e_HsV3:
            return ConstructLayers<HSV3_KEY_LEN, CryptoPP::SHA3_256>(seed);
        }
      throw std::invalid_argument("unknown relay crypto protocol");
    }
  catch (...)
    {
      core::Exception ex("RelayCrypt");
      ex.Dispatch(__func__);
      throw;
    }
}

}  // namespace core
}  // namespace shallot
