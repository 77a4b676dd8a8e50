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

#ifndef SRC_CORE_CELL_CELL_H_
#define SRC_CORE_CELL_CELL_H_

#include <boost/optional.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace shallot
{
namespace core
{
/// Fixed size of a cell body, relay cells included
const std::size_t CELL_BODY_LEN = 509;

/// Length of a SENDME authentication tag, whatever the digest in use
const std::size_t SENDME_TAG_LEN = 20;

/// @class HopNum
/// @brief Zero-based index of a hop on a circuit
class HopNum
{
 public:
  HopNum() : m_Hop(0) {}
  explicit HopNum(std::uint8_t hop) : m_Hop(hop) {}

  std::uint8_t Get() const noexcept
  {
    return m_Hop;
  }

  bool IsFirstHop() const noexcept
  {
    return m_Hop == 0;
  }

  /// @return One-based display form, e.g. "#1" for the first hop
  std::string ToString() const;

  bool operator==(const HopNum& other) const noexcept
  {
    return m_Hop == other.m_Hop;
  }

  bool operator!=(const HopNum& other) const noexcept
  {
    return m_Hop != other.m_Hop;
  }

  bool operator<(const HopNum& other) const noexcept
  {
    return m_Hop < other.m_Hop;
  }

 private:
  std::uint8_t m_Hop;
};

std::ostream& operator<<(std::ostream& os, const HopNum& hop);

/// Wire-level circuit identifier, never zero on a circuit cell
typedef std::uint32_t CircId;

/// Stream identifier within a circuit hop, never zero
typedef std::uint16_t StreamId;

/// @class SendmeTag
/// @brief Truncated digest which authenticates a circuit SENDME
class SendmeTag
{
 public:
  SendmeTag() : m_Tag{} {}

  /// @param data Must point to at least SENDME_TAG_LEN bytes
  explicit SendmeTag(const std::uint8_t* data);

  const std::uint8_t* data() const noexcept
  {
    return m_Tag.data();
  }

  std::size_t size() const noexcept
  {
    return m_Tag.size();
  }

  /// @brief Constant-time comparison
  bool operator==(const SendmeTag& other) const;

  bool operator!=(const SendmeTag& other) const
  {
    return !(*this == other);
  }

 private:
  std::array<std::uint8_t, SENDME_TAG_LEN> m_Tag;
};

/// @brief Body of a relay cell, encrypted and decrypted in place
typedef std::array<std::uint8_t, CELL_BODY_LEN> RelayCellBody;

/// @enum ChanCmd
/// @brief Channel cell command
enum struct ChanCmd : std::uint8_t
{
  e_Padding = 0,
  e_Create = 1,
  e_Created = 2,
  e_Relay = 3,
  e_Destroy = 4,
  e_CreateFast = 5,
  e_CreatedFast = 6,
  e_Versions = 7,
  e_Netinfo = 8,
  e_RelayEarly = 9,
  e_Create2 = 10,
  e_Created2 = 11,
  e_PaddingNegotiate = 12,
  e_VPadding = 128,
  e_Certs = 129,
  e_AuthChallenge = 130,
  e_Authenticate = 131,
  e_Authorize = 132,
};

/// @return Wire name of the command, e.g. "CREATE2"
std::string GetChanCmdName(ChanCmd cmd);

/// @brief DESTROY reason codes
enum struct DestroyReason : std::uint8_t
{
  e_None = 0,
  e_Protocol = 1,
  e_Internal = 2,
  e_Requested = 3,
  e_Finished = 9,
};

/// @class ChanMsg
/// @brief Command and body of a channel cell
struct ChanMsg
{
  ChanCmd cmd;
  std::vector<std::uint8_t> body;
};

/// @class ChanCell
/// @brief Channel cell as it travels between a channel and its circuits
struct ChanCell
{
  /// Absent on channel-level cells (VERSIONS, PADDING, ...)
  boost::optional<CircId> circ_id;
  ChanMsg msg;
};

/// @brief Builds a RELAY (or RELAY_EARLY) cell for the given circuit
ChanCell MakeRelayCell(
    CircId circ_id,
    const RelayCellBody& body,
    bool early = false);

/// @brief Builds a DESTROY cell for the given circuit
ChanCell MakeDestroyCell(CircId circ_id, DestroyReason reason);

/// @brief Copies a channel message body into a relay cell body
/// @throw std::length_error if the body is not exactly one relay cell
RelayCellBody GetRelayCellBody(const ChanMsg& msg);

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CELL_CELL_H_
