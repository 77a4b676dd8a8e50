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

#ifndef SRC_CORE_CELL_RELAY_CELL_H_
#define SRC_CORE_CELL_RELAY_CELL_H_

#include <boost/optional.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "core/cell/cell.h"

namespace shallot
{
namespace core
{
/// @brief Positions of the fields of a V0 (legacy) relay cell
namespace relay_v0
{
const std::size_t CMD_OFFSET = 0,
                  RECOGNIZED_OFFSET = 1,
                  RECOGNIZED_LEN = 2,
                  STREAM_ID_OFFSET = 3,
                  DIGEST_OFFSET = 5,
                  DIGEST_LEN = 4,
                  LENGTH_OFFSET = 9,
                  HEADER_LEN = 11,
                  MAX_DATA_LEN = CELL_BODY_LEN - HEADER_LEN;  // 498
}  // namespace relay_v0

/// @brief Positions of the fields of a V1 relay cell
/// @details The stream id is only present for commands which take one, the
///   data follows it (or the length field when there's none)
namespace relay_v1
{
const std::size_t TAG_LEN = 16,
                  CMD_OFFSET = 16,
                  LENGTH_OFFSET = 17,
                  STREAM_ID_OFFSET = 19,
                  HEADER_LEN = 19,
                  STREAM_ID_LEN = 2,
                  MAX_DATA_LEN = CELL_BODY_LEN - HEADER_LEN;  // 490
}  // namespace relay_v1

/// @enum RelayCellFormat
/// @brief Relay cell layout negotiated with a hop
enum struct RelayCellFormat : std::uint8_t
{
  /// cmd, recognized, stream id, digest, length, data
  e_V0,
  /// tag, cmd, length, stream id if any, data
  e_V1,
};

/// @enum RelayCmd
/// @brief Relay message command
enum struct RelayCmd : std::uint8_t
{
  e_Begin = 1,
  e_Data = 2,
  e_End = 3,
  e_Connected = 4,
  e_Sendme = 5,
  e_Extend = 6,
  e_Extended = 7,
  e_Truncate = 8,
  e_Truncated = 9,
  e_Drop = 10,
  e_Resolve = 11,
  e_Resolved = 12,
  e_BeginDir = 13,
  e_Extend2 = 14,
  e_Extended2 = 15,
  e_Xoff = 43,
  e_Xon = 44,
};

/// @return Wire name of the command, e.g. "SENDME"
std::string GetRelayCmdName(RelayCmd cmd);

/// @return True if cells with this command count towards SENDME windows
/// @note Only DATA does
bool CmdCountsTowardsWindows(RelayCmd cmd) noexcept;

/// @enum EndReason
/// @brief Reason carried by an END message
enum struct EndReason : std::uint8_t
{
  e_Misc = 1,
  e_ResolveFailed = 2,
  e_ConnectRefused = 3,
  e_ExitPolicy = 4,
  e_Destroy = 5,
  e_Done = 6,
  e_Timeout = 7,
  e_NoRoute = 8,
  e_Hibernating = 9,
  e_Internal = 10,
  e_ResourceLimit = 11,
  e_ConnReset = 12,
  e_TorProtocol = 13,
  e_NotDirectory = 14,
};

/// @class RelayMsg
/// @brief Decoded relay message: command, stream and body
struct RelayMsg
{
  RelayCmd cmd;
  /// Absent for circuit-level messages
  boost::optional<StreamId> stream_id;
  std::vector<std::uint8_t> body;

  static RelayMsg Data(StreamId id, const std::uint8_t* data, std::size_t len);

  static RelayMsg End(StreamId id, EndReason reason);

  /// @param flags BEGIN flag bits, 0 for none
  static RelayMsg Begin(
      StreamId id,
      const std::string& address,
      std::uint16_t port,
      std::uint32_t flags = 0);

  /// @brief Version 0 SENDME (no authentication tag)
  static RelayMsg Sendme(boost::optional<StreamId> id = boost::none);

  /// @brief Version 1 (authenticated) circuit SENDME
  static RelayMsg Sendme(const SendmeTag& tag);

  static RelayMsg Xon(StreamId id, std::uint32_t kbps_ewma);

  static RelayMsg Xoff(StreamId id);
};

/// @class SendmeMsg
/// @brief Parsed body of a SENDME message
class SendmeMsg
{
 public:
  /// @throw ProtocolError (e_CircProto) on a malformed body
  static SendmeMsg Parse(const std::vector<std::uint8_t>& body);

  /// @return Authentication tag, none for version 0 SENDMEs
  const boost::optional<SendmeTag>& GetTag() const noexcept
  {
    return m_Tag;
  }

 private:
  boost::optional<SendmeTag> m_Tag;
};

/// @return Rate limit carried by an XON body
/// @throw ProtocolError (e_CircProto) on a malformed body
std::uint32_t ParseXonRate(const std::vector<std::uint8_t>& body);

/// @brief Encodes a relay message into a cell body (recognized/digest or
///   tag zeroed)
/// @throw std::length_error if the message body does not fit
/// @throw ProtocolError (e_Internal) if V1 can't carry the message's stream
///   id, e.g. a stream-level SENDME
RelayCellBody EncodeRelayMsg(RelayCellFormat format, const RelayMsg& msg);

/// @brief Decodes an already decrypted and recognized relay cell
/// @throw ProtocolError (e_CircProto) on a bad length field, and for V1 on
///   an unrecognized command or a zero stream id
RelayMsg DecodeRelayMsg(RelayCellFormat format, const RelayCellBody& body);

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CELL_RELAY_CELL_H_
