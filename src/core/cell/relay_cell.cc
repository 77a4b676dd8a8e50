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

#include "core/cell/relay_cell.h"

#include <algorithm>
#include <stdexcept>

#include "core/crypto/rand.h"
#include "core/util/byte_stream.h"
#include "core/util/error.h"

namespace shallot
{
namespace core
{
namespace
{
const std::uint8_t SENDME_VERSION_V0 = 0, SENDME_VERSION_V1 = 1;
const std::uint8_t FLOWCTRL_VERSION = 0;
// Zero bytes written after the data, before random padding
const std::size_t PADDING_ZERO_PREFIX = 4;

/// @enum StreamIdUse
/// @brief Whether a V1 cell of a command carries a stream id
enum struct StreamIdUse : std::uint8_t
{
  e_None,
  e_Required,
  /// Unknown command: the layout of the cell can't be known
  e_Unknown,
};

StreamIdUse GetV1StreamIdUse(RelayCmd cmd)
{
  switch (cmd)
    {
      case RelayCmd::e_Begin:
      case RelayCmd::e_Data:
      case RelayCmd::e_End:
      case RelayCmd::e_Connected:
      case RelayCmd::e_Resolve:
      case RelayCmd::e_Resolved:
      case RelayCmd::e_BeginDir:
      case RelayCmd::e_Xoff:
      case RelayCmd::e_Xon:
        return StreamIdUse::e_Required;
      // V1 requires congestion control, so there are no stream SENDMEs
      case RelayCmd::e_Sendme:
      case RelayCmd::e_Extend:
      case RelayCmd::e_Extended:
      case RelayCmd::e_Truncate:
      case RelayCmd::e_Truncated:
      case RelayCmd::e_Drop:
      case RelayCmd::e_Extend2:
      case RelayCmd::e_Extended2:
        return StreamIdUse::e_None;
    }
  return StreamIdUse::e_Unknown;
}

/// @brief Writes the zero prefix and random padding after the message
void PadCell(OutputByteStream& output, RelayCellBody& cell)
{
  output.WriteZeros(std::min(PADDING_ZERO_PREFIX, output.GetRemaining()));
  const std::size_t remaining = output.GetRemaining();
  if (remaining)
    RandBytes(cell.data() + (cell.size() - remaining), remaining);
}

RelayCellBody EncodeV0(const RelayMsg& msg)
{
  if (msg.body.size() > relay_v0::MAX_DATA_LEN)
    throw std::length_error("EncodeRelayMsg: message body too long");
  RelayCellBody cell;
  OutputByteStream output(cell.data(), cell.size());
  output.Write<std::uint8_t>(GetType(msg.cmd));
  output.WriteZeros(relay_v0::RECOGNIZED_LEN);
  output.Write<std::uint16_t>(msg.stream_id ? *msg.stream_id : 0);
  output.WriteZeros(relay_v0::DIGEST_LEN);
  output.Write<std::uint16_t>(static_cast<std::uint16_t>(msg.body.size()));
  output.WriteData(msg.body.data(), msg.body.size());
  PadCell(output, cell);
  return cell;
}

RelayCellBody EncodeV1(const RelayMsg& msg)
{
  const StreamIdUse use = GetV1StreamIdUse(msg.cmd);
  const bool has_stream_id = use == StreamIdUse::e_Required;
  if (use == StreamIdUse::e_Unknown || has_stream_id != !!msg.stream_id)
    throw ProtocolError(
        ErrorKind::e_Internal,
        "Can't encode " + GetRelayCmdName(msg.cmd)
            + (msg.stream_id ? " with" : " without")
            + " a stream id in a V1 relay cell");
  const std::size_t max_len =
      relay_v1::MAX_DATA_LEN - (has_stream_id ? relay_v1::STREAM_ID_LEN : 0);
  if (msg.body.size() > max_len)
    throw std::length_error("EncodeRelayMsg: message body too long");
  RelayCellBody cell;
  OutputByteStream output(cell.data(), cell.size());
  output.WriteZeros(relay_v1::TAG_LEN);
  output.Write<std::uint8_t>(GetType(msg.cmd));
  output.Write<std::uint16_t>(static_cast<std::uint16_t>(msg.body.size()));
  if (has_stream_id)
    output.Write<std::uint16_t>(*msg.stream_id);
  output.WriteData(msg.body.data(), msg.body.size());
  PadCell(output, cell);
  return cell;
}

RelayMsg DecodeV0(InputByteStream& input, std::uint16_t& len)
{
  RelayMsg msg;
  msg.cmd = static_cast<RelayCmd>(input.Read<std::uint8_t>());
  input.Skip(relay_v0::RECOGNIZED_LEN);
  auto stream_id = input.Read<std::uint16_t>();
  if (stream_id)
    msg.stream_id = stream_id;
  input.Skip(relay_v0::DIGEST_LEN);
  len = input.Read<std::uint16_t>();
  return msg;
}

RelayMsg DecodeV1(InputByteStream& input, std::uint16_t& len)
{
  RelayMsg msg;
  input.Skip(relay_v1::TAG_LEN);
  msg.cmd = static_cast<RelayCmd>(input.Read<std::uint8_t>());
  len = input.Read<std::uint16_t>();
  switch (GetV1StreamIdUse(msg.cmd))
    {
      case StreamIdUse::e_None:
        break;
      case StreamIdUse::e_Required:
        {
          auto stream_id = input.Read<std::uint16_t>();
          if (!stream_id)
            throw ProtocolError(
                ErrorKind::e_CircProto,
                "Zero stream id with relay command "
                    + GetRelayCmdName(msg.cmd));
          msg.stream_id = stream_id;
        }
        break;
      case StreamIdUse::e_Unknown:
        throw ProtocolError(ErrorKind::e_CircProto, GetRelayCmdName(msg.cmd));
    }
  return msg;
}
}  // namespace

std::string GetRelayCmdName(RelayCmd cmd)
{
  switch (cmd)
    {
      case RelayCmd::e_Begin:
        return "BEGIN";
      case RelayCmd::e_Data:
        return "DATA";
      case RelayCmd::e_End:
        return "END";
      case RelayCmd::e_Connected:
        return "CONNECTED";
      case RelayCmd::e_Sendme:
        return "SENDME";
      case RelayCmd::e_Extend:
        return "EXTEND";
      case RelayCmd::e_Extended:
        return "EXTENDED";
      case RelayCmd::e_Truncate:
        return "TRUNCATE";
      case RelayCmd::e_Truncated:
        return "TRUNCATED";
      case RelayCmd::e_Drop:
        return "DROP";
      case RelayCmd::e_Resolve:
        return "RESOLVE";
      case RelayCmd::e_Resolved:
        return "RESOLVED";
      case RelayCmd::e_BeginDir:
        return "BEGIN_DIR";
      case RelayCmd::e_Extend2:
        return "EXTEND2";
      case RelayCmd::e_Extended2:
        return "EXTENDED2";
      case RelayCmd::e_Xoff:
        return "XOFF";
      case RelayCmd::e_Xon:
        return "XON";
    }
  return "Unrecognized relay command (" + std::to_string(GetType(cmd)) + ")";
}

bool CmdCountsTowardsWindows(RelayCmd cmd) noexcept
{
  return cmd == RelayCmd::e_Data;
}

RelayMsg RelayMsg::Data(StreamId id, const std::uint8_t* data, std::size_t len)
{
  if (len > relay_v0::MAX_DATA_LEN)
    throw std::length_error("RelayMsg: DATA body too long");
  RelayMsg msg{RelayCmd::e_Data, id, {}};
  if (len)
    msg.body.assign(data, data + len);
  return msg;
}

RelayMsg RelayMsg::End(StreamId id, EndReason reason)
{
  return RelayMsg{RelayCmd::e_End, id, {GetType(reason)}};
}

RelayMsg RelayMsg::Begin(
    StreamId id,
    const std::string& address,
    std::uint16_t port,
    std::uint32_t flags)
{
  RelayMsg msg{RelayCmd::e_Begin, id, {}};
  const std::string target = address + ":" + std::to_string(port);
  msg.body.assign(target.begin(), target.end());
  msg.body.push_back(0);
  if (flags)
    {
      std::uint8_t buf[sizeof(flags)];
      OutputByteStream::Write<std::uint32_t>(buf, flags);
      msg.body.insert(msg.body.end(), buf, buf + sizeof(buf));
    }
  return msg;
}

RelayMsg RelayMsg::Sendme(boost::optional<StreamId> id)
{
  return RelayMsg{RelayCmd::e_Sendme, id, {}};
}

RelayMsg RelayMsg::Sendme(const SendmeTag& tag)
{
  RelayMsg msg{RelayCmd::e_Sendme, boost::none, {}};
  OutputByteStream output(1 + 2 + tag.size());
  output.Write<std::uint8_t>(SENDME_VERSION_V1);
  output.Write<std::uint16_t>(static_cast<std::uint16_t>(tag.size()));
  output.WriteData(tag.data(), tag.size());
  msg.body = output.GetBytes();
  return msg;
}

RelayMsg RelayMsg::Xon(StreamId id, std::uint32_t kbps_ewma)
{
  RelayMsg msg{RelayCmd::e_Xon, id, {}};
  OutputByteStream output(1 + sizeof(kbps_ewma));
  output.Write<std::uint8_t>(FLOWCTRL_VERSION);
  output.Write<std::uint32_t>(kbps_ewma);
  msg.body = output.GetBytes();
  return msg;
}

RelayMsg RelayMsg::Xoff(StreamId id)
{
  return RelayMsg{RelayCmd::e_Xoff, id, {FLOWCTRL_VERSION}};
}

SendmeMsg SendmeMsg::Parse(const std::vector<std::uint8_t>& body)
{
  SendmeMsg sendme;
  // An empty body is a version 0 SENDME
  if (body.empty())
    return sendme;
  try
    {
      InputByteStream input(body.data(), body.size());
      auto version = input.Read<std::uint8_t>();
      switch (version)
        {
          case SENDME_VERSION_V0:
            break;
          case SENDME_VERSION_V1:
            {
              auto len = input.Read<std::uint16_t>();
              if (len < SENDME_TAG_LEN)
                throw ProtocolError(
                    ErrorKind::e_CircProto, "SENDME tag is too short");
              sendme.m_Tag = SendmeTag(input.ReadBytes(len));
            }
            break;
          default:
            throw ProtocolError(
                ErrorKind::e_CircProto,
                "Unrecognized SENDME version "
                    + std::to_string(static_cast<unsigned>(version)));
        }
    }
  catch (const std::length_error&)
    {
      throw ProtocolError(ErrorKind::e_CircProto, "Truncated SENDME message");
    }
  return sendme;
}

std::uint32_t ParseXonRate(const std::vector<std::uint8_t>& body)
{
  if (body.empty())
    throw ProtocolError(ErrorKind::e_CircProto, "Truncated XON message");
  try
    {
      InputByteStream input(body.data(), body.size());
      if (input.Read<std::uint8_t>() != FLOWCTRL_VERSION)
        throw ProtocolError(
            ErrorKind::e_CircProto, "Unrecognized XON version");
      return input.Read<std::uint32_t>();
    }
  catch (const std::length_error&)
    {
      throw ProtocolError(ErrorKind::e_CircProto, "Truncated XON message");
    }
}

RelayCellBody EncodeRelayMsg(RelayCellFormat format, const RelayMsg& msg)
{
  switch (format)
    {
      case RelayCellFormat::e_V0:
        return EncodeV0(msg);
      case RelayCellFormat::e_V1:
        return EncodeV1(msg);
    }
  throw ProtocolError(ErrorKind::e_Internal, "Unsupported relay cell format");
}

RelayMsg DecodeRelayMsg(RelayCellFormat format, const RelayCellBody& body)
{
  InputByteStream input(body.data(), body.size());
  RelayMsg msg;
  std::uint16_t len = 0;
  switch (format)
    {
      case RelayCellFormat::e_V0:
        msg = DecodeV0(input, len);
        break;
      case RelayCellFormat::e_V1:
        msg = DecodeV1(input, len);
        break;
      default:
        throw ProtocolError(
            ErrorKind::e_Internal, "Unsupported relay cell format");
    }
  if (len > input.GetRemaining())
    throw ProtocolError(
        ErrorKind::e_CircProto, "Relay cell with bad length field");
  const std::uint8_t* data = input.ReadBytes(len);
  msg.body.assign(data, data + len);
  return msg;
}

}  // namespace core
}  // namespace shallot
