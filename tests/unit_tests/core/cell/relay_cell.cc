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

#define BOOST_TEST_DYN_LINK

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

#include "core/cell/cell.h"
#include "core/cell/relay_cell.h"
#include "helpers.h"

namespace core = shallot::core;
namespace tests = shallot::tests;

struct RelayCellFixture
{
  RelayCellFixture()
  {
    for (std::size_t i = 0; i < m_TagBytes.size(); i++)
      m_TagBytes[i] = static_cast<std::uint8_t>(0xa0 + i);
  }

  std::array<std::uint8_t, core::SENDME_TAG_LEN> m_TagBytes;
  const core::RelayCellFormat m_Format = core::RelayCellFormat::e_V0;
};

BOOST_FIXTURE_TEST_SUITE(RelayCellTests, RelayCellFixture)

BOOST_AUTO_TEST_CASE(EncodeDataCell)
{
  const std::uint8_t data[] = {0xde, 0xad, 0xbe, 0xef};
  const core::RelayCellBody cell = core::EncodeRelayMsg(
      m_Format, core::RelayMsg::Data(0x1234, data, sizeof(data)));
  BOOST_CHECK_EQUAL(cell[core::relay_v0::CMD_OFFSET], 2);
  // Recognized and digest are left for the crypto layer
  BOOST_CHECK_EQUAL(cell[1], 0);
  BOOST_CHECK_EQUAL(cell[2], 0);
  BOOST_CHECK_EQUAL(cell[3], 0x12);
  BOOST_CHECK_EQUAL(cell[4], 0x34);
  BOOST_CHECK(std::all_of(
      cell.begin() + core::relay_v0::DIGEST_OFFSET,
      cell.begin() + core::relay_v0::LENGTH_OFFSET,
      [](std::uint8_t b) { return b == 0; }));
  BOOST_CHECK_EQUAL(cell[9], 0);
  BOOST_CHECK_EQUAL(cell[10], 4);
  BOOST_CHECK_EQUAL_COLLECTIONS(
      cell.begin() + core::relay_v0::HEADER_LEN,
      cell.begin() + core::relay_v0::HEADER_LEN + sizeof(data),
      data,
      data + sizeof(data));
  // Zero padding prefix after the body
  BOOST_CHECK(std::all_of(
      cell.begin() + 15, cell.begin() + 19, [](std::uint8_t b) {
        return b == 0;
      }));

  const core::RelayMsg msg = core::DecodeRelayMsg(m_Format, cell);
  BOOST_CHECK(msg.cmd == core::RelayCmd::e_Data);
  BOOST_REQUIRE(msg.stream_id);
  BOOST_CHECK_EQUAL(*msg.stream_id, 0x1234);
  BOOST_CHECK_EQUAL_COLLECTIONS(
      msg.body.begin(), msg.body.end(), data, data + sizeof(data));
}

BOOST_AUTO_TEST_CASE(DataLimits)
{
  const std::vector<std::uint8_t> max(core::relay_v0::MAX_DATA_LEN, 0x42);
  const core::RelayCellBody cell = core::EncodeRelayMsg(
      m_Format, core::RelayMsg::Data(1, max.data(), max.size()));
  BOOST_CHECK_EQUAL(core::DecodeRelayMsg(m_Format, cell).body.size(), 498);

  const std::vector<std::uint8_t> over(core::relay_v0::MAX_DATA_LEN + 1);
  BOOST_CHECK_THROW(
      core::RelayMsg::Data(1, over.data(), over.size()), std::length_error);
  core::RelayMsg msg{core::RelayCmd::e_Data, core::StreamId(1), over};
  BOOST_CHECK_THROW(core::EncodeRelayMsg(m_Format, msg), std::length_error);

  // Empty DATA is legal
  BOOST_CHECK(core::RelayMsg::Data(1, nullptr, 0).body.empty());
}

BOOST_AUTO_TEST_CASE(CircuitLevelMessage)
{
  const core::RelayCellBody cell =
      core::EncodeRelayMsg(m_Format, core::RelayMsg::Sendme());
  const core::RelayMsg msg = core::DecodeRelayMsg(m_Format, cell);
  BOOST_CHECK(msg.cmd == core::RelayCmd::e_Sendme);
  // Stream ID 0 means no stream
  BOOST_CHECK(!msg.stream_id);
  BOOST_CHECK(msg.body.empty());
}

BOOST_AUTO_TEST_CASE(BadLengthField)
{
  core::RelayCellBody cell =
      core::EncodeRelayMsg(m_Format, core::RelayMsg::Sendme());
  cell[core::relay_v0::LENGTH_OFFSET] = 0x01;
  cell[core::relay_v0::LENGTH_OFFSET + 1] = 0xf3;  // 499
  BOOST_CHECK_EXCEPTION(
      core::DecodeRelayMsg(m_Format, cell),
      core::ProtocolError,
      tests::IsKind(core::ErrorKind::e_CircProto));
}

BOOST_AUTO_TEST_CASE(BeginAndEnd)
{
  const core::RelayMsg begin = core::RelayMsg::Begin(5, "example.com", 443);
  const std::string expected("example.com:443");
  BOOST_CHECK_EQUAL(begin.body.size(), expected.size() + 1);
  BOOST_CHECK(std::equal(expected.begin(), expected.end(), begin.body.begin()));
  BOOST_CHECK_EQUAL(begin.body.back(), 0);

  const core::RelayMsg flagged = core::RelayMsg::Begin(5, "1.2.3.4", 80, 0x01);
  BOOST_CHECK_EQUAL(flagged.body.size(), std::string("1.2.3.4:80").size() + 5);
  BOOST_CHECK_EQUAL(flagged.body.back(), 0x01);

  const core::RelayMsg end = core::RelayMsg::End(5, core::EndReason::e_Done);
  BOOST_CHECK(end.cmd == core::RelayCmd::e_End);
  BOOST_REQUIRE_EQUAL(end.body.size(), 1);
  BOOST_CHECK_EQUAL(end.body[0], 6);
}

BOOST_AUTO_TEST_CASE(AuthenticatedSendme)
{
  const core::SendmeTag tag(m_TagBytes.data());
  const core::RelayMsg msg = core::RelayMsg::Sendme(tag);
  BOOST_CHECK(!msg.stream_id);
  BOOST_REQUIRE_EQUAL(msg.body.size(), 23);
  BOOST_CHECK_EQUAL(msg.body[0], 1);
  BOOST_CHECK_EQUAL(msg.body[1], 0);
  BOOST_CHECK_EQUAL(msg.body[2], 20);

  const core::SendmeMsg parsed = core::SendmeMsg::Parse(msg.body);
  BOOST_REQUIRE(parsed.GetTag());
  BOOST_CHECK(*parsed.GetTag() == tag);
}

BOOST_AUTO_TEST_CASE(UnauthenticatedSendme)
{
  BOOST_CHECK(!core::SendmeMsg::Parse({}).GetTag());
  BOOST_CHECK(!core::SendmeMsg::Parse({0}).GetTag());
}

BOOST_AUTO_TEST_CASE(MalformedSendme)
{
  const auto is_circ_proto = tests::IsKind(core::ErrorKind::e_CircProto);
  // Unknown version
  BOOST_CHECK_EXCEPTION(
      core::SendmeMsg::Parse({2, 0, 0}), core::ProtocolError, is_circ_proto);
  // Tag too short
  BOOST_CHECK_EXCEPTION(
      core::SendmeMsg::Parse({1, 0, 4, 1, 2, 3, 4}),
      core::ProtocolError,
      is_circ_proto);
  // Truncated tag
  std::vector<std::uint8_t> body{1, 0, 20};
  body.insert(body.end(), m_TagBytes.begin(), m_TagBytes.begin() + 10);
  BOOST_CHECK_EXCEPTION(
      core::SendmeMsg::Parse(body), core::ProtocolError, is_circ_proto);
}

BOOST_AUTO_TEST_CASE(FlowControlMessages)
{
  const core::RelayMsg xon = core::RelayMsg::Xon(9, 1234);
  BOOST_CHECK(xon.cmd == core::RelayCmd::e_Xon);
  BOOST_CHECK_EQUAL(xon.body.size(), 5);
  BOOST_CHECK_EQUAL(core::ParseXonRate(xon.body), 1234);

  const core::RelayMsg xoff = core::RelayMsg::Xoff(9);
  BOOST_CHECK(xoff.cmd == core::RelayCmd::e_Xoff);
  BOOST_REQUIRE_EQUAL(xoff.body.size(), 1);
  BOOST_CHECK_EQUAL(xoff.body[0], 0);

  const auto is_circ_proto = tests::IsKind(core::ErrorKind::e_CircProto);
  BOOST_CHECK_EXCEPTION(
      core::ParseXonRate({1, 0, 0, 0, 0}), core::ProtocolError, is_circ_proto);
  BOOST_CHECK_EXCEPTION(
      core::ParseXonRate({0, 0, 0}), core::ProtocolError, is_circ_proto);
  BOOST_CHECK_EXCEPTION(
      core::ParseXonRate({}), core::ProtocolError, is_circ_proto);
}

BOOST_AUTO_TEST_CASE(V1DataCell)
{
  const core::RelayCellFormat v1 = core::RelayCellFormat::e_V1;
  const std::uint8_t data[] = {0xde, 0xad, 0xbe, 0xef};
  const core::RelayCellBody cell = core::EncodeRelayMsg(
      v1, core::RelayMsg::Data(0x1234, data, sizeof(data)));
  // Tag region is left for the crypto layer
  BOOST_CHECK(std::all_of(
      cell.begin(),
      cell.begin() + core::relay_v1::TAG_LEN,
      [](std::uint8_t b) { return b == 0; }));
  BOOST_CHECK_EQUAL(cell[core::relay_v1::CMD_OFFSET], 2);
  BOOST_CHECK_EQUAL(cell[core::relay_v1::LENGTH_OFFSET], 0);
  BOOST_CHECK_EQUAL(cell[core::relay_v1::LENGTH_OFFSET + 1], 4);
  BOOST_CHECK_EQUAL(cell[core::relay_v1::STREAM_ID_OFFSET], 0x12);
  BOOST_CHECK_EQUAL(cell[core::relay_v1::STREAM_ID_OFFSET + 1], 0x34);
  BOOST_CHECK_EQUAL_COLLECTIONS(
      cell.begin() + 21, cell.begin() + 25, data, data + sizeof(data));
  BOOST_CHECK(std::all_of(
      cell.begin() + 25, cell.begin() + 29, [](std::uint8_t b) {
        return b == 0;
      }));

  const core::RelayMsg msg = core::DecodeRelayMsg(v1, cell);
  BOOST_CHECK(msg.cmd == core::RelayCmd::e_Data);
  BOOST_REQUIRE(msg.stream_id);
  BOOST_CHECK_EQUAL(*msg.stream_id, 0x1234);
  BOOST_CHECK_EQUAL_COLLECTIONS(
      msg.body.begin(), msg.body.end(), data, data + sizeof(data));
}

BOOST_AUTO_TEST_CASE(V1CircuitLevelMessages)
{
  const core::RelayCellFormat v1 = core::RelayCellFormat::e_V1;
  const core::SendmeTag tag(m_TagBytes.data());
  const core::RelayCellBody cell =
      core::EncodeRelayMsg(v1, core::RelayMsg::Sendme(tag));
  BOOST_CHECK_EQUAL(cell[core::relay_v1::CMD_OFFSET], 5);
  BOOST_CHECK_EQUAL(cell[core::relay_v1::LENGTH_OFFSET + 1], 23);
  // No stream id: the body starts right after the length
  BOOST_CHECK_EQUAL(cell[core::relay_v1::STREAM_ID_OFFSET], 1);

  const core::RelayMsg sendme = core::DecodeRelayMsg(v1, cell);
  BOOST_CHECK(sendme.cmd == core::RelayCmd::e_Sendme);
  BOOST_CHECK(!sendme.stream_id);
  const core::SendmeMsg parsed = core::SendmeMsg::Parse(sendme.body);
  BOOST_REQUIRE(parsed.GetTag());
  BOOST_CHECK(*parsed.GetTag() == tag);

  const core::RelayMsg drop = core::DecodeRelayMsg(
      v1,
      core::EncodeRelayMsg(
          v1, core::RelayMsg{core::RelayCmd::e_Drop, boost::none, {}}));
  BOOST_CHECK(drop.cmd == core::RelayCmd::e_Drop);
  BOOST_CHECK(!drop.stream_id);
  BOOST_CHECK(drop.body.empty());
}

BOOST_AUTO_TEST_CASE(V1DataLimits)
{
  const core::RelayCellFormat v1 = core::RelayCellFormat::e_V1;
  const std::vector<std::uint8_t> with_id(core::relay_v1::MAX_DATA_LEN - 2);
  core::RelayMsg data{core::RelayCmd::e_Data, core::StreamId(1), with_id};
  BOOST_CHECK_EQUAL(
      core::DecodeRelayMsg(v1, core::EncodeRelayMsg(v1, data)).body.size(),
      488u);
  data.body.push_back(0);
  BOOST_CHECK_THROW(core::EncodeRelayMsg(v1, data), std::length_error);

  const std::vector<std::uint8_t> without_id(core::relay_v1::MAX_DATA_LEN);
  core::RelayMsg drop{core::RelayCmd::e_Drop, boost::none, without_id};
  BOOST_CHECK_EQUAL(
      core::DecodeRelayMsg(v1, core::EncodeRelayMsg(v1, drop)).body.size(),
      490u);
  drop.body.push_back(0);
  BOOST_CHECK_THROW(core::EncodeRelayMsg(v1, drop), std::length_error);
}

BOOST_AUTO_TEST_CASE(V1StreamIdMismatch)
{
  const core::RelayCellFormat v1 = core::RelayCellFormat::e_V1;
  const auto is_internal = tests::IsKind(core::ErrorKind::e_Internal);
  // Stream-level SENDMEs don't exist in V1
  BOOST_CHECK_EXCEPTION(
      core::EncodeRelayMsg(v1, core::RelayMsg::Sendme(core::StreamId(3))),
      core::ProtocolError,
      is_internal);
  BOOST_CHECK_EXCEPTION(
      core::EncodeRelayMsg(
          v1, core::RelayMsg{core::RelayCmd::e_Data, boost::none, {}}),
      core::ProtocolError,
      is_internal);
  BOOST_CHECK_EXCEPTION(
      core::EncodeRelayMsg(
          v1,
          core::RelayMsg{static_cast<core::RelayCmd>(200), boost::none, {}}),
      core::ProtocolError,
      is_internal);
  // V0 still carries them
  const core::RelayMsg sendme = core::DecodeRelayMsg(
      m_Format,
      core::EncodeRelayMsg(m_Format, core::RelayMsg::Sendme(core::StreamId(3))));
  BOOST_REQUIRE(sendme.stream_id);
  BOOST_CHECK_EQUAL(*sendme.stream_id, 3);
}

BOOST_AUTO_TEST_CASE(V1MalformedCells)
{
  const core::RelayCellFormat v1 = core::RelayCellFormat::e_V1;
  const auto is_circ_proto = tests::IsKind(core::ErrorKind::e_CircProto);

  core::RelayCellBody unknown{};
  unknown[core::relay_v1::CMD_OFFSET] = 200;
  BOOST_CHECK_EXCEPTION(
      core::DecodeRelayMsg(v1, unknown), core::ProtocolError, is_circ_proto);

  core::RelayCellBody zero_stream{};
  zero_stream[core::relay_v1::CMD_OFFSET] = 2;  // DATA
  BOOST_CHECK_EXCEPTION(
      core::DecodeRelayMsg(v1, zero_stream),
      core::ProtocolError,
      is_circ_proto);

  core::RelayCellBody cell =
      core::EncodeRelayMsg(v1, core::RelayMsg::Sendme());
  cell[core::relay_v1::LENGTH_OFFSET] = 0x01;
  cell[core::relay_v1::LENGTH_OFFSET + 1] = 0xeb;  // 491
  BOOST_CHECK_EXCEPTION(
      core::DecodeRelayMsg(v1, cell), core::ProtocolError, is_circ_proto);
}

BOOST_AUTO_TEST_CASE(CommandNames)
{
  BOOST_CHECK_EQUAL(core::GetRelayCmdName(core::RelayCmd::e_Sendme), "SENDME");
  BOOST_CHECK_EQUAL(core::GetRelayCmdName(core::RelayCmd::e_Xoff), "XOFF");
  BOOST_CHECK_EQUAL(
      core::GetRelayCmdName(static_cast<core::RelayCmd>(200)),
      "Unrecognized relay command (200)");

  BOOST_CHECK(core::CmdCountsTowardsWindows(core::RelayCmd::e_Data));
  BOOST_CHECK(!core::CmdCountsTowardsWindows(core::RelayCmd::e_Sendme));
  BOOST_CHECK(!core::CmdCountsTowardsWindows(core::RelayCmd::e_End));
}

BOOST_AUTO_TEST_SUITE_END()
