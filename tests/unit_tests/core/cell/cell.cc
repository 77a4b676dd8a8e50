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

#include <sstream>
#include <stdexcept>

#include "core/cell/cell.h"

namespace core = shallot::core;

BOOST_AUTO_TEST_SUITE(CellTests)

BOOST_AUTO_TEST_CASE(HopNumDisplay)
{
  // Hops are displayed 1-based
  BOOST_CHECK_EQUAL(core::HopNum(0).ToString(), "#1");
  BOOST_CHECK(core::HopNum(0).IsFirstHop());
  BOOST_CHECK(!core::HopNum(2).IsFirstHop());
  std::ostringstream os;
  os << core::HopNum(2);
  BOOST_CHECK_EQUAL(os.str(), "#3");
  BOOST_CHECK(core::HopNum(1) < core::HopNum(2));
}

BOOST_AUTO_TEST_CASE(RelayCell)
{
  core::RelayCellBody body{};
  body[0] = 0x02;
  const core::ChanCell cell = core::MakeRelayCell(7, body);
  BOOST_REQUIRE(cell.circ_id);
  BOOST_CHECK_EQUAL(*cell.circ_id, 7);
  BOOST_CHECK(cell.msg.cmd == core::ChanCmd::e_Relay);
  BOOST_CHECK(core::GetRelayCellBody(cell.msg) == body);

  const core::ChanCell early = core::MakeRelayCell(7, body, true);
  BOOST_CHECK(early.msg.cmd == core::ChanCmd::e_RelayEarly);

  core::ChanMsg shortened = cell.msg;
  shortened.body.pop_back();
  BOOST_CHECK_THROW(core::GetRelayCellBody(shortened), std::length_error);
}

BOOST_AUTO_TEST_CASE(DestroyCell)
{
  const core::ChanCell cell =
      core::MakeDestroyCell(9, core::DestroyReason::e_None);
  BOOST_CHECK(cell.msg.cmd == core::ChanCmd::e_Destroy);
  BOOST_REQUIRE_EQUAL(cell.msg.body.size(), 1);
  BOOST_CHECK_EQUAL(cell.msg.body[0], 0);
}

BOOST_AUTO_TEST_CASE(SendmeTagCompare)
{
  std::uint8_t bytes[core::SENDME_TAG_LEN]{};
  const core::SendmeTag zero(bytes);
  BOOST_CHECK(zero == core::SendmeTag());
  bytes[19] = 1;
  BOOST_CHECK(zero != core::SendmeTag(bytes));
  BOOST_CHECK_THROW(core::SendmeTag(nullptr), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(CommandNames)
{
  BOOST_CHECK_EQUAL(core::GetChanCmdName(core::ChanCmd::e_Create2), "CREATE2");
  BOOST_CHECK_EQUAL(
      core::GetChanCmdName(core::ChanCmd::e_RelayEarly), "RELAY_EARLY");
}

BOOST_AUTO_TEST_SUITE_END()
