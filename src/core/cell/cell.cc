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

#include "core/cell/cell.h"

#include <cryptopp/misc.h>

#include <algorithm>
#include <stdexcept>

#include "core/util/byte_stream.h"

namespace shallot
{
namespace core
{
std::string HopNum::ToString() const
{
  return "#" + std::to_string(static_cast<unsigned>(m_Hop) + 1);
}

std::ostream& operator<<(std::ostream& os, const HopNum& hop)
{
  return os << hop.ToString();
}

SendmeTag::SendmeTag(const std::uint8_t* data)
{
  if (!data)
    throw std::invalid_argument("SendmeTag: null buffer not allowed");
  std::copy(data, data + SENDME_TAG_LEN, m_Tag.begin());
}

bool SendmeTag::operator==(const SendmeTag& other) const
{
  return CryptoPP::VerifyBufsEqual(m_Tag.data(), other.m_Tag.data(), m_Tag.size());
}

std::string GetChanCmdName(ChanCmd cmd)
{
  switch (cmd)
    {
      case ChanCmd::e_Padding:
        return "PADDING";
      case ChanCmd::e_Create:
        return "CREATE";
      case ChanCmd::e_Created:
        return "CREATED";
      case ChanCmd::e_Relay:
        return "RELAY";
      case ChanCmd::e_Destroy:
        return "DESTROY";
      case ChanCmd::e_CreateFast:
        return "CREATE_FAST";
      case ChanCmd::e_CreatedFast:
        return "CREATED_FAST";
      case ChanCmd::e_Versions:
        return "VERSIONS";
      case ChanCmd::e_Netinfo:
        return "NETINFO";
      case ChanCmd::e_RelayEarly:
        return "RELAY_EARLY";
      case ChanCmd::e_Create2:
        return "CREATE2";
      case ChanCmd::e_Created2:
        return "CREATED2";
      case ChanCmd::e_PaddingNegotiate:
        return "PADDING_NEGOTIATE";
      case ChanCmd::e_VPadding:
        return "VPADDING";
      case ChanCmd::e_Certs:
        return "CERTS";
      case ChanCmd::e_AuthChallenge:
        return "AUTH_CHALLENGE";
      case ChanCmd::e_Authenticate:
        return "AUTHENTICATE";
      case ChanCmd::e_Authorize:
        return "AUTHORIZE";
    }
  return "Unrecognized channel command (" + std::to_string(GetType(cmd)) + ")";
}

ChanCell MakeRelayCell(CircId circ_id, const RelayCellBody& body, bool early)
{
  ChanCell cell;
  cell.circ_id = circ_id;
  cell.msg.cmd = early ? ChanCmd::e_RelayEarly : ChanCmd::e_Relay;
  cell.msg.body.assign(body.begin(), body.end());
  return cell;
}

ChanCell MakeDestroyCell(CircId circ_id, DestroyReason reason)
{
  ChanCell cell;
  cell.circ_id = circ_id;
  cell.msg.cmd = ChanCmd::e_Destroy;
  cell.msg.body.assign(1, GetType(reason));
  return cell;
}

RelayCellBody GetRelayCellBody(const ChanMsg& msg)
{
  if (msg.body.size() != CELL_BODY_LEN)
    throw std::length_error("relay cell body has the wrong length");
  RelayCellBody body;
  std::copy(msg.body.begin(), msg.body.end(), body.begin());
  return body;
}

}  // namespace core
}  // namespace shallot
