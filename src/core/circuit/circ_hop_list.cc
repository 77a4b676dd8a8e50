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

#include "core/circuit/circ_hop_list.h"

#include "core/util/error.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
HopNum CircHopList::AddHop(const HopSettings& settings, HopLayers layers)
{
  std::unique_lock<std::mutex> hops(m_HopsMutex, std::defer_lock),
      outbound(m_OutboundMutex, std::defer_lock),
      inbound(m_InboundMutex, std::defer_lock);
  std::lock(hops, outbound, inbound);
  if (m_Hops.size() >= MAX_CRYPT_LAYERS)
    throw ProtocolError(ErrorKind::e_Internal, "Too many hops on a circuit");
  const HopNum hop(static_cast<std::uint8_t>(m_Hops.size()));
  auto circ_hop = std::make_shared<CircHop>(hop, settings);
  if (m_SendWaker)
    circ_hop->SetSendWaker(m_SendWaker);
  m_Outbound.AddLayer(std::move(layers.forward));
  m_Inbound.AddLayer(std::move(layers.backward));
  m_Hops.push_back(circ_hop);
  LOG(debug) << "CircHopList: added hop " << hop;
  return hop;
}

HopNum CircHopList::ResolveTargetHop(const TargetHop& target) const
{
  std::unique_lock<std::mutex> l(m_HopsMutex);
  if (target.IsLast())
    {
      if (m_Hops.empty())
        throw ProtocolError(ErrorKind::e_NoSuchHop, "Circuit has no hops");
      return m_Hops.back()->GetHopNum();
    }
  if (target.GetHop().Get() >= m_Hops.size())
    throw ProtocolError(
        ErrorKind::e_NoSuchHop,
        "No hop " + target.GetHop().ToString() + " on circuit");
  return target.GetHop();
}

std::shared_ptr<CircHop> CircHopList::GetHop(HopNum hop) const
{
  std::unique_lock<std::mutex> l(m_HopsMutex);
  if (hop.Get() >= m_Hops.size())
    throw ProtocolError(
        ErrorKind::e_NoSuchHop, "No hop " + hop.ToString() + " on circuit");
  return m_Hops[hop.Get()];
}

std::size_t CircHopList::GetSize() const
{
  std::unique_lock<std::mutex> l(m_HopsMutex);
  return m_Hops.size();
}

std::vector<std::shared_ptr<CircHop>> CircHopList::GetHops() const
{
  std::unique_lock<std::mutex> l(m_HopsMutex);
  return m_Hops;
}

SendmeTag CircHopList::Encrypt(RelayCellBody& cell, HopNum hop)
{
  std::unique_lock<std::mutex> l(m_OutboundMutex);
  return m_Outbound.Encrypt(cell, hop);
}

std::pair<HopNum, SendmeTag> CircHopList::Decrypt(RelayCellBody& cell)
{
  std::unique_lock<std::mutex> l(m_InboundMutex);
  return m_Inbound.Decrypt(cell);
}

void CircHopList::SetSendWaker(std::shared_ptr<Waker> waker)
{
  std::unique_lock<std::mutex> l(m_HopsMutex);
  m_SendWaker = waker;
  for (const auto& hop : m_Hops)
    hop->SetSendWaker(waker);
}

bool CircHopList::HasStreams() const
{
  for (const auto& hop : GetHops())
    if (hop->HasActiveStreams())
      return true;
  return false;
}

std::size_t CircHopList::GetOpenStreamCount() const
{
  std::size_t count = 0;
  for (const auto& hop : GetHops())
    count += hop->GetOpenStreamCount();
  return count;
}

TunnelActivity CircHopList::GetLastActivity() const
{
  TunnelActivity activity{TunnelActivity::State::e_NeverUsed, 0, boost::none};
  for (const auto& hop : GetHops())
    {
      activity.n_open_streams += hop->GetOpenStreamCount();
      const auto since = hop->GetUnusedSince();
      if (since && (!activity.unused_since || *activity.unused_since < *since))
        activity.unused_since = since;
    }
  if (activity.n_open_streams)
    {
      activity.state = TunnelActivity::State::e_InUse;
      activity.unused_since = boost::none;
    }
  else if (activity.unused_since)
    {
      activity.state = TunnelActivity::State::e_Unused;
    }
  return activity;
}

void CircHopList::CloseStreams()
{
  for (const auto& hop : GetHops())
    hop->CloseStreams();
}

}  // namespace core
}  // namespace shallot
