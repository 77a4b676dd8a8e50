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

#include "core/channel/circ_map.h"

#include <utility>

#include "core/crypto/rand.h"
#include "core/util/error.h"

namespace shallot
{
namespace core
{
namespace
{
// Random picks before giving up on a crowded id range
const std::size_t CIRC_ID_ATTEMPTS = 16;
const CircId CIRC_ID_MIDPOINT = 0x80000000;
}  // namespace

void HalfCirc::ReceiveCell()
{
  if (!m_AllowCells)
    throw ProtocolError(
        ErrorKind::e_ChanProto,
        "Too many cells received on destroyed circuit");
  --m_AllowCells;
}

CircEnt CircEnt::Opening(
    std::shared_ptr<CircMsgQueue> created_sender,
    std::shared_ptr<CircMsgQueue> cell_sender)
{
  CircEnt ent;
  ent.state = State::e_Opening;
  ent.created_sender = std::move(created_sender);
  ent.cell_sender = std::move(cell_sender);
  return ent;
}

CircEnt CircEnt::Open(std::shared_ptr<CircMsgQueue> cell_sender)
{
  CircEnt ent;
  ent.state = State::e_Open;
  ent.cell_sender = std::move(cell_sender);
  return ent;
}

CircEnt CircEnt::DestroySent(const HalfCirc& half_circ)
{
  CircEnt ent;
  ent.state = State::e_DestroySent;
  ent.half_circ = half_circ;
  return ent;
}

CircMap::CircMap(CircIdRange range)
    : m_Range(range), m_OpenCount(0), m_UnusedSince(Clock::now())
{
}

CircId CircMap::GetRandomId() const
{
  if (m_Range == CircIdRange::e_Low)
    return RandInRange<CircId>(1, CIRC_ID_MIDPOINT - 1);
  return RandInRange<CircId>(CIRC_ID_MIDPOINT, 0xFFFFFFFF);
}

CircId CircMap::AddEnt(
    std::shared_ptr<CircMsgQueue> created_sender,
    std::shared_ptr<CircMsgQueue> cell_sender)
{
  for (std::size_t i = 0; i < CIRC_ID_ATTEMPTS; i++)
    {
      const CircId id = GetRandomId();
      if (m_Circs.count(id))
        continue;
      m_Circs.emplace(
          id,
          CircEnt::Opening(std::move(created_sender), std::move(cell_sender)));
      ++m_OpenCount;
      UpdateUnusedSince();
      return id;
    }
  throw ProtocolError(
      ErrorKind::e_IdRangeFull, "Couldn't find a free circuit id");
}

CircEnt* CircMap::Get(CircId id)
{
  auto it = m_Circs.find(id);
  return it == m_Circs.end() ? nullptr : &it->second;
}

void CircMap::Put(CircId id, CircEnt ent)
{
  Remove(id);
  if (ent.IsOpenOrOpening())
    ++m_OpenCount;
  m_Circs[id] = std::move(ent);
  UpdateUnusedSince();
}

boost::optional<CircEnt> CircMap::Remove(CircId id)
{
  auto it = m_Circs.find(id);
  if (it == m_Circs.end())
    return boost::none;
  boost::optional<CircEnt> removed(std::move(it->second));
  m_Circs.erase(it);
  if (removed->IsOpenOrOpening() && m_OpenCount)
    --m_OpenCount;
  UpdateUnusedSince();
  return removed;
}

std::shared_ptr<CircMsgQueue> CircMap::AdvanceFromOpening(CircId id)
{
  CircEnt* ent = Get(id);
  if (!ent || ent->state != CircEnt::State::e_Opening)
    throw ProtocolError(
        ErrorKind::e_ChanProto,
        "Unexpected CREATED* cell not on opening circuit");
  std::shared_ptr<CircMsgQueue> created = std::move(ent->created_sender);
  // Open from now on, whatever the creator makes of the reply
  *ent = CircEnt::Open(std::move(ent->cell_sender));
  return created;
}

void CircMap::DestroySent(CircId id, const HalfCirc& half_circ)
{
  auto it = m_Circs.find(id);
  if (it != m_Circs.end() && it->second.IsOpenOrOpening() && m_OpenCount)
    --m_OpenCount;
  m_Circs[id] = CircEnt::DestroySent(half_circ);
  UpdateUnusedSince();
}

void CircMap::CloseAll()
{
  for (auto& circ : m_Circs)
    {
      if (circ.second.created_sender)
        circ.second.created_sender->Close();
      if (circ.second.cell_sender)
        circ.second.cell_sender->Close();
    }
  m_Circs.clear();
  m_OpenCount = 0;
  UpdateUnusedSince();
}

void CircMap::UpdateUnusedSince()
{
  if (m_OpenCount)
    m_UnusedSince = boost::none;
  else if (!m_UnusedSince)
    m_UnusedSince = Clock::now();
}

}  // namespace core
}  // namespace shallot
