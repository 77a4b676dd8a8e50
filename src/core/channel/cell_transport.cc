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

#include "core/channel/cell_transport.h"

#include <stdexcept>
#include <utility>

#include "core/util/error.h"

namespace shallot
{
namespace core
{
QueueCellStream::QueueCellStream(std::shared_ptr<CellQueue> queue)
    : m_Queue(std::move(queue))
{
  if (!m_Queue)
    throw std::invalid_argument("QueueCellStream: null queue not allowed");
}

boost::optional<ChanCell> QueueCellStream::TryNext()
{
  return m_Queue->TryGet();
}

bool QueueCellStream::IsTerminated()
{
  return m_Queue->IsDrained();
}

void QueueCellStream::SetWaker(std::shared_ptr<Waker> waker)
{
  m_Queue->AddWaker(waker);
}

QueueCellSink::QueueCellSink(std::shared_ptr<CellQueue> queue)
    : m_Queue(std::move(queue))
{
  if (!m_Queue)
    throw std::invalid_argument("QueueCellSink: null queue not allowed");
}

bool QueueCellSink::PollReady()
{
  return m_Queue->IsClosed() || !m_Queue->IsFull();
}

void QueueCellSink::StartSend(ChanCell cell)
{
  switch (m_Queue->TryPut(std::move(cell)))
    {
      case SendStatus::e_Sent:
        return;
      case SendStatus::e_Full:
        throw ProtocolError(
            ErrorKind::e_Internal, "Sent a cell to a sink that wasn't ready");
      case SendStatus::e_Closed:
      default:
        throw ProtocolError(ErrorKind::e_ChannelClosed, "Cell sink closed");
    }
}

bool QueueCellSink::PollFlush()
{
  // Queued cells are visible to the reader as soon as they are put
  return true;
}

std::size_t QueueCellSink::GetQueuedCount()
{
  return m_Queue->GetSize();
}

void QueueCellSink::SetWaker(std::shared_ptr<Waker> waker)
{
  m_Queue->AddWaker(waker);
}

}  // namespace core
}  // namespace shallot
