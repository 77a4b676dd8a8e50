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

#ifndef SRC_CORE_CHANNEL_CELL_TRANSPORT_H_
#define SRC_CORE_CHANNEL_CELL_TRANSPORT_H_

#include <boost/optional.hpp>

#include <cstddef>
#include <memory>

#include "core/cell/cell.h"
#include "core/util/queue.h"

namespace shallot
{
namespace core
{
/// @class CellStream
/// @brief Source of already framed cells (e.g. a TLS connection's reader)
class CellStream
{
 public:
  virtual ~CellStream() = default;

  /// @return Next cell if one is ready, none otherwise
  virtual boost::optional<ChanCell> TryNext() = 0;

  /// @return True once no cell will ever be produced again
  virtual bool IsTerminated() = 0;

  /// @brief Registers the waker to notify when a cell becomes ready
  virtual void SetWaker(std::shared_ptr<Waker> waker) = 0;
};

/// @class CellSink
/// @brief Destination of cells with backpressure
class CellSink
{
 public:
  virtual ~CellSink() = default;

  /// @return True if StartSend() may be called
  virtual bool PollReady() = 0;

  /// @brief Hands a cell over to the sink. Only valid after PollReady()
  /// @throw ProtocolError (e_ChannelClosed) if the sink is gone
  virtual void StartSend(ChanCell cell) = 0;

  /// @brief Pushes buffered cells towards the peer
  /// @return True if nothing is left buffered
  virtual bool PollFlush() = 0;

  /// @return Cells accepted but not yet consumed downstream
  virtual std::size_t GetQueuedCount() = 0;

  /// @brief Registers the waker to notify when the sink has room again
  virtual void SetWaker(std::shared_ptr<Waker> waker) = 0;
};

/// Cells as carried between tasks of this process
typedef Queue<ChanCell> CellQueue;

/// @class QueueCellStream
/// @brief CellStream reading from an in-process queue
class QueueCellStream : public CellStream
{
 public:
  explicit QueueCellStream(std::shared_ptr<CellQueue> queue);

  boost::optional<ChanCell> TryNext() override;

  bool IsTerminated() override;

  void SetWaker(std::shared_ptr<Waker> waker) override;

 private:
  std::shared_ptr<CellQueue> m_Queue;
};

/// @class QueueCellSink
/// @brief CellSink writing to an in-process queue
/// @details Readiness is the queue having room. A closed queue reports
///   ready so that the next StartSend() surfaces the closure
class QueueCellSink : public CellSink
{
 public:
  explicit QueueCellSink(std::shared_ptr<CellQueue> queue);

  bool PollReady() override;

  void StartSend(ChanCell cell) override;

  bool PollFlush() override;

  std::size_t GetQueuedCount() override;

  void SetWaker(std::shared_ptr<Waker> waker) override;

 private:
  std::shared_ptr<CellQueue> m_Queue;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CHANNEL_CELL_TRANSPORT_H_
