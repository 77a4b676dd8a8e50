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

#ifndef SRC_CORE_UTIL_REACTOR_H_
#define SRC_CORE_UTIL_REACTOR_H_

#include <boost/asio/io_service.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <memory>

#include "core/util/queue.h"

namespace shallot
{
namespace core
{
/// @enum ReactorStatus
/// @brief Outcome of one reactor iteration
enum struct ReactorStatus : std::uint8_t
{
  /// Some source was ready and handled, poll again
  e_Progress,
  /// No source was ready, park until woken
  e_Idle,
  /// Terminal, every later poll returns this too
  e_Shutdown,
};

/// @class Reactor
/// @brief Single-threaded cooperative task driven by Poll()
/// @details Sources register GetWaker() so that a state change wakes the
///   reactor up. A reactor runs on a dedicated thread (Run()) or as ticks
///   posted onto a strand of an io_service (Start())
class Reactor : public std::enable_shared_from_this<Reactor>
{
 public:
  virtual ~Reactor() = default;

  /// @brief Handles at most one event per source, never blocks
  virtual ReactorStatus Poll() = 0;

  /// @brief Schedules Poll() on a strand of the given service until shutdown
  void Start(boost::asio::io_service& service);

  /// @brief Polls on the calling thread until shutdown
  void Run();

  bool IsShutdown() const noexcept
  {
    return m_IsShutdown;
  }

 protected:
  Reactor();

  const std::shared_ptr<Waker>& GetWaker() const noexcept
  {
    return m_Waker;
  }

 private:
  /// @brief Poll() for the scheduling loops, an error ends the reactor
  ReactorStatus PollOnce();

  void ScheduleTick();

  void Tick();

 private:
  std::shared_ptr<Waker> m_Waker;
  std::unique_ptr<boost::asio::io_service::strand> m_Strand;
  std::atomic<bool> m_TickPending, m_IsShutdown;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_UTIL_REACTOR_H_
