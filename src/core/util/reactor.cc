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

#include "core/util/reactor.h"

#include <exception>

#include "core/util/log.h"

namespace shallot
{
namespace core
{
Reactor::Reactor()
    : m_Waker(std::make_shared<Waker>()),
      m_TickPending(false),
      m_IsShutdown(false)
{
}

void Reactor::Start(boost::asio::io_service& service)
{
  m_Strand = std::make_unique<boost::asio::io_service::strand>(service);
  std::weak_ptr<Reactor> weak = shared_from_this();
  m_Waker->SetCallback([weak]() {
    if (auto reactor = weak.lock())
      reactor->ScheduleTick();
  });
  ScheduleTick();
}

void Reactor::Run()
{
  while (!m_IsShutdown)
    {
      const std::uint64_t seen = m_Waker->GetGeneration();
      switch (PollOnce())
        {
          case ReactorStatus::e_Progress:
            break;
          case ReactorStatus::e_Idle:
            m_Waker->Wait(seen);
            break;
          case ReactorStatus::e_Shutdown:
            m_IsShutdown = true;
            break;
        }
    }
}

ReactorStatus Reactor::PollOnce()
{
  try
    {
      return Poll();
    }
  catch (const std::exception& ex)
    {
      // Poll() logged the cause already, the reactor is closed
      LOG(debug) << "Reactor: stopped on error: " << ex.what();
      return ReactorStatus::e_Shutdown;
    }
}

void Reactor::ScheduleTick()
{
  if (m_IsShutdown || m_TickPending.exchange(true))
    return;
  auto self = shared_from_this();
  m_Strand->post([self]() { self->Tick(); });
}

void Reactor::Tick()
{
  // Wakes from here on schedule another tick
  m_TickPending = false;
  for (;;)
    {
      const ReactorStatus status = PollOnce();
      if (status == ReactorStatus::e_Progress)
        continue;
      if (status == ReactorStatus::e_Shutdown)
        {
          LOG(trace) << "Reactor: shut down, no more ticks";
          m_IsShutdown = true;
          m_Waker->SetCallback(nullptr);
        }
      return;
    }
}

}  // namespace core
}  // namespace shallot
