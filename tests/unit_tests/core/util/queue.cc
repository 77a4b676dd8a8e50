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

#include <chrono>
#include <memory>
#include <thread>

#include "core/util/queue.h"

namespace core = shallot::core;

struct QueueFixture
{
  QueueFixture() : m_Queue(2), m_Waker(std::make_shared<core::Waker>())
  {
    m_Queue.AddWaker(m_Waker);
  }

  core::Queue<int> m_Queue;
  std::shared_ptr<core::Waker> m_Waker;
};

BOOST_FIXTURE_TEST_SUITE(QueueTests, QueueFixture)

BOOST_AUTO_TEST_CASE(BoundedTryPut)
{
  BOOST_CHECK(m_Queue.IsEmpty());
  BOOST_CHECK(m_Queue.TryPut(1) == core::SendStatus::e_Sent);
  BOOST_CHECK(m_Queue.TryPut(2) == core::SendStatus::e_Sent);
  BOOST_CHECK(m_Queue.IsFull());
  BOOST_CHECK(m_Queue.TryPut(3) == core::SendStatus::e_Full);
  BOOST_CHECK_EQUAL(m_Queue.GetSize(), 2);

  // FIFO
  BOOST_CHECK_EQUAL(*m_Queue.TryGet(), 1);
  BOOST_CHECK(!m_Queue.IsFull());
  BOOST_CHECK_EQUAL(*m_Queue.TryGet(), 2);
  BOOST_CHECK(!m_Queue.TryGet());
}

BOOST_AUTO_TEST_CASE(Unbounded)
{
  core::Queue<int> queue;
  for (int i = 0; i < 1000; i++)
    BOOST_CHECK(queue.TryPut(i) == core::SendStatus::e_Sent);
  BOOST_CHECK(!queue.IsFull());
  BOOST_CHECK_EQUAL(queue.GetSize(), 1000);
}

BOOST_AUTO_TEST_CASE(CloseDrains)
{
  m_Queue.TryPut(1);
  m_Queue.Close();
  BOOST_CHECK(m_Queue.IsClosed());
  BOOST_CHECK(m_Queue.TryPut(2) == core::SendStatus::e_Closed);
  BOOST_CHECK(!m_Queue.Put(2));
  // Queued elements outlive the close
  BOOST_CHECK(!m_Queue.IsDrained());
  BOOST_CHECK_EQUAL(*m_Queue.GetNext(), 1);
  BOOST_CHECK(m_Queue.IsDrained());
  BOOST_CHECK(!m_Queue.GetNext());
  // Closing twice is harmless
  BOOST_CHECK_NO_THROW(m_Queue.Close());
}

BOOST_AUTO_TEST_CASE(WakesOnChange)
{
  auto seen = m_Waker->GetGeneration();
  m_Queue.TryPut(1);
  BOOST_CHECK(m_Waker->GetGeneration() != seen);

  seen = m_Waker->GetGeneration();
  m_Queue.TryGet();
  BOOST_CHECK(m_Waker->GetGeneration() != seen);

  // Nothing read, nothing changed
  seen = m_Waker->GetGeneration();
  m_Queue.TryGet();
  BOOST_CHECK_EQUAL(m_Waker->GetGeneration(), seen);

  m_Queue.Close();
  BOOST_CHECK(m_Waker->GetGeneration() != seen);
}

BOOST_AUTO_TEST_CASE(WakerCallback)
{
  int calls = 0;
  m_Waker->SetCallback([&calls] { ++calls; });
  m_Queue.TryPut(1);
  m_Queue.TryPut(2);
  BOOST_CHECK_EQUAL(calls, 2);
  m_Waker->SetCallback(core::Waker::Callback());
}

BOOST_AUTO_TEST_CASE(ExpiredWakerIsSkipped)
{
  m_Waker.reset();
  BOOST_CHECK(m_Queue.TryPut(1) == core::SendStatus::e_Sent);
}

BOOST_AUTO_TEST_CASE(PutBlocksUntilRoom)
{
  m_Queue.TryPut(1);
  m_Queue.TryPut(2);
  bool put = false;
  std::thread producer([this, &put] { put = m_Queue.Put(3); });
  auto seen = m_Waker->GetGeneration();
  BOOST_CHECK_EQUAL(*m_Queue.GetNext(), 1);
  producer.join();
  BOOST_CHECK(put);
  BOOST_CHECK(m_Waker->WaitFor(seen, std::chrono::milliseconds(1000)));
  BOOST_CHECK_EQUAL(*m_Queue.TryGet(), 2);
  BOOST_CHECK_EQUAL(*m_Queue.TryGet(), 3);
}

BOOST_AUTO_TEST_CASE(CloseReleasesBlockedPut)
{
  m_Queue.TryPut(1);
  m_Queue.TryPut(2);
  bool put = true;
  std::thread producer([this, &put] { put = m_Queue.Put(3); });
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  m_Queue.Close();
  producer.join();
  BOOST_CHECK(!put);
  BOOST_CHECK_EQUAL(m_Queue.GetSize(), 2);
}

BOOST_AUTO_TEST_SUITE_END()
