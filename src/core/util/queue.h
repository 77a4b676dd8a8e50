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

#ifndef SRC_CORE_UTIL_QUEUE_H_
#define SRC_CORE_UTIL_QUEUE_H_

#include <boost/optional.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace shallot
{
namespace core
{
/// @class Waker
/// @brief Readiness notifier shared by a reactor and the queues it polls
/// @details A reactor records GetGeneration() before polling its sources;
///   if nothing was ready it parks in Wait() with that generation, so a wake
///   that races the poll is never lost.
class Waker
{
 public:
  typedef std::function<void()> Callback;

  /// @brief Sets callback run on every wake (e.g. post a tick onto a strand)
  void SetCallback(Callback callback)
  {
    std::unique_lock<std::mutex> l(m_Mutex);
    m_Callback = std::move(callback);
  }

  void Wake()
  {
    Callback callback;
    {
      std::unique_lock<std::mutex> l(m_Mutex);
      ++m_Generation;
      callback = m_Callback;
    }
    m_Changed.notify_all();
    // Callback runs unlocked, it may re-enter the waker
    if (callback)
      callback();
  }

  std::uint64_t GetGeneration()
  {
    std::unique_lock<std::mutex> l(m_Mutex);
    return m_Generation;
  }

  /// @brief Blocks until woken after the given generation
  void Wait(std::uint64_t seen)
  {
    std::unique_lock<std::mutex> l(m_Mutex);
    m_Changed.wait(l, [this, seen] { return m_Generation != seen; });
  }

  /// @return False on timeout
  bool WaitFor(std::uint64_t seen, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> l(m_Mutex);
    return m_Changed.wait_for(
        l, timeout, [this, seen] { return m_Generation != seen; });
  }

 private:
  std::mutex m_Mutex;
  std::condition_variable m_Changed;
  std::uint64_t m_Generation = 0;
  Callback m_Callback;
};

/// @enum SendStatus
/// @brief Outcome of a non-blocking Queue::TryPut()
enum struct SendStatus : std::uint8_t
{
  e_Sent,
  e_Full,
  e_Closed,
};

/// @class Queue
/// @brief Closable FIFO between two tasks, optionally bounded
/// @details Either side may Close(). A closed queue refuses new elements but
///   still hands out the ones already queued; IsDrained() tells a reader that
///   nothing more will ever arrive.
template <typename Element>
class Queue
{
 public:
  /// @param capacity Maximum queued elements, 0 for unbounded
  explicit Queue(std::size_t capacity = 0) : m_Capacity(capacity) {}

  Queue(const Queue&) = delete;
  Queue& operator=(const Queue&) = delete;

  /// @brief Registers a waker notified on every state change
  void AddWaker(std::shared_ptr<Waker> waker)
  {
    std::unique_lock<std::mutex> l(m_QueueMutex);
    m_Wakers.push_back(waker);
  }

  SendStatus TryPut(Element e)
  {
    {
      std::unique_lock<std::mutex> l(m_QueueMutex);
      if (m_IsClosed)
        return SendStatus::e_Closed;
      if (m_Capacity && m_Queue.size() >= m_Capacity)
        return SendStatus::e_Full;
      m_Queue.push_back(std::move(e));
    }
    m_NonEmpty.notify_one();
    WakeUp();
    return SendStatus::e_Sent;
  }

  /// @brief Blocks while the queue is full
  /// @return False if the queue is (or became) closed
  bool Put(Element e)
  {
    {
      std::unique_lock<std::mutex> l(m_QueueMutex);
      m_NotFull.wait(l, [this] {
        return m_IsClosed || !m_Capacity || m_Queue.size() < m_Capacity;
      });
      if (m_IsClosed)
        return false;
      m_Queue.push_back(std::move(e));
    }
    m_NonEmpty.notify_one();
    WakeUp();
    return true;
  }

  boost::optional<Element> TryGet()
  {
    boost::optional<Element> el;
    {
      std::unique_lock<std::mutex> l(m_QueueMutex);
      el = GetNonThreadSafe();
    }
    if (el)
      {
        m_NotFull.notify_one();
        WakeUp();
      }
    return el;
  }

  /// @brief Blocks until an element arrives
  /// @return Element, or none once the queue is drained
  boost::optional<Element> GetNext()
  {
    boost::optional<Element> el;
    {
      std::unique_lock<std::mutex> l(m_QueueMutex);
      m_NonEmpty.wait(l, [this] { return m_IsClosed || !m_Queue.empty(); });
      el = GetNonThreadSafe();
    }
    if (el)
      {
        m_NotFull.notify_one();
        WakeUp();
      }
    return el;
  }

  boost::optional<Element> GetNextWithTimeout(int msec)
  {
    boost::optional<Element> el;
    {
      std::unique_lock<std::mutex> l(m_QueueMutex);
      m_NonEmpty.wait_for(l, std::chrono::milliseconds(msec), [this] {
        return m_IsClosed || !m_Queue.empty();
      });
      el = GetNonThreadSafe();
    }
    if (el)
      {
        m_NotFull.notify_one();
        WakeUp();
      }
    return el;
  }

  void Close()
  {
    {
      std::unique_lock<std::mutex> l(m_QueueMutex);
      if (m_IsClosed)
        return;
      m_IsClosed = true;
    }
    m_NonEmpty.notify_all();
    m_NotFull.notify_all();
    WakeUp();
  }

  bool IsClosed()
  {
    std::unique_lock<std::mutex> l(m_QueueMutex);
    return m_IsClosed;
  }

  /// @return True if closed and nothing is left to read
  bool IsDrained()
  {
    std::unique_lock<std::mutex> l(m_QueueMutex);
    return m_IsClosed && m_Queue.empty();
  }

  bool IsEmpty()
  {
    std::unique_lock<std::mutex> l(m_QueueMutex);
    return m_Queue.empty();
  }

  /// @return True if a TryPut() would currently be refused for lack of room
  bool IsFull()
  {
    std::unique_lock<std::mutex> l(m_QueueMutex);
    return m_Capacity && m_Queue.size() >= m_Capacity;
  }

  std::size_t GetSize()
  {
    std::unique_lock<std::mutex> l(m_QueueMutex);
    return m_Queue.size();
  }

 private:
  boost::optional<Element> GetNonThreadSafe()
  {
    if (m_Queue.empty())
      return boost::none;
    boost::optional<Element> el(std::move(m_Queue.front()));
    m_Queue.pop_front();
    return el;
  }

  void WakeUp()
  {
    std::vector<std::shared_ptr<Waker>> wakers;
    {
      std::unique_lock<std::mutex> l(m_QueueMutex);
      for (const auto& weak : m_Wakers)
        if (auto waker = weak.lock())
          wakers.push_back(waker);
    }
    for (const auto& waker : wakers)
      waker->Wake();
  }

 private:
  std::size_t m_Capacity;
  bool m_IsClosed = false;
  std::deque<Element> m_Queue;
  std::vector<std::weak_ptr<Waker>> m_Wakers;
  std::mutex m_QueueMutex;
  std::condition_variable m_NonEmpty, m_NotFull;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_UTIL_QUEUE_H_
