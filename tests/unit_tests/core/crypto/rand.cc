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

#include <array>
#include <cstdint>
#include <limits>
#include <set>

#include "core/crypto/rand.h"

namespace core = shallot::core;

BOOST_AUTO_TEST_SUITE(RandTests)

template <class T>
struct Range
{
  Range(T min, T max) : m_Min(min), m_Max(max) {}

  /// @return True if every draw was in range and not all draws were equal
  bool Test(int count = 100) const
  {
    std::set<T> seen;
    for (int i = 0; i < count; i++)
      {
        const T result = core::RandInRange<T>(m_Min, m_Max);
        if (result < m_Min || result > m_Max)
          return false;
        seen.insert(result);
      }
    return seen.size() > 1;
  }

  T m_Min, m_Max;
};

BOOST_AUTO_TEST_CASE(StreamIdRange)
{
  BOOST_CHECK(Range<std::uint16_t>(1, 0xFFFF).Test());
}

BOOST_AUTO_TEST_CASE(CircIdRange)
{
  BOOST_CHECK(Range<std::uint32_t>(1, 0x7FFFFFFF).Test());
  BOOST_CHECK(Range<std::uint32_t>(0x80000000, 0xFFFFFFFF).Test());
}

BOOST_AUTO_TEST_CASE(FullRange)
{
  BOOST_CHECK(Range<std::uint64_t>(0, std::numeric_limits<std::uint64_t>::max()).Test());
  BOOST_CHECK(Range<int>(std::numeric_limits<int>::min(), 0).Test());
}

BOOST_AUTO_TEST_CASE(SingleValue)
{
  for (int i = 0; i < 10; i++)
    BOOST_CHECK_EQUAL(core::RandInRange<std::uint16_t>(7, 7), 7);
}

BOOST_AUTO_TEST_CASE(RandBytes)
{
  std::array<std::uint8_t, 64> first{}, second{};
  core::RandBytes(first.data(), first.size());
  core::RandBytes(second.data(), second.size());
  BOOST_CHECK(first != second);
  BOOST_CHECK(core::Rand<std::uint64_t>() != core::Rand<std::uint64_t>());
}

BOOST_AUTO_TEST_SUITE_END()
