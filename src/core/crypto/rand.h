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

#ifndef SRC_CORE_CRYPTO_RAND_H_
#define SRC_CORE_CRYPTO_RAND_H_

#include <cstddef>
#include <cstdint>
#include <random>

namespace shallot
{
namespace core
{
/// @brief Fills a buffer from the process-wide CSPRNG
/// @note Thread-safe
void RandBytes(std::uint8_t* data, std::size_t length);

/// @return A value of trivially-copyable type T with every byte random
template <class T>
T Rand()
{
  T value;
  RandBytes(reinterpret_cast<std::uint8_t*>(&value), sizeof(value));
  return value;
}

/// @brief Uniform random bit generator drawing from RandBytes(), for use
///   with the standard distributions
struct RandEngine
{
  typedef std::uint32_t result_type;

  static constexpr result_type min()
  {
    return 0;
  }

  static constexpr result_type max()
  {
    return 0xFFFFFFFF;
  }

  result_type operator()() const
  {
    return Rand<result_type>();
  }
};

/// @return Uniformly distributed integer in [min, max]
template <class T>
T RandInRange(T min, T max)
{
  RandEngine engine;
  std::uniform_int_distribution<T> dist(min, max);
  return dist(engine);
}

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CRYPTO_RAND_H_
