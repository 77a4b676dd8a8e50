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

#include "core/util/byte_stream.h"

#include <stdexcept>
#include <string>

namespace shallot
{
namespace core
{
ByteStream::ByteStream(std::uint8_t* data, std::size_t len)
    : m_Data(data), m_Size(len), m_Position(0)
{
  if (!data)
    throw std::invalid_argument("ByteStream: null buffer");
}

ByteStream::ByteStream(std::size_t len)
    : m_Data(nullptr), m_Buffer(len), m_Size(len), m_Position(0)
{
  m_Data = m_Buffer.data();
}

std::uint8_t* ByteStream::Take(std::size_t len)
{
  if (len > GetRemaining())
    throw std::length_error(
        "ByteStream: " + std::to_string(len) + " bytes past position "
        + std::to_string(m_Position) + " of " + std::to_string(m_Size));
  std::uint8_t* ptr = m_Data + m_Position;
  m_Position += len;
  return ptr;
}

// The input stream never writes through m_Data
InputByteStream::InputByteStream(const std::uint8_t* data, std::size_t len)
    : ByteStream(const_cast<std::uint8_t*>(data), len)
{
}

OutputByteStream::OutputByteStream(std::uint8_t* data, std::size_t len)
    : ByteStream(data, len)
{
}

OutputByteStream::OutputByteStream(std::size_t len) : ByteStream(len) {}

void OutputByteStream::WriteZeros(std::size_t len)
{
  if (len)
    std::memset(Take(len), 0, len);
}

void OutputByteStream::WriteData(const std::uint8_t* data, std::size_t len)
{
  if (!len)
    return;
  if (!data)
    throw std::invalid_argument("OutputByteStream: null data");
  std::memcpy(Take(len), data, len);
}

}  // namespace core
}  // namespace shallot
