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

#ifndef SRC_CORE_UTIL_BYTE_STREAM_H_
#define SRC_CORE_UTIL_BYTE_STREAM_H_

#include <boost/endian/conversion.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <vector>

namespace shallot
{
namespace core
{
/// @return Underlying value of an enumerator
template <typename Enum>
constexpr std::underlying_type_t<Enum> GetType(Enum value) noexcept
{
  return static_cast<std::underlying_type_t<Enum>>(value);
}

/// @class ByteStream
/// @brief Cursor over a fixed-size byte buffer, owned or wrapped
/// @details Wire integers are always big endian (network order)
class ByteStream
{
 public:
  std::size_t GetSize() const noexcept
  {
    return m_Size;
  }

  /// @return Bytes consumed (or produced) so far
  std::size_t GetPosition() const noexcept
  {
    return m_Position;
  }

  std::size_t GetRemaining() const noexcept
  {
    return m_Size - m_Position;
  }

 protected:
  /// @throw std::invalid_argument if data is null
  ByteStream(std::uint8_t* data, std::size_t len);

  /// @brief Owns a zero-initialized buffer of the given length
  explicit ByteStream(std::size_t len);

  ByteStream(const ByteStream&) = delete;
  ByteStream& operator=(const ByteStream&) = delete;

  /// @return Current position, then moves past len bytes
  /// @throw std::length_error if fewer than len bytes remain. The position
  ///   is left unchanged
  std::uint8_t* Take(std::size_t len);

  std::uint8_t* m_Data;

 private:
  std::vector<std::uint8_t> m_Buffer;
  std::size_t m_Size, m_Position;
};

/// @class InputByteStream
/// @brief Reads fields off a read-only buffer
class InputByteStream : public ByteStream
{
 public:
  InputByteStream(const std::uint8_t* data, std::size_t len);

  void Skip(std::size_t len)
  {
    Take(len);
  }

  /// @return Pointer to the len bytes read, valid as long as the buffer
  const std::uint8_t* ReadBytes(std::size_t len)
  {
    return Take(len);
  }

  /// @brief Reads an unsigned integer in network order
  template <typename UInt>
  UInt Read()
  {
    return Read<UInt>(Take(sizeof(UInt)));
  }

  /// @brief Reads an unsigned integer in network order from a raw buffer
  template <typename UInt>
  static UInt Read(const std::uint8_t* buf)
  {
    static_assert(
        std::is_integral<UInt>::value && std::is_unsigned<UInt>::value,
        "InputByteStream: unsigned integral types only");
    UInt value;
    std::memcpy(&value, buf, sizeof(value));
    return boost::endian::big_to_native(value);
  }
};

/// @class OutputByteStream
/// @brief Writes fields into a buffer of fixed size
class OutputByteStream : public ByteStream
{
 public:
  /// @brief Writes into the caller's buffer
  OutputByteStream(std::uint8_t* data, std::size_t len);

  /// @brief Writes into a buffer of its own
  explicit OutputByteStream(std::size_t len);

  void WriteZeros(std::size_t len);

  /// @throw std::invalid_argument if data is null and len is not
  void WriteData(const std::uint8_t* data, std::size_t len);

  /// @brief Writes an unsigned integer in network order
  template <typename UInt>
  void Write(UInt value)
  {
    Write<UInt>(Take(sizeof(UInt)), value);
  }

  /// @brief Writes an unsigned integer in network order into a raw buffer
  template <typename UInt>
  static void Write(std::uint8_t* buf, UInt value)
  {
    static_assert(
        std::is_integral<UInt>::value && std::is_unsigned<UInt>::value,
        "OutputByteStream: unsigned integral types only");
    boost::endian::native_to_big_inplace(value);
    std::memcpy(buf, &value, sizeof(value));
  }

  /// @return Copy of the bytes written so far
  std::vector<std::uint8_t> GetBytes() const
  {
    return std::vector<std::uint8_t>(m_Data, m_Data + GetPosition());
  }
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_UTIL_BYTE_STREAM_H_
