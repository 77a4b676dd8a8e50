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

#ifndef SRC_CORE_UTIL_ERROR_H_
#define SRC_CORE_UTIL_ERROR_H_

#include <cstdint>
#include <stdexcept>
#include <string>

namespace shallot
{
namespace core
{
/// @enum ErrorKind
/// @brief What went wrong, and therefore what must be torn down
enum struct ErrorKind : std::uint8_t
{
  /// Channel protocol violation, closes the whole channel
  e_ChanProto,
  /// Circuit protocol violation, closes the circuit
  e_CircProto,
  /// No hop recognized an inbound relay cell
  e_BadCellAuth,
  /// Asked to use a hop that isn't on the circuit
  e_NoSuchHop,
  /// Hop sent us more cells than it was permitted to
  e_ExcessInboundCells,
  /// We tried to send more cells than the hop permits
  e_ExcessOutboundCells,
  /// Couldn't find a free circuit or stream id
  e_IdRangeFull,
  /// Channel or circuit went away under us
  e_ChannelClosed,
  /// Invariant violation (a bug)
  e_Internal,
};

/// @return Printable name of the given error kind
const char* GetErrorKindName(ErrorKind kind) noexcept;

/// @class ProtocolError
/// @brief Fatal error raised while processing cells
/// @details Protocol violations are never retried: the circuit or channel
///   which raised one is closed
class ProtocolError : public std::runtime_error
{
 public:
  ProtocolError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), m_Kind(kind)
  {
  }

  ErrorKind GetKind() const noexcept
  {
    return m_Kind;
  }

  /// @return True if the error must close the whole channel
  bool IsChannelFatal() const noexcept
  {
    return m_Kind == ErrorKind::e_ChanProto;
  }

 private:
  ErrorKind m_Kind;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_UTIL_ERROR_H_
