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

#ifndef SRC_CORE_CIRCUIT_FLOW_CTRL_H_
#define SRC_CORE_CIRCUIT_FLOW_CTRL_H_

#include <boost/optional.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

#include "core/cell/relay_cell.h"
#include "core/util/error.h"

namespace shallot
{
namespace core
{
/// @class FlowCtrlParams
/// @brief XON/XOFF stream flow control parameters, in cells
struct FlowCtrlParams
{
  std::uint32_t cc_xoff_client = 500;
  std::uint32_t cc_xoff_exit = 500;
  std::uint32_t cc_xon_rate = 500;
  std::uint32_t cc_xon_change_pct = 25;
  std::uint32_t cc_xon_ewma_cnt = 2;

  /// @return Buffered bytes above which we ask the other side to stop
  std::size_t GetXoffLimit() const noexcept
  {
    return static_cast<std::size_t>(
               cc_xoff_client > cc_xoff_exit ? cc_xoff_client : cc_xoff_exit)
           * relay_v0::MAX_DATA_LEN;
  }
};

/// @class SendWindow
/// @brief Cells we may still send before the peer acknowledges some
/// @tparam Max Largest window the peer may open
/// @tparam Increment Cells acknowledged by one SENDME
template <std::uint16_t Max, std::uint16_t Increment>
class SendWindow
{
 public:
  SendWindow() : m_Window(Max) {}

  std::uint16_t Get() const noexcept
  {
    return m_Window;
  }

  /// @brief Takes one cell of the window
  /// @throw ProtocolError (e_Internal) if the window is empty
  void Take()
  {
    if (!m_Window)
      throw ProtocolError(
          ErrorKind::e_Internal, "Called Take() on an empty send window");
    --m_Window;
  }

  /// @brief Handles a SENDME from the peer
  /// @throw ProtocolError (e_CircProto) if it would overflow the window
  void Put()
  {
    if (m_Window + Increment > Max)
      throw ProtocolError(
          ErrorKind::e_CircProto, "Received a SENDME when none was expected");
    m_Window += Increment;
  }

 private:
  std::uint16_t m_Window;
};

/// @class RecvWindow
/// @brief Cells the peer may still send us before we acknowledge some
template <std::uint16_t Max, std::uint16_t Increment>
class RecvWindow
{
 public:
  RecvWindow() : m_Window(Max) {}

  std::uint16_t Get() const noexcept
  {
    return m_Window;
  }

  /// @brief Accounts for one received cell
  /// @return True if a SENDME is now due
  /// @throw ProtocolError (e_CircProto) if the window is exhausted
  bool Take()
  {
    if (!m_Window)
      throw ProtocolError(
          ErrorKind::e_CircProto,
          "Received a DATA cell in excess of the window");
    --m_Window;
    return m_Window % Increment == 0;
  }

  /// @brief Accounts for cells received but never read
  /// @throw ProtocolError (e_CircProto) if more than the window
  void DecrementN(std::uint16_t n)
  {
    if (n > m_Window)
      throw ProtocolError(
          ErrorKind::e_CircProto, "Received too many cells on a stream");
    m_Window -= n;
  }

  /// @brief To be called once we sent a SENDME
  void Put() noexcept
  {
    m_Window += Increment;
  }

 private:
  std::uint16_t m_Window;
};

typedef SendWindow<500, 50> StreamSendWindow;
typedef RecvWindow<500, 50> StreamRecvWindow;

/// @enum FlowCtrlMode
enum struct FlowCtrlMode : std::uint8_t
{
  /// Stream SENDMEs, for hops using fixed window congestion control
  e_Window,
  /// XON/XOFF, for hops using Vegas
  e_XonXoff,
};

/// @class StreamFlowCtrl
/// @brief Outbound flow control of one stream
class StreamFlowCtrl
{
 public:
  static StreamFlowCtrl Window();

  static StreamFlowCtrl XonXoff(const FlowCtrlParams& params);

  FlowCtrlMode GetMode() const noexcept
  {
    return m_Mode;
  }

  /// @return True if the message may be sent now
  bool CanSend(const RelayMsg& msg) const;

  /// @brief Takes capacity for an outbound message
  /// @throw ProtocolError (e_Internal) if there is none
  void TakeCapacityToSend(const RelayMsg& msg);

  /// @brief Handles a stream SENDME
  /// @throw ProtocolError (e_CircProto) on a SENDME we don't accept
  void PutForIncomingSendme(const RelayMsg& msg);

  /// @throw ProtocolError (e_CircProto) on an XON we don't accept
  void HandleIncomingXon(const RelayMsg& msg);

  /// @throw ProtocolError (e_CircProto) on an XOFF we don't accept
  void HandleIncomingXoff(const RelayMsg& msg);

  /// @param rate Rate in kbps to advertise, 0 for unlimited
  /// @param buffer_len Bytes we buffer for the stream
  /// @return XON to send, if the buffer drained enough
  boost::optional<RelayMsg> MaybeSendXon(
      StreamId id,
      std::uint32_t rate,
      std::size_t buffer_len);

  /// @return XOFF to send, if the buffer grew past the limit
  boost::optional<RelayMsg> MaybeSendXoff(StreamId id, std::size_t buffer_len);

  /// @return Rate in bytes per second the peer asked for, 0 for unlimited
  std::uint64_t GetRateLimit() const noexcept
  {
    return m_RateLimit;
  }

  /// @return False once the peer sent XOFF, until its next XON
  bool IsXonReceived() const noexcept
  {
    return m_IsXonReceived;
  }

  const StreamSendWindow& GetSendWindow() const noexcept
  {
    return m_Window;
  }

 private:
  enum struct LastSent : std::uint8_t
  {
    e_None,
    e_Xon,
    e_Xoff,
  };

  explicit StreamFlowCtrl(FlowCtrlMode mode);

  FlowCtrlMode m_Mode;
  StreamSendWindow m_Window;
  FlowCtrlParams m_Params;
  LastSent m_LastSent;
  bool m_IsXonReceived;
  std::uint64_t m_RateLimit;
  /// Bytes sent so far, for telling apart bogus XOFFs
  std::uint64_t m_BytesSent;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CIRCUIT_FLOW_CTRL_H_
