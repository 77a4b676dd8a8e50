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

#ifndef SRC_CORE_CIRCUIT_CIRC_MSGS_H_
#define SRC_CORE_CIRCUIT_CIRC_MSGS_H_

#include <cstddef>
#include <cstdint>

#include "core/cell/cell.h"
#include "core/cell/relay_cell.h"
#include "core/util/queue.h"

namespace shallot
{
namespace core
{
/// @class CircCmd
/// @brief Work the forward half hands over to the backward half
struct CircCmd
{
  enum struct Type : std::uint8_t
  {
    /// Circuit SENDME received from the hop
    e_HandleSendme,
    /// Message to send to the hop, e.g. our circuit SENDME
    e_SendRelayMsg,
    e_SendXon,
    e_SendXoff,
  };

  Type type;
  HopNum hop;
  RelayMsg msg;
};

typedef Queue<CircCmd> CircCmdQueue;

/// Capacity of the queue from the forward to the backward half
const std::size_t CIRC_CMD_QUEUE_SIZE = 128;

/// @class StreamRequest
/// @brief Stream message the application wants sent
struct StreamRequest
{
  HopNum hop;
  RelayMsg msg;
};

typedef Queue<StreamRequest> StreamRequestQueue;

/// @class CircCtrlMsg
/// @brief Request to the backward half, handled before anything else
struct CircCtrlMsg
{
  enum struct Type : std::uint8_t
  {
    e_Shutdown,
    e_CloseStream,
  };

  Type type;
  /// e_CloseStream only
  HopNum hop;
  StreamId stream_id;
  EndReason reason;
};

typedef Queue<CircCtrlMsg> CircCtrlQueue;

/// @class PaddingEvent
/// @brief Decision of a circuit padding machine
struct PaddingEvent
{
  enum struct Type : std::uint8_t
  {
    /// Send a DROP to the hop
    e_SendPadding,
    /// Hold back everything but padding
    e_StartBlocking,
    e_StopBlocking,
  };

  Type type;
  HopNum hop;
};

typedef Queue<PaddingEvent> PaddingQueue;

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CIRCUIT_CIRC_MSGS_H_
