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

#ifndef SRC_CORE_CIRCUIT_HOP_SETTINGS_H_
#define SRC_CORE_CIRCUIT_HOP_SETTINGS_H_

#include <boost/optional.hpp>

#include <cstddef>
#include <cstdint>

#include "core/cell/relay_cell.h"
#include "core/circuit/flow_ctrl.h"
#include "core/congestion/params.h"
#include "core/crypto/relay_crypt.h"

namespace shallot
{
namespace core
{
/// @class CircParameters
/// @brief Circuit-wide settings, built from configuration
struct CircParameters
{
  CongestionControlParams ccontrol;
  /// Relay cells a hop may send us, none for unlimited
  boost::optional<std::uint32_t> n_incoming_cells_permitted;
  /// Relay cells we may send a hop, none for unlimited
  boost::optional<std::uint32_t> n_outgoing_cells_permitted;
  /// Cells accepted on a circuit after we sent DESTROY
  std::uint32_t half_circ_cells = 3000;
  /// Capacity of each stream's inbound queue, in messages
  std::size_t stream_queue_size = 1000;
  FlowCtrlParams flow_ctrl;
};

/// @enum HopNegotiationType
/// @brief How the handshake with a hop was negotiated
enum struct HopNegotiationType : std::uint8_t
{
  /// No protocol negotiation (CREATE_FAST, virtual hops)
  e_None,
  /// Onion service rendezvous hop
  e_HsV3,
  /// Regular relay which advertised its subprotocols
  e_Full,
};

/// @class HopSettings
/// @brief Negotiated settings of one circuit hop
struct HopSettings
{
  CongestionControlParams ccontrol;
  boost::optional<std::uint32_t> n_incoming_cells_permitted;
  boost::optional<std::uint32_t> n_outgoing_cells_permitted;
  /// Set by whoever negotiated the hop; V1 carries no stream-level SENDMEs,
  ///   so it needs congestion control
  RelayCellFormat relay_format = RelayCellFormat::e_V0;
  RelayCryptProtocol relay_crypt_protocol = RelayCryptProtocol::e_Tor1;
  FlowCtrlParams flow_ctrl;

  /// @param supports_flowctl_cc True if the hop advertises congestion
  ///   control (FlowCtrl=2)
  /// @details Vegas is used only on fully negotiated hops supporting it,
  ///   every other hop falls back to fixed window
  static HopSettings FromParameters(
      const CircParameters& params,
      bool supports_flowctl_cc,
      HopNegotiationType type = HopNegotiationType::e_Full);
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CIRCUIT_HOP_SETTINGS_H_
