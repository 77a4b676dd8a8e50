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

#include "core/circuit/hop_settings.h"

#include "core/util/log.h"

namespace shallot
{
namespace core
{
HopSettings HopSettings::FromParameters(
    const CircParameters& params,
    bool supports_flowctl_cc,
    HopNegotiationType type)
{
  HopSettings settings;
  settings.ccontrol = params.ccontrol;
  settings.n_incoming_cells_permitted = params.n_incoming_cells_permitted;
  settings.n_outgoing_cells_permitted = params.n_outgoing_cells_permitted;
  settings.flow_ctrl = params.flow_ctrl;
  switch (type)
    {
      case HopNegotiationType::e_None:
        settings.ccontrol.UseFallbackAlg();
        break;
      case HopNegotiationType::e_HsV3:
        // Onion services don't negotiate congestion control yet
        settings.ccontrol.UseFallbackAlg();
        settings.relay_crypt_protocol = RelayCryptProtocol::e_HsV3;
        break;
      case HopNegotiationType::e_Full:
        if (!supports_flowctl_cc)
          settings.ccontrol.UseFallbackAlg();
        break;
    }
  if (settings.ccontrol.alg != params.ccontrol.alg)
    LOG(debug) << "HopSettings: hop can't do congestion control, "
               << "falling back to fixed window";
  return settings;
}

}  // namespace core
}  // namespace shallot
