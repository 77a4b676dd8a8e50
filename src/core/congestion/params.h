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

#ifndef SRC_CORE_CONGESTION_PARAMS_H_
#define SRC_CORE_CONGESTION_PARAMS_H_

#include <cstdint>
#include <limits>

namespace shallot
{
namespace core
{
/// @brief Defaults below are the consensus defaults of the Tor network

/// @class FixedWindowParams
/// @brief Parameters of the legacy fixed-window (SENDME) algorithm
struct FixedWindowParams
{
  std::uint32_t circ_window_start = 1000;
  std::uint32_t circ_window_max = 1000;
};

/// @class CongestionWindowParams
/// @brief Congestion window shared by the cwnd-based algorithms
struct CongestionWindowParams
{
  std::uint32_t cwnd_init = 124;
  /// Percent of sendme_inc to grow by in slow start
  std::uint32_t cwnd_inc_pct_ss = 100;
  std::uint32_t cwnd_inc = 31;
  /// How often (in cwnds) we update cwnd in steady state
  std::uint32_t cwnd_inc_rate = 1;
  std::uint32_t cwnd_min = 124;
  std::uint32_t cwnd_max = std::numeric_limits<std::int32_t>::max();
  /// Cells between two SENDMEs
  std::uint32_t sendme_inc = 31;
};

/// @class VegasQueueParams
/// @brief Queue-use thresholds of the Vegas algorithm, in cells
struct VegasQueueParams
{
  std::uint32_t alpha = 186;
  std::uint32_t beta = 248;
  std::uint32_t delta = 310;
  std::uint32_t gamma = 186;
  /// Cap of the RFC 3742 limited slow start
  std::uint32_t ss_cwnd_cap = 600;
};

/// @class VegasParams
struct VegasParams
{
  VegasQueueParams cell_in_queue;
  std::uint32_t ss_cwnd_max = 5000;
  std::uint32_t cwnd_full_gap = 4;
  std::uint32_t cwnd_full_min_pct = 25;
  std::uint32_t cwnd_full_per_cwnd = 1;
};

/// @class RoundTripEstimatorParams
struct RoundTripEstimatorParams
{
  /// EWMA weight as a percentage of the cwnd update rate
  std::uint32_t ewma_cwnd_pct = 50;
  std::uint32_t ewma_max = 10;
  std::uint32_t ewma_ss_max = 2;
  /// Percent of the way towards the current EWMA the min RTT is reset to
  std::uint32_t rtt_reset_pct = 100;
};

/// @enum CongestionAlgorithm
enum struct CongestionAlgorithm : std::uint8_t
{
  e_FixedWindow,
  e_Vegas,
};

/// @class CongestionControlParams
/// @brief Everything needed to build a hop's CongestionControl
struct CongestionControlParams
{
  CongestionAlgorithm alg = CongestionAlgorithm::e_Vegas;
  FixedWindowParams fixed_window;
  CongestionWindowParams cwnd;
  VegasParams vegas;
  RoundTripEstimatorParams rtt;

  /// @brief Falls back to fixed window, for hops without congestion control
  void UseFallbackAlg() noexcept
  {
    alg = CongestionAlgorithm::e_FixedWindow;
  }
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_CONGESTION_PARAMS_H_
