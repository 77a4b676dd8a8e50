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

#include "core/util/config.h"

#include <cstdint>
#include <fstream>
#include <stdexcept>

#include "core/congestion/params.h"
#include "core/util/exception.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
namespace bpo = boost::program_options;

namespace
{
const char* const CC_FIXED = "fixed";
const char* const CC_VEGAS = "vegas";

/// @brief Shorthand for a defaulted 32-bit option value
bpo::typed_value<std::uint32_t>* Count(std::uint32_t def)
{
  return bpo::value<std::uint32_t>()->default_value(def);
}

/// @brief Throws if a count option which must be positive is zero
void RequirePositive(const bpo::variables_map& map, const char* option)
{
  if (!map[option].as<std::uint32_t>())
    throw bpo::validation_error(
        bpo::validation_error::invalid_option_value, option, "0");
}
}  // namespace

Configuration::Configuration(const std::vector<std::string>& args)
    : m_ArgOptions("shallot options"), m_FileOptions()
{
  try
    {
      DescribeOptions();
      Load(args);
      Validate();
    }
  catch (...)
    {
      core::Exception ex("Configuration");
      ex.Dispatch(__func__);
      throw;
    }
}

void Configuration::DescribeOptions()
{
  // 0 = fatal ... 5 = trace, see GetLogSeverity()
  bpo::options_description logging("\nlogging");
  logging.add_options()
    ("log-level", bpo::value<std::uint16_t>()->default_value(3))
    ("log-to-console", bpo::value<bool>()->default_value(true))
    ("log-to-file", bpo::value<bool>()->default_value(false))
    ("log-file-name",
     bpo::value<std::string>()->default_value("")->value_name("path"));

  bpo::options_description circuit("\ncircuit");
  circuit.add_options()
    // 0 = unlimited
    ("circ-inbound-cell-limit", Count(0))
    ("circ-outbound-cell-limit", Count(0))
    ("half-circ-cells", Count(3000))
    ("stream-queue-size", Count(1000));

  const FlowCtrlParams flow;
  bpo::options_description congestion("\ncongestion control");
  congestion.add_options()
    ("cc-alg",
     bpo::value<std::string>()->default_value(CC_VEGAS)->value_name(
         "fixed|vegas"))
    ("cc-sendme-inc", Count(31))
    ("cc-cwnd-init", Count(124))
    ("cc-xoff-client", Count(flow.cc_xoff_client))
    ("cc-xoff-exit", Count(flow.cc_xoff_exit))
    ("cc-xon-rate", Count(flow.cc_xon_rate));

  m_FileOptions.add(logging).add(circuit).add(congestion);

  m_ArgOptions.add_options()
    ("help,h", "print the available options")
    ("config,c",
     bpo::value<std::string>()->default_value("")->value_name("path"),
     "read further options from this file");
  m_ArgOptions.add(m_FileOptions);
}

void Configuration::Load(const std::vector<std::string>& args)
{
  bpo::store(bpo::command_line_parser(args).options(m_ArgOptions).run(), m_Map);
  if (m_Map.count("help"))
    {
      LOG(info) << m_ArgOptions;
      throw std::runtime_error("Configuration: help requested");
    }
  const auto& path = m_Map["config"].as<std::string>();
  if (!path.empty())
    LoadFile(path);
  bpo::notify(m_Map);
}

void Configuration::LoadFile(const std::string& path)
{
  std::ifstream file(path);
  if (!file)
    throw std::runtime_error("Configuration: can't open " + path);
  // store() never replaces a value that's already set
  bpo::store(bpo::parse_config_file(file, m_FileOptions), m_Map);
  LOG(debug) << "Configuration: loaded " << path;
}

void Configuration::Validate() const
{
  const auto& alg = m_Map["cc-alg"].as<std::string>();
  if (alg != CC_FIXED && alg != CC_VEGAS)
    throw bpo::validation_error(
        bpo::validation_error::invalid_option_value, "cc-alg", alg);
  RequirePositive(m_Map, "cc-sendme-inc");
  RequirePositive(m_Map, "cc-cwnd-init");
  RequirePositive(m_Map, "stream-queue-size");
}

CircParameters Configuration::GetCircParameters() const
{
  auto count = [this](const char* option) {
    return m_Map[option].as<std::uint32_t>();
  };
  CircParameters params;
  params.ccontrol.alg = m_Map["cc-alg"].as<std::string>() == CC_FIXED
                            ? CongestionAlgorithm::e_FixedWindow
                            : CongestionAlgorithm::e_Vegas;
  params.ccontrol.cwnd.sendme_inc = count("cc-sendme-inc");
  params.ccontrol.cwnd.cwnd_init = count("cc-cwnd-init");
  if (count("circ-inbound-cell-limit"))
    params.n_incoming_cells_permitted = count("circ-inbound-cell-limit");
  if (count("circ-outbound-cell-limit"))
    params.n_outgoing_cells_permitted = count("circ-outbound-cell-limit");
  params.half_circ_cells = count("half-circ-cells");
  params.stream_queue_size = count("stream-queue-size");
  params.flow_ctrl.cc_xoff_client = count("cc-xoff-client");
  params.flow_ctrl.cc_xoff_exit = count("cc-xoff-exit");
  params.flow_ctrl.cc_xon_rate = count("cc-xon-rate");
  return params;
}

}  // namespace core
}  // namespace shallot
