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

#ifndef SRC_CORE_UTIL_CONFIG_H_
#define SRC_CORE_UTIL_CONFIG_H_

#include <boost/program_options.hpp>

#include <string>
#include <vector>

#include "core/circuit/hop_settings.h"

namespace shallot
{
namespace core
{
/// @class Configuration
/// @brief Circuit and logging options for a shallot client
/// @details Options are read from the given arguments first, then from the
///   file named with --config. A value given in both keeps the argument's
///   value. Every option has a default, so an empty argument list is valid
class Configuration final
{
 public:
  /// @param args Arguments as they'd appear in argv, without the program name
  /// @throw std::runtime_error on --help or an unreadable config file
  /// @throw boost::program_options::error on bad options or values
  explicit Configuration(
      const std::vector<std::string>& args = std::vector<std::string>());

  /// @return Every option, stored or defaulted
  const boost::program_options::variables_map& GetMap() const noexcept
  {
    return m_Map;
  }

  /// @return Parameters for new circuits, built from the stored options
  CircParameters GetCircParameters() const;

 private:
  /// @brief Fills in the options accepted on the command line and in files
  void DescribeOptions();

  /// @brief Stores the arguments, then the config file if one was named
  void Load(const std::vector<std::string>& args);

  /// @brief Stores options from a config file without overriding arguments
  void LoadFile(const std::string& path);

  /// @brief Rejects values that circuits can't be built with
  void Validate() const;

 private:
  boost::program_options::options_description m_ArgOptions;
  boost::program_options::options_description m_FileOptions;
  boost::program_options::variables_map m_Map;
};

}  // namespace core
}  // namespace shallot

#endif  // SRC_CORE_UTIL_CONFIG_H_
