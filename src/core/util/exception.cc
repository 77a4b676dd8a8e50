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

#include "core/util/exception.h"

#include <cryptopp/cryptlib.h>

#include <boost/program_options.hpp>

#include <exception>
#include <stdexcept>

#include "core/util/error.h"
#include "core/util/log.h"

namespace shallot
{
namespace core
{
Exception::Exception(const char* component) : m_Component(component) {}

std::string Exception::GetPrefix(const char* where) const
{
  std::string prefix;
  if (!m_Component.empty())
    prefix += m_Component + ": ";
  if (where && *where)
    prefix += std::string(where) + ": ";
  return prefix;
}

void Exception::Dispatch(const char* where)
{
  const std::string prefix = GetPrefix(where);
  try
    {
      throw;
    }
  catch (const ProtocolError& ex)
    {
      // A peer going away is how circuits and channels normally end
      if (ex.GetKind() == ErrorKind::e_ChannelClosed)
        LOG(debug) << prefix << GetErrorKindName(ex.GetKind()) << ": '"
                   << ex.what() << "'";
      else
        LOG(error) << prefix << GetErrorKindName(ex.GetKind()) << ": '"
                   << ex.what() << "'";
    }
  // CryptoPP::Exception inherits std::exception, so it goes first
  catch (const CryptoPP::Exception& ex)
    {
      LOG(error) << prefix << "cryptopp exception: '" << ex.what() << "'";
    }
  catch (const boost::program_options::error& ex)
    {
      LOG(error) << prefix << "program option exception: '" << ex.what()
                 << "'";
    }
  catch (const std::length_error& ex)
    {
      LOG(error) << prefix << "malformed cell: '" << ex.what() << "'";
    }
  catch (const std::exception& ex)
    {
      LOG(error) << prefix << "standard exception: '" << ex.what() << "'";
    }
  catch (...)
    {
      LOG(error) << prefix << "unknown exception";
    }
}

}  // namespace core
}  // namespace shallot
