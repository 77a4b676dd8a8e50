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

#include "core/util/log.h"

#include <boost/core/null_deleter.hpp>
#include <boost/log/attributes.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/formatters/date_time.hpp>
#include <boost/log/sinks.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <stdexcept>
#include <string>

BOOST_LOG_GLOBAL_LOGGER_INIT(
    g_Logger,
    boost::log::sources::severity_logger_mt<
        boost::log::trivial::severity_level>)
{
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      logger;
  return logger;
}

namespace shallot
{
namespace core
{
namespace
{
namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace sinks = boost::log::sinks;
namespace attrs = boost::log::attributes;
namespace keywords = boost::log::keywords;

const char* DEFAULT_LOG_FILE_NAME = "shallot_%Y-%m-%d.log";

/// @return [timestamp] [thread] [severity]  message
logging::formatter MakeFormatter()
{
  return expr::stream
         << "["
         << expr::format_date_time(
                expr::attr<boost::posix_time::ptime>("TimeStamp"),
                "%Y.%m.%d %T.%f")
         << "] [" << expr::attr<attrs::current_thread_id::value_type>("ThreadID")
         << "] [" << logging::trivial::severity << "]  " << expr::smessage;
}

void AddConsoleSink(const logging::formatter& format)
{
  typedef sinks::synchronous_sink<sinks::text_ostream_backend> console_sink;
  auto sink = boost::make_shared<console_sink>();
  sink->locked_backend()->add_stream(
      boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
  sink->set_formatter(format);
  logging::core::get()->add_sink(sink);
}

/// @param flush Flush every record, for debugging sessions which may end
///   in a crash
void AddFileSink(
    const std::string& file_name,
    bool flush,
    const logging::formatter& format)
{
  typedef sinks::asynchronous_sink<sinks::text_file_backend> file_sink;
  auto backend = boost::make_shared<sinks::text_file_backend>(
      keywords::file_name = file_name,
      keywords::time_based_rotation =
          sinks::file::rotation_at_time_point(0, 0, 0));
  backend->auto_flush(flush);
  auto sink = boost::make_shared<file_sink>(backend);
  sink->set_formatter(format);
  logging::core::get()->add_sink(sink);
}
}  // namespace

logging::trivial::severity_level GetLogSeverity(std::uint16_t level)
{
  switch (level)
    {
      case 0:
        return logging::trivial::fatal;
      case 1:
        return logging::trivial::error;
      case 2:
        return logging::trivial::warning;
      case 3:
        return logging::trivial::info;
      case 4:
        return logging::trivial::debug;
      case 5:
        return logging::trivial::trace;
      default:
        throw std::invalid_argument(
            "Log: invalid log-level " + std::to_string(level)
            + ", expected 0 (fatal) to 5 (trace)");
    }
}

void SetupLogging(const boost::program_options::variables_map& config)
{
  const auto severity = GetLogSeverity(config["log-level"].as<std::uint16_t>());
  auto log_core = logging::core::get();
  log_core->add_global_attribute("TimeStamp", attrs::utc_clock());
  log_core->add_global_attribute("ThreadID", attrs::current_thread_id());
  log_core->set_filter(
      expr::attr<logging::trivial::severity_level>("Severity") >= severity);
  const logging::formatter format = MakeFormatter();
  if (config["log-to-console"].as<bool>())
    AddConsoleSink(format);
  if (config["log-to-file"].as<bool>())
    AddFileSink(
        config["log-file-name"].defaulted()
            ? std::string(DEFAULT_LOG_FILE_NAME)
            : config["log-file-name"].as<std::string>(),
        severity <= logging::trivial::debug,
        format);
}

}  // namespace core
}  // namespace shallot
