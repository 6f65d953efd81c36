#pragma once

#include <string>

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

namespace logging = boost::log;
namespace src = boost::log::sources;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

// Usage: CUSTOM_LOG(lg, debug) << "your message";
#define CUSTOM_LOG(logger, sev)                                                \
  BOOST_LOG_SEV(logger, logging::trivial::sev)                                 \
      << "[" << __FILE__ << ":" << __LINE__ << "] "

void initLogger();
void setLogLevel(const std::string &level);
