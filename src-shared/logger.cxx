#include <mutex>
#include <stdexcept>

#include <boost/log/support/date_time.hpp>

#include "../include-shared/logger.hpp"

namespace {
std::once_flag logger_once;
}

/**
 * Set up the console sink and common attributes. Safe to call repeatedly.
 */
void initLogger() {
  std::call_once(logger_once, []() {
    logging::add_console_log(
        std::clog,
        keywords::format =
            (expr::stream << "["
                          << expr::format_date_time<boost::posix_time::ptime>(
                                 "TimeStamp", "%H:%M:%S.%f")
                          << "] <" << logging::trivial::severity << "> "
                          << expr::smessage));
    logging::add_common_attributes();
    logging::core::get()->set_filter(logging::trivial::severity >=
                                     logging::trivial::info);
  });
}

/**
 * Set the minimum severity that reaches the console.
 */
void setLogLevel(const std::string &level) {
  logging::trivial::severity_level sev;
  if (!logging::trivial::from_string(level.c_str(), level.size(), sev)) {
    throw std::runtime_error("Unknown log level: " + level);
  }
  logging::core::get()->set_filter(logging::trivial::severity >= sev);
}
