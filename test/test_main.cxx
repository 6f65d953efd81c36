#define BOOST_TEST_MODULE hrz_test

#include <boost/test/unit_test.hpp>

#include "../include-shared/logger.hpp"

// Keep rejection warnings out of the test output.
struct LoggerSetup {
  LoggerSetup() {
    initLogger();
    setLogLevel("error");
  }
};

BOOST_TEST_GLOBAL_FIXTURE(LoggerSetup);
