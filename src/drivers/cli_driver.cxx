#include "../../include/drivers/cli_driver.hpp"

namespace {
const std::string RESET = "\033[0m";
const std::string GREEN = "\033[32m";
const std::string YELLOW = "\033[33m";
const std::string CYAN = "\033[36m";
} // namespace

/**
 * Print the banner.
 */
void CLIDriver::init() {
  std::cout << CYAN << "self-tallying election" << RESET << std::endl;
  std::cout << "type \"help\" for commands, \"exit\" to quit" << std::endl;
}

void CLIDriver::print_info(std::string message) {
  std::cout << CYAN << message << RESET << std::endl;
}

void CLIDriver::print_success(std::string message) {
  std::cout << GREEN << message << RESET << std::endl;
}

void CLIDriver::print_warning(std::string message) {
  std::cout << YELLOW << message << RESET << std::endl;
}

void CLIDriver::print_left(std::string message) {
  std::cout << message << std::endl;
}
