#include <iostream>
#include <stdexcept>

#include "../../include-shared/logger.hpp"
#include "../../include-shared/util.hpp"
#include "../../include/drivers/repl_driver.hpp"
#include "../../include/pkg/coordinator.hpp"
#include "../../include/pkg/voter.hpp"

namespace {
src::severity_logger<logging::trivial::severity_level> lg;
}

/**
 * Constructor
 */
template <class T> REPLDriver<T>::REPLDriver(T *owner) {
  this->owner = owner;
  this->cli_driver = std::make_shared<CLIDriver>();
}

/**
 * Register a handler for lines whose first word is `trigger`.
 */
template <class T>
void REPLDriver<T>::add_action(std::string trigger, std::string guide,
                               void (T::*func)(std::string line)) {
  this->actions[trigger] = func;
  this->guides[trigger] = guide;
}

template <class T> void REPLDriver<T>::print_guides() {
  for (auto &guide : this->guides) {
    this->cli_driver->print_left(guide.second);
  }
  this->cli_driver->print_left("help");
  this->cli_driver->print_left("exit");
}

/**
 * Read lines until EOF or "exit". A handler that throws aborts only its own
 * command.
 */
template <class T> void REPLDriver<T>::run() {
  std::string line;
  while (true) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    std::vector<std::string> words = string_split(line, ' ');
    if (words.empty()) {
      continue;
    }
    if (words[0] == "exit") {
      break;
    }
    if (words[0] == "help") {
      this->print_guides();
      continue;
    }
    auto it = this->actions.find(words[0]);
    if (it == this->actions.end()) {
      this->cli_driver->print_warning("Unknown command \"" + words[0] +
                                      "\"; type \"help\" for commands.");
      continue;
    }
    try {
      (this->owner->*(it->second))(line);
    } catch (std::exception &e) {
      CUSTOM_LOG(lg, error) << "command \"" << words[0]
                            << "\" failed: " << e.what();
      this->cli_driver->print_warning(std::string("Error: ") + e.what());
    }
  }
}

template class REPLDriver<CoordinatorClient>;
template class REPLDriver<VoterClient>;
