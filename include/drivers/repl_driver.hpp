#pragma once

#include <map>
#include <memory>
#include <string>

#include "../../include/drivers/cli_driver.hpp"

// Line-oriented command loop dispatching to member handlers of its owner.
template <class T> class REPLDriver {
public:
  REPLDriver(T *owner);
  void add_action(std::string trigger, std::string guide,
                  void (T::*func)(std::string line));
  void run();

private:
  void print_guides();

  T *owner;
  std::shared_ptr<CLIDriver> cli_driver;
  std::map<std::string, void (T::*)(std::string line)> actions;
  std::map<std::string, std::string> guides;
};
