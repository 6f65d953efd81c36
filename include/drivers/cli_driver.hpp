#pragma once

#include <iostream>
#include <string>

// Colored console output for the interactive front-ends.
class CLIDriver {
public:
  void init();
  void print_info(std::string message);
  void print_success(std::string message);
  void print_warning(std::string message);
  void print_left(std::string message);
};
