#include <iostream>
#include <string>

#include "../../include-shared/config.hpp"
#include "../../include-shared/logger.hpp"
#include "../../include/pkg/coordinator.hpp"

/*
 * Usage: ./hrz_coordinator <election config file>
 */
int main(int argc, char *argv[]) {
  // Initialize logger
  initLogger();

  // Parse args
  if (!(argc == 2)) {
    std::cout << "Usage: ./hrz_coordinator <election config file>"
              << std::endl;
    return 1;
  }

  // Create coordinator object and run
  ElectionConfig election_config = load_election_config(argv[1]);
  CoordinatorClient coordinator = CoordinatorClient(election_config);
  coordinator.run();
  return 0;
}
