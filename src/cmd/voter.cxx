#include <iostream>
#include <string>

#include "../../include-shared/config.hpp"
#include "../../include-shared/logger.hpp"
#include "../../include/pkg/voter.hpp"

/*
 * Usage: ./hrz_voter <voter config file> <election config file>
 */
int main(int argc, char *argv[]) {
  // Initialize logger
  initLogger();

  // Parse args
  if (!(argc == 3)) {
    std::cout << "Usage: ./hrz_voter <voter config file> <election config file>"
              << std::endl;
    return 1;
  }

  // Create voter object and run
  VoterConfig voter_config = load_voter_config(argv[1]);
  ElectionConfig election_config = load_election_config(argv[2]);
  VoterClient voter = VoterClient(voter_config, election_config);
  voter.run();
  return 0;
}
