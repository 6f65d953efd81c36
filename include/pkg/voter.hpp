#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <crypto++/integer.h>

#include "../../include-shared/config.hpp"
#include "../../include-shared/keyloaders.hpp"
#include "../../include-shared/messages.hpp"
#include "../../include/drivers/cli_driver.hpp"
#include "../../include/drivers/db_driver.hpp"
#include "../../include/pkg/arithmetic.hpp"

class VoterClient {
public:
  VoterClient(VoterConfig voter_config, ElectionConfig election_config);
  void run();
  void HandleKeygen(std::string input);
  void HandleRegister(std::string input);
  void HandleVote(std::string input);

  VoterToCoordinator_Register_Message DoRegister();
  std::pair<VoterToCoordinator_Vote_Message, bool>
  DoVote(std::string candidate);

private:
  std::pair<CryptoPP::Integer, bool> LoadReconstructedKey();

  VoterConfig voter_config;
  ElectionConfig election_config;
  GroupParams group;
  int slot_width;

  std::shared_ptr<CLIDriver> cli_driver;
  std::shared_ptr<DBDriver> db_driver;

  CryptoPP::Integer secret_key;
  CryptoPP::Integer public_key;
  bool has_keys;
};
