#pragma once

#include <memory>
#include <string>
#include <vector>

#include <crypto++/integer.h>

#include "../../include-shared/config.hpp"
#include "../../include-shared/messages.hpp"
#include "../../include/drivers/cli_driver.hpp"
#include "../../include/drivers/db_driver.hpp"
#include "../../include/pkg/election_state.hpp"
#include "../../include/pkg/status.hpp"

/**
 * Hosts one election: feeds voter submissions through the engine and appends
 * the accepted ones to the public transcript.
 */
class CoordinatorClient {
public:
  CoordinatorClient(ElectionConfig election_config);
  void run();
  void HandleRegister(std::string input);
  void HandleVote(std::string input);
  void HandleTally(std::string input);
  void HandleStatus(std::string input);
  void HandleResult(std::string input);
  void HandleReset(std::string input);

  ElectionStatus AcceptRegistration(const RegistrationRow &registration);
  ElectionStatus AcceptBallot(const BallotRow &ballot);
  ElectionStatus AcceptTally(const std::vector<CryptoPP::Integer> &counts);
  std::shared_ptr<ElectionState> GetState();

private:
  void NewElection();
  void Restore();
  ElectionStatus Submit(const BallotRow &ballot);
  ElectionStatus Unrecorded(std::string what);

  ElectionConfig election_config;
  std::shared_ptr<CLIDriver> cli_driver;
  std::shared_ptr<DBDriver> db_driver;
  std::shared_ptr<ElectionState> state;
};
