#include <algorithm>
#include <map>
#include <stdexcept>

#include "../../include/pkg/voter.hpp"
#include "../../include-shared/keyloaders.hpp"
#include "../../include-shared/logger.hpp"
#include "../../include-shared/util.hpp"
#include "../../include/drivers/repl_driver.hpp"
#include "../../include/pkg/election.hpp"

/*
Syntax to use logger:
  CUSTOM_LOG(lg, debug) << "your message"
See logger.hpp for more modes besides 'debug'
*/
namespace {
src::severity_logger<logging::trivial::severity_level> lg;
}

/**
 * Constructor
 */
VoterClient::VoterClient(VoterConfig voter_config,
                         ElectionConfig election_config) {
  // Make shared variables.
  this->voter_config = voter_config;
  this->election_config = election_config;
  this->group.p = election_config.p;
  this->group.q = election_config.q;
  this->group.g = election_config.g;
  this->slot_width =
      election_config.slot_width != 0
          ? election_config.slot_width
          : FieldArithmetic::SlotWidth(election_config.candidates.size());
  this->cli_driver = std::make_shared<CLIDriver>();
  this->db_driver = std::make_shared<DBDriver>();
  if (this->db_driver->open(election_config.db_path) != SQLITE_OK) {
    throw std::runtime_error("Could not open database " +
                             election_config.db_path);
  }
  this->db_driver->init_tables();
  setLogLevel(election_config.log_level);

  // Load voter keys, if they were generated already.
  this->has_keys = false;
  try {
    LoadInteger(voter_config.voter_secret_key_path, this->secret_key);
    LoadInteger(voter_config.voter_public_key_path, this->public_key);
    this->has_keys = true;
  } catch (CryptoPP::FileStore::OpenErr &) {
    this->cli_driver->print_warning(
        "Could not find voter keys; you might consider generating some!");
  }
}

/**
 * Run REPL
 */
void VoterClient::run() {
  // Start REPL
  this->cli_driver->init();
  REPLDriver<VoterClient> repl = REPLDriver<VoterClient>(this);
  repl.add_action("keygen", "keygen", &VoterClient::HandleKeygen);
  repl.add_action("register", "register <out_file>",
                  &VoterClient::HandleRegister);
  repl.add_action("vote", "vote <candidate> <out_file>",
                  &VoterClient::HandleVote);
  repl.run();
}

/**
 * Handle generating the voter's secret exponent and public key.
 */
void VoterClient::HandleKeygen(std::string _) {
  std::pair<CryptoPP::Integer, CryptoPP::Integer> keys =
      ElectionClient::GenerateKeyPair(this->group);
  SaveInteger(this->voter_config.voter_secret_key_path, keys.first);
  SaveInteger(this->voter_config.voter_public_key_path, keys.second);
  this->secret_key = keys.first;
  this->public_key = keys.second;
  this->has_keys = true;
  this->cli_driver->print_success("Keys saved.");
}

/**
 * Round one: the public key with its proof of knowledge of the secret.
 */
VoterToCoordinator_Register_Message VoterClient::DoRegister() {
  if (!this->has_keys) {
    throw std::runtime_error("Voter has no keys; run keygen first.");
  }
  VoterToCoordinator_Register_Message registration;
  registration.voter_id = this->voter_config.voter_id;
  registration.zkp = ElectionClient::GeneratePublicKeyZKP(
      this->secret_key, this->voter_config.voter_id, this->group);
  return registration;
}

void VoterClient::HandleRegister(std::string input) {
  std::vector<std::string> args = string_split(input, ' ');
  if (args.size() != 2) {
    this->cli_driver->print_warning("usage: register <out_file>");
    return;
  }
  VoterToCoordinator_Register_Message registration = this->DoRegister();
  SaveMessage(args[1], registration);
  this->cli_driver->print_success("Registration written to " + args[1]);
}

/**
 * Compute this voter's reconstructed key from the registrations in the
 * transcript. Fails until every voter on the roster has registered.
 */
std::pair<CryptoPP::Integer, bool> VoterClient::LoadReconstructedKey() {
  std::map<std::string, CryptoPP::Integer> registered;
  for (const RegistrationRow &registration :
       this->db_driver->all_registrations()) {
    registered[registration.voter_id] = registration.zkp.pk;
  }

  std::vector<CryptoPP::Integer> public_keys;
  size_t position = this->election_config.voters.size();
  for (size_t i = 0; i < this->election_config.voters.size(); i++) {
    const std::string &voter = this->election_config.voters[i];
    auto it = registered.find(voter);
    if (it == registered.end()) {
      CUSTOM_LOG(lg, debug) << voter << " has not registered yet";
      return std::make_pair(CryptoPP::Integer::Zero(), false);
    }
    if (voter == this->voter_config.voter_id) {
      position = i;
    }
    public_keys.push_back(it->second);
  }
  if (position == this->election_config.voters.size()) {
    throw std::runtime_error("Voter " + this->voter_config.voter_id +
                             " is not on the roster.");
  }
  if (public_keys[position] != this->public_key) {
    throw std::runtime_error(
        "Transcript holds a different public key for this voter.");
  }
  return std::make_pair(ElectionClient::ReconstructedKey(public_keys, position,
                                                         this->group),
                        true);
}

/**
 * Round two: the self-tallying ballot for a candidate, with a membership
 * proof when the election requires one. Returns false while registration is
 * still open.
 */
std::pair<VoterToCoordinator_Vote_Message, bool>
VoterClient::DoVote(std::string candidate) {
  VoterToCoordinator_Vote_Message ballot;
  if (!this->has_keys) {
    throw std::runtime_error("Voter has no keys; run keygen first.");
  }
  const std::vector<std::string> &candidates = this->election_config.candidates;
  auto found = std::find(candidates.begin(), candidates.end(), candidate);
  if (found == candidates.end()) {
    throw std::runtime_error("Unknown candidate " + candidate);
  }
  size_t slot = found - candidates.begin();

  auto y = this->LoadReconstructedKey();
  if (!y.second) {
    return std::make_pair(ballot, false);
  }

  ballot.voter_id = this->voter_config.voter_id;
  ballot.vote = ElectionClient::GenerateVote(this->secret_key, y.first, slot,
                                             this->slot_width, this->group);
  if (this->election_config.require_vote_proof) {
    ballot.has_zkp = true;
    ballot.zkp = ElectionClient::GenerateVoteZKP(
        this->secret_key, y.first, ballot.vote, slot, candidates.size(),
        this->slot_width, this->voter_config.voter_id, this->group);
  }
  return std::make_pair(ballot, true);
}

void VoterClient::HandleVote(std::string input) {
  std::vector<std::string> args = string_split(input, ' ');
  if (args.size() != 3) {
    this->cli_driver->print_warning("usage: vote <candidate> <out_file>");
    return;
  }
  auto ballot = this->DoVote(args[1]);
  if (!ballot.second) {
    this->cli_driver->print_warning(
        "Registration is not complete; every voter must register first.");
    return;
  }
  SaveMessage(args[2], ballot.first);
  this->cli_driver->print_success("Ballot written to " + args[2]);
}
