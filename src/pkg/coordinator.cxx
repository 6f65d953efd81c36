#include <stdexcept>

#include "../../include/pkg/coordinator.hpp"
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
 * Constructor. Builds the election described by the config and replays
 * whatever transcript the database already holds.
 */
CoordinatorClient::CoordinatorClient(ElectionConfig election_config) {
  // Make shared variables.
  this->election_config = election_config;
  this->cli_driver = std::make_shared<CLIDriver>();
  this->db_driver = std::make_shared<DBDriver>();
  if (this->db_driver->open(this->election_config.db_path) != SQLITE_OK) {
    throw std::runtime_error("Could not open database " +
                             this->election_config.db_path);
  }
  this->db_driver->init_tables();
  setLogLevel(this->election_config.log_level);

  this->NewElection();
  this->Restore();
}

void CoordinatorClient::run() {
  // Start REPL
  this->cli_driver->init();
  REPLDriver<CoordinatorClient> repl = REPLDriver<CoordinatorClient>(this);
  repl.add_action("register", "register <registration_file>",
                  &CoordinatorClient::HandleRegister);
  repl.add_action("vote", "vote <ballot_file>", &CoordinatorClient::HandleVote);
  repl.add_action("tally", "tally [<count_0> ... <count_k-1>]",
                  &CoordinatorClient::HandleTally);
  repl.add_action("status", "status", &CoordinatorClient::HandleStatus);
  repl.add_action("result", "result", &CoordinatorClient::HandleResult);
  repl.add_action("reset", "reset", &CoordinatorClient::HandleReset);
  repl.run();
}

std::shared_ptr<ElectionState> CoordinatorClient::GetState() {
  return this->state;
}

/**
 * Create a fresh engine from the config; a config the engine rejects is a
 * setup error.
 */
void CoordinatorClient::NewElection() {
  ElectionParams params;
  params.candidates = this->election_config.candidates;
  params.voters = this->election_config.voters;
  params.group.p = this->election_config.p;
  params.group.q = this->election_config.q;
  params.group.g = this->election_config.g;
  params.slot_width =
      this->election_config.slot_width != 0
          ? this->election_config.slot_width
          : FieldArithmetic::SlotWidth(this->election_config.candidates.size());
  params.require_vote_proof = this->election_config.require_vote_proof;

  auto created = ElectionState::Create(params);
  if (!created.second.ok()) {
    throw std::runtime_error("Invalid election: " +
                             created.second.to_string());
  }
  this->state = created.first;
}

/**
 * Replay the transcript through the engine so that restored state is
 * re-verified rather than trusted.
 */
void CoordinatorClient::Restore() {
  size_t replayed = 0;
  for (const RegistrationRow &registration :
       this->db_driver->all_registrations()) {
    ElectionStatus status = this->state->SubmitPublicKey(
        registration.voter_id, registration.zkp);
    if (!status.ok()) {
      this->cli_driver->print_warning("Transcript registration for " +
                                      registration.voter_id +
                                      " rejected: " + status.to_string());
      continue;
    }
    replayed++;
  }
  for (const BallotRow &ballot : this->db_driver->all_ballots()) {
    ElectionStatus status = this->Submit(ballot);
    if (!status.ok()) {
      this->cli_driver->print_warning("Transcript ballot for " +
                                      ballot.voter_id +
                                      " rejected: " + status.to_string());
      continue;
    }
    replayed++;
  }
  auto tally = this->db_driver->find_tally();
  if (tally.second) {
    ElectionStatus status = this->state->ResolveTally(tally.first.counts);
    if (!status.ok()) {
      this->cli_driver->print_warning("Transcript tally rejected: " +
                                      status.to_string());
    } else {
      replayed++;
    }
  }
  CUSTOM_LOG(lg, info) << "replayed " << replayed
                       << " transcript entries; round is "
                       << round_to_string(this->state->GetRound());
}

ElectionStatus CoordinatorClient::Submit(const BallotRow &ballot) {
  if (ballot.has_zkp) {
    return this->state->SubmitVote(ballot.voter_id, ballot.vote, ballot.zkp);
  }
  return this->state->SubmitVote(ballot.voter_id, ballot.vote);
}

// ================================================
// SUBMISSIONS
// ================================================

/**
 * The engine accepted something the transcript could not hold. Rebuild the
 * engine from the transcript so the two agree again, and report the
 * submission as not taken.
 */
ElectionStatus CoordinatorClient::Unrecorded(std::string what) {
  CUSTOM_LOG(lg, error) << what << " accepted but not recorded; rolling back";
  this->NewElection();
  this->Restore();
  return ElectionStatus::Error(ElectionErrorKind::TranscriptError,
                               what + " could not be written to the "
                                      "transcript and was rolled back; "
                                      "resubmit it");
}

/**
 * Run a registration through the engine and record it if accepted.
 */
ElectionStatus
CoordinatorClient::AcceptRegistration(const RegistrationRow &registration) {
  ElectionStatus status =
      this->state->SubmitPublicKey(registration.voter_id, registration.zkp);
  if (status.ok() && !this->db_driver->insert_registration(registration)) {
    return this->Unrecorded("registration for " + registration.voter_id);
  }
  return status;
}

/**
 * Run a ballot through the engine and record it if accepted.
 */
ElectionStatus CoordinatorClient::AcceptBallot(const BallotRow &ballot) {
  ElectionStatus status = this->Submit(ballot);
  if (status.ok() && !this->db_driver->insert_ballot(ballot)) {
    return this->Unrecorded("ballot for " + ballot.voter_id);
  }
  return status;
}

/**
 * Check a claimed tally against the aggregate and record it if it holds.
 */
ElectionStatus
CoordinatorClient::AcceptTally(const std::vector<CryptoPP::Integer> &counts) {
  ElectionStatus status = this->state->ResolveTally(counts);
  if (status.ok()) {
    CoordinatorToWorld_Tally_Message tally;
    tally.counts = counts;
    if (!this->db_driver->insert_tally(tally)) {
      return this->Unrecorded("tally");
    }
  }
  return status;
}

// ================================================
// REPL HANDLERS
// ================================================

void CoordinatorClient::HandleRegister(std::string input) {
  std::vector<std::string> args = string_split(input, ' ');
  if (args.size() != 2) {
    this->cli_driver->print_warning("usage: register <registration_file>");
    return;
  }
  RegistrationRow registration;
  LoadMessage(args[1], registration);

  ElectionStatus status = this->AcceptRegistration(registration);
  if (!status.ok()) {
    this->cli_driver->print_warning(status.to_string());
    return;
  }
  this->cli_driver->print_success("Registered " + registration.voter_id + " (" +
                                  std::to_string(
                                      this->state->GetRegistrationCount()) +
                                  "/" +
                                  std::to_string(this->election_config.voters
                                                     .size()) +
                                  ")");
}

void CoordinatorClient::HandleVote(std::string input) {
  std::vector<std::string> args = string_split(input, ' ');
  if (args.size() != 2) {
    this->cli_driver->print_warning("usage: vote <ballot_file>");
    return;
  }
  BallotRow ballot;
  LoadMessage(args[1], ballot);

  ElectionStatus status = this->AcceptBallot(ballot);
  if (!status.ok()) {
    this->cli_driver->print_warning(status.to_string());
    return;
  }
  this->cli_driver->print_success(
      "Accepted ballot from " + ballot.voter_id + " (" +
      std::to_string(this->state->GetVoteCount()) + "/" +
      std::to_string(this->election_config.voters.size()) + ")");
}

/**
 * With explicit counts, check them. Without, search for the counts that
 * explain the aggregate first.
 */
void CoordinatorClient::HandleTally(std::string input) {
  std::vector<std::string> args = string_split(input, ' ');
  std::vector<CryptoPP::Integer> counts;
  if (args.size() == 1) {
    auto aggregate = this->state->GetAggregate();
    if (!aggregate.second.ok()) {
      this->cli_driver->print_warning(aggregate.second.to_string());
      return;
    }
    this->cli_driver->print_info("Searching for the tally...");
    auto found = ElectionClient::SearchTally(
        aggregate.first, this->state->GetCandidates().size(),
        this->state->GetVoteCount(), this->state->GetSlotWidth(),
        this->state->GetGroup());
    if (!found.second) {
      this->cli_driver->print_warning(
          "No count vector explains the aggregate within the search bound.");
      return;
    }
    counts = found.first;
  } else {
    for (size_t i = 1; i < args.size(); i++) {
      counts.push_back(string_to_integer(args[i]));
    }
  }

  ElectionStatus status = this->AcceptTally(counts);
  if (!status.ok()) {
    this->cli_driver->print_warning(status.to_string());
    return;
  }
  this->cli_driver->print_success("Tally verified; election closed.");
  this->HandleResult("result");
}

void CoordinatorClient::HandleStatus(std::string _) {
  size_t voters = this->election_config.voters.size();
  this->cli_driver->print_info("Round: " +
                               round_to_string(this->state->GetRound()));
  this->cli_driver->print_left(
      "Registered: " + std::to_string(this->state->GetRegistrationCount()) +
      "/" + std::to_string(voters));
  this->cli_driver->print_left(
      "Voted: " + std::to_string(this->state->GetVoteCount()) + "/" +
      std::to_string(voters));
  auto aggregate = this->state->GetAggregate();
  if (aggregate.second.ok()) {
    this->cli_driver->print_left("Aggregate: " +
                                 integer_to_string(aggregate.first));
  }
}

void CoordinatorClient::HandleResult(std::string _) {
  auto result = this->state->GetResult();
  if (!result.second.ok()) {
    this->cli_driver->print_warning(result.second.to_string());
    return;
  }
  for (const std::string &candidate : this->state->GetCandidates()) {
    this->cli_driver->print_left(candidate + ": " +
                                 integer_to_string(result.first[candidate]));
  }
  auto winner = this->state->GetWinner();
  if (!winner.second.ok()) {
    this->cli_driver->print_warning(winner.second.to_string());
    return;
  }
  this->cli_driver->print_success("Winner: " + winner.first);
}

/**
 * Drop the transcript and start over with a fresh election.
 */
void CoordinatorClient::HandleReset(std::string _) {
  this->db_driver->reset_tables();
  this->NewElection();
  CUSTOM_LOG(lg, info) << "election reset";
  this->cli_driver->print_success("Election reset.");
}
