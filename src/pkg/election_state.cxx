#include <set>

#include <crypto++/nbtheory.h>

#include "../../include-shared/logger.hpp"
#include "../../include-shared/util.hpp"
#include "../../include/pkg/election.hpp"
#include "../../include/pkg/election_state.hpp"

/*
Syntax to use logger:
  CUSTOM_LOG(lg, debug) << "your message"
See logger.hpp for more modes besides 'debug'
*/
namespace {
src::severity_logger<logging::trivial::severity_level> lg;

ElectionStatus invalid_configuration(std::string reason) {
  CUSTOM_LOG(lg, warning) << "rejected election configuration: " << reason;
  return ElectionStatus::Error(ElectionErrorKind::InvalidConfiguration,
                               reason);
}

bool has_duplicates(const std::vector<std::string> &names) {
  std::set<std::string> seen(names.begin(), names.end());
  return seen.size() != names.size();
}
} // namespace

std::string round_to_string(ElectionRound::T round) {
  switch (round) {
  case ElectionRound::Registration:
    return "Registration";
  case ElectionRound::Voting:
    return "Voting";
  case ElectionRound::TallyPending:
    return "TallyPending";
  case ElectionRound::Closed:
    return "Closed";
  }
  return "Unknown";
}

// ================================================
// INITIALIZATION
// ================================================

/**
 * Validate the initializer's parameters and build a fresh election in the
 * Registration round.
 */
std::pair<std::shared_ptr<ElectionState>, ElectionStatus>
ElectionState::Create(ElectionParams params) {
  std::shared_ptr<ElectionState> none;
  if (params.candidates.empty()) {
    return std::make_pair(none, invalid_configuration("no candidates"));
  }
  if (has_duplicates(params.candidates)) {
    return std::make_pair(none,
                          invalid_configuration("duplicate candidate names"));
  }
  if (params.voters.empty()) {
    return std::make_pair(none, invalid_configuration("empty voter roster"));
  }
  if (has_duplicates(params.voters)) {
    return std::make_pair(none,
                          invalid_configuration("duplicate voter identities"));
  }
  if (params.group.p <= CryptoPP::Integer(2) ||
      !CryptoPP::IsPrime(params.group.p)) {
    return std::make_pair(none,
                          invalid_configuration("modulus p is not an odd prime"));
  }
  if (params.group.g <= CryptoPP::Integer::One() ||
      params.group.g >= params.group.p) {
    return std::make_pair(none,
                          invalid_configuration("generator g is not in (1, p)"));
  }
  if (params.group.q <= CryptoPP::Integer(2) ||
      !CryptoPP::IsPrime(params.group.q) ||
      !((params.group.p - CryptoPP::Integer::One()) % params.group.q)
           .IsZero()) {
    return std::make_pair(
        none, invalid_configuration("subgroup order q is not an odd prime "
                                    "dividing p - 1"));
  }
  if (FieldArithmetic::Power(params.group.g, params.group.q, params.group.p) !=
      CryptoPP::Integer::One()) {
    return std::make_pair(
        none, invalid_configuration("generator g does not have order q"));
  }
  if (!FieldArithmetic::IsValidSlotWidth(params.slot_width,
                                         params.candidates.size())) {
    return std::make_pair(
        none, invalid_configuration(
                  "slot width " + std::to_string(params.slot_width) +
                  " does not satisfy 2^m > " +
                  std::to_string(params.candidates.size()) + " >= 2^(m-1)"));
  }
  if (params.slot_width < 64 &&
      params.voters.size() >= (1ULL << params.slot_width)) {
    CUSTOM_LOG(lg, warning)
        << params.voters.size() << " voters can overflow a " << params.slot_width
        << "-bit slot; tallies may alias";
  }

  std::shared_ptr<ElectionState> state(new ElectionState(params));
  CUSTOM_LOG(lg, info) << "election created with "
                       << params.candidates.size() << " candidates, "
                       << params.voters.size() << " voters, slot width "
                       << params.slot_width;
  return std::make_pair(state, ElectionStatus::Ok());
}

/**
 * Constructor
 */
ElectionState::ElectionState(ElectionParams params) {
  this->candidates = params.candidates;
  this->voters = params.voters;
  this->group = params.group;
  this->slot_width = params.slot_width;
  this->require_vote_proof = params.require_vote_proof;

  this->round = ElectionRound::Registration;
  for (const std::string &voter : this->voters) {
    this->records[voter] = VoterRecord();
  }
  this->registration_count = 0;
  this->vote_count = 0;
  this->aggregate = CryptoPP::Integer::One();
  this->winner = 0;
  this->has_winner = false;
}

// ================================================
// MUTATIONS
// ================================================

/**
 * Round one. Bind a proven public key to a roster entry; the last
 * registration opens the Voting round.
 */
ElectionStatus ElectionState::SubmitPublicKey(std::string voter_id,
                                              const PublicKeyZKP_Struct &zkp) {
  std::unique_lock<std::mutex> lck(this->mtx);

  if (this->round != ElectionRound::Registration) {
    return this->Reject(ElectionErrorKind::WrongRound,
                        "public keys are only accepted during Registration, "
                        "current round is " +
                            round_to_string(this->round));
  }
  auto record = this->records.find(voter_id);
  if (record == this->records.end() || !record->second.eligible) {
    return this->Reject(ElectionErrorKind::Unauthorized,
                        voter_id + " is not an eligible voter");
  }
  if (record->second.registered) {
    return this->Reject(ElectionErrorKind::Unauthorized,
                        voter_id + " has already registered a public key");
  }
  auto owner = this->key_owners.find(zkp.pk);
  if (owner != this->key_owners.end()) {
    return this->Reject(ElectionErrorKind::DuplicateKey,
                        "public key is already bound to " + owner->second);
  }
  if (!ElectionClient::VerifyPublicKeyZKP(zkp, voter_id, this->group)) {
    return this->Reject(ElectionErrorKind::InvalidProof,
                        "proof of knowledge for " + voter_id +
                            "'s public key does not verify");
  }

  record->second.registered = true;
  record->second.public_key = zkp.pk;
  this->key_owners[zkp.pk] = voter_id;
  this->registration_count++;
  CUSTOM_LOG(lg, debug) << "registered " << voter_id << " ("
                        << this->registration_count << "/"
                        << this->voters.size() << ")";

  if (this->registration_count == this->voters.size()) {
    this->round = ElectionRound::Voting;
    CUSTOM_LOG(lg, info) << "all voters registered, round is now Voting";
  }
  return ElectionStatus::Ok();
}

/**
 * Round two. Fold a ballot into the aggregate.
 */
ElectionStatus ElectionState::SubmitVote(std::string voter_id,
                                         CryptoPP::Integer encrypted_vote) {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->DoSubmitVote(voter_id, encrypted_vote, nullptr);
}

/**
 * Round two, with a proof that the ballot encodes a single candidate slot.
 */
ElectionStatus ElectionState::SubmitVote(std::string voter_id,
                                         CryptoPP::Integer encrypted_vote,
                                         const VoteZKP_Struct &zkp) {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->DoSubmitVote(voter_id, encrypted_vote, &zkp);
}

ElectionStatus ElectionState::DoSubmitVote(std::string voter_id,
                                           CryptoPP::Integer encrypted_vote,
                                           const VoteZKP_Struct *zkp) {
  if (this->round != ElectionRound::Voting) {
    return this->Reject(ElectionErrorKind::WrongRound,
                        "votes are only accepted during Voting, current "
                        "round is " +
                            round_to_string(this->round));
  }
  auto record = this->records.find(voter_id);
  if (record == this->records.end()) {
    return this->Reject(ElectionErrorKind::Unauthorized,
                        voter_id + " is not on the roster");
  }
  if (!record->second.eligible) {
    return this->Reject(ElectionErrorKind::Unauthorized,
                        voter_id + " has already voted");
  }
  if (!FieldArithmetic::IsGroupElement(encrypted_vote, this->group)) {
    return this->Reject(ElectionErrorKind::InvalidProof,
                        "ballot from " + voter_id + " is not a group element");
  }
  if (this->require_vote_proof && zkp == nullptr) {
    return this->Reject(ElectionErrorKind::InvalidProof,
                        "ballot from " + voter_id +
                            " carries no candidate membership proof");
  }
  if (zkp != nullptr &&
      !ElectionClient::VerifyVoteZKP(
          *zkp, record->second.public_key,
          this->ReconstructedKeyLocked(voter_id), encrypted_vote,
          this->candidates.size(), this->slot_width, voter_id, this->group)) {
    return this->Reject(ElectionErrorKind::InvalidProof,
                        "candidate membership proof from " + voter_id +
                            " does not verify");
  }

  record->second.eligible = false;
  this->aggregate =
      ElectionClient::CombineVote(this->aggregate, encrypted_vote, this->group);
  this->vote_count++;
  CUSTOM_LOG(lg, debug) << "accepted ballot from " << voter_id << " ("
                        << this->vote_count << "/" << this->voters.size()
                        << ")";

  if (this->vote_count == this->voters.size()) {
    this->round = ElectionRound::TallyPending;
    CUSTOM_LOG(lg, info) << "all ballots cast, round is now TallyPending";
  }
  return ElectionStatus::Ok();
}

/**
 * Check claimed per-candidate counts against the aggregate and close the
 * election on a match.
 */
ElectionStatus
ElectionState::ResolveTally(const std::vector<CryptoPP::Integer> &counts) {
  std::unique_lock<std::mutex> lck(this->mtx);

  if (this->round != ElectionRound::TallyPending) {
    return this->Reject(ElectionErrorKind::WrongRound,
                        "tallies are only accepted during TallyPending, "
                        "current round is " +
                            round_to_string(this->round));
  }
  if (counts.size() != this->candidates.size()) {
    return this->Reject(ElectionErrorKind::TallyMismatch,
                        "expected " + std::to_string(this->candidates.size()) +
                            " counts, got " + std::to_string(counts.size()));
  }
  // A count of 2^m or more in one slot aliases into the next, so only vectors
  // that account for exactly the ballots cast are checked against the
  // aggregate.
  CryptoPP::Integer cast = CryptoPP::Integer(
      static_cast<long>(this->vote_count));
  CryptoPP::Integer sum = CryptoPP::Integer::Zero();
  for (const CryptoPP::Integer &count : counts) {
    if (count.IsNegative()) {
      return this->Reject(ElectionErrorKind::TallyMismatch,
                          "counts must be non-negative");
    }
    if (count > cast) {
      return this->Reject(ElectionErrorKind::TallyMismatch,
                          "count " + integer_to_string(count) +
                              " exceeds the " + std::to_string(this->vote_count) +
                              " ballots cast");
    }
    sum += count;
  }
  if (sum != cast) {
    return this->Reject(ElectionErrorKind::TallyMismatch,
                        "counts sum to " + integer_to_string(sum) + ", but " +
                            std::to_string(this->vote_count) +
                            " ballots were cast");
  }
  if (!ElectionClient::VerifyTally(this->aggregate, counts, this->slot_width,
                                   this->group)) {
    return this->Reject(ElectionErrorKind::TallyMismatch,
                        "claimed counts do not reproduce the aggregate");
  }

  std::pair<size_t, bool> winner = ElectionClient::SelectWinner(counts);
  this->counts = counts;
  this->winner = winner.first;
  this->has_winner = winner.second;
  this->round = ElectionRound::Closed;
  CUSTOM_LOG(lg, info) << "tally verified, election closed";
  return ElectionStatus::Ok();
}

// ================================================
// QUERIES
// ================================================

std::vector<std::string> ElectionState::GetCandidates() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->candidates;
}

std::vector<std::string> ElectionState::GetVoters() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->voters;
}

ElectionRound::T ElectionState::GetRound() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->round;
}

GroupParams ElectionState::GetGroup() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->group;
}

int ElectionState::GetSlotWidth() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->slot_width;
}

bool ElectionState::RequiresVoteProof() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->require_vote_proof;
}

size_t ElectionState::GetRegistrationCount() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->registration_count;
}

size_t ElectionState::GetVoteCount() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  return this->vote_count;
}

std::pair<CryptoPP::Integer, ElectionStatus>
ElectionState::GetPublicKey(std::string voter_id) const {
  std::unique_lock<std::mutex> lck(this->mtx);
  auto record = this->records.find(voter_id);
  if (record == this->records.end() || !record->second.registered) {
    return std::make_pair(
        CryptoPP::Integer::Zero(),
        ElectionStatus::Error(ElectionErrorKind::Unauthorized,
                              voter_id + " has no registered public key"));
  }
  return std::make_pair(record->second.public_key, ElectionStatus::Ok());
}

/**
 * Registered public keys by voter id.
 */
std::map<std::string, CryptoPP::Integer> ElectionState::GetPublicKeys() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  std::map<std::string, CryptoPP::Integer> keys;
  for (const auto &record : this->records) {
    if (record.second.registered) {
      keys[record.first] = record.second.public_key;
    }
  }
  return keys;
}

/**
 * The blinding base for a voter's ballot; defined once every key is in.
 */
std::pair<CryptoPP::Integer, ElectionStatus>
ElectionState::GetReconstructedKey(std::string voter_id) const {
  std::unique_lock<std::mutex> lck(this->mtx);
  if (this->round == ElectionRound::Registration) {
    return std::make_pair(
        CryptoPP::Integer::Zero(),
        ElectionStatus::Error(ElectionErrorKind::WrongRound,
                              "reconstructed keys need every public key"));
  }
  if (this->records.find(voter_id) == this->records.end()) {
    return std::make_pair(
        CryptoPP::Integer::Zero(),
        ElectionStatus::Error(ElectionErrorKind::Unauthorized,
                              voter_id + " is not on the roster"));
  }
  return std::make_pair(this->ReconstructedKeyLocked(voter_id),
                        ElectionStatus::Ok());
}

std::pair<CryptoPP::Integer, ElectionStatus>
ElectionState::GetAggregate() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  if (this->round < ElectionRound::TallyPending) {
    return std::make_pair(
        CryptoPP::Integer::Zero(),
        ElectionStatus::Error(ElectionErrorKind::WrongRound,
                              "aggregate is published once every ballot is in"));
  }
  return std::make_pair(this->aggregate, ElectionStatus::Ok());
}

std::pair<CryptoPP::Integer, ElectionStatus>
ElectionState::GetCandidateVotes(std::string candidate) const {
  std::unique_lock<std::mutex> lck(this->mtx);
  if (this->round != ElectionRound::Closed) {
    return std::make_pair(
        CryptoPP::Integer::Zero(),
        ElectionStatus::Error(ElectionErrorKind::NotYetFinalized,
                              "election is not closed"));
  }
  for (size_t i = 0; i < this->candidates.size(); i++) {
    if (this->candidates[i] == candidate) {
      return std::make_pair(this->counts[i], ElectionStatus::Ok());
    }
  }
  return std::make_pair(
      CryptoPP::Integer::Zero(),
      ElectionStatus::Error(ElectionErrorKind::UnknownCandidate,
                            candidate + " is not on the ballot"));
}

std::pair<std::map<std::string, CryptoPP::Integer>, ElectionStatus>
ElectionState::GetResult() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  std::map<std::string, CryptoPP::Integer> result;
  if (this->round != ElectionRound::Closed) {
    return std::make_pair(
        result, ElectionStatus::Error(ElectionErrorKind::NotYetFinalized,
                                      "election is not closed"));
  }
  for (size_t i = 0; i < this->candidates.size(); i++) {
    result[this->candidates[i]] = this->counts[i];
  }
  return std::make_pair(result, ElectionStatus::Ok());
}

std::pair<std::string, ElectionStatus> ElectionState::GetWinner() const {
  std::unique_lock<std::mutex> lck(this->mtx);
  if (this->round != ElectionRound::Closed) {
    return std::make_pair(
        std::string(),
        ElectionStatus::Error(ElectionErrorKind::NotYetFinalized,
                              "election is not closed"));
  }
  if (!this->has_winner) {
    return std::make_pair(
        std::string(), ElectionStatus::Error(ElectionErrorKind::NoWinner,
                                             "every candidate has zero votes"));
  }
  return std::make_pair(this->candidates[this->winner], ElectionStatus::Ok());
}

// ================================================
// HELPERS
// ================================================

/**
 * Caller holds mtx and every voter has registered.
 */
CryptoPP::Integer
ElectionState::ReconstructedKeyLocked(std::string voter_id) const {
  std::vector<CryptoPP::Integer> public_keys;
  size_t position = 0;
  for (size_t i = 0; i < this->voters.size(); i++) {
    if (this->voters[i] == voter_id) {
      position = i;
    }
    public_keys.push_back(this->records.at(this->voters[i]).public_key);
  }
  return ElectionClient::ReconstructedKey(public_keys, position, this->group);
}

ElectionStatus ElectionState::Reject(ElectionErrorKind::T kind,
                                     std::string reason) const {
  CUSTOM_LOG(lg, warning) << error_kind_to_string(kind) << ": " << reason;
  return ElectionStatus::Error(kind, reason);
}
