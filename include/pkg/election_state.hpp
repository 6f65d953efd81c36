#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <crypto++/integer.h>

#include "../../include-shared/messages.hpp"
#include "../../include/pkg/arithmetic.hpp"
#include "../../include/pkg/status.hpp"

// ================================================
// ROUNDS
// ================================================

namespace ElectionRound {
enum T {
  Registration = 0,
  Voting = 1,
  TallyPending = 2,
  Closed = 3,
};
};
std::string round_to_string(ElectionRound::T round);

// Everything an initializer supplies when an election is created.
struct ElectionParams {
  std::vector<std::string> candidates;
  std::vector<std::string> voters;
  GroupParams group;
  int slot_width = 0;
  bool require_vote_proof = false;
};

// Per-roster-entry state.
struct VoterRecord {
  bool eligible = true;
  bool registered = false;
  CryptoPP::Integer public_key;
};

/**
 * One election. Owns the roster, the aggregate and the round; every mutation
 * validates all preconditions before writing, and all access is serialized
 * by a single mutex.
 */
class ElectionState {
public:
  static std::pair<std::shared_ptr<ElectionState>, ElectionStatus>
  Create(ElectionParams params);

  // Mutations.
  ElectionStatus SubmitPublicKey(std::string voter_id,
                                 const PublicKeyZKP_Struct &zkp);
  ElectionStatus SubmitVote(std::string voter_id,
                            CryptoPP::Integer encrypted_vote);
  ElectionStatus SubmitVote(std::string voter_id,
                            CryptoPP::Integer encrypted_vote,
                            const VoteZKP_Struct &zkp);
  ElectionStatus ResolveTally(const std::vector<CryptoPP::Integer> &counts);

  // Queries.
  std::vector<std::string> GetCandidates() const;
  std::vector<std::string> GetVoters() const;
  ElectionRound::T GetRound() const;
  GroupParams GetGroup() const;
  int GetSlotWidth() const;
  bool RequiresVoteProof() const;
  size_t GetRegistrationCount() const;
  size_t GetVoteCount() const;
  std::pair<CryptoPP::Integer, ElectionStatus>
  GetPublicKey(std::string voter_id) const;
  std::map<std::string, CryptoPP::Integer> GetPublicKeys() const;
  std::pair<CryptoPP::Integer, ElectionStatus>
  GetReconstructedKey(std::string voter_id) const;
  std::pair<CryptoPP::Integer, ElectionStatus> GetAggregate() const;
  std::pair<CryptoPP::Integer, ElectionStatus>
  GetCandidateVotes(std::string candidate) const;
  std::pair<std::map<std::string, CryptoPP::Integer>, ElectionStatus>
  GetResult() const;
  std::pair<std::string, ElectionStatus> GetWinner() const;

private:
  explicit ElectionState(ElectionParams params);

  ElectionStatus DoSubmitVote(std::string voter_id,
                              CryptoPP::Integer encrypted_vote,
                              const VoteZKP_Struct *zkp);
  CryptoPP::Integer ReconstructedKeyLocked(std::string voter_id) const;
  ElectionStatus Reject(ElectionErrorKind::T kind, std::string reason) const;

  mutable std::mutex mtx;

  std::vector<std::string> candidates;
  std::vector<std::string> voters;
  GroupParams group;
  int slot_width;
  bool require_vote_proof;

  ElectionRound::T round;
  std::map<std::string, VoterRecord> records;
  std::map<CryptoPP::Integer, std::string> key_owners;
  size_t registration_count;
  size_t vote_count;
  CryptoPP::Integer aggregate;

  std::vector<CryptoPP::Integer> counts;
  size_t winner;
  bool has_winner;
};
