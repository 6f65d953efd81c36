#pragma once

#include <string>
#include <utility>
#include <vector>

#include <crypto++/cryptlib.h>
#include <crypto++/integer.h>
#include <crypto++/nbtheory.h>
#include <crypto++/osrng.h>

#include "../../include-shared/constants.hpp"
#include "../../include-shared/messages.hpp"
#include "../../include-shared/util.hpp"
#include "../../include/pkg/arithmetic.hpp"

class ElectionClient {
public:
  // Round one: keys and proofs of knowledge.
  static std::pair<CryptoPP::Integer, CryptoPP::Integer>
  GenerateKeyPair(const GroupParams &group);
  static PublicKeyZKP_Struct GeneratePublicKeyZKP(CryptoPP::Integer x,
                                                  std::string voter_id,
                                                  const GroupParams &group);
  static bool VerifyPublicKeyZKP(const PublicKeyZKP_Struct &zkp,
                                 std::string voter_id,
                                 const GroupParams &group);

  // Round two: self-tallying ballots.
  static CryptoPP::Integer
  ReconstructedKey(const std::vector<CryptoPP::Integer> &public_keys,
                   size_t position, const GroupParams &group);
  static CryptoPP::Integer EncodeVote(size_t slot, int slot_width,
                                      const GroupParams &group);
  static CryptoPP::Integer GenerateVote(CryptoPP::Integer x,
                                        CryptoPP::Integer y, size_t slot,
                                        int slot_width,
                                        const GroupParams &group);
  static VoteZKP_Struct
  GenerateVoteZKP(CryptoPP::Integer x, CryptoPP::Integer y,
                  CryptoPP::Integer vote, size_t slot, size_t candidate_count,
                  int slot_width, std::string voter_id,
                  const GroupParams &group);
  static bool VerifyVoteZKP(const VoteZKP_Struct &zkp, CryptoPP::Integer pk,
                            CryptoPP::Integer y, CryptoPP::Integer vote,
                            size_t candidate_count, int slot_width,
                            std::string voter_id, const GroupParams &group);

  // Homomorphic aggregation.
  static CryptoPP::Integer CombineVote(CryptoPP::Integer current,
                                       CryptoPP::Integer vote,
                                       const GroupParams &group);
  static CryptoPP::Integer
  CombineVotes(const std::vector<CryptoPP::Integer> &votes,
               const GroupParams &group);

  // Tally resolution.
  static CryptoPP::Integer
  TallyExponent(const std::vector<CryptoPP::Integer> &counts, int slot_width,
                const GroupParams &group);
  static bool VerifyTally(CryptoPP::Integer aggregate,
                          const std::vector<CryptoPP::Integer> &counts,
                          int slot_width, const GroupParams &group);
  static std::pair<size_t, bool>
  SelectWinner(const std::vector<CryptoPP::Integer> &counts);
  static std::pair<std::vector<CryptoPP::Integer>, bool>
  SearchTally(CryptoPP::Integer aggregate, size_t candidate_count,
              size_t voter_count, int slot_width, const GroupParams &group,
              unsigned long max_steps = DEFAULT_TALLY_SEARCH_STEPS);
};
