#include <stdexcept>

#include "../../include-shared/logger.hpp"
#include "../../include/pkg/election.hpp"

/*
Syntax to use logger:
  CUSTOM_LOG(lg, debug) << "your message"
See logger.hpp for more modes besides 'debug'
*/
namespace {
src::severity_logger<logging::trivial::severity_level> lg;

// Depth-first walk over count vectors summing to a fixed voter count.
struct TallySearch {
  CryptoPP::Integer aggregate;
  CryptoPP::Integer order;
  std::vector<CryptoPP::Integer> slot_values;
  GroupParams group;
  unsigned long max_steps;
  unsigned long steps;
  std::vector<CryptoPP::Integer> counts;

  bool Visit(size_t index, size_t remaining, CryptoPP::Integer exponent) {
    if (index + 1 == this->counts.size()) {
      if (this->steps >= this->max_steps) {
        return false;
      }
      this->steps++;
      this->counts[index] = CryptoPP::Integer((long)remaining);
      exponent = FieldArithmetic::Add(
          exponent,
          FieldArithmetic::Multiply(this->counts[index],
                                    this->slot_values[index], this->order),
          this->order);
      return FieldArithmetic::Power(this->group.g, exponent, this->group.p) ==
             this->aggregate;
    }
    for (size_t taken = 0; taken <= remaining && this->steps < this->max_steps;
         taken++) {
      this->counts[index] = CryptoPP::Integer((long)(remaining - taken));
      CryptoPP::Integer next = FieldArithmetic::Add(
          exponent,
          FieldArithmetic::Multiply(this->counts[index],
                                    this->slot_values[index], this->order),
          this->order);
      if (this->Visit(index + 1, taken, next)) {
        return true;
      }
    }
    return false;
  }
};
} // namespace

/**
 * Generate a voter key pair (x, g^x) with x drawn from [1, q-1].
 */
std::pair<CryptoPP::Integer, CryptoPP::Integer>
ElectionClient::GenerateKeyPair(const GroupParams &group) {
  CryptoPP::AutoSeededRandomPool prng;
  CryptoPP::Integer x(prng, 1, FieldArithmetic::GroupOrder(group) - 1);
  return std::make_pair(x, FieldArithmetic::Power(group.g, x, group.p));
}

/**
 * Fiat-Shamir Schnorr proof of knowledge of x behind pk = g^x, bound to
 * voter_id so it cannot be replayed under another identity.
 */
PublicKeyZKP_Struct
ElectionClient::GeneratePublicKeyZKP(CryptoPP::Integer x, std::string voter_id,
                                     const GroupParams &group) {
  CryptoPP::AutoSeededRandomPool prng;
  CryptoPP::Integer order = FieldArithmetic::GroupOrder(group);

  PublicKeyZKP_Struct zkp;
  zkp.pk = FieldArithmetic::Power(group.g, x, group.p);

  CryptoPP::Integer v(prng, 1, order - 1);
  zkp.gv = FieldArithmetic::Power(group.g, v, group.p);

  CryptoPP::Integer c = hash_pk_zkp(group.g, zkp.gv, zkp.pk, voter_id);
  zkp.r = (v - x * c) % order;
  return zkp;
}

/**
 * Verify gv == g^r * pk^c with c recomputed from the transcript.
 */
bool ElectionClient::VerifyPublicKeyZKP(const PublicKeyZKP_Struct &zkp,
                                        std::string voter_id,
                                        const GroupParams &group) {
  if (!FieldArithmetic::IsGroupElement(zkp.pk, group) ||
      !FieldArithmetic::IsGroupElement(zkp.gv, group) ||
      zkp.r.IsNegative()) {
    return false;
  }
  CryptoPP::Integer c = hash_pk_zkp(group.g, zkp.gv, zkp.pk, voter_id);
  CryptoPP::Integer rhs = FieldArithmetic::Multiply(
      FieldArithmetic::Power(group.g, zkp.r, group.p),
      FieldArithmetic::Power(zkp.pk, c, group.p), group.p);
  return zkp.gv == rhs;
}

/**
 * Y_i = prod_{j<i} pk_j / prod_{j>i} pk_j mod p, with i = position in the
 * roster. The sum over i of x_i * log(Y_i) is zero, so the blinding factors
 * Y_i^x_i cancel in the product of all ballots.
 */
CryptoPP::Integer
ElectionClient::ReconstructedKey(const std::vector<CryptoPP::Integer> &public_keys,
                                 size_t position, const GroupParams &group) {
  if (position >= public_keys.size()) {
    throw std::out_of_range("ElectionClient::ReconstructedKey: bad position");
  }
  CryptoPP::Integer before = CryptoPP::Integer::One();
  CryptoPP::Integer after = CryptoPP::Integer::One();
  for (size_t j = 0; j < public_keys.size(); j++) {
    if (j < position) {
      before = FieldArithmetic::Multiply(before, public_keys[j], group.p);
    } else if (j > position) {
      after = FieldArithmetic::Multiply(after, public_keys[j], group.p);
    }
  }
  return FieldArithmetic::Divide(before, after, group.p);
}

/**
 * g^(2^(slot*m)): the unblinded encoding of a vote for `slot`.
 */
CryptoPP::Integer ElectionClient::EncodeVote(size_t slot, int slot_width,
                                             const GroupParams &group) {
  return FieldArithmetic::Power(
      group.g,
      FieldArithmetic::SlotValue(slot, slot_width) %
          FieldArithmetic::GroupOrder(group),
      group.p);
}

/**
 * Self-tallying ballot V = Y^x * g^(2^(slot*m)) mod p.
 */
CryptoPP::Integer ElectionClient::GenerateVote(CryptoPP::Integer x,
                                               CryptoPP::Integer y, size_t slot,
                                               int slot_width,
                                               const GroupParams &group) {
  return FieldArithmetic::Multiply(FieldArithmetic::Power(y, x, group.p),
                                   EncodeVote(slot, slot_width, group),
                                   group.p);
}

/**
 * 1-of-K proof that `vote` encodes one of the candidate slots. The real
 * branch is proven honestly; every other branch is simulated from a random
 * challenge and response. Branch challenges sum to the transcript hash
 * modulo 2^CHALLENGE_BITS.
 */
VoteZKP_Struct ElectionClient::GenerateVoteZKP(
    CryptoPP::Integer x, CryptoPP::Integer y, CryptoPP::Integer vote,
    size_t slot, size_t candidate_count, int slot_width, std::string voter_id,
    const GroupParams &group) {
  if (slot >= candidate_count) {
    throw std::invalid_argument("ElectionClient::GenerateVoteZKP: bad slot");
  }
  CryptoPP::AutoSeededRandomPool prng;
  CryptoPP::Integer order = FieldArithmetic::GroupOrder(group);
  CryptoPP::Integer challenge_mod = CryptoPP::Integer::Power2(CHALLENGE_BITS);
  CryptoPP::Integer pk = FieldArithmetic::Power(group.g, x, group.p);

  VoteZKP_Struct zkp;
  zkp.a.resize(candidate_count);
  zkp.b.resize(candidate_count);
  zkp.c.resize(candidate_count);
  zkp.r.resize(candidate_count);

  CryptoPP::Integer w(prng, 1, order - 1);
  CryptoPP::Integer simulated_sum = CryptoPP::Integer::Zero();
  for (size_t k = 0; k < candidate_count; k++) {
    if (k == slot) {
      zkp.a[k] = FieldArithmetic::Power(group.g, w, group.p);
      zkp.b[k] = FieldArithmetic::Power(y, w, group.p);
      continue;
    }
    zkp.c[k] = CryptoPP::Integer(prng, CryptoPP::Integer::Zero(),
                                 challenge_mod - 1);
    zkp.r[k] =
        CryptoPP::Integer(prng, CryptoPP::Integer::Zero(), order - 1);
    CryptoPP::Integer unblinded = FieldArithmetic::Divide(
        vote, EncodeVote(k, slot_width, group), group.p);
    zkp.a[k] = FieldArithmetic::Multiply(
        FieldArithmetic::Power(group.g, zkp.r[k], group.p),
        FieldArithmetic::Power(pk, zkp.c[k], group.p), group.p);
    zkp.b[k] = FieldArithmetic::Multiply(
        FieldArithmetic::Power(y, zkp.r[k], group.p),
        FieldArithmetic::Power(unblinded, zkp.c[k], group.p), group.p);
    simulated_sum += zkp.c[k];
  }

  CryptoPP::Integer h = hash_vote_zkp(voter_id, pk, y, vote, zkp.a, zkp.b);
  zkp.c[slot] = (h - simulated_sum) % challenge_mod;
  zkp.r[slot] = (w - x * zkp.c[slot]) % order;
  return zkp;
}

/**
 * Verify a 1-of-K ballot proof against the voter's pk and reconstructed key.
 */
bool ElectionClient::VerifyVoteZKP(const VoteZKP_Struct &zkp,
                                   CryptoPP::Integer pk, CryptoPP::Integer y,
                                   CryptoPP::Integer vote,
                                   size_t candidate_count, int slot_width,
                                   std::string voter_id,
                                   const GroupParams &group) {
  if (zkp.a.size() != candidate_count || zkp.b.size() != candidate_count ||
      zkp.c.size() != candidate_count || zkp.r.size() != candidate_count) {
    return false;
  }
  if (!FieldArithmetic::IsGroupElement(vote, group) ||
      !FieldArithmetic::IsGroupElement(pk, group)) {
    return false;
  }
  CryptoPP::Integer challenge_mod = CryptoPP::Integer::Power2(CHALLENGE_BITS);

  CryptoPP::Integer c_sum = CryptoPP::Integer::Zero();
  for (size_t k = 0; k < candidate_count; k++) {
    if (!FieldArithmetic::IsGroupElement(zkp.a[k], group) ||
        !FieldArithmetic::IsGroupElement(zkp.b[k], group) ||
        zkp.c[k].IsNegative() || zkp.c[k] >= challenge_mod ||
        zkp.r[k].IsNegative()) {
      return false;
    }
    c_sum += zkp.c[k];
  }
  CryptoPP::Integer h = hash_vote_zkp(voter_id, pk, y, vote, zkp.a, zkp.b);
  if (c_sum % challenge_mod != h % challenge_mod) {
    return false;
  }

  for (size_t k = 0; k < candidate_count; k++) {
    CryptoPP::Integer unblinded = FieldArithmetic::Divide(
        vote, EncodeVote(k, slot_width, group), group.p);
    if (zkp.a[k] != FieldArithmetic::Multiply(
                        FieldArithmetic::Power(group.g, zkp.r[k], group.p),
                        FieldArithmetic::Power(pk, zkp.c[k], group.p),
                        group.p)) {
      return false;
    }
    if (zkp.b[k] != FieldArithmetic::Multiply(
                        FieldArithmetic::Power(y, zkp.r[k], group.p),
                        FieldArithmetic::Power(unblinded, zkp.c[k], group.p),
                        group.p)) {
      return false;
    }
  }
  return true;
}

/**
 * Fold one ballot into the running product.
 */
CryptoPP::Integer ElectionClient::CombineVote(CryptoPP::Integer current,
                                              CryptoPP::Integer vote,
                                              const GroupParams &group) {
  return FieldArithmetic::Multiply(current, vote, group.p);
}

/**
 * Combine votes into one using homomorphic multiplication.
 */
CryptoPP::Integer
ElectionClient::CombineVotes(const std::vector<CryptoPP::Integer> &votes,
                             const GroupParams &group) {
  CryptoPP::Integer combined = CryptoPP::Integer::One();
  for (size_t i = 0; i < votes.size(); ++i) {
    combined = CombineVote(combined, votes[i], group);
  }
  return combined;
}

/**
 * sum_i counts[i] * 2^(i*m), reduced modulo the group order.
 */
CryptoPP::Integer
ElectionClient::TallyExponent(const std::vector<CryptoPP::Integer> &counts,
                              int slot_width, const GroupParams &group) {
  CryptoPP::Integer order = FieldArithmetic::GroupOrder(group);
  CryptoPP::Integer exponent = CryptoPP::Integer::Zero();
  for (size_t i = 0; i < counts.size(); i++) {
    exponent = FieldArithmetic::Add(
        exponent,
        FieldArithmetic::Multiply(
            counts[i], FieldArithmetic::SlotValue(i, slot_width), order),
        order);
  }
  return exponent;
}

/**
 * True iff aggregate == g^TallyExponent(counts). Negative counts never match.
 */
bool ElectionClient::VerifyTally(CryptoPP::Integer aggregate,
                                 const std::vector<CryptoPP::Integer> &counts,
                                 int slot_width, const GroupParams &group) {
  for (const CryptoPP::Integer &count : counts) {
    if (count.IsNegative()) {
      return false;
    }
  }
  CryptoPP::Integer expected = FieldArithmetic::Power(
      group.g, TallyExponent(counts, slot_width, group), group.p);
  return aggregate == expected;
}

/**
 * Index of the first strictly greatest count. Not found when every count is
 * zero.
 */
std::pair<size_t, bool>
ElectionClient::SelectWinner(const std::vector<CryptoPP::Integer> &counts) {
  size_t winner = 0;
  CryptoPP::Integer best = CryptoPP::Integer::Zero();
  for (size_t i = 0; i < counts.size(); i++) {
    if (best < counts[i]) {
      best = counts[i];
      winner = i;
    }
  }
  return std::make_pair(winner, best.IsPositive());
}

/**
 * Bounded discrete-log search: walk count vectors summing to voter_count in
 * descending lexicographic order and return the first whose exponent
 * reproduces the aggregate. Gives up after max_steps vectors.
 */
std::pair<std::vector<CryptoPP::Integer>, bool>
ElectionClient::SearchTally(CryptoPP::Integer aggregate,
                            size_t candidate_count, size_t voter_count,
                            int slot_width, const GroupParams &group,
                            unsigned long max_steps) {
  if (candidate_count == 0) {
    return std::make_pair(std::vector<CryptoPP::Integer>(), false);
  }
  TallySearch search;
  search.aggregate = aggregate;
  search.order = FieldArithmetic::GroupOrder(group);
  search.group = group;
  search.max_steps = max_steps;
  search.steps = 0;
  search.counts.resize(candidate_count);
  for (size_t i = 0; i < candidate_count; i++) {
    search.slot_values.push_back(FieldArithmetic::SlotValue(i, slot_width) %
                                 search.order);
  }

  bool found = search.Visit(0, voter_count, CryptoPP::Integer::Zero());
  CUSTOM_LOG(lg, debug) << "tally search tried " << search.steps
                        << " count vectors, found=" << found;
  if (!found) {
    return std::make_pair(std::vector<CryptoPP::Integer>(), false);
  }
  return std::make_pair(search.counts, true);
}
