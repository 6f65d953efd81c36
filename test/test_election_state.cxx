#include <map>
#include <thread>

#include <boost/test/unit_test.hpp>

#include "test_helpers.hpp"

using CryptoPP::Integer;

namespace {
// An election plus every voter's key pair, in roster order.
struct ElectionFixture {
  ElectionParams params;
  std::shared_ptr<ElectionState> state;
  std::vector<Integer> secrets;

  ElectionFixture(size_t voters, bool require_vote_proof = false) {
    this->params = three_way_params(voters);
    this->params.require_vote_proof = require_vote_proof;
    auto created = ElectionState::Create(this->params);
    BOOST_REQUIRE(created.second.ok());
    this->state = created.first;
    for (size_t i = 0; i < voters; i++) {
      this->secrets.push_back(
          ElectionClient::GenerateKeyPair(this->params.group).first);
    }
  }

  std::string voter(size_t i) { return this->params.voters[i]; }

  PublicKeyZKP_Struct proof(size_t i) {
    return ElectionClient::GeneratePublicKeyZKP(this->secrets[i], voter(i),
                                                this->params.group);
  }

  ElectionStatus register_voter(size_t i) {
    return this->state->SubmitPublicKey(voter(i), proof(i));
  }

  void register_all() {
    for (size_t i = 0; i < this->secrets.size(); i++) {
      BOOST_REQUIRE(register_voter(i).ok());
    }
    BOOST_REQUIRE_EQUAL(this->state->GetRound(), ElectionRound::Voting);
  }

  Integer plain_vote(size_t slot) {
    return ElectionClient::EncodeVote(slot, 2, this->params.group);
  }

  Integer y(size_t i) {
    auto y = this->state->GetReconstructedKey(voter(i));
    BOOST_REQUIRE(y.second.ok());
    return y.first;
  }

  Integer blinded_vote(size_t i, size_t slot) {
    return ElectionClient::GenerateVote(this->secrets[i], y(i), slot, 2,
                                        this->params.group);
  }

  VoteZKP_Struct vote_proof(size_t i, Integer vote, size_t slot) {
    return ElectionClient::GenerateVoteZKP(this->secrets[i], y(i), vote, slot,
                                           3, 2, voter(i), this->params.group);
  }

  void vote_all(const std::vector<size_t> &slots) {
    for (size_t i = 0; i < slots.size(); i++) {
      BOOST_REQUIRE(
          this->state->SubmitVote(voter(i), plain_vote(slots[i])).ok());
    }
    BOOST_REQUIRE_EQUAL(this->state->GetRound(), ElectionRound::TallyPending);
  }
};
} // namespace

BOOST_AUTO_TEST_SUITE(election_configuration)

BOOST_AUTO_TEST_CASE(valid_configuration_starts_in_registration) {
  auto created = ElectionState::Create(three_way_params(3));
  BOOST_REQUIRE(created.second.ok());
  BOOST_CHECK_EQUAL(created.first->GetRound(), ElectionRound::Registration);
  BOOST_CHECK(created.first->GetCandidates() == names("c", 3));
  BOOST_CHECK(created.first->GetVoters() == names("v", 3));
  BOOST_CHECK_EQUAL(created.first->GetSlotWidth(), 2);
  BOOST_CHECK(!created.first->RequiresVoteProof());
}

BOOST_AUTO_TEST_CASE(invalid_configurations_rejected) {
  std::vector<ElectionParams> bad;

  ElectionParams no_candidates = three_way_params(3);
  no_candidates.candidates.clear();
  bad.push_back(no_candidates);

  ElectionParams repeated_candidate = three_way_params(3);
  repeated_candidate.candidates[2] = "c0";
  bad.push_back(repeated_candidate);

  ElectionParams no_voters = three_way_params(3);
  no_voters.voters.clear();
  bad.push_back(no_voters);

  ElectionParams repeated_voter = three_way_params(3);
  repeated_voter.voters[1] = "v0";
  bad.push_back(repeated_voter);

  ElectionParams composite = three_way_params(3);
  composite.group.p = Integer(15);
  composite.group.g = Integer(2);
  bad.push_back(composite);

  ElectionParams unit_generator = three_way_params(3);
  unit_generator.group.g = Integer::One();
  bad.push_back(unit_generator);

  ElectionParams large_generator = three_way_params(3);
  large_generator.group.g = large_generator.group.p;
  bad.push_back(large_generator);

  ElectionParams non_residue_generator = three_way_params(3);
  non_residue_generator.group.g = Integer(5);
  bad.push_back(non_residue_generator);

  ElectionParams composite_order = three_way_params(3);
  composite_order.group.q = composite_order.group.p - 1;
  bad.push_back(composite_order);

  ElectionParams foreign_order = three_way_params(3);
  foreign_order.group.q = Integer(1000003);
  bad.push_back(foreign_order);

  ElectionParams wide_slots = three_way_params(3);
  wide_slots.slot_width = 3;
  bad.push_back(wide_slots);

  ElectionParams narrow_slots = three_way_params(3);
  narrow_slots.slot_width = 1;
  bad.push_back(narrow_slots);

  for (const ElectionParams &params : bad) {
    auto created = ElectionState::Create(params);
    BOOST_CHECK(!created.first);
    BOOST_CHECK_EQUAL(created.second.kind,
                      ElectionErrorKind::InvalidConfiguration);
  }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(election_state_machine)

// 3 candidates, 3 voters voting for 0, 1, 1.
BOOST_AUTO_TEST_CASE(three_voter_scenario) {
  ElectionFixture election(3);

  BOOST_CHECK(election.register_voter(0).ok());
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::Registration);
  BOOST_CHECK(election.register_voter(1).ok());
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::Registration);
  BOOST_CHECK(election.register_voter(2).ok());
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::Voting);

  BOOST_CHECK(election.state->SubmitVote("v0", election.plain_vote(0)).ok());
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::Voting);
  BOOST_CHECK(election.state->SubmitVote("v1", election.plain_vote(1)).ok());
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::Voting);
  BOOST_CHECK(election.state->SubmitVote("v2", election.plain_vote(1)).ok());
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::TallyPending);

  BOOST_CHECK(election.state->ResolveTally(integers({1, 2, 0})).ok());
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::Closed);

  auto winner = election.state->GetWinner();
  BOOST_CHECK(winner.second.ok());
  BOOST_CHECK_EQUAL(winner.first, "c1");

  BOOST_CHECK(election.state->GetCandidateVotes("c0").first == Integer(1));
  BOOST_CHECK(election.state->GetCandidateVotes("c1").first == Integer(2));
  BOOST_CHECK(election.state->GetCandidateVotes("c2").first == Integer::Zero());

  auto result = election.state->GetResult();
  BOOST_REQUIRE(result.second.ok());
  BOOST_CHECK_EQUAL(result.first.size(), 3u);
  BOOST_CHECK(result.first["c1"] == Integer(2));
}

BOOST_AUTO_TEST_CASE(duplicate_public_key_rejected) {
  ElectionFixture election(3);
  BOOST_REQUIRE(election.register_voter(0).ok());

  // v1 proves knowledge of v0's secret under its own identity.
  PublicKeyZKP_Struct stolen = ElectionClient::GeneratePublicKeyZKP(
      election.secrets[0], "v1", election.params.group);
  ElectionStatus status = election.state->SubmitPublicKey("v1", stolen);
  BOOST_CHECK_EQUAL(status.kind, ElectionErrorKind::DuplicateKey);
  BOOST_CHECK_EQUAL(election.state->GetRegistrationCount(), 1u);
  BOOST_CHECK(!election.state->GetPublicKey("v1").second.ok());

  BOOST_CHECK(election.register_voter(1).ok());
  BOOST_CHECK_EQUAL(election.state->GetRegistrationCount(), 2u);
}

BOOST_AUTO_TEST_CASE(tally_during_voting_is_wrong_round) {
  ElectionFixture election(3);
  election.register_all();
  ElectionStatus status = election.state->ResolveTally(integers({0, 0, 0}));
  BOOST_CHECK_EQUAL(status.kind, ElectionErrorKind::WrongRound);
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::Voting);
}

BOOST_AUTO_TEST_CASE(out_of_round_calls_change_nothing) {
  ElectionFixture election(2);

  BOOST_CHECK_EQUAL(
      election.state->SubmitVote("v0", election.plain_vote(0)).kind,
      ElectionErrorKind::WrongRound);
  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({0, 0, 0})).kind,
                    ElectionErrorKind::WrongRound);
  BOOST_CHECK_EQUAL(election.state->GetVoteCount(), 0u);

  election.register_all();
  BOOST_CHECK_EQUAL(election.state->SubmitPublicKey("v0", election.proof(0)).kind,
                    ElectionErrorKind::WrongRound);
  BOOST_CHECK_EQUAL(election.state->GetRegistrationCount(), 2u);

  election.vote_all({2, 2});
  BOOST_CHECK_EQUAL(
      election.state->SubmitVote("v0", election.plain_vote(0)).kind,
      ElectionErrorKind::WrongRound);
  BOOST_CHECK(election.state->ResolveTally(integers({0, 0, 2})).ok());

  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({0, 0, 2})).kind,
                    ElectionErrorKind::WrongRound);
  BOOST_CHECK_EQUAL(
      election.state->SubmitVote("v1", election.plain_vote(0)).kind,
      ElectionErrorKind::WrongRound);
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::Closed);
  BOOST_CHECK_EQUAL(election.state->GetWinner().first, "c2");
}

BOOST_AUTO_TEST_CASE(unauthorized_submissions) {
  ElectionFixture election(2);

  PublicKeyZKP_Struct outsider = ElectionClient::GeneratePublicKeyZKP(
      election.secrets[0], "eve", election.params.group);
  BOOST_CHECK_EQUAL(election.state->SubmitPublicKey("eve", outsider).kind,
                    ElectionErrorKind::Unauthorized);

  BOOST_REQUIRE(election.register_voter(0).ok());
  BOOST_CHECK_EQUAL(election.register_voter(0).kind,
                    ElectionErrorKind::Unauthorized);
  BOOST_CHECK_EQUAL(election.state->GetRegistrationCount(), 1u);

  BOOST_REQUIRE(election.register_voter(1).ok());
  BOOST_CHECK_EQUAL(
      election.state->SubmitVote("eve", election.plain_vote(0)).kind,
      ElectionErrorKind::Unauthorized);
  BOOST_REQUIRE(election.state->SubmitVote("v0", election.plain_vote(0)).ok());
  BOOST_CHECK_EQUAL(
      election.state->SubmitVote("v0", election.plain_vote(1)).kind,
      ElectionErrorKind::Unauthorized);
  BOOST_CHECK_EQUAL(election.state->GetVoteCount(), 1u);

  // The rejected second ballot never reached the aggregate.
  BOOST_REQUIRE(election.state->SubmitVote("v1", election.plain_vote(0)).ok());
  BOOST_CHECK(election.state->ResolveTally(integers({2, 0, 0})).ok());
}

BOOST_AUTO_TEST_CASE(invalid_proofs_rejected) {
  ElectionFixture election(2);

  PublicKeyZKP_Struct forged = election.proof(0);
  forged.r += Integer::One();
  BOOST_CHECK_EQUAL(election.state->SubmitPublicKey("v0", forged).kind,
                    ElectionErrorKind::InvalidProof);

  // v0's proof replayed under v1's identity.
  BOOST_CHECK_EQUAL(
      election.state->SubmitPublicKey("v1", election.proof(0)).kind,
      ElectionErrorKind::InvalidProof);

  BOOST_CHECK_EQUAL(election.state->GetRegistrationCount(), 0u);
  BOOST_CHECK(election.state->GetPublicKeys().empty());

  election.register_all();
  BOOST_CHECK_EQUAL(election.state->SubmitVote("v0", Integer::Zero()).kind,
                    ElectionErrorKind::InvalidProof);
  BOOST_CHECK_EQUAL(
      election.state->SubmitVote("v0", election.params.group.p).kind,
      ElectionErrorKind::InvalidProof);
  BOOST_CHECK_EQUAL(election.state->GetVoteCount(), 0u);
}

BOOST_AUTO_TEST_CASE(tally_mismatch_keeps_election_open) {
  ElectionFixture election(3);
  election.register_all();
  election.vote_all({0, 1, 1});

  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({2, 1, 0})).kind,
                    ElectionErrorKind::TallyMismatch);
  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({1, 3, 0})).kind,
                    ElectionErrorKind::TallyMismatch);
  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({1, 2})).kind,
                    ElectionErrorKind::TallyMismatch);
  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({1, 2, 0, 0})).kind,
                    ElectionErrorKind::TallyMismatch);
  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({1, 2, -1})).kind,
                    ElectionErrorKind::TallyMismatch);
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::TallyPending);

  BOOST_CHECK(election.state->ResolveTally(integers({1, 2, 0})).ok());
}

BOOST_AUTO_TEST_CASE(queries_before_and_after_close) {
  ElectionFixture election(2);
  BOOST_CHECK_EQUAL(election.state->GetWinner().second.kind,
                    ElectionErrorKind::NotYetFinalized);
  BOOST_CHECK_EQUAL(election.state->GetCandidateVotes("c0").second.kind,
                    ElectionErrorKind::NotYetFinalized);
  BOOST_CHECK_EQUAL(election.state->GetResult().second.kind,
                    ElectionErrorKind::NotYetFinalized);
  BOOST_CHECK_EQUAL(election.state->GetReconstructedKey("v0").second.kind,
                    ElectionErrorKind::WrongRound);
  BOOST_CHECK_EQUAL(election.state->GetAggregate().second.kind,
                    ElectionErrorKind::WrongRound);
  BOOST_CHECK_EQUAL(election.state->GetPublicKey("v0").second.kind,
                    ElectionErrorKind::Unauthorized);

  election.register_all();
  BOOST_CHECK(election.state->GetPublicKey("v0").second.ok());
  BOOST_CHECK_EQUAL(election.state->GetPublicKeys().size(), 2u);
  BOOST_CHECK_EQUAL(election.state->GetReconstructedKey("eve").second.kind,
                    ElectionErrorKind::Unauthorized);
  BOOST_CHECK_EQUAL(election.state->GetAggregate().second.kind,
                    ElectionErrorKind::WrongRound);

  election.vote_all({1, 2});
  auto aggregate = election.state->GetAggregate();
  BOOST_REQUIRE(aggregate.second.ok());
  BOOST_CHECK(aggregate.first ==
              FieldArithmetic::Multiply(election.plain_vote(1),
                                        election.plain_vote(2),
                                        election.params.group.p));

  BOOST_REQUIRE(election.state->ResolveTally(integers({0, 1, 1})).ok());
  BOOST_CHECK_EQUAL(election.state->GetCandidateVotes("c9").second.kind,
                    ElectionErrorKind::UnknownCandidate);
}

BOOST_AUTO_TEST_CASE(tie_goes_to_earliest_candidate) {
  ElectionFixture election(4);
  election.register_all();
  election.vote_all({2, 1, 1, 2});
  BOOST_REQUIRE(election.state->ResolveTally(integers({0, 2, 2})).ok());
  BOOST_CHECK_EQUAL(election.state->GetWinner().first, "c1");
}

// With m = 2 a count of 4 in one slot equals one vote in the next, so [5,1,0]
// and [9,0,0] both rebuild g^9. Only vectors accounting for exactly the three
// ballots cast are checked against the aggregate.
BOOST_AUTO_TEST_CASE(aliased_tally_rejected) {
  ElectionFixture election(3);
  election.register_all();
  election.vote_all({0, 1, 1});

  BOOST_REQUIRE(ElectionClient::VerifyTally(
      election.state->GetAggregate().first, integers({5, 1, 0}), 2,
      election.params.group));
  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({5, 1, 0})).kind,
                    ElectionErrorKind::TallyMismatch);
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::TallyPending);
  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({9, 0, 0})).kind,
                    ElectionErrorKind::TallyMismatch);
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::TallyPending);

  BOOST_CHECK(election.state->ResolveTally(integers({1, 2, 0})).ok());
  BOOST_CHECK_EQUAL(election.state->GetWinner().first, "c1");
}

// Without membership proofs a voter can cast g^0; counts that leave those
// ballots unaccounted for are refused.
BOOST_AUTO_TEST_CASE(empty_ballots_cannot_close_with_zero_counts) {
  ElectionFixture election(2);
  election.register_all();
  BOOST_REQUIRE(election.state->SubmitVote("v0", Integer::One()).ok());
  BOOST_REQUIRE(election.state->SubmitVote("v1", Integer::One()).ok());
  BOOST_CHECK_EQUAL(election.state->ResolveTally(integers({0, 0, 0})).kind,
                    ElectionErrorKind::TallyMismatch);
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::TallyPending);
  BOOST_CHECK_EQUAL(election.state->GetWinner().second.kind,
                    ElectionErrorKind::NotYetFinalized);
}

BOOST_AUTO_TEST_CASE(blinded_two_round_election) {
  ElectionFixture election(5);
  election.register_all();

  std::vector<size_t> slots = {1, 0, 2, 1, 1};
  for (size_t i = 0; i < slots.size(); i++) {
    BOOST_REQUIRE(election.state
                      ->SubmitVote(election.voter(i),
                                   election.blinded_vote(i, slots[i]))
                      .ok());
  }
  auto aggregate = election.state->GetAggregate();
  BOOST_REQUIRE(aggregate.second.ok());

  auto found = ElectionClient::SearchTally(aggregate.first, 3, 5, 2,
                                           election.params.group);
  BOOST_REQUIRE(found.second);
  BOOST_CHECK(election.state->ResolveTally(found.first).ok());
  BOOST_CHECK(election.state->GetCandidateVotes("c1").first == Integer(3));
  BOOST_CHECK_EQUAL(election.state->GetWinner().first, "c1");
}

BOOST_AUTO_TEST_CASE(concurrent_registrations_serialize) {
  ElectionFixture election(8);
  std::vector<PublicKeyZKP_Struct> proofs;
  for (size_t i = 0; i < 8; i++) {
    proofs.push_back(election.proof(i));
  }

  std::vector<ElectionStatus> statuses(8);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < 8; i++) {
    threads.push_back(std::thread([&election, &proofs, &statuses, i]() {
      statuses[i] = election.state->SubmitPublicKey(election.params.voters[i],
                                                    proofs[i]);
    }));
  }
  for (std::thread &thread : threads) {
    thread.join();
  }

  for (const ElectionStatus &status : statuses) {
    BOOST_CHECK(status.ok());
  }
  BOOST_CHECK_EQUAL(election.state->GetRegistrationCount(), 8u);
  BOOST_CHECK_EQUAL(election.state->GetRound(), ElectionRound::Voting);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(hardened_election)

BOOST_AUTO_TEST_CASE(ballot_without_proof_rejected) {
  ElectionFixture election(2, true);
  BOOST_CHECK(election.state->RequiresVoteProof());
  election.register_all();
  BOOST_CHECK_EQUAL(
      election.state->SubmitVote("v0", election.blinded_vote(0, 1)).kind,
      ElectionErrorKind::InvalidProof);
  BOOST_CHECK_EQUAL(election.state->GetVoteCount(), 0u);
}

BOOST_AUTO_TEST_CASE(proof_for_another_voter_rejected) {
  ElectionFixture election(2, true);
  election.register_all();
  Integer vote = election.blinded_vote(0, 1);
  VoteZKP_Struct zkp = election.vote_proof(0, vote, 1);
  BOOST_CHECK_EQUAL(election.state->SubmitVote("v1", vote, zkp).kind,
                    ElectionErrorKind::InvalidProof);
  BOOST_CHECK(election.state->SubmitVote("v0", vote, zkp).ok());
}

BOOST_AUTO_TEST_CASE(proven_ballots_close_the_election) {
  ElectionFixture election(3, true);
  election.register_all();

  std::vector<size_t> slots = {2, 2, 0};
  for (size_t i = 0; i < slots.size(); i++) {
    Integer vote = election.blinded_vote(i, slots[i]);
    VoteZKP_Struct zkp = election.vote_proof(i, vote, slots[i]);
    BOOST_REQUIRE(
        election.state->SubmitVote(election.voter(i), vote, zkp).ok());
  }
  BOOST_REQUIRE(election.state->ResolveTally(integers({1, 0, 2})).ok());
  BOOST_CHECK_EQUAL(election.state->GetWinner().first, "c2");
}

// (p-1) * V with all-even branch challenges satisfies every proof equation;
// the ballot lies outside <g> and would leave the aggregate untallyable.
BOOST_AUTO_TEST_CASE(negated_ballot_rejected) {
  ElectionFixture election(2, true);
  election.register_all();
  Integer negated = FieldArithmetic::Multiply(election.params.group.p - 1,
                                              election.blinded_vote(0, 1),
                                              election.params.group.p);
  VoteZKP_Struct zkp;
  bool all_even = false;
  for (int attempt = 0; attempt < 256 && !all_even; attempt++) {
    zkp = election.vote_proof(0, negated, 1);
    all_even = true;
    for (const Integer &c : zkp.c) {
      all_even = all_even && c.IsEven();
    }
  }
  BOOST_REQUIRE(all_even);
  BOOST_CHECK_EQUAL(election.state->SubmitVote("v0", negated, zkp).kind,
                    ElectionErrorKind::InvalidProof);
  BOOST_CHECK_EQUAL(election.state->GetVoteCount(), 0u);
  BOOST_CHECK(election.state->GetAggregate().second.kind ==
              ElectionErrorKind::WrongRound);

  Integer vote = election.blinded_vote(0, 1);
  BOOST_CHECK(
      election.state->SubmitVote("v0", vote, election.vote_proof(0, vote, 1))
          .ok());
}

BOOST_AUTO_TEST_SUITE_END()
