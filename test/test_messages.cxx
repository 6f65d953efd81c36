#include <stdexcept>

#include <boost/test/unit_test.hpp>

#include "../include-shared/messages.hpp"
#include "test_helpers.hpp"

using CryptoPP::Integer;

BOOST_AUTO_TEST_SUITE(messages)

BOOST_AUTO_TEST_CASE(registration_message) {
  GroupParams group = test_group();
  auto keys = ElectionClient::GenerateKeyPair(group);

  VoterToCoordinator_Register_Message sent;
  sent.voter_id = "v0";
  sent.zkp = ElectionClient::GeneratePublicKeyZKP(keys.first, "v0", group);
  std::vector<unsigned char> data;
  sent.serialize(data);
  BOOST_CHECK_EQUAL(get_message_type(data),
                    MessageType::VoterToCoordinator_Register_Message);

  VoterToCoordinator_Register_Message received;
  BOOST_CHECK_EQUAL(received.deserialize(data), (int)data.size());
  BOOST_CHECK_EQUAL(received.voter_id, "v0");
  BOOST_CHECK(ElectionClient::VerifyPublicKeyZKP(received.zkp, "v0", group));
}

BOOST_AUTO_TEST_CASE(ballot_with_and_without_proof) {
  VoterToCoordinator_Vote_Message plain;
  plain.voter_id = "v1";
  plain.vote = Integer(12345);
  std::vector<unsigned char> plain_data;
  plain.serialize(plain_data);

  VoterToCoordinator_Vote_Message plain_received;
  plain_received.deserialize(plain_data);
  BOOST_CHECK(!plain_received.has_zkp);
  BOOST_CHECK(plain_received.vote == Integer(12345));

  VoterToCoordinator_Vote_Message proven = plain;
  proven.has_zkp = true;
  proven.zkp.a = integers({1, 2});
  proven.zkp.b = integers({3, 4});
  proven.zkp.c = integers({5, 6});
  proven.zkp.r = integers({7, 8});
  std::vector<unsigned char> proven_data;
  proven.serialize(proven_data);
  BOOST_CHECK(proven_data.size() > plain_data.size());

  VoterToCoordinator_Vote_Message proven_received;
  BOOST_CHECK_EQUAL(proven_received.deserialize(proven_data),
                    (int)proven_data.size());
  BOOST_CHECK(proven_received.has_zkp);
  BOOST_CHECK(proven_received.zkp.b == integers({3, 4}));
  BOOST_CHECK(proven_received.zkp.r == integers({7, 8}));
}

BOOST_AUTO_TEST_CASE(large_and_negative_integers_survive) {
  CoordinatorToWorld_Tally_Message sent;
  sent.counts.push_back(test_group().p);
  sent.counts.push_back(Integer(-7));
  sent.counts.push_back(Integer::Zero());
  std::vector<unsigned char> data;
  sent.serialize(data);

  CoordinatorToWorld_Tally_Message received;
  received.deserialize(data);
  BOOST_CHECK(received.counts == sent.counts);
}

BOOST_AUTO_TEST_CASE(truncated_message_throws) {
  VoterToCoordinator_Vote_Message sent;
  sent.voter_id = "v2";
  sent.vote = Integer(99);
  std::vector<unsigned char> data;
  sent.serialize(data);
  data.resize(data.size() - 1);

  VoterToCoordinator_Vote_Message received;
  BOOST_CHECK_THROW(received.deserialize(data), std::runtime_error);

  std::vector<unsigned char> empty;
  BOOST_CHECK_THROW(received.deserialize(empty), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(wrong_message_type_throws) {
  CoordinatorToWorld_Tally_Message tally;
  tally.counts = integers({1, 2, 3});
  std::vector<unsigned char> data;
  tally.serialize(data);

  VoterToCoordinator_Register_Message registration;
  BOOST_CHECK_THROW(registration.deserialize(data), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
