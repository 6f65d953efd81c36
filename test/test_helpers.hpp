#pragma once

#include <initializer_list>
#include <string>
#include <vector>

#include <crypto++/integer.h>

#include "../include/pkg/arithmetic.hpp"
#include "../include/pkg/election.hpp"
#include "../include/pkg/election_state.hpp"

// p = 2^127 - 2721 is a safe prime, p = 2q + 1 with q prime. 4 is a square,
// so it generates the order-q subgroup.
inline GroupParams test_group() {
  GroupParams group;
  group.p = CryptoPP::Integer::Power2(127) - CryptoPP::Integer(2721);
  group.q = (group.p - CryptoPP::Integer::One()) / CryptoPP::Integer(2);
  group.g = CryptoPP::Integer(4);
  return group;
}

inline std::vector<CryptoPP::Integer> integers(std::initializer_list<long> xs) {
  std::vector<CryptoPP::Integer> res;
  for (long x : xs) {
    res.push_back(CryptoPP::Integer(x));
  }
  return res;
}

inline std::vector<std::string> names(const std::string &prefix, size_t n) {
  std::vector<std::string> res;
  for (size_t i = 0; i < n; i++) {
    res.push_back(prefix + std::to_string(i));
  }
  return res;
}

// Three candidates (m = 2) and `voters` voters over the test group.
inline ElectionParams three_way_params(size_t voters) {
  ElectionParams params;
  params.candidates = names("c", 3);
  params.voters = names("v", voters);
  params.group = test_group();
  params.slot_width = 2;
  return params;
}
