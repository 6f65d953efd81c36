#pragma once

#include <iostream>
#include <string>
#include <vector>

#include <crypto++/integer.h>

#include "boost/property_tree/json_parser.hpp"
#include "boost/property_tree/ptree.hpp"

template <typename T>
std::vector<T> as_vector(boost::property_tree::ptree const &pt,
                         boost::property_tree::ptree::key_type const &key);

struct ElectionConfig {
  std::string db_path;
  std::string log_level;
  std::vector<std::string> candidates;
  std::vector<std::string> voters;
  CryptoPP::Integer p;
  CryptoPP::Integer q;
  CryptoPP::Integer g;
  int slot_width; // 0 means derive from the candidate count
  bool require_vote_proof;
};
ElectionConfig load_election_config(std::string filename);

struct VoterConfig {
  std::string voter_id;
  std::string voter_secret_key_path;
  std::string voter_public_key_path;
};
VoterConfig load_voter_config(std::string filename);
