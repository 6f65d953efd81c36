#include <fstream>
#include <stdexcept>

#include "../include-shared/config.hpp"
#include "../include-shared/constants.hpp"
#include "../include-shared/util.hpp"

#include "boost/property_tree/json_parser.hpp"
#include "boost/property_tree/ptree.hpp"

// Helper function to load vector
// https://stackoverflow.com/questions/23481262/using-boost-property-tree-to-read-int-array
template <typename T>
std::vector<T> as_vector(boost::property_tree::ptree const &pt,
                         boost::property_tree::ptree::key_type const &key) {
  std::vector<T> r;
  for (auto &item : pt.get_child(key))
    r.push_back(item.second.get_value<T>());
  return r;
}

namespace {
/**
 * Open and parse a JSON file.
 */
boost::property_tree::ptree read_json_file(const std::string &filename) {
  std::ifstream jsonFile(filename);
  if (!jsonFile) {
    std::cerr << "File not found: " << filename << std::endl;
    throw std::runtime_error("Invalid file path: " + filename);
  }
  boost::property_tree::ptree root;
  boost::property_tree::read_json(jsonFile, root);
  return root;
}
} // namespace

/**
 * Load election config. Group parameters default to the RFC 5114 group. A
 * custom p without q is taken to be a safe prime, q = (p - 1) / 2.
 */
ElectionConfig load_election_config(std::string filename) {
  boost::property_tree::ptree root = read_json_file(filename);

  ElectionConfig config;
  config.db_path = root.get<std::string>("db_path", "election.db");
  config.log_level = root.get<std::string>("log_level", "info");
  config.candidates = as_vector<std::string>(root, "candidates");
  config.voters = as_vector<std::string>(root, "voters");

  std::string p = root.get<std::string>("p", "");
  std::string q = root.get<std::string>("q", "");
  std::string g = root.get<std::string>("g", "");
  config.p = p.empty() ? DL_P : string_to_integer(p);
  config.g = g.empty() ? DL_G : string_to_integer(g);
  if (!q.empty()) {
    config.q = string_to_integer(q);
  } else if (p.empty()) {
    config.q = DL_Q;
  } else {
    config.q = (config.p - CryptoPP::Integer::One()) / CryptoPP::Integer(2);
  }

  config.slot_width = root.get<int>("slot_width", 0);
  config.require_vote_proof = root.get<bool>("require_vote_proof", false);

  return config;
}

/**
 * Load voter config.
 */
VoterConfig load_voter_config(std::string filename) {
  boost::property_tree::ptree root = read_json_file(filename);

  VoterConfig config;
  config.voter_id = root.get<std::string>("voter_id", "");
  config.voter_secret_key_path =
      root.get<std::string>("voter_secret_key_path", "");
  config.voter_public_key_path =
      root.get<std::string>("voter_public_key_path", "");

  return config;
}
