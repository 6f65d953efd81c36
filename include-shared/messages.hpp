#pragma once

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <crypto++/cryptlib.h>
#include <crypto++/integer.h>

// ================================================
// MESSAGE TYPES
// ================================================

namespace MessageType {
enum T {
  PublicKeyZKP_Struct = 1,
  VoteZKP_Struct = 2,
  VoterToCoordinator_Register_Message = 3,
  VoterToCoordinator_Vote_Message = 4,
  CoordinatorToWorld_Tally_Message = 5,
};
};
MessageType::T get_message_type(std::vector<unsigned char> &data);

// ================================================
// SERIALIZABLE
// ================================================

struct Serializable {
  virtual ~Serializable() {}
  virtual void serialize(std::vector<unsigned char> &data) = 0;
  virtual int deserialize(std::vector<unsigned char> &data) = 0;
};

// serializers.
int put_bool(bool b, std::vector<unsigned char> &data);
int put_string(std::string s, std::vector<unsigned char> &data);
int put_integer(CryptoPP::Integer i, std::vector<unsigned char> &data);
int put_integers(const std::vector<CryptoPP::Integer> &v,
                 std::vector<unsigned char> &data);

// deserializers; all throw std::runtime_error on truncated input.
int get_bool(bool *b, std::vector<unsigned char> &data, int idx);
int get_string(std::string *s, std::vector<unsigned char> &data, int idx);
int get_integer(CryptoPP::Integer *i, std::vector<unsigned char> &data,
                int idx);
int get_integers(std::vector<CryptoPP::Integer> *v,
                 std::vector<unsigned char> &data, int idx);

// ================================================
// PROOFS
// ================================================

// Schnorr proof of knowledge of x for pk = g^x:
// (pk, gv, r) = (g^x, g^v, v - x*c mod q), c = H(g, gv, pk, voter_id)
struct PublicKeyZKP_Struct : public Serializable {
  CryptoPP::Integer pk;
  CryptoPP::Integer gv;
  CryptoPP::Integer r;

  void serialize(std::vector<unsigned char> &data);
  int deserialize(std::vector<unsigned char> &data);
};

// 1-of-K proof that a ballot V = Y^x * g^(2^(k*m)) for some slot k.
// Branch k holds (a_k, b_k, c_k, r_k) with
//   a_k = g^r_k * pk^c_k and b_k = Y^r_k * (V / g^(2^(k*m)))^c_k.
struct VoteZKP_Struct : public Serializable {
  std::vector<CryptoPP::Integer> a;
  std::vector<CryptoPP::Integer> b;
  std::vector<CryptoPP::Integer> c;
  std::vector<CryptoPP::Integer> r;

  void serialize(std::vector<unsigned char> &data);
  int deserialize(std::vector<unsigned char> &data);
};

// ================================================
// VOTER <==> COORDINATOR
// ================================================

struct VoterToCoordinator_Register_Message : public Serializable {
  std::string voter_id;
  PublicKeyZKP_Struct zkp;

  void serialize(std::vector<unsigned char> &data);
  int deserialize(std::vector<unsigned char> &data);
};

struct VoterToCoordinator_Vote_Message : public Serializable {
  std::string voter_id;
  CryptoPP::Integer vote;
  bool has_zkp = false;
  VoteZKP_Struct zkp;

  void serialize(std::vector<unsigned char> &data);
  int deserialize(std::vector<unsigned char> &data);
};

// ================================================
// COORDINATOR <==> WORLD
// ================================================

struct CoordinatorToWorld_Tally_Message : public Serializable {
  std::vector<CryptoPP::Integer> counts;

  void serialize(std::vector<unsigned char> &data);
  int deserialize(std::vector<unsigned char> &data);
};
