#include <cctype>
#include <sstream>

#include "../include-shared/messages.hpp"
#include "../include-shared/util.hpp"

namespace {
/**
 * SHA-256 over the given transcript, read as an unsigned big-endian integer.
 */
CryptoPP::Integer hash_transcript(const std::vector<unsigned char> &data) {
  CryptoPP::SHA256 hash;
  CryptoPP::SecByteBlock digest(CryptoPP::SHA256::DIGESTSIZE);
  hash.CalculateDigest(digest.BytePtr(), data.data(), data.size());
  return byteblock_to_integer(digest);
}
} // namespace

/**
 * Convert char vec to string.
 */
std::string chvec2str(std::vector<unsigned char> data) {
  std::string s(data.begin(), data.end());
  return s;
}

/**
 * Convert string to char vec.
 */
std::vector<unsigned char> str2chvec(std::string s) {
  std::vector<unsigned char> v(s.begin(), s.end());
  return v;
}

/**
 * Converts a byte block into an integer.
 */
CryptoPP::Integer byteblock_to_integer(CryptoPP::SecByteBlock block) {
  return CryptoPP::Integer(block, block.size());
}

/**
 * Converts an integer to a string
 * Example: 123 -> "123"
 */
std::string integer_to_string(CryptoPP::Integer x) {
  return CryptoPP::IntToString(x);
}

/**
 * Converts a string to an integer. Accepts decimal or 0x-prefixed hex.
 * Example: "123" -> 123
 */
CryptoPP::Integer string_to_integer(const std::string &s) {
  if (s.empty()) {
    throw std::runtime_error("Cannot parse an empty integer");
  }
  size_t start = (s[0] == '-') ? 1 : 0;
  bool hex = s.size() > start + 2 && s[start] == '0' &&
             (s[start + 1] == 'x' || s[start + 1] == 'X');
  for (size_t i = hex ? start + 2 : start; i < s.size(); i++) {
    bool ok = hex ? std::isxdigit(static_cast<unsigned char>(s[i]))
                  : std::isdigit(static_cast<unsigned char>(s[i]));
    if (!ok) {
      throw std::runtime_error("Not an integer: " + s);
    }
  }
  if (start == s.size() || (hex && s.size() == start + 2)) {
    throw std::runtime_error("Not an integer: " + s);
  }
  return CryptoPP::Integer(s.c_str());
}

/**
 * Split a string.
 */
std::vector<std::string> string_split(std::string str, char delimiter) {
  std::vector<std::string> result;
  // construct a stream from the string
  std::stringstream ss(str);
  std::string s;
  while (std::getline(ss, s, delimiter)) {
    if (!s.empty()) {
      result.push_back(s);
    }
  }
  return result;
}

/**
 * Hash the public key proof transcript (g, g^v, pk, voter id).
 */
CryptoPP::Integer hash_pk_zkp(CryptoPP::Integer g, CryptoPP::Integer gv,
                              CryptoPP::Integer pk, std::string voter_id) {
  std::vector<unsigned char> data;
  put_integer(g, data);
  put_integer(gv, data);
  put_integer(pk, data);
  put_string(voter_id, data);
  return hash_transcript(data);
}

/**
 * Hash the ballot membership proof transcript.
 */
CryptoPP::Integer hash_vote_zkp(std::string voter_id, CryptoPP::Integer pk,
                                CryptoPP::Integer y, CryptoPP::Integer vote,
                                const std::vector<CryptoPP::Integer> &a,
                                const std::vector<CryptoPP::Integer> &b) {
  std::vector<unsigned char> data;
  put_string(voter_id, data);
  put_integer(pk, data);
  put_integer(y, data);
  put_integer(vote, data);
  for (size_t i = 0; i < a.size() && i < b.size(); i++) {
    put_integer(a[i], data);
    put_integer(b[i], data);
  }
  return hash_transcript(data);
}
