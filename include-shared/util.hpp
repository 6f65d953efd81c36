#pragma once

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <crypto++/cryptlib.h>
#include <crypto++/filters.h>
#include <crypto++/integer.h>
#include <crypto++/misc.h>
#include <crypto++/sha.h>

// String <=> Vec<char>.
std::string chvec2str(std::vector<unsigned char> data);
std::vector<unsigned char> str2chvec(std::string s);

// SecByteBlock <=> Integer.
CryptoPP::Integer byteblock_to_integer(CryptoPP::SecByteBlock block);

// Integer <=> string.
std::string integer_to_string(CryptoPP::Integer x);
CryptoPP::Integer string_to_integer(const std::string &s);

// Splitter.
std::vector<std::string> string_split(std::string str, char delimiter);

// Hashers. Every field is length-prefixed before hashing.
CryptoPP::Integer hash_pk_zkp(CryptoPP::Integer g, CryptoPP::Integer gv,
                              CryptoPP::Integer pk, std::string voter_id);

CryptoPP::Integer hash_vote_zkp(std::string voter_id, CryptoPP::Integer pk,
                                CryptoPP::Integer y, CryptoPP::Integer vote,
                                const std::vector<CryptoPP::Integer> &a,
                                const std::vector<CryptoPP::Integer> &b);
