#pragma once

#include <cstddef>

#include <crypto++/integer.h>
#include <crypto++/nbtheory.h>

// Prime modulus p, generator g and the prime order q of the subgroup g
// generates. Ballots, keys and proof commitments all live in that subgroup.
struct GroupParams {
  CryptoPP::Integer p;
  CryptoPP::Integer q;
  CryptoPP::Integer g;
};

class FieldArithmetic {
public:
  static CryptoPP::Integer Power(CryptoPP::Integer base,
                                 CryptoPP::Integer exponent,
                                 CryptoPP::Integer modulus);
  static CryptoPP::Integer Multiply(CryptoPP::Integer a, CryptoPP::Integer b,
                                    CryptoPP::Integer modulus);
  static CryptoPP::Integer Add(CryptoPP::Integer a, CryptoPP::Integer b,
                               CryptoPP::Integer modulus);
  static CryptoPP::Integer Inverse(CryptoPP::Integer a,
                                   CryptoPP::Integer modulus);
  static CryptoPP::Integer Divide(CryptoPP::Integer a, CryptoPP::Integer b,
                                  CryptoPP::Integer modulus);

  static CryptoPP::Integer GroupOrder(const GroupParams &group);
  static bool IsGroupElement(CryptoPP::Integer x, const GroupParams &group);

  static int SlotWidth(size_t candidate_count);
  static bool IsValidSlotWidth(int slot_width, size_t candidate_count);
  static CryptoPP::Integer SlotValue(size_t slot, int slot_width);
};
