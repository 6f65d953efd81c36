#include <stdexcept>

#include "../../include/pkg/arithmetic.hpp"

/**
 * base^exponent mod modulus by square-and-multiply. Returns 0 for modulus 1.
 */
CryptoPP::Integer FieldArithmetic::Power(CryptoPP::Integer base,
                                         CryptoPP::Integer exponent,
                                         CryptoPP::Integer modulus) {
  if (!modulus.IsPositive()) {
    throw std::invalid_argument("FieldArithmetic::Power: modulus must be >= 1");
  }
  if (exponent.IsNegative()) {
    throw std::invalid_argument(
        "FieldArithmetic::Power: exponent must be non-negative");
  }
  if (modulus == CryptoPP::Integer::One()) {
    return CryptoPP::Integer::Zero();
  }
  return a_exp_b_mod_c(base % modulus, exponent, modulus);
}

/**
 * a * b mod modulus.
 */
CryptoPP::Integer FieldArithmetic::Multiply(CryptoPP::Integer a,
                                            CryptoPP::Integer b,
                                            CryptoPP::Integer modulus) {
  if (!modulus.IsPositive()) {
    throw std::invalid_argument(
        "FieldArithmetic::Multiply: modulus must be >= 1");
  }
  return a_times_b_mod_c(a % modulus, b % modulus, modulus);
}

/**
 * a + b mod modulus.
 */
CryptoPP::Integer FieldArithmetic::Add(CryptoPP::Integer a, CryptoPP::Integer b,
                                       CryptoPP::Integer modulus) {
  if (!modulus.IsPositive()) {
    throw std::invalid_argument("FieldArithmetic::Add: modulus must be >= 1");
  }
  return (a % modulus + b % modulus) % modulus;
}

/**
 * a^-1 mod modulus; throws if a has no inverse.
 */
CryptoPP::Integer FieldArithmetic::Inverse(CryptoPP::Integer a,
                                           CryptoPP::Integer modulus) {
  CryptoPP::Integer reduced = a % modulus;
  if (reduced.IsZero() || CryptoPP::GCD(reduced, modulus) != 1) {
    throw std::invalid_argument("FieldArithmetic::Inverse: not invertible");
  }
  return CryptoPP::EuclideanMultiplicativeInverse(reduced, modulus);
}

/**
 * a / b mod modulus.
 */
CryptoPP::Integer FieldArithmetic::Divide(CryptoPP::Integer a,
                                          CryptoPP::Integer b,
                                          CryptoPP::Integer modulus) {
  return Multiply(a, Inverse(b, modulus), modulus);
}

/**
 * Order of the subgroup generated by g; exponents are reduced by this.
 */
CryptoPP::Integer FieldArithmetic::GroupOrder(const GroupParams &group) {
  return group.q;
}

/**
 * True iff 1 <= x < p and x lies in the order-q subgroup.
 */
bool FieldArithmetic::IsGroupElement(CryptoPP::Integer x,
                                     const GroupParams &group) {
  if (x < CryptoPP::Integer::One() || x >= group.p) {
    return false;
  }
  return Power(x, group.q, group.p) == CryptoPP::Integer::One();
}

/**
 * Minimal m with 2^m > candidate_count >= 2^(m-1).
 */
int FieldArithmetic::SlotWidth(size_t candidate_count) {
  int m = 0;
  while (candidate_count >> m) {
    m++;
  }
  return m;
}

bool FieldArithmetic::IsValidSlotWidth(int slot_width,
                                       size_t candidate_count) {
  return candidate_count > 0 && slot_width >= 1 &&
         slot_width == SlotWidth(candidate_count);
}

/**
 * 2^(slot * slot_width): the exponent a single vote for `slot` contributes.
 */
CryptoPP::Integer FieldArithmetic::SlotValue(size_t slot, int slot_width) {
  return CryptoPP::Integer::Power2(slot * slot_width);
}
