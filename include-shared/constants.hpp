#pragma once

#include <crypto++/integer.h>

// 2048-bit MODP group with a 256-bit prime order subgroup (RFC 5114 2.3).
// Used whenever an election config does not name its own group.
const CryptoPP::Integer DL_P = CryptoPP::Integer(
    "0x87A8E61DB4B6663CFFBBD19C651959998CEEF608660DD0F25D2CEED4435E3B00E00DF8"
    "F1D61957D4FAF7DF4561B2AA3016C3D91134096FAA3BF4296D830E9A7C209E0C6497517A"
    "BD5A8A9D306BCF67ED91F9E6725B4758C022E0B1EF4275BF7B6C5BFC11D45F9088B941F5"
    "4EB1E59BB8BC39A0BF12307F5C4FDB70C581B23F76B63ACAE1CAA6B7902D52526735488A"
    "0EF13C6D9A51BFA4AB3AD8347796524D8EF6A167B5A41825D967E144E5140564251CCACB"
    "83E6B486F6B3CA3F7971506026C0B857F689962856DED4010ABD0BE621C3A3960A54E710"
    "C375F26375D7014103A4B54330C198AF126116D2276E11715F693877FAD7EF09CADB094A"
    "E91E1A1597");
const CryptoPP::Integer DL_Q = CryptoPP::Integer(
    "0x8CF83642A709A097B447997640129DA299B1A47D1EB3750BA308B0FE64F5FBD3");
const CryptoPP::Integer DL_G = CryptoPP::Integer(
    "0x3FB32C9B73134D0B2E77506660EDBD484CA7B18F21EF205407F4793A1A0BA12510DBC1"
    "5077BE463FFF4FED4AAC0BB555BE3A6C1B0C6B47B1BC3773BF7E8C6F62901228F8C28CBB"
    "18A55AE31341000A650196F931C77A57F2DDF463E5E9EC144B777DE62AAAB8A8628AC376"
    "D282D6ED3864E67982428EBC831D14348F6F2F9193B5045AF2767164E1DFC967C1FB3F2E"
    "55A4BD1BFFE83B9C80D052B985D182EA0ADB2A3B7313D3FE14C8484B1E052588B9B7D2BB"
    "D2DF016199ECD06E1557CD0915B3353BBB64E0EC377FD028370DF92B52C7891428CDC67E"
    "B6184B523D1DB246C32F63078490F00EF8D647D148D47954515E2327CFEF98C582664B4C"
    "0F6CC41659");

// Bit length of Fiat-Shamir challenges (SHA-256 output).
const int CHALLENGE_BITS = 256;

// Upper bound on count vectors tried by the bounded tally search.
const unsigned long DEFAULT_TALLY_SEARCH_STEPS = 1000000;
