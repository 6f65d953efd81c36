#pragma once

#include <string>

// ================================================
// ERROR KINDS
// ================================================

namespace ElectionErrorKind {
enum T {
  OK = 0,
  InvalidConfiguration = 1,
  Unauthorized = 2,
  WrongRound = 3,
  InvalidProof = 4,
  DuplicateKey = 5,
  TallyMismatch = 6,
  NotYetFinalized = 7,
  UnknownCandidate = 8,
  NoWinner = 9,
  TranscriptError = 10,
};
};
std::string error_kind_to_string(ElectionErrorKind::T kind);

// Outcome of an engine operation: the error kind plus a readable reason.
struct ElectionStatus {
  ElectionErrorKind::T kind = ElectionErrorKind::OK;
  std::string reason;

  bool ok() const { return kind == ElectionErrorKind::OK; }
  std::string to_string() const;

  static ElectionStatus Ok();
  static ElectionStatus Error(ElectionErrorKind::T kind, std::string reason);
};
