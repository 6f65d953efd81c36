#include "../../include/pkg/status.hpp"

std::string error_kind_to_string(ElectionErrorKind::T kind) {
  switch (kind) {
  case ElectionErrorKind::OK:
    return "OK";
  case ElectionErrorKind::InvalidConfiguration:
    return "InvalidConfiguration";
  case ElectionErrorKind::Unauthorized:
    return "Unauthorized";
  case ElectionErrorKind::WrongRound:
    return "WrongRound";
  case ElectionErrorKind::InvalidProof:
    return "InvalidProof";
  case ElectionErrorKind::DuplicateKey:
    return "DuplicateKey";
  case ElectionErrorKind::TallyMismatch:
    return "TallyMismatch";
  case ElectionErrorKind::NotYetFinalized:
    return "NotYetFinalized";
  case ElectionErrorKind::UnknownCandidate:
    return "UnknownCandidate";
  case ElectionErrorKind::NoWinner:
    return "NoWinner";
  case ElectionErrorKind::TranscriptError:
    return "TranscriptError";
  }
  return "Unknown";
}

std::string ElectionStatus::to_string() const {
  if (this->ok()) {
    return "OK";
  }
  return error_kind_to_string(this->kind) + ": " + this->reason;
}

ElectionStatus ElectionStatus::Ok() { return ElectionStatus(); }

ElectionStatus ElectionStatus::Error(ElectionErrorKind::T kind,
                                     std::string reason) {
  ElectionStatus status;
  status.kind = kind;
  status.reason = reason;
  return status;
}
