#pragma once

#include <cstdint>

// Schema type: verification outcome.
// `degraded` is set only when the note was located by the fallback search.
namespace notary::schema {

template <uint16_t Version>
struct verification_outcome;

template <>
struct verification_outcome<1> final {
  uint16_t version{1};
  bool verified{false};
  bool fingerprint_matched{false};
  bool note_found{false};
  bool confirmed{false};
  bool degraded{false};
};

using verification_outcome_t = verification_outcome<1>;

}  // namespace notary::schema
