#pragma once

#include <notary/schema/note_metadata.hpp>
#include <notary/schema/primitives.hpp>

#include <string>
#include <string_view>

namespace notary::service {

inline constexpr auto kNoteKind = std::string_view{"HEALTH_DATA"};
inline constexpr auto kNoteSeparator = std::string_view{"|||"};
inline constexpr auto kLegacyNoteSeparator = std::string_view{"|"};
inline constexpr auto kLegacyNotePrefix = std::string_view{"HEALTH_DATA:"};
inline constexpr auto kMinimalNotePrefix = std::string_view{"HG_"};
/// Size the joined formats are trimmed to.
inline constexpr auto kNoteEncodeCeiling = std::size_t{1000};
/// Largest note the ledger accepts.
inline constexpr auto kNoteLedgerCeiling = std::size_t{1024};

/// Writes fingerprints into transaction notes and recognises every note
/// layout this application has produced.
///
/// An encoded note holds up to three segments joined by "|||", richest
/// first: a JSON object, "HEALTH_DATA:<fingerprint>" and "HG_<fingerprint>".
class note_codec final {
 public:
  /// Throws std::invalid_argument on an empty fingerprint or one containing
  /// '|', and note_too_large when the JSON segment alone exceeds
  /// kNoteLedgerCeiling.
  notary::schema::bytes_t encode(
      const notary::schema::fingerprint_t& fingerprint,
      const notary::schema::note_metadata_t& metadata) const;

  /// True when any segment of `note` carries `expected`. An empty
  /// `expected` never matches.
  ///
  /// Segments are also searched for `expected` as a substring, so a note
  /// for "abc123" matches "abc". Distinct fingerprints only fail to match
  /// each other when neither contains the other, which holds for digests of
  /// one fixed length.
  bool matches(const notary::schema::bytes_view_t& note,
               std::string_view expected) const;

  /// The JSON segment on its own.
  std::string structured_segment(
      const notary::schema::fingerprint_t& fingerprint,
      const notary::schema::note_metadata_t& metadata) const;
};

}  // namespace notary::service
