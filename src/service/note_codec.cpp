#include <notary/service/errors.hpp>
#include <notary/service/note_codec.hpp>

#include <json/json.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <vector>

namespace notary::service {

namespace {

std::string join(const std::vector<std::string>& segments) {
  auto out = std::string{};
  for (const auto& segment : segments) {
    if (!out.empty()) {
      out += kNoteSeparator;
    }
    out += segment;
  }
  return out;
}

std::vector<std::string_view> split(std::string_view text,
                                    const std::string_view separator) {
  auto out = std::vector<std::string_view>{};
  auto position = text.find(separator);
  while (position != std::string_view::npos) {
    out.push_back(text.substr(0, position));
    text.remove_prefix(position + separator.size());
    position = text.find(separator);
  }
  out.push_back(text);
  return out;
}

std::string_view trim(std::string_view text) {
  constexpr auto kWhitespace = std::string_view{" \t\r\n"};
  auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

std::optional<std::string> member_string(const Json::Value& object,
                                         const char* primary,
                                         const char* historical) {
  for (const auto* name : {primary, historical}) {
    if (object.isMember(name) && object[name].isString()) {
      return object[name].asString();
    }
  }
  return std::nullopt;
}

// Both the current {kind, fingerprint} and the historical {type, hash} key
// pairs are accepted.
bool structured_matches(const std::string_view segment,
                        const std::string_view expected) {
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto root = Json::Value{};
  auto errors = std::string{};
  if (!reader->parse(segment.data(), segment.data() + segment.size(), &root,
                     &errors) ||
      !root.isObject()) {
    return false;
  }
  auto kind = member_string(root, "kind", "type");
  if (kind.has_value() && *kind != kNoteKind) {
    return false;
  }
  auto fingerprint = member_string(root, "fingerprint", "hash");
  return fingerprint.has_value() && *fingerprint == expected;
}

bool prefixed_matches(const std::string_view segment,
                      const std::string_view prefix,
                      const std::string_view expected) {
  if (!segment.starts_with(prefix)) {
    return false;
  }
  auto value = segment.substr(prefix.size());
  return value == expected || value.find(expected) != std::string_view::npos;
}

bool segment_matches(const std::string_view segment,
                     const std::string_view expected) {
  if (segment.starts_with('{') && structured_matches(segment, expected)) {
    return true;
  }
  if (prefixed_matches(segment, kLegacyNotePrefix, expected)) {
    return true;
  }
  if (prefixed_matches(segment, kMinimalNotePrefix, expected)) {
    return true;
  }
  return segment.find(expected) != std::string_view::npos;
}

}  // namespace

std::string note_codec::structured_segment(
    const notary::schema::fingerprint_t& fingerprint,
    const notary::schema::note_metadata_t& metadata) const {
  auto object = Json::Value{Json::objectValue};
  object["app"] = metadata.application;
  object["createdAtMillis"] =
      static_cast<Json::UInt64>(metadata.created_at_millis);
  object["fingerprint"] = fingerprint;
  object["formatVersion"] = metadata.format_version;
  object["kind"] = std::string{kNoteKind};
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  return Json::writeString(builder, object);
}

notary::schema::bytes_t note_codec::encode(
    const notary::schema::fingerprint_t& fingerprint,
    const notary::schema::note_metadata_t& metadata) const {
  if (fingerprint.empty()) {
    throw std::invalid_argument{"fingerprint must not be empty"};
  }
  // Any '|' would split the fingerprint when the note is read back, under
  // either separator.
  if (fingerprint.find('|') != std::string::npos) {
    throw std::invalid_argument{"fingerprint must not contain '|'"};
  }

  auto segments = std::vector<std::string>{
      structured_segment(fingerprint, metadata),
      std::string{kLegacyNotePrefix} + fingerprint,
      std::string{kMinimalNotePrefix} + fingerprint};
  if (segments.front().size() > kNoteLedgerCeiling) {
    throw note_too_large{"structured note is " +
                         std::to_string(segments.front().size()) +
                         " bytes, limit is " +
                         std::to_string(kNoteLedgerCeiling)};
  }

  auto note = join(segments);
  while (note.size() > kNoteEncodeCeiling && segments.size() > 1) {
    segments.pop_back();
    note = join(segments);
  }
  if (segments.size() < 3) {
    spdlog::debug("note trimmed to {} segment(s), {} bytes", segments.size(),
                  note.size());
  }
  return notary::schema::make_bytes(note);
}

bool note_codec::matches(const notary::schema::bytes_view_t& note,
                         const std::string_view expected) const {
  if (expected.empty()) {
    return false;
  }
  auto text = notary::schema::make_string_view(note);
  auto separator = text.find(kNoteSeparator) != std::string_view::npos
                       ? kNoteSeparator
                       : kLegacyNoteSeparator;
  for (const auto segment : split(text, separator)) {
    if (segment_matches(trim(segment), expected)) {
      return true;
    }
  }
  return false;
}

}  // namespace notary::service
