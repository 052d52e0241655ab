#include <notary/blake3/hash.hpp>
#include <notary/crypto/digest.hpp>
#include <notary/fingerprint/fingerprint.hpp>

#include <json/json.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace notary::fingerprint {

std::optional<std::string> canonical_json(const std::string_view json) {
  auto builder = Json::CharReaderBuilder{};
  builder["collectComments"] = false;
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto root = Json::Value{};
  auto errors = std::string{};
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &errors)) {
    return std::nullopt;
  }

  // Json::Value keeps object members in a sorted map, so writing it back
  // compactly yields the canonical form.
  auto writer = Json::StreamWriterBuilder{};
  writer["indentation"] = "";
  writer["emitUTF8"] = true;
  return Json::writeString(writer, root);
}

notary::schema::fingerprint_t compute(const std::string_view record_json,
                                      const digest_algorithm_t algorithm) {
  auto canonical = canonical_json(record_json);
  if (!canonical) {
    throw std::invalid_argument{"record is not valid JSON"};
  }
  auto digest = algorithm == digest_algorithm_t::blake3
                    ? notary::blake3::hash(*canonical)
                    : notary::crypto::sha256(*canonical);
  return notary::schema::to_hex(digest);
}

bool is_well_formed(const std::string_view fingerprint) {
  return fingerprint.size() == 64 &&
         std::all_of(std::begin(fingerprint), std::end(fingerprint),
                     [](const char c) {
                       return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
                     });
}

}  // namespace notary::fingerprint
