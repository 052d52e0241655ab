#include <notary/storage/commitment_ledger.hpp>

namespace notary::storage {

std::string make_commitment_key(const std::string_view record_id) {
  auto key = std::string{kCommitmentPrefix};
  key.append(record_id);
  return key;
}

void record_commitment(const ledger_storage_t& store,
                       const std::string_view record_id,
                       const notary::schema::commitment_t& commitment) {
  auto encoder = ledger_encoder_t{};
  auto key = make_commitment_key(record_id);
  store.put(encoder, notary::schema::make_bytes_view(key), commitment);
  spdlog::debug("recorded commitment {} for record {}",
                commitment.transaction_id, record_id);
}

std::optional<notary::schema::commitment_t> find_commitment(
    const ledger_storage_t& store,
    const std::string_view record_id) {
  auto encoder = ledger_encoder_t{};
  auto key = make_commitment_key(record_id);
  return store.get<notary::schema::commitment_t>(
      encoder, notary::schema::make_bytes_view(key));
}

std::vector<std::pair<std::string, notary::schema::commitment_t>>
list_commitments(const ledger_storage_t& store) {
  auto encoder = ledger_encoder_t{};
  auto out =
      std::vector<std::pair<std::string, notary::schema::commitment_t>>{};
  auto prefix = std::string{kCommitmentPrefix};
  for (const auto& [key, value] :
       store.list_by_prefix(notary::schema::make_bytes_view(prefix))) {
    auto record_id = notary::schema::make_string(key).substr(prefix.size());
    auto decoded = encoder.try_decode<notary::schema::commitment_t>(value);
    if (!decoded) {
      spdlog::warn("skipping undecodable commitment for record {}", record_id);
      continue;
    }
    out.emplace_back(std::move(record_id), std::move(*decoded));
  }
  return out;
}

bool forget_commitment(const ledger_storage_t& store,
                       const std::string_view record_id) {
  auto key = make_commitment_key(record_id);
  return store.erase(notary::schema::make_bytes_view(key));
}

}  // namespace notary::storage
