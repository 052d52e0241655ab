#pragma once

#include <notary/schema/commitment.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/storage/rocksdb/storage.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Commitments keyed by the id of the record whose fingerprint they carry.
namespace notary::storage {

using ledger_storage_t = storage<rocksdb_storage_tag>;
using ledger_encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommitmentPrefix =
    std::string_view{"NOTARY|COMMITMENT|"};

std::string make_commitment_key(std::string_view record_id);

/// Replaces any earlier commitment for `record_id`.
void record_commitment(const ledger_storage_t& store,
                       std::string_view record_id,
                       const notary::schema::commitment_t& commitment);

std::optional<notary::schema::commitment_t> find_commitment(
    const ledger_storage_t& store,
    std::string_view record_id);

/// (record id, commitment) pairs ordered by record id. Entries that fail
/// to decode are skipped with a warning.
std::vector<std::pair<std::string, notary::schema::commitment_t>>
list_commitments(const ledger_storage_t& store);

bool forget_commitment(const ledger_storage_t& store,
                       std::string_view record_id);

}  // namespace notary::storage
