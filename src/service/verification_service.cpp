#include <notary/common/logging.hpp>
#include <notary/service/verification_service.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace notary::service {

verification_service::verification_service(notary::rpc::node_client& node,
                                           const note_codec& codec,
                                           verification_options options,
                                           notary::common::sleeper_t sleeper)
    : node_{node},
      codec_{codec},
      options_{std::move(options)},
      sleeper_{std::move(sleeper)} {}

std::optional<std::string> verification_service::locate_note(
    const notary::schema::transaction_info_t& info) {
  if (info.signed_note.has_value()) {
    return info.signed_note;
  }
  if (info.transaction_note.has_value()) {
    return info.transaction_note;
  }
  return info.flat_note;
}

std::string verification_service::decode_note(const std::string_view note) {
  if (auto decoded = notary::schema::try_from_base64(note)) {
    return notary::schema::make_string(*decoded);
  }
  return std::string{note};
}

notary::schema::verification_outcome_t verification_service::verify(
    const notary::schema::fingerprint_t& fingerprint,
    const std::string_view transaction_id,
    const std::stop_token& stop) const {
  auto outcome = notary::schema::verification_outcome_t{};
  auto info = notary::schema::transaction_info_t{};
  try {
    info = with_retries(options_.fetch_retry, sleeper_, stop,
                        "transaction lookup", [&](uint32_t) {
                          return node_.transaction_info(transaction_id);
                        });
  } catch (const std::exception& e) {
    spdlog::error("could not fetch transaction {}: {}", transaction_id,
                  e.what());
    return outcome;
  }

  if (!info.confirmed_round.has_value()) {
    spdlog::warn("transaction {} is not confirmed", transaction_id);
    return outcome;
  }

  auto note = locate_note(info);
  if (!note) {
    spdlog::warn("transaction {} carries no note, trying fallback search",
                 transaction_id);
    return fallback_search(fingerprint, transaction_id, stop);
  }

  auto text = decode_note(*note);
  auto verified =
      codec_.matches(notary::schema::make_bytes_view(text), fingerprint);
  outcome.verified = verified;
  outcome.fingerprint_matched = verified;
  outcome.note_found = true;
  outcome.confirmed = true;
  spdlog::info("fingerprint {} {} in transaction {}",
               notary::common::abbreviate(fingerprint),
               verified ? "verified" : "not found", transaction_id);
  return outcome;
}

notary::schema::verification_outcome_t verification_service::fallback_search(
    const notary::schema::fingerprint_t& fingerprint,
    const std::string_view transaction_id,
    const std::stop_token& stop) const {
  auto outcome = notary::schema::verification_outcome_t{};
  if (!sleeper_(options_.fallback_delay, stop)) {
    return outcome;
  }

  const auto& policy = options_.fallback_retry;
  for (auto attempt = uint32_t{1}; attempt <= policy.attempts; ++attempt) {
    try {
      auto info = node_.transaction_info(transaction_id);
      if (auto note = locate_note(info)) {
        auto text = decode_note(*note);
        auto verified = !fingerprint.empty() &&
                        text.find(fingerprint) != std::string::npos;
        outcome.verified = verified;
        outcome.fingerprint_matched = verified;
        outcome.note_found = true;
        outcome.confirmed = info.confirmed_round.has_value();
        outcome.degraded = true;
        spdlog::info("fallback search found the note of {} on attempt {}",
                     transaction_id, attempt);
        return outcome;
      }
      spdlog::debug("fallback attempt {}/{} found no note", attempt,
                    policy.attempts);
    } catch (const std::exception& e) {
      spdlog::warn("fallback attempt {}/{} failed: {}", attempt,
                   policy.attempts, e.what());
    }
    if (attempt < policy.attempts &&
        !sleeper_(policy.delay_after(attempt), stop)) {
      return outcome;
    }
  }

  spdlog::warn("no note found for transaction {}", transaction_id);
  outcome.confirmed = true;
  return outcome;
}

}  // namespace notary::service
