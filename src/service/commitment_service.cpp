#include <notary/common/logging.hpp>
#include <notary/ledger/transaction.hpp>
#include <notary/rpc/errors.hpp>
#include <notary/service/commitment_service.hpp>
#include <notary/service/errors.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace notary::service {

namespace {

using notary::schema::commitment_error_code_t;

bool mentions_insufficient_funds(std::string message) {
  std::transform(std::begin(message), std::end(message), std::begin(message),
                 [](const unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return message.find("overspend") != std::string::npos ||
         message.find("below min") != std::string::npos ||
         message.find("insufficient") != std::string::npos;
}

commitment_error_code_t classify_rejection(const std::string& message) {
  return mentions_insufficient_funds(message)
             ? commitment_error_code_t::insufficient_funds
             : commitment_error_code_t::node_rejected;
}

commitment_error_code_t classify(const notary::rpc::rpc_error& error) {
  if (error.transport_failure() || error.status() >= 500) {
    return commitment_error_code_t::network_error;
  }
  return classify_rejection(std::string{error.what()} + " " + error.body());
}

}  // namespace

commitment_service::commitment_service(const identity_provisioner& provisioner,
                                       funding_coordinator& funding,
                                       notary::rpc::node_client& node,
                                       const note_codec& codec,
                                       commitment_options options,
                                       notary::common::sleeper_t sleeper,
                                       notary::common::millis_clock_t clock)
    : provisioner_{provisioner},
      funding_{funding},
      node_{node},
      codec_{codec},
      options_{std::move(options)},
      sleeper_{std::move(sleeper)},
      clock_{std::move(clock)} {}

commitment_service::address_guard::address_guard(commitment_service& service,
                                                 const std::string& address)
    : service_{service}, address_{address} {
  {
    auto lock = std::lock_guard{service_.locks_mutex_};
    lock_ = &service_.address_locks_[address_];
    ++lock_->holders;
  }
  lock_->mutex.lock();
}

commitment_service::address_guard::~address_guard() {
  lock_->mutex.unlock();
  auto lock = std::lock_guard{service_.locks_mutex_};
  if (--lock_->holders == 0) {
    service_.address_locks_.erase(address_);
  }
}

std::size_t commitment_service::active_addresses() const {
  auto lock = std::lock_guard{locks_mutex_};
  return address_locks_.size();
}

notary::schema::commitment_t commitment_service::commit(
    const notary::schema::identity_t& identity,
    const notary::schema::fingerprint_t& fingerprint,
    const std::stop_token& stop) {
  if (!provisioner_.validate(identity)) {
    throw invalid_identity{"identity " + identity.address +
                           " failed validation"};
  }

  auto metadata = options_.note_template;
  metadata.created_at_millis = clock_();
  auto note = notary::schema::bytes_t{};
  try {
    note = codec_.encode(fingerprint, metadata);
  } catch (const std::exception& e) {
    throw commitment_failed{commitment_error_code_t::encoding_failed,
                            e.what()};
  }

  auto guard = address_guard{*this, identity.address};
  spdlog::info("committing fingerprint {} from {}",
               notary::common::abbreviate(fingerprint), identity.address);
  try {
    return with_retries(options_.commit_retry, sleeper_, stop, "commit",
                        [&](const uint32_t attempt) {
                          spdlog::debug("commit attempt {}", attempt);
                          return attempt_commit(identity, fingerprint, note,
                                                stop);
                        });
  } catch (const operation_cancelled& e) {
    throw commitment_failed{commitment_error_code_t::cancelled, e.what()};
  } catch (const notary::rpc::confirmation_timeout& e) {
    throw commitment_failed{commitment_error_code_t::confirmation_timeout,
                            e.what()};
  } catch (const notary::rpc::transaction_rejected& e) {
    throw commitment_failed{classify_rejection(e.what()), e.what()};
  } catch (const notary::rpc::rpc_error& e) {
    throw commitment_failed{classify(e), e.what()};
  } catch (const std::exception& e) {
    throw commitment_failed{commitment_error_code_t::network_error, e.what()};
  }
}

notary::schema::commitment_t commitment_service::attempt_commit(
    const notary::schema::identity_t& identity,
    const notary::schema::fingerprint_t& fingerprint,
    const notary::schema::bytes_t& note,
    const std::stop_token& stop) {
  if (options_.ensure_funding &&
      !funding_.ensure_funded(identity.address, stop)) {
    spdlog::warn("{} may be underfunded, submitting anyway", identity.address);
  }

  auto params =
      with_retries(options_.params_retry, sleeper_, stop, "transaction params",
                   [&](uint32_t) { return node_.transaction_params(); });

  // Both were checked by validate().
  auto public_key = *identity_provisioner::public_key_of(identity);
  auto seed = *identity_provisioner::seed_of(identity);

  auto transaction =
      notary::ledger::make_self_payment(public_key, params, note);
  auto signed_transaction = notary::ledger::sign_transaction(transaction, seed);
  if (!signed_transaction) {
    throw std::runtime_error{"failed to sign transaction"};
  }

  if (stop.stop_requested()) {
    throw operation_cancelled{"commit cancelled before submission"};
  }
  auto transaction_id = node_.submit_transaction(*signed_transaction);
  auto expected_id = notary::ledger::transaction_id(transaction);
  if (transaction_id != expected_id) {
    spdlog::warn("node assigned id {} but the transaction hashes to {}",
                 transaction_id, expected_id);
  }
  spdlog::info("submitted {}, waiting up to {} rounds", transaction_id,
               options_.confirmation_rounds);

  auto info =
      node_.wait_for_confirmation(transaction_id, options_.confirmation_rounds);

  auto commitment = notary::schema::commitment_t{};
  commitment.transaction_id = transaction_id;
  commitment.confirmed_round = info.confirmed_round.value_or(0);
  commitment.committed_at_millis = clock_();
  commitment.fingerprint = fingerprint;
  commitment.identity_address = identity.address;
  spdlog::info("{} confirmed in round {}", transaction_id,
               commitment.confirmed_round);
  return commitment;
}

notary::schema::commitment_t commit_and_record(
    commitment_service& service,
    const notary::storage::ledger_storage_t& store,
    const std::string_view record_id,
    const notary::schema::identity_t& identity,
    const notary::schema::fingerprint_t& fingerprint,
    const std::stop_token& stop) {
  auto result = service.commit(identity, fingerprint, stop);
  spdlog::info("record {} committed as {} in round {}", record_id,
               result.transaction_id, result.confirmed_round);
  notary::storage::record_commitment(store, record_id, result);
  return result;
}

}  // namespace notary::service
