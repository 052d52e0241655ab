#include <csignal>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <notary/common/logging.hpp>
#include <notary/common/sleeper.hpp>
#include <notary/config/settings.hpp>
#include <notary/fingerprint/fingerprint.hpp>
#include <notary/ledger/explorer.hpp>
#include <notary/ledger/mnemonic.hpp>
#include <notary/rpc/algod_node_client.hpp>
#include <notary/rpc/errors.hpp>
#include <notary/rpc/faucet_client.hpp>
#include <notary/service/commitment_service.hpp>
#include <notary/service/errors.hpp>
#include <notary/service/funding_coordinator.hpp>
#include <notary/service/identity_provisioner.hpp>
#include <notary/service/note_codec.hpp>
#include <notary/service/verification_service.hpp>
#include <notary/storage/commitment_ledger.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace {

namespace po = boost::program_options;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) { shutdown_requested() = true; }

constexpr auto kUsage = std::string_view{
    "Usage: notary [options] <command> [arguments]\n"
    "\n"
    "Commands:\n"
    "  check-network [address]            Node status, parameters and balance\n"
    "  generate-identity                  Create a new signing identity\n"
    "  fund-account <address>             Request faucet funds for an address\n"
    "  fingerprint <record.json>          Fingerprint a JSON record\n"
    "  commit <record-id> <fingerprint>   Commit a fingerprint (needs "
    "--mnemonic or --private-key)\n"
    "  verify <record-id>                 Verify a recorded commitment\n"
    "  verify <fingerprint> <tx-id>       Verify a fingerprint in a "
    "transaction\n"
    "  list-commitments                   Show recorded commitments\n"
    "  self-test                          Generate, fund, commit and verify\n"};

struct context final {
  notary::config::settings settings;
  std::optional<notary::ledger::word_list> words;
  notary::rpc::algod_node_client node;
  notary::rpc::http_faucet_client faucet;
  notary::service::note_codec codec;
  notary::service::identity_provisioner provisioner;
  notary::service::funding_coordinator funding;
  notary::service::commitment_service commitment;
  notary::service::verification_service verification;

  explicit context(notary::config::settings config,
                   std::optional<notary::ledger::word_list> word_list)
      : settings{std::move(config)},
        words{std::move(word_list)},
        node{settings.node},
        faucet{},
        codec{},
        provisioner{words ? &*words : nullptr},
        funding{node, faucet, settings.funding,
                notary::common::make_thread_sleeper()},
        commitment{provisioner,
                   funding,
                   node,
                   codec,
                   settings.commitment,
                   notary::common::make_thread_sleeper(),
                   notary::common::make_system_clock()},
        verification{node, codec, settings.verification,
                     notary::common::make_thread_sleeper()} {}
};

std::string read_file(const std::string& path) {
  auto input = std::ifstream{path};
  if (!input) {
    throw std::runtime_error{"cannot read " + path};
  }
  auto buffer = std::stringstream{};
  buffer << input.rdbuf();
  return buffer.str();
}

notary::schema::identity_t load_identity(context& ctx,
                                         const po::variables_map& vm) {
  if (vm.contains("mnemonic")) {
    return ctx.provisioner.restore(vm["mnemonic"].as<std::string>());
  }
  if (vm.contains("private-key")) {
    auto key =
        notary::schema::try_from_hex(vm["private-key"].as<std::string>());
    if (!key) {
      throw notary::service::invalid_identity{"private key is not hex"};
    }
    return ctx.provisioner.from_private_key(*key);
  }
  throw notary::service::invalid_identity{
      "commit needs --mnemonic or --private-key"};
}

void print_identity(const notary::schema::identity_t& identity) {
  std::cout << "Address:     " << identity.address << "\n";
  if (identity.mnemonic) {
    std::cout << "Mnemonic:    " << *identity.mnemonic << "\n";
  } else {
    std::cout << "Private key: " << notary::schema::to_hex(identity.private_key)
              << "\n";
  }
  std::cout << "Keep the mnemonic or private key secret; it controls the "
               "account.\n";
}

void print_outcome(const context& ctx,
                   const notary::schema::verification_outcome_t& outcome,
                   const std::string_view transaction_id) {
  std::cout << (outcome.verified ? "VERIFIED" : "NOT VERIFIED") << "\n";
  std::cout << "  confirmed:   " << (outcome.confirmed ? "yes" : "no") << "\n";
  std::cout << "  note found:  " << (outcome.note_found ? "yes" : "no") << "\n";
  if (outcome.degraded) {
    std::cout << "  The note was located by a secondary lookup method.\n";
  }
  std::cout << "  explorer:    "
            << notary::ledger::transaction_url(ctx.settings.explorer(),
                                               transaction_id)
            << "\n";
}

int check_network(context& ctx, const std::vector<std::string>& args) {
  auto status = ctx.node.status();
  auto params = ctx.node.transaction_params();
  std::cout << "Node:          " << ctx.settings.node.url << "\n";
  std::cout << "Network:       " << params.genesis_id << "\n";
  std::cout << "Last round:    " << status.last_round << "\n";
  std::cout << "Min fee:       " << params.min_fee << " microAlgos\n";
  if (!args.empty()) {
    auto account = ctx.node.account_info(args.front());
    std::cout << "Balance:       " << account.amount << " microAlgos\n";
    std::cout << "Explorer:      "
              << notary::ledger::address_url(ctx.settings.explorer(),
                                             args.front())
              << "\n";
  }
  return 0;
}

int generate_identity(context& ctx) {
  if (!ctx.words) {
    spdlog::warn("no word list configured, the identity has no mnemonic");
  }
  print_identity(ctx.provisioner.generate());
  return 0;
}

int fund_account(context& ctx,
                 const std::vector<std::string>& args,
                 const std::stop_token& stop) {
  if (args.size() != 1 || !notary::ledger::is_valid_address(args.front())) {
    std::cerr << "fund-account needs one valid address\n";
    return 2;
  }
  if (ctx.funding.ensure_funded(args.front(), stop)) {
    std::cout << args.front() << " is funded\n";
    return 0;
  }
  for (const auto& line : ctx.funding.manual_funding_guidance(args.front())) {
    std::cout << line << "\n";
  }
  return 1;
}

int fingerprint_record(context& ctx, const std::vector<std::string>& args) {
  if (args.size() != 1) {
    std::cerr << "fingerprint needs one JSON file\n";
    return 2;
  }
  std::cout << notary::fingerprint::compute(read_file(args.front()),
                                            ctx.settings.digest)
            << "\n";
  return 0;
}

int commit(context& ctx,
           const po::variables_map& vm,
           const std::vector<std::string>& args,
           const std::stop_token& stop) {
  if (args.size() != 2) {
    std::cerr << "commit needs <record-id> <fingerprint>\n";
    return 2;
  }
  auto identity = load_identity(ctx, vm);
  if (!notary::fingerprint::is_well_formed(args[1])) {
    spdlog::warn("{} is not a 64 character lowercase hex digest",
                 notary::common::abbreviate(args[1]));
  }
  auto store = notary::storage::make_storage<
      notary::storage::rocksdb_storage_tag>(ctx.settings.storage_path);
  try {
    auto result = notary::service::commit_and_record(ctx.commitment, store,
                                                     args[0], identity,
                                                     args[1], stop);
    std::cout << "Committed in round " << result.confirmed_round << "\n";
    std::cout << "Transaction: " << result.transaction_id << "\n";
    std::cout << "Explorer:    "
              << notary::ledger::transaction_url(ctx.settings.explorer(),
                                                 result.transaction_id)
              << "\n";
    return 0;
  } catch (const notary::service::commitment_failed& e) {
    std::cerr << "Commit failed (" << notary::schema::to_string(e.code())
              << "): " << e.reason() << "\nPlease try again later.\n";
    using notary::schema::commitment_error_code_t;
    if (e.code() == commitment_error_code_t::insufficient_funds) {
      for (const auto& line :
           ctx.funding.manual_funding_guidance(identity.address)) {
        std::cerr << line << "\n";
      }
    }
    return 1;
  }
}

int verify(context& ctx,
           const std::vector<std::string>& args,
           const std::stop_token& stop) {
  auto fingerprint = std::string{};
  auto transaction_id = std::string{};
  if (args.size() == 1) {
    auto store = notary::storage::make_storage<
        notary::storage::rocksdb_storage_tag>(ctx.settings.storage_path);
    auto recorded = notary::storage::find_commitment(store, args[0]);
    if (!recorded) {
      std::cerr << "no commitment recorded for " << args[0] << "\n";
      return 1;
    }
    fingerprint = recorded->fingerprint;
    transaction_id = recorded->transaction_id;
  } else if (args.size() == 2) {
    fingerprint = args[0];
    transaction_id = args[1];
  } else {
    std::cerr << "verify needs <record-id> or <fingerprint> <tx-id>\n";
    return 2;
  }
  if (!notary::fingerprint::is_well_formed(fingerprint)) {
    spdlog::warn("{} is not a 64 character lowercase hex digest",
                 notary::common::abbreviate(fingerprint));
  }
  auto outcome = ctx.verification.verify(fingerprint, transaction_id, stop);
  print_outcome(ctx, outcome, transaction_id);
  return outcome.verified ? 0 : 1;
}

int list_commitments(context& ctx) {
  auto store = notary::storage::make_storage<
      notary::storage::rocksdb_storage_tag>(ctx.settings.storage_path);
  for (const auto& [record_id, entry] :
       notary::storage::list_commitments(store)) {
    std::cout << record_id << "  " << entry.transaction_id << "  round "
              << entry.confirmed_round << "  "
              << notary::common::abbreviate(entry.fingerprint) << "\n";
  }
  return 0;
}

int self_test(context& ctx, const std::stop_token& stop) {
  auto identity = ctx.provisioner.generate();
  print_identity(identity);
  if (!ctx.funding.ensure_funded(identity.address, stop)) {
    for (const auto& line :
         ctx.funding.manual_funding_guidance(identity.address)) {
      std::cout << line << "\n";
    }
    return 1;
  }
  auto fingerprint = notary::fingerprint::compute(
      R"({"allergies":["penicillin"],"bloodType":"O+","name":"self-test"})",
      ctx.settings.digest);
  try {
    auto result = ctx.commitment.commit(identity, fingerprint, stop);
    auto outcome =
        ctx.verification.verify(fingerprint, result.transaction_id, stop);
    print_outcome(ctx, outcome, result.transaction_id);
    return outcome.verified ? 0 : 1;
  } catch (const notary::service::commitment_failed& e) {
    std::cerr << "Commit failed (" << notary::schema::to_string(e.code())
              << "): " << e.reason() << "\nPlease try again later.\n";
    return 1;
  }
}

int dispatch(context& ctx,
             const po::variables_map& vm,
             const std::string& command,
             const std::vector<std::string>& args,
             const std::stop_token& stop) {
  if (command == "check-network") {
    return check_network(ctx, args);
  }
  if (command == "generate-identity") {
    return generate_identity(ctx);
  }
  if (command == "fund-account") {
    return fund_account(ctx, args, stop);
  }
  if (command == "fingerprint") {
    return fingerprint_record(ctx, args);
  }
  if (command == "commit") {
    return commit(ctx, vm, args, stop);
  }
  if (command == "verify") {
    return verify(ctx, args, stop);
  }
  if (command == "list-commitments") {
    return list_commitments(ctx);
  }
  if (command == "self-test") {
    return self_test(ctx, stop);
  }
  std::cerr << "unknown command '" << command << "'\n" << kUsage;
  return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto settings_options = notary::config::make_options();
  auto cli = po::options_description{"Notary"};
  // clang-format off
  cli.add_options()
      ("help,h", "Show the help message")
      ("config,c", po::value<std::string>(), "INI style settings file")
      ("mnemonic", po::value<std::string>(), "25 word identity phrase")
      ("private-key", po::value<std::string>(),
       "Hex encoded 32 or 64 byte private key");
  // clang-format on
  cli.add(settings_options);

  auto hidden = po::options_description{};
  hidden.add_options()("command", po::value<std::string>())(
      "arguments", po::value<std::vector<std::string>>());
  auto positional = po::positional_options_description{};
  positional.add("command", 1).add("arguments", -1);

  auto all = po::options_description{};
  all.add(cli).add(hidden);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      notary::config::load_config_file(vm["config"].as<std::string>(),
                                       settings_options, vm);
    }
    po::notify(vm);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n" << kUsage;
    return 2;
  }

  if (vm.contains("help") || !vm.contains("command")) {
    std::cout << kUsage << "\n" << cli << std::endl;
    return vm.contains("help") ? 0 : 2;
  }

  auto settings = notary::config::settings{};
  try {
    settings = notary::config::from_variables(vm);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  notary::common::configure_logging(settings.log_level, settings.log_file);

  auto words = std::optional<notary::ledger::word_list>{};
  if (!settings.word_list_path.empty()) {
    words = notary::ledger::word_list::load(settings.word_list_path);
  }

  auto stop_source = std::stop_source{};
  auto watcher = std::jthread{[&stop_source](const std::stop_token& done) {
    while (!done.stop_requested()) {
      if (shutdown_requested()) {
        spdlog::info("interrupt received, cancelling");
        stop_source.request_stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{100});
    }
  }};

  auto args = vm.contains("arguments")
                  ? vm["arguments"].as<std::vector<std::string>>()
                  : std::vector<std::string>{};
  auto exit_code = 1;
  try {
    auto ctx = context{std::move(settings), std::move(words)};
    exit_code = dispatch(ctx, vm, vm["command"].as<std::string>(), args,
                         stop_source.get_token());
  } catch (const notary::service::invalid_identity& e) {
    spdlog::error("invalid identity: {}", e.what());
  } catch (const notary::service::identity_generation_exhausted& e) {
    spdlog::error("{}", e.what());
  } catch (const notary::rpc::rpc_error& e) {
    spdlog::error("node request failed: {}", e.what());
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
  }

  watcher.request_stop();
  watcher.join();
  spdlog::shutdown();
  return exit_code;
}
