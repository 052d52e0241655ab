#pragma once

#include <notary/fingerprint/fingerprint.hpp>
#include <notary/rpc/algod_node_client.hpp>
#include <notary/schema/funding_source.hpp>
#include <notary/schema/network.hpp>
#include <notary/service/commitment_service.hpp>
#include <notary/service/funding_coordinator.hpp>
#include <notary/service/verification_service.hpp>

#include <boost/program_options.hpp>

#include <string>
#include <string_view>

namespace notary::config {

struct settings final {
  notary::rpc::node_settings node;
  notary::schema::network_t network{notary::schema::network_t::testnet};
  /// Empty selects the default explorer of `network`.
  std::string explorer_base;
  notary::service::funding_options funding;
  notary::service::commitment_options commitment;
  notary::service::verification_options verification;
  notary::fingerprint::digest_algorithm_t digest{
      notary::fingerprint::digest_algorithm_t::sha256};
  std::string word_list_path;
  std::string storage_path{"notary-db"};
  std::string log_level{"info"};
  std::string log_file{"notary.log"};

  std::string_view explorer() const;
};

/// Options shared by the command line and the config file.
boost::program_options::options_description make_options();

/// Store `path` into `variables`. Values already present (from the command
/// line) take precedence. Throws std::runtime_error when the file cannot be
/// read and boost::program_options::error on unknown keys.
void load_config_file(
    const std::string& path,
    const boost::program_options::options_description& options,
    boost::program_options::variables_map& variables);

/// Throws std::invalid_argument on malformed values.
settings from_variables(const boost::program_options::variables_map& variables);

/// "name,url,form" or "name,url,json".
notary::schema::funding_source_t parse_funding_source(std::string_view value);

}  // namespace notary::config
