#pragma once

#include <notary/schema/network.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace notary::ledger {

std::string_view default_explorer_base(notary::schema::network_t network);

std::string transaction_url(std::string_view base,
                            std::string_view transaction_id);
std::string address_url(std::string_view base, std::string_view address);
std::string application_url(std::string_view base, uint64_t application_id);

}  // namespace notary::ledger
