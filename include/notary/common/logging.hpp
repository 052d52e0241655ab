#pragma once

#include <string>
#include <string_view>

namespace notary::common {

/// Install the process-wide async logger (colour console + file sink).
///
/// `level` is an spdlog level name ("trace" .. "off"); unknown names fall
/// back to "info". An empty `file_path` disables the file sink.
void configure_logging(std::string_view level, const std::string& file_path);

/// Shorten a fingerprint or id for log output.
std::string abbreviate(std::string_view value, std::size_t keep = 16);

}  // namespace notary::common
