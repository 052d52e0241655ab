#include <notary/common/logging.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace notary::common {

void configure_logging(const std::string_view level,
                       const std::string& file_path) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!file_path.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "notary", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto parsed = spdlog::level::from_str(std::string{level});
  if (parsed == spdlog::level::off && level != "off") {
    parsed = spdlog::level::info;
  }
  spdlog::set_level(parsed);
}

std::string abbreviate(const std::string_view value, const std::size_t keep) {
  if (value.size() <= keep) {
    return std::string{value};
  }
  return std::string{value.substr(0, keep)} + "...";
}

}  // namespace notary::common
