#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <warden/common/logging.hpp>

#include <memory>
#include <string>
#include <vector>

namespace warden::common {

void configure_logging(const std::string_view level,
                       const std::string_view file) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        std::string{file}, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(std::string{level}));
  spdlog::flush_on(spdlog::level::warn);
}

}  // namespace warden::common
