#include "logging.hpp"
#include <utility>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

static void install(std::shared_ptr<spdlog::logger> logger, const AppConfig& cfg) {
  logger->set_level(spdlog::level::from_str(cfg.log_level));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

bool init_logging(const AppConfig& cfg, std::string* error) {
  spdlog::drop(CELLTERM_LOGGER_NAME);
  if (!cfg.log_file.empty()) {
    try {
      auto logger = spdlog::basic_logger_mt(CELLTERM_LOGGER_NAME, cfg.log_file, true);
      logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
      install(std::move(logger), cfg);
      return true;
    } catch (const spdlog::spdlog_ex& e) {
      if (error) *error = e.what();
    }
  }
  install(spdlog::null_logger_mt(CELLTERM_LOGGER_NAME), cfg);
  return cfg.log_file.empty();
}
