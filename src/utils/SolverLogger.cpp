#include "SolverLogger.h"

#include <stdexcept>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

using namespace BOOLSAT;

namespace {

const char* const LoggerName = "boolsat";

}  // namespace

std::shared_ptr<spdlog::logger> SolverLogger::logger_;

std::shared_ptr<spdlog::logger> SolverLogger::get() {
  if (!logger_) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>(LoggerName, console_sink);
    logger_->set_level(spdlog::level::warn);
    spdlog::register_logger(logger_);
  }
  return logger_;
}

void SolverLogger::init(const std::string& logFileName,
                        spdlog::level::level_enum level) {
  if (logger_) {
    spdlog::drop(LoggerName);
    logger_.reset();
  }
  if (logFileName.empty()) {
    get()->set_level(level);
    return;
  }
  try {
    auto file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFileName, true);
    logger_ = std::make_shared<spdlog::logger>(LoggerName, file_sink);
    logger_->set_level(level);
    logger_->flush_on(spdlog::level::info);
    spdlog::register_logger(logger_);
  } catch (const spdlog::spdlog_ex& ex) {
    // Fallback: create a simple stdout logger explicitly
    auto console_sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    logger_ = std::make_shared<spdlog::logger>(LoggerName, console_sink);
    logger_->set_level(level);
    spdlog::register_logger(logger_);
    logger_->error("spdlog initialization failed for file sink: {}", ex.what());
  }
}

spdlog::level::level_enum SolverLogger::parseLevel(const std::string& level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "critical")
    return spdlog::level::critical;
  if (level == "off")
    return spdlog::level::off;
  throw std::runtime_error("Unrecognized log level: " + level);
}
