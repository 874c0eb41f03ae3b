#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace BOOLSAT {

class SolverLogger {
 public:
  /// Shared "boolsat" logger, created on first use with a console sink.
  static std::shared_ptr<spdlog::logger> get();

  /// Recreate the logger. An empty logFileName keeps the console sink;
  /// otherwise output goes to that file, falling back to stdout when the
  /// file cannot be opened.
  static void init(const std::string& logFileName,
                   spdlog::level::level_enum level);

  /// Map "trace", "debug", "info", "warn", "error", "critical" or "off".
  /// Throws std::runtime_error on anything else.
  static spdlog::level::level_enum parseLevel(const std::string& level);

 private:
  static std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace BOOLSAT
