#pragma once

#include <memory>
#include <mutex>
#include <string>

#include <spdlog/spdlog.h>

namespace dnsaudit::common {

/// Thin wrapper over spdlog. Writes to stderr so stdout stays reserved for
/// report output.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Validating {} domains", vDomains.size());
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Returns spdlog's default logger, initializing at "info" on first use.
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
  static std::mutex _mtx;
};

}  // namespace dnsaudit::common
