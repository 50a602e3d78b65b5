#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace dnsaudit::common {

bool Logger::_bInitialized = false;
std::mutex Logger::_mtx;

void Logger::init(const std::string& sLevel) {
  std::lock_guard<std::mutex> lock(_mtx);
  const auto level = spdlog::level::from_str(sLevel);
  if (_bInitialized) {
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::stderr_color_mt("dnsaudit");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bInitialized) {
      return spdlog::default_logger();
    }
  }
  init("info");
  return spdlog::default_logger();
}

}  // namespace dnsaudit::common
