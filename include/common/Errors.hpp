#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace dnsaudit::common {

/// Base error for all application-level exceptions.
/// Carries the process exit code and a machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iExitCode;
  std::string _sErrorCode;

  explicit AppError(int iExitCode, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iExitCode(iExitCode),
        _sErrorCode(std::move(sCode)) {}
};

/// Exit 2 — invalid invocation or environment. Fatal before any domain runs.
struct ConfigError : AppError {
  explicit ConfigError(std::string sCode, std::string sMsg)
      : AppError(2, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 2 — a single input value could not be interpreted.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(2, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 3 — expected-record source has nothing usable for a domain.
/// Contained per domain by the validation engine.
struct ProviderError : AppError {
  explicit ProviderError(std::string sCode, std::string sMsg)
      : AppError(3, std::move(sCode), std::move(sMsg)) {}
};

/// Exit 4 — the query mechanism itself failed. Converted to a Fault
/// QueryResult at the resolver boundary.
struct QueryError : AppError {
  explicit QueryError(std::string sCode, std::string sMsg)
      : AppError(4, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace dnsaudit::common
