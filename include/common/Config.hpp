#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnsaudit::common {

enum class ResolverBackend { Standard, DoH };

std::string toString(ResolverBackend backend);

/// Environment variable loader. All knobs live in one typed struct that is
/// passed explicitly to whatever needs it.
/// Class abbreviation: cfg
struct Config {
  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  // ── Resolver ──────────────────────────────────────────────────────────
  ResolverBackend backend = ResolverBackend::Standard;
  std::optional<std::string> oDnsServer;
  std::string sDohEndpoint = "https://dns.google/resolve";
  int iQueryTimeoutMs = 5000;

  // ── Concurrency ───────────────────────────────────────────────────────
  int iThreadPoolSize = 0;  // 0 = std::thread::hardware_concurrency()
  int iMaxConcurrentQueries = 8;

  // ── Expected-record sources (at most one) ─────────────────────────────
  std::optional<std::string> oExpectedCsvPath;
  std::optional<std::string> oExpectedJsonPath;
  std::optional<std::string> oBaselinePath;
  std::optional<std::string> oGraphToken;  // wiped after handoff to DirectorySession
  std::string sGraphEndpoint = "https://graph.microsoft.com";

  // ── Checks ────────────────────────────────────────────────────────────
  bool bIncludeOptional = false;
  bool bCheckDkim = true;
  bool bCheckDmarc = true;
  bool bCheckDeprecated = true;
  bool bCheckSrv = false;
  std::vector<std::string> vDkimSelectors{"selector1", "selector2"};
  ScoreProfile scoreProfile = ScoreProfile::Health;

  // ── Propagation monitor ───────────────────────────────────────────────
  std::vector<std::string> vMonitorResolvers{"8.8.8.8", "1.1.1.1", "9.9.9.9",
                                             "208.67.222.222"};
  int iMonitorIntervalSeconds = 30;
  int iMonitorMaxDurationSeconds = 0;  // 0 = unbounded

  /// Number of expected-record sources configured.
  int sourceCount() const;

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for DNSAUDIT_GRAPH_TOKEN.
  /// Throws ConfigError on invalid values or conflicting sources.
  static Config load();

 private:
  /// Read an env var, falling back to the file named by varName + "_FILE".
  /// Returns nullopt when neither is set.
  static std::optional<std::string> loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var, nullopt if unset or empty.
  static std::optional<std::string> getEnvOpt(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as bool (true/false/1/0/yes/no).
  static bool getEnvBool(const char* pVarName, bool bDefault);

  /// Read a comma-separated list, trimming blanks.
  static std::vector<std::string> getEnvList(const char* pVarName,
                                             std::vector<std::string> vDefault);
};

}  // namespace dnsaudit::common
