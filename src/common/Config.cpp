#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace dnsaudit::common {

std::string toString(ResolverBackend backend) {
  return backend == ResolverBackend::Standard ? "standard" : "doh";
}

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

std::optional<std::string> Config::getEnvOpt(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return std::nullopt;
  }
  return sValue;
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    size_t nPos = 0;
    const int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) {
      throw std::invalid_argument(sValue);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw ConfigError("invalid_integer",
                      std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  if (sValue == "true" || sValue == "1" || sValue == "yes") return true;
  if (sValue == "false" || sValue == "0" || sValue == "no") return false;
  throw ConfigError("invalid_boolean",
                    std::string("Invalid boolean value for ") + pVarName + ": " + sValue);
}

std::vector<std::string> Config::getEnvList(const char* pVarName,
                                            std::vector<std::string> vDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return vDefault;
  }

  std::vector<std::string> vOut;
  std::istringstream iss(sValue);
  std::string sItem;
  while (std::getline(iss, sItem, ',')) {
    const auto nFirst = sItem.find_first_not_of(" \t");
    if (nFirst == std::string::npos) continue;
    const auto nLast = sItem.find_last_not_of(" \t");
    vOut.push_back(sItem.substr(nFirst, nLast - nFirst + 1));
  }
  return vOut;
}

std::optional<std::string> Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    return std::nullopt;
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ConfigError("unreadable_secret",
                      "Cannot open secret file specified by " + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ConfigError("empty_secret",
                      "Secret file is empty: " + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

int Config::sourceCount() const {
  return (oExpectedCsvPath ? 1 : 0) + (oExpectedJsonPath ? 1 : 0) + (oBaselinePath ? 1 : 0) +
         (oGraphToken ? 1 : 0);
}

Config Config::load() {
  Config cfg;

  const std::string sLogLevel = getEnv("DNSAUDIT_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Resolver ───────────────────────────────────────────────────────────
  const std::string sBackend = getEnv("DNSAUDIT_RESOLVER_BACKEND");
  if (sBackend.empty() || sBackend == "standard") {
    cfg.backend = ResolverBackend::Standard;
  } else if (sBackend == "doh") {
    cfg.backend = ResolverBackend::DoH;
  } else {
    throw ConfigError("invalid_backend",
                      "DNSAUDIT_RESOLVER_BACKEND must be 'standard' or 'doh' (got '" +
                          sBackend + "')");
  }
  cfg.oDnsServer = getEnvOpt("DNSAUDIT_DNS_SERVER");
  if (auto oEndpoint = getEnvOpt("DNSAUDIT_DOH_ENDPOINT")) {
    cfg.sDohEndpoint = *oEndpoint;
  }
  cfg.iQueryTimeoutMs = getEnvInt("DNSAUDIT_QUERY_TIMEOUT_MS", 5000);

  // ── Concurrency ────────────────────────────────────────────────────────
  cfg.iThreadPoolSize = getEnvInt("DNSAUDIT_THREAD_POOL_SIZE", 0);
  cfg.iMaxConcurrentQueries = getEnvInt("DNSAUDIT_MAX_CONCURRENT_QUERIES", 8);

  // ── Sources ────────────────────────────────────────────────────────────
  cfg.oExpectedCsvPath = getEnvOpt("DNSAUDIT_EXPECTED_CSV");
  cfg.oExpectedJsonPath = getEnvOpt("DNSAUDIT_EXPECTED_JSON");
  cfg.oBaselinePath = getEnvOpt("DNSAUDIT_BASELINE_FILE");
  cfg.oGraphToken = loadSecret("DNSAUDIT_GRAPH_TOKEN");
  if (auto oGraph = getEnvOpt("DNSAUDIT_GRAPH_ENDPOINT")) {
    cfg.sGraphEndpoint = *oGraph;
  }

  // ── Checks ─────────────────────────────────────────────────────────────
  cfg.bIncludeOptional = getEnvBool("DNSAUDIT_INCLUDE_OPTIONAL", false);
  cfg.bCheckDkim = getEnvBool("DNSAUDIT_CHECK_DKIM", true);
  cfg.bCheckDmarc = getEnvBool("DNSAUDIT_CHECK_DMARC", true);
  cfg.bCheckDeprecated = getEnvBool("DNSAUDIT_CHECK_DEPRECATED", true);
  cfg.bCheckSrv = getEnvBool("DNSAUDIT_CHECK_SRV", false);
  cfg.vDkimSelectors = getEnvList("DNSAUDIT_DKIM_SELECTORS", cfg.vDkimSelectors);

  const std::string sProfile = getEnv("DNSAUDIT_SCORE_PROFILE");
  if (sProfile.empty() || sProfile == "health") {
    cfg.scoreProfile = ScoreProfile::Health;
  } else if (sProfile == "readiness") {
    cfg.scoreProfile = ScoreProfile::Readiness;
  } else {
    throw ConfigError("invalid_profile",
                      "DNSAUDIT_SCORE_PROFILE must be 'health' or 'readiness' (got '" +
                          sProfile + "')");
  }

  // ── Monitor ────────────────────────────────────────────────────────────
  cfg.vMonitorResolvers = getEnvList("DNSAUDIT_MONITOR_RESOLVERS", cfg.vMonitorResolvers);
  cfg.iMonitorIntervalSeconds = getEnvInt("DNSAUDIT_MONITOR_INTERVAL_SECONDS", 30);
  cfg.iMonitorMaxDurationSeconds = getEnvInt("DNSAUDIT_MONITOR_MAX_DURATION_SECONDS", 0);

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.sourceCount() > 1) {
    throw ConfigError("conflicting_sources",
                      "At most one of DNSAUDIT_EXPECTED_CSV, DNSAUDIT_EXPECTED_JSON, "
                      "DNSAUDIT_BASELINE_FILE and DNSAUDIT_GRAPH_TOKEN may be set");
  }

  if (cfg.iQueryTimeoutMs <= 0) {
    throw ConfigError("invalid_timeout",
                      "DNSAUDIT_QUERY_TIMEOUT_MS must be > 0 (got " +
                          std::to_string(cfg.iQueryTimeoutMs) + ")");
  }

  if (cfg.iThreadPoolSize < 0) {
    throw ConfigError("invalid_pool_size",
                      "DNSAUDIT_THREAD_POOL_SIZE must be >= 0 (got " +
                          std::to_string(cfg.iThreadPoolSize) + ")");
  }

  if (cfg.iMaxConcurrentQueries < 1) {
    throw ConfigError("invalid_concurrency",
                      "DNSAUDIT_MAX_CONCURRENT_QUERIES must be >= 1 (got " +
                          std::to_string(cfg.iMaxConcurrentQueries) + ")");
  }

  if (cfg.iMonitorIntervalSeconds < 1) {
    throw ConfigError("invalid_interval",
                      "DNSAUDIT_MONITOR_INTERVAL_SECONDS must be >= 1 (got " +
                          std::to_string(cfg.iMonitorIntervalSeconds) + ")");
  }

  if (cfg.iMonitorMaxDurationSeconds < 0) {
    throw ConfigError("invalid_duration",
                      "DNSAUDIT_MONITOR_MAX_DURATION_SECONDS must be >= 0 (got " +
                          std::to_string(cfg.iMonitorMaxDurationSeconds) + ")");
  }

  if (cfg.vMonitorResolvers.empty()) {
    throw ConfigError("no_resolvers", "DNSAUDIT_MONITOR_RESOLVERS must name at least one resolver");
  }

  return cfg;
}

}  // namespace dnsaudit::common
