#include "report/BaselineStore.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <chrono>
#include <ctime>
#include <fstream>

namespace dnsaudit::report {

using nlohmann::json;

std::string BaselineStore::utcTimestamp() {
  const std::time_t tNow = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tmUtc{};
  gmtime_r(&tNow, &tmUtc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmUtc);
  return buf;
}

json BaselineStore::toJson(const std::vector<common::ComparisonResult>& vResults,
                           const std::string& sCapturedAt) {
  json jArr = json::array();
  for (const auto& cr : vResults) {
    jArr.push_back({
        {"Domain", cr.sDomain},
        {"RecordType", common::toString(cr.type)},
        {"Label", cr.sLabel},
        {"ExpectedValue", cr.sExpectedValue},
        {"SupportedService", cr.sSupportedService},
        {"IsOptional", cr.bIsOptional},
        {"TTL", cr.iTtl},
        {"Status", common::toString(cr.status)},
        {"ActualValue", cr.sActualValue},
        {"CapturedAt", sCapturedAt},
    });
  }
  return jArr;
}

void BaselineStore::save(const std::string& sPath,
                         const std::vector<common::ComparisonResult>& vResults) {
  std::ofstream ofs(sPath, std::ios::trunc);
  if (!ofs) {
    throw common::ConfigError("unwritable_baseline", "Cannot write baseline file: " + sPath);
  }
  ofs << toJson(vResults, utcTimestamp()).dump(2) << '\n';
  if (!ofs) {
    throw common::ConfigError("unwritable_baseline", "Failed writing baseline file: " + sPath);
  }
  common::Logger::get()->info("Saved baseline of {} records to {}", vResults.size(), sPath);
}

std::vector<providers::FieldMap> BaselineStore::load(const std::string& sPath) {
  std::ifstream ifs(sPath);
  if (!ifs) {
    throw common::ConfigError("unreadable_baseline", "Cannot open baseline file: " + sPath);
  }

  json jDoc;
  try {
    jDoc = json::parse(ifs);
  } catch (const json::parse_error& ex) {
    throw common::ConfigError("invalid_baseline",
                              "Baseline " + sPath + " is not valid JSON: " + ex.what());
  }
  if (!jDoc.is_array()) {
    throw common::ConfigError("invalid_baseline", "Baseline " + sPath + " is not a JSON array");
  }

  std::vector<providers::FieldMap> vRows;
  vRows.reserve(jDoc.size());
  for (const auto& jEntry : jDoc) {
    try {
      vRows.push_back(providers::fieldsFromJson(jEntry));
    } catch (const common::ValidationError& ex) {
      throw common::ConfigError("invalid_baseline",
                                "Baseline " + sPath + " entry " +
                                    std::to_string(vRows.size() + 1) + ": " + ex.what());
    }
  }
  return vRows;
}

}  // namespace dnsaudit::report
