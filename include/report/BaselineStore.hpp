#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "providers/RecordMapping.hpp"

namespace dnsaudit::report {

/// Reads and writes baseline snapshots: a JSON array of flat objects keyed
/// Domain, RecordType, Label, ExpectedValue, SupportedService, IsOptional,
/// TTL, Status, ActualValue, CapturedAt.
/// Class abbreviation: bs
class BaselineStore {
 public:
  /// Throws ConfigError if the file cannot be written.
  static void save(const std::string& sPath,
                   const std::vector<common::ComparisonResult>& vResults);

  /// Throws ConfigError if the file is unreadable or not a JSON array of objects.
  static std::vector<providers::FieldMap> load(const std::string& sPath);

  static nlohmann::json toJson(const std::vector<common::ComparisonResult>& vResults,
                               const std::string& sCapturedAt);

  /// Current UTC time as ISO 8601 ("2024-05-01T12:00:00Z").
  static std::string utcTimestamp();
};

}  // namespace dnsaudit::report
