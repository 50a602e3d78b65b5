#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"
#include "core/PropagationMonitor.hpp"

namespace dnsaudit::report {

/// Renders core results for stdout. JSON and CSV only.
class ReportWriter {
 public:
  static nlohmann::json toJson(const common::ComparisonResult& cr);
  static nlohmann::json toJson(const common::ComplianceAssessment& ca);
  static nlohmann::json toJson(const common::DomainReport& drp);
  static nlohmann::json toJson(const std::vector<common::DomainReport>& vReports);

  /// Final snapshot of a propagation watch plus every recorded change.
  static nlohmann::json propagationSummary(const core::PropagationMonitor& pm);

  /// One CSV line per comparison row of every non-skipped domain, with header.
  static std::string toCsv(const std::vector<common::DomainReport>& vReports);

  /// RFC 4180 field quoting: quotes when the field holds a comma, quote or line break.
  static std::string csvField(const std::string& sValue);
};

}  // namespace dnsaudit::report
