#include "common/Types.hpp"

#include <algorithm>
#include <cctype>

namespace dnsaudit::common {

namespace {

std::string toUpper(std::string_view sv) {
  std::string sOut(sv);
  std::transform(sOut.begin(), sOut.end(), sOut.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return sOut;
}

}  // anonymous namespace

std::string toString(RecordType type) {
  switch (type) {
    case RecordType::MX: return "MX";
    case RecordType::CNAME: return "CNAME";
    case RecordType::TXT: return "TXT";
    case RecordType::SRV: return "SRV";
    case RecordType::A: return "A";
    case RecordType::AAAA: return "AAAA";
  }
  return "UNKNOWN";
}

std::optional<RecordType> parseRecordType(std::string_view svType) {
  const std::string sUpper = toUpper(svType);
  if (sUpper == "MX") return RecordType::MX;
  if (sUpper == "CNAME") return RecordType::CNAME;
  if (sUpper == "TXT") return RecordType::TXT;
  if (sUpper == "SRV") return RecordType::SRV;
  if (sUpper == "A") return RecordType::A;
  if (sUpper == "AAAA") return RecordType::AAAA;
  return std::nullopt;
}

int rrTypeCode(RecordType type) {
  switch (type) {
    case RecordType::A: return 1;
    case RecordType::CNAME: return 5;
    case RecordType::MX: return 15;
    case RecordType::TXT: return 16;
    case RecordType::AAAA: return 28;
    case RecordType::SRV: return 33;
  }
  return 0;
}

std::string TxtValue::joined() const {
  std::string sOut;
  for (const auto& sSeg : vSegments) {
    sOut += sSeg;
  }
  return sOut;
}

std::string renderValue(const TypedValue& tvValue) {
  struct Renderer {
    std::string operator()(const MxValue& mx) const {
      return std::to_string(mx.iPreference) + " " + mx.sExchange;
    }
    std::string operator()(const CnameValue& cn) const { return cn.sTarget; }
    std::string operator()(const TxtValue& txt) const { return txt.joined(); }
    std::string operator()(const SrvValue& srv) const {
      return std::to_string(srv.iPriority) + " " + std::to_string(srv.iWeight) + " " +
             std::to_string(srv.iPort) + " " + srv.sTarget;
    }
    std::string operator()(const AddressValue& addr) const { return addr.sAddress; }
  };
  return std::visit(Renderer{}, tvValue);
}

std::string normalizeHost(std::string_view svHost) {
  std::string sOut(svHost);
  std::transform(sOut.begin(), sOut.end(), sOut.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (!sOut.empty() && sOut.back() == '.') {
    sOut.pop_back();
  }
  return sOut;
}

std::string ExpectedRecord::fqdn() const {
  if (sLabel.empty() || sLabel == "@") {
    return sDomain;
  }
  return sLabel + "." + sDomain;
}

QueryResult QueryResult::answered(std::vector<ResourceRecord> vRecords) {
  QueryResult qr;
  qr.status = vRecords.empty() ? QueryStatus::NoAnswer : QueryStatus::Answered;
  qr.vRecords = std::move(vRecords);
  return qr;
}

QueryResult QueryResult::noAnswer(std::string sReason) {
  QueryResult qr;
  qr.status = QueryStatus::NoAnswer;
  qr.sError = std::move(sReason);
  return qr;
}

QueryResult QueryResult::fault(std::string sError) {
  QueryResult qr;
  qr.status = QueryStatus::Fault;
  qr.sError = std::move(sError);
  return qr;
}

std::string toString(ComparisonStatus status) {
  switch (status) {
    case ComparisonStatus::Match: return "Match";
    case ComparisonStatus::Mismatch: return "Mismatch";
    case ComparisonStatus::Missing: return "Missing";
    case ComparisonStatus::Error: return "Error";
  }
  return "Error";
}

std::optional<ComparisonStatus> parseComparisonStatus(std::string_view svStatus) {
  const std::string sUpper = toUpper(svStatus);
  if (sUpper == "MATCH") return ComparisonStatus::Match;
  if (sUpper == "MISMATCH") return ComparisonStatus::Mismatch;
  if (sUpper == "MISSING") return ComparisonStatus::Missing;
  if (sUpper == "ERROR") return ComparisonStatus::Error;
  return std::nullopt;
}

std::string toString(CheckCategory category) {
  switch (category) {
    case CheckCategory::Mx: return "MX";
    case CheckCategory::Dkim: return "DKIM";
    case CheckCategory::Spf: return "SPF";
    case CheckCategory::Dmarc: return "DMARC";
    case CheckCategory::DeprecatedRecords: return "DeprecatedRecords";
    case CheckCategory::Srv: return "SRV";
    case CheckCategory::LegacyAliases: return "LegacyAliases";
  }
  return "Unknown";
}

bool isScored(CheckCategory category) {
  return category != CheckCategory::LegacyAliases;
}

std::string toString(ScoreProfile profile) {
  return profile == ScoreProfile::Health ? "health" : "readiness";
}

std::string toString(HealthTier tier) {
  switch (tier) {
    case HealthTier::Healthy: return "Healthy";
    case HealthTier::Warning: return "Warning";
    case HealthTier::Issues: return "Issues";
    case HealthTier::Critical: return "Critical";
  }
  return "Critical";
}

std::string toString(ReadinessPriority priority) {
  switch (priority) {
    case ReadinessPriority::Low: return "Low";
    case ReadinessPriority::Medium: return "Medium";
    case ReadinessPriority::High: return "High";
    case ReadinessPriority::Critical: return "Critical";
  }
  return "Critical";
}

std::string ComplianceAssessment::tierName() const {
  return profile == ScoreProfile::Health ? toString(healthTier) : toString(priority);
}

std::string toString(MonitorState state) {
  switch (state) {
    case MonitorState::Polling: return "Polling";
    case MonitorState::Converged: return "Converged";
    case MonitorState::TimedOut: return "TimedOut";
    case MonitorState::Cancelled: return "Cancelled";
  }
  return "Polling";
}

}  // namespace dnsaudit::common
