#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dnsaudit::common {

/// Closed set of record types the auditor understands.
enum class RecordType { MX, CNAME, TXT, SRV, A, AAAA };

std::string toString(RecordType type);

/// Case-insensitive parse; nullopt for anything outside the closed set.
std::optional<RecordType> parseRecordType(std::string_view svType);

/// IANA numeric RR type code (MX=15, CNAME=5, ...).
int rrTypeCode(RecordType type);

// ── Typed record payloads ──────────────────────────────────────────────────

/// Class abbreviation: mx
struct MxValue {
  int iPreference = 0;
  std::string sExchange;
};

/// Class abbreviation: cn
struct CnameValue {
  std::string sTarget;
};

/// TXT payload. A single RR may carry several character-strings; they are
/// kept apart here and joined only for comparison.
/// Class abbreviation: txt
struct TxtValue {
  std::vector<std::string> vSegments;

  std::string joined() const;
};

/// Class abbreviation: srv
struct SrvValue {
  int iPriority = 0;
  int iWeight = 0;
  int iPort = 0;
  std::string sTarget;
};

/// A / AAAA payload.
/// Class abbreviation: addr
struct AddressValue {
  std::string sAddress;
};

using TypedValue = std::variant<MxValue, CnameValue, TxtValue, SrvValue, AddressValue>;

/// Human-readable rendering used in reports and baselines.
/// MX "10 host", SRV "prio weight port target", TXT joined text.
std::string renderValue(const TypedValue& tvValue);

/// Lowercase and strip a single trailing root dot.
std::string normalizeHost(std::string_view svHost);

// ── Expected side ──────────────────────────────────────────────────────────

/// One row of "what should exist", independent of the source that produced it.
/// Class abbreviation: er
struct ExpectedRecord {
  std::string sDomain;
  std::string sLabel = "@";
  RecordType type = RecordType::TXT;
  TypedValue tvExpected;
  bool bIsOptional = false;
  int iTtl = 3600;
  std::string sSupportedService;

  /// "@" maps to the apex, anything else is prefixed to the domain.
  std::string fqdn() const;
};

// ── Actual side ────────────────────────────────────────────────────────────

/// A single answer-section RR as returned by either resolver backend.
/// Class abbreviation: rr
struct ResourceRecord {
  std::string sName;
  RecordType type = RecordType::A;
  uint32_t uTtl = 0;
  TypedValue tvValue;
};

enum class QueryStatus { Answered, NoAnswer, Fault };

/// Outcome of one query. NoAnswer covers NXDOMAIN, empty answers and network
/// failures; Fault is reserved for the query mechanism itself breaking.
/// Class abbreviation: qr
struct QueryResult {
  QueryStatus status = QueryStatus::NoAnswer;
  std::vector<ResourceRecord> vRecords;
  std::string sError;

  static QueryResult answered(std::vector<ResourceRecord> vRecords);
  static QueryResult noAnswer(std::string sReason = {});
  static QueryResult fault(std::string sError);

  bool hasRecords() const { return status == QueryStatus::Answered && !vRecords.empty(); }
};

// ── Comparison ─────────────────────────────────────────────────────────────

enum class ComparisonStatus { Match, Mismatch, Missing, Error };

std::string toString(ComparisonStatus status);
std::optional<ComparisonStatus> parseComparisonStatus(std::string_view svStatus);

/// One evaluated expected record. Never mutated after the comparator returns it.
/// Class abbreviation: cr
struct ComparisonResult {
  std::string sDomain;
  std::string sLabel;
  std::string sFqdn;
  RecordType type = RecordType::TXT;
  ComparisonStatus status = ComparisonStatus::Missing;
  std::string sExpectedValue;
  std::string sActualValue;
  std::optional<std::string> oFormatNote;
  std::optional<std::string> oDetails;
  bool bIsOptional = false;
  int iTtl = 0;
  std::string sSupportedService;

  bool operator==(const ComparisonResult&) const = default;
};

// ── Compliance ─────────────────────────────────────────────────────────────

/// Auxiliary check categories. LegacyAliases is advisory and never scored.
enum class CheckCategory { Mx, Dkim, Spf, Dmarc, DeprecatedRecords, Srv, LegacyAliases };

std::string toString(CheckCategory category);
bool isScored(CheckCategory category);

/// Facts gathered for one category by the health checker.
/// Class abbreviation: ac
struct AuxCheck {
  CheckCategory category = CheckCategory::Mx;
  bool bPresent = false;
  bool bValid = false;
  bool bLegacyFormat = false;
  bool bQueryFault = false;
  std::vector<std::string> vObserved;
  std::string sDetail;

  // SPF
  bool bMultipleRecords = false;
  int iIncludeCount = 0;
  std::string sAllQualifier;

  // DMARC
  std::string sPolicy;
  bool bHasReportAddress = false;
};

enum class ScoreProfile { Health, Readiness };
enum class HealthTier { Healthy, Warning, Issues, Critical };
enum class ReadinessPriority { Low, Medium, High, Critical };

std::string toString(ScoreProfile profile);
std::string toString(HealthTier tier);
std::string toString(ReadinessPriority priority);

/// Scored row for one category.
/// Class abbreviation: co
struct CheckOutcome {
  CheckCategory category = CheckCategory::Mx;
  bool bPassed = false;
  std::string sStatus;
  std::string sDetail;
  std::vector<std::string> vObserved;  // copied from the AuxCheck
};

/// Per-domain aggregate. Owned by the scorer until returned.
/// Class abbreviation: ca
struct ComplianceAssessment {
  std::string sDomain;
  ScoreProfile profile = ScoreProfile::Health;
  int iScore = 100;
  int iPassed = 0;
  int iApplicable = 0;
  HealthTier healthTier = HealthTier::Healthy;
  ReadinessPriority priority = ReadinessPriority::Low;
  std::vector<CheckOutcome> vOutcomes;
  std::vector<std::string> vCriticalActions;
  std::vector<std::string> vRecommendations;

  /// Tier label for the active profile.
  std::string tierName() const;
};

/// Result for one domain of a validation batch.
/// Class abbreviation: drp
struct DomainReport {
  std::string sDomain;
  bool bSkipped = false;
  std::string sSkipReason;
  std::vector<ComparisonResult> vComparisons;
  std::optional<ComplianceAssessment> oAssessment;
};

// ── Propagation ────────────────────────────────────────────────────────────

enum class MonitorState { Polling, Converged, TimedOut, Cancelled };

std::string toString(MonitorState state);

/// Class abbreviation: ps
struct PropagationState {
  std::map<std::string, std::optional<std::string>> mResolverValues;
  int iCheckCount = 0;
  int iChangeCount = 0;
  int iMatchCount = 0;
  int iPropagationPct = 0;
  std::chrono::steady_clock::time_point tpStartedAt;
  MonitorState state = MonitorState::Polling;
};

/// Emitted whenever a resolver's observed value changes between two present values.
/// Class abbreviation: pce
struct PropagationChange {
  std::string sResolverId;
  std::string sPrevious;
  std::string sCurrent;
  int iCheckNumber = 0;
};

}  // namespace dnsaudit::common
