#include "core/ComplianceScorer.hpp"

#include "core/PolicyRecords.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <optional>
#include <set>
#include <string_view>

namespace dnsaudit::core {

using common::AuxCheck;
using common::CheckCategory;
using common::CheckOutcome;
using common::ComparisonResult;
using common::ComparisonStatus;
using common::ComplianceAssessment;

namespace {

/// Mutable scratch state while one assessment is built.
struct Accumulator {
  ComplianceAssessment ca;
  bool bQueryFault = false;
  bool bDeprecatedFound = false;
  bool bSpfAbsent = false;
  bool bDmarcAbsent = false;
  bool bLegacyFormat = false;
  bool bLegacyAliases = false;
  std::set<CheckCategory> setFailedByComparison;

  void critical(std::string s) { ca.vCriticalActions.push_back(std::move(s)); }
  void recommend(std::string s) { ca.vRecommendations.push_back(std::move(s)); }
  void outcome(CheckCategory category, bool bPassed, std::string sStatus, std::string sDetail) {
    ca.vOutcomes.push_back(
        CheckOutcome{category, bPassed, std::move(sStatus), std::move(sDetail), {}});
  }
};

bool startsWithNoCase(const std::string& s, std::string_view svPrefix) {
  if (s.size() < svPrefix.size()) return false;
  return std::equal(svPrefix.begin(), svPrefix.end(), s.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
  });
}

/// Scored category an expected record belongs to, if any. Records such as
/// autodiscover or the MS= verification TXT belong to none.
std::optional<CheckCategory> categoryOf(const ComparisonResult& cr) {
  const std::string sFqdn = common::normalizeHost(cr.sFqdn);
  switch (cr.type) {
    case common::RecordType::MX:
      return CheckCategory::Mx;
    case common::RecordType::SRV:
      return CheckCategory::Srv;
    case common::RecordType::CNAME:
      if (sFqdn.find("._domainkey.") != std::string::npos) return CheckCategory::Dkim;
      return std::nullopt;
    case common::RecordType::TXT:
      if (startsWithNoCase(cr.sExpectedValue, "v=spf1")) return CheckCategory::Spf;
      if (startsWithNoCase(sFqdn, "_dmarc.") || startsWithNoCase(cr.sExpectedValue, "v=DMARC1")) {
        return CheckCategory::Dmarc;
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

void scoreComparisons(const std::vector<ComparisonResult>& vComparisons, Accumulator& acc) {
  for (const auto& cr : vComparisons) {
    const std::string sType = common::toString(cr.type);
    switch (cr.status) {
      case ComparisonStatus::Match:
        break;
      case ComparisonStatus::Missing:
        if (cr.bIsOptional) {
          acc.recommend("Consider adding optional " + sType + " record " + cr.sFqdn + " (" +
                        cr.sExpectedValue + ")");
        } else {
          acc.critical("Create " + sType + " record " + cr.sFqdn + " with value " +
                       cr.sExpectedValue);
        }
        break;
      case ComparisonStatus::Mismatch: {
        const std::string sAction = "Update " + sType + " record " + cr.sFqdn + " to " +
                                    cr.sExpectedValue + " (currently " + cr.sActualValue + ")";
        if (cr.bIsOptional) {
          acc.recommend(sAction);
        } else {
          acc.critical(sAction);
        }
        break;
      }
      case ComparisonStatus::Error:
        acc.bQueryFault = true;
        break;
    }

    const bool bFailed =
        cr.status == ComparisonStatus::Missing || cr.status == ComparisonStatus::Mismatch;
    if (bFailed && !cr.bIsOptional) {
      if (auto oCategory = categoryOf(cr)) {
        acc.setFailedByComparison.insert(*oCategory);
      }
    }

    if (cr.oFormatNote) {
      acc.bLegacyFormat = true;
      acc.recommend("Migrate " + sType + " record " + cr.sFqdn + " away from the " +
                    *cr.oFormatNote);
    }
  }
}

void scoreMx(const std::string& sDomain, const AuxCheck& ac, Accumulator& acc) {
  if (!ac.bPresent) {
    acc.outcome(ac.category, false, "CRITICAL - Missing", ac.sDetail);
    acc.critical("Add an MX record for " + sDomain + " pointing to Exchange Online Protection");
  } else if (!ac.bValid) {
    acc.outcome(ac.category, false, "CRITICAL - Not pointing to Microsoft 365", ac.sDetail);
    acc.critical("Point the primary MX record for " + sDomain +
                 " to Exchange Online Protection");
  } else if (ac.bLegacyFormat) {
    acc.bLegacyFormat = true;
    acc.outcome(ac.category, true, "OK - Legacy format", ac.sDetail);
    acc.recommend("Migrate the MX record for " + sDomain + " to the mx.microsoft format");
  } else {
    acc.outcome(ac.category, true, "OK", ac.sDetail);
  }
}

void scoreSpf(const std::string& sDomain, const AuxCheck& ac, Accumulator& acc) {
  if (!ac.bPresent) {
    acc.bSpfAbsent = true;
    acc.outcome(ac.category, false, "CRITICAL - Missing", ac.sDetail);
    acc.critical("Add an SPF record for " + sDomain + ": v=spf1 include:" + kM365SpfInclude +
                 " -all");
    return;
  }

  if (ac.bMultipleRecords) {
    acc.outcome(ac.category, false, "CRITICAL - Multiple SPF records", ac.sDetail);
    acc.critical("Merge the SPF records for " + sDomain + " into a single v=spf1 record");
  } else if (!ac.bValid) {
    acc.outcome(ac.category, false, "CRITICAL - Missing Microsoft 365 include", ac.sDetail);
    acc.critical(std::string("Add include:") + kM365SpfInclude + " to the SPF record for " +
                 sDomain);
  } else {
    acc.outcome(ac.category, true, "OK", ac.sDetail);
  }

  // Approximation: only top-level include: terms are counted.
  if (ac.iIncludeCount > kSpfLookupLimit) {
    acc.recommend("SPF record for " + sDomain + " has " + std::to_string(ac.iIncludeCount) +
                  " include: terms and may exceed the " + std::to_string(kSpfLookupLimit) +
                  " DNS lookup limit (nested includes not counted)");
  }
  if (ac.sAllQualifier.empty() || ac.sAllQualifier == "+all" || ac.sAllQualifier == "?all") {
    acc.recommend("Tighten the SPF all mechanism for " + sDomain + " to -all or ~all");
  }
}

void scoreDmarc(const std::string& sDomain, const AuxCheck& ac, Accumulator& acc) {
  if (!ac.bPresent) {
    acc.bDmarcAbsent = true;
    acc.outcome(ac.category, false, "CRITICAL - Missing", ac.sDetail);
    acc.critical("Add a DMARC record at _dmarc." + sDomain);
    return;
  }

  if (!ac.bValid) {
    acc.outcome(ac.category, false, "WARNING - Policy is none", ac.sDetail);
    acc.recommend("Tighten the DMARC policy for " + sDomain +
                  " from p=none to quarantine or reject");
  } else {
    acc.outcome(ac.category, true, "OK", ac.sDetail);
  }

  if (!ac.bHasReportAddress) {
    acc.recommend("Add a rua= aggregate report address to the DMARC record for " + sDomain);
  }
}

void scoreDkim(const std::string& sDomain, const AuxCheck& ac, Accumulator& acc) {
  if (!ac.bPresent) {
    acc.outcome(ac.category, false, "WARNING - Missing", ac.sDetail);
    acc.recommend("Enable DKIM signing for " + sDomain + " and publish its selector CNAMEs");
  } else if (!ac.bValid) {
    acc.outcome(ac.category, false, "WARNING - Incomplete", ac.sDetail);
    acc.recommend("Publish every DKIM selector CNAME for " + sDomain + " (" + ac.sDetail + ")");
  } else if (ac.bLegacyFormat) {
    acc.bLegacyFormat = true;
    acc.outcome(ac.category, true, "OK - Legacy format", ac.sDetail);
    acc.recommend("Migrate the DKIM CNAMEs for " + sDomain +
                  " to the dkim.mail.microsoft format");
  } else {
    acc.outcome(ac.category, true, "OK", ac.sDetail);
  }
}

void scoreDeprecated(const std::string& sDomain, const AuxCheck& ac, Accumulator& acc) {
  if (ac.bPresent) {
    acc.bDeprecatedFound = true;
    acc.outcome(ac.category, false, "CRITICAL - Deprecated record present", ac.sDetail);
    acc.critical("Remove the deprecated msoid CNAME record (msoid." + sDomain + ")");
  } else {
    acc.outcome(ac.category, true, "OK", ac.sDetail);
  }
}

void scoreSrv(const std::string& sDomain, const AuxCheck& ac, Accumulator& acc) {
  if (!ac.bPresent) {
    acc.outcome(ac.category, false, "WARNING - Missing", ac.sDetail);
    acc.recommend("Publish the _sip._tls and _sipfederationtls._tcp SRV records for " + sDomain);
  } else if (!ac.bValid) {
    acc.outcome(ac.category, false, "WARNING - Incorrect target", ac.sDetail);
    acc.recommend("Correct the SRV records for " + sDomain + " (" + ac.sDetail + ")");
  } else {
    acc.outcome(ac.category, true, "OK", ac.sDetail);
  }
}

}  // anonymous namespace

ComplianceScorer::ComplianceScorer(common::ScoreProfile profile) : _profile(profile) {}

ComplianceScorer::~ComplianceScorer() = default;

common::HealthTier ComplianceScorer::tierForScore(int iScore) {
  if (iScore >= 90) return common::HealthTier::Healthy;
  if (iScore >= 70) return common::HealthTier::Warning;
  return common::HealthTier::Critical;
}

ComplianceAssessment ComplianceScorer::score(const std::string& sDomain,
                                             const std::vector<ComparisonResult>& vComparisons,
                                             const std::vector<AuxCheck>& vAuxChecks) const {
  Accumulator acc;
  acc.ca.sDomain = sDomain;
  acc.ca.profile = _profile;

  scoreComparisons(vComparisons, acc);

  for (const auto& ac : vAuxChecks) {
    if (ac.category == CheckCategory::LegacyAliases) {
      if (ac.bQueryFault) {
        acc.bQueryFault = true;
      } else if (ac.bPresent) {
        acc.bLegacyAliases = true;
        acc.recommend("Remove the legacy Skype for Business aliases (lyncdiscover, sip) for " +
                      sDomain + " once the tenant is Teams-only");
      }
      continue;
    }

    ++acc.ca.iApplicable;
    if (ac.bQueryFault) {
      acc.bQueryFault = true;
      acc.outcome(ac.category, false, "ERROR - " + ac.sDetail, ac.sDetail);
    } else {
      switch (ac.category) {
        case CheckCategory::Mx: scoreMx(sDomain, ac, acc); break;
        case CheckCategory::Spf: scoreSpf(sDomain, ac, acc); break;
        case CheckCategory::Dmarc: scoreDmarc(sDomain, ac, acc); break;
        case CheckCategory::Dkim: scoreDkim(sDomain, ac, acc); break;
        case CheckCategory::DeprecatedRecords: scoreDeprecated(sDomain, ac, acc); break;
        case CheckCategory::Srv: scoreSrv(sDomain, ac, acc); break;
        case CheckCategory::LegacyAliases: break;
      }
    }
    acc.ca.vOutcomes.back().vObserved = ac.vObserved;
  }

  auto& ca = acc.ca;
  // A passing category still fails when one of its expected records is absent
  // or differs; the action for it is already in vCriticalActions.
  for (auto& co : ca.vOutcomes) {
    if (co.bPassed && acc.setFailedByComparison.count(co.category) > 0) {
      co.bPassed = false;
      co.sStatus = "CRITICAL - Expected record missing or different";
    }
  }
  for (const auto& co : ca.vOutcomes) {
    if (co.bPassed) ++ca.iPassed;
  }
  ca.iScore = ca.iApplicable == 0
                  ? 100
                  : static_cast<int>(std::lround(100.0 * ca.iPassed / ca.iApplicable));

  ca.healthTier = tierForScore(ca.iScore);
  if (acc.bQueryFault && ca.healthTier != common::HealthTier::Critical) {
    ca.healthTier = common::HealthTier::Issues;
  }

  if (acc.bDeprecatedFound || (acc.bSpfAbsent && acc.bDmarcAbsent)) {
    ca.priority = common::ReadinessPriority::Critical;
  } else if (acc.bLegacyFormat) {
    ca.priority = common::ReadinessPriority::High;
  } else if (acc.bLegacyAliases) {
    ca.priority = common::ReadinessPriority::Medium;
  } else {
    ca.priority = common::ReadinessPriority::Low;
  }

  return ca;
}

}  // namespace dnsaudit::core
