#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnsaudit::core {

/// Folds comparison rows and auxiliary checks into one ComplianceAssessment.
///
/// Every scored category present in the aux list is worth one point;
/// categories the caller did not request are simply absent from the list and
/// do not count. An empty pool scores 100. A mandatory comparison row that is
/// Missing or Mismatch fails the category it belongs to (MX, SPF, DMARC, DKIM,
/// SRV); rows outside those categories only produce actions.
///
/// Missing or mandatory conditions (SPF, DMARC, deprecated records, MX) land in
/// vCriticalActions; format and posture improvements land in vRecommendations.
/// Class abbreviation: sc
class ComplianceScorer {
 public:
  explicit ComplianceScorer(common::ScoreProfile profile = common::ScoreProfile::Health);
  ~ComplianceScorer();

  common::ComplianceAssessment score(const std::string& sDomain,
                                     const std::vector<common::ComparisonResult>& vComparisons,
                                     const std::vector<common::AuxCheck>& vAuxChecks) const;

  /// Health-profile tier for a numeric score.
  static common::HealthTier tierForScore(int iScore);

 private:
  common::ScoreProfile _profile;
};

}  // namespace dnsaudit::core
