#include "core/ComplianceScorer.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace dnsaudit::common;
using dnsaudit::core::ComplianceScorer;

namespace {

AuxCheck passing(CheckCategory category) {
  AuxCheck ac;
  ac.category = category;
  ac.bPresent = category != CheckCategory::DeprecatedRecords;
  ac.bValid = true;
  ac.sAllQualifier = "-all";
  ac.bHasReportAddress = true;
  ac.sPolicy = "reject";
  return ac;
}

std::vector<AuxCheck> allPassing() {
  return {passing(CheckCategory::Mx), passing(CheckCategory::Spf),
          passing(CheckCategory::Dmarc), passing(CheckCategory::Dkim),
          passing(CheckCategory::DeprecatedRecords)};
}

AuxCheck& find(std::vector<AuxCheck>& vChecks, CheckCategory category) {
  return *std::find_if(vChecks.begin(), vChecks.end(),
                       [category](const AuxCheck& ac) { return ac.category == category; });
}

bool contains(const std::vector<std::string>& v, const std::string& sNeedle) {
  return std::any_of(v.begin(), v.end(), [&](const std::string& s) {
    return s.find(sNeedle) != std::string::npos;
  });
}

const CheckOutcome& outcome(const ComplianceAssessment& ca, CheckCategory category) {
  return *std::find_if(ca.vOutcomes.begin(), ca.vOutcomes.end(),
                       [category](const CheckOutcome& co) { return co.category == category; });
}

}  // namespace

TEST(ComplianceScorerTest, AllPassingIsHealthy) {
  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {}, allPassing());
  EXPECT_EQ(ca.iScore, 100);
  EXPECT_EQ(ca.iApplicable, 5);
  EXPECT_EQ(ca.healthTier, HealthTier::Healthy);
  EXPECT_TRUE(ca.vCriticalActions.empty());
  EXPECT_TRUE(ca.vRecommendations.empty());
}

TEST(ComplianceScorerTest, ZeroApplicableChecksScore100) {
  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {}, {});
  EXPECT_EQ(ca.iApplicable, 0);
  EXPECT_EQ(ca.iScore, 100);
  EXPECT_EQ(ca.healthTier, HealthTier::Healthy);
}

TEST(ComplianceScorerTest, MissingDmarcIsCritical) {
  auto vChecks = allPassing();
  auto& acDmarc = find(vChecks, CheckCategory::Dmarc);
  acDmarc.bPresent = false;
  acDmarc.bValid = false;

  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {}, vChecks);
  EXPECT_EQ(outcome(ca, CheckCategory::Dmarc).sStatus, "CRITICAL - Missing");
  EXPECT_TRUE(contains(ca.vCriticalActions, "_dmarc.contoso.com"));
  EXPECT_FALSE(contains(ca.vRecommendations, "DMARC"));
  EXPECT_EQ(ca.iScore, 80);
  EXPECT_EQ(ca.healthTier, HealthTier::Warning);
}

TEST(ComplianceScorerTest, DeprecatedMsoidIsCriticalRegardlessOfTarget) {
  for (const std::string sTarget : {"clientconfig.microsoftonline-p.net", "anything.example"}) {
    auto vChecks = allPassing();
    auto& acDep = find(vChecks, CheckCategory::DeprecatedRecords);
    acDep.bPresent = true;
    acDep.bValid = false;
    acDep.vObserved = {"msoid.contoso.com -> " + sTarget};

    ComplianceScorer sc(ScoreProfile::Readiness);
    auto ca = sc.score("contoso.com", {}, vChecks);
    ASSERT_EQ(ca.vCriticalActions.size(), 1u);
    EXPECT_EQ(ca.vCriticalActions.front(),
              "Remove the deprecated msoid CNAME record (msoid.contoso.com)");
    EXPECT_EQ(ca.priority, ReadinessPriority::Critical);
  }
}

TEST(ComplianceScorerTest, DmarcPolicyNoneIsRecommendationOnly) {
  auto vChecks = allPassing();
  auto& acDmarc = find(vChecks, CheckCategory::Dmarc);
  acDmarc.bValid = false;
  acDmarc.sPolicy = "none";
  acDmarc.bHasReportAddress = false;

  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {}, vChecks);
  EXPECT_TRUE(ca.vCriticalActions.empty());
  EXPECT_TRUE(contains(ca.vRecommendations, "p=none"));
  EXPECT_TRUE(contains(ca.vRecommendations, "rua="));
  EXPECT_EQ(outcome(ca, CheckCategory::Dmarc).sStatus, "WARNING - Policy is none");
}

TEST(ComplianceScorerTest, SpfBuckets) {
  auto vChecks = allPassing();
  auto& acSpf = find(vChecks, CheckCategory::Spf);
  acSpf.bValid = false;
  acSpf.iIncludeCount = 12;
  acSpf.sAllQualifier = "?all";

  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {}, vChecks);
  EXPECT_TRUE(contains(ca.vCriticalActions, "include:spf.protection.outlook.com"));
  EXPECT_TRUE(contains(ca.vRecommendations, "lookup limit"));
  EXPECT_TRUE(contains(ca.vRecommendations, "all mechanism"));
}

TEST(ComplianceScorerTest, MissingMxIsCritical) {
  auto vChecks = allPassing();
  auto& acMx = find(vChecks, CheckCategory::Mx);
  acMx.bPresent = false;
  acMx.bValid = false;

  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {}, vChecks);
  EXPECT_TRUE(contains(ca.vCriticalActions, "MX record"));
}

TEST(ComplianceScorerTest, LegacyFormatsAreRecommendationsAndHighPriority) {
  auto vChecks = allPassing();
  find(vChecks, CheckCategory::Mx).bLegacyFormat = true;
  find(vChecks, CheckCategory::Dkim).bLegacyFormat = true;

  ComplianceScorer sc(ScoreProfile::Readiness);
  auto ca = sc.score("contoso.com", {}, vChecks);
  EXPECT_EQ(ca.iScore, 100);
  EXPECT_TRUE(ca.vCriticalActions.empty());
  EXPECT_TRUE(contains(ca.vRecommendations, "mx.microsoft"));
  EXPECT_TRUE(contains(ca.vRecommendations, "dkim.mail.microsoft"));
  EXPECT_EQ(outcome(ca, CheckCategory::Mx).sStatus, "OK - Legacy format");
  EXPECT_EQ(ca.priority, ReadinessPriority::High);
  EXPECT_EQ(ca.tierName(), "High");
}

TEST(ComplianceScorerTest, OnlyLegacyAliasesIsMedium) {
  auto vChecks = allPassing();
  AuxCheck acAliases;
  acAliases.category = CheckCategory::LegacyAliases;
  acAliases.bPresent = true;
  acAliases.bValid = true;
  vChecks.push_back(acAliases);

  ComplianceScorer sc(ScoreProfile::Readiness);
  auto ca = sc.score("contoso.com", {}, vChecks);
  EXPECT_EQ(ca.priority, ReadinessPriority::Medium);
  EXPECT_EQ(ca.iApplicable, 5);
  EXPECT_TRUE(contains(ca.vRecommendations, "Skype for Business"));
}

TEST(ComplianceScorerTest, SpfAndDmarcBothAbsentIsCriticalPriority) {
  auto vChecks = allPassing();
  find(vChecks, CheckCategory::Spf) = AuxCheck{CheckCategory::Spf};
  find(vChecks, CheckCategory::Dmarc) = AuxCheck{CheckCategory::Dmarc};

  ComplianceScorer sc(ScoreProfile::Readiness);
  auto ca = sc.score("contoso.com", {}, vChecks);
  EXPECT_EQ(ca.priority, ReadinessPriority::Critical);
  EXPECT_EQ(ca.iScore, 60);
}

TEST(ComplianceScorerTest, NothingOutstandingIsLowPriority) {
  ComplianceScorer sc(ScoreProfile::Readiness);
  EXPECT_EQ(sc.score("contoso.com", {}, allPassing()).priority, ReadinessPriority::Low);
}

TEST(ComplianceScorerTest, TierThresholds) {
  EXPECT_EQ(ComplianceScorer::tierForScore(100), HealthTier::Healthy);
  EXPECT_EQ(ComplianceScorer::tierForScore(90), HealthTier::Healthy);
  EXPECT_EQ(ComplianceScorer::tierForScore(89), HealthTier::Warning);
  EXPECT_EQ(ComplianceScorer::tierForScore(70), HealthTier::Warning);
  EXPECT_EQ(ComplianceScorer::tierForScore(69), HealthTier::Critical);
  EXPECT_EQ(ComplianceScorer::tierForScore(0), HealthTier::Critical);
}

TEST(ComplianceScorerTest, QueryFaultDowngradesToIssues) {
  auto vChecks = allPassing();
  auto& acDkim = find(vChecks, CheckCategory::Dkim);
  acDkim.bQueryFault = true;
  acDkim.sDetail = "selector1._domainkey.contoso.com: timeout";

  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {}, vChecks);
  EXPECT_EQ(ca.iScore, 80);
  EXPECT_EQ(ca.healthTier, HealthTier::Issues);
  EXPECT_EQ(outcome(ca, CheckCategory::Dkim).sStatus.rfind("ERROR - ", 0), 0u);
}

TEST(ComplianceScorerTest, ComparisonRowsFeedBuckets) {
  ComparisonResult crMissing;
  crMissing.sFqdn = "autodiscover.contoso.com";
  crMissing.type = RecordType::CNAME;
  crMissing.status = ComparisonStatus::Missing;
  crMissing.sExpectedValue = "autodiscover.outlook.com";

  ComparisonResult crOptional = crMissing;
  crOptional.sFqdn = "enterpriseenrollment.contoso.com";
  crOptional.bIsOptional = true;

  ComparisonResult crLegacy;
  crLegacy.sFqdn = "contoso.com";
  crLegacy.type = RecordType::MX;
  crLegacy.status = ComparisonStatus::Match;
  crLegacy.oFormatNote = "legacy MX format";

  ComplianceScorer sc(ScoreProfile::Readiness);
  auto ca = sc.score("contoso.com", {crMissing, crOptional, crLegacy}, {});
  ASSERT_EQ(ca.vCriticalActions.size(), 1u);
  EXPECT_NE(ca.vCriticalActions[0].find("autodiscover.contoso.com"), std::string::npos);
  EXPECT_TRUE(contains(ca.vRecommendations, "enterpriseenrollment.contoso.com"));
  EXPECT_TRUE(contains(ca.vRecommendations, "legacy MX format"));
  EXPECT_EQ(ca.priority, ReadinessPriority::High);
}

TEST(ComplianceScorerTest, ActionsKeepDetectionOrderWithoutDedup) {
  ComparisonResult cr;
  cr.sFqdn = "contoso.com";
  cr.type = RecordType::TXT;
  cr.status = ComparisonStatus::Missing;
  cr.sExpectedValue = "MS=ms1";

  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {cr, cr}, {});
  ASSERT_EQ(ca.vCriticalActions.size(), 2u);
  EXPECT_EQ(ca.vCriticalActions[0], ca.vCriticalActions[1]);
}

TEST(ComplianceScorerTest, FailedMandatoryRecordsCountAgainstTheirCategory) {
  ComparisonResult crMx;
  crMx.sFqdn = "contoso.com";
  crMx.type = RecordType::MX;
  crMx.status = ComparisonStatus::Missing;
  crMx.sExpectedValue = "0 contoso-com.mail.protection.outlook.com";

  ComparisonResult crDkim;
  crDkim.sFqdn = "selector1._domainkey.contoso.com";
  crDkim.type = RecordType::CNAME;
  crDkim.status = ComparisonStatus::Mismatch;
  crDkim.sExpectedValue = "selector1-contoso-com._domainkey.contoso.onmicrosoft.com";
  crDkim.sActualValue = "other.example.net";

  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {crMx, crDkim}, allPassing());
  EXPECT_EQ(ca.iScore, 60);
  EXPECT_EQ(ca.healthTier, HealthTier::Critical);
  EXPECT_FALSE(outcome(ca, CheckCategory::Mx).bPassed);
  EXPECT_EQ(outcome(ca, CheckCategory::Mx).sStatus, "CRITICAL - Expected record missing or different");
  EXPECT_FALSE(outcome(ca, CheckCategory::Dkim).bPassed);
  EXPECT_TRUE(outcome(ca, CheckCategory::Spf).bPassed);
  EXPECT_EQ(ca.vCriticalActions.size(), 2u);
}

TEST(ComplianceScorerTest, OptionalOrUncategorizedRowsLeaveScoreAlone) {
  ComparisonResult crAutodiscover;
  crAutodiscover.sFqdn = "autodiscover.contoso.com";
  crAutodiscover.type = RecordType::CNAME;
  crAutodiscover.status = ComparisonStatus::Missing;
  crAutodiscover.sExpectedValue = "autodiscover.outlook.com";

  ComparisonResult crSpf;
  crSpf.sFqdn = "contoso.com";
  crSpf.type = RecordType::TXT;
  crSpf.status = ComparisonStatus::Missing;
  crSpf.sExpectedValue = "v=spf1 include:spf.protection.outlook.com -all";
  crSpf.bIsOptional = true;

  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {crAutodiscover, crSpf}, allPassing());
  EXPECT_EQ(ca.iScore, 100);
  EXPECT_EQ(ca.vCriticalActions.size(), 1u);
  EXPECT_EQ(ca.vRecommendations.size(), 1u);
}

TEST(ComplianceScorerTest, OutcomesCarryObservedValues) {
  auto vChecks = allPassing();
  find(vChecks, CheckCategory::Mx).vObserved = {"0 contoso-com.o-v1.mx.microsoft"};

  ComplianceScorer sc;
  auto ca = sc.score("contoso.com", {}, vChecks);
  const auto& co = outcome(ca, CheckCategory::Mx);
  ASSERT_EQ(co.vObserved.size(), 1u);
  EXPECT_EQ(co.vObserved[0], "0 contoso-com.o-v1.mx.microsoft");
  EXPECT_TRUE(outcome(ca, CheckCategory::Spf).vObserved.empty());
}
