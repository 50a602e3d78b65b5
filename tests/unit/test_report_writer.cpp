#include "report/ReportWriter.hpp"

#include <gtest/gtest.h>

using namespace dnsaudit::common;
using dnsaudit::report::ReportWriter;

namespace {

DomainReport sampleReport() {
  ComparisonResult cr;
  cr.sDomain = "contoso.com";
  cr.sLabel = "@";
  cr.sFqdn = "contoso.com";
  cr.type = RecordType::TXT;
  cr.status = ComparisonStatus::Mismatch;
  cr.sExpectedValue = "v=spf1 include:spf.protection.outlook.com -all";
  cr.sActualValue = "a=1 | b=\"2\"";

  DomainReport drp;
  drp.sDomain = "contoso.com";
  drp.vComparisons.push_back(cr);
  drp.oAssessment = ComplianceAssessment{};
  drp.oAssessment->sDomain = "contoso.com";
  return drp;
}

}  // namespace

TEST(ReportWriterTest, CsvFieldQuotesOnlyWhenNeeded) {
  EXPECT_EQ(ReportWriter::csvField("plain"), "plain");
  EXPECT_EQ(ReportWriter::csvField("a,b"), "\"a,b\"");
  EXPECT_EQ(ReportWriter::csvField("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(ReportWriterTest, CsvHasHeaderAndOneLinePerRow) {
  const std::string sCsv = ReportWriter::toCsv({sampleReport()});
  EXPECT_EQ(sCsv.rfind("Domain,FQDN,RecordType,Status,", 0), 0u);
  EXPECT_NE(sCsv.find("contoso.com,contoso.com,TXT,Mismatch,"), std::string::npos);
  EXPECT_NE(sCsv.find("\"a=1 | b=\"\"2\"\"\""), std::string::npos);
}

TEST(ReportWriterTest, SkippedDomainHasReasonOnly) {
  DomainReport drp;
  drp.sDomain = "fabrikam.com";
  drp.bSkipped = true;
  drp.sSkipReason = "No expected records";
  auto j = ReportWriter::toJson(drp);
  EXPECT_TRUE(j["skipped"].get<bool>());
  EXPECT_EQ(j["skipReason"], "No expected records");
  EXPECT_FALSE(j.contains("comparisons"));
}

TEST(ReportWriterTest, JsonCarriesAssessment) {
  auto j = ReportWriter::toJson(std::vector<DomainReport>{sampleReport()});
  ASSERT_EQ(j.size(), 1u);
  EXPECT_EQ(j[0]["comparisons"][0]["status"], "Mismatch");
  EXPECT_TRUE(j[0]["comparisons"][0]["formatNote"].is_null());
  EXPECT_EQ(j[0]["assessment"]["score"], 100);
  EXPECT_EQ(j[0]["assessment"]["tier"], "Healthy");
}

TEST(ReportWriterTest, OutcomesListObservedValues) {
  ComplianceAssessment ca;
  ca.sDomain = "contoso.com";
  ca.vOutcomes.push_back(CheckOutcome{CheckCategory::Mx, true, "OK", "1 MX record",
                                      {"0 contoso-com.mail.protection.outlook.com"}});
  auto j = ReportWriter::toJson(ca);
  ASSERT_EQ(j["outcomes"].size(), 1u);
  EXPECT_EQ(j["outcomes"][0]["category"], toString(CheckCategory::Mx));
  ASSERT_EQ(j["outcomes"][0]["observed"].size(), 1u);
  EXPECT_EQ(j["outcomes"][0]["observed"][0], "0 contoso-com.mail.protection.outlook.com");
}
