#include "core/PolicyRecords.hpp"

#include <gtest/gtest.h>

using namespace dnsaudit::core;

TEST(PolicyRecordsTest, ParsesMicrosoft365Spf) {
  auto oSpf = parseSpf("v=spf1 include:spf.protection.outlook.com -all");
  ASSERT_TRUE(oSpf.has_value());
  EXPECT_TRUE(oSpf->includesMicrosoft365());
  EXPECT_EQ(oSpf->iIncludeCount, 1);
  EXPECT_EQ(oSpf->sAllQualifier, "-all");
}

TEST(PolicyRecordsTest, NonSpfTextIsIgnored) {
  EXPECT_FALSE(parseSpf("MS=ms12345678").has_value());
  EXPECT_FALSE(parseSpf("v=spf10 include:x").has_value());
}

TEST(PolicyRecordsTest, SpfIsCaseInsensitive) {
  auto oSpf = parseSpf("V=SPF1 INCLUDE:SPF.PROTECTION.OUTLOOK.COM ~ALL");
  ASSERT_TRUE(oSpf.has_value());
  EXPECT_TRUE(oSpf->includesMicrosoft365());
  EXPECT_EQ(oSpf->sAllQualifier, "~all");
}

TEST(PolicyRecordsTest, BareAllIsPlusAll) {
  auto oSpf = parseSpf("v=spf1 a mx all");
  ASSERT_TRUE(oSpf.has_value());
  EXPECT_EQ(oSpf->sAllQualifier, "+all");
  EXPECT_FALSE(oSpf->includesMicrosoft365());
}

TEST(PolicyRecordsTest, IncludeCountIsTopLevelOnly) {
  auto oSpf = parseSpf(
      "v=spf1 include:a.example include:b.example include:c.example include:d.example "
      "include:e.example include:f.example include:g.example include:h.example "
      "include:i.example include:j.example include:k.example -all");
  ASSERT_TRUE(oSpf.has_value());
  EXPECT_EQ(oSpf->iIncludeCount, 11);
  EXPECT_GT(oSpf->iIncludeCount, kSpfLookupLimit);
}

TEST(PolicyRecordsTest, ParsesDmarcTags) {
  auto oDmarc = parseDmarc(
      "v=DMARC1; p=Reject; sp=quarantine; pct=50; rua=mailto:a@contoso.com, mailto:b@contoso.com; "
      "ruf=mailto:f@contoso.com");
  ASSERT_TRUE(oDmarc.has_value());
  EXPECT_EQ(oDmarc->sPolicy, "reject");
  EXPECT_EQ(oDmarc->sSubdomainPolicy, "quarantine");
  EXPECT_EQ(oDmarc->iPercent, 50);
  EXPECT_EQ(oDmarc->vAggregateReports.size(), 2u);
  EXPECT_EQ(oDmarc->vForensicReports.size(), 1u);
}

TEST(PolicyRecordsTest, DmarcDefaultsWithoutOptionalTags) {
  auto oDmarc = parseDmarc("v=DMARC1; p=none");
  ASSERT_TRUE(oDmarc.has_value());
  EXPECT_EQ(oDmarc->sPolicy, "none");
  EXPECT_TRUE(oDmarc->vAggregateReports.empty());
  EXPECT_EQ(oDmarc->iPercent, 100);
}

TEST(PolicyRecordsTest, UnparsablePctFallsBackTo100) {
  auto oDmarc = parseDmarc("v=DMARC1; p=quarantine; pct=abc");
  ASSERT_TRUE(oDmarc.has_value());
  EXPECT_EQ(oDmarc->iPercent, 100);
}

TEST(PolicyRecordsTest, NonDmarcTextIsIgnored) {
  EXPECT_FALSE(parseDmarc("v=spf1 -all").has_value());
}
