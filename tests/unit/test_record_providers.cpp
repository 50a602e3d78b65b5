#include "providers/FileRecordProvider.hpp"
#include "providers/GraphRecordProvider.hpp"
#include "providers/RecordMapping.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <unistd.h>

#include "common/Errors.hpp"

using namespace dnsaudit::common;
using namespace dnsaudit::providers;

namespace {

class TempFile {
 public:
  TempFile(const std::string& sSuffix, const std::string& sContent) {
    _pPath = std::filesystem::temp_directory_path() /
             ("dnsaudit_" + std::to_string(::getpid()) + "_" + std::to_string(++s_iCounter) +
              sSuffix);
    std::ofstream ofs(_pPath, std::ios::binary);
    ofs << sContent;
  }
  ~TempFile() { std::filesystem::remove(_pPath); }

  std::string path() const { return _pPath.string(); }

 private:
  static inline int s_iCounter = 0;
  std::filesystem::path _pPath;
};

std::string configErrorCode(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const ConfigError& ex) {
    return ex._sErrorCode;
  }
  return "";
}

}  // namespace

// ── Field mapping ──────────────────────────────────────────────────────────

TEST(RecordMappingTest, CanonicalFieldFoldsAliases) {
  EXPECT_EQ(canonicalField("DomainName"), "domain");
  EXPECT_EQ(canonicalField("Host"), "label");
  EXPECT_EQ(canonicalField("Record_Type"), "recordtype");
  EXPECT_EQ(canonicalField("mailExchange"), "expectedvalue");
  EXPECT_EQ(canonicalField("Expected Value"), "expectedvalue");
  EXPECT_EQ(canonicalField("IsOptional"), "isoptional");
  EXPECT_EQ(canonicalField("Service"), "service");
  EXPECT_EQ(canonicalField("Whatever"), "whatever");
}

TEST(RecordMappingTest, FirstNonEmptyAliasWins) {
  auto mFields = canonicalize({{"Data", ""}, {"Value", "v=spf1 -all"}});
  EXPECT_EQ(mFields["expectedvalue"], "v=spf1 -all");
}

TEST(RecordMappingTest, MapsFlatRow) {
  auto er = toExpectedRecord(canonicalize({{"Domain", "Contoso.com."},
                                           {"RecordType", "mx"},
                                           {"Label", "@"},
                                           {"ExpectedValue", "0 contoso-com.mail.protection.outlook.com"},
                                           {"IsOptional", "FALSE"},
                                           {"TTL", "3600"},
                                           {"SupportedService", "Email"}}));
  EXPECT_EQ(er.sDomain, "contoso.com");
  EXPECT_EQ(er.type, RecordType::MX);
  EXPECT_EQ(er.sLabel, "@");
  EXPECT_FALSE(er.bIsOptional);
  EXPECT_EQ(er.sSupportedService, "Email");
  const auto& mx = std::get<MxValue>(er.tvExpected);
  EXPECT_EQ(mx.iPreference, 0);
  EXPECT_EQ(mx.sExchange, "contoso-com.mail.protection.outlook.com");
}

TEST(RecordMappingTest, FullyQualifiedLabelBecomesRelative) {
  auto er = toExpectedRecord(canonicalize({{"Domain", "contoso.com"},
                                           {"Type", "CNAME"},
                                           {"Host", "autodiscover.contoso.com"},
                                           {"Target", "autodiscover.outlook.com"}}));
  EXPECT_EQ(er.sLabel, "autodiscover");
  EXPECT_EQ(er.fqdn(), "autodiscover.contoso.com");
}

TEST(RecordMappingTest, BareMxHostUsesPreferenceField) {
  auto er = toExpectedRecord(canonicalize({{"Domain", "contoso.com"},
                                           {"RecordType", "MX"},
                                           {"MailExchange", "mx.contoso.com"},
                                           {"Preference", "10"}}));
  EXPECT_EQ(std::get<MxValue>(er.tvExpected).iPreference, 10);
}

TEST(RecordMappingTest, TxtKeepsSurroundingSpaces) {
  auto erTxt = toExpectedRecord(canonicalize({{"Domain", "contoso.com"},
                                              {"RecordType", "TXT"},
                                              {"ExpectedValue", " padded text "}}));
  const auto& txt = std::get<TxtValue>(erTxt.tvExpected);
  ASSERT_EQ(txt.vSegments.size(), 1u);
  EXPECT_EQ(txt.vSegments[0], " padded text ");

  auto erCname = toExpectedRecord(canonicalize({{"Domain", "contoso.com"},
                                                {"RecordType", "CNAME"},
                                                {"Label", "autodiscover"},
                                                {"ExpectedValue", " autodiscover.outlook.com "}}));
  EXPECT_EQ(std::get<CnameValue>(erCname.tvExpected).sTarget, "autodiscover.outlook.com");
}

TEST(RecordMappingTest, SrvNeedsAPort) {
  FieldMap mFields{{"domain", "contoso.com"},
                   {"recordtype", "SRV"},
                   {"expectedvalue", "sipdir.online.lync.com"}};
  EXPECT_THROW(toExpectedRecord(mFields), ValidationError);
  mFields["port"] = "443";
  auto er = toExpectedRecord(mFields);
  EXPECT_EQ(std::get<SrvValue>(er.tvExpected).iPort, 443);
}

TEST(RecordMappingTest, RejectsBadRows) {
  const FieldMap mNoDomain{{"recordtype", "TXT"}, {"expectedvalue", "x"}};
  const FieldMap mBadType{{"domain", "contoso.com"}, {"recordtype", "PTR"}, {"expectedvalue", "x"}};
  const FieldMap mNoValue{{"domain", "contoso.com"}, {"recordtype", "TXT"}};
  const FieldMap mNegativeTtl{
      {"domain", "contoso.com"}, {"recordtype", "TXT"}, {"expectedvalue", "x"}, {"ttl", "-5"}};

  EXPECT_THROW(toExpectedRecord(mNoDomain), ValidationError);
  EXPECT_THROW(toExpectedRecord(mBadType), ValidationError);
  EXPECT_THROW(toExpectedRecord(mNoValue), ValidationError);
  EXPECT_THROW(toExpectedRecord(mNegativeTtl), ValidationError);
}

// ── CSV ────────────────────────────────────────────────────────────────────

TEST(CsvRecordProviderTest, ParsesQuotedFields) {
  auto vRows = CsvRecordProvider::parseCsv(
      "a,b,c\r\n\"x, y\",\"say \"\"hi\"\"\",\"line\nbreak\"\r\n\r\n1,2,3");
  ASSERT_EQ(vRows.size(), 3u);
  EXPECT_EQ(vRows[1][0], "x, y");
  EXPECT_EQ(vRows[1][1], "say \"hi\"");
  EXPECT_EQ(vRows[1][2], "line\nbreak");
  EXPECT_EQ(vRows[2][2], "3");
}

TEST(CsvRecordProviderTest, KeepsEmptyTrailingField) {
  auto vRows = CsvRecordProvider::parseCsv("a,b,\n");
  ASSERT_EQ(vRows.size(), 1u);
  EXPECT_EQ(vRows[0].size(), 3u);
}

TEST(CsvRecordProviderTest, UnterminatedQuoteThrows) {
  EXPECT_THROW(CsvRecordProvider::parseCsv("a,\"b\n"), ValidationError);
}

TEST(CsvRecordProviderTest, LoadsAndFiltersByDomain) {
  TempFile tf(".csv",
              "\xEF\xBB\xBF"
              "Domain,RecordType,Label,ExpectedValue,IsOptional\n"
              "contoso.com,TXT,@,\"v=spf1 include:spf.protection.outlook.com -all\",false\n"
              "contoso.com,CNAME,autodiscover,autodiscover.outlook.com,false\n"
              "fabrikam.com,TXT,@,MS=ms1,true\n");
  CsvRecordProvider csv(tf.path());
  EXPECT_EQ(csv.name(), "csv");
  EXPECT_EQ(csv.recordCount(), 3u);

  auto vRecords = csv.fetch("CONTOSO.COM");
  ASSERT_EQ(vRecords.size(), 2u);
  EXPECT_EQ(vRecords[0].type, RecordType::TXT);
  EXPECT_EQ(vRecords[1].sLabel, "autodiscover");

  EXPECT_TRUE(csv.fetch("fabrikam.com")[0].bIsOptional);
  EXPECT_THROW(csv.fetch("unknown.example"), ProviderError);
}

TEST(CsvRecordProviderTest, BadRowNamesTheRow) {
  TempFile tf(".csv", "Domain,RecordType,ExpectedValue\ncontoso.com,TXT,x\ncontoso.com,BOGUS,y\n");
  try {
    CsvRecordProvider csv(tf.path());
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& ex) {
    EXPECT_EQ(ex._sErrorCode, "invalid_record");
    EXPECT_NE(std::string(ex.what()).find("row 2"), std::string::npos);
  }
}

TEST(CsvRecordProviderTest, MissingFileIsConfigError) {
  EXPECT_EQ(configErrorCode([] { CsvRecordProvider csv("/nonexistent/dnsaudit.csv"); }),
            "unreadable_source");
}

// ── JSON ───────────────────────────────────────────────────────────────────

TEST(JsonRecordProviderTest, LoadsFlatArray) {
  TempFile tf(".json", R"([
    {"Domain": "contoso.com", "RecordType": "MX", "Label": "@",
     "ExpectedValue": "0 contoso-com.mail.protection.outlook.com", "IsOptional": false, "TTL": 3600},
    {"Domain": "contoso.com", "RecordType": "SRV", "Label": "_sip._tls",
     "ExpectedValue": "100 1 443 sipdir.online.lync.com", "IsOptional": true}
  ])");
  JsonRecordProvider jrp(tf.path());
  auto vRecords = jrp.fetch("contoso.com");
  ASSERT_EQ(vRecords.size(), 2u);
  EXPECT_EQ(vRecords[1].type, RecordType::SRV);
  EXPECT_TRUE(vRecords[1].bIsOptional);
  EXPECT_EQ(vRecords[1].fqdn(), "_sip._tls.contoso.com");
}

TEST(JsonRecordProviderTest, AcceptsDirectoryEnvelope) {
  TempFile tf(".json", R"({"value": [
    {"domain": "contoso.com", "recordType": "Txt", "label": "contoso.com",
     "text": "MS=ms12345678", "isOptional": false, "supportedService": "Email", "ttl": 3600}
  ]})");
  JsonRecordProvider jrp(tf.path());
  auto vRecords = jrp.fetch("contoso.com");
  ASSERT_EQ(vRecords.size(), 1u);
  EXPECT_EQ(vRecords[0].sLabel, "@");
  EXPECT_EQ(std::get<TxtValue>(vRecords[0].tvExpected).joined(), "MS=ms12345678");
}

TEST(JsonRecordProviderTest, RejectsNonArray) {
  TempFile tfObj(".json", R"({"Domain": "contoso.com"})");
  EXPECT_EQ(configErrorCode([&] { JsonRecordProvider jrp(tfObj.path()); }), "invalid_json");

  TempFile tfGarbage(".json", "not json");
  EXPECT_EQ(configErrorCode([&] { JsonRecordProvider jrp(tfGarbage.path()); }), "invalid_json");

  TempFile tfScalar(".json", "[1]");
  EXPECT_EQ(configErrorCode([&] { JsonRecordProvider jrp(tfScalar.path()); }), "invalid_record");
}

// ── Directory ──────────────────────────────────────────────────────────────

TEST(GraphRecordProviderTest, MapsServiceConfigurationRecords) {
  const auto jPage = nlohmann::json::parse(R"({
    "value": [
      {"@odata.type": "#microsoft.graph.domainDnsMxRecord", "isOptional": false,
       "label": "contoso.com", "recordType": "Mx", "supportedService": "Email", "ttl": 3600,
       "mailExchange": "contoso-com.mail.protection.outlook.com", "preference": 0},
      {"@odata.type": "#microsoft.graph.domainDnsCnameRecord", "isOptional": false,
       "label": "autodiscover.contoso.com", "recordType": "CName", "supportedService": "Email",
       "ttl": 3600, "canonicalName": "autodiscover.outlook.com"},
      {"@odata.type": "#microsoft.graph.domainDnsSrvRecord", "isOptional": false,
       "label": "contoso.com", "recordType": "Srv", "supportedService": "OfficeCommunicationsOnline",
       "ttl": 3600, "nameTarget": "sipdir.online.lync.com", "port": 443, "priority": 100,
       "protocol": "_tls", "service": "_sip", "weight": 1},
      {"@odata.type": "#microsoft.graph.domainDnsUnavailableRecord", "label": "contoso.com",
       "recordType": "Unavailable"}
    ]})");

  auto vRecords = GraphRecordProvider::parseServiceConfigurationRecords(jPage, "contoso.com");
  ASSERT_EQ(vRecords.size(), 3u);

  EXPECT_EQ(vRecords[0].type, RecordType::MX);
  EXPECT_EQ(vRecords[0].sLabel, "@");
  EXPECT_EQ(std::get<MxValue>(vRecords[0].tvExpected).sExchange,
            "contoso-com.mail.protection.outlook.com");

  EXPECT_EQ(vRecords[1].sLabel, "autodiscover");

  EXPECT_EQ(vRecords[2].type, RecordType::SRV);
  EXPECT_EQ(vRecords[2].sLabel, "_sip._tls");
  EXPECT_EQ(vRecords[2].sSupportedService, "OfficeCommunicationsOnline");
  const auto& srv = std::get<SrvValue>(vRecords[2].tvExpected);
  EXPECT_EQ(srv.iPort, 443);
  EXPECT_EQ(srv.iPriority, 100);
  EXPECT_EQ(srv.sTarget, "sipdir.online.lync.com");
}

TEST(GraphRecordProviderTest, SkipsMalformedEntries) {
  const auto jPage = nlohmann::json::parse(R"({"value": [
    {"@odata.type": "#microsoft.graph.domainDnsTxtRecord", "label": "contoso.com",
     "recordType": "Txt", "text": ""},
    {"@odata.type": "#microsoft.graph.domainDnsTxtRecord", "label": "contoso.com",
     "recordType": "Txt", "text": "MS=ms1"}
  ]})");
  auto vRecords = GraphRecordProvider::parseServiceConfigurationRecords(jPage, "contoso.com");
  ASSERT_EQ(vRecords.size(), 1u);
}

TEST(GraphRecordProviderTest, PageWithoutValueIsProviderError) {
  EXPECT_THROW(GraphRecordProvider::parseServiceConfigurationRecords(
                   nlohmann::json::parse(R"({"error": {"code": "x"}})"), "contoso.com"),
               ProviderError);
}
