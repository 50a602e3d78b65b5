#include "resolver/DohResolver.hpp"
#include "resolver/StandardResolver.hpp"

#include "common/Logger.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

using namespace dnsaudit::common;
using dnsaudit::resolver::DohResolver;
using dnsaudit::resolver::StandardResolver;

namespace {

bool liveDnsEnabled() {
  const char* pFlag = std::getenv("DNSAUDIT_LIVE_DNS");
  return pFlag && *pFlag != '\0';
}

}  // namespace

class LiveResolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!liveDnsEnabled()) {
      GTEST_SKIP() << "DNSAUDIT_LIVE_DNS not set, skipping live DNS test";
    }
    Logger::init("warn");
  }
};

TEST_F(LiveResolverTest, StandardResolverFindsMicrosoftMx) {
  StandardResolver sr(std::string("8.8.8.8"), 5000);
  auto qr = sr.query("microsoft.com", RecordType::MX);
  ASSERT_EQ(qr.status, QueryStatus::Answered);
  EXPECT_FALSE(qr.vRecords.empty());
}

TEST_F(LiveResolverTest, StandardResolverNxdomainIsNoAnswer) {
  StandardResolver sr(std::nullopt, 5000);
  auto qr = sr.query("does-not-exist.invalid", RecordType::A);
  EXPECT_EQ(qr.status, QueryStatus::NoAnswer);
}

TEST_F(LiveResolverTest, BackendsAgreeOnTxtShape) {
  StandardResolver sr(std::string("8.8.8.8"), 5000);
  DohResolver dr("https://dns.google/resolve", 5000);
  auto qrStd = sr.query("microsoft.com", RecordType::TXT);
  auto qrDoh = dr.query("microsoft.com", RecordType::TXT);
  ASSERT_EQ(qrStd.status, QueryStatus::Answered);
  ASSERT_EQ(qrDoh.status, QueryStatus::Answered);
  for (const auto& rr : qrDoh.vRecords) {
    EXPECT_TRUE(std::holds_alternative<TxtValue>(rr.tvValue));
  }
}
