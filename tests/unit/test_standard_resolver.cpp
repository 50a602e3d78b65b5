#include "resolver/StandardResolver.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "common/Errors.hpp"

using namespace dnsaudit::common;
using dnsaudit::resolver::StandardResolver;

namespace {

// Response to "contoso.com MX": an A record (skipped) then an MX record.
const std::vector<unsigned char> kMxResponse{
    0x12, 0x34, 0x81, 0x80, 0x00, 0x01, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00,
    // question
    0x07, 'c', 'o', 'n', 't', 'o', 's', 'o', 0x03, 'c', 'o', 'm', 0x00, 0x00, 0x0f, 0x00, 0x01,
    // answer 1: A 10.0.0.1
    0xc0, 0x0c, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x0e, 0x10, 0x00, 0x04, 0x0a, 0x00, 0x00,
    0x01,
    // answer 2: MX 10 mail.contoso.com
    0xc0, 0x0c, 0x00, 0x0f, 0x00, 0x01, 0x00, 0x00, 0x0e, 0x10, 0x00, 0x09, 0x00, 0x0a, 0x04,
    'm', 'a', 'i', 'l', 0xc0, 0x0c};

}  // namespace

TEST(StandardResolverTest, KeepsOnlyRecordsOfQueriedType) {
  auto vRecords = StandardResolver::parseAnswer(kMxResponse.data(),
                                                static_cast<int>(kMxResponse.size()),
                                                RecordType::MX);
  ASSERT_EQ(vRecords.size(), 1u);
  EXPECT_EQ(vRecords[0].sName, "contoso.com");
  EXPECT_EQ(vRecords[0].uTtl, 3600u);
  const auto& mx = std::get<MxValue>(vRecords[0].tvValue);
  EXPECT_EQ(mx.iPreference, 10);
  EXPECT_EQ(mx.sExchange, "mail.contoso.com");
}

TEST(StandardResolverTest, ParsesAddressRecords) {
  auto vRecords = StandardResolver::parseAnswer(kMxResponse.data(),
                                                static_cast<int>(kMxResponse.size()),
                                                RecordType::A);
  ASSERT_EQ(vRecords.size(), 1u);
  EXPECT_EQ(std::get<AddressValue>(vRecords[0].tvValue).sAddress, "10.0.0.1");
}

TEST(StandardResolverTest, TruncatedMessageThrows) {
  const unsigned char vShort[] = {0x12, 0x34, 0x81, 0x80, 0x00};
  EXPECT_THROW(StandardResolver::parseAnswer(vShort, sizeof(vShort), RecordType::MX), QueryError);
}

TEST(StandardResolverTest, NameIncludesPinnedServer) {
  StandardResolver srPinned(std::string("8.8.8.8"), 1000);
  StandardResolver srSystem(std::nullopt, 1000);
  EXPECT_NE(srPinned.name().find("8.8.8.8"), std::string::npos);
  EXPECT_NE(srPinned.name(), srSystem.name());
}
