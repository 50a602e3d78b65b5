#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dnsaudit::core {

/// RFC 7208 caps an SPF evaluation at ten DNS-querying terms.
constexpr int kSpfLookupLimit = 10;

constexpr const char* kM365SpfInclude = "spf.protection.outlook.com";

/// Class abbreviation: spf
struct SpfPolicy {
  std::vector<std::string> vIncludes;
  /// Literal "include:" occurrences in the top-level record only. Nested
  /// includes are not followed, so this undercounts real lookups.
  int iIncludeCount = 0;
  std::string sAllQualifier;  // "-all", "~all", "?all", "+all" or empty

  bool includesMicrosoft365() const;
};

/// Class abbreviation: dmp
struct DmarcPolicy {
  std::string sPolicy;           // p=
  std::string sSubdomainPolicy;  // sp=
  std::vector<std::string> vAggregateReports;  // rua=
  std::vector<std::string> vForensicReports;   // ruf=
  int iPercent = 100;
};

/// nullopt unless the text starts with "v=spf1" (case-insensitive).
std::optional<SpfPolicy> parseSpf(std::string_view svText);

/// nullopt unless the text starts with "v=DMARC1" (case-insensitive).
std::optional<DmarcPolicy> parseDmarc(std::string_view svText);

}  // namespace dnsaudit::core
