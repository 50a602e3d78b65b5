#pragma once

#include <string>
#include <vector>

#include "common/HttpClient.hpp"
#include "resolver/IResolver.hpp"

namespace dnsaudit::resolver {

/// DNS-over-HTTPS backend speaking the JSON API (dns.google/resolve style):
/// GET <endpoint>?name=<name>&type=<TYPE>, answer in an "Answer" array of
/// {name, type, TTL, data}.
class DohResolver : public IResolver {
 public:
  DohResolver(std::string sEndpoint, int iTimeoutMs);
  ~DohResolver() override;

  std::string name() const override;
  common::QueryResult query(const std::string& sName, common::RecordType type) override;

  /// Turn a JSON response body into a QueryResult shaped like the standard
  /// backend's output. Throws QueryError on a body that is not valid JSON.
  static common::QueryResult parseResponse(const std::string& sBody, common::RecordType type);

  /// Rebuild a typed value from the presentation-format "data" field.
  /// Throws QueryError when the text does not fit the record type.
  static common::TypedValue parseData(const std::string& sData, common::RecordType type);

  /// Split presentation-format TXT data ("\"a\" \"b\"") into its segments.
  static std::vector<std::string> splitTxtSegments(const std::string& sData);

 private:
  std::string _sEndpoint;
  common::HttpClient _hcClient;
};

}  // namespace dnsaudit::resolver
