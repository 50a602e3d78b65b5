#pragma once

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/HttpClient.hpp"
#include "providers/IExpectedRecordProvider.hpp"

namespace dnsaudit::providers {

/// Explicit credential handle for the directory API. Owns the bearer token and
/// wipes it on destruction; nothing else in the process keeps a copy.
/// Class abbreviation: ds
class DirectorySession {
 public:
  DirectorySession(std::string sToken, std::string sEndpoint);
  ~DirectorySession();

  DirectorySession(const DirectorySession&) = delete;
  DirectorySession& operator=(const DirectorySession&) = delete;

  std::string authorizationHeader() const;
  const std::string& endpoint() const { return _sEndpoint; }

 private:
  std::string _sToken;
  std::string _sEndpoint;
};

/// Expected records from the directory's per-domain service configuration
/// records endpoint, following @odata.nextLink pages.
/// Class abbreviation: grp
class GraphRecordProvider : public IExpectedRecordProvider {
 public:
  GraphRecordProvider(std::shared_ptr<DirectorySession> spSession, int iTimeoutMs);
  ~GraphRecordProvider() override;

  std::string name() const override { return "graph"; }
  std::vector<common::ExpectedRecord> fetch(const std::string& sDomain) override;

  /// Maps one response page ({"value": [...]}) into expected records.
  /// Entries of unsupported @odata.type are skipped.
  /// Throws ProviderError if the page has no "value" array.
  static std::vector<common::ExpectedRecord> parseServiceConfigurationRecords(
      const nlohmann::json& jPage, const std::string& sDomain);

  static constexpr int kMaxPages = 50;

 private:
  std::shared_ptr<DirectorySession> _spSession;
  common::HttpClient _hcClient;
};

}  // namespace dnsaudit::providers
