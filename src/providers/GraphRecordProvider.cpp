#include "providers/GraphRecordProvider.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "providers/RecordMapping.hpp"

#include <openssl/crypto.h>

#include <array>
#include <string_view>

namespace dnsaudit::providers {

using common::ProviderError;
using nlohmann::json;

namespace {

constexpr std::array<std::string_view, 4> kSupportedTypes{
    "#microsoft.graph.domainDnsMxRecord",
    "#microsoft.graph.domainDnsCnameRecord",
    "#microsoft.graph.domainDnsTxtRecord",
    "#microsoft.graph.domainDnsSrvRecord",
};

bool isSupportedType(const std::string& sType) {
  for (const auto& sv : kSupportedTypes) {
    if (sv == sType) return true;
  }
  return false;
}

}  // anonymous namespace

// ── DirectorySession ───────────────────────────────────────────────────────

DirectorySession::DirectorySession(std::string sToken, std::string sEndpoint)
    : _sToken(std::move(sToken)), _sEndpoint(std::move(sEndpoint)) {
  while (!_sEndpoint.empty() && _sEndpoint.back() == '/') {
    _sEndpoint.pop_back();
  }
}

DirectorySession::~DirectorySession() {
  if (!_sToken.empty()) {
    OPENSSL_cleanse(_sToken.data(), _sToken.size());
  }
}

std::string DirectorySession::authorizationHeader() const {
  return "Authorization: Bearer " + _sToken;
}

// ── GraphRecordProvider ────────────────────────────────────────────────────

GraphRecordProvider::GraphRecordProvider(std::shared_ptr<DirectorySession> spSession,
                                         int iTimeoutMs)
    : _spSession(std::move(spSession)), _hcClient(iTimeoutMs) {}

GraphRecordProvider::~GraphRecordProvider() = default;

std::vector<common::ExpectedRecord> GraphRecordProvider::parseServiceConfigurationRecords(
    const json& jPage, const std::string& sDomain) {
  if (!jPage.is_object() || !jPage.contains("value") || !jPage["value"].is_array()) {
    throw ProviderError("directory_error", "Directory response for " + sDomain +
                                               " has no value array");
  }

  std::vector<common::ExpectedRecord> vRecords;
  for (const auto& jRec : jPage["value"]) {
    if (!jRec.is_object()) continue;
    const std::string sType = jRec.value("@odata.type", std::string{});
    if (!isSupportedType(sType)) {
      common::Logger::get()->debug("Skipping directory record of type '{}' for {}", sType,
                                   sDomain);
      continue;
    }

    try {
      auto mFields = fieldsFromJson(jRec);
      mFields["domain"] = sDomain;
      vRecords.push_back(toExpectedRecord(mFields));
    } catch (const common::ValidationError& ex) {
      common::Logger::get()->warn("Skipping malformed directory record for {}: {}", sDomain,
                                  ex.what());
    }
  }
  return vRecords;
}

std::vector<common::ExpectedRecord> GraphRecordProvider::fetch(const std::string& sDomain) {
  const std::vector<std::string> vHeaders{_spSession->authorizationHeader(),
                                          "Accept: application/json"};

  std::string sUrl;
  try {
    sUrl = _spSession->endpoint() + "/v1.0/domains/" + common::HttpClient::escape(sDomain) +
           "/serviceConfigurationRecords";
  } catch (const common::QueryError& ex) {
    throw ProviderError("directory_error", ex.what());
  }

  std::vector<common::ExpectedRecord> vRecords;
  for (int iPage = 0; !sUrl.empty(); ++iPage) {
    if (iPage >= kMaxPages) {
      throw ProviderError("directory_error",
                          "Directory paging for " + sDomain + " exceeded " +
                              std::to_string(kMaxPages) + " pages");
    }

    common::HttpResponse hr;
    try {
      hr = _hcClient.get(sUrl, vHeaders);
    } catch (const common::QueryError& ex) {
      throw ProviderError("directory_error", ex.what());
    }
    if (!hr.bTransportOk) {
      throw ProviderError("directory_unreachable",
                          "Directory request for " + sDomain + " failed: " + hr.sError);
    }
    if (hr.iStatus == 404) {
      throw ProviderError("domain_not_found", "Domain " + sDomain + " is not in the directory");
    }
    if (hr.iStatus != 200) {
      throw ProviderError("directory_error", "Directory returned HTTP " +
                                                 std::to_string(hr.iStatus) + " for " + sDomain);
    }

    json jPage;
    try {
      jPage = json::parse(hr.sBody);
    } catch (const json::parse_error& ex) {
      throw ProviderError("directory_error",
                          "Directory response for " + sDomain + " is not JSON: " + ex.what());
    }

    auto vPage = parseServiceConfigurationRecords(jPage, sDomain);
    vRecords.insert(vRecords.end(), vPage.begin(), vPage.end());

    const auto it = jPage.find("@odata.nextLink");
    sUrl = (it != jPage.end() && it->is_string()) ? it->get<std::string>() : std::string{};
  }

  if (vRecords.empty()) {
    throw ProviderError("no_records", "Directory has no service records for " + sDomain);
  }
  common::Logger::get()->debug("Directory returned {} expected records for {}", vRecords.size(),
                               sDomain);
  return vRecords;
}

}  // namespace dnsaudit::providers
