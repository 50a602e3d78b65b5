#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/FormatClassifier.hpp"
#include "resolver/IResolver.hpp"

namespace dnsaudit::core {

/// Which auxiliary categories the caller asked for. MX and SPF always run.
/// Class abbreviation: hco
struct HealthCheckOptions {
  bool bCheckDkim = true;
  bool bCheckDmarc = true;
  bool bCheckDeprecated = true;
  bool bCheckSrv = false;
  std::vector<std::string> vDkimSelectors{"selector1", "selector2"};
};

/// Collects facts for the scorer's auxiliary categories by querying the
/// well-known Microsoft 365 names under a domain.
/// Class abbreviation: hck
class DomainHealthChecker {
 public:
  DomainHealthChecker(resolver::IResolver& rResolver, HealthCheckOptions hco);
  ~DomainHealthChecker();

  /// One AuxCheck per requested category, in fixed order
  /// (MX, SPF, DMARC, DKIM, deprecated, SRV), followed by the LegacyAliases advisory.
  std::vector<common::AuxCheck> check(const std::string& sDomain) const;

  static constexpr const char* kSipTlsTarget = "sipdir.online.lync.com";
  static constexpr int kSipTlsPort = 443;
  static constexpr const char* kSipFederationTarget = "sipfed.online.lync.com";
  static constexpr int kSipFederationPort = 5061;

 private:
  common::AuxCheck checkMx(const std::string& sDomain) const;
  common::AuxCheck checkSpf(const std::string& sDomain) const;
  common::AuxCheck checkDmarc(const std::string& sDomain) const;
  common::AuxCheck checkDkim(const std::string& sDomain) const;
  common::AuxCheck checkDeprecated(const std::string& sDomain) const;
  common::AuxCheck checkSrv(const std::string& sDomain) const;
  common::AuxCheck checkLegacyAliases(const std::string& sDomain) const;

  resolver::IResolver& _rResolver;
  HealthCheckOptions _hco;
  FormatClassifier _fcClassifier;
};

}  // namespace dnsaudit::core
