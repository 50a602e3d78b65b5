#include "core/DomainHealthChecker.hpp"

#include "common/Logger.hpp"
#include "core/PolicyRecords.hpp"

#include <algorithm>

namespace dnsaudit::core {

using common::AuxCheck;
using common::CheckCategory;
using common::QueryResult;
using common::QueryStatus;
using common::RecordType;

namespace {

std::vector<std::string> txtTexts(const QueryResult& qr) {
  std::vector<std::string> vTexts;
  for (const auto& rr : qr.vRecords) {
    if (const auto* pTxt = std::get_if<common::TxtValue>(&rr.tvValue)) {
      vTexts.push_back(pTxt->joined());
    }
  }
  return vTexts;
}

std::optional<std::string> cnameTarget(const QueryResult& qr) {
  for (const auto& rr : qr.vRecords) {
    if (const auto* pCn = std::get_if<common::CnameValue>(&rr.tvValue)) {
      return pCn->sTarget;
    }
  }
  return std::nullopt;
}

/// Marks the check as faulted; returns true when the caller should stop.
bool recordFault(AuxCheck& ac, const QueryResult& qr, const std::string& sName) {
  if (qr.status != QueryStatus::Fault) {
    return false;
  }
  ac.bQueryFault = true;
  ac.sDetail = sName + ": " + qr.sError;
  common::Logger::get()->warn("Health check {} query for {} failed: {}",
                              common::toString(ac.category), sName, qr.sError);
  return true;
}

}  // anonymous namespace

DomainHealthChecker::DomainHealthChecker(resolver::IResolver& rResolver, HealthCheckOptions hco)
    : _rResolver(rResolver), _hco(std::move(hco)) {}

DomainHealthChecker::~DomainHealthChecker() = default;

std::vector<AuxCheck> DomainHealthChecker::check(const std::string& sDomain) const {
  std::vector<AuxCheck> vChecks;
  vChecks.push_back(checkMx(sDomain));
  vChecks.push_back(checkSpf(sDomain));
  if (_hco.bCheckDmarc) vChecks.push_back(checkDmarc(sDomain));
  if (_hco.bCheckDkim) vChecks.push_back(checkDkim(sDomain));
  if (_hco.bCheckDeprecated) vChecks.push_back(checkDeprecated(sDomain));
  if (_hco.bCheckSrv) vChecks.push_back(checkSrv(sDomain));
  vChecks.push_back(checkLegacyAliases(sDomain));
  return vChecks;
}

AuxCheck DomainHealthChecker::checkMx(const std::string& sDomain) const {
  AuxCheck ac;
  ac.category = CheckCategory::Mx;

  const auto qr = _rResolver.query(sDomain, RecordType::MX);
  if (recordFault(ac, qr, sDomain)) return ac;

  std::vector<common::MxValue> vMx;
  for (const auto& rr : qr.vRecords) {
    if (const auto* pMx = std::get_if<common::MxValue>(&rr.tvValue)) {
      vMx.push_back(*pMx);
    }
  }
  if (vMx.empty()) {
    ac.sDetail = "No MX records";
    return ac;
  }

  std::stable_sort(vMx.begin(), vMx.end(), [](const auto& a, const auto& b) {
    if (a.iPreference != b.iPreference) return a.iPreference < b.iPreference;
    return common::normalizeHost(a.sExchange) < common::normalizeHost(b.sExchange);
  });
  for (const auto& mx : vMx) {
    ac.vObserved.push_back(common::renderValue(mx));
  }

  const auto ofm = _fcClassifier.classify(RecordType::MX, vMx.front().sExchange);
  ac.bPresent = true;
  ac.bValid = ofm.has_value();
  ac.bLegacyFormat = ofm.has_value() && ofm->formatClass == FormatClass::Legacy;
  ac.sDetail = ac.bValid ? ofm->sLabel
                         : "Primary MX " + vMx.front().sExchange + " is not Microsoft 365";
  return ac;
}

AuxCheck DomainHealthChecker::checkSpf(const std::string& sDomain) const {
  AuxCheck ac;
  ac.category = CheckCategory::Spf;

  const auto qr = _rResolver.query(sDomain, RecordType::TXT);
  if (recordFault(ac, qr, sDomain)) return ac;

  std::vector<SpfPolicy> vPolicies;
  for (const auto& sText : txtTexts(qr)) {
    if (auto oSpf = parseSpf(sText)) {
      ac.vObserved.push_back(sText);
      vPolicies.push_back(*oSpf);
    }
  }
  if (vPolicies.empty()) {
    ac.sDetail = "No v=spf1 record";
    return ac;
  }

  const auto& spf = vPolicies.front();
  ac.bPresent = true;
  ac.bMultipleRecords = vPolicies.size() > 1;
  ac.iIncludeCount = spf.iIncludeCount;
  ac.sAllQualifier = spf.sAllQualifier;
  ac.bValid = !ac.bMultipleRecords && spf.includesMicrosoft365();
  if (ac.bMultipleRecords) {
    ac.sDetail = std::to_string(vPolicies.size()) + " SPF records published";
  } else if (!spf.includesMicrosoft365()) {
    ac.sDetail = std::string("SPF record lacks include:") + kM365SpfInclude;
  }
  return ac;
}

AuxCheck DomainHealthChecker::checkDmarc(const std::string& sDomain) const {
  AuxCheck ac;
  ac.category = CheckCategory::Dmarc;

  const std::string sName = "_dmarc." + sDomain;
  const auto qr = _rResolver.query(sName, RecordType::TXT);
  if (recordFault(ac, qr, sName)) return ac;

  for (const auto& sText : txtTexts(qr)) {
    if (auto oDmarc = parseDmarc(sText)) {
      ac.bPresent = true;
      ac.vObserved.push_back(sText);
      ac.sPolicy = oDmarc->sPolicy;
      ac.bHasReportAddress = !oDmarc->vAggregateReports.empty();
      ac.bValid = ac.sPolicy == "quarantine" || ac.sPolicy == "reject";
      ac.sDetail = "p=" + (ac.sPolicy.empty() ? std::string("(unset)") : ac.sPolicy);
      return ac;
    }
  }
  ac.sDetail = "No v=DMARC1 record at " + sName;
  return ac;
}

AuxCheck DomainHealthChecker::checkDkim(const std::string& sDomain) const {
  AuxCheck ac;
  ac.category = CheckCategory::Dkim;

  std::vector<std::string> vMissing;
  int iFound = 0;
  bool bAllWellFormed = true;
  for (const auto& sSelector : _hco.vDkimSelectors) {
    const std::string sName = sSelector + "._domainkey." + sDomain;
    const auto qr = _rResolver.query(sName, RecordType::CNAME);
    if (recordFault(ac, qr, sName)) return ac;

    const auto oTarget = cnameTarget(qr);
    if (!oTarget) {
      vMissing.push_back(sSelector);
      continue;
    }
    ++iFound;
    ac.vObserved.push_back(sName + " -> " + *oTarget);
    if (common::normalizeHost(*oTarget).find("_domainkey") == std::string::npos) {
      bAllWellFormed = false;
    }
    if (_fcClassifier.isLegacy(RecordType::CNAME, *oTarget)) {
      ac.bLegacyFormat = true;
    }
  }

  ac.bPresent = iFound > 0;
  ac.bValid = iFound > 0 && vMissing.empty() && bAllWellFormed;
  if (!vMissing.empty()) {
    std::string sList;
    for (const auto& s : vMissing) {
      if (!sList.empty()) sList += ", ";
      sList += s;
    }
    ac.sDetail = "Missing selector(s): " + sList;
  } else if (!bAllWellFormed) {
    ac.sDetail = "DKIM CNAME target is not a _domainkey host";
  }
  return ac;
}

AuxCheck DomainHealthChecker::checkDeprecated(const std::string& sDomain) const {
  AuxCheck ac;
  ac.category = CheckCategory::DeprecatedRecords;

  const std::string sName = "msoid." + sDomain;
  const auto qr = _rResolver.query(sName, RecordType::CNAME);
  if (recordFault(ac, qr, sName)) return ac;

  if (const auto oTarget = cnameTarget(qr)) {
    ac.bPresent = true;
    ac.vObserved.push_back(sName + " -> " + *oTarget);
    ac.sDetail = "Deprecated msoid CNAME present";
  }
  ac.bValid = !ac.bPresent;
  return ac;
}

AuxCheck DomainHealthChecker::checkSrv(const std::string& sDomain) const {
  AuxCheck ac;
  ac.category = CheckCategory::Srv;

  struct Probe {
    std::string sName;
    std::string sTarget;
    int iPort;
  };
  const std::vector<Probe> vProbes{
      {"_sip._tls." + sDomain, kSipTlsTarget, kSipTlsPort},
      {"_sipfederationtls._tcp." + sDomain, kSipFederationTarget, kSipFederationPort},
  };

  int iPresent = 0;
  int iValid = 0;
  std::vector<std::string> vProblems;
  for (const auto& probe : vProbes) {
    const auto qr = _rResolver.query(probe.sName, RecordType::SRV);
    if (recordFault(ac, qr, probe.sName)) return ac;

    bool bFound = false;
    bool bMatched = false;
    for (const auto& rr : qr.vRecords) {
      if (const auto* pSrv = std::get_if<common::SrvValue>(&rr.tvValue)) {
        bFound = true;
        ac.vObserved.push_back(probe.sName + " -> " + common::renderValue(*pSrv));
        if (common::normalizeHost(pSrv->sTarget) == probe.sTarget &&
            pSrv->iPort == probe.iPort) {
          bMatched = true;
        }
      }
    }
    if (bFound) ++iPresent;
    if (bMatched) ++iValid;
    if (!bFound) {
      vProblems.push_back(probe.sName + " missing");
    } else if (!bMatched) {
      vProblems.push_back(probe.sName + " does not target " + probe.sTarget + ":" +
                          std::to_string(probe.iPort));
    }
  }

  ac.bPresent = iPresent == static_cast<int>(vProbes.size());
  ac.bValid = iValid == static_cast<int>(vProbes.size());
  for (const auto& s : vProblems) {
    if (!ac.sDetail.empty()) ac.sDetail += "; ";
    ac.sDetail += s;
  }
  return ac;
}

AuxCheck DomainHealthChecker::checkLegacyAliases(const std::string& sDomain) const {
  AuxCheck ac;
  ac.category = CheckCategory::LegacyAliases;

  for (const char* pLabel : {"lyncdiscover", "sip"}) {
    const std::string sName = std::string(pLabel) + "." + sDomain;
    const auto qr = _rResolver.query(sName, RecordType::CNAME);
    if (recordFault(ac, qr, sName)) return ac;

    if (const auto oTarget = cnameTarget(qr)) {
      ac.bPresent = true;
      ac.vObserved.push_back(sName + " -> " + *oTarget);
    }
  }
  ac.bValid = true;
  if (ac.bPresent) {
    ac.sDetail = "Legacy Skype for Business aliases still published";
  }
  return ac;
}

}  // namespace dnsaudit::core
