#include "core/Comparator.hpp"

#include <algorithm>
#include <cctype>

namespace dnsaudit::core {

using common::ComparisonResult;
using common::ComparisonStatus;
using common::ExpectedRecord;
using common::QueryResult;
using common::QueryStatus;
using common::RecordType;
using common::ResourceRecord;

namespace {

void appendDetail(ComparisonResult& cr, const std::string& sNote) {
  if (cr.oDetails && !cr.oDetails->empty()) {
    *cr.oDetails += "; " + sNote;
  } else {
    cr.oDetails = sNote;
  }
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool isDkimLabel(const std::string& sLabel) {
  const std::string sLower = lower(sLabel);
  return sLower.rfind("selector", 0) == 0 &&
         sLower.find("._domainkey") != std::string::npos;
}

bool isLegacyRtcLabel(const std::string& sLabel) {
  const std::string sLower = lower(sLabel);
  return sLower == "lyncdiscover" || sLower == "sip";
}

template <typename T>
const T* expectedAs(const ExpectedRecord& er, ComparisonResult& cr) {
  const T* pValue = std::get_if<T>(&er.tvExpected);
  if (!pValue) {
    cr.status = ComparisonStatus::Error;
    cr.oDetails = "Expected value shape does not match record type " + common::toString(er.type);
  }
  return pValue;
}

}  // anonymous namespace

Comparator::Comparator() = default;

Comparator::Comparator(FormatClassifier fcClassifier) : _fcClassifier(std::move(fcClassifier)) {}

ComparisonResult Comparator::compare(const ExpectedRecord& er, const QueryResult& qr) const {
  ComparisonResult cr;
  cr.sDomain = er.sDomain;
  cr.sLabel = er.sLabel;
  cr.sFqdn = er.fqdn();
  cr.type = er.type;
  cr.sExpectedValue = common::renderValue(er.tvExpected);
  cr.bIsOptional = er.bIsOptional;
  cr.iTtl = er.iTtl;
  cr.sSupportedService = er.sSupportedService;

  if (qr.status == QueryStatus::Fault) {
    cr.status = ComparisonStatus::Error;
    cr.oDetails = qr.sError.empty() ? std::string("Query failed") : qr.sError;
    return cr;
  }

  std::vector<ResourceRecord> vRecords;
  for (const auto& rr : qr.vRecords) {
    if (rr.type == er.type) {
      vRecords.push_back(rr);
    }
  }

  if (qr.status == QueryStatus::NoAnswer || vRecords.empty()) {
    cr.status = ComparisonStatus::Missing;
    cr.sActualValue = kNotFound;
    return cr;
  }

  switch (er.type) {
    case RecordType::MX: compareMx(er, vRecords, cr); break;
    case RecordType::CNAME: compareCname(er, vRecords, cr); break;
    case RecordType::TXT: compareTxt(er, vRecords, cr); break;
    case RecordType::SRV: compareSrv(er, vRecords, cr); break;
    case RecordType::A:
    case RecordType::AAAA: compareAddress(er, vRecords, cr); break;
  }
  return cr;
}

void Comparator::compareMx(const ExpectedRecord& er, const std::vector<ResourceRecord>& vRecords,
                           ComparisonResult& cr) const {
  const auto* pExpected = expectedAs<common::MxValue>(er, cr);
  if (!pExpected) return;

  std::vector<common::MxValue> vMx;
  for (const auto& rr : vRecords) {
    if (const auto* pMx = std::get_if<common::MxValue>(&rr.tvValue)) {
      vMx.push_back(*pMx);
    }
  }
  // Lowest preference wins; equal preferences fall back to host order so the
  // pick does not depend on answer order.
  std::stable_sort(vMx.begin(), vMx.end(), [](const auto& a, const auto& b) {
    if (a.iPreference != b.iPreference) return a.iPreference < b.iPreference;
    return common::normalizeHost(a.sExchange) < common::normalizeHost(b.sExchange);
  });
  if (vMx.empty()) {
    cr.status = ComparisonStatus::Error;
    cr.oDetails = "MX answer carried no MX payload";
    return;
  }
  const auto& mxBest = vMx.front();

  cr.sActualValue = common::renderValue(mxBest);
  if (common::normalizeHost(mxBest.sExchange) == common::normalizeHost(pExpected->sExchange)) {
    cr.status = ComparisonStatus::Match;
  } else {
    cr.status = ComparisonStatus::Mismatch;
    cr.oDetails = "Highest-priority MX points to " + mxBest.sExchange + ", expected " +
                  pExpected->sExchange;
  }

  if (auto ofm = _fcClassifier.classify(RecordType::MX, mxBest.sExchange);
      ofm && ofm->formatClass == FormatClass::Legacy) {
    cr.oFormatNote = ofm->sLabel;
  }
}

void Comparator::compareCname(const ExpectedRecord& er,
                              const std::vector<ResourceRecord>& vRecords,
                              ComparisonResult& cr) const {
  const auto* pExpected = expectedAs<common::CnameValue>(er, cr);
  if (!pExpected) return;

  const auto* pActual = std::get_if<common::CnameValue>(&vRecords.front().tvValue);
  const std::string sActual = pActual ? pActual->sTarget : std::string{};
  cr.sActualValue = sActual;

  if (common::normalizeHost(sActual) == common::normalizeHost(pExpected->sTarget)) {
    cr.status = ComparisonStatus::Match;
  } else {
    cr.status = ComparisonStatus::Mismatch;
    cr.oDetails = "CNAME points to " + sActual + ", expected " + pExpected->sTarget;
  }

  // Advisory only; status is already settled.
  if (isDkimLabel(er.sLabel) && _fcClassifier.isLegacy(RecordType::CNAME, sActual)) {
    appendDetail(cr,
                 "DKIM CNAME uses legacy onmicrosoft.com target; migrate to the "
                 "dkim.mail.microsoft format");
  }
  if (isLegacyRtcLabel(er.sLabel)) {
    appendDetail(cr, "legacy Skype for Business alias; not required for Teams-only tenants");
  }
}

void Comparator::compareTxt(const ExpectedRecord& er, const std::vector<ResourceRecord>& vRecords,
                            ComparisonResult& cr) const {
  const auto* pExpected = expectedAs<common::TxtValue>(er, cr);
  if (!pExpected) return;

  const std::string sWanted = pExpected->joined();
  std::vector<std::string> vTexts;
  for (const auto& rr : vRecords) {
    if (const auto* pTxt = std::get_if<common::TxtValue>(&rr.tvValue)) {
      vTexts.push_back(pTxt->joined());
    }
  }

  if (std::find(vTexts.begin(), vTexts.end(), sWanted) != vTexts.end()) {
    cr.status = ComparisonStatus::Match;
    cr.sActualValue = sWanted;
    return;
  }

  // Sorted so the rendering does not depend on answer order
  std::sort(vTexts.begin(), vTexts.end());
  std::string sAll;
  for (const auto& sText : vTexts) {
    if (!sAll.empty()) sAll += " | ";
    sAll += sText;
  }
  cr.status = ComparisonStatus::Mismatch;
  cr.sActualValue = sAll;
  cr.oDetails = "Expected text not present among " + std::to_string(vTexts.size()) +
                " TXT record(s)";
}

void Comparator::compareSrv(const ExpectedRecord& er, const std::vector<ResourceRecord>& vRecords,
                            ComparisonResult& cr) const {
  const auto* pExpected = expectedAs<common::SrvValue>(er, cr);
  if (!pExpected) return;

  std::vector<common::SrvValue> vSrv;
  for (const auto& rr : vRecords) {
    if (const auto* pSrv = std::get_if<common::SrvValue>(&rr.tvValue)) {
      vSrv.push_back(*pSrv);
    }
  }
  std::stable_sort(vSrv.begin(), vSrv.end(), [](const auto& a, const auto& b) {
    if (a.iPriority != b.iPriority) return a.iPriority < b.iPriority;
    return common::normalizeHost(a.sTarget) < common::normalizeHost(b.sTarget);
  });

  if (vSrv.empty()) {
    cr.status = ComparisonStatus::Error;
    cr.oDetails = "SRV answer carried no SRV payload";
    return;
  }

  // Priority and weight are tuning, not configuration
  const std::string sWantTarget = common::normalizeHost(pExpected->sTarget);
  for (const auto& srv : vSrv) {
    if (common::normalizeHost(srv.sTarget) == sWantTarget && srv.iPort == pExpected->iPort) {
      cr.status = ComparisonStatus::Match;
      cr.sActualValue = common::renderValue(srv);
      return;
    }
  }

  cr.status = ComparisonStatus::Mismatch;
  cr.sActualValue = common::renderValue(vSrv.front());
  cr.oDetails = "No SRV answer targets " + pExpected->sTarget + ":" +
                std::to_string(pExpected->iPort);
}

void Comparator::compareAddress(const ExpectedRecord& er,
                                const std::vector<ResourceRecord>& vRecords,
                                ComparisonResult& cr) const {
  const auto* pExpected = expectedAs<common::AddressValue>(er, cr);
  if (!pExpected) return;

  std::vector<std::string> vAddrs;
  for (const auto& rr : vRecords) {
    if (const auto* pAddr = std::get_if<common::AddressValue>(&rr.tvValue)) {
      vAddrs.push_back(pAddr->sAddress);
    }
  }
  std::sort(vAddrs.begin(), vAddrs.end());

  if (std::find(vAddrs.begin(), vAddrs.end(), pExpected->sAddress) != vAddrs.end()) {
    cr.status = ComparisonStatus::Match;
    cr.sActualValue = pExpected->sAddress;
    return;
  }

  std::string sAll;
  for (const auto& sAddr : vAddrs) {
    if (!sAll.empty()) sAll += ", ";
    sAll += sAddr;
  }
  cr.status = ComparisonStatus::Mismatch;
  cr.sActualValue = sAll;
  cr.oDetails = "Address " + pExpected->sAddress + " not among answers";
}

}  // namespace dnsaudit::core
