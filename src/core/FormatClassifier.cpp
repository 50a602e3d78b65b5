#include "core/FormatClassifier.hpp"

namespace dnsaudit::core {

using common::RecordType;

FormatClassifier::FormatClassifier() : _vRules(defaultRules()) {}

FormatClassifier::FormatClassifier(std::vector<FormatRule> vRules) : _vRules(std::move(vRules)) {}

std::vector<FormatRule> FormatClassifier::defaultRules() {
  return {
      {RecordType::MX, "*.mail.protection.outlook.com", FormatClass::Legacy, "legacy MX format"},
      {RecordType::MX, "*.mx.microsoft", FormatClass::Modern, "modern MX format"},
      {RecordType::CNAME, "*._domainkey.*.onmicrosoft.com", FormatClass::Legacy,
       "legacy DKIM format"},
      {RecordType::CNAME, "*.dkim.mail.microsoft", FormatClass::Modern, "modern DKIM format"},
  };
}

std::optional<FormatMatch> FormatClassifier::classify(RecordType type,
                                                      std::string_view svHost) const {
  for (const auto& fr : _vRules) {
    if (fr.type == type && wildcardMatch(fr.sPattern, svHost)) {
      return FormatMatch{fr.formatClass, fr.sLabel};
    }
  }
  return std::nullopt;
}

bool FormatClassifier::isLegacy(RecordType type, std::string_view svHost) const {
  const auto ofm = classify(type, svHost);
  return ofm.has_value() && ofm->formatClass == FormatClass::Legacy;
}

bool FormatClassifier::wildcardMatch(std::string_view svPattern, std::string_view svText) {
  const std::string sPat = common::normalizeHost(svPattern);
  const std::string sTxt = common::normalizeHost(svText);

  // Iterative glob with single-star backtracking
  size_t p = 0, t = 0;
  size_t nStar = std::string::npos, nMark = 0;
  while (t < sTxt.size()) {
    if (p < sPat.size() && sPat[p] == '*') {
      nStar = p++;
      nMark = t;
    } else if (p < sPat.size() && sPat[p] == sTxt[t]) {
      ++p;
      ++t;
    } else if (nStar != std::string::npos) {
      p = nStar + 1;
      t = ++nMark;
    } else {
      return false;
    }
  }
  while (p < sPat.size() && sPat[p] == '*') ++p;
  return p == sPat.size();
}

}  // namespace dnsaudit::core
