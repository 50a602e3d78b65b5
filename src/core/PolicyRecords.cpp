#include "core/PolicyRecords.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace dnsaudit::core {

namespace {

std::string lower(std::string_view sv) {
  std::string sOut(sv);
  std::transform(sOut.begin(), sOut.end(), sOut.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sOut;
}

std::string trim(std::string_view sv) {
  const auto nFirst = sv.find_first_not_of(" \t");
  if (nFirst == std::string_view::npos) return {};
  const auto nLast = sv.find_last_not_of(" \t");
  return std::string(sv.substr(nFirst, nLast - nFirst + 1));
}

std::vector<std::string> splitList(const std::string& sValue, char cSep) {
  std::vector<std::string> vOut;
  std::istringstream iss(sValue);
  std::string sItem;
  while (std::getline(iss, sItem, cSep)) {
    sItem = trim(sItem);
    if (!sItem.empty()) vOut.push_back(sItem);
  }
  return vOut;
}

}  // anonymous namespace

bool SpfPolicy::includesMicrosoft365() const {
  return std::any_of(vIncludes.begin(), vIncludes.end(),
                     [](const std::string& s) { return lower(s) == kM365SpfInclude; });
}

std::optional<SpfPolicy> parseSpf(std::string_view svText) {
  const std::string sLower = lower(trim(svText));
  if (sLower != "v=spf1" && sLower.rfind("v=spf1 ", 0) != 0) {
    return std::nullopt;
  }

  SpfPolicy spf;
  const std::string sOriginal = trim(svText);
  std::istringstream iss(sOriginal);
  std::string sTerm;
  iss >> sTerm;  // v=spf1
  while (iss >> sTerm) {
    const std::string sTermLower = lower(sTerm);
    if (sTermLower.rfind("include:", 0) == 0) {
      spf.vIncludes.push_back(sTerm.substr(8));
    } else if (sTermLower == "all" || sTermLower == "+all" || sTermLower == "-all" ||
               sTermLower == "~all" || sTermLower == "?all") {
      spf.sAllQualifier = sTermLower == "all" ? "+all" : sTermLower;
    }
  }

  size_t nPos = 0;
  while ((nPos = sLower.find("include:", nPos)) != std::string::npos) {
    ++spf.iIncludeCount;
    nPos += 8;
  }
  return spf;
}

std::optional<DmarcPolicy> parseDmarc(std::string_view svText) {
  const std::string sTrimmed = trim(svText);
  if (lower(sTrimmed).rfind("v=dmarc1", 0) != 0) {
    return std::nullopt;
  }

  DmarcPolicy dmp;
  for (const auto& sTag : splitList(sTrimmed, ';')) {
    const auto nEq = sTag.find('=');
    if (nEq == std::string::npos) continue;
    const std::string sKey = lower(trim(sTag.substr(0, nEq)));
    const std::string sValue = trim(sTag.substr(nEq + 1));

    if (sKey == "p") {
      dmp.sPolicy = lower(sValue);
    } else if (sKey == "sp") {
      dmp.sSubdomainPolicy = lower(sValue);
    } else if (sKey == "rua") {
      dmp.vAggregateReports = splitList(sValue, ',');
    } else if (sKey == "ruf") {
      dmp.vForensicReports = splitList(sValue, ',');
    } else if (sKey == "pct") {
      try {
        dmp.iPercent = std::clamp(std::stoi(sValue), 0, 100);
      } catch (const std::logic_error&) {
        dmp.iPercent = 100;  // RFC 7489 default on unparsable pct
      }
    }
  }
  return dmp;
}

}  // namespace dnsaudit::core
