#include "providers/RecordMapping.hpp"

#include "common/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_map>

namespace dnsaudit::providers {

using common::RecordType;
using common::ValidationError;

namespace {

std::string lower(std::string_view sv) {
  std::string sOut(sv);
  std::transform(sOut.begin(), sOut.end(), sOut.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sOut;
}

std::string trim(std::string_view sv) {
  const auto nFirst = sv.find_first_not_of(" \t\r\n");
  if (nFirst == std::string_view::npos) return {};
  const auto nLast = sv.find_last_not_of(" \t\r\n");
  return std::string(sv.substr(nFirst, nLast - nFirst + 1));
}

const std::unordered_map<std::string, std::string>& aliasTable() {
  static const std::unordered_map<std::string, std::string> mAliases{
      {"domainname", "domain"},
      {"name", "label"},
      {"host", "label"},
      {"type", "recordtype"},
      {"value", "expectedvalue"},
      {"target", "expectedvalue"},
      {"data", "expectedvalue"},
      {"mailexchange", "expectedvalue"},
      {"canonicalname", "expectedvalue"},
      {"text", "expectedvalue"},
      {"nametarget", "expectedvalue"},
      {"optional", "isoptional"},
  };
  return mAliases;
}

std::optional<std::string> field(const FieldMap& mFields, const char* pName) {
  auto it = mFields.find(pName);
  if (it == mFields.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

int parseInt(const std::string& sValue, const char* pField) {
  try {
    size_t nPos = 0;
    const int iValue = std::stoi(sValue, &nPos);
    if (nPos != sValue.size()) throw std::invalid_argument(sValue);
    return iValue;
  } catch (const std::logic_error&) {
    throw ValidationError("invalid_number",
                          std::string("Field ") + pField + " is not an integer: " + sValue);
  }
}

int intField(const FieldMap& mFields, const char* pName, int iDefault) {
  auto oValue = field(mFields, pName);
  return oValue ? parseInt(trim(*oValue), pName) : iDefault;
}

bool parseBool(const std::string& sValue) {
  const std::string s = lower(trim(sValue));
  if (s.empty() || s == "false" || s == "0" || s == "no") return false;
  if (s == "true" || s == "1" || s == "yes") return true;
  throw ValidationError("invalid_boolean", "Not a boolean: " + sValue);
}

std::vector<std::string> words(const std::string& sValue) {
  std::istringstream iss(sValue);
  std::vector<std::string> vWords;
  std::string sWord;
  while (iss >> sWord) vWords.push_back(sWord);
  return vWords;
}

/// Label relative to the domain: "@" for the apex, otherwise the prefix.
std::string relativeLabel(const std::string& sLabel, const std::string& sDomain) {
  const std::string sHost = common::normalizeHost(sLabel);
  const std::string sZone = common::normalizeHost(sDomain);
  if (sHost.empty() || sHost == "@" || sHost == sZone) return "@";
  const std::string sSuffix = "." + sZone;
  if (sHost.size() > sSuffix.size() &&
      sHost.compare(sHost.size() - sSuffix.size(), sSuffix.size(), sSuffix) == 0) {
    return sHost.substr(0, sHost.size() - sSuffix.size());
  }
  return sHost;
}

}  // anonymous namespace

std::string canonicalField(std::string_view svKey) {
  std::string sKey = lower(trim(svKey));
  std::erase(sKey, '_');
  std::erase(sKey, ' ');
  const auto& mAliases = aliasTable();
  auto it = mAliases.find(sKey);
  return it == mAliases.end() ? sKey : it->second;
}

FieldMap canonicalize(const std::map<std::string, std::string>& mRaw) {
  FieldMap mFields;
  for (const auto& [sKey, sValue] : mRaw) {
    auto& sSlot = mFields[canonicalField(sKey)];
    if (sSlot.empty()) sSlot = sValue;
  }
  return mFields;
}

FieldMap fieldsFromJson(const nlohmann::json& jObject) {
  if (!jObject.is_object()) {
    throw ValidationError("invalid_entry", "Expected a JSON object, got " +
                                               std::string(jObject.type_name()));
  }

  std::map<std::string, std::string> mRaw;
  for (const auto& [sKey, jValue] : jObject.items()) {
    if (jValue.is_string()) {
      mRaw[sKey] = jValue.get<std::string>();
    } else if (jValue.is_boolean()) {
      mRaw[sKey] = jValue.get<bool>() ? "true" : "false";
    } else if (jValue.is_number_integer()) {
      mRaw[sKey] = std::to_string(jValue.get<long long>());
    } else if (jValue.is_number()) {
      mRaw[sKey] = jValue.dump();
    }
  }
  return canonicalize(mRaw);
}

common::TypedValue parseExpectedValue(RecordType type, const std::string& sRawValue,
                                      const FieldMap& mFields) {
  const std::string sValue = trim(sRawValue);
  if (sValue.empty()) {
    throw ValidationError("missing_value", "Expected value is empty");
  }

  switch (type) {
    case RecordType::MX: {
      const auto vWords = words(sValue);
      if (vWords.size() == 2) {
        return common::MxValue{parseInt(vWords[0], "preference"), vWords[1]};
      }
      if (vWords.size() != 1) {
        throw ValidationError("invalid_mx", "Cannot parse MX value: " + sValue);
      }
      const int iPref = intField(mFields, "preference", intField(mFields, "priority", 0));
      return common::MxValue{iPref, vWords[0]};
    }
    case RecordType::SRV: {
      const auto vWords = words(sValue);
      if (vWords.size() == 4) {
        return common::SrvValue{parseInt(vWords[0], "priority"), parseInt(vWords[1], "weight"),
                                parseInt(vWords[2], "port"), vWords[3]};
      }
      if (vWords.size() != 1) {
        throw ValidationError("invalid_srv", "Cannot parse SRV value: " + sValue);
      }
      if (!field(mFields, "port")) {
        throw ValidationError("invalid_srv", "SRV target " + sValue + " has no port");
      }
      return common::SrvValue{intField(mFields, "priority", 0), intField(mFields, "weight", 0),
                              intField(mFields, "port", 0), vWords[0]};
    }
    case RecordType::CNAME:
      return common::CnameValue{sValue};
    case RecordType::TXT:
      // Compared byte for byte; surrounding spaces belong to the text.
      return common::TxtValue{{sRawValue}};
    case RecordType::A:
    case RecordType::AAAA:
      return common::AddressValue{sValue};
  }
  throw ValidationError("invalid_type", "Unhandled record type");
}

common::ExpectedRecord toExpectedRecord(const FieldMap& mFields) {
  const auto oDomain = field(mFields, "domain");
  if (!oDomain) {
    throw ValidationError("missing_domain", "Record has no Domain field");
  }
  const auto oType = field(mFields, "recordtype");
  if (!oType) {
    throw ValidationError("missing_type", "Record has no RecordType field");
  }
  const auto oRecordType = common::parseRecordType(trim(*oType));
  if (!oRecordType) {
    throw ValidationError("invalid_type", "Unknown record type: " + *oType);
  }

  common::ExpectedRecord er;
  er.sDomain = common::normalizeHost(trim(*oDomain));
  er.type = *oRecordType;
  er.bIsOptional = parseBool(field(mFields, "isoptional").value_or(""));
  er.iTtl = intField(mFields, "ttl", 3600);
  if (er.iTtl < 0) {
    throw ValidationError("invalid_ttl", "TTL must be >= 0");
  }

  // "service" is either the workload ("Email") or, next to "protocol", the
  // SRV owner prefix ("_sip").
  std::string sService = field(mFields, "supportedservice").value_or("");
  const auto oService = field(mFields, "service");
  const auto oProtocol = field(mFields, "protocol");
  if (er.type == RecordType::SRV && oService && oProtocol && oService->rfind('_', 0) == 0) {
    er.sLabel = *oService + "." + *oProtocol;
  } else {
    er.sLabel = relativeLabel(field(mFields, "label").value_or("@"), er.sDomain);
    if (sService.empty() && oService) sService = *oService;
  }
  er.sSupportedService = sService;

  er.tvExpected =
      parseExpectedValue(er.type, field(mFields, "expectedvalue").value_or(""), mFields);
  return er;
}

}  // namespace dnsaudit::providers
