#include "resolver/DohResolver.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <sstream>

namespace dnsaudit::resolver {

using common::QueryError;
using common::QueryResult;
using common::RecordType;
using common::ResourceRecord;

namespace {

std::string stripRootDot(std::string sHost) {
  if (!sHost.empty() && sHost.back() == '.') {
    sHost.pop_back();
  }
  return sHost;
}

int toUint16(const std::string& sField, const std::string& sData) {
  try {
    size_t nPos = 0;
    const int iValue = std::stoi(sField, &nPos);
    if (nPos != sField.size() || iValue < 0 || iValue > 65535) {
      throw std::out_of_range(sField);
    }
    return iValue;
  } catch (const std::logic_error&) {
    throw QueryError("malformed_response", "Bad numeric field in DoH data: '" + sData + "'");
  }
}

}  // anonymous namespace

DohResolver::DohResolver(std::string sEndpoint, int iTimeoutMs)
    : _sEndpoint(std::move(sEndpoint)), _hcClient(iTimeoutMs) {}

DohResolver::~DohResolver() = default;

std::string DohResolver::name() const { return "doh"; }

QueryResult DohResolver::query(const std::string& sName, RecordType type) {
  if (sName.empty()) {
    return QueryResult::fault("Query name is empty");
  }

  auto spLog = common::Logger::get();
  try {
    const char cSep = _sEndpoint.find('?') == std::string::npos ? '?' : '&';
    const std::string sUrl = _sEndpoint + cSep + "name=" + common::HttpClient::escape(sName) +
                             "&type=" + common::toString(type);

    const auto hr = _hcClient.get(sUrl, {"Accept: application/dns-json"});
    if (!hr.bTransportOk) {
      spLog->debug("DoH transport failure for {} {}: {}", sName, common::toString(type),
                   hr.sError);
      return QueryResult::noAnswer(hr.sError);
    }
    if (hr.iStatus != 200) {
      return QueryResult::fault("DoH endpoint returned HTTP " + std::to_string(hr.iStatus));
    }
    return parseResponse(hr.sBody, type);
  } catch (const QueryError& ex) {
    spLog->warn("DohResolver: {} {} failed: {}", sName, common::toString(type), ex.what());
    return QueryResult::fault(ex.what());
  }
}

QueryResult DohResolver::parseResponse(const std::string& sBody, RecordType type) {
  nlohmann::json jBody;
  try {
    jBody = nlohmann::json::parse(sBody);
  } catch (const nlohmann::json::exception&) {
    throw QueryError("malformed_response", "DoH response is not valid JSON");
  }
  if (!jBody.is_object()) {
    throw QueryError("malformed_response", "DoH response is not a JSON object");
  }

  const int iWantType = common::rrTypeCode(type);
  std::vector<ResourceRecord> vRecords;
  try {
    const int iRcode = jBody.value("Status", 0);
    if (iRcode != 0) {
      return QueryResult::noAnswer(iRcode == 3 ? "NXDOMAIN" : "rcode " + std::to_string(iRcode));
    }

    auto itAnswer = jBody.find("Answer");
    if (itAnswer == jBody.end() || !itAnswer->is_array()) {
      return QueryResult::noAnswer("empty answer section");
    }

    for (const auto& jAnswer : *itAnswer) {
      if (!jAnswer.is_object() || jAnswer.value("type", 0) != iWantType) {
        continue;
      }
      auto itData = jAnswer.find("data");
      if (itData == jAnswer.end() || !itData->is_string()) {
        throw QueryError("malformed_response", "DoH answer entry without string data");
      }

      ResourceRecord rec;
      rec.sName = stripRootDot(jAnswer.value("name", std::string{}));
      rec.type = type;
      rec.uTtl = jAnswer.value("TTL", 0u);
      rec.tvValue = parseData(itData->get<std::string>(), type);
      vRecords.push_back(std::move(rec));
    }
  } catch (const nlohmann::json::exception& ex) {
    throw QueryError("malformed_response", std::string("Unexpected DoH field type: ") + ex.what());
  }

  return QueryResult::answered(std::move(vRecords));
}

common::TypedValue DohResolver::parseData(const std::string& sData, RecordType type) {
  std::istringstream iss(sData);
  switch (type) {
    case RecordType::MX: {
      std::string sPref, sHost;
      if (!(iss >> sPref >> sHost)) {
        throw QueryError("malformed_response", "Bad MX data: '" + sData + "'");
      }
      return common::MxValue{toUint16(sPref, sData), stripRootDot(sHost)};
    }
    case RecordType::SRV: {
      std::string sPrio, sWeight, sPort, sTarget;
      if (!(iss >> sPrio >> sWeight >> sPort >> sTarget)) {
        throw QueryError("malformed_response", "Bad SRV data: '" + sData + "'");
      }
      common::SrvValue srv;
      srv.iPriority = toUint16(sPrio, sData);
      srv.iWeight = toUint16(sWeight, sData);
      srv.iPort = toUint16(sPort, sData);
      srv.sTarget = stripRootDot(sTarget);
      return srv;
    }
    case RecordType::CNAME:
      return common::CnameValue{stripRootDot(sData)};
    case RecordType::TXT:
      return common::TxtValue{splitTxtSegments(sData)};
    case RecordType::A:
    case RecordType::AAAA:
      return common::AddressValue{sData};
  }
  throw QueryError("malformed_response", "Unsupported record type");
}

std::vector<std::string> DohResolver::splitTxtSegments(const std::string& sData) {
  // Some resolvers hand back TXT data unquoted
  if (sData.empty() || sData.front() != '"') {
    return {sData};
  }

  std::vector<std::string> vSegments;
  size_t i = 0;
  while (i < sData.size()) {
    while (i < sData.size() && std::isspace(static_cast<unsigned char>(sData[i]))) ++i;
    if (i >= sData.size()) break;
    if (sData[i] != '"') {
      throw QueryError("malformed_response", "Unquoted text between TXT segments: '" + sData + "'");
    }
    ++i;

    std::string sSeg;
    bool bClosed = false;
    while (i < sData.size()) {
      const char c = sData[i];
      if (c == '"') {
        bClosed = true;
        ++i;
        break;
      }
      if (c == '\\' && i + 1 < sData.size()) {
        // \DDD decimal escape or escaped literal
        if (i + 3 < sData.size() && std::isdigit(static_cast<unsigned char>(sData[i + 1])) &&
            std::isdigit(static_cast<unsigned char>(sData[i + 2])) &&
            std::isdigit(static_cast<unsigned char>(sData[i + 3]))) {
          const int iByte = std::stoi(sData.substr(i + 1, 3));
          if (iByte > 255) {
            throw QueryError("malformed_response", "TXT escape out of range: '" + sData + "'");
          }
          sSeg += static_cast<char>(iByte);
          i += 4;
        } else {
          sSeg += sData[i + 1];
          i += 2;
        }
        continue;
      }
      sSeg += c;
      ++i;
    }
    if (!bClosed) {
      throw QueryError("malformed_response", "Unterminated TXT segment: '" + sData + "'");
    }
    vSegments.push_back(std::move(sSeg));
  }
  return vSegments;
}

}  // namespace dnsaudit::resolver
