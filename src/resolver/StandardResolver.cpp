#include "resolver/StandardResolver.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <netinet/in.h>
#include <resolv.h>

#include <algorithm>
#include <cstring>
#include <vector>

namespace dnsaudit::resolver {

using common::QueryError;
using common::QueryResult;
using common::RecordType;
using common::ResourceRecord;

namespace {

constexpr int kAnswerBufSize = 65536;

ns_type toNsType(RecordType type) {
  switch (type) {
    case RecordType::MX: return ns_t_mx;
    case RecordType::CNAME: return ns_t_cname;
    case RecordType::TXT: return ns_t_txt;
    case RecordType::SRV: return ns_t_srv;
    case RecordType::A: return ns_t_a;
    case RecordType::AAAA: return ns_t_aaaa;
  }
  return ns_t_invalid;
}

/// RAII owner of a per-query resolver state.
class ResolverState {
 public:
  ResolverState() {
    std::memset(&_state, 0, sizeof(_state));
    if (res_ninit(&_state) != 0) {
      throw QueryError("res_init_failed", "res_ninit failed to read resolver configuration");
    }
  }
  ~ResolverState() { res_nclose(&_state); }

  ResolverState(const ResolverState&) = delete;
  ResolverState& operator=(const ResolverState&) = delete;

  res_state get() { return &_state; }

 private:
  struct __res_state _state;
};

std::string expandName(const ns_msg& handle, const unsigned char* pSrc) {
  char vName[NS_MAXDNAME];
  if (dn_expand(ns_msg_base(handle), ns_msg_end(handle), pSrc, vName, sizeof(vName)) < 0) {
    throw QueryError("malformed_response", "Failed to decompress domain name in answer");
  }
  return std::string(vName);
}

std::string describeHErrno(int iHErrno) {
  switch (iHErrno) {
    case HOST_NOT_FOUND: return "NXDOMAIN";
    case NO_DATA: return "no records of requested type";
    case TRY_AGAIN: return "timeout or server failure";
    case NO_RECOVERY: return "non-recoverable server error";
    default: return "resolver error " + std::to_string(iHErrno);
  }
}

}  // anonymous namespace

StandardResolver::StandardResolver(std::optional<std::string> oServer, int iTimeoutMs)
    : _oServer(std::move(oServer)), _iTimeoutMs(iTimeoutMs) {}

StandardResolver::~StandardResolver() = default;

std::string StandardResolver::name() const {
  return _oServer.value_or("system");
}

QueryResult StandardResolver::query(const std::string& sName, RecordType type) {
  if (sName.empty()) {
    return QueryResult::fault("Query name is empty");
  }

  try {
    ResolverState rs;
    res_state pState = rs.get();

    if (_oServer) {
      sockaddr_in sa{};
      sa.sin_family = AF_INET;
      sa.sin_port = htons(NS_DEFAULTPORT);
      if (inet_pton(AF_INET, _oServer->c_str(), &sa.sin_addr) != 1) {
        return QueryResult::fault("Resolver address is not an IPv4 literal: " + *_oServer);
      }
      pState->nsaddr_list[0] = sa;
      pState->nscount = 1;
    }

    pState->retrans = std::max(1, _iTimeoutMs / 1000);
    pState->retry = 2;

    std::vector<unsigned char> vAnswer(kAnswerBufSize);
    const int iLen = res_nquery(pState, sName.c_str(), ns_c_in, toNsType(type), vAnswer.data(),
                                static_cast<int>(vAnswer.size()));
    if (iLen < 0) {
      return QueryResult::noAnswer(describeHErrno(pState->res_h_errno));
    }

    return QueryResult::answered(parseAnswer(vAnswer.data(), iLen, type));
  } catch (const QueryError& ex) {
    common::Logger::get()->warn("StandardResolver[{}]: {} {} failed: {}", name(), sName,
                                common::toString(type), ex.what());
    return QueryResult::fault(ex.what());
  }
}

std::vector<ResourceRecord> StandardResolver::parseAnswer(const unsigned char* pMsg, int iLen,
                                                          RecordType type) {
  ns_msg handle;
  if (ns_initparse(pMsg, iLen, &handle) < 0) {
    throw QueryError("malformed_response", "Failed to parse DNS response header");
  }

  const ns_type wantType = toNsType(type);
  std::vector<ResourceRecord> vRecords;
  const int iCount = ns_msg_count(handle, ns_s_an);

  for (int i = 0; i < iCount; ++i) {
    ns_rr rr;
    if (ns_parserr(&handle, ns_s_an, i, &rr) < 0) {
      throw QueryError("malformed_response",
                       "Failed to parse answer record " + std::to_string(i));
    }
    if (ns_rr_type(rr) != wantType) {
      continue;  // CNAME chain hops, DNAME etc.
    }

    ResourceRecord rec;
    rec.sName = ns_rr_name(rr);
    rec.type = type;
    rec.uTtl = ns_rr_ttl(rr);

    const unsigned char* pRdata = ns_rr_rdata(rr);
    const uint16_t uRdLen = ns_rr_rdlen(rr);

    switch (type) {
      case RecordType::A: {
        if (uRdLen != NS_INADDRSZ) {
          throw QueryError("malformed_response", "A record with invalid length");
        }
        char vAddr[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, pRdata, vAddr, sizeof(vAddr));
        rec.tvValue = common::AddressValue{vAddr};
        break;
      }
      case RecordType::AAAA: {
        if (uRdLen != NS_IN6ADDRSZ) {
          throw QueryError("malformed_response", "AAAA record with invalid length");
        }
        char vAddr[INET6_ADDRSTRLEN];
        inet_ntop(AF_INET6, pRdata, vAddr, sizeof(vAddr));
        rec.tvValue = common::AddressValue{vAddr};
        break;
      }
      case RecordType::CNAME:
        rec.tvValue = common::CnameValue{expandName(handle, pRdata)};
        break;
      case RecordType::MX: {
        if (uRdLen < 3) {
          throw QueryError("malformed_response", "MX record too short");
        }
        common::MxValue mx;
        mx.iPreference = ns_get16(pRdata);
        mx.sExchange = expandName(handle, pRdata + NS_INT16SZ);
        rec.tvValue = mx;
        break;
      }
      case RecordType::SRV: {
        if (uRdLen < 7) {
          throw QueryError("malformed_response", "SRV record too short");
        }
        common::SrvValue srv;
        srv.iPriority = ns_get16(pRdata);
        srv.iWeight = ns_get16(pRdata + NS_INT16SZ);
        srv.iPort = ns_get16(pRdata + 2 * NS_INT16SZ);
        srv.sTarget = expandName(handle, pRdata + 3 * NS_INT16SZ);
        rec.tvValue = srv;
        break;
      }
      case RecordType::TXT: {
        common::TxtValue txt;
        size_t nOff = 0;
        while (nOff < uRdLen) {
          const size_t nSegLen = pRdata[nOff];
          if (nOff + 1 + nSegLen > uRdLen) {
            throw QueryError("malformed_response", "TXT character-string overruns rdata");
          }
          txt.vSegments.emplace_back(reinterpret_cast<const char*>(pRdata + nOff + 1), nSegLen);
          nOff += 1 + nSegLen;
        }
        rec.tvValue = txt;
        break;
      }
    }

    vRecords.push_back(std::move(rec));
  }

  return vRecords;
}

}  // namespace dnsaudit::resolver
