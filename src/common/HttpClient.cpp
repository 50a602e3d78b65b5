#include "common/HttpClient.hpp"

#include "common/Errors.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace dnsaudit::common {

namespace {

std::once_flag gCurlInitFlag;

void ensureCurlInitialized() {
  std::call_once(gCurlInitFlag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeCallback(char* pData, size_t nSize, size_t nMemb, void* pUser) {
  auto* pBody = static_cast<std::string*>(pUser);
  pBody->append(pData, nSize * nMemb);
  return nSize * nMemb;
}

struct CurlDeleter {
  void operator()(CURL* pCurl) const { curl_easy_cleanup(pCurl); }
};

struct SlistDeleter {
  void operator()(curl_slist* pList) const { curl_slist_free_all(pList); }
};

}  // anonymous namespace

HttpClient::HttpClient(int iTimeoutMs) : _iTimeoutMs(iTimeoutMs) {
  ensureCurlInitialized();
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::get(const std::string& sUrl,
                             const std::vector<std::string>& vHeaders) const {
  std::unique_ptr<CURL, CurlDeleter> upCurl(curl_easy_init());
  if (!upCurl) {
    throw QueryError("curl_init_failed", "curl_easy_init returned null");
  }

  curl_slist* pHeaders = nullptr;
  for (const auto& sHeader : vHeaders) {
    pHeaders = curl_slist_append(pHeaders, sHeader.c_str());
  }
  std::unique_ptr<curl_slist, SlistDeleter> upHeaders(pHeaders);

  HttpResponse hr;
  char vErrBuf[CURL_ERROR_SIZE] = {0};

  curl_easy_setopt(upCurl.get(), CURLOPT_URL, sUrl.c_str());
  curl_easy_setopt(upCurl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(upCurl.get(), CURLOPT_HTTPHEADER, upHeaders.get());
  curl_easy_setopt(upCurl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(upCurl.get(), CURLOPT_WRITEDATA, &hr.sBody);
  curl_easy_setopt(upCurl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(_iTimeoutMs));
  curl_easy_setopt(upCurl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(upCurl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(upCurl.get(), CURLOPT_ERRORBUFFER, vErrBuf);

  const CURLcode rc = curl_easy_perform(upCurl.get());
  if (rc != CURLE_OK) {
    hr.bTransportOk = false;
    hr.sError = vErrBuf[0] != '\0' ? std::string(vErrBuf) : curl_easy_strerror(rc);
    return hr;
  }

  hr.bTransportOk = true;
  curl_easy_getinfo(upCurl.get(), CURLINFO_RESPONSE_CODE, &hr.iStatus);
  return hr;
}

std::string HttpClient::escape(const std::string& sValue) {
  ensureCurlInitialized();
  char* pEscaped = curl_easy_escape(nullptr, sValue.c_str(), static_cast<int>(sValue.size()));
  if (!pEscaped) {
    throw QueryError("escape_failed", "curl_easy_escape failed for '" + sValue + "'");
  }
  std::string sOut(pEscaped);
  curl_free(pEscaped);
  return sOut;
}

}  // namespace dnsaudit::common
