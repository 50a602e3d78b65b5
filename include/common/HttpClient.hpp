#pragma once

#include <string>
#include <utility>
#include <vector>

namespace dnsaudit::common {

/// Class abbreviation: hr
struct HttpResponse {
  bool bTransportOk = false;  // false on DNS/connect/TLS/timeout failures
  long iStatus = 0;
  std::string sBody;
  std::string sError;
};

/// Minimal blocking libcurl GET client shared by the DoH resolver and the
/// directory API provider. One easy handle per request; safe to use from
/// multiple threads.
/// Class abbreviation: hc
class HttpClient {
 public:
  explicit HttpClient(int iTimeoutMs);
  ~HttpClient();

  HttpResponse get(const std::string& sUrl,
                   const std::vector<std::string>& vHeaders = {}) const;

  /// URL-encode a single query parameter value.
  static std::string escape(const std::string& sValue);

 private:
  int _iTimeoutMs;
};

}  // namespace dnsaudit::common
