#pragma once

#include <optional>
#include <string>
#include <vector>

#include "resolver/IResolver.hpp"

namespace dnsaudit::resolver {

/// Host resolver backend built on libresolv. Each query gets its own
/// res_state, so instances are safe to share between threads.
/// Pinning is limited to IPv4 server literals.
class StandardResolver : public IResolver {
 public:
  StandardResolver(std::optional<std::string> oServer, int iTimeoutMs);
  ~StandardResolver() override;

  std::string name() const override;
  common::QueryResult query(const std::string& sName, common::RecordType type) override;

  /// Parse a raw DNS response, keeping answer-section RRs of the queried type.
  /// Throws QueryError when the message cannot be parsed.
  static std::vector<common::ResourceRecord> parseAnswer(const unsigned char* pMsg, int iLen,
                                                         common::RecordType type);

 private:
  std::optional<std::string> _oServer;
  int _iTimeoutMs;
};

}  // namespace dnsaudit::resolver
