#pragma once

#include <memory>
#include <optional>
#include <string>

#include "common/Config.hpp"
#include "resolver/IResolver.hpp"

namespace dnsaudit::resolver {

/// Creates concrete IResolver instances by backend.
class ResolverFactory {
 public:
  static std::unique_ptr<IResolver> create(common::ResolverBackend backend,
                                           const std::optional<std::string>& oServer,
                                           const std::string& sDohEndpoint, int iTimeoutMs);

  /// Resolver for batch validation, as configured.
  static std::unique_ptr<IResolver> fromConfig(const common::Config& cfg);

  /// Resolver for one monitor entry: "doh" selects the DoH backend, "system"
  /// the unpinned host resolver, anything else is a server to pin.
  static std::unique_ptr<IResolver> forMonitorEntry(const std::string& sEntry,
                                                    const common::Config& cfg);
};

}  // namespace dnsaudit::resolver
