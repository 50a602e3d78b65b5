#include "resolver/ResolverFactory.hpp"

#include "resolver/DohResolver.hpp"
#include "resolver/StandardResolver.hpp"

namespace dnsaudit::resolver {

std::unique_ptr<IResolver> ResolverFactory::create(common::ResolverBackend backend,
                                                   const std::optional<std::string>& oServer,
                                                   const std::string& sDohEndpoint,
                                                   int iTimeoutMs) {
  if (backend == common::ResolverBackend::DoH) {
    return std::make_unique<DohResolver>(sDohEndpoint, iTimeoutMs);
  }
  return std::make_unique<StandardResolver>(oServer, iTimeoutMs);
}

std::unique_ptr<IResolver> ResolverFactory::fromConfig(const common::Config& cfg) {
  return create(cfg.backend, cfg.oDnsServer, cfg.sDohEndpoint, cfg.iQueryTimeoutMs);
}

std::unique_ptr<IResolver> ResolverFactory::forMonitorEntry(const std::string& sEntry,
                                                            const common::Config& cfg) {
  if (sEntry == "doh") {
    return create(common::ResolverBackend::DoH, std::nullopt, cfg.sDohEndpoint,
                  cfg.iQueryTimeoutMs);
  }
  if (sEntry == "system") {
    return create(common::ResolverBackend::Standard, std::nullopt, cfg.sDohEndpoint,
                  cfg.iQueryTimeoutMs);
  }
  return create(common::ResolverBackend::Standard, sEntry, cfg.sDohEndpoint,
                cfg.iQueryTimeoutMs);
}

}  // namespace dnsaudit::resolver
