#include "providers/ProviderFactory.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "providers/FileRecordProvider.hpp"
#include "providers/GraphRecordProvider.hpp"

#include <openssl/crypto.h>

namespace dnsaudit::providers {

std::unique_ptr<IExpectedRecordProvider> ProviderFactory::create(common::Config& cfg) {
  const int iSources = cfg.sourceCount();
  if (iSources == 0) {
    throw common::ConfigError("no_source",
                              "No expected-record source configured (set one of "
                              "DNSAUDIT_EXPECTED_CSV, DNSAUDIT_EXPECTED_JSON, "
                              "DNSAUDIT_BASELINE_FILE, DNSAUDIT_GRAPH_TOKEN)");
  }
  if (iSources > 1) {
    throw common::ConfigError("conflicting_sources",
                              "Only one expected-record source may be configured");
  }

  auto spLog = common::Logger::get();
  if (cfg.oExpectedCsvPath) {
    spLog->info("Expected records: CSV {}", *cfg.oExpectedCsvPath);
    return std::make_unique<CsvRecordProvider>(*cfg.oExpectedCsvPath);
  }
  if (cfg.oExpectedJsonPath) {
    spLog->info("Expected records: JSON {}", *cfg.oExpectedJsonPath);
    return std::make_unique<JsonRecordProvider>(*cfg.oExpectedJsonPath);
  }
  if (cfg.oBaselinePath) {
    spLog->info("Expected records: baseline {}", *cfg.oBaselinePath);
    return std::make_unique<BaselineRecordProvider>(*cfg.oBaselinePath);
  }

  spLog->info("Expected records: directory API {}", cfg.sGraphEndpoint);
  auto spSession = std::make_shared<DirectorySession>(*cfg.oGraphToken, cfg.sGraphEndpoint);
  OPENSSL_cleanse(cfg.oGraphToken->data(), cfg.oGraphToken->size());
  cfg.oGraphToken.reset();
  return std::make_unique<GraphRecordProvider>(std::move(spSession), cfg.iQueryTimeoutMs);
}

}  // namespace dnsaudit::providers
