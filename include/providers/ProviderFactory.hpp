#pragma once

#include <memory>

#include "common/Config.hpp"
#include "providers/IExpectedRecordProvider.hpp"

namespace dnsaudit::providers {

/// Creates the single configured expected-record provider.
class ProviderFactory {
 public:
  /// Throws ConfigError("no_source") when nothing is configured and
  /// ConfigError("conflicting_sources") when more than one source is set.
  /// The directory token is moved into a DirectorySession and wiped from cfg.
  static std::unique_ptr<IExpectedRecordProvider> create(common::Config& cfg);
};

}  // namespace dnsaudit::providers
