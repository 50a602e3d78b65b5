#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace dnsaudit::providers {

/// Pure abstract interface for every source of expected records.
/// fetch() may be called concurrently for different domains.
class IExpectedRecordProvider {
 public:
  virtual ~IExpectedRecordProvider() = default;

  virtual std::string name() const = 0;

  /// Throws ProviderError when the source has nothing usable for the domain.
  virtual std::vector<common::ExpectedRecord> fetch(const std::string& sDomain) = 0;
};

}  // namespace dnsaudit::providers
