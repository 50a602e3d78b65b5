#pragma once

#include <string>

#include "common/Types.hpp"

namespace dnsaudit::resolver {

/// Pure abstract interface for all resolver backends.
/// Implementations return type-homogeneous answers shaped identically
/// regardless of transport, and never throw to callers.
class IResolver {
 public:
  virtual ~IResolver() = default;

  /// Identifier used in logs and propagation snapshots (e.g. "8.8.8.8", "doh").
  virtual std::string name() const = 0;

  virtual common::QueryResult query(const std::string& sName, common::RecordType type) = 0;
};

}  // namespace dnsaudit::resolver
