#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/Comparator.hpp"
#include "core/DomainHealthChecker.hpp"
#include "core/ThreadPool.hpp"
#include "providers/IExpectedRecordProvider.hpp"
#include "resolver/IResolver.hpp"

namespace dnsaudit::core {

/// Class abbreviation: vo
struct ValidationOptions {
  bool bIncludeOptional = false;
  bool bRunHealthChecks = true;
  HealthCheckOptions hco;
  common::ScoreProfile profile = common::ScoreProfile::Health;
  int iDomainWorkers = 0;  // 0 = hardware concurrency
  int iMaxConcurrentQueries = 8;
};

/// Batch driver: for every domain, fetch expected records, query them through
/// the resolver, compare, run health checks and score.
///
/// Domains run on one pool and write into pre-sized result slots, so output
/// order always equals input order. Every resolver query, health checks
/// included, runs on a second pool bounded by iMaxConcurrentQueries; keeping
/// the pools separate means a domain worker waiting on its queries can never
/// starve them.
/// Class abbreviation: ve
class ValidationEngine {
 public:
  /// pProvider may be null, in which case only health checks run.
  /// The resolver and provider must outlive the engine.
  ValidationEngine(resolver::IResolver& rResolver, providers::IExpectedRecordProvider* pProvider,
                   ValidationOptions vo);
  ~ValidationEngine();

  std::vector<common::DomainReport> run(const std::vector<std::string>& vDomains);

  /// Evaluates one domain. ProviderError is contained as a skipped report.
  common::DomainReport validateDomain(const std::string& sDomain);

 private:
  std::vector<common::ComparisonResult> compareAll(
      const std::vector<common::ExpectedRecord>& vExpected);

  resolver::IResolver& _rResolver;
  providers::IExpectedRecordProvider* _pProvider;
  ValidationOptions _vo;
  Comparator _cmpComparator;
  ThreadPool _tpDomains;
  ThreadPool _tpQueries;
};

}  // namespace dnsaudit::core
