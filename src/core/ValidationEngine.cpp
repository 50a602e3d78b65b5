#include "core/ValidationEngine.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/ComplianceScorer.hpp"

#include <algorithm>
#include <future>
#include <string>

namespace dnsaudit::core {

using common::ComparisonResult;
using common::DomainReport;
using common::ExpectedRecord;
using common::QueryResult;

namespace {

/// Forwards every query to the wrapped resolver through a pool, so callers
/// that query serially still share that pool's concurrency bound.
class PooledResolver : public resolver::IResolver {
 public:
  PooledResolver(resolver::IResolver& rResolver, ThreadPool& tpQueries)
      : _rResolver(rResolver), _tpQueries(tpQueries) {}

  std::string name() const override { return _rResolver.name(); }

  QueryResult query(const std::string& sName, common::RecordType type) override {
    return _tpQueries.submit([this, &sName, type]() { return _rResolver.query(sName, type); })
        .get();
  }

 private:
  resolver::IResolver& _rResolver;
  ThreadPool& _tpQueries;
};

}  // anonymous namespace

ValidationEngine::ValidationEngine(resolver::IResolver& rResolver,
                                   providers::IExpectedRecordProvider* pProvider,
                                   ValidationOptions vo)
    : _rResolver(rResolver),
      _pProvider(pProvider),
      _vo(std::move(vo)),
      _tpDomains(_vo.iDomainWorkers),
      _tpQueries(std::max(_vo.iMaxConcurrentQueries, 1)) {}

ValidationEngine::~ValidationEngine() = default;

std::vector<ComparisonResult> ValidationEngine::compareAll(
    const std::vector<ExpectedRecord>& vExpected) {
  std::vector<std::future<QueryResult>> vFutures;
  vFutures.reserve(vExpected.size());
  for (const auto& er : vExpected) {
    vFutures.push_back(_tpQueries.submit(
        [this, sFqdn = er.fqdn(), type = er.type]() { return _rResolver.query(sFqdn, type); }));
  }

  std::vector<ComparisonResult> vResults(vExpected.size());
  for (size_t i = 0; i < vExpected.size(); ++i) {
    vResults[i] = _cmpComparator.compare(vExpected[i], vFutures[i].get());
  }
  return vResults;
}

DomainReport ValidationEngine::validateDomain(const std::string& sDomain) {
  auto spLog = common::Logger::get();
  DomainReport drp;
  drp.sDomain = common::normalizeHost(sDomain);

  if (_pProvider) {
    std::vector<ExpectedRecord> vExpected;
    try {
      vExpected = _pProvider->fetch(drp.sDomain);
    } catch (const common::ProviderError& ex) {
      spLog->warn("Skipping {}: {}", drp.sDomain, ex.what());
      drp.bSkipped = true;
      drp.sSkipReason = ex.what();
      return drp;
    }

    if (!_vo.bIncludeOptional) {
      std::erase_if(vExpected, [](const ExpectedRecord& er) { return er.bIsOptional; });
    }
    spLog->debug("Comparing {} expected records for {}", vExpected.size(), drp.sDomain);
    drp.vComparisons = compareAll(vExpected);
  }

  std::vector<common::AuxCheck> vAux;
  if (_vo.bRunHealthChecks) {
    PooledResolver prBounded(_rResolver, _tpQueries);
    DomainHealthChecker hck(prBounded, _vo.hco);
    vAux = hck.check(drp.sDomain);
  }

  ComplianceScorer sc(_vo.profile);
  drp.oAssessment = sc.score(drp.sDomain, drp.vComparisons, vAux);
  spLog->info("{}: score {} ({})", drp.sDomain, drp.oAssessment->iScore,
              drp.oAssessment->tierName());
  return drp;
}

std::vector<DomainReport> ValidationEngine::run(const std::vector<std::string>& vDomains) {
  std::vector<DomainReport> vReports(vDomains.size());
  std::vector<std::future<void>> vFutures;
  vFutures.reserve(vDomains.size());

  for (size_t i = 0; i < vDomains.size(); ++i) {
    vFutures.push_back(_tpDomains.submit([this, &vReports, &vDomains, i]() {
      vReports[i] = validateDomain(vDomains[i]);
    }));
  }
  // Every worker references vReports; let all finish before any rethrow.
  for (auto& fut : vFutures) {
    fut.wait();
  }
  for (auto& fut : vFutures) {
    fut.get();
  }
  return vReports;
}

}  // namespace dnsaudit::core
