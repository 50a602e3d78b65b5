#include "core/PropagationMonitor.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <set>

namespace dnsaudit::core {

using common::MonitorState;
using common::QueryResult;
using common::QueryStatus;

namespace {

std::string canonical(const std::string& s) {
  return common::normalizeHost(s);
}

}  // anonymous namespace

PropagationMonitor::PropagationMonitor(std::vector<NamedResolver> vResolvers, MonitorOptions mo)
    : _vResolvers(std::move(vResolvers)),
      _mo(std::move(mo)),
      _tpFanOut(static_cast<int>(std::max<size_t>(_vResolvers.size(), 1))) {
  if (_vResolvers.empty()) {
    throw common::ValidationError("no_resolvers", "Propagation monitor needs at least one resolver");
  }
  std::set<std::string> setIds;
  for (const auto& nr : _vResolvers) {
    if (!setIds.insert(nr.sId).second) {
      throw common::ValidationError("duplicate_resolver", "Resolver listed twice: " + nr.sId);
    }
    _ps.mResolverValues[nr.sId] = std::nullopt;
    _mMatched[nr.sId] = false;
  }
  _ps.tpStartedAt = std::chrono::steady_clock::now();
}

PropagationMonitor::~PropagationMonitor() = default;

void PropagationMonitor::onChange(ChangeCallback fnCallback) {
  _fnOnChange = std::move(fnCallback);
}

std::optional<std::string> PropagationMonitor::observedValue(const QueryResult& qr) {
  if (!qr.hasRecords()) return std::nullopt;

  std::vector<std::string> vValues;
  for (const auto& rr : qr.vRecords) {
    vValues.push_back(common::renderValue(rr.tvValue));
  }
  std::sort(vValues.begin(), vValues.end());

  std::string sOut;
  for (const auto& s : vValues) {
    if (!sOut.empty()) sOut += ", ";
    sOut += s;
  }
  return sOut;
}

bool PropagationMonitor::matchesExpected(const QueryResult& qr, const std::string& sExpected) {
  const std::string sWanted = canonical(sExpected);
  for (const auto& rr : qr.vRecords) {
    if (canonical(common::renderValue(rr.tvValue)) == sWanted) return true;

    if (const auto* pMx = std::get_if<common::MxValue>(&rr.tvValue)) {
      if (canonical(pMx->sExchange) == sWanted) return true;
    } else if (const auto* pSrv = std::get_if<common::SrvValue>(&rr.tvValue)) {
      if (canonical(pSrv->sTarget) == sWanted) return true;
    } else if (const auto* pCn = std::get_if<common::CnameValue>(&rr.tvValue)) {
      if (canonical(pCn->sTarget) == sWanted) return true;
    }
  }
  return false;
}

void PropagationMonitor::tick() {
  if (_ps.state != MonitorState::Polling) return;

  auto spLog = common::Logger::get();
  ++_ps.iCheckCount;

  std::vector<std::future<QueryResult>> vFutures;
  vFutures.reserve(_vResolvers.size());
  for (const auto& nr : _vResolvers) {
    vFutures.push_back(_tpFanOut.submit([spResolver = nr.spResolver, this]() {
      return spResolver->query(_mo.sName, _mo.type);
    }));
  }

  for (size_t i = 0; i < _vResolvers.size(); ++i) {
    const std::string& sId = _vResolvers[i].sId;
    const QueryResult qr = vFutures[i].get();

    if (qr.status == QueryStatus::Fault) {
      // Keep the last observation; one broken resolver must not reset progress.
      spLog->warn("Resolver {} failed for {} {}: {}", sId, _mo.sName,
                  common::toString(_mo.type), qr.sError);
      continue;
    }

    auto oCurrent = observedValue(qr);
    auto& oPrevious = _ps.mResolverValues[sId];
    if (oPrevious && oCurrent && *oPrevious != *oCurrent) {
      common::PropagationChange pce{sId, *oPrevious, *oCurrent, _ps.iCheckCount};
      ++_ps.iChangeCount;
      spLog->info("Resolver {} changed: {} -> {}", sId, pce.sPrevious, pce.sCurrent);
      _vChanges.push_back(pce);
      if (_fnOnChange) _fnOnChange(pce);
    }
    oPrevious = std::move(oCurrent);

    if (_mo.oExpectedValue) {
      _mMatched[sId] = matchesExpected(qr, *_mo.oExpectedValue);
    }
  }

  for (const auto& [sId, oValue] : _ps.mResolverValues) {
    spLog->debug("Check #{} {}: {}", _ps.iCheckCount, sId, oValue.value_or("(none)"));
  }

  if (!_mo.oExpectedValue) return;

  _ps.iMatchCount = static_cast<int>(
      std::count_if(_mMatched.begin(), _mMatched.end(), [](const auto& kv) { return kv.second; }));
  const int iTotal = static_cast<int>(_vResolvers.size());
  _ps.iPropagationPct = static_cast<int>(std::lround(100.0 * _ps.iMatchCount / iTotal));
  spLog->info("Check #{}: {}/{} resolvers ({}%) return {}", _ps.iCheckCount, _ps.iMatchCount,
              iTotal, _ps.iPropagationPct, *_mo.oExpectedValue);

  if (_ps.iMatchCount == iTotal) {
    finish(MonitorState::Converged);
  }
}

void PropagationMonitor::finish(MonitorState state) {
  _ps.state = state;
  common::Logger::get()->info("Propagation monitor for {} {} finished: {} after {} checks",
                              _mo.sName, common::toString(_mo.type), common::toString(state),
                              _ps.iCheckCount);
}

common::PropagationState PropagationMonitor::run(std::stop_token stToken) {
  using Clock = std::chrono::steady_clock;
  _ps.tpStartedAt = Clock::now();
  const bool bBounded = _mo.durMaxDuration.count() > 0;
  const auto tpDeadline = _ps.tpStartedAt + _mo.durMaxDuration;

  while (_ps.state == MonitorState::Polling) {
    if (stToken.stop_requested()) {
      finish(MonitorState::Cancelled);
      break;
    }
    if (bBounded && Clock::now() >= tpDeadline) {
      finish(MonitorState::TimedOut);
      break;
    }

    tick();
    if (_ps.state != MonitorState::Polling) break;

    auto durWait = std::chrono::duration_cast<std::chrono::milliseconds>(_mo.durInterval);
    if (bBounded) {
      const auto durRemaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(tpDeadline - Clock::now());
      durWait = std::min(durWait, std::max(durRemaining, std::chrono::milliseconds(0)));
    }

    // Sleep until the next tick is due, or until stop is requested
    std::unique_lock<std::mutex> lock(_mtxWait);
    _cvWait.wait_for(lock, stToken, durWait, []() { return false; });
  }
  return _ps;
}

}  // namespace dnsaudit::core
