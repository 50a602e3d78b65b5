#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/ThreadPool.hpp"
#include "resolver/IResolver.hpp"

namespace dnsaudit::core {

/// One resolver taking part in a propagation watch.
/// Class abbreviation: nr
struct NamedResolver {
  std::string sId;
  std::shared_ptr<resolver::IResolver> spResolver;
};

/// Class abbreviation: mo
struct MonitorOptions {
  std::string sName;
  common::RecordType type = common::RecordType::A;
  std::optional<std::string> oExpectedValue;
  std::chrono::milliseconds durInterval{std::chrono::seconds(30)};
  std::chrono::milliseconds durMaxDuration{0};  // 0 = unbounded
};

/// Polls one (name, type) pair across several resolvers until every resolver
/// returns the expected value, the maximum duration elapses, or the caller
/// requests a stop.
///
/// Sequencing is single-threaded: tick, then wait. Only the per-tick resolver
/// queries fan out, on a pool with one worker per resolver. A stop observed
/// during a tick lets the in-flight queries finish; the loop then exits
/// before the next tick.
/// Class abbreviation: pm
class PropagationMonitor {
 public:
  using ChangeCallback = std::function<void(const common::PropagationChange&)>;

  /// Throws ValidationError if vResolvers is empty or has duplicate ids.
  PropagationMonitor(std::vector<NamedResolver> vResolvers, MonitorOptions mo);
  ~PropagationMonitor();

  void onChange(ChangeCallback fnCallback);

  /// Runs the tick/wait loop until a terminal state and returns the final state.
  common::PropagationState run(std::stop_token stToken);

  /// Executes exactly one tick. No-op once a terminal state has been reached.
  void tick();

  const common::PropagationState& state() const { return _ps; }
  const std::vector<common::PropagationChange>& changes() const { return _vChanges; }
  const MonitorOptions& options() const { return _mo; }

  /// Comparable rendering of an answer: rendered values sorted and joined with
  /// ", ". nullopt for an empty or failed answer.
  static std::optional<std::string> observedValue(const common::QueryResult& qr);

  /// True if any record equals sExpected (case- and trailing-dot-insensitive).
  /// For MX, SRV and CNAME the bare host also counts.
  static bool matchesExpected(const common::QueryResult& qr, const std::string& sExpected);

 private:
  void finish(common::MonitorState state);

  std::vector<NamedResolver> _vResolvers;
  MonitorOptions _mo;
  common::PropagationState _ps;
  std::map<std::string, bool> _mMatched;
  std::vector<common::PropagationChange> _vChanges;
  ChangeCallback _fnOnChange;
  ThreadPool _tpFanOut;
  std::mutex _mtxWait;
  std::condition_variable_any _cvWait;
};

}  // namespace dnsaudit::core
