#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>
#include <signal.h>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/PropagationMonitor.hpp"
#include "core/ValidationEngine.hpp"
#include "providers/ProviderFactory.hpp"
#include "report/BaselineStore.hpp"
#include "report/ReportWriter.hpp"
#include "resolver/ResolverFactory.hpp"

namespace {

using namespace dnsaudit;

constexpr const char* kUsage =
    "usage: dns-auditor <command> [args]\n"
    "\n"
    "  validate [--csv] <domain>...                compare live DNS to expected records\n"
    "  health <domain>...                          run health checks only\n"
    "  save-baseline <file> <domain>...            validate and write a baseline snapshot\n"
    "  compare-baseline [--csv] <file> <domain>... validate against a saved baseline\n"
    "  monitor <name> <type> [expected]            watch propagation across resolvers\n"
    "\n"
    "Configuration is read from DNSAUDIT_* environment variables.\n";

struct CliArgs {
  std::string sCommand;
  std::vector<std::string> vArgs;
  bool bCsv = false;
};

CliArgs parseArgs(int argc, char* argv[]) {
  CliArgs ca;
  for (int i = 1; i < argc; ++i) {
    const std::string sArg = argv[i];
    if (sArg == "--csv") {
      ca.bCsv = true;
    } else if (ca.sCommand.empty()) {
      ca.sCommand = sArg;
    } else {
      ca.vArgs.push_back(sArg);
    }
  }
  return ca;
}

core::ValidationOptions validationOptions(const common::Config& cfg) {
  core::ValidationOptions vo;
  vo.bIncludeOptional = cfg.bIncludeOptional;
  vo.bRunHealthChecks = true;
  vo.hco.bCheckDkim = cfg.bCheckDkim;
  vo.hco.bCheckDmarc = cfg.bCheckDmarc;
  vo.hco.bCheckDeprecated = cfg.bCheckDeprecated;
  vo.hco.bCheckSrv = cfg.bCheckSrv;
  vo.hco.vDkimSelectors = cfg.vDkimSelectors;
  vo.profile = cfg.scoreProfile;
  vo.iDomainWorkers = cfg.iThreadPoolSize;
  vo.iMaxConcurrentQueries = cfg.iMaxConcurrentQueries;
  return vo;
}

void printReports(const std::vector<common::DomainReport>& vReports, bool bCsv) {
  if (bCsv) {
    std::cout << report::ReportWriter::toCsv(vReports);
  } else {
    std::cout << report::ReportWriter::toJson(vReports).dump(2) << "\n";
  }
}

std::vector<common::ComparisonResult> allComparisons(
    const std::vector<common::DomainReport>& vReports) {
  std::vector<common::ComparisonResult> vOut;
  for (const auto& drp : vReports) {
    vOut.insert(vOut.end(), drp.vComparisons.begin(), drp.vComparisons.end());
  }
  return vOut;
}

int runValidate(common::Config& cfg, const std::vector<std::string>& vDomains, bool bCsv,
                const std::optional<std::string>& oSaveBaseline) {
  auto upProvider = providers::ProviderFactory::create(cfg);
  auto upResolver = resolver::ResolverFactory::fromConfig(cfg);
  common::Logger::get()->info("Validating {} domain(s) via {} against {} source",
                              vDomains.size(), upResolver->name(), upProvider->name());

  core::ValidationEngine ve(*upResolver, upProvider.get(), validationOptions(cfg));
  const auto vReports = ve.run(vDomains);

  if (oSaveBaseline) {
    report::BaselineStore::save(*oSaveBaseline, allComparisons(vReports));
  }
  printReports(vReports, bCsv);
  return EXIT_SUCCESS;
}

int runHealth(const common::Config& cfg, const std::vector<std::string>& vDomains) {
  auto upResolver = resolver::ResolverFactory::fromConfig(cfg);
  core::ValidationEngine ve(*upResolver, nullptr, validationOptions(cfg));
  printReports(ve.run(vDomains), false);
  return EXIT_SUCCESS;
}

/// Forwards SIGINT/SIGTERM to a stop_source. The signals must already be
/// blocked in every thread so that only sigtimedwait() here receives them.
std::jthread startSignalWatcher(std::stop_source ssMonitor) {
  return std::jthread([ssMonitor](std::stop_token stToken) mutable {
    sigset_t sigSet;
    sigemptyset(&sigSet);
    sigaddset(&sigSet, SIGINT);
    sigaddset(&sigSet, SIGTERM);
    const timespec tsPoll{0, 200'000'000};

    while (!stToken.stop_requested()) {
      const int iSig = sigtimedwait(&sigSet, nullptr, &tsPoll);
      if (iSig == SIGINT || iSig == SIGTERM) {
        common::Logger::get()->info("Received signal {}, stopping monitor", iSig);
        ssMonitor.request_stop();
        return;
      }
    }
  });
}

int runMonitor(const common::Config& cfg, const std::vector<std::string>& vArgs) {
  if (vArgs.size() < 2 || vArgs.size() > 3) {
    throw common::ConfigError("invalid_arguments", "monitor takes <name> <type> [expected]");
  }
  const auto oType = common::parseRecordType(vArgs[1]);
  if (!oType) {
    throw common::ValidationError("invalid_type", "Unknown record type: " + vArgs[1]);
  }

  // Block before any worker thread exists so every thread inherits the mask.
  sigset_t sigSet;
  sigemptyset(&sigSet);
  sigaddset(&sigSet, SIGINT);
  sigaddset(&sigSet, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigSet, nullptr);

  std::vector<core::NamedResolver> vResolvers;
  for (const auto& sEntry : cfg.vMonitorResolvers) {
    vResolvers.push_back(
        core::NamedResolver{sEntry, resolver::ResolverFactory::forMonitorEntry(sEntry, cfg)});
  }

  core::MonitorOptions mo;
  mo.sName = vArgs[0];
  mo.type = *oType;
  if (vArgs.size() == 3) mo.oExpectedValue = vArgs[2];
  mo.durInterval = std::chrono::seconds(cfg.iMonitorIntervalSeconds);
  mo.durMaxDuration = std::chrono::seconds(cfg.iMonitorMaxDurationSeconds);

  core::PropagationMonitor pm(std::move(vResolvers), mo);
  std::stop_source ssMonitor;
  auto thWatcher = startSignalWatcher(ssMonitor);

  const auto ps = pm.run(ssMonitor.get_token());
  thWatcher.request_stop();
  thWatcher.join();

  std::cout << report::ReportWriter::propagationSummary(pm).dump(2) << "\n";
  return ps.state == common::MonitorState::TimedOut ? EXIT_FAILURE : EXIT_SUCCESS;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
  try {
    const CliArgs ca = parseArgs(argc, argv);
    if (ca.sCommand.empty() || ca.sCommand == "help" || ca.sCommand == "--help") {
      std::cerr << kUsage;
      return ca.sCommand.empty() ? 2 : EXIT_SUCCESS;
    }

    // ── Configuration ─────────────────────────────────────────────────────
    auto cfgApp = common::Config::load();
    common::Logger::init(cfgApp.sLogLevel);
    auto spLog = common::Logger::get();
    spLog->debug("Configuration loaded (backend={}, profile={})",
                 common::toString(cfgApp.backend), common::toString(cfgApp.scoreProfile));

    // ── Dispatch ──────────────────────────────────────────────────────────
    if (ca.sCommand == "monitor") {
      return runMonitor(cfgApp, ca.vArgs);
    }

    if (ca.sCommand == "validate" || ca.sCommand == "health") {
      if (ca.vArgs.empty()) {
        throw common::ConfigError("invalid_arguments", ca.sCommand + " needs at least one domain");
      }
      return ca.sCommand == "validate" ? runValidate(cfgApp, ca.vArgs, ca.bCsv, std::nullopt)
                                       : runHealth(cfgApp, ca.vArgs);
    }

    if (ca.sCommand == "save-baseline" || ca.sCommand == "compare-baseline") {
      if (ca.vArgs.size() < 2) {
        throw common::ConfigError("invalid_arguments",
                                  ca.sCommand + " needs <file> and at least one domain");
      }
      const std::string sFile = ca.vArgs.front();
      const std::vector<std::string> vDomains(ca.vArgs.begin() + 1, ca.vArgs.end());

      if (ca.sCommand == "save-baseline") {
        return runValidate(cfgApp, vDomains, ca.bCsv, sFile);
      }
      if (cfgApp.sourceCount() > 0) {
        throw common::ConfigError("conflicting_sources",
                                  "compare-baseline uses the baseline as its only source; "
                                  "unset the other expected-record variables");
      }
      cfgApp.oBaselinePath = sFile;
      return runValidate(cfgApp, vDomains, ca.bCsv, std::nullopt);
    }

    throw common::ConfigError("unknown_command", "Unknown command: " + ca.sCommand);
  } catch (const common::ConfigError& ex) {
    common::Logger::get()->critical("{} ({})", ex.what(), ex._sErrorCode);
    if (ex._sErrorCode == "invalid_arguments" || ex._sErrorCode == "unknown_command") {
      std::cerr << kUsage;
    }
    return ex._iExitCode;
  } catch (const common::AppError& ex) {
    common::Logger::get()->critical("{} ({})", ex.what(), ex._sErrorCode);
    return ex._iExitCode;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
