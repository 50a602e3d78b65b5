#include "report/ReportWriter.hpp"

#include <chrono>

namespace dnsaudit::report {

using nlohmann::json;

json ReportWriter::toJson(const common::ComparisonResult& cr) {
  json j = {
      {"domain", cr.sDomain},
      {"label", cr.sLabel},
      {"fqdn", cr.sFqdn},
      {"recordType", common::toString(cr.type)},
      {"status", common::toString(cr.status)},
      {"expectedValue", cr.sExpectedValue},
      {"actualValue", cr.sActualValue},
      {"isOptional", cr.bIsOptional},
      {"ttl", cr.iTtl},
      {"supportedService", cr.sSupportedService},
  };
  j["formatNote"] = cr.oFormatNote ? json(*cr.oFormatNote) : json(nullptr);
  j["details"] = cr.oDetails ? json(*cr.oDetails) : json(nullptr);
  return j;
}

json ReportWriter::toJson(const common::ComplianceAssessment& ca) {
  json jOutcomes = json::array();
  for (const auto& co : ca.vOutcomes) {
    jOutcomes.push_back({
        {"category", common::toString(co.category)},
        {"passed", co.bPassed},
        {"status", co.sStatus},
        {"detail", co.sDetail},
        {"observed", co.vObserved},
    });
  }
  return {
      {"domain", ca.sDomain},
      {"profile", common::toString(ca.profile)},
      {"score", ca.iScore},
      {"passed", ca.iPassed},
      {"applicable", ca.iApplicable},
      {"tier", ca.tierName()},
      {"outcomes", jOutcomes},
      {"criticalActions", ca.vCriticalActions},
      {"recommendations", ca.vRecommendations},
  };
}

json ReportWriter::toJson(const common::DomainReport& drp) {
  json j = {{"domain", drp.sDomain}, {"skipped", drp.bSkipped}};
  if (drp.bSkipped) {
    j["skipReason"] = drp.sSkipReason;
    return j;
  }

  json jComparisons = json::array();
  for (const auto& cr : drp.vComparisons) {
    jComparisons.push_back(toJson(cr));
  }
  j["comparisons"] = jComparisons;
  j["assessment"] = drp.oAssessment ? toJson(*drp.oAssessment) : json(nullptr);
  return j;
}

json ReportWriter::toJson(const std::vector<common::DomainReport>& vReports) {
  json jArr = json::array();
  for (const auto& drp : vReports) {
    jArr.push_back(toJson(drp));
  }
  return jArr;
}

json ReportWriter::propagationSummary(const core::PropagationMonitor& pm) {
  const auto& ps = pm.state();
  const auto& mo = pm.options();

  json jResolvers = json::object();
  for (const auto& [sId, oValue] : ps.mResolverValues) {
    jResolvers[sId] = oValue ? json(*oValue) : json(nullptr);
  }

  json jChanges = json::array();
  for (const auto& pce : pm.changes()) {
    jChanges.push_back({
        {"resolver", pce.sResolverId},
        {"previous", pce.sPrevious},
        {"current", pce.sCurrent},
        {"check", pce.iCheckNumber},
    });
  }

  const auto durElapsed = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::steady_clock::now() - ps.tpStartedAt);

  json j = {
      {"name", mo.sName},
      {"recordType", common::toString(mo.type)},
      {"state", common::toString(ps.state)},
      {"checkCount", ps.iCheckCount},
      {"changeCount", ps.iChangeCount},
      {"elapsedSeconds", durElapsed.count()},
      {"resolvers", jResolvers},
      {"changes", jChanges},
  };
  if (mo.oExpectedValue) {
    j["expectedValue"] = *mo.oExpectedValue;
    j["matchCount"] = ps.iMatchCount;
    j["propagationPct"] = ps.iPropagationPct;
  } else {
    j["expectedValue"] = nullptr;
  }
  return j;
}

std::string ReportWriter::csvField(const std::string& sValue) {
  if (sValue.find_first_of(",\"\r\n") == std::string::npos) {
    return sValue;
  }
  std::string sOut = "\"";
  for (char c : sValue) {
    if (c == '"') sOut += '"';
    sOut += c;
  }
  sOut += '"';
  return sOut;
}

std::string ReportWriter::toCsv(const std::vector<common::DomainReport>& vReports) {
  std::string sOut =
      "Domain,FQDN,RecordType,Status,ExpectedValue,ActualValue,FormatNote,Details,"
      "IsOptional,SupportedService\r\n";
  for (const auto& drp : vReports) {
    for (const auto& cr : drp.vComparisons) {
      sOut += csvField(cr.sDomain) + ',' + csvField(cr.sFqdn) + ',' +
              common::toString(cr.type) + ',' + common::toString(cr.status) + ',' +
              csvField(cr.sExpectedValue) + ',' + csvField(cr.sActualValue) + ',' +
              csvField(cr.oFormatNote.value_or("")) + ',' +
              csvField(cr.oDetails.value_or("")) + ',' + (cr.bIsOptional ? "true" : "false") +
              ',' + csvField(cr.sSupportedService) + "\r\n";
    }
  }
  return sOut;
}

}  // namespace dnsaudit::report
