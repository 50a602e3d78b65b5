#include "providers/FileRecordProvider.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "report/BaselineStore.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace dnsaudit::providers {

using common::ConfigError;

namespace {

std::string readFile(const std::string& sPath) {
  std::ifstream ifs(sPath, std::ios::binary);
  if (!ifs) {
    throw ConfigError("unreadable_source", "Cannot open expected-record file: " + sPath);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

}  // anonymous namespace

// ── FileRecordProvider ─────────────────────────────────────────────────────

FileRecordProvider::FileRecordProvider(std::string sPath) : _sPath(std::move(sPath)) {}

void FileRecordProvider::ingest(const std::vector<FieldMap>& vRows) {
  _vRecords.reserve(vRows.size());
  for (size_t i = 0; i < vRows.size(); ++i) {
    try {
      _vRecords.push_back(toExpectedRecord(vRows[i]));
    } catch (const common::ValidationError& ex) {
      throw ConfigError("invalid_record",
                        _sPath + " row " + std::to_string(i + 1) + ": " + ex.what());
    }
  }
  common::Logger::get()->debug("Loaded {} expected records from {}", _vRecords.size(), _sPath);
}

std::vector<common::ExpectedRecord> FileRecordProvider::fetch(const std::string& sDomain) {
  const std::string sWanted = common::normalizeHost(sDomain);
  std::vector<common::ExpectedRecord> vOut;
  for (const auto& er : _vRecords) {
    if (er.sDomain == sWanted) {
      vOut.push_back(er);
    }
  }
  if (vOut.empty()) {
    throw common::ProviderError("no_records",
                                "No expected records for " + sDomain + " in " + _sPath);
  }
  return vOut;
}

// ── CsvRecordProvider ──────────────────────────────────────────────────────

std::vector<std::vector<std::string>> CsvRecordProvider::parseCsv(const std::string& sText) {
  std::vector<std::vector<std::string>> vRows;
  std::vector<std::string> vRow;
  std::string sField;
  bool bInQuotes = false;
  bool bFieldStarted = false;

  auto endField = [&]() {
    vRow.push_back(std::move(sField));
    sField.clear();
    bFieldStarted = false;
  };
  auto endRow = [&]() {
    endField();
    const bool bBlank = vRow.size() == 1 && vRow.front().empty();
    if (!bBlank) vRows.push_back(std::move(vRow));
    vRow.clear();
  };

  for (size_t i = 0; i < sText.size(); ++i) {
    const char c = sText[i];
    if (bInQuotes) {
      if (c == '"') {
        if (i + 1 < sText.size() && sText[i + 1] == '"') {
          sField += '"';
          ++i;
        } else {
          bInQuotes = false;
        }
      } else {
        sField += c;
      }
      continue;
    }

    if (c == '"' && !bFieldStarted) {
      bInQuotes = true;
      bFieldStarted = true;
    } else if (c == ',') {
      endField();
    } else if (c == '\r') {
      if (i + 1 < sText.size() && sText[i + 1] == '\n') ++i;
      endRow();
    } else if (c == '\n') {
      endRow();
    } else {
      sField += c;
      bFieldStarted = true;
    }
  }

  if (bInQuotes) {
    throw common::ValidationError("unterminated_quote", "CSV ends inside a quoted field");
  }
  if (bFieldStarted || !sField.empty() || !vRow.empty()) {
    endRow();
  }
  return vRows;
}

CsvRecordProvider::CsvRecordProvider(const std::string& sPath) : FileRecordProvider(sPath) {
  std::string sText = readFile(sPath);
  if (sText.rfind("\xEF\xBB\xBF", 0) == 0) {
    sText.erase(0, 3);  // UTF-8 BOM
  }

  std::vector<std::vector<std::string>> vTable;
  try {
    vTable = parseCsv(sText);
  } catch (const common::ValidationError& ex) {
    throw ConfigError("invalid_csv", sPath + ": " + ex.what());
  }
  if (vTable.empty()) {
    throw ConfigError("invalid_csv", sPath + " has no header row");
  }

  const auto& vHeader = vTable.front();
  std::vector<FieldMap> vRows;
  for (size_t r = 1; r < vTable.size(); ++r) {
    std::map<std::string, std::string> mRaw;
    for (size_t c = 0; c < vHeader.size() && c < vTable[r].size(); ++c) {
      mRaw[vHeader[c]] = vTable[r][c];
    }
    vRows.push_back(canonicalize(mRaw));
  }
  ingest(vRows);
}

// ── JsonRecordProvider ─────────────────────────────────────────────────────

JsonRecordProvider::JsonRecordProvider(const std::string& sPath) : FileRecordProvider(sPath) {
  nlohmann::json jDoc;
  try {
    jDoc = nlohmann::json::parse(readFile(sPath));
  } catch (const nlohmann::json::parse_error& ex) {
    throw ConfigError("invalid_json", sPath + " is not valid JSON: " + ex.what());
  }

  // Accept a bare array or a directory-style {"value": [...]} envelope.
  if (jDoc.is_object() && jDoc.contains("value")) {
    jDoc = jDoc["value"];
  }
  if (!jDoc.is_array()) {
    throw ConfigError("invalid_json", sPath + " must contain a JSON array of records");
  }

  std::vector<FieldMap> vRows;
  for (const auto& jEntry : jDoc) {
    try {
      vRows.push_back(fieldsFromJson(jEntry));
    } catch (const common::ValidationError& ex) {
      throw ConfigError("invalid_record",
                        sPath + " row " + std::to_string(vRows.size() + 1) + ": " + ex.what());
    }
  }
  ingest(vRows);
}

// ── BaselineRecordProvider ─────────────────────────────────────────────────

BaselineRecordProvider::BaselineRecordProvider(const std::string& sPath)
    : FileRecordProvider(sPath) {
  ingest(report::BaselineStore::load(sPath));
}

}  // namespace dnsaudit::providers
