#pragma once

#include <string>
#include <vector>

#include "providers/IExpectedRecordProvider.hpp"
#include "providers/RecordMapping.hpp"

namespace dnsaudit::providers {

/// Shared base for offline sources that load every row up front.
/// fetch() is a read-only filter and safe to call concurrently.
/// Class abbreviation: frp
class FileRecordProvider : public IExpectedRecordProvider {
 public:
  std::vector<common::ExpectedRecord> fetch(const std::string& sDomain) override;

  size_t recordCount() const { return _vRecords.size(); }

 protected:
  explicit FileRecordProvider(std::string sPath);

  /// Maps rows through toExpectedRecord. A row that cannot be mapped is a
  /// ConfigError naming the file and the 1-based row number.
  void ingest(const std::vector<FieldMap>& vRows);

  std::string _sPath;
  std::vector<common::ExpectedRecord> _vRecords;
};

/// Expected records from a CSV file with a header row (RFC 4180 quoting).
/// Class abbreviation: csv
class CsvRecordProvider : public FileRecordProvider {
 public:
  explicit CsvRecordProvider(const std::string& sPath);

  std::string name() const override { return "csv"; }

  /// Splits CSV text into rows of fields. Quoted fields may contain commas,
  /// doubled quotes and line breaks. Blank lines are dropped.
  /// Throws ValidationError on an unterminated quote.
  static std::vector<std::vector<std::string>> parseCsv(const std::string& sText);
};

/// Expected records from a JSON array of objects, flat or directory-shaped.
/// Class abbreviation: jrp
class JsonRecordProvider : public FileRecordProvider {
 public:
  explicit JsonRecordProvider(const std::string& sPath);

  std::string name() const override { return "json"; }
};

/// Expected records replayed from a saved baseline snapshot.
/// Class abbreviation: brp
class BaselineRecordProvider : public FileRecordProvider {
 public:
  explicit BaselineRecordProvider(const std::string& sPath);

  std::string name() const override { return "baseline"; }
};

}  // namespace dnsaudit::providers
