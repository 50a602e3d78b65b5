#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"
#include "core/FormatClassifier.hpp"

namespace dnsaudit::core {

/// Per-record-type equivalence between one expected record and the live answer.
/// Stateless apart from the classifier table; compare() is a pure function of
/// its inputs and safe to call from any thread.
/// Class abbreviation: cmp
class Comparator {
 public:
  Comparator();
  explicit Comparator(FormatClassifier fcClassifier);

  common::ComparisonResult compare(const common::ExpectedRecord& er,
                                   const common::QueryResult& qr) const;

  static constexpr const char* kNotFound = "(not found)";

 private:
  void compareMx(const common::ExpectedRecord& er,
                 const std::vector<common::ResourceRecord>& vRecords,
                 common::ComparisonResult& cr) const;
  void compareCname(const common::ExpectedRecord& er,
                    const std::vector<common::ResourceRecord>& vRecords,
                    common::ComparisonResult& cr) const;
  void compareTxt(const common::ExpectedRecord& er,
                  const std::vector<common::ResourceRecord>& vRecords,
                  common::ComparisonResult& cr) const;
  void compareSrv(const common::ExpectedRecord& er,
                  const std::vector<common::ResourceRecord>& vRecords,
                  common::ComparisonResult& cr) const;
  void compareAddress(const common::ExpectedRecord& er,
                      const std::vector<common::ResourceRecord>& vRecords,
                      common::ComparisonResult& cr) const;

  FormatClassifier _fcClassifier;
};

}  // namespace dnsaudit::core
