#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/Types.hpp"

namespace dnsaudit::core {

/// Hostname generation for a Microsoft 365 record.
enum class FormatClass { Legacy, Modern };

/// One row of the classification table.
/// Class abbreviation: fr
struct FormatRule {
  common::RecordType type;
  std::string sPattern;  // '*' matches any run of characters
  FormatClass formatClass;
  std::string sLabel;
};

/// Class abbreviation: fm
struct FormatMatch {
  FormatClass formatClass;
  std::string sLabel;
};

/// Ordered (pattern, label) table evaluated top-down; the first rule whose
/// type and pattern match wins.
/// Class abbreviation: fc
class FormatClassifier {
 public:
  /// Classifier loaded with the built-in Microsoft 365 rules.
  FormatClassifier();
  explicit FormatClassifier(std::vector<FormatRule> vRules);

  std::optional<FormatMatch> classify(common::RecordType type, std::string_view svHost) const;

  bool isLegacy(common::RecordType type, std::string_view svHost) const;

  static std::vector<FormatRule> defaultRules();

  /// Case-insensitive glob match; trailing root dots are ignored on both sides.
  static bool wildcardMatch(std::string_view svPattern, std::string_view svText);

 private:
  std::vector<FormatRule> _vRules;
};

}  // namespace dnsaudit::core
