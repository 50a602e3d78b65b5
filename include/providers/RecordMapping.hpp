#pragma once

#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace dnsaudit::providers {

/// Flat field map as read from a CSV row, a JSON object or a baseline entry.
/// Keys are canonical lowercase field names (see canonicalField).
using FieldMap = std::map<std::string, std::string>;

/// Canonical field name for a source key. Case-insensitive; aliases such as
/// "Host" -> "label" or "mailExchange" -> "expectedvalue" are folded.
/// Unknown keys come back lowercased.
std::string canonicalField(std::string_view svKey);

/// Canonicalizes every key; the first non-empty value for a field wins.
FieldMap canonicalize(const std::map<std::string, std::string>& mRaw);

/// Flattens one JSON object into a FieldMap. Strings are copied, numbers and
/// booleans are rendered, nested values are ignored.
FieldMap fieldsFromJson(const nlohmann::json& jObject);

/// The single mapping every adapter shares.
/// Throws ValidationError on a missing domain, unknown record type or an
/// expected value that cannot be shaped for its type.
common::ExpectedRecord toExpectedRecord(const FieldMap& mFields);

/// Shapes expected value text for a record type. MX accepts "10 host" or a bare
/// host plus the preference field; SRV accepts "prio weight port target" or a
/// bare target plus the numeric fields.
common::TypedValue parseExpectedValue(common::RecordType type, const std::string& sValue,
                                      const FieldMap& mFields);

}  // namespace dnsaudit::providers
