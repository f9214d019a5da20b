#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "models.h"

namespace storage {

// DynamoDB type tag for the held kind: "NULL", "S", "N" or "BOOL".
const char* KindName(const AttributeValue& v);

bool IsNull(const AttributeValue& v);
bool IsString(const AttributeValue& v);
bool IsNumber(const AttributeValue& v);
bool IsBool(const AttributeValue& v);

// Only strings and numbers may be key attributes.
bool IsKeyKind(const AttributeValue& v);

// Decimal rendering that parses back to the same double ("42", "0.1",
// "1234567890123457"). -0 renders as "0".
std::string FormatNumber(double v);
std::optional<double> ParseNumber(const std::string& s);

// Human-readable rendering for messages and logs: strings quoted.
std::string ToDisplayString(const AttributeValue& v);

bool Equals(const AttributeValue& a, const AttributeValue& b);

// Total order used for sort-key ordering: kind first, then value.
int Compare(const AttributeValue& a, const AttributeValue& b);

// Approximate DynamoDB item size: attribute name lengths plus value sizes.
size_t AttributeSizeBytes(const AttributeValue& v);
size_t ItemSizeBytes(const Item& item);

}  // namespace storage
