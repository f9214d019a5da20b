#include "attribute_value.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

namespace storage {

const char* KindName(const AttributeValue& v) {
  switch (v.index()) {
    case 0: return "NULL";
    case 1: return "S";
    case 2: return "N";
    case 3: return "BOOL";
  }
  return "NULL";
}

bool IsNull(const AttributeValue& v) { return std::holds_alternative<std::monostate>(v); }
bool IsString(const AttributeValue& v) { return std::holds_alternative<std::string>(v); }
bool IsNumber(const AttributeValue& v) { return std::holds_alternative<double>(v); }
bool IsBool(const AttributeValue& v) { return std::holds_alternative<bool>(v); }

bool IsKeyKind(const AttributeValue& v) {
  return IsString(v) || IsNumber(v);
}

std::string FormatNumber(double v) {
  if (!std::isfinite(v)) return "0";
  if (v == 0.0) return "0";
  // 15 digits reads naturally ("0.1"); use max_digits10 when that would
  // collapse two distinct doubles.
  std::ostringstream out;
  out << std::setprecision(15) << v;
  if (std::strtod(out.str().c_str(), nullptr) == v) return out.str();
  std::ostringstream exact;
  exact << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
  return exact.str();
}

std::optional<double> ParseNumber(const std::string& s) {
  if (s.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const double parsed = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) return std::nullopt;
  if (!std::isfinite(parsed)) return std::nullopt;
  return parsed;
}

std::string ToDisplayString(const AttributeValue& v) {
  switch (v.index()) {
    case 1: return "\"" + std::get<std::string>(v) + "\"";
    case 2: return FormatNumber(std::get<double>(v));
    case 3: return std::get<bool>(v) ? "true" : "false";
    default: return "null";
  }
}

bool Equals(const AttributeValue& a, const AttributeValue& b) {
  return Compare(a, b) == 0;
}

int Compare(const AttributeValue& a, const AttributeValue& b) {
  if (a.index() != b.index()) return a.index() < b.index() ? -1 : 1;
  switch (a.index()) {
    case 1: {
      const int c = std::get<std::string>(a).compare(std::get<std::string>(b));
      return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    case 2: {
      const double x = std::get<double>(a);
      const double y = std::get<double>(b);
      return x < y ? -1 : (x > y ? 1 : 0);
    }
    case 3: {
      const bool x = std::get<bool>(a);
      const bool y = std::get<bool>(b);
      return x == y ? 0 : (x ? 1 : -1);
    }
    default:
      return 0;
  }
}

size_t AttributeSizeBytes(const AttributeValue& v) {
  switch (v.index()) {
    case 1: return std::get<std::string>(v).size();
    // Numbers are stored as variable-length decimals: roughly one byte per
    // two significant digits plus one.
    case 2: return FormatNumber(std::get<double>(v)).size() / 2 + 1;
    default: return 1;
  }
}

size_t ItemSizeBytes(const Item& item) {
  size_t total = 0;
  for (const auto& kv : item) {
    total += kv.first.size() + AttributeSizeBytes(kv.second);
  }
  return total;
}

}  // namespace storage
