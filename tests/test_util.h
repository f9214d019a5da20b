#pragma once

#include <string>

#include <aws/core/utils/json/JsonSerializer.h>

#include "storage/models.h"

namespace testutil {

inline storage::AttributeValue S(const std::string& v) { return storage::AttributeValue(v); }
inline storage::AttributeValue N(double v) { return storage::AttributeValue(v); }
inline storage::AttributeValue B(bool v) { return storage::AttributeValue(v); }

inline Aws::Utils::Json::JsonValue Json(const std::string& text) {
  return Aws::Utils::Json::JsonValue(Aws::String(text.c_str()));
}

}  // namespace testutil
