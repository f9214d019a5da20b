#include "attribute_json.h"

#include <string>

#include "attribute_value.h"

namespace storage {
namespace {

using Aws::DynamoDB::Model::ValueType;
using Aws::Utils::Json::JsonView;
using DynamoValue = Aws::DynamoDB::Model::AttributeValue;

DynamoValue S(const std::string& v) {
  DynamoValue a;
  a.SetS(v.c_str());
  return a;
}

DynamoValue N(double v) {
  DynamoValue a;
  a.SetN(FormatNumber(v).c_str());
  return a;
}

DynamoValue B(bool v) {
  DynamoValue a;
  a.SetBool(v);
  return a;
}

DynamoValue Null() {
  DynamoValue a;
  a.SetNull(true);
  return a;
}

bool IsTypedAttribute(JsonView v) {
  if (!v.IsObject()) return false;
  const auto fields = v.GetAllObjects();
  if (fields.size() != 1) return false;
  const std::string tag = fields.begin()->first.c_str();
  return tag == "S" || tag == "N" || tag == "BOOL" || tag == "NULL" || tag == "B" || tag == "SS" ||
         tag == "NS" || tag == "BS" || tag == "M" || tag == "L";
}

}  // namespace

DynamoValue ToDynamo(const AttributeValue& v) {
  switch (v.index()) {
    case 1: return S(std::get<std::string>(v));
    case 2: return N(std::get<double>(v));
    case 3: return B(std::get<bool>(v));
    default: return Null();
  }
}

std::optional<AttributeValue> FromDynamo(const DynamoValue& v) {
  switch (v.GetType()) {
    case ValueType::STRING:
      return AttributeValue(std::string(v.GetS().c_str()));
    case ValueType::NUMBER: {
      const auto parsed = ParseNumber(v.GetN().c_str());
      if (!parsed) return std::nullopt;
      return AttributeValue(*parsed);
    }
    case ValueType::BOOL:
      return AttributeValue(v.GetBool());
    case ValueType::NULLVALUE:
      return AttributeValue(std::monostate{});
    default:
      return std::nullopt;
  }
}

Aws::Utils::Json::JsonValue ItemToJson(const Item& item) {
  Aws::Utils::Json::JsonValue out;
  for (const auto& kv : item) {
    out.WithObject(kv.first.c_str(), ToDynamo(kv.second).Jsonize());
  }
  return out;
}

std::optional<AttributeValue> AttributeFromJson(JsonView v) {
  if (v.IsNull()) return AttributeValue(std::monostate{});
  if (v.IsString()) return AttributeValue(std::string(v.AsString().c_str()));
  if (v.IsBool()) return AttributeValue(v.AsBool());
  if (v.IsIntegerType()) return AttributeValue(static_cast<double>(v.AsInt64()));
  if (v.IsFloatingPointType()) return AttributeValue(v.AsDouble());
  if (IsTypedAttribute(v)) return FromDynamo(DynamoValue(v));
  return std::nullopt;
}

std::optional<Item> ItemFromJson(JsonView v, std::string* bad_attribute) {
  if (!v.IsObject()) {
    if (bad_attribute) bad_attribute->clear();
    return std::nullopt;
  }
  Item out;
  for (const auto& kv : v.GetAllObjects()) {
    const std::string name = kv.first.c_str();
    auto value = AttributeFromJson(kv.second);
    if (!value) {
      if (bad_attribute) *bad_attribute = name;
      return std::nullopt;
    }
    out.emplace(name, std::move(*value));
  }
  return out;
}

}  // namespace storage
