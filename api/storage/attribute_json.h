#pragma once

#include <optional>
#include <string>

#include <aws/core/utils/json/JsonSerializer.h>
#include <aws/dynamodb/model/AttributeValue.h>

#include "models.h"

namespace storage {

// Conversions between simulator values and the DynamoDB wire model.
Aws::DynamoDB::Model::AttributeValue ToDynamo(const AttributeValue& v);

// Returns nullopt for kinds the simulator does not model (sets, lists, maps,
// binary) and for unparsable numbers.
std::optional<AttributeValue> FromDynamo(const Aws::DynamoDB::Model::AttributeValue& v);

// Item as DynamoDB typed JSON: {"order_id":{"S":"o1"},"qty":{"N":"2"}}.
Aws::Utils::Json::JsonValue ItemToJson(const Item& item);

// Accepts a plain JSON scalar ("o1", 2, true, null) or a typed attribute
// object ({"S":"o1"}, {"N":"2"}, {"BOOL":true}, {"NULL":true}).
std::optional<AttributeValue> AttributeFromJson(Aws::Utils::Json::JsonView v);

// Decodes every attribute of a JSON object. On an unsupported value returns
// nullopt and stores the offending attribute name in *bad_attribute.
std::optional<Item> ItemFromJson(Aws::Utils::Json::JsonView v, std::string* bad_attribute);

}  // namespace storage
