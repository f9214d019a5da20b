#include "sample_data.h"

#include <iostream>
#include <string>
#include <vector>

namespace dispatch {
namespace {

struct SampleTable {
  const char* name;
  const char* partition_key;
  std::vector<const char*> rows;
};

const std::vector<SampleTable>& sample_tables() {
  static const std::vector<SampleTable> tables = {
      {"users", "user_id",
       {R"({"user_id":"u001","name":"Alice Johnson","email":"alice@example.com","age":28,"city":"San Francisco"})",
        R"({"user_id":"u002","name":"Bob Smith","email":"bob@example.com","age":35,"city":"New York"})",
        R"({"user_id":"u003","name":"Carol Davis","email":"carol@example.com","age":42,"city":"Chicago"})"}},
      {"products", "product_id",
       {R"({"product_id":"p001","name":"iPhone 15","category":"electronics","price":999,"rating":4.5})",
        R"({"product_id":"p002","name":"MacBook Pro","category":"electronics","price":2499,"rating":4.8})",
        R"({"product_id":"p003","name":"AirPods","category":"electronics","price":249,"rating":4.3})"}},
      {"orders", "order_id",
       {R"({"order_id":"o001","user_id":"u001","product_id":"p001","quantity":1,"total":999,"status":"shipped"})",
        R"({"order_id":"o002","user_id":"u002","product_id":"p002","quantity":1,"total":2499,"status":"delivered"})",
        R"({"order_id":"o003","user_id":"u001","product_id":"p003","quantity":2,"total":498,"status":"pending"})"}},
      {"reviews", "review_id",
       {R"({"review_id":"r001","product_id":"p001","user_id":"u001","rating":5,"comment":"Great phone!","date":"2024-01-15"})",
        R"({"review_id":"r002","product_id":"p002","user_id":"u002","rating":4,"comment":"Excellent laptop","date":"2024-01-20"})"}},
      {"inventory", "item_id",
       {R"({"item_id":"i001","product_id":"p001","warehouse":"west","quantity":150,"last_updated":"2024-01-10"})",
        R"({"item_id":"i002","product_id":"p002","warehouse":"east","quantity":75,"last_updated":"2024-01-12"})"}},
  };
  return tables;
}

}  // namespace

int SeedSampleData(ToolDispatcher& dispatcher) {
  int failures = 0;
  int rows = 0;

  for (const auto& t : sample_tables()) {
    const std::string create = std::string(R"({"table_name":")") + t.name +
                               R"(","key_schema":{"partition_key":")" + t.partition_key +
                               R"("},"billing_mode":"ON_DEMAND"})";
    auto created = dispatcher.Invoke("create_table", create);
    if (!created.success) {
      std::cerr << "[seed] create_table " << t.name << " failed: " << created.error.value_or("") << std::endl;
      ++failures;
      continue;
    }
    for (const char* row : t.rows) {
      const std::string put = std::string(R"({"table_name":")") + t.name + R"(","item":)" + row + "}";
      auto r = dispatcher.Invoke("put_item", put);
      if (!r.success) {
        std::cerr << "[seed] put_item " << t.name << " failed: " << r.error.value_or("") << std::endl;
        ++failures;
        continue;
      }
      ++rows;
    }
  }

  // Typical access patterns of the demo front end, including inefficient ones.
  dispatcher.Invoke("query", R"({"table_name":"users","key_condition":"age > :a","expression_values":{":a":30}})");
  dispatcher.Invoke("query",
                    R"({"table_name":"products","key_condition":"category = :c","expression_values":{":c":"electronics"}})");
  dispatcher.Invoke("scan",
                    R"({"table_name":"orders","filter_expression":"status = :s","expression_values":{":s":"pending"}})");
  dispatcher.Invoke("query", R"({"table_name":"reviews","key_condition":"rating > :r","expression_values":{":r":4}})");

  std::cout << "[seed] " << sample_tables().size() << " tables, " << rows << " items";
  if (failures > 0) std::cout << ", " << failures << " failures";
  std::cout << std::endl;
  return failures;
}

}  // namespace dispatch
