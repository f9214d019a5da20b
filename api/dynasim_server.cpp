// dynasim_server.cpp
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <aws/core/Aws.h>

#include "../config/runtime_config.h"
#include "dispatch/sample_data.h"
#include "dispatch/tool_dispatcher.h"
#include "httplib.h"
#include "protocol/encode_json.h"
#include "storage/memory_storage.h"

using namespace std;

static void add_cors(httplib::Response& res) {
  res.set_header("Access-Control-Allow-Origin", "*");
  res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
}

static int status_for(const protocol::Response& r) {
  if (r.success) return 200;
  switch (r.error_code) {
    case storage::ErrorCode::NotFound: return 404;
    case storage::ErrorCode::AlreadyExists: return 409;
    default: return 400;
  }
}

// Orders walkthrough: create, put, update, scan, printing every envelope.
static int run_demo(dispatch::ToolDispatcher& dispatcher) {
  const vector<pair<string, string>> steps = {
      {"create_table", R"({"table_name":"orders","key_schema":{"partition_key":"order_id"},"billing_mode":"ON_DEMAND"})"},
      {"put_item", R"({"table_name":"orders","item":{"order_id":"o1","status":"pending"},"return_stream_event":true})"},
      {"update_item",
       R"({"table_name":"orders","key":{"order_id":"o1"},"update_expression":"SET status = :s","expression_values":{":s":"shipped"},"return_stream_event":true})"},
      {"scan", R"({"table_name":"orders"})"},
  };

  int failures = 0;
  for (const auto& step : steps) {
    auto r = dispatcher.Invoke(step.first, step.second);
    cout << step.first << " -> " << protocol::encode_response_json(r) << "\n";
    if (!r.success) ++failures;
  }
  cout << "ledger -> " << protocol::encode_ledger_json(dispatcher.GetLedgerSummary()) << "\n";
  return failures == 0 ? 0 : 1;
}

int main(int argc, char** argv) {
  const string mode = (argc >= 2) ? argv[1] : "serve";

  Aws::SDKOptions aws_options;
  Aws::InitAPI(aws_options);

  RuntimeConfig cfg = RuntimeConfig::FromEnv();
  cout << "[config] "
       << "LOG_OPERATIONS=" << (cfg.log_operations ? "true" : "false")
       << ", COST_READ_REQUEST=" << cfg.cost_read_request
       << ", COST_WRITE_REQUEST=" << cfg.cost_write_request
       << ", INDEX_WINDOW=" << cfg.index_window
       << ", INDEX_SCAN_RATIO=" << cfg.index_scan_ratio
       << ", INDEX_MIN_SCANS=" << cfg.index_min_scans
       << ", ENABLE_PARTITION_OPTIMIZER=" << (cfg.enable_partition_optimizer ? "true" : "false")
       << ", ENABLE_INDEX_ADVISOR=" << (cfg.enable_index_advisor ? "true" : "false")
       << ", ENABLE_STREAMS=" << (cfg.enable_streams ? "true" : "false")
       << "\n";

  int rc = 0;
  {
    storage::MemoryStorage store;
    dispatch::ToolDispatcher dispatcher(store, dispatch::OptionsFromConfig(cfg));

    if (mode == "demo") {
      rc = run_demo(dispatcher);
    } else if (mode != "serve") {
      cerr << "Usage: ./dynasim_server [serve|demo]\n";
      rc = 1;
    } else {
      if (cfg.seed_sample_data && dispatch::SeedSampleData(dispatcher) > 0) {
        cerr << "[seed] sample data incomplete\n";
      }

      httplib::Server srv;

      srv.Options(R"(.*)", [&](const httplib::Request&, httplib::Response& res) {
        add_cors(res);
        res.status = 204;
      });

      srv.Get("/tools", [&](const httplib::Request&, httplib::Response& res) {
        add_cors(res);
        res.set_content(protocol::encode_tools_json(dispatch::ToolDispatcher::ListTools()), "application/json");
      });

      srv.Post(R"(/tools/([a-z_]+))", [&](const httplib::Request& req, httplib::Response& res) {
        add_cors(res);
        auto r = dispatcher.Invoke(req.matches[1].str(), req.body);
        res.status = status_for(r);
        res.set_content(protocol::encode_response_json(r), "application/json");
      });

      srv.Get("/ledger", [&](const httplib::Request&, httplib::Response& res) {
        add_cors(res);
        res.set_content(protocol::encode_ledger_json(dispatcher.GetLedgerSummary()), "application/json");
      });

      srv.Post("/ledger/reset", [&](const httplib::Request&, httplib::Response& res) {
        add_cors(res);
        dispatcher.ResetLedger();
        res.set_content("{\"status\":\"OK\"}", "application/json");
      });

      srv.Get(R"(/tables/([^/]+)/advisories)", [&](const httplib::Request& req, httplib::Response& res) {
        add_cors(res);
        res.set_content(protocol::encode_suggestion_json(dispatcher.GetAdvisories(req.matches[1].str())),
                        "application/json");
      });

      srv.Get(R"(/tables/([^/]+)/stream)", [&](const httplib::Request& req, httplib::Response& res) {
        add_cors(res);
        size_t limit = 20;
        if (req.has_param("limit")) {
          const string raw = req.get_param_value("limit");
          char* end = nullptr;
          long parsed = strtol(raw.c_str(), &end, 10);
          if (end == raw.c_str() || *end != '\0' || parsed < 1) {
            res.status = 400;
            res.set_content("{\"error\":\"bad_limit\"}", "application/json");
            return;
          }
          limit = static_cast<size_t>(parsed);
        }
        auto events = dispatcher.RecentStreamEvents(req.matches[1].str(), limit);
        res.set_content(protocol::encode_stream_events_json(events), "application/json");
      });

      cout << "Server on http://" << cfg.bind_host << ":" << cfg.bind_port << "\n";
      cout << "Tools:  GET /tools, POST /tools/<name> {parameters}\n";
      cout << "Ledger: GET /ledger, POST /ledger/reset\n";
      cout << "Tables: GET /tables/<name>/advisories, GET /tables/<name>/stream?limit=K\n";

      if (!srv.listen(cfg.bind_host, cfg.bind_port)) {
        cerr << "Failed to listen on " << cfg.bind_host << ":" << cfg.bind_port << "\n";
        rc = 1;
      }
    }
  }

  Aws::ShutdownAPI(aws_options);
  return rc;
}
