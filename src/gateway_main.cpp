#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "httplib.h"

#include "pmx/api.hpp"
#include "pmx/exchange.hpp"
#include "pmx/matching_engine.hpp"
#include "pmx/types.hpp"
#include "pmx/validation.hpp"

namespace {

constexpr int kDefaultPort = 8000;
constexpr const char* kDefaultHost = "0.0.0.0";

void set_no_cache(httplib::Response& res) {
  res.set_header("Cache-Control", "no-store, max-age=0");
  res.set_header("Pragma", "no-cache");
}

void send_json(httplib::Response& res, int status, const std::string& body) {
  set_no_cache(res);
  res.status = status;
  res.set_content(body, "application/json");
}

// Engine faults are programming errors: report them once, never retry.
using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

Handler guarded(const char* route, Handler h) {
  return [route, h = std::move(h)](const httplib::Request& req, httplib::Response& res) {
    try {
      h(req, res);
    } catch (const std::exception& e) {
      std::cerr << "error: " << route << ": " << e.what() << "\n";
      send_json(res, 500, pmx::api::error_json("Internal error"));
    }
  };
}

void usage() {
  std::cerr << "Usage:\n"
            << "  pmx_gateway [port] [host]\n"
            << "  defaults: port " << kDefaultPort << ", host " << kDefaultHost << "\n";
}

} // namespace

// ---------------- main ----------------
int main(int argc, char** argv) {
  // args: [port] [host]
  int port = kDefaultPort;
  std::string host = kDefaultHost;

  if (argc > 1) {
    const auto p = pmx::api::parse_int(argv[1]);
    if (!p || *p <= 0 || *p > 65535) {
      std::cerr << "invalid port '" << argv[1] << "'\n";
      usage();
      return 1;
    }
    port = static_cast<int>(*p);
  }
  if (argc > 2) host = argv[2];

  pmx::Exchange exchange{};

  httplib::Server svr;

  svr.set_default_headers({
    {"Access-Control-Allow-Origin", "*"},
    {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
    {"Access-Control-Allow-Headers", "*"},
  });

  // Allow typing "exit" or "quit" to stop cleanly
  std::thread stdin_thread([&]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line == "exit" || line == "quit") {
        svr.stop();
        break;
      }
    }
  });

  svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
  });

  svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, R"({"message":"Prediction Market Exchange API","status":"running"})");
  });

  // ---- APIs ----
  svr.Post("/orders", guarded("POST /orders", [&](const httplib::Request& req, httplib::Response& res) {
    pmx::OrderRequest order{};
    const bool json_body = req.get_header_value("Content-Type").find("application/json") != std::string::npos;
    const auto v = json_body ? pmx::api::parse_order_json(req.body, order)
                             : pmx::api::parse_order_request(req.params, order);
    if (!v.ok()) {
      send_json(res, 400, pmx::api::error_json(v.detail));
      return;
    }

    const auto r = exchange.place(order);

    std::cout << "order " << r.order_id << " " << pmx::to_string(r.status)
              << " filled=" << r.filled_qty
              << " remaining=" << r.remaining_qty
              << " trades=" << r.trades.size() << "\n";

    send_json(res, 200, pmx::api::to_json(r));
  }));

  svr.Get("/orderbook", guarded("GET /orderbook", [&](const httplib::Request&, httplib::Response& res) {
    send_json(res, 200, pmx::api::to_json(exchange.snapshot()));
  }));

  svr.Get("/trades", guarded("GET /trades", [&](const httplib::Request& req, httplib::Response& res) {
    std::size_t limit = 0;
    const auto v = pmx::api::parse_limit(req.params, exchange.config().default_trade_limit, limit);
    if (!v.ok()) {
      send_json(res, 400, pmx::api::error_json(v.detail));
      return;
    }
    send_json(res, 200, pmx::api::to_json(exchange.recent_trades(limit)));
  }));

  svr.Get(R"(/orders/(\d+))", guarded("GET /orders/{id}", [&](const httplib::Request& req, httplib::Response& res) {
    const auto id = pmx::api::parse_int(req.matches[1].str());
    const auto o = id ? exchange.find_order(static_cast<pmx::OrderId>(*id)) : std::nullopt;
    if (!o) {
      send_json(res, 404, pmx::api::error_json("order " + req.matches[1].str() + " is not resting"));
      return;
    }
    send_json(res, 200, pmx::api::to_json(*o));
  }));

  svr.Post("/reset", guarded("POST /reset", [&](const httplib::Request&, httplib::Response& res) {
    exchange.reset();
    std::cout << "order book reset\n";
    send_json(res, 200, pmx::api::message_json("Order book reset successfully"));
  }));

  std::cout << "PMX gateway listening on http://" << host << ":" << port << "/\n";
  std::cout << "Type 'exit' (or 'quit') then press Enter to stop cleanly.\n";

  if (!svr.listen(host, port)) {
    std::cerr << "failed to listen on " << host << ":" << port << "\n";
    svr.stop();
    if (stdin_thread.joinable()) stdin_thread.detach();
    return 1;
  }

  if (stdin_thread.joinable()) stdin_thread.join();
  return 0;
}
