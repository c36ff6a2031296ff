#include "PrinterBridge.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "core/printer/PrinterClient.hpp"
#include "core/text/Sanitizer.hpp"

using nlohmann::json;

namespace gb {

void mount_printer_bridge_routes(httplib::Server& svr, PrinterClient& device) {
  svr.Post("/print", [&](const httplib::Request& req, httplib::Response& res) {
    try {
      const json payload = json::parse(req.body);
      std::string message;
      if (payload.is_object() && payload.contains("message") && payload["message"].is_string()) {
        message = trimWhitespace(payload["message"].get<std::string>());
      }
      if (message.empty()) {
        res.status = 400;
        res.set_content("Missing message", "text/plain");
        return;
      }
      device.print(message);
      res.status = 200;
      res.set_content("OK", "text/plain");
    } catch (const std::exception& e) {
      spdlog::error("print failed: {}", e.what());
      res.status = 500;
      res.set_content(std::string(e.what()), "text/plain");
    }
  });
}

bool run_printer_bridge(PrinterClient& device, int port) {
  httplib::Server svr;
  mount_printer_bridge_routes(svr, device);

  spdlog::info("Printer bridge listening on http://127.0.0.1:{}", port);
  if (!svr.listen("127.0.0.1", port)) {
    spdlog::error("Failed to bind port {}", port);
    return false;
  }
  return true;
}

} // namespace gb
