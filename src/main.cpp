// src/main.cpp
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "core/config/AppConfig.hpp"
#include "core/metadata/InitDb.hpp"
#include "core/metadata/MessageStore.hpp"
#include "core/printer/DevicePrinter.hpp"
#include "core/printer/PrinterClient.hpp"
#include "core/printer/PrinterCodec.hpp"
#include "core/quota/RateLimiter.hpp"
#include "services/api/HttpServer.hpp"
#include "services/moderation/ModerationTool.hpp"
#include "services/printer/PrinterBridge.hpp"
#include "services/submission/SubmissionService.hpp"

// ---------- helpers ----------

// Look for schema.sql in CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/metadata)");
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init            # create/upgrade SQLite schema\n"
            << "  " << argv0 << " --serve           # start intake + gallery server (GB_PORT or 8080)\n"
            << "  " << argv0 << " --printer-bridge  # start local printer bridge (GB_BRIDGE_PORT or 8765)\n"
            << "  " << argv0 << " --moderate        # approve pending messages for the gallery\n";
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const gb::AppConfig cfg = gb::loadConfigFromEnv();
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));
    const std::string cmd = argc > 1 ? argv[1] : "";

    if (cmd == "--init") {
      initDatabase(cfg.dbPath, findSchemaPath());
      std::cout << "DB initialized at: " << cfg.dbPath << "\n";
      return 0;
    }

    if (cmd == "--serve") {
      // Self-heal DB on startup (idempotent)
      initDatabase(cfg.dbPath, findSchemaPath());

      MessageStore store(cfg.dbPath);
      gb::SlidingWindowRateLimiter limiter(cfg.rateLimit, std::chrono::seconds(cfg.rateWindowSec));
      gb::HttpPrinterClient printer(cfg.printerUrl, std::chrono::seconds(cfg.printerTimeoutSec));
      gb::SubmissionService submissions(store, limiter, printer,
                                        gb::SubmissionLimits{cfg.dailyLimit, cfg.maxLength});

      spdlog::info("daily limit {}, max length {}, printer at {}",
                   cfg.dailyLimit, cfg.maxLength, cfg.printerUrl);
      return gb::run_http_server(submissions, store, cfg.bindAddress, cfg.port) ? 0 : 2;
    }

    if (cmd == "--printer-bridge") {
      gb::DevicePrinter device(cfg.printerDevice, std::make_unique<gb::EscPosCodec>());
      spdlog::info("printing to {}", cfg.printerDevice);
      return gb::run_printer_bridge(device, cfg.bridgePort) ? 0 : 2;
    }

    if (cmd == "--moderate") {
      MessageStore store(cfg.dbPath);
      gb::ModerationTool tool(store, std::cin, std::cout);
      tool.run();
      return 0;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("Fatal: {}", e.what());
    return 2;
  }
}
