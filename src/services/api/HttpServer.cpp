#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <string>

#include "core/metadata/MessageStore.hpp"

using nlohmann::json;

static void send_detail(httplib::Response& res, int status, const std::string& detail) {
  res.status = status;
  res.set_content(json({{"detail", detail}}).dump(), "application/json");
}

namespace gb {

int http_status_for(SubmissionOutcome o) {
  switch (o) {
    case SubmissionOutcome::Accepted:           return 200;
    case SubmissionOutcome::EmptyContent:       return 400;
    case SubmissionOutcome::PayloadTooLarge:    return 422;
    case SubmissionOutcome::RateLimited:        return 429;
    case SubmissionOutcome::DailyLimitReached:  return 429;
    case SubmissionOutcome::PrinterUnavailable: return 502;
    case SubmissionOutcome::StoreUnavailable:   return 503;
  }
  return 500;
}

void mount_guestbook_routes(httplib::Server& svr,
                            SubmissionService& submissions,
                            MessageStore& store) {
  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // POST /submit
  // Body: {"message": "<text>"}
  svr.Post("/submit", [&](const httplib::Request& req, httplib::Response& res) {
    json j;
    try { j = json::parse(req.body); }
    catch (const json::parse_error&) { send_detail(res, 422, "invalid JSON body"); return; }

    if (!j.is_object() || !j.contains("message") || !j["message"].is_string()) {
      send_detail(res, 422, "field 'message' (string) required");
      return;
    }

    SubmissionResult r;
    try {
      r = submissions.submit(j["message"].get<std::string>(), req.remote_addr);
    } catch (const std::exception& e) {
      spdlog::error("submit failed: {}", e.what());
      send_detail(res, 500, "internal error");
      return;
    }

    if (r.accepted()) {
      res.status = 200;
      res.set_content(json({{"status", "ok"}}).dump(), "application/json");
      return;
    }
    send_detail(res, http_status_for(r.outcome), r.detail);
  });

  // GET /gallery -> approved messages, newest first
  svr.Get("/gallery", [&](const httplib::Request&, httplib::Response& res) {
    std::vector<MessageRecord> rows;
    try {
      rows = store.listApproved();
    } catch (const StoreError& e) {
      spdlog::error("gallery query failed: {}", e.what());
      send_detail(res, 503, "Message store unavailable");
      return;
    }

    json out = json::array();
    for (const auto& r : rows) {
      out.push_back({
        {"id", r.id},
        {"message", r.text},
        {"submitted_at", r.submitted_at}
      });
    }
    res.status = 200;
    res.set_content(out.dump(), "application/json");
  });

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) res.set_content("not found", "text/plain");
  });
}

bool run_http_server(SubmissionService& submissions,
                     MessageStore& store,
                     const std::string& bindAddress,
                     int port) {
  httplib::Server svr;
  mount_guestbook_routes(svr, submissions, store);

  spdlog::info("HTTP server listening on http://{}:{}", bindAddress, port);
  if (!svr.listen(bindAddress, port)) {
    spdlog::error("Failed to bind port {}", port);
    return false;
  }
  return true;
}

} // namespace gb
