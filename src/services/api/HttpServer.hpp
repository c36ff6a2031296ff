#pragma once
#include <string>

#include "services/submission/SubmissionService.hpp"

class MessageStore;

namespace httplib { class Server; }

namespace gb {
  // HTTP status for each submission outcome.
  int http_status_for(SubmissionOutcome o);

  // POST /submit, GET /gallery, GET /health.
  void mount_guestbook_routes(httplib::Server& svr,
                              SubmissionService& submissions,
                              MessageStore& store);

  // Start a blocking HTTP server. Returns false if the port can't be bound.
  bool run_http_server(SubmissionService& submissions,
                       MessageStore& store,
                       const std::string& bindAddress,
                       int port);
}
