#pragma once

namespace httplib { class Server; }

namespace gb {
  class PrinterClient;

  // POST /print {"message": "..."} -> device.
  // 200 "OK" | 400 "Missing message" | 500 <error> | 404 on other paths.
  void mount_printer_bridge_routes(httplib::Server& svr, PrinterClient& device);

  // Blocking; binds loopback only. Returns false if the port can't be bound.
  bool run_printer_bridge(PrinterClient& device, int port);
}
