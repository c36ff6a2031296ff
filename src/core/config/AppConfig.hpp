#pragma once
#include <string>

namespace gb {

struct AppConfig {
  std::string dbPath          = "data/guestbook.db";
  std::string bindAddress     = "0.0.0.0";
  int         port            = 8080;

  int         dailyLimit      = 30;
  int         maxLength       = 10000;
  int         rateLimit       = 3;
  int         rateWindowSec   = 3600;

  std::string printerUrl      = "http://127.0.0.1:8765/print";
  int         printerTimeoutSec = 5;
  std::string printerDevice   = "/dev/usb/lp0";
  int         bridgePort      = 8765;

  std::string logLevel        = "info";
};

// Reads GB_* variables (DAILY_LIMIT is honoured when GB_DAILY_LIMIT is unset).
AppConfig loadConfigFromEnv();

std::string get_env_or(const char* key, const std::string& defval);

// Positive integer from the environment, or defval if unset / unparseable.
int get_env_int_or(const char* key, int defval);

} // namespace gb
