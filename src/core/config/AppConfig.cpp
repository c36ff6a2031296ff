#include "AppConfig.hpp"

#include <cstdlib>
#include <stdexcept>

namespace gb {

std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

int get_env_int_or(const char* key, int defval) {
  const std::string raw = get_env_or(key, "");
  if (raw.empty()) return defval;
  try {
    size_t used = 0;
    const int v = std::stoi(raw, &used);
    if (used != raw.size() || v <= 0) return defval;
    return v;
  } catch (const std::exception&) {
    return defval;
  }
}

AppConfig loadConfigFromEnv() {
  AppConfig c;
  c.dbPath        = get_env_or("GB_DB_PATH", c.dbPath);
  c.bindAddress   = get_env_or("GB_BIND", c.bindAddress);
  c.port          = get_env_int_or("GB_PORT", c.port);

  c.dailyLimit    = get_env_int_or("GB_DAILY_LIMIT", get_env_int_or("DAILY_LIMIT", c.dailyLimit));
  c.maxLength     = get_env_int_or("GB_MAX_LENGTH", c.maxLength);
  c.rateLimit     = get_env_int_or("GB_RATE_LIMIT", c.rateLimit);
  c.rateWindowSec = get_env_int_or("GB_RATE_WINDOW_SECONDS", c.rateWindowSec);

  c.printerUrl        = get_env_or("GB_PRINTER_URL", c.printerUrl);
  c.printerTimeoutSec = get_env_int_or("GB_PRINTER_TIMEOUT_SECONDS", c.printerTimeoutSec);
  c.printerDevice     = get_env_or("GB_PRINTER_DEVICE", c.printerDevice);
  c.bridgePort        = get_env_int_or("GB_BRIDGE_PORT", c.bridgePort);

  c.logLevel      = get_env_or("GB_LOG_LEVEL", c.logLevel);
  return c;
}

} // namespace gb
