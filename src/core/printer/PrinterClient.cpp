#include "PrinterClient.hpp"
#include "PrinterError.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

using nlohmann::json;

namespace gb {

HttpPrinterClient::HttpPrinterClient(std::string url, std::chrono::seconds timeout)
  : timeout_(timeout) {
  // http://host[:port]/path ; the bridge is plain HTTP on loopback
  const std::string scheme = "http://";
  if (url.compare(0, scheme.size(), scheme) != 0) {
    throw std::invalid_argument("printer url must start with http://: " + url);
  }
  std::string rest = url.substr(scheme.size());
  const auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  path_ = slash == std::string::npos ? "/" : rest.substr(slash);

  if (const auto colon = authority.rfind(':'); colon != std::string::npos) {
    try {
      port_ = std::stoi(authority.substr(colon + 1));
    } catch (const std::exception&) {
      throw std::invalid_argument("bad port in printer url: " + url);
    }
    authority.resize(colon);
  }
  if (authority.empty()) throw std::invalid_argument("missing host in printer url: " + url);
  host_ = authority;
}

void HttpPrinterClient::print(const std::string& cleanedText) {
  httplib::Client cli(host_, port_);
  const auto secs = static_cast<time_t>(timeout_.count());
  cli.set_connection_timeout(secs, 0);
  cli.set_read_timeout(secs, 0);
  cli.set_write_timeout(secs, 0);

  const json body = {{"message", cleanedText}};
  auto res = cli.Post(path_, body.dump(), "application/json");
  if (!res) {
    throw PrinterError("printer bridge unreachable: " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    throw PrinterError("printer returned " + std::to_string(res->status) +
                       (res->body.empty() ? "" : ": " + res->body));
  }
}

} // namespace gb
