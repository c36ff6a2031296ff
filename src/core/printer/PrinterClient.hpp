#pragma once
#include <chrono>
#include <string>

namespace gb {

// Delivers cleaned text to the printer. Throws PrinterError on any failure.
class PrinterClient {
public:
  virtual ~PrinterClient() = default;
  virtual void print(const std::string& cleanedText) = 0;
};

// Talks to the local printer bridge: POST {"message": ...} as JSON, success
// only on HTTP 200. Transport errors and timeouts count as failures.
class HttpPrinterClient : public PrinterClient {
public:
  explicit HttpPrinterClient(std::string url,
                             std::chrono::seconds timeout = std::chrono::seconds(5));

  void print(const std::string& cleanedText) override;

  const std::string& host() const { return host_; }
  int port() const { return port_; }
  const std::string& path() const { return path_; }

private:
  std::string host_;
  int         port_ = 80;
  std::string path_;
  std::chrono::seconds timeout_;
};

} // namespace gb
