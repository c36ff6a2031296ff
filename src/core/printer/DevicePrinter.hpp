#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "PrinterClient.hpp"
#include "PrinterCodec.hpp"

namespace gb {

// Owns the printer device node (e.g. /dev/usb/lp0). One frame per print()
// call, written whole while holding the device lock so concurrent jobs never
// interleave on the paper.
class DevicePrinter : public PrinterClient {
public:
  DevicePrinter(std::string devicePath, std::unique_ptr<PrinterCodec> codec)
    : devicePath_(std::move(devicePath)), codec_(std::move(codec)) {}

  // Throws PrinterError if the device can't be opened or written.
  void print(const std::string& cleanedText) override;

  const std::string& devicePath() const { return devicePath_; }

private:
  std::string devicePath_;
  std::unique_ptr<PrinterCodec> codec_;
  std::mutex mu_;
};

} // namespace gb
