#include "DevicePrinter.hpp"
#include "PrinterError.hpp"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace gb {

void DevicePrinter::print(const std::string& cleanedText) {
  const std::string frame = codec_->encode(cleanedText);

  std::lock_guard<std::mutex> lk(mu_);
  const int fd = ::open(devicePath_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw PrinterError("cannot open " + devicePath_ + ": " + std::strerror(errno));
  }

  // A short write only happens on signals or a full device buffer; finish the
  // frame before releasing the lock.
  size_t off = 0;
  while (off < frame.size()) {
    const ssize_t n = ::write(fd, frame.data() + off, frame.size() - off);
    if (n < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      ::close(fd);
      throw PrinterError("write to " + devicePath_ + " failed: " + std::strerror(err));
    }
    off += static_cast<size_t>(n);
  }
  if (::close(fd) != 0) {
    throw PrinterError("close of " + devicePath_ + " failed: " + std::strerror(errno));
  }
}

} // namespace gb
