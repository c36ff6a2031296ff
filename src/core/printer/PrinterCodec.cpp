#include "PrinterCodec.hpp"

namespace gb {

std::string EscPosCodec::encode(std::string_view utf8Text) const {
  std::string frame;
  frame.reserve(sizeof(kInit) + utf8Text.size() + 1 + sizeof(kFeedAndCut));
  frame.append(kInit, sizeof(kInit));
  frame.append(utf8Text.data(), utf8Text.size());
  frame.push_back('\n');
  frame.append(kFeedAndCut, sizeof(kFeedAndCut));
  return frame;
}

} // namespace gb
