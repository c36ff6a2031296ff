#pragma once
#include <string>
#include <string_view>

namespace gb {

// Turns cleaned text into the exact byte frame a printer model expects.
class PrinterCodec {
public:
  virtual ~PrinterCodec() = default;
  virtual std::string encode(std::string_view utf8Text) const = 0;
};

// ESC/POS frame for the Rongta RP326:
//   ESC @  |  UTF-8 text  |  LF  |  ESC d 5 (feed 5 lines)  GS V 0 (full cut)
class EscPosCodec : public PrinterCodec {
public:
  static constexpr char kInit[]       = {'\x1B', '\x40'};
  static constexpr char kFeedAndCut[] = {'\x1B', '\x64', '\x05', '\x1D', '\x56', '\x00'};

  std::string encode(std::string_view utf8Text) const override;
};

} // namespace gb
