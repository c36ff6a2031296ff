#include "ModerationTool.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <unicode/utf8.h>

#include "core/text/Sanitizer.hpp"

namespace gb {

std::string first_line(std::string_view text, std::size_t width) {
  const std::string_view line = text.substr(0, text.find('\n'));
  const auto* s = reinterpret_cast<const uint8_t*>(line.data());
  const int64_t length = static_cast<int64_t>(line.size());
  int64_t cut = 0;
  U8_FWD_N(s, cut, length, static_cast<int32_t>(width));
  if (cut >= length) return std::string(line);
  return std::string(line.substr(0, static_cast<size_t>(cut))) + "...";
}

static std::string indent(const std::string& text, const std::string& prefix) {
  std::istringstream is(text);
  std::ostringstream os;
  std::string line;
  while (std::getline(is, line)) {
    if (!line.empty()) os << prefix;
    os << line << "\n";
  }
  return os.str();
}

static bool all_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(),
                                   [](unsigned char c) { return std::isdigit(c) != 0; });
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool ModerationTool::prompt(const std::string& question, std::string& answer) {
  out_ << question << std::flush;
  if (!std::getline(in_, answer)) return false;
  answer = trimWhitespace(answer);
  return true;
}

std::vector<MessageRecord> ModerationTool::listPending() {
  auto rows = store_.listPending();
  if (rows.empty()) {
    out_ << "No pending messages.\n";
    return rows;
  }
  out_ << "\n" << std::setw(4) << "ID" << "  " << std::setw(10) << "Date" << "  First line\n";
  out_ << std::string(72, '-') << "\n";
  for (const auto& r : rows) {
    out_ << std::setw(4) << r.id << "  " << r.submitted_at.substr(0, 10)
         << "  " << first_line(r.text) << "\n";
  }
  out_ << "\n";
  return rows;
}

void ModerationTool::approveInteractive(int64_t id) {
  const auto row = store_.findById(id);
  if (!row || row->gallery_approved) {
    out_ << "No pending message with ID " << id << ".\n";
    return;
  }

  out_ << "\n--- Message " << row->id << " ---\n";
  out_ << indent(row->text, "  ");
  out_ << "---\n";

  std::string commentary, confirm;
  if (!prompt("Commentary (leave blank for none): ", commentary)) return;
  if (!prompt("Approve message " + std::to_string(row->id) + "? [y/N] ", confirm)) return;
  if (lower(confirm) != "y") {
    out_ << "Cancelled.\n";
    return;
  }

  const std::optional<std::string> note =
    commentary.empty() ? std::nullopt : std::optional<std::string>(commentary);
  if (!store_.approve(row->id, note)) {
    // approved by someone else between the lookup and now
    out_ << "No pending message with ID " << row->id << ".\n";
    return;
  }
  spdlog::info("message {} approved for gallery", row->id);
  out_ << "Message " << row->id << " approved.\n";
}

void ModerationTool::run() {
  while (true) {
    listPending();
    std::string raw;
    if (!prompt("Enter ID to approve (or q to quit): ", raw)) {
      out_ << "\n";
      return;
    }
    const std::string cmd = lower(raw);
    if (cmd.empty() || cmd == "q" || cmd == "quit") return;
    if (!all_digits(raw)) {
      out_ << "Please enter a numeric ID.\n";
      continue;
    }
    int64_t id = 0;
    try {
      id = std::stoll(raw);
    } catch (const std::out_of_range&) {
      out_ << "No pending message with ID " << raw << ".\n";
      continue;
    }
    approveInteractive(id);
  }
}

} // namespace gb
