#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "core/metadata/MessageStore.hpp"

namespace gb {

// First line of a message, cut to `width` code points with "..." appended
// when longer.
std::string first_line(std::string_view text, std::size_t width = 60);

// Operator loop: list pending messages, pick one by id, add optional
// commentary, confirm, approve. Reads answers from `in`, writes to `out`.
class ModerationTool {
public:
  ModerationTool(MessageStore& store, std::istream& in, std::ostream& out)
    : store_(store), in_(in), out_(out) {}

  // Returns when the operator quits or input ends.
  void run();

  std::vector<MessageRecord> listPending();
  void approveInteractive(int64_t id);

private:
  bool prompt(const std::string& question, std::string& answer);

  MessageStore& store_;
  std::istream& in_;
  std::ostream& out_;
};

} // namespace gb
