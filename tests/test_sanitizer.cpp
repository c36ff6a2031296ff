#include <doctest/doctest.h>
#include "core/text/Sanitizer.hpp"

#include <string>
#include <vector>

using gb::sanitize;

TEST_CASE("sanitize strips ESC and BEL but keeps newlines") {
    CHECK(sanitize("Hello\x1bWorld\n\x07!") == "HelloWorld\n!");
}

TEST_CASE("sanitize drops every C0 control except newline, and DEL") {
    std::string in;
    for (int c = 0; c < 0x20; ++c) in.push_back(static_cast<char>(c));
    in.push_back('\x7f');
    in += "ok";
    CHECK(sanitize(in) == "\nok");
}

TEST_CASE("sanitize drops tab and carriage return") {
    CHECK(sanitize("a\tb\r\nc") == "ab\nc");
}

TEST_CASE("sanitize removes Unicode control/format/private-use/unassigned") {
    CHECK(sanitize("a\u200bb") == "ab");      // zero width space (Cf)
    CHECK(sanitize("a\u202eb") == "ab");      // right-to-left override (Cf)
    CHECK(sanitize("a\ufeffb") == "ab");      // BOM (Cf)
    CHECK(sanitize("a\u00adb") == "ab");      // soft hyphen (Cf)
    CHECK(sanitize("a\u0085b") == "ab");      // NEL (Cc)
    CHECK(sanitize("a\ue000b") == "ab");      // private use (Co)
    CHECK(sanitize("a\u0378b") == "ab");      // unassigned (Cn)
}

TEST_CASE("sanitize keeps printable text from any script verbatim") {
    const std::string s = "héllo 世界 \U0001F600  café שלום";
    CHECK(sanitize(s) == s);
}

TEST_CASE("sanitize drops ill-formed UTF-8 bytes") {
    CHECK(sanitize("a\xff" "b") == "ab");
    CHECK(sanitize("\xc3") == "");
}

TEST_CASE("sanitize preserves relative order of what it keeps") {
    CHECK(sanitize("\x1b" "1\x1d" "2\n3\u200b4") == "12\n34");
}

TEST_CASE("sanitize is idempotent") {
    const std::vector<std::string> samples = {
        "", "plain", "Hello\x1bWorld\n\x07!", "\x1b\x1d\x7f", "a\u202eb\ue000c",
        "line1\nline2\r\n", "\U0001F600\u200d\U0001F600", "x\xff\xfe" "y"
    };
    for (const auto& s : samples) {
        const std::string once = sanitize(s);
        CHECK(sanitize(once) == once);
    }
}

TEST_CASE("control-only input sanitizes to empty") {
    CHECK(sanitize("\x1b\x40\x1d\x56").size() == 2); // '@' and 'V' survive
    CHECK(sanitize("\x1b\x1d\x07\x7f").empty());
}

TEST_CASE("trimWhitespace removes Unicode whitespace at both ends only") {
    CHECK(gb::trimWhitespace("  hi  ") == "hi");
    CHECK(gb::trimWhitespace("\u3000 hi there\n\n") == "hi there");
    CHECK(gb::trimWhitespace("a\n b") == "a\n b");
    CHECK(gb::trimWhitespace(" \n\t ").empty());
    CHECK(gb::trimWhitespace("").empty());
}

TEST_CASE("codePointCount counts code points, not bytes") {
    CHECK(gb::codePointCount("") == 0);
    CHECK(gb::codePointCount("abc") == 3);
    CHECK(gb::codePointCount("héllo") == 5);
    CHECK(gb::codePointCount("\U0001F600") == 1);
}
