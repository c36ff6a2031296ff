#include <doctest/doctest.h>
#include "services/submission/SubmissionService.hpp"
#include "core/metadata/MessageStore.hpp"
#include "core/quota/RateLimiter.hpp"
#include "core/util/Fingerprint.hpp"
#include "TestSupport.hpp"

#include <sqlite3.h>

#include <atomic>
#include <chrono>
#include <thread>

using namespace gb;
using std::chrono::minutes;

namespace {

struct Harness {
    explicit Harness(const std::string& name, int dailyLimit = 30, int maxLength = 10000)
      : path(gbtest::fresh_db(name)),
        store(path),
        service(store, limiter, printer, SubmissionLimits{dailyLimit, maxLength}) {}

    SubmissionResult submit(const std::string& text, const std::string& addr = "203.0.113.7") {
        return service.submit(text, addr, gbtest::noon_ish());
    }

    std::string path;
    MessageStore store;
    gbtest::AllowAll limiter;
    gbtest::FakePrinter printer;
    SubmissionService service;
};

} // namespace

TEST_CASE("ceiling of one: first accepted, second hits the daily limit") {
    Harness h("sub-ceiling-one", 1);
    const auto first = h.submit("hi");
    CHECK(first.outcome == SubmissionOutcome::Accepted);
    CHECK(first.id.has_value());

    const auto second = h.submit("there");
    CHECK(second.outcome == SubmissionOutcome::DailyLimitReached);
    CHECK_FALSE(second.id.has_value());

    CHECK(h.store.countAll() == 1);
    REQUIRE(h.printer.printed.size() == 1);
    CHECK(h.printer.printed[0] == "hi");
}

TEST_CASE("text is sanitized and trimmed before it is stored and printed") {
    Harness h("sub-clean");
    const auto r = h.submit("  Hello\x1bWorld\n\x07!  \n");
    REQUIRE(r.outcome == SubmissionOutcome::Accepted);

    const auto rec = h.store.findById(*r.id);
    REQUIRE(rec.has_value());
    CHECK(rec->text == "HelloWorld\n!");
    CHECK(h.printer.printed.at(0) == "HelloWorld\n!");
}

TEST_CASE("input that sanitizes to nothing is EmptyContent and stores nothing") {
    Harness h("sub-empty");
    CHECK(h.submit("").outcome == SubmissionOutcome::EmptyContent);
    CHECK(h.submit("   \n  ").outcome == SubmissionOutcome::EmptyContent);
    CHECK(h.submit("\x1b\x1d\x07 \u200b\n").outcome == SubmissionOutcome::EmptyContent);
    CHECK(h.store.countAll() == 0);
    CHECK(h.printer.printed.empty());
}

TEST_CASE("oversized payloads are rejected before sanitizing") {
    Harness h("sub-too-large", 30, 10);
    CHECK(h.submit(std::string(11, 'a')).outcome == SubmissionOutcome::PayloadTooLarge);
    // control characters count toward the raw length
    CHECK(h.submit("\x1b\x1b\x1b\x1b\x1b\x1b" "abcde").outcome == SubmissionOutcome::PayloadTooLarge);
    CHECK(h.store.countAll() == 0);

    // the limit is in code points, not bytes
    std::string accents;
    for (int i = 0; i < 10; ++i) accents += "é";
    CHECK(h.submit(accents).outcome == SubmissionOutcome::Accepted);
    CHECK(h.submit(std::string(10, 'b')).outcome == SubmissionOutcome::Accepted);
}

TEST_CASE("default limits accept exactly 10,000 code points") {
    Harness h("sub-max");
    CHECK(h.submit(std::string(10000, 'x')).outcome == SubmissionOutcome::Accepted);
    CHECK(h.submit(std::string(10001, 'x')).outcome == SubmissionOutcome::PayloadTooLarge);
}

TEST_CASE("a full day rejects new submissions and leaves the row count alone") {
    Harness h("sub-full-day", 5);
    for (int i = 0; i < 5; ++i) h.store.insert("old", "2026-10-19T01:00:00.000000+00:00", "h");
    h.store.insert("yesterday", "2026-10-18T12:00:00.000000+00:00", "h");

    const auto r = h.submit("one more");
    CHECK(r.outcome == SubmissionOutcome::DailyLimitReached);
    CHECK(h.store.countAll() == 6);
    CHECK(h.printer.printed.empty());
}

TEST_CASE("yesterday's messages do not use today's budget") {
    Harness h("sub-yesterday", 2);
    for (int i = 0; i < 5; ++i) h.store.insert("old", "2026-10-18T23:59:59.999999+00:00", "h");
    CHECK(h.submit("a").outcome == SubmissionOutcome::Accepted);
    CHECK(h.submit("b").outcome == SubmissionOutcome::Accepted);
    CHECK(h.submit("c").outcome == SubmissionOutcome::DailyLimitReached);
}

TEST_CASE("printer failure after persist keeps the message") {
    Harness h("sub-printer-down");
    h.printer.fail = true;

    const auto r = h.submit("keep me");
    CHECK(r.outcome == SubmissionOutcome::PrinterUnavailable);
    REQUIRE(r.id.has_value());
    CHECK(r.detail.find("device offline") != std::string::npos);

    const auto rec = h.store.findById(*r.id);
    REQUIRE(rec.has_value());
    CHECK(rec->text == "keep me");
    CHECK(h.store.countAll() == 1);
}

TEST_CASE("store failure aborts the submission before anything is printed") {
    Harness h("sub-store-down");
    sqlite3* raw = nullptr;
    REQUIRE(sqlite3_open(h.path.c_str(), &raw) == SQLITE_OK);
    REQUIRE(sqlite3_exec(raw, "DROP TABLE messages;", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(raw);

    const auto r = h.submit("hello");
    CHECK(r.outcome == SubmissionOutcome::StoreUnavailable);
    CHECK_FALSE(r.id.has_value());
    CHECK(h.printer.printed.empty());
}

TEST_CASE("stored fingerprint is the hashed address, never the address") {
    Harness h("sub-fingerprint");
    const auto r = h.submit("hi", "198.51.100.23");
    REQUIRE(r.accepted());
    const auto rec = h.store.findById(*r.id);
    REQUIRE(rec.has_value());
    CHECK(rec->ip_hash == fingerprint("198.51.100.23"));
    CHECK(rec->ip_hash.find("198.51") == std::string::npos);
    CHECK(rec->submitted_at == "2026-10-19T08:15:02.000000+00:00");
}

TEST_CASE("per-address rate limit is separate from the daily ceiling") {
    const std::string path = gbtest::fresh_db("sub-rate");
    MessageStore store(path);
    SlidingWindowRateLimiter limiter(3, std::chrono::hours(1));
    gbtest::FakePrinter printer;
    SubmissionService service(store, limiter, printer, SubmissionLimits{30, 10000});
    const auto t0 = gbtest::noon_ish();

    for (int i = 0; i < 3; ++i) {
        CHECK(service.submit("msg", "10.1.1.1", t0 + minutes(i)).accepted());
    }
    const auto limited = service.submit("msg", "10.1.1.1", t0 + minutes(5));
    CHECK(limited.outcome == SubmissionOutcome::RateLimited);
    CHECK_FALSE(limited.id.has_value());

    CHECK(service.submit("msg", "10.1.1.2", t0 + minutes(5)).accepted());
    CHECK(service.submit("msg", "10.1.1.1", t0 + minutes(61)).accepted());
    CHECK(store.countAll() == 5);
}

TEST_CASE("empty submissions do not spend a rate-limit slot") {
    const std::string path = gbtest::fresh_db("sub-rate-empty");
    MessageStore store(path);
    SlidingWindowRateLimiter limiter(1, std::chrono::hours(1));
    gbtest::FakePrinter printer;
    SubmissionService service(store, limiter, printer, SubmissionLimits{30, 10000});
    const auto t0 = gbtest::noon_ish();

    CHECK(service.submit("\x07", "10.9.9.9", t0).outcome == SubmissionOutcome::EmptyContent);
    CHECK(service.submit("real", "10.9.9.9", t0).accepted());
}

TEST_CASE("two concurrent submissions for the last slot: one accepted, one rejected") {
    for (int round = 0; round < 10; ++round) {
        Harness h("sub-last-slot", 3);
        h.store.insert("a", "2026-10-19T01:00:00.000000+00:00", "h");
        h.store.insert("b", "2026-10-19T02:00:00.000000+00:00", "h");

        std::atomic<int> accepted{0};
        std::atomic<int> limited{0};
        auto racer = [&](const char* text) {
            const auto r = h.submit(text);
            if (r.outcome == SubmissionOutcome::Accepted) ++accepted;
            else if (r.outcome == SubmissionOutcome::DailyLimitReached) ++limited;
        };
        std::thread x(racer, "x");
        std::thread y(racer, "y");
        x.join();
        y.join();

        CHECK(accepted.load() == 1);
        CHECK(limited.load() == 1);
        CHECK(h.store.countAll() == 3);
    }
}

TEST_CASE("outcome names") {
    CHECK(std::string(to_string(SubmissionOutcome::Accepted)) == "Accepted");
    CHECK(std::string(to_string(SubmissionOutcome::DailyLimitReached)) == "DailyLimitReached");
    CHECK(std::string(to_string(SubmissionOutcome::PrinterUnavailable)) == "PrinterUnavailable");
}
