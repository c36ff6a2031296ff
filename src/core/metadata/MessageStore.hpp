#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct MessageRecord {
  int64_t     id = 0;
  std::string text;
  std::string submitted_at;     // ISO-8601 UTC
  std::string ip_hash;          // submitter fingerprint, never the raw address
  bool        gallery_approved = false;
  std::optional<std::string> commentary;
};

class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// SQLite-backed message table. One connection per instance; every write goes
// through mu_ so count-then-insert can't interleave within the process, and
// BEGIN IMMEDIATE covers other processes on the same file.
// All methods throw StoreError on SQLite failures.
class MessageStore {
public:
  explicit MessageStore(const std::string& dbPath);
  ~MessageStore();
  MessageStore(const MessageStore&) = delete;
  MessageStore& operator=(const MessageStore&) = delete;

  int64_t insert(const std::string& text,
                 const std::string& submitted_at,
                 const std::string& ip_hash);

  // Counts rows for the date prefix of submitted_at and inserts only if that
  // count is below dailyLimit, as a single transaction. Returns the new id, or
  // nullopt when the ceiling is already reached (nothing written).
  std::optional<int64_t> insertWithinDailyLimit(const std::string& text,
                                                const std::string& submitted_at,
                                                const std::string& ip_hash,
                                                int dailyLimit);

  // date is "YYYY-MM-DD"
  int64_t countOnDate(const std::string& date);
  int64_t countAll();

  std::vector<MessageRecord> listApproved();   // newest first
  std::vector<MessageRecord> listPending();    // oldest first

  std::optional<MessageRecord> findById(int64_t id);

  // One-shot transition: false if id is unknown or already approved.
  bool approve(int64_t id, const std::optional<std::string>& commentary);

private:
  int64_t countOnDateLocked(const std::string& date);
  int64_t insertLocked(const std::string& text,
                       const std::string& submitted_at,
                       const std::string& ip_hash);
  std::vector<MessageRecord> query(const char* sql);

  void* db_; // sqlite3*
  std::mutex mu_;
};
