#include "MessageStore.hpp"
#include <sqlite3.h>

#include "core/quota/QuotaGuard.hpp"

namespace {

// Finalizes on scope exit.
struct Stmt {
  sqlite3_stmt* st = nullptr;
  ~Stmt() { sqlite3_finalize(st); }
};

void prepare(sqlite3* db, const char* sql, Stmt& s, const char* what) {
  if (sqlite3_prepare_v2(db, sql, -1, &s.st, nullptr) != SQLITE_OK) {
    throw StoreError(std::string(what) + " prepare failed: " + sqlite3_errmsg(db));
  }
}

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw StoreError(std::string(sql) + " failed: " + msg);
  }
}

// Rolls back unless committed.
class ImmediateTx {
public:
  explicit ImmediateTx(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE;"); }
  ~ImmediateTx() {
    if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  void commit() { exec(db_, "COMMIT;"); done_ = true; }
private:
  sqlite3* db_;
  bool done_ = false;
};

std::string column_text(sqlite3_stmt* st, int col) {
  const auto* p = sqlite3_column_text(st, col);
  if (!p) return {};
  return std::string(reinterpret_cast<const char*>(p), static_cast<size_t>(sqlite3_column_bytes(st, col)));
}

MessageRecord read_row(sqlite3_stmt* st) {
  MessageRecord r;
  r.id               = sqlite3_column_int64(st, 0);
  r.text             = column_text(st, 1);
  r.submitted_at     = column_text(st, 2);
  r.ip_hash          = column_text(st, 3);
  r.gallery_approved = sqlite3_column_int(st, 4) != 0;
  if (sqlite3_column_type(st, 5) != SQLITE_NULL) r.commentary = column_text(st, 5);
  return r;
}

constexpr const char* kColumns =
  "id, message, submitted_at, ip_hash, gallery_approved, commentary";

} // namespace

MessageStore::MessageStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr)!=SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StoreError("failed to open db " + dbPath + ": " + msg);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

MessageStore::~MessageStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

int64_t MessageStore::insert(const std::string& text,
                             const std::string& submitted_at,
                             const std::string& ip_hash) {
  std::lock_guard<std::mutex> lk(mu_);
  return insertLocked(text, submitted_at, ip_hash);
}

std::optional<int64_t> MessageStore::insertWithinDailyLimit(const std::string& text,
                                                            const std::string& submitted_at,
                                                            const std::string& ip_hash,
                                                            int dailyLimit) {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lk(mu_);
  ImmediateTx tx(db);
  const int64_t today = countOnDateLocked(submitted_at.substr(0, 10));
  if (gb::checkQuota(today, dailyLimit) == gb::QuotaDecision::DailyLimitReached) {
    return std::nullopt; // tx rolls back
  }
  const int64_t id = insertLocked(text, submitted_at, ip_hash);
  tx.commit();
  return id;
}

int64_t MessageStore::countOnDate(const std::string& date) {
  std::lock_guard<std::mutex> lk(mu_);
  return countOnDateLocked(date);
}

int64_t MessageStore::countAll() {
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lk(mu_);
  Stmt s;
  prepare(db, "SELECT COUNT(*) FROM messages", s, "countAll");
  if (sqlite3_step(s.st) != SQLITE_ROW) {
    throw StoreError(std::string("countAll failed: ") + sqlite3_errmsg(db));
  }
  return sqlite3_column_int64(s.st, 0);
}

std::vector<MessageRecord> MessageStore::listApproved() {
  static const std::string sql = std::string("SELECT ") + kColumns +
    " FROM messages WHERE gallery_approved = 1 ORDER BY submitted_at DESC, id DESC";
  std::lock_guard<std::mutex> lk(mu_);
  return query(sql.c_str());
}

std::vector<MessageRecord> MessageStore::listPending() {
  static const std::string sql = std::string("SELECT ") + kColumns +
    " FROM messages WHERE gallery_approved = 0 ORDER BY submitted_at ASC, id ASC";
  std::lock_guard<std::mutex> lk(mu_);
  return query(sql.c_str());
}

std::optional<MessageRecord> MessageStore::findById(int64_t id) {
  static const std::string sql = std::string("SELECT ") + kColumns +
    " FROM messages WHERE id = ?";
  auto* db = static_cast<sqlite3*>(db_);
  std::lock_guard<std::mutex> lk(mu_);
  Stmt s;
  prepare(db, sql.c_str(), s, "findById");
  sqlite3_bind_int64(s.st, 1, id);
  const int rc = sqlite3_step(s.st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw StoreError(std::string("findById failed: ") + sqlite3_errmsg(db));
  return read_row(s.st);
}

bool MessageStore::approve(int64_t id, const std::optional<std::string>& commentary) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    UPDATE messages SET gallery_approved = 1, commentary = ?
    WHERE id = ? AND gallery_approved = 0
  )SQL";
  std::lock_guard<std::mutex> lk(mu_);
  Stmt s;
  prepare(db, sql, s, "approve");
  if (commentary) sqlite3_bind_text(s.st, 1, commentary->c_str(), -1, SQLITE_TRANSIENT);
  else sqlite3_bind_null(s.st, 1);
  sqlite3_bind_int64(s.st, 2, id);
  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw StoreError(std::string("approve failed: ") + sqlite3_errmsg(db));
  }
  return sqlite3_changes(db) == 1;
}

int64_t MessageStore::countOnDateLocked(const std::string& date) {
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db, "SELECT COUNT(*) FROM messages WHERE substr(submitted_at, 1, 10) = ?", s, "countOnDate");
  sqlite3_bind_text(s.st, 1, date.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(s.st) != SQLITE_ROW) {
    throw StoreError(std::string("countOnDate failed: ") + sqlite3_errmsg(db));
  }
  return sqlite3_column_int64(s.st, 0);
}

int64_t MessageStore::insertLocked(const std::string& text,
                                   const std::string& submitted_at,
                                   const std::string& ip_hash) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO messages (message, submitted_at, ip_hash)
    VALUES (?,?,?)
  )SQL";
  Stmt s;
  prepare(db, sql, s, "insert");
  int i=1;
  sqlite3_bind_text(s.st, i++, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, submitted_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, ip_hash.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw StoreError(std::string("insert failed: ") + sqlite3_errmsg(db));
  }
  return sqlite3_last_insert_rowid(db);
}

std::vector<MessageRecord> MessageStore::query(const char* sql) {
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db, sql, s, "query");
  std::vector<MessageRecord> out;
  int rc;
  while ((rc = sqlite3_step(s.st)) == SQLITE_ROW) out.push_back(read_row(s.st));
  if (rc != SQLITE_DONE) throw StoreError(std::string("query failed: ") + sqlite3_errmsg(db));
  return out;
}
