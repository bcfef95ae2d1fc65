#include "common/registry_store.h"

#include "common/key_path.h"
#include "common/text_encoding.h"
#include "config/hivereg_config.h"

#include <sqlite3.h>

#include <ctime>
#include <cstring>
#include <map>
#include <mutex>

namespace hivereg {
namespace {

int64_t NowUnixSeconds() {
  // Only used for ordering/debugging; doesn't need to be monotonic.
  return (int64_t)time(nullptr);
}

// e.g. HKEY_CURRENT_USER\A\B -> [HKEY_CURRENT_USER, HKEY_CURRENT_USER\A, HKEY_CURRENT_USER\A\B]
std::vector<std::wstring> KeyChain(const std::wstring& keyPath) {
  std::vector<std::wstring> out;
  std::wstring path;
  for (const auto& segment : SplitKeyPath(keyPath)) {
    path = JoinKeyPath(path, segment);
    out.push_back(path);
  }
  return out;
}

// Lookup form of a key path or value name: ASCII upper-cased UTF-8, compared
// as a BLOB so that embedded NULs take part in equality and ordering.
// SQLite's NOCASE and LIKE both stop at the first NUL.
std::string FoldName(const std::wstring& name) {
  return WideToUtf8(CaseFoldAscii(name));
}

// Every descendant of a key has a folded path in [fold + '\', fold + ']').
constexpr char kFoldedSeparator = '\\';
constexpr char kFoldedSeparatorNext = kFoldedSeparator + 1;

class Statement {
public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) {
      sqlite3_finalize(st_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const { return st_ != nullptr; }
  sqlite3_stmt* get() const { return st_; }

  bool BindText(int index1, const std::wstring& text) {
    std::string utf8 = WideToUtf8(text);
    if (!text.empty() && utf8.empty()) {
      return false;
    }
    return sqlite3_bind_text(st_, index1, utf8.data(), (int)utf8.size(), SQLITE_TRANSIENT) == SQLITE_OK;
  }

  // Binds the folded lookup form of `text`; see FoldName().
  bool BindFolded(int index1, const std::wstring& text, const char* suffix = "") {
    std::string folded = FoldName(text);
    if (!text.empty() && folded.empty()) {
      return false;
    }
    folded += suffix;
    // data() is never null, so an empty name binds as a zero-length blob, not NULL.
    return sqlite3_bind_blob(st_, index1, folded.data(), (int)folded.size(), SQLITE_TRANSIENT) == SQLITE_OK;
  }

  bool BindInt64(int index1, int64_t v) { return sqlite3_bind_int64(st_, index1, v) == SQLITE_OK; }

  bool BindBlob(int index1, const void* data, uint32_t size) {
    if (!data || !size) {
      return sqlite3_bind_null(st_, index1) == SQLITE_OK;
    }
    return sqlite3_bind_blob(st_, index1, data, (int)size, SQLITE_TRANSIENT) == SQLITE_OK;
  }

  int Step() { return sqlite3_step(st_); }

  void Reset() {
    sqlite3_reset(st_);
    sqlite3_clear_bindings(st_);
  }

  std::wstring ColumnText(int col) const {
    const char* p = reinterpret_cast<const char*>(sqlite3_column_text(st_, col));
    int bytes = sqlite3_column_bytes(st_, col);
    if (!p || bytes <= 0) {
      return {};
    }
    return Utf8ToWide(std::string(p, p + bytes));
  }

  std::vector<uint8_t> ColumnBlob(int col) const {
    const void* blob = sqlite3_column_blob(st_, col);
    int size = sqlite3_column_bytes(st_, col);
    std::vector<uint8_t> out;
    if (blob && size > 0) {
      out.resize((size_t)size);
      std::memcpy(out.data(), blob, (size_t)size);
    }
    return out;
  }

private:
  sqlite3_stmt* st_ = nullptr;
};

// BEGIN IMMEDIATE on construction; rolls back unless Commit() succeeded.
class Transaction {
public:
  explicit Transaction(sqlite3* db) : db_(db) {
    active_ = sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK;
  }
  ~Transaction() {
    if (active_) {
      (void)sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
  }

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  bool active() const { return active_; }

  bool Commit() {
    if (!active_) {
      return false;
    }
    if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      return false;
    }
    active_ = false;
    return true;
  }

private:
  sqlite3* db_;
  bool active_ = false;
};

thread_local std::string t_lastError;
thread_local int t_lastErrorCode = SQLITE_OK;

bool RecordFailure(sqlite3* db) {
  if (db) {
    t_lastErrorCode = sqlite3_extended_errcode(db);
    t_lastError = sqlite3_errmsg(db);
  } else {
    t_lastErrorCode = SQLITE_MISUSE;
    t_lastError = "store is not open";
  }
  if (t_lastErrorCode == SQLITE_OK) {
    // e.g. a text conversion failure before SQLite was involved.
    t_lastErrorCode = SQLITE_MISMATCH;
    t_lastError = "key or value name is not valid text";
  }
  return false;
}

}  // namespace

RegistryStore::RegistryStore() = default;

RegistryStore::~RegistryStore() {
  Close();
}

bool RegistryStore::Open(const std::filesystem::path& dbPath) {
  Close();
  const std::string utf8 = dbPath.u8string();
  if (utf8.empty()) {
    t_lastErrorCode = SQLITE_CANTOPEN;
    t_lastError = "empty database path";
    return false;
  }

  int rc = sqlite3_open_v2(utf8.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    RecordFailure(db_);
    Close();
    return false;
  }

  // Several processes may share one store; wait on a locked database instead
  // of failing immediately with SQLITE_BUSY.
  (void)sqlite3_busy_timeout(db_, HIVEREG_STORE_BUSY_TIMEOUT_MS);
  (void)sqlite3_extended_result_codes(db_, 1);

  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  (void)sqlite3_wal_autocheckpoint(db_, 256);

  if (!EnsureSchema()) {
    RecordFailure(db_);
    Close();
    return false;
  }
  return true;
}

void RegistryStore::Close() {
  if (db_) {
    // Merge the WAL back into the main file on clean shutdown, without
    // stalling if another connection is busy.
    (void)sqlite3_busy_timeout(db_, 0);
    (void)sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool RegistryStore::Exec(const char* sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
  if (err) {
    sqlite3_free(err);
  }
  return rc == SQLITE_OK;
}

bool RegistryStore::EnsureSchema() {
  return Exec(
             "CREATE TABLE IF NOT EXISTS keys("
             "  key_fold BLOB NOT NULL PRIMARY KEY,"
             "  key_path TEXT NOT NULL,"
             "  updated_at INTEGER NOT NULL"
             ");") &&
         Exec(
             "CREATE TABLE IF NOT EXISTS values_tbl("
             "  key_fold BLOB NOT NULL,"
             "  name_fold BLOB NOT NULL,"
             "  value_name TEXT NOT NULL,"
             "  type INTEGER NOT NULL,"
             "  data BLOB,"
             "  updated_at INTEGER NOT NULL,"
             "  PRIMARY KEY(key_fold, name_fold)"
             ");");
}

bool RegistryStore::InsertKeyChain(const std::wstring& keyPath, int64_t now) {
  Statement st(db_, "INSERT OR IGNORE INTO keys(key_fold, key_path, updated_at) VALUES(?,?,?);");
  if (!st.ok()) {
    return false;
  }
  for (const auto& path : KeyChain(keyPath)) {
    st.Reset();
    if (!st.BindFolded(1, path) || !st.BindText(2, path) || !st.BindInt64(3, now)) {
      return false;
    }
    if (st.Step() != SQLITE_DONE) {
      return false;
    }
  }
  return true;
}

bool RegistryStore::CreateKey(const std::wstring& keyPath) {
  if (!db_) {
    return RecordFailure(db_);
  }
  std::lock_guard<std::mutex> lock(mutex_);

  Transaction tx(db_);
  if (!tx.active() || !InsertKeyChain(keyPath, NowUnixSeconds()) || !tx.Commit()) {
    return RecordFailure(db_);
  }
  return true;
}

bool RegistryStore::KeyExists(const std::wstring& keyPath, bool& exists) {
  exists = false;
  if (!db_) {
    return RecordFailure(db_);
  }
  std::lock_guard<std::mutex> lock(mutex_);

  Statement st(db_, "SELECT 1 FROM keys WHERE key_fold=? LIMIT 1;");
  if (!st.ok() || !st.BindFolded(1, keyPath)) {
    return RecordFailure(db_);
  }
  int rc = st.Step();
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return RecordFailure(db_);
  }
  exists = rc == SQLITE_ROW;
  return true;
}

bool RegistryStore::DeleteKeyTree(const std::wstring& keyPath) {
  if (!db_) {
    return RecordFailure(db_);
  }
  std::lock_guard<std::mutex> lock(mutex_);

  Transaction tx(db_);
  if (!tx.active()) {
    return RecordFailure(db_);
  }

  const char separator[] = {kFoldedSeparator, '\0'};
  const char separatorNext[] = {kFoldedSeparatorNext, '\0'};
  const char* sqls[] = {
      "DELETE FROM values_tbl WHERE key_fold=? OR (key_fold>=? AND key_fold<?);",
      "DELETE FROM keys WHERE key_fold=? OR (key_fold>=? AND key_fold<?);",
  };
  for (const char* sql : sqls) {
    Statement st(db_, sql);
    if (!st.ok() || !st.BindFolded(1, keyPath) || !st.BindFolded(2, keyPath, separator) ||
        !st.BindFolded(3, keyPath, separatorNext)) {
      return RecordFailure(db_);
    }
    if (st.Step() != SQLITE_DONE) {
      return RecordFailure(db_);
    }
  }

  if (!tx.Commit()) {
    return RecordFailure(db_);
  }
  return true;
}

bool RegistryStore::PutValue(const std::wstring& keyPath,
                             const std::wstring& valueName,
                             uint32_t type,
                             const void* data,
                             uint32_t dataSize) {
  if (!db_) {
    return RecordFailure(db_);
  }
  std::lock_guard<std::mutex> lock(mutex_);

  const auto now = NowUnixSeconds();
  Transaction tx(db_);
  if (!tx.active() || !InsertKeyChain(keyPath, now)) {
    return RecordFailure(db_);
  }

  // The primary key is the folded name, so a differently-cased name updates
  // the existing row and keeps its original spelling.
  Statement st(db_,
               "INSERT INTO values_tbl(key_fold, name_fold, value_name, type, data, updated_at) VALUES(?,?,?,?,?,?) "
               "ON CONFLICT(key_fold, name_fold) DO UPDATE SET type=excluded.type, data=excluded.data, "
               "updated_at=excluded.updated_at;");
  if (!st.ok() || !st.BindFolded(1, keyPath) || !st.BindFolded(2, valueName) || !st.BindText(3, valueName) ||
      !st.BindInt64(4, (int64_t)type) || !st.BindBlob(5, data, dataSize) || !st.BindInt64(6, now)) {
    return RecordFailure(db_);
  }
  if (st.Step() != SQLITE_DONE) {
    return RecordFailure(db_);
  }

  if (!tx.Commit()) {
    return RecordFailure(db_);
  }
  return true;
}

bool RegistryStore::DeleteValue(const std::wstring& keyPath, const std::wstring& valueName, bool& existed) {
  existed = false;
  if (!db_) {
    return RecordFailure(db_);
  }
  std::lock_guard<std::mutex> lock(mutex_);

  Statement st(db_, "DELETE FROM values_tbl WHERE key_fold=? AND name_fold=?;");
  if (!st.ok() || !st.BindFolded(1, keyPath) || !st.BindFolded(2, valueName)) {
    return RecordFailure(db_);
  }
  if (st.Step() != SQLITE_DONE) {
    return RecordFailure(db_);
  }
  existed = sqlite3_changes(db_) != 0;
  return true;
}

bool RegistryStore::GetValue(const std::wstring& keyPath, const std::wstring& valueName, std::optional<StoredValue>& out) {
  out.reset();
  if (!db_) {
    return RecordFailure(db_);
  }
  std::lock_guard<std::mutex> lock(mutex_);

  Statement st(db_, "SELECT type, data FROM values_tbl WHERE key_fold=? AND name_fold=? LIMIT 1;");
  if (!st.ok() || !st.BindFolded(1, keyPath) || !st.BindFolded(2, valueName)) {
    return RecordFailure(db_);
  }
  int rc = st.Step();
  if (rc == SQLITE_DONE) {
    return true;
  }
  if (rc != SQLITE_ROW) {
    return RecordFailure(db_);
  }
  StoredValue v;
  v.type = (uint32_t)sqlite3_column_int64(st.get(), 0);
  v.data = st.ColumnBlob(1);
  out = std::move(v);
  return true;
}

bool RegistryStore::ListValues(const std::wstring& keyPath, std::vector<ValueRow>& out) {
  out.clear();
  if (!db_) {
    return RecordFailure(db_);
  }
  std::lock_guard<std::mutex> lock(mutex_);

  Statement st(db_,
               "SELECT value_name, type, data FROM values_tbl WHERE key_fold=? "
               "ORDER BY name_fold ASC;");
  if (!st.ok() || !st.BindFolded(1, keyPath)) {
    return RecordFailure(db_);
  }
  int rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    ValueRow r;
    r.valueName = st.ColumnText(0);
    r.type = (uint32_t)sqlite3_column_int64(st.get(), 1);
    r.data = st.ColumnBlob(2);
    out.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE) {
    out.clear();
    return RecordFailure(db_);
  }
  return true;
}

bool RegistryStore::ListImmediateSubKeys(const std::wstring& keyPath, std::vector<std::wstring>& out) {
  out.clear();
  if (!db_) {
    return RecordFailure(db_);
  }
  std::lock_guard<std::mutex> lock(mutex_);

  const char separator[] = {kFoldedSeparator, '\0'};
  const char separatorNext[] = {kFoldedSeparatorNext, '\0'};
  Statement st(db_, "SELECT key_path FROM keys WHERE key_fold>=? AND key_fold<?;");
  if (!st.ok() || !st.BindFolded(1, keyPath, separator) || !st.BindFolded(2, keyPath, separatorNext)) {
    return RecordFailure(db_);
  }

  std::map<std::wstring, std::wstring> foldedToDisplay;
  const size_t prefixLen = keyPath.size() + 1;
  int rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    std::wstring full = st.ColumnText(0);
    if (full.size() <= prefixLen) {
      continue;
    }
    std::wstring rem = full.substr(prefixLen);
    auto pos = rem.find(kKeySeparator);
    std::wstring child = (pos == std::wstring::npos) ? rem : rem.substr(0, pos);
    if (!child.empty()) {
      foldedToDisplay.emplace(CaseFoldAscii(child), std::move(child));
    }
  }
  if (rc != SQLITE_DONE) {
    return RecordFailure(db_);
  }

  out.reserve(foldedToDisplay.size());
  for (auto& kv : foldedToDisplay) {
    out.push_back(std::move(kv.second));
  }
  return true;
}

std::string RegistryStore::LastError() const {
  return t_lastError;
}

int RegistryStore::LastErrorCode() const {
  return t_lastErrorCode;
}

}
