#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace hivereg {

struct StoredValue {
  uint32_t type = 0;
  std::vector<uint8_t> data;
};

// Persistent key/value tree in a single SQLite database. Key paths are full
// paths including the root name (e.g. HKEY_CURRENT_USER\Software\App) and are
// compared case-insensitively (ASCII only). Names may contain embedded NULs;
// they are significant in every comparison. Every method returns false on a database
// failure; LastError() describes the most recent failure on the calling thread.
class RegistryStore {
public:
  RegistryStore();
  ~RegistryStore();

  RegistryStore(const RegistryStore&) = delete;
  RegistryStore& operator=(const RegistryStore&) = delete;

  bool Open(const std::filesystem::path& dbPath);
  void Close();
  bool IsOpen() const { return db_ != nullptr; }

  // Creates keyPath and every missing ancestor. Existing keys keep their spelling.
  bool CreateKey(const std::wstring& keyPath);
  bool KeyExists(const std::wstring& keyPath, bool& exists);
  // Removes keyPath, its descendants and all of their values.
  bool DeleteKeyTree(const std::wstring& keyPath);

  // Also creates the key chain when it does not exist yet.
  bool PutValue(const std::wstring& keyPath, const std::wstring& valueName, uint32_t type, const void* data, uint32_t dataSize);
  bool DeleteValue(const std::wstring& keyPath, const std::wstring& valueName, bool& existed);
  // `out` is left empty when the value does not exist.
  bool GetValue(const std::wstring& keyPath, const std::wstring& valueName, std::optional<StoredValue>& out);

  struct ValueRow {
    std::wstring valueName;
    uint32_t type = 0;
    std::vector<uint8_t> data;
  };
  bool ListValues(const std::wstring& keyPath, std::vector<ValueRow>& out);
  bool ListImmediateSubKeys(const std::wstring& keyPath, std::vector<std::wstring>& out);

  std::string LastError() const;
  int LastErrorCode() const;

private:
  bool EnsureSchema();
  bool Exec(const char* sql);
  bool InsertKeyChain(const std::wstring& keyPath, int64_t now);

  sqlite3* db_ = nullptr;
  // Keeps multi-statement transactions from different threads apart.
  std::mutex mutex_;
};

}
