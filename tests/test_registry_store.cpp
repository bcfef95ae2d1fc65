#include "common/registry_store.h"
#include "test_tmp.h"

#include <catch2/catch.hpp>

#include <sqlite3.h>

#include <chrono>
#include <thread>
#include <vector>

using namespace hivereg;

namespace {

constexpr uint32_t kRegBinary = 3;

std::filesystem::path MakeStorePath() {
  auto path = testutil::MakeTempDbPath("store");
  REQUIRE_FALSE(path.empty());
  return path;
}

bool Exists(RegistryStore& store, const std::wstring& keyPath) {
  bool exists = false;
  REQUIRE(store.KeyExists(keyPath, exists));
  return exists;
}

}  // namespace

TEST_CASE("RegistryStore creates the whole key chain", "[store]") {
  RegistryStore store;
  REQUIRE(store.Open(MakeStorePath()));

  REQUIRE(store.CreateKey(L"HKEY_CURRENT_USER\\Software\\Vendor\\App"));
  CHECK(Exists(store, L"HKEY_CURRENT_USER\\Software"));
  CHECK(Exists(store, L"HKEY_CURRENT_USER\\Software\\Vendor"));
  CHECK(Exists(store, L"hkey_current_user\\SOFTWARE\\vendor\\APP"));
  CHECK_FALSE(Exists(store, L"HKEY_CURRENT_USER\\Software\\Other"));

  // Creating again is a no-op and keeps the original spelling.
  REQUIRE(store.CreateKey(L"HKEY_CURRENT_USER\\SOFTWARE\\VENDOR"));
  std::vector<std::wstring> subkeys;
  REQUIRE(store.ListImmediateSubKeys(L"HKEY_CURRENT_USER", subkeys));
  CHECK(subkeys == std::vector<std::wstring>{L"Software"});
}

TEST_CASE("RegistryStore preserves embedded NUL in key/value names", "[store]") {
  RegistryStore store;
  REQUIRE(store.Open(MakeStorePath()));

  std::wstring key = L"HKEY_LOCAL_MACHINE\\Soft";
  key.push_back(L'\0');
  key += L"Ware\\Case";

  std::wstring valueName = L"Na";
  valueName.push_back(L'\0');
  valueName += L"me";

  const std::vector<uint8_t> payload = {0x41, 0x00, 0x42, 0x00, 0x00};
  REQUIRE(store.PutValue(key, valueName, kRegBinary, payload.data(), static_cast<uint32_t>(payload.size())));

  std::optional<StoredValue> value;
  REQUIRE(store.GetValue(key, valueName, value));
  REQUIRE(value.has_value());
  CHECK(value->type == kRegBinary);
  CHECK(value->data == payload);

  std::vector<RegistryStore::ValueRow> rows;
  REQUIRE(store.ListValues(key, rows));
  REQUIRE(rows.size() == 1);
  CHECK(rows[0].valueName == valueName);
  CHECK(rows[0].data == payload);
}

TEST_CASE("RegistryStore keeps names that differ only after a NUL apart", "[store]") {
  RegistryStore store;
  REQUIRE(store.Open(MakeStorePath()));

  const std::wstring key = L"HKEY_CURRENT_USER\\Software\\Nul";
  const std::wstring one(L"v\0one", 5);
  const std::wstring two(L"v\0two", 5);
  const uint8_t byteOne = 1;
  const uint8_t byteTwo = 2;
  REQUIRE(store.PutValue(key, one, kRegBinary, &byteOne, 1));
  REQUIRE(store.PutValue(key, two, kRegBinary, &byteTwo, 1));

  std::optional<StoredValue> value;
  REQUIRE(store.GetValue(key, one, value));
  REQUIRE(value.has_value());
  CHECK(value->data == std::vector<uint8_t>{byteOne});
  REQUIRE(store.GetValue(key, two, value));
  REQUIRE(value.has_value());
  CHECK(value->data == std::vector<uint8_t>{byteTwo});
  REQUIRE(store.GetValue(key, L"v", value));
  CHECK_FALSE(value.has_value());

  std::vector<RegistryStore::ValueRow> rows;
  REQUIRE(store.ListValues(key, rows));
  REQUIRE(rows.size() == 2);
  CHECK(rows[0].valueName == one);
  CHECK(rows[1].valueName == two);

  // Case folding still applies before the NUL and after it.
  REQUIRE(store.GetValue(L"hkey_current_user\\SOFTWARE\\nul", std::wstring(L"V\0ONE", 5), value));
  REQUIRE(value.has_value());
  CHECK(value->data == std::vector<uint8_t>{byteOne});
}

TEST_CASE("RegistryStore tree delete of a NUL-bearing key spares its prefix sibling", "[store]") {
  RegistryStore store;
  REQUIRE(store.Open(MakeStorePath()));

  const std::wstring sibling = L"HKEY_CURRENT_USER\\Software\\A";
  const std::wstring nulKey = sibling + std::wstring(L"\0B", 2);
  const uint8_t byteA = 0xA0;
  REQUIRE(store.PutValue(sibling, L"Keep", kRegBinary, &byteA, 1));
  REQUIRE(store.CreateKey(sibling + L"\\Child"));
  REQUIRE(store.CreateKey(nulKey + L"\\Deep"));
  CHECK_FALSE(Exists(store, sibling + std::wstring(L"\0C", 2)));

  REQUIRE(store.DeleteKeyTree(nulKey));
  CHECK_FALSE(Exists(store, nulKey));
  CHECK_FALSE(Exists(store, nulKey + L"\\Deep"));
  CHECK(Exists(store, sibling));
  CHECK(Exists(store, sibling + L"\\Child"));

  std::optional<StoredValue> value;
  REQUIRE(store.GetValue(sibling, L"Keep", value));
  CHECK(value.has_value());

  std::vector<std::wstring> subkeys;
  REQUIRE(store.ListImmediateSubKeys(L"HKEY_CURRENT_USER\\Software", subkeys));
  CHECK(subkeys == std::vector<std::wstring>{L"A"});
}

TEST_CASE("RegistryStore key/value lookups are case-insensitive", "[store]") {
  RegistryStore store;
  REQUIRE(store.Open(MakeStorePath()));

  const std::wstring keyWritten = L"HKEY_LOCAL_MACHINE\\Software\\ExampleVendor\\ExampleApp";
  const std::vector<uint8_t> first = {0x10, 0x20, 0x30};
  const std::vector<uint8_t> second = {0x40};

  REQUIRE(store.PutValue(keyWritten, L"InstallDir", kRegBinary, first.data(), static_cast<uint32_t>(first.size())));

  const std::wstring keyQuery = L"hkey_local_machine\\SOFTWARE\\examplevendor\\EXAMPLEAPP";
  std::optional<StoredValue> value;
  REQUIRE(store.GetValue(keyQuery, L"installdir", value));
  REQUIRE(value.has_value());
  CHECK(value->data == first);

  // Overwriting with different casing updates the same row.
  REQUIRE(store.PutValue(keyQuery, L"INSTALLDIR", kRegBinary, second.data(), 1));
  std::vector<RegistryStore::ValueRow> rows;
  REQUIRE(store.ListValues(keyWritten, rows));
  REQUIRE(rows.size() == 1);
  CHECK(rows[0].valueName == L"InstallDir");
  CHECK(rows[0].data == second);
}

TEST_CASE("RegistryStore reports missing values without failing", "[store]") {
  RegistryStore store;
  REQUIRE(store.Open(MakeStorePath()));

  std::optional<StoredValue> value = StoredValue{};
  REQUIRE(store.GetValue(L"HKEY_USERS\\Nope", L"X", value));
  CHECK_FALSE(value.has_value());

  bool existed = true;
  REQUIRE(store.DeleteValue(L"HKEY_USERS\\Nope", L"X", existed));
  CHECK_FALSE(existed);
}

TEST_CASE("RegistryStore deletes values and key trees", "[store]") {
  RegistryStore store;
  REQUIRE(store.Open(MakeStorePath()));

  const uint8_t byteA = 0xAA;
  const uint8_t byteB = 0xBB;
  REQUIRE(store.PutValue(L"HKEY_CURRENT_USER\\Software\\One", L"X", kRegBinary, &byteA, 1));
  REQUIRE(store.PutValue(L"HKEY_CURRENT_USER\\Software\\One\\Deep", L"Y", kRegBinary, &byteB, 1));
  REQUIRE(store.PutValue(L"HKEY_CURRENT_USER\\Software_Two", L"X", kRegBinary, &byteB, 1));

  bool existed = false;
  REQUIRE(store.DeleteValue(L"HKEY_CURRENT_USER\\Software\\One", L"x", existed));
  CHECK(existed);

  REQUIRE(store.DeleteKeyTree(L"HKEY_CURRENT_USER\\SOFTWARE"));
  CHECK_FALSE(Exists(store, L"HKEY_CURRENT_USER\\Software"));
  CHECK_FALSE(Exists(store, L"HKEY_CURRENT_USER\\Software\\One\\Deep"));

  std::optional<StoredValue> value;
  REQUIRE(store.GetValue(L"HKEY_CURRENT_USER\\Software\\One\\Deep", L"Y", value));
  CHECK_FALSE(value.has_value());

  // A sibling sharing the name as a prefix is untouched; '_' is not a wildcard.
  CHECK(Exists(store, L"HKEY_CURRENT_USER\\Software_Two"));
  REQUIRE(store.GetValue(L"HKEY_CURRENT_USER\\Software_Two", L"X", value));
  CHECK(value.has_value());
}

TEST_CASE("RegistryStore lists immediate subkeys only", "[store]") {
  RegistryStore store;
  REQUIRE(store.Open(MakeStorePath()));

  REQUIRE(store.CreateKey(L"HKEY_CLASSES_ROOT\\.txt\\ShellNew"));
  REQUIRE(store.CreateKey(L"HKEY_CLASSES_ROOT\\.md"));
  REQUIRE(store.CreateKey(L"HKEY_CLASSES_ROOT\\txtfile\\shell\\open"));

  std::vector<std::wstring> subkeys;
  REQUIRE(store.ListImmediateSubKeys(L"HKEY_CLASSES_ROOT", subkeys));
  CHECK(subkeys == std::vector<std::wstring>{L".md", L".txt", L"txtfile"});

  REQUIRE(store.ListImmediateSubKeys(L"HKEY_CLASSES_ROOT\\txtfile", subkeys));
  CHECK(subkeys == std::vector<std::wstring>{L"shell"});

  REQUIRE(store.ListImmediateSubKeys(L"HKEY_CLASSES_ROOT\\.md", subkeys));
  CHECK(subkeys.empty());
}

TEST_CASE("RegistryStore operations fail cleanly when not open", "[store]") {
  RegistryStore store;
  CHECK_FALSE(store.IsOpen());
  CHECK_FALSE(store.CreateKey(L"HKEY_USERS\\X"));
  bool exists = true;
  CHECK_FALSE(store.KeyExists(L"HKEY_USERS\\X", exists));
  CHECK_FALSE(exists);
  CHECK_FALSE(store.LastError().empty());
}

TEST_CASE("RegistryStore WAL changes are visible across concurrent opens", "[store][wal]") {
  const auto dbPath = MakeStorePath();

  RegistryStore writer;
  REQUIRE(writer.Open(dbPath));

  const std::wstring key = L"HKEY_CURRENT_USER\\Software\\WalTest";
  const uint8_t byteA = 0x11;
  const uint8_t byteB = 0x22;
  REQUIRE(writer.PutValue(key, L"Value", kRegBinary, &byteA, 1));

  RegistryStore reader;
  REQUIRE(reader.Open(dbPath));
  std::optional<StoredValue> v;
  REQUIRE(reader.GetValue(key, L"Value", v));
  REQUIRE(v.has_value());
  CHECK(v->data == std::vector<uint8_t>{byteA});

  REQUIRE(writer.PutValue(key, L"Value", kRegBinary, &byteB, 1));
  REQUIRE(reader.GetValue(key, L"Value", v));
  REQUIRE(v.has_value());
  CHECK(v->data == std::vector<uint8_t>{byteB});
}

TEST_CASE("RegistryStore waits through writer contention (busy_timeout)", "[store][wal]") {
  const auto dbPath = MakeStorePath();
  RegistryStore writer;
  REQUIRE(writer.Open(dbPath));

  // Hold a write transaction open on a raw connection.
  sqlite3* lockDb = nullptr;
  REQUIRE(sqlite3_open_v2(dbPath.u8string().c_str(), &lockDb, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) ==
          SQLITE_OK);
  REQUIRE(sqlite3_exec(lockDb, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) == SQLITE_OK);

  const std::wstring key = L"HKEY_CURRENT_USER\\Software\\BusyTest";
  const uint8_t payload = 0x7F;

  bool putOk = false;
  auto start = std::chrono::steady_clock::now();
  std::thread t([&] { putOk = writer.PutValue(key, L"X", kRegBinary, &payload, 1); });

  std::this_thread::sleep_for(std::chrono::milliseconds(150));
  REQUIRE(sqlite3_exec(lockDb, "COMMIT;", nullptr, nullptr, nullptr) == SQLITE_OK);

  t.join();
  auto elapsedMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
  sqlite3_close(lockDb);

  CHECK(putOk);
  CHECK(elapsedMs >= 50);

  std::optional<StoredValue> v;
  REQUIRE(writer.GetValue(key, L"X", v));
  REQUIRE(v.has_value());
  CHECK(v->data == std::vector<uint8_t>{payload});
}

TEST_CASE("RegistryStore serializes writers sharing one connection", "[store][threads]") {
  RegistryStore store;
  REQUIRE(store.Open(MakeStorePath()));

  constexpr int kThreads = 4;
  constexpr int kWrites = 25;
  std::vector<std::thread> threads;
  std::vector<int> failures(kThreads, 0);
  for (int t = 0; t < kThreads; t++) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < kWrites; i++) {
        const std::wstring key = L"HKEY_CURRENT_USER\\Software\\T" + std::to_wstring(t) + L"\\K" + std::to_wstring(i);
        const uint8_t b = (uint8_t)i;
        if (!store.PutValue(key, L"V", kRegBinary, &b, 1)) {
          failures[t]++;
        }
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  for (int f : failures) {
    CHECK(f == 0);
  }

  std::vector<std::wstring> subkeys;
  REQUIRE(store.ListImmediateSubKeys(L"HKEY_CURRENT_USER\\Software\\T0", subkeys));
  CHECK(subkeys.size() == (size_t)kWrites);
}
