#include "common/registry_error.h"
#include "registry/key_name.h"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace hivereg;

namespace {

struct RootCase {
  RootHive hive;
  std::wstring name;
};

const std::vector<RootCase>& AllRoots() {
  static const std::vector<RootCase> roots = {
      {RootHive::ClassesRoot, L"HKEY_CLASSES_ROOT"},
      {RootHive::CurrentUser, L"HKEY_CURRENT_USER"},
      {RootHive::LocalMachine, L"HKEY_LOCAL_MACHINE"},
      {RootHive::Users, L"HKEY_USERS"},
      {RootHive::PerformanceData, L"HKEY_PERFORMANCE_DATA"},
      {RootHive::CurrentConfig, L"HKEY_CURRENT_CONFIG"},
  };
  return roots;
}

std::wstring Lower(std::wstring s) {
  for (auto& ch : s) {
    if (ch >= L'A' && ch <= L'Z') ch = (wchar_t)(ch - L'A' + L'a');
  }
  return s;
}

// Alternating case, starting lower: hKeY_cUrReNt_uSeR
std::wstring Mixed(std::wstring s) {
  bool lower = true;
  for (auto& ch : s) {
    if (ch >= L'A' && ch <= L'Z') {
      if (lower) ch = (wchar_t)(ch - L'A' + L'a');
      lower = !lower;
    }
  }
  return s;
}

KeyNameErrc ResolveError(const std::wstring& keyName) {
  try {
    (void)ResolveKeyName(keyName);
  } catch (const KeyNameError& e) {
    return e.code();
  }
  FAIL("expected KeyNameError for " << std::string(keyName.begin(), keyName.end()));
  return KeyNameErrc::InvalidKeyName;
}

}  // namespace

TEST_CASE("Every root name resolves to its hive with an empty subkey, in any case", "[resolve]") {
  for (const auto& root : AllRoots()) {
    for (const auto& spelled : {root.name, Lower(root.name), Mixed(root.name)}) {
      const auto resolved = ResolveKeyName(spelled);
      CHECK(resolved.hive == root.hive);
      CHECK(resolved.subKeyName.empty());
    }
  }
}

TEST_CASE("Root name followed by a subpath passes the subpath through unmodified", "[resolve]") {
  const std::wstring sub = L"Software\\Vendor App\\/odd\\\\Path\\";
  for (const auto& root : AllRoots()) {
    const auto resolved = ResolveKeyName(Mixed(root.name) + L"\\" + sub);
    CHECK(resolved.hive == root.hive);
    CHECK(resolved.subKeyName == sub);
  }
}

TEST_CASE("A trailing separator yields an empty subkey", "[resolve]") {
  const auto resolved = ResolveKeyName(std::wstring(L"HKEY_LOCAL_MACHINE\\"));
  CHECK(resolved.hive == RootHive::LocalMachine);
  CHECK(resolved.subKeyName.empty());
}

TEST_CASE("Null key name fails with NullKeyName", "[resolve]") {
  const wchar_t* keyName = nullptr;
  try {
    (void)ResolveKeyName(keyName);
    FAIL("expected KeyNameError");
  } catch (const KeyNameError& e) {
    CHECK(e.code() == KeyNameErrc::NullKeyName);
    CHECK(e.paramName() == "keyName");
  }
}

TEST_CASE("Unknown root names fail with InvalidKeyName", "[resolve]") {
  CHECK(ResolveError(L"") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"NOT_A_ROOT") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"HKLM\\Software") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"\\HKEY_USERS") == KeyNameErrc::InvalidKeyName);

  // Right lengths (10/17/18/19/21), wrong names.
  CHECK(ResolveError(L"HKEY_USERZ") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"HKEY_CLASSES_ROOX\\Sub") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"HKEY_CURRENT_USEX") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"HKEY_LOCAL_MACHINX") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"HKEY_CURRENT_CONFIX") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"HKEY_PERFORMANCE_DATX") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"0123456789") == KeyNameErrc::InvalidKeyName);
}

TEST_CASE("InvalidKeyName names the offending parameter", "[resolve]") {
  try {
    (void)ResolveKeyName(std::wstring(L"NOT_A_ROOT\\x"));
    FAIL("expected KeyNameError");
  } catch (const KeyNameError& e) {
    CHECK(e.paramName() == "keyName");
    CHECK(std::string(e.what()).find("keyName") != std::string::npos);
  }
}

TEST_CASE("Length 17 routes on the character at index 6", "[resolve][dispatch]") {
  CHECK(ResolveKeyName(std::wstring(L"HKEY_CLASSES_ROOT\\x")).hive == RootHive::ClassesRoot);
  CHECK(ResolveKeyName(std::wstring(L"hkey_classes_root")).hive == RootHive::ClassesRoot);
  CHECK(ResolveKeyName(std::wstring(L"HKEY_CURRENT_USER\\x")).hive == RootHive::CurrentUser);
  CHECK(ResolveKeyName(std::wstring(L"hkey_current_user")).hive == RootHive::CurrentUser);

  // Any other character at index 6 fails closed.
  CHECK(ResolveError(L"HKEY_CXASSES_ROOT") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"HKEY_C_RRENT_USER\\Software") == KeyNameErrc::InvalidKeyName);
  // Right dispatch character, wrong body.
  CHECK(ResolveError(L"HKEY_CLRRENT_USER") == KeyNameErrc::InvalidKeyName);
  CHECK(ResolveError(L"HKEY_CUASSES_ROOT") == KeyNameErrc::InvalidKeyName);
}

TEST_CASE("DispatchRootName maps lengths to candidate hives", "[dispatch]") {
  CHECK(DispatchRootName(10, L'\0') == RootHive::Users);
  CHECK(DispatchRootName(17, L'L') == RootHive::ClassesRoot);
  CHECK(DispatchRootName(17, L'l') == RootHive::ClassesRoot);
  CHECK(DispatchRootName(17, L'U') == RootHive::CurrentUser);
  CHECK(DispatchRootName(17, L'u') == RootHive::CurrentUser);
  CHECK_FALSE(DispatchRootName(17, L'X').has_value());
  CHECK(DispatchRootName(18, L'?') == RootHive::LocalMachine);
  CHECK(DispatchRootName(19, L'?') == RootHive::CurrentConfig);
  CHECK(DispatchRootName(21, L'?') == RootHive::PerformanceData);

  for (size_t length : {0u, 1u, 9u, 11u, 16u, 20u, 22u, 100u}) {
    CHECK_FALSE(DispatchRootName(length, L'L').has_value());
  }
}

TEST_CASE("MatchesRootName verifies the whole root segment", "[dispatch]") {
  CHECK(MatchesRootName(RootHive::Users, L"HKEY_USERS"));
  CHECK(MatchesRootName(RootHive::Users, L"hkey_users\\S-1-5-18"));
  CHECK_FALSE(MatchesRootName(RootHive::Users, L"HKEY_USER"));
  CHECK_FALSE(MatchesRootName(RootHive::Users, L"HKEY_USERSX"));
  CHECK_FALSE(MatchesRootName(RootHive::LocalMachine, L"HKEY_USERS"));
  CHECK_FALSE(MatchesRootName(RootHive::CurrentUser, L"HKEY_CLASSES_ROOT"));
}

TEST_CASE("TryResolveKeyName reports failures without throwing", "[resolve]") {
  CHECK_FALSE(TryResolveKeyName(L"").has_value());
  CHECK_FALSE(TryResolveKeyName(L"HKEY_CURRENT_USEX").has_value());

  const auto resolved = TryResolveKeyName(L"HKEY_CURRENT_CONFIG\\System\\CurrentControlSet");
  REQUIRE(resolved.has_value());
  CHECK(resolved->hive == RootHive::CurrentConfig);
  CHECK(resolved->subKeyName == L"System\\CurrentControlSet");
}
