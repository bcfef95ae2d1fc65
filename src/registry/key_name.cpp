#include "registry/key_name.h"

#include "common/key_path.h"
#include "common/registry_error.h"

#include <string>

namespace hivereg {
namespace {

constexpr size_t NameLength(RootHive hive) {
  return std::char_traits<wchar_t>::length(RootHiveName(hive));
}

static_assert(NameLength(RootHive::Users) == 10);
static_assert(NameLength(RootHive::ClassesRoot) == 17);
static_assert(NameLength(RootHive::CurrentUser) == 17);
static_assert(NameLength(RootHive::LocalMachine) == 18);
static_assert(NameLength(RootHive::CurrentConfig) == 19);
static_assert(NameLength(RootHive::PerformanceData) == 21);
static_assert(RootHiveName(RootHive::ClassesRoot)[kRootNameUniqueCharIndex] == L'L');
static_assert(RootHiveName(RootHive::CurrentUser)[kRootNameUniqueCharIndex] == L'U');

}  // namespace

std::optional<RootHive> DispatchRootName(size_t length, wchar_t uniqueChar) {
  switch (length) {
    case 10:
      return RootHive::Users;  // HKEY_USERS
    case 17:
      switch (uniqueChar) {
        case L'l':
        case L'L':
          return RootHive::ClassesRoot;  // HKEY_C[L]ASSES_ROOT
        case L'u':
        case L'U':
          return RootHive::CurrentUser;  // HKEY_C[U]RRENT_USER
        default:
          return std::nullopt;
      }
    case 18:
      return RootHive::LocalMachine;  // HKEY_LOCAL_MACHINE
    case 19:
      return RootHive::CurrentConfig;  // HKEY_CURRENT_CONFIG
    case 21:
      return RootHive::PerformanceData;  // HKEY_PERFORMANCE_DATA
    default:
      return std::nullopt;
  }
}

bool MatchesRootName(RootHive hive, std::wstring_view keyName) {
  const std::wstring_view name = RootHiveName(hive);
  if (keyName.size() < name.size()) {
    return false;
  }
  if (keyName.size() > name.size() && keyName[name.size()] != kKeySeparator) {
    return false;
  }
  return EqualsNoCaseAscii(keyName.substr(0, name.size()), name);
}

std::optional<ResolvedKeyName> TryResolveKeyName(std::wstring_view keyName) {
  const size_t sep = keyName.find(kKeySeparator);
  const size_t length = (sep != std::wstring_view::npos) ? sep : keyName.size();
  const wchar_t uniqueChar = (length > kRootNameUniqueCharIndex) ? keyName[kRootNameUniqueCharIndex] : L'\0';

  const auto hive = DispatchRootName(length, uniqueChar);
  if (!hive || !MatchesRootName(*hive, keyName)) {
    return std::nullopt;
  }

  ResolvedKeyName resolved{*hive, std::wstring()};
  if (sep != std::wstring_view::npos && sep + 1 < keyName.size()) {
    resolved.subKeyName.assign(keyName.substr(sep + 1));
  }
  return resolved;
}

ResolvedKeyName ResolveKeyName(const wchar_t* keyName) {
  if (!keyName) {
    throw KeyNameError(KeyNameErrc::NullKeyName, "keyName");
  }
  return ResolveKeyName(std::wstring(keyName));
}

ResolvedKeyName ResolveKeyName(const std::wstring& keyName) {
  auto resolved = TryResolveKeyName(keyName);
  if (!resolved) {
    throw KeyNameError(KeyNameErrc::InvalidKeyName, "keyName");
  }
  return std::move(*resolved);
}

}
