#pragma once

#include <cstddef>

namespace hivereg {

enum class RootHive {
  ClassesRoot,
  CurrentUser,
  LocalMachine,
  Users,
  PerformanceData,
  CurrentConfig,
};

constexpr size_t kRootHiveCount = 6;

// 64-bit hosts see one tree; the 32-bit view is kept as a handle attribute.
enum class RegistryView {
  Default,
  Registry32,
  Registry64,
};

inline constexpr const wchar_t* kRootHiveNames[kRootHiveCount] = {
    L"HKEY_CLASSES_ROOT",
    L"HKEY_CURRENT_USER",
    L"HKEY_LOCAL_MACHINE",
    L"HKEY_USERS",
    L"HKEY_PERFORMANCE_DATA",
    L"HKEY_CURRENT_CONFIG",
};

constexpr const wchar_t* RootHiveName(RootHive hive) {
  return kRootHiveNames[static_cast<size_t>(hive)];
}

}
