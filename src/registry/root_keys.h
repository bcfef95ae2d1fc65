#pragma once

#include "registry/registry_key.h"
#include "registry/root_hive.h"

#include <array>
#include <memory>

namespace hivereg {

class RegistryStore;

// The six root keys, one per RootHive. Immutable once built.
class RootKeyTable {
 public:
  using Roots = std::array<std::unique_ptr<RegistryKey>, kRootHiveCount>;

  // Throws std::invalid_argument when a slot is empty.
  explicit RootKeyTable(Roots roots);

  RegistryKey& Get(RootHive hive) const;

 private:
  Roots roots_;
};

RootKeyTable OpenRootKeys(std::shared_ptr<RegistryStore> store, RegistryView view = RegistryView::Default);

// Process-wide roots over the store from ResolveStorePath(), opened on first
// use and never closed. Throws StoreError when the store cannot be opened.
const RootKeyTable& DefaultRootKeys();

RegistryKey& CurrentUser();
RegistryKey& LocalMachine();
RegistryKey& ClassesRoot();
RegistryKey& Users();
RegistryKey& PerformanceData();
RegistryKey& CurrentConfig();

}
