#include "registry/root_keys.h"

#include "common/store_location.h"

#include <stdexcept>
#include <utility>

namespace hivereg {

RootKeyTable::RootKeyTable(Roots roots) : roots_(std::move(roots)) {
  for (const auto& root : roots_) {
    if (!root) {
      throw std::invalid_argument("RootKeyTable requires a key for every root hive");
    }
  }
}

RegistryKey& RootKeyTable::Get(RootHive hive) const {
  return *roots_[static_cast<size_t>(hive)];
}

RootKeyTable OpenRootKeys(std::shared_ptr<RegistryStore> store, RegistryView view) {
  RootKeyTable::Roots roots;
  for (size_t i = 0; i < kRootHiveCount; i++) {
    roots[i] = OpenBaseKey(store, static_cast<RootHive>(i), view);
  }
  return RootKeyTable(std::move(roots));
}

const RootKeyTable& DefaultRootKeys() {
  // A throwing initializer leaves the table unbuilt; the next call retries.
  static const RootKeyTable table = OpenRootKeys(OpenStore(ResolveStorePath()), RegistryView::Default);
  return table;
}

RegistryKey& CurrentUser() {
  return DefaultRootKeys().Get(RootHive::CurrentUser);
}

RegistryKey& LocalMachine() {
  return DefaultRootKeys().Get(RootHive::LocalMachine);
}

RegistryKey& ClassesRoot() {
  return DefaultRootKeys().Get(RootHive::ClassesRoot);
}

RegistryKey& Users() {
  return DefaultRootKeys().Get(RootHive::Users);
}

RegistryKey& PerformanceData() {
  return DefaultRootKeys().Get(RootHive::PerformanceData);
}

RegistryKey& CurrentConfig() {
  return DefaultRootKeys().Get(RootHive::CurrentConfig);
}

}
