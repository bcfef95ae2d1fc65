#pragma once

#include <filesystem>
#include <memory>

namespace hivereg {

class RegistryStore;

// HIVEREG_DB_PATH when set, else <data dir>/hivereg/registry.sqlite where the
// data dir is $XDG_DATA_HOME, ~/.local/share, or the system temp directory.
// Returns an empty path when none of them is usable.
std::filesystem::path ResolveStorePath();

// Opens the store at `dbPath`, creating parent directories. Throws StoreError.
std::shared_ptr<RegistryStore> OpenStore(const std::filesystem::path& dbPath);

}
