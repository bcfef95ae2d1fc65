#include "common/store_location.h"

#include "common/registry_error.h"
#include "common/registry_store.h"
#include "config/hivereg_config.h"

#include <sqlite3.h>

#include <cstdlib>
#include <system_error>

namespace hivereg {
namespace {

std::filesystem::path EnvPath(const char* name) {
  if (const char* env = std::getenv(name); env && *env) {
    return std::filesystem::path(env);
  }
  return {};
}

std::filesystem::path DefaultDataDir() {
  if (auto xdg = EnvPath("XDG_DATA_HOME"); !xdg.empty()) {
    return xdg;
  }
  if (auto home = EnvPath("HOME"); !home.empty()) {
    return home / ".local" / "share";
  }
  std::error_code ec;
  auto temp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    return {};
  }
  return temp;
}

}  // namespace

std::filesystem::path ResolveStorePath() {
  if (auto configured = EnvPath(HIVEREG_DB_PATH_ENV); !configured.empty()) {
    return configured;
  }
  auto base = DefaultDataDir();
  if (base.empty()) {
    return {};
  }
  return base / HIVEREG_DATA_DIR_NAME / HIVEREG_DB_FILE_NAME;
}

std::shared_ptr<RegistryStore> OpenStore(const std::filesystem::path& dbPath) {
  if (dbPath.empty()) {
    throw StoreError("no registry store path could be determined", SQLITE_CANTOPEN);
  }

  if (dbPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(dbPath.parent_path(), ec);
    if (ec) {
      throw StoreError("cannot create store directory " + dbPath.parent_path().u8string() + ": " + ec.message(),
                       SQLITE_CANTOPEN);
    }
  }

  auto store = std::make_shared<RegistryStore>();
  if (!store->Open(dbPath)) {
    throw StoreError("cannot open registry store " + dbPath.u8string() + ": " + store->LastError(),
                     store->LastErrorCode());
  }
  return store;
}

}
