#pragma once

#include "common/registry_value.h"
#include "registry/root_hive.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hivereg {

class RegistryStore;

// An open registry key. Subkey handles returned by OpenSubKey/CreateSubKey
// are owned by the caller; destroying the handle releases it.
class RegistryKey {
 public:
  virtual ~RegistryKey() = default;

  // Full path, starting with the root name.
  virtual const std::wstring& Name() const = 0;
  virtual RegistryView View() const = 0;

  // Returns null when the subkey does not exist. An empty name opens a new
  // handle on this key.
  virtual std::unique_ptr<RegistryKey> OpenSubKey(const std::wstring& subKeyName) = 0;
  // Opens the subkey, creating it and any missing intermediate keys.
  virtual std::unique_ptr<RegistryKey> CreateSubKey(const std::wstring& subKeyName) = 0;

  // Returns defaultValue when the value does not exist.
  virtual RegistryValue GetValue(const std::wstring& valueName, const RegistryValue& defaultValue) = 0;
  virtual std::optional<ValueKind> GetValueKind(const std::wstring& valueName) = 0;
  // ValueKind::Unknown infers the kind from the value.
  virtual void SetValue(const std::wstring& valueName, const RegistryValue& value, ValueKind kind) = 0;
  // Returns false when there was no such value.
  virtual bool DeleteValue(const std::wstring& valueName) = 0;
  // Returns false when there was no such subkey.
  virtual bool DeleteSubKeyTree(const std::wstring& subKeyName) = 0;

  virtual std::vector<std::wstring> GetValueNames() = 0;
  virtual std::vector<std::wstring> GetSubKeyNames() = 0;
};

// Opens a root key backed by `store`. Root keys always exist.
std::unique_ptr<RegistryKey> OpenBaseKey(std::shared_ptr<RegistryStore> store, RootHive hive, RegistryView view);

}
