#pragma once

#include "common/registry_value.h"
#include "registry/root_keys.h"

namespace hivereg {

// Reads `valueName` from the key named by the full path `keyName`
// (e.g. L"HKEY_CURRENT_USER\\Software\\App"). Returns defaultValue when the
// key or the value does not exist. A null valueName reads the default value.
//
// Throws KeyNameError when keyName is null or names no root, StoreError on
// storage failures.
RegistryValue GetValue(const wchar_t* keyName, const wchar_t* valueName, const RegistryValue& defaultValue);
RegistryValue GetValue(const RootKeyTable& roots,
                       const wchar_t* keyName,
                       const wchar_t* valueName,
                       const RegistryValue& defaultValue);

// Writes `valueName` under `keyName`, creating the key chain as needed.
// ValueKind::Unknown infers the kind from the value. Throws KeyNameError,
// ValueKindError or StoreError.
void SetValue(const wchar_t* keyName,
              const wchar_t* valueName,
              const RegistryValue& value,
              ValueKind kind = ValueKind::Unknown);
void SetValue(const RootKeyTable& roots,
              const wchar_t* keyName,
              const wchar_t* valueName,
              const RegistryValue& value,
              ValueKind kind = ValueKind::Unknown);

}
