#include "registry/registry.h"

#include "common/registry_error.h"
#include "common/text_encoding.h"
#include "common/trace.h"
#include "registry/key_name.h"

#include <memory>
#include <string>

namespace hivereg {
namespace {

ResolvedKeyName ResolveOrTrace(const wchar_t* keyName) {
  try {
    return ResolveKeyName(keyName);
  } catch (const KeyNameError& e) {
    TraceEvent(trace_op::kResolve, keyName ? keyName : L"(null)", L"", Utf8ToWide(e.what()));
    throw;
  }
}

RegistryValue ReadResolved(const RootKeyTable& roots,
                           const ResolvedKeyName& resolved,
                           const wchar_t* valueName,
                           const RegistryValue& defaultValue) {
  std::unique_ptr<RegistryKey> key = roots.Get(resolved.hive).OpenSubKey(resolved.subKeyName);
  if (!key) {
    return defaultValue;
  }
  return key->GetValue(valueName ? valueName : L"", defaultValue);
}

void WriteResolved(const RootKeyTable& roots,
                   const ResolvedKeyName& resolved,
                   const wchar_t* valueName,
                   const RegistryValue& value,
                   ValueKind kind) {
  std::unique_ptr<RegistryKey> key = roots.Get(resolved.hive).CreateSubKey(resolved.subKeyName);
  if (!key) {
    // CreateSubKey reports its own failures; a null handle breaks its contract.
    throw StoreError("CreateSubKey returned no key for '" + WideToUtf8(resolved.subKeyName) + "'", 0);
  }
  key->SetValue(valueName ? valueName : L"", value, kind);
}

}  // namespace

RegistryValue GetValue(const wchar_t* keyName, const wchar_t* valueName, const RegistryValue& defaultValue) {
  const ResolvedKeyName resolved = ResolveOrTrace(keyName);
  return ReadResolved(DefaultRootKeys(), resolved, valueName, defaultValue);
}

RegistryValue GetValue(const RootKeyTable& roots,
                       const wchar_t* keyName,
                       const wchar_t* valueName,
                       const RegistryValue& defaultValue) {
  const ResolvedKeyName resolved = ResolveOrTrace(keyName);
  return ReadResolved(roots, resolved, valueName, defaultValue);
}

void SetValue(const wchar_t* keyName, const wchar_t* valueName, const RegistryValue& value, ValueKind kind) {
  const ResolvedKeyName resolved = ResolveOrTrace(keyName);
  WriteResolved(DefaultRootKeys(), resolved, valueName, value, kind);
}

void SetValue(const RootKeyTable& roots,
              const wchar_t* keyName,
              const wchar_t* valueName,
              const RegistryValue& value,
              ValueKind kind) {
  const ResolvedKeyName resolved = ResolveOrTrace(keyName);
  WriteResolved(roots, resolved, valueName, value, kind);
}

}
