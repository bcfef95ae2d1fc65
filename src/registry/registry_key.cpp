#include "registry/registry_key.h"

#include "common/key_path.h"
#include "common/registry_error.h"
#include "common/registry_store.h"
#include "common/text_encoding.h"
#include "common/trace.h"

#include <stdexcept>
#include <utility>

namespace hivereg {
namespace {

class StoreRegistryKey : public RegistryKey {
 public:
  StoreRegistryKey(std::shared_ptr<RegistryStore> store, RegistryView view, std::wstring name, bool isRoot)
      : store_(std::move(store)), view_(view), name_(std::move(name)), isRoot_(isRoot) {}

  ~StoreRegistryKey() override {
    if (!isRoot_) {
      TraceEvent(trace_op::kClose, name_, L"", L"");
    }
  }

  StoreRegistryKey(const StoreRegistryKey&) = delete;
  StoreRegistryKey& operator=(const StoreRegistryKey&) = delete;

  const std::wstring& Name() const override { return name_; }
  RegistryView View() const override { return view_; }

  std::unique_ptr<RegistryKey> OpenSubKey(const std::wstring& subKeyName) override {
    const std::wstring sub = CheckedSubKey(subKeyName);
    if (sub.empty()) {
      return Child(name_);
    }
    const std::wstring path = JoinKeyPath(name_, sub);
    bool exists = false;
    if (!store_->KeyExists(path, exists)) {
      ThrowStoreFailure("open key", path);
    }
    TraceEvent(trace_op::kOpen, path, L"", exists ? L"found" : L"missing");
    if (!exists) {
      return nullptr;
    }
    return Child(path);
  }

  std::unique_ptr<RegistryKey> CreateSubKey(const std::wstring& subKeyName) override {
    const std::wstring sub = CheckedSubKey(subKeyName);
    if (sub.empty()) {
      return Child(name_);
    }
    const std::wstring path = JoinKeyPath(name_, sub);
    if (!store_->CreateKey(path)) {
      ThrowStoreFailure("create key", path);
    }
    TraceEvent(trace_op::kCreate, path, L"", L"");
    return Child(path);
  }

  RegistryValue GetValue(const std::wstring& valueName, const RegistryValue& defaultValue) override {
    std::optional<StoredValue> stored;
    if (!store_->GetValue(name_, valueName, stored)) {
      ThrowStoreFailure("read value", name_);
    }
    if (!stored) {
      TraceEvent(trace_op::kGet, name_, valueName, L"missing");
      return defaultValue;
    }
    RegistryValue value = DecodeValue(stored->type, stored->data);
    if (ShouldTrace(trace_op::kGet)) {
      TraceEvent(trace_op::kGet, name_, valueName,
                 FormatValueKind(KindFromStoredType(stored->type)) + L" " + FormatValuePreview(value));
    }
    return value;
  }

  std::optional<ValueKind> GetValueKind(const std::wstring& valueName) override {
    std::optional<StoredValue> stored;
    if (!store_->GetValue(name_, valueName, stored)) {
      ThrowStoreFailure("read value", name_);
    }
    if (!stored) {
      return std::nullopt;
    }
    return KindFromStoredType(stored->type);
  }

  void SetValue(const std::wstring& valueName, const RegistryValue& value, ValueKind kind) override {
    if (kind == ValueKind::Unknown) {
      kind = InferValueKind(value);
    }
    const std::vector<uint8_t> data = EncodeValue(value, kind);
    if (!store_->PutValue(name_, valueName, StoredTypeFromKind(kind), data.data(), (uint32_t)data.size())) {
      ThrowStoreFailure("write value", name_);
    }
    if (ShouldTrace(trace_op::kSet)) {
      TraceEvent(trace_op::kSet, name_, valueName, FormatValueKind(kind) + L" " + FormatValuePreview(value));
    }
  }

  bool DeleteValue(const std::wstring& valueName) override {
    bool existed = false;
    if (!store_->DeleteValue(name_, valueName, existed)) {
      ThrowStoreFailure("delete value", name_);
    }
    TraceEvent(trace_op::kDelete, name_, valueName, existed ? L"deleted" : L"missing");
    return existed;
  }

  bool DeleteSubKeyTree(const std::wstring& subKeyName) override {
    const std::wstring sub = CheckedSubKey(subKeyName);
    if (sub.empty()) {
      // Deleting the key a handle refers to goes through its parent.
      throw KeyNameError(KeyNameErrc::InvalidKeyName, "subKeyName");
    }
    const std::wstring path = JoinKeyPath(name_, sub);
    bool exists = false;
    if (!store_->KeyExists(path, exists)) {
      ThrowStoreFailure("open key", path);
    }
    if (!exists) {
      return false;
    }
    if (!store_->DeleteKeyTree(path)) {
      ThrowStoreFailure("delete key", path);
    }
    TraceEvent(trace_op::kDelete, path, L"", L"tree");
    return true;
  }

  std::vector<std::wstring> GetValueNames() override {
    std::vector<RegistryStore::ValueRow> rows;
    if (!store_->ListValues(name_, rows)) {
      ThrowStoreFailure("list values", name_);
    }
    std::vector<std::wstring> names;
    names.reserve(rows.size());
    for (auto& row : rows) {
      names.push_back(std::move(row.valueName));
    }
    TraceEvent(trace_op::kEnum, name_, L"", L"values=" + std::to_wstring(names.size()));
    return names;
  }

  std::vector<std::wstring> GetSubKeyNames() override {
    std::vector<std::wstring> names;
    if (!store_->ListImmediateSubKeys(name_, names)) {
      ThrowStoreFailure("list subkeys", name_);
    }
    TraceEvent(trace_op::kEnum, name_, L"", L"subkeys=" + std::to_wstring(names.size()));
    return names;
  }

 private:
  std::unique_ptr<RegistryKey> Child(const std::wstring& path) const {
    return std::make_unique<StoreRegistryKey>(store_, view_, path, false);
  }

  static std::wstring CheckedSubKey(const std::wstring& subKeyName) {
    std::wstring sub = CanonicalizeSubKey(subKeyName);
    if (LongestSegmentLength(sub) > kMaxKeySegmentLength) {
      throw KeyNameError(KeyNameErrc::SubKeyNameTooLong, "subKeyName");
    }
    return sub;
  }

  [[noreturn]] void ThrowStoreFailure(const char* what, const std::wstring& path) const {
    throw StoreError(std::string("cannot ") + what + " '" + WideToUtf8(path) + "': " + store_->LastError(),
                     store_->LastErrorCode());
  }

  std::shared_ptr<RegistryStore> store_;
  RegistryView view_;
  std::wstring name_;
  bool isRoot_;
};

}  // namespace

std::unique_ptr<RegistryKey> OpenBaseKey(std::shared_ptr<RegistryStore> store, RootHive hive, RegistryView view) {
  if (!store || !store->IsOpen()) {
    throw std::invalid_argument("OpenBaseKey requires an open store");
  }
  return std::make_unique<StoreRegistryKey>(std::move(store), view, RootHiveName(hive), true);
}

}
